#include "time.hpp"

namespace accessres::util {

TimePoint Now() {
  return Clock::now();
}

std::uint64_t NowMillis() {
  return ToUnixMillis(Now());
}

std::uint64_t ToUnixMillis(TimePoint tp) {
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
  return ms < 0 ? 0 : static_cast<std::uint64_t>(ms);
}

} // namespace accessres::util
