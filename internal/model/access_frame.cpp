#include "access_frame.hpp"

#include <utility>

namespace accessres::model {

AccessFrame MakeFrame(std::string item_id, Readiness readiness, std::optional<AccessPayload> access,
                      std::optional<AccessPayload> fallback, std::uint64_t timestamp_ms) {
  AccessFrame frame;
  frame.item_id      = std::move(item_id);
  frame.readiness    = readiness;
  frame.flags        = FrameFlags{}.With(FrameFlag::kHasAccess, access.has_value()).With(FrameFlag::kHasFallback, fallback.has_value());
  frame.access       = std::move(access);
  frame.fallback     = std::move(fallback);
  frame.timestamp_ms = timestamp_ms;
  return frame;
}

bool IsFrameExpired(const AccessFrame& frame, std::uint64_t now_ms, std::uint64_t max_age_ms) {
  if (frame.timestamp_ms >= now_ms) {
    return false;
  }
  return now_ms - frame.timestamp_ms > max_age_ms;
}

} // namespace accessres::model
