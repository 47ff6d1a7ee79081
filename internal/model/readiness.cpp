#include "readiness.hpp"

namespace accessres::model {

std::optional<Readiness> ParseReadiness(std::string_view text) {
  if (text == "PENDING") {
    return Readiness::kPending;
  }
  if (text == "READY") {
    return Readiness::kReady;
  }
  if (text == "DEGRADED") {
    return Readiness::kDegraded;
  }
  return std::nullopt;
}

} // namespace accessres::model
