#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#include "internal/model/access_frame.hpp"

namespace accessres::runtime::config {
class PolicyConfig;
}

namespace accessres::readiness {

struct AccessPolicy {
  bool          auto_upgrade{true};
  std::uint64_t max_frame_age_ms{accessres::model::kDefaultMaxFrameAgeMs};
  bool          reject_out_of_order{true};
  bool          allow_truncated_frames{true};

  static AccessPolicy FromConfig(const accessres::runtime::config::PolicyConfig& config);
};

// Callbacks toward the presentation layer. Unset members are skipped.
struct AccessObserver {
  std::function<void(const std::string& item_id, accessres::model::Readiness state)>                 on_readiness_change;
  std::function<void(const std::string& item_id, const accessres::model::AccessPayload& candidate)> on_upgrade_available;
};

enum class FrameVerdict : std::uint8_t {
  kAccept,
  kInvalid,
  kExpired,
  kTruncated,
};

std::string_view ToString(FrameVerdict verdict);

// Integrity and age gate shared by the lane filter and the state machine.
FrameVerdict CheckFrame(const accessres::model::AccessFrame& frame, const AccessPolicy& policy, std::uint64_t now_ms);

} // namespace accessres::readiness
