#include "access_policy.hpp"

#include "config/config.pb.h"

namespace accessres::readiness {

AccessPolicy AccessPolicy::FromConfig(const accessres::runtime::config::PolicyConfig& config) {
  AccessPolicy policy;
  if (config.has_auto_upgrade()) {
    policy.auto_upgrade = config.auto_upgrade();
  }
  if (config.max_frame_age_ms() != 0) {
    policy.max_frame_age_ms = config.max_frame_age_ms();
  }
  if (config.has_reject_out_of_order()) {
    policy.reject_out_of_order = config.reject_out_of_order();
  }
  if (config.has_allow_truncated_frames()) {
    policy.allow_truncated_frames = config.allow_truncated_frames();
  }
  return policy;
}

std::string_view ToString(FrameVerdict verdict) {
  switch (verdict) {
    case FrameVerdict::kAccept:
      return "accept";
    case FrameVerdict::kInvalid:
      return "invalid";
    case FrameVerdict::kExpired:
      return "expired";
    case FrameVerdict::kTruncated:
      return "truncated";
  }
  return "invalid";
}

FrameVerdict CheckFrame(const accessres::model::AccessFrame& frame, const AccessPolicy& policy, std::uint64_t now_ms) {
  if (!frame.is_valid) {
    return FrameVerdict::kInvalid;
  }
  if (frame.truncated && !policy.allow_truncated_frames) {
    return FrameVerdict::kTruncated;
  }
  if (accessres::model::IsFrameExpired(frame, now_ms, policy.max_frame_age_ms)) {
    return FrameVerdict::kExpired;
  }
  return FrameVerdict::kAccept;
}

} // namespace accessres::readiness
