#pragma once

#include <cstdint>
#include <string_view>

#include "access_policy.hpp"
#include "access_registry.hpp"

namespace accessres::upgrade {
class UpgradeOrchestrator;
}

namespace accessres::readiness {

enum class ApplyOutcome : std::uint8_t {
  kUpgraded,
  kUpgradeStaged,
  kDegraded,
  kPending,
  kIgnored,
  kInvalid,
  kExpired,
  kTruncated,
  kStale,
};

std::string_view ToString(ApplyOutcome outcome);

// kPush frames come from a lane; kBootstrap frames are synthesized from a
// fetched resolution. Bootstrap frames bypass the ordering guard and apply a
// READY payload even when automatic upgrade is off.
enum class FrameSource : std::uint8_t {
  kPush,
  kBootstrap,
};

/*
  Applies decoded frames to per-item readiness managers.

    READY + access       stage as pending upgrade, notify, then upgrade
                         automatically when allowed and not already READY
    DEGRADED + fallback  only while PENDING: DEGRADED, notify, render fallback
    PENDING              only while PENDING: notify, show a pending result
    anything else        ignored; READY is sticky

  Invalid, expired and (by policy) truncated or out-of-order frames never
  reach a manager.
*/
class ReadinessStateMachine {
 public:
  ReadinessStateMachine(AccessRegistry& registry, accessres::upgrade::UpgradeOrchestrator& orchestrator, const AccessPolicy& policy,
                        const AccessObserver& observer);

  ApplyOutcome ApplyFrame(const accessres::model::AccessFrame& frame, std::uint64_t now_ms, FrameSource source = FrameSource::kPush);
  ApplyOutcome ApplyFrame(const accessres::model::AccessFrame& frame, FrameSource source = FrameSource::kPush);

 private:
  ApplyOutcome ApplyReady(ReadinessManager& manager, const accessres::model::AccessPayload& access, FrameSource source);
  ApplyOutcome ApplyDegraded(ReadinessManager& manager, const accessres::model::AccessPayload& fallback);
  ApplyOutcome ApplyPending(ReadinessManager& manager);

  void Transition(ReadinessManager& manager, accessres::model::Readiness next);

  AccessRegistry&                       registry_;
  accessres::upgrade::UpgradeOrchestrator& orchestrator_;
  const AccessPolicy&                   policy_;
  const AccessObserver&                 observer_;
};

} // namespace accessres::readiness
