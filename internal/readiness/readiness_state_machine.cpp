#include "readiness_state_machine.hpp"

#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/upgrade/upgrade_orchestrator.hpp"
#include "internal/util/time.hpp"

namespace accessres::readiness {

using accessres::model::AccessFrame;
using accessres::model::AccessPayload;
using accessres::model::Readiness;
using accessres::observability::StringField;
using accessres::observability::UintField;

std::string_view ToString(ApplyOutcome outcome) {
  switch (outcome) {
    case ApplyOutcome::kUpgraded:
      return "upgraded";
    case ApplyOutcome::kUpgradeStaged:
      return "upgrade_staged";
    case ApplyOutcome::kDegraded:
      return "degraded";
    case ApplyOutcome::kPending:
      return "pending";
    case ApplyOutcome::kIgnored:
      return "ignored";
    case ApplyOutcome::kInvalid:
      return "invalid";
    case ApplyOutcome::kExpired:
      return "expired";
    case ApplyOutcome::kTruncated:
      return "truncated";
    case ApplyOutcome::kStale:
      return "stale";
  }
  return "ignored";
}

ReadinessStateMachine::ReadinessStateMachine(AccessRegistry& registry, accessres::upgrade::UpgradeOrchestrator& orchestrator,
                                             const AccessPolicy& policy, const AccessObserver& observer)
    : registry_(registry), orchestrator_(orchestrator), policy_(policy), observer_(observer) {
}

ApplyOutcome ReadinessStateMachine::ApplyFrame(const AccessFrame& frame, FrameSource source) {
  return ApplyFrame(frame, accessres::util::NowMillis(), source);
}

ApplyOutcome ReadinessStateMachine::ApplyFrame(const AccessFrame& frame, std::uint64_t now_ms, FrameSource source) {
  auto outcome = ApplyOutcome::kIgnored;

  switch (CheckFrame(frame, policy_, now_ms)) {
    case FrameVerdict::kInvalid:
      outcome = ApplyOutcome::kInvalid;
      break;
    case FrameVerdict::kExpired:
      outcome = ApplyOutcome::kExpired;
      break;
    case FrameVerdict::kTruncated:
      outcome = ApplyOutcome::kTruncated;
      break;
    case FrameVerdict::kAccept:
      break;
  }
  if (outcome != ApplyOutcome::kIgnored) {
    ACCESSRES_LOG_WARN("Dropped access frame", {StringField("item_id", frame.item_id), StringField("reason", ToString(outcome))});
    accessres::observability::Metrics::Instance().RecordFrame(ToString(outcome));
    return outcome;
  }
  if (frame.truncated) {
    ACCESSRES_LOG_WARN("Applying truncated access frame", {StringField("item_id", frame.item_id)});
  }

  auto& manager = registry_.GetOrCreate(frame.item_id);

  if (source == FrameSource::kPush && policy_.reject_out_of_order && manager.last_frame_ms && frame.timestamp_ms < *manager.last_frame_ms) {
    ACCESSRES_LOG_WARN("Dropped out-of-order access frame",
                    {StringField("item_id", frame.item_id), UintField("timestamp_ms", frame.timestamp_ms), UintField("last_frame_ms", *manager.last_frame_ms)});
    accessres::observability::Metrics::Instance().RecordFrame(ToString(ApplyOutcome::kStale));
    return ApplyOutcome::kStale;
  }

  const Readiness state = manager.current_state;
  if (frame.readiness == Readiness::kReady && frame.access) {
    if (source == FrameSource::kPush) {
      manager.last_frame_ms = frame.timestamp_ms;
    }
    outcome = ApplyReady(manager, *frame.access, source);
  } else if (frame.readiness == Readiness::kDegraded && frame.fallback && state == Readiness::kPending) {
    if (source == FrameSource::kPush) {
      manager.last_frame_ms = frame.timestamp_ms;
    }
    outcome = ApplyDegraded(manager, *frame.fallback);
  } else if (frame.readiness == Readiness::kPending && state == Readiness::kPending) {
    if (source == FrameSource::kPush) {
      manager.last_frame_ms = frame.timestamp_ms;
    }
    outcome = ApplyPending(manager);
  } else {
    ACCESSRES_LOG_DEBUG("Ignored access frame",
                     {StringField("item_id", frame.item_id), StringField("frame", accessres::model::ToString(frame.readiness)),
                      StringField("state", accessres::model::ToString(state))});
  }

  accessres::observability::Metrics::Instance().RecordFrame(ToString(outcome));
  return outcome;
}

ApplyOutcome ReadinessStateMachine::ApplyReady(ReadinessManager& manager, const AccessPayload& access, FrameSource source) {
  const std::string   item_id  = manager.item_id;
  const std::uint64_t instance = manager.instance;

  manager.pending_upgrade = access;
  if (observer_.on_upgrade_available) {
    observer_.on_upgrade_available(item_id, access);
    if (!registry_.IsLive(item_id, instance)) {
      return ApplyOutcome::kUpgradeStaged;
    }
  }

  const bool automatic = policy_.auto_upgrade || source == FrameSource::kBootstrap;
  if (!automatic || manager.current_state == Readiness::kReady) {
    ACCESSRES_LOG_INFO("Access upgrade available", {StringField("item_id", item_id), StringField("mode", accessres::model::ToString(access.mode()))});
    return ApplyOutcome::kUpgradeStaged;
  }

  orchestrator_.PerformUpgrade(manager, access, source == FrameSource::kPush);
  return ApplyOutcome::kUpgraded;
}

ApplyOutcome ReadinessStateMachine::ApplyDegraded(ReadinessManager& manager, const AccessPayload& fallback) {
  const std::string   item_id  = manager.item_id;
  const std::uint64_t instance = manager.instance;

  Transition(manager, Readiness::kDegraded);
  if (!registry_.IsLive(item_id, instance)) {
    return ApplyOutcome::kDegraded;
  }

  if (!orchestrator_.ReleaseResult(manager)) {
    return ApplyOutcome::kDegraded;
  }
  manager.current_result = orchestrator_.Render(manager, fallback, Readiness::kDegraded);
  ACCESSRES_LOG_INFO("Rendering fallback access",
                  {StringField("item_id", item_id), StringField("mode", accessres::model::ToString(fallback.mode())),
                   StringField("render", accessres::render::ToString(manager.current_result->type))});
  return ApplyOutcome::kDegraded;
}

ApplyOutcome ReadinessStateMachine::ApplyPending(ReadinessManager& manager) {
  const std::string   item_id  = manager.item_id;
  const std::uint64_t instance = manager.instance;

  Transition(manager, Readiness::kPending);
  if (!registry_.IsLive(item_id, instance)) {
    return ApplyOutcome::kPending;
  }

  if (!manager.current_result) {
    manager.current_result = accessres::render::RenderResult::Pending();
  }
  return ApplyOutcome::kPending;
}

void ReadinessStateMachine::Transition(ReadinessManager& manager, Readiness next) {
  const Readiness previous = manager.current_state;
  if (!accessres::model::CanTransition(previous, next)) {
    return;
  }
  manager.current_state = next;
  if (previous != next) {
    accessres::observability::Metrics::Instance().RecordTransition(accessres::model::ToString(previous), accessres::model::ToString(next));
  }
  if (observer_.on_readiness_change) {
    // May destroy the manager; callers re-check liveness.
    const std::string item_id = manager.item_id;
    observer_.on_readiness_change(item_id, next);
  }
}

} // namespace accessres::readiness
