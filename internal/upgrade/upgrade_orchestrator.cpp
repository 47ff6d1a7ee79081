#include "upgrade_orchestrator.hpp"

#include <exception>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"

namespace accessres::upgrade {

using accessres::model::Readiness;
using accessres::observability::BoolField;
using accessres::observability::StringField;

UpgradeOrchestrator::UpgradeOrchestrator(accessres::readiness::AccessRegistry&       registry,
                                         accessres::render::RenderDispatcher&        dispatcher,
                                         const accessres::readiness::AccessObserver& observer,
                                         accessres::render::RenderOptions            options)
    : registry_(registry), dispatcher_(dispatcher), observer_(observer), options_(std::move(options)) {
}

void UpgradeOrchestrator::PerformUpgrade(accessres::readiness::ReadinessManager& manager, const accessres::model::AccessPayload& access,
                                         bool automatic) {
  // Copies: the observer may destroy the manager (and a staged payload with it).
  const std::string                     item_id  = manager.item_id;
  const std::uint64_t                   instance = manager.instance;
  const accessres::model::AccessPayload target   = access;
  const Readiness                       previous = manager.current_state;

  if (!ReleaseResult(manager)) {
    ACCESSRES_LOG_INFO("Item destroyed by cleanup during upgrade", {StringField("item_id", item_id)});
    return;
  }

  manager.current_state = Readiness::kReady;
  manager.pending_upgrade.reset();
  if (previous != Readiness::kReady) {
    accessres::observability::Metrics::Instance().RecordTransition(accessres::model::ToString(previous), accessres::model::ToString(Readiness::kReady));
  }

  if (observer_.on_readiness_change) {
    observer_.on_readiness_change(item_id, Readiness::kReady);
    if (!registry_.IsLive(item_id, instance)) {
      ACCESSRES_LOG_INFO("Item destroyed during upgrade", {StringField("item_id", item_id)});
      return;
    }
  }

  auto result = Render(manager, target, Readiness::kReady);
  manager.current_result = std::move(result);

  accessres::observability::Metrics::Instance().RecordUpgrade(automatic);
  ACCESSRES_LOG_INFO("Access upgraded",
                     {StringField("item_id", item_id), StringField("mode", accessres::model::ToString(target.mode())),
                      StringField("render", accessres::render::ToString(manager.current_result->type)), BoolField("automatic", automatic)});
}

bool UpgradeOrchestrator::TriggerUpgrade(const std::string& item_id) {
  auto* manager = registry_.Find(item_id);
  if (manager == nullptr || !manager->pending_upgrade) {
    return false;
  }

  const auto staged = *manager->pending_upgrade;
  PerformUpgrade(*manager, staged, false);
  return true;
}

bool UpgradeOrchestrator::ReleaseResult(accessres::readiness::ReadinessManager& manager) {
  if (!manager.current_result) {
    return true;
  }
  const std::string   item_id  = manager.item_id;
  const std::uint64_t instance = manager.instance;

  auto previous = std::move(*manager.current_result);
  manager.current_result.reset();
  previous.cleanup();
  return registry_.IsLive(item_id, instance);
}

accessres::render::RenderResult UpgradeOrchestrator::Render(const accessres::readiness::ReadinessManager& manager,
                                                            const accessres::model::AccessPayload& access, Readiness readiness) {
  const accessres::model::AccessResolution resolution{
      .item_id   = manager.item_id,
      .item_type = manager.item_type,
      .title     = manager.title,
      .access    = access,
  };

  accessres::render::RenderResult result;
  try {
    result = dispatcher_.Dispatch(resolution, options_);
  } catch (const std::exception& e) {
    ACCESSRES_LOG_ERROR("Render dispatch failed", {StringField("item_id", manager.item_id), StringField("error", e.what())});
    result = accessres::render::RenderResult::Error(e.what());
  }
  result.readiness = readiness;
  return result;
}

} // namespace accessres::upgrade
