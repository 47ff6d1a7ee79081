#pragma once

#include <string>

#include "internal/readiness/access_policy.hpp"
#include "internal/readiness/access_registry.hpp"
#include "internal/render/render_dispatcher.hpp"

namespace accessres::upgrade {

/*
  Swaps an item's active rendering for a READY payload.

  PerformUpgrade runs, in order: the old result's cleanup, state := READY
  with the staged upgrade cleared, the readiness observer, then a dispatch
  whose result becomes current_result. Identical payloads are not
  deduplicated; a repeated upgrade re-renders.
*/
class UpgradeOrchestrator {
 public:
  UpgradeOrchestrator(accessres::readiness::AccessRegistry&       registry,
                      accessres::render::RenderDispatcher&        dispatcher,
                      const accessres::readiness::AccessObserver& observer,
                      accessres::render::RenderOptions            options = {});

  void PerformUpgrade(accessres::readiness::ReadinessManager& manager, const accessres::model::AccessPayload& access, bool automatic);

  // Applies the staged upgrade; false when the item has none.
  bool TriggerUpgrade(const std::string& item_id);

  // Detaches current_result and runs its cleanup. Returns false when the
  // cleanup destroyed the item; the manager must not be touched then.
  bool ReleaseResult(accessres::readiness::ReadinessManager& manager);

  // Dispatches a payload in the manager's presentation context.
  accessres::render::RenderResult Render(const accessres::readiness::ReadinessManager& manager, const accessres::model::AccessPayload& access,
                                         accessres::model::Readiness readiness);

 private:
  accessres::readiness::AccessRegistry&       registry_;
  accessres::render::RenderDispatcher&        dispatcher_;
  const accessres::readiness::AccessObserver& observer_;
  accessres::render::RenderOptions            options_;
};

} // namespace accessres::upgrade
