#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/fetch/access_fetcher.hpp"
#include "internal/lane/lane_subscription_manager.hpp"
#include "internal/readiness/access_policy.hpp"
#include "internal/readiness/access_registry.hpp"
#include "internal/readiness/readiness_state_machine.hpp"
#include "internal/render/render_dispatcher.hpp"
#include "internal/upgrade/upgrade_orchestrator.hpp"
#include "internal/wire/frame_stream_parser.hpp"

namespace accessres::runtime::config {
class RuntimeConfig;
}

namespace accessres::session {

struct SessionOptions {
  accessres::readiness::AccessPolicy policy;
  std::string                     access_lane{accessres::lane::kDefaultAccessLane};
  accessres::render::RenderOptions   render;

  static SessionOptions FromConfig(const accessres::runtime::config::RuntimeConfig& config);
};

/*
  Owns the per-item state of one resolution session and wires the pipeline:

    fetcher / lane chunks -> parser -> lane filter -> state machine
                                                   -> upgrade orchestrator
                                                   -> render dispatcher

  Every call must come from the thread that owns the session. Teardown (also
  run by the destructor) detaches all subscriptions and destroys every
  manager, running the current results' cleanup.
*/
class AccessSession {
 public:
  AccessSession(SessionOptions options, accessres::render::RenderDispatcher& dispatcher, accessres::fetch::AccessFetcher* fetcher = nullptr,
                accessres::readiness::AccessObserver observer = {});
  AccessSession(const AccessSession&)            = delete;
  AccessSession& operator=(const AccessSession&) = delete;
  ~AccessSession();

  // ---------------------------------------------------------------------
  // Fetch bootstrap
  // ---------------------------------------------------------------------

  // Graded fetch applied as a frame; subscribes the item while it is not
  // READY and a lane is known. nullopt when the fetch failed, in which case
  // an item first tracked by this call is dropped again.
  std::optional<accessres::model::Readiness> Bootstrap(const std::string& item_id);

  // Batch bootstrap of items not yet tracked. Returns how many were applied.
  std::size_t Prefetch(const std::vector<std::string>& item_ids,
                       accessres::model::BatchPriority    priority = accessres::model::BatchPriority::kNormal);

  // Completions carrying an older generation than the newest BeginFetch (or
  // arriving after Destroy) are discarded as kStale.
  std::uint64_t                   BeginFetch(const std::string& item_id);
  accessres::readiness::ApplyOutcome CompleteFetch(const std::string& item_id, std::uint64_t generation,
                                                const accessres::model::GradedResolution& graded);

  // ---------------------------------------------------------------------
  // Push lane
  // ---------------------------------------------------------------------

  void                                                  SetSessionLanes(accessres::lane::SessionLanes lanes);
  std::shared_ptr<const accessres::lane::LaneSubscription> Subscribe(const std::string& item_id);
  bool                                                  Unsubscribe(const std::string& item_id);
  void                                                  UnsubscribeAll();
  bool                                                  IsSubscribed(const std::string& item_id) const;
  std::vector<std::string>                              ActiveSubscriptions() const;

  std::size_t                     FeedLaneChunk(std::string_view chunk);
  accessres::readiness::ApplyOutcome ApplyFrame(const accessres::model::AccessFrame& frame);

  // ---------------------------------------------------------------------
  // State
  // ---------------------------------------------------------------------

  bool                                    TriggerUpgrade(const std::string& item_id);
  std::optional<accessres::model::Readiness> GetReadinessState(const std::string& item_id) const;
  bool                                    HasUpgradeAvailable(const std::string& item_id) const;
  const accessres::render::RenderResult*     CurrentResult(const std::string& item_id) const;
  std::vector<std::string>                TrackedItems() const;

  bool Destroy(const std::string& item_id);
  void Teardown();

 private:
  // Drops an entry that only BeginFetch created once its fetch has failed.
  void AbandonFetch(const std::string& item_id, std::uint64_t generation);

  SessionOptions                           options_;
  accessres::readiness::AccessObserver        observer_;
  accessres::readiness::AccessRegistry        registry_;
  accessres::wire::FrameStreamParser          parser_;
  accessres::upgrade::UpgradeOrchestrator     orchestrator_;
  accessres::readiness::ReadinessStateMachine state_machine_;
  accessres::lane::LaneSubscriptionManager    lanes_;
  accessres::fetch::AccessFetcher*            fetcher_;
};

} // namespace accessres::session
