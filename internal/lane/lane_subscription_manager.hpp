#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/readiness/access_policy.hpp"
#include "internal/readiness/access_registry.hpp"
#include "internal/readiness/readiness_state_machine.hpp"
#include "internal/wire/frame_stream_parser.hpp"
#include "lane_subscription.hpp"
#include "session_lanes.hpp"

namespace accessres::lane {

/*
  Multiplexes the shared push parser into per-item subscriptions.

  At most one subscription per item exists; subscribing again returns the
  registered one. Each subscription's handler drops frames for other items
  and frames failing the integrity/age gate, and forwards the rest to the
  state machine.
*/
class LaneSubscriptionManager {
 public:
  LaneSubscriptionManager(accessres::readiness::AccessRegistry& registry, accessres::wire::FrameStreamParser& parser,
                          accessres::readiness::ReadinessStateMachine& state_machine, const accessres::readiness::AccessPolicy& policy,
                          std::string access_lane = std::string(kDefaultAccessLane));
  LaneSubscriptionManager(const LaneSubscriptionManager&)            = delete;
  LaneSubscriptionManager& operator=(const LaneSubscriptionManager&) = delete;

  // Detaches every subscription so no manager keeps a hook into this object.
  ~LaneSubscriptionManager();

  void                SetSessionLanes(SessionLanes lanes);
  const SessionLanes& session_lanes() const { return lanes_; }

  // nullptr when the session advertises no access lane.
  std::shared_ptr<const LaneSubscription> Subscribe(const std::string& item_id);
  bool                                    Unsubscribe(const std::string& item_id);
  void                                    UnsubscribeAll();

  bool                     IsSubscribed(const std::string& item_id) const;
  std::vector<std::string> ActiveSubscriptions() const;

 private:
  void HandleFrame(const std::string& item_id, const accessres::model::AccessFrame& frame);

  accessres::readiness::AccessRegistry&        registry_;
  accessres::wire::FrameStreamParser&          parser_;
  accessres::readiness::ReadinessStateMachine& state_machine_;
  const accessres::readiness::AccessPolicy&    policy_;
  std::string                               access_lane_;
  SessionLanes                              lanes_;
  std::uint64_t                             next_id_{1};
};

} // namespace accessres::lane
