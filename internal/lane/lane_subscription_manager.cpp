#include "lane_subscription_manager.hpp"

#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace accessres::lane {

using accessres::observability::StringField;
using accessres::observability::UintField;

LaneSubscriptionManager::LaneSubscriptionManager(accessres::readiness::AccessRegistry& registry, accessres::wire::FrameStreamParser& parser,
                                                 accessres::readiness::ReadinessStateMachine& state_machine,
                                                 const accessres::readiness::AccessPolicy& policy, std::string access_lane)
    : registry_(registry), parser_(parser), state_machine_(state_machine), policy_(policy), access_lane_(std::move(access_lane)) {
}

LaneSubscriptionManager::~LaneSubscriptionManager() {
  UnsubscribeAll();
}

void LaneSubscriptionManager::SetSessionLanes(SessionLanes lanes) {
  lanes_ = std::move(lanes);
  ACCESSRES_LOG_INFO("Session lanes updated", {StringField("session_id", lanes_.session_id), UintField("lanes", lanes_.lanes.size())});
}

std::shared_ptr<const LaneSubscription> LaneSubscriptionManager::Subscribe(const std::string& item_id) {
  if (auto existing = registry_.FindSubscription(item_id)) {
    return existing;
  }

  const auto lane = lanes_.Find(access_lane_);
  if (!lane) {
    ACCESSRES_LOG_WARN("No access lane advertised", {StringField("item_id", item_id), StringField("lane", access_lane_)});
    return nullptr;
  }

  auto subscription           = std::make_shared<LaneSubscription>();
  subscription->id            = next_id_++;
  subscription->item_id       = item_id;
  subscription->lane          = lane->name;
  subscription->handler_token = parser_.Subscribe([this, item_id](const accessres::model::AccessFrame& frame) { HandleFrame(item_id, frame); });
  registry_.PutSubscription(subscription);

  auto& manager       = registry_.GetOrCreate(item_id);
  manager.unsubscribe = [this, item_id] { Unsubscribe(item_id); };

  ACCESSRES_LOG_DEBUG("Subscribed to access lane", {StringField("item_id", item_id), StringField("lane", lane->name)});
  return subscription;
}

bool LaneSubscriptionManager::Unsubscribe(const std::string& item_id) {
  auto subscription = registry_.TakeSubscription(item_id);
  if (!subscription) {
    return false;
  }

  parser_.Unsubscribe(subscription->handler_token);
  if (auto* manager = registry_.Find(item_id)) {
    manager->unsubscribe = nullptr;
  }
  ACCESSRES_LOG_DEBUG("Unsubscribed from access lane", {StringField("item_id", item_id)});
  return true;
}

void LaneSubscriptionManager::UnsubscribeAll() {
  for (const auto& item_id : registry_.SubscribedItemIds()) {
    Unsubscribe(item_id);
  }
}

bool LaneSubscriptionManager::IsSubscribed(const std::string& item_id) const {
  return registry_.FindSubscription(item_id) != nullptr;
}

std::vector<std::string> LaneSubscriptionManager::ActiveSubscriptions() const {
  return registry_.SubscribedItemIds();
}

void LaneSubscriptionManager::HandleFrame(const std::string& item_id, const accessres::model::AccessFrame& frame) {
  if (frame.item_id != item_id) {
    return;
  }

  const auto verdict = accessres::readiness::CheckFrame(frame, policy_, accessres::util::NowMillis());
  if (verdict != accessres::readiness::FrameVerdict::kAccept) {
    ACCESSRES_LOG_WARN("Discarded lane frame", {StringField("item_id", item_id), StringField("reason", accessres::readiness::ToString(verdict))});
    return;
  }
  state_machine_.ApplyFrame(frame);
}

} // namespace accessres::lane
