#include "access_registry.hpp"

#include <utility>

#include "internal/observability/logging.hpp"

namespace accessres::readiness {

using accessres::observability::StringField;

AccessRegistry::~AccessRegistry() {
  Clear();
}

ReadinessManager& AccessRegistry::GetOrCreate(const std::string& item_id) {
  auto it = managers_.find(item_id);
  if (it != managers_.end()) {
    return it->second;
  }

  ReadinessManager manager;
  manager.item_id  = item_id;
  manager.instance = NextStamp();
  ACCESSRES_LOG_DEBUG("Created readiness manager", {StringField("item_id", item_id)});
  return managers_.emplace(item_id, std::move(manager)).first->second;
}

ReadinessManager* AccessRegistry::Find(const std::string& item_id) {
  auto it = managers_.find(item_id);
  return it == managers_.end() ? nullptr : &it->second;
}

const ReadinessManager* AccessRegistry::Find(const std::string& item_id) const {
  auto it = managers_.find(item_id);
  return it == managers_.end() ? nullptr : &it->second;
}

bool AccessRegistry::Contains(const std::string& item_id) const {
  return managers_.contains(item_id);
}

bool AccessRegistry::IsLive(const std::string& item_id, std::uint64_t instance) const {
  const auto* manager = Find(item_id);
  return manager != nullptr && manager->instance == instance;
}

bool AccessRegistry::Destroy(const std::string& item_id) {
  auto it = managers_.find(item_id);
  if (it == managers_.end()) {
    return false;
  }

  // Move out before running callbacks; they may look the item up again.
  ReadinessManager manager = std::move(it->second);
  managers_.erase(it);

  if (manager.unsubscribe) {
    manager.unsubscribe();
  }
  if (manager.current_result) {
    manager.current_result->cleanup();
  }
  ACCESSRES_LOG_DEBUG("Destroyed readiness manager", {StringField("item_id", item_id)});
  return true;
}

void AccessRegistry::Clear() {
  for (const auto& item_id : ItemIds()) {
    Destroy(item_id);
  }
  subscriptions_.clear();
}

std::vector<std::string> AccessRegistry::ItemIds() const {
  std::vector<std::string> ids;
  ids.reserve(managers_.size());
  for (const auto& [item_id, manager] : managers_) {
    ids.push_back(item_id);
  }
  return ids;
}

std::shared_ptr<const accessres::lane::LaneSubscription> AccessRegistry::FindSubscription(const std::string& item_id) const {
  auto it = subscriptions_.find(item_id);
  return it == subscriptions_.end() ? nullptr : it->second;
}

void AccessRegistry::PutSubscription(std::shared_ptr<const accessres::lane::LaneSubscription> subscription) {
  auto item_id            = subscription->item_id;
  subscriptions_[item_id] = std::move(subscription);
}

std::shared_ptr<const accessres::lane::LaneSubscription> AccessRegistry::TakeSubscription(const std::string& item_id) {
  auto it = subscriptions_.find(item_id);
  if (it == subscriptions_.end()) {
    return nullptr;
  }
  auto subscription = std::move(it->second);
  subscriptions_.erase(it);
  return subscription;
}

std::vector<std::string> AccessRegistry::SubscribedItemIds() const {
  std::vector<std::string> ids;
  ids.reserve(subscriptions_.size());
  for (const auto& [item_id, subscription] : subscriptions_) {
    ids.push_back(item_id);
  }
  return ids;
}

} // namespace accessres::readiness
