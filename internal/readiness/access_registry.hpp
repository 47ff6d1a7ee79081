#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/lane/lane_subscription.hpp"
#include "readiness_manager.hpp"

namespace accessres::readiness {

/*
  Owned store of per-item state: readiness managers and lane subscriptions,
  both keyed by item id.

  Managers are created lazily and destroyed only through Destroy/Clear.
  References returned by GetOrCreate stay valid until the item is destroyed.
  Not thread safe; the owning session serializes access.
*/
class AccessRegistry {
 public:
  AccessRegistry() = default;
  AccessRegistry(const AccessRegistry&)            = delete;
  AccessRegistry& operator=(const AccessRegistry&) = delete;
  ~AccessRegistry();

  // ---------------------------------------------------------------------
  // Readiness managers
  // ---------------------------------------------------------------------

  ReadinessManager&       GetOrCreate(const std::string& item_id);
  ReadinessManager*       Find(const std::string& item_id);
  const ReadinessManager* Find(const std::string& item_id) const;
  bool                    Contains(const std::string& item_id) const;

  // True while the manager created as `instance` is still registered.
  bool IsLive(const std::string& item_id, std::uint64_t instance) const;

  // Detaches the subscription, runs the current result's cleanup and drops
  // the manager. Returns false if the item was unknown.
  bool Destroy(const std::string& item_id);
  void Clear();

  std::vector<std::string> ItemIds() const;
  std::size_t              size() const { return managers_.size(); }

  // Registry-wide monotonic stamp for instances and fetch generations.
  std::uint64_t NextStamp() { return ++stamp_; }

  // ---------------------------------------------------------------------
  // Lane subscriptions
  // ---------------------------------------------------------------------

  std::shared_ptr<const accessres::lane::LaneSubscription> FindSubscription(const std::string& item_id) const;
  void                                                  PutSubscription(std::shared_ptr<const accessres::lane::LaneSubscription> subscription);
  std::shared_ptr<const accessres::lane::LaneSubscription> TakeSubscription(const std::string& item_id);
  std::vector<std::string>                              SubscribedItemIds() const;

 private:
  std::unordered_map<std::string, ReadinessManager>                                       managers_;
  std::unordered_map<std::string, std::shared_ptr<const accessres::lane::LaneSubscription>> subscriptions_;
  std::uint64_t                                                                           stamp_{0};
};

} // namespace accessres::readiness
