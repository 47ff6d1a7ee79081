#include "access_session.hpp"

#include <map>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace accessres::session {

using accessres::model::Readiness;
using accessres::readiness::ApplyOutcome;
using accessres::readiness::FrameSource;
using accessres::observability::StringField;
using accessres::observability::UintField;

SessionOptions SessionOptions::FromConfig(const accessres::runtime::config::RuntimeConfig& config) {
  SessionOptions options;
  options.policy = accessres::readiness::AccessPolicy::FromConfig(config.policy());
  if (!config.client().access_lane().empty()) {
    options.access_lane = config.client().access_lane();
  }
  if (!config.client().identity_token().empty()) {
    options.render.identity = config.client().identity_token();
  }
  return options;
}

AccessSession::AccessSession(SessionOptions options, accessres::render::RenderDispatcher& dispatcher, accessres::fetch::AccessFetcher* fetcher,
                             accessres::readiness::AccessObserver observer)
    : options_(std::move(options)),
      observer_(std::move(observer)),
      orchestrator_(registry_, dispatcher, observer_, options_.render),
      state_machine_(registry_, orchestrator_, options_.policy, observer_),
      lanes_(registry_, parser_, state_machine_, options_.policy, options_.access_lane),
      fetcher_(fetcher) {
}

AccessSession::~AccessSession() {
  Teardown();
}

std::optional<Readiness> AccessSession::Bootstrap(const std::string& item_id) {
  if (fetcher_ == nullptr) {
    throw accessres::util::InvalidState("session has no fetcher");
  }

  const bool tracked    = registry_.Contains(item_id);
  const auto generation = BeginFetch(item_id);
  auto       graded     = fetcher_->FetchGradedAccessManifest(item_id);
  if (!graded) {
    ACCESSRES_LOG_WARN("No resolution for item", {StringField("item_id", item_id)});
    if (!tracked) {
      AbandonFetch(item_id, generation);
    }
    return std::nullopt;
  }
  const auto outcome = CompleteFetch(item_id, generation, *graded);
  if (outcome == ApplyOutcome::kStale) {
    return std::nullopt;
  }
  if (!tracked) {
    AbandonFetch(item_id, generation);
  }

  auto state = GetReadinessState(item_id);
  if (state && *state != Readiness::kReady && !lanes_.session_lanes().lanes.empty()) {
    Subscribe(item_id);
  }
  return state;
}

std::size_t AccessSession::Prefetch(const std::vector<std::string>& item_ids, accessres::model::BatchPriority priority) {
  if (fetcher_ == nullptr) {
    throw accessres::util::InvalidState("session has no fetcher");
  }

  accessres::model::BatchAccessRequest    request;
  std::map<std::string, std::uint64_t> generations;
  request.priority = priority;
  for (const auto& item_id : item_ids) {
    if (registry_.Contains(item_id) || generations.contains(item_id)) {
      continue;
    }
    generations.emplace(item_id, BeginFetch(item_id));
    request.item_ids.push_back(item_id);
  }
  if (request.item_ids.empty()) {
    return 0;
  }

  const auto  response = fetcher_->BatchFetchAccessManifests(request);
  std::size_t applied  = 0;
  for (const auto& result : response.results) {
    auto it = generations.find(result.item_id);
    if (it == generations.end()) {
      ACCESSRES_LOG_WARN("Batch returned unrequested item", {StringField("item_id", result.item_id)});
      continue;
    }
    const std::uint64_t generation = it->second;
    generations.erase(it);

    accessres::model::GradedResolution graded;
    graded.item_id        = result.item_id;
    graded.readiness      = result.readiness;
    graded.access         = result.access;
    graded.fallback       = result.fallback;
    graded.upgrade_eta_ms = result.eta_ms;

    const auto outcome = CompleteFetch(result.item_id, generation, graded);
    if (outcome != ApplyOutcome::kStale && outcome != ApplyOutcome::kIgnored) {
      ++applied;
    }
    AbandonFetch(result.item_id, generation);
  }
  for (const auto& error : response.errors) {
    ACCESSRES_LOG_WARN("Batch resolution failed", {StringField("item_id", error.item_id), StringField("error", error.error)});
  }
  // Requested items the batch did not resolve.
  for (const auto& [item_id, generation] : generations) {
    AbandonFetch(item_id, generation);
  }

  ACCESSRES_LOG_INFO("Prefetched access", {UintField("requested", request.item_ids.size()), UintField("applied", applied)});
  return applied;
}

std::uint64_t AccessSession::BeginFetch(const std::string& item_id) {
  auto& manager            = registry_.GetOrCreate(item_id);
  manager.fetch_generation = registry_.NextStamp();
  return manager.fetch_generation;
}

ApplyOutcome AccessSession::CompleteFetch(const std::string& item_id, std::uint64_t generation, const accessres::model::GradedResolution& graded) {
  auto* manager = registry_.Find(item_id);
  if (manager == nullptr || manager->fetch_generation != generation) {
    ACCESSRES_LOG_INFO("Discarded stale fetch completion", {StringField("item_id", item_id), UintField("generation", generation)});
    return ApplyOutcome::kStale;
  }
  if (graded.item_id != item_id) {
    ACCESSRES_LOG_WARN("Fetch returned a different item", {StringField("item_id", item_id), StringField("returned", graded.item_id)});
    return ApplyOutcome::kIgnored;
  }

  if (graded.item_type != accessres::model::ItemType::kUnknown) {
    manager->item_type = graded.item_type;
  }
  if (!graded.title.empty()) {
    manager->title = graded.title;
  }

  auto fallback = graded.fallback;
  if (graded.readiness == Readiness::kDegraded && !fallback && graded.access) {
    // Degraded without a fallback: present the primary access as degraded.
    ACCESSRES_LOG_INFO("Degraded resolution without fallback", {StringField("item_id", item_id)});
    fallback = graded.access;
  }

  const auto frame = accessres::model::MakeFrame(item_id, graded.readiness, graded.access, fallback, accessres::util::NowMillis());
  return state_machine_.ApplyFrame(frame, FrameSource::kBootstrap);
}

void AccessSession::AbandonFetch(const std::string& item_id, std::uint64_t generation) {
  const auto* manager = registry_.Find(item_id);
  if (manager == nullptr || manager->fetch_generation != generation || manager->current_result) {
    return;
  }
  ACCESSRES_LOG_DEBUG("Dropped unresolved item", {StringField("item_id", item_id)});
  registry_.Destroy(item_id);
}

void AccessSession::SetSessionLanes(accessres::lane::SessionLanes lanes) {
  lanes_.SetSessionLanes(std::move(lanes));
}

std::shared_ptr<const accessres::lane::LaneSubscription> AccessSession::Subscribe(const std::string& item_id) {
  return lanes_.Subscribe(item_id);
}

bool AccessSession::Unsubscribe(const std::string& item_id) {
  return lanes_.Unsubscribe(item_id);
}

void AccessSession::UnsubscribeAll() {
  lanes_.UnsubscribeAll();
}

bool AccessSession::IsSubscribed(const std::string& item_id) const {
  return lanes_.IsSubscribed(item_id);
}

std::vector<std::string> AccessSession::ActiveSubscriptions() const {
  return lanes_.ActiveSubscriptions();
}

std::size_t AccessSession::FeedLaneChunk(std::string_view chunk) {
  return parser_.Feed(chunk);
}

ApplyOutcome AccessSession::ApplyFrame(const accessres::model::AccessFrame& frame) {
  return state_machine_.ApplyFrame(frame);
}

bool AccessSession::TriggerUpgrade(const std::string& item_id) {
  return orchestrator_.TriggerUpgrade(item_id);
}

std::optional<Readiness> AccessSession::GetReadinessState(const std::string& item_id) const {
  const auto* manager = registry_.Find(item_id);
  if (manager == nullptr) {
    return std::nullopt;
  }
  return manager->current_state;
}

bool AccessSession::HasUpgradeAvailable(const std::string& item_id) const {
  const auto* manager = registry_.Find(item_id);
  return manager != nullptr && manager->pending_upgrade.has_value();
}

const accessres::render::RenderResult* AccessSession::CurrentResult(const std::string& item_id) const {
  const auto* manager = registry_.Find(item_id);
  if (manager == nullptr || !manager->current_result) {
    return nullptr;
  }
  return &*manager->current_result;
}

std::vector<std::string> AccessSession::TrackedItems() const {
  return registry_.ItemIds();
}

bool AccessSession::Destroy(const std::string& item_id) {
  const bool subscribed = lanes_.Unsubscribe(item_id);
  const bool destroyed  = registry_.Destroy(item_id);
  return subscribed || destroyed;
}

void AccessSession::Teardown() {
  lanes_.UnsubscribeAll();
  registry_.Clear();
  parser_.Reset();
}

} // namespace accessres::session
