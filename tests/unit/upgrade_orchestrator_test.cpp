#include "internal/upgrade/upgrade_orchestrator.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using accessres::model::AccessFormat;
using accessres::model::AccessPayload;
using accessres::model::ItemType;
using accessres::model::Readiness;
using accessres::render::CleanupHandle;
using accessres::render::RenderResult;
using accessres::render::RenderType;

// Appends every dispatch and teardown to a shared event log.
class OrderedDispatcher : public accessres::render::RenderDispatcher {
 public:
  explicit OrderedDispatcher(std::vector<std::string>* events) : events_(events) {}

  RenderResult Dispatch(const accessres::model::AccessResolution& resolution, const accessres::render::RenderOptions& options) override {
    if (fail_next) {
      fail_next = false;
      throw std::runtime_error("renderer unavailable");
    }
    const std::string url = resolution.access.Locator();
    events_->push_back("dispatch:" + url);
    last_type  = resolution.item_type;
    last_title = resolution.title;
    autoplay   = options.autoplay;

    RenderResult result;
    result.type    = RenderType::kPlayer;
    result.url     = url;
    result.cleanup = CleanupHandle([events = events_, url] { events->push_back("cleanup:" + url); });
    return result;
  }

  bool        fail_next{false};
  ItemType    last_type{ItemType::kUnknown};
  std::string last_title;
  bool        autoplay{false};

 private:
  std::vector<std::string>* events_;
};

AccessPayload Stream(const std::string& uri) {
  return AccessPayload::Stream(AccessFormat::kHls, uri);
}

void TestCleanupRunsBeforeObserverAndDispatch() {
  std::vector<std::string>          events;
  OrderedDispatcher                 dispatcher(&events);
  accessres::readiness::AccessObserver observer;
  observer.on_readiness_change = [&](const std::string& item_id, Readiness state) {
    events.push_back("observer:" + item_id + ":" + std::string(accessres::model::ToString(state)));
  };
  accessres::readiness::AccessRegistry    registry;
  accessres::render::RenderOptions        options;
  options.autoplay = true;
  accessres::upgrade::UpgradeOrchestrator orchestrator(registry, dispatcher, observer, options);

  auto& manager     = registry.GetOrCreate("vid-42");
  manager.item_type = ItemType::kVideo;
  manager.title     = "Launch talk";
  manager.current_state  = Readiness::kDegraded;
  manager.current_result = orchestrator.Render(manager, Stream("https://cdn/preview.m3u8"), Readiness::kDegraded);
  manager.pending_upgrade = Stream("https://cdn/full.m3u8");
  events.clear();

  assert(orchestrator.TriggerUpgrade("vid-42"));
  assert((events == std::vector<std::string>{"cleanup:https://cdn/preview.m3u8", "observer:vid-42:READY", "dispatch:https://cdn/full.m3u8"}));
  assert(manager.current_state == Readiness::kReady);
  assert(!manager.pending_upgrade);
  assert(manager.current_result->readiness == Readiness::kReady);
  assert(dispatcher.last_type == ItemType::kVideo);
  assert(dispatcher.last_title == "Launch talk");
  assert(dispatcher.autoplay);

  // Repeating the same payload re-renders.
  orchestrator.PerformUpgrade(manager, Stream("https://cdn/full.m3u8"), true);
  assert(events.size() == 6);
  assert(events[3] == "cleanup:https://cdn/full.m3u8");
  assert(events[5] == "dispatch:https://cdn/full.m3u8");

  registry.Destroy("vid-42");
  assert(events.back() == "cleanup:https://cdn/full.m3u8");
}

void TestTriggerWithoutStagedUpgrade() {
  std::vector<std::string>             events;
  OrderedDispatcher                    dispatcher(&events);
  accessres::readiness::AccessObserver    observer;
  accessres::readiness::AccessRegistry    registry;
  accessres::upgrade::UpgradeOrchestrator orchestrator(registry, dispatcher, observer);

  assert(!orchestrator.TriggerUpgrade("missing"));
  registry.GetOrCreate("vid-42");
  assert(!orchestrator.TriggerUpgrade("vid-42"));
  assert(events.empty());
}

void TestDispatchFailureBecomesErrorResult() {
  std::vector<std::string>             events;
  OrderedDispatcher                    dispatcher(&events);
  accessres::readiness::AccessObserver    observer;
  accessres::readiness::AccessRegistry    registry;
  accessres::upgrade::UpgradeOrchestrator orchestrator(registry, dispatcher, observer);

  auto& manager        = registry.GetOrCreate("vid-42");
  dispatcher.fail_next = true;
  orchestrator.PerformUpgrade(manager, Stream("https://cdn/full.m3u8"), true);

  assert(manager.current_state == Readiness::kReady);
  assert(manager.current_result->type == RenderType::kError);
  assert(manager.current_result->error == std::optional<std::string>("renderer unavailable"));
  assert(manager.current_result->readiness == Readiness::kReady);
}

void TestObserverDestroyingItemStopsUpgrade() {
  std::vector<std::string>          events;
  OrderedDispatcher                 dispatcher(&events);
  accessres::readiness::AccessObserver observer;
  accessres::readiness::AccessRegistry registry;
  observer.on_readiness_change = [&](const std::string& item_id, Readiness) { registry.Destroy(item_id); };
  accessres::upgrade::UpgradeOrchestrator orchestrator(registry, dispatcher, observer);

  auto& manager           = registry.GetOrCreate("vid-42");
  manager.pending_upgrade = Stream("https://cdn/full.m3u8");
  assert(orchestrator.TriggerUpgrade("vid-42"));
  assert(!registry.Contains("vid-42"));
  assert(events.empty());
}

void TestCleanupDestroyingItemStopsUpgrade() {
  std::vector<std::string>             events;
  OrderedDispatcher                    dispatcher(&events);
  accessres::readiness::AccessObserver observer;
  int                                  notifications = 0;
  observer.on_readiness_change = [&](const std::string&, Readiness) { ++notifications; };
  accessres::readiness::AccessRegistry    registry;
  accessres::upgrade::UpgradeOrchestrator orchestrator(registry, dispatcher, observer);

  auto& manager                   = registry.GetOrCreate("vid-42");
  manager.current_state           = Readiness::kDegraded;
  manager.current_result          = RenderResult::Pending();
  manager.current_result->cleanup = CleanupHandle([&] {
    events.push_back("teardown");
    registry.Destroy("vid-42");
  });
  manager.pending_upgrade = Stream("https://cdn/full.m3u8");

  assert(orchestrator.TriggerUpgrade("vid-42"));
  assert(!registry.Contains("vid-42"));
  assert((events == std::vector<std::string>{"teardown"}));
  assert(notifications == 0);
}

void TestReleaseResultReportsLiveness() {
  std::vector<std::string>                events;
  OrderedDispatcher                       dispatcher(&events);
  accessres::readiness::AccessObserver    observer;
  accessres::readiness::AccessRegistry    registry;
  accessres::upgrade::UpgradeOrchestrator orchestrator(registry, dispatcher, observer);

  auto& manager = registry.GetOrCreate("vid-42");
  assert(orchestrator.ReleaseResult(manager));

  manager.current_result = orchestrator.Render(manager, Stream("https://cdn/preview.m3u8"), Readiness::kDegraded);
  assert(orchestrator.ReleaseResult(manager));
  assert(!manager.current_result);
  assert(events.back() == "cleanup:https://cdn/preview.m3u8");
}

void TestCleanupHandleRunsOnce() {
  int           runs = 0;
  CleanupHandle handle([&] { ++runs; });
  CleanupHandle copy = handle;
  assert(handle.armed());
  copy();
  handle();
  assert(runs == 1);
  assert(!handle.armed());

  CleanupHandle empty;
  empty();
  assert(!empty.armed());
}

} // namespace

int main() {
  TestCleanupRunsBeforeObserverAndDispatch();
  TestTriggerWithoutStagedUpgrade();
  TestDispatchFailureBecomesErrorResult();
  TestObserverDestroyingItemStopsUpgrade();
  TestCleanupDestroyingItemStopsUpgrade();
  TestReleaseResultReportsLiveness();
  TestCleanupHandleRunsOnce();

  std::cout << "access_resolver_unit_upgrade_orchestrator: pass\n";
  return 0;
}
