#include "internal/lane/lane_subscription_manager.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/upgrade/upgrade_orchestrator.hpp"
#include "internal/util/time.hpp"
#include "internal/wire/frame_codec.hpp"

namespace {

using accessres::model::AccessFormat;
using accessres::model::AccessPayload;
using accessres::model::Readiness;
using accessres::render::RenderResult;
using accessres::render::RenderType;

class CountingDispatcher : public accessres::render::RenderDispatcher {
 public:
  RenderResult Dispatch(const accessres::model::AccessResolution&, const accessres::render::RenderOptions&) override {
    ++dispatches;
    RenderResult result;
    result.type = RenderType::kPlayer;
    return result;
  }

  int dispatches{0};
};

struct Fixture {
  Fixture() {
    accessres::lane::SessionLanes session;
    session.session_id = "sess-1";
    session.lanes      = {{"access", "https://push.example/lanes/access"}, {"presence", "https://push.example/lanes/presence"}};
    lanes.SetSessionLanes(session);
  }

  CountingDispatcher                       dispatcher;
  accessres::readiness::AccessPolicy          policy;
  accessres::readiness::AccessObserver        observer;
  accessres::readiness::AccessRegistry        registry;
  accessres::wire::FrameStreamParser          parser;
  accessres::upgrade::UpgradeOrchestrator     orchestrator{registry, dispatcher, observer};
  accessres::readiness::ReadinessStateMachine machine{registry, orchestrator, policy, observer};
  accessres::lane::LaneSubscriptionManager    lanes{registry, parser, machine, policy};
};

std::string ReadyLine(const std::string& item_id, std::uint64_t ts) {
  auto frame = accessres::model::MakeFrame(item_id, Readiness::kReady, AccessPayload::Stream(AccessFormat::kHls, "https://cdn/" + item_id),
                                        std::nullopt, ts);
  return accessres::wire::EncodeFrameBase64(frame) + "\n";
}

void TestSubscribeIsIdempotent() {
  Fixture f;

  auto first  = f.lanes.Subscribe("vid-42");
  auto second = f.lanes.Subscribe("vid-42");
  assert(first != nullptr);
  assert(first == second);
  assert(first->lane == "access");
  assert(f.parser.handler_count() == 1);
  assert(f.lanes.IsSubscribed("vid-42"));
  assert(f.registry.Contains("vid-42"));

  f.lanes.Subscribe("vid-43");
  assert(f.parser.handler_count() == 2);
  assert(f.lanes.ActiveSubscriptions().size() == 2);
}

void TestNoAccessLaneMeansNoSubscription() {
  Fixture                    f;
  accessres::lane::SessionLanes presence_only;
  presence_only.session_id = "sess-2";
  presence_only.lanes      = {{"presence", "https://push.example/lanes/presence"}};
  f.lanes.SetSessionLanes(presence_only);

  assert(f.lanes.Subscribe("vid-42") == nullptr);
  assert(f.parser.handler_count() == 0);
  assert(!f.lanes.IsSubscribed("vid-42"));
}

void TestFramesRouteOnlyToTheirItem() {
  Fixture f;
  f.lanes.Subscribe("vid-42");
  f.lanes.Subscribe("vid-43");

  const auto now = accessres::util::NowMillis();
  assert(f.parser.Feed(ReadyLine("vid-42", now)) == 1);
  assert(f.registry.Find("vid-42")->current_state == Readiness::kReady);
  assert(f.registry.Find("vid-43")->current_state == Readiness::kPending);
  assert(f.dispatcher.dispatches == 1);

  // Frames for items nobody subscribed to are not applied.
  f.parser.Feed(ReadyLine("vid-99", now));
  assert(!f.registry.Contains("vid-99"));
}

void TestExpiredLaneFramesAreDiscarded() {
  Fixture f;
  f.lanes.Subscribe("vid-42");

  f.parser.Feed(ReadyLine("vid-42", accessres::util::NowMillis() - 10 * 60 * 1000));
  assert(f.registry.Find("vid-42")->current_state == Readiness::kPending);
  assert(f.dispatcher.dispatches == 0);
}

void TestUnsubscribeDetachesHandler() {
  Fixture f;
  f.lanes.Subscribe("vid-42");
  assert(f.lanes.Unsubscribe("vid-42"));
  assert(!f.lanes.Unsubscribe("vid-42"));
  assert(f.parser.handler_count() == 0);
  assert(!f.registry.Find("vid-42")->unsubscribe);

  f.parser.Feed(ReadyLine("vid-42", accessres::util::NowMillis()));
  assert(f.registry.Find("vid-42")->current_state == Readiness::kPending);
}

void TestUnsubscribeAllAndDestroy() {
  Fixture f;
  f.lanes.Subscribe("vid-1");
  f.lanes.Subscribe("vid-2");
  f.lanes.Subscribe("vid-3");

  // Destroying an item detaches its subscription through the manager hook.
  f.registry.Destroy("vid-1");
  assert(!f.lanes.IsSubscribed("vid-1"));
  assert(f.parser.handler_count() == 2);

  f.lanes.UnsubscribeAll();
  assert(f.lanes.ActiveSubscriptions().empty());
  assert(f.parser.handler_count() == 0);
  assert(f.registry.Contains("vid-2"));
}

void TestCustomLaneName() {
  CountingDispatcher                       dispatcher;
  accessres::readiness::AccessPolicy          policy;
  accessres::readiness::AccessObserver        observer;
  accessres::readiness::AccessRegistry        registry;
  accessres::wire::FrameStreamParser          parser;
  accessres::upgrade::UpgradeOrchestrator     orchestrator(registry, dispatcher, observer);
  accessres::readiness::ReadinessStateMachine machine(registry, orchestrator, policy, observer);
  accessres::lane::LaneSubscriptionManager    lanes(registry, parser, machine, policy, "grades");

  accessres::lane::SessionLanes session;
  session.lanes = {{"access", "https://push.example/a"}, {"grades", "https://push.example/g"}};
  lanes.SetSessionLanes(session);

  auto subscription = lanes.Subscribe("vid-42");
  assert(subscription != nullptr);
  assert(subscription->lane == "grades");
}

} // namespace

int main() {
  TestSubscribeIsIdempotent();
  TestNoAccessLaneMeansNoSubscription();
  TestFramesRouteOnlyToTheirItem();
  TestExpiredLaneFramesAreDiscarded();
  TestUnsubscribeDetachesHandler();
  TestUnsubscribeAllAndDestroy();
  TestCustomLaneName();

  std::cout << "access_resolver_unit_lane_subscription_manager: pass\n";
  return 0;
}
