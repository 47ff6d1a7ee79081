#include "internal/readiness/readiness_state_machine.hpp"

#include <cassert>
#include <functional>
#include <iostream>
#include <string>
#include <vector>

#include "internal/upgrade/upgrade_orchestrator.hpp"
#include "internal/wire/frame_codec.hpp"

namespace {

using accessres::model::AccessFormat;
using accessres::model::AccessFrame;
using accessres::model::AccessPayload;
using accessres::model::Readiness;
using accessres::readiness::ApplyOutcome;
using accessres::readiness::FrameSource;
using accessres::render::RenderResult;
using accessres::render::RenderType;

constexpr std::uint64_t kNow = 1'700'000'000'000ull;

class RecordingDispatcher : public accessres::render::RenderDispatcher {
 public:
  RenderResult Dispatch(const accessres::model::AccessResolution& resolution, const accessres::render::RenderOptions&) override {
    const std::string url = resolution.access.Locator();
    dispatched.push_back(url);

    RenderResult result;
    result.type    = RenderType::kPlayer;
    result.url     = url;
    result.cleanup = accessres::render::CleanupHandle([this, url, item_id = resolution.item_id] {
      cleaned.push_back(url);
      if (on_cleanup) {
        on_cleanup(item_id);
      }
    });
    return result;
  }

  std::vector<std::string>                dispatched;
  std::vector<std::string>                cleaned;
  std::function<void(const std::string&)> on_cleanup;
};

struct Fixture {
  explicit Fixture(accessres::readiness::AccessPolicy initial = {}) : policy(initial) {
    observer.on_readiness_change = [this](const std::string& item_id, Readiness state) {
      changes.push_back(item_id + ":" + std::string(accessres::model::ToString(state)));
    };
    observer.on_upgrade_available = [this](const std::string& item_id, const AccessPayload&) { available.push_back(item_id); };
  }

  // Declared before the registry: the registry runs cleanups that record here.
  RecordingDispatcher                  dispatcher;
  accessres::readiness::AccessPolicy      policy;
  accessres::readiness::AccessObserver    observer;
  std::vector<std::string>             changes;
  std::vector<std::string>             available;
  accessres::readiness::AccessRegistry    registry;
  accessres::upgrade::UpgradeOrchestrator orchestrator{registry, dispatcher, observer};
  accessres::readiness::ReadinessStateMachine machine{registry, orchestrator, policy, observer};
};

AccessPayload Hls() {
  return AccessPayload::Stream(AccessFormat::kHls, "https://cdn/vid-42.m3u8");
}

AccessPayload Preview() {
  return AccessPayload::Embed(AccessFormat::kMp4, "https://cdn/vid-42-preview.mp4");
}

AccessFrame Frame(Readiness readiness, std::optional<AccessPayload> access, std::optional<AccessPayload> fallback, std::uint64_t ts,
                  const std::string& item_id = "vid-42") {
  return accessres::model::MakeFrame(item_id, readiness, std::move(access), std::move(fallback), ts);
}

void TestDegradedThenReadyUpgradesOnce() {
  Fixture f;

  assert(f.machine.ApplyFrame(Frame(Readiness::kPending, std::nullopt, std::nullopt, kNow), kNow) == ApplyOutcome::kPending);
  auto* manager = f.registry.Find("vid-42");
  assert(manager != nullptr);
  assert(manager->current_result && manager->current_result->type == RenderType::kPending);

  assert(f.machine.ApplyFrame(Frame(Readiness::kDegraded, std::nullopt, Preview(), kNow + 1), kNow) == ApplyOutcome::kDegraded);
  assert(manager->current_state == Readiness::kDegraded);
  assert((f.dispatcher.dispatched == std::vector<std::string>{"https://cdn/vid-42-preview.mp4"}));
  assert(manager->current_result->readiness == Readiness::kDegraded);

  assert(f.machine.ApplyFrame(Frame(Readiness::kReady, Hls(), std::nullopt, kNow + 2), kNow) == ApplyOutcome::kUpgraded);
  assert(manager->current_state == Readiness::kReady);
  assert(!manager->pending_upgrade);
  assert(manager->current_result->url == std::optional<std::string>("https://cdn/vid-42.m3u8"));
  assert(manager->current_result->readiness == Readiness::kReady);
  assert((f.dispatcher.cleaned == std::vector<std::string>{"https://cdn/vid-42-preview.mp4"}));
  assert(f.dispatcher.dispatched.size() == 2);

  assert((f.changes == std::vector<std::string>{"vid-42:PENDING", "vid-42:DEGRADED", "vid-42:READY"}));
  assert((f.available == std::vector<std::string>{"vid-42"}));
}

void TestReadyIsSticky() {
  Fixture f;
  f.machine.ApplyFrame(Frame(Readiness::kReady, Hls(), std::nullopt, kNow), kNow);

  assert(f.machine.ApplyFrame(Frame(Readiness::kDegraded, std::nullopt, Preview(), kNow + 1), kNow) == ApplyOutcome::kIgnored);
  assert(f.machine.ApplyFrame(Frame(Readiness::kPending, std::nullopt, std::nullopt, kNow + 2), kNow) == ApplyOutcome::kIgnored);
  assert(f.registry.Find("vid-42")->current_state == Readiness::kReady);
  assert(f.dispatcher.dispatched.size() == 1);

  // A second READY is staged for a manual swap, not auto-applied.
  const auto hd = AccessPayload::Stream(AccessFormat::kDash, "https://cdn/vid-42.mpd");
  assert(f.machine.ApplyFrame(Frame(Readiness::kReady, hd, std::nullopt, kNow + 3), kNow) == ApplyOutcome::kUpgradeStaged);
  assert(f.registry.Find("vid-42")->pending_upgrade == hd);
  assert(f.dispatcher.dispatched.size() == 1);
}

void TestReadyWithoutAccessIsIgnored() {
  Fixture f;
  assert(f.machine.ApplyFrame(Frame(Readiness::kReady, std::nullopt, std::nullopt, kNow), kNow) == ApplyOutcome::kIgnored);
  assert(f.registry.Find("vid-42")->current_state == Readiness::kPending);
  assert(f.machine.ApplyFrame(Frame(Readiness::kDegraded, std::nullopt, std::nullopt, kNow + 1), kNow) == ApplyOutcome::kIgnored);
}

void TestCorruptedFrameLeavesStateUnchanged() {
  Fixture f;
  f.machine.ApplyFrame(Frame(Readiness::kDegraded, std::nullopt, Preview(), kNow), kNow);

  auto bytes = accessres::wire::EncodeFrame(Frame(Readiness::kReady, Hls(), std::nullopt, kNow + 1));
  bytes[bytes.size() - 6] ^= 0x10;
  auto decoded = accessres::wire::DecodeFrame(bytes, kNow);
  assert(decoded.has_value());
  assert(!decoded->is_valid);

  assert(f.machine.ApplyFrame(*decoded, kNow) == ApplyOutcome::kInvalid);
  const auto* manager = f.registry.Find("vid-42");
  assert(manager->current_state == Readiness::kDegraded);
  assert(!manager->pending_upgrade);
  assert(f.dispatcher.dispatched.size() == 1);
}

void TestExpiredFrameNeverCreatesManager() {
  Fixture f;
  assert(f.machine.ApplyFrame(Frame(Readiness::kReady, Hls(), std::nullopt, kNow - 300001), kNow) == ApplyOutcome::kExpired);
  assert(!f.registry.Contains("vid-42"));
  assert(f.changes.empty());
}

void TestOutOfOrderPushFramesAreStale() {
  Fixture f;
  f.machine.ApplyFrame(Frame(Readiness::kPending, std::nullopt, std::nullopt, kNow + 100), kNow);
  assert(f.machine.ApplyFrame(Frame(Readiness::kDegraded, std::nullopt, Preview(), kNow + 50), kNow) == ApplyOutcome::kStale);
  assert(f.registry.Find("vid-42")->current_state == Readiness::kPending);

  // Bootstrap frames come from a fetch and are not ordered against the lane.
  assert(f.machine.ApplyFrame(Frame(Readiness::kDegraded, std::nullopt, Preview(), kNow + 50), kNow, FrameSource::kBootstrap) ==
         ApplyOutcome::kDegraded);
  assert(f.registry.Find("vid-42")->last_frame_ms == kNow + 100);

  accessres::readiness::AccessPolicy lenient;
  lenient.reject_out_of_order = false;
  Fixture g(lenient);
  g.machine.ApplyFrame(Frame(Readiness::kPending, std::nullopt, std::nullopt, kNow + 100), kNow);
  assert(g.machine.ApplyFrame(Frame(Readiness::kDegraded, std::nullopt, Preview(), kNow + 50), kNow) == ApplyOutcome::kDegraded);
}

void TestManualUpgradeWhenAutoUpgradeOff() {
  accessres::readiness::AccessPolicy manual;
  manual.auto_upgrade = false;
  Fixture f(manual);

  f.machine.ApplyFrame(Frame(Readiness::kDegraded, std::nullopt, Preview(), kNow), kNow);
  assert(f.machine.ApplyFrame(Frame(Readiness::kReady, Hls(), std::nullopt, kNow + 1), kNow) == ApplyOutcome::kUpgradeStaged);

  auto* manager = f.registry.Find("vid-42");
  assert(manager->current_state == Readiness::kDegraded);
  assert(manager->pending_upgrade == Hls());
  assert((f.available == std::vector<std::string>{"vid-42"}));
  assert(f.dispatcher.cleaned.empty());

  assert(f.orchestrator.TriggerUpgrade("vid-42"));
  assert(manager->current_state == Readiness::kReady);
  assert(!manager->pending_upgrade);
  assert((f.dispatcher.cleaned == std::vector<std::string>{"https://cdn/vid-42-preview.mp4"}));
  assert(!f.orchestrator.TriggerUpgrade("vid-42"));

  // Bootstrap READY applies even with auto upgrade off.
  assert(f.machine.ApplyFrame(Frame(Readiness::kReady, Hls(), std::nullopt, kNow, "vid-7"), kNow, FrameSource::kBootstrap) ==
         ApplyOutcome::kUpgraded);
  assert(f.registry.Find("vid-7")->current_state == Readiness::kReady);
}

void TestTruncatedFramesFollowPolicy() {
  auto frame      = Frame(Readiness::kPending, std::nullopt, std::nullopt, kNow);
  frame.truncated = true;

  Fixture lenient;
  assert(lenient.machine.ApplyFrame(frame, kNow) == ApplyOutcome::kPending);

  accessres::readiness::AccessPolicy strict;
  strict.allow_truncated_frames = false;
  Fixture f(strict);
  assert(f.machine.ApplyFrame(frame, kNow) == ApplyOutcome::kTruncated);
  assert(!f.registry.Contains("vid-42"));
}

void TestObserverMayDestroyItem() {
  Fixture f;
  f.observer.on_upgrade_available = [&f](const std::string& item_id, const AccessPayload&) { f.registry.Destroy(item_id); };

  f.machine.ApplyFrame(Frame(Readiness::kDegraded, std::nullopt, Preview(), kNow), kNow);
  assert(f.machine.ApplyFrame(Frame(Readiness::kReady, Hls(), std::nullopt, kNow + 1), kNow) == ApplyOutcome::kUpgradeStaged);
  assert(!f.registry.Contains("vid-42"));
  assert((f.dispatcher.cleaned == std::vector<std::string>{"https://cdn/vid-42-preview.mp4"}));
  assert(f.dispatcher.dispatched.size() == 1);

  Fixture g;
  g.observer.on_readiness_change = [&g](const std::string& item_id, Readiness state) {
    if (state == Readiness::kDegraded) {
      g.registry.Destroy(item_id);
    }
  };
  assert(g.machine.ApplyFrame(Frame(Readiness::kDegraded, std::nullopt, Preview(), kNow), kNow) == ApplyOutcome::kDegraded);
  assert(!g.registry.Contains("vid-42"));
  assert(g.dispatcher.dispatched.empty());
}

void TestCleanupMayDestroyItem() {
  Fixture f;
  f.dispatcher.on_cleanup = [&f](const std::string& item_id) { f.registry.Destroy(item_id); };

  assert(f.machine.ApplyFrame(Frame(Readiness::kDegraded, std::nullopt, Preview(), kNow), kNow) == ApplyOutcome::kDegraded);
  assert(f.machine.ApplyFrame(Frame(Readiness::kReady, Hls(), std::nullopt, kNow + 1), kNow) == ApplyOutcome::kUpgraded);
  assert(!f.registry.Contains("vid-42"));
  assert((f.dispatcher.cleaned == std::vector<std::string>{"https://cdn/vid-42-preview.mp4"}));
  assert(f.dispatcher.dispatched.size() == 1);
  assert((f.changes == std::vector<std::string>{"vid-42:DEGRADED"}));

  // Replacing a prior result with the fallback.
  Fixture g;
  auto& manager                   = g.registry.GetOrCreate("vid-42");
  manager.current_result          = RenderResult::Pending();
  manager.current_result->cleanup = accessres::render::CleanupHandle([&g] { g.registry.Destroy("vid-42"); });
  assert(g.machine.ApplyFrame(Frame(Readiness::kDegraded, std::nullopt, Preview(), kNow), kNow) == ApplyOutcome::kDegraded);
  assert(!g.registry.Contains("vid-42"));
  assert(g.dispatcher.dispatched.empty());
}

} // namespace

int main() {
  TestDegradedThenReadyUpgradesOnce();
  TestReadyIsSticky();
  TestReadyWithoutAccessIsIgnored();
  TestCorruptedFrameLeavesStateUnchanged();
  TestExpiredFrameNeverCreatesManager();
  TestOutOfOrderPushFramesAreStale();
  TestManualUpgradeWhenAutoUpgradeOff();
  TestTruncatedFramesFollowPolicy();
  TestObserverMayDestroyItem();
  TestCleanupMayDestroyItem();

  std::cout << "access_resolver_unit_readiness_state_machine: pass\n";
  return 0;
}
