#include "internal/render/descriptor_dispatcher.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/render/access_labels.hpp"

namespace {

using accessres::model::AccessAction;
using accessres::model::AccessFormat;
using accessres::model::AccessPayload;
using accessres::model::AccessResolution;
using accessres::model::ItemType;
using accessres::render::DescriptorDispatcher;
using accessres::render::RenderOptions;
using accessres::render::RenderType;

class RecordingSink : public accessres::render::ReceiptSink {
 public:
  void LogReceipt(const accessres::model::AccessReceipt& receipt, const std::string& identity) override {
    if (fail) {
      throw std::runtime_error("receipt endpoint down");
    }
    receipts.push_back(receipt);
    identities.push_back(identity);
  }

  bool                                      fail{false};
  std::vector<accessres::model::AccessReceipt> receipts;
  std::vector<std::string>                  identities;
};

AccessResolution Resolution(ItemType type, AccessPayload payload) {
  return AccessResolution{"item-1", type, "Title", std::move(payload)};
}

RenderOptions WithIdentity() {
  RenderOptions options;
  options.identity = "0xabc";
  return options;
}

void TestDispatchByMode() {
  DescriptorDispatcher dispatcher({"internal.example", "localhost"});

  auto result = dispatcher.Dispatch(Resolution(ItemType::kVideo, AccessPayload::Stream(AccessFormat::kHls, "https://cdn/x.m3u8")), {});
  assert(result.type == RenderType::kPlayer);
  assert(result.element == std::optional<std::string>("video"));
  assert(result.url == std::optional<std::string>("https://cdn/x.m3u8"));

  result = dispatcher.Dispatch(Resolution(ItemType::kVideo, AccessPayload::Stream(AccessFormat::kMp3, "https://cdn/x.mp3")), {});
  assert(result.element == std::optional<std::string>("audio"));
  result = dispatcher.Dispatch(Resolution(ItemType::kAudio, AccessPayload::Stream(AccessFormat::kHls, "https://cdn/x.m3u8")), {});
  assert(result.element == std::optional<std::string>("audio"));

  result = dispatcher.Dispatch(Resolution(ItemType::kGame, AccessPayload::Embed(AccessFormat::kHtml, "https://games/x")), {});
  assert(result.type == RenderType::kEmbed);
  assert(result.element == std::optional<std::string>("iframe"));

  result = dispatcher.Dispatch(Resolution(ItemType::kEbook, AccessPayload::File(AccessFormat::kEpub, "https://cdn/x.epub")), {});
  assert(result.type == RenderType::kReader);
  assert(result.element == std::optional<std::string>("epub-reader"));
  result = dispatcher.Dispatch(Resolution(ItemType::kDocument, AccessPayload::File(AccessFormat::kPdf, "https://cdn/x.pdf")), {});
  assert(result.element == std::optional<std::string>("pdf-reader"));

  result = dispatcher.Dispatch(Resolution(ItemType::kDocument, AccessPayload::File(AccessFormat::kDocx, "https://cdn/x.docx")), {});
  assert(result.type == RenderType::kRedirect);
  assert(!result.cleanup.armed());

  result = dispatcher.Dispatch(Resolution(ItemType::kProduct, AccessPayload::OpenWeb(AccessFormat::kHtml, "https://shop.example/p/1")), {});
  assert(result.type == RenderType::kRedirect);
  assert(result.url == std::optional<std::string>("https://shop.example/p/1"));
}

void TestInternalOpenWebIsAnError() {
  DescriptorDispatcher dispatcher({"internal.example"});

  auto result = dispatcher.Dispatch(Resolution(ItemType::kProduct, AccessPayload::OpenWeb(AccessFormat::kHtml, "https://app.internal.example/p")), {});
  assert(result.type == RenderType::kError);
  assert(result.error == std::optional<std::string>("No compatible access method for product"));

  result = dispatcher.Dispatch(Resolution(ItemType::kGame, AccessPayload::OpenWeb(AccessFormat::kHtml, "/relative/path")), {});
  assert(result.type == RenderType::kError);
}

void TestIsExternalUrl() {
  DescriptorDispatcher dispatcher({"internal.example", "localhost"});
  assert(dispatcher.IsExternalUrl("https://shop.example/p"));
  assert(dispatcher.IsExternalUrl("https://user@shop.example:8443/p?q=1"));
  assert(!dispatcher.IsExternalUrl("http://localhost:3000/p"));
  assert(!dispatcher.IsExternalUrl("https://cdn.internal.example/x"));
  assert(!dispatcher.IsExternalUrl("not a url"));
  assert(!dispatcher.IsExternalUrl("://missing-scheme"));
}

void TestReceiptsNeedIdentityAndSink() {
  RecordingSink        sink;
  DescriptorDispatcher dispatcher({}, &sink);

  dispatcher.Dispatch(Resolution(ItemType::kVideo, AccessPayload::Stream(AccessFormat::kHls, "https://cdn/x.m3u8")), {});
  assert(sink.receipts.empty());

  dispatcher.Dispatch(Resolution(ItemType::kVideo, AccessPayload::Stream(AccessFormat::kHls, "https://cdn/x.m3u8")), WithIdentity());
  dispatcher.Dispatch(Resolution(ItemType::kDocument, AccessPayload::File(AccessFormat::kDocx, "https://cdn/x.docx")), WithIdentity());
  dispatcher.Dispatch(Resolution(ItemType::kGovernance, AccessPayload::Embed(AccessFormat::kBallot, "https://vote/x")), WithIdentity());

  assert(sink.receipts.size() == 3);
  assert(sink.identities[0] == "0xabc");
  assert(sink.receipts[0].action == AccessAction::kStream);
  assert(sink.receipts[0].access_uri == std::optional<std::string>("https://cdn/x.m3u8"));
  assert(sink.receipts[1].action == AccessAction::kDownload);
  assert(sink.receipts[2].action == AccessAction::kVote);
  assert(sink.receipts[2].item_id == std::optional<std::string>("item-1"));

  // A failing sink never fails the render.
  sink.fail   = true;
  auto result = dispatcher.Dispatch(Resolution(ItemType::kVideo, AccessPayload::Stream(AccessFormat::kHls, "https://cdn/x.m3u8")), WithIdentity());
  assert(result.type == RenderType::kPlayer);
}

void TestCleanupIsIdempotent() {
  DescriptorDispatcher dispatcher(std::vector<std::string>{});
  auto result = dispatcher.Dispatch(Resolution(ItemType::kVideo, AccessPayload::Stream(AccessFormat::kHls, "https://cdn/x.m3u8")), {});
  assert(result.cleanup.armed());
  result.cleanup();
  result.cleanup();
  assert(!result.cleanup.armed());
}

void TestLabels() {
  const auto live = AccessPayload::Stream(AccessFormat::kHls, "https://cdn/live.m3u8");
  assert(accessres::render::AccessLabel(live, ItemType::kChannel) == "Watch Live");
  assert(accessres::render::AccessLabel(live, ItemType::kVideo) == "Play");
  assert(accessres::render::AccessLabel(AccessPayload::OpenWeb(AccessFormat::kHtml, "https://x"), ItemType::kEbook) == "Read Online");
  assert(accessres::render::AccessLabel(AccessPayload::File(AccessFormat::kNone, "https://x"),
                                     ItemType::kApp) == "Download");
  assert(accessres::render::AccessLabel(AccessPayload::File(AccessFormat::kPdf, "https://x"), ItemType::kDocument) == "Read");

  assert(accessres::render::CanRenderInline(live));
  assert(!accessres::render::CanRenderInline(AccessPayload::OpenWeb(AccessFormat::kHtml, "https://x")));
  assert(accessres::render::CanRenderInline(AccessPayload::File(AccessFormat::kImage, "https://x")));
  assert(!accessres::render::CanRenderInline(AccessPayload::File(AccessFormat::kDocx, "https://x")));

  assert(accessres::render::ActionForItemType(ItemType::kProduct) == AccessAction::kCheckout);
  assert(accessres::render::ActionForItemType(ItemType::kUnknown) == AccessAction::kView);
  assert(accessres::render::ItemTypeLabel(ItemType::kChannel) == "live stream");
  assert(accessres::render::ItemTypeLabel(ItemType::kUnknown) == "content");
}

} // namespace

int main() {
  TestDispatchByMode();
  TestInternalOpenWebIsAnError();
  TestIsExternalUrl();
  TestReceiptsNeedIdentityAndSink();
  TestCleanupIsIdempotent();
  TestLabels();

  std::cout << "access_resolver_unit_descriptor_dispatcher: pass\n";
  return 0;
}
