#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "receipt_sink.hpp"
#include "render_dispatcher.hpp"

namespace accessres::render {

/*
  Built-in dispatcher that only describes the presentation.

  Dispatch order:
    openweb  -> redirect, only when the url host is not internal
    embed    -> embed (iframe)
    stream   -> player (video, or audio for audio formats)
    file     -> reader for pdf/epub, otherwise a download redirect
    anything else -> error "No compatible access method for <item type>"

  Receipts go to the sink when options carry an identity token.
*/
class DescriptorDispatcher : public RenderDispatcher {
 public:
  explicit DescriptorDispatcher(std::vector<std::string> internal_hosts, ReceiptSink* receipts = nullptr);

  RenderResult Dispatch(const accessres::model::AccessResolution& resolution, const RenderOptions& options) override;

  // False for unparsable urls and for hosts containing an internal host name.
  bool IsExternalUrl(std::string_view url) const;

 private:
  void EmitReceipt(const accessres::model::AccessResolution& resolution, accessres::model::AccessAction action, const RenderOptions& options);

  std::vector<std::string> internal_hosts_;
  ReceiptSink*             receipts_;
};

} // namespace accessres::render
