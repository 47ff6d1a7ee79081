#include "descriptor_dispatcher.hpp"

#include <exception>
#include <utility>

#include "access_labels.hpp"
#include "internal/observability/logging.hpp"

namespace accessres::render {

using accessres::model::AccessAction;
using accessres::model::AccessFormat;
using accessres::model::AccessMode;
using accessres::observability::StringField;

namespace {

std::string_view UrlHost(std::string_view url) {
  const auto scheme = url.find("://");
  if (scheme == std::string_view::npos || scheme == 0) {
    return {};
  }
  auto authority = url.substr(scheme + 3);
  authority      = authority.substr(0, authority.find_first_of("/?#"));
  if (const auto at = authority.rfind('@'); at != std::string_view::npos) {
    authority.remove_prefix(at + 1);
  }
  if (!authority.empty() && authority.front() == '[') {
    return authority.substr(1, authority.find(']') - 1);
  }
  return authority.substr(0, authority.find(':'));
}

bool IsAudioFormat(AccessFormat format) {
  return format == AccessFormat::kMp3 || format == AccessFormat::kAac || format == AccessFormat::kOgg || format == AccessFormat::kFlac;
}

CleanupHandle DescriptorCleanup(std::string item_id, RenderType type) {
  return CleanupHandle([item_id = std::move(item_id), type] {
    ACCESSRES_LOG_DEBUG("Released render descriptor", {StringField("item_id", item_id), StringField("type", ToString(type))});
  });
}

} // namespace

DescriptorDispatcher::DescriptorDispatcher(std::vector<std::string> internal_hosts, ReceiptSink* receipts)
    : internal_hosts_(std::move(internal_hosts)), receipts_(receipts) {
}

bool DescriptorDispatcher::IsExternalUrl(std::string_view url) const {
  const auto host = UrlHost(url);
  if (host.empty()) {
    return false;
  }
  for (const auto& internal : internal_hosts_) {
    if (!internal.empty() && host.find(internal) != std::string_view::npos) {
      return false;
    }
  }
  return true;
}

RenderResult DescriptorDispatcher::Dispatch(const accessres::model::AccessResolution& resolution, const RenderOptions& options) {
  const auto& access = resolution.access;
  RenderResult result;

  switch (access.mode()) {
    case AccessMode::kOpenWeb:
      if (!IsExternalUrl(access.Locator())) {
        break;
      }
      EmitReceipt(resolution, ActionForItemType(resolution.item_type), options);
      result.type = RenderType::kRedirect;
      result.url  = access.Locator();
      return result;

    case AccessMode::kEmbed:
      EmitReceipt(resolution, ActionForItemType(resolution.item_type), options);
      result.type    = RenderType::kEmbed;
      result.element = "iframe";
      result.url     = access.Locator();
      result.cleanup = DescriptorCleanup(resolution.item_id, result.type);
      return result;

    case AccessMode::kStream: {
      const bool audio = IsAudioFormat(access.format()) || resolution.item_type == accessres::model::ItemType::kAudio;
      EmitReceipt(resolution, audio ? AccessAction::kListen : AccessAction::kStream, options);
      result.type    = RenderType::kPlayer;
      result.element = audio ? "audio" : "video";
      result.url     = access.Locator();
      result.cleanup = DescriptorCleanup(resolution.item_id, result.type);
      return result;
    }

    case AccessMode::kFile:
      if (access.format() == AccessFormat::kPdf || access.format() == AccessFormat::kEpub) {
        EmitReceipt(resolution, AccessAction::kRead, options);
        result.type    = RenderType::kReader;
        result.element = access.format() == AccessFormat::kPdf ? "pdf-reader" : "epub-reader";
        result.url     = access.Locator();
        result.cleanup = DescriptorCleanup(resolution.item_id, result.type);
        return result;
      }
      EmitReceipt(resolution, AccessAction::kDownload, options);
      result.type = RenderType::kRedirect;
      result.url  = access.Locator();
      return result;
  }

  auto message = "No compatible access method for " + std::string(accessres::model::ToString(resolution.item_type));
  ACCESSRES_LOG_WARN("No compatible access", {StringField("item_id", resolution.item_id), StringField("mode", accessres::model::ToString(access.mode()))});
  return RenderResult::Error(std::move(message));
}

void DescriptorDispatcher::EmitReceipt(const accessres::model::AccessResolution& resolution, AccessAction action, const RenderOptions& options) {
  if (receipts_ == nullptr || !options.identity || options.identity->empty()) {
    return;
  }

  accessres::model::AccessReceipt receipt;
  receipt.item_id       = resolution.item_id;
  receipt.item_type     = resolution.item_type;
  receipt.action        = action;
  receipt.access_mode   = resolution.access.mode();
  receipt.access_format = resolution.access.format();
  receipt.access_uri    = resolution.access.Locator();

  try {
    receipts_->LogReceipt(receipt, *options.identity);
  } catch (const std::exception& e) {
    ACCESSRES_LOG_WARN("Receipt sink failed", {StringField("item_id", resolution.item_id), StringField("error", e.what())});
  }
}

} // namespace accessres::render
