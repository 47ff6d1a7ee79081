#include "resolution.hpp"

#include <array>
#include <utility>

namespace accessres::model {

namespace {

constexpr std::array<std::pair<ItemType, std::string_view>, 10> kItemTypeNames = {{
    {ItemType::kChannel, "channel"},
    {ItemType::kVideo, "video"},
    {ItemType::kEbook, "ebook"},
    {ItemType::kGame, "game"},
    {ItemType::kProduct, "product"},
    {ItemType::kApp, "app"},
    {ItemType::kAudio, "audio"},
    {ItemType::kDocument, "document"},
    {ItemType::kGovernance, "governance"},
    {ItemType::kGallery, "gallery"},
}};

} // namespace

std::string_view ToString(ItemType type) {
  for (const auto& [value, name] : kItemTypeNames) {
    if (value == type) {
      return name;
    }
  }
  return "unknown";
}

ItemType ParseItemType(std::string_view text) {
  for (const auto& [value, name] : kItemTypeNames) {
    if (name == text) {
      return value;
    }
  }
  return ItemType::kUnknown;
}

std::string_view ToString(AccessAction action) {
  switch (action) {
    case AccessAction::kView:
      return "view";
    case AccessAction::kRead:
      return "read";
    case AccessAction::kLaunch:
      return "launch";
    case AccessAction::kCheckout:
      return "checkout";
    case AccessAction::kStream:
      return "stream";
    case AccessAction::kDownload:
      return "download";
    case AccessAction::kListen:
      return "listen";
    case AccessAction::kVote:
      return "vote";
    case AccessAction::kBrowse:
      return "browse";
    case AccessAction::kPlay:
      return "play";
  }
  return "view";
}

} // namespace accessres::model
