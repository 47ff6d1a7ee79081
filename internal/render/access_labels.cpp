#include "access_labels.hpp"

namespace accessres::render {

using accessres::model::AccessAction;
using accessres::model::AccessFormat;
using accessres::model::AccessMode;
using accessres::model::ItemType;

namespace {

bool IsAudioFormat(AccessFormat format) {
  return format == AccessFormat::kMp3 || format == AccessFormat::kAac || format == AccessFormat::kOgg || format == AccessFormat::kFlac;
}

} // namespace

bool CanRenderInline(const accessres::model::AccessPayload& access) {
  switch (access.mode()) {
    case AccessMode::kOpenWeb:
      return false;
    case AccessMode::kEmbed:
    case AccessMode::kStream:
      return true;
    case AccessMode::kFile: {
      const auto format = access.format();
      return format == AccessFormat::kPdf || format == AccessFormat::kEpub || format == AccessFormat::kImage || format == AccessFormat::kMp3 ||
             format == AccessFormat::kAac || format == AccessFormat::kOgg;
    }
  }
  return false;
}

std::string_view AccessLabel(const accessres::model::AccessPayload& access, ItemType item_type) {
  switch (access.mode()) {
    case AccessMode::kOpenWeb:
      switch (item_type) {
        case ItemType::kGame:
          return "Play in Browser";
        case ItemType::kEbook:
          return "Read Online";
        case ItemType::kDocument:
          return "View Document";
        case ItemType::kProduct:
          return "Shop Now";
        case ItemType::kGovernance:
          return "Vote";
        case ItemType::kGallery:
          return "View Gallery";
        case ItemType::kAudio:
          return "Listen";
        default:
          return "Open";
      }
    case AccessMode::kStream:
      if (item_type == ItemType::kChannel) {
        return "Watch Live";
      }
      if (item_type == ItemType::kAudio) {
        return "Listen";
      }
      return "Play";
    case AccessMode::kEmbed:
      switch (item_type) {
        case ItemType::kGame:
          return "Play";
        case ItemType::kGovernance:
          return "Vote";
        case ItemType::kDocument:
        case ItemType::kGallery:
          return "View";
        case ItemType::kAudio:
          return "Listen";
        default:
          return "Open";
      }
    case AccessMode::kFile: {
      const auto format = access.format();
      if (format == AccessFormat::kEpub || format == AccessFormat::kPdf) {
        return "Read";
      }
      if (format == AccessFormat::kDocx || format == AccessFormat::kPptx || format == AccessFormat::kXlsx || format == AccessFormat::kImage ||
          format == AccessFormat::kGallery) {
        return "View";
      }
      if (IsAudioFormat(format)) {
        return "Listen";
      }
      return "Download";
    }
  }
  return "Open";
}

AccessAction ActionForItemType(ItemType item_type) {
  switch (item_type) {
    case ItemType::kChannel:
    case ItemType::kVideo:
      return AccessAction::kStream;
    case ItemType::kAudio:
      return AccessAction::kListen;
    case ItemType::kEbook:
    case ItemType::kDocument:
      return AccessAction::kRead;
    case ItemType::kGame:
    case ItemType::kApp:
      return AccessAction::kLaunch;
    case ItemType::kProduct:
      return AccessAction::kCheckout;
    case ItemType::kGovernance:
      return AccessAction::kVote;
    case ItemType::kGallery:
      return AccessAction::kBrowse;
    case ItemType::kUnknown:
      break;
  }
  return AccessAction::kView;
}

std::string_view ItemTypeLabel(ItemType item_type) {
  switch (item_type) {
    case ItemType::kChannel:
      return "live stream";
    case ItemType::kVideo:
      return "video";
    case ItemType::kEbook:
      return "ebook";
    case ItemType::kGame:
      return "game";
    case ItemType::kProduct:
      return "product";
    case ItemType::kApp:
      return "app";
    case ItemType::kAudio:
      return "audio";
    case ItemType::kDocument:
      return "document";
    case ItemType::kGovernance:
      return "proposal";
    case ItemType::kGallery:
      return "gallery";
    case ItemType::kUnknown:
      break;
  }
  return "content";
}

} // namespace accessres::render
