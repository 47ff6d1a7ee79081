#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "access_payload.hpp"
#include "readiness.hpp"

namespace accessres::model {

enum class ItemType : std::uint8_t {
  kChannel,
  kVideo,
  kEbook,
  kGame,
  kProduct,
  kApp,
  kAudio,
  kDocument,
  kGovernance,
  kGallery,
  kUnknown,
};

enum class AccessAction : std::uint8_t {
  kView,
  kRead,
  kLaunch,
  kCheckout,
  kStream,
  kDownload,
  kListen,
  kVote,
  kBrowse,
  kPlay,
};

std::string_view ToString(ItemType type);
std::string_view ToString(AccessAction action);
ItemType         ParseItemType(std::string_view text);

struct AccessResolution {
  std::string   item_id;
  ItemType      item_type{ItemType::kUnknown};
  std::string   title;
  AccessPayload access;
};

// Resolution with readiness; access is absent while the item is still pending.
struct GradedResolution {
  std::string                  item_id;
  ItemType                     item_type{ItemType::kUnknown};
  std::string                  title;
  Readiness                    readiness{Readiness::kPending};
  std::optional<AccessPayload> access;
  std::optional<AccessPayload> fallback;
  std::optional<std::uint64_t> upgrade_eta_ms;
};

enum class BatchPriority : std::uint8_t {
  kNormal,
  kHigh,
  kLow,
};

struct BatchAccessRequest {
  std::vector<std::string> item_ids;
  BatchPriority            priority{BatchPriority::kNormal};
};

struct BatchAccessResult {
  std::string                  item_id;
  Readiness                    readiness{Readiness::kPending};
  std::optional<AccessPayload> access;
  std::optional<AccessPayload> fallback;
  std::optional<std::uint64_t> eta_ms;
};

struct BatchAccessError {
  std::string item_id;
  std::string error;
};

struct BatchAccessResponse {
  std::vector<BatchAccessResult> results;
  std::vector<BatchAccessError>  errors;
};

struct AccessReceipt {
  std::optional<std::string>         item_id;
  ItemType                           item_type{ItemType::kUnknown};
  AccessAction                       action{AccessAction::kView};
  std::optional<AccessMode>          access_mode;
  std::optional<AccessFormat>        access_format;
  std::optional<std::string>         access_uri;
  std::map<std::string, std::string> metadata;
};

} // namespace accessres::model
