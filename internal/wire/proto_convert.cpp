#include "proto_convert.hpp"

#include <string>
#include <utility>

namespace accessres::wire {

using accessres::model::AccessFormat;
using accessres::model::AccessMode;
using accessres::model::AccessPayload;

namespace {

std::optional<AccessMode> ModeFromProto(v1::AccessMode mode) {
  switch (mode) {
    case v1::ACCESS_MODE_STREAM:
      return AccessMode::kStream;
    case v1::ACCESS_MODE_FILE:
      return AccessMode::kFile;
    case v1::ACCESS_MODE_EMBED:
      return AccessMode::kEmbed;
    case v1::ACCESS_MODE_OPENWEB:
      return AccessMode::kOpenWeb;
    default:
      return std::nullopt;
  }
}

v1::AccessMode ModeToProto(AccessMode mode) {
  switch (mode) {
    case AccessMode::kStream:
      return v1::ACCESS_MODE_STREAM;
    case AccessMode::kFile:
      return v1::ACCESS_MODE_FILE;
    case AccessMode::kEmbed:
      return v1::ACCESS_MODE_EMBED;
    case AccessMode::kOpenWeb:
      return v1::ACCESS_MODE_OPENWEB;
  }
  return v1::ACCESS_MODE_UNSPECIFIED;
}

std::optional<accessres::model::Readiness> ReadinessFromProto(v1::Readiness readiness) {
  return accessres::model::ReadinessFromCode(static_cast<std::uint64_t>(readiness));
}

v1::Readiness ReadinessToProto(accessres::model::Readiness readiness) {
  return static_cast<v1::Readiness>(accessres::model::ToCode(readiness));
}

// Absent sub-message means "no payload"; a present but unusable one is an error.
bool OptionalManifest(bool present, const v1::AccessManifest& manifest, std::optional<AccessPayload>* out) {
  if (!present) {
    return true;
  }
  *out = ManifestFromProto(manifest);
  return out->has_value();
}

} // namespace

std::optional<AccessPayload> ManifestFromProto(const v1::AccessManifest& manifest) {
  const auto mode   = ModeFromProto(manifest.mode());
  const auto format = accessres::model::ParseAccessFormat(manifest.format());
  if (!mode || !format) {
    return std::nullopt;
  }

  AccessPayload::Attributes attributes;
  attributes.headers.insert(manifest.headers().begin(), manifest.headers().end());
  if (manifest.expires_at_ms() != 0) {
    attributes.expires_at_ms = manifest.expires_at_ms();
  }
  if (!manifest.quality().empty()) {
    attributes.quality = manifest.quality();
  }
  if (manifest.bitrate() != 0) {
    attributes.bitrate = manifest.bitrate();
  }

  switch (*mode) {
    case AccessMode::kStream:
      if (manifest.uri().empty()) {
        return std::nullopt;
      }
      return AccessPayload::Stream(*format, manifest.uri(), std::move(attributes));
    case AccessMode::kFile:
      if (manifest.uri().empty()) {
        return std::nullopt;
      }
      return AccessPayload::File(*format, manifest.uri(), std::move(attributes));
    case AccessMode::kEmbed:
      if (manifest.embed().empty()) {
        return std::nullopt;
      }
      return AccessPayload::Embed(*format, manifest.embed(), std::move(attributes));
    case AccessMode::kOpenWeb:
      if (manifest.open_web().empty()) {
        return std::nullopt;
      }
      return AccessPayload::OpenWeb(*format, manifest.open_web(), std::move(attributes));
  }
  return std::nullopt;
}

v1::AccessManifest ManifestToProto(const AccessPayload& payload) {
  v1::AccessManifest manifest;
  manifest.set_mode(ModeToProto(payload.mode()));
  manifest.set_format(std::string(accessres::model::ToString(payload.format())));

  switch (payload.mode()) {
    case AccessMode::kStream:
    case AccessMode::kFile:
      manifest.set_uri(payload.Locator());
      break;
    case AccessMode::kEmbed:
      manifest.set_embed(payload.Locator());
      break;
    case AccessMode::kOpenWeb:
      manifest.set_open_web(payload.Locator());
      break;
  }

  const auto& attributes = payload.attributes();
  manifest.mutable_headers()->insert(attributes.headers.begin(), attributes.headers.end());
  if (attributes.expires_at_ms) {
    manifest.set_expires_at_ms(*attributes.expires_at_ms);
  }
  if (attributes.quality) {
    manifest.set_quality(*attributes.quality);
  }
  if (attributes.bitrate) {
    manifest.set_bitrate(static_cast<std::uint32_t>(*attributes.bitrate));
  }
  return manifest;
}

std::optional<accessres::model::AccessResolution> ResolutionFromProto(const v1::AccessResolution& resolution) {
  if (resolution.item_id().empty() || !resolution.has_access()) {
    return std::nullopt;
  }
  auto manifest = ManifestFromProto(resolution.access());
  if (!manifest) {
    return std::nullopt;
  }
  return accessres::model::AccessResolution{
      .item_id   = resolution.item_id(),
      .item_type = accessres::model::ParseItemType(resolution.item_type()),
      .title     = resolution.title(),
      .access    = std::move(*manifest),
  };
}

v1::AccessResolution ResolutionToProto(const accessres::model::AccessResolution& resolution) {
  v1::AccessResolution out;
  out.set_item_id(resolution.item_id);
  out.set_item_type(std::string(accessres::model::ToString(resolution.item_type)));
  out.set_title(resolution.title);
  *out.mutable_access() = ManifestToProto(resolution.access);
  return out;
}

std::optional<accessres::model::GradedResolution> GradedFromProto(const v1::GradedAccessResolution& graded) {
  const auto readiness = ReadinessFromProto(graded.readiness());
  if (graded.item_id().empty() || !readiness) {
    return std::nullopt;
  }

  accessres::model::GradedResolution out;
  out.item_id   = graded.item_id();
  out.item_type = accessres::model::ParseItemType(graded.item_type());
  out.title     = graded.title();
  out.readiness = *readiness;
  if (!OptionalManifest(graded.has_access(), graded.access(), &out.access) ||
      !OptionalManifest(graded.has_fallback(), graded.fallback(), &out.fallback)) {
    return std::nullopt;
  }
  if (graded.has_upgrade_eta_ms()) {
    out.upgrade_eta_ms = graded.upgrade_eta_ms();
  }
  return out;
}

v1::GradedAccessResolution GradedToProto(const accessres::model::GradedResolution& graded) {
  v1::GradedAccessResolution out;
  out.set_item_id(graded.item_id);
  out.set_item_type(std::string(accessres::model::ToString(graded.item_type)));
  out.set_title(graded.title);
  out.set_readiness(ReadinessToProto(graded.readiness));
  if (graded.access) {
    *out.mutable_access() = ManifestToProto(*graded.access);
  }
  if (graded.fallback) {
    *out.mutable_fallback() = ManifestToProto(*graded.fallback);
  }
  if (graded.upgrade_eta_ms) {
    out.set_upgrade_eta_ms(*graded.upgrade_eta_ms);
  }
  return out;
}

std::optional<accessres::model::BatchAccessResult> BatchResultFromProto(const v1::BatchAccessResult& result) {
  const auto readiness = ReadinessFromProto(result.readiness());
  if (result.item_id().empty() || !readiness) {
    return std::nullopt;
  }

  accessres::model::BatchAccessResult out;
  out.item_id   = result.item_id();
  out.readiness = *readiness;
  if (!OptionalManifest(result.has_access(), result.access(), &out.access) ||
      !OptionalManifest(result.has_fallback(), result.fallback(), &out.fallback)) {
    return std::nullopt;
  }
  if (result.has_eta_ms()) {
    out.eta_ms = result.eta_ms();
  }
  return out;
}

v1::BatchAccessResult BatchResultToProto(const accessres::model::BatchAccessResult& result) {
  v1::BatchAccessResult out;
  out.set_item_id(result.item_id);
  out.set_readiness(ReadinessToProto(result.readiness));
  if (result.access) {
    *out.mutable_access() = ManifestToProto(*result.access);
  }
  if (result.fallback) {
    *out.mutable_fallback() = ManifestToProto(*result.fallback);
  }
  if (result.eta_ms) {
    out.set_eta_ms(*result.eta_ms);
  }
  return out;
}

v1::BatchPriority PriorityToProto(accessres::model::BatchPriority priority) {
  switch (priority) {
    case accessres::model::BatchPriority::kHigh:
      return v1::BATCH_PRIORITY_HIGH;
    case accessres::model::BatchPriority::kLow:
      return v1::BATCH_PRIORITY_LOW;
    case accessres::model::BatchPriority::kNormal:
      break;
  }
  return v1::BATCH_PRIORITY_NORMAL;
}

v1::AccessReceipt ReceiptToProto(const accessres::model::AccessReceipt& receipt) {
  v1::AccessReceipt out;
  if (receipt.item_id) {
    out.set_item_id(*receipt.item_id);
  }
  out.set_item_type(std::string(accessres::model::ToString(receipt.item_type)));
  out.set_action(std::string(accessres::model::ToString(receipt.action)));
  if (receipt.access_mode) {
    out.set_access_mode(std::string(accessres::model::ToString(*receipt.access_mode)));
  }
  if (receipt.access_format) {
    out.set_access_format(std::string(accessres::model::ToString(*receipt.access_format)));
  }
  if (receipt.access_uri) {
    out.set_access_uri(*receipt.access_uri);
  }
  out.mutable_metadata()->insert(receipt.metadata.begin(), receipt.metadata.end());
  return out;
}

} // namespace accessres::wire
