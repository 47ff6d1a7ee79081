#include "access_payload.hpp"

#include <array>
#include <utility>

#include "internal/util/errors.hpp"

namespace accessres::model {

namespace {

constexpr std::array<std::pair<AccessMode, std::string_view>, 4> kModeNames = {{
    {AccessMode::kStream, "stream"},
    {AccessMode::kFile, "file"},
    {AccessMode::kEmbed, "embed"},
    {AccessMode::kOpenWeb, "openweb"},
}};

constexpr std::array<std::pair<AccessFormat, std::string_view>, 21> kFormatNames = {{
    {AccessFormat::kHls, "hls"},         {AccessFormat::kDash, "dash"},     {AccessFormat::kMp4, "mp4"},
    {AccessFormat::kWebm, "webm"},       {AccessFormat::kEpub, "epub"},     {AccessFormat::kPdf, "pdf"},
    {AccessFormat::kHtml, "html"},       {AccessFormat::kDocx, "docx"},     {AccessFormat::kPptx, "pptx"},
    {AccessFormat::kXlsx, "xlsx"},       {AccessFormat::kMp3, "mp3"},       {AccessFormat::kAac, "aac"},
    {AccessFormat::kOgg, "ogg"},         {AccessFormat::kFlac, "flac"},     {AccessFormat::kRss, "rss"},
    {AccessFormat::kJsonFeed, "json-feed"}, {AccessFormat::kImage, "image"}, {AccessFormat::kGallery, "gallery"},
    {AccessFormat::kBallot, "ballot"},   {AccessFormat::kProposal, "proposal"}, {AccessFormat::kNone, "none"},
}};

} // namespace

std::string_view ToString(AccessMode mode) {
  for (const auto& [value, name] : kModeNames) {
    if (value == mode) {
      return name;
    }
  }
  return "stream";
}

std::string_view ToString(AccessFormat format) {
  for (const auto& [value, name] : kFormatNames) {
    if (value == format) {
      return name;
    }
  }
  return "none";
}

std::optional<AccessMode> ParseAccessMode(std::string_view text) {
  for (const auto& [value, name] : kModeNames) {
    if (name == text) {
      return value;
    }
  }
  return std::nullopt;
}

std::optional<AccessFormat> ParseAccessFormat(std::string_view text) {
  for (const auto& [value, name] : kFormatNames) {
    if (name == text) {
      return value;
    }
  }
  return std::nullopt;
}

AccessPayload::AccessPayload(AccessFormat format, AccessTarget target, Attributes attributes)
    : format_(format), target_(std::move(target)), attributes_(std::move(attributes)) {
  if (Locator().empty()) {
    throw accessres::util::InvalidArgument("access payload: " + std::string(ToString(mode())) + " mode requires a non-empty locator");
  }
}

AccessPayload AccessPayload::Stream(AccessFormat format, std::string uri, Attributes attributes) {
  return AccessPayload(format, StreamAccess{std::move(uri)}, std::move(attributes));
}

AccessPayload AccessPayload::File(AccessFormat format, std::string uri, Attributes attributes) {
  return AccessPayload(format, FileAccess{std::move(uri)}, std::move(attributes));
}

AccessPayload AccessPayload::Embed(AccessFormat format, std::string embed, Attributes attributes) {
  return AccessPayload(format, EmbedAccess{std::move(embed)}, std::move(attributes));
}

AccessPayload AccessPayload::OpenWeb(AccessFormat format, std::string open_web, Attributes attributes) {
  return AccessPayload(format, OpenWebAccess{std::move(open_web)}, std::move(attributes));
}

AccessMode AccessPayload::mode() const {
  switch (target_.index()) {
    case 0:
      return AccessMode::kStream;
    case 1:
      return AccessMode::kFile;
    case 2:
      return AccessMode::kEmbed;
    default:
      return AccessMode::kOpenWeb;
  }
}

const std::string& AccessPayload::Locator() const {
  if (const auto* stream = std::get_if<StreamAccess>(&target_)) {
    return stream->uri;
  }
  if (const auto* file = std::get_if<FileAccess>(&target_)) {
    return file->uri;
  }
  if (const auto* embed = std::get_if<EmbedAccess>(&target_)) {
    return embed->embed;
  }
  return std::get<OpenWebAccess>(target_).open_web;
}

} // namespace accessres::model
