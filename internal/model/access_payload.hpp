#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace accessres::model {

enum class AccessMode : std::uint8_t {
  kStream,
  kFile,
  kEmbed,
  kOpenWeb,
};

enum class AccessFormat : std::uint8_t {
  kHls,
  kDash,
  kMp4,
  kWebm,
  kEpub,
  kPdf,
  kHtml,
  kDocx,
  kPptx,
  kXlsx,
  kMp3,
  kAac,
  kOgg,
  kFlac,
  kRss,
  kJsonFeed,
  kImage,
  kGallery,
  kBallot,
  kProposal,
  kNone,
};

std::string_view          ToString(AccessMode mode);
std::string_view          ToString(AccessFormat format);
std::optional<AccessMode>   ParseAccessMode(std::string_view text);
std::optional<AccessFormat> ParseAccessFormat(std::string_view text);

using HeaderMap = std::map<std::string, std::string>;

// One alternative per mode; each carries the locator that mode requires.
struct StreamAccess {
  std::string uri;
  bool        operator==(const StreamAccess&) const = default;
};

struct FileAccess {
  std::string uri;
  bool        operator==(const FileAccess&) const = default;
};

struct EmbedAccess {
  std::string embed;
  bool        operator==(const EmbedAccess&) const = default;
};

struct OpenWebAccess {
  std::string open_web;
  bool        operator==(const OpenWebAccess&) const = default;
};

using AccessTarget = std::variant<StreamAccess, FileAccess, EmbedAccess, OpenWebAccess>;

/*
  Immutable access descriptor.

  The mode is implied by the target alternative, so a stream without a uri or
  an embed without an embed url cannot be built. Updates replace the whole
  value.
*/
class AccessPayload {
 public:
  struct Attributes {
    HeaderMap                    headers;
    std::optional<std::uint64_t> expires_at_ms;
    std::optional<std::string>   quality;
    std::optional<std::uint64_t> bitrate;

    bool operator==(const Attributes&) const = default;
  };

  // Throws util::InvalidArgument when the locator is empty.
  AccessPayload(AccessFormat format, AccessTarget target, Attributes attributes = {});

  static AccessPayload Stream(AccessFormat format, std::string uri, Attributes attributes = {});
  static AccessPayload File(AccessFormat format, std::string uri, Attributes attributes = {});
  static AccessPayload Embed(AccessFormat format, std::string embed, Attributes attributes = {});
  static AccessPayload OpenWeb(AccessFormat format, std::string open_web, Attributes attributes = {});

  AccessMode          mode() const;
  AccessFormat        format() const { return format_; }
  const AccessTarget& target() const { return target_; }
  const Attributes&   attributes() const { return attributes_; }

  // uri, embed url or open-web url depending on the mode.
  const std::string& Locator() const;

  bool operator==(const AccessPayload&) const = default;

 private:
  AccessFormat format_;
  AccessTarget target_;
  Attributes   attributes_;
};

} // namespace accessres::model
