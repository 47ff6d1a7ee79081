#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/model/access_frame.hpp"

namespace accessres::wire {

/*
  Binary frame layout, little-endian:

    [version:1][flags:1][itemIdLen:2][readiness:1][itemId]
    [accessLen:4][access json]       if HAS_ACCESS
    [fallbackLen:4][fallback json]   if HAS_FALLBACK
    [headersLen:4][headers json]     if HAS_HEADERS
    [timestamp low32:4][timestamp high32:4]
    [crc32:4]                        over every preceding byte

  A frame whose trailer is cut short decodes with truncated=true and
  is_valid=true: under 8 bytes the timestamp becomes now_ms, under 12 the
  checksum is not checked. Bytes past a full trailer are ignored.

  Compact form: {"id":..., "r":0|1|2, "a":b64(json)?, "f":b64(json)?, "t":ms}.
  It carries no checksum and no headers.

  Decoders never throw; a rejected input yields nullopt and a warning log.
*/

inline constexpr std::size_t kMinFrameBytes = 13;

enum class FrameEncoding : std::uint8_t {
  kBinary,
  kCompact,
};

std::string_view ToString(FrameEncoding encoding);

// Throws util::InvalidArgument when the item id or a section does not fit its
// length prefix. Section flags are rewritten to match the sections present.
std::string EncodeFrame(const accessres::model::AccessFrame& frame);
std::string EncodeFrameBase64(const accessres::model::AccessFrame& frame);
std::string EncodeCompactFrame(const accessres::model::AccessFrame& frame);

std::optional<accessres::model::AccessFrame> DecodeFrame(std::string_view bytes, std::uint64_t now_ms);
std::optional<accessres::model::AccessFrame> DecodeFrame(std::string_view bytes);

std::optional<accessres::model::AccessFrame> DecodeFrameBase64(std::string_view text, std::uint64_t now_ms);
std::optional<accessres::model::AccessFrame> DecodeFrameBase64(std::string_view text);

std::optional<accessres::model::AccessFrame> DecodeCompactFrame(std::string_view json);

// A trimmed line starting with '{' is compact, anything else base64 binary.
FrameEncoding                             DetectEncoding(std::string_view line);
std::optional<accessres::model::AccessFrame> DecodeLine(std::string_view line, std::uint64_t now_ms);
std::optional<accessres::model::AccessFrame> DecodeLine(std::string_view line);

} // namespace accessres::wire
