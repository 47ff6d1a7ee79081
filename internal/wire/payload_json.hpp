#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/model/access_payload.hpp"

namespace accessres::wire {

/*
  JSON form of an access payload, as embedded in frame sections:

    { "mode": "stream", "format": "hls", "uri": "...", "headers": {...},
      "expiresAt": 1700000000000, "quality": "1080p", "bitrate": 4500000 }

  The locator key depends on the mode: uri (stream, file), embed, openWeb.
  Parsing returns nullopt for malformed JSON, unknown mode/format, a missing
  locator or wrongly typed optional fields. expiresAt and bitrate must be
  exact integers no larger than 2^53; a larger value rejects the payload and
  with it the whole frame that embeds it.
*/
std::string                                 PayloadToJson(const accessres::model::AccessPayload& payload);
std::optional<accessres::model::AccessPayload> PayloadFromJson(std::string_view json);

std::string                             HeadersToJson(const accessres::model::HeaderMap& headers);
std::optional<accessres::model::HeaderMap> HeadersFromJson(std::string_view json);

// Largest integer a JSON number (IEEE double) carries exactly.
inline constexpr double kMaxExactInteger = 9007199254740992.0;

// Non-negative integral number value up to kMaxExactInteger.
std::optional<std::uint64_t> ExactUnsigned(const google::protobuf::Value& value);

} // namespace accessres::wire
