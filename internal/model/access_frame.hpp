#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "access_payload.hpp"
#include "readiness.hpp"

namespace accessres::model {

inline constexpr std::uint8_t  kFrameVersion         = 1;
inline constexpr std::uint64_t kDefaultMaxFrameAgeMs = 300000;

enum class FrameFlag : std::uint8_t {
  kHasAccess    = 0x01,
  kHasFallback  = 0x02,
  kHasHeaders   = 0x04,
  kIsDelta      = 0x08,
  kIsCompressed = 0x10,
  kRequiresAuth = 0x20,
};

class FrameFlags {
 public:
  constexpr FrameFlags() = default;
  constexpr explicit FrameFlags(std::uint8_t bits) : bits_(bits) {
  }

  constexpr bool Has(FrameFlag flag) const {
    return (bits_ & static_cast<std::uint8_t>(flag)) != 0;
  }

  constexpr FrameFlags With(FrameFlag flag, bool enabled = true) const {
    const auto mask = static_cast<std::uint8_t>(flag);
    return FrameFlags(static_cast<std::uint8_t>(enabled ? (bits_ | mask) : (bits_ & ~mask)));
  }

  constexpr std::uint8_t bits() const {
    return bits_;
  }

  bool operator==(const FrameFlags&) const = default;

 private:
  std::uint8_t bits_{0};
};

/*
  One access-state update as carried on the wire.

  is_valid is computed by the decoder (checksum match) and is never
  transmitted. truncated marks a binary frame that ended before its
  timestamp/checksum trailer.
*/
struct AccessFrame {
  std::uint8_t                 version{kFrameVersion};
  FrameFlags                   flags;
  std::string                  item_id;
  Readiness                    readiness{Readiness::kPending};
  std::optional<AccessPayload> access;
  std::optional<AccessPayload> fallback;
  std::optional<HeaderMap>     headers;
  std::uint64_t                timestamp_ms{0};
  std::uint32_t                checksum{0};
  bool                         is_valid{true};
  bool                         truncated{false};
};

// Builds a frame whose section flags match the sections present.
AccessFrame MakeFrame(std::string item_id, Readiness readiness, std::optional<AccessPayload> access,
                      std::optional<AccessPayload> fallback, std::uint64_t timestamp_ms);

bool IsFrameExpired(const AccessFrame& frame, std::uint64_t now_ms, std::uint64_t max_age_ms = kDefaultMaxFrameAgeMs);

} // namespace accessres::model
