#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace accessres::lane {

inline constexpr std::string_view kDefaultAccessLane = "access";

struct Lane {
  std::string name;
  std::string url;
};

// Lanes advertised by the push session handshake.
struct SessionLanes {
  std::string              session_id;
  std::vector<Lane>        lanes;
  std::vector<std::string> features;
  std::uint64_t            expires_at_ms{0};
  std::uint32_t            heartbeat_interval_ms{0};

  std::optional<Lane> Find(std::string_view name) const {
    for (const auto& lane : lanes) {
      if (lane.name == name) {
        return lane;
      }
    }
    return std::nullopt;
  }
};

} // namespace accessres::lane
