#pragma once

#include <cstdint>
#include <string>

namespace accessres::lane {

// Binding of one item to the shared access lane. Identity is the id.
struct LaneSubscription {
  std::uint64_t id{0};
  std::string   item_id;
  std::string   lane;
  std::uint64_t handler_token{0};
};

} // namespace accessres::lane
