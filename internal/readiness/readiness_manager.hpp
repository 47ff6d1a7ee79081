#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "internal/model/resolution.hpp"
#include "internal/render/render_result.hpp"

namespace accessres::readiness {

/*
  Per-item readiness record.

  current_result is owned here: its cleanup runs before it is replaced and
  when the manager is destroyed. unsubscribe detaches the item's lane
  subscription, if any.

  instance is unique per created manager so callbacks can detect that the
  item was destroyed (and maybe recreated) while they ran. fetch_generation
  is the stamp of the newest fetch started for this item.
*/
struct ReadinessManager {
  std::string item_id;
  std::uint64_t instance{0};

  accessres::model::Readiness                   current_state{accessres::model::Readiness::kPending};
  std::optional<accessres::render::RenderResult> current_result;
  std::optional<accessres::model::AccessPayload> pending_upgrade;
  std::function<void()>                       unsubscribe;

  std::uint64_t                fetch_generation{0};
  std::optional<std::uint64_t> last_frame_ms;

  // Presentation context used when dispatching renders.
  accessres::model::ItemType item_type{accessres::model::ItemType::kVideo};
  std::string             title;
};

} // namespace accessres::readiness
