#include "render_result.hpp"

#include <utility>

namespace accessres::render {

std::string_view ToString(RenderType type) {
  switch (type) {
    case RenderType::kPlayer:
      return "player";
    case RenderType::kReader:
      return "reader";
    case RenderType::kEmbed:
      return "embed";
    case RenderType::kRedirect:
      return "redirect";
    case RenderType::kError:
      return "error";
    case RenderType::kPending:
      return "pending";
  }
  return "pending";
}

CleanupHandle::CleanupHandle(std::function<void()> teardown) {
  if (teardown) {
    state_           = std::make_shared<State>();
    state_->teardown = std::move(teardown);
  }
}

void CleanupHandle::operator()() const {
  if (!state_ || state_->done) {
    return;
  }
  // Disarm first so a re-entrant call from the teardown itself is a no-op.
  state_->done = true;
  auto teardown = std::move(state_->teardown);
  teardown();
}

bool CleanupHandle::armed() const {
  return state_ && !state_->done;
}

RenderResult RenderResult::Pending() {
  RenderResult result;
  result.type      = RenderType::kPending;
  result.readiness = accessres::model::Readiness::kPending;
  return result;
}

RenderResult RenderResult::Error(std::string message) {
  RenderResult result;
  result.type  = RenderType::kError;
  result.error = std::move(message);
  return result;
}

} // namespace accessres::render
