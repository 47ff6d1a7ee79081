#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/resolution.hpp"
#include "render_result.hpp"

namespace accessres::render {

struct RenderOptions {
  // Identity token for receipts; no receipt is emitted without one.
  std::optional<std::string> identity;
  bool                       autoplay{false};
  std::uint64_t              start_position_ms{0};
};

/*
  Turns a resolved manifest into a RenderResult.

  The returned cleanup must be safe to call more than once. Implementations
  report unusable manifests as RenderType::kError instead of throwing.
*/
class RenderDispatcher {
 public:
  virtual ~RenderDispatcher() = default;

  virtual RenderResult Dispatch(const accessres::model::AccessResolution& resolution, const RenderOptions& options) = 0;
};

} // namespace accessres::render
