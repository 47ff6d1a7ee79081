#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "internal/model/readiness.hpp"

namespace accessres::render {

enum class RenderType : std::uint8_t {
  kPlayer,
  kReader,
  kEmbed,
  kRedirect,
  kError,
  kPending,
};

std::string_view ToString(RenderType type);

/*
  Teardown callback that runs at most once.

  Copies share the same state, so invoking any copy disarms all of them.
  An empty handle is a no-op.
*/
class CleanupHandle {
 public:
  CleanupHandle() = default;
  explicit CleanupHandle(std::function<void()> teardown);

  void operator()() const;

  bool armed() const;

 private:
  struct State {
    std::function<void()> teardown;
    bool                  done{false};
  };

  std::shared_ptr<State> state_;
};

// Side-effect free description of how an item is (or will be) presented.
struct RenderResult {
  RenderType                              type{RenderType::kPending};
  std::optional<std::string>              element;
  std::optional<std::string>              url;
  std::optional<std::string>              error;
  std::optional<accessres::model::Readiness> readiness;
  CleanupHandle                           cleanup;

  static RenderResult Pending();
  static RenderResult Error(std::string message);
};

} // namespace accessres::render
