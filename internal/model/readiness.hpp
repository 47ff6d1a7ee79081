#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace accessres::model {

// Wire codes are fixed by the frame format.
enum class Readiness : std::uint8_t {
  kPending  = 0,
  kReady    = 1,
  kDegraded = 2,
};

constexpr bool IsTerminal(Readiness state) {
  return state == Readiness::kReady;
}

// PENDING -> DEGRADED, PENDING -> READY, DEGRADED -> READY. Self transitions
// are accepted so observers can be re-notified; READY never goes back.
constexpr bool CanTransition(Readiness from, Readiness to) {
  if (from == to) {
    return true;
  }
  if (IsTerminal(from)) {
    return false;
  }
  if (to == Readiness::kPending) {
    return false;
  }
  return from == Readiness::kPending || to == Readiness::kReady;
}

constexpr std::uint8_t ToCode(Readiness state) {
  return static_cast<std::uint8_t>(state);
}

constexpr std::optional<Readiness> ReadinessFromCode(std::uint64_t code) {
  switch (code) {
    case 0:
      return Readiness::kPending;
    case 1:
      return Readiness::kReady;
    case 2:
      return Readiness::kDegraded;
    default:
      return std::nullopt;
  }
}

constexpr std::string_view ToString(Readiness state) {
  switch (state) {
    case Readiness::kPending:
      return "PENDING";
    case Readiness::kReady:
      return "READY";
    case Readiness::kDegraded:
      return "DEGRADED";
  }
  return "PENDING";
}

std::optional<Readiness> ParseReadiness(std::string_view text);

} // namespace accessres::model
