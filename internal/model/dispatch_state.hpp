#pragma once

#include <cstdint>
#include <string_view>

namespace cadence::model {

// Lifecycle of one record inside a dispatch pass.
enum class DispatchState : std::uint8_t {
  kPending   = 0,
  kDue       = 1,
  kResolving = 2,
  kPublished = 3,
  kSkipped   = 4,
};

constexpr bool IsTerminal(DispatchState state) {
  return state == DispatchState::kPublished || state == DispatchState::kSkipped;
}

constexpr bool CanTransition(DispatchState from, DispatchState to) {
  if (IsTerminal(from)) {
    return false;
  }
  if (to == DispatchState::kSkipped) {
    return from != DispatchState::kPending;
  }
  return static_cast<std::uint8_t>(to) == static_cast<std::uint8_t>(from) + 1;
}

constexpr std::string_view ToString(DispatchState state) {
  switch (state) {
    case DispatchState::kPending:
      return "pending";
    case DispatchState::kDue:
      return "due";
    case DispatchState::kResolving:
      return "resolving";
    case DispatchState::kPublished:
      return "published";
    case DispatchState::kSkipped:
      return "skipped";
  }
  return "pending";
}

} // namespace cadence::model
