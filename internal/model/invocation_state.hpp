#pragma once

#include <cstdint>
#include <string_view>

namespace receiver::model {

/*
  Lifecycle of a single trigger invocation, as seen by the dispatcher.

    RECEIVED -> AUTHENTICATING -> AUTHORIZED -> SUBMITTED
                      |               |
                      +-> REJECTED <--+

  SUBMITTED is terminal here; action progress belongs to the action engine.
*/
enum class InvocationState : std::uint8_t {
  kReceived       = 0,
  kAuthenticating = 1,
  kAuthorized     = 2,
  kSubmitted      = 3,
  kRejected       = 4,
};

constexpr bool IsTerminal(InvocationState state) {
  return state == InvocationState::kSubmitted || state == InvocationState::kRejected;
}

constexpr bool CanTransition(InvocationState from, InvocationState to) {
  if (IsTerminal(from)) {
    return false;
  }

  switch (to) {
    case InvocationState::kAuthenticating:
      return from == InvocationState::kReceived;
    case InvocationState::kAuthorized:
      return from == InvocationState::kAuthenticating;
    case InvocationState::kSubmitted:
      return from == InvocationState::kAuthorized;
    case InvocationState::kRejected:
      return from == InvocationState::kAuthenticating || from == InvocationState::kAuthorized;
    case InvocationState::kReceived:
      break;
  }
  return false;
}

constexpr std::string_view ToString(InvocationState state) {
  switch (state) {
    case InvocationState::kReceived:
      return "RECEIVED";
    case InvocationState::kAuthenticating:
      return "AUTHENTICATING";
    case InvocationState::kAuthorized:
      return "AUTHORIZED";
    case InvocationState::kSubmitted:
      return "SUBMITTED";
    case InvocationState::kRejected:
      return "REJECTED";
  }
  return "UNKNOWN";
}

} // namespace receiver::model
