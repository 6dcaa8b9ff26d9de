#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include "internal/identity/identity_service.hpp"
#include "internal/model/receiver.hpp"

namespace receiver::engine {

enum class ActionStatus {
  kInit,
  kReady,
  kRunning,
  kSucceeded,
  kFailed,
  kCancelled,
};

constexpr std::string_view ToString(ActionStatus status) {
  switch (status) {
    case ActionStatus::kInit:
      return "INIT";
    case ActionStatus::kReady:
      return "READY";
    case ActionStatus::kRunning:
      return "RUNNING";
    case ActionStatus::kSucceeded:
      return "SUCCEEDED";
    case ActionStatus::kFailed:
      return "FAILED";
    case ActionStatus::kCancelled:
      return "CANCELLED";
  }
  return "UNKNOWN";
}

struct ActionRequest {
  std::string              action;
  std::string              cluster_id;
  model::Params            inputs;
  identity::ActingIdentity actor;
  // e.g. "receiver:<id>"
  std::string cause;
};

// Returned by Submit before the action runs.
struct ActionHandle {
  std::string  action_id;
  ActionStatus status = ActionStatus::kInit;
};

struct ActionRecord {
  std::string   id;
  std::string   action;
  std::string   cluster_id;
  ActionStatus  status = ActionStatus::kInit;
  std::string   status_reason;
  std::string   cause;
  model::Params inputs;
  std::string   user;
  std::string   project;

  std::chrono::system_clock::time_point created_at{};
};

/*
  Submission API of the action engine.

  Submit returns as soon as the action is accepted; execution is
  asynchronous. A refused submission throws util::DispatchRejected.
*/
class ActionEngine {
 public:
  virtual ~ActionEngine() = default;

  virtual bool IsKnownAction(const std::string& action) const = 0;

  virtual ActionHandle Submit(const ActionRequest& request) = 0;

  virtual std::optional<ActionRecord> GetAction(const std::string& action_id) const = 0;
};

} // namespace receiver::engine
