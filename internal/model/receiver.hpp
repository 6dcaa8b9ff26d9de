#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace receiver::model {

enum class ReceiverType : std::uint8_t {
  kUnspecified = 0,
  kWebhook     = 1,
  kSignal      = 2,
};

constexpr std::string_view ToString(ReceiverType type) {
  switch (type) {
    case ReceiverType::kWebhook:
      return "webhook";
    case ReceiverType::kSignal:
      return "signal";
    case ReceiverType::kUnspecified:
      break;
  }
  return "unspecified";
}

constexpr std::optional<ReceiverType> ParseReceiverType(std::string_view value) {
  if (value == "webhook") {
    return ReceiverType::kWebhook;
  }
  if (value == "signal") {
    return ReceiverType::kSignal;
  }
  return std::nullopt;
}

using Params = std::map<std::string, std::string>;

// Key under Receiver::actor holding the delegated credential handle.
inline constexpr std::string_view kTrustIdKey = "trust_id";

struct Channel {
  std::string alarm_url;
};

struct Receiver {
  std::string  id;
  std::string  name;
  ReceiverType type = ReceiverType::kUnspecified;
  std::string  cluster_id;
  std::string  action;

  Params actor;
  Params params;

  // Derived on every read, never persisted.
  std::optional<Channel> channel;

  std::string project;
  std::string domain;
  std::string user;

  std::chrono::system_clock::time_point created_at{};
  std::chrono::system_clock::time_point updated_at{};

  std::optional<std::string> TrustId() const {
    auto it = actor.find(std::string(kTrustIdKey));
    if (it == actor.end() || it->second.empty()) {
      return std::nullopt;
    }
    return it->second;
  }
};

} // namespace receiver::model
