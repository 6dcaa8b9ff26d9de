#pragma once

#include <optional>
#include <string>

#include "internal/model/receiver.hpp"

namespace receiver::core {

/*
  Derives the externally reachable channel of a receiver.

  Pure: the result depends only on (base_url, receiver_id, type), so it is
  recomputed on every read instead of being stored.

    webhook -> {alarm_url: <base_url>/v1/webhooks/<receiver_id>/trigger?V=1}
    signal  -> nullopt

  This process serves gRPC only. base_url names the HTTP gateway in front
  of it, which transcodes

    POST /v1/webhooks/{receiver_id}/trigger?V=1   (JSON body: {"params": {...}})

  onto TriggerService.TriggerWebhook with receiver_id taken from the path.
*/
class ChannelAllocator {
 public:
  explicit ChannelAllocator(std::string base_url);

  std::optional<model::Channel> Allocate(const std::string& receiver_id, model::ReceiverType type) const;

  const std::string& BaseUrl() const {
    return base_url_;
  }

 private:
  std::string base_url_;
};

} // namespace receiver::core
