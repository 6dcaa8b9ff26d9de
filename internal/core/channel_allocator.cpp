#include "channel_allocator.hpp"

namespace receiver::core {

namespace {

constexpr const char* kWebhookPath  = "/v1/webhooks/";
constexpr const char* kTriggerPath  = "/trigger";
constexpr const char* kVersionQuery = "?V=1";

} // namespace

ChannelAllocator::ChannelAllocator(std::string base_url) : base_url_(std::move(base_url)) {
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

std::optional<model::Channel> ChannelAllocator::Allocate(const std::string& receiver_id, model::ReceiverType type) const {
  if (type != model::ReceiverType::kWebhook) {
    return std::nullopt;
  }

  model::Channel channel;
  channel.alarm_url = base_url_ + kWebhookPath + receiver_id + kTriggerPath + kVersionQuery;
  return channel;
}

} // namespace receiver::core
