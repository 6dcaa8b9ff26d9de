#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/core/channel_allocator.hpp"
#include "internal/core/receiver_codec.hpp"
#include "internal/util/time.hpp"

namespace {

using receiver::core::ChannelAllocator;
using receiver::model::ReceiverType;

receiver::model::Receiver SampleReceiver() {
  receiver::model::Receiver r;
  r.id         = "5f0c1f3e-9b7a-4c55-8f0e-2f7a1b2c3d4e";
  r.name       = "scale-on-cpu";
  r.type       = ReceiverType::kWebhook;
  r.cluster_id = "c-1";
  r.action     = "CLUSTER_SCALE_OUT";
  r.actor      = {{"trust_id", "t-1"}, {"note", "on call"}};
  r.params     = {{"count", "2"}};
  r.project    = "web";
  r.domain     = "default";
  r.user       = "alice";
  r.created_at = receiver::util::FromUnixMillis(1700000000123);
  r.updated_at = r.created_at;
  return r;
}

void TestChannelForWebhook() {
  ChannelAllocator channels("https://receivers.example.com/");
  assert(channels.BaseUrl() == "https://receivers.example.com");

  auto channel = channels.Allocate("abc", ReceiverType::kWebhook);
  assert(channel.has_value());
  assert(channel->alarm_url == "https://receivers.example.com/v1/webhooks/abc/trigger?V=1");

  // same inputs, same channel
  assert(channels.Allocate("abc", ReceiverType::kWebhook)->alarm_url == channel->alarm_url);
}

void TestNoChannelForSignal() {
  ChannelAllocator channels("http://localhost:8778");
  assert(!channels.Allocate("abc", ReceiverType::kSignal).has_value());
}

void TestRecordKeepsEveryField() {
  auto original = SampleReceiver();
  auto record   = receiver::core::ToRecord(original);
  assert(record.type == "webhook");
  assert(record.created_at_ms == 1700000000123ULL);

  auto restored = receiver::core::FromRecord(record);
  assert(restored.id == original.id);
  assert(restored.type == ReceiverType::kWebhook);
  assert(restored.actor == original.actor);
  assert(restored.params == original.params);
  assert(restored.TrustId() == std::optional<std::string>("t-1"));
  assert(restored.created_at == original.created_at);
  assert(!restored.channel.has_value());
}

void TestNonStringJsonValuesAreKeptAsText() {
  auto params = receiver::core::DecodeParams(R"({"count": 3, "force": true, "name": "x"})");
  assert(params.size() == 3);
  assert(params.at("count") == "3");
  assert(params.at("force") == "true");
  assert(params.at("name") == "x");

  assert(receiver::core::DecodeParams("").empty());
}

void TestCorruptRowsAreRejected() {
  auto record = receiver::core::ToRecord(SampleReceiver());
  record.type = "carrier-pigeon";

  bool threw = false;
  try {
    (void)receiver::core::FromRecord(record);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)receiver::core::DecodeParams("{not json");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestProtoCarriesChannelWhenPresent() {
  auto r    = SampleReceiver();
  r.channel = ChannelAllocator("http://h").Allocate(r.id, r.type);

  auto proto = receiver::core::ToProto(r);
  assert(proto.type() == "webhook");
  assert(proto.channel().alarm_url() == "http://h/v1/webhooks/" + r.id + "/trigger?V=1");
  assert(proto.params().at("count") == "2");
  assert(proto.created_at().seconds() == 1700000000);
  assert(proto.created_at().nanos() == 123000000);

  r.type    = ReceiverType::kSignal;
  r.channel = std::nullopt;
  assert(!receiver::core::ToProto(r).has_channel());
}

} // namespace

int main() {
  TestChannelForWebhook();
  TestNoChannelForSignal();
  TestRecordKeepsEveryField();
  TestNonStringJsonValuesAreKeptAsText();
  TestCorruptRowsAreRejected();
  TestProtoCarriesChannelWhenPresent();

  std::cout << "receiver_manager_unit_receiver_codec: pass\n";
  return 0;
}
