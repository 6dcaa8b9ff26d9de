#include "receiver_codec.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/util/time.hpp"

namespace receiver::core {

using namespace receiver::manager::v1;

std::string EncodeParams(const model::Params& params) {
  google::protobuf::Struct object;
  for (const auto& [key, value] : params) {
    (*object.mutable_fields())[key].set_string_value(value);
  }

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(object, &json);
  if (!status.ok()) {
    throw std::runtime_error("encode params: " + std::string(status.message()));
  }
  return json;
}

model::Params DecodeParams(const std::string& json) {
  model::Params params;
  if (json.empty()) {
    return params;
  }

  google::protobuf::Struct object;
  auto                     status = google::protobuf::util::JsonStringToMessage(json, &object);
  if (!status.ok()) {
    throw std::runtime_error("decode params: " + std::string(status.message()));
  }

  for (const auto& [key, value] : object.fields()) {
    if (value.kind_case() == google::protobuf::Value::kStringValue) {
      params[key] = value.string_value();
      continue;
    }

    std::string text;
    auto        value_status = google::protobuf::util::MessageToJsonString(value, &text);
    if (!value_status.ok()) {
      throw std::runtime_error("decode params: " + std::string(value_status.message()));
    }
    params[key] = text;
  }
  return params;
}

db::model::ReceiverRecord ToRecord(const model::Receiver& receiver) {
  db::model::ReceiverRecord record;
  record.id            = receiver.id;
  record.name          = receiver.name;
  record.type          = std::string(model::ToString(receiver.type));
  record.cluster_id    = receiver.cluster_id;
  record.action        = receiver.action;
  record.actor_json    = EncodeParams(receiver.actor);
  record.params_json   = EncodeParams(receiver.params);
  record.project       = receiver.project;
  record.domain        = receiver.domain;
  record.user          = receiver.user;
  record.created_at_ms = util::ToUnixMillis(receiver.created_at);
  record.updated_at_ms = util::ToUnixMillis(receiver.updated_at);
  return record;
}

model::Receiver FromRecord(const db::model::ReceiverRecord& record) {
  auto type = model::ParseReceiverType(record.type);
  if (!type) {
    throw std::runtime_error("receiver '" + record.id + "' has unknown type '" + record.type + "'");
  }

  model::Receiver receiver;
  receiver.id         = record.id;
  receiver.name       = record.name;
  receiver.type       = *type;
  receiver.cluster_id = record.cluster_id;
  receiver.action     = record.action;
  receiver.actor      = DecodeParams(record.actor_json);
  receiver.params     = DecodeParams(record.params_json);
  receiver.project    = record.project;
  receiver.domain     = record.domain;
  receiver.user       = record.user;
  receiver.created_at = util::FromUnixMillis(record.created_at_ms);
  receiver.updated_at = util::FromUnixMillis(record.updated_at_ms);
  return receiver;
}

Receiver ToProto(const model::Receiver& receiver) {
  Receiver out;
  out.set_id(receiver.id);
  out.set_name(receiver.name);
  out.set_type(std::string(model::ToString(receiver.type)));
  out.set_cluster_id(receiver.cluster_id);
  out.set_action(receiver.action);
  out.mutable_actor()->insert(receiver.actor.begin(), receiver.actor.end());
  out.mutable_params()->insert(receiver.params.begin(), receiver.params.end());
  if (receiver.channel) {
    out.mutable_channel()->set_alarm_url(receiver.channel->alarm_url);
  }
  out.set_domain(receiver.domain);
  out.set_project(receiver.project);
  out.set_user(receiver.user);
  *out.mutable_created_at() = util::ToProto(receiver.created_at);
  *out.mutable_updated_at() = util::ToProto(receiver.updated_at);
  return out;
}

ActionInfo ToProto(const engine::ActionRecord& action) {
  ActionInfo out;
  out.set_action_id(action.id);
  out.set_action(action.action);
  out.set_cluster_id(action.cluster_id);
  out.set_status(std::string(engine::ToString(action.status)));
  out.set_status_reason(action.status_reason);
  out.set_cause(action.cause);
  out.mutable_inputs()->insert(action.inputs.begin(), action.inputs.end());
  out.set_user(action.user);
  out.set_project(action.project);
  *out.mutable_created_at() = util::ToProto(action.created_at);
  return out;
}

} // namespace receiver::core
