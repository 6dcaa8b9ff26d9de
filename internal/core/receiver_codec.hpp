#pragma once

#include <string>

#include "internal/db/model/receiver_record.hpp"
#include "internal/engine/action_engine.hpp"
#include "internal/model/receiver.hpp"
#include "receiver/manager/v1.hpp"

namespace receiver::core {

/*
  Conversions between the persisted row, the domain model and the wire
  representation.

  actor/params are stored as JSON objects (protobuf Struct encoding).
  Non-string JSON values found in a row are kept as their JSON text.
*/

std::string   EncodeParams(const model::Params& params);
model::Params DecodeParams(const std::string& json);

db::model::ReceiverRecord ToRecord(const model::Receiver& receiver);

// Throws std::runtime_error for rows with an unknown type or corrupt JSON.
model::Receiver FromRecord(const db::model::ReceiverRecord& record);

receiver::manager::v1::Receiver   ToProto(const model::Receiver& receiver);
receiver::manager::v1::ActionInfo ToProto(const engine::ActionRecord& action);

} // namespace receiver::core
