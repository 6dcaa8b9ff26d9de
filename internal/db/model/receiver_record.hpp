#pragma once

#include <cstdint>
#include <string>

namespace receiver::db::model {

/*
  Persistent receiver row.

  - (project, name) is unique.
  - actor/params are JSON objects of string values.
  - channel is derived and never stored.
*/

struct ReceiverRecord {
  std::string id;
  std::string name;
  std::string type; // "webhook" | "signal"
  std::string cluster_id;
  std::string action;

  std::string actor_json  = "{}";
  std::string params_json = "{}";

  std::string project;
  std::string domain;
  std::string user;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

}
