#pragma once

#include <algorithm>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/receiver_record.hpp"

namespace receiver::db {

/*
  Receiver filter.

  Empty vectors match everything; a non-empty vector matches any of its
  values. An unset project means all projects.
*/
struct ReceiverFilter {
  std::optional<std::string> project;
  std::vector<std::string>   names;
  std::vector<std::string>   types;
  std::vector<std::string>   cluster_ids;
  std::vector<std::string>   actions;

  bool Matches(const model::ReceiverRecord& record) const {
    auto any_of = [](const std::vector<std::string>& values, const std::string& value) {
      return values.empty() || std::find(values.begin(), values.end(), value) != values.end();
    };
    if (project && *project != record.project) return false;
    return any_of(names, record.name) && any_of(types, record.type) && any_of(cluster_ids, record.cluster_id) && any_of(actions, record.action);
  }
};

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - InsertReceiver fails with AlreadyExists on a duplicate id or a
    duplicate (project, name)
  - DeleteReceiver is compare-and-delete: NotFound when the row is
    already gone

  The DB is the source of truth for receivers and their credential
  references (actor.trust_id).
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Receivers
  // ---------------------------------------------------------------------

  virtual Result InsertReceiver(Transaction&, const model::ReceiverRecord&) = 0;

  virtual std::optional<model::ReceiverRecord> GetReceiver(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::ReceiverRecord> GetReceiverByName(Transaction&, const std::string& project, const std::string& name) = 0;

  // Unordered; callers sort and paginate.
  virtual std::vector<model::ReceiverRecord> ListReceivers(Transaction&, const ReceiverFilter& filter) = 0;

  virtual Result DeleteReceiver(Transaction&, const std::string& id) = 0;
};

} // namespace receiver::db
