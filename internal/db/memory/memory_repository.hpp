#pragma once

#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/db/api/repository.hpp"

namespace receiver::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertReceiver(Transaction&, const model::ReceiverRecord&) override;
  std::optional<model::ReceiverRecord> GetReceiver(Transaction&, const std::string&) override;
  std::optional<model::ReceiverRecord> GetReceiverByName(Transaction&, const std::string& project, const std::string& name) override;
  std::vector<model::ReceiverRecord> ListReceivers(Transaction&, const ReceiverFilter&) override;
  Result DeleteReceiver(Transaction&, const std::string&) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::ReceiverRecord> receivers;
    // project#name -> id
    std::unordered_map<std::string, std::string> name_index;
  };

  static Result ApplyInsert(State& state, const model::ReceiverRecord& record);
  static Result ApplyDelete(State& state, const std::string& id);

  std::mutex mutex_;
  State committed_;
};

}
