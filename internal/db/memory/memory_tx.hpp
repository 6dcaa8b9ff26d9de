#pragma once

#include <string>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace receiver::db::memory {

/*
  Transaction = snapshot + write set

  Reads see the snapshot with this transaction's writes applied. Commit
  replays the write set against the latest committed state, so
  transactions touching different records never conflict; a replayed
  write that no longer applies (duplicate name, row already deleted)
  aborts the whole commit with CommitError.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State& Mutable() {
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

  void RecordInsert(const model::ReceiverRecord& record);
  void RecordDelete(const std::string& id);

 private:
  struct WriteOp {
    enum class Kind { kInsert, kDelete };

    Kind                  kind;
    model::ReceiverRecord record;
  };

  MemoryRepository&       repo_;
  MemoryRepository::State working_;
  std::vector<WriteOp>    writes_;
  bool                    committed_   = false;
  bool                    rolled_back_ = false;
};

} // namespace receiver::db::memory
