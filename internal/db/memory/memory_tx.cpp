#include "memory_tx.hpp"

namespace receiver::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::RecordInsert(const model::ReceiverRecord& record) {
  writes_.push_back(WriteOp{WriteOp::Kind::kInsert, record});
}

void MemoryTransaction::RecordDelete(const std::string& id) {
  model::ReceiverRecord key;
  key.id = id;
  writes_.push_back(WriteOp{WriteOp::Kind::kDelete, std::move(key)});
}

void MemoryTransaction::Commit() {
  std::scoped_lock lock(repo_.mutex_);

  auto next = repo_.committed_;
  for (const auto& op : writes_) {
    auto result = op.kind == WriteOp::Kind::kInsert ? MemoryRepository::ApplyInsert(next, op.record)
                                                    : MemoryRepository::ApplyDelete(next, op.record.id);
    if (!result) {
      throw CommitError(std::move(result));
    }
  }

  repo_.committed_ = std::move(next);
  writes_.clear();
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  writes_.clear();
  rolled_back_ = true;
}

} // namespace receiver::db::memory
