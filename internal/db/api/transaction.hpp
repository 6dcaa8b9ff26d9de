#pragma once

#include <stdexcept>
#include <utility>

#include "internal/db/api/result.hpp"

namespace receiver::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed

  SQLite: BEGIN IMMEDIATE
  Postgres: pqxx::work
  Memory: snapshot + write set replayed at commit
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically; throws CommitError when the write set
  // conflicts with state committed concurrently
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true if commit already performed
  virtual bool IsCommitted() const = 0;
};

class CommitError : public std::runtime_error {
 public:
  explicit CommitError(Result result) : std::runtime_error(result.message), result_(std::move(result)) {
  }

  const Result& result() const {
    return result_;
  }

 private:
  Result result_;
};

}
