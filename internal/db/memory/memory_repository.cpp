#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace receiver::db::memory {

namespace {

std::string NameKey(const std::string& project, const std::string& name) {
  return project + "#" + name;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::ApplyInsert(State& s, const model::ReceiverRecord& r) {
  if (s.receivers.contains(r.id)) {
    return Result::Err(ErrorCode::AlreadyExists, "receiver '" + r.id + "' already exists");
  }
  const auto key = NameKey(r.project, r.name);
  if (s.name_index.contains(key)) {
    return Result::Err(ErrorCode::AlreadyExists, "receiver name '" + r.name + "' already exists in project '" + r.project + "'");
  }
  s.receivers[r.id] = r;
  s.name_index[key]  = r.id;
  return Result::Ok();
}

Result MemoryRepository::ApplyDelete(State& s, const std::string& id) {
  auto it = s.receivers.find(id);
  if (it == s.receivers.end()) {
    return Result::Err(ErrorCode::NotFound, "receiver '" + id + "' not found");
  }
  s.name_index.erase(NameKey(it->second.project, it->second.name));
  s.receivers.erase(it);
  return Result::Ok();
}

Result MemoryRepository::InsertReceiver(Transaction& t, const model::ReceiverRecord& r) {
  auto result = ApplyInsert(TX(t).Mutable(), r);
  if (result) {
    TX(t).RecordInsert(r);
  }
  return result;
}

std::optional<model::ReceiverRecord> MemoryRepository::GetReceiver(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.receivers.find(id);
  if (it == s.receivers.end()) return std::nullopt;
  return it->second;
}

std::optional<model::ReceiverRecord> MemoryRepository::GetReceiverByName(Transaction& t, const std::string& project, const std::string& name) {
  const auto& s  = TX(t).View();
  auto        it = s.name_index.find(NameKey(project, name));
  if (it == s.name_index.end()) return std::nullopt;
  return GetReceiver(t, it->second);
}

std::vector<model::ReceiverRecord> MemoryRepository::ListReceivers(Transaction& t, const ReceiverFilter& filter) {
  const auto&                        s = TX(t).View();
  std::vector<model::ReceiverRecord> records;
  for (const auto& [_, record] : s.receivers) {
    if (filter.Matches(record)) {
      records.push_back(record);
    }
  }
  return records;
}

Result MemoryRepository::DeleteReceiver(Transaction& t, const std::string& id) {
  auto result = ApplyDelete(TX(t).Mutable(), id);
  if (result) {
    TX(t).RecordDelete(id);
  }
  return result;
}

} // namespace receiver::db::memory
