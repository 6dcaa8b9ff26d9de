#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/receiver_record.hpp"

namespace receiver::core {

enum class SortKey {
  kName,
  kType,
  kClusterId,
  kAction,
  kCreatedAt,
  kUpdatedAt,
};

struct SortSpec {
  SortKey key       = SortKey::kCreatedAt;
  bool    ascending = true;
};

// Last row of the previous page: its sort key values and id.
struct Marker {
  std::vector<std::string> sort_values;
  std::string              id;
};

struct Page {
  std::vector<db::model::ReceiverRecord> records;
  // Empty when nothing follows.
  std::string next_marker;
};

/*
  Stateless pagination over receiver rows.

  Rows are ordered by the sort keys, then by id. The marker is an opaque
  hex encoding of the last returned row's key, so a page never depends on
  server-side cursor state.
*/
class ListQuery {
 public:
  // "key[:asc|desc][,key...]"; empty selects created_at:asc.
  static std::vector<SortSpec> ParseSort(const std::string& sort);

  static std::string EncodeMarker(const Marker& marker);
  static Marker      DecodeMarker(const std::string& marker);

  // 0 selects default_limit; values above max_limit are rejected.
  static uint32_t ResolveLimit(uint32_t requested, uint32_t default_limit, uint32_t max_limit);

  ListQuery(std::vector<SortSpec> sort, std::optional<Marker> marker, uint32_t limit);

  Page Apply(std::vector<db::model::ReceiverRecord> records) const;

 private:
  std::vector<std::string> SortValues(const db::model::ReceiverRecord& record) const;

  // <0, 0, >0 in page order.
  int Compare(const std::vector<std::string>& lhs_values, const std::string& lhs_id, const std::vector<std::string>& rhs_values,
              const std::string& rhs_id) const;

  std::vector<SortSpec> sort_;
  std::optional<Marker> marker_;
  uint32_t              limit_;
};

} // namespace receiver::core
