#include "list_query.hpp"

#include <algorithm>
#include <cstdio>

#include "internal/util/errors.hpp"
#include "receiver/manager/v1.hpp"

namespace receiver::core {

namespace {

std::string InvalidValue(const std::string& value, const std::string& field) {
  return "Invalid value '" + value + "' specified for '" + field + "'";
}

std::optional<SortKey> ParseSortKey(const std::string& key) {
  if (key == "name") return SortKey::kName;
  if (key == "type") return SortKey::kType;
  if (key == "cluster_id") return SortKey::kClusterId;
  if (key == "action") return SortKey::kAction;
  if (key == "created_at") return SortKey::kCreatedAt;
  if (key == "updated_at") return SortKey::kUpdatedAt;
  return std::nullopt;
}

// Fixed width so lexical order matches numeric order.
std::string PadMillis(uint64_t ms) {
  char buffer[21];
  std::snprintf(buffer, sizeof(buffer), "%020llu", static_cast<unsigned long long>(ms));
  return buffer;
}

std::vector<std::string> Split(const std::string& value, char delimiter) {
  std::vector<std::string> parts;
  std::size_t              start = 0;
  while (true) {
    auto end = value.find(delimiter, start);
    parts.push_back(value.substr(start, end == std::string::npos ? std::string::npos : end - start));
    if (end == std::string::npos) break;
    start = end + 1;
  }
  return parts;
}

int HexNibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

} // namespace

std::vector<SortSpec> ListQuery::ParseSort(const std::string& sort) {
  if (sort.empty()) {
    return {SortSpec{SortKey::kCreatedAt, true}};
  }

  std::vector<SortSpec> specs;
  for (const auto& item : Split(sort, ',')) {
    auto parts = Split(item, ':');
    if (parts.size() > 2) {
      throw util::InvalidArgument(InvalidValue(item, "sort"));
    }

    auto key = ParseSortKey(parts[0]);
    if (!key) {
      throw util::InvalidArgument(InvalidValue(parts[0], "sort key"));
    }

    SortSpec spec{*key, true};
    if (parts.size() == 2) {
      if (parts[1] == "desc") {
        spec.ascending = false;
      } else if (parts[1] != "asc") {
        throw util::InvalidArgument(InvalidValue(parts[1], "sort dir"));
      }
    }
    specs.push_back(spec);
  }
  return specs;
}

std::string ListQuery::EncodeMarker(const Marker& marker) {
  receiver::manager::v1::ListMarker proto;
  for (const auto& value : marker.sort_values) {
    proto.add_sort_values(value);
  }
  proto.set_id(marker.id);

  static constexpr char kHex[] = "0123456789abcdef";
  std::string           bytes  = proto.SerializeAsString();
  std::string           out;
  out.reserve(bytes.size() * 2);
  for (unsigned char c : bytes) {
    out.push_back(kHex[(c >> 4) & 0x0F]);
    out.push_back(kHex[c & 0x0F]);
  }
  return out;
}

Marker ListQuery::DecodeMarker(const std::string& marker) {
  if (marker.empty() || marker.size() % 2 != 0) {
    throw util::InvalidArgument(InvalidValue(marker, "marker"));
  }

  std::string bytes;
  bytes.reserve(marker.size() / 2);
  for (std::size_t i = 0; i < marker.size(); i += 2) {
    int hi = HexNibble(marker[i]);
    int lo = HexNibble(marker[i + 1]);
    if (hi < 0 || lo < 0) {
      throw util::InvalidArgument(InvalidValue(marker, "marker"));
    }
    bytes.push_back(static_cast<char>((hi << 4) | lo));
  }

  receiver::manager::v1::ListMarker proto;
  if (!proto.ParseFromString(bytes) || proto.id().empty()) {
    throw util::InvalidArgument(InvalidValue(marker, "marker"));
  }

  Marker out;
  out.sort_values.assign(proto.sort_values().begin(), proto.sort_values().end());
  out.id = proto.id();
  return out;
}

uint32_t ListQuery::ResolveLimit(uint32_t requested, uint32_t default_limit, uint32_t max_limit) {
  if (requested == 0) {
    return std::min(default_limit, max_limit);
  }
  if (requested > max_limit) {
    throw util::InvalidArgument(InvalidValue(std::to_string(requested), "limit"));
  }
  return requested;
}

ListQuery::ListQuery(std::vector<SortSpec> sort, std::optional<Marker> marker, uint32_t limit)
    : sort_(std::move(sort)), marker_(std::move(marker)), limit_(limit) {
  if (marker_ && marker_->sort_values.size() != sort_.size()) {
    // a marker minted under a different sort order
    throw util::InvalidArgument(InvalidValue(EncodeMarker(*marker_), "marker"));
  }
}

std::vector<std::string> ListQuery::SortValues(const db::model::ReceiverRecord& record) const {
  std::vector<std::string> values;
  values.reserve(sort_.size());
  for (const auto& spec : sort_) {
    switch (spec.key) {
      case SortKey::kName:
        values.push_back(record.name);
        break;
      case SortKey::kType:
        values.push_back(record.type);
        break;
      case SortKey::kClusterId:
        values.push_back(record.cluster_id);
        break;
      case SortKey::kAction:
        values.push_back(record.action);
        break;
      case SortKey::kCreatedAt:
        values.push_back(PadMillis(record.created_at_ms));
        break;
      case SortKey::kUpdatedAt:
        values.push_back(PadMillis(record.updated_at_ms));
        break;
    }
  }
  return values;
}

int ListQuery::Compare(const std::vector<std::string>& lhs_values, const std::string& lhs_id, const std::vector<std::string>& rhs_values,
                       const std::string& rhs_id) const {
  for (std::size_t i = 0; i < sort_.size(); ++i) {
    int c = lhs_values[i].compare(rhs_values[i]);
    if (c != 0) {
      return sort_[i].ascending ? c : -c;
    }
  }
  return lhs_id.compare(rhs_id);
}

Page ListQuery::Apply(std::vector<db::model::ReceiverRecord> records) const {
  struct Row {
    std::vector<std::string>  values;
    db::model::ReceiverRecord record;
  };

  std::vector<Row> rows;
  rows.reserve(records.size());
  for (auto& record : records) {
    auto values = SortValues(record);
    rows.push_back(Row{std::move(values), std::move(record)});
  }

  std::sort(rows.begin(), rows.end(),
            [this](const Row& lhs, const Row& rhs) { return Compare(lhs.values, lhs.record.id, rhs.values, rhs.record.id) < 0; });

  auto begin = rows.begin();
  if (marker_) {
    begin = std::find_if(rows.begin(), rows.end(),
                         [this](const Row& row) { return Compare(row.values, row.record.id, marker_->sort_values, marker_->id) > 0; });
  }

  Page page;
  auto it = begin;
  for (; it != rows.end() && page.records.size() < limit_; ++it) {
    page.records.push_back(it->record);
  }

  if (it != rows.end() && !page.records.empty()) {
    const auto& last = *(it - 1);
    page.next_marker = EncodeMarker(Marker{last.values, last.record.id});
  }
  return page;
}

} // namespace receiver::core
