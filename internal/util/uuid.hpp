#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace receiver::util {

/*
  UUID helpers

  Receiver, trust and action ids are RFC4122 version 4 UUIDs in canonical
  36 character text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

// GenerateUUID() rendered as text.
std::string NewId();

bool LooksLikeUUID(const std::string& str);

} // namespace receiver::util
