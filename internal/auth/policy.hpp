#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/auth/request_context.hpp"

namespace receiver::auth {

/*
  Static role -> permission table.

  Roles are ordered: reader < member < admin. A caller satisfies a permission
  when its highest role is at least the permission's minimum role. Permissions
  missing from the table are admin-only.
*/

enum class Role : std::uint8_t {
  kReader = 0,
  kMember = 1,
  kAdmin  = 2,
};

enum class Permission {
  kListReceivers,
  kGetReceiver,
  kCreateReceiver,
  kDeleteReceiver,
  kListGlobalProject,
  kGetAction,
};

std::optional<Role> RoleFromString(std::string_view value);
std::string_view    ToString(Permission permission);

// Highest recognized role of the caller, if any.
std::optional<Role> HighestRole(const RequestContext& ctx);

bool IsAllowed(const RequestContext& ctx, Permission permission);

// Throws util::Forbidden when the caller lacks the permission.
void Enforce(const RequestContext& ctx, Permission permission);

} // namespace receiver::auth
