#include "internal/auth/policy.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace receiver::auth {

namespace {

struct PermissionRule {
  Permission permission;
  Role       minimum_role;
};

constexpr PermissionRule kPermissionTable[] = {
    {Permission::kListReceivers, Role::kReader},
    {Permission::kGetReceiver, Role::kReader},
    {Permission::kGetAction, Role::kReader},
    {Permission::kCreateReceiver, Role::kMember},
    {Permission::kDeleteReceiver, Role::kMember},
    {Permission::kListGlobalProject, Role::kAdmin},
};

Role MinimumRole(Permission permission) {
  for (const auto& rule : kPermissionTable) {
    if (rule.permission == permission) {
      return rule.minimum_role;
    }
  }
  return Role::kAdmin;
}

} // namespace

std::optional<Role> RoleFromString(std::string_view value) {
  if (value == "reader") return Role::kReader;
  if (value == "member") return Role::kMember;
  if (value == "admin") return Role::kAdmin;
  return std::nullopt;
}

std::string_view ToString(Permission permission) {
  switch (permission) {
    case Permission::kListReceivers:
      return "receivers:list";
    case Permission::kGetReceiver:
      return "receivers:get";
    case Permission::kCreateReceiver:
      return "receivers:create";
    case Permission::kDeleteReceiver:
      return "receivers:delete";
    case Permission::kListGlobalProject:
      return "receivers:global_project";
    case Permission::kGetAction:
      return "actions:get";
  }
  return "unknown";
}

std::optional<Role> HighestRole(const RequestContext& ctx) {
  std::optional<Role> highest;
  for (const auto& name : ctx.roles) {
    const auto role = RoleFromString(name);
    if (role && (!highest || *role > *highest)) {
      highest = role;
    }
  }
  return highest;
}

bool IsAllowed(const RequestContext& ctx, Permission permission) {
  const auto role = HighestRole(ctx);
  return role.has_value() && *role >= MinimumRole(permission);
}

void Enforce(const RequestContext& ctx, Permission permission) {
  if (!IsAllowed(ctx, permission)) {
    throw util::Forbidden("user '" + ctx.user + "' is not allowed to perform '" + std::string(ToString(permission)) + "'");
  }
}

} // namespace receiver::auth
