#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/auth/policy.hpp"
#include "internal/cluster/cluster_registry.hpp"
#include "internal/util/errors.hpp"

namespace {

using receiver::auth::Permission;
using receiver::auth::RequestContext;
using receiver::auth::Role;

RequestContext Context(const std::string& user, const std::string& project, std::vector<std::string> roles) {
  RequestContext ctx;
  ctx.user    = user;
  ctx.project = project;
  ctx.roles   = std::move(roles);
  return ctx;
}

void TestHighestRoleWins() {
  assert(receiver::auth::HighestRole(Context("a", "p", {"reader", "admin", "member"})) == Role::kAdmin);
  assert(receiver::auth::HighestRole(Context("a", "p", {"auditor", "reader"})) == Role::kReader);
  assert(!receiver::auth::HighestRole(Context("a", "p", {"auditor"})).has_value());
}

void TestPermissionTable() {
  const auto reader = Context("bob", "web", {"reader"});
  const auto member = Context("alice", "web", {"member"});
  const auto admin  = Context("root", "ops", {"admin"});
  const auto nobody = Context("eve", "web", {});

  assert(receiver::auth::IsAllowed(reader, Permission::kListReceivers));
  assert(receiver::auth::IsAllowed(reader, Permission::kGetReceiver));
  assert(receiver::auth::IsAllowed(reader, Permission::kGetAction));
  assert(!receiver::auth::IsAllowed(reader, Permission::kCreateReceiver));
  assert(!receiver::auth::IsAllowed(reader, Permission::kDeleteReceiver));

  assert(receiver::auth::IsAllowed(member, Permission::kCreateReceiver));
  assert(receiver::auth::IsAllowed(member, Permission::kDeleteReceiver));
  assert(!receiver::auth::IsAllowed(member, Permission::kListGlobalProject));

  assert(receiver::auth::IsAllowed(admin, Permission::kListGlobalProject));
  assert(!receiver::auth::IsAllowed(nobody, Permission::kListReceivers));

  bool threw = false;
  try {
    receiver::auth::Enforce(reader, Permission::kCreateReceiver);
  } catch (const receiver::util::Forbidden& e) {
    threw = std::string(e.what()).find("receivers:create") != std::string::npos;
  }
  assert(threw);
}

void TestClusterResolution() {
  receiver::cluster::StaticClusterRegistry registry({
      {"c-web", "frontend", "web"},
      {"c-ops", "frontend", "ops"},
      {"c-batch", "batch", "ops"},
  });

  const auto alice = Context("alice", "web", {"member"});
  const auto admin = Context("root", "ops", {"admin"});

  assert(registry.Resolve("c-web", alice)->name == "frontend");
  assert(registry.Resolve("frontend", alice)->id == "c-web");
  // other projects are invisible by id and by name
  assert(!registry.Resolve("c-batch", alice).has_value());
  assert(!registry.Resolve("batch", alice).has_value());
  assert(registry.Resolve("batch", admin)->id == "c-batch");

  bool threw = false;
  try {
    (void)registry.Resolve("frontend", admin);
  } catch (const receiver::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  assert(registry.Get("c-batch").has_value());
  assert(registry.Remove("c-batch"));
  assert(!registry.Remove("c-batch"));
  assert(!registry.Get("c-batch").has_value());
}

} // namespace

int main() {
  TestHighestRoleWins();
  TestPermissionTable();
  TestClusterResolution();

  std::cout << "receiver_manager_unit_auth_policy: pass\n";
  return 0;
}
