#pragma once

#include <algorithm>
#include <string>
#include <vector>

namespace receiver::auth {

/*
  Authenticated caller of an API request, as resolved by the identity service.
*/
struct RequestContext {
  std::string              user;
  std::string              project;
  std::string              domain;
  std::vector<std::string> roles;

  // Correlation id of the request being served (x-request-id).
  std::string request_id;

  bool HasRole(const std::string& role) const {
    return std::find(roles.begin(), roles.end(), role) != roles.end();
  }

  bool IsAdmin() const {
    return HasRole("admin");
  }
};

} // namespace receiver::auth
