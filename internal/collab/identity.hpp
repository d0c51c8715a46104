#pragma once

#include <string>

#include "circulation/v1/types.pb.h"
#include "internal/util/errors.hpp"

namespace circulation::collab {

// Authenticated caller of one request. The core trusts it as given.
struct Caller {
  std::string           user_id;
  circulation::v1::Role role = circulation::v1::ROLE_MEMBER;

  bool IsAdmin() const {
    return role == circulation::v1::ROLE_ADMIN;
  }
};

inline Caller SystemCaller() {
  return Caller{"system", circulation::v1::ROLE_ADMIN};
}

inline void RequireAdmin(const Caller& caller, const std::string& operation) {
  if (!caller.IsAdmin()) {
    throw util::Forbidden(operation + " requires the admin role");
  }
}

// Members act only for themselves; admins may act for anyone.
inline void RequireActingFor(const Caller& caller, const std::string& user_id) {
  if (!caller.IsAdmin() && caller.user_id != user_id) {
    throw util::Forbidden("caller may not act for user " + user_id);
  }
}

} // namespace circulation::collab
