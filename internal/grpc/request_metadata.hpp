#pragma once

#include <string>

#include <grpcpp/grpcpp.h>

#include "internal/service/request_context.hpp"

namespace circulation::grpc {

inline constexpr const char* kUserIdHeader   = "x-user-id";
inline constexpr const char* kUserRoleHeader = "x-user-role";

/*
  Builds the caller identity and deadline of one call.

  The caller is read from the x-user-id / x-user-role metadata set by the
  fronting gateway; role "admin" maps to ROLE_ADMIN, anything else to
  ROLE_MEMBER. Without x-user-id the caller is the request's own user id
  (fallback_user_id) acting as a member.
*/
service::RequestContext FromServerContext(const ::grpc::ServerContext* context, const std::string& fallback_user_id);

} // namespace circulation::grpc
