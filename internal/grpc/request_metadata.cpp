#include "request_metadata.hpp"

#include <chrono>

namespace circulation::grpc {

namespace {

std::string Metadata(const ::grpc::ServerContext* context, const char* key) {
  const auto& metadata = context->client_metadata();
  auto        it       = metadata.find(key);
  if (it == metadata.end()) {
    return {};
  }
  return std::string(it->second.data(), it->second.size());
}

} // namespace

service::RequestContext FromServerContext(const ::grpc::ServerContext* context, const std::string& fallback_user_id) {
  service::RequestContext request;
  request.caller.user_id = fallback_user_id;
  request.caller.role    = circulation::v1::ROLE_MEMBER;

  if (context == nullptr) {
    return request;
  }

  auto user_id = Metadata(context, kUserIdHeader);
  if (!user_id.empty()) {
    request.caller.user_id = std::move(user_id);
  }
  if (Metadata(context, kUserRoleHeader) == "admin") {
    request.caller.role = circulation::v1::ROLE_ADMIN;
  }

  // gRPC reports "no deadline" as the maximum system_clock time point.
  const auto deadline = context->deadline();
  if (deadline != std::chrono::system_clock::time_point::max()) {
    const auto remaining = deadline - std::chrono::system_clock::now();
    request.deadline     = std::chrono::steady_clock::now() + std::chrono::duration_cast<std::chrono::steady_clock::duration>(remaining);
  }
  return request;
}

} // namespace circulation::grpc
