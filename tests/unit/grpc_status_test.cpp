#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "circulation/v1.hpp"
#include "config/config.pb.h"
#include "internal/factory.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/circulation_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/service/admin_service.hpp"

namespace {

using namespace circulation::v1;
using ::grpc::StatusCode;

circulation::factory::Application BuildApp() {
  auto app = circulation::factory::Build(circulation::runtime::config::RuntimeConfig{});

  circulation::service::RequestContext admin;
  admin.caller = circulation::collab::Caller{"librarian", ROLE_ADMIN};
  RegisterCopyRequest req;
  req.set_copy_id("C1");
  req.set_book_id("B1");
  app.admin_service->RegisterCopy(req, admin);
  return app;
}

void TestErrorMapping() {
  namespace util = circulation::util;
  assert(circulation::grpc::ToStatus(util::NotFound("x")).error_code() == StatusCode::NOT_FOUND);
  assert(circulation::grpc::ToStatus(util::AlreadyExists("x")).error_code() == StatusCode::ALREADY_EXISTS);
  assert(circulation::grpc::ToStatus(util::Conflict("x")).error_code() == StatusCode::FAILED_PRECONDITION);
  assert(circulation::grpc::ToStatus(util::KeyReuseMismatch("x")).error_code() == StatusCode::FAILED_PRECONDITION);
  assert(circulation::grpc::ToStatus(util::Forbidden("x")).error_code() == StatusCode::PERMISSION_DENIED);
  assert(circulation::grpc::ToStatus(util::Timeout("x")).error_code() == StatusCode::DEADLINE_EXCEEDED);
  assert(circulation::grpc::ToStatus(util::InvalidArgument("x")).error_code() == StatusCode::INVALID_ARGUMENT);
  assert(circulation::grpc::ToStatus(util::Internal("x")).error_code() == StatusCode::INTERNAL);
  assert(circulation::grpc::ToStatus(std::runtime_error("x")).error_code() == StatusCode::INTERNAL);

  const auto status = circulation::grpc::ToStatus(util::NotFound("copy C9 not found"));
  assert(status.error_message() == "copy C9 not found");
}

void TestCheckoutThroughServer() {
  auto app = BuildApp();
  circulation::grpc::CirculationServer server(app.circulation_service);

  CheckoutRequest req;
  req.set_copy_id("C1");
  req.set_user_id("U1");
  req.set_idempotency_key("K1");
  CheckoutResponse      resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.Checkout(&grpc_ctx, &req, &resp);
  assert(status.ok());
  assert(resp.loan().copy_id() == "C1");
  assert(resp.loan().user_id() == "U1");
  assert(!resp.replayed());

  // Same copy under a new key is a conflict.
  CheckoutRequest second = req;
  second.set_user_id("U2");
  second.set_idempotency_key("K2");
  CheckoutResponse      second_resp;
  ::grpc::ServerContext second_ctx;
  assert(server.Checkout(&second_ctx, &second, &second_resp).error_code() == StatusCode::FAILED_PRECONDITION);
}

void TestMissingLoanReturnsNotFound() {
  auto app = BuildApp();
  circulation::grpc::CirculationServer server(app.circulation_service);

  GetActiveLoanRequest  req;
  req.set_copy_id("C1");
  GetActiveLoanResponse resp;
  ::grpc::ServerContext grpc_ctx;
  assert(server.GetActiveLoan(&grpc_ctx, &req, &resp).error_code() == StatusCode::NOT_FOUND);
}

void TestMissingKeyReturnsInvalidArgument() {
  auto app = BuildApp();
  circulation::grpc::CirculationServer server(app.circulation_service);

  CheckoutRequest req;
  req.set_copy_id("C1");
  req.set_user_id("U1");
  CheckoutResponse      resp;
  ::grpc::ServerContext grpc_ctx;
  assert(server.Checkout(&grpc_ctx, &req, &resp).error_code() == StatusCode::INVALID_ARGUMENT);
}

void TestAdminCallWithoutRoleIsDenied() {
  auto app = BuildApp();
  circulation::grpc::AdminServer server(app.admin_service);

  RegisterCopyRequest req;
  req.set_copy_id("C2");
  req.set_book_id("B1");
  RegisterCopyResponse  resp;
  ::grpc::ServerContext grpc_ctx;
  assert(server.RegisterCopy(&grpc_ctx, &req, &resp).error_code() == StatusCode::PERMISSION_DENIED);

  StatsRequest          stats_req;
  StatsResponse         stats_resp;
  ::grpc::ServerContext stats_ctx;
  assert(server.Stats(&stats_ctx, &stats_req, &stats_resp).error_code() == StatusCode::PERMISSION_DENIED);
}

} // namespace

int main() {
  TestErrorMapping();
  TestCheckoutThroughServer();
  TestMissingLoanReturnsNotFound();
  TestMissingKeyReturnsInvalidArgument();
  TestAdminCallWithoutRoleIsDenied();

  std::cout << "circulation_unit_grpc_status: pass\n";
  return 0;
}
