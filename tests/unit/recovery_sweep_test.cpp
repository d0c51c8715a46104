#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "config/config.pb.h"
#include "internal/core/allocation_engine.hpp"
#include "internal/factory.hpp"
#include "internal/idempotency/idempotency_coordinator.hpp"
#include "internal/maintenance/maintenance_worker.hpp"
#include "internal/maintenance/recovery_sweep.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/circulation_service.hpp"
#include "internal/service/operations.hpp"

namespace {

using circulation::idempotency::BeginStatus;
using circulation::service::RequestContext;
using namespace circulation::v1;

constexpr auto kPastLease = std::chrono::milliseconds(80);

circulation::factory::Application BuildApp() {
  circulation::runtime::config::RuntimeConfig config;
  // 50ms in-flight lease so markers become orphans quickly.
  config.mutable_idempotency()->mutable_in_flight_lease()->set_nanos(50'000'000);
  config.mutable_maintenance()->mutable_interval()->set_seconds(3600);
  auto app = circulation::factory::Build(config);

  RequestContext admin;
  admin.caller = circulation::collab::Caller{"librarian", ROLE_ADMIN};
  for (const auto* copy_id : {"C1", "C2"}) {
    RegisterCopyRequest req;
    req.set_copy_id(copy_id);
    req.set_book_id("B1");
    app.admin_service->RegisterCopy(req, admin);
  }
  return app;
}

// Runs a checkout the way the service does, then "crashes" before the
// audit and idempotency completion steps.
std::string CheckoutAndCrash(circulation::factory::Application& app, const std::string& copy_id, const std::string& key) {
  const auto fingerprint = circulation::service::CheckoutFingerprint(copy_id, "U1");
  assert(app.context.idempotency->Begin(key, circulation::service::kOpCheckout, fingerprint).status == BeginStatus::kNew);

  circulation::core::OperationContext op{circulation::collab::Caller{"U1", ROLE_MEMBER}, key};
  return app.context.engine->Checkout(copy_id, "U1", op).value.loan_id();
}

std::size_t AuditCount(circulation::factory::Application& app, const std::string& key) {
  auto tx    = app.context.repository->Begin();
  auto count = app.context.repository->ListAuditByCorrelation(*tx, key).size();
  tx->Commit();
  return count;
}

void TestCommittedOrphanIsCompletedAndAudited() {
  auto       app     = BuildApp();
  const auto loan_id = CheckoutAndCrash(app, "C1", "K1");
  assert(AuditCount(app, "K1") == 0);

  std::this_thread::sleep_for(kPastLease);
  auto report = app.recovery_sweep->Run();
  assert(report.markers_completed == 1);
  assert(report.markers_cleared == 0);
  assert(report.audit_reemitted == 2);

  auto tx    = app.context.repository->Begin();
  auto audit = app.context.repository->ListAuditByCorrelation(*tx, "K1");
  tx->Commit();
  assert(audit.size() == 2);
  for (const auto& event : audit) {
    assert(event.actor == "recovery");
  }

  // The client's retry replays the original loan.
  CheckoutRequest req;
  req.set_copy_id("C1");
  req.set_user_id("U1");
  req.set_idempotency_key("K1");
  RequestContext member;
  member.caller = circulation::collab::Caller{"U1", ROLE_MEMBER};
  auto resp     = app.circulation_service->Checkout(req, member);
  assert(resp.replayed());
  assert(resp.loan().loan_id() == loan_id);

  // A second sweep finds nothing left to do.
  auto again = app.recovery_sweep->Run();
  assert(again.markers_completed == 0);
  assert(again.audit_reemitted == 0);
  assert(AuditCount(app, "K1") == 2);
}

void TestUncommittedOrphanIsCleared() {
  auto app = BuildApp();

  const auto fingerprint = circulation::service::CheckoutFingerprint("C2", "U1");
  assert(app.context.idempotency->Begin("K2", circulation::service::kOpCheckout, fingerprint).status == BeginStatus::kNew);

  std::this_thread::sleep_for(kPastLease);
  auto report = app.recovery_sweep->Run();
  assert(report.markers_cleared == 1);
  assert(report.markers_completed == 0);

  assert(app.context.idempotency->Begin("K2", circulation::service::kOpCheckout, fingerprint).status == BeginStatus::kNew);
}

void TestLateCompletionAfterSweepStillReplays() {
  auto app = BuildApp();

  // The operation is still running when its marker outlives the lease.
  const auto fingerprint = circulation::service::CheckoutFingerprint("C2", "U1");
  assert(app.context.idempotency->Begin("K5", circulation::service::kOpCheckout, fingerprint).status == BeginStatus::kNew);
  std::this_thread::sleep_for(kPastLease);
  assert(app.recovery_sweep->Run().markers_cleared == 1);

  circulation::core::OperationContext op{circulation::collab::Caller{"U1", ROLE_MEMBER}, "K5"};
  auto                                committed = app.context.engine->Checkout("C2", "U1", op);
  OperationResult                     result;
  *result.mutable_loan() = committed.value;
  app.context.idempotency->Complete("K5", circulation::service::kOpCheckout, fingerprint, result.SerializeAsString());

  CheckoutRequest req;
  req.set_copy_id("C2");
  req.set_user_id("U1");
  req.set_idempotency_key("K5");
  RequestContext member;
  member.caller = circulation::collab::Caller{"U1", ROLE_MEMBER};
  auto resp     = app.circulation_service->Checkout(req, member);
  assert(resp.replayed());
  assert(resp.loan().loan_id() == committed.value.loan_id());
}

void TestAuditAlreadyEmittedIsNotDuplicated() {
  auto app = BuildApp();

  CheckoutRequest req;
  req.set_copy_id("C2");
  req.set_user_id("U1");
  req.set_idempotency_key("K3");
  RequestContext member;
  member.caller = circulation::collab::Caller{"U1", ROLE_MEMBER};
  app.circulation_service->Checkout(req, member);
  assert(AuditCount(app, "K3") == 2);

  auto report = app.recovery_sweep->Run();
  assert(report.audit_reemitted == 0);
  assert(report.markers_completed == 0);
  assert(AuditCount(app, "K3") == 2);
}

void TestWorkerSweepsOnStart() {
  auto app = BuildApp();
  CheckoutAndCrash(app, "C1", "K4");
  std::this_thread::sleep_for(kPastLease);

  app.maintenance_worker->Start();
  app.maintenance_worker->Stop();

  const auto fingerprint = circulation::service::CheckoutFingerprint("C1", "U1");
  auto       outcome     = app.context.idempotency->Begin("K4", circulation::service::kOpCheckout, fingerprint);
  assert(outcome.status == BeginStatus::kDuplicateCompleted);

  OperationResult result;
  assert(result.ParseFromString(outcome.result));
  assert(result.has_loan());
  assert(result.loan().copy_id() == "C1");
}

} // namespace

int main() {
  TestCommittedOrphanIsCompletedAndAudited();
  TestUncommittedOrphanIsCleared();
  TestLateCompletionAfterSweepStillReplays();
  TestAuditAlreadyEmittedIsNotDuplicated();
  TestWorkerSweepsOnStart();

  std::cout << "circulation_unit_recovery_sweep: pass\n";
  return 0;
}
