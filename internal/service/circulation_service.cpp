#include "circulation_service.hpp"

#include <algorithm>

#include "internal/audit/audit_emitter.hpp"
#include "internal/core/allocation_engine.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/idempotency/idempotency_coordinator.hpp"
#include "internal/ledger/loan_ledger.hpp"
#include "internal/model/proto_convert.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"
#include "operations.hpp"

namespace circulation::service {

using namespace circulation::v1;
using observability::StringField;

namespace {

void RequireArgument(const std::string& value, const char* name) {
  if (value.empty()) {
    throw util::InvalidArgument(std::string(name) + " is required");
  }
}

void RequireCase(const OperationResult& result, OperationResult::ResultCase expected) {
  if (result.result_case() != expected) {
    throw std::runtime_error("cached idempotency result has an unexpected shape");
  }
}

} // namespace

CirculationService::CirculationService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

// Unknown loans pass; the engine reports them as NotFound.
void CirculationService::RequireLoanAccess(const std::string& loan_id, const collab::Caller& caller) const {
  if (caller.IsAdmin()) {
    return;
  }
  auto tx   = ctx_.repository->Begin();
  auto loan = ctx_.loans->Get(*tx, loan_id);
  tx->Commit();
  if (loan && loan->user_id != caller.user_id) {
    throw util::Forbidden("loan " + loan_id + " belongs to another user");
  }
}

util::Deadline CirculationService::ResolveDeadline(const RequestContext& request) const {
  const auto requested = request.deadline ? *request.deadline : util::DeadlineAfter(ctx_.default_timeout);
  // The marker must still be live when the operation completes it.
  return std::min(requested, util::DeadlineAfter(ctx_.in_flight_lease / 2));
}

CirculationService::Outcome CirculationService::RunIdempotent(const char* operation, const std::string& key, const std::string& fingerprint,
                                                              const RequestContext& request, const std::function<void()>& authorize,
                                                              const std::function<Executed(const core::OperationContext&)>& execute) {
  RequireArgument(key, "idempotency_key");
  authorize();
  const auto deadline = ResolveDeadline(request);

  auto begun = ctx_.idempotency->Begin(key, operation, fingerprint);
  if (begun.status == idempotency::BeginStatus::kDuplicateInFlight) {
    begun = ctx_.idempotency->AwaitResolution(key, operation, fingerprint, deadline);
  }

  switch (begun.status) {
    case idempotency::BeginStatus::kKeyReuseMismatch:
      throw util::KeyReuseMismatch("idempotency key " + key + " was already used for a different request");

    case idempotency::BeginStatus::kDuplicateCompleted: {
      Outcome outcome;
      if (!outcome.result.ParseFromString(begun.result)) {
        throw std::runtime_error("cached idempotency result for key " + key + " is unreadable");
      }
      outcome.replayed = true;
      return outcome;
    }

    case idempotency::BeginStatus::kNew:
      break;

    case idempotency::BeginStatus::kDuplicateInFlight:
      throw util::Timeout("request with this idempotency key is still in progress");
  }

  const core::OperationContext op{request.caller, key, deadline};

  Executed executed;
  try {
    executed = execute(op);
  } catch (const std::exception&) {
    try {
      ctx_.idempotency->Abort(key);
    } catch (const std::exception& abort_error) {
      // The stale marker is cleared by the recovery sweep.
      CIRCULATION_LOG_ERROR("idempotency abort failed", {StringField("key", key), StringField("error", abort_error.what())});
    }
    throw;
  }

  ctx_.audit->RecordTransition(executed.transition, request.caller.user_id, key);

  try {
    ctx_.idempotency->Complete(key, operation, fingerprint, executed.result.SerializeAsString());
  } catch (const std::exception& e) {
    // The transition is committed; the recovery sweep completes the marker
    // from the loan event later.
    CIRCULATION_LOG_ERROR("idempotency completion failed", {StringField("key", key), StringField("error", e.what())});
  }

  return Outcome{std::move(executed.result), false};
}

CheckoutResponse CirculationService::Checkout(const CheckoutRequest& req, const RequestContext& request) {
  return ObserveRpc("CirculationService.Checkout", [&] {
    auto outcome = RunIdempotent(kOpCheckout, req.idempotency_key(), CheckoutFingerprint(req.copy_id(), req.user_id()), request,
                                 [&] { collab::RequireActingFor(request.caller, req.user_id()); },
                                 [&](const core::OperationContext& op) {
                                   auto     committed = ctx_.engine->Checkout(req.copy_id(), req.user_id(), op);
                                   Executed executed;
                                   *executed.result.mutable_loan() = std::move(committed.value);
                                   executed.transition             = std::move(committed.transition);
                                   return executed;
                                 });
    RequireCase(outcome.result, OperationResult::kLoan);

    CheckoutResponse resp;
    *resp.mutable_loan() = outcome.result.loan();
    resp.set_replayed(outcome.replayed);
    return resp;
  });
}

ReturnCopyResponse CirculationService::ReturnCopy(const ReturnCopyRequest& req, const RequestContext& request) {
  return ObserveRpc("CirculationService.ReturnCopy", [&] {
    auto outcome = RunIdempotent(kOpReturn, req.idempotency_key(), ReturnFingerprint(req.copy_id(), req.user_id()), request,
                                 [&] { collab::RequireActingFor(request.caller, req.user_id()); },
                                 [&](const core::OperationContext& op) {
                                   auto     committed = ctx_.engine->ReturnCopy(req.copy_id(), req.user_id(), op);
                                   Executed executed;
                                   *executed.result.mutable_receipt() = std::move(committed.value);
                                   executed.transition                = std::move(committed.transition);
                                   return executed;
                                 });
    RequireCase(outcome.result, OperationResult::kReceipt);

    ReturnCopyResponse resp;
    *resp.mutable_receipt() = outcome.result.receipt();
    resp.set_replayed(outcome.replayed);
    return resp;
  });
}

RenewResponse CirculationService::Renew(const RenewRequest& req, const RequestContext& request) {
  return ObserveRpc("CirculationService.Renew", [&] {
    auto outcome = RunIdempotent(kOpRenew, req.idempotency_key(), RenewFingerprint(req.loan_id()), request,
                                 [&] { RequireLoanAccess(req.loan_id(), request.caller); },
                                 [&](const core::OperationContext& op) {
                                   auto     committed = ctx_.engine->Renew(req.loan_id(), op);
                                   Executed executed;
                                   *executed.result.mutable_renewal() = std::move(committed.value);
                                   executed.transition                = std::move(committed.transition);
                                   return executed;
                                 });
    RequireCase(outcome.result, OperationResult::kRenewal);

    RenewResponse resp;
    *resp.mutable_renewal() = outcome.result.renewal();
    resp.set_replayed(outcome.replayed);
    return resp;
  });
}

ReportLostResponse CirculationService::ReportLost(const ReportLostRequest& req, const RequestContext& request) {
  return ObserveRpc("CirculationService.ReportLost", [&] {
    auto outcome = RunIdempotent(kOpReportLost, req.idempotency_key(), ReportLostFingerprint(req.copy_id()), request,
                                 [&] { collab::RequireAdmin(request.caller, "report lost"); },
                                 [&](const core::OperationContext& op) {
                                   auto     committed = ctx_.engine->ReportLost(req.copy_id(), op);
                                   Executed executed;
                                   *executed.result.mutable_loss_report() = std::move(committed.value);
                                   executed.transition                    = std::move(committed.transition);
                                   return executed;
                                 });
    RequireCase(outcome.result, OperationResult::kLossReport);

    ReportLostResponse resp;
    *resp.mutable_report() = outcome.result.loss_report();
    resp.set_replayed(outcome.replayed);
    return resp;
  });
}

GetActiveLoanResponse CirculationService::GetActiveLoan(const GetActiveLoanRequest& req) {
  return ObserveRpc("CirculationService.GetActiveLoan", [&] {
    RequireArgument(req.copy_id(), "copy_id");

    auto tx     = ctx_.repository->Begin();
    auto active = ctx_.loans->ActiveForCopy(*tx, req.copy_id());
    tx->Commit();
    if (!active) {
      throw util::NotFound("no active loan for copy " + req.copy_id());
    }

    GetActiveLoanResponse resp;
    *resp.mutable_loan() = model::ToProto(*active);
    return resp;
  });
}

ListLoansResponse CirculationService::ListLoans(const ListLoansRequest& req) {
  return ObserveRpc("CirculationService.ListLoans", [&] {
    RequireArgument(req.user_id(), "user_id");

    auto tx    = ctx_.repository->Begin();
    auto loans = ctx_.loans->ListForUser(*tx, req.user_id());
    tx->Commit();

    ListLoansResponse resp;
    for (const auto& loan : loans) {
      *resp.add_loans() = model::ToProto(loan);
    }
    return resp;
  });
}

} // namespace circulation::service
