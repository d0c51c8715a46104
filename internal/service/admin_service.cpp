#include "admin_service.hpp"

#include "internal/audit/audit_emitter.hpp"
#include "internal/core/allocation_engine.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/ledger/loan_ledger.hpp"
#include "internal/ledger/resource_ledger.hpp"
#include "internal/model/proto_convert.hpp"
#include "internal/model/transition.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"

namespace circulation::service {

using namespace circulation::v1;

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

core::OperationContext AdminService::ContextFor(const RequestContext& request) const {
  core::OperationContext op;
  op.caller   = request.caller;
  op.deadline = request.deadline ? *request.deadline : util::DeadlineAfter(ctx_.default_timeout);
  return op;
}

RegisterCopyResponse AdminService::RegisterCopy(const RegisterCopyRequest& req, const RequestContext& request) {
  return ObserveRpc("AdminService.RegisterCopy", [&] {
    if (req.copy_id().empty() || req.book_id().empty()) {
      throw util::InvalidArgument("copy_id and book_id are required");
    }

    auto committed = ctx_.engine->RegisterCopy(req.copy_id(), req.book_id(), ContextFor(request));
    ctx_.audit->RecordTransition(committed.transition, request.caller.user_id, committed.transition.transition_id);

    RegisterCopyResponse resp;
    *resp.mutable_copy() = std::move(committed.value);
    return resp;
  });
}

RetireCopyResponse AdminService::RetireCopy(const RetireCopyRequest& req, const RequestContext& request) {
  return ObserveRpc("AdminService.RetireCopy", [&] {
    if (req.copy_id().empty()) {
      throw util::InvalidArgument("copy_id is required");
    }

    auto committed = ctx_.engine->RetireCopy(req.copy_id(), ContextFor(request));
    ctx_.audit->RecordTransition(committed.transition, request.caller.user_id, committed.transition.transition_id);

    RetireCopyResponse resp;
    *resp.mutable_copy() = std::move(committed.value);
    return resp;
  });
}

GetCopyResponse AdminService::GetCopy(const GetCopyRequest& req, const RequestContext& request) {
  return ObserveRpc("AdminService.GetCopy", [&] {
    collab::RequireAdmin(request.caller, "get copy");

    auto tx   = ctx_.repository->Begin();
    auto copy = ctx_.resources->GetCopy(*tx, req.copy_id());
    tx->Commit();

    GetCopyResponse resp;
    *resp.mutable_copy() = model::ToProto(copy);
    return resp;
  });
}

GetLoanHistoryResponse AdminService::GetLoanHistory(const GetLoanHistoryRequest& req, const RequestContext& request) {
  return ObserveRpc("AdminService.GetLoanHistory", [&] {
    collab::RequireAdmin(request.caller, "get loan history");

    auto tx   = ctx_.repository->Begin();
    auto loan = ctx_.loans->Get(*tx, req.loan_id());
    if (!loan) {
      throw util::NotFound("loan not found: " + req.loan_id());
    }
    auto events = ctx_.loans->History(*tx, req.loan_id());
    tx->Commit();

    GetLoanHistoryResponse resp;
    for (const auto& event : events) {
      *resp.add_events() = model::ToProto(event);
    }
    return resp;
  });
}

ListAuditEventsResponse AdminService::ListAuditEvents(const ListAuditEventsRequest& req, const RequestContext& request) {
  return ObserveRpc("AdminService.ListAuditEvents", [&] {
    collab::RequireAdmin(request.caller, "list audit events");

    if (req.entity_type() != model::kEntityLoan && req.entity_type() != model::kEntityCopy) {
      throw util::InvalidArgument("entity_type must be \"" + std::string(model::kEntityLoan) + "\" or \"" +
                                  std::string(model::kEntityCopy) + "\"");
    }

    auto tx      = ctx_.repository->Begin();
    auto records = ctx_.repository->ListAuditByEntity(*tx, req.entity_type(), req.entity_id());
    tx->Commit();

    ListAuditEventsResponse resp;
    for (const auto& record : records) {
      *resp.add_events() = model::ToProto(record);
    }
    return resp;
  });
}

StatsResponse AdminService::Stats(const StatsRequest&, const RequestContext& request) {
  return ObserveRpc("AdminService.Stats", [&] {
    collab::RequireAdmin(request.caller, "stats");

    auto       tx      = ctx_.repository->Begin();
    const auto records = ctx_.resources->List(*tx);
    tx->Commit();

    uint64_t available = 0;
    uint64_t loaned    = 0;
    uint64_t lost      = 0;
    uint64_t retired   = 0;
    for (const auto& record : records) {
      if (record.status == COPY_STATUS_AVAILABLE) {
        ++available;
      } else if (record.status == COPY_STATUS_LOANED) {
        ++loaned;
      } else if (record.status == COPY_STATUS_LOST) {
        ++lost;
      } else if (record.status == COPY_STATUS_RETIRED) {
        ++retired;
      }
    }

    StatsResponse resp;
    resp.set_copies_available(available);
    resp.set_copies_loaned(loaned);
    resp.set_copies_lost(lost);
    resp.set_copies_retired(retired);
    resp.set_pending_audit_events(ctx_.audit->PendingGaps());
    return resp;
  });
}

} // namespace circulation::service
