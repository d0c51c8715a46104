#pragma once

#include "circulation/v1.hpp"
#include "internal/core/operation_context.hpp"
#include "request_context.hpp"
#include "service_context.hpp"

namespace circulation::service {

/*
  Operator surface: copy inventory, history and audit inspection.

  RegisterCopy and RetireCopy change state through the allocation engine
  and are audited like member operations; they are not idempotent because
  repeating them is already safe (AlreadyExists / Conflict).

  Every operation requires the admin role.
*/
class AdminService {
public:
  explicit AdminService(ServiceContext ctx);

  circulation::v1::RegisterCopyResponse
  RegisterCopy(const circulation::v1::RegisterCopyRequest& req, const RequestContext& request);

  circulation::v1::RetireCopyResponse
  RetireCopy(const circulation::v1::RetireCopyRequest& req, const RequestContext& request);

  circulation::v1::GetCopyResponse
  GetCopy(const circulation::v1::GetCopyRequest& req, const RequestContext& request);

  circulation::v1::GetLoanHistoryResponse
  GetLoanHistory(const circulation::v1::GetLoanHistoryRequest& req, const RequestContext& request);

  circulation::v1::ListAuditEventsResponse
  ListAuditEvents(const circulation::v1::ListAuditEventsRequest& req, const RequestContext& request);

  circulation::v1::StatsResponse
  Stats(const circulation::v1::StatsRequest& req, const RequestContext& request);

private:
  core::OperationContext ContextFor(const RequestContext& request) const;

  ServiceContext ctx_;
};

}
