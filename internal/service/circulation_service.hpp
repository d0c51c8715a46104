#pragma once

#include <functional>
#include <string>

#include "circulation/v1.hpp"
#include "internal/core/operation_context.hpp"
#include "internal/model/transition.hpp"
#include "request_context.hpp"
#include "service_context.hpp"

namespace circulation::service {

/*
  Member-facing circulation operations.

  Writes run through the idempotency coordinator: a new key executes the
  engine operation once, emits its audit events and caches the result;
  a repeated key replays the cached result (replayed = true) or waits for
  the first attempt, bounded by the request deadline and by half of the
  in-flight lease. Failed operations
  are not cached, so a retry with the same key executes again.

  Reads go to the ledgers directly.
*/
class CirculationService {
public:
  explicit CirculationService(ServiceContext ctx);

  circulation::v1::CheckoutResponse
  Checkout(const circulation::v1::CheckoutRequest& req, const RequestContext& request);

  circulation::v1::ReturnCopyResponse
  ReturnCopy(const circulation::v1::ReturnCopyRequest& req, const RequestContext& request);

  circulation::v1::RenewResponse
  Renew(const circulation::v1::RenewRequest& req, const RequestContext& request);

  circulation::v1::ReportLostResponse
  ReportLost(const circulation::v1::ReportLostRequest& req, const RequestContext& request);

  circulation::v1::GetActiveLoanResponse
  GetActiveLoan(const circulation::v1::GetActiveLoanRequest& req);

  circulation::v1::ListLoansResponse
  ListLoans(const circulation::v1::ListLoansRequest& req);

private:
  struct Executed {
    circulation::v1::OperationResult result;
    model::Transition                transition;
  };

  struct Outcome {
    circulation::v1::OperationResult result;
    bool                             replayed = false;
  };

  // `authorize` runs before the key is consulted, so a replay is served
  // only to callers allowed to issue the request itself.
  Outcome RunIdempotent(const char* operation, const std::string& key, const std::string& fingerprint,
                        const RequestContext& request, const std::function<void()>& authorize,
                        const std::function<Executed(const core::OperationContext&)>& execute);

  void RequireLoanAccess(const std::string& loan_id, const collab::Caller& caller) const;

  util::Deadline ResolveDeadline(const RequestContext& request) const;

  ServiceContext ctx_;
};

}
