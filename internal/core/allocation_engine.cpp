#include "allocation_engine.hpp"

#include <algorithm>

#include "internal/collab/catalog.hpp"
#include "internal/collab/user_directory.hpp"
#include "internal/db/api/throw_if_error.hpp"
#include "internal/ledger/loan_ledger.hpp"
#include "internal/ledger/resource_ledger.hpp"
#include "internal/model/circulation_state.hpp"
#include "internal/model/proto_convert.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace circulation::core {

using namespace circulation::v1;

using collab::RequireActingFor;
using collab::RequireAdmin;

namespace {

constexpr const char* kCopyNotAvailable = "copy not available";

void RequireArgument(const std::string& value, const char* name) {
  if (value.empty()) {
    throw util::InvalidArgument(std::string(name) + " is required");
  }
}

std::unique_lock<std::timed_mutex> LockCopy(std::timed_mutex& mutex, util::Deadline deadline, const std::string& copy_id) {
  std::unique_lock<std::timed_mutex> lock(mutex, std::defer_lock);
  if (deadline == util::Deadline::max()) {
    lock.lock();
    return lock;
  }
  if (!lock.try_lock_until(deadline)) {
    throw util::Timeout("timed out waiting for copy " + copy_id);
  }
  return lock;
}

model::Transition TransitionOf(const char* kind, const db::model::LoanRecord& loan, const std::string& transition_id) {
  db::model::LoanEventRecord event;
  event.kind          = kind;
  event.loan          = loan;
  event.transition_id = transition_id;
  return model::TransitionFor(event);
}

model::Transition CopyTransition(const std::string& copy_id, CopyStatus from, CopyStatus to, const std::string& transition_id) {
  model::Transition transition;
  transition.transition_id = transition_id;
  transition.changes.push_back(model::EntityChange{model::kEntityCopy, copy_id, model::StateName(from), model::StateName(to)});
  return transition;
}

} // namespace

AllocationEngine::AllocationEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<ledger::ResourceLedger> resources,
                                   std::shared_ptr<ledger::LoanLedger> loans, std::shared_ptr<collab::Catalog> catalog,
                                   std::shared_ptr<collab::UserDirectory> users, Options options)
    : repository_(std::move(repository)),
      resources_(std::move(resources)),
      loans_(std::move(loans)),
      catalog_(std::move(catalog)),
      users_(std::move(users)),
      options_(options) {
}

std::shared_ptr<std::timed_mutex> AllocationEngine::CopyMutex(const std::string& copy_id) {
  std::lock_guard<std::mutex> lock(copy_mutexes_guard_);
  auto&                       copy_mutex = copy_mutexes_[copy_id];
  if (!copy_mutex) {
    copy_mutex = std::make_shared<std::timed_mutex>();
  }
  return copy_mutex;
}

std::size_t AllocationEngine::TrackedCopyLocks() const {
  std::lock_guard<std::mutex> lock(copy_mutexes_guard_);
  return copy_mutexes_.size();
}

void AllocationEngine::RequireCopy(const std::string& copy_id) const {
  if (!catalog_->CopyExists(copy_id)) {
    throw util::NotFound("copy " + copy_id + " not found");
  }
}

void AllocationEngine::RunTransaction(const std::string& conflict_message, const std::function<void(db::Transaction&)>& body) {
  auto tx = repository_->Begin();
  body(*tx);
  try {
    tx->Commit();
  } catch (const db::CommitConflict& e) {
    CIRCULATION_LOG_WARN("transaction lost a commit race", {observability::StringField("error", e.what())});
    throw util::Conflict(conflict_message);
  }
}

Committed<Loan> AllocationEngine::Checkout(const std::string& copy_id, const std::string& user_id, const OperationContext& op) {
  RequireArgument(copy_id, "copy_id");
  RequireArgument(user_id, "user_id");
  RequireActingFor(op.caller, user_id);
  RequireCopy(copy_id);

  const auto eligibility = users_->IsEligible(user_id);
  if (!eligibility.active) {
    throw util::Forbidden("user " + user_id + " is not eligible: account inactive");
  }
  if (!eligibility.under_loan_limit) {
    throw util::Forbidden("user " + user_id + " is not eligible: loan limit reached");
  }

  auto copy_mutex = CopyMutex(copy_id);
  auto lock       = LockCopy(*copy_mutex, op.deadline, copy_id);

  const auto                 now_ms = util::NowMs();
  const ledger::EventContext ctx{op.correlation_id, util::NewId(), now_ms};
  const auto                 due_at_ms = now_ms + static_cast<uint64_t>(options_.loan_period.count());

  db::model::LoanRecord loan;
  RunTransaction(kCopyNotAvailable, [&](db::Transaction& tx) {
    const auto copy = resources_->GetCopy(tx, copy_id);
    if (model::Derive(copy.status, false) != model::AllocationState::kFree) {
      throw util::Conflict(kCopyNotAvailable);
    }

    db::ThrowIfDbError(loans_->CreateActiveLoan(tx, copy_id, user_id, now_ms, due_at_ms, ctx, loan), kCopyNotAvailable);
    db::ThrowIfDbError(resources_->TryAllocate(tx, copy_id, loan.loan_id, now_ms), kCopyNotAvailable);
  });

  return {model::ToProto(loan), TransitionOf(model::kLoanCreated, loan, ctx.transition_id)};
}

Committed<Receipt> AllocationEngine::ReturnCopy(const std::string& copy_id, const std::string& user_id, const OperationContext& op) {
  RequireArgument(copy_id, "copy_id");
  RequireArgument(user_id, "user_id");
  RequireActingFor(op.caller, user_id);
  RequireCopy(copy_id);

  auto copy_mutex = CopyMutex(copy_id);
  auto lock       = LockCopy(*copy_mutex, op.deadline, copy_id);

  const auto                 now_ms = util::NowMs();
  const ledger::EventContext ctx{op.correlation_id, util::NewId(), now_ms};

  db::model::CopyRecord copy;
  db::model::LoanRecord loan;
  RunTransaction("no active loan for copy " + copy_id, [&](db::Transaction& tx) {
    copy        = resources_->GetCopy(tx, copy_id);
    auto active = loans_->ActiveForCopy(tx, copy_id);
    if (!active) {
      throw util::Conflict("no active loan for copy " + copy_id);
    }
    if (active->user_id != user_id && !op.caller.IsAdmin()) {
      throw util::Forbidden("copy " + copy_id + " is not on loan to user " + user_id);
    }

    db::ThrowIfDbError(loans_->CompleteReturn(tx, active->loan_id, now_ms, ctx, loan), "no active loan for copy " + copy_id);
    db::ThrowIfDbError(resources_->Release(tx, copy_id, loan.loan_id, now_ms), "no active loan for copy " + copy_id);
  });

  copy.status = COPY_STATUS_AVAILABLE;
  copy.current_loan_id.clear();

  Receipt receipt;
  *receipt.mutable_loan()        = model::ToProto(loan);
  *receipt.mutable_copy()        = model::ToProto(copy);
  *receipt.mutable_returned_at() = util::MillisToProto(loan.returned_at_ms);
  return {std::move(receipt), TransitionOf(model::kLoanReturned, loan, ctx.transition_id)};
}

Committed<Renewal> AllocationEngine::Renew(const std::string& loan_id, const OperationContext& op) {
  RequireArgument(loan_id, "loan_id");

  // The copy lock is keyed by copy, so resolve the loan's copy first.
  std::string copy_id;
  {
    auto tx    = repository_->Begin();
    auto found = loans_->Get(*tx, loan_id);
    tx->Commit();
    if (!found) {
      throw util::NotFound("loan " + loan_id + " not found");
    }
    copy_id = found->copy_id;
  }

  auto copy_mutex = CopyMutex(copy_id);
  auto lock       = LockCopy(*copy_mutex, op.deadline, copy_id);

  const auto                 now_ms = util::NowMs();
  const ledger::EventContext ctx{op.correlation_id, util::NewId(), now_ms};

  db::model::LoanRecord loan;
  RunTransaction("loan " + loan_id + " is not active", [&](db::Transaction& tx) {
    auto current = loans_->Get(tx, loan_id);
    if (!current) {
      throw util::NotFound("loan " + loan_id + " not found");
    }
    if (!op.caller.IsAdmin() && current->user_id != op.caller.user_id) {
      throw util::Forbidden("loan " + loan_id + " belongs to another user");
    }
    if (current->status != LOAN_STATUS_ACTIVE) {
      throw util::Conflict("loan " + loan_id + " is not active");
    }
    if (current->renewal_count >= options_.max_renewals) {
      throw util::Conflict("loan " + loan_id + " reached the renewal limit");
    }

    const auto new_due_at_ms = std::max(current->due_at_ms, now_ms) + static_cast<uint64_t>(options_.loan_period.count());
    db::ThrowIfDbError(loans_->Renew(tx, loan_id, new_due_at_ms, ctx, loan), "loan " + loan_id + " is not active");
  });

  Renewal renewal;
  renewal.set_loan_id(loan.loan_id);
  *renewal.mutable_new_due_at() = util::MillisToProto(loan.due_at_ms);
  renewal.set_renewal_count(loan.renewal_count);
  return {std::move(renewal), TransitionOf(model::kLoanRenewed, loan, ctx.transition_id)};
}

Committed<LossReport> AllocationEngine::ReportLost(const std::string& copy_id, const OperationContext& op) {
  RequireArgument(copy_id, "copy_id");
  RequireAdmin(op.caller, "report lost");
  RequireCopy(copy_id);

  auto copy_mutex = CopyMutex(copy_id);
  auto lock       = LockCopy(*copy_mutex, op.deadline, copy_id);

  const auto                 now_ms = util::NowMs();
  const ledger::EventContext ctx{op.correlation_id, util::NewId(), now_ms};
  const std::string          not_on_loan = "copy " + copy_id + " is not on loan";

  db::model::CopyRecord copy;
  db::model::LoanRecord loan;
  RunTransaction(not_on_loan, [&](db::Transaction& tx) {
    copy        = resources_->GetCopy(tx, copy_id);
    auto active = loans_->ActiveForCopy(tx, copy_id);
    if (!active || model::Derive(copy.status, true) != model::AllocationState::kHeld) {
      throw util::Conflict(not_on_loan);
    }

    db::ThrowIfDbError(loans_->MarkLost(tx, active->loan_id, ctx, loan), not_on_loan);
    db::ThrowIfDbError(resources_->MarkLost(tx, copy_id, loan.loan_id, now_ms), not_on_loan);
  });

  copy.status = COPY_STATUS_LOST;
  copy.current_loan_id.clear();

  LossReport report;
  *report.mutable_loan() = model::ToProto(loan);
  *report.mutable_copy() = model::ToProto(copy);
  return {std::move(report), TransitionOf(model::kLoanLost, loan, ctx.transition_id)};
}

Committed<Copy> AllocationEngine::RetireCopy(const std::string& copy_id, const OperationContext& op) {
  RequireArgument(copy_id, "copy_id");
  RequireAdmin(op.caller, "retire copy");
  RequireCopy(copy_id);

  auto copy_mutex = CopyMutex(copy_id);
  auto lock       = LockCopy(*copy_mutex, op.deadline, copy_id);

  const auto        now_ms   = util::NowMs();
  const std::string conflict = "copy " + copy_id + " cannot be retired";

  db::model::CopyRecord copy;
  CopyStatus            from = COPY_STATUS_UNSPECIFIED;
  RunTransaction(conflict, [&](db::Transaction& tx) {
    copy = resources_->GetCopy(tx, copy_id);
    from = copy.status;
    db::ThrowIfDbError(resources_->Retire(tx, copy_id, from, now_ms), conflict);
  });

  copy.status        = COPY_STATUS_RETIRED;
  copy.updated_at_ms = now_ms;
  return {model::ToProto(copy), CopyTransition(copy_id, from, COPY_STATUS_RETIRED, util::NewId())};
}

Committed<Copy> AllocationEngine::RegisterCopy(const std::string& copy_id, const std::string& book_id, const OperationContext& op) {
  RequireArgument(copy_id, "copy_id");
  RequireArgument(book_id, "book_id");
  RequireAdmin(op.caller, "register copy");

  auto copy_mutex = CopyMutex(copy_id);
  auto lock       = LockCopy(*copy_mutex, op.deadline, copy_id);

  const auto        now_ms = util::NowMs();
  const std::string exists = "copy " + copy_id + " already exists";

  RunTransaction(exists, [&](db::Transaction& tx) { db::ThrowIfDbError(resources_->Register(tx, copy_id, book_id, now_ms), exists); });

  db::model::CopyRecord copy;
  copy.copy_id       = copy_id;
  copy.book_id       = book_id;
  copy.status        = COPY_STATUS_AVAILABLE;
  copy.updated_at_ms = now_ms;
  return {model::ToProto(copy), CopyTransition(copy_id, COPY_STATUS_UNSPECIFIED, COPY_STATUS_AVAILABLE, util::NewId())};
}

} // namespace circulation::core
