#include "loan_ledger.hpp"

#include "internal/model/transition.hpp"
#include "internal/util/uuid.hpp"

namespace circulation::ledger {

using namespace circulation::v1;
using db::ErrorCode;
using db::Result;

namespace {

Result AppendEvent(db::Repository& repository, db::Transaction& tx, const db::model::LoanRecord& loan, const char* kind,
                   const EventContext& ctx) {
  db::model::LoanEventRecord event;
  event.kind           = kind;
  event.loan           = loan;
  event.correlation_id = ctx.correlation_id;
  event.transition_id  = ctx.transition_id;
  event.recorded_at_ms = ctx.recorded_at_ms;
  return repository.AppendLoanEvent(tx, event);
}

} // namespace

LoanLedger::LoanLedger(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

Result LoanLedger::CreateActiveLoan(db::Transaction& tx, const std::string& copy_id, const std::string& user_id, uint64_t checked_out_at_ms,
                                    uint64_t due_at_ms, const EventContext& ctx, db::model::LoanRecord& out) {
  db::model::LoanRecord loan;
  loan.loan_id           = util::NewId();
  loan.copy_id           = copy_id;
  loan.user_id           = user_id;
  loan.status            = LOAN_STATUS_ACTIVE;
  loan.checked_out_at_ms = checked_out_at_ms;
  loan.due_at_ms         = due_at_ms;

  auto inserted = repository_->InsertLoan(tx, loan);
  if (inserted.code == ErrorCode::ConstraintViolation) {
    return Result::Err(ErrorCode::Conflict, "copy " + copy_id + " already has an active loan");
  }
  if (!inserted) return inserted;

  auto appended = AppendEvent(*repository_, tx, loan, model::kLoanCreated, ctx);
  if (!appended) return appended;

  out = std::move(loan);
  return Result::Ok();
}

Result LoanLedger::CompleteReturn(db::Transaction& tx, const std::string& loan_id, uint64_t returned_at_ms, const EventContext& ctx,
                                  db::model::LoanRecord& out) {
  db::model::LoanRecord loan;
  auto                  loaded = LoadActive(tx, loan_id, loan);
  if (!loaded) return loaded;

  loan.status         = LOAN_STATUS_RETURNED;
  loan.returned_at_ms = returned_at_ms;

  auto applied = Apply(tx, loan, model::kLoanReturned, ctx);
  if (!applied) return applied;

  out = std::move(loan);
  return Result::Ok();
}

Result LoanLedger::Renew(db::Transaction& tx, const std::string& loan_id, uint64_t new_due_at_ms, const EventContext& ctx,
                         db::model::LoanRecord& out) {
  db::model::LoanRecord loan;
  auto                  loaded = LoadActive(tx, loan_id, loan);
  if (!loaded) return loaded;

  loan.due_at_ms = new_due_at_ms;
  ++loan.renewal_count;

  auto applied = Apply(tx, loan, model::kLoanRenewed, ctx);
  if (!applied) return applied;

  out = std::move(loan);
  return Result::Ok();
}

Result LoanLedger::MarkLost(db::Transaction& tx, const std::string& loan_id, const EventContext& ctx, db::model::LoanRecord& out) {
  db::model::LoanRecord loan;
  auto                  loaded = LoadActive(tx, loan_id, loan);
  if (!loaded) return loaded;

  loan.status = LOAN_STATUS_LOST;

  auto applied = Apply(tx, loan, model::kLoanLost, ctx);
  if (!applied) return applied;

  out = std::move(loan);
  return Result::Ok();
}

std::optional<db::model::LoanRecord> LoanLedger::Get(db::Transaction& tx, const std::string& loan_id) {
  return repository_->GetLoan(tx, loan_id);
}

std::optional<db::model::LoanRecord> LoanLedger::ActiveForCopy(db::Transaction& tx, const std::string& copy_id) {
  return repository_->FindActiveLoanByCopy(tx, copy_id);
}

std::vector<db::model::LoanRecord> LoanLedger::ListForUser(db::Transaction& tx, const std::string& user_id) {
  return repository_->ListLoansByUser(tx, user_id);
}

uint64_t LoanLedger::CountActiveForUser(db::Transaction& tx, const std::string& user_id) {
  return repository_->CountActiveLoansByUser(tx, user_id);
}

std::vector<db::model::LoanEventRecord> LoanLedger::History(db::Transaction& tx, const std::string& loan_id) {
  return repository_->ListLoanEvents(tx, loan_id);
}

Result LoanLedger::LoadActive(db::Transaction& tx, const std::string& loan_id, db::model::LoanRecord& out) {
  auto loan = repository_->GetLoan(tx, loan_id);
  if (!loan) {
    return Result::Err(ErrorCode::NotFound, "loan " + loan_id + " not found");
  }
  if (loan->status != LOAN_STATUS_ACTIVE) {
    return Result::Err(ErrorCode::Conflict, "loan " + loan_id + " is not active");
  }
  out = std::move(*loan);
  return Result::Ok();
}

Result LoanLedger::Apply(db::Transaction& tx, const db::model::LoanRecord& next, const char* kind, const EventContext& ctx) {
  auto updated = repository_->UpdateLoan(tx, next, LOAN_STATUS_ACTIVE);
  if (!updated) return updated;
  return AppendEvent(*repository_, tx, next, kind, ctx);
}

} // namespace circulation::ledger
