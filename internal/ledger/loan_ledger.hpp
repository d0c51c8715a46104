#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace circulation::ledger {

// Attached to every loan event written by one engine transition.
struct EventContext {
  std::string correlation_id;
  std::string transition_id;
  uint64_t    recorded_at_ms = 0;
};

/*
  Loan ledger: current loan rows plus their append-only event history.

  Every successful mutation writes the new loan row and appends a loan
  event holding the full snapshot, in the caller's transaction.

  CreateActiveLoan relies on the storage constraint "one ACTIVE loan per
  copy" and reports its violation as Conflict. The other mutations are
  conditional on the loan still being ACTIVE and report Conflict otherwise.
*/
class LoanLedger {
 public:
  explicit LoanLedger(std::shared_ptr<db::Repository> repository);

  db::Result CreateActiveLoan(db::Transaction& tx, const std::string& copy_id, const std::string& user_id, uint64_t checked_out_at_ms,
                              uint64_t due_at_ms, const EventContext& ctx, db::model::LoanRecord& out);

  db::Result CompleteReturn(db::Transaction& tx, const std::string& loan_id, uint64_t returned_at_ms, const EventContext& ctx,
                            db::model::LoanRecord& out);

  db::Result Renew(db::Transaction& tx, const std::string& loan_id, uint64_t new_due_at_ms, const EventContext& ctx,
                   db::model::LoanRecord& out);

  db::Result MarkLost(db::Transaction& tx, const std::string& loan_id, const EventContext& ctx, db::model::LoanRecord& out);

  std::optional<db::model::LoanRecord> Get(db::Transaction& tx, const std::string& loan_id);
  std::optional<db::model::LoanRecord> ActiveForCopy(db::Transaction& tx, const std::string& copy_id);
  std::vector<db::model::LoanRecord>   ListForUser(db::Transaction& tx, const std::string& user_id);
  uint64_t                             CountActiveForUser(db::Transaction& tx, const std::string& user_id);

  // Oldest first.
  std::vector<db::model::LoanEventRecord> History(db::Transaction& tx, const std::string& loan_id);

 private:
  // Loads the loan and checks that it is ACTIVE.
  db::Result LoadActive(db::Transaction& tx, const std::string& loan_id, db::model::LoanRecord& out);

  // Writes `next` over an ACTIVE row and appends the event.
  db::Result Apply(db::Transaction& tx, const db::model::LoanRecord& next, const char* kind, const EventContext& ctx);

  std::shared_ptr<db::Repository> repository_;
};

} // namespace circulation::ledger
