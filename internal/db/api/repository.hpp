#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/audit_record.hpp"
#include "internal/db/model/copy_record.hpp"
#include "internal/db/model/idempotency_record.hpp"
#include "internal/db/model/loan_event_record.hpp"
#include "internal/db/model/loan_record.hpp"

namespace circulation::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - Conditional writes (TransitionCopy, UpdateLoan, CompleteIdempotency,
    DeleteIdempotency) are a single atomic check-and-set in the store;
    when the precondition fails they return Conflict and change nothing
  - At most one ACTIVE loan per copy is a storage constraint:
    InsertLoan / UpdateLoan return ConstraintViolation when violated
  - Idempotency keys are unique: InsertIdempotency returns AlreadyExists

  The DB is the source of truth for:
    copy allocation state
    loans and their event history
    idempotency markers
    audit trail
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Copies (resource ledger)
  // ---------------------------------------------------------------------

  virtual Result InsertCopy(Transaction&, const model::CopyRecord&) = 0;

  virtual std::optional<model::CopyRecord> GetCopy(Transaction&, const std::string& copy_id) = 0;

  virtual std::vector<model::CopyRecord> ListCopies(Transaction&) = 0;

  // Sets `to` only if the row currently holds `from`.
  // NotFound if the copy does not exist.
  virtual Result TransitionCopy(Transaction&, const std::string& copy_id, const model::CopyState& from, const model::CopyState& to,
                                uint64_t updated_at_ms) = 0;

  // ---------------------------------------------------------------------
  // Loans (loan ledger, current view)
  // ---------------------------------------------------------------------

  virtual Result InsertLoan(Transaction&, const model::LoanRecord&) = 0;

  virtual std::optional<model::LoanRecord> GetLoan(Transaction&, const std::string& loan_id) = 0;

  virtual std::optional<model::LoanRecord> FindActiveLoanByCopy(Transaction&, const std::string& copy_id) = 0;

  // Ordered by checkout time.
  virtual std::vector<model::LoanRecord> ListLoansByUser(Transaction&, const std::string& user_id) = 0;

  virtual uint64_t CountActiveLoansByUser(Transaction&, const std::string& user_id) = 0;

  // Replaces the row only if its current status equals expected_status.
  virtual Result UpdateLoan(Transaction&, const model::LoanRecord&, circulation::v1::LoanStatus expected_status) = 0;

  // ---------------------------------------------------------------------
  // Loan events (append-only history)
  // ---------------------------------------------------------------------

  // Assigns the sequence number.
  virtual Result AppendLoanEvent(Transaction&, model::LoanEventRecord&) = 0;

  virtual std::vector<model::LoanEventRecord> ListLoanEvents(Transaction&, const std::string& loan_id) = 0;

  virtual std::vector<model::LoanEventRecord> ListLoanEventsByCorrelation(Transaction&, const std::string& correlation_id) = 0;

  virtual std::vector<model::LoanEventRecord> ListLoanEventsSince(Transaction&, uint64_t min_recorded_at_ms) = 0;

  // ---------------------------------------------------------------------
  // Idempotency markers
  // ---------------------------------------------------------------------

  virtual Result InsertIdempotency(Transaction&, const model::IdempotencyRecord&) = 0;

  virtual std::optional<model::IdempotencyRecord> GetIdempotency(Transaction&, const std::string& key) = 0;

  // IN_FLIGHT -> COMPLETED with the serialized result.
  virtual Result CompleteIdempotency(Transaction&, const std::string& key, const std::string& result, uint64_t completed_at_ms) = 0;

  virtual Result DeleteIdempotency(Transaction&, const std::string& key, model::IdempotencyStatus expected_status) = 0;

  virtual std::vector<model::IdempotencyRecord> ListInFlightIdempotency(Transaction&, uint64_t created_before_ms) = 0;

  // Removes records with expires_at_ms <= now_ms; returns how many went.
  virtual uint64_t PurgeExpiredIdempotency(Transaction&, uint64_t now_ms) = 0;

  // ---------------------------------------------------------------------
  // Audit trail
  // ---------------------------------------------------------------------

  // AlreadyExists when event_id was appended before.
  virtual Result AppendAudit(Transaction&, const model::AuditRecord&) = 0;

  virtual std::vector<model::AuditRecord> ListAuditByEntity(Transaction&, const std::string& entity_type, const std::string& entity_id) = 0;

  virtual std::vector<model::AuditRecord> ListAuditByCorrelation(Transaction&, const std::string& correlation_id) = 0;
};

} // namespace circulation::db
