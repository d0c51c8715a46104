#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace circulation::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertCopy(Transaction&, const model::CopyRecord&) override;
  std::optional<model::CopyRecord> GetCopy(Transaction&, const std::string&) override;
  std::vector<model::CopyRecord> ListCopies(Transaction&) override;
  Result TransitionCopy(Transaction&, const std::string& copy_id, const model::CopyState& from,
                        const model::CopyState& to, uint64_t updated_at_ms) override;

  Result InsertLoan(Transaction&, const model::LoanRecord&) override;
  std::optional<model::LoanRecord> GetLoan(Transaction&, const std::string&) override;
  std::optional<model::LoanRecord> FindActiveLoanByCopy(Transaction&, const std::string&) override;
  std::vector<model::LoanRecord> ListLoansByUser(Transaction&, const std::string&) override;
  uint64_t CountActiveLoansByUser(Transaction&, const std::string&) override;
  Result UpdateLoan(Transaction&, const model::LoanRecord&, circulation::v1::LoanStatus expected_status) override;

  Result AppendLoanEvent(Transaction&, model::LoanEventRecord&) override;
  std::vector<model::LoanEventRecord> ListLoanEvents(Transaction&, const std::string&) override;
  std::vector<model::LoanEventRecord> ListLoanEventsByCorrelation(Transaction&, const std::string&) override;
  std::vector<model::LoanEventRecord> ListLoanEventsSince(Transaction&, uint64_t min_recorded_at_ms) override;

  Result InsertIdempotency(Transaction&, const model::IdempotencyRecord&) override;
  std::optional<model::IdempotencyRecord> GetIdempotency(Transaction&, const std::string&) override;
  Result CompleteIdempotency(Transaction&, const std::string& key, const std::string& result,
                             uint64_t completed_at_ms) override;
  Result DeleteIdempotency(Transaction&, const std::string& key, model::IdempotencyStatus expected_status) override;
  std::vector<model::IdempotencyRecord> ListInFlightIdempotency(Transaction&, uint64_t created_before_ms) override;
  uint64_t PurgeExpiredIdempotency(Transaction&, uint64_t now_ms) override;

  Result AppendAudit(Transaction&, const model::AuditRecord&) override;
  std::vector<model::AuditRecord> ListAuditByEntity(Transaction&, const std::string& entity_type,
                                                    const std::string& entity_id) override;
  std::vector<model::AuditRecord> ListAuditByCorrelation(Transaction&, const std::string&) override;

private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception& e);

  // Tells NotFound from Conflict after a conditional write changed nothing.
  static Result MissOrConflict(pqxx::work& w, const std::string& exists_sql, const std::string& id, const std::string& what);
};

}
