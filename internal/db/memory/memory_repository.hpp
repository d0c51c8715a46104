#pragma once

#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace circulation::db::memory {

class MemoryTransaction;

class MemoryRepository : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  enum class Table : char {
    kCopy        = 'c',
    kLoan        = 'l',
    kActiveLoan  = 'a',
    kIdempotency = 'i',
  };

  static std::string RowKey(Table table, const std::string& id);

  struct State {
    std::unordered_map<std::string, model::CopyRecord>        copies;
    std::unordered_map<std::string, model::LoanRecord>        loans;
    std::unordered_map<std::string, std::string>              active_loan_by_copy;
    std::vector<model::LoanEventRecord>                       loan_events;
    std::unordered_map<std::string, model::IdempotencyRecord> idempotency;
    std::vector<model::AuditRecord>                           audit;
    std::unordered_set<std::string>                           audit_ids;

    // Row version per RowKey; bumped on every committed write to the row.
    std::unordered_map<std::string, uint64_t> row_versions;
    uint64_t                                  next_loan_event_seq = 1;
  };

  std::mutex mutex_;
  State committed_;
};

}
