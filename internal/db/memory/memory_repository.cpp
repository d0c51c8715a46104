#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace circulation::db::memory {

using circulation::v1::LOAN_STATUS_ACTIVE;
using circulation::v1::LoanStatus;

MemoryRepository::MemoryRepository() = default;

std::string MemoryRepository::RowKey(Table table, const std::string& id) {
  std::string key;
  key.reserve(id.size() + 2);
  key.push_back(static_cast<char>(table));
  key.push_back('/');
  key.append(id);
  return key;
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Copies
// ------------------------------------------------------------------

Result MemoryRepository::InsertCopy(Transaction& t, const model::CopyRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.copies.contains(r.copy_id)) return Result::Err(ErrorCode::AlreadyExists, "copy " + r.copy_id + " already exists");
  s.copies[r.copy_id] = r;
  TX(t).Touch(RowKey(Table::kCopy, r.copy_id));
  return Result::Ok();
}

std::optional<model::CopyRecord> MemoryRepository::GetCopy(Transaction& t, const std::string& copy_id) {
  const auto& s  = TX(t).View();
  auto        it = s.copies.find(copy_id);
  if (it == s.copies.end()) return std::nullopt;
  return it->second;
}

std::vector<model::CopyRecord> MemoryRepository::ListCopies(Transaction& t) {
  const auto&                     s = TX(t).View();
  std::vector<model::CopyRecord> records;
  records.reserve(s.copies.size());
  for (const auto& [_, record] : s.copies) {
    records.push_back(record);
  }
  std::sort(records.begin(), records.end(), [](const auto& a, const auto& b) { return a.copy_id < b.copy_id; });
  return records;
}

Result MemoryRepository::TransitionCopy(Transaction& t, const std::string& copy_id, const model::CopyState& from, const model::CopyState& to,
                                        uint64_t updated_at_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.copies.find(copy_id);
  if (it == s.copies.end()) return Result::Err(ErrorCode::NotFound, "copy " + copy_id + " not found");

  auto& row = it->second;
  if (row.status != from.status || row.current_loan_id != from.current_loan_id) {
    return Result::Err(ErrorCode::Conflict, "copy " + copy_id + " is not in the expected state");
  }

  row.status          = to.status;
  row.current_loan_id = to.current_loan_id;
  row.updated_at_ms   = updated_at_ms;
  TX(t).Touch(RowKey(Table::kCopy, copy_id));
  return Result::Ok();
}

// ------------------------------------------------------------------
// Loans
// ------------------------------------------------------------------

Result MemoryRepository::InsertLoan(Transaction& t, const model::LoanRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.loans.contains(r.loan_id)) return Result::Err(ErrorCode::AlreadyExists, "loan " + r.loan_id + " already exists");

  if (r.status == LOAN_STATUS_ACTIVE) {
    if (s.active_loan_by_copy.contains(r.copy_id)) {
      return Result::Err(ErrorCode::ConstraintViolation, "copy " + r.copy_id + " already has an active loan");
    }
    s.active_loan_by_copy[r.copy_id] = r.loan_id;
    TX(t).Touch(RowKey(Table::kActiveLoan, r.copy_id));
  }

  s.loans[r.loan_id] = r;
  TX(t).Touch(RowKey(Table::kLoan, r.loan_id));
  return Result::Ok();
}

std::optional<model::LoanRecord> MemoryRepository::GetLoan(Transaction& t, const std::string& loan_id) {
  const auto& s  = TX(t).View();
  auto        it = s.loans.find(loan_id);
  if (it == s.loans.end()) return std::nullopt;
  return it->second;
}

std::optional<model::LoanRecord> MemoryRepository::FindActiveLoanByCopy(Transaction& t, const std::string& copy_id) {
  const auto& s      = TX(t).View();
  auto        active = s.active_loan_by_copy.find(copy_id);
  if (active == s.active_loan_by_copy.end()) return std::nullopt;

  auto it = s.loans.find(active->second);
  if (it == s.loans.end()) return std::nullopt;
  return it->second;
}

std::vector<model::LoanRecord> MemoryRepository::ListLoansByUser(Transaction& t, const std::string& user_id) {
  std::vector<model::LoanRecord> out;
  for (const auto& [_, loan] : TX(t).View().loans)
    if (loan.user_id == user_id) out.push_back(loan);

  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return a.checked_out_at_ms != b.checked_out_at_ms ? a.checked_out_at_ms < b.checked_out_at_ms : a.loan_id < b.loan_id;
  });
  return out;
}

uint64_t MemoryRepository::CountActiveLoansByUser(Transaction& t, const std::string& user_id) {
  uint64_t count = 0;
  for (const auto& [_, loan] : TX(t).View().loans)
    if (loan.user_id == user_id && loan.status == LOAN_STATUS_ACTIVE) ++count;
  return count;
}

Result MemoryRepository::UpdateLoan(Transaction& t, const model::LoanRecord& r, LoanStatus expected_status) {
  auto& s  = TX(t).Mutable();
  auto  it = s.loans.find(r.loan_id);
  if (it == s.loans.end()) return Result::Err(ErrorCode::NotFound, "loan " + r.loan_id + " not found");
  if (it->second.status != expected_status) {
    return Result::Err(ErrorCode::Conflict, "loan " + r.loan_id + " is not in the expected state");
  }

  const bool was_active = it->second.status == LOAN_STATUS_ACTIVE;
  const bool is_active  = r.status == LOAN_STATUS_ACTIVE;
  if (is_active && !was_active) {
    if (s.active_loan_by_copy.contains(r.copy_id)) {
      return Result::Err(ErrorCode::ConstraintViolation, "copy " + r.copy_id + " already has an active loan");
    }
    s.active_loan_by_copy[r.copy_id] = r.loan_id;
    TX(t).Touch(RowKey(Table::kActiveLoan, r.copy_id));
  } else if (was_active && !is_active) {
    s.active_loan_by_copy.erase(r.copy_id);
    TX(t).Touch(RowKey(Table::kActiveLoan, r.copy_id));
  }

  it->second = r;
  TX(t).Touch(RowKey(Table::kLoan, r.loan_id));
  return Result::Ok();
}

// ------------------------------------------------------------------
// Loan events
// ------------------------------------------------------------------

Result MemoryRepository::AppendLoanEvent(Transaction& t, model::LoanEventRecord& r) {
  auto& s    = TX(t).Mutable();
  r.sequence = s.next_loan_event_seq++;
  s.loan_events.push_back(r);
  TX(t).Appended(r);
  return Result::Ok();
}

std::vector<model::LoanEventRecord> MemoryRepository::ListLoanEvents(Transaction& t, const std::string& loan_id) {
  std::vector<model::LoanEventRecord> out;
  for (const auto& e : TX(t).View().loan_events)
    if (e.loan.loan_id == loan_id) out.push_back(e);
  return out;
}

std::vector<model::LoanEventRecord> MemoryRepository::ListLoanEventsByCorrelation(Transaction& t, const std::string& correlation_id) {
  std::vector<model::LoanEventRecord> out;
  for (const auto& e : TX(t).View().loan_events)
    if (e.correlation_id == correlation_id) out.push_back(e);
  return out;
}

std::vector<model::LoanEventRecord> MemoryRepository::ListLoanEventsSince(Transaction& t, uint64_t min_recorded_at_ms) {
  std::vector<model::LoanEventRecord> out;
  for (const auto& e : TX(t).View().loan_events)
    if (e.recorded_at_ms >= min_recorded_at_ms) out.push_back(e);
  return out;
}

// ------------------------------------------------------------------
// Idempotency
// ------------------------------------------------------------------

Result MemoryRepository::InsertIdempotency(Transaction& t, const model::IdempotencyRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.idempotency.contains(r.key)) return Result::Err(ErrorCode::AlreadyExists, "idempotency key already recorded");
  s.idempotency[r.key] = r;
  TX(t).Touch(RowKey(Table::kIdempotency, r.key));
  return Result::Ok();
}

std::optional<model::IdempotencyRecord> MemoryRepository::GetIdempotency(Transaction& t, const std::string& key) {
  const auto& s  = TX(t).View();
  auto        it = s.idempotency.find(key);
  if (it == s.idempotency.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::CompleteIdempotency(Transaction& t, const std::string& key, const std::string& result, uint64_t completed_at_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.idempotency.find(key);
  if (it == s.idempotency.end()) return Result::Err(ErrorCode::NotFound, "idempotency key not found");
  if (it->second.status != model::IdempotencyStatus::kInFlight) {
    return Result::Err(ErrorCode::Conflict, "idempotency key already completed");
  }

  it->second.status          = model::IdempotencyStatus::kCompleted;
  it->second.result          = result;
  it->second.completed_at_ms = completed_at_ms;
  TX(t).Touch(RowKey(Table::kIdempotency, key));
  return Result::Ok();
}

Result MemoryRepository::DeleteIdempotency(Transaction& t, const std::string& key, model::IdempotencyStatus expected_status) {
  auto& s  = TX(t).Mutable();
  auto  it = s.idempotency.find(key);
  if (it == s.idempotency.end()) return Result::Err(ErrorCode::NotFound, "idempotency key not found");
  if (it->second.status != expected_status) {
    return Result::Err(ErrorCode::Conflict, "idempotency key is not in the expected state");
  }

  s.idempotency.erase(it);
  TX(t).Touch(RowKey(Table::kIdempotency, key));
  return Result::Ok();
}

std::vector<model::IdempotencyRecord> MemoryRepository::ListInFlightIdempotency(Transaction& t, uint64_t created_before_ms) {
  std::vector<model::IdempotencyRecord> out;
  for (const auto& [_, record] : TX(t).View().idempotency)
    if (record.status == model::IdempotencyStatus::kInFlight && record.created_at_ms < created_before_ms) out.push_back(record);
  return out;
}

uint64_t MemoryRepository::PurgeExpiredIdempotency(Transaction& t, uint64_t now_ms) {
  auto&    s      = TX(t).Mutable();
  uint64_t purged = 0;
  for (auto it = s.idempotency.begin(); it != s.idempotency.end();) {
    if (it->second.expires_at_ms > now_ms) {
      ++it;
      continue;
    }
    TX(t).Touch(RowKey(Table::kIdempotency, it->first));
    it = s.idempotency.erase(it);
    ++purged;
  }
  return purged;
}

// ------------------------------------------------------------------
// Audit
// ------------------------------------------------------------------

Result MemoryRepository::AppendAudit(Transaction& t, const model::AuditRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.audit_ids.contains(r.event_id)) return Result::Err(ErrorCode::AlreadyExists, "audit event " + r.event_id + " already recorded");
  s.audit_ids.insert(r.event_id);
  s.audit.push_back(r);
  TX(t).Appended(r);
  return Result::Ok();
}

std::vector<model::AuditRecord> MemoryRepository::ListAuditByEntity(Transaction& t, const std::string& entity_type, const std::string& entity_id) {
  std::vector<model::AuditRecord> out;
  for (const auto& r : TX(t).View().audit)
    if (r.entity_type == entity_type && r.entity_id == entity_id) out.push_back(r);
  return out;
}

std::vector<model::AuditRecord> MemoryRepository::ListAuditByCorrelation(Transaction& t, const std::string& correlation_id) {
  std::vector<model::AuditRecord> out;
  for (const auto& r : TX(t).View().audit)
    if (r.correlation_id == correlation_id) out.push_back(r);
  return out;
}

} // namespace circulation::db::memory
