#include "pg_repository.hpp"

#include <cstddef>

#include "circulation/v1.hpp"

namespace circulation::db::postgres {

namespace {

using Bytes = std::basic_string<std::byte>;

Bytes ToBytes(const std::string& s) {
  return Bytes(reinterpret_cast<const std::byte*>(s.data()), s.size());
}

std::string FromBytes(const pqxx::field& f) {
  if (f.is_null()) return {};
  auto bytes = f.as<Bytes>();
  return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

std::string Text(const pqxx::field& f) {
  return f.is_null() ? std::string() : f.as<std::string>();
}

model::CopyRecord ReadCopy(const pqxx::row& row) {
  model::CopyRecord r;
  r.copy_id         = row[0].as<std::string>();
  r.book_id         = row[1].as<std::string>();
  r.status          = static_cast<circulation::v1::CopyStatus>(row[2].as<int>());
  r.current_loan_id = Text(row[3]);
  r.updated_at_ms   = row[4].as<uint64_t>();
  return r;
}

model::LoanRecord ReadLoan(const pqxx::row& row, pqxx::row::size_type first = 0) {
  model::LoanRecord r;
  r.loan_id           = row[first + 0].as<std::string>();
  r.copy_id           = row[first + 1].as<std::string>();
  r.user_id           = row[first + 2].as<std::string>();
  r.status            = static_cast<circulation::v1::LoanStatus>(row[first + 3].as<int>());
  r.checked_out_at_ms = row[first + 4].as<uint64_t>();
  r.due_at_ms         = row[first + 5].as<uint64_t>();
  r.returned_at_ms    = row[first + 6].as<uint64_t>();
  r.renewal_count     = row[first + 7].as<uint32_t>();
  return r;
}

model::LoanEventRecord ReadLoanEvent(const pqxx::row& row) {
  model::LoanEventRecord r;
  r.sequence       = row[0].as<uint64_t>();
  r.kind           = row[1].as<std::string>();
  r.loan           = ReadLoan(row, 2);
  r.correlation_id = row[10].as<std::string>();
  r.transition_id  = row[11].as<std::string>();
  r.recorded_at_ms = row[12].as<uint64_t>();
  return r;
}

model::IdempotencyRecord ReadIdempotency(const pqxx::row& row) {
  model::IdempotencyRecord r;
  r.key             = row[0].as<std::string>();
  r.operation       = row[1].as<std::string>();
  r.fingerprint     = row[2].as<std::string>();
  r.status          = static_cast<model::IdempotencyStatus>(row[3].as<int>());
  r.result          = FromBytes(row[4]);
  r.created_at_ms   = row[5].as<uint64_t>();
  r.completed_at_ms = row[6].as<uint64_t>();
  r.expires_at_ms   = row[7].as<uint64_t>();
  return r;
}

model::AuditRecord ReadAudit(const pqxx::row& row) {
  model::AuditRecord r;
  r.event_id       = row[0].as<std::string>();
  r.entity_type    = row[1].as<std::string>();
  r.entity_id      = row[2].as<std::string>();
  r.from_state     = row[3].as<std::string>();
  r.to_state       = row[4].as<std::string>();
  r.actor          = row[5].as<std::string>();
  r.correlation_id = row[6].as<std::string>();
  r.recorded_at_ms = row[7].as<uint64_t>();
  return r;
}

const std::string kLoanSelect =
    "SELECT loan_id,copy_id,user_id,status,checked_out_at_ms,due_at_ms,returned_at_ms,renewal_count FROM loans ";

const std::string kLoanEventSelect =
    "SELECT sequence,kind,loan_id,copy_id,user_id,status,checked_out_at_ms,due_at_ms,returned_at_ms,renewal_count,"
    "correlation_id,transition_id,recorded_at_ms FROM loan_events ";

const std::string kIdempotencySelect =
    "SELECT idem_key,operation,fingerprint,status,result,created_at_ms,completed_at_ms,expires_at_ms FROM idempotency_records ";

const std::string kAuditSelect =
    "SELECT event_id,entity_type,entity_id,from_state,to_state,actor,correlation_id,recorded_at_ms FROM audit_events ";

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::transaction_rollback*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::MissOrConflict(pqxx::work& w, const std::string& exists_sql, const std::string& id, const std::string& what) {
  auto res = w.exec_params(exists_sql, id);
  if (res.empty()) return Result::Err(ErrorCode::NotFound, what + " " + id + " not found");
  return Result::Err(ErrorCode::Conflict, what + " " + id + " is not in the expected state");
}

// ------------------------------------------------------------------
// Copies
// ------------------------------------------------------------------

Result PgRepository::InsertCopy(Transaction& t, const model::CopyRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO copies(copy_id,book_id,status,current_loan_id,updated_at_ms) VALUES($1,$2,$3,NULLIF($4,''),$5) "
        "ON CONFLICT(copy_id) DO NOTHING;",
        r.copy_id, r.book_id, static_cast<int>(r.status), r.current_loan_id, r.updated_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists, "copy " + r.copy_id + " already exists");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::CopyRecord> PgRepository::GetCopy(Transaction& t, const std::string& copy_id) {
  auto res = TX(t).Work().exec_prepared("get_copy", copy_id);
  if (res.empty()) return std::nullopt;
  return ReadCopy(res[0]);
}

std::vector<model::CopyRecord> PgRepository::ListCopies(Transaction& t) {
  auto res = TX(t).Work().exec(
      "SELECT copy_id,book_id,status,COALESCE(current_loan_id,''),updated_at_ms FROM copies ORDER BY copy_id;");

  std::vector<model::CopyRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadCopy(row));
  return out;
}

Result PgRepository::TransitionCopy(Transaction& t, const std::string& copy_id, const model::CopyState& from,
                                    const model::CopyState& to, uint64_t updated_at_ms) {
  try {
    auto& w   = TX(t).Work();
    auto  res = w.exec_prepared("transition_copy", copy_id, static_cast<int>(to.status), to.current_loan_id,
                                static_cast<int>(from.status), from.current_loan_id, updated_at_ms);
    if (res.affected_rows() == 1) return Result::Ok();
    return MissOrConflict(w, "SELECT 1 FROM copies WHERE copy_id=$1;", copy_id, "copy");
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Loans
// ------------------------------------------------------------------

Result PgRepository::InsertLoan(Transaction& t, const model::LoanRecord& r) {
  try {
    auto& w = TX(t).Work();
    // DO NOTHING keeps the transaction usable; the follow-up read tells a
    // duplicate loan id apart from a second ACTIVE loan for the copy.
    auto res = w.exec_params(
        "INSERT INTO loans(loan_id,copy_id,user_id,status,checked_out_at_ms,due_at_ms,returned_at_ms,renewal_count) "
        "VALUES($1,$2,$3,$4,$5,$6,$7,$8) ON CONFLICT DO NOTHING;",
        r.loan_id, r.copy_id, r.user_id, static_cast<int>(r.status), r.checked_out_at_ms, r.due_at_ms, r.returned_at_ms,
        static_cast<int>(r.renewal_count));
    if (res.affected_rows() == 1) return Result::Ok();

    if (!w.exec_params("SELECT 1 FROM loans WHERE loan_id=$1;", r.loan_id).empty()) {
      return Result::Err(ErrorCode::AlreadyExists, "loan " + r.loan_id + " already exists");
    }
    return Result::Err(ErrorCode::ConstraintViolation, "copy " + r.copy_id + " already has an active loan");
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::LoanRecord> PgRepository::GetLoan(Transaction& t, const std::string& loan_id) {
  auto res = TX(t).Work().exec_params(kLoanSelect + "WHERE loan_id=$1;", loan_id);
  if (res.empty()) return std::nullopt;
  return ReadLoan(res[0]);
}

std::optional<model::LoanRecord> PgRepository::FindActiveLoanByCopy(Transaction& t, const std::string& copy_id) {
  auto res = TX(t).Work().exec_prepared("find_active_loan", copy_id);
  if (res.empty()) return std::nullopt;
  return ReadLoan(res[0]);
}

std::vector<model::LoanRecord> PgRepository::ListLoansByUser(Transaction& t, const std::string& user_id) {
  auto res = TX(t).Work().exec_params(kLoanSelect + "WHERE user_id=$1 ORDER BY checked_out_at_ms,loan_id;", user_id);

  std::vector<model::LoanRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadLoan(row));
  return out;
}

uint64_t PgRepository::CountActiveLoansByUser(Transaction& t, const std::string& user_id) {
  auto res = TX(t).Work().exec_params("SELECT COUNT(*) FROM loans WHERE user_id=$1 AND status=1;", user_id);
  return res[0][0].as<uint64_t>();
}

Result PgRepository::UpdateLoan(Transaction& t, const model::LoanRecord& r, circulation::v1::LoanStatus expected_status) {
  try {
    auto& w   = TX(t).Work();
    auto  res = w.exec_params(
        "UPDATE loans SET status=$2,due_at_ms=$3,returned_at_ms=$4,renewal_count=$5 WHERE loan_id=$1 AND status=$6;", r.loan_id,
        static_cast<int>(r.status), r.due_at_ms, r.returned_at_ms, static_cast<int>(r.renewal_count),
        static_cast<int>(expected_status));
    if (res.affected_rows() == 1) return Result::Ok();
    return MissOrConflict(w, "SELECT 1 FROM loans WHERE loan_id=$1;", r.loan_id, "loan");
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Loan events
// ------------------------------------------------------------------

Result PgRepository::AppendLoanEvent(Transaction& t, model::LoanEventRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO loan_events(kind,loan_id,copy_id,user_id,status,checked_out_at_ms,due_at_ms,returned_at_ms,renewal_count,"
        "correlation_id,transition_id,recorded_at_ms) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12) RETURNING sequence;",
        r.kind, r.loan.loan_id, r.loan.copy_id, r.loan.user_id, static_cast<int>(r.loan.status), r.loan.checked_out_at_ms,
        r.loan.due_at_ms, r.loan.returned_at_ms, static_cast<int>(r.loan.renewal_count), r.correlation_id, r.transition_id,
        r.recorded_at_ms);
    r.sequence = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::LoanEventRecord> PgRepository::ListLoanEvents(Transaction& t, const std::string& loan_id) {
  auto res = TX(t).Work().exec_params(kLoanEventSelect + "WHERE loan_id=$1 ORDER BY sequence;", loan_id);

  std::vector<model::LoanEventRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadLoanEvent(row));
  return out;
}

std::vector<model::LoanEventRecord> PgRepository::ListLoanEventsByCorrelation(Transaction& t, const std::string& correlation_id) {
  auto res = TX(t).Work().exec_params(kLoanEventSelect + "WHERE correlation_id=$1 ORDER BY sequence;", correlation_id);

  std::vector<model::LoanEventRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadLoanEvent(row));
  return out;
}

std::vector<model::LoanEventRecord> PgRepository::ListLoanEventsSince(Transaction& t, uint64_t min_recorded_at_ms) {
  auto res = TX(t).Work().exec_params(kLoanEventSelect + "WHERE recorded_at_ms>=$1 ORDER BY sequence;", min_recorded_at_ms);

  std::vector<model::LoanEventRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadLoanEvent(row));
  return out;
}

// ------------------------------------------------------------------
// Idempotency
// ------------------------------------------------------------------

Result PgRepository::InsertIdempotency(Transaction& t, const model::IdempotencyRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO idempotency_records(idem_key,operation,fingerprint,status,result,created_at_ms,completed_at_ms,expires_at_ms) "
        "VALUES($1,$2,$3,$4,$5,$6,$7,$8) ON CONFLICT(idem_key) DO NOTHING;",
        r.key, r.operation, r.fingerprint, static_cast<int>(r.status), ToBytes(r.result), r.created_at_ms, r.completed_at_ms,
        r.expires_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists, "idempotency key already recorded");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::IdempotencyRecord> PgRepository::GetIdempotency(Transaction& t, const std::string& key) {
  auto res = TX(t).Work().exec_prepared("get_idempotency", key);
  if (res.empty()) return std::nullopt;
  return ReadIdempotency(res[0]);
}

Result PgRepository::CompleteIdempotency(Transaction& t, const std::string& key, const std::string& result, uint64_t completed_at_ms) {
  try {
    auto& w   = TX(t).Work();
    auto  res = w.exec_params("UPDATE idempotency_records SET status=$2,result=$3,completed_at_ms=$4 WHERE idem_key=$1 AND status=$5;",
                              key, static_cast<int>(model::IdempotencyStatus::kCompleted), ToBytes(result), completed_at_ms,
                              static_cast<int>(model::IdempotencyStatus::kInFlight));
    if (res.affected_rows() == 1) return Result::Ok();
    return MissOrConflict(w, "SELECT 1 FROM idempotency_records WHERE idem_key=$1;", key, "idempotency key");
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteIdempotency(Transaction& t, const std::string& key, model::IdempotencyStatus expected_status) {
  try {
    auto& w   = TX(t).Work();
    auto  res = w.exec_params("DELETE FROM idempotency_records WHERE idem_key=$1 AND status=$2;", key, static_cast<int>(expected_status));
    if (res.affected_rows() == 1) return Result::Ok();
    return MissOrConflict(w, "SELECT 1 FROM idempotency_records WHERE idem_key=$1;", key, "idempotency key");
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::IdempotencyRecord> PgRepository::ListInFlightIdempotency(Transaction& t, uint64_t created_before_ms) {
  auto res = TX(t).Work().exec_params(kIdempotencySelect + "WHERE status=$1 AND created_at_ms<$2 ORDER BY created_at_ms;",
                                      static_cast<int>(model::IdempotencyStatus::kInFlight), created_before_ms);

  std::vector<model::IdempotencyRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadIdempotency(row));
  return out;
}

uint64_t PgRepository::PurgeExpiredIdempotency(Transaction& t, uint64_t now_ms) {
  auto res = TX(t).Work().exec_params("DELETE FROM idempotency_records WHERE expires_at_ms<=$1;", now_ms);
  return static_cast<uint64_t>(res.affected_rows());
}

// ------------------------------------------------------------------
// Audit
// ------------------------------------------------------------------

Result PgRepository::AppendAudit(Transaction& t, const model::AuditRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO audit_events(event_id,entity_type,entity_id,from_state,to_state,actor,correlation_id,recorded_at_ms) "
        "VALUES($1,$2,$3,$4,$5,$6,$7,$8) ON CONFLICT(event_id) DO NOTHING;",
        r.event_id, r.entity_type, r.entity_id, r.from_state, r.to_state, r.actor, r.correlation_id, r.recorded_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists, "audit event " + r.event_id + " already recorded");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::AuditRecord> PgRepository::ListAuditByEntity(Transaction& t, const std::string& entity_type, const std::string& entity_id) {
  auto res = TX(t).Work().exec_params(kAuditSelect + "WHERE entity_type=$1 AND entity_id=$2 ORDER BY recorded_at_ms,event_id;", entity_type,
                                      entity_id);

  std::vector<model::AuditRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadAudit(row));
  return out;
}

std::vector<model::AuditRecord> PgRepository::ListAuditByCorrelation(Transaction& t, const std::string& correlation_id) {
  auto res = TX(t).Work().exec_params(kAuditSelect + "WHERE correlation_id=$1 ORDER BY recorded_at_ms,event_id;", correlation_id);

  std::vector<model::AuditRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadAudit(row));
  return out;
}

} // namespace circulation::db::postgres
