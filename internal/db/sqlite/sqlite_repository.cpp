#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "circulation/v1.hpp"

namespace circulation::db::sqlite {

using circulation::db::ErrorCode;
using circulation::db::Result;

namespace {

// Finalizes on scope exit; every early return below relies on it.
struct Statement {
  sqlite3_stmt* st = nullptr;

  Statement() = default;
  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;
  ~Statement() {
    if (st) sqlite3_finalize(st);
  }
};

bool Prepare(sqlite3* db, const char* sql, Statement& s) {
  return sqlite3_prepare_v2(db, sql, -1, &s.st, nullptr) == SQLITE_OK;
}

// Read paths have no Result to carry the failure, so they throw.
void PrepareOrThrow(sqlite3* db, const char* sql, Statement& s) {
  if (!Prepare(db, sql, s)) throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
}

bool StepRow(sqlite3* db, Statement& s) {
  int rc = sqlite3_step(s.st);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptionalText(sqlite3_stmt* st, int idx, const std::string& s) {
  if (s.empty()) {
    sqlite3_bind_null(st, idx);
    return;
  }
  BindText(st, idx, s);
}

void BindBlob(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_blob(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::string ColBlob(sqlite3_stmt* st, int col) {
  const void* data = sqlite3_column_blob(st, col);
  int         size = sqlite3_column_bytes(st, col);
  if (!data || size <= 0) return {};
  return std::string(static_cast<const char*>(data), static_cast<std::size_t>(size));
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

model::CopyRecord ReadCopy(sqlite3_stmt* st) {
  model::CopyRecord r;
  r.copy_id         = ColText(st, 0);
  r.book_id         = ColText(st, 1);
  r.status          = static_cast<circulation::v1::CopyStatus>(ColI32(st, 2));
  r.current_loan_id = ColText(st, 3);
  r.updated_at_ms   = ColU64(st, 4);
  return r;
}

// Loan columns in the order loan_id,copy_id,user_id,status,checked_out_at_ms,
// due_at_ms,returned_at_ms,renewal_count starting at `first`.
model::LoanRecord ReadLoan(sqlite3_stmt* st, int first = 0) {
  model::LoanRecord r;
  r.loan_id           = ColText(st, first + 0);
  r.copy_id           = ColText(st, first + 1);
  r.user_id           = ColText(st, first + 2);
  r.status            = static_cast<circulation::v1::LoanStatus>(ColI32(st, first + 3));
  r.checked_out_at_ms = ColU64(st, first + 4);
  r.due_at_ms         = ColU64(st, first + 5);
  r.returned_at_ms    = ColU64(st, first + 6);
  r.renewal_count     = static_cast<uint32_t>(ColI32(st, first + 7));
  return r;
}

model::LoanEventRecord ReadLoanEvent(sqlite3_stmt* st) {
  model::LoanEventRecord r;
  r.sequence       = ColU64(st, 0);
  r.kind           = ColText(st, 1);
  r.loan           = ReadLoan(st, 2);
  r.correlation_id = ColText(st, 10);
  r.transition_id  = ColText(st, 11);
  r.recorded_at_ms = ColU64(st, 12);
  return r;
}

model::IdempotencyRecord ReadIdempotency(sqlite3_stmt* st) {
  model::IdempotencyRecord r;
  r.key             = ColText(st, 0);
  r.operation       = ColText(st, 1);
  r.fingerprint     = ColText(st, 2);
  r.status          = static_cast<model::IdempotencyStatus>(ColI32(st, 3));
  r.result          = ColBlob(st, 4);
  r.created_at_ms   = ColU64(st, 5);
  r.completed_at_ms = ColU64(st, 6);
  r.expires_at_ms   = ColU64(st, 7);
  return r;
}

model::AuditRecord ReadAudit(sqlite3_stmt* st) {
  model::AuditRecord r;
  r.event_id       = ColText(st, 0);
  r.entity_type    = ColText(st, 1);
  r.entity_id      = ColText(st, 2);
  r.from_state     = ColText(st, 3);
  r.to_state       = ColText(st, 4);
  r.actor          = ColText(st, 5);
  r.correlation_id = ColText(st, 6);
  r.recorded_at_ms = ColU64(st, 7);
  return r;
}

constexpr const char* kLoanEventSelect =
    "SELECT sequence,kind,loan_id,copy_id,user_id,status,checked_out_at_ms,due_at_ms,returned_at_ms,renewal_count,"
    "correlation_id,transition_id,recorded_at_ms FROM loan_events ";

constexpr const char* kAuditSelect =
    "SELECT event_id,entity_type,entity_id,from_state,to_state,actor,correlation_id,recorded_at_ms FROM audit_events ";

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            if (sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_PRIMARYKEY)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

Result SqliteRepository::MissOrConflict(sqlite3* db, const char* exists_sql, const std::string& id, const std::string& what) {
    Statement s;
    if (!Prepare(db, exists_sql, s)) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindText(s.st, 1, id);

    int rc = sqlite3_step(s.st);
    if (rc == SQLITE_ROW) return Result::Err(ErrorCode::Conflict, what + " " + id + " is not in the expected state");
    if (rc == SQLITE_DONE) return Result::Err(ErrorCode::NotFound, what + " " + id + " not found");
    return Translate(db, rc);
}

// ------------------------------------------------------------------
// Copies
// ------------------------------------------------------------------

Result SqliteRepository::InsertCopy(Transaction& t, const model::CopyRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO copies(copy_id,book_id,status,current_loan_id,updated_at_ms) VALUES(?,?,?,?,?);";

    Statement s;
    if (!Prepare(db, sql, s)) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(s.st, 1, r.copy_id);
    BindText(s.st, 2, r.book_id);
    BindI32(s.st, 3, static_cast<int>(r.status));
    BindOptionalText(s.st, 4, r.current_loan_id);
    BindU64(s.st, 5, r.updated_at_ms);

    return Translate(db, sqlite3_step(s.st));
}

std::optional<model::CopyRecord> SqliteRepository::GetCopy(Transaction& t, const std::string& copy_id) {
    auto* db = TX(t).Handle();

    Statement s;
    PrepareOrThrow(db, "SELECT copy_id,book_id,status,current_loan_id,updated_at_ms FROM copies WHERE copy_id=?;", s);
    BindText(s.st, 1, copy_id);

    if (!StepRow(db, s)) return std::nullopt;
    return ReadCopy(s.st);
}

std::vector<model::CopyRecord> SqliteRepository::ListCopies(Transaction& t) {
    auto* db = TX(t).Handle();

    Statement s;
    PrepareOrThrow(db, "SELECT copy_id,book_id,status,current_loan_id,updated_at_ms FROM copies ORDER BY copy_id;", s);

    std::vector<model::CopyRecord> out;
    while (StepRow(db, s)) out.push_back(ReadCopy(s.st));
    return out;
}

Result SqliteRepository::TransitionCopy(Transaction& t, const std::string& copy_id, const model::CopyState& from,
                                        const model::CopyState& to, uint64_t updated_at_ms) {
    auto* db = TX(t).Handle();

    const char* sql =
        "UPDATE copies SET status=?,current_loan_id=?,updated_at_ms=? "
        "WHERE copy_id=? AND status=? AND IFNULL(current_loan_id,'')=?;";

    Statement s;
    if (!Prepare(db, sql, s)) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI32(s.st, 1, static_cast<int>(to.status));
    BindOptionalText(s.st, 2, to.current_loan_id);
    BindU64(s.st, 3, updated_at_ms);
    BindText(s.st, 4, copy_id);
    BindI32(s.st, 5, static_cast<int>(from.status));
    BindText(s.st, 6, from.current_loan_id);

    int rc = sqlite3_step(s.st);
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 1) return Result::Ok();

    return MissOrConflict(db, "SELECT 1 FROM copies WHERE copy_id=?;", copy_id, "copy");
}

// ------------------------------------------------------------------
// Loans
// ------------------------------------------------------------------

Result SqliteRepository::InsertLoan(Transaction& t, const model::LoanRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO loans(loan_id,copy_id,user_id,status,checked_out_at_ms,due_at_ms,returned_at_ms,renewal_count) "
        "VALUES(?,?,?,?,?,?,?,?);";

    Statement s;
    if (!Prepare(db, sql, s)) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(s.st, 1, r.loan_id);
    BindText(s.st, 2, r.copy_id);
    BindText(s.st, 3, r.user_id);
    BindI32(s.st, 4, static_cast<int>(r.status));
    BindU64(s.st, 5, r.checked_out_at_ms);
    BindU64(s.st, 6, r.due_at_ms);
    BindU64(s.st, 7, r.returned_at_ms);
    BindI32(s.st, 8, static_cast<int>(r.renewal_count));

    return Translate(db, sqlite3_step(s.st));
}

std::optional<model::LoanRecord> SqliteRepository::GetLoan(Transaction& t, const std::string& loan_id) {
    auto* db = TX(t).Handle();

    Statement s;
    PrepareOrThrow(db,
                   "SELECT loan_id,copy_id,user_id,status,checked_out_at_ms,due_at_ms,returned_at_ms,renewal_count "
                   "FROM loans WHERE loan_id=?;",
                   s);
    BindText(s.st, 1, loan_id);

    if (!StepRow(db, s)) return std::nullopt;
    return ReadLoan(s.st);
}

std::optional<model::LoanRecord> SqliteRepository::FindActiveLoanByCopy(Transaction& t, const std::string& copy_id) {
    auto* db = TX(t).Handle();

    Statement s;
    PrepareOrThrow(db,
                   "SELECT loan_id,copy_id,user_id,status,checked_out_at_ms,due_at_ms,returned_at_ms,renewal_count "
                   "FROM loans WHERE copy_id=? AND status=?;",
                   s);
    BindText(s.st, 1, copy_id);
    BindI32(s.st, 2, static_cast<int>(circulation::v1::LOAN_STATUS_ACTIVE));

    if (!StepRow(db, s)) return std::nullopt;
    return ReadLoan(s.st);
}

std::vector<model::LoanRecord> SqliteRepository::ListLoansByUser(Transaction& t, const std::string& user_id) {
    auto* db = TX(t).Handle();

    Statement s;
    PrepareOrThrow(db,
                   "SELECT loan_id,copy_id,user_id,status,checked_out_at_ms,due_at_ms,returned_at_ms,renewal_count "
                   "FROM loans WHERE user_id=? ORDER BY checked_out_at_ms,loan_id;",
                   s);
    BindText(s.st, 1, user_id);

    std::vector<model::LoanRecord> out;
    while (StepRow(db, s)) out.push_back(ReadLoan(s.st));
    return out;
}

uint64_t SqliteRepository::CountActiveLoansByUser(Transaction& t, const std::string& user_id) {
    auto* db = TX(t).Handle();

    Statement s;
    PrepareOrThrow(db, "SELECT COUNT(*) FROM loans WHERE user_id=? AND status=?;", s);
    BindText(s.st, 1, user_id);
    BindI32(s.st, 2, static_cast<int>(circulation::v1::LOAN_STATUS_ACTIVE));

    if (!StepRow(db, s)) return 0;
    return ColU64(s.st, 0);
}

Result SqliteRepository::UpdateLoan(Transaction& t, const model::LoanRecord& r, circulation::v1::LoanStatus expected_status) {
    auto* db = TX(t).Handle();

    const char* sql =
        "UPDATE loans SET status=?,due_at_ms=?,returned_at_ms=?,renewal_count=? WHERE loan_id=? AND status=?;";

    Statement s;
    if (!Prepare(db, sql, s)) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI32(s.st, 1, static_cast<int>(r.status));
    BindU64(s.st, 2, r.due_at_ms);
    BindU64(s.st, 3, r.returned_at_ms);
    BindI32(s.st, 4, static_cast<int>(r.renewal_count));
    BindText(s.st, 5, r.loan_id);
    BindI32(s.st, 6, static_cast<int>(expected_status));

    int rc = sqlite3_step(s.st);
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 1) return Result::Ok();

    return MissOrConflict(db, "SELECT 1 FROM loans WHERE loan_id=?;", r.loan_id, "loan");
}

// ------------------------------------------------------------------
// Loan events
// ------------------------------------------------------------------

Result SqliteRepository::AppendLoanEvent(Transaction& t, model::LoanEventRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO loan_events(kind,loan_id,copy_id,user_id,status,checked_out_at_ms,due_at_ms,returned_at_ms,"
        "renewal_count,correlation_id,transition_id,recorded_at_ms) VALUES(?,?,?,?,?,?,?,?,?,?,?,?);";

    Statement s;
    if (!Prepare(db, sql, s)) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(s.st, 1, r.kind);
    BindText(s.st, 2, r.loan.loan_id);
    BindText(s.st, 3, r.loan.copy_id);
    BindText(s.st, 4, r.loan.user_id);
    BindI32(s.st, 5, static_cast<int>(r.loan.status));
    BindU64(s.st, 6, r.loan.checked_out_at_ms);
    BindU64(s.st, 7, r.loan.due_at_ms);
    BindU64(s.st, 8, r.loan.returned_at_ms);
    BindI32(s.st, 9, static_cast<int>(r.loan.renewal_count));
    BindText(s.st, 10, r.correlation_id);
    BindText(s.st, 11, r.transition_id);
    BindU64(s.st, 12, r.recorded_at_ms);

    int rc = sqlite3_step(s.st);
    if (rc != SQLITE_DONE) return Translate(db, rc);

    r.sequence = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
    return Result::Ok();
}

std::vector<model::LoanEventRecord> SqliteRepository::ListLoanEvents(Transaction& t, const std::string& loan_id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string(kLoanEventSelect) + "WHERE loan_id=? ORDER BY sequence;";
    Statement s;
    PrepareOrThrow(db, sql.c_str(), s);
    BindText(s.st, 1, loan_id);

    std::vector<model::LoanEventRecord> out;
    while (StepRow(db, s)) out.push_back(ReadLoanEvent(s.st));
    return out;
}

std::vector<model::LoanEventRecord> SqliteRepository::ListLoanEventsByCorrelation(Transaction& t, const std::string& correlation_id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string(kLoanEventSelect) + "WHERE correlation_id=? ORDER BY sequence;";
    Statement s;
    PrepareOrThrow(db, sql.c_str(), s);
    BindText(s.st, 1, correlation_id);

    std::vector<model::LoanEventRecord> out;
    while (StepRow(db, s)) out.push_back(ReadLoanEvent(s.st));
    return out;
}

std::vector<model::LoanEventRecord> SqliteRepository::ListLoanEventsSince(Transaction& t, uint64_t min_recorded_at_ms) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string(kLoanEventSelect) + "WHERE recorded_at_ms>=? ORDER BY sequence;";
    Statement s;
    PrepareOrThrow(db, sql.c_str(), s);
    BindU64(s.st, 1, min_recorded_at_ms);

    std::vector<model::LoanEventRecord> out;
    while (StepRow(db, s)) out.push_back(ReadLoanEvent(s.st));
    return out;
}

// ------------------------------------------------------------------
// Idempotency
// ------------------------------------------------------------------

Result SqliteRepository::InsertIdempotency(Transaction& t, const model::IdempotencyRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO idempotency_records(idem_key,operation,fingerprint,status,result,created_at_ms,completed_at_ms,expires_at_ms) "
        "VALUES(?,?,?,?,?,?,?,?) ON CONFLICT(idem_key) DO NOTHING;";

    Statement s;
    if (!Prepare(db, sql, s)) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(s.st, 1, r.key);
    BindText(s.st, 2, r.operation);
    BindText(s.st, 3, r.fingerprint);
    BindI32(s.st, 4, static_cast<int>(r.status));
    BindBlob(s.st, 5, r.result);
    BindU64(s.st, 6, r.created_at_ms);
    BindU64(s.st, 7, r.completed_at_ms);
    BindU64(s.st, 8, r.expires_at_ms);

    int rc = sqlite3_step(s.st);
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::AlreadyExists, "idempotency key already recorded");
    return Result::Ok();
}

std::optional<model::IdempotencyRecord> SqliteRepository::GetIdempotency(Transaction& t, const std::string& key) {
    auto* db = TX(t).Handle();

    Statement s;
    PrepareOrThrow(db,
                   "SELECT idem_key,operation,fingerprint,status,result,created_at_ms,completed_at_ms,expires_at_ms "
                   "FROM idempotency_records WHERE idem_key=?;",
                   s);
    BindText(s.st, 1, key);

    if (!StepRow(db, s)) return std::nullopt;
    return ReadIdempotency(s.st);
}

Result SqliteRepository::CompleteIdempotency(Transaction& t, const std::string& key, const std::string& result,
                                             uint64_t completed_at_ms) {
    auto* db = TX(t).Handle();

    const char* sql =
        "UPDATE idempotency_records SET status=?,result=?,completed_at_ms=? WHERE idem_key=? AND status=?;";

    Statement s;
    if (!Prepare(db, sql, s)) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI32(s.st, 1, static_cast<int>(model::IdempotencyStatus::kCompleted));
    BindBlob(s.st, 2, result);
    BindU64(s.st, 3, completed_at_ms);
    BindText(s.st, 4, key);
    BindI32(s.st, 5, static_cast<int>(model::IdempotencyStatus::kInFlight));

    int rc = sqlite3_step(s.st);
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 1) return Result::Ok();

    return MissOrConflict(db, "SELECT 1 FROM idempotency_records WHERE idem_key=?;", key, "idempotency key");
}

Result SqliteRepository::DeleteIdempotency(Transaction& t, const std::string& key, model::IdempotencyStatus expected_status) {
    auto* db = TX(t).Handle();

    Statement s;
    if (!Prepare(db, "DELETE FROM idempotency_records WHERE idem_key=? AND status=?;", s))
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(s.st, 1, key);
    BindI32(s.st, 2, static_cast<int>(expected_status));

    int rc = sqlite3_step(s.st);
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 1) return Result::Ok();

    return MissOrConflict(db, "SELECT 1 FROM idempotency_records WHERE idem_key=?;", key, "idempotency key");
}

std::vector<model::IdempotencyRecord> SqliteRepository::ListInFlightIdempotency(Transaction& t, uint64_t created_before_ms) {
    auto* db = TX(t).Handle();

    Statement s;
    PrepareOrThrow(db,
                   "SELECT idem_key,operation,fingerprint,status,result,created_at_ms,completed_at_ms,expires_at_ms "
                   "FROM idempotency_records WHERE status=? AND created_at_ms<? ORDER BY created_at_ms;",
                   s);
    BindI32(s.st, 1, static_cast<int>(model::IdempotencyStatus::kInFlight));
    BindU64(s.st, 2, created_before_ms);

    std::vector<model::IdempotencyRecord> out;
    while (StepRow(db, s)) out.push_back(ReadIdempotency(s.st));
    return out;
}

uint64_t SqliteRepository::PurgeExpiredIdempotency(Transaction& t, uint64_t now_ms) {
    auto* db = TX(t).Handle();

    Statement s;
    PrepareOrThrow(db, "DELETE FROM idempotency_records WHERE expires_at_ms<=?;", s);
    BindU64(s.st, 1, now_ms);

    int rc = sqlite3_step(s.st);
    if (rc != SQLITE_DONE) throw std::runtime_error(std::string("sqlite purge: ") + sqlite3_errmsg(db));
    return static_cast<uint64_t>(sqlite3_changes(db));
}

// ------------------------------------------------------------------
// Audit
// ------------------------------------------------------------------

Result SqliteRepository::AppendAudit(Transaction& t, const model::AuditRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO audit_events(event_id,entity_type,entity_id,from_state,to_state,actor,correlation_id,recorded_at_ms) "
        "VALUES(?,?,?,?,?,?,?,?) ON CONFLICT(event_id) DO NOTHING;";

    Statement s;
    if (!Prepare(db, sql, s)) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(s.st, 1, r.event_id);
    BindText(s.st, 2, r.entity_type);
    BindText(s.st, 3, r.entity_id);
    BindText(s.st, 4, r.from_state);
    BindText(s.st, 5, r.to_state);
    BindText(s.st, 6, r.actor);
    BindText(s.st, 7, r.correlation_id);
    BindU64(s.st, 8, r.recorded_at_ms);

    int rc = sqlite3_step(s.st);
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::AlreadyExists, "audit event " + r.event_id + " already recorded");
    return Result::Ok();
}

std::vector<model::AuditRecord> SqliteRepository::ListAuditByEntity(Transaction& t, const std::string& entity_type,
                                                                    const std::string& entity_id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string(kAuditSelect) + "WHERE entity_type=? AND entity_id=? ORDER BY recorded_at_ms,rowid;";
    Statement s;
    PrepareOrThrow(db, sql.c_str(), s);
    BindText(s.st, 1, entity_type);
    BindText(s.st, 2, entity_id);

    std::vector<model::AuditRecord> out;
    while (StepRow(db, s)) out.push_back(ReadAudit(s.st));
    return out;
}

std::vector<model::AuditRecord> SqliteRepository::ListAuditByCorrelation(Transaction& t, const std::string& correlation_id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string(kAuditSelect) + "WHERE correlation_id=? ORDER BY recorded_at_ms,rowid;";
    Statement s;
    PrepareOrThrow(db, sql.c_str(), s);
    BindText(s.st, 1, correlation_id);

    std::vector<model::AuditRecord> out;
    while (StepRow(db, s)) out.push_back(ReadAudit(s.st));
    return out;
}

} // namespace circulation::db::sqlite
