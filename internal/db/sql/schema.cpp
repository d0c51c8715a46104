#include "schema.hpp"

namespace circulation::db::sql {

const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS copies (copy_id TEXT PRIMARY KEY, book_id TEXT NOT NULL, status INTEGER NOT NULL, current_loan_id TEXT, "
      "updated_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS loans (loan_id TEXT PRIMARY KEY, copy_id TEXT NOT NULL REFERENCES copies(copy_id), user_id TEXT NOT NULL, "
      "status INTEGER NOT NULL, checked_out_at_ms INTEGER NOT NULL, due_at_ms INTEGER NOT NULL, returned_at_ms INTEGER NOT NULL DEFAULT 0, "
      "renewal_count INTEGER NOT NULL DEFAULT 0);",
      "CREATE UNIQUE INDEX IF NOT EXISTS loans_one_active_per_copy ON loans(copy_id) WHERE status = 1;",
      "CREATE INDEX IF NOT EXISTS loans_by_user ON loans(user_id, checked_out_at_ms);",
      "CREATE TABLE IF NOT EXISTS loan_events (sequence INTEGER PRIMARY KEY AUTOINCREMENT, kind TEXT NOT NULL, loan_id TEXT NOT NULL, "
      "copy_id TEXT NOT NULL, user_id TEXT NOT NULL, status INTEGER NOT NULL, checked_out_at_ms INTEGER NOT NULL, due_at_ms INTEGER NOT NULL, "
      "returned_at_ms INTEGER NOT NULL, renewal_count INTEGER NOT NULL, correlation_id TEXT NOT NULL, transition_id TEXT NOT NULL, "
      "recorded_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS loan_events_by_loan ON loan_events(loan_id, sequence);",
      "CREATE INDEX IF NOT EXISTS loan_events_by_correlation ON loan_events(correlation_id);",
      "CREATE INDEX IF NOT EXISTS loan_events_by_time ON loan_events(recorded_at_ms);",
      "CREATE TABLE IF NOT EXISTS idempotency_records (idem_key TEXT PRIMARY KEY, operation TEXT NOT NULL, fingerprint TEXT NOT NULL, "
      "status INTEGER NOT NULL, result BLOB, created_at_ms INTEGER NOT NULL, completed_at_ms INTEGER NOT NULL DEFAULT 0, "
      "expires_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idempotency_by_expiry ON idempotency_records(expires_at_ms);",
      "CREATE TABLE IF NOT EXISTS audit_events (event_id TEXT PRIMARY KEY, entity_type TEXT NOT NULL, entity_id TEXT NOT NULL, "
      "from_state TEXT NOT NULL, to_state TEXT NOT NULL, actor TEXT NOT NULL, correlation_id TEXT NOT NULL, recorded_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS audit_by_entity ON audit_events(entity_type, entity_id, recorded_at_ms);",
      "CREATE INDEX IF NOT EXISTS audit_by_correlation ON audit_events(correlation_id);",
  };
  return kSchema;
}

const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS copies (copy_id TEXT PRIMARY KEY, book_id TEXT NOT NULL, status SMALLINT NOT NULL, current_loan_id TEXT, "
      "updated_at_ms BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS loans (loan_id TEXT PRIMARY KEY, copy_id TEXT NOT NULL REFERENCES copies(copy_id), user_id TEXT NOT NULL, "
      "status SMALLINT NOT NULL, checked_out_at_ms BIGINT NOT NULL, due_at_ms BIGINT NOT NULL, returned_at_ms BIGINT NOT NULL DEFAULT 0, "
      "renewal_count INTEGER NOT NULL DEFAULT 0);",
      "CREATE UNIQUE INDEX IF NOT EXISTS loans_one_active_per_copy ON loans(copy_id) WHERE status = 1;",
      "CREATE INDEX IF NOT EXISTS loans_by_user ON loans(user_id, checked_out_at_ms);",
      "CREATE TABLE IF NOT EXISTS loan_events (sequence BIGSERIAL PRIMARY KEY, kind TEXT NOT NULL, loan_id TEXT NOT NULL, copy_id TEXT NOT NULL, "
      "user_id TEXT NOT NULL, status SMALLINT NOT NULL, checked_out_at_ms BIGINT NOT NULL, due_at_ms BIGINT NOT NULL, "
      "returned_at_ms BIGINT NOT NULL, renewal_count INTEGER NOT NULL, correlation_id TEXT NOT NULL, transition_id TEXT NOT NULL, "
      "recorded_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS loan_events_by_loan ON loan_events(loan_id, sequence);",
      "CREATE INDEX IF NOT EXISTS loan_events_by_correlation ON loan_events(correlation_id);",
      "CREATE INDEX IF NOT EXISTS loan_events_by_time ON loan_events(recorded_at_ms);",
      "CREATE TABLE IF NOT EXISTS idempotency_records (idem_key TEXT PRIMARY KEY, operation TEXT NOT NULL, fingerprint TEXT NOT NULL, "
      "status SMALLINT NOT NULL, result BYTEA, created_at_ms BIGINT NOT NULL, completed_at_ms BIGINT NOT NULL DEFAULT 0, "
      "expires_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idempotency_by_expiry ON idempotency_records(expires_at_ms);",
      "CREATE TABLE IF NOT EXISTS audit_events (event_id TEXT PRIMARY KEY, entity_type TEXT NOT NULL, entity_id TEXT NOT NULL, "
      "from_state TEXT NOT NULL, to_state TEXT NOT NULL, actor TEXT NOT NULL, correlation_id TEXT NOT NULL, recorded_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS audit_by_entity ON audit_events(entity_type, entity_id, recorded_at_ms);",
      "CREATE INDEX IF NOT EXISTS audit_by_correlation ON audit_events(correlation_id);",
  };
  return kSchema;
}

} // namespace circulation::db::sql
