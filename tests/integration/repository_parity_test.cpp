#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"

#if CIRCULATION_DB_SQLITE || CIRCULATION_DB_POSTGRES
#include "internal/db/sql/schema.hpp"
#endif

#if CIRCULATION_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if CIRCULATION_DB_POSTGRES
#include <pqxx/pqxx>

#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using circulation::db::ErrorCode;
using circulation::db::Repository;
using circulation::db::memory::MemoryRepository;
using circulation::db::model::AuditRecord;
using circulation::db::model::CopyRecord;
using circulation::db::model::CopyState;
using circulation::db::model::IdempotencyRecord;
using circulation::db::model::IdempotencyStatus;
using circulation::db::model::LoanEventRecord;
using circulation::db::model::LoanRecord;
using namespace circulation::v1;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  // Two open transactions on one thread; first committer wins at Commit.
  bool supports_optimistic_transactions = false;
};

CopyRecord AvailableCopy(const std::string& copy_id) {
  CopyRecord copy;
  copy.copy_id       = copy_id;
  copy.book_id       = "book-" + copy_id;
  copy.status        = COPY_STATUS_AVAILABLE;
  copy.updated_at_ms = 1000;
  return copy;
}

LoanRecord ActiveLoan(const std::string& loan_id, const std::string& copy_id, const std::string& user_id, uint64_t checked_out_at_ms) {
  LoanRecord loan;
  loan.loan_id           = loan_id;
  loan.copy_id           = copy_id;
  loan.user_id           = user_id;
  loan.status            = LOAN_STATUS_ACTIVE;
  loan.checked_out_at_ms = checked_out_at_ms;
  loan.due_at_ms         = checked_out_at_ms + 14 * 24 * 3600 * 1000ull;
  return loan;
}

void VerifyCopyLifecycle(Repository& repo, const std::string& prefix) {
  const auto copy_id = prefix + "-copy";
  {
    auto tx = repo.Begin();
    assert(repo.InsertCopy(*tx, AvailableCopy(copy_id)));
    tx->Commit();
  }

  {
    auto tx        = repo.Begin();
    auto duplicate = repo.InsertCopy(*tx, AvailableCopy(copy_id));
    assert(duplicate.code == ErrorCode::AlreadyExists);
    tx->Rollback();
  }

  auto tx   = repo.Begin();
  auto read = repo.GetCopy(*tx, copy_id);
  assert(read.has_value());
  assert(read->book_id == "book-" + copy_id);
  assert(read->status == COPY_STATUS_AVAILABLE);
  assert(read->current_loan_id.empty());

  const CopyState available{COPY_STATUS_AVAILABLE, ""};
  const CopyState loaned{COPY_STATUS_LOANED, prefix + "-loan"};
  assert(repo.TransitionCopy(*tx, copy_id, available, loaned, 2000));

  // The row no longer holds `available`.
  auto stale = repo.TransitionCopy(*tx, copy_id, available, loaned, 2001);
  assert(stale.code == ErrorCode::Conflict);

  auto missing = repo.TransitionCopy(*tx, prefix + "-missing", available, loaned, 2001);
  assert(missing.code == ErrorCode::NotFound);

  auto after = repo.GetCopy(*tx, copy_id);
  assert(after->status == COPY_STATUS_LOANED);
  assert(after->current_loan_id == prefix + "-loan");
  assert(after->updated_at_ms == 2000);

  assert(repo.TransitionCopy(*tx, copy_id, loaned, available, 3000));
  tx->Commit();

  auto check_tx = repo.Begin();
  bool listed   = false;
  for (const auto& copy : repo.ListCopies(*check_tx)) {
    if (copy.copy_id == copy_id) {
      listed = true;
      assert(copy.status == COPY_STATUS_AVAILABLE);
      assert(copy.current_loan_id.empty());
    }
  }
  assert(listed);
  check_tx->Commit();
}

void VerifySingleActiveLoanPerCopy(Repository& repo, const std::string& prefix) {
  const auto copy_id = prefix + "-copy";
  const auto user_id = prefix + "-user";

  {
    auto tx = repo.Begin();
    assert(repo.InsertCopy(*tx, AvailableCopy(copy_id)));
    assert(repo.InsertLoan(*tx, ActiveLoan(prefix + "-L1", copy_id, user_id, 1000)));
    tx->Commit();
  }

  {
    auto tx     = repo.Begin();
    auto second = repo.InsertLoan(*tx, ActiveLoan(prefix + "-L2", copy_id, prefix + "-other", 1100));
    assert(second.code == ErrorCode::ConstraintViolation);
    tx->Rollback();
  }

  {
    auto tx     = repo.Begin();
    auto active = repo.FindActiveLoanByCopy(*tx, copy_id);
    assert(active.has_value());
    assert(active->loan_id == prefix + "-L1");
    assert(repo.CountActiveLoansByUser(*tx, user_id) == 1);

    auto returned           = *active;
    returned.status         = LOAN_STATUS_RETURNED;
    returned.returned_at_ms = 5000;

    auto wrong_expectation = repo.UpdateLoan(*tx, returned, LOAN_STATUS_LOST);
    assert(wrong_expectation.code == ErrorCode::Conflict);

    assert(repo.UpdateLoan(*tx, returned, LOAN_STATUS_ACTIVE));
    assert(!repo.FindActiveLoanByCopy(*tx, copy_id).has_value());
    assert(repo.CountActiveLoansByUser(*tx, user_id) == 0);
    tx->Commit();
  }

  {
    // Returning released the slot.
    auto tx = repo.Begin();
    assert(repo.InsertLoan(*tx, ActiveLoan(prefix + "-L3", copy_id, user_id, 6000)));
    tx->Commit();
  }

  auto tx    = repo.Begin();
  auto loans = repo.ListLoansByUser(*tx, user_id);
  assert(loans.size() == 2);
  assert(loans[0].loan_id == prefix + "-L1");
  assert(loans[0].status == LOAN_STATUS_RETURNED);
  assert(loans[0].returned_at_ms == 5000);
  assert(loans[1].loan_id == prefix + "-L3");

  auto missing           = ActiveLoan(prefix + "-missing", copy_id, user_id, 1);
  auto missing_update    = repo.UpdateLoan(*tx, missing, LOAN_STATUS_ACTIVE);
  assert(missing_update.code == ErrorCode::NotFound);
  assert(!repo.GetLoan(*tx, prefix + "-missing").has_value());
  tx->Commit();
}

void VerifyLoanEventHistory(Repository& repo, const std::string& prefix) {
  const auto loan_id = prefix + "-loan";
  auto       loan    = ActiveLoan(loan_id, prefix + "-copy", prefix + "-user", 1000);

  const auto base_ms = NowMs();
  {
    auto tx = repo.Begin();

    LoanEventRecord created{.kind = "created", .loan = loan, .correlation_id = prefix + "-K1", .transition_id = prefix + "-T1",
                            .recorded_at_ms = base_ms};
    assert(repo.AppendLoanEvent(*tx, created));

    loan.renewal_count = 1;
    loan.due_at_ms += 1000;
    LoanEventRecord renewed{.kind = "renewed", .loan = loan, .correlation_id = prefix + "-K2", .transition_id = prefix + "-T2",
                            .recorded_at_ms = base_ms + 10};
    assert(repo.AppendLoanEvent(*tx, renewed));
    assert(renewed.sequence > created.sequence);
    tx->Commit();
  }

  auto tx      = repo.Begin();
  auto history = repo.ListLoanEvents(*tx, loan_id);
  assert(history.size() == 2);
  assert(history[0].kind == "created");
  assert(history[1].kind == "renewed");
  assert(history[1].loan.renewal_count == 1);
  assert(history[1].transition_id == prefix + "-T2");

  auto by_key = repo.ListLoanEventsByCorrelation(*tx, prefix + "-K2");
  assert(by_key.size() == 1);
  assert(by_key[0].loan.loan_id == loan_id);

  bool found_created = false;
  for (const auto& event : repo.ListLoanEventsSince(*tx, base_ms + 5)) {
    if (event.loan.loan_id == loan_id) {
      assert(event.kind == "renewed");
    }
    found_created |= event.transition_id == prefix + "-T1";
  }
  assert(!found_created);
  tx->Commit();
}

void VerifyIdempotencyRecords(Repository& repo, const std::string& prefix) {
  const auto now_ms = NowMs();

  IdempotencyRecord record{.key = prefix + "-K", .operation = "checkout", .fingerprint = "fp", .created_at_ms = now_ms,
                           .expires_at_ms = now_ms + 60'000};
  IdempotencyRecord expired{.key = prefix + "-old", .operation = "renew", .fingerprint = "fp-old", .created_at_ms = now_ms - 10'000,
                            .expires_at_ms = now_ms - 1};
  {
    auto tx = repo.Begin();
    assert(repo.InsertIdempotency(*tx, record));
    assert(repo.InsertIdempotency(*tx, expired));
    tx->Commit();
  }

  {
    auto tx        = repo.Begin();
    auto duplicate = repo.InsertIdempotency(*tx, record);
    assert(duplicate.code == ErrorCode::AlreadyExists);
    tx->Rollback();
  }

  {
    auto tx        = repo.Begin();
    auto in_flight = repo.ListInFlightIdempotency(*tx, now_ms + 1);
    bool seen      = false;
    for (const auto& marker : in_flight) seen |= marker.key == record.key;
    assert(seen);

    assert(repo.CompleteIdempotency(*tx, record.key, "serialized-result", now_ms + 5));
    auto again = repo.CompleteIdempotency(*tx, record.key, "other", now_ms + 6);
    assert(again.code == ErrorCode::Conflict);

    auto read = repo.GetIdempotency(*tx, record.key);
    assert(read.has_value());
    assert(read->status == IdempotencyStatus::kCompleted);
    assert(read->result == "serialized-result");
    assert(read->fingerprint == "fp");
    assert(read->completed_at_ms == now_ms + 5);

    auto wrong_status = repo.DeleteIdempotency(*tx, record.key, IdempotencyStatus::kInFlight);
    assert(wrong_status.code == ErrorCode::Conflict);
    auto missing = repo.DeleteIdempotency(*tx, prefix + "-missing", IdempotencyStatus::kInFlight);
    assert(missing.code == ErrorCode::NotFound);
    tx->Commit();
  }

  auto tx = repo.Begin();
  assert(repo.PurgeExpiredIdempotency(*tx, now_ms) >= 1);
  assert(!repo.GetIdempotency(*tx, expired.key).has_value());
  assert(repo.GetIdempotency(*tx, record.key).has_value());
  assert(repo.DeleteIdempotency(*tx, record.key, IdempotencyStatus::kCompleted));
  assert(!repo.GetIdempotency(*tx, record.key).has_value());
  tx->Commit();
}

void VerifyAuditTrail(Repository& repo, const std::string& prefix) {
  AuditRecord loan_event{.event_id = prefix + "-T1:loan", .entity_type = "loan", .entity_id = prefix + "-loan", .from_state = "NONE",
                         .to_state = "ACTIVE", .actor = "U1", .correlation_id = prefix + "-K1", .recorded_at_ms = 1000};
  AuditRecord copy_event{.event_id = prefix + "-T1:copy", .entity_type = "copy", .entity_id = prefix + "-copy", .from_state = "AVAILABLE",
                         .to_state = "LOANED", .actor = "U1", .correlation_id = prefix + "-K1", .recorded_at_ms = 1000};
  {
    auto tx = repo.Begin();
    assert(repo.AppendAudit(*tx, loan_event));
    assert(repo.AppendAudit(*tx, copy_event));
    tx->Commit();
  }

  {
    auto tx        = repo.Begin();
    auto duplicate = repo.AppendAudit(*tx, loan_event);
    assert(duplicate.code == ErrorCode::AlreadyExists);
    tx->Rollback();
  }

  auto tx        = repo.Begin();
  auto for_loan  = repo.ListAuditByEntity(*tx, "loan", prefix + "-loan");
  auto for_copy  = repo.ListAuditByEntity(*tx, "copy", prefix + "-copy");
  auto for_key   = repo.ListAuditByCorrelation(*tx, prefix + "-K1");
  assert(for_loan.size() == 1);
  assert(for_loan[0].to_state == "ACTIVE");
  assert(for_copy.size() == 1);
  assert(for_copy[0].from_state == "AVAILABLE");
  assert(for_key.size() == 2);
  assert(repo.ListAuditByEntity(*tx, "copy", prefix + "-loan").empty());
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& prefix) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertCopy(*tx, AvailableCopy(prefix + "-copy")));
    assert(repo.InsertLoan(*tx, ActiveLoan(prefix + "-loan", prefix + "-copy", "U1", 1000)));
    tx->Rollback();
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetCopy(*check_tx, prefix + "-copy").has_value());
  assert(!repo.GetLoan(*check_tx, prefix + "-loan").has_value());
  check_tx->Commit();
}

// Finished transactions stay in scope while the next one begins on the same thread.
void VerifySequentialTransactions(Repository& repo, const std::string& prefix) {
  auto first = repo.Begin();
  assert(repo.InsertCopy(*first, AvailableCopy(prefix + "-a")));
  first->Commit();

  auto second = repo.Begin();
  assert(repo.GetCopy(*second, prefix + "-a").has_value());
  assert(repo.InsertCopy(*second, AvailableCopy(prefix + "-b")));
  second->Rollback();

  auto third = repo.Begin();
  assert(repo.GetCopy(*third, prefix + "-a").has_value());
  assert(!repo.GetCopy(*third, prefix + "-b").has_value());
  third->Commit();

  assert(first->IsCommitted());
  assert(!second->IsCommitted());
}

void VerifyFirstCommitterWins(Repository& repo, const std::string& prefix) {
  const auto copy_id = prefix + "-copy";
  {
    auto tx = repo.Begin();
    assert(repo.InsertCopy(*tx, AvailableCopy(copy_id)));
    tx->Commit();
  }

  const CopyState available{COPY_STATUS_AVAILABLE, ""};
  auto            tx1 = repo.Begin();
  auto            tx2 = repo.Begin();

  assert(repo.TransitionCopy(*tx1, copy_id, available, CopyState{COPY_STATUS_LOANED, "loan-1"}, 2000));
  assert(repo.TransitionCopy(*tx2, copy_id, available, CopyState{COPY_STATUS_LOANED, "loan-2"}, 2000));

  tx1->Commit();

  bool conflicted = false;
  try {
    tx2->Commit();
  } catch (const circulation::db::CommitConflict&) {
    conflicted = true;
  }
  assert(conflicted);

  auto verify_tx = repo.Begin();
  auto final     = repo.GetCopy(*verify_tx, copy_id);
  assert(final.has_value());
  assert(final->current_loan_id == "loan-1");
  verify_tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& prefix) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->InsertCopy(*tx, AvailableCopy(prefix + "-copy")));
    assert(repo->InsertLoan(*tx, ActiveLoan(prefix + "-loan", prefix + "-copy", "U1", 1000)));

    IdempotencyRecord marker{.key = prefix + "-K", .operation = "checkout", .fingerprint = "fp", .created_at_ms = NowMs(),
                             .expires_at_ms = NowMs() + 60'000};
    assert(repo->InsertIdempotency(*tx, marker));
    assert(repo->CompleteIdempotency(*tx, marker.key, "result-bytes", NowMs()));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  assert(repo->GetCopy(*tx, prefix + "-copy").has_value());

  auto active = repo->FindActiveLoanByCopy(*tx, prefix + "-copy");
  assert(active.has_value());
  assert(active->loan_id == prefix + "-loan");

  auto marker = repo->GetIdempotency(*tx, prefix + "-K");
  assert(marker.has_value());
  assert(marker->status == IdempotencyStatus::kCompleted);
  assert(marker->result == "result-bytes");
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                             = "memory",
      .make_repository                  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart                 = []() { return false; },
      .restart                          = [](std::shared_ptr<Repository>&) {},
      .cleanup                          = []() {},
      .supports_optimistic_transactions = true,
  };
}

#if CIRCULATION_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("circulation_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() -> std::shared_ptr<Repository> {
    auto db = std::make_shared<circulation::db::sqlite::SqliteDB>(db_path);
    for (const auto& sql : circulation::db::sql::SqliteSchema()) {
      db->Exec(sql);
    }
    return std::make_shared<circulation::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup                          = [db_path]() { std::filesystem::remove(db_path); },
      .supports_optimistic_transactions = false,
  };
}
#endif

#if CIRCULATION_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("CIRCULATION_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("CIRCULATION_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() -> std::shared_ptr<Repository> {
    {
      pqxx::connection conn(conninfo);
      pqxx::work       tx(conn);
      for (const auto& sql : circulation::db::sql::PostgresSchema()) {
        tx.exec(sql);
      }
      tx.commit();
    }
    auto pool = std::make_shared<circulation::db::postgres::PgPool>(conninfo);
    return std::make_shared<circulation::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name                             = "postgres",
      .make_repository                  = make_repo,
      .supports_restart                 = []() { return true; },
      .restart                          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                          = []() {},
      .supports_optimistic_transactions = false,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  // Postgres keeps rows between runs.
  const auto run = backend.name + "-" + std::to_string(NowMs());

  VerifyCopyLifecycle(*repo, run + "-lifecycle");
  VerifySingleActiveLoanPerCopy(*repo, run + "-active");
  VerifyLoanEventHistory(*repo, run + "-events");
  VerifyIdempotencyRecords(*repo, run + "-idem");
  VerifyAuditTrail(*repo, run + "-audit");
  VerifyRollbackBehavior(*repo, run + "-rollback");
  VerifySequentialTransactions(*repo, run + "-sequential");
  if (backend.supports_optimistic_transactions) {
    VerifyFirstCommitterWins(*repo, run + "-race");
  }

  repo.reset();
  VerifyRestartDurability(backend, run + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if CIRCULATION_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if CIRCULATION_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "circulation_integration_repository_parity: pass\n";
  return 0;
}
