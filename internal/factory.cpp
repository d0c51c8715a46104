#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/audit/audit_emitter.hpp"
#include "internal/collab/catalog.hpp"
#include "internal/collab/user_directory.hpp"
#include "internal/core/allocation_engine.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/idempotency/idempotency_coordinator.hpp"
#include "internal/ledger/loan_ledger.hpp"
#include "internal/ledger/resource_ledger.hpp"
#include "internal/maintenance/maintenance_worker.hpp"
#include "internal/maintenance/recovery_sweep.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/circulation_service.hpp"
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

namespace circulation::factory {

using namespace circulation;
using observability::StringField;

namespace {

#if CIRCULATION_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  for (const auto& sql : db::sql::SqliteSchema()) {
    sqlite_db->Exec(sql);
  }
}
#endif

#if CIRCULATION_DB_POSTGRES
// Runs before the pool exists: pooled connections prepare statements
// against these tables.
void BootstrapPostgresSchema(const std::string& connection_uri) {
  pqxx::connection conn(connection_uri);
  pqxx::work       tx(conn);
  for (const auto& sql : db::sql::PostgresSchema()) {
    tx.exec(sql);
  }
  tx.commit();
}
#endif

std::shared_ptr<db::Repository> BuildRepository(const circulation::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if CIRCULATION_DB_SQLITE
    if (database.sqlite().path().empty()) {
      throw std::runtime_error("database.sqlite.path is required");
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    BootstrapSqliteSchema(sqlite_db);
    CIRCULATION_LOG_INFO("Using sqlite repository", {StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if CIRCULATION_DB_POSTGRES
    const auto& postgres = database.postgres();
    if (postgres.connection_uri().empty()) {
      throw std::runtime_error("database.postgres.connection_uri is required");
    }
    BootstrapPostgresSchema(postgres.connection_uri());
    const std::size_t max_connections = postgres.max_connections() > 0 ? postgres.max_connections() : 16;
    auto              pool            = std::make_shared<db::postgres::PgPool>(postgres.connection_uri(), max_connections);
    CIRCULATION_LOG_INFO("Using postgres repository");
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  CIRCULATION_LOG_INFO("Using in-memory repository");
  return std::make_shared<db::memory::MemoryRepository>();
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const circulation::runtime::config::RuntimeConfig& config) {
  Application app;
  app.policy = config::ResolvePolicy(config);
  const auto& policy = app.policy;

  // ------------------------------------------------------------------
  // Store and ledgers
  // ------------------------------------------------------------------
  auto repository = BuildRepository(config);
  auto resources  = std::make_shared<ledger::ResourceLedger>(repository);
  auto loans      = std::make_shared<ledger::LoanLedger>(repository);

  // ------------------------------------------------------------------
  // Collaborators
  // ------------------------------------------------------------------
  auto catalog = std::make_shared<collab::RepositoryCatalog>(repository);
  auto users   = std::make_shared<collab::ConfiguredUserDirectory>(repository, policy.suspended_users, policy.max_active_loans_per_user);

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  core::AllocationEngine::Options engine_options;
  engine_options.loan_period  = policy.loan_period;
  engine_options.max_renewals = policy.max_renewals;
  auto engine = std::make_shared<core::AllocationEngine>(repository, resources, loans, catalog, users, engine_options);

  idempotency::IdempotencyCoordinator::Options idempotency_options;
  idempotency_options.retention     = policy.idempotency_retention;
  idempotency_options.poll_interval = policy.poll_interval;
  auto coordinator = std::make_shared<idempotency::IdempotencyCoordinator>(repository, idempotency_options);

  auto emitter = std::make_shared<audit::AuditEmitter>(repository, policy.audit_retry_attempts);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext& ctx = app.context;
  ctx.repository      = repository;
  ctx.resources       = resources;
  ctx.loans           = loans;
  ctx.engine          = engine;
  ctx.idempotency     = coordinator;
  ctx.audit           = emitter;
  ctx.default_timeout = policy.default_request_timeout;
  ctx.in_flight_lease = policy.in_flight_lease;

  app.circulation_service = std::make_shared<service::CirculationService>(ctx);
  app.admin_service       = std::make_shared<service::AdminService>(ctx);

  // ------------------------------------------------------------------
  // Maintenance
  // ------------------------------------------------------------------
  maintenance::RecoverySweep::Options sweep_options;
  sweep_options.in_flight_lease = policy.in_flight_lease;
  sweep_options.retention       = policy.idempotency_retention;
  app.recovery_sweep     = std::make_shared<maintenance::RecoverySweep>(repository, coordinator, emitter, sweep_options);
  app.maintenance_worker = std::make_shared<maintenance::MaintenanceWorker>(app.recovery_sweep, policy.maintenance_interval);

  return app;
}

} // namespace circulation::factory
