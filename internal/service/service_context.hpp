#pragma once

#include <chrono>
#include <memory>

namespace circulation::core { class AllocationEngine; }
namespace circulation::ledger { class ResourceLedger; class LoanLedger; }
namespace circulation::idempotency { class IdempotencyCoordinator; }
namespace circulation::audit { class AuditEmitter; }
namespace circulation::db { class Repository; }

namespace circulation::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<circulation::db::Repository> repository;
  std::shared_ptr<circulation::ledger::ResourceLedger> resources;
  std::shared_ptr<circulation::ledger::LoanLedger> loans;
  std::shared_ptr<circulation::core::AllocationEngine> engine;
  std::shared_ptr<circulation::idempotency::IdempotencyCoordinator> idempotency;
  std::shared_ptr<circulation::audit::AuditEmitter> audit;

  // Applied when the caller sets no deadline.
  std::chrono::milliseconds default_timeout{std::chrono::seconds(5)};

  // Age at which the recovery sweep treats an IN_FLIGHT marker as orphaned.
  // Idempotent operations finish within half of it.
  std::chrono::milliseconds in_flight_lease{std::chrono::seconds(60)};
};

}
