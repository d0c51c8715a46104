#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>

#include "internal/db/api/repository.hpp"

namespace circulation::audit {
class AuditEmitter;
}
namespace circulation::idempotency {
class IdempotencyCoordinator;
}

namespace circulation::maintenance {

struct SweepReport {
  uint64_t    markers_completed = 0;
  uint64_t    markers_cleared   = 0;
  uint64_t    audit_reemitted   = 0;
  uint64_t    records_purged    = 0;
  std::size_t audit_backlog     = 0;
};

/*
  Repairs what a crash between the phases of a write can leave behind.

  - An IN_FLIGHT marker older than the in-flight lease whose operation did
    commit (a loan event carries the key as correlation id) is completed
    with a result rebuilt from that event. Without such an event the
    operation never committed and the marker is removed.
  - Audit events of loan events recorded within the retention window are
    re-emitted; existing event ids are skipped.
  - The audit backlog is drained and expired idempotency records purged.
*/
class RecoverySweep {
 public:
  struct Options {
    std::chrono::milliseconds in_flight_lease{std::chrono::seconds(60)};
    std::chrono::milliseconds retention{std::chrono::hours(24)};
  };

  RecoverySweep(std::shared_ptr<db::Repository> repository, std::shared_ptr<idempotency::IdempotencyCoordinator> coordinator,
                std::shared_ptr<audit::AuditEmitter> emitter, Options options);

  SweepReport Run();

 private:
  void     ResolveOrphanedMarkers(uint64_t now_ms, SweepReport& report);
  uint64_t ReemitAudit(uint64_t now_ms);

  std::shared_ptr<db::Repository>                       repository_;
  std::shared_ptr<idempotency::IdempotencyCoordinator> coordinator_;
  std::shared_ptr<audit::AuditEmitter>                  emitter_;
  Options                                               options_;
};

} // namespace circulation::maintenance
