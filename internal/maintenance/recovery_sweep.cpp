#include "recovery_sweep.hpp"

#include <optional>

#include "circulation/v1.hpp"
#include "internal/audit/audit_emitter.hpp"
#include "internal/idempotency/idempotency_coordinator.hpp"
#include "internal/model/proto_convert.hpp"
#include "internal/model/transition.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/operations.hpp"
#include "internal/util/time.hpp"

namespace circulation::maintenance {

using namespace circulation::v1;
using observability::IntField;
using observability::StringField;

namespace {

// Copy as it stood right after the event's transition.
Copy CopyAfter(db::Repository& repository, db::Transaction& tx, const db::model::LoanRecord& loan, CopyStatus status) {
  Copy copy;
  copy.set_copy_id(loan.copy_id);
  copy.set_status(status);
  if (auto record = repository.GetCopy(tx, loan.copy_id)) {
    copy.set_book_id(record->book_id);
  }
  return copy;
}

std::optional<OperationResult> RebuildResult(db::Repository& repository, db::Transaction& tx, const std::string& operation,
                                             const db::model::LoanEventRecord& event) {
  OperationResult result;
  const auto&     loan = event.loan;

  if (operation == service::kOpCheckout && event.kind == model::kLoanCreated) {
    *result.mutable_loan() = model::ToProto(loan);
  } else if (operation == service::kOpReturn && event.kind == model::kLoanReturned) {
    auto* receipt            = result.mutable_receipt();
    *receipt->mutable_loan() = model::ToProto(loan);
    *receipt->mutable_copy() = CopyAfter(repository, tx, loan, COPY_STATUS_AVAILABLE);
    *receipt->mutable_returned_at() = util::MillisToProto(loan.returned_at_ms);
  } else if (operation == service::kOpRenew && event.kind == model::kLoanRenewed) {
    auto* renewal = result.mutable_renewal();
    renewal->set_loan_id(loan.loan_id);
    *renewal->mutable_new_due_at() = util::MillisToProto(loan.due_at_ms);
    renewal->set_renewal_count(loan.renewal_count);
  } else if (operation == service::kOpReportLost && event.kind == model::kLoanLost) {
    auto* report            = result.mutable_loss_report();
    *report->mutable_loan() = model::ToProto(loan);
    *report->mutable_copy() = CopyAfter(repository, tx, loan, COPY_STATUS_LOST);
  } else {
    return std::nullopt;
  }
  return result;
}

} // namespace

RecoverySweep::RecoverySweep(std::shared_ptr<db::Repository> repository, std::shared_ptr<idempotency::IdempotencyCoordinator> coordinator,
                             std::shared_ptr<audit::AuditEmitter> emitter, Options options)
    : repository_(std::move(repository)), coordinator_(std::move(coordinator)), emitter_(std::move(emitter)), options_(options) {
}

SweepReport RecoverySweep::Run() {
  SweepReport report;
  const auto  now_ms = util::NowMs();

  ResolveOrphanedMarkers(now_ms, report);
  report.audit_reemitted = ReemitAudit(now_ms);
  report.audit_backlog   = emitter_->DrainBacklog();
  report.records_purged  = coordinator_->PurgeExpired(now_ms);

  if (report.markers_completed || report.markers_cleared || report.audit_reemitted || report.records_purged) {
    CIRCULATION_LOG_INFO("recovery sweep", {IntField("markers_completed", static_cast<int64_t>(report.markers_completed)),
                                            IntField("markers_cleared", static_cast<int64_t>(report.markers_cleared)),
                                            IntField("audit_reemitted", static_cast<int64_t>(report.audit_reemitted)),
                                            IntField("records_purged", static_cast<int64_t>(report.records_purged)),
                                            IntField("audit_backlog", static_cast<int64_t>(report.audit_backlog))});
  }
  return report;
}

void RecoverySweep::ResolveOrphanedMarkers(uint64_t now_ms, SweepReport& report) {
  const auto lease_ms       = static_cast<uint64_t>(options_.in_flight_lease.count());
  const auto created_before = now_ms > lease_ms ? now_ms - lease_ms : 0;

  std::vector<db::model::IdempotencyRecord> orphaned;
  {
    auto tx  = repository_->Begin();
    orphaned = repository_->ListInFlightIdempotency(*tx, created_before);
    tx->Commit();
  }

  for (const auto& marker : orphaned) {
    std::optional<OperationResult> result;
    {
      auto tx     = repository_->Begin();
      auto events = repository_->ListLoanEventsByCorrelation(*tx, marker.key);
      for (auto it = events.rbegin(); it != events.rend() && !result; ++it) {
        result = RebuildResult(*repository_, *tx, marker.operation, *it);
      }
      tx->Commit();
    }

    try {
      if (result) {
        coordinator_->Complete(marker.key, marker.operation, marker.fingerprint, result->SerializeAsString());
        ++report.markers_completed;
        CIRCULATION_LOG_INFO("completed orphaned idempotency marker",
                             {StringField("key", marker.key), StringField("operation", marker.operation)});
      } else {
        coordinator_->Abort(marker.key);
        ++report.markers_cleared;
        CIRCULATION_LOG_INFO("cleared orphaned idempotency marker",
                             {StringField("key", marker.key), StringField("operation", marker.operation)});
      }
    } catch (const std::exception& e) {
      // The owner resolved it meanwhile, or the store failed; next sweep retries.
      CIRCULATION_LOG_WARN("orphaned idempotency marker not resolved", {StringField("key", marker.key), StringField("error", e.what())});
    }
  }
}

uint64_t RecoverySweep::ReemitAudit(uint64_t now_ms) {
  const auto retention_ms = static_cast<uint64_t>(options_.retention.count());
  const auto since        = now_ms > retention_ms ? now_ms - retention_ms : 0;

  std::vector<db::model::LoanEventRecord> events;
  {
    auto tx = repository_->Begin();
    events  = repository_->ListLoanEventsSince(*tx, since);
    tx->Commit();
  }

  uint64_t reemitted = 0;
  for (const auto& event : events) {
    const auto transition = model::TransitionFor(event);
    const auto records    = audit::AuditEmitter::EventsFor(transition, "recovery", event.correlation_id, event.recorded_at_ms);

    uint64_t appended_here = 0;
    auto     tx            = repository_->Begin();
    for (const auto& record : records) {
      auto appended = repository_->AppendAudit(*tx, record);
      if (appended) {
        ++appended_here;
      } else if (appended.code != db::ErrorCode::AlreadyExists) {
        CIRCULATION_LOG_WARN("audit re-emission failed", {StringField("event_id", record.event_id), StringField("error", appended.message)});
      }
    }
    try {
      tx->Commit();
      reemitted += appended_here;
    } catch (const db::CommitConflict& e) {
      CIRCULATION_LOG_WARN("audit re-emission raced with emitter", {StringField("error", e.what())});
    }
  }
  return reemitted;
}

} // namespace circulation::maintenance
