#include "audit_emitter.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace circulation::audit {

using observability::IntField;
using observability::StringField;

AuditEmitter::AuditEmitter(std::shared_ptr<db::Repository> repository, uint32_t attempts)
    : repository_(std::move(repository)), attempts_(attempts == 0 ? 1 : attempts) {
}

std::string AuditEmitter::EventId(const std::string& transition_id, const std::string& entity_type) {
  return transition_id + ":" + entity_type;
}

std::vector<db::model::AuditRecord> AuditEmitter::EventsFor(const model::Transition& transition, const std::string& actor,
                                                            const std::string& correlation_id, uint64_t recorded_at_ms) {
  std::vector<db::model::AuditRecord> records;
  records.reserve(transition.changes.size());
  for (const auto& change : transition.changes) {
    db::model::AuditRecord record;
    record.event_id       = EventId(transition.transition_id, change.entity_type);
    record.entity_type    = change.entity_type;
    record.entity_id      = change.entity_id;
    record.from_state     = change.from_state;
    record.to_state       = change.to_state;
    record.actor          = actor;
    record.correlation_id = correlation_id;
    record.recorded_at_ms = recorded_at_ms;
    records.push_back(std::move(record));
  }
  return records;
}

bool AuditEmitter::Record(const db::model::AuditRecord& record) {
  for (uint32_t attempt = 0; attempt < attempts_; ++attempt) {
    if (TryAppend(record)) {
      return true;
    }
  }

  CIRCULATION_LOG_WARN("audit gap; event queued for reconciliation",
                       {StringField("event_id", record.event_id), StringField("entity_type", record.entity_type),
                        StringField("entity_id", record.entity_id), StringField("correlation_id", record.correlation_id)});

  std::lock_guard lock(backlog_mutex_);
  backlog_.push_back(record);
  return false;
}

std::size_t AuditEmitter::RecordTransition(const model::Transition& transition, const std::string& actor, const std::string& correlation_id) {
  std::size_t queued = 0;
  for (const auto& record : EventsFor(transition, actor, correlation_id, util::NowMs())) {
    if (!Record(record)) {
      ++queued;
    }
  }
  return queued;
}

std::size_t AuditEmitter::DrainBacklog() {
  std::deque<db::model::AuditRecord> pending;
  {
    std::lock_guard lock(backlog_mutex_);
    pending.swap(backlog_);
  }

  std::deque<db::model::AuditRecord> failed;
  for (auto& record : pending) {
    if (!TryAppend(record)) {
      failed.push_back(std::move(record));
    }
  }

  std::lock_guard lock(backlog_mutex_);
  if (!failed.empty()) {
    CIRCULATION_LOG_WARN("audit backlog not drained", {IntField("remaining", static_cast<int64_t>(failed.size()))});
  }
  for (auto& record : failed) {
    backlog_.push_back(std::move(record));
  }
  return backlog_.size();
}

std::size_t AuditEmitter::PendingGaps() const {
  std::lock_guard lock(backlog_mutex_);
  return backlog_.size();
}

bool AuditEmitter::TryAppend(const db::model::AuditRecord& record) {
  try {
    auto tx       = repository_->Begin();
    auto appended = repository_->AppendAudit(*tx, record);
    if (appended.code == db::ErrorCode::AlreadyExists) {
      tx->Rollback();
      return true;
    }
    if (!appended) {
      CIRCULATION_LOG_WARN("audit append failed", {StringField("event_id", record.event_id), StringField("error", appended.message)});
      tx->Rollback();
      return false;
    }
    tx->Commit();
    return true;
  } catch (const db::CommitConflict&) {
    // A concurrent emitter stored the same event id first.
    return true;
  } catch (const std::exception& e) {
    CIRCULATION_LOG_WARN("audit append failed", {StringField("event_id", record.event_id), StringField("error", e.what())});
    return false;
  }
}

} // namespace circulation::audit
