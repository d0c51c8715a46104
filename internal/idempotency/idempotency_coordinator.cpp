#include "idempotency_coordinator.hpp"

#include <algorithm>

#include "internal/db/api/throw_if_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace circulation::idempotency {

using db::model::IdempotencyRecord;
using db::model::IdempotencyStatus;

namespace {

// Every lost insert race means a competing record now exists, so the
// next attempt classifies it. Deletes racing with inserts can repeat this.
constexpr int kMaxBeginAttempts = 8;

} // namespace

IdempotencyCoordinator::IdempotencyCoordinator(std::shared_ptr<db::Repository> repository, Options options)
    : repository_(std::move(repository)), options_(options) {
}

BeginOutcome IdempotencyCoordinator::Begin(const std::string& key, const std::string& operation, const std::string& fingerprint) {
  if (key.empty()) {
    throw util::InvalidArgument("idempotency key is required");
  }

  for (int attempt = 0; attempt < kMaxBeginAttempts; ++attempt) {
    const auto now_ms = util::NowMs();
    auto       tx     = repository_->Begin();

    auto existing = repository_->GetIdempotency(*tx, key);
    if (existing && existing->expires_at_ms <= now_ms) {
      db::ThrowIfDbError(repository_->DeleteIdempotency(*tx, key, existing->status), "idempotency: drop expired record");
      existing.reset();
    }

    if (existing) {
      tx->Commit();
      if (existing->operation != operation || existing->fingerprint != fingerprint) {
        return BeginOutcome{BeginStatus::kKeyReuseMismatch, {}};
      }
      if (existing->status == IdempotencyStatus::kCompleted) {
        return BeginOutcome{BeginStatus::kDuplicateCompleted, existing->result};
      }
      return BeginOutcome{BeginStatus::kDuplicateInFlight, {}};
    }

    IdempotencyRecord record;
    record.key           = key;
    record.operation     = operation;
    record.fingerprint   = fingerprint;
    record.status        = IdempotencyStatus::kInFlight;
    record.created_at_ms = now_ms;
    record.expires_at_ms = now_ms + static_cast<uint64_t>(options_.retention.count());

    auto inserted = repository_->InsertIdempotency(*tx, record);
    if (inserted.code == db::ErrorCode::AlreadyExists) {
      tx->Rollback();
      continue;
    }
    db::ThrowIfDbError(inserted, "idempotency: record marker");

    try {
      tx->Commit();
    } catch (const db::CommitConflict&) {
      continue;
    }
    return BeginOutcome{BeginStatus::kNew, {}};
  }

  throw util::Conflict("idempotency key is contended; retry the request");
}

BeginOutcome IdempotencyCoordinator::AwaitResolution(const std::string& key, const std::string& operation, const std::string& fingerprint,
                                                     util::Deadline deadline) {
  for (;;) {
    if (util::Expired(deadline)) {
      throw util::Timeout("request with this idempotency key is still in progress");
    }

    {
      std::unique_lock lock(resolved_mutex_);
      const auto       wake = std::min(deadline, std::chrono::steady_clock::now() + options_.poll_interval);
      resolved_.wait_until(lock, wake);
    }

    auto outcome = Begin(key, operation, fingerprint);
    if (outcome.status != BeginStatus::kDuplicateInFlight) {
      return outcome;
    }
  }
}

void IdempotencyCoordinator::Complete(const std::string& key, const std::string& operation, const std::string& fingerprint,
                                      const std::string& result) {
  const auto now_ms = util::NowMs();
  auto       tx     = repository_->Begin();

  auto completed = repository_->CompleteIdempotency(*tx, key, result, now_ms);
  if (completed.code == db::ErrorCode::NotFound) {
    IdempotencyRecord record;
    record.key             = key;
    record.operation       = operation;
    record.fingerprint     = fingerprint;
    record.status          = IdempotencyStatus::kCompleted;
    record.result          = result;
    record.created_at_ms   = now_ms;
    record.completed_at_ms = now_ms;
    record.expires_at_ms   = now_ms + static_cast<uint64_t>(options_.retention.count());

    CIRCULATION_LOG_WARN("idempotency marker missing at completion; recording result", {observability::StringField("key", key)});
    completed = repository_->InsertIdempotency(*tx, record);
  }
  if (completed.code == db::ErrorCode::AlreadyExists || completed.code == db::ErrorCode::Conflict) {
    // Another path resolved the key first; its record stands.
    CIRCULATION_LOG_WARN("idempotency key resolved concurrently", {observability::StringField("key", key)});
    tx->Rollback();
    NotifyResolved();
    return;
  }
  db::ThrowIfDbError(completed, "idempotency: complete " + key);
  tx->Commit();
  NotifyResolved();
}

void IdempotencyCoordinator::Abort(const std::string& key) {
  auto tx      = repository_->Begin();
  auto removed = repository_->DeleteIdempotency(*tx, key, IdempotencyStatus::kInFlight);
  if (removed.code == db::ErrorCode::NotFound || removed.code == db::ErrorCode::Conflict) {
    CIRCULATION_LOG_WARN("idempotency marker already resolved", {observability::StringField("key", key)});
    tx->Rollback();
    NotifyResolved();
    return;
  }
  db::ThrowIfDbError(removed, "idempotency: abort " + key);
  tx->Commit();
  NotifyResolved();
}

uint64_t IdempotencyCoordinator::PurgeExpired(uint64_t now_ms) {
  auto tx     = repository_->Begin();
  auto purged = repository_->PurgeExpiredIdempotency(*tx, now_ms);
  tx->Commit();
  return purged;
}

void IdempotencyCoordinator::NotifyResolved() {
  {
    std::lock_guard lock(resolved_mutex_);
  }
  resolved_.notify_all();
}

} // namespace circulation::idempotency
