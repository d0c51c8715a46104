#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace circulation::idempotency {

enum class BeginStatus {
  kNew,                // caller owns the key and must Complete or Abort it
  kDuplicateInFlight,  // another request with this key is executing
  kDuplicateCompleted, // `result` holds the cached outcome
  kKeyReuseMismatch,   // key was bound to a different operation or parameters
};

struct BeginOutcome {
  BeginStatus status = BeginStatus::kNew;

  // Serialized circulation.v1.OperationResult for kDuplicateCompleted.
  std::string result;
};

/*
  Two-phase idempotency markers.

  Begin inserts an IN_FLIGHT marker under a store-unique key, so exactly
  one of any number of concurrent first attempts gets kNew, in this process
  or another one sharing the store. The winner later calls Complete with
  the serialized result, or Abort when its operation failed so that a retry
  may execute again.

  Records whose expiry has passed are treated as absent.
*/
class IdempotencyCoordinator {
 public:
  struct Options {
    std::chrono::milliseconds retention{std::chrono::hours(24)};
    std::chrono::milliseconds poll_interval{20};
  };

  IdempotencyCoordinator(std::shared_ptr<db::Repository> repository, Options options);

  BeginOutcome Begin(const std::string& key, const std::string& operation, const std::string& fingerprint);

  // Waits for an IN_FLIGHT key to resolve. Returns kDuplicateCompleted,
  // kKeyReuseMismatch, or kNew when the first attempt aborted and this
  // caller took the key over. Throws util::Timeout at the deadline.
  BeginOutcome AwaitResolution(const std::string& key, const std::string& operation, const std::string& fingerprint,
                               util::Deadline deadline);

  // Marks the key COMPLETED with `result`. A marker that is gone (dropped
  // by the recovery sweep) is recreated as COMPLETED so retries replay.
  void Complete(const std::string& key, const std::string& operation, const std::string& fingerprint, const std::string& result);

  // Drops the IN_FLIGHT marker. Missing markers are not an error.
  void Abort(const std::string& key);

  uint64_t PurgeExpired(uint64_t now_ms);

 private:
  void NotifyResolved();

  std::shared_ptr<db::Repository> repository_;
  Options                         options_;

  // Wakes in-process waiters early; waiters also poll the store so that
  // resolutions by other processes are seen.
  std::mutex              resolved_mutex_;
  std::condition_variable resolved_;
};

} // namespace circulation::idempotency
