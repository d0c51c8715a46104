#pragma once

#include <cstdint>
#include <string>

namespace circulation::db::model {

enum class IdempotencyStatus : int {
  kInFlight  = 1,
  kCompleted = 2,
};

struct IdempotencyRecord {
  std::string key;
  std::string operation;
  std::string fingerprint;

  IdempotencyStatus status = IdempotencyStatus::kInFlight;

  // Serialized circulation.v1.OperationResult; empty until COMPLETED.
  std::string result;

  uint64_t created_at_ms   = 0;
  uint64_t completed_at_ms = 0;
  uint64_t expires_at_ms   = 0;
};

}
