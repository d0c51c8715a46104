#pragma once

#include <cstdint>
#include <string>

#include "loan_record.hpp"

namespace circulation::db::model {

// Snapshot of a loan after one change. Never updated or deleted.
struct LoanEventRecord {
  uint64_t    sequence = 0;
  std::string kind; // "created" | "renewed" | "returned" | "lost"

  LoanRecord loan;

  // Idempotency key of the request that caused the change.
  std::string correlation_id;

  // Shared with the audit events of the same transition.
  std::string transition_id;

  uint64_t recorded_at_ms = 0;
};

}
