#pragma once

#include <cstdint>
#include <string>

#include "circulation/v1/types.pb.h"

namespace circulation::db::model {

/*
  Current view of a loan (latest snapshot).

  The full history lives in loan events; this row exists so the
  "one ACTIVE loan per copy" rule can be a storage constraint.
*/

struct LoanRecord {
  std::string loan_id;
  std::string copy_id;
  std::string user_id;

  circulation::v1::LoanStatus status = circulation::v1::LOAN_STATUS_UNSPECIFIED;

  uint64_t checked_out_at_ms = 0;
  uint64_t due_at_ms         = 0;

  // 0 = not returned
  uint64_t returned_at_ms = 0;

  uint32_t renewal_count = 0;
};

}
