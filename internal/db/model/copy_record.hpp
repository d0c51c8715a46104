#pragma once

#include <string>

#include "circulation/v1/types.pb.h"

namespace circulation::db::model {

/*
  Persistent copy row (resource ledger).

  IMPORTANT:
  - status == LOANED <=> current_loan_id names the copy's ACTIVE loan.
  - Only the allocation engine changes status, always through
    Repository::TransitionCopy.
*/

struct CopyState {
  circulation::v1::CopyStatus status = circulation::v1::COPY_STATUS_UNSPECIFIED;
  std::string                 current_loan_id;
};

struct CopyRecord {
  std::string copy_id;
  std::string book_id;

  circulation::v1::CopyStatus status = circulation::v1::COPY_STATUS_UNSPECIFIED;

  // Empty when the copy is not loaned.
  std::string current_loan_id;

  uint64_t updated_at_ms = 0;

  CopyState State() const {
    return CopyState{status, current_loan_id};
  }
};

}
