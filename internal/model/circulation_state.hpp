#pragma once

#include <cstdint>
#include <string>

#include "circulation/v1/types.pb.h"

namespace circulation::model {

/*
  Allocation state of a copy, derived jointly from Copy.status and the
  status of its current loan.

    FREE        AVAILABLE, no active loan
    HELD        LOANED, exactly one ACTIVE loan
    UNAVAILABLE LOST or RETIRED
*/
enum class AllocationState : std::uint8_t {
  kFree         = 0,
  kHeld         = 1,
  kUnavailable  = 2,
  kInconsistent = 3,
};

constexpr AllocationState Derive(circulation::v1::CopyStatus copy_status, bool has_active_loan) {
  switch (copy_status) {
    case circulation::v1::COPY_STATUS_AVAILABLE:
      return has_active_loan ? AllocationState::kInconsistent : AllocationState::kFree;
    case circulation::v1::COPY_STATUS_LOANED:
      return has_active_loan ? AllocationState::kHeld : AllocationState::kInconsistent;
    case circulation::v1::COPY_STATUS_LOST:
    case circulation::v1::COPY_STATUS_RETIRED:
      return has_active_loan ? AllocationState::kInconsistent : AllocationState::kUnavailable;
    default:
      return AllocationState::kInconsistent;
  }
}

constexpr bool IsTerminal(circulation::v1::LoanStatus status) {
  return status == circulation::v1::LOAN_STATUS_RETURNED || status == circulation::v1::LOAN_STATUS_LOST;
}

// Copy transitions the engine is allowed to perform.
constexpr bool CanTransition(circulation::v1::CopyStatus from, circulation::v1::CopyStatus to) {
  using namespace circulation::v1;
  switch (from) {
    case COPY_STATUS_AVAILABLE:
      return to == COPY_STATUS_LOANED || to == COPY_STATUS_RETIRED;
    case COPY_STATUS_LOANED:
      return to == COPY_STATUS_AVAILABLE || to == COPY_STATUS_LOST;
    case COPY_STATUS_LOST:
      return to == COPY_STATUS_RETIRED;
    default:
      return false;
  }
}

// Loan transitions; ACTIVE -> ACTIVE is a renewal.
constexpr bool CanTransition(circulation::v1::LoanStatus from, circulation::v1::LoanStatus to) {
  using namespace circulation::v1;
  if (from != LOAN_STATUS_ACTIVE) {
    return false;
  }
  return to == LOAN_STATUS_ACTIVE || to == LOAN_STATUS_RETURNED || to == LOAN_STATUS_LOST;
}

inline std::string StateName(circulation::v1::CopyStatus status) {
  switch (status) {
    case circulation::v1::COPY_STATUS_AVAILABLE:
      return "AVAILABLE";
    case circulation::v1::COPY_STATUS_LOANED:
      return "LOANED";
    case circulation::v1::COPY_STATUS_LOST:
      return "LOST";
    case circulation::v1::COPY_STATUS_RETIRED:
      return "RETIRED";
    default:
      return "NONE";
  }
}

inline std::string StateName(circulation::v1::LoanStatus status) {
  switch (status) {
    case circulation::v1::LOAN_STATUS_ACTIVE:
      return "ACTIVE";
    case circulation::v1::LOAN_STATUS_RETURNED:
      return "RETURNED";
    case circulation::v1::LOAN_STATUS_LOST:
      return "LOST";
    default:
      return "NONE";
  }
}

} // namespace circulation::model
