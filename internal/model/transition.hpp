#pragma once

#include <string>
#include <vector>

#include "internal/db/model/loan_event_record.hpp"

namespace circulation::model {

inline constexpr const char* kEntityLoan = "loan";
inline constexpr const char* kEntityCopy = "copy";

struct EntityChange {
  std::string entity_type;
  std::string entity_id;
  std::string from_state;
  std::string to_state;
};

/*
  One committed state transition of the engine.

  transition_id is shared by the loan event written in the same store
  transaction and by every audit event emitted for it.
*/
struct Transition {
  std::string               transition_id;
  std::vector<EntityChange> changes;
};

// Loan event kinds.
inline constexpr const char* kLoanCreated  = "created";
inline constexpr const char* kLoanRenewed  = "renewed";
inline constexpr const char* kLoanReturned = "returned";
inline constexpr const char* kLoanLost     = "lost";

// Rebuilds the transition a loan event was written for. Unknown kinds
// yield a transition without changes.
Transition TransitionFor(const db::model::LoanEventRecord& event);

} // namespace circulation::model
