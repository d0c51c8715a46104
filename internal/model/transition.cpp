#include "internal/model/transition.hpp"

#include "internal/model/circulation_state.hpp"

namespace circulation::model {

using namespace circulation::v1;

Transition TransitionFor(const db::model::LoanEventRecord& event) {
  Transition transition;
  transition.transition_id = event.transition_id;

  const auto& loan = event.loan;
  auto        add  = [&](const char* type, const std::string& id, std::string from, std::string to) {
    transition.changes.push_back(EntityChange{type, id, std::move(from), std::move(to)});
  };

  if (event.kind == kLoanCreated) {
    add(kEntityLoan, loan.loan_id, StateName(LOAN_STATUS_UNSPECIFIED), StateName(LOAN_STATUS_ACTIVE));
    add(kEntityCopy, loan.copy_id, StateName(COPY_STATUS_AVAILABLE), StateName(COPY_STATUS_LOANED));
  } else if (event.kind == kLoanReturned) {
    add(kEntityLoan, loan.loan_id, StateName(LOAN_STATUS_ACTIVE), StateName(LOAN_STATUS_RETURNED));
    add(kEntityCopy, loan.copy_id, StateName(COPY_STATUS_LOANED), StateName(COPY_STATUS_AVAILABLE));
  } else if (event.kind == kLoanRenewed) {
    add(kEntityLoan, loan.loan_id, StateName(LOAN_STATUS_ACTIVE), StateName(LOAN_STATUS_ACTIVE));
  } else if (event.kind == kLoanLost) {
    add(kEntityLoan, loan.loan_id, StateName(LOAN_STATUS_ACTIVE), StateName(LOAN_STATUS_LOST));
    add(kEntityCopy, loan.copy_id, StateName(COPY_STATUS_LOANED), StateName(COPY_STATUS_LOST));
  }
  return transition;
}

} // namespace circulation::model
