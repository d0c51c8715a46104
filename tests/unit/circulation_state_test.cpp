#include <cassert>
#include <iostream>

#include "internal/db/model/loan_event_record.hpp"
#include "internal/model/circulation_state.hpp"
#include "internal/model/transition.hpp"

namespace {

using circulation::model::AllocationState;
using circulation::model::CanTransition;
using circulation::model::Derive;
using namespace circulation::v1;

void TestDeriveCoversEveryConsistentPair() {
  static_assert(Derive(COPY_STATUS_AVAILABLE, false) == AllocationState::kFree);
  static_assert(Derive(COPY_STATUS_LOANED, true) == AllocationState::kHeld);
  static_assert(Derive(COPY_STATUS_LOST, false) == AllocationState::kUnavailable);
  static_assert(Derive(COPY_STATUS_RETIRED, false) == AllocationState::kUnavailable);

  assert(Derive(COPY_STATUS_AVAILABLE, true) == AllocationState::kInconsistent);
  assert(Derive(COPY_STATUS_LOANED, false) == AllocationState::kInconsistent);
  assert(Derive(COPY_STATUS_LOST, true) == AllocationState::kInconsistent);
  assert(Derive(COPY_STATUS_UNSPECIFIED, false) == AllocationState::kInconsistent);
}

void TestCopyTransitions() {
  assert(CanTransition(COPY_STATUS_AVAILABLE, COPY_STATUS_LOANED));
  assert(CanTransition(COPY_STATUS_LOANED, COPY_STATUS_AVAILABLE));
  assert(CanTransition(COPY_STATUS_LOANED, COPY_STATUS_LOST));
  assert(CanTransition(COPY_STATUS_AVAILABLE, COPY_STATUS_RETIRED));
  assert(CanTransition(COPY_STATUS_LOST, COPY_STATUS_RETIRED));

  assert(!CanTransition(COPY_STATUS_LOANED, COPY_STATUS_LOANED));
  assert(!CanTransition(COPY_STATUS_LOANED, COPY_STATUS_RETIRED));
  assert(!CanTransition(COPY_STATUS_LOST, COPY_STATUS_AVAILABLE));
  assert(!CanTransition(COPY_STATUS_RETIRED, COPY_STATUS_AVAILABLE));
}

void TestLoanTransitionsLeaveTerminalStatesAlone() {
  assert(CanTransition(LOAN_STATUS_ACTIVE, LOAN_STATUS_ACTIVE));
  assert(CanTransition(LOAN_STATUS_ACTIVE, LOAN_STATUS_RETURNED));
  assert(CanTransition(LOAN_STATUS_ACTIVE, LOAN_STATUS_LOST));

  assert(!CanTransition(LOAN_STATUS_RETURNED, LOAN_STATUS_ACTIVE));
  assert(!CanTransition(LOAN_STATUS_LOST, LOAN_STATUS_RETURNED));

  assert(circulation::model::IsTerminal(LOAN_STATUS_RETURNED));
  assert(circulation::model::IsTerminal(LOAN_STATUS_LOST));
  assert(!circulation::model::IsTerminal(LOAN_STATUS_ACTIVE));
}

void TestTransitionForEachEventKind() {
  circulation::db::model::LoanEventRecord event;
  event.transition_id = "t-1";
  event.loan.loan_id  = "loan-1";
  event.loan.copy_id  = "copy-1";

  event.kind = circulation::model::kLoanCreated;
  auto created = circulation::model::TransitionFor(event);
  assert(created.transition_id == "t-1");
  assert(created.changes.size() == 2);
  assert(created.changes[0].entity_type == circulation::model::kEntityLoan);
  assert(created.changes[0].entity_id == "loan-1");
  assert(created.changes[0].from_state == "NONE");
  assert(created.changes[0].to_state == "ACTIVE");
  assert(created.changes[1].entity_type == circulation::model::kEntityCopy);
  assert(created.changes[1].entity_id == "copy-1");
  assert(created.changes[1].from_state == "AVAILABLE");
  assert(created.changes[1].to_state == "LOANED");

  event.kind = circulation::model::kLoanReturned;
  auto returned = circulation::model::TransitionFor(event);
  assert(returned.changes.size() == 2);
  assert(returned.changes[0].to_state == "RETURNED");
  assert(returned.changes[1].to_state == "AVAILABLE");

  event.kind = circulation::model::kLoanRenewed;
  auto renewed = circulation::model::TransitionFor(event);
  assert(renewed.changes.size() == 1);
  assert(renewed.changes[0].from_state == "ACTIVE");
  assert(renewed.changes[0].to_state == "ACTIVE");

  event.kind = circulation::model::kLoanLost;
  auto lost = circulation::model::TransitionFor(event);
  assert(lost.changes.size() == 2);
  assert(lost.changes[0].to_state == "LOST");
  assert(lost.changes[1].from_state == "LOANED");
  assert(lost.changes[1].to_state == "LOST");
}

} // namespace

int main() {
  TestDeriveCoversEveryConsistentPair();
  TestCopyTransitions();
  TestLoanTransitionsLeaveTerminalStatesAlone();
  TestTransitionForEachEventKind();

  std::cout << "circulation_unit_circulation_state: pass\n";
  return 0;
}
