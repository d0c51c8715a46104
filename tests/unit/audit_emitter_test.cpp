#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>

#include "internal/audit/audit_emitter.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/model/transition.hpp"

namespace {

using circulation::audit::AuditEmitter;
using circulation::db::ErrorCode;
using circulation::db::Result;
using circulation::db::Transaction;
using circulation::db::memory::MemoryRepository;
using circulation::model::EntityChange;
using circulation::model::Transition;

// Fails the next `failures` audit appends with an IO error.
class FlakyAuditRepository : public MemoryRepository {
 public:
  Result AppendAudit(Transaction& tx, const circulation::db::model::AuditRecord& record) override {
    if (failures > 0) {
      --failures;
      return Result::Err(ErrorCode::IOError, "audit store unavailable");
    }
    return MemoryRepository::AppendAudit(tx, record);
  }

  std::atomic<int> failures{0};
};

Transition LoanCreated(const std::string& transition_id) {
  Transition transition;
  transition.transition_id = transition_id;
  transition.changes.push_back(EntityChange{circulation::model::kEntityLoan, "l1", "NONE", "ACTIVE"});
  transition.changes.push_back(EntityChange{circulation::model::kEntityCopy, "c1", "AVAILABLE", "LOANED"});
  return transition;
}

std::size_t CountAudit(MemoryRepository& repo, const std::string& entity_type, const std::string& entity_id) {
  auto tx    = repo.Begin();
  auto count = repo.ListAuditByEntity(*tx, entity_type, entity_id).size();
  tx->Commit();
  return count;
}

void TestEventsCarryTransitionFields() {
  auto events = AuditEmitter::EventsFor(LoanCreated("t1"), "alice", "key-1", 42);
  assert(events.size() == 2);
  assert(events[0].event_id == "t1:loan");
  assert(events[0].entity_id == "l1");
  assert(events[0].from_state == "NONE");
  assert(events[0].to_state == "ACTIVE");
  assert(events[0].actor == "alice");
  assert(events[0].correlation_id == "key-1");
  assert(events[0].recorded_at_ms == 42);
  assert(events[1].event_id == "t1:copy");
  assert(AuditEmitter::EventId("t1", "copy") == "t1:copy");
}

void TestRecordTransitionStoresOneEventPerEntity() {
  auto         repo = std::make_shared<MemoryRepository>();
  AuditEmitter emitter(repo, 3);

  assert(emitter.RecordTransition(LoanCreated("t1"), "alice", "key-1") == 0);
  assert(CountAudit(*repo, "loan", "l1") == 1);
  assert(CountAudit(*repo, "copy", "c1") == 1);

  // Emitting the same transition again stores nothing new.
  assert(emitter.RecordTransition(LoanCreated("t1"), "alice", "key-1") == 0);
  assert(CountAudit(*repo, "loan", "l1") == 1);
  assert(emitter.PendingGaps() == 0);
}

void TestTransientFailureIsRetried() {
  auto repo      = std::make_shared<FlakyAuditRepository>();
  repo->failures = 2;
  AuditEmitter emitter(repo, 3);

  assert(emitter.RecordTransition(LoanCreated("t1"), "alice", "key-1") == 0);
  assert(CountAudit(*repo, "loan", "l1") == 1);
  assert(CountAudit(*repo, "copy", "c1") == 1);
  assert(emitter.PendingGaps() == 0);
}

void TestPersistentFailureIsQueuedAndDrained() {
  auto repo      = std::make_shared<FlakyAuditRepository>();
  repo->failures = 100;
  AuditEmitter emitter(repo, 2);

  assert(emitter.RecordTransition(LoanCreated("t1"), "alice", "key-1") == 2);
  assert(emitter.PendingGaps() == 2);
  assert(CountAudit(*repo, "loan", "l1") == 0);

  // Still failing: nothing drains.
  repo->failures = 100;
  assert(emitter.DrainBacklog() == 2);

  repo->failures = 0;
  assert(emitter.DrainBacklog() == 0);
  assert(emitter.PendingGaps() == 0);
  assert(CountAudit(*repo, "loan", "l1") == 1);
  assert(CountAudit(*repo, "copy", "c1") == 1);
}

} // namespace

int main() {
  TestEventsCarryTransitionFields();
  TestRecordTransitionStoresOneEventPerEntity();
  TestTransientFailureIsRetried();
  TestPersistentFailureIsQueuedAndDrained();

  std::cout << "circulation_unit_audit_emitter: pass\n";
  return 0;
}
