#include "memory_tx.hpp"

namespace circulation::db::memory {

namespace {

template <typename Map>
void CopyRow(const Map& from, Map& to, const std::string& id) {
  auto it = from.find(id);
  if (it == from.end()) {
    to.erase(id);
  } else {
    to[id] = it->second;
  }
}

} // namespace

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

uint64_t MemoryTransaction::VersionOf(const MemoryRepository::State& state, const std::string& row_key) {
  auto it = state.row_versions.find(row_key);
  return it == state.row_versions.end() ? 0 : it->second;
}

void MemoryTransaction::ApplyRow(MemoryRepository::State& target, const std::string& row_key) const {
  const auto table = static_cast<MemoryRepository::Table>(row_key.front());
  const auto id    = row_key.substr(2);

  switch (table) {
    case MemoryRepository::Table::kCopy:
      CopyRow(working_.copies, target.copies, id);
      break;
    case MemoryRepository::Table::kLoan:
      CopyRow(working_.loans, target.loans, id);
      break;
    case MemoryRepository::Table::kActiveLoan:
      CopyRow(working_.active_loan_by_copy, target.active_loan_by_copy, id);
      break;
    case MemoryRepository::Table::kIdempotency:
      CopyRow(working_.idempotency, target.idempotency, id);
      break;
  }
}

void MemoryTransaction::Commit() {
  std::scoped_lock lock(repo_.mutex_);
  auto&            target = repo_.committed_;

  for (const auto& row_key : touched_) {
    if (VersionOf(target, row_key) != VersionOf(working_, row_key)) {
      throw CommitConflict("transaction conflict: row " + row_key + " was modified by a concurrent transaction");
    }
  }
  for (const auto& record : pending_audit_) {
    if (target.audit_ids.contains(record.event_id)) {
      throw CommitConflict("transaction conflict: audit event " + record.event_id + " already appended");
    }
  }

  for (const auto& row_key : touched_) {
    ApplyRow(target, row_key);
    target.row_versions[row_key] = VersionOf(target, row_key) + 1;
  }

  // Sequence numbers handed out inside the transaction are provisional.
  for (auto event : pending_events_) {
    event.sequence = target.next_loan_event_seq++;
    target.loan_events.push_back(std::move(event));
  }
  for (const auto& record : pending_audit_) {
    target.audit_ids.insert(record.event_id);
    target.audit.push_back(record);
  }

  committed_ = true;
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
}

} // namespace circulation::db::memory
