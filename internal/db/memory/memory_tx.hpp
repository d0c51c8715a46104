#pragma once

#include <cstdint>
#include <string>
#include <unordered_set>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace circulation::db::memory {

/*
  Transaction = snapshot + write set

  Commit validates every written row against the committed row version
  (first committer wins) and merges only those rows back, so transactions
  touching different copies never conflict with each other.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State& Mutable() {
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

  // Records a write to a row; the row is validated and merged on commit.
  void Touch(const std::string& row_key) {
    touched_.insert(row_key);
  }

  void Appended(const model::LoanEventRecord& event) {
    pending_events_.push_back(event);
  }

  void Appended(const model::AuditRecord& record) {
    pending_audit_.push_back(record);
  }

 private:
  static uint64_t VersionOf(const MemoryRepository::State& state, const std::string& row_key);
  void            ApplyRow(MemoryRepository::State& target, const std::string& row_key) const;

  MemoryRepository&       repo_;
  MemoryRepository::State working_;

  std::unordered_set<std::string>     touched_;
  std::vector<model::LoanEventRecord> pending_events_;
  std::vector<model::AuditRecord>     pending_audit_;

  bool committed_   = false;
  bool rolled_back_ = false;
};

} // namespace circulation::db::memory
