#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "circulation/v1.hpp"
#include "internal/core/operation_context.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/transition.hpp"

namespace circulation::collab {
class Catalog;
class UserDirectory;
} // namespace circulation::collab

namespace circulation::ledger {
class LoanLedger;
class ResourceLedger;
} // namespace circulation::ledger

namespace circulation::core {

// Outcome of a committed engine operation plus the transition to audit.
template <typename T>
struct Committed {
  T                 value;
  model::Transition transition;
};

/*
  Allocation engine.

  Runs every copy/loan state change as ONE store transaction across both
  ledgers:

    Checkout    FREE -> HELD         createActiveLoan + tryAllocate
    ReturnCopy  HELD -> FREE         completeReturn + release
    Renew       HELD -> HELD         renew (due date, renewal count)
    ReportLost  HELD -> UNAVAILABLE  loan LOST + copy LOST
    RetireCopy  FREE | LOST -> RETIRED
    RegisterCopy                     new AVAILABLE copy

  Any ledger conflict aborts the whole transaction and surfaces as
  util::Conflict. Operations on one copy are additionally serialized by a
  per-copy timed mutex; waiting past the caller deadline raises
  util::Timeout and changes nothing.

  Thread-safe.
*/
class AllocationEngine {
 public:
  struct Options {
    std::chrono::milliseconds loan_period{std::chrono::hours(24 * 14)};
    uint32_t                  max_renewals = 2;
  };

  AllocationEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<ledger::ResourceLedger> resources,
                   std::shared_ptr<ledger::LoanLedger> loans, std::shared_ptr<collab::Catalog> catalog,
                   std::shared_ptr<collab::UserDirectory> users, Options options);

  Committed<circulation::v1::Loan>       Checkout(const std::string& copy_id, const std::string& user_id, const OperationContext& op);
  Committed<circulation::v1::Receipt>    ReturnCopy(const std::string& copy_id, const std::string& user_id, const OperationContext& op);
  Committed<circulation::v1::Renewal>    Renew(const std::string& loan_id, const OperationContext& op);
  Committed<circulation::v1::LossReport> ReportLost(const std::string& copy_id, const OperationContext& op);
  Committed<circulation::v1::Copy>       RetireCopy(const std::string& copy_id, const OperationContext& op);
  Committed<circulation::v1::Copy>       RegisterCopy(const std::string& copy_id, const std::string& book_id, const OperationContext& op);

  // Number of per-copy locks held in the lock table.
  std::size_t TrackedCopyLocks() const;

 private:
  std::shared_ptr<std::timed_mutex> CopyMutex(const std::string& copy_id);

  // Throws util::NotFound for copies the catalog does not know. Runs before
  // CopyMutex so unknown ids never enter the lock table.
  void RequireCopy(const std::string& copy_id) const;

  // Begins, runs `body`, commits. A commit-time conflict becomes
  // util::Conflict(conflict_message).
  void RunTransaction(const std::string& conflict_message, const std::function<void(db::Transaction&)>& body);

  std::shared_ptr<db::Repository>         repository_;
  std::shared_ptr<ledger::ResourceLedger> resources_;
  std::shared_ptr<ledger::LoanLedger>     loans_;
  std::shared_ptr<collab::Catalog>        catalog_;
  std::shared_ptr<collab::UserDirectory>  users_;
  Options                                 options_;

  mutable std::mutex                                                 copy_mutexes_guard_;
  std::unordered_map<std::string, std::shared_ptr<std::timed_mutex>> copy_mutexes_;
};

} // namespace circulation::core
