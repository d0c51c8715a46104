#include "resource_ledger.hpp"

#include "internal/model/circulation_state.hpp"
#include "internal/util/errors.hpp"

namespace circulation::ledger {

using namespace circulation::v1;
using db::model::CopyState;

ResourceLedger::ResourceLedger(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

db::model::CopyRecord ResourceLedger::GetCopy(db::Transaction& tx, const std::string& copy_id) {
  auto copy = repository_->GetCopy(tx, copy_id);
  if (!copy) {
    throw util::NotFound("copy " + copy_id + " not found");
  }
  return *copy;
}

std::optional<db::model::CopyRecord> ResourceLedger::FindCopy(db::Transaction& tx, const std::string& copy_id) {
  return repository_->GetCopy(tx, copy_id);
}

std::vector<db::model::CopyRecord> ResourceLedger::List(db::Transaction& tx) {
  return repository_->ListCopies(tx);
}

db::Result ResourceLedger::Register(db::Transaction& tx, const std::string& copy_id, const std::string& book_id, uint64_t now_ms) {
  db::model::CopyRecord record;
  record.copy_id       = copy_id;
  record.book_id       = book_id;
  record.status        = COPY_STATUS_AVAILABLE;
  record.updated_at_ms = now_ms;
  return repository_->InsertCopy(tx, record);
}

db::Result ResourceLedger::TryAllocate(db::Transaction& tx, const std::string& copy_id, const std::string& loan_id, uint64_t now_ms) {
  return repository_->TransitionCopy(tx, copy_id, CopyState{COPY_STATUS_AVAILABLE, ""}, CopyState{COPY_STATUS_LOANED, loan_id}, now_ms);
}

db::Result ResourceLedger::Release(db::Transaction& tx, const std::string& copy_id, const std::string& expected_loan_id, uint64_t now_ms) {
  return repository_->TransitionCopy(tx, copy_id, CopyState{COPY_STATUS_LOANED, expected_loan_id}, CopyState{COPY_STATUS_AVAILABLE, ""},
                                     now_ms);
}

db::Result ResourceLedger::MarkLost(db::Transaction& tx, const std::string& copy_id, const std::string& expected_loan_id, uint64_t now_ms) {
  return repository_->TransitionCopy(tx, copy_id, CopyState{COPY_STATUS_LOANED, expected_loan_id}, CopyState{COPY_STATUS_LOST, ""}, now_ms);
}

db::Result ResourceLedger::Retire(db::Transaction& tx, const std::string& copy_id, CopyStatus current, uint64_t now_ms) {
  if (!model::CanTransition(current, COPY_STATUS_RETIRED)) {
    return db::Result::Err(db::ErrorCode::Conflict, "copy " + copy_id + " cannot be retired from " + model::StateName(current));
  }
  return repository_->TransitionCopy(tx, copy_id, CopyState{current, ""}, CopyState{COPY_STATUS_RETIRED, ""}, now_ms);
}

} // namespace circulation::ledger
