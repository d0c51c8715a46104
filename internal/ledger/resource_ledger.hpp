#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace circulation::ledger {

/*
  Resource ledger: allocation status of every physical copy.

  Every mutation is a single conditional write (Repository::TransitionCopy);
  the ledger never reads a row and then writes it back. Conflict means the
  copy was not in the state the caller expected.

    TryAllocate  AVAILABLE            -> LOANED(loan_id)
    Release      LOANED(loan_id)      -> AVAILABLE
    MarkLost     LOANED(loan_id)      -> LOST
    Retire       AVAILABLE | LOST     -> RETIRED
*/
class ResourceLedger {
 public:
  explicit ResourceLedger(std::shared_ptr<db::Repository> repository);

  // Throws util::NotFound.
  db::model::CopyRecord                GetCopy(db::Transaction& tx, const std::string& copy_id);
  std::optional<db::model::CopyRecord> FindCopy(db::Transaction& tx, const std::string& copy_id);
  std::vector<db::model::CopyRecord>   List(db::Transaction& tx);

  db::Result Register(db::Transaction& tx, const std::string& copy_id, const std::string& book_id, uint64_t now_ms);

  db::Result TryAllocate(db::Transaction& tx, const std::string& copy_id, const std::string& loan_id, uint64_t now_ms);
  db::Result Release(db::Transaction& tx, const std::string& copy_id, const std::string& expected_loan_id, uint64_t now_ms);
  db::Result MarkLost(db::Transaction& tx, const std::string& copy_id, const std::string& expected_loan_id, uint64_t now_ms);

  // `current` is the status the caller observed in this transaction.
  db::Result Retire(db::Transaction& tx, const std::string& copy_id, circulation::v1::CopyStatus current, uint64_t now_ms);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace circulation::ledger
