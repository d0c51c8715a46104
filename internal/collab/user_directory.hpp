#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

namespace circulation::db {
class Repository;
}

namespace circulation::collab {

struct Eligibility {
  bool active           = false;
  bool under_loan_limit = false;

  bool Eligible() const {
    return active && under_loan_limit;
  }
};

/*
  User collaborator: may this member borrow right now?
*/
class UserDirectory {
 public:
  virtual ~UserDirectory() = default;

  virtual Eligibility IsEligible(const std::string& user_id) = 0;
};

/*
  Eligibility from configuration: a suspended-user list and a per-user
  limit on ACTIVE loans counted from the loan ledger. A limit of 0 means
  unlimited.

  The count is read before the checkout transaction, so two concurrent
  checkouts by one member on different copies can both pass at limit - 1.
*/
class ConfiguredUserDirectory final : public UserDirectory {
 public:
  ConfiguredUserDirectory(std::shared_ptr<db::Repository> repository, const std::vector<std::string>& suspended,
                          uint32_t max_active_loans);

  Eligibility IsEligible(const std::string& user_id) override;

 private:
  std::shared_ptr<db::Repository> repository_;
  std::unordered_set<std::string> suspended_;
  uint32_t                        max_active_loans_;
};

} // namespace circulation::collab
