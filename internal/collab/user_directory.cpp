#include "user_directory.hpp"

#include "internal/db/api/repository.hpp"

namespace circulation::collab {

ConfiguredUserDirectory::ConfiguredUserDirectory(std::shared_ptr<db::Repository> repository, const std::vector<std::string>& suspended,
                                                 uint32_t max_active_loans)
    : repository_(std::move(repository)), suspended_(suspended.begin(), suspended.end()), max_active_loans_(max_active_loans) {
}

Eligibility ConfiguredUserDirectory::IsEligible(const std::string& user_id) {
  Eligibility eligibility;
  eligibility.active = !suspended_.contains(user_id);

  if (max_active_loans_ == 0) {
    eligibility.under_loan_limit = true;
    return eligibility;
  }

  auto tx     = repository_->Begin();
  auto active = repository_->CountActiveLoansByUser(*tx, user_id);
  tx->Commit();

  eligibility.under_loan_limit = active < max_active_loans_;
  return eligibility;
}

} // namespace circulation::collab
