#include "catalog.hpp"

#include "internal/db/api/repository.hpp"

namespace circulation::collab {

RepositoryCatalog::RepositoryCatalog(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

bool RepositoryCatalog::CopyExists(const std::string& copy_id) {
  return BookOf(copy_id).has_value();
}

std::optional<std::string> RepositoryCatalog::BookOf(const std::string& copy_id) {
  auto tx   = repository_->Begin();
  auto copy = repository_->GetCopy(*tx, copy_id);
  tx->Commit();
  if (!copy) return std::nullopt;
  return copy->book_id;
}

} // namespace circulation::collab
