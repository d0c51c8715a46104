#pragma once

#include <memory>
#include <optional>
#include <string>

namespace circulation::db {
class Repository;
}

namespace circulation::collab {

/*
  Catalog collaborator: which copies exist and which book they belong to.
*/
class Catalog {
 public:
  virtual ~Catalog() = default;

  virtual bool                       CopyExists(const std::string& copy_id) = 0;
  virtual std::optional<std::string> BookOf(const std::string& copy_id)     = 0;
};

// Answers from the copies registered in the resource ledger.
class RepositoryCatalog final : public Catalog {
 public:
  explicit RepositoryCatalog(std::shared_ptr<db::Repository> repository);

  bool                       CopyExists(const std::string& copy_id) override;
  std::optional<std::string> BookOf(const std::string& copy_id) override;

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace circulation::collab
