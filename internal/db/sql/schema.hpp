#pragma once

#include <string>
#include <vector>

namespace circulation::db::sql {

/*
  Bootstrap DDL per backend, applied in order with CREATE ... IF NOT EXISTS.

  Both schemas carry the ledger-level uniqueness rule as a partial unique
  index: at most one loan row with status ACTIVE (1) per copy_id.
*/

const std::vector<std::string>& SqliteSchema();
const std::vector<std::string>& PostgresSchema();

} // namespace circulation::db::sql
