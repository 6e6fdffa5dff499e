#pragma once

#include <array>
#include <iterator>
#include <string>
#include <vector>

#include "sql_params.hpp"

namespace bazaar::db::sql {

enum class Dialect { kSqlite, kPostgres };

/*
  Canonical SQL used by all backends.

  IMPORTANT:
  Statements are written in the SQLite-compatible subset
  (INSERT .. ON CONFLICT, '?' placeholders) so they work in both engines.
  Table names carry the deployment prefix so several deployments can
  share one store.
*/
class Queries {
 public:
  // Throws util::InvalidArgument if the prefix is not [A-Za-z0-9_]*.
  explicit Queries(std::string table_prefix);

  const std::string& Sql(StatementId id) const;

  const std::string& UsersTable() const { return users_table_; }
  const std::string& InventoryTable() const { return inventory_table_; }

  // CREATE TABLE/INDEX statements, idempotent.
  std::vector<std::string> Schema(Dialect dialect) const;

  static bool IsValidPrefix(const std::string& prefix);

 private:
  std::string users_table_;
  std::string inventory_table_;

  std::array<std::string, std::size(kAllStatements)> sql_;
};

}
