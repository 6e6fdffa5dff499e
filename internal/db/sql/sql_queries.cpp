#include "sql_queries.hpp"

#include <cctype>

#include "internal/util/errors.hpp"

namespace bazaar::db::sql {

bool Queries::IsValidPrefix(const std::string& prefix) {
  for (unsigned char c : prefix) {
    if (!std::isalnum(c) && c != '_') return false;
  }
  return true;
}

Queries::Queries(std::string table_prefix) {
  if (!IsValidPrefix(table_prefix)) {
    throw util::InvalidArgument("table prefix must match [A-Za-z0-9_]*: " + table_prefix);
  }

  users_table_     = table_prefix + "users";
  inventory_table_ = table_prefix + "inventory";

  const auto& u = users_table_;
  const auto& i = inventory_table_;

  sql_[static_cast<std::size_t>(StatementId::kEnsureUser)] =
      "INSERT INTO " + u + "(identity,credits,created_at_ms,updated_at_ms) VALUES(?,?,?,?)"
      " ON CONFLICT(identity) DO NOTHING;";
  sql_[static_cast<std::size_t>(StatementId::kSelectUser)] =
      "SELECT identity,credits,updated_at_ms FROM " + u + " WHERE identity=?;";
  sql_[static_cast<std::size_t>(StatementId::kUpsertUser)] =
      "INSERT INTO " + u + "(identity,credits,created_at_ms,updated_at_ms) VALUES(?,?,?,?)"
      " ON CONFLICT(identity) DO UPDATE SET"
      " credits=excluded.credits,"
      " updated_at_ms=excluded.updated_at_ms;";
  sql_[static_cast<std::size_t>(StatementId::kSelectInventory)] =
      "SELECT category_key,item_key,acquired_at_ms,price_paid FROM " + i +
      " WHERE identity=? ORDER BY acquired_at_ms,category_key,item_key;";
  sql_[static_cast<std::size_t>(StatementId::kDeleteInventory)] =
      "DELETE FROM " + i + " WHERE identity=?;";
  sql_[static_cast<std::size_t>(StatementId::kInsertInventory)] =
      "INSERT INTO " + i + "(identity,category_key,item_key,acquired_at_ms,price_paid) VALUES(?,?,?,?,?);";
}

const std::string& Queries::Sql(StatementId id) const {
  return sql_.at(static_cast<std::size_t>(id));
}

std::vector<std::string> Queries::Schema(Dialect dialect) const {
  const auto& u = users_table_;
  const auto& i = inventory_table_;

  if (dialect == Dialect::kPostgres) {
    return {
        "CREATE TABLE IF NOT EXISTS " + u +
            " (identity TEXT PRIMARY KEY, credits BIGINT NOT NULL, created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL);",
        "CREATE TABLE IF NOT EXISTS " + i +
            " (identity TEXT NOT NULL REFERENCES " + u + "(identity) ON DELETE CASCADE, category_key TEXT NOT NULL,"
            " item_key TEXT NOT NULL, acquired_at_ms BIGINT NOT NULL, price_paid BIGINT NOT NULL,"
            " PRIMARY KEY (identity, category_key, item_key));",
    };
  }

  return {
      "CREATE TABLE IF NOT EXISTS " + u +
          " (identity TEXT PRIMARY KEY, credits INTEGER NOT NULL, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS " + i +
          " (identity TEXT NOT NULL, category_key TEXT NOT NULL, item_key TEXT NOT NULL,"
          " acquired_at_ms INTEGER NOT NULL, price_paid INTEGER NOT NULL,"
          " PRIMARY KEY (identity, category_key, item_key),"
          " FOREIGN KEY(identity) REFERENCES " + u + "(identity) ON DELETE CASCADE);",
  };
}

}
