#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace bazaar::db::sql {

/*
  Parameter abstraction.

  Postgres: $1 $2 $3
  SQLite:   ? ? ?

  Both use ordered binding → canonical SQL is written with '?'
  and the Postgres backend rewrites placeholders once at prepare time.
*/

using Param = std::variant<
    std::nullptr_t,
    int64_t,
    std::string
>;

using Params = std::vector<Param>;

/*
  Named statements.

  Every backend maps each id to its own executable form:
    sqlite   -> prefixed SQL text
    postgres -> prepared statement of the same name
    memory   -> direct manipulation of the in-memory tables
*/
enum class StatementId {
  // (identity, credits, created_at_ms, updated_at_ms) - insert the default row when absent
  kEnsureUser,
  // (identity) -> identity, credits, updated_at_ms
  kSelectUser,
  // (identity, credits, created_at_ms, updated_at_ms)
  kUpsertUser,
  // (identity) -> category_key, item_key, acquired_at_ms, price_paid
  kSelectInventory,
  // (identity)
  kDeleteInventory,
  // (identity, category_key, item_key, acquired_at_ms, price_paid)
  kInsertInventory,
};

struct Statement {
  StatementId id;
  Params      params;
};

constexpr std::string_view StatementName(StatementId id) {
  switch (id) {
    case StatementId::kEnsureUser: return "ensure_user";
    case StatementId::kSelectUser: return "select_user";
    case StatementId::kUpsertUser: return "upsert_user";
    case StatementId::kSelectInventory: return "select_inventory";
    case StatementId::kDeleteInventory: return "delete_inventory";
    case StatementId::kInsertInventory: return "insert_inventory";
  }
  return "unknown";
}

inline constexpr StatementId kAllStatements[] = {
    StatementId::kEnsureUser,      StatementId::kSelectUser,      StatementId::kUpsertUser,
    StatementId::kSelectInventory, StatementId::kDeleteInventory, StatementId::kInsertInventory,
};

// Number of '?' parameters each statement binds.
constexpr std::size_t ParamCount(StatementId id) {
  switch (id) {
    case StatementId::kEnsureUser: return 4;
    case StatementId::kSelectUser: return 1;
    case StatementId::kUpsertUser: return 4;
    case StatementId::kSelectInventory: return 1;
    case StatementId::kDeleteInventory: return 1;
    case StatementId::kInsertInventory: return 5;
  }
  return 0;
}

}
