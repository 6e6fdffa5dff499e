#pragma once

#include <memory>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/sql/sql_params.hpp"
#include "internal/db/sql/sql_row.hpp"

namespace bazaar::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - Every statement runs inside a Transaction
  - Reads inside a transaction see its writes
  - A failed statement leaves the transaction usable only for Rollback()
  - Backend errors are returned as Result, never thrown, from Execute()

  Begin() and Transaction::Commit() may throw when the backend is
  unreachable; callers treat that as ErrorCode::Unavailable.

  The DB is the source of truth for:
    credit balances
    owned items
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Statements
  // ---------------------------------------------------------------------

  // Rows produced by the statement are appended to `rows` when non-null.
  virtual Result Execute(Transaction&, const sql::Statement& statement, sql::ResultSet* rows) = 0;
};

inline Result CheckArity(const sql::Statement& statement) {
  if (statement.params.size() != sql::ParamCount(statement.id)) {
    return Result::Err(ErrorCode::InternalError,
                       std::string(sql::StatementName(statement.id)) + ": expected " +
                           std::to_string(sql::ParamCount(statement.id)) + " params, got " +
                           std::to_string(statement.params.size()));
  }
  return Result::Ok();
}

} // namespace bazaar::db
