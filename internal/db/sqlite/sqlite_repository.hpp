#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace bazaar::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  SqliteRepository(std::shared_ptr<SqliteDB> db, sql::Queries queries);

  std::unique_ptr<Transaction> Begin() override;

  Result Execute(Transaction&, const sql::Statement& statement, sql::ResultSet* rows) override;

private:
  std::shared_ptr<SqliteDB> db_;
  sql::Queries queries_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
