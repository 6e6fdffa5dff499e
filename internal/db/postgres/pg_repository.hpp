#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace bazaar::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  Result Execute(Transaction&, const sql::Statement& statement, sql::ResultSet* rows) override;

  // Prepared statement set for a pool serving this repository.
  static PgPool::PreparedStatements PreparedFor(const sql::Queries& queries);

  // Rewrites '?' placeholders (outside quoted literals) to $1..$n.
  static std::string ToPostgresPlaceholders(const std::string& sql);

private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception& e);
};

}
