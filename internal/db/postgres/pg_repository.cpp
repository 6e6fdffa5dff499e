#include "pg_repository.hpp"

namespace bazaar::db::postgres {

namespace {

pqxx::params ToPqxxParams(const sql::Params& params) {
  pqxx::params out;
  for (const auto& p : params) {
    if (const auto* s = std::get_if<std::string>(&p)) {
      out.append(*s);
    } else if (const auto* i = std::get_if<int64_t>(&p)) {
      out.append(*i);
    } else {
      out.append();
    }
  }
  return out;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

PgPool::PreparedStatements PgRepository::PreparedFor(const sql::Queries& queries) {
  PgPool::PreparedStatements prepared;
  for (auto id : sql::kAllStatements) {
    prepared.emplace_back(std::string(sql::StatementName(id)), ToPostgresPlaceholders(queries.Sql(id)));
  }
  return prepared;
}

std::string PgRepository::ToPostgresPlaceholders(const std::string& sql) {
  std::string out;
  out.reserve(sql.size() + 8);
  int  next     = 1;
  bool in_quote = false;
  for (char c : sql) {
    if (c == '\'') in_quote = !in_quote;
    if (c == '?' && !in_quote) {
      out += '$';
      out += std::to_string(next++);
      continue;
    }
    out += c;
  }
  return out;
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::Unavailable, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) || dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::in_doubt_error*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::Execute(Transaction& t, const sql::Statement& statement, sql::ResultSet* rows) {
  if (auto arity = CheckArity(statement); !arity) return arity;

  try {
    auto res = TX(t).Work().exec_prepared(std::string(sql::StatementName(statement.id)), ToPqxxParams(statement.params));
    if (!rows) return Result::Ok();

    rows->reserve(rows->size() + res.size());
    for (const auto& row : res) {
      sql::Row out;
      for (const auto& field : row) {
        if (field.is_null()) {
          out.Append(nullptr);
        } else {
          out.Append(std::string(field.c_str()));
        }
      }
      rows->push_back(std::move(out));
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

}
