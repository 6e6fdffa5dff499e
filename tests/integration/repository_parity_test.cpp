#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/factory.hpp"

namespace {

using bazaar::db::ErrorCode;
using bazaar::db::Repository;
using bazaar::db::sql::ResultSet;
using bazaar::db::sql::Statement;
using bazaar::db::sql::StatementId;
using bazaar::runtime::config::RuntimeConfig;

std::int64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                                  name;
  std::function<std::shared_ptr<Repository>(const std::string&)> make_repository;
  std::function<void()>                                        cleanup;
  bool                                                         supports_restart  = true;
  bool                                                         isolates_prefixes = true;
  // concurrent transactions beyond this many fail instead of waiting forever
  std::size_t                                                  max_open_transactions = 0;
};

Statement EnsureUser(const std::string& identity, std::int64_t credits) {
  const auto now = NowMs();
  return {StatementId::kEnsureUser, {identity, credits, now, now}};
}

Statement UpsertUser(const std::string& identity, std::int64_t credits) {
  const auto now = NowMs();
  return {StatementId::kUpsertUser, {identity, credits, now, now}};
}

Statement InsertItem(const std::string& identity, const std::string& category, const std::string& item, std::int64_t acquired,
                     std::int64_t price) {
  return {StatementId::kInsertInventory, {identity, category, item, acquired, price}};
}

ResultSet Select(Repository& repo, StatementId id, const std::string& identity) {
  auto      tx = repo.Begin();
  ResultSet rows;
  auto      result = repo.Execute(*tx, {id, {identity}}, &rows);
  assert(result);
  tx->Commit();
  return rows;
}

void Commit(Repository& repo, const std::vector<Statement>& statements) {
  auto tx = repo.Begin();
  for (const auto& statement : statements) {
    auto result = repo.Execute(*tx, statement, nullptr);
    assert(result);
  }
  tx->Commit();
}

ErrorCode FailingCode(Repository& repo, const std::vector<Statement>& statements) {
  auto tx = repo.Begin();
  for (const auto& statement : statements) {
    auto result = repo.Execute(*tx, statement, nullptr);
    if (!result) {
      tx->Rollback();
      return result.code;
    }
  }
  tx->Commit();
  return ErrorCode::OK;
}

void VerifyEnsureAndUpsert(Repository& repo, const std::string& identity) {
  Commit(repo, {EnsureUser(identity, 2000)});

  auto rows = Select(repo, StatementId::kSelectUser, identity);
  assert(rows.size() == 1);
  assert(rows[0].GetText(0) == identity);
  assert(rows[0].GetInt64(1) == 2000);

  Commit(repo, {UpsertUser(identity, 2500)});
  // an existing row is never reset to the starting balance
  Commit(repo, {EnsureUser(identity, 2000)});

  rows = Select(repo, StatementId::kSelectUser, identity);
  assert(rows.size() == 1);
  assert(rows[0].GetInt64(1) == 2500);

  Commit(repo, {UpsertUser(identity + "-new", 75)});
  rows = Select(repo, StatementId::kSelectUser, identity + "-new");
  assert(rows.size() == 1);
  assert(rows[0].GetInt64(1) == 75);

  assert(Select(repo, StatementId::kSelectUser, identity + "-absent").empty());
}

void VerifyInventoryReadWrite(Repository& repo, const std::string& identity) {
  Commit(repo, {EnsureUser(identity, 0), InsertItem(identity, "weapons", "ak47", 30, 1500),
                InsertItem(identity, "gear", "kevlar", 10, 650), InsertItem(identity, "gear", "helmet", 10, 350)});

  auto rows = Select(repo, StatementId::kSelectInventory, identity);
  assert(rows.size() == 3);
  assert(rows[0].GetText(1) == "helmet");
  assert(rows[1].GetText(1) == "kevlar");
  assert(rows[2].GetText(0) == "weapons");
  assert(rows[2].GetText(1) == "ak47");
  assert(rows[2].GetInt64(2) == 30);
  assert(rows[2].GetInt64(3) == 1500);

  // full rewrite, the way a flush replaces the owned set
  Commit(repo, {Statement{StatementId::kDeleteInventory, {identity}}, InsertItem(identity, "gear", "kevlar", 10, 650)});
  rows = Select(repo, StatementId::kSelectInventory, identity);
  assert(rows.size() == 1);
  assert(rows[0].GetText(1) == "kevlar");

  Commit(repo, {Statement{StatementId::kDeleteInventory, {identity}}});
  assert(Select(repo, StatementId::kSelectInventory, identity).empty());
}

void VerifyConstraintViolations(Repository& repo, const std::string& identity) {
  Commit(repo, {EnsureUser(identity, 0), InsertItem(identity, "gear", "kevlar", 1, 650)});

  assert(FailingCode(repo, {InsertItem(identity, "gear", "kevlar", 2, 650)}) == ErrorCode::ConstraintViolation);
  assert(FailingCode(repo, {InsertItem(identity + "-ghost", "gear", "kevlar", 2, 650)}) == ErrorCode::ConstraintViolation);

  // the failed transactions left nothing behind
  auto rows = Select(repo, StatementId::kSelectInventory, identity);
  assert(rows.size() == 1);
  assert(rows[0].GetInt64(2) == 1);
  assert(Select(repo, StatementId::kSelectUser, identity + "-ghost").empty());

  // the statement that just failed binds and runs cleanly next time
  Commit(repo, {InsertItem(identity, "gear", "helmet", 3, 350)});
  rows = Select(repo, StatementId::kSelectInventory, identity);
  assert(rows.size() == 2);
  assert(rows[1].GetText(1) == "helmet");
  assert(rows[1].GetInt64(3) == 350);
}

void VerifyRollbackBehavior(Repository& repo, const std::string& identity) {
  {
    auto tx = repo.Begin();
    assert(repo.Execute(*tx, EnsureUser(identity, 10), nullptr));

    ResultSet inside;
    assert(repo.Execute(*tx, {StatementId::kSelectUser, {identity}}, &inside));
    assert(inside.size() == 1);

    tx->Rollback();
    assert(!tx->IsCommitted());
  }
  assert(Select(repo, StatementId::kSelectUser, identity).empty());

  {
    // dropped without Commit()
    auto tx = repo.Begin();
    assert(repo.Execute(*tx, EnsureUser(identity, 10), nullptr));
  }
  assert(Select(repo, StatementId::kSelectUser, identity).empty());

  // a failing statement takes the earlier writes of its transaction with it
  assert(FailingCode(repo, {EnsureUser(identity, 10), InsertItem(identity + "-ghost", "gear", "kevlar", 1, 1)}) ==
         ErrorCode::ConstraintViolation);
  assert(Select(repo, StatementId::kSelectUser, identity).empty());
}

void VerifyArityIsChecked(Repository& repo) {
  auto tx = repo.Begin();

  auto result = repo.Execute(*tx, {StatementId::kSelectUser, {}}, nullptr);
  assert(result.code == ErrorCode::InternalError);
  assert(result.message.find("select_user") != std::string::npos);
  tx->Rollback();

  tx     = repo.Begin();
  result = repo.Execute(*tx, {StatementId::kInsertInventory, {std::string("a"), std::string("b")}}, nullptr);
  assert(result.code == ErrorCode::InternalError);
  tx->Rollback();
}

void VerifyPrefixIsolation(BackendFactory& backend, const std::string& prefix, const std::string& identity) {
  if (!backend.isolates_prefixes) return;

  auto first  = backend.make_repository(prefix);
  auto second = backend.make_repository(prefix + "b_");

  Commit(*first, {EnsureUser(identity, 5)});
  assert(Select(*first, StatementId::kSelectUser, identity).size() == 1);
  assert(Select(*second, StatementId::kSelectUser, identity).empty());
}

void VerifyTransactionsAreBounded(BackendFactory& backend, const std::string& prefix) {
  if (backend.max_open_transactions == 0) return;

  auto                                                  repo = backend.make_repository(prefix);
  std::vector<std::unique_ptr<bazaar::db::Transaction>> open;
  for (std::size_t i = 0; i < backend.max_open_transactions; ++i) {
    open.push_back(repo->Begin());
  }

  bool timed_out = false;
  try {
    auto extra = repo->Begin();
  } catch (const std::runtime_error&) {
    timed_out = true;
  }
  assert(timed_out);

  // a returned connection serves the next transaction
  open.pop_back();
  Commit(*repo, {EnsureUser(backend.name + "-bounded", 1)});
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& prefix, const std::string& identity) {
  if (!backend.supports_restart) return;

  {
    auto repo = backend.make_repository(prefix);
    Commit(*repo, {EnsureUser(identity, 0), UpsertUser(identity, 4200), InsertItem(identity, "weapons", "deagle", 7, 700)});
  }

  auto reopened = backend.make_repository(prefix);
  auto user     = Select(*reopened, StatementId::kSelectUser, identity);
  assert(user.size() == 1);
  assert(user[0].GetInt64(1) == 4200);

  auto items = Select(*reopened, StatementId::kSelectInventory, identity);
  assert(items.size() == 1);
  assert(items[0].GetText(1) == "deagle");
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name            = "memory",
      .make_repository = [](const std::string&) { return bazaar::factory::BuildRepository(RuntimeConfig{}); },
      .cleanup         = []() {},
      .supports_restart  = false,
      .isolates_prefixes = false,
  };
}

#if BAZAAR_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  const auto db_path = std::filesystem::temp_directory_path() / ("bazaar_repository_parity_" + std::to_string(NowMs()) + ".db");

  auto make_repo = [db_path](const std::string& prefix) {
    RuntimeConfig config;
    auto*         database = config.mutable_database();
    database->set_table_prefix(prefix);
    database->mutable_sqlite()->set_path(db_path.string());
    database->mutable_sqlite()->set_wal_mode(true);
    return bazaar::factory::BuildRepository(config);
  };

  return BackendFactory{
      .name            = "sqlite",
      .make_repository = make_repo,
      .cleanup =
          [db_path]() {
            std::filesystem::remove(db_path);
            std::filesystem::remove(db_path.string() + "-wal");
            std::filesystem::remove(db_path.string() + "-shm");
          },
  };
}
#endif

#if BAZAAR_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("BAZAAR_TEST_PG_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("BAZAAR_TEST_PG_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo](const std::string& prefix) {
    RuntimeConfig config;
    auto*         database = config.mutable_database();
    database->set_table_prefix(prefix);
    database->mutable_postgres()->set_connection_uri(conninfo);
    database->mutable_postgres()->set_max_connections(2);
    database->mutable_postgres()->mutable_acquire_timeout()->set_nanos(200000000);
    return bazaar::factory::BuildRepository(config);
  };

  return BackendFactory{
      .name                  = "postgres",
      .make_repository       = make_repo,
      .cleanup               = []() {},
      .max_open_transactions = 2,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";

  // fresh tables per run so reruns against a shared server start empty
  const auto prefix = "parity_" + std::to_string(NowMs()) + "_";
  auto       repo   = backend.make_repository(prefix);

  VerifyEnsureAndUpsert(*repo, backend.name + "-ensure");
  VerifyInventoryReadWrite(*repo, backend.name + "-inventory");
  VerifyConstraintViolations(*repo, backend.name + "-constraints");
  VerifyRollbackBehavior(*repo, backend.name + "-rollback");
  VerifyArityIsChecked(*repo);
  repo.reset();

  VerifyPrefixIsolation(backend, prefix + "iso_", backend.name + "-isolated");
  VerifyRestartDurability(backend, prefix + "durable_", backend.name + "-durable");
  VerifyTransactionsAreBounded(backend, prefix + "bounded_");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if BAZAAR_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if BAZAAR_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "bazaar_integration_repository_parity: pass\n";
  return 0;
}
