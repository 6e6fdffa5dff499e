#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/catalog/registry.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/gateway/persistence_gateway.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/economy_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/time.hpp"
#if BAZAAR_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if BAZAAR_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace bazaar::factory {

using namespace std::chrono_literals;
using observability::BoolField;
using observability::DurationField;
using observability::IntField;
using observability::StringField;
using observability::UintField;

namespace {

#if BAZAAR_DB_SQLITE
class SqliteMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(std::shared_ptr<db::sqlite::SqliteDB> db) : db_(std::move(db)) {
  }

  void ExecuteSQL(const std::string& sql) override {
    db_->Exec(sql);
  }

 private:
  std::shared_ptr<db::sqlite::SqliteDB> db_;
};
#endif

#if BAZAAR_DB_POSTGRES
class PgMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit PgMigrationExecutor(std::shared_ptr<db::postgres::PgPool> pool) : pool_(std::move(pool)) {
  }

  void ExecuteSQL(const std::string& sql) override {
    auto       conn = pool_->Acquire();
    pqxx::work tx(*conn);
    tx.exec(sql);
    tx.commit();
  }

 private:
  std::shared_ptr<db::postgres::PgPool> pool_;
};
#endif

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const bazaar::runtime::config::RuntimeConfig& config) {
  const auto&       database = config.database();
  db::sql::Queries queries(database.table_prefix());

  if (database.has_sqlite()) {
#if BAZAAR_DB_SQLITE
    db::sqlite::SqliteOptions sqlite_options;
    sqlite_options.wal_mode     = database.sqlite().wal_mode();
    sqlite_options.full_sync    = database.sqlite().full_sync();
    sqlite_options.busy_timeout = util::FromProto(database.sqlite().busy_timeout(), 5s);
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), sqlite_options);

    SqliteMigrationExecutor migrations(sqlite_db);
    db::sql::RunMigrations(migrations, queries.Schema(db::sql::Dialect::kSqlite));

    BAZAAR_LOG_INFO("sqlite repository ready", {StringField("path", database.sqlite().path()),
                                                StringField("users_table", queries.UsersTable()),
                                                BoolField("wal_mode", database.sqlite().wal_mode())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db), std::move(queries));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if BAZAAR_DB_POSTGRES
    db::postgres::PgPool::Options pool_options;
    pool_options.max_connections = database.postgres().max_connections() > 0 ? database.postgres().max_connections() : 16u;
    pool_options.acquire_timeout = util::FromProto(database.postgres().acquire_timeout(), 5s);
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(),
                                                       db::postgres::PgRepository::PreparedFor(queries), pool_options);

    PgMigrationExecutor migrations(pool);
    db::sql::RunMigrations(migrations, queries.Schema(db::sql::Dialect::kPostgres));

    BAZAAR_LOG_INFO("postgres repository ready",
                    {StringField("users_table", queries.UsersTable()), UintField("max_connections", pool_options.max_connections),
                     DurationField("acquire_timeout", pool_options.acquire_timeout)});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  BAZAAR_LOG_WARN("no database configured; using the in-memory repository, state is lost on exit");
  return std::make_shared<db::memory::MemoryRepository>();
}

session::SessionOptions SessionOptionsFrom(const bazaar::runtime::config::RuntimeConfig& config) {
  const auto& economy = config.economy();

  session::SessionOptions options;
  options.starting_balance = economy.starting_balance();
  options.credit_floor     = economy.has_credit_floor() ? economy.credit_floor() : 0;
  if (economy.has_credit_ceiling()) {
    options.credit_ceiling = economy.credit_ceiling();
  }
  options.flush_interval     = util::FromProto(economy.flush_interval(), 30s);
  options.load_timeout       = util::FromProto(economy.load_timeout(), 10s);
  options.flush_timeout      = util::FromProto(economy.flush_timeout(), 10s);
  options.max_flush_attempts = economy.max_flush_attempts() > 0 ? economy.max_flush_attempts() : 3;
  return options;
}

gateway::GatewayOptions GatewayOptionsFrom(const bazaar::runtime::config::RuntimeConfig& config) {
  const auto& gw = config.gateway();

  gateway::GatewayOptions options;
  options.workers            = gw.workers() > 0 ? gw.workers() : 2;
  options.retry.max_attempts = gw.max_read_attempts() > 0 ? gw.max_read_attempts() : 3;
  options.retry.backoff      = util::FromProto(gw.retry_backoff(), 50ms);
  return options;
}

/*
    Build full application dependency graph
*/
Application Build(const bazaar::runtime::config::RuntimeConfig& config, session::SessionCache::ClockFn clock) {
  Application app;

  // ------------------------------------------------------------------
  // Persistence
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);
  app.gateway    = std::make_shared<gateway::PersistenceGateway>(app.repository, GatewayOptionsFrom(config));
  app.gateway->Start();

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  app.registry = std::make_shared<catalog::Registry>();
  app.sessions =
      std::make_shared<session::SessionCache>(*app.registry, *app.gateway, SessionOptionsFrom(config), std::move(clock));

  // ------------------------------------------------------------------
  // API
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.registry = app.registry;
  ctx.sessions = app.sessions;
  app.api      = std::make_shared<service::EconomyService>(ctx);

  if (config.has_catalog()) {
    SeedCatalog(*app.api, config.catalog());
  }

  const auto& options = app.sessions->Options();
  BAZAAR_LOG_INFO("economy engine built",
                  {IntField("starting_balance", options.starting_balance), IntField("credit_floor", options.credit_floor),
                   DurationField("flush_interval", options.flush_interval),
                   UintField("categories", app.registry->CategoryCount()), UintField("items", app.registry->ItemCount())});
  return app;
}

void SeedCatalog(economy::v1::EconomyApi& api, const bazaar::runtime::config::CatalogConfig& catalog) {
  using economy::v1::CategoryHandle;
  using economy::v1::ItemHandle;

  for (const auto& category : catalog.categories()) {
    CategoryHandle handle;
    auto           status = api.RegisterCategory({category.key(), category.name(), category.description()}, &handle);
    if (!status) {
      throw std::runtime_error("catalog category '" + category.key() + "': " + std::string(StatusCodeName(status.code)) +
                               ": " + status.message);
    }

    for (const auto& item : category.items()) {
      ItemHandle item_handle;
      status = api.RegisterItem(handle, {item.key(), item.name(), item.price(), item.type()}, &item_handle);
      if (!status) {
        throw std::runtime_error("catalog item '" + category.key() + "/" + item.key() +
                                 "': " + std::string(StatusCodeName(status.code)) + ": " + status.message);
      }
    }
  }
}

} // namespace bazaar::factory
