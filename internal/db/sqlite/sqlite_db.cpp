#include "sqlite_db.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace bazaar::db::sqlite {

using observability::DurationField;
using observability::StringField;

SqliteDB::SqliteDB(std::string path, SqliteOptions options) : path_(std::move(path)), options_(options) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("cannot open economy database " + path_ + ": " + msg);
  }

  try {
    Configure();
  } catch (const std::exception&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (!db_) return;
  FinalizeAll();
  sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : sqlite3_errstr(rc);
    sqlite3_free(err);
    throw std::runtime_error(path_ + ": " + msg);
  }
}

int SqliteDB::Cached(sql::StatementId id, const std::string& text, sqlite3_stmt** out) {
  auto& slot = statements_[static_cast<std::size_t>(id)];
  if (slot == nullptr) {
    int rc = sqlite3_prepare_v3(db_, text.c_str(), -1, SQLITE_PREPARE_PERSISTENT, &slot, nullptr);
    if (rc != SQLITE_OK) {
      sqlite3_finalize(slot);
      slot = nullptr;
      return rc;
    }
  }
  *out = slot;
  return SQLITE_OK;
}

void SqliteDB::FinalizeAll() {
  for (auto& st : statements_) {
    sqlite3_finalize(st);
    st = nullptr;
  }
}

void SqliteDB::Configure() {
  if (options_.wal_mode) {
    Exec("PRAGMA journal_mode=WAL;");
  }
  Exec(options_.full_sync ? "PRAGMA synchronous=FULL;" : "PRAGMA synchronous=NORMAL;");

  // inventory rows reference their owner
  Exec("PRAGMA foreign_keys=ON;");

  int rc = sqlite3_busy_timeout(db_, static_cast<int>(options_.busy_timeout.count()));
  if (rc != SQLITE_OK) {
    throw std::runtime_error(path_ + ": busy_timeout: " + sqlite3_errmsg(db_));
  }

  BAZAAR_LOG_DEBUG("sqlite connection configured",
                   {StringField("path", path_), StringField("synchronous", options_.full_sync ? "FULL" : "NORMAL"),
                    DurationField("busy_timeout", options_.busy_timeout)});
}

} // namespace bazaar::db::sqlite
