#pragma once

#include <sqlite3.h>

#include <array>
#include <chrono>
#include <iterator>
#include <mutex>
#include <string>

#include "internal/db/sql/sql_params.hpp"

namespace bazaar::db::sqlite {

struct SqliteOptions {
  bool wal_mode = true;
  // FULL fsyncs every commit; NORMAL can lose the last commits on power loss in WAL mode
  bool                      full_sync    = false;
  std::chrono::milliseconds busy_timeout = std::chrono::milliseconds(5000);
};

/*
  One economy database file behind a single sqlite3 connection.

  Every gateway lane shares it: a transaction holds TransactionMutex()
  from BEGIN to COMMIT/ROLLBACK, and the prepared statement cache is only
  touched while that mutex is held.
*/
class SqliteDB {
 public:
  SqliteDB(std::string path, SqliteOptions options);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  std::mutex& TransactionMutex() {
    return tx_mutex_;
  }

  // Runs raw SQL (transaction control, schema migrations). Throws on failure.
  void Exec(const std::string& sql);

  // Returns the prepared form of `id`, compiling `text` on first use.
  // The statement stays owned by the cache; callers reset it after use.
  // Returns the sqlite result code of the prepare on failure.
  int Cached(sql::StatementId id, const std::string& text, sqlite3_stmt** out);

 private:
  void Configure();
  void FinalizeAll();

  sqlite3*      db_ = nullptr;
  std::string   path_;
  SqliteOptions options_;
  std::mutex    tx_mutex_;

  std::array<sqlite3_stmt*, std::size(sql::kAllStatements)> statements_{};
};

} // namespace bazaar::db::sqlite
