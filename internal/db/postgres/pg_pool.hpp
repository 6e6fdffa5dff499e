#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <utility>
#include <vector>

namespace bazaar::db::postgres {

/*
  Bounded pool of economy database connections, one per open transaction.

  libpqxx connections are not thread-safe, so a gateway lane holds its
  connection exclusively until its transaction ends. Every connection gets
  the economy statements prepared when it is opened. A connection that
  reports itself closed is dropped on release and reopened on demand.

  Transactions hold a shared_ptr<pqxx::connection> whose deleter returns
  the connection here, or closes it once the pool is gone.
*/
class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  // (name, SQL) pairs prepared on every new connection.
  using PreparedStatements = std::vector<std::pair<std::string, std::string>>;

  struct Options {
    std::size_t               max_connections = 16;
    std::chrono::milliseconds acquire_timeout = std::chrono::milliseconds(5000);
  };

  PgPool(std::string conninfo, PreparedStatements prepared, Options options);

  // Blocks while every connection is checked out. Throws std::runtime_error
  // after acquire_timeout, pqxx::broken_connection when the server is
  // unreachable.
  std::shared_ptr<pqxx::connection> Acquire();

  std::size_t LiveConnections() const;

 private:
  std::unique_ptr<pqxx::connection> Open();
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);

  std::string        conninfo_;
  PreparedStatements prepared_;
  Options            options_;

  mutable std::mutex                             mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace bazaar::db::postgres
