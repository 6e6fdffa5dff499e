#include "pg_pool.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace bazaar::db::postgres {

using observability::DurationField;
using observability::UintField;

PgPool::PgPool(std::string conninfo, PreparedStatements prepared, Options options)
    : conninfo_(std::move(conninfo)), prepared_(std::move(prepared)), options_(options) {
  if (options_.max_connections == 0) options_.max_connections = 1;
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  const auto deadline = std::chrono::steady_clock::now() + options_.acquire_timeout;

  std::unique_lock lock(mutex_);
  for (;;) {
    if (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
      return Wrap(conn.release());
    }

    if (live_connections_ < options_.max_connections) {
      ++live_connections_;
      lock.unlock();

      try {
        return Wrap(Open().release());
      } catch (const std::exception&) {
        lock.lock();
        --live_connections_;
        cv_.notify_one();
        throw;
      }
    }

    const bool ready = cv_.wait_until(lock, deadline, [this] {
      return !idle_.empty() || live_connections_ < options_.max_connections;
    });
    if (!ready) {
      BAZAAR_LOG_WARN("postgres pool exhausted", {UintField("max_connections", options_.max_connections),
                                                  DurationField("waited", options_.acquire_timeout)});
      throw std::runtime_error("no postgres connection free after " + std::to_string(options_.acquire_timeout.count()) +
                               "ms");
    }
  }
}

std::size_t PgPool::LiveConnections() const {
  std::lock_guard lock(mutex_);
  return live_connections_;
}

std::unique_ptr<pqxx::connection> PgPool::Open() {
  auto conn = std::make_unique<pqxx::connection>(conninfo_);
  for (const auto& [name, sql] : prepared_) {
    conn->prepare(name, sql);
  }
  BAZAAR_LOG_DEBUG("postgres connection opened", {UintField("backend_pid", static_cast<std::uint64_t>(conn->backendpid())),
                                                  UintField("statements", prepared_.size())});
  return conn;
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    if (conn->is_open()) {
      idle_.emplace_back(conn);
    } else {
      delete conn;
      --live_connections_;
      BAZAAR_LOG_WARN("dropped closed postgres connection", {UintField("live_connections", live_connections_)});
    }
  }
  cv_.notify_one();
}

} // namespace bazaar::db::postgres
