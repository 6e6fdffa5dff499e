#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <thread>

#include "internal/db/api/repository.hpp"
#include "request_queue.hpp"

namespace bazaar::gateway {

struct RetryPolicy {
  // total attempts for idempotent requests, first one included
  std::uint32_t             max_attempts = 3;
  std::chrono::milliseconds backoff{50};
};

/*
  Background worker that executes the requests of one lane.

  Each request runs as one repository transaction:
      Begin -> Execute... -> Commit   (Rollback on first failure)

  Results are handed to the sink, never to the request's callbacks;
  those run on the control thread.
*/
class LaneWorker {
 public:
  using Sink = std::function<void(Completion)>;

  LaneWorker(std::size_t lane, std::shared_ptr<RequestQueue> queue, std::shared_ptr<db::Repository> repository,
             RetryPolicy retry, Sink sink);
  ~LaneWorker();

  LaneWorker(const LaneWorker&)            = delete;
  LaneWorker& operator=(const LaneWorker&) = delete;

  void Start();

  // Finishes the request in progress, then joins.
  void Stop();

 private:
  void       Run();
  Completion Execute(Request request);
  db::Result ExecuteOnce(const Request& request, std::vector<db::sql::ResultSet>* results);

  std::size_t                     lane_;
  std::shared_ptr<RequestQueue>   queue_;
  std::shared_ptr<db::Repository> repository_;
  RetryPolicy                     retry_;
  Sink                            sink_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace bazaar::gateway
