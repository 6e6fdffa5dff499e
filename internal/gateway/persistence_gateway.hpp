#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "lane_worker.hpp"
#include "request.hpp"
#include "request_queue.hpp"

namespace bazaar::gateway {

struct GatewayOptions {
  std::size_t workers = 2;
  RetryPolicy retry;
};

/*
  PersistenceGateway

  Asynchronous front of the repository.

  Threading model:
  - Query()/RunTransaction()/Poll()/Shutdown() are called from the
    control thread only
  - lane workers block in the driver and push completions into a
    mutex-protected queue
  - every callback runs inside Poll() on the control thread, exactly once

  Ordering:
  - a request is routed to lane hash(ordering_key) % workers
  - lanes are FIFO and single-threaded, so requests sharing a key
    complete in issue order; different keys may interleave

  Shutdown():
  - rejects new requests
  - lets each lane finish the request in progress
  - delivers finished completions, then fails the still-queued requests
    with kAborted
  - no callback runs after it returns
*/
class PersistenceGateway {
 public:
  PersistenceGateway(std::shared_ptr<db::Repository> repository, GatewayOptions options);

  // Stops the lanes without invoking any pending callback.
  ~PersistenceGateway();

  PersistenceGateway(const PersistenceGateway&)            = delete;
  PersistenceGateway& operator=(const PersistenceGateway&) = delete;

  void Start();

  // Throws util::InvalidState once Shutdown() has begun.
  CorrelationId Query(db::sql::Statement statement, QueryCallback on_complete, RequestOptions options = {});

  CorrelationId RunTransaction(std::vector<db::sql::Statement> statements, SuccessCallback on_success,
                               FailureCallback on_failure, RequestOptions options = {});

  // Runs the callbacks of every finished request. Returns how many ran.
  std::size_t Poll();

  // Blocks until at least one completion is ready or `timeout` elapses.
  bool WaitForCompletion(std::chrono::milliseconds timeout);

  void Shutdown();

  bool Accepting() const { return accepting_.load(); }

  // Submitted requests whose callbacks have not run yet.
  std::size_t InFlight() const { return in_flight_.load(); }

  std::size_t Lanes() const { return lanes_.size(); }

 private:
  struct Lane {
    std::shared_ptr<RequestQueue> queue;
    std::unique_ptr<LaneWorker>   worker;
  };

  CorrelationId Submit(Request request);
  std::size_t   LaneFor(const Request& request) const;
  void          PushCompletion(Completion completion);
  void          StopLanes();
  void          Deliver(Completion& completion);

  std::shared_ptr<db::Repository> repository_;
  GatewayOptions                  options_;
  std::vector<Lane>               lanes_;

  std::atomic<bool>          accepting_{true};
  std::atomic<bool>          started_{false};
  std::atomic<CorrelationId> next_id_{1};
  std::atomic<std::size_t>   in_flight_{0};

  std::mutex              completions_mutex_;
  std::condition_variable completions_cv_;
  std::deque<Completion>  completions_;
};

} // namespace bazaar::gateway
