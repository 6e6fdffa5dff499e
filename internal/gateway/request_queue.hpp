#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

#include "request.hpp"

namespace bazaar::gateway {

/*
  Thread-safe blocking FIFO feeding one lane worker.

  After Shutdown() Dequeue() stops handing out work even if requests are
  still queued; those are collected with DrainPending() and aborted.
*/
class RequestQueue {
 public:
  void Enqueue(Request request);

  // blocking wait; nullopt once shut down
  std::optional<Request> Dequeue();

  // Sleeps for `delay` unless shut down first. Returns false when interrupted.
  bool WaitFor(std::chrono::milliseconds delay);

  void Shutdown();

  std::vector<Request> DrainPending();

  std::size_t Size() const;

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::deque<Request>     queue_;
  bool                    shutdown_ = false;
};

} // namespace bazaar::gateway
