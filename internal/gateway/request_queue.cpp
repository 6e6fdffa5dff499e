#include "request_queue.hpp"

namespace bazaar::gateway {

void RequestQueue::Enqueue(Request request) {
  {
    std::lock_guard lock(mutex_);
    queue_.push_back(std::move(request));
  }
  cv_.notify_one();
}

std::optional<Request> RequestQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_) return std::nullopt;

  Request request = std::move(queue_.front());
  queue_.pop_front();
  return request;
}

bool RequestQueue::WaitFor(std::chrono::milliseconds delay) {
  std::unique_lock lock(mutex_);
  return !cv_.wait_for(lock, delay, [&] { return shutdown_; });
}

void RequestQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::vector<Request> RequestQueue::DrainPending() {
  std::lock_guard      lock(mutex_);
  std::vector<Request> pending;
  pending.reserve(queue_.size());
  for (auto& request : queue_) {
    pending.push_back(std::move(request));
  }
  queue_.clear();
  return pending;
}

std::size_t RequestQueue::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace bazaar::gateway
