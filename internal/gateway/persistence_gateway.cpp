#include "persistence_gateway.hpp"

#include <functional>
#include <string>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace bazaar::gateway {

using observability::DurationField;
using observability::StringField;
using observability::UintField;

PersistenceGateway::PersistenceGateway(std::shared_ptr<db::Repository> repository, GatewayOptions options)
    : repository_(std::move(repository)), options_(options) {
  if (!repository_) {
    throw util::InvalidArgument("gateway requires a repository");
  }
  if (options_.workers == 0) {
    options_.workers = 1;
  }

  lanes_.reserve(options_.workers);
  for (std::size_t i = 0; i < options_.workers; ++i) {
    Lane lane;
    lane.queue  = std::make_shared<RequestQueue>();
    lane.worker = std::make_unique<LaneWorker>(i, lane.queue, repository_, options_.retry,
                                               [this](Completion c) { PushCompletion(std::move(c)); });
    lanes_.push_back(std::move(lane));
  }
}

PersistenceGateway::~PersistenceGateway() {
  accepting_ = false;
  StopLanes();

  std::size_t dropped = 0;
  {
    std::lock_guard lock(completions_mutex_);
    dropped = completions_.size();
  }
  for (auto& lane : lanes_) {
    dropped += lane.queue->Size();
  }
  if (dropped > 0) {
    BAZAAR_LOG_WARN("gateway destroyed with undelivered requests", {UintField("count", dropped)});
  }
}

void PersistenceGateway::Start() {
  if (started_.exchange(true)) return;

  for (auto& lane : lanes_) {
    lane.worker->Start();
  }
  BAZAAR_LOG_INFO("persistence gateway started",
                  {UintField("lanes", lanes_.size()), UintField("max_read_attempts", options_.retry.max_attempts),
                   DurationField("retry_backoff", options_.retry.backoff)});
}

// ------------------------------------------------------------
// Submission
// ------------------------------------------------------------

CorrelationId PersistenceGateway::Query(db::sql::Statement statement, QueryCallback on_complete, RequestOptions options) {
  auto shared = std::make_shared<QueryCallback>(std::move(on_complete));

  Request request;
  request.statements.push_back(std::move(statement));
  request.options    = std::move(options);
  request.on_success = [shared](CorrelationId id, std::vector<db::sql::ResultSet> results) {
    QueryOutcome outcome;
    outcome.id = id;
    if (!results.empty()) outcome.rows = std::move(results.front());
    (*shared)(std::move(outcome));
  };
  request.on_failure = [shared](CorrelationId id, const StoreError& error) {
    QueryOutcome outcome;
    outcome.id    = id;
    outcome.error = error;
    (*shared)(std::move(outcome));
  };
  return Submit(std::move(request));
}

CorrelationId PersistenceGateway::RunTransaction(std::vector<db::sql::Statement> statements, SuccessCallback on_success,
                                                 FailureCallback on_failure, RequestOptions options) {
  Request request;
  request.statements = std::move(statements);
  request.options    = std::move(options);
  request.on_success = std::move(on_success);
  request.on_failure = std::move(on_failure);
  return Submit(std::move(request));
}

CorrelationId PersistenceGateway::Submit(Request request) {
  if (!accepting_) {
    throw util::InvalidState("persistence gateway is shut down");
  }
  if (request.statements.empty()) {
    throw util::InvalidArgument("request has no statements");
  }

  request.id = next_id_.fetch_add(1);
  const auto id   = request.id;
  const auto lane = LaneFor(request);

  ++in_flight_;
  lanes_[lane].queue->Enqueue(std::move(request));
  return id;
}

std::size_t PersistenceGateway::LaneFor(const Request& request) const {
  if (request.options.ordering_key.empty()) {
    return static_cast<std::size_t>(request.id % lanes_.size());
  }
  return std::hash<std::string>{}(request.options.ordering_key) % lanes_.size();
}

// ------------------------------------------------------------
// Completion
// ------------------------------------------------------------

void PersistenceGateway::PushCompletion(Completion completion) {
  {
    std::lock_guard lock(completions_mutex_);
    completions_.push_back(std::move(completion));
  }
  completions_cv_.notify_all();
}

void PersistenceGateway::Deliver(Completion& completion) {
  auto& request = completion.request;
  try {
    if (completion.error) {
      if (request.on_failure) request.on_failure(request.id, *completion.error);
    } else {
      if (request.on_success) request.on_success(request.id, std::move(completion.results));
    }
  } catch (const std::exception& e) {
    BAZAAR_LOG_ERROR("completion callback threw", {UintField("correlation_id", request.id), StringField("error", e.what())});
  }
  --in_flight_;
}

std::size_t PersistenceGateway::Poll() {
  std::deque<Completion> ready;
  {
    std::lock_guard lock(completions_mutex_);
    ready.swap(completions_);
  }

  for (auto& completion : ready) {
    Deliver(completion);
  }
  return ready.size();
}

bool PersistenceGateway::WaitForCompletion(std::chrono::milliseconds timeout) {
  std::unique_lock lock(completions_mutex_);
  return completions_cv_.wait_for(lock, timeout, [&] { return !completions_.empty(); });
}

// ------------------------------------------------------------
// Shutdown
// ------------------------------------------------------------

void PersistenceGateway::StopLanes() {
  for (auto& lane : lanes_) {
    lane.worker->Stop();
  }
}

void PersistenceGateway::Shutdown() {
  if (!accepting_.exchange(false)) return;

  BAZAAR_LOG_INFO("persistence gateway shutting down", {UintField("in_flight", in_flight_.load())});

  StopLanes();

  // finished work first, so callers observe it before the aborts
  std::size_t delivered = Poll();

  std::size_t aborted = 0;
  for (auto& lane : lanes_) {
    for (auto& request : lane.queue->DrainPending()) {
      Completion completion;
      completion.error   = StoreError{.kind     = StoreErrorKind::kAborted,
                                      .code     = db::ErrorCode::Aborted,
                                      .message  = "persistence gateway shut down before execution",
                                      .attempts = 0};
      completion.request = std::move(request);
      Deliver(completion);
      ++aborted;
    }
  }

  BAZAAR_LOG_INFO("persistence gateway stopped", {UintField("delivered", delivered), UintField("aborted", aborted)});
}

} // namespace bazaar::gateway
