#include "lane_worker.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"

namespace bazaar::gateway {

using observability::DurationField;
using observability::IntField;
using observability::StringField;
using observability::UintField;

LaneWorker::LaneWorker(std::size_t lane, std::shared_ptr<RequestQueue> queue, std::shared_ptr<db::Repository> repository,
                       RetryPolicy retry, Sink sink)
    : lane_(lane),
      queue_(std::move(queue)),
      repository_(std::move(repository)),
      retry_(retry),
      sink_(std::move(sink)) {
}

LaneWorker::~LaneWorker() {
  Stop();
}

void LaneWorker::Start() {
  running_ = true;
  thread_  = std::thread(&LaneWorker::Run, this);
}

void LaneWorker::Stop() {
  queue_->Shutdown();
  running_ = false;
  if (thread_.joinable()) thread_.join();
}

void LaneWorker::Run() {
  while (running_) {
    auto request = queue_->Dequeue();
    if (!request) break;

    sink_(Execute(std::move(*request)));
  }
}

db::Result LaneWorker::ExecuteOnce(const Request& request, std::vector<db::sql::ResultSet>* results) {
  results->clear();

  std::unique_ptr<db::Transaction> tx;
  try {
    tx = repository_->Begin();
  } catch (const std::exception& e) {
    return db::Result::Err(db::ErrorCode::Unavailable, e.what());
  }

  for (const auto& statement : request.statements) {
    db::sql::ResultSet rows;
    auto               r = repository_->Execute(*tx, statement, &rows);
    if (!r) {
      try {
        tx->Rollback();
      } catch (const std::exception& e) {
        BAZAAR_LOG_WARN("rollback failed", {UintField("correlation_id", request.id), StringField("error", e.what())});
      }
      r.message = std::string(db::sql::StatementName(statement.id)) + ": " + r.message;
      return r;
    }
    results->push_back(std::move(rows));
  }

  try {
    tx->Commit();
  } catch (const std::exception& e) {
    return db::Result::Err(db::ErrorCode::IOError, std::string("commit: ") + e.what());
  }
  return db::Result::Ok();
}

Completion LaneWorker::Execute(Request request) {
  Completion completion;

  const std::uint32_t budget = request.options.idempotent ? std::max<std::uint32_t>(retry_.max_attempts, 1) : 1;

  for (std::uint32_t attempt = 1;; ++attempt) {
    auto r = ExecuteOnce(request, &completion.results);
    if (r) break;

    StoreError error{.kind = StoreErrorKind::kIntegrity, .code = r.code, .message = r.message, .attempts = attempt};

    if (!db::IsTransient(r.code)) {
      completion.error = std::move(error);
      break;
    }

    if (!request.options.idempotent) {
      error.kind       = StoreErrorKind::kTransient;
      completion.error = std::move(error);
      break;
    }

    if (attempt >= budget) {
      error.kind       = StoreErrorKind::kFatal;
      completion.error = std::move(error);
      break;
    }

    const auto delay = retry_.backoff * (1LL << std::min<std::uint32_t>(attempt - 1, 16));
    BAZAAR_LOG_DEBUG("retrying request",
                     {UintField("lane", lane_), UintField("correlation_id", request.id), IntField("attempt", attempt),
                      DurationField("delay", delay), StringField("error", r.message)});

    if (!queue_->WaitFor(delay)) {
      error.kind       = StoreErrorKind::kAborted;
      error.message    = "shutdown during retry backoff: " + error.message;
      completion.error = std::move(error);
      break;
    }
  }

  if (completion.error) {
    completion.results.clear();
    BAZAAR_LOG_WARN("request failed",
                    {UintField("lane", lane_), UintField("correlation_id", request.id),
                     StringField("kind", StoreErrorKindName(completion.error->kind)),
                     StringField("code", db::ErrorCodeName(completion.error->code)),
                     StringField("error", completion.error->message)});
  }

  completion.request = std::move(request);
  return completion;
}

} // namespace bazaar::gateway
