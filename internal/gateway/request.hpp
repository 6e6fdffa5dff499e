#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/sql/sql_params.hpp"
#include "internal/db/sql/sql_row.hpp"

namespace bazaar::gateway {

using CorrelationId = std::uint64_t;

enum class StoreErrorKind {
  // The write may or may not have reached the store; issuing it again is
  // the caller's decision.
  kTransient,
  // A statement failed; the whole transaction was rolled back.
  kIntegrity,
  // Retry budget exhausted or the store is unusable.
  kFatal,
  // Never executed, or interrupted, because the gateway shut down.
  kAborted,
};

constexpr std::string_view StoreErrorKindName(StoreErrorKind kind) {
  switch (kind) {
    case StoreErrorKind::kTransient: return "transient";
    case StoreErrorKind::kIntegrity: return "integrity";
    case StoreErrorKind::kFatal: return "fatal";
    case StoreErrorKind::kAborted: return "aborted";
  }
  return "unknown";
}

struct StoreError {
  StoreErrorKind kind = StoreErrorKind::kFatal;
  db::ErrorCode  code = db::ErrorCode::InternalError;
  std::string    message;
  std::uint32_t  attempts = 0;
};

struct RequestOptions {
  // Requests sharing a key complete in issue order.
  std::string ordering_key;

  // Safe to execute more than once; enables retry of transient failures.
  bool idempotent = false;
};

struct QueryOutcome {
  CorrelationId             id = 0;
  db::sql::ResultSet        rows;
  std::optional<StoreError> error;

  bool ok() const { return !error.has_value(); }
};

using QueryCallback   = std::function<void(QueryOutcome)>;
using SuccessCallback = std::function<void(CorrelationId, std::vector<db::sql::ResultSet>)>;
using FailureCallback = std::function<void(CorrelationId, const StoreError&)>;

/*
  Unit of work handed to a lane.

  A single query is a one-statement request; both forms run inside one
  repository transaction.
*/
struct Request {
  CorrelationId                   id = 0;
  std::vector<db::sql::Statement> statements;
  RequestOptions                  options;

  SuccessCallback on_success;
  FailureCallback on_failure;
};

// Finished request waiting for Poll() on the control thread.
struct Completion {
  Request                         request;
  std::vector<db::sql::ResultSet> results;
  std::optional<StoreError>       error;
};

} // namespace bazaar::gateway
