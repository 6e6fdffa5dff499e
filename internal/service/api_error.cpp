#include "api_error.hpp"

#include "internal/util/errors.hpp"

namespace bazaar::economy::v1 {

std::string_view StatusCodeName(StatusCode code) {
  switch (code) {
    case StatusCode::kOk: return "OK";
    case StatusCode::kDuplicateKey: return "DUPLICATE_KEY";
    case StatusCode::kInvalidCategory: return "INVALID_CATEGORY";
    case StatusCode::kNotFound: return "NOT_FOUND";
    case StatusCode::kInvalidArgument: return "INVALID_ARGUMENT";
    case StatusCode::kNotPurchasable: return "NOT_PURCHASABLE";
    case StatusCode::kSessionNotActive: return "SESSION_NOT_ACTIVE";
    case StatusCode::kInsufficientFunds: return "INSUFFICIENT_FUNDS";
    case StatusCode::kCreditLimitExceeded: return "CREDIT_LIMIT_EXCEEDED";
    case StatusCode::kAlreadyOwned: return "ALREADY_OWNED";
    case StatusCode::kFailedPrecondition: return "FAILED_PRECONDITION";
    case StatusCode::kUnavailable: return "UNAVAILABLE";
    case StatusCode::kInternal: return "INTERNAL";
  }
  return "UNKNOWN";
}

std::string_view SessionStateName(SessionState state) {
  switch (state) {
    case SessionState::kLoading: return "loading";
    case SessionState::kActive: return "active";
    case SessionState::kFlushing: return "flushing";
    case SessionState::kRetired: return "retired";
    case SessionState::kFailed: return "failed";
  }
  return "unknown";
}

} // namespace bazaar::economy::v1

namespace bazaar::service {

economy::v1::Status ToStatus(const std::exception& e) {
  using namespace bazaar::util;
  using economy::v1::StatusCode;

  // validation
  if (dynamic_cast<const DuplicateKey*>(&e)) {
    return {StatusCode::kDuplicateKey, e.what()};
  }
  if (dynamic_cast<const InvalidCategory*>(&e)) {
    return {StatusCode::kInvalidCategory, e.what()};
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return {StatusCode::kNotFound, e.what()};
  }
  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return {StatusCode::kInvalidArgument, e.what()};
  }
  if (dynamic_cast<const NotPurchasable*>(&e)) {
    return {StatusCode::kNotPurchasable, e.what()};
  }
  if (dynamic_cast<const ValidationError*>(&e)) {
    return {StatusCode::kInvalidArgument, e.what()};
  }

  // state
  if (dynamic_cast<const SessionNotActive*>(&e)) {
    return {StatusCode::kSessionNotActive, e.what()};
  }
  if (dynamic_cast<const InsufficientFunds*>(&e)) {
    return {StatusCode::kInsufficientFunds, e.what()};
  }
  if (dynamic_cast<const CreditLimitExceeded*>(&e)) {
    return {StatusCode::kCreditLimitExceeded, e.what()};
  }
  if (dynamic_cast<const AlreadyOwned*>(&e)) {
    return {StatusCode::kAlreadyOwned, e.what()};
  }
  if (dynamic_cast<const StateError*>(&e)) {
    return {StatusCode::kFailedPrecondition, e.what()};
  }

  if (dynamic_cast<const Unavailable*>(&e)) {
    return {StatusCode::kUnavailable, e.what()};
  }

  return {StatusCode::kInternal, e.what()};
}

} // namespace bazaar::service
