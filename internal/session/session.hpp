#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "bazaar/economy/v1.hpp"
#include "internal/db/model/inventory_record.hpp"
#include "internal/gateway/request.hpp"
#include "internal/util/time.hpp"

namespace bazaar::session {

using economy::v1::SessionState;

constexpr bool IsTerminal(SessionState state) {
  return state == SessionState::kRetired || state == SessionState::kFailed;
}

constexpr bool CanTransition(SessionState from, SessionState to) {
  if (from == to) {
    return true;
  }
  if (IsTerminal(from)) {
    return false;
  }

  switch (from) {
    case SessionState::kLoading:
      // Retired only when the player left before the load was ever issued
      return to == SessionState::kActive || to == SessionState::kFailed || to == SessionState::kRetired;
    case SessionState::kActive:
      return to == SessionState::kFlushing;
    case SessionState::kFlushing:
      return to == SessionState::kRetired || to == SessionState::kFailed;
    default:
      return false;
  }
}

struct OwnedItem {
  economy::v1::ItemHandle item;
  std::int64_t            acquired_at_ms = 0;
  std::int64_t            price_paid     = 0;
};

/*
  Live economic state of one connected player.

  revision counts in-memory mutations; persisted_revision is the
  revision last confirmed durable. The session is dirty while they
  differ.
*/
struct Session {
  economy::v1::SessionToken   token;
  economy::v1::ConnectionSlot slot = -1;
  std::string                 identity;
  SessionState                state = SessionState::kLoading;

  std::int64_t                                          credits = 0;
  std::unordered_map<economy::v1::ItemHandle, OwnedItem> items;

  // persisted rows whose keys no longer resolve in the catalog; written back unchanged
  std::vector<db::model::InventoryRecord> unresolved;

  std::uint64_t revision           = 0;
  std::uint64_t persisted_revision = 0;

  std::int64_t created_at_ms = 0;

  // OnLeave() observed
  bool leaving = false;

  // waiting for an older session of the same identity to retire
  bool load_deferred = false;

  std::optional<gateway::CorrelationId> load_request;
  util::TimePoint                       load_deadline{};

  std::optional<gateway::CorrelationId> flush_request;
  std::uint64_t                         flush_revision = 0;
  util::TimePoint                       flush_deadline{};
  std::uint32_t                         flush_attempts = 0;

  util::TimePoint last_flush{};

  bool Dirty() const { return revision != persisted_revision; }
};

} // namespace bazaar::session
