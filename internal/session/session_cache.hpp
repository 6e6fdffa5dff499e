#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "bazaar/economy/v1.hpp"
#include "internal/catalog/registry.hpp"
#include "internal/gateway/persistence_gateway.hpp"
#include "internal/util/time.hpp"
#include "session.hpp"
#include "slot_table.hpp"

namespace bazaar::session {

struct SessionOptions {
  std::int64_t                starting_balance = 0;
  std::int64_t                credit_floor     = 0;
  std::optional<std::int64_t> credit_ceiling;

  std::chrono::milliseconds flush_interval{30000};
  std::chrono::milliseconds load_timeout{10000};
  std::chrono::milliseconds flush_timeout{10000};

  // final-write attempts for a departing session
  std::uint32_t max_flush_attempts = 3;
};

/*
  SessionCache

  One live record per connected player, owned here and addressed by
  session token. All methods run on the control thread; gateway
  continuations capture the token only and are dropped when the session
  they were issued for has moved on.

  Lifecycle:
      OnJoin  -> Loading  -> (load completes)  -> Active
      OnLeave -> Flushing -> (final write)     -> Retired
  Failed is entered on an unrecoverable load or final-write error.
  Retired and failed-and-departed sessions are destroyed; their final
  state stays queryable through State() for a while.

  Store ordering:
  - every request is keyed by identity, so a reconnecting player's load
    queues behind the previous session's final write
  - a second session for a live identity does not even issue its load
    until the first one has ended
*/
class SessionCache {
 public:
  using ClockFn = std::function<util::TimePoint()>;

  SessionCache(const catalog::Registry& registry, gateway::PersistenceGateway& gateway, SessionOptions options,
               ClockFn clock = util::Now);

  SessionCache(const SessionCache&)            = delete;
  SessionCache& operator=(const SessionCache&) = delete;

  // ------------------------------------------------------------
  // Lifecycle
  // ------------------------------------------------------------

  economy::v1::SessionToken OnJoin(economy::v1::ConnectionSlot slot, const std::string& identity);
  void                      OnLeave(economy::v1::SessionToken token);

  // Periodic flush and deadline enforcement.
  void Tick(util::TimePoint now);

  // Issues a flush for every dirty Active session. Returns how many were issued.
  std::size_t FlushDirty();

  // Leaves every live session. Returns how many were left.
  std::size_t BeginShutdown();

  // ------------------------------------------------------------
  // Mutations (Active only)
  // ------------------------------------------------------------

  std::int64_t AdjustCredits(economy::v1::SessionToken token, std::int64_t delta, std::string_view reason);
  std::int64_t SetCredits(economy::v1::SessionToken token, std::int64_t value, std::string_view reason);

  bool GrantItem(economy::v1::SessionToken token, economy::v1::ItemHandle item);
  bool RevokeItem(economy::v1::SessionToken token, economy::v1::ItemHandle item);

  economy::v1::PurchaseReceipt Purchase(economy::v1::SessionToken token, economy::v1::ItemHandle item);

  // ------------------------------------------------------------
  // Queries (Active or Flushing)
  // ------------------------------------------------------------

  std::int64_t                             Credits(economy::v1::SessionToken token) const;
  bool                                     HasItem(economy::v1::SessionToken token, economy::v1::ItemHandle item) const;
  std::vector<economy::v1::InventoryEntry> Inventory(economy::v1::SessionToken token) const;
  bool                                     IsDirty(economy::v1::SessionToken token) const;

  SessionState                             State(economy::v1::SessionToken token) const;
  std::optional<economy::v1::SessionToken> TokenForSlot(economy::v1::ConnectionSlot slot) const;
  const std::string&                       Identity(economy::v1::SessionToken token) const;

  // Sessions not yet destroyed, Failed ones included.
  std::size_t LiveCount() const { return sessions_.size(); }

  const SessionOptions& Options() const { return options_; }

 private:
  Session*       Find(economy::v1::SessionToken token);
  const Session* Find(economy::v1::SessionToken token) const;
  Session&       RequireActive(economy::v1::SessionToken token);
  const Session& RequireReadable(economy::v1::SessionToken token) const;

  void Transition(Session& s, SessionState to);

  void IssueLoad(Session& s);
  void OnLoadSuccess(economy::v1::SessionToken token, gateway::CorrelationId id, std::vector<db::sql::ResultSet> results);
  void OnLoadFailure(economy::v1::SessionToken token, gateway::CorrelationId id, const gateway::StoreError& error);

  void StartFinalFlush(Session& s);
  bool IssueFlush(Session& s);
  void OnFlushSuccess(economy::v1::SessionToken token, gateway::CorrelationId id);
  void OnFlushFailure(economy::v1::SessionToken token, gateway::CorrelationId id, const gateway::StoreError& error);

  std::vector<db::sql::Statement> SnapshotStatements(const Session& s, std::int64_t now_ms) const;

  void Fail(Session& s, std::string_view reason);

  // Destroys the record; `s` is dangling afterwards.
  void End(Session& s, SessionState final_state);
  void ReleaseIdentity(const std::string& identity, economy::v1::SessionToken token);
  void RecordEnded(economy::v1::SessionToken token, SessionState state);

  std::int64_t NowMillis() const { return util::ToUnixMillis(clock_()); }

  // Brings a persisted balance into [credit_floor, credit_ceiling].
  std::int64_t ClampCredits(std::int64_t credits) const;

  const catalog::Registry&     registry_;
  gateway::PersistenceGateway& gateway_;
  SessionOptions               options_;
  ClockFn                      clock_;

  std::unordered_map<economy::v1::SessionToken, Session> sessions_;
  SlotTable                                              slots_;

  // live tokens per identity, join order; only the front may load
  std::unordered_map<std::string, std::deque<economy::v1::SessionToken>> by_identity_;

  std::uint64_t next_token_ = 1;

  std::unordered_map<economy::v1::SessionToken, SessionState> ended_;
  std::deque<economy::v1::SessionToken>                       ended_order_;
};

} // namespace bazaar::session
