#include "session_cache.hpp"

#include <algorithm>
#include <limits>
#include <tuple>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace bazaar::session {

using economy::v1::ConnectionSlot;
using economy::v1::InventoryEntry;
using economy::v1::ItemHandle;
using economy::v1::PurchaseReceipt;
using economy::v1::SessionStateName;
using economy::v1::SessionToken;
using observability::BoolField;
using observability::IntField;
using observability::StringField;
using observability::UintField;

namespace sql = db::sql;

namespace {

constexpr std::size_t kEndedHistory = 4096;

std::string Describe(SessionToken token) {
  return "session " + std::to_string(token.value);
}

} // namespace

SessionCache::SessionCache(const catalog::Registry& registry, gateway::PersistenceGateway& gateway, SessionOptions options,
                           ClockFn clock)
    : registry_(registry), gateway_(gateway), options_(std::move(options)), clock_(std::move(clock)) {
  if (options_.credit_ceiling && *options_.credit_ceiling < options_.credit_floor) {
    throw util::InvalidArgument("credit ceiling below credit floor");
  }
  if (options_.starting_balance < options_.credit_floor ||
      (options_.credit_ceiling && options_.starting_balance > *options_.credit_ceiling)) {
    throw util::InvalidArgument("starting balance outside [floor, ceiling]: " + std::to_string(options_.starting_balance));
  }
  if (options_.max_flush_attempts == 0) {
    options_.max_flush_attempts = 1;
  }
}

// ------------------------------------------------------------
// Lookup helpers
// ------------------------------------------------------------

Session* SessionCache::Find(SessionToken token) {
  auto it = sessions_.find(token);
  return it == sessions_.end() ? nullptr : &it->second;
}

const Session* SessionCache::Find(SessionToken token) const {
  auto it = sessions_.find(token);
  return it == sessions_.end() ? nullptr : &it->second;
}

Session& SessionCache::RequireActive(SessionToken token) {
  auto* s = Find(token);
  if (!s) {
    throw util::SessionNotActive(Describe(token) + " is not live");
  }
  if (s->state != SessionState::kActive) {
    throw util::SessionNotActive(Describe(token) + " is " + std::string(SessionStateName(s->state)));
  }
  return *s;
}

const Session& SessionCache::RequireReadable(SessionToken token) const {
  const auto* s = Find(token);
  if (!s) {
    throw util::SessionNotActive(Describe(token) + " is not live");
  }
  if (s->state != SessionState::kActive && s->state != SessionState::kFlushing) {
    throw util::SessionNotActive(Describe(token) + " is " + std::string(SessionStateName(s->state)));
  }
  return *s;
}

void SessionCache::Transition(Session& s, SessionState to) {
  if (!CanTransition(s.state, to)) {
    throw util::InvalidState(Describe(s.token) + ": illegal transition " + std::string(SessionStateName(s.state)) + " -> " +
                             std::string(SessionStateName(to)));
  }
  s.state = to;
}

// ------------------------------------------------------------
// Join / load
// ------------------------------------------------------------

SessionToken SessionCache::OnJoin(ConnectionSlot slot, const std::string& identity) {
  if (identity.empty()) {
    throw util::InvalidArgument("identity must not be empty");
  }
  if (slot < 0) {
    throw util::InvalidArgument("connection slot must be >= 0: " + std::to_string(slot));
  }
  if (!gateway_.Accepting()) {
    throw util::Unavailable("persistence is shutting down; join rejected");
  }

  if (auto previous = slots_.Lookup(slot)) {
    auto* old = Find(*previous);
    if (old && !old->leaving) {
      BAZAAR_LOG_WARN("slot reused before leave; leaving previous session",
                      {IntField("slot", slot), UintField("previous_token", previous->value)});
      OnLeave(*previous);
    }
  }

  const SessionToken token{next_token_++};

  Session s;
  s.token         = token;
  s.slot          = slot;
  s.identity      = identity;
  s.credits       = options_.starting_balance;
  s.created_at_ms = NowMillis();

  auto& session = sessions_.emplace(token, std::move(s)).first->second;
  slots_.Bind(slot, token);

  auto& queue = by_identity_[identity];
  queue.push_back(token);

  BAZAAR_LOG_INFO("session joined", {UintField("token", token.value), IntField("slot", slot), StringField("identity", identity)});

  if (queue.size() > 1) {
    session.load_deferred = true;
    BAZAAR_LOG_INFO("load deferred until previous session of identity ends",
                    {UintField("token", token.value), UintField("waiting_on", queue.front().value)});
  } else {
    IssueLoad(session);
  }
  return token;
}

void SessionCache::IssueLoad(Session& s) {
  s.load_deferred = false;

  if (!gateway_.Accepting()) {
    Fail(s, "persistence unavailable for load");
    return;
  }

  const auto now    = clock_();
  const auto now_ms = util::ToUnixMillis(now);

  std::vector<sql::Statement> statements;
  statements.push_back({sql::StatementId::kEnsureUser, {s.identity, options_.starting_balance, now_ms, now_ms}});
  statements.push_back({sql::StatementId::kSelectUser, {s.identity}});
  statements.push_back({sql::StatementId::kSelectInventory, {s.identity}});

  const auto token = s.token;
  s.load_deadline  = now + options_.load_timeout;
  s.load_request   = gateway_.RunTransaction(
      std::move(statements),
      [this, token](gateway::CorrelationId id, std::vector<sql::ResultSet> results) {
        OnLoadSuccess(token, id, std::move(results));
      },
      [this, token](gateway::CorrelationId id, const gateway::StoreError& error) { OnLoadFailure(token, id, error); },
      gateway::RequestOptions{.ordering_key = s.identity, .idempotent = true});
}

void SessionCache::OnLoadSuccess(SessionToken token, gateway::CorrelationId id, std::vector<sql::ResultSet> results) {
  auto* s = Find(token);
  if (!s || s->state != SessionState::kLoading || s->load_request != id) {
    BAZAAR_LOG_DEBUG("discarding stale load completion", {UintField("token", token.value), UintField("correlation_id", id)});
    return;
  }
  s->load_request.reset();

  if (results.size() != 3) {
    Fail(*s, "load returned " + std::to_string(results.size()) + " result sets");
    if (s->leaving) End(*s, SessionState::kFailed);
    return;
  }

  const auto& user = results[1];
  if (!user.empty()) {
    s->credits = user.front().GetInt64(1);
  }
  const auto stored_credits = s->credits;
  s->credits                = ClampCredits(stored_credits);

  s->items.clear();
  s->unresolved.clear();
  for (const auto& row : results[2]) {
    const auto category_key = row.GetText(0);
    const auto item_key     = row.GetText(1);
    const auto acquired     = row.GetInt64(2);
    const auto price_paid   = row.GetInt64(3);

    if (auto handle = registry_.TryLookupByKey(category_key, item_key)) {
      s->items[*handle] = OwnedItem{.item = *handle, .acquired_at_ms = acquired, .price_paid = price_paid};
    } else {
      s->unresolved.push_back(db::model::InventoryRecord{.identity       = s->identity,
                                                         .category_key   = category_key,
                                                         .item_key       = item_key,
                                                         .acquired_at_ms = acquired,
                                                         .price_paid     = price_paid});
    }
  }

  s->revision           = 0;
  s->persisted_revision = 0;
  s->last_flush         = clock_();
  Transition(*s, SessionState::kActive);

  if (s->credits != stored_credits) {
    BAZAAR_LOG_WARN("stored balance outside configured bounds; adjusted",
                    {UintField("token", token.value), StringField("identity", s->identity),
                     IntField("stored", stored_credits), IntField("credits", s->credits)});
    // the corrected balance is written back by the next flush
    ++s->revision;
  }

  BAZAAR_LOG_INFO("session active",
                  {UintField("token", token.value), StringField("identity", s->identity), IntField("credits", s->credits),
                   UintField("items", s->items.size()), UintField("unresolved", s->unresolved.size())});

  if (s->leaving) {
    StartFinalFlush(*s);
  }
}

std::int64_t SessionCache::ClampCredits(std::int64_t credits) const {
  if (credits < options_.credit_floor) return options_.credit_floor;
  if (options_.credit_ceiling && credits > *options_.credit_ceiling) return *options_.credit_ceiling;
  return credits;
}

void SessionCache::OnLoadFailure(SessionToken token, gateway::CorrelationId id, const gateway::StoreError& error) {
  auto* s = Find(token);
  if (!s || s->state != SessionState::kLoading || s->load_request != id) {
    BAZAAR_LOG_DEBUG("discarding stale load failure", {UintField("token", token.value), UintField("correlation_id", id)});
    return;
  }
  s->load_request.reset();

  Fail(*s, "load failed (" + std::string(gateway::StoreErrorKindName(error.kind)) + "): " + error.message);
  if (s->leaving) {
    End(*s, SessionState::kFailed);
  }
}

// ------------------------------------------------------------
// Leave / flush
// ------------------------------------------------------------

void SessionCache::OnLeave(SessionToken token) {
  auto* s = Find(token);
  if (!s) {
    throw util::SessionNotActive(Describe(token) + " is not live");
  }
  if (s->leaving) {
    return;
  }

  s->leaving = true;
  slots_.Unbind(s->slot, token);

  BAZAAR_LOG_INFO("session leaving", {UintField("token", token.value), StringField("state", SessionStateName(s->state))});

  switch (s->state) {
    case SessionState::kLoading:
      if (s->load_deferred) {
        // nothing was read, so there is nothing to write
        End(*s, SessionState::kRetired);
      }
      // otherwise the load completion finalizes the record and flushes
      return;
    case SessionState::kActive:
      StartFinalFlush(*s);
      return;
    case SessionState::kFailed:
      End(*s, SessionState::kFailed);
      return;
    case SessionState::kFlushing:
    case SessionState::kRetired:
      return;
  }
}

void SessionCache::StartFinalFlush(Session& s) {
  Transition(s, SessionState::kFlushing);
  s.flush_attempts = 0;
  s.flush_deadline = clock_() + options_.flush_timeout;

  if (s.flush_request) {
    // a periodic flush is in flight; its completion re-issues if needed
    return;
  }
  IssueFlush(s);
}

std::vector<sql::Statement> SessionCache::SnapshotStatements(const Session& s, std::int64_t now_ms) const {
  std::vector<sql::Statement> statements;
  statements.reserve(2 + s.items.size() + s.unresolved.size());

  statements.push_back({sql::StatementId::kUpsertUser, {s.identity, s.credits, s.created_at_ms, now_ms}});
  statements.push_back({sql::StatementId::kDeleteInventory, {s.identity}});

  for (const auto& [handle, owned] : s.items) {
    const auto item     = registry_.Lookup(handle);
    const auto category = registry_.Lookup(item.category);
    statements.push_back(
        {sql::StatementId::kInsertInventory, {s.identity, category.key, item.key, owned.acquired_at_ms, owned.price_paid}});
  }
  for (const auto& row : s.unresolved) {
    statements.push_back(
        {sql::StatementId::kInsertInventory, {s.identity, row.category_key, row.item_key, row.acquired_at_ms, row.price_paid}});
  }
  return statements;
}

bool SessionCache::IssueFlush(Session& s) {
  if (s.flush_request) {
    return false;
  }

  if (!gateway_.Accepting()) {
    BAZAAR_LOG_ERROR("lost write: persistence unavailable",
                     {UintField("token", s.token.value), StringField("identity", s.identity), IntField("credits", s.credits),
                      UintField("revision", s.revision), UintField("persisted_revision", s.persisted_revision)});
    if (s.leaving) {
      Fail(s, "persistence unavailable for final write");
      End(s, SessionState::kFailed);
    }
    return false;
  }

  const auto now = clock_();
  if (!s.leaving) {
    s.flush_deadline = now + options_.flush_timeout;
  }

  const auto token = s.token;
  s.flush_revision = s.revision;
  ++s.flush_attempts;
  s.flush_request = gateway_.RunTransaction(
      SnapshotStatements(s, util::ToUnixMillis(now)),
      [this, token](gateway::CorrelationId id, std::vector<sql::ResultSet>) { OnFlushSuccess(token, id); },
      [this, token](gateway::CorrelationId id, const gateway::StoreError& error) { OnFlushFailure(token, id, error); },
      gateway::RequestOptions{.ordering_key = s.identity, .idempotent = false});

  BAZAAR_LOG_DEBUG("flush issued", {UintField("token", token.value), UintField("correlation_id", *s.flush_request),
                                    UintField("revision", s.flush_revision), UintField("attempt", s.flush_attempts)});
  return true;
}

void SessionCache::OnFlushSuccess(SessionToken token, gateway::CorrelationId id) {
  auto* s = Find(token);
  if (!s || s->flush_request != id) {
    BAZAAR_LOG_DEBUG("discarding stale flush completion", {UintField("token", token.value), UintField("correlation_id", id)});
    return;
  }
  s->flush_request.reset();
  s->persisted_revision = std::max(s->persisted_revision, s->flush_revision);
  s->last_flush         = clock_();

  if (s->state == SessionState::kActive) {
    s->flush_attempts = 0;
    return;
  }

  if (s->state == SessionState::kFlushing) {
    if (s->Dirty()) {
      IssueFlush(*s);
      return;
    }
    BAZAAR_LOG_INFO("session retired", {UintField("token", token.value), StringField("identity", s->identity),
                                        IntField("credits", s->credits)});
    End(*s, SessionState::kRetired);
  }
}

void SessionCache::OnFlushFailure(SessionToken token, gateway::CorrelationId id, const gateway::StoreError& error) {
  auto* s = Find(token);
  if (!s || s->flush_request != id) {
    BAZAAR_LOG_DEBUG("discarding stale flush failure", {UintField("token", token.value), UintField("correlation_id", id)});
    return;
  }
  s->flush_request.reset();

  if (s->state == SessionState::kActive) {
    // the failed attempt counts as this interval's flush
    s->last_flush = clock_();
    BAZAAR_LOG_WARN("periodic flush failed; retrying next interval",
                    {UintField("token", token.value), StringField("kind", gateway::StoreErrorKindName(error.kind)),
                     StringField("error", error.message)});
    return;
  }

  if (s->state != SessionState::kFlushing) {
    return;
  }

  const bool give_up = error.kind == gateway::StoreErrorKind::kAborted ||
                       s->flush_attempts >= options_.max_flush_attempts || !gateway_.Accepting();
  if (!give_up) {
    BAZAAR_LOG_WARN("final flush failed; re-issuing full state",
                    {UintField("token", token.value), UintField("attempt", s->flush_attempts),
                     StringField("kind", gateway::StoreErrorKindName(error.kind)), StringField("error", error.message)});
    IssueFlush(*s);
    return;
  }

  BAZAAR_LOG_ERROR("lost write: final flush failed",
                   {UintField("token", token.value), StringField("identity", s->identity), IntField("credits", s->credits),
                    UintField("items", s->items.size()), UintField("attempts", s->flush_attempts),
                    StringField("kind", gateway::StoreErrorKindName(error.kind)), StringField("error", error.message)});
  Fail(*s, "final flush failed");
  End(*s, SessionState::kFailed);
}

// ------------------------------------------------------------
// End of life
// ------------------------------------------------------------

void SessionCache::Fail(Session& s, std::string_view reason) {
  BAZAAR_LOG_ERROR("session failed", {UintField("token", s.token.value), StringField("identity", s.identity),
                                      StringField("state", SessionStateName(s.state)), StringField("reason", reason)});
  Transition(s, SessionState::kFailed);
  s.load_request.reset();
  s.flush_request.reset();

  // nothing of this session is in flight any more; a waiting successor may load
  ReleaseIdentity(s.identity, s.token);
}

void SessionCache::End(Session& s, SessionState final_state) {
  if (s.state != final_state) {
    Transition(s, final_state);
  }

  const auto token    = s.token;
  const auto identity = s.identity;
  slots_.Unbind(s.slot, token);
  RecordEnded(token, final_state);
  sessions_.erase(token);

  ReleaseIdentity(identity, token);
}

void SessionCache::ReleaseIdentity(const std::string& identity, SessionToken token) {
  auto it = by_identity_.find(identity);
  if (it == by_identity_.end()) return;

  auto& queue = it->second;
  auto  pos   = std::find(queue.begin(), queue.end(), token);
  if (pos == queue.end()) return;

  const bool was_front = pos == queue.begin();
  queue.erase(pos);

  if (queue.empty()) {
    by_identity_.erase(it);
    return;
  }
  if (!was_front) return;

  auto* next = Find(queue.front());
  if (next && next->state == SessionState::kLoading && next->load_deferred) {
    BAZAAR_LOG_INFO("issuing deferred load", {UintField("token", next->token.value), StringField("identity", identity)});
    IssueLoad(*next);
  }
}

void SessionCache::RecordEnded(SessionToken token, SessionState state) {
  ended_[token] = state;
  ended_order_.push_back(token);
  while (ended_order_.size() > kEndedHistory) {
    ended_.erase(ended_order_.front());
    ended_order_.pop_front();
  }
}

// ------------------------------------------------------------
// Periodic work
// ------------------------------------------------------------

void SessionCache::Tick(util::TimePoint now) {
  std::vector<SessionToken> tokens;
  tokens.reserve(sessions_.size());
  for (const auto& [token, _] : sessions_) {
    tokens.push_back(token);
  }

  for (auto token : tokens) {
    auto* s = Find(token);
    if (!s) continue;

    switch (s->state) {
      case SessionState::kLoading:
        if (s->load_request && now >= s->load_deadline) {
          Fail(*s, "load timed out");
          if (s->leaving) End(*s, SessionState::kFailed);
        }
        break;

      case SessionState::kFlushing:
        if (now >= s->flush_deadline) {
          BAZAAR_LOG_ERROR("lost write: final flush timed out; force-retiring",
                           {UintField("token", token.value), StringField("identity", s->identity),
                            IntField("credits", s->credits), BoolField("dirty", s->Dirty())});
          End(*s, SessionState::kRetired);
        }
        break;

      case SessionState::kActive:
        // at most one periodic flush per session is queued; an overdue one is waited out
        if (s->flush_request && now >= s->flush_deadline) {
          BAZAAR_LOG_WARN("periodic flush overdue; waiting for its completion",
                          {UintField("token", token.value), UintField("correlation_id", *s->flush_request),
                           UintField("revision", s->flush_revision)});
          s->flush_deadline = now + options_.flush_timeout;
        }
        if (s->Dirty() && !s->flush_request && now - s->last_flush >= options_.flush_interval) {
          IssueFlush(*s);
        }
        break;

      case SessionState::kRetired:
      case SessionState::kFailed:
        break;
    }
  }
}

std::size_t SessionCache::FlushDirty() {
  std::size_t issued = 0;
  for (auto& [token, s] : sessions_) {
    if (s.state == SessionState::kActive && s.Dirty() && IssueFlush(s)) {
      ++issued;
    }
  }
  return issued;
}

std::size_t SessionCache::BeginShutdown() {
  std::vector<SessionToken> tokens;
  for (const auto& [token, s] : sessions_) {
    if (!s.leaving) tokens.push_back(token);
  }

  for (auto token : tokens) {
    if (Find(token)) OnLeave(token);
  }
  BAZAAR_LOG_INFO("sessions leaving for shutdown", {UintField("count", tokens.size()), UintField("live", sessions_.size())});
  return tokens.size();
}

// ------------------------------------------------------------
// Mutations
// ------------------------------------------------------------

std::int64_t SessionCache::AdjustCredits(SessionToken token, std::int64_t delta, std::string_view reason) {
  auto& s = RequireActive(token);

  constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
  constexpr auto kMin = std::numeric_limits<std::int64_t>::min();

  if (delta > 0 && s.credits > kMax - delta) {
    throw util::CreditLimitExceeded(Describe(token) + ": balance overflow");
  }
  if (delta < 0 && s.credits < kMin - delta) {
    throw util::InsufficientFunds(Describe(token) + ": balance underflow");
  }

  const auto next = s.credits + delta;
  if (delta < 0 && next < options_.credit_floor) {
    throw util::InsufficientFunds(Describe(token) + ": " + std::to_string(s.credits) + " + (" + std::to_string(delta) +
                                  ") is below floor " + std::to_string(options_.credit_floor));
  }
  if (delta > 0 && options_.credit_ceiling && next > *options_.credit_ceiling) {
    throw util::CreditLimitExceeded(Describe(token) + ": " + std::to_string(next) + " exceeds ceiling " +
                                    std::to_string(*options_.credit_ceiling));
  }

  if (delta != 0) {
    s.credits = next;
    ++s.revision;
  }

  BAZAAR_LOG_DEBUG("credits adjusted", {UintField("token", token.value), IntField("delta", delta),
                                        IntField("balance", s.credits), StringField("reason", reason)});
  return s.credits;
}

std::int64_t SessionCache::SetCredits(SessionToken token, std::int64_t value, std::string_view reason) {
  auto& s = RequireActive(token);

  if (value < options_.credit_floor) {
    throw util::InsufficientFunds(Describe(token) + ": " + std::to_string(value) + " is below floor " +
                                  std::to_string(options_.credit_floor));
  }
  if (options_.credit_ceiling && value > *options_.credit_ceiling) {
    throw util::CreditLimitExceeded(Describe(token) + ": " + std::to_string(value) + " exceeds ceiling " +
                                    std::to_string(*options_.credit_ceiling));
  }

  if (value != s.credits) {
    s.credits = value;
    ++s.revision;
  }

  BAZAAR_LOG_INFO("credits set", {UintField("token", token.value), IntField("balance", value), StringField("reason", reason)});
  return s.credits;
}

bool SessionCache::GrantItem(SessionToken token, ItemHandle item) {
  auto& s = RequireActive(token);
  registry_.Lookup(item);

  if (s.items.contains(item)) {
    return false;
  }
  s.items.emplace(item, OwnedItem{.item = item, .acquired_at_ms = NowMillis(), .price_paid = 0});
  ++s.revision;
  return true;
}

bool SessionCache::RevokeItem(SessionToken token, ItemHandle item) {
  auto& s = RequireActive(token);
  if (s.items.erase(item) == 0) {
    return false;
  }
  ++s.revision;
  return true;
}

PurchaseReceipt SessionCache::Purchase(SessionToken token, ItemHandle item) {
  auto& s = RequireActive(token);

  const auto info = registry_.Lookup(item);
  if (!registry_.IsPurchasable(item)) {
    throw util::NotPurchasable("item is retired: " + info.key);
  }

  const auto price = info.price;
  if (s.credits < std::numeric_limits<std::int64_t>::min() + price || s.credits - price < options_.credit_floor) {
    throw util::InsufficientFunds(Describe(token) + ": balance " + std::to_string(s.credits) + " cannot cover " + info.key +
                                  " at " + std::to_string(price));
  }
  if (s.items.contains(item)) {
    throw util::AlreadyOwned(Describe(token) + " already owns " + info.key);
  }

  PurchaseReceipt receipt;
  receipt.item           = item;
  receipt.price_paid     = price;
  receipt.acquired_at_ms = NowMillis();

  s.credits -= price;
  s.items.emplace(item, OwnedItem{.item = item, .acquired_at_ms = receipt.acquired_at_ms, .price_paid = price});
  ++s.revision;

  receipt.balance_after = s.credits;

  BAZAAR_LOG_INFO("purchase", {UintField("token", token.value), StringField("item", info.key), IntField("price", price),
                               IntField("balance", s.credits)});
  return receipt;
}

// ------------------------------------------------------------
// Queries
// ------------------------------------------------------------

std::int64_t SessionCache::Credits(SessionToken token) const {
  return RequireReadable(token).credits;
}

bool SessionCache::HasItem(SessionToken token, ItemHandle item) const {
  return RequireReadable(token).items.contains(item);
}

std::vector<InventoryEntry> SessionCache::Inventory(SessionToken token) const {
  const auto& s = RequireReadable(token);

  std::vector<InventoryEntry> out;
  out.reserve(s.items.size());
  for (const auto& [handle, owned] : s.items) {
    out.push_back(InventoryEntry{.item = handle, .acquired_at_ms = owned.acquired_at_ms, .price_paid = owned.price_paid});
  }
  std::sort(out.begin(), out.end(), [](const InventoryEntry& a, const InventoryEntry& b) {
    return std::tie(a.acquired_at_ms, a.item) < std::tie(b.acquired_at_ms, b.item);
  });
  return out;
}

bool SessionCache::IsDirty(SessionToken token) const {
  const auto* s = Find(token);
  if (!s) {
    throw util::NotFound(Describe(token) + " is not live");
  }
  return s->Dirty();
}

SessionState SessionCache::State(SessionToken token) const {
  if (const auto* s = Find(token)) {
    return s->state;
  }
  if (auto it = ended_.find(token); it != ended_.end()) {
    return it->second;
  }
  if (token.valid() && token.value < next_token_) {
    return SessionState::kRetired;
  }
  throw util::NotFound("unknown " + Describe(token));
}

std::optional<SessionToken> SessionCache::TokenForSlot(ConnectionSlot slot) const {
  return slots_.Lookup(slot);
}

const std::string& SessionCache::Identity(SessionToken token) const {
  const auto* s = Find(token);
  if (!s) {
    throw util::NotFound(Describe(token) + " is not live");
  }
  return s->identity;
}

} // namespace bazaar::session
