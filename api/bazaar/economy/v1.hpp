#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

/*
  bazaar economy API, version 1.

  The stable surface collaborator modules (commands, menus, admin tools)
  use to register catalog content and to read or modify a player's
  economic state. Nothing here exposes Registry, SessionCache or Gateway
  internals; every call validates its handles and tokens and reports a
  typed StatusCode instead of throwing.

  All calls must be made from the thread that drives the server tick.
*/

namespace bazaar::economy::v1 {

inline constexpr int kApiVersion = 1;

// ---------------------------------------------------------------------
// Handles
// ---------------------------------------------------------------------

// Index 0 is the null handle. `registry` identifies the issuing registry
// so a handle from another instance never resolves to a different entity.
struct CategoryHandle {
  std::uint32_t registry = 0;
  std::uint32_t index    = 0;

  constexpr bool valid() const { return index != 0; }
  auto operator<=>(const CategoryHandle&) const = default;
};

struct ItemHandle {
  std::uint32_t registry = 0;
  std::uint32_t index    = 0;

  constexpr bool valid() const { return index != 0; }
  auto operator<=>(const ItemHandle&) const = default;
};

// Never reused within a process, even when the connection slot is.
struct SessionToken {
  std::uint64_t value = 0;

  constexpr bool valid() const { return value != 0; }
  auto operator<=>(const SessionToken&) const = default;
};

// Transient per-connection index assigned by the host server.
using ConnectionSlot = std::int32_t;

enum class SessionState : std::uint8_t {
  kLoading  = 0,
  kActive   = 1,
  kFlushing = 2,
  kRetired  = 3,
  kFailed   = 4,
};

std::string_view SessionStateName(SessionState state);

// ---------------------------------------------------------------------
// Status
// ---------------------------------------------------------------------

enum class StatusCode {
  kOk = 0,

  // validation
  kDuplicateKey,
  kInvalidCategory,
  kNotFound,
  kInvalidArgument,
  kNotPurchasable,

  // state
  kSessionNotActive,
  kInsufficientFunds,
  kCreditLimitExceeded,
  kAlreadyOwned,
  kFailedPrecondition,

  kUnavailable,
  kInternal,
};

std::string_view StatusCodeName(StatusCode code);

struct Status {
  StatusCode  code = StatusCode::kOk;
  std::string message;

  static Status Ok() { return {}; }

  bool ok() const { return code == StatusCode::kOk; }
  explicit operator bool() const { return ok(); }
};

// ---------------------------------------------------------------------
// Catalog types
// ---------------------------------------------------------------------

struct CategorySpec {
  std::string key;
  std::string name;
  std::string description;
};

struct ItemSpec {
  std::string  key;
  std::string  name;
  std::int64_t price = 0;
  std::string  type;
};

struct CategoryInfo {
  CategoryHandle          handle;
  std::string             key;
  std::string             name;
  std::string             description;
  std::vector<ItemHandle> items;
  bool                    retired = false;
};

struct ItemInfo {
  ItemHandle     handle;
  CategoryHandle category;
  std::string    key;
  std::string    name;
  std::int64_t   price = 0;
  std::string    type;
  bool           retired = false;
};

// ---------------------------------------------------------------------
// Player state types
// ---------------------------------------------------------------------

struct InventoryEntry {
  ItemHandle   item;
  std::int64_t acquired_at_ms = 0;
  std::int64_t price_paid     = 0;
};

struct PurchaseReceipt {
  ItemHandle   item;
  std::int64_t price_paid     = 0;
  std::int64_t balance_after  = 0;
  std::int64_t acquired_at_ms = 0;
};

// ---------------------------------------------------------------------
// API
// ---------------------------------------------------------------------

class EconomyApi {
 public:
  virtual ~EconomyApi() = default;

  // catalog registration
  virtual Status RegisterCategory(const CategorySpec& spec, CategoryHandle* out) = 0;
  virtual Status RegisterItem(CategoryHandle category, const ItemSpec& spec, ItemHandle* out) = 0;

  // catalog administration
  virtual Status SetItemPrice(ItemHandle item, std::int64_t price) = 0;
  virtual Status SetItemName(ItemHandle item, const std::string& name) = 0;
  virtual Status RetireItem(ItemHandle item) = 0;
  virtual Status RetireCategory(CategoryHandle category) = 0;

  // catalog lookup and enumeration
  virtual Status GetCategory(CategoryHandle category, CategoryInfo* out) const = 0;
  virtual Status GetItem(ItemHandle item, ItemInfo* out) const = 0;
  virtual Status FindCategory(std::string_view category_key, CategoryHandle* out) const = 0;
  virtual Status FindItem(std::string_view category_key, std::string_view item_key, ItemHandle* out) const = 0;
  virtual std::vector<CategoryInfo> ListCategories() const = 0;
  virtual Status ListItems(CategoryHandle category, std::vector<ItemInfo>* out) const = 0;

  // session lifecycle
  virtual Status PlayerJoined(ConnectionSlot slot, const std::string& identity, SessionToken* out) = 0;
  virtual Status PlayerLeft(SessionToken token) = 0;
  virtual Status SessionForSlot(ConnectionSlot slot, SessionToken* out) const = 0;
  virtual Status GetSessionState(SessionToken token, SessionState* out) const = 0;

  // credits
  virtual Status GetCredits(SessionToken token, std::int64_t* out) const = 0;
  virtual Status AdjustCredits(SessionToken token, std::int64_t delta, std::string_view reason, std::int64_t* new_balance) = 0;
  virtual Status SetCredits(SessionToken token, std::int64_t value, std::string_view reason) = 0;

  // inventory
  virtual Status GrantItem(SessionToken token, ItemHandle item, bool* changed) = 0;
  virtual Status RevokeItem(SessionToken token, ItemHandle item, bool* changed) = 0;
  virtual Status HasItem(SessionToken token, ItemHandle item, bool* out) const = 0;
  virtual Status ListInventory(SessionToken token, std::vector<InventoryEntry>* out) const = 0;

  // debit and grant as one step
  virtual Status Purchase(SessionToken token, ItemHandle item, PurchaseReceipt* out) = 0;
};

} // namespace bazaar::economy::v1

template <>
struct std::hash<bazaar::economy::v1::ItemHandle> {
  std::size_t operator()(const bazaar::economy::v1::ItemHandle& h) const noexcept {
    return std::hash<std::uint64_t>{}((static_cast<std::uint64_t>(h.registry) << 32) | h.index);
  }
};

template <>
struct std::hash<bazaar::economy::v1::CategoryHandle> {
  std::size_t operator()(const bazaar::economy::v1::CategoryHandle& h) const noexcept {
    return std::hash<std::uint64_t>{}((static_cast<std::uint64_t>(h.registry) << 32) | h.index);
  }
};

template <>
struct std::hash<bazaar::economy::v1::SessionToken> {
  std::size_t operator()(const bazaar::economy::v1::SessionToken& t) const noexcept {
    return std::hash<std::uint64_t>{}(t.value);
  }
};
