#include "economy_service.hpp"

#include <stdexcept>

#include "api_error.hpp"
#include "internal/catalog/registry.hpp"
#include "internal/observability/logging.hpp"
#include "internal/session/session_cache.hpp"
#include "internal/util/errors.hpp"

namespace bazaar::service {

using namespace bazaar::economy::v1;
using observability::StringField;

namespace {

// Runs `fn`, translating any exception into a Status for `route`.
template <typename Fn>
Status Guard(std::string_view route, Fn&& fn) {
  try {
    fn();
    return Status::Ok();
  } catch (const std::exception& e) {
    auto status = ToStatus(e);
    if (status.code == StatusCode::kInternal) {
      BAZAAR_LOG_ERROR("api call failed", {StringField("route", route), StringField("error", e.what())});
    } else {
      BAZAAR_LOG_DEBUG("api call rejected", {StringField("route", route), StringField("code", StatusCodeName(status.code)),
                                             StringField("error", e.what())});
    }
    return status;
  }
}

template <typename T>
void Set(T* out, T value) {
  if (out) *out = std::move(value);
}

} // namespace

EconomyService::EconomyService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.registry || !ctx_.sessions) {
    throw std::invalid_argument("EconomyService requires a registry and a session cache");
  }
}

// ------------------------------------------------------------
// Catalog
// ------------------------------------------------------------

Status EconomyService::RegisterCategory(const CategorySpec& spec, CategoryHandle* out) {
  return Guard("RegisterCategory", [&] { Set(out, ctx_.registry->RegisterCategory(spec.key, spec.name, spec.description)); });
}

Status EconomyService::RegisterItem(CategoryHandle category, const ItemSpec& spec, ItemHandle* out) {
  return Guard("RegisterItem",
               [&] { Set(out, ctx_.registry->RegisterItem(category, spec.key, spec.name, spec.price, spec.type)); });
}

Status EconomyService::SetItemPrice(ItemHandle item, std::int64_t price) {
  return Guard("SetItemPrice", [&] { ctx_.registry->SetPrice(item, price); });
}

Status EconomyService::SetItemName(ItemHandle item, const std::string& name) {
  return Guard("SetItemName", [&] { ctx_.registry->SetName(item, name); });
}

Status EconomyService::RetireItem(ItemHandle item) {
  return Guard("RetireItem", [&] { ctx_.registry->RetireItem(item); });
}

Status EconomyService::RetireCategory(CategoryHandle category) {
  return Guard("RetireCategory", [&] { ctx_.registry->RetireCategory(category); });
}

Status EconomyService::GetCategory(CategoryHandle category, CategoryInfo* out) const {
  return Guard("GetCategory", [&] { Set(out, ctx_.registry->Lookup(category)); });
}

Status EconomyService::GetItem(ItemHandle item, ItemInfo* out) const {
  return Guard("GetItem", [&] { Set(out, ctx_.registry->Lookup(item)); });
}

Status EconomyService::FindCategory(std::string_view category_key, CategoryHandle* out) const {
  return Guard("FindCategory", [&] { Set(out, ctx_.registry->FindCategory(category_key)); });
}

Status EconomyService::FindItem(std::string_view category_key, std::string_view item_key, ItemHandle* out) const {
  return Guard("FindItem", [&] { Set(out, ctx_.registry->LookupByKey(category_key, item_key)); });
}

std::vector<CategoryInfo> EconomyService::ListCategories() const {
  std::vector<CategoryInfo> out;
  for (auto handle : ctx_.registry->Categories()) {
    out.push_back(ctx_.registry->Lookup(handle));
  }
  return out;
}

Status EconomyService::ListItems(CategoryHandle category, std::vector<ItemInfo>* out) const {
  return Guard("ListItems", [&] {
    std::vector<ItemInfo> items;
    for (auto handle : ctx_.registry->Items(category)) {
      items.push_back(ctx_.registry->Lookup(handle));
    }
    Set(out, std::move(items));
  });
}

// ------------------------------------------------------------
// Sessions
// ------------------------------------------------------------

Status EconomyService::PlayerJoined(ConnectionSlot slot, const std::string& identity, SessionToken* out) {
  return Guard("PlayerJoined", [&] { Set(out, ctx_.sessions->OnJoin(slot, identity)); });
}

Status EconomyService::PlayerLeft(SessionToken token) {
  return Guard("PlayerLeft", [&] { ctx_.sessions->OnLeave(token); });
}

Status EconomyService::SessionForSlot(ConnectionSlot slot, SessionToken* out) const {
  return Guard("SessionForSlot", [&] {
    auto token = ctx_.sessions->TokenForSlot(slot);
    if (!token) {
      throw util::NotFound("no session on slot " + std::to_string(slot));
    }
    Set(out, *token);
  });
}

Status EconomyService::GetSessionState(SessionToken token, SessionState* out) const {
  return Guard("GetSessionState", [&] { Set(out, ctx_.sessions->State(token)); });
}

// ------------------------------------------------------------
// Credits and inventory
// ------------------------------------------------------------

Status EconomyService::GetCredits(SessionToken token, std::int64_t* out) const {
  return Guard("GetCredits", [&] { Set(out, ctx_.sessions->Credits(token)); });
}

Status EconomyService::AdjustCredits(SessionToken token, std::int64_t delta, std::string_view reason,
                                     std::int64_t* new_balance) {
  return Guard("AdjustCredits", [&] { Set(new_balance, ctx_.sessions->AdjustCredits(token, delta, reason)); });
}

Status EconomyService::SetCredits(SessionToken token, std::int64_t value, std::string_view reason) {
  return Guard("SetCredits", [&] { ctx_.sessions->SetCredits(token, value, reason); });
}

Status EconomyService::GrantItem(SessionToken token, ItemHandle item, bool* changed) {
  return Guard("GrantItem", [&] { Set(changed, ctx_.sessions->GrantItem(token, item)); });
}

Status EconomyService::RevokeItem(SessionToken token, ItemHandle item, bool* changed) {
  return Guard("RevokeItem", [&] {
    // foreign or unknown handles are reported, not silently "not owned"
    ctx_.registry->Lookup(item);
    Set(changed, ctx_.sessions->RevokeItem(token, item));
  });
}

Status EconomyService::HasItem(SessionToken token, ItemHandle item, bool* out) const {
  return Guard("HasItem", [&] {
    ctx_.registry->Lookup(item);
    Set(out, ctx_.sessions->HasItem(token, item));
  });
}

Status EconomyService::ListInventory(SessionToken token, std::vector<InventoryEntry>* out) const {
  return Guard("ListInventory", [&] { Set(out, ctx_.sessions->Inventory(token)); });
}

Status EconomyService::Purchase(SessionToken token, ItemHandle item, PurchaseReceipt* out) {
  return Guard("Purchase", [&] { Set(out, ctx_.sessions->Purchase(token, item)); });
}

} // namespace bazaar::service
