#include "internal/service/economy_service.hpp"

#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/gateway/persistence_gateway.hpp"
#include "internal/service/api_error.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;
using namespace bazaar::economy::v1;

using bazaar::factory::Application;

constexpr const char* kConfig = R"(
economy:
  starting_balance: 2000
  credit_ceiling: 10000
gateway:
  workers: 2
  retry_backoff: "0.001s"
catalog:
  categories:
    - key: "weapons"
      name: "Weapons"
      items:
        - key: "ak47"
          name: "AK-47"
          price: 1500
          type: "rifle"
        - key: "deagle"
          name: "Desert Eagle"
          price: 700
          type: "pistol"
    - key: "gear"
      name: "Gear"
      items:
        - key: "kevlar"
          name: "Kevlar Vest"
          price: 650
)";

Application BuildApp() {
  return bazaar::factory::Build(bazaar::config::ConfigLoader::LoadFromString(kConfig));
}

bool Pump(Application& app, const std::function<bool()>& done) {
  const auto deadline = std::chrono::steady_clock::now() + 5s;
  while (!done()) {
    if (std::chrono::steady_clock::now() > deadline) return false;
    app.gateway->WaitForCompletion(10ms);
    app.gateway->Poll();
  }
  return true;
}

SessionToken JoinActive(Application& app, ConnectionSlot slot, const std::string& identity) {
  SessionToken token;
  assert(app.api->PlayerJoined(slot, identity, &token));
  assert(token.valid());
  assert(Pump(app, [&] {
    SessionState state = SessionState::kLoading;
    assert(app.api->GetSessionState(token, &state));
    return state == SessionState::kActive;
  }));
  return token;
}

ItemHandle Item(Application& app, const char* category, const char* key) {
  ItemHandle handle;
  assert(app.api->FindItem(category, key, &handle));
  return handle;
}

void TestSeededCatalogIsBrowsable() {
  auto  app = BuildApp();
  auto& api = *app.api;

  const auto categories = api.ListCategories();
  assert(categories.size() == 2);
  assert(categories[0].key == "weapons");
  assert(categories[0].items.size() == 2);
  assert(categories[1].key == "gear");

  CategoryHandle weapons;
  assert(api.FindCategory("weapons", &weapons));

  std::vector<ItemInfo> items;
  assert(api.ListItems(weapons, &items));
  assert(items.size() == 2);
  assert(items[0].key == "ak47");
  assert(items[0].price == 1500);
  assert(items[1].type == "pistol");

  ItemInfo info;
  assert(api.GetItem(Item(app, "gear", "kevlar"), &info));
  assert(info.name == "Kevlar Vest");

  CategoryInfo category;
  assert(api.GetCategory(weapons, &category));
  assert(category.name == "Weapons");
}

void TestCatalogErrorsAreReportedAsStatus() {
  auto  app = BuildApp();
  auto& api = *app.api;

  CategoryHandle weapons;
  assert(api.FindCategory("weapons", &weapons));

  CategoryHandle untouched{7, 7};
  auto           status = api.RegisterCategory({"weapons", "Weapons", ""}, &untouched);
  assert(status.code == StatusCode::kDuplicateKey);
  assert(!status.message.empty());
  assert((untouched == CategoryHandle{7, 7}));

  ItemHandle item{7, 7};
  assert(api.RegisterItem(weapons, {"ak47", "AK-47", 1, ""}, &item).code == StatusCode::kDuplicateKey);
  assert(api.RegisterItem(CategoryHandle{}, {"m4a1", "M4A1", 1, ""}, &item).code == StatusCode::kInvalidCategory);
  assert(api.RegisterItem(weapons, {"m4a1", "M4A1", -1, ""}, &item).code == StatusCode::kInvalidArgument);
  assert(api.RegisterItem(weapons, {"", "Nameless", 1, ""}, &item).code == StatusCode::kInvalidArgument);
  assert((item == ItemHandle{7, 7}));

  assert(api.FindCategory("vehicles", &weapons).code == StatusCode::kNotFound);
  assert(api.FindItem("weapons", "m4a1", &item).code == StatusCode::kNotFound);
  assert(api.SetItemPrice(ItemHandle{}, 10).code == StatusCode::kNotFound);
  assert(api.SetItemPrice(Item(app, "weapons", "ak47"), -10).code == StatusCode::kInvalidArgument);

  assert(api.RegisterItem(weapons, {"m4a1", "M4A1", 3100, "rifle"}, &item));
  assert(item.valid());
  assert(api.SetItemName(item, "M4A1-S"));

  ItemInfo info;
  assert(api.GetItem(item, &info));
  assert(info.name == "M4A1-S");
  assert(info.price == 3100);
}

void TestPlayerEconomyThroughApi() {
  auto  app = BuildApp();
  auto& api = *app.api;

  const auto ak47   = Item(app, "weapons", "ak47");
  const auto deagle = Item(app, "weapons", "deagle");
  const auto kevlar = Item(app, "gear", "kevlar");

  const auto alice = JoinActive(app, 1, "alice");

  SessionToken on_slot;
  assert(api.SessionForSlot(1, &on_slot));
  assert(on_slot == alice);
  assert(api.SessionForSlot(2, &on_slot).code == StatusCode::kNotFound);

  std::int64_t credits = 0;
  assert(api.GetCredits(alice, &credits));
  assert(credits == 2000);

  PurchaseReceipt receipt;
  assert(api.Purchase(alice, ak47, &receipt));
  assert(receipt.price_paid == 1500);
  assert(receipt.balance_after == 500);

  PurchaseReceipt rejected;
  rejected.balance_after = -1;
  auto status = api.Purchase(alice, deagle, &rejected);
  assert(status.code == StatusCode::kInsufficientFunds);
  assert(rejected.balance_after == -1);

  std::int64_t balance = 0;
  assert(api.AdjustCredits(alice, 2000, "round win", &balance));
  assert(balance == 2500);
  assert(api.Purchase(alice, ak47, &receipt).code == StatusCode::kAlreadyOwned);
  assert(api.AdjustCredits(alice, 8000, "bonus", &balance).code == StatusCode::kCreditLimitExceeded);
  assert(balance == 2500);
  assert(api.SetCredits(alice, -5, "admin").code == StatusCode::kInsufficientFunds);

  bool changed = false;
  assert(api.GrantItem(alice, kevlar, &changed));
  assert(changed);
  assert(api.GrantItem(alice, kevlar, &changed));
  assert(!changed);

  bool owned = false;
  assert(api.HasItem(alice, kevlar, &owned));
  assert(owned);

  std::vector<InventoryEntry> inventory;
  assert(api.ListInventory(alice, &inventory));
  assert(inventory.size() == 2);

  assert(api.RevokeItem(alice, kevlar, &changed));
  assert(changed);
  assert(api.HasItem(alice, kevlar, &owned));
  assert(!owned);

  assert(api.RetireItem(deagle));
  assert(api.Purchase(alice, deagle, &receipt).code == StatusCode::kNotPurchasable);

  assert(api.PlayerLeft(alice));
  assert(api.AdjustCredits(alice, 1, "late", nullptr).code == StatusCode::kSessionNotActive);
  assert(Pump(app, [&] {
    SessionState state = SessionState::kActive;
    api.GetSessionState(alice, &state);
    return state == SessionState::kRetired;
  }));
  assert(api.GetCredits(alice, &credits).code == StatusCode::kSessionNotActive);
  assert(api.PlayerLeft(alice).code == StatusCode::kSessionNotActive);

  // the next session sees what the previous one wrote
  const auto again = JoinActive(app, 3, "alice");
  assert(api.GetCredits(again, &credits));
  assert(credits == 2500);
  assert(api.HasItem(again, ak47, &owned));
  assert(owned);
}

void TestForeignHandlesAreRejected() {
  auto first  = BuildApp();
  auto second = BuildApp();

  const auto foreign_item = Item(second, "weapons", "ak47");
  CategoryHandle foreign_category;
  assert(second.api->FindCategory("weapons", &foreign_category));

  const auto alice = JoinActive(first, 1, "alice");

  PurchaseReceipt receipt;
  assert(first.api->Purchase(alice, foreign_item, &receipt).code == StatusCode::kNotFound);

  bool flag = false;
  assert(first.api->GrantItem(alice, foreign_item, &flag).code == StatusCode::kNotFound);
  assert(first.api->RevokeItem(alice, foreign_item, &flag).code == StatusCode::kNotFound);
  assert(first.api->HasItem(alice, foreign_item, &flag).code == StatusCode::kNotFound);
  assert(first.api->SetItemPrice(foreign_item, 1).code == StatusCode::kNotFound);

  ItemHandle item;
  assert(first.api->RegisterItem(foreign_category, {"m4a1", "M4A1", 1, ""}, &item).code == StatusCode::kInvalidCategory);

  SessionState state;
  assert(first.api->GetSessionState(SessionToken{12345}, &state).code == StatusCode::kNotFound);
}

void TestJoinRejectedOnceShutDown() {
  auto app = BuildApp();

  SessionToken token;
  assert(app.api->PlayerJoined(1, "", &token).code == StatusCode::kInvalidArgument);
  assert(app.api->PlayerJoined(-3, "alice", &token).code == StatusCode::kInvalidArgument);

  app.gateway->Shutdown();
  auto status = app.api->PlayerJoined(1, "alice", &token);
  assert(status.code == StatusCode::kUnavailable);
  assert(!token.valid());
}

void TestExceptionMapping() {
  using bazaar::service::ToStatus;

  assert(ToStatus(bazaar::util::InvalidState("x")).code == StatusCode::kFailedPrecondition);
  assert(ToStatus(bazaar::util::ValidationError("x")).code == StatusCode::kInvalidArgument);
  assert(ToStatus(bazaar::util::StateError("x")).code == StatusCode::kFailedPrecondition);
  assert(ToStatus(bazaar::util::Unavailable("x")).code == StatusCode::kUnavailable);
  assert(ToStatus(std::runtime_error("boom")).code == StatusCode::kInternal);
  assert(ToStatus(std::runtime_error("boom")).message == "boom");

  assert(StatusCodeName(StatusCode::kInsufficientFunds) == "INSUFFICIENT_FUNDS");
  assert(StatusCodeName(StatusCode::kOk) == "OK");
  assert(SessionStateName(SessionState::kFlushing) == "flushing");
}

void TestSeedingStopsAtFirstRejectedEntry() {
  auto app = BuildApp();

  bazaar::runtime::config::CatalogConfig catalog;
  auto* category = catalog.add_categories();
  category->set_key("weapons");
  category->set_name("Duplicate");

  bool threw = false;
  try {
    bazaar::factory::SeedCatalog(*app.api, catalog);
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find("DUPLICATE_KEY") != std::string::npos;
  }
  assert(threw);
}

} // namespace

int main() {
  TestSeededCatalogIsBrowsable();
  TestCatalogErrorsAreReportedAsStatus();
  TestPlayerEconomyThroughApi();
  TestForeignHandlesAreRejected();
  TestJoinRejectedOnceShutDown();
  TestExceptionMapping();
  TestSeedingStopsAtFirstRejectedEntry();

  std::cout << "bazaar_unit_economy_service: pass\n";
  return 0;
}
