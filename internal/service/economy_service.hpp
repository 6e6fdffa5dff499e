#pragma once

#include "bazaar/economy/v1.hpp"
#include "service_context.hpp"

namespace bazaar::service {

/*
  EconomyService

  Implements the versioned extensibility API on top of the registry and
  the session cache. Every internal exception is caught here and
  reported as a Status; out-pointers are written on success only.
*/
class EconomyService final : public economy::v1::EconomyApi {
 public:
  explicit EconomyService(ServiceContext ctx);

  economy::v1::Status RegisterCategory(const economy::v1::CategorySpec& spec, economy::v1::CategoryHandle* out) override;
  economy::v1::Status RegisterItem(economy::v1::CategoryHandle category, const economy::v1::ItemSpec& spec,
                                   economy::v1::ItemHandle* out) override;

  economy::v1::Status SetItemPrice(economy::v1::ItemHandle item, std::int64_t price) override;
  economy::v1::Status SetItemName(economy::v1::ItemHandle item, const std::string& name) override;
  economy::v1::Status RetireItem(economy::v1::ItemHandle item) override;
  economy::v1::Status RetireCategory(economy::v1::CategoryHandle category) override;

  economy::v1::Status GetCategory(economy::v1::CategoryHandle category, economy::v1::CategoryInfo* out) const override;
  economy::v1::Status GetItem(economy::v1::ItemHandle item, economy::v1::ItemInfo* out) const override;
  economy::v1::Status FindCategory(std::string_view category_key, economy::v1::CategoryHandle* out) const override;
  economy::v1::Status FindItem(std::string_view category_key, std::string_view item_key,
                               economy::v1::ItemHandle* out) const override;
  std::vector<economy::v1::CategoryInfo> ListCategories() const override;
  economy::v1::Status ListItems(economy::v1::CategoryHandle category, std::vector<economy::v1::ItemInfo>* out) const override;

  economy::v1::Status PlayerJoined(economy::v1::ConnectionSlot slot, const std::string& identity,
                                   economy::v1::SessionToken* out) override;
  economy::v1::Status PlayerLeft(economy::v1::SessionToken token) override;
  economy::v1::Status SessionForSlot(economy::v1::ConnectionSlot slot, economy::v1::SessionToken* out) const override;
  economy::v1::Status GetSessionState(economy::v1::SessionToken token, economy::v1::SessionState* out) const override;

  economy::v1::Status GetCredits(economy::v1::SessionToken token, std::int64_t* out) const override;
  economy::v1::Status AdjustCredits(economy::v1::SessionToken token, std::int64_t delta, std::string_view reason,
                                    std::int64_t* new_balance) override;
  economy::v1::Status SetCredits(economy::v1::SessionToken token, std::int64_t value, std::string_view reason) override;

  economy::v1::Status GrantItem(economy::v1::SessionToken token, economy::v1::ItemHandle item, bool* changed) override;
  economy::v1::Status RevokeItem(economy::v1::SessionToken token, economy::v1::ItemHandle item, bool* changed) override;
  economy::v1::Status HasItem(economy::v1::SessionToken token, economy::v1::ItemHandle item, bool* out) const override;
  economy::v1::Status ListInventory(economy::v1::SessionToken token,
                                    std::vector<economy::v1::InventoryEntry>* out) const override;

  economy::v1::Status Purchase(economy::v1::SessionToken token, economy::v1::ItemHandle item,
                               economy::v1::PurchaseReceipt* out) override;

 private:
  ServiceContext ctx_;
};

} // namespace bazaar::service
