#pragma once

#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "bazaar/economy/v1.hpp"

namespace bazaar::catalog {

/*
  Registry

  Owns every category and item definition for the process lifetime.

  Handle semantics:
  - handles are dense indexes into append-only tables, tagged with the
    id of the issuing registry
  - nothing is ever erased; Retire*() only deactivates
  - therefore a handle keeps resolving to the same logical entity, and a
    handle from another registry is NotFound

  Read-heavy: lookups take a shared lock, the rare administrative
  mutations an exclusive one. Lookups return value snapshots, so a price
  read once stays fixed for the caller while later lookups observe any
  SetPrice() immediately.
*/
class Registry {
 public:
  Registry();

  Registry(const Registry&)            = delete;
  Registry& operator=(const Registry&) = delete;

  economy::v1::CategoryHandle RegisterCategory(const std::string& key, const std::string& name,
                                               const std::string& description);

  economy::v1::ItemHandle RegisterItem(economy::v1::CategoryHandle category, const std::string& key,
                                       const std::string& name, std::int64_t price, const std::string& type = {});

  economy::v1::CategoryInfo Lookup(economy::v1::CategoryHandle handle) const;
  economy::v1::ItemInfo     Lookup(economy::v1::ItemHandle handle) const;

  economy::v1::CategoryHandle FindCategory(std::string_view category_key) const;
  economy::v1::ItemHandle     LookupByKey(std::string_view category_key, std::string_view item_key) const;
  std::optional<economy::v1::ItemHandle> TryLookupByKey(std::string_view category_key,
                                                        std::string_view item_key) const;

  void SetPrice(economy::v1::ItemHandle handle, std::int64_t price);
  void SetName(economy::v1::ItemHandle handle, const std::string& name);

  void RetireItem(economy::v1::ItemHandle handle);
  void RetireCategory(economy::v1::CategoryHandle handle);

  // Neither the item nor its category is retired.
  bool IsPurchasable(economy::v1::ItemHandle handle) const;

  // Registration order.
  std::vector<economy::v1::CategoryHandle> Categories() const;
  std::vector<economy::v1::ItemHandle>     Items(economy::v1::CategoryHandle category) const;

  std::size_t CategoryCount() const;
  std::size_t ItemCount() const;

  std::uint32_t Id() const { return id_; }

 private:
  struct CategoryEntry {
    std::string                                  key;
    std::string                                  name;
    std::string                                  description;
    std::vector<std::uint32_t>                   items;
    std::unordered_map<std::string, std::uint32_t> items_by_key;
    bool                                         retired = false;
  };

  struct ItemEntry {
    std::uint32_t category = 0;
    std::string   key;
    std::string   name;
    std::int64_t  price = 0;
    std::string   type;
    bool          retired = false;
  };

  const CategoryEntry* FindLocked(economy::v1::CategoryHandle handle) const;
  const ItemEntry*     FindLocked(economy::v1::ItemHandle handle) const;
  ItemEntry*           MutableLocked(economy::v1::ItemHandle handle);

  economy::v1::CategoryHandle CategoryAt(std::uint32_t index) const { return {id_, index}; }
  economy::v1::ItemHandle     ItemAt(std::uint32_t index) const { return {id_, index}; }

  economy::v1::CategoryInfo ToInfo(std::uint32_t index, const CategoryEntry& entry) const;
  economy::v1::ItemInfo     ToInfo(std::uint32_t index, const ItemEntry& entry) const;

  const std::uint32_t id_;

  mutable std::shared_mutex mutex_;

  // index i + 1 is the handle of element i
  std::vector<CategoryEntry>                     categories_;
  std::vector<ItemEntry>                         items_;
  std::unordered_map<std::string, std::uint32_t> categories_by_key_;
};

} // namespace bazaar::catalog
