#include "registry.hpp"

#include <atomic>
#include <mutex>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace bazaar::catalog {

using namespace bazaar::economy::v1;
using observability::IntField;
using observability::StringField;

namespace {

std::uint32_t NextRegistryId() {
  static std::atomic<std::uint32_t> next{1};
  return next.fetch_add(1, std::memory_order_relaxed);
}

std::string Describe(ItemHandle h) {
  return "item#" + std::to_string(h.registry) + "." + std::to_string(h.index);
}

std::string Describe(CategoryHandle h) {
  return "category#" + std::to_string(h.registry) + "." + std::to_string(h.index);
}

} // namespace

Registry::Registry() : id_(NextRegistryId()) {
}

// ------------------------------------------------------------
// Registration
// ------------------------------------------------------------

CategoryHandle Registry::RegisterCategory(const std::string& key, const std::string& name, const std::string& description) {
  if (key.empty()) {
    throw util::InvalidArgument("category key must not be empty");
  }

  std::unique_lock lock(mutex_);

  if (categories_by_key_.contains(key)) {
    throw util::DuplicateKey("category already registered: " + key);
  }

  CategoryEntry entry;
  entry.key         = key;
  entry.name        = name;
  entry.description = description;
  categories_.push_back(std::move(entry));

  const auto index = static_cast<std::uint32_t>(categories_.size());
  categories_by_key_.emplace(key, index);

  BAZAAR_LOG_DEBUG("category registered", {StringField("key", key), IntField("index", index)});
  return CategoryAt(index);
}

ItemHandle Registry::RegisterItem(CategoryHandle category, const std::string& key, const std::string& name, std::int64_t price,
                                  const std::string& type) {
  if (key.empty()) {
    throw util::InvalidArgument("item key must not be empty");
  }
  if (price < 0) {
    throw util::InvalidArgument("item price must be >= 0: " + key + " " + std::to_string(price));
  }

  std::unique_lock lock(mutex_);

  const auto* found = FindLocked(category);
  if (!found || found->retired) {
    throw util::InvalidCategory("unknown or retired " + Describe(category));
  }

  auto& owner = categories_[category.index - 1];
  if (owner.items_by_key.contains(key)) {
    throw util::DuplicateKey("item already registered in " + owner.key + ": " + key);
  }

  ItemEntry entry;
  entry.category = category.index;
  entry.key      = key;
  entry.name     = name;
  entry.price    = price;
  entry.type     = type;
  items_.push_back(std::move(entry));

  const auto index = static_cast<std::uint32_t>(items_.size());
  owner.items.push_back(index);
  owner.items_by_key.emplace(key, index);

  BAZAAR_LOG_DEBUG("item registered", {StringField("category", owner.key), StringField("key", key), IntField("price", price)});
  return ItemAt(index);
}

// ------------------------------------------------------------
// Lookup
// ------------------------------------------------------------

const Registry::CategoryEntry* Registry::FindLocked(CategoryHandle handle) const {
  if (handle.registry != id_ || handle.index == 0 || handle.index > categories_.size()) {
    return nullptr;
  }
  return &categories_[handle.index - 1];
}

const Registry::ItemEntry* Registry::FindLocked(ItemHandle handle) const {
  if (handle.registry != id_ || handle.index == 0 || handle.index > items_.size()) {
    return nullptr;
  }
  return &items_[handle.index - 1];
}

Registry::ItemEntry* Registry::MutableLocked(ItemHandle handle) {
  return const_cast<ItemEntry*>(FindLocked(handle));
}

CategoryInfo Registry::ToInfo(std::uint32_t index, const CategoryEntry& entry) const {
  CategoryInfo info;
  info.handle      = CategoryAt(index);
  info.key         = entry.key;
  info.name        = entry.name;
  info.description = entry.description;
  info.retired     = entry.retired;
  info.items.reserve(entry.items.size());
  for (auto item : entry.items) {
    info.items.push_back(ItemAt(item));
  }
  return info;
}

ItemInfo Registry::ToInfo(std::uint32_t index, const ItemEntry& entry) const {
  ItemInfo info;
  info.handle   = ItemAt(index);
  info.category = CategoryAt(entry.category);
  info.key      = entry.key;
  info.name     = entry.name;
  info.price    = entry.price;
  info.type     = entry.type;
  info.retired  = entry.retired;
  return info;
}

CategoryInfo Registry::Lookup(CategoryHandle handle) const {
  std::shared_lock lock(mutex_);
  const auto*      entry = FindLocked(handle);
  if (!entry) {
    throw util::NotFound("unknown " + Describe(handle));
  }
  return ToInfo(handle.index, *entry);
}

ItemInfo Registry::Lookup(ItemHandle handle) const {
  std::shared_lock lock(mutex_);
  const auto*      entry = FindLocked(handle);
  if (!entry) {
    throw util::NotFound("unknown " + Describe(handle));
  }
  return ToInfo(handle.index, *entry);
}

CategoryHandle Registry::FindCategory(std::string_view category_key) const {
  std::shared_lock lock(mutex_);
  auto             it = categories_by_key_.find(std::string(category_key));
  if (it == categories_by_key_.end()) {
    throw util::NotFound("unknown category key: " + std::string(category_key));
  }
  return CategoryAt(it->second);
}

std::optional<ItemHandle> Registry::TryLookupByKey(std::string_view category_key, std::string_view item_key) const {
  std::shared_lock lock(mutex_);
  auto             cat = categories_by_key_.find(std::string(category_key));
  if (cat == categories_by_key_.end()) {
    return std::nullopt;
  }

  const auto& entry = categories_[cat->second - 1];
  auto        item  = entry.items_by_key.find(std::string(item_key));
  if (item == entry.items_by_key.end()) {
    return std::nullopt;
  }
  return ItemAt(item->second);
}

ItemHandle Registry::LookupByKey(std::string_view category_key, std::string_view item_key) const {
  auto handle = TryLookupByKey(category_key, item_key);
  if (!handle) {
    throw util::NotFound("unknown item: " + std::string(category_key) + "/" + std::string(item_key));
  }
  return *handle;
}

bool Registry::IsPurchasable(ItemHandle handle) const {
  std::shared_lock lock(mutex_);
  const auto*      entry = FindLocked(handle);
  if (!entry || entry->retired) {
    return false;
  }
  return !categories_[entry->category - 1].retired;
}

// ------------------------------------------------------------
// Administration
// ------------------------------------------------------------

void Registry::SetPrice(ItemHandle handle, std::int64_t price) {
  if (price < 0) {
    throw util::InvalidArgument("item price must be >= 0: " + std::to_string(price));
  }

  std::unique_lock lock(mutex_);
  auto*            entry = MutableLocked(handle);
  if (!entry) {
    throw util::NotFound("unknown " + Describe(handle));
  }

  const auto previous = entry->price;
  entry->price        = price;
  BAZAAR_LOG_INFO("item price changed", {StringField("item", entry->key), IntField("from", previous), IntField("to", price)});
}

void Registry::SetName(ItemHandle handle, const std::string& name) {
  std::unique_lock lock(mutex_);
  auto*            entry = MutableLocked(handle);
  if (!entry) {
    throw util::NotFound("unknown " + Describe(handle));
  }
  entry->name = name;
}

void Registry::RetireItem(ItemHandle handle) {
  std::unique_lock lock(mutex_);
  auto*            entry = MutableLocked(handle);
  if (!entry) {
    throw util::NotFound("unknown " + Describe(handle));
  }
  entry->retired = true;
  BAZAAR_LOG_INFO("item retired", {StringField("item", entry->key)});
}

void Registry::RetireCategory(CategoryHandle handle) {
  std::unique_lock lock(mutex_);
  if (!FindLocked(handle)) {
    throw util::NotFound("unknown " + Describe(handle));
  }
  auto& entry   = categories_[handle.index - 1];
  entry.retired = true;
  BAZAAR_LOG_INFO("category retired", {StringField("category", entry.key)});
}

// ------------------------------------------------------------
// Enumeration
// ------------------------------------------------------------

std::vector<CategoryHandle> Registry::Categories() const {
  std::shared_lock            lock(mutex_);
  std::vector<CategoryHandle> out;
  out.reserve(categories_.size());
  for (std::uint32_t i = 1; i <= categories_.size(); ++i) {
    out.push_back(CategoryAt(i));
  }
  return out;
}

std::vector<ItemHandle> Registry::Items(CategoryHandle category) const {
  std::shared_lock lock(mutex_);
  const auto*      entry = FindLocked(category);
  if (!entry) {
    throw util::NotFound("unknown " + Describe(category));
  }

  std::vector<ItemHandle> out;
  out.reserve(entry->items.size());
  for (auto index : entry->items) {
    out.push_back(ItemAt(index));
  }
  return out;
}

std::size_t Registry::CategoryCount() const {
  std::shared_lock lock(mutex_);
  return categories_.size();
}

std::size_t Registry::ItemCount() const {
  std::shared_lock lock(mutex_);
  return items_.size();
}

} // namespace bazaar::catalog
