#pragma once

#include <cstdint>
#include <string>

namespace bazaar::db::model {

// Items are persisted by key, never by in-process handle.
struct InventoryRecord {
  std::string identity;
  std::string category_key;
  std::string item_key;
  int64_t     acquired_at_ms = 0;
  int64_t     price_paid     = 0;
};

} // namespace bazaar::db::model
