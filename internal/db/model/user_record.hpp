#pragma once

#include <cstdint>
#include <string>

namespace bazaar::db::model {

struct UserRecord {
  std::string identity;
  int64_t     credits       = 0;
  int64_t     created_at_ms = 0;
  int64_t     updated_at_ms = 0;
};

} // namespace bazaar::db::model
