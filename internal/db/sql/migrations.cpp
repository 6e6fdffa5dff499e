#include "migrations.hpp"

#include <stdexcept>

namespace bazaar::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (std::size_t i = 0; i < ordered_sql.size(); ++i) {
    try {
      executor.ExecuteSQL(ordered_sql[i]);
    } catch (const std::exception& e) {
      throw std::runtime_error("migration step " + std::to_string(i) + " failed: " + e.what());
    }
  }
}

} // namespace bazaar::db::sql
