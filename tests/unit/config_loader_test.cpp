#include "internal/config/config_loader.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/factory.hpp"
#include "internal/runtime/host.hpp"

namespace {

using namespace std::chrono_literals;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "bazaar_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejected(const std::string& yaml) {
  try {
    (void)bazaar::config::ConfigLoader::LoadFromString(yaml);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  table_prefix: "bz_"
  sqlite:
    path: "C:\\bazaar\\\"quoted\"\\economy.db"
    wal_mode: true
)");

  auto config = bazaar::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\bazaar\\\"quoted\"\\economy.db");
  assert(config.database().sqlite().wal_mode());
  assert(config.database().table_prefix() == "bz_");
}

void TestQuotedNumbersStayStrings() {
  // an all-digit item key must not turn into a number
  auto config = bazaar::config::ConfigLoader::LoadFromString(R"(catalog:
  categories:
    - key: "weapons"
      items:
        - key: "1911"
          name: "M1911"
          price: 500
)");

  const auto& item = config.catalog().categories(0).items(0);
  assert(item.key() == "1911");
  assert(item.price() == 500);
}

void TestEconomyAndDurations() {
  auto config = bazaar::config::ConfigLoader::LoadFromString(R"(economy:
  starting_balance: 800
  credit_floor: -200
  flush_interval: "45s"
  load_timeout: "2.5s"
gateway:
  workers: 4
host:
  tick_interval: "0.020s"
)");

  const auto sessions = bazaar::factory::SessionOptionsFrom(config);
  assert(sessions.starting_balance == 800);
  assert(sessions.credit_floor == -200);
  assert(!sessions.credit_ceiling.has_value());
  assert(sessions.flush_interval == 45s);
  assert(sessions.load_timeout == 2500ms);
  assert(sessions.flush_timeout == 10s);
  assert(sessions.max_flush_attempts == 3);

  const auto gateway = bazaar::factory::GatewayOptionsFrom(config);
  assert(gateway.workers == 4);
  assert(gateway.retry.max_attempts == 3);
  assert(gateway.retry.backoff == 50ms);

  const auto host = bazaar::runtime::HostOptionsFrom(config);
  assert(host.tick_interval == 20ms);
  assert(host.shutdown_grace == 15s);
}

void TestUnknownFieldsAreRejected() {
  assert(Rejected("economy:\n  starting_balance: 10\nunknown_field: 123\n") && "ConfigLoader must reject unknown fields.");
  assert(Rejected("economy:\n  startingbalance: 10\n"));
  assert(Rejected("economy:\n  flush_interval: \"soon\"\n"));
  assert(Rejected("economy: [1, 2\n"));

  bool threw = false;
  try {
    (void)bazaar::config::ConfigLoader::LoadFromYaml("/nonexistent/bazaar.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestExampleConfigLoads() {
  const auto path   = std::filesystem::path(BAZAAR_SOURCE_DIR) / "config" / "bazaar.example.yaml";
  auto       config = bazaar::config::ConfigLoader::LoadFromYaml(path.string());

  assert(config.database().has_sqlite());
  assert(!config.database().sqlite().full_sync());
  assert(config.database().sqlite().busy_timeout().seconds() == 5);
  assert(config.economy().starting_balance() == 2000);
  assert(config.economy().has_credit_ceiling());
  assert(config.catalog().categories_size() == 2);
  assert(config.catalog().categories(0).items(0).key() == "ak47");
  assert(config.catalog().categories(0).items(0).price() == 1500);
  assert(config.logging().logger_name() == "bazaar");
}

} // namespace

int main() {
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedNumbersStayStrings();
  TestEconomyAndDurations();
  TestUnknownFieldsAreRejected();
  TestExampleConfigLoads();

  std::cout << "bazaar_unit_config_loader: pass\n";
  return 0;
}
