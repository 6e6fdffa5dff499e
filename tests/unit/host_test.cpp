#include "internal/runtime/host.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

#include "internal/catalog/registry.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/gateway/persistence_gateway.hpp"
#include "internal/service/economy_service.hpp"
#include "internal/session/session_cache.hpp"
#include "support/scripted_repository.hpp"

namespace {

using namespace std::chrono_literals;
using namespace bazaar::economy::v1;

using bazaar::factory::Application;
using bazaar::runtime::Host;
using bazaar::runtime::HostOptions;

HostOptions FastHost() {
  HostOptions options;
  options.tick_interval  = 5ms;
  options.shutdown_grace = 2s;
  return options;
}

Application BuildApp() {
  return bazaar::factory::Build(bazaar::config::ConfigLoader::LoadFromString(R"(
economy:
  starting_balance: 100
catalog:
  categories:
    - key: "gear"
      items:
        - key: "kevlar"
          price: 60
)"));
}

SessionState StateOf(Application& app, SessionToken token) {
  SessionState state = SessionState::kLoading;
  assert(app.api->GetSessionState(token, &state));
  return state;
}

void TestTickDrivesSessionsToActive() {
  auto app = BuildApp();
  Host host(app, FastHost());

  SessionToken token;
  assert(app.api->PlayerJoined(1, "alice", &token));

  const auto deadline = std::chrono::steady_clock::now() + 5s;
  while (StateOf(app, token) != SessionState::kActive && std::chrono::steady_clock::now() < deadline) {
    app.gateway->WaitForCompletion(10ms);
    host.Tick();
  }
  assert(StateOf(app, token) == SessionState::kActive);
  assert(host.Tick() == 0);

  assert(host.Stop() == 0);
}

void TestRunStopsWhenAsked() {
  auto app = BuildApp();
  Host host(app, FastHost());

  int ticks = 0;
  host.Run([&] { return ++ticks <= 3; });
  assert(ticks == 4);

  assert(host.Stop() == 0);
}

void TestStopFlushesEverySession() {
  auto app = BuildApp();
  Host host(app, FastHost());

  ItemHandle kevlar;
  assert(app.api->FindItem("gear", "kevlar", &kevlar));

  SessionToken alice, bob;
  assert(app.api->PlayerJoined(1, "alice", &alice));
  assert(app.api->PlayerJoined(2, "bob", &bob));
  host.Run([&] { return StateOf(app, alice) != SessionState::kActive || StateOf(app, bob) != SessionState::kActive; });

  PurchaseReceipt receipt;
  assert(app.api->Purchase(alice, kevlar, &receipt));
  assert(app.api->AdjustCredits(bob, 5, "bonus", nullptr));

  assert(host.Stop() == 0);
  assert(app.sessions->LiveCount() == 0);
  assert(StateOf(app, alice) == SessionState::kRetired);
  assert(StateOf(app, bob) == SessionState::kRetired);
  assert(!app.gateway->Accepting());

  // second Stop is a no-op
  assert(host.Stop() == 0);

  bazaar::db::sql::ResultSet rows;
  auto                       tx = app.repository->Begin();
  assert(app.repository->Execute(*tx, {bazaar::db::sql::StatementId::kSelectUser, {std::string("alice")}}, &rows));
  assert(app.repository->Execute(*tx, {bazaar::db::sql::StatementId::kSelectUser, {std::string("bob")}}, &rows));
  tx->Commit();
  assert(rows.size() == 2);
  assert(rows[0].GetInt64(1) == 40);
  assert(rows[1].GetInt64(1) == 105);

  SessionToken late;
  assert(app.api->PlayerJoined(3, "carol", &late).code == StatusCode::kUnavailable);
}

void TestStopReportsSessionsStillLiveAfterGrace() {
  auto scripted = std::make_shared<bazaar::testing::ScriptedRepository>(std::make_shared<bazaar::db::memory::MemoryRepository>());

  Application app;
  app.repository = scripted;
  app.gateway    = std::make_shared<bazaar::gateway::PersistenceGateway>(app.repository, bazaar::gateway::GatewayOptions{});
  app.gateway->Start();
  app.registry = std::make_shared<bazaar::catalog::Registry>();
  app.sessions = std::make_shared<bazaar::session::SessionCache>(*app.registry, *app.gateway, bazaar::session::SessionOptions{});
  app.api      = std::make_shared<bazaar::service::EconomyService>(bazaar::service::ServiceContext{app.registry, app.sessions});

  auto options           = FastHost();
  options.shutdown_grace = 100ms;
  Host host(app, options);

  scripted->Hold();
  SessionToken token;
  assert(app.api->PlayerJoined(1, "alice", &token));
  scripted->AwaitWaiting(1);

  // the stuck load finishes only once the gateway has stopped accepting work
  std::thread releaser([&] {
    while (app.gateway->Accepting()) std::this_thread::sleep_for(1ms);
    scripted->Open();
  });

  assert(host.Stop() == 1);
  releaser.join();

  assert(app.sessions->LiveCount() == 0);
  assert(StateOf(app, token) == SessionState::kFailed);
}

} // namespace

int main() {
  TestTickDrivesSessionsToActive();
  TestRunStopsWhenAsked();
  TestStopFlushesEverySession();
  TestStopReportsSessionsStillLiveAfterGrace();

  std::cout << "bazaar_unit_host: pass\n";
  return 0;
}
