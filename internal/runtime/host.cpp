#include "host.hpp"

#include <thread>

#include "internal/gateway/persistence_gateway.hpp"
#include "internal/observability/logging.hpp"
#include "internal/session/session_cache.hpp"

namespace bazaar::runtime {

using namespace std::chrono_literals;
using observability::DurationField;
using observability::UintField;

HostOptions HostOptionsFrom(const bazaar::runtime::config::RuntimeConfig& config) {
  HostOptions options;
  options.tick_interval  = util::FromProto(config.host().tick_interval(), 50ms);
  options.shutdown_grace = util::FromProto(config.host().shutdown_grace(), 15s);
  return options;
}

Host::Host(factory::Application& app, HostOptions options, ClockFn clock)
    : app_(app), options_(options), clock_(std::move(clock)) {
}

std::size_t Host::Tick() {
  const auto ran = app_.gateway->Poll();
  app_.sessions->Tick(clock_());
  return ran;
}

void Host::Run(const std::function<bool()>& keep_running) {
  BAZAAR_LOG_INFO("host loop started", {DurationField("tick_interval", options_.tick_interval)});

  while (keep_running()) {
    const auto started = std::chrono::steady_clock::now();
    Tick();
    const auto elapsed = std::chrono::steady_clock::now() - started;
    if (elapsed < options_.tick_interval) {
      std::this_thread::sleep_for(options_.tick_interval - elapsed);
    }
  }
}

std::size_t Host::Stop() {
  if (stopped_) return 0;
  stopped_ = true;

  app_.sessions->BeginShutdown();

  const auto deadline = std::chrono::steady_clock::now() + options_.shutdown_grace;
  while (app_.sessions->LiveCount() > 0 && std::chrono::steady_clock::now() < deadline) {
    app_.gateway->WaitForCompletion(options_.tick_interval);
    Tick();
  }

  const auto remaining = app_.sessions->LiveCount();
  if (remaining > 0) {
    BAZAAR_LOG_ERROR("shutdown grace elapsed with live sessions", {UintField("sessions", remaining)});
  }

  // aborts whatever is still queued; the session cache logs those as lost writes
  app_.gateway->Shutdown();

  BAZAAR_LOG_INFO("host stopped", {UintField("sessions", app_.sessions->LiveCount())});
  return remaining;
}

} // namespace bazaar::runtime
