#pragma once

#include <chrono>
#include <functional>

#include "internal/factory.hpp"
#include "internal/util/time.hpp"

namespace bazaar::runtime {

struct HostOptions {
  std::chrono::milliseconds tick_interval{50};
  std::chrono::milliseconds shutdown_grace{15000};
};

HostOptions HostOptionsFrom(const bazaar::runtime::config::RuntimeConfig& config);

/*
  Host

  Stand-in for the game server's simulation loop: every tick it runs
  the gateway continuations and the session cache's periodic work on
  the calling thread.
*/
class Host {
 public:
  using ClockFn = std::function<util::TimePoint()>;

  Host(factory::Application& app, HostOptions options, ClockFn clock = util::Now);

  Host(const Host&)            = delete;
  Host& operator=(const Host&) = delete;

  // One simulation step. Returns the number of continuations run.
  std::size_t Tick();

  // Ticks at tick_interval while `keep_running` returns true.
  void Run(const std::function<bool()>& keep_running);

  /*
    Leaves every session and keeps ticking until all of them are gone
    or shutdown_grace elapses, then shuts the gateway down.
    Returns the number of sessions still live when the grace ran out.
  */
  std::size_t Stop();

 private:
  factory::Application& app_;
  HostOptions           options_;
  ClockFn               clock_;
  bool                  stopped_ = false;
};

} // namespace bazaar::runtime
