#pragma once

#include <memory>

#include "bazaar/economy/v1.hpp"
#include "config/config.pb.h"
#include "internal/session/session_cache.hpp"

namespace bazaar::factory {

/*
  Application

  Owns all long-lived components of the economy engine.
  Members are destroyed in reverse order: the API first, the
  repository last.
*/
struct Application {
  std::shared_ptr<db::Repository>              repository;
  std::shared_ptr<gateway::PersistenceGateway> gateway;
  std::shared_ptr<catalog::Registry>           registry;
  std::shared_ptr<session::SessionCache>       sessions;
  std::shared_ptr<economy::v1::EconomyApi>     api;
};

/*
  Build

  Constructs the whole engine from runtime config, bootstraps the schema
  and starts the gateway lanes.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Application Build(const bazaar::runtime::config::RuntimeConfig& config,
                  session::SessionCache::ClockFn clock = util::Now);

/*
  Opens the configured backend and applies the schema.
  Falls back to the in-memory repository when no database is configured.
*/
std::shared_ptr<db::Repository> BuildRepository(const bazaar::runtime::config::RuntimeConfig& config);

// Zero or unset config values fall back to defaults.
session::SessionOptions   SessionOptionsFrom(const bazaar::runtime::config::RuntimeConfig& config);
gateway::GatewayOptions   GatewayOptionsFrom(const bazaar::runtime::config::RuntimeConfig& config);

/*
  Registers the configured catalog through the extensibility API.
  Throws std::runtime_error naming the offending entry on the first
  rejected registration.
*/
void SeedCatalog(economy::v1::EconomyApi& api, const bazaar::runtime::config::CatalogConfig& catalog);

} // namespace bazaar::factory
