#pragma once

#include <memory>

namespace bazaar::catalog { class Registry; }
namespace bazaar::session { class SessionCache; }

namespace bazaar::service {

/*
  Dependency container shared by the API implementation.
*/
struct ServiceContext {
  std::shared_ptr<bazaar::catalog::Registry> registry;
  std::shared_ptr<bazaar::session::SessionCache> sessions;
};

}
