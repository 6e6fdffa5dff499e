#pragma once

#include <exception>

#include "bazaar/economy/v1.hpp"

namespace bazaar::service {

/*
  Converts internal exceptions into economy::v1 status codes.
*/

economy::v1::Status ToStatus(const std::exception& e);

} // namespace bazaar::service
