#pragma once

#include <optional>
#include <unordered_map>

#include "bazaar/economy/v1.hpp"

namespace bazaar::session {

/*
  Connection slot -> current session token.

  The host reuses slots; the token is the generation. Unbind() only
  clears the slot while it still points at the given token, so a late
  cleanup for an old session never detaches its successor.
*/
class SlotTable {
 public:
  // Returns the token previously bound to the slot, if any.
  std::optional<economy::v1::SessionToken> Bind(economy::v1::ConnectionSlot slot, economy::v1::SessionToken token);

  bool Unbind(economy::v1::ConnectionSlot slot, economy::v1::SessionToken token);

  std::optional<economy::v1::SessionToken> Lookup(economy::v1::ConnectionSlot slot) const;

  std::size_t Size() const { return slots_.size(); }

 private:
  std::unordered_map<economy::v1::ConnectionSlot, economy::v1::SessionToken> slots_;
};

} // namespace bazaar::session
