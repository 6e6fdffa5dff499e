#include "slot_table.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace bazaar::session {

using economy::v1::ConnectionSlot;
using economy::v1::SessionToken;

std::optional<SessionToken> SlotTable::Bind(ConnectionSlot slot, SessionToken token) {
  if (slot < 0) {
    throw util::InvalidArgument("connection slot must be >= 0: " + std::to_string(slot));
  }

  std::optional<SessionToken> previous;
  auto                        it = slots_.find(slot);
  if (it != slots_.end()) {
    previous   = it->second;
    it->second = token;
  } else {
    slots_.emplace(slot, token);
  }
  return previous;
}

bool SlotTable::Unbind(ConnectionSlot slot, SessionToken token) {
  auto it = slots_.find(slot);
  if (it == slots_.end() || it->second != token) {
    return false;
  }
  slots_.erase(it);
  return true;
}

std::optional<SessionToken> SlotTable::Lookup(ConnectionSlot slot) const {
  auto it = slots_.find(slot);
  if (it == slots_.end()) return std::nullopt;
  return it->second;
}

} // namespace bazaar::session
