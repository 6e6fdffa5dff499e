#include "memory_repository.hpp"

#include <algorithm>
#include <tuple>

#include "memory_tx.hpp"

namespace bazaar::db::memory {

namespace {

std::string TextParam(const sql::Param& p) {
  if (const auto* s = std::get_if<std::string>(&p)) return *s;
  if (const auto* i = std::get_if<int64_t>(&p)) return std::to_string(*i);
  return {};
}

int64_t IntParam(const sql::Param& p) {
  if (const auto* i = std::get_if<int64_t>(&p)) return *i;
  if (const auto* s = std::get_if<std::string>(&p)) return std::stoll(*s);
  return 0;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::Execute(Transaction& t, const sql::Statement& statement, sql::ResultSet* rows) {
  if (auto arity = CheckArity(statement); !arity) return arity;

  auto& s = TX(t).Mutable();
  try {
    switch (statement.id) {
      case sql::StatementId::kEnsureUser:
        return EnsureUser(s, statement.params);
      case sql::StatementId::kSelectUser:
        return SelectUser(s, statement.params, rows);
      case sql::StatementId::kUpsertUser:
        return UpsertUser(s, statement.params);
      case sql::StatementId::kSelectInventory:
        return SelectInventory(s, statement.params, rows);
      case sql::StatementId::kDeleteInventory:
        return DeleteInventory(s, statement.params);
      case sql::StatementId::kInsertInventory:
        return InsertInventory(s, statement.params);
    }
  } catch (const std::exception& e) {
    return Result::Err(ErrorCode::InternalError, e.what());
  }
  return Result::Err(ErrorCode::Unsupported, std::string(sql::StatementName(statement.id)));
}

// ------------------------------------------------------------------
// Users
// ------------------------------------------------------------------

Result MemoryRepository::EnsureUser(State& s, const sql::Params& p) {
  const auto identity = TextParam(p[0]);
  if (s.users.contains(identity)) return Result::Ok();

  model::UserRecord r;
  r.identity      = identity;
  r.credits       = IntParam(p[1]);
  r.created_at_ms = IntParam(p[2]);
  r.updated_at_ms = IntParam(p[3]);
  s.users.emplace(identity, std::move(r));
  return Result::Ok();
}

Result MemoryRepository::UpsertUser(State& s, const sql::Params& p) {
  const auto identity = TextParam(p[0]);
  auto       it       = s.users.find(identity);
  if (it == s.users.end()) {
    model::UserRecord r;
    r.identity      = identity;
    r.credits       = IntParam(p[1]);
    r.created_at_ms = IntParam(p[2]);
    r.updated_at_ms = IntParam(p[3]);
    s.users.emplace(identity, std::move(r));
    return Result::Ok();
  }

  it->second.credits       = IntParam(p[1]);
  it->second.updated_at_ms = IntParam(p[3]);
  return Result::Ok();
}

Result MemoryRepository::SelectUser(const State& s, const sql::Params& p, sql::ResultSet* rows) const {
  auto it = s.users.find(TextParam(p[0]));
  if (it == s.users.end() || !rows) return Result::Ok();

  rows->emplace_back(std::vector<sql::Param>{it->second.identity, it->second.credits, it->second.updated_at_ms});
  return Result::Ok();
}

// ------------------------------------------------------------------
// Inventory
// ------------------------------------------------------------------

Result MemoryRepository::SelectInventory(const State& s, const sql::Params& p, sql::ResultSet* rows) const {
  auto it = s.inventory.find(TextParam(p[0]));
  if (it == s.inventory.end() || !rows) return Result::Ok();

  auto owned = it->second;
  std::sort(owned.begin(), owned.end(), [](const model::InventoryRecord& a, const model::InventoryRecord& b) {
    return std::tie(a.acquired_at_ms, a.category_key, a.item_key) < std::tie(b.acquired_at_ms, b.category_key, b.item_key);
  });

  for (const auto& r : owned) {
    rows->emplace_back(std::vector<sql::Param>{r.category_key, r.item_key, r.acquired_at_ms, r.price_paid});
  }
  return Result::Ok();
}

Result MemoryRepository::DeleteInventory(State& s, const sql::Params& p) {
  s.inventory.erase(TextParam(p[0]));
  return Result::Ok();
}

Result MemoryRepository::InsertInventory(State& s, const sql::Params& p) {
  model::InventoryRecord r;
  r.identity       = TextParam(p[0]);
  r.category_key   = TextParam(p[1]);
  r.item_key       = TextParam(p[2]);
  r.acquired_at_ms = IntParam(p[3]);
  r.price_paid     = IntParam(p[4]);

  if (!s.users.contains(r.identity)) {
    return Result::Err(ErrorCode::ConstraintViolation, "FOREIGN KEY constraint failed: unknown identity " + r.identity);
  }

  auto& owned = s.inventory[r.identity];
  for (const auto& existing : owned) {
    if (existing.category_key == r.category_key && existing.item_key == r.item_key) {
      return Result::Err(ErrorCode::ConstraintViolation,
                         "UNIQUE constraint failed: " + r.identity + "/" + r.category_key + "/" + r.item_key);
    }
  }
  owned.push_back(std::move(r));
  return Result::Ok();
}

}
