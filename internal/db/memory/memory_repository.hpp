#pragma once

#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/inventory_record.hpp"
#include "internal/db/model/user_record.hpp"

namespace bazaar::db::memory {

class MemoryTransaction;

/*
  In-process backend.

  Interprets the named statements directly against two tables held in
  memory; the foreign key and primary key constraints of the SQL schema
  are enforced the same way so behaviour matches the SQL backends.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result Execute(Transaction&, const sql::Statement& statement, sql::ResultSet* rows) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::UserRecord> users;
    // identity -> owned rows, in insertion order
    std::map<std::string, std::vector<model::InventoryRecord>> inventory;
  };

  Result EnsureUser(State& s, const sql::Params& p);
  Result UpsertUser(State& s, const sql::Params& p);
  Result SelectUser(const State& s, const sql::Params& p, sql::ResultSet* rows) const;
  Result SelectInventory(const State& s, const sql::Params& p, sql::ResultSet* rows) const;
  Result DeleteInventory(State& s, const sql::Params& p);
  Result InsertInventory(State& s, const sql::Params& p);

  // held by a transaction from Begin() until it ends
  std::mutex writer_mutex_;

  std::mutex state_mutex_;
  State committed_;
};

}
