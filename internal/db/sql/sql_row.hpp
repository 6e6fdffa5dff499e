#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "sql_params.hpp"

namespace bazaar::db::sql {

/*
  Generic row.

  Backends copy their result row into it:
    postgres -> pqxx::row    (cells arrive as text)
    sqlite   -> sqlite3_stmt (integers stay integers)
    memory   -> native values

  Prevents driver types leaking into gateway and session logic.
  Accessors convert between text and integers on demand.
*/

class Row {
public:
  Row() = default;
  explicit Row(std::vector<Param> cells) : cells_(std::move(cells)) {}

  std::size_t Size() const { return cells_.size(); }

  std::string GetText(std::size_t col) const;
  int64_t GetInt64(std::size_t col) const;
  bool IsNull(std::size_t col) const;

  void Append(Param cell) { cells_.push_back(std::move(cell)); }

private:
  const Param& Cell(std::size_t col) const;

  std::vector<Param> cells_;
};

using ResultSet = std::vector<Row>;

}
