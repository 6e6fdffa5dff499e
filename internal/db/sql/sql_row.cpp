#include "sql_row.hpp"

#include <charconv>
#include <stdexcept>

namespace bazaar::db::sql {

const Param& Row::Cell(std::size_t col) const {
  if (col >= cells_.size()) {
    throw std::out_of_range("row column " + std::to_string(col) + " out of range");
  }
  return cells_[col];
}

std::string Row::GetText(std::size_t col) const {
  const auto& cell = Cell(col);
  if (const auto* s = std::get_if<std::string>(&cell)) return *s;
  if (const auto* i = std::get_if<int64_t>(&cell)) return std::to_string(*i);
  return {};
}

int64_t Row::GetInt64(std::size_t col) const {
  const auto& cell = Cell(col);
  if (const auto* i = std::get_if<int64_t>(&cell)) return *i;
  if (const auto* s = std::get_if<std::string>(&cell)) {
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(s->data(), s->data() + s->size(), value);
    if (ec != std::errc() || ptr != s->data() + s->size()) {
      throw std::runtime_error("row column " + std::to_string(col) + " is not an integer: " + *s);
    }
    return value;
  }
  return 0;
}

bool Row::IsNull(std::size_t col) const {
  return std::holds_alternative<std::nullptr_t>(Cell(col));
}

}
