#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace dumpflux {

// std::nullopt is the absent-value marker for an unquoted SQL NULL.
using FieldValue = std::optional<std::string>;
using Row = std::vector<FieldValue>;

struct TableSchema {
  std::string name;
  std::vector<std::string> columns;

  [[nodiscard]] std::size_t Arity() const { return columns.size(); }
};

}  // namespace dumpflux
