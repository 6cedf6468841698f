#include "dumpflux/schema_tracker.hpp"

#include <algorithm>
#include <utility>

#include "dumpflux/statement.hpp"

namespace dumpflux {

void SchemaTracker::Begin(std::string table) {
  schema_ = TableSchema{std::move(table), {}};
  duplicates_.clear();
  state_ = State::awaiting_columns;
}

bool SchemaTracker::Consume(std::string_view line) {
  if (state_ != State::awaiting_columns) {
    return state_ == State::closed;
  }

  std::string column;
  if (ParseColumnName(line, column)) {
    auto& columns = schema_.columns;
    if (std::find(columns.begin(), columns.end(), column) != columns.end()) {
      duplicates_.push_back(column);
    }
    columns.push_back(std::move(column));
    return false;
  }

  if (IsDefinitionTerminator(line)) {
    state_ = State::closed;
    return true;
  }
  return false;
}

TableSchema SchemaTracker::TakeSchema() {
  TableSchema out = std::move(schema_);
  schema_ = TableSchema{};
  duplicates_.clear();
  state_ = State::idle;
  return out;
}

}  // namespace dumpflux
