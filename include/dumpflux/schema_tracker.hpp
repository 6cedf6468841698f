#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "dumpflux/types.hpp"

namespace dumpflux {

// Collects the column names of one CREATE TABLE body, a line at a time.
class SchemaTracker {
 public:
  enum class State { idle = 0, awaiting_columns, closed };

  void Begin(std::string table);

  // Feeds one line of the CREATE TABLE body. Returns true once the line that
  // terminates the statement has been seen.
  bool Consume(std::string_view line);

  // Stops accepting columns even if no terminator was seen.
  void Close() { state_ = State::closed; }

  [[nodiscard]] State state() const { return state_; }
  [[nodiscard]] const TableSchema& schema() const { return schema_; }
  // Column names that were declared more than once, in encounter order.
  [[nodiscard]] const std::vector<std::string>& duplicates() const { return duplicates_; }

  TableSchema TakeSchema();

 private:
  State state_ = State::idle;
  TableSchema schema_;
  std::vector<std::string> duplicates_;
};

}  // namespace dumpflux
