#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "dumpflux/types.hpp"

namespace dumpflux {

struct TupleResult {
  Row fields;
  bool malformed = false;
  // Set on a malformed tuple that is still open at the end of the clause,
  // i.e. one that may continue on the next line.
  bool truncated = false;
  std::string error;
  // Offset of the tuple's opening parenthesis within the VALUES clause.
  std::size_t offset = 0;
};

// Parses the tuple whose '(' sits at `pos` and moves `pos` past its ')'.
// Throws DumpError(malformed_literal) and leaves `pos` untouched on failure.
[[nodiscard]] Row ParseTuple(std::string_view clause, std::size_t& pos);

// Lazily walks the top-level tuples of a VALUES clause, i.e. the text after
// the VALUES keyword without the statement's terminating ';'.
class TupleReader {
 public:
  explicit TupleReader(std::string_view values_clause) : clause_(values_clause) {}

  // Returns false once the clause is exhausted. Malformed tuples are returned
  // with `malformed` set and scanning resumes after the next top-level ')'.
  bool Next(TupleResult& out);

  [[nodiscard]] std::size_t position() const { return pos_; }

 private:
  [[nodiscard]] std::size_t RecoveryPoint(std::size_t from) const;
  [[nodiscard]] bool RunsPastEnd(std::size_t open) const;

  std::string_view clause_;
  std::size_t pos_ = 0;
};

}  // namespace dumpflux
