#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace dumpflux {

enum class ErrorKind {
  malformed_literal = 0,
  arity_mismatch,
  insert_before_schema,
  sink_write_failure,
  interleaved_insert,
  duplicate_column,
};

inline constexpr std::size_t kErrorKindCount = 6;

const char* ErrorKindName(ErrorKind kind);

class DumpError : public std::runtime_error {
 public:
  DumpError(ErrorKind kind, const std::string& message, std::size_t offset = 0)
      : std::runtime_error(message), kind_(kind), offset_(offset) {}

  [[nodiscard]] ErrorKind kind() const { return kind_; }
  // Byte offset into the buffer being tokenized, when known.
  [[nodiscard]] std::size_t offset() const { return offset_; }

 private:
  ErrorKind kind_;
  std::size_t offset_;
};

}  // namespace dumpflux
