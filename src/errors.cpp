#include "dumpflux/errors.hpp"

namespace dumpflux {

const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::malformed_literal:
      return "malformed_literal";
    case ErrorKind::arity_mismatch:
      return "arity_mismatch";
    case ErrorKind::insert_before_schema:
      return "insert_before_schema";
    case ErrorKind::sink_write_failure:
      return "sink_write_failure";
    case ErrorKind::interleaved_insert:
      return "interleaved_insert";
    case ErrorKind::duplicate_column:
      return "duplicate_column";
  }
  return "unknown";
}

}  // namespace dumpflux
