#pragma once

#include <cstddef>
#include <string_view>

#include "dumpflux/types.hpp"

namespace dumpflux {

struct ValueToken {
  FieldValue value;
  // Offset just past the closing quote, or of the delimiter ending an unquoted token.
  std::size_t end = 0;
};

// Decodes one SQL literal starting at `pos` (leading whitespace allowed).
// Throws DumpError(malformed_literal) if a quoted literal is not terminated.
[[nodiscard]] ValueToken ParseValue(std::string_view text, std::size_t pos);

bool IsSqlSpace(char c);

}  // namespace dumpflux
