#include "dumpflux/value_tokenizer.hpp"

#include <cctype>
#include <string>

#include "dumpflux/errors.hpp"

namespace dumpflux {

namespace {

bool IsDelimiter(char c) { return c == ',' || c == ')'; }

bool MatchesNullKeyword(std::string_view text, std::size_t pos) {
  static constexpr std::string_view kNull = "NULL";
  if (text.size() - pos < kNull.size()) {
    return false;
  }
  for (std::size_t k = 0; k < kNull.size(); ++k) {
    if (std::toupper(static_cast<unsigned char>(text[pos + k])) != kNull[k]) {
      return false;
    }
  }
  std::size_t after = pos + kNull.size();
  while (after < text.size() && IsSqlSpace(text[after])) {
    ++after;
  }
  return after == text.size() || IsDelimiter(text[after]);
}

char DecodeEscape(char c) {
  switch (c) {
    case 'n':
      return '\n';
    case 't':
      return '\t';
    case 'r':
      return '\r';
    case '0':
      return '\0';
    case 'Z':
      return '\x1a';
    default:
      // Backslash, either quote character and unknown escapes decode to themselves.
      return c;
  }
}

ValueToken ParseQuoted(std::string_view text, std::size_t open) {
  const char quote = text[open];
  std::string out;
  std::size_t i = open + 1;
  while (i < text.size()) {
    char c = text[i];
    if (c == '\\') {
      if (i + 1 >= text.size()) {
        break;
      }
      out.push_back(DecodeEscape(text[i + 1]));
      i += 2;
      continue;
    }
    if (c == quote) {
      if (i + 1 < text.size() && text[i + 1] == quote) {
        out.push_back(quote);
        i += 2;
        continue;
      }
      return ValueToken{std::move(out), i + 1};
    }
    out.push_back(c);
    ++i;
  }
  throw DumpError(ErrorKind::malformed_literal, "unterminated quoted literal", open);
}

}  // namespace

bool IsSqlSpace(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; }

ValueToken ParseValue(std::string_view text, std::size_t pos) {
  while (pos < text.size() && IsSqlSpace(text[pos])) {
    ++pos;
  }
  if (pos >= text.size()) {
    return ValueToken{std::string(), pos};
  }

  if (MatchesNullKeyword(text, pos)) {
    std::size_t end = pos + 4;
    while (end < text.size() && IsSqlSpace(text[end])) {
      ++end;
    }
    return ValueToken{std::nullopt, end};
  }

  if (text[pos] == '\'' || text[pos] == '"') {
    return ParseQuoted(text, pos);
  }

  std::size_t end = pos;
  while (end < text.size() && !IsDelimiter(text[end])) {
    ++end;
  }
  std::size_t last = end;
  while (last > pos && IsSqlSpace(text[last - 1])) {
    --last;
  }
  return ValueToken{std::string(text.substr(pos, last - pos)), end};
}

}  // namespace dumpflux
