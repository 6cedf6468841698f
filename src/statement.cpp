#include "dumpflux/statement.hpp"

#include <cctype>
#include <utility>

#include "dumpflux/value_tokenizer.hpp"

namespace dumpflux {

namespace {

std::size_t SkipSpace(std::string_view text, std::size_t i) {
  while (i < text.size() && IsSqlSpace(text[i])) {
    ++i;
  }
  return i;
}

bool IsIdentChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

// Matches `keyword` case-insensitively as a whole word at `pos`, then skips
// the whitespace after it.
bool ConsumeKeyword(std::string_view text, std::size_t& pos, std::string_view keyword) {
  if (text.size() - pos < keyword.size()) {
    return false;
  }
  for (std::size_t k = 0; k < keyword.size(); ++k) {
    if (std::toupper(static_cast<unsigned char>(text[pos + k])) != keyword[k]) {
      return false;
    }
  }
  std::size_t end = pos + keyword.size();
  if (end < text.size() && IsIdentChar(text[end])) {
    return false;
  }
  pos = SkipSpace(text, end);
  return true;
}

// `name`, `schema`.`name` or a bare identifier; keeps the last part.
bool ParseTableName(std::string_view text, std::size_t& pos, std::string& out) {
  while (true) {
    if (pos < text.size() && text[pos] == '`') {
      if (!ParseQuotedIdentifier(text, pos, out)) {
        return false;
      }
    } else {
      std::size_t start = pos;
      while (pos < text.size() && IsIdentChar(text[pos])) {
        ++pos;
      }
      if (pos == start) {
        return false;
      }
      out.assign(text.substr(start, pos - start));
    }
    if (pos < text.size() && text[pos] == '.') {
      ++pos;
      continue;
    }
    pos = SkipSpace(text, pos);
    return true;
  }
}

bool SkipColumnList(std::string_view text, std::size_t& pos) {
  bool in_ident = false;
  for (std::size_t i = pos + 1; i < text.size(); ++i) {
    if (text[i] == '`') {
      in_ident = !in_ident;
    } else if (text[i] == ')' && !in_ident) {
      pos = SkipSpace(text, i + 1);
      return true;
    }
  }
  return false;
}

}  // namespace

std::string_view TrimSql(std::string_view text) {
  std::size_t start = 0;
  while (start < text.size() && IsSqlSpace(text[start])) {
    ++start;
  }
  std::size_t end = text.size();
  while (end > start && IsSqlSpace(text[end - 1])) {
    --end;
  }
  return text.substr(start, end - start);
}

bool ParseQuotedIdentifier(std::string_view text, std::size_t& pos, std::string& out) {
  if (pos >= text.size() || text[pos] != '`') {
    return false;
  }
  std::string name;
  for (std::size_t i = pos + 1; i < text.size(); ++i) {
    if (text[i] != '`') {
      name.push_back(text[i]);
      continue;
    }
    if (i + 1 < text.size() && text[i + 1] == '`') {
      name.push_back('`');
      ++i;
      continue;
    }
    if (name.empty()) {
      return false;
    }
    out = std::move(name);
    pos = i + 1;
    return true;
  }
  return false;
}

namespace {

// Leaves `pos` just past the table name and the whitespace after it.
bool ParseCreateHeaderAt(std::string_view line, std::size_t& pos, std::string& table) {
  pos = SkipSpace(line, 0);
  if (!ConsumeKeyword(line, pos, "CREATE")) {
    return false;
  }
  ConsumeKeyword(line, pos, "TEMPORARY");
  if (!ConsumeKeyword(line, pos, "TABLE")) {
    return false;
  }
  std::size_t after = pos;
  if (ConsumeKeyword(line, after, "IF") && ConsumeKeyword(line, after, "NOT") &&
      ConsumeKeyword(line, after, "EXISTS")) {
    pos = after;
  }
  return pos < line.size() && line[pos] == '`' && ParseTableName(line, pos, table);
}

}  // namespace

bool ParseCreateTableHeader(std::string_view line, std::string& table) {
  std::size_t pos = 0;
  return ParseCreateHeaderAt(line, pos, table);
}

std::vector<std::string_view> SplitInlineDefinitions(std::string_view line, bool& closed) {
  std::vector<std::string_view> defs;
  closed = false;
  std::size_t pos = 0;
  std::string table;
  if (!ParseCreateHeaderAt(line, pos, table) || pos >= line.size() || line[pos] != '(') {
    return defs;
  }

  auto push = [&](std::size_t from, std::size_t to) {
    std::string_view def = TrimSql(line.substr(from, to - from));
    if (!def.empty()) {
      defs.push_back(def);
    }
  };
  std::size_t start = pos + 1;
  int depth = 0;
  char quote = 0;
  for (std::size_t i = start; i < line.size(); ++i) {
    char c = line[i];
    if (quote) {
      if (c == '\\' && quote != '`') {
        ++i;
      } else if (c == quote) {
        quote = 0;
      }
      continue;
    }
    if (c == '`' || c == '\'' || c == '"') {
      quote = c;
    } else if (c == '(') {
      ++depth;
    } else if (c == ')') {
      if (depth == 0) {
        push(start, i);
        closed = true;
        return defs;
      }
      --depth;
    } else if (c == ',' && depth == 0) {
      push(start, i);
      start = i + 1;
    }
  }
  push(start, line.size());
  return defs;
}

bool ParseInsertStatement(std::string_view line, InsertStatement& out) {
  std::size_t pos = SkipSpace(line, 0);
  if (ConsumeKeyword(line, pos, "INSERT")) {
    ConsumeKeyword(line, pos, "IGNORE");
  } else if (!ConsumeKeyword(line, pos, "REPLACE")) {
    return false;
  }
  if (!ConsumeKeyword(line, pos, "INTO")) {
    return false;
  }
  std::string table;
  if (!ParseTableName(line, pos, table)) {
    return false;
  }
  if (pos < line.size() && line[pos] == '(' && !SkipColumnList(line, pos)) {
    return false;
  }
  if (!ConsumeKeyword(line, pos, "VALUES") && !ConsumeKeyword(line, pos, "VALUE")) {
    return false;
  }

  std::string_view values = TrimSql(line.substr(pos));
  bool terminated = !values.empty() && values.back() == ';';
  if (terminated) {
    values.remove_suffix(1);
  }
  out.table = std::move(table);
  out.values = values;
  out.terminated = terminated;
  return true;
}

bool ParseColumnName(std::string_view line, std::string& column) {
  std::string_view trimmed = TrimSql(line);
  std::size_t pos = 0;
  return ParseQuotedIdentifier(trimmed, pos, column);
}

bool IsDefinitionTerminator(std::string_view line) {
  std::string_view trimmed = TrimSql(line);
  return !trimmed.empty() && (trimmed.front() == ')' || trimmed.back() == ';');
}

}  // namespace dumpflux
