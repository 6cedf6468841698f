#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace dumpflux {

struct InsertStatement {
  std::string table;
  // Text after VALUES with the terminating ';' removed; views into the line.
  std::string_view values;
  // False when the statement continues on the following lines.
  bool terminated = false;
};

std::string_view TrimSql(std::string_view text);

// Reads a backtick-quoted identifier starting at `pos` ("``" decodes to "`").
// On success stores it in `out` and moves `pos` past the closing backtick.
bool ParseQuotedIdentifier(std::string_view text, std::size_t& pos, std::string& out);

// CREATE TABLE [IF NOT EXISTS] `name` ...
bool ParseCreateTableHeader(std::string_view line, std::string& table);

// Definitions written on the CREATE TABLE line itself, split at top-level
// commas. `closed` is set when the body's closing ')' is on the same line.
std::vector<std::string_view> SplitInlineDefinitions(std::string_view line, bool& closed);

// INSERT [IGNORE] INTO `name` [(`col`, ...)] VALUES ...;  or  REPLACE INTO ...
bool ParseInsertStatement(std::string_view line, InsertStatement& out);

// A column declaration line inside a CREATE TABLE body: `name` <type ...>
bool ParseColumnName(std::string_view line, std::string& column);

// True for the line closing a CREATE TABLE body, e.g. ") ENGINE=InnoDB ...;".
bool IsDefinitionTerminator(std::string_view line);

}  // namespace dumpflux
