#include "dumpflux/tuple_reader.hpp"

#include <utility>

#include "dumpflux/errors.hpp"
#include "dumpflux/value_tokenizer.hpp"

namespace dumpflux {

namespace {
std::size_t SkipSpace(std::string_view text, std::size_t i) {
  while (i < text.size() && IsSqlSpace(text[i])) {
    ++i;
  }
  return i;
}
}  // namespace

Row ParseTuple(std::string_view clause, std::size_t& pos) {
  Row fields;
  std::size_t i = SkipSpace(clause, pos + 1);
  if (i < clause.size() && clause[i] == ')') {
    pos = i + 1;
    return fields;
  }

  while (true) {
    ValueToken token = ParseValue(clause, i);
    std::size_t j = SkipSpace(clause, token.end);
    if (j >= clause.size()) {
      throw DumpError(ErrorKind::malformed_literal, "tuple is missing its closing ')'", j);
    }
    if (clause[j] == ',') {
      fields.push_back(std::move(token.value));
      i = j + 1;
      continue;
    }
    if (clause[j] == ')') {
      fields.push_back(std::move(token.value));
      pos = j + 1;
      return fields;
    }
    throw DumpError(ErrorKind::malformed_literal,
                    std::string("unexpected character '") + clause[j] + "' after value", j);
  }
}

bool TupleReader::Next(TupleResult& out) {
  while (pos_ < clause_.size() && (IsSqlSpace(clause_[pos_]) || clause_[pos_] == ',')) {
    ++pos_;
  }
  if (pos_ >= clause_.size()) {
    return false;
  }

  out = TupleResult{};
  out.offset = pos_;
  if (clause_[pos_] != '(') {
    out.malformed = true;
    out.error = "expected '(' to open a tuple";
    std::size_t next = clause_.find('(', pos_);
    pos_ = next == std::string_view::npos ? clause_.size() : next;
    return true;
  }

  try {
    out.fields = ParseTuple(clause_, pos_);
  } catch (const DumpError& e) {
    out.malformed = true;
    out.error = e.what();
    out.fields.clear();
    out.truncated = RunsPastEnd(out.offset);
    pos_ = RecoveryPoint(e.offset());
  }
  return true;
}

std::size_t TupleReader::RecoveryPoint(std::size_t from) const {
  // Depth starts inside the failed tuple; quotes are not trusted here.
  int depth = 1;
  for (std::size_t i = from; i < clause_.size(); ++i) {
    if (clause_[i] == '(') {
      ++depth;
    } else if (clause_[i] == ')') {
      if (--depth == 0) {
        return i + 1;
      }
    }
  }
  return clause_.size();
}

bool TupleReader::RunsPastEnd(std::size_t open) const {
  int depth = 0;
  char quote = 0;
  for (std::size_t i = open; i < clause_.size(); ++i) {
    char c = clause_[i];
    if (quote) {
      if (c == '\\') {
        ++i;
      } else if (c == quote) {
        quote = 0;
      }
      continue;
    }
    if (c == '\'' || c == '"') {
      quote = c;
    } else if (c == '(') {
      ++depth;
    } else if (c == ')' && --depth == 0) {
      return false;
    }
  }
  return true;
}

}  // namespace dumpflux
