#include <cassert>
#include <string>

#include "dumpflux/errors.hpp"
#include "dumpflux/value_tokenizer.hpp"

using namespace dumpflux;

static void test_quoted_literals() {
  auto t = ParseValue("'abc',1", 0);
  assert(t.value && *t.value == "abc");
  assert(t.end == 5);

  t = ParseValue("'O''Brien'", 0);
  assert(t.value && *t.value == "O'Brien");
  t = ParseValue("'O\\'Brien'", 0);
  assert(t.value && *t.value == "O'Brien");

  t = ParseValue("\"dq \\\" x\"", 0);
  assert(t.value && *t.value == "dq \" x");

  t = ParseValue("'a)b', 2", 0);
  assert(t.value && *t.value == "a)b");
  assert(t.end == 5);
}

static void test_escapes() {
  auto t = ParseValue("'\\n\\t\\r\\0\\Z\\\\\\q'", 0);
  std::string expected = "\n\t\r";
  expected.push_back('\0');
  expected.push_back('\x1a');
  expected += "\\q";
  assert(t.value && *t.value == expected);
}

static void test_null_keyword() {
  auto t = ParseValue("NULL,1", 0);
  assert(!t.value);
  assert(t.end == 4);

  t = ParseValue("  null  )", 0);
  assert(!t.value);
  assert(t.end == 8);

  t = ParseValue("NuLl", 0);
  assert(!t.value);

  t = ParseValue("'NULL'", 0);
  assert(t.value && *t.value == "NULL");

  t = ParseValue("NULLABLE,", 0);
  assert(t.value && *t.value == "NULLABLE");
}

static void test_unquoted_tokens() {
  auto t = ParseValue("  42 ,x", 0);
  assert(t.value && *t.value == "42");
  assert(t.end == 5);

  t = ParseValue("-3.5e2)", 0);
  assert(t.value && *t.value == "-3.5e2");
  assert(t.end == 6);

  t = ParseValue(",", 0);
  assert(t.value && t.value->empty());
  assert(t.end == 0);

  t = ParseValue("   ", 0);
  assert(t.value && t.value->empty());
  assert(t.end == 3);
}

static void test_unterminated_literal() {
  bool threw = false;
  try {
    (void)ParseValue("1,'abc", 2);
  } catch (const DumpError& e) {
    threw = true;
    assert(e.kind() == ErrorKind::malformed_literal);
    assert(e.offset() == 2);
  }
  assert(threw);

  threw = false;
  try {
    (void)ParseValue("'ab\\", 0);
  } catch (const DumpError& e) {
    threw = true;
    assert(e.kind() == ErrorKind::malformed_literal);
  }
  assert(threw);
}

int main() {
  test_quoted_literals();
  test_escapes();
  test_null_keyword();
  test_unquoted_tokens();
  test_unterminated_literal();
  assert(IsSqlSpace('\t') && !IsSqlSpace('x'));
  return 0;
}
