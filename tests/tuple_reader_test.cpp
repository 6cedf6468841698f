#include <cassert>
#include <string>
#include <string_view>
#include <vector>

#include "dumpflux/errors.hpp"
#include "dumpflux/tuple_reader.hpp"

using namespace dumpflux;

static std::vector<TupleResult> ReadAll(std::string_view clause) {
  std::vector<TupleResult> out;
  TupleReader reader(clause);
  TupleResult t;
  while (reader.Next(t)) {
    out.push_back(t);
  }
  return out;
}

static void test_parse_tuple() {
  std::size_t pos = 0;
  Row row = ParseTuple("(1,'a',NULL),(2)", pos);
  assert(row.size() == 3);
  assert(*row[0] == "1" && *row[1] == "a" && !row[2]);
  assert(pos == 12);

  pos = 0;
  row = ParseTuple("('a)b', 2)", pos);
  assert(row.size() == 2);
  assert(*row[0] == "a)b" && *row[1] == "2");

  pos = 0;
  row = ParseTuple("( )", pos);
  assert(row.empty());
  assert(pos == 3);

  pos = 0;
  row = ParseTuple("(1,)", pos);
  assert(row.size() == 2);
  assert(*row[0] == "1" && row[1]->empty());
}

static void test_parse_tuple_errors() {
  std::size_t pos = 0;
  bool threw = false;
  try {
    (void)ParseTuple("('a' 'b')", pos);
  } catch (const DumpError& e) {
    threw = true;
    assert(e.kind() == ErrorKind::malformed_literal);
    assert(e.offset() == 5);
  }
  assert(threw);
  assert(pos == 0);

  threw = false;
  try {
    (void)ParseTuple("(1,2", pos);
  } catch (const DumpError& e) {
    threw = true;
    assert(std::string(e.what()).find("closing") != std::string::npos);
  }
  assert(threw);
}

static void test_reader_walks_tuples() {
  auto tuples = ReadAll("(1,'x'),(2,'y') ,\n (3,NULL)");
  assert(tuples.size() == 3);
  for (const auto& t : tuples) {
    assert(!t.malformed);
    assert(t.fields.size() == 2);
  }
  assert(*tuples[1].fields[1] == "y");
  assert(!tuples[2].fields[1]);
  assert(tuples[1].offset == 8);

  assert(ReadAll("").empty());
  assert(ReadAll("  ").empty());
}

static void test_reader_recovers_after_malformed_tuple() {
  auto tuples = ReadAll("(1,'a'),(2,'b' x),(3,'c')");
  assert(tuples.size() == 3);
  assert(!tuples[0].malformed);
  assert(tuples[1].malformed);
  assert(tuples[1].fields.empty());
  assert(!tuples[1].truncated);
  assert(!tuples[2].malformed);
  assert(*tuples[2].fields[1] == "c");

  tuples = ReadAll("(1,'ok'),(2,'never closed");
  assert(tuples.size() == 2);
  assert(tuples[1].malformed);
  assert(tuples[1].error == "unterminated quoted literal");
  assert(tuples[1].truncated);

  tuples = ReadAll("(1,2),(3,");
  assert(tuples.size() == 2);
  assert(tuples[1].malformed);
  assert(tuples[1].truncated);
  assert(tuples[1].offset == 6);

  tuples = ReadAll("(1,'x)'),(2,'it\\'s'");
  assert(tuples.size() == 2);
  assert(!tuples[0].malformed);
  assert(tuples[1].truncated);

  tuples = ReadAll("junk (1)");
  assert(tuples.size() == 2);
  assert(tuples[0].malformed);
  assert(!tuples[1].malformed);
  assert(*tuples[1].fields[0] == "1");
}

int main() {
  test_parse_tuple();
  test_parse_tuple_errors();
  test_reader_walks_tuples();
  test_reader_recovers_after_malformed_tuple();
  return 0;
}
