#include <cassert>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "dumpflux/csv_sink.hpp"
#include "dumpflux/errors.hpp"
#include "dumpflux/jsonl_sink.hpp"
#include "dumpflux/memory_sink.hpp"

using namespace dumpflux;
namespace fs = std::filesystem;

static fs::path ScratchDir(const std::string& name) {
  fs::path dir = fs::temp_directory_path() / ("dumpflux_sinks_" + name);
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

static std::string ReadFile(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  std::ostringstream oss;
  oss << in.rdbuf();
  return oss.str();
}

static TableSchema UsersSchema() { return TableSchema{"users", {"id", "name"}}; }

static void test_escape_csv_field() {
  assert(EscapeCsvField("plain", ',', false) == "plain");
  assert(EscapeCsvField("plain", ',', true) == "\"plain\"");
  assert(EscapeCsvField("a,b", ',', false) == "\"a,b\"");
  assert(EscapeCsvField("say \"hi\"", ',', false) == "\"say \"\"hi\"\"\"");
  assert(EscapeCsvField("two\nlines", ',', false) == "\"two\nlines\"");
  assert(EscapeCsvField("a;b", ';', false) == "\"a;b\"");
  assert(EscapeCsvField("", ',', true) == "\"\"");
}

static void test_file_stems() {
  assert(FileStemForTable("users") == "users");
  assert(FileStemForTable("a/b\\c:d") == "a_b_c_d");
  assert(FileStemForTable("..") == "_..");
  assert(FileStemForTable("") == "_");
}

static void test_csv_sink_quote_all() {
  fs::path dir = ScratchDir("quote_all");
  CsvOptions opts;
  opts.out_dir = (dir / "nested").string();
  opts.null_text = "\\N";
  CsvSinkFactory factory(opts);

  auto sink = factory.Open("users");
  sink->WriteHeader(UsersSchema());
  sink->WriteRow(Row{std::string("1"), std::nullopt});
  sink->WriteRow(Row{std::string("2"), std::string("")});
  sink->WriteRow(Row{std::string("3"), std::string("O\"Brien, Jr.")});
  sink->Close();
  sink->Close();

  std::string text = ReadFile(dir / "nested" / "users.csv");
  assert(text ==
         "\"id\",\"name\"\r\n"
         "\"1\",\\N\r\n"
         "\"2\",\"\"\r\n"
         "\"3\",\"O\"\"Brien, Jr.\"\r\n");
}

static void test_csv_sink_minimal_quoting() {
  fs::path dir = ScratchDir("minimal");
  CsvOptions opts;
  opts.out_dir = dir.string();
  opts.quote_all = false;
  CsvSinkFactory factory(opts);

  auto sink = factory.Open("shop/orders");
  sink->WriteHeader(UsersSchema());
  sink->WriteRow(Row{std::string("1"), std::nullopt});
  sink->WriteRow(Row{std::string("2"), std::string("a,b")});
  sink->Close();

  std::string text = ReadFile(dir / "shop_orders.csv");
  assert(text == "id,name\r\n1,\r\n2,\"a,b\"\r\n");
}

static void test_csv_null_text_validation() {
  assert(NullTextIsSafe("", ','));
  assert(NullTextIsSafe("\\N", ','));
  assert(NullTextIsSafe("NULL", ','));
  assert(!NullTextIsSafe("a,b", ','));
  assert(!NullTextIsSafe("\"x\"", ','));
  assert(!NullTextIsSafe("x\ny", ','));
  assert(!NullTextIsSafe("x\r", ','));
  assert(NullTextIsSafe("a,b", '\t'));
  assert(!NullTextIsSafe("a\tb", '\t'));

  CsvOptions opts;
  opts.out_dir = ScratchDir("null_text").string();
  opts.null_text = "a,b";
  bool threw = false;
  try {
    CsvSinkFactory factory(opts);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  opts.null_text = "\\N";
  opts.quote_all = false;
  CsvSinkFactory factory(opts);
  auto sink = factory.Open("users");
  sink->WriteHeader(UsersSchema());
  sink->WriteRow(Row{std::string("1"), std::nullopt});
  sink->Close();
  assert(ReadFile(fs::path(opts.out_dir) / "users.csv") == "id,name\r\n1,\\N\r\n");
}

static void test_csv_factory_reports_unwritable_dir() {
  fs::path dir = ScratchDir("blocked");
  {
    std::ofstream blocker(dir / "file");
    blocker << "x";
  }
  CsvOptions opts;
  opts.out_dir = (dir / "file" / "sub").string();
  CsvSinkFactory factory(opts);

  bool threw = false;
  try {
    auto sink = factory.Open("users");
  } catch (const DumpError& e) {
    threw = true;
    assert(e.kind() == ErrorKind::sink_write_failure);
  }
  assert(threw);
}

static void test_jsonl_sink() {
  fs::path dir = ScratchDir("jsonl");
  JsonlSinkFactory factory(dir.string());

  auto sink = factory.Open("users");
  sink->WriteHeader(UsersSchema());
  sink->WriteRow(Row{std::string("1"), std::string("Ada")});
  sink->WriteRow(Row{std::string("2"), std::nullopt});
  sink->Close();

  std::ifstream in(dir / "users.jsonl");
  std::vector<nlohmann::json> lines;
  std::string line;
  while (std::getline(in, line)) {
    lines.push_back(nlohmann::json::parse(line));
  }
  assert(lines.size() == 2);
  assert(lines[0]["id"] == "1");
  assert(lines[0]["name"] == "Ada");
  assert(lines[1]["name"].is_null());
  assert(ReadFile(dir / "users.jsonl").rfind("{\"id\":\"1\",\"name\":\"Ada\"}\n", 0) == 0);
}

static void test_memory_catalog() {
  MemoryCatalog catalog;
  {
    auto sink = catalog.Open("t");
    sink->WriteHeader(TableSchema{"t", {"a"}});
    sink->WriteRow(Row{std::string("1")});
    sink->WriteRow(Row{std::nullopt});
    sink->Close();
  }
  const TableData* t = catalog.Find("t");
  assert(t && t->columns.size() == 1 && t->rows.size() == 2);
  assert(!t->rows[1][0]);

  // Reopening the same table starts it over.
  auto again = catalog.Open("t");
  again->WriteHeader(TableSchema{"t", {"a", "b"}});
  assert(catalog.Find("t")->rows.empty());
  assert(catalog.Find("t")->columns.size() == 2);
  assert(!catalog.Find("missing"));

  TableMap taken = catalog.Take();
  assert(taken.size() == 1);
  assert(catalog.tables().empty());
}

int main() {
  test_escape_csv_field();
  test_file_stems();
  test_csv_sink_quote_all();
  test_csv_sink_minimal_quoting();
  test_csv_null_text_validation();
  test_csv_factory_reports_unwritable_dir();
  test_jsonl_sink();
  test_memory_catalog();
  return 0;
}
