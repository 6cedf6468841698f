#include <cassert>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <lzma.h>
#include <zlib.h>

#include "dumpflux/dump_reader.hpp"
#include "dumpflux/extractor.hpp"
#include "dumpflux/memory_sink.hpp"

using namespace dumpflux;
namespace fs = std::filesystem;

static const char* kDump =
    "CREATE TABLE `t` (\r\n"
    "  `a` int,\r\n"
    "  `b` varchar(8)\r\n"
    ");\r\n"
    "INSERT INTO `t` VALUES (1,'x'),(2,NULL);\r\n"
    "INSERT INTO `t` VALUES (3,'no newline');";

static fs::path ScratchDir() {
  fs::path dir = fs::temp_directory_path() / "dumpflux_reader";
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

static void WriteGz(const fs::path& path, const std::string& data) {
  gzFile f = gzopen(path.string().c_str(), "wb");
  assert(f);
  int written = gzwrite(f, data.data(), static_cast<unsigned>(data.size()));
  assert(written == static_cast<int>(data.size()));
  assert(gzclose(f) == Z_OK);
}

static void WriteXz(const fs::path& path, const std::string& data) {
  std::vector<std::uint8_t> out(lzma_stream_buffer_bound(data.size()));
  std::size_t out_pos = 0;
  lzma_ret ret = lzma_easy_buffer_encode(6, LZMA_CHECK_CRC64, nullptr,
                                         reinterpret_cast<const std::uint8_t*>(data.data()), data.size(),
                                         out.data(), &out_pos, out.size());
  assert(ret == LZMA_OK);
  std::ofstream f(path, std::ios::binary);
  f.write(reinterpret_cast<const char*>(out.data()), static_cast<std::streamsize>(out_pos));
  assert(f.good());
}

static std::vector<std::string> Collect(const std::string& path, bool& ok) {
  std::vector<std::string> lines;
  std::string err;
  ok = ForEachDumpLine(path, [&](std::string_view line) {
    lines.emplace_back(line);
    return true;
  }, err);
  return lines;
}

static void CheckLines(const std::vector<std::string>& lines) {
  assert(lines.size() == 6);
  assert(lines[0] == "CREATE TABLE `t` (");
  assert(lines[4] == "INSERT INTO `t` VALUES (1,'x'),(2,NULL);");
  assert(lines[5] == "INSERT INTO `t` VALUES (3,'no newline');");
}

static void test_detect_format() {
  assert(DetectDumpFormat("dump.sql") == DumpFormat::text);
  assert(DetectDumpFormat("dump.sql.gz") == DumpFormat::gzip);
  assert(DetectDumpFormat("DUMP.SQL.GZ") == DumpFormat::gzip);
  assert(DetectDumpFormat("dump.sql.xz") == DumpFormat::xz);
  assert(DetectDumpFormat("xz_dump.sql") == DumpFormat::text);
}

static void test_text_stream() {
  std::istringstream in(kDump);
  std::vector<std::string> lines;
  assert(ReadTextLines(in, [&](std::string_view line) {
    lines.emplace_back(line);
    return true;
  }));
  CheckLines(lines);
}

static void test_compressed_files() {
  fs::path dir = ScratchDir();
  fs::path plain = dir / "dump.sql";
  {
    std::ofstream f(plain, std::ios::binary);
    f << kDump;
  }
  fs::path gz = dir / "dump.sql.gz";
  WriteGz(gz, kDump);
  fs::path xz = dir / "dump.sql.xz";
  WriteXz(xz, kDump);

  for (const fs::path& path : {plain, gz, xz}) {
    bool ok = false;
    auto lines = Collect(path.string(), ok);
    assert(ok);
    CheckLines(lines);
  }

  MemoryCatalog catalog;
  ExtractionSummary summary;
  std::string err;
  assert(ExtractFile(xz.string(), catalog, {}, summary, err));
  assert(summary.TotalRows() == 3);
  assert(!catalog.Find("t")->rows[1][1]);
  assert(*catalog.Find("t")->rows[2][1] == "no newline");
}

static void test_callback_stops_reading() {
  fs::path dir = ScratchDir();
  fs::path gz = dir / "stop.sql.gz";
  WriteGz(gz, kDump);
  fs::path xz = dir / "stop.sql.xz";
  WriteXz(xz, kDump);

  for (const fs::path& path : {gz, xz}) {
    int seen = 0;
    std::string err;
    bool ok = ForEachDumpLine(path.string(), [&](std::string_view) { return ++seen < 2; }, err);
    assert(ok);
    assert(seen == 2);
  }
}

static void test_unreadable_input() {
  fs::path dir = ScratchDir();
  bool ok = true;
  auto lines = Collect((dir / "missing.sql").string(), ok);
  assert(!ok);
  assert(lines.empty());

  fs::path bad = dir / "bad.sql.xz";
  {
    std::ofstream f(bad, std::ios::binary);
    f << "definitely not xz data";
  }
  std::string err;
  assert(!ForEachDumpLine(bad.string(), [](std::string_view) { return true; }, err));
  assert(err.find("xz") != std::string::npos);

  MemoryCatalog catalog;
  ExtractionSummary summary;
  err.clear();
  assert(!ExtractFile((dir / "missing.sql.gz").string(), catalog, {}, summary, err));
  assert(summary.input_error);
  assert(!err.empty());
}

static void test_embedded_nul_bytes() {
  fs::path dir = ScratchDir();
  const std::string data("a\0b\nc\n", 6);
  WriteGz(dir / "nul.sql.gz", data);
  WriteXz(dir / "nul.sql.xz", data);

  for (const char* name : {"nul.sql.gz", "nul.sql.xz"}) {
    bool ok = false;
    auto lines = Collect((dir / name).string(), ok);
    assert(ok);
    assert(lines.size() == 2);
    assert(lines[0].size() == 3);
    assert(lines[0][1] == '\0');
    assert(lines[0][2] == 'b');
    assert(lines[1] == "c");
  }
}

int main() {
  test_detect_format();
  test_text_stream();
  test_compressed_files();
  test_callback_stops_reading();
  test_unreadable_input();
  test_embedded_nul_bytes();
  return 0;
}
