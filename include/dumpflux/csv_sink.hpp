#pragma once

#include <fstream>
#include <memory>
#include <string>
#include <utility>

#include "dumpflux/table_sink.hpp"

namespace dumpflux {

struct CsvOptions {
  std::string out_dir = "sql_raw";
  // Written verbatim, unquoted, for NULL values.
  std::string null_text;
  bool quote_all = true;
  char delimiter = ',';
};

class CsvFileSink final : public TableSink {
 public:
  CsvFileSink(std::string path, CsvOptions options);
  ~CsvFileSink() override;

  void WriteHeader(const TableSchema& schema) override;
  void WriteRow(const Row& row) override;
  void Close() override;

  [[nodiscard]] const std::string& path() const { return path_; }

 private:
  void WriteField(const std::string& text);
  void EndRecord();

  std::string path_;
  CsvOptions options_;
  std::ofstream out_;
};

// Writes <out_dir>/<table>.csv for every table.
class CsvSinkFactory final : public SinkFactory {
 public:
  // Throws std::invalid_argument if `null_text` would break the record layout.
  explicit CsvSinkFactory(CsvOptions options = {});

  [[nodiscard]] std::unique_ptr<TableSink> Open(const std::string& table) override;

 private:
  CsvOptions options_;
};

// False if `null_text` holds the delimiter, a quote or a line break. NULL is
// written unquoted, so such text would be read back as a different record.
bool NullTextIsSafe(const std::string& null_text, char delimiter);

// Renders one CSV field, quoting when `quote_all` is set or the text needs it.
std::string EscapeCsvField(const std::string& text, char delimiter, bool quote_all);

}  // namespace dumpflux
