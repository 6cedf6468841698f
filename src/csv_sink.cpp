#include "dumpflux/csv_sink.hpp"

#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "dumpflux/errors.hpp"

namespace dumpflux {

std::string EscapeCsvField(const std::string& text, char delimiter, bool quote_all) {
  bool needs_quotes = quote_all || text.find_first_of(std::string{delimiter, '"', '\r', '\n'}) != std::string::npos;
  if (!needs_quotes) {
    return text;
  }
  std::string out;
  out.reserve(text.size() + 2);
  out.push_back('"');
  for (char c : text) {
    if (c == '"') {
      out.push_back('"');
    }
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

bool NullTextIsSafe(const std::string& null_text, char delimiter) {
  return null_text.find_first_of(std::string{delimiter, '"', '\r', '\n'}) == std::string::npos;
}

CsvFileSink::CsvFileSink(std::string path, CsvOptions options)
    : path_(std::move(path)), options_(std::move(options)) {
  out_.open(path_, std::ios::binary | std::ios::trunc);
  if (!out_) {
    throw DumpError(ErrorKind::sink_write_failure, "failed to create csv file: " + path_);
  }
}

CsvFileSink::~CsvFileSink() {
  if (out_.is_open()) {
    out_.close();
  }
}

void CsvFileSink::WriteHeader(const TableSchema& schema) {
  for (std::size_t i = 0; i < schema.columns.size(); ++i) {
    if (i > 0) {
      out_.put(options_.delimiter);
    }
    WriteField(schema.columns[i]);
  }
  EndRecord();
}

void CsvFileSink::WriteRow(const Row& row) {
  for (std::size_t i = 0; i < row.size(); ++i) {
    if (i > 0) {
      out_.put(options_.delimiter);
    }
    if (row[i]) {
      WriteField(*row[i]);
    } else {
      out_ << options_.null_text;
    }
  }
  EndRecord();
}

void CsvFileSink::Close() {
  if (!out_.is_open()) {
    return;
  }
  out_.flush();
  bool ok = static_cast<bool>(out_);
  out_.close();
  if (!ok || out_.fail()) {
    throw DumpError(ErrorKind::sink_write_failure, "failed to flush csv file: " + path_);
  }
}

void CsvFileSink::WriteField(const std::string& text) {
  out_ << EscapeCsvField(text, options_.delimiter, options_.quote_all);
}

void CsvFileSink::EndRecord() {
  out_ << "\r\n";
  if (!out_) {
    throw DumpError(ErrorKind::sink_write_failure, "failed to write csv file: " + path_);
  }
}

CsvSinkFactory::CsvSinkFactory(CsvOptions options) : options_(std::move(options)) {
  if (!NullTextIsSafe(options_.null_text, options_.delimiter)) {
    throw std::invalid_argument("csv null text must not contain the delimiter, a quote or a line break");
  }
}

std::unique_ptr<TableSink> CsvSinkFactory::Open(const std::string& table) {
  std::error_code ec;
  std::filesystem::create_directories(options_.out_dir, ec);
  if (ec) {
    throw DumpError(ErrorKind::sink_write_failure, "failed to create output dir: " + options_.out_dir);
  }
  auto path = std::filesystem::path(options_.out_dir) / (FileStemForTable(table) + ".csv");
  return std::make_unique<CsvFileSink>(path.string(), options_);
}

}  // namespace dumpflux
