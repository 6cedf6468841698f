#include "dumpflux/jsonl_sink.hpp"

#include <filesystem>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>

#include "dumpflux/errors.hpp"

namespace dumpflux {

JsonlFileSink::JsonlFileSink(std::string path) : path_(std::move(path)) {
  out_.open(path_, std::ios::binary | std::ios::trunc);
  if (!out_) {
    throw DumpError(ErrorKind::sink_write_failure, "failed to create jsonl file: " + path_);
  }
}

void JsonlFileSink::WriteHeader(const TableSchema& schema) { columns_ = schema.columns; }

void JsonlFileSink::WriteRow(const Row& row) {
  nlohmann::ordered_json j = nlohmann::ordered_json::object();
  for (std::size_t i = 0; i < row.size() && i < columns_.size(); ++i) {
    if (row[i]) {
      j[columns_[i]] = *row[i];
    } else {
      j[columns_[i]] = nullptr;
    }
  }
  // Field bytes are copied verbatim and may not be valid UTF-8.
  out_ << j.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace) << '\n';
  if (!out_) {
    throw DumpError(ErrorKind::sink_write_failure, "failed to write jsonl file: " + path_);
  }
}

void JsonlFileSink::Close() {
  if (!out_.is_open()) {
    return;
  }
  out_.flush();
  bool ok = static_cast<bool>(out_);
  out_.close();
  if (!ok || out_.fail()) {
    throw DumpError(ErrorKind::sink_write_failure, "failed to flush jsonl file: " + path_);
  }
}

std::unique_ptr<TableSink> JsonlSinkFactory::Open(const std::string& table) {
  std::error_code ec;
  std::filesystem::create_directories(out_dir_, ec);
  if (ec) {
    throw DumpError(ErrorKind::sink_write_failure, "failed to create output dir: " + out_dir_);
  }
  auto path = std::filesystem::path(out_dir_) / (FileStemForTable(table) + ".jsonl");
  return std::make_unique<JsonlFileSink>(path.string());
}

}  // namespace dumpflux
