#pragma once

#include <fstream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "dumpflux/table_sink.hpp"

namespace dumpflux {

// One JSON object per row keyed by column name; NULL becomes JSON null.
class JsonlFileSink final : public TableSink {
 public:
  explicit JsonlFileSink(std::string path);

  void WriteHeader(const TableSchema& schema) override;
  void WriteRow(const Row& row) override;
  void Close() override;

 private:
  std::string path_;
  std::vector<std::string> columns_;
  std::ofstream out_;
};

class JsonlSinkFactory final : public SinkFactory {
 public:
  explicit JsonlSinkFactory(std::string out_dir) : out_dir_(std::move(out_dir)) {}

  [[nodiscard]] std::unique_ptr<TableSink> Open(const std::string& table) override;

 private:
  std::string out_dir_;
};

}  // namespace dumpflux
