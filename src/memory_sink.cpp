#include "dumpflux/memory_sink.hpp"

#include <utility>

namespace dumpflux {

namespace {
class MemorySink final : public TableSink {
 public:
  explicit MemorySink(TableData& data) : data_(data) {}

  void WriteHeader(const TableSchema& schema) override { data_.columns = schema.columns; }
  void WriteRow(const Row& row) override { data_.rows.push_back(row); }
  void Close() override {}

 private:
  TableData& data_;
};
}  // namespace

std::unique_ptr<TableSink> MemoryCatalog::Open(const std::string& table) {
  TableData& data = tables_[table];
  data = TableData{};
  return std::make_unique<MemorySink>(data);
}

const TableData* MemoryCatalog::Find(const std::string& table) const {
  auto it = tables_.find(table);
  return it == tables_.end() ? nullptr : &it->second;
}

TableMap MemoryCatalog::Take() {
  TableMap out = std::move(tables_);
  tables_.clear();
  return out;
}

}  // namespace dumpflux
