#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "dumpflux/table_sink.hpp"

namespace dumpflux {

struct TableData {
  std::vector<std::string> columns;
  std::vector<Row> rows;
};

using TableMap = std::map<std::string, TableData>;

// Collects every table in memory and hands the table -> rows mapping back to
// the caller. Intended for dumps that fit in memory and for tests.
class MemoryCatalog final : public SinkFactory {
 public:
  [[nodiscard]] std::unique_ptr<TableSink> Open(const std::string& table) override;

  [[nodiscard]] const TableMap& tables() const { return tables_; }
  [[nodiscard]] const TableData* Find(const std::string& table) const;
  TableMap Take();

 private:
  TableMap tables_;
};

}  // namespace dumpflux
