#pragma once

#include <memory>
#include <string>

#include "dumpflux/types.hpp"

namespace dumpflux {

// Destination for one table's output: the header once, then rows of the
// header's width. Write failures are reported by throwing
// DumpError(ErrorKind::sink_write_failure).
class TableSink {
 public:
  virtual ~TableSink() = default;

  virtual void WriteHeader(const TableSchema& schema) = 0;
  virtual void WriteRow(const Row& row) = 0;
  // Flushes and releases the destination. Safe to call more than once.
  virtual void Close() = 0;
};

class SinkFactory {
 public:
  virtual ~SinkFactory() = default;

  // Creates, or truncates, the destination for `table`.
  [[nodiscard]] virtual std::unique_ptr<TableSink> Open(const std::string& table) = 0;
};

// Maps a table name onto a safe file stem.
std::string FileStemForTable(const std::string& table);

}  // namespace dumpflux
