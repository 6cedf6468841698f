#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "dumpflux/errors.hpp"
#include "dumpflux/progress.hpp"
#include "dumpflux/schema_tracker.hpp"
#include "dumpflux/statement.hpp"
#include "dumpflux/table_sink.hpp"
#include "dumpflux/types.hpp"

namespace dumpflux {

struct Incident {
  ErrorKind kind = ErrorKind::malformed_literal;
  std::string table;
  std::uint64_t line = 0;
  std::string message;
};

struct TableReport {
  std::string name;
  std::vector<std::string> columns;
  std::uint64_t rows_emitted = 0;
  std::uint64_t rows_skipped = 0;
  std::uint64_t insert_statements = 0;
  bool sink_opened = false;
  // Cleared when the table's sink failed and its output stopped early.
  bool complete = true;
  // Set when a table filter excluded this table from output.
  bool filtered = false;
  std::string error;
};

struct ExtractionSummary {
  std::vector<TableReport> tables;
  std::array<std::uint64_t, kErrorKindCount> warnings{};
  // Capped at ExtractOptions::max_incidents; the counts above stay exact.
  std::vector<Incident> incidents;
  std::uint64_t incidents_dropped = 0;
  std::uint64_t lines_read = 0;
  std::uint64_t bytes_read = 0;
  bool cancelled = false;
  // Set when the input stopped because it could not be read further.
  bool input_error = false;

  [[nodiscard]] std::uint64_t WarningCount(ErrorKind kind) const {
    return warnings[static_cast<std::size_t>(kind)];
  }
  [[nodiscard]] std::uint64_t TotalRows() const;
  [[nodiscard]] const TableReport* FindTable(std::string_view name) const;
  [[nodiscard]] bool AllComplete() const;
};

struct ExtractOptions {
  // Tables to write; empty writes every table.
  std::vector<std::string> tables;
  std::size_t max_incidents = 1000;
  // 0 disables progress output.
  std::uint64_t progress_interval_ms = 0;
  // Checked between lines.
  const std::atomic<bool>* stop = nullptr;
  std::function<void(const Incident&)> on_incident;
};

// Single forward pass over a dump, fed one physical line at a time.
class DumpExtractor {
 public:
  enum class State { no_table = 0, in_schema, ready };

  explicit DumpExtractor(SinkFactory& sinks, ExtractOptions options = {});

  DumpExtractor(const DumpExtractor&) = delete;
  DumpExtractor& operator=(const DumpExtractor&) = delete;

  // Returns false once a stop has been requested; further lines are ignored.
  bool FeedLine(std::string_view line);

  // Closes any open sink and returns the run summary. Call exactly once.
  ExtractionSummary Finish();

  [[nodiscard]] State state() const { return state_; }
  [[nodiscard]] const ExtractionSummary& summary() const { return summary_; }

 private:
  void BeginTable(std::string name);
  void FinalizeSchema();
  void HandleInsert(const InsertStatement& stmt);
  void ContinueInsert(std::string_view line);
  void CloseStatement();
  void WriteValues(std::string_view values, bool final);
  void WriteTuples(TableReport& table, std::string_view values, bool final);
  void FailTable(const std::string& message);
  void CloseSink();
  void Cancel();
  void Report(ErrorKind kind, const std::string& table, std::string message);
  [[nodiscard]] bool Selected(const std::string& table) const;
  TableReport& current() { return summary_.tables.back(); }

  SinkFactory& sinks_;
  ExtractOptions options_;
  std::unordered_set<std::string> selected_;
  ProgressTracker progress_;

  State state_ = State::no_table;
  SchemaTracker tracker_;
  std::optional<TableSchema> schema_;
  std::unique_ptr<TableSink> sink_;
  // An INSERT whose terminating ';' has not been seen yet.
  bool statement_open_ = false;
  bool statement_writes_ = false;
  // Unparsed start of a tuple that continues on the next line.
  std::string pending_values_;
  ExtractionSummary summary_;
  bool stopped_ = false;
  bool finished_ = false;
};

ExtractionSummary ExtractStream(std::istream& in, SinkFactory& sinks, ExtractOptions options = {});

// Reads a .sql, .sql.gz or .sql.xz dump ("-" for stdin). Returns false if the
// input could not be read; `summary` still covers everything fed before that.
bool ExtractFile(const std::string& path, SinkFactory& sinks, ExtractOptions options,
                 ExtractionSummary& summary, std::string& err);

}  // namespace dumpflux
