#include "dumpflux/extractor.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

#include "dumpflux/dump_reader.hpp"
#include "dumpflux/tuple_reader.hpp"

namespace dumpflux {

std::uint64_t ExtractionSummary::TotalRows() const {
  std::uint64_t total = 0;
  for (const auto& t : tables) {
    total += t.rows_emitted;
  }
  return total;
}

const TableReport* ExtractionSummary::FindTable(std::string_view name) const {
  // Later declarations of the same name win, matching the truncated output.
  for (auto it = tables.rbegin(); it != tables.rend(); ++it) {
    if (it->name == name) {
      return &*it;
    }
  }
  return nullptr;
}

bool ExtractionSummary::AllComplete() const {
  for (const auto& t : tables) {
    if (!t.complete) {
      return false;
    }
  }
  return true;
}

DumpExtractor::DumpExtractor(SinkFactory& sinks, ExtractOptions options)
    : sinks_(sinks),
      options_(std::move(options)),
      selected_(options_.tables.begin(), options_.tables.end()),
      progress_("extract", options_.progress_interval_ms, std::cerr) {}

bool DumpExtractor::FeedLine(std::string_view line) {
  if (finished_) {
    throw std::logic_error("DumpExtractor::FeedLine called after Finish");
  }
  if (stopped_) {
    return false;
  }
  if (options_.stop && options_.stop->load(std::memory_order_relaxed)) {
    Cancel();
    return false;
  }

  ++summary_.lines_read;
  summary_.bytes_read += line.size() + 1;

  std::string table;
  InsertStatement insert;
  if (ParseCreateTableHeader(line, table)) {
    CloseStatement();
    BeginTable(std::move(table));
    bool closed = false;
    for (std::string_view def : SplitInlineDefinitions(line, closed)) {
      tracker_.Consume(def);
    }
    if (closed || IsDefinitionTerminator(line)) {
      FinalizeSchema();
    }
  } else if (ParseInsertStatement(line, insert)) {
    CloseStatement();
    HandleInsert(insert);
  } else if (statement_open_) {
    ContinueInsert(line);
  } else if (state_ == State::in_schema && tracker_.Consume(line)) {
    FinalizeSchema();
  }

  progress_.Add(1, line.size() + 1);
  return true;
}

ExtractionSummary DumpExtractor::Finish() {
  if (finished_) {
    throw std::logic_error("DumpExtractor::Finish called twice");
  }
  CloseStatement();
  if (state_ == State::in_schema) {
    FinalizeSchema();
  }
  CloseSink();
  finished_ = true;
  progress_.Finish();
  return summary_;
}

void DumpExtractor::BeginTable(std::string name) {
  if (state_ == State::in_schema) {
    FinalizeSchema();
  }
  CloseSink();
  schema_.reset();

  TableReport report;
  report.name = name;
  report.filtered = !Selected(name);
  summary_.tables.push_back(std::move(report));
  progress_.SetTables(summary_.tables.size());

  tracker_.Begin(std::move(name));
  state_ = State::in_schema;
}

void DumpExtractor::FinalizeSchema() {
  tracker_.Close();
  for (const auto& column : tracker_.duplicates()) {
    Report(ErrorKind::duplicate_column, tracker_.schema().name, "column `" + column + "` declared more than once");
  }
  schema_ = tracker_.TakeSchema();
  current().columns = schema_->columns;
  state_ = State::ready;
}

void DumpExtractor::HandleInsert(const InsertStatement& stmt) {
  statement_open_ = !stmt.terminated;
  statement_writes_ = false;
  if (state_ == State::no_table) {
    Report(ErrorKind::insert_before_schema, stmt.table,
           "INSERT INTO `" + stmt.table + "` before any CREATE TABLE; statement skipped");
    return;
  }
  if (state_ == State::in_schema) {
    FinalizeSchema();
  }

  TableReport& table = current();
  if (stmt.table != schema_->name) {
    Report(ErrorKind::interleaved_insert, schema_->name,
           "INSERT INTO `" + stmt.table + "` while `" + schema_->name + "` is active; rows attributed to `" +
               schema_->name + "`");
  }
  if (table.filtered || !table.complete) {
    return;
  }
  ++table.insert_statements;
  statement_writes_ = true;
  WriteValues(stmt.values, stmt.terminated);
}

void DumpExtractor::ContinueInsert(std::string_view line) {
  std::string_view trimmed = TrimSql(line);
  if (pending_values_.empty() && !trimmed.empty() && trimmed.front() != '(' && trimmed.front() != ',') {
    // Not tuple text: the INSERT simply lacked its ';'.
    statement_open_ = false;
    return;
  }
  bool terminated = !trimmed.empty() && trimmed.back() == ';';
  if (statement_writes_ && current().complete) {
    std::string buffer = std::move(pending_values_);
    pending_values_.clear();
    if (!buffer.empty()) {
      // The line break belongs to a literal that spans lines.
      buffer.push_back('\n');
      buffer.append(line);
    } else {
      buffer.assign(trimmed);
    }
    std::string_view values = buffer;
    if (terminated) {
      values = TrimSql(values);
      values.remove_suffix(1);
    }
    WriteValues(values, terminated);
  }
  if (terminated) {
    statement_open_ = false;
    pending_values_.clear();
  }
}

// Ends an INSERT that never saw its ';'; a tuple left open is reported.
void DumpExtractor::CloseStatement() {
  if (!statement_open_) {
    return;
  }
  statement_open_ = false;
  std::string rest = std::move(pending_values_);
  pending_values_.clear();
  if (statement_writes_ && current().complete && !rest.empty()) {
    WriteValues(rest, true);
  }
}

void DumpExtractor::WriteValues(std::string_view values, bool final) {
  TableReport& table = current();
  try {
    if (!sink_) {
      sink_ = sinks_.Open(schema_->name);
      table.sink_opened = true;
      sink_->WriteHeader(*schema_);
    }
    WriteTuples(table, values, final);
  } catch (const DumpError& e) {
    FailTable(e.what());
  }
}

void DumpExtractor::WriteTuples(TableReport& table, std::string_view values, bool final) {
  const std::size_t arity = schema_->Arity();
  TupleReader reader(values);
  TupleResult tuple;
  while (reader.Next(tuple)) {
    if (tuple.malformed && tuple.truncated && !final) {
      pending_values_.assign(values.substr(tuple.offset));
      return;
    }
    if (tuple.malformed) {
      ++table.rows_skipped;
      Report(ErrorKind::malformed_literal, table.name,
             "tuple at offset " + std::to_string(tuple.offset) + ": " + tuple.error);
      continue;
    }
    if (tuple.fields.size() != arity) {
      ++table.rows_skipped;
      Report(ErrorKind::arity_mismatch, table.name,
             "row has " + std::to_string(tuple.fields.size()) + " fields, expected " + std::to_string(arity));
      continue;
    }
    sink_->WriteRow(tuple.fields);
    ++table.rows_emitted;
    progress_.AddRows(1);
  }
}

void DumpExtractor::FailTable(const std::string& message) {
  TableReport& table = current();
  table.complete = false;
  table.error = message;
  Report(ErrorKind::sink_write_failure, table.name, message);
  // Dropping the sink releases the destination without another write attempt.
  sink_.reset();
}

void DumpExtractor::CloseSink() {
  if (!sink_) {
    return;
  }
  try {
    sink_->Close();
  } catch (const DumpError& e) {
    FailTable(e.what());
  }
  sink_.reset();
}

void DumpExtractor::Cancel() {
  CloseStatement();
  if (state_ == State::in_schema) {
    FinalizeSchema();
  }
  CloseSink();
  summary_.cancelled = true;
  stopped_ = true;
}

void DumpExtractor::Report(ErrorKind kind, const std::string& table, std::string message) {
  ++summary_.warnings[static_cast<std::size_t>(kind)];
  Incident incident{kind, table, summary_.lines_read, std::move(message)};
  if (options_.on_incident) {
    options_.on_incident(incident);
  }
  if (summary_.incidents.size() < options_.max_incidents) {
    summary_.incidents.push_back(std::move(incident));
  } else {
    ++summary_.incidents_dropped;
  }
}

bool DumpExtractor::Selected(const std::string& table) const {
  return selected_.empty() || selected_.count(table) > 0;
}

ExtractionSummary ExtractStream(std::istream& in, SinkFactory& sinks, ExtractOptions options) {
  DumpExtractor extractor(sinks, std::move(options));
  bool ok = ReadTextLines(in, [&](std::string_view line) { return extractor.FeedLine(line); });
  ExtractionSummary summary = extractor.Finish();
  summary.input_error = !ok;
  return summary;
}

bool ExtractFile(const std::string& path, SinkFactory& sinks, ExtractOptions options,
                 ExtractionSummary& summary, std::string& err) {
  DumpExtractor extractor(sinks, std::move(options));
  bool ok = ForEachDumpLine(path, [&](std::string_view line) { return extractor.FeedLine(line); }, err);
  summary = extractor.Finish();
  summary.input_error = !ok;
  return ok;
}

}  // namespace dumpflux
