#include "dumpflux/report.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace dumpflux {

namespace {
constexpr ErrorKind kAllKinds[] = {
    ErrorKind::malformed_literal,  ErrorKind::arity_mismatch,     ErrorKind::insert_before_schema,
    ErrorKind::sink_write_failure, ErrorKind::interleaved_insert, ErrorKind::duplicate_column,
};

const char* TableStatus(const TableReport& t) {
  if (t.filtered) {
    return "filtered";
  }
  if (!t.complete) {
    return "incomplete";
  }
  return "ok";
}
}  // namespace

nlohmann::json SummaryToJson(const ExtractionSummary& summary) {
  nlohmann::json j;
  j["lines_read"] = summary.lines_read;
  j["bytes_read"] = summary.bytes_read;
  j["cancelled"] = summary.cancelled;
  j["input_error"] = summary.input_error;
  j["total_rows"] = summary.TotalRows();

  nlohmann::json tables = nlohmann::json::array();
  for (const auto& t : summary.tables) {
    nlohmann::json jt = {
        {"name", t.name},
        {"columns", t.columns},
        {"rows", t.rows_emitted},
        {"rows_skipped", t.rows_skipped},
        {"insert_statements", t.insert_statements},
        {"status", TableStatus(t)},
    };
    if (!t.error.empty()) {
      jt["error"] = t.error;
    }
    tables.push_back(std::move(jt));
  }
  j["tables"] = std::move(tables);

  nlohmann::json warnings = nlohmann::json::object();
  for (ErrorKind kind : kAllKinds) {
    warnings[ErrorKindName(kind)] = summary.WarningCount(kind);
  }
  j["warnings"] = std::move(warnings);

  nlohmann::json incidents = nlohmann::json::array();
  for (const auto& inc : summary.incidents) {
    incidents.push_back({
        {"kind", ErrorKindName(inc.kind)},
        {"table", inc.table},
        {"line", inc.line},
        {"message", inc.message},
    });
  }
  j["incidents"] = std::move(incidents);
  j["incidents_dropped"] = summary.incidents_dropped;
  return j;
}

void WriteSummaryJson(const ExtractionSummary& summary, const std::string& path) {
  std::ofstream out(path);
  if (!out) {
    throw std::runtime_error("failed to create summary json: " + path);
  }
  out << SummaryToJson(summary).dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
  if (!out) {
    throw std::runtime_error("failed to write summary json: " + path);
  }
}

std::string FormatSummary(const ExtractionSummary& summary) {
  std::ostringstream oss;
  for (const auto& t : summary.tables) {
    oss << "  " << std::left << std::setw(35) << t.name << " -> " << std::right << std::setw(9) << t.rows_emitted
        << " rows x " << std::setw(3) << t.columns.size() << " cols";
    if (t.rows_skipped > 0) {
      oss << " (" << t.rows_skipped << " skipped)";
    }
    if (t.filtered) {
      oss << " [filtered]";
    } else if (!t.complete) {
      oss << " [incomplete: " << t.error << "]";
    }
    oss << "\n";
  }
  oss << "tables " << summary.tables.size() << " rows " << summary.TotalRows() << " lines " << summary.lines_read
      << "\n";
  bool any = false;
  for (ErrorKind kind : kAllKinds) {
    std::uint64_t n = summary.WarningCount(kind);
    if (n == 0) {
      continue;
    }
    oss << (any ? ", " : "warnings: ") << ErrorKindName(kind) << "=" << n;
    any = true;
  }
  if (any) {
    oss << "\n";
  }
  if (summary.cancelled) {
    oss << "extraction was cancelled before the end of the dump\n";
  }
  return oss.str();
}

}  // namespace dumpflux
