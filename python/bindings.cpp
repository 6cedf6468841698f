#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <stdexcept>
#include <utility>

#include "dumpflux/csv_sink.hpp"
#include "dumpflux/extractor.hpp"
#include "dumpflux/jsonl_sink.hpp"
#include "dumpflux/memory_sink.hpp"
#include "dumpflux/report.hpp"
#include "dumpflux/value_tokenizer.hpp"

namespace py = pybind11;
using namespace dumpflux;

namespace {

ExtractOptions MakeOptions(const std::vector<std::string>& tables, std::size_t max_incidents) {
  ExtractOptions opts;
  opts.tables = tables;
  opts.max_incidents = max_incidents;
  return opts;
}

ExtractionSummary RunExtraction(const std::string& path, SinkFactory& sinks, ExtractOptions opts) {
  ExtractionSummary summary;
  std::string err;
  if (!ExtractFile(path, sinks, std::move(opts), summary, err)) {
    throw std::runtime_error(err);
  }
  return summary;
}

}  // namespace

PYBIND11_MODULE(pydumpflux, m) {
  py::register_exception<DumpError>(m, "DumpError");

  py::enum_<ErrorKind>(m, "ErrorKind")
      .value("malformed_literal", ErrorKind::malformed_literal)
      .value("arity_mismatch", ErrorKind::arity_mismatch)
      .value("insert_before_schema", ErrorKind::insert_before_schema)
      .value("sink_write_failure", ErrorKind::sink_write_failure)
      .value("interleaved_insert", ErrorKind::interleaved_insert)
      .value("duplicate_column", ErrorKind::duplicate_column);

  py::class_<Incident>(m, "Incident")
      .def_readonly("kind", &Incident::kind)
      .def_readonly("table", &Incident::table)
      .def_readonly("line", &Incident::line)
      .def_readonly("message", &Incident::message);

  py::class_<TableReport>(m, "TableReport")
      .def_readonly("name", &TableReport::name)
      .def_readonly("columns", &TableReport::columns)
      .def_readonly("rows_emitted", &TableReport::rows_emitted)
      .def_readonly("rows_skipped", &TableReport::rows_skipped)
      .def_readonly("insert_statements", &TableReport::insert_statements)
      .def_readonly("complete", &TableReport::complete)
      .def_readonly("filtered", &TableReport::filtered)
      .def_readonly("error", &TableReport::error);

  py::class_<ExtractionSummary>(m, "ExtractionSummary")
      .def_readonly("tables", &ExtractionSummary::tables)
      .def_readonly("incidents", &ExtractionSummary::incidents)
      .def_readonly("incidents_dropped", &ExtractionSummary::incidents_dropped)
      .def_readonly("lines_read", &ExtractionSummary::lines_read)
      .def_readonly("bytes_read", &ExtractionSummary::bytes_read)
      .def_readonly("cancelled", &ExtractionSummary::cancelled)
      .def("warning_count", &ExtractionSummary::WarningCount)
      .def("total_rows", &ExtractionSummary::TotalRows)
      .def("all_complete", &ExtractionSummary::AllComplete)
      .def("to_json", [](const ExtractionSummary& s) { return SummaryToJson(s).dump(2); })
      .def("__str__", &FormatSummary);

  m.def(
      "parse_value",
      [](const std::string& text, std::size_t pos) {
        ValueToken token = ParseValue(text, pos);
        return py::make_tuple(token.value, token.end);
      },
      py::arg("text"), py::arg("pos") = 0);

  m.def(
      "read_tables",
      [](const std::string& path, const std::vector<std::string>& tables) {
        MemoryCatalog catalog;
        RunExtraction(path, catalog, MakeOptions(tables, 1000));
        py::dict out;
        for (auto& [name, data] : catalog.Take()) {
          py::dict entry;
          entry["columns"] = data.columns;
          entry["rows"] = data.rows;
          out[py::str(name)] = entry;
        }
        return out;
      },
      py::arg("path"), py::arg("tables") = std::vector<std::string>{});

  m.def(
      "extract_dump",
      [](const std::string& path, const std::string& out_dir, const std::string& format,
         const std::string& null_text, bool quote_all, const std::vector<std::string>& tables,
         std::size_t max_incidents) {
        ExtractOptions opts = MakeOptions(tables, max_incidents);
        if (format == "jsonl") {
          JsonlSinkFactory sinks(out_dir);
          return RunExtraction(path, sinks, std::move(opts));
        }
        if (format != "csv") {
          throw std::invalid_argument("format must be 'csv' or 'jsonl'");
        }
        CsvOptions copts;
        copts.out_dir = out_dir;
        copts.null_text = null_text;
        copts.quote_all = quote_all;
        CsvSinkFactory sinks(copts);
        return RunExtraction(path, sinks, std::move(opts));
      },
      py::arg("path"), py::arg("out_dir") = "sql_raw", py::arg("format") = "csv", py::arg("null_text") = "",
      py::arg("quote_all") = true, py::arg("tables") = std::vector<std::string>{},
      py::arg("max_incidents") = 1000);
}
