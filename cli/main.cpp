#include "dumpflux/config.hpp"
#include "dumpflux/csv_sink.hpp"
#include "dumpflux/extractor.hpp"
#include "dumpflux/jsonl_sink.hpp"
#include "dumpflux/report.hpp"

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>

using namespace dumpflux;

namespace {

std::atomic<bool> g_stop{false};

void on_signal(int) {
    g_stop.store(true);
}

std::unique_ptr<SinkFactory> make_sinks(const Config& cfg) {
    if (cfg.format == OutputFormat::jsonl) {
        return std::make_unique<JsonlSinkFactory>(cfg.out_dir);
    }
    CsvOptions copts;
    copts.out_dir = cfg.out_dir;
    copts.null_text = cfg.null_text;
    copts.quote_all = cfg.quote_all;
    return std::make_unique<CsvSinkFactory>(copts);
}

} // namespace

int main(int argc, char** argv) {
    std::ios::sync_with_stdio(false);

    Config cfg;
    if (!load_config(argc, argv, cfg)) {
        print_usage();
        return 1;
    }
    if (cfg.show_help) {
        print_usage();
        return 0;
    }
    if (cfg.dump_path.empty()) {
        std::cerr << "No dump given: pass a path, --input, or set DUMP_PATH in " << cfg.env_path << "\n";
        return 1;
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    std::cerr << "[dumpflux] reading " << cfg.dump_path << "\n"
              << "[dumpflux] writing " << output_format_name(cfg.format) << " to " << cfg.out_dir << "\n";

    ExtractOptions opts;
    opts.tables = cfg.tables;
    opts.max_incidents = cfg.max_incidents;
    opts.progress_interval_ms = cfg.progress_interval_ms;
    opts.stop = &g_stop;
    if (cfg.verbose) {
        opts.on_incident = [](const Incident& inc) {
            std::cerr << "[warn] line " << inc.line << " " << ErrorKindName(inc.kind);
            if (!inc.table.empty()) {
                std::cerr << " `" << inc.table << "`";
            }
            std::cerr << ": " << inc.message << "\n";
        };
    }

    auto sinks = make_sinks(cfg);
    ExtractionSummary summary;
    std::string err;
    bool ok = ExtractFile(cfg.dump_path, *sinks, opts, summary, err);

    std::cerr << FormatSummary(summary);
    if (!cfg.summary_json.empty()) {
        try {
            WriteSummaryJson(summary, cfg.summary_json);
            std::cerr << "[dumpflux] summary written to " << cfg.summary_json << "\n";
        } catch (const std::exception& e) {
            std::cerr << "[dumpflux] " << e.what() << "\n";
            return 1;
        }
    }

    if (!ok) {
        std::cerr << "[dumpflux] " << err << "\n";
        return 1;
    }
    return summary.AllComplete() ? 0 : 2;
}
