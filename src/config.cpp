#include "dumpflux/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string_view>

#include "dumpflux/csv_sink.hpp"

namespace dumpflux {

namespace {

std::string trim(const std::string& s) {
  std::size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
    ++start;
  }
  std::size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
    --end;
  }
  return s.substr(start, end - start);
}

std::string lower(const std::string& s) {
  std::string v;
  v.reserve(s.size());
  for (char c : s) {
    v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return v;
}

std::vector<std::string> split_csv(const std::string& s) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : s) {
    if (c == ',') {
      out.push_back(trim(cur));
      cur.clear();
    } else {
      cur.push_back(c);
    }
  }
  if (!cur.empty() || !out.empty()) {
    out.push_back(trim(cur));
  }
  out.erase(std::remove_if(out.begin(), out.end(), [](const std::string& v) { return v.empty(); }), out.end());
  return out;
}

bool parse_size_strict(const std::string& s, std::size_t& out) {
  if (s.empty() || !std::all_of(s.begin(), s.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
    return false;
  }
  try {
    unsigned long long v = std::stoull(s);
    if (v > std::numeric_limits<std::size_t>::max()) {
      return false;
    }
    out = static_cast<std::size_t>(v);
    return true;
  } catch (const std::out_of_range&) {
    return false;
  }
}

std::size_t parse_size(const std::string& s, std::size_t def_val) {
  std::size_t v = 0;
  return parse_size_strict(trim(s), v) ? v : def_val;
}

bool parse_bool(const std::string& s, bool def_val) {
  std::string v = lower(trim(s));
  if (v == "1" || v == "true" || v == "yes" || v == "y" || v == "on") {
    return true;
  }
  if (v == "0" || v == "false" || v == "no" || v == "n" || v == "off") {
    return false;
  }
  return def_val;
}

}  // namespace

bool parse_output_format(const std::string& s, OutputFormat& out) {
  std::string v = lower(trim(s));
  if (v == "csv") {
    out = OutputFormat::csv;
    return true;
  }
  if (v == "jsonl" || v == "ndjson") {
    out = OutputFormat::jsonl;
    return true;
  }
  return false;
}

const char* output_format_name(OutputFormat format) {
  return format == OutputFormat::jsonl ? "jsonl" : "csv";
}

std::unordered_map<std::string, std::string> read_env_file(const std::string& path) {
  std::unordered_map<std::string, std::string> env;
  std::ifstream in(path);
  if (!in) {
    return env;
  }
  bool first_line = true;
  std::string line;
  while (std::getline(in, line)) {
    if (first_line) {
      first_line = false;
      if (line.size() >= 3 && static_cast<unsigned char>(line[0]) == 0xEF &&
          static_cast<unsigned char>(line[1]) == 0xBB && static_cast<unsigned char>(line[2]) == 0xBF) {
        line.erase(0, 3);
      }
    }
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    auto trimmed = trim(line);
    if (trimmed.empty() || trimmed[0] == '#') {
      continue;
    }
    auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    std::string key = trim(trimmed.substr(0, eq));
    std::string val = trim(trimmed.substr(eq + 1));
    if (val.size() >= 2 &&
        ((val.front() == '"' && val.back() == '"') || (val.front() == '\'' && val.back() == '\''))) {
      val = val.substr(1, val.size() - 2);
    }
    env[key] = val;
  }
  return env;
}

void apply_env_overrides(Config& cfg, const std::unordered_map<std::string, std::string>& env) {
  auto get = [&](const std::string& key) -> const std::string* {
    auto it = env.find(key);
    if (it == env.end()) {
      return nullptr;
    }
    return &it->second;
  };
  if (auto v = get("DUMP_PATH"))
    cfg.dump_path = *v;
  if (auto v = get("OUTPUT_DIR"))
    cfg.out_dir = *v;
  if (auto v = get("OUTPUT_FORMAT")) {
    OutputFormat format = cfg.format;
    if (parse_output_format(*v, format)) {
      cfg.format = format;
    } else {
      std::cerr << "[config] ignoring unknown OUTPUT_FORMAT: " << *v << "\n";
    }
  }
  if (auto v = get("NULL_TEXT")) {
    if (NullTextIsSafe(*v, ',')) {
      cfg.null_text = *v;
    } else {
      std::cerr << "[config] ignoring NULL_TEXT with a comma, quote or line break: " << *v << "\n";
    }
  }
  if (auto v = get("QUOTE_ALL"))
    cfg.quote_all = parse_bool(*v, cfg.quote_all);
  if (auto v = get("TABLES"))
    cfg.tables = split_csv(*v);
  if (auto v = get("MAX_INCIDENTS"))
    cfg.max_incidents = parse_size(*v, cfg.max_incidents);
  if (auto v = get("PROGRESS_INTERVAL_MS"))
    cfg.progress_interval_ms = parse_size(*v, cfg.progress_interval_ms);
  if (auto v = get("SUMMARY_JSON"))
    cfg.summary_json = *v;
  if (auto v = get("VERBOSE"))
    cfg.verbose = parse_bool(*v, cfg.verbose);
}

void print_usage() {
  std::cerr << "dumpflux: extract per-table rows from a SQL dump (.sql / .sql.gz / .sql.xz)\n"
            << "Usage:\n"
            << "  dumpflux [options] [dump.sql]\n\n"
            << "Options:\n"
            << "  --env-file <path>             Path to .env (default: .env)\n"
            << "  --input <path>                Dump file, '-' for stdin (overrides DUMP_PATH)\n"
            << "  --out-dir <path>              Output directory (default: sql_raw)\n"
            << "  --format <csv|jsonl>          Output format (default: csv)\n"
            << "  --null-text <text>            CSV text for NULL values, no commas, quotes or line breaks (default: empty)\n"
            << "  --quote-all                   Quote every CSV field (default)\n"
            << "  --minimal-quoting             Quote CSV fields only when needed\n"
            << "  --tables <a,b,...>            Only write these tables\n"
            << "  --max-incidents <n>           Incidents kept in the summary (default: 1000)\n"
            << "  --progress-interval-ms <n>    Progress cadence, 0 disables (default: 1000)\n"
            << "  --summary-json <path>         Write the run summary as JSON\n"
            << "  --verbose                     Print every warning\n"
            << "  --help                        Show this help\n";
}

bool parse_args(int argc, char** argv, Config& cfg) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    auto need_value = [&](const std::string& name) -> const char* {
      if (i + 1 >= argc) {
        std::cerr << "Missing value for " << name << "\n";
        return nullptr;
      }
      return argv[++i];
    };
    auto need_size = [&](const std::string& name, std::size_t& out) -> bool {
      const char* v = need_value(name);
      if (!v) {
        return false;
      }
      if (!parse_size_strict(v, out)) {
        std::cerr << "Invalid " << name << ": " << v << "\n";
        return false;
      }
      return true;
    };

    if (arg == "--help" || arg == "-h") {
      cfg.show_help = true;
      return true;
    }
    if (arg == "--env-file") {
      const char* v = need_value(arg);
      if (!v) {
        return false;
      }
      cfg.env_path = v;
      continue;
    }
    if (arg == "--input") {
      const char* v = need_value(arg);
      if (!v) {
        return false;
      }
      cfg.dump_path = v;
      continue;
    }
    if (arg == "--out-dir") {
      const char* v = need_value(arg);
      if (!v) {
        return false;
      }
      cfg.out_dir = v;
      continue;
    }
    if (arg == "--format") {
      const char* v = need_value(arg);
      if (!v) {
        return false;
      }
      if (!parse_output_format(v, cfg.format)) {
        std::cerr << "Invalid --format: " << v << "\n";
        return false;
      }
      continue;
    }
    if (arg == "--null-text") {
      const char* v = need_value(arg);
      if (!v) {
        return false;
      }
      if (!NullTextIsSafe(v, ',')) {
        std::cerr << "Invalid --null-text (no commas, quotes or line breaks): " << v << "\n";
        return false;
      }
      cfg.null_text = v;
      continue;
    }
    if (arg == "--quote-all") {
      cfg.quote_all = true;
      continue;
    }
    if (arg == "--minimal-quoting") {
      cfg.quote_all = false;
      continue;
    }
    if (arg == "--tables") {
      const char* v = need_value(arg);
      if (!v) {
        return false;
      }
      cfg.tables = split_csv(v);
      continue;
    }
    if (arg == "--max-incidents") {
      if (!need_size(arg, cfg.max_incidents)) {
        return false;
      }
      continue;
    }
    if (arg == "--progress-interval-ms") {
      if (!need_size(arg, cfg.progress_interval_ms)) {
        return false;
      }
      continue;
    }
    if (arg == "--summary-json") {
      const char* v = need_value(arg);
      if (!v) {
        return false;
      }
      cfg.summary_json = v;
      continue;
    }
    if (arg == "--verbose" || arg == "-v") {
      cfg.verbose = true;
      continue;
    }
    if (arg.size() > 1 && arg[0] == '-') {
      std::cerr << "Unknown option: " << arg << "\n";
      return false;
    }
    cfg.dump_path = arg;
  }
  return true;
}

bool load_config(int argc, char** argv, Config& cfg) {
  for (int i = 1; i + 1 < argc; ++i) {
    if (std::string_view(argv[i]) == "--env-file") {
      cfg.env_path = argv[i + 1];
    }
  }
  apply_env_overrides(cfg, read_env_file(cfg.env_path));
  return parse_args(argc, argv, cfg);
}

}  // namespace dumpflux
