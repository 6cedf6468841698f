#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace dumpflux {

enum class OutputFormat {
  csv = 0,
  jsonl,
};

struct Config {
  std::string env_path = ".env";
  std::string dump_path;
  std::string out_dir = "sql_raw";
  OutputFormat format = OutputFormat::csv;
  std::string null_text;
  bool quote_all = true;
  std::vector<std::string> tables;  // empty -> every table
  std::size_t max_incidents = 1000;
  std::size_t progress_interval_ms = 1000;  // 0 -> no progress output
  std::string summary_json;
  bool verbose = false;
  bool show_help = false;
};

std::unordered_map<std::string, std::string> read_env_file(const std::string& path);
void apply_env_overrides(Config& cfg, const std::unordered_map<std::string, std::string>& env);

void print_usage();
// Prints the problem to stderr and returns false on an invalid argument.
bool parse_args(int argc, char** argv, Config& cfg);

// --env-file first, then the .env values, then the remaining flags.
bool load_config(int argc, char** argv, Config& cfg);

bool parse_output_format(const std::string& s, OutputFormat& out);
const char* output_format_name(OutputFormat format);

}  // namespace dumpflux
