#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "dumpflux/extractor.hpp"

namespace dumpflux {

[[nodiscard]] nlohmann::json SummaryToJson(const ExtractionSummary& summary);

// Throws std::runtime_error if the file cannot be written.
void WriteSummaryJson(const ExtractionSummary& summary, const std::string& path);

// Human-readable per-table listing followed by warning totals.
[[nodiscard]] std::string FormatSummary(const ExtractionSummary& summary);

}  // namespace dumpflux
