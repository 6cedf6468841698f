#pragma once

#include <chrono>
#include <cstdint>
#include <ostream>
#include <string>

namespace dumpflux {

// Periodic single-line progress report for a forward pass over a dump.
class ProgressTracker {
 public:
  ProgressTracker(std::string label, std::uint64_t interval_ms, std::ostream& out);

  void Add(std::uint64_t lines, std::uint64_t bytes);
  void SetTables(std::uint64_t tables) { tables_ = tables; }
  void AddRows(std::uint64_t rows) { rows_ += rows; }
  void Finish();

  [[nodiscard]] std::uint64_t lines() const { return lines_; }

 private:
  void MaybePrint(bool force);

  std::string label_;
  std::uint64_t interval_ms_;
  std::ostream& out_;
  std::uint64_t lines_ = 0;
  std::uint64_t bytes_ = 0;
  std::uint64_t tables_ = 0;
  std::uint64_t rows_ = 0;
  std::chrono::steady_clock::time_point start_;
  std::chrono::steady_clock::time_point last_print_;
};

std::string FormatDuration(double seconds);

}  // namespace dumpflux
