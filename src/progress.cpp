#include "dumpflux/progress.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

namespace dumpflux {

std::string FormatDuration(double seconds) {
  int sec = static_cast<int>(seconds + 0.5);
  int h = sec / 3600;
  int m = (sec % 3600) / 60;
  int s = sec % 60;
  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(2) << h << ":" << std::setw(2) << m << ":" << std::setw(2) << s;
  return oss.str();
}

ProgressTracker::ProgressTracker(std::string label, std::uint64_t interval_ms, std::ostream& out)
    : label_(std::move(label)), interval_ms_(interval_ms), out_(out) {
  start_ = std::chrono::steady_clock::now();
  last_print_ = start_;
}

void ProgressTracker::Add(std::uint64_t lines, std::uint64_t bytes) {
  lines_ += lines;
  bytes_ += bytes;
  MaybePrint(false);
}

void ProgressTracker::Finish() { MaybePrint(true); }

void ProgressTracker::MaybePrint(bool force) {
  if (interval_ms_ == 0) {
    return;
  }
  auto now = std::chrono::steady_clock::now();
  if (!force) {
    auto delta = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_print_).count();
    if (delta < static_cast<long long>(interval_ms_)) {
      return;
    }
  }
  last_print_ = now;

  double elapsed = std::chrono::duration_cast<std::chrono::duration<double>>(now - start_).count();
  double line_rate = elapsed > 0.0 ? static_cast<double>(lines_) / elapsed : 0.0;
  double mb_rate = elapsed > 0.0 ? static_cast<double>(bytes_) / (1024.0 * 1024.0) / elapsed : 0.0;

  std::ostringstream oss;
  oss.setf(std::ios::fixed);
  oss << "[" << label_ << "] lines " << lines_ << " tables " << tables_ << " rows " << rows_;
  if (rows_ >= 1000000) {
    oss << " (" << std::setprecision(1) << (static_cast<double>(rows_) / 1e6) << "M)";
  }
  if (line_rate > 0.0) {
    oss << " rate " << std::setprecision(0) << line_rate << " lines/s " << std::setprecision(2) << mb_rate
        << " MB/s";
  }
  oss << " elapsed " << FormatDuration(elapsed) << "\n";
  out_ << oss.str();
}

}  // namespace dumpflux
