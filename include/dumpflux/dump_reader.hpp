#pragma once

#include <functional>
#include <istream>
#include <string>
#include <string_view>

namespace dumpflux {

enum class DumpFormat {
  text = 0,
  gzip,
  xz,
};

// Detected from the file extension (.gz / .xz); everything else is text.
DumpFormat DetectDumpFormat(const std::string& path);

// Receives each line without its terminator; return false to stop reading.
using LineCallback = std::function<bool(std::string_view)>;

bool ReadTextLines(std::istream& in, const LineCallback& cb);
bool ReadTextLines(const std::string& path, const LineCallback& cb);
bool ReadGzLines(const std::string& path, const LineCallback& cb);
bool ReadXzLines(const std::string& path, const LineCallback& cb);

// Dispatches on DetectDumpFormat; "-" reads standard input. A reader stopped
// by its callback still counts as success.
bool ForEachDumpLine(const std::string& path, const LineCallback& cb, std::string& err);

}  // namespace dumpflux
