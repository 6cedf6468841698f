#include "dumpflux/table_sink.hpp"

namespace dumpflux {

std::string FileStemForTable(const std::string& table) {
  std::string out = table;
  for (char& c : out) {
    if (c == '/' || c == '\\' || c == ':' || c == '\0') {
      c = '_';
    }
  }
  if (out.empty() || out == "." || out == "..") {
    out = "_" + out;
  }
  return out;
}

}  // namespace dumpflux
