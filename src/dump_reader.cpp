#include "dumpflux/dump_reader.hpp"

#include <cctype>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <vector>

#include <lzma.h>
#include <zlib.h>

namespace dumpflux {

namespace {

std::string lower_ascii(std::string value) {
  for (char& ch : value) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  return value;
}

bool ends_with(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

void strip_line_end(std::string& line) {
  while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
    line.pop_back();
  }
}

// Hands every complete line in `pending` to `cb` and keeps the unfinished
// rest. Returns false once `cb` asks to stop. Lines are cut by length, so
// NUL bytes inside them survive.
bool emit_lines(std::string& pending, const LineCallback& cb) {
  std::size_t start = 0;
  bool keep_going = true;
  while (start < pending.size()) {
    std::size_t pos = pending.find('\n', start);
    if (pos == std::string::npos) {
      break;
    }
    std::string_view line(pending.data() + start, pos - start);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    start = pos + 1;
    if (!cb(line)) {
      keep_going = false;
      break;
    }
  }
  pending.erase(0, start);
  return keep_going;
}

// Last line of a stream that does not end with a newline.
void emit_tail(std::string& pending, const LineCallback& cb) {
  strip_line_end(pending);
  if (!pending.empty()) {
    cb(pending);
  }
}

// Feeds decompressed bytes to `on_chunk` until the stream ends or `on_chunk`
// asks to stop.
bool decode_xz_stream(std::istream& in, const std::function<bool(const char*, std::size_t)>& on_chunk) {
  lzma_stream strm = LZMA_STREAM_INIT;
  if (lzma_stream_decoder(&strm, UINT64_MAX, LZMA_CONCATENATED) != LZMA_OK) {
    return false;
  }

  std::vector<std::uint8_t> in_buf(1 << 16);
  std::vector<std::uint8_t> out_buf(1 << 16);
  lzma_action action = LZMA_RUN;
  bool eof = false;
  bool ok = true;

  while (true) {
    if (strm.avail_in == 0 && !eof) {
      in.read(reinterpret_cast<char*>(in_buf.data()), static_cast<std::streamsize>(in_buf.size()));
      std::streamsize got = in.gcount();
      if (got < 0 || in.bad()) {
        ok = false;
        break;
      }
      strm.next_in = in_buf.data();
      strm.avail_in = static_cast<std::size_t>(got);
      if (got == 0) {
        eof = true;
        action = LZMA_FINISH;
      }
    }

    strm.next_out = out_buf.data();
    strm.avail_out = out_buf.size();

    lzma_ret ret = lzma_code(&strm, action);
    std::size_t produced = out_buf.size() - strm.avail_out;
    if (produced > 0 && !on_chunk(reinterpret_cast<const char*>(out_buf.data()), produced)) {
      break;
    }

    if (ret == LZMA_STREAM_END) {
      break;
    }
    if (ret != LZMA_OK) {
      ok = false;
      break;
    }
    if (eof && strm.avail_in == 0 && produced == 0) {
      ok = false;
      break;
    }
  }

  lzma_end(&strm);
  return ok;
}

}  // namespace

DumpFormat DetectDumpFormat(const std::string& path) {
  std::string lower = lower_ascii(path);
  if (ends_with(lower, ".gz") || ends_with(lower, ".gzip")) {
    return DumpFormat::gzip;
  }
  if (ends_with(lower, ".xz")) {
    return DumpFormat::xz;
  }
  return DumpFormat::text;
}

bool ReadTextLines(std::istream& in, const LineCallback& cb) {
  std::string line;
  while (std::getline(in, line)) {
    strip_line_end(line);
    if (!cb(line)) {
      return true;
    }
  }
  return !in.bad();
}

bool ReadTextLines(const std::string& path, const LineCallback& cb) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return false;
  }
  return ReadTextLines(in, cb);
}

bool ReadGzLines(const std::string& path, const LineCallback& cb) {
  gzFile f = gzopen(path.c_str(), "rb");
  if (!f) {
    return false;
  }
  gzbuffer(f, 1 << 17);
  std::vector<char> buf(1 << 20);
  std::string pending;
  bool ok = true;
  while (true) {
    int got = gzread(f, buf.data(), static_cast<unsigned>(buf.size()));
    if (got < 0) {
      ok = false;
      break;
    }
    if (got == 0) {
      break;
    }
    pending.append(buf.data(), static_cast<std::size_t>(got));
    if (!emit_lines(pending, cb)) {
      gzclose(f);
      return true;
    }
  }
  int errnum = Z_OK;
  gzerror(f, &errnum);
  gzclose(f);
  if (!ok || (errnum != Z_OK && errnum != Z_STREAM_END)) {
    return false;
  }
  emit_tail(pending, cb);
  return true;
}

bool ReadXzLines(const std::string& path, const LineCallback& cb) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return false;
  }

  std::string pending;
  bool stopped = false;
  bool ok = decode_xz_stream(in, [&](const char* data, std::size_t n) {
    pending.append(data, n);
    if (!emit_lines(pending, cb)) {
      stopped = true;
      return false;
    }
    return true;
  });
  if (stopped) {
    return true;
  }
  if (!ok) {
    return false;
  }
  emit_tail(pending, cb);
  return true;
}

bool ForEachDumpLine(const std::string& path, const LineCallback& cb, std::string& err) {
  if (path == "-") {
    if (!ReadTextLines(std::cin, cb)) {
      err = "failed to read dump from stdin";
      return false;
    }
    return true;
  }

  switch (DetectDumpFormat(path)) {
    case DumpFormat::gzip:
      if (!ReadGzLines(path, cb)) {
        err = "failed to read gz dump: " + path;
        return false;
      }
      return true;
    case DumpFormat::xz:
      if (!ReadXzLines(path, cb)) {
        err = "failed to read xz dump: " + path;
        return false;
      }
      return true;
    case DumpFormat::text:
    default:
      if (!ReadTextLines(path, cb)) {
        err = "failed to read dump: " + path;
        return false;
      }
      return true;
  }
}

}  // namespace dumpflux
