// -----------------------------------------------------------------------------
// config.cpp: JSON configuration for the host tools
//
// Parsing never throws: nlohmann::json is asked for a discarded value instead
// of an exception, and every key is type-checked before get<>().
// -----------------------------------------------------------------------------
#include "meshsplit/config.hpp"

#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>

#include "nlohmann/json.hpp"

using json = nlohmann::json;

namespace meshsplit {

namespace {

// Read an optional unsigned integer in [lo, hi]. Absent key → true, `out` untouched.
template <typename T>
bool read_unsigned(const json& obj, const char* key, const std::string& path,
                   uint64_t lo, uint64_t hi, T& out, std::string& err) {
  auto it = obj.find(key);
  if (it == obj.end()) return true;
  if (!it->is_number_unsigned() || it->get<uint64_t>() < lo || it->get<uint64_t>() > hi) {
    err = "bad_value:" + path;
    return false;
  }
  out = static_cast<T>(it->get<uint64_t>());
  return true;
}

// Optional nested object. Absent → nullptr; present but not an object → error.
bool section(const json& root, const char* key, const json*& out, std::string& err) {
  out = nullptr;
  auto it = root.find(key);
  if (it == root.end()) return true;
  if (!it->is_object()) { err = std::string("bad_value:") + key; return false; }
  out = &*it;
  return true;
}

} // namespace

bool is_supported_baud(long baud) {
  switch (baud) {
    case 9600: case 19200: case 38400: case 57600: case 115200: case 230400:
      return true;
    default:
      return false;
  }
}

// -----------------------------------------------------------------------------
// parse_config()
// POLICY:
//   - Work on a copy; commit to `cfg` only when every key validated.
//   - Unknown keys are ignored.
// -----------------------------------------------------------------------------
bool parse_config(const std::string& json_text, SplitterConfig& cfg, std::string& err) {
  const json root = json::parse(json_text, nullptr, /*allow_exceptions=*/false);
  if (root.is_discarded()) { err = "parse_error"; return false; }
  if (!root.is_object())   { err = "not_object";  return false; }

  SplitterConfig next = cfg;
  const uint64_t size_max = std::numeric_limits<size_t>::max();
  const uint64_t u32_max  = std::numeric_limits<uint32_t>::max();

  if (!read_unsigned(root, "total_limit", "total_limit", 0, size_max, next.limits.total_limit, err)) return false;
  if (!read_unsigned(root, "chunk_limit", "chunk_limit", 0, size_max, next.limits.chunk_limit, err)) return false;

  const json* pacing = nullptr;
  if (!section(root, "pacing", pacing, err)) return false;
  if (pacing) {
    if (!read_unsigned(*pacing, "split_delay_ms", "pacing.split_delay_ms", 0, u32_max, next.pacing.split_delay_ms, err)) return false;
    if (!read_unsigned(*pacing, "burst_every",    "pacing.burst_every",    0, 255,     next.pacing.burst_every,    err)) return false;
    if (!read_unsigned(*pacing, "burst_pause_ms", "pacing.burst_pause_ms", 0, u32_max, next.pacing.burst_pause_ms, err)) return false;
  }

  const json* serial = nullptr;
  if (!section(root, "serial", serial, err)) return false;
  if (serial) {
    auto dev = serial->find("device");
    if (dev != serial->end()) {
      if (!dev->is_string()) { err = "bad_value:serial.device"; return false; }
      next.device = dev->get<std::string>();
    }
    long baud = next.baud;
    if (!read_unsigned(*serial, "baud", "serial.baud", 1, u32_max, baud, err)) return false;
    if (!is_supported_baud(baud)) { err = "bad_value:serial.baud"; return false; }
    next.baud = static_cast<int>(baud);
  }

  cfg = next;
  return true;
}

bool load_config(const std::string& path, SplitterConfig& cfg, std::string& err) {
  std::ifstream in(path);
  if (!in) { err = "open_failed"; return false; }
  std::ostringstream ss;
  ss << in.rdbuf();
  if (in.bad()) { err = "open_failed"; return false; }
  return parse_config(ss.str(), cfg, err);
}

} // namespace meshsplit
