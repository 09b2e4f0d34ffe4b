#pragma once
/**
 * @file config.hpp
 * @brief Host-side configuration: JSON file → SplitterConfig.
 *
 * File layout (every key optional; missing keys keep their defaults):
 * @code{.json}
 * { "total_limit": 1000, "chunk_limit": 230,
 *   "pacing": { "split_delay_ms": 2500, "burst_every": 4, "burst_pause_ms": 5000 },
 *   "serial": { "device": "/dev/ttyACM0", "baud": 115200 } }
 * @endcode
 *
 * Only types and ranges are checked here. Whether the limits make a feasible
 * split is decided by validate_limits() at split time.
 *
 * Reason tokens written to `err`:
 *  - `open_failed`         file missing or unreadable
 *  - `parse_error`         not valid JSON
 *  - `not_object`          top level is not an object
 *  - `bad_value:<key>`     wrong type or out of range, e.g. `bad_value:pacing.burst_every`
 */

#include <string>

#include "meshsplit/limits.hpp"
#include "meshsplit/dispatcher.hpp"

namespace meshsplit {

struct SplitterConfig {
  SplitLimits  limits{};
  PacingPolicy pacing{};
  std::string  device;        // empty → no serial link configured
  int          baud{115200};
};

/// Baud rates the Linux serial transport knows how to set.
bool is_supported_baud(long baud);

/**
 * @brief Overlay the values in `json_text` onto `cfg`.
 * @return false with `err` set on the first problem; `cfg` is then unchanged.
 */
bool parse_config(const std::string& json_text, SplitterConfig& cfg, std::string& err);

/// @brief Read `path` and hand it to parse_config().
bool load_config(const std::string& path, SplitterConfig& cfg, std::string& err);

} // namespace meshsplit
