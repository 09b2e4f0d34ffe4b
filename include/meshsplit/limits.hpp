/**
 * @file limits.hpp
 * @brief MeshSplit limits, tunables and status codes shared by every stage.
 *
 * ---
 *
 * ## Purpose
 *
 * A message leaving a MeshSplit node passes through three stages:
 *
 *   raw text → Truncator → Segmenter → Marker Resolver → numbered chunks
 *
 * All three stages agree on the numbers defined here: how much of the source
 * message may be kept (`total_limit`), how large a single transmitted chunk
 * may be (`chunk_limit`, numbering marker included), and the compile-time
 * capacities of the fixed-size tables the core uses instead of the heap.
 *
 * ---
 *
 * ## Typical values
 *
 * | Link                        | chunk_limit | total_limit |
 * |-----------------------------|-------------|-------------|
 * | Meshtastic text packet      | 200..230    | 1000        |
 * | Telegram bridge (default)   | 230         | 1000        |
 * | Raw LoRa frame payload      | 80          | 255         |
 *
 * ---
 *
 * ## Failure model
 *
 * Truncation and segmentation are total. The only caller error is a
 * `chunk_limit` too small to hold a marker and one character, and it is
 * reported before any text is touched. `total_limit == 0` is not an error:
 * it keeps nothing and yields one empty chunk.
 *
 * | SplitStatus          | Meaning                                              |
 * |----------------------|------------------------------------------------------|
 * | Ok                   | Plan produced                                        |
 * | ChunkLimitTooSmall   | chunk_limit < MIN_CHUNK_LIMIT                        |
 * | MarkerDoesNotFit     | numbering the resolved count leaves no body room     |
 * | TooManyChunks        | count exceeds the core's fixed table (ChunkPlan only)|
 *
 * Capacities can be raised per build with `-DMESHSPLIT_MAX_CHUNKS=<n>`.
 */
#ifndef MESHSPLIT_LIMITS_HPP
#define MESHSPLIT_LIMITS_HPP

#include <stdint.h>
#include <stddef.h>

#ifndef MESHSPLIT_MAX_CHUNKS
#define MESHSPLIT_MAX_CHUNKS 64
#endif

namespace meshsplit {

// Tunables: keep these tight for MCU safety.
static constexpr size_t MAX_CHUNKS          = MESHSPLIT_MAX_CHUNKS; ///< Capacity of a chunk table
static constexpr size_t MIN_CHUNK_LIMIT     = 7;    ///< "(1/2) " plus one body character
static constexpr size_t MAX_RESOLVE_PASSES  = 5;    ///< Fixed-point iteration cap
static constexpr size_t FORCED_CUT_MARGIN   = 10;   ///< Forced cuts stop this far short of the budget
static constexpr size_t DEFAULT_TOTAL_LIMIT = 1000; ///< Truncation ceiling
static constexpr size_t DEFAULT_CHUNK_LIMIT = 230;  ///< Per-chunk ceiling

/// Widest marker the core can print: "(65535/65535) ".
static constexpr size_t MARKER_CAP = 14;

/**
 * @brief Caller-supplied ceilings for one split.
 *
 * Neither value is auto-detected. Pick `chunk_limit` to match the payload
 * ceiling of the transport that will carry the chunks.
 */
struct SplitLimits {
    size_t total_limit = DEFAULT_TOTAL_LIMIT; ///< Characters kept from the source message
    size_t chunk_limit = DEFAULT_CHUNK_LIMIT; ///< Characters per chunk, marker included
};

/// @brief Result of a split.
enum class SplitStatus : uint8_t {
    Ok                 = 0,
    ChunkLimitTooSmall = 1,
    MarkerDoesNotFit   = 2,
    TooManyChunks      = 3
};

/**
 * @brief Fail-fast check of the limits, run before truncation.
 * @return SplitStatus::Ok or the first violated rule.
 */
SplitStatus validate_limits(const SplitLimits& limits);

/**
 * @brief Short machine-readable token for a status.
 * @return Static string such as "chunk_limit_too_small"; never nullptr.
 */
const char* status_reason(SplitStatus status);

} // namespace meshsplit

#endif // MESHSPLIT_LIMITS_HPP
