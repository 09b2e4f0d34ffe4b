/**
 * @file marker.hpp
 * @brief "(i/N) " numbering markers: width arithmetic, rendering, parsing.
 *
 * A marker is the prefix that tells a human on the other end of the link
 * which part of a split message they are reading:
 *
 * @code
 * (1/3) The repeater on the ridge is back online after the storm, ...
 * (2/3) ... battery voltage holding at 3.9V, solar input nominal ...
 * (3/3) ... next check-in at 18:00.
 * @endcode
 *
 * The index is printed without padding, so "(3/12) " is narrower than
 * "(12/12) ". Space is reserved for the widest one, `2 * digits(N) + 4`.
 *
 * | N        | widest marker   | width |
 * |----------|-----------------|-------|
 * | 2..9     | "(9/9) "        | 6     |
 * | 10..99   | "(99/99) "      | 8     |
 * | 100..999 | "(999/999) "    | 10    |
 */
#ifndef MESHSPLIT_MARKER_HPP
#define MESHSPLIT_MARKER_HPP

#include "etl/string.h"
#include "meshsplit/limits.hpp"
#include <stdint.h>
#include <stddef.h>

namespace meshsplit {

/// Marker text type; fits the widest marker the chunk table can need.
using MarkerStr = etl::string<MARKER_CAP>;

/// @brief Fields recovered from a marker at the start of a chunk.
struct MarkerInfo {
    size_t index = 0; ///< 1-based position
    size_t total = 0; ///< Chunk count N
    size_t width = 0; ///< Characters the marker occupies, trailing space included
};

/**
 * @brief Number of decimal digits in n (0 has one digit).
 */
uint8_t decimal_digits(size_t n);

/**
 * @brief Characters reserved for the marker of a message split into `total` chunks.
 * @return 2 * decimal_digits(total) + 4
 */
size_t marker_width(size_t total);

/**
 * @brief Append "(index/total) " to `out`.
 * @return false if index is 0, index > total, or `out` lacks capacity
 *         (in which case `out` is left unchanged).
 */
bool write_marker(size_t index, size_t total, etl::istring& out);

/**
 * @brief Recognise a marker at the start of `text`.
 *
 * Accepts only the exact form written by write_marker(): no leading zeros,
 * 1 <= index <= total, a single trailing space.
 *
 * @return true and fills `info` if a marker was found.
 */
bool parse_marker(const char* text, size_t length, MarkerInfo& info);

} // namespace meshsplit

#endif // MESHSPLIT_MARKER_HPP
