/**
 * @file segmenter.hpp
 * @brief Segmenter: splits text into body fragments that each fit a budget.
 *
 * ---
 *
 * ## Role in MeshSplit
 *
 * The Segmenter knows nothing about numbering. It is handed a body budget `B`
 * (the Marker Resolver has already subtracted the marker width) and returns
 * an ordered list of spans over the text such that:
 *
 * - every span is at most `B` characters,
 * - the spans, in order, cover the text exactly (nothing dropped, nothing
 *   repeated),
 * - boundaries prefer whitespace.
 *
 * ---
 *
 * ## Cut policy
 *
 * Each boundary is one of three tagged choices (`CutKind`):
 *
 * | Kind            | When                                                   | Length         |
 * |-----------------|--------------------------------------------------------|----------------|
 * | Tail            | remaining text fits in `B`                             | remainder      |
 * | WordBoundaryCut | whitespace found at index `B-1` down to `B/2`          | up to and including the whitespace |
 * | ForcedCut       | no whitespace in that window (one giant "word")        | `forced_cut_width(B)` |
 *
 * The whitespace that ends a fragment stays in that fragment, so the next
 * fragment starts on the following word and the concatenation still equals
 * the input.
 *
 * Forced cuts stop `min(FORCED_CUT_MARGIN, B/2)` short of the budget, so a
 * run of non-whitespace is chunked at a predictable width rather than always
 * filling to exactly `B`.
 *
 * ---
 *
 * ## Memory
 *
 * Fragments are spans (`offset`, `length`) into the caller's text. In the
 * core the list is an ETL vector with fixed capacity (`FragmentList`), and
 * `segment()` reports false instead of overflowing it. Host builds pass a
 * `std::vector<Fragment>` and are bounded only by the text length.
 *
 * ---
 *
 * ## Example
 * @code
 * meshsplit::FragmentList frags;
 * const char* text = "hello mesh world";
 * if (meshsplit::segment(text, 16, 8, frags)) {
 *     // frags: "hello " (WordBoundaryCut), "mesh " (WordBoundaryCut), "world" (Tail)
 * }
 * @endcode
 */
#ifndef MESHSPLIT_SEGMENTER_HPP
#define MESHSPLIT_SEGMENTER_HPP

#include "etl/vector.h"
#include "meshsplit/limits.hpp"
#include <stdint.h>
#include <stddef.h>

namespace meshsplit {

/// @brief How a fragment boundary was chosen.
enum class CutKind : uint8_t {
    Tail            = 0, ///< Last fragment; remainder fit the budget
    WordBoundaryCut = 1, ///< Ended on whitespace inside the search window
    ForcedCut       = 2  ///< No whitespace in the window; fixed-width cut
};

/// @brief One boundary decision: its kind and how many characters it consumes.
struct Cut {
    CutKind kind   = CutKind::Tail;
    size_t  length = 0;
};

/// @brief Span of the source text that forms one chunk body.
struct Fragment {
    size_t  offset = 0;             ///< First character, relative to the segmented text
    size_t  length = 0;             ///< Characters in this body (<= budget)
    CutKind cut    = CutKind::Tail; ///< How the fragment was closed
};

/// Fixed-capacity fragment table used by the core.
using FragmentList = etl::vector<Fragment, MAX_CHUNKS>;

/**
 * @brief true for space, tab, newline, carriage return, vertical tab, form feed.
 */
bool is_whitespace(char c);

/**
 * @brief Width of a forced cut for a given body budget.
 * @return budget - min(FORCED_CUT_MARGIN, budget / 2); never 0 for budget >= 1.
 */
size_t forced_cut_width(size_t budget);

/**
 * @brief Decide where the next fragment ends.
 * @param text   Remaining text (not null-terminated; `length` bounds it).
 * @param length Characters remaining.
 * @param budget Body budget, must be >= 1.
 * @return The chosen cut. A budget of 0 yields a ForcedCut of length 0.
 */
Cut next_cut(const char* text, size_t length, size_t budget);

/**
 * @brief Split text into fragments of at most `budget` characters.
 *
 * Empty text yields exactly one empty Tail fragment, so callers always have
 * at least one unit to transmit.
 *
 * Every non-Tail cut consumes at least one character, so the loop ends after
 * at most `length + 1` iterations. Capacity is checked against `max_size()`
 * before each push: a FragmentList reports false when its table is full, a
 * host `std::vector<Fragment>` grows instead.
 *
 * @tparam Fragments FragmentList (core) or std::vector<Fragment> (host).
 * @param text   Text to split.
 * @param length Characters at `text`.
 * @param budget Body budget per fragment.
 * @param out    Receives the fragments; cleared first.
 * @return false if `budget` is 0 or `out` ran out of capacity.
 */
template <typename Fragments>
bool segment(const char* text, size_t length, size_t budget, Fragments& out) {
    out.clear();
    if (budget == 0) return false;

    size_t pos = 0;
    while (true) {
        if (out.size() >= out.max_size()) return false;  // table exhausted before the Tail

        const Cut cut = next_cut(text + pos, length - pos, budget);

        Fragment frag;
        frag.offset = pos;
        frag.length = cut.length;
        frag.cut    = cut.kind;
        out.push_back(frag);

        pos += cut.length;
        if (cut.kind == CutKind::Tail) return true;
    }
}

} // namespace meshsplit

#endif // MESHSPLIT_SEGMENTER_HPP
