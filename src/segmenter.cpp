/**
 * @file segmenter.cpp
 * @brief Segmenter implementation (word-boundary cuts with forced-cut fallback)
 *
 * Refer to segmenter.hpp for the cut policy table.
 *
 * This implementation is designed for:
 *   - microcontroller environments (no dynamic memory, no exceptions)
 *   - spans into the caller's text instead of copied strings
 */
#include "meshsplit/segmenter.hpp"

namespace meshsplit {

bool is_whitespace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

size_t forced_cut_width(size_t budget) {
    const size_t half   = budget / 2;
    const size_t margin = (FORCED_CUT_MARGIN < half) ? FORCED_CUT_MARGIN : half;
    const size_t width  = budget - margin;
    return width > 0 ? width : 1;
}


// next_cut(): One boundary decision
// ---------------------------------
// Step 1: remainder fits → Tail, done.
// Step 2: scan backward from the last index that still fits (budget - 1)
//         down to budget / 2. The first whitespace found closes the fragment
//         and is kept in it.
// Step 3: nothing found → ForcedCut at forced_cut_width(budget).
Cut next_cut(const char* text, size_t length, size_t budget) {
    Cut cut;

    if (budget == 0) {
        cut.kind = CutKind::ForcedCut;     // caller error; consume nothing
        return cut;
    }

    // Step 1
    if (length <= budget) {
        cut.kind   = CutKind::Tail;
        cut.length = length;
        return cut;
    }

    // Step 2
    const size_t floor = budget / 2;
    for (size_t i = budget; i-- > floor;) {
        if (is_whitespace(text[i])) {
            cut.kind   = CutKind::WordBoundaryCut;
            cut.length = i + 1;
            return cut;
        }
    }

    // Step 3
    cut.kind   = CutKind::ForcedCut;
    cut.length = forced_cut_width(budget);
    return cut;
}

} // namespace meshsplit
