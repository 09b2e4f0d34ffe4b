/**
 * @file marker_resolver.hpp
 * @brief Marker Resolver: settles the chunk count and marker width together.
 *
 * @details
 * ## The circularity
 *
 * Every chunk of a multi-part message is prefixed with "(i/N) ". The marker
 * eats into the same per-chunk ceiling `C` as the body, and its width depends
 * on `N`. But `N` is only known after segmenting, and segmenting needs the
 * body budget `C - marker_width(N)`. Crossing a power of ten (9 → 10,
 * 99 → 100) widens the marker, shrinks the budget, and can add chunks.
 *
 * ## Resolution (bounded fixed point)
 *
 * ```
 *  pass 0: segment(text, C)            → 1 fragment? done, no marker
 *                                      → N0 fragments, d = digits(N0)
 *  pass k: B = C - (2d + 4)
 *          segment(text, B)            → N'
 *          digits(N') <= d ?           → done, numbering self-consistent
 *          else d = digits(N'), repeat (at most MAX_RESOLVE_PASSES times)
 *  fallback: d = digits(len(text))     → N' <= len(text), so the reservation
 *                                        always covers the final marker
 * ```
 *
 * `d` only grows, and it can never exceed `digits(len(text))`, so the loop
 * settles in two or three passes for any realistic message. The fallback
 * trades a few extra, smaller chunks for the ceiling guarantee.
 *
 * ## Guarantees on SplitStatus::Ok
 * - `marker_width(total) + body length <= C` for every fragment.
 * - fragments cover the text exactly, in order.
 * - `numbered` is false iff there is exactly one fragment.
 *
 * ## Failures
 * - ChunkLimitTooSmall: `C < MIN_CHUNK_LIMIT`.
 * - MarkerDoesNotFit: the marker for the count the text needs leaves no
 *   room for even one body character.
 * - TooManyChunks: a pass overflowed a fixed FragmentList. Only the core
 *   `ChunkPlan` can report this; a host plan backed by std::vector cannot.
 *
 * On failure the plan is cleared.
 */
#ifndef MESHSPLIT_MARKER_RESOLVER_HPP
#define MESHSPLIT_MARKER_RESOLVER_HPP

#include "meshsplit/limits.hpp"
#include "meshsplit/marker.hpp"
#include "meshsplit/segmenter.hpp"
#include <stdint.h>
#include <stddef.h>

namespace meshsplit {

/**
 * @brief A resolved split: fragment spans plus the numbering they carry.
 *
 * The plan does not own the text. `source` points into the caller's buffer
 * and must stay valid while chunks are rendered or dispatched.
 *
 * @tparam Fragments Fragment container; see segment().
 */
template <typename Fragments>
struct BasicChunkPlan {
    Fragments    fragments;           ///< Bodies, in transmission order
    const char*  source = "";         ///< Text the fragments index (already truncated)
    size_t       source_length = 0;   ///< Characters at `source`
    bool         clipped = false;     ///< Truncator dropped trailing characters
    bool         numbered = false;    ///< Markers are emitted (count > 1)
    size_t       marker_width = 0;    ///< Reserved marker width; 0 when not numbered
    size_t       body_budget = 0;     ///< Budget the final pass segmented with
    uint8_t      passes = 0;          ///< Segmentation passes run
    bool         converged = false;   ///< false if the fallback reservation was used

    /// @brief Number of chunks (N).
    size_t count() const { return fragments.size(); }

    /// @brief Reset to the empty state.
    void clear() {
        fragments.clear();
        source        = "";
        source_length = 0;
        clipped       = false;
        numbered      = false;
        marker_width  = 0;
        body_budget   = 0;
        passes        = 0;
        converged     = false;
    }
};

/// Heap-free plan used by the core and the Dispatcher.
using ChunkPlan = BasicChunkPlan<FragmentList>;

namespace detail {

template <typename Fragments>
SplitStatus fail(BasicChunkPlan<Fragments>& plan, SplitStatus status) {
    plan.clear();
    return status;
}

// -----------------------------------------------------------------------------
// segment_reserved(): One numbered pass with `digits`-wide numbers.
// PRE:   plan.source/plan.source_length set.
// OUT:   plan.fragments, marker_width, body_budget, passes updated.
// -----------------------------------------------------------------------------
template <typename Fragments>
SplitStatus segment_reserved(BasicChunkPlan<Fragments>& plan, size_t chunk_limit, uint8_t digits) {
    const size_t width = 2u * digits + 4u;
    if (width >= chunk_limit) return SplitStatus::MarkerDoesNotFit;  // no body room left

    const size_t budget = chunk_limit - width;
    ++plan.passes;
    if (!segment(plan.source, plan.source_length, budget, plan.fragments)) {
        return SplitStatus::TooManyChunks;
    }
    plan.marker_width = width;
    plan.body_budget  = budget;
    return SplitStatus::Ok;
}

} // namespace detail

/**
 * @brief Segment `text` so that marker + body fits `chunk_limit` for every chunk.
 * @param text        Text to split (already truncated).
 * @param length      Characters at `text`.
 * @param chunk_limit Per-chunk ceiling C, marker included.
 * @param plan        Receives the resolved plan.
 *
 * POLICY:
 *   - Pass 0 uses the whole ceiling; a single fragment means no marker at all.
 *   - Later passes reserve 2d+4 characters; d grows only when the new count
 *     needs more digits than were reserved.
 *   - A count needing fewer digits than reserved is accepted: the printed
 *     marker is narrower than the reservation, the ceiling still holds.
 *   - Pass cap exhausted → reserve for digits(length), which bounds any count.
 */
template <typename Fragments>
SplitStatus resolve_markers(const char* text, size_t length, size_t chunk_limit,
                            BasicChunkPlan<Fragments>& plan) {
    plan.clear();
    plan.source        = text ? text : "";
    plan.source_length = text ? length : 0;

    if (chunk_limit < MIN_CHUNK_LIMIT) return detail::fail(plan, SplitStatus::ChunkLimitTooSmall);

    // Pass 0: no reservation
    ++plan.passes;
    if (!segment(plan.source, plan.source_length, chunk_limit, plan.fragments)) {
        return detail::fail(plan, SplitStatus::TooManyChunks);
    }
    if (plan.fragments.size() == 1) {
        plan.body_budget = chunk_limit;
        plan.converged   = true;
        return SplitStatus::Ok;
    }

    // Passes 1..MAX_RESOLVE_PASSES: reserve, re-segment, compare digit width
    uint8_t digits = decimal_digits(plan.fragments.size());
    for (size_t i = 0; i < MAX_RESOLVE_PASSES; ++i) {
        const SplitStatus st = detail::segment_reserved(plan, chunk_limit, digits);
        if (st != SplitStatus::Ok) return detail::fail(plan, st);

        const uint8_t needed = decimal_digits(plan.fragments.size());
        if (needed <= digits) {
            plan.numbered  = true;
            plan.converged = true;
            return SplitStatus::Ok;
        }
        digits = needed;                            // count crossed a power of ten
    }

    // Fallback: every fragment holds at least one character, so the count can
    // never need more digits than the length itself.
    const SplitStatus st = detail::segment_reserved(plan, chunk_limit, decimal_digits(plan.source_length));
    if (st != SplitStatus::Ok) return detail::fail(plan, st);
    plan.numbered  = true;
    plan.converged = false;
    return SplitStatus::Ok;
}

// The core plan is compiled once in marker_resolver.cpp.
extern template struct BasicChunkPlan<FragmentList>;
extern template SplitStatus resolve_markers<FragmentList>(const char*, size_t, size_t, ChunkPlan&);

} // namespace meshsplit

#endif // MESHSPLIT_MARKER_RESOLVER_HPP
