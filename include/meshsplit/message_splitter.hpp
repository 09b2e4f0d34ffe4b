/**
 * @file message_splitter.hpp
 * @brief One-call split for the core: validate → truncate → resolve → render.
 *
 * ---
 *
 * ## Flow
 *
 * ```
 *  text ──► validate_limits() ──► truncate(total_limit) ──► resolve_markers(chunk_limit)
 *                 │                                               │
 *           status != Ok ◄──────────────────────────────── ChunkPlan (spans + N)
 *                                                                 │
 *                                              render_chunk(i) ──► "(i/N) body"
 * ```
 *
 * Nothing is rendered until the whole plan exists: every marker depends on the
 * final `N`, so no chunk can be handed to a transport before the last one has
 * been computed.
 *
 * ---
 *
 * ## Usage (embedded, no heap)
 * @code
 * meshsplit::ChunkPlan plan;
 * meshsplit::SplitLimits limits;           // 1000 / 230
 * const char* reply = build_reply();
 * if (meshsplit::split_message(reply, meshsplit::text_length(reply), limits, plan)
 *         == meshsplit::SplitStatus::Ok) {
 *     etl::string<230> line;
 *     for (size_t i = 0; i < plan.count(); ++i) {
 *         meshsplit::render_chunk(plan, i, line);
 *         radio.send(line.c_str(), line.size());
 *     }
 * }
 * @endcode
 *
 * Calls share no state; independent plans may be built concurrently.
 */
#ifndef MESHSPLIT_MESSAGE_SPLITTER_HPP
#define MESHSPLIT_MESSAGE_SPLITTER_HPP

#include "etl/string.h"
#include "meshsplit/limits.hpp"
#include "meshsplit/marker_resolver.hpp"
#include "meshsplit/truncator.hpp"
#include <stddef.h>

namespace meshsplit {

/**
 * @brief Split a message into a numbered chunk plan.
 * @param text   Message characters (nullptr is treated as empty).
 * @param length Characters at `text`.
 * @param limits Truncation and per-chunk ceilings.
 * @param plan   Receives the plan; cleared on failure. A core ChunkPlan, or a
 *               host plan backed by std::vector (see segment_message.hpp).
 * @return SplitStatus::Ok or the error that prevented the split.
 */
template <typename Fragments>
SplitStatus split_message(const char* text, size_t length, const SplitLimits& limits,
                          BasicChunkPlan<Fragments>& plan) {
    plan.clear();

    // Fail fast: nothing is truncated or segmented with bad limits.
    const SplitStatus st = validate_limits(limits);
    if (st != SplitStatus::Ok) return st;

    const TruncatedText kept = truncate(text, length, limits.total_limit);

    const SplitStatus resolved = resolve_markers(kept.data, kept.length, limits.chunk_limit, plan);
    if (resolved != SplitStatus::Ok) return resolved;

    plan.clipped = kept.clipped;
    return SplitStatus::Ok;
}

/**
 * @brief Render the body of chunk `index` (0-based, no marker) into `out`.
 * @return false if index is out of range or `out` is too small.
 */
bool render_body(const ChunkPlan& plan, size_t index, etl::istring& out);

/**
 * @brief Render the transmitted text of chunk `index` (0-based): marker + body.
 *
 * The marker is written only when the plan is numbered, as "(index+1/N) ".
 *
 * @return false if index is out of range or `out` is too small.
 */
bool render_chunk(const ChunkPlan& plan, size_t index, etl::istring& out);

/**
 * @brief Length of the transmitted text of chunk `index` without rendering it.
 */
size_t chunk_length(const ChunkPlan& plan, size_t index);

} // namespace meshsplit

#endif // MESHSPLIT_MESSAGE_SPLITTER_HPP
