#pragma once
/**
 * @file segment_message.hpp
 * @brief Host-side (Linux) entry point: std::string in, ready-to-send strings out.
 *
 * Thin wrapper around split_message() for bridges, daemons and the CLI. The
 * core stays heap-free with its fixed FragmentList; this layer resolves into
 * a HostChunkPlan backed by std::vector, so the number of chunks is bounded
 * only by the text, and copies each chunk into a std::string so callers can
 * queue them for their transport.
 *
 * Errors follow the dispatcher convention: `false` plus a short reason token
 * in `err`, printed by callers as `status=error reason=<err>`. The tokens a
 * host split can produce are `chunk_limit_too_small` and
 * `marker_does_not_fit`.
 *
 * @code
 * std::vector<std::string> chunks;
 * std::string err;
 * if (!meshsplit::segment_message(reply, 1000, 230, chunks, err)) {
 *     std::cerr << "status=error reason=" << err << "\n";
 *     return 2;
 * }
 * for (const auto& c : chunks) send_text(c);
 * @endcode
 */

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "meshsplit/marker_resolver.hpp"

namespace meshsplit {

/// Unbounded fragment store for host builds.
using HostFragmentList = std::vector<Fragment>;

/// Plan resolved into a HostFragmentList; never reports TooManyChunks.
using HostChunkPlan = BasicChunkPlan<HostFragmentList>;

/**
 * @brief Split `text` into chunks of at most `chunk_limit` characters each.
 * @param text        Message to split.
 * @param total_limit Characters kept from `text` before splitting (0 keeps none).
 * @param chunk_limit Characters per chunk, "(i/N) " marker included.
 * @param out         Receives the chunks in transmission order; cleared first,
 *                    left empty on failure.
 * @param err         Receives the reason token on failure.
 * @return true on success.
 */
bool segment_message(const std::string& text,
                     std::size_t total_limit,
                     std::size_t chunk_limit,
                     std::vector<std::string>& out,
                     std::string& err);

/**
 * @brief Copy every chunk of a plan, marker included, into std::strings.
 *
 * Markers are formatted with std::to_string, so counts beyond the core's
 * five-digit MarkerStr render as well.
 *
 * @param plan   Resolved plan (core or host).
 * @param chunks Receives one string per chunk; cleared first.
 */
template <typename Fragments>
void render_all(const BasicChunkPlan<Fragments>& plan, std::vector<std::string>& chunks) {
    chunks.clear();
    chunks.reserve(plan.count());

    const std::string total = std::to_string(plan.count());
    for (std::size_t i = 0; i < plan.count(); ++i) {
        const Fragment& frag = plan.fragments[i];

        std::string chunk;
        if (plan.numbered) {
            chunk.reserve(total.size() * 2 + 4 + frag.length);
            chunk += '(';
            chunk += std::to_string(i + 1);
            chunk += '/';
            chunk += total;
            chunk += ") ";
        }
        chunk.append(plan.source + frag.offset, frag.length);
        chunks.push_back(std::move(chunk));
    }
}

/**
 * @brief Remove a leading "(i/N) " marker, if any.
 * @return The body text.
 */
std::string strip_marker(const std::string& chunk);

} // namespace meshsplit
