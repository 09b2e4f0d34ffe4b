// -----------------------------------------------------------------------------
// message_splitter.cpp: core chunk rendering (split_message is a template in the header)
//
// API & flow diagram:
//   see include/meshsplit/message_splitter.hpp
// -----------------------------------------------------------------------------
#include "meshsplit/message_splitter.hpp"
#include "meshsplit/marker.hpp"

namespace meshsplit {

bool render_body(const ChunkPlan& plan, size_t index, etl::istring& out) {
    out.clear();
    if (index >= plan.count()) return false;

    const Fragment& frag = plan.fragments[index];
    if (out.max_size() < frag.length) return false;

    out.append(plan.source + frag.offset, frag.length);
    return true;
}

// -----------------------------------------------------------------------------
// render_chunk(): marker (if numbered) followed by the body span.
// POLICY:
//   - Capacity is checked for the full chunk up front; a short buffer yields
//     false and an empty `out`, never a truncated chunk.
// -----------------------------------------------------------------------------
bool render_chunk(const ChunkPlan& plan, size_t index, etl::istring& out) {
    out.clear();
    if (index >= plan.count()) return false;
    if (out.max_size() < chunk_length(plan, index)) return false;

    if (plan.numbered && !write_marker(index + 1, plan.count(), out)) {
        out.clear();
        return false;
    }

    const Fragment& frag = plan.fragments[index];
    out.append(plan.source + frag.offset, frag.length);
    return true;
}

size_t chunk_length(const ChunkPlan& plan, size_t index) {
    if (index >= plan.count()) return 0;

    size_t len = plan.fragments[index].length;
    if (plan.numbered) {
        len += static_cast<size_t>(decimal_digits(index + 1)) + decimal_digits(plan.count()) + 4u;
    }
    return len;
}

} // namespace meshsplit
