// ============================================================================
// segment_message.cpp: host wrapper over the splitter
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================
#include "meshsplit/segment_message.hpp"
#include "meshsplit/marker.hpp"
#include "meshsplit/message_splitter.hpp"

namespace meshsplit {

// ---------------------------------------------------------------------------
// segment_message()
// -----------------
// Resolves into a HostChunkPlan, so long messages are never refused for lack
// of table space. Only the limits themselves can fail the call.
// ---------------------------------------------------------------------------
bool segment_message(const std::string& text,
                     std::size_t total_limit,
                     std::size_t chunk_limit,
                     std::vector<std::string>& out,
                     std::string& err)
{
    out.clear();

    SplitLimits limits;
    limits.total_limit = total_limit;
    limits.chunk_limit = chunk_limit;

    HostChunkPlan plan;
    const SplitStatus st = split_message(text.data(), text.size(), limits, plan);
    if (st != SplitStatus::Ok) {
        err = status_reason(st);
        return false;
    }

    render_all(plan, out);
    return true;
}

std::string strip_marker(const std::string& chunk) {
    MarkerInfo info;
    if (parse_marker(chunk.data(), chunk.size(), info)) {
        return chunk.substr(info.width);
    }
    return chunk;
}

} // namespace meshsplit
