// -----------------------------------------------------------------------------
// limits.cpp: limit validation and status tokens
//
// API & field descriptions:
//   see include/meshsplit/limits.hpp
// -----------------------------------------------------------------------------
#include "meshsplit/limits.hpp"

namespace meshsplit {

static_assert(MAX_CHUNKS >= 1, "MESHSPLIT_MAX_CHUNKS must allow at least one chunk");
static_assert(MAX_CHUNKS <= 65535, "markers are sized for at most five digits");

// -----------------------------------------------------------------------------
// validate_limits(): Boundary check before any text is touched.
// POLICY:
//   - chunk_limit must hold "(1/2) " plus one body character.
//   - total_limit is not checked; zero simply truncates to the empty message.
// -----------------------------------------------------------------------------
SplitStatus validate_limits(const SplitLimits& limits) {
    if (limits.chunk_limit < MIN_CHUNK_LIMIT) return SplitStatus::ChunkLimitTooSmall;
    return SplitStatus::Ok;
}

const char* status_reason(SplitStatus status) {
    switch (status) {
        case SplitStatus::Ok:                 return "ok";
        case SplitStatus::ChunkLimitTooSmall: return "chunk_limit_too_small";
        case SplitStatus::MarkerDoesNotFit:   return "marker_does_not_fit";
        case SplitStatus::TooManyChunks:      return "too_many_chunks";
    }
    return "unknown";
}

} // namespace meshsplit
