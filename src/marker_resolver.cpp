// -----------------------------------------------------------------------------
// marker_resolver.cpp: core instantiation of the marker resolver
//
// The resolver is a template over the fragment container so that host code
// can resolve into an unbounded std::vector. The heap-free FragmentList
// instantiation lives here so embedded builds compile it once.
//
// API & pass diagram:
//   see include/meshsplit/marker_resolver.hpp
// -----------------------------------------------------------------------------
#include "meshsplit/marker_resolver.hpp"

namespace meshsplit {

template struct BasicChunkPlan<FragmentList>;
template SplitStatus resolve_markers<FragmentList>(const char*, size_t, size_t, ChunkPlan&);

} // namespace meshsplit
