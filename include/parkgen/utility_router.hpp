#pragma once

#include <vector>

#include "parkgen/layout.hpp"
#include "parkgen/params.hpp"

namespace parkgen {

// Utilities run in the road corridors. The road graph has a node at every centerline vertex,
// junction and lot attachment point; each lot attaches at the point of its access road nearest
// to its centroid.
//
//   water  Steiner tree over the plant and the lot attachments, approximated by the minimum
//          spanning tree of their shortest-path distances expanded back onto the roads.
//   sewer  union of the shortest paths from every lot to the wastewater plant (a drainage tree).
//   power  minimum spanning tree of every road reachable from the substation.
//
// A missing plant is replaced by the primary entrance. Lots with no road path to the source are
// counted as unserved and get no runs.
UtilityNetwork route_utility(UtilityKind kind, const CandidateLayout& layout, const ParameterSet& params);

// Water, sewer and power, in that order.
std::vector<UtilityNetwork> route_utilities(const CandidateLayout& layout, const ParameterSet& params);

// The layout's routed networks, or a fresh routing when the layout carries none.
std::vector<UtilityNetwork> utilities_of(const CandidateLayout& layout, const ParameterSet& params);

}  // namespace parkgen
