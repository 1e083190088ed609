#pragma once

#include <vector>

#include "parkgen/geometry.hpp"
#include "parkgen/layout.hpp"
#include "parkgen/params.hpp"
#include "parkgen/road_network.hpp"

namespace parkgen {

struct InfrastructurePlacement {
    std::vector<InfrastructureElement> elements;  // local frame
    std::vector<OpenSpace> open_spaces;           // exclusion strips and leftovers
    std::vector<PlacementIssue> issues;
    std::vector<Block> remaining;                 // blocks left for lot subdivision
};

// Greedy placement in priority order. Each element takes a full-width slice from one end of
// the largest compatible block (lowest elevation first for elements that require it). A
// boundary-adjacent slice must share an edge with the buildable outline, a road-adjacent one
// must front a road. The slice is followed by an exclusion strip of width `exclusion_radius`
// left as open space.
// Elements that fit nowhere are reported as PlacementInfeasible issues; placement continues.
InfrastructurePlacement place_infrastructure(const std::vector<Block>& blocks,
                                             const Polygon& buildable,
                                             const RoadNetwork& roads,
                                             const LocalFrame& frame,
                                             double site_area,
                                             const ParameterSet& params);

}  // namespace parkgen
