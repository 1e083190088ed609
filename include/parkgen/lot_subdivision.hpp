#pragma once

#include <cstdint>
#include <vector>

#include "parkgen/geometry.hpp"
#include "parkgen/layout.hpp"
#include "parkgen/params.hpp"
#include "parkgen/road_network.hpp"

namespace parkgen {

struct SubdivisionResult {
    std::vector<Lot> lots;
    std::vector<OpenSpace> residuals;
};

// Guillotine subdivision of each block into lots near `target_area`. A cut on a non-convex
// piece yields every simple component on either side.
// A cut is admissible only if both sides keep a piece with at least min_frontage of road
// frontage. Pieces below lot_area_min, or with less than min_frontage, become residual open
// space. A piece with no admissible cut is accepted as a relaxed lot up to
// relax_factor * lot_area_max; a larger one is re-cut with the shape bound dropped, slicing a
// lot-sized piece off a fronted end.
// Cut fractions and ties are perturbed by `seed`; the same input and seed give the same lots.
SubdivisionResult subdivide_blocks(const std::vector<Block>& blocks,
                                   const std::vector<FrontageLine>& frontage,
                                   const ParameterSet& params,
                                   double target_area,
                                   std::uint64_t seed);

// Long side over short side of the minimum-area enclosing rectangle.
double lot_aspect_ratio(const Polygon& poly);

}  // namespace parkgen
