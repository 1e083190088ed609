#pragma once

#include <vector>

#include "parkgen/geometry.hpp"
#include "parkgen/layout.hpp"
#include "parkgen/params.hpp"

namespace parkgen {

// Road generation works in a site-aligned frame: the primary spine runs along x,
// secondary roads along y, collectors parallel to the spine.
struct RoadLayoutInput {
    Polygon buildable;            // boundary minus perimeter buffer, local frame
    double spine_fraction = 0.5;  // [0, 1] mapped onto [spine_min_fraction, spine_max_fraction]
    double lot_depth = 40.0;
    double phase = 0.5;           // [0, 1) shifts the secondary pattern
    // Points on the buildable edge where a north/south facing entrance arrives; each gets a
    // secondary road. The first one anchors the secondary pattern.
    std::vector<Point> forced_secondaries;
    bool has_forced_spine = false;
    Point forced_spine_at;        // arrival point of a side-facing primary entrance
};

// Land between roads, before infrastructure placement and subdivision.
struct Block {
    Polygon polygon;
    int order = 0;  // generation order, used to keep later stages deterministic
};

struct RoadLayout {
    RoadNetwork network;
    std::vector<Block> blocks;
    double spine_y = 0.0;
    std::vector<double> secondary_x;
    double max_road_distance = 0.0;
};

// Builds the spine, secondaries and collectors and carves their rights-of-way out of `buildable`.
// Blocks plus right-of-way polygons partition `buildable`; frontage lines are the right-of-way
// edges that face a block. Throws InfeasibleGeometry when `buildable` is empty or has no room
// for a spine.
RoadLayout generate_road_network(const RoadLayoutInput& input, const ParameterSet& params);

// Fills `connections` from centerline contacts and sets the junction count.
void link_road_segments(RoadNetwork& net, double tol = 1e-6);

// Components of the contact graph of the given segments (ignores stored `connections`).
int road_component_count(const std::vector<RoadSegment>& segments, double tol = 1e-6);

// Fraction of grid samples inside `region` that lie within `max_distance` of a road edge.
double road_coverage(const Polygon& region,
                     const std::vector<RoadSegment>& segments,
                     double max_distance,
                     double step = 0.0);

}  // namespace parkgen
