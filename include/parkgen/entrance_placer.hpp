#pragma once

#include <vector>

#include "parkgen/geometry.hpp"
#include "parkgen/layout.hpp"
#include "parkgen/params.hpp"

namespace parkgen {

// Boundary edge that can host an entrance.
struct EntranceCandidate {
    int edge_index = -1;
    Point a;
    Point b;
    double length = 0.0;
    Point inward_normal;
    double alignment = 0.0;     // |outward normal . reference direction|; 0 = edge parallel to the reference
    double ref_distance = 0.0;  // edge midpoint to reference line (or -length without a reference)
    double span_lo = 0.0;       // admissible arc-length range for the entrance centre
    double span_hi = 0.0;
};

// Edges long enough for corner setbacks plus the access road, best first: alignment with the
// reference line (banded by alignment_tolerance), then distance to it, then edge index.
// Without a reference line the longest edge ranks first.
// Throws NoValidFrontage when no edge qualifies.
std::vector<EntranceCandidate> rank_entrance_edges(const Polygon& boundary,
                                                   const Polyline* reference,
                                                   const ParameterSet& params);

// Index into `ranked` of the primary entrance edge selected by choice_gene in [0, 1).
int primary_candidate_index(const std::vector<EntranceCandidate>& ranked,
                            const ParameterSet& params,
                            double choice_gene);

struct EntrancePlan {
    std::vector<Entrance> entrances;            // world coordinates, primary first
    std::vector<Point> inward_normals;          // parallel to entrances
    int dropped = 0;                            // requested entrances that found no admissible spot
};

// Picks the primary entrance among the best `top_candidates` edges (choice_gene) at offset_gene
// along its span, then adds entrances spread as far as possible from those already placed.
// Secondary entrances must face a frame axis that a secondary road can extend
// (|inward normal . frame y| >= |inward normal . frame x|).
EntrancePlan place_entrances(const std::vector<EntranceCandidate>& ranked,
                             const ParameterSet& params,
                             double frame_angle_deg,
                             double choice_gene,
                             double offset_gene);

// Access road from an entrance straight through the perimeter buffer.
RoadSegment make_entrance_connector(const Entrance& entrance,
                                    const Point& inward_normal,
                                    double depth,
                                    double width,
                                    int id);

}  // namespace parkgen
