#pragma once

#include <vector>

#include "parkgen/entrance_placer.hpp"
#include "parkgen/geometry.hpp"
#include "parkgen/layout.hpp"
#include "parkgen/params.hpp"

namespace parkgen {

// Per-run state shared read-only by every decode of one optimisation.
struct DecodeContext {
    Polygon boundary;  // world, CCW
    bool has_reference = false;
    Polyline reference;
    std::vector<EntranceCandidate> ranked_edges;
    OrientedBox obb;
    Point origin;
    double site_area = 0.0;
};

// Checks that some parameterization can work: the buffered interior is non-empty
// (else InfeasibleGeometry) and an entrance edge exists (else NoValidFrontage).
DecodeContext prepare_decode(const Polygon& boundary, const Polyline* reference, const ParameterSet& params);

// Lot depth and target area implied by a genome.
double genome_lot_area(const Genome& genome, const ParameterSet& params);
double genome_lot_depth(const Genome& genome, const ParameterSet& params);

// Runs entrances -> roads -> infrastructure -> lots for one genome and returns the layout in
// world coordinates. Deterministic: the same context, genome and parameters give identical geometry.
// Throws PlanningError subclasses when the genome produces unusable geometry.
CandidateLayout decode_layout(const DecodeContext& ctx, const Genome& genome, const ParameterSet& params);

}  // namespace parkgen
