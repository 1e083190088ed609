#pragma once

#include <vector>

#include "parkgen/compliance.hpp"
#include "parkgen/layout.hpp"
#include "parkgen/optimizer.hpp"
#include "parkgen/params.hpp"
#include "parkgen/rules.hpp"
#include "parkgen/scoring.hpp"
#include "parkgen/timeline.hpp"

namespace parkgen {

struct OptimizerStats {
    int generations = 0;
    long long evaluations = 0;
    double elapsed_s = 0.0;
    StopReason stop_reason = StopReason::kGenerationLimit;
    size_t front_size = 0;
};

struct SitePlanReport {
    CandidateLayout layout;
    LayoutMetrics metrics;
    ViolationReport violations;
    ScoreVector scores;
    TimelineResult timeline;
    std::vector<LayoutFeature> features;
    bool compliant = false;  // false: least-infeasible layout, hard violations listed
    OptimizerStats stats;
};

// Full run: checks inputs, rejects unusable sites before searching (InfeasibleGeometry,
// NoValidFrontage), optimises, then schedules and scores the winner.
// `reference` is an optional external line (e.g. a highway) that entrances should face.
SitePlanReport plan_site(const Polygon& boundary,
                         const Polyline* reference,
                         const ParameterSet& params,
                         const RuleSet& rules);

}  // namespace parkgen
