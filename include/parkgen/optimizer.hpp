#pragma once

#include <array>
#include <string>
#include <vector>

#include "parkgen/compliance.hpp"
#include "parkgen/layout.hpp"
#include "parkgen/layout_decoder.hpp"
#include "parkgen/params.hpp"
#include "parkgen/rules.hpp"
#include "parkgen/scoring.hpp"

namespace parkgen {

constexpr int kObjectiveCount = 4;
using Objectives = std::array<double, kObjectiveCount>;  // all minimised

// One decoded and judged genome.
struct Evaluation {
    Genome genome;
    bool decoded = false;
    std::string error;  // decode failure message when !decoded

    CandidateLayout layout;
    LayoutMetrics metrics;
    ViolationReport report;
    ScoreVector scores;

    int hard_count = 0;
    double hard_magnitude = 0.0;
    // soft penalty, -aggregate, road length per ha, -lot quality
    Objectives objectives{};
};

// Decode + validate + score. A PlanningError from the decoder yields an undecoded,
// maximally unfit evaluation instead of propagating.
Evaluation evaluate_genome(const DecodeContext& ctx,
                           const Genome& genome,
                           const ParameterSet& params,
                           const RuleSet& rules);

// Deb's constrained domination: feasible beats infeasible; among infeasible fewer hard
// violations (then smaller hard magnitude) wins; among feasible, Pareto dominance.
bool constrained_dominates(const Evaluation& a, const Evaluation& b);

// Final-pick order: fewer hard violations, then higher aggregate, then lower soft penalty.
bool better_final(const Evaluation& a, const Evaluation& b);

// Non-dominated fronts (indices into `pop`), best front first.
std::vector<std::vector<int>> non_dominated_sort(const std::vector<Evaluation>& pop);

// Crowding distance of each member of `front`, aligned with it; boundary members get +inf.
std::vector<double> crowding_distance(const std::vector<Evaluation>& pop, const std::vector<int>& front);

enum class StopReason {
    kGenerationLimit = 0,
    kStagnation = 1,
    kDeadline = 2,
    kCancelled = 3,
};

const char* stop_reason_name(StopReason r);

struct FrontMember {
    Genome genome;
    Objectives objectives{};
    int hard_count = 0;
    double aggregate = 0.0;
};

struct OptimizerResult {
    Evaluation best;
    bool compliant = false;
    std::vector<FrontMember> front;  // first front of the final population

    int generations = 0;  // completed variation rounds
    long long evaluations = 0;
    double elapsed_s = 0.0;
    StopReason stop_reason = StopReason::kGenerationLimit;
};

// NSGA-II over genomes. The search stream is drawn on the calling thread only, so results
// do not depend on the OpenMP thread count. Returns the best layout seen even when stopped
// early by the deadline or the cancel flag.
OptimizerResult optimize_layout(const DecodeContext& ctx, const ParameterSet& params, const RuleSet& rules);

}  // namespace parkgen
