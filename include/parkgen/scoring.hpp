#pragma once

#include <array>
#include <string>
#include <vector>

#include "parkgen/compliance.hpp"
#include "parkgen/layout.hpp"
#include "parkgen/params.hpp"
#include "parkgen/timeline.hpp"

namespace parkgen {

enum class ScoreDimension {
    kCompliance = 0,
    kEfficiency = 1,
    kLotQuality = 2,
    kFinancial = 3,
    kConstructability = 4,
    kEnvironmental = 5,
    kUtilityCoverage = 6,
};

const char* score_dimension_name(ScoreDimension d);

struct ScoreVector {
    std::array<double, kScoreDimensionCount> values{};  // each in [0, 1]
    double aggregate = 0.0;                            // weighted mean, in [0, 1]
    std::string grade;

    double operator[](ScoreDimension d) const { return values[static_cast<size_t>(d)]; }
};

// Letter grade for a 0-100 score: A+ >= 95, A >= 90, B+ >= 85, ... D >= 60, F below.
std::string grade_for(double score_0_100);

// Mean aspect conformance of the lots (1 at the preferred 1:1.5 proportion, 0 beyond max_aspect).
double lot_quality(const std::vector<Lot>& lots, const ParameterSet& params);

// Mean lot area over its minimum enclosing rectangle.
double lot_regularity(const std::vector<Lot>& lots);

ScoreVector score_layout(const CandidateLayout& layout,
                         const LayoutMetrics& metrics,
                         const ViolationReport& report,
                         const TimelineResult& timeline,
                         const ParameterSet& params);

struct LayoutComparison {
    int best_overall = -1;
    std::array<int, kScoreDimensionCount> best_by_dimension{};
};

// Index of the best aggregate and of the best value per dimension; ties keep the earlier entry.
LayoutComparison compare_layouts(const std::vector<ScoreVector>& scores);

}  // namespace parkgen
