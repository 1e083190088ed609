#include <doctest/doctest.h>

#include <algorithm>

#include "parkgen/scoring.hpp"
#include "test_helpers.hpp"

using namespace parkgen;
using parkgen_test::rect;

TEST_CASE("grade bands") {
    CHECK(grade_for(97.0) == "A+");
    CHECK(grade_for(95.0) == "A+");
    CHECK(grade_for(90.0) == "A");
    CHECK(grade_for(86.0) == "B+");
    CHECK(grade_for(72.0) == "C");
    CHECK(grade_for(60.0) == "D");
    CHECK(grade_for(59.9) == "F");
}

TEST_CASE("lot quality prefers the 1:1.5 proportion") {
    ParameterSet params;
    Lot good;
    good.polygon = rect(0, 0, 30, 45);
    Lot thin;
    thin.polygon = rect(0, 0, 10, 60);
    CHECK(lot_quality({good}, params) == doctest::Approx(1.0));
    CHECK(lot_quality({thin}, params) == doctest::Approx(0.0));
    CHECK(lot_quality({good, thin}, params) == doctest::Approx(0.5));
    CHECK(lot_quality({}, params) == doctest::Approx(0.0));
    CHECK(lot_regularity({good}) == doctest::Approx(1.0));
}

TEST_CASE("scores of a decoded layout") {
    const parkgen_test::Scenario sc;
    const CandidateLayout layout = sc.decode();
    const LayoutMetrics m = measure_layout(layout, sc.params);
    const ViolationReport rep = evaluate_rules(m, default_rule_set());
    const TimelineResult tl = estimate_timeline(layout, sc.params);
    const ScoreVector sv = score_layout(layout, m, rep, tl, sc.params);

    for (double v : sv.values) {
        CHECK(v >= 0.0);
        CHECK(v <= 1.0);
    }
    CHECK(sv[ScoreDimension::kEfficiency] == doctest::Approx(std::min(1.0, m.salable_fraction / 0.85)));
    CHECK(sv.aggregate >= 0.0);
    CHECK(sv.aggregate <= 1.0);
    CHECK(sv.grade == grade_for(100.0 * sv.aggregate));

    // Weights select dimensions.
    ParameterSet only_eff = sc.params;
    only_eff.score_weights.fill(0.0);
    only_eff.score_weights[static_cast<size_t>(ScoreDimension::kEfficiency)] = 2.0;
    const ScoreVector eff = score_layout(layout, m, rep, tl, only_eff);
    CHECK(eff.aggregate == doctest::Approx(eff[ScoreDimension::kEfficiency]));
}

TEST_CASE("compliance dimension drops with violations") {
    const parkgen_test::Scenario sc;
    const CandidateLayout layout = sc.decode();
    LayoutMetrics m = measure_layout(layout, sc.params);
    const TimelineResult tl = estimate_timeline(layout, sc.params);
    const ScoreVector clean = score_layout(layout, m, ViolationReport{}, tl, sc.params);
    m.road_components = 2;
    const ViolationReport bad = evaluate_rules(m, default_rule_set());
    const ScoreVector worse = score_layout(layout, m, bad, tl, sc.params);
    CHECK(clean[ScoreDimension::kCompliance] == doctest::Approx(1.0));
    CHECK(worse[ScoreDimension::kCompliance] < clean[ScoreDimension::kCompliance]);
}

TEST_CASE("comparison picks best overall and per dimension") {
    ScoreVector a;
    a.values = {1.0, 0.2, 0.2, 0.2, 0.2, 0.2, 0.2};
    a.aggregate = 0.31;
    ScoreVector b;
    b.values = {0.5, 0.9, 0.9, 0.9, 0.9, 0.9, 0.1};
    b.aggregate = 0.74;
    const LayoutComparison cmp = compare_layouts({a, b});
    CHECK(cmp.best_overall == 1);
    CHECK(cmp.best_by_dimension[0] == 0);
    CHECK(cmp.best_by_dimension[1] == 1);
    CHECK(cmp.best_by_dimension[6] == 0);
    CHECK(compare_layouts({}).best_overall == -1);
}
