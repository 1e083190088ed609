#include <doctest/doctest.h>

#include <cmath>
#include <limits>

#include "parkgen/compliance.hpp"
#include "test_helpers.hpp"

using namespace parkgen;

namespace {

LayoutMetrics compliant_metrics() {
    LayoutMetrics m;
    m.site_area = 200000.0;
    m.salable_fraction = 0.74;
    m.green_fraction = 0.12;
    m.min_primary_row = 25.0;
    m.min_secondary_row = 12.0;
    m.perimeter_buffer = 5.0;
    m.lot_count = 120;
    m.road_components = 1;
    m.entrance_count = 1;
    m.coverage_fraction = 0.97;
    return m;
}

}  // namespace

TEST_CASE("compliant metrics produce an empty report") {
    const ViolationReport rep = evaluate_rules(compliant_metrics(), default_rule_set());
    CHECK(rep.violations.empty());
    CHECK(rep.compliant());
    CHECK(rep.soft_penalty() == doctest::Approx(0.0));
}

TEST_CASE("hard and soft violations are separated") {
    LayoutMetrics m = compliant_metrics();
    m.salable_fraction = 0.90;
    m.green_fraction = 0.05;
    m.road_components = 3;
    const ViolationReport rep = evaluate_rules(m, default_rule_set());

    REQUIRE(rep.violations.count("salable-max") == 1);
    const Violation& v = rep.violations.at("salable-max");
    CHECK(v.severity == Severity::kHard);
    CHECK(v.measured == doctest::Approx(0.90));
    CHECK(v.threshold == doctest::Approx(0.85));
    CHECK(v.magnitude == doctest::Approx(0.05));

    CHECK(rep.violations.count("road-connected") == 1);
    CHECK(rep.violations.at("road-connected").magnitude == doctest::Approx(2.0));
    CHECK(rep.hard_count() == 2);
    CHECK(rep.soft_count() == 1);
    CHECK(rep.soft_penalty() == doctest::Approx(0.05));
    CHECK_FALSE(rep.compliant());
}

TEST_CASE("a layout leaving much of the site far from roads is not compliant") {
    LayoutMetrics m = compliant_metrics();
    m.coverage_fraction = 0.93;
    ViolationReport rep = evaluate_rules(m, default_rule_set());
    CHECK(rep.violations.count("coverage") == 1);
    CHECK(rep.compliant());

    m.coverage_fraction = 0.77;
    rep = evaluate_rules(m, default_rule_set());
    REQUIRE(rep.violations.count("coverage-floor") == 1);
    CHECK(rep.violations.at("coverage-floor").severity == Severity::kHard);
    CHECK_FALSE(rep.compliant());
}

TEST_CASE("missing secondary roads do not trip the width rule") {
    LayoutMetrics m = compliant_metrics();
    m.min_secondary_row = std::numeric_limits<double>::infinity();
    CHECK(evaluate_rules(m, default_rule_set()).violations.count("secondary-row") == 0);
    m.min_secondary_row = 10.0;
    CHECK(evaluate_rules(m, default_rule_set()).violations.count("secondary-row") == 1);
}

TEST_CASE("metric lookup covers every quantity") {
    LayoutMetrics m = compliant_metrics();
    m.uncovered_area = 12.5;
    m.lot_deficit = 3;
    CHECK(metric_value(m, Quantity::kSalableFraction) == doctest::Approx(0.74));
    CHECK(metric_value(m, Quantity::kUncoveredArea) == doctest::Approx(12.5));
    CHECK(metric_value(m, Quantity::kLotDeficit) == doctest::Approx(3.0));
    CHECK(metric_value(m, Quantity::kLotCount) == doctest::Approx(120.0));
}

TEST_CASE("decoded layout measures cleanly and deterministically") {
    const parkgen_test::Scenario sc;
    const CandidateLayout layout = sc.decode();
    const LayoutMetrics m = measure_layout(layout, sc.params);

    CHECK(m.site_area == doctest::Approx(200000.0));
    CHECK(m.perimeter_buffer == doctest::Approx(sc.params.perimeter_buffer));
    CHECK(m.min_primary_row == doctest::Approx(sc.params.primary_row_width));
    CHECK(m.lot_overlaps == 0);
    CHECK(m.infrastructure_overlaps == 0);
    CHECK(m.road_components == 1);
    CHECK(m.entrance_count >= 1);
    CHECK(m.lots_without_frontage == 0);
    CHECK(m.undersized_lots == 0);
    CHECK(std::abs(m.uncovered_area) < sc.params.lot_area_min);
    CHECK(m.road_length_per_ha == doctest::Approx(m.road_length / 20.0));

    const ViolationReport a = validate_layout(layout, default_rule_set(), sc.params);
    const ViolationReport b = validate_layout(layout, default_rule_set(), sc.params);
    CHECK(a == b);
}

TEST_CASE("overlapping lots are counted") {
    const parkgen_test::Scenario sc;
    CandidateLayout layout = sc.decode();
    REQUIRE(layout.lots.size() >= 2);
    layout.lots.push_back(layout.lots.front());
    const LayoutMetrics m = measure_layout(layout, sc.params);
    CHECK(m.lot_overlaps >= 1);
    const ViolationReport rep = evaluate_rules(m, default_rule_set());
    CHECK(rep.violations.count("lot-overlap") == 1);
}
