#include <doctest/doctest.h>

#include <cmath>
#include <set>
#include <stdexcept>
#include <string>

#include "parkgen/errors.hpp"
#include "parkgen/layout_decoder.hpp"
#include "parkgen/pipeline.hpp"
#include "test_helpers.hpp"

using namespace parkgen;
using parkgen_test::rect;

namespace {

const RoadSegment* road_by_id(const RoadNetwork& net, int id) {
    for (const auto& s : net.segments) {
        if (s.id == id) {
            return &s;
        }
    }
    return nullptr;
}

// Checks that hold for any decoded layout, whatever the site outline.
void check_layout_invariants(const CandidateLayout& layout, const ParameterSet& params) {
    const LayoutMetrics m = measure_layout(layout, params);
    REQUIRE(!layout.lots.empty());
    CHECK(layout.roads.connected());
    CHECK(m.road_components == 1);
    CHECK(m.lots_without_frontage == 0);
    CHECK(m.lot_overlaps == 0);
    CHECK(layout.roads.coverage >= 0.90);
    CHECK(m.coverage_fraction >= 0.90);

    for (const auto& lot : layout.lots) {
        const RoadSegment* access = road_by_id(layout.roads, lot.access_road);
        REQUIRE(access != nullptr);
        CHECK(polygon_distance(lot.polygon, access->row) <= 1e-6);
        CHECK(lot.frontage >= params.subdivision.min_frontage - 1e-6);
    }
    for (const auto& os : layout.open_spaces) {
        if (os.kind != OpenSpaceKind::kResidual) {
            continue;
        }
        const double a = polygon_area(os.polygon);
        const double fr = measure_frontage(os.polygon, layout.roads.frontage_lines(), 1e-5).length;
        CHECK((a < params.lot_area_min || fr < params.subdivision.min_frontage + 1e-6));
    }
    for (const auto& u : layout.utilities) {
        CHECK(u.unserved == 0);
    }
}

CandidateLayout decode_site(const Polygon& boundary) {
    parkgen_test::Scenario sc;
    sc.boundary = boundary;
    sc.highway = Polyline{{-100.0, -30.0}, {800.0, -30.0}};
    return sc.decode();
}

}  // namespace

TEST_CASE("twenty hectare site with a highway frontage") {
    parkgen_test::Scenario sc;
    sc.params.optimizer.population = 8;
    sc.params.optimizer.generations = 4;
    sc.params.optimizer.seed = 3;

    const SitePlanReport rep = plan_site(sc.boundary, &sc.highway, sc.params, default_rule_set());

    CHECK(rep.compliant);
    CHECK(rep.violations.hard_count() == 0);
    CHECK(rep.metrics.salable_fraction >= 0.70);
    CHECK(rep.metrics.salable_fraction <= 0.85);
    CHECK(rep.layout.lots.size() >= 50);
    CHECK(rep.metrics.lot_overlaps == 0);
    CHECK(rep.layout.roads.connected());
    REQUIRE(!rep.layout.entrances.empty());
    CHECK(rep.layout.entrances.front().point.y == doctest::Approx(0.0));

    CHECK(rep.timeline.total_duration_days > 0.0);
    CHECK(rep.scores.grade == grade_for(100.0 * rep.scores.aggregate));
    CHECK(rep.stats.evaluations >= 8);
    CHECK(rep.stats.generations <= 4);
}

TEST_CASE("features have stable typed ids") {
    parkgen_test::Scenario sc;
    const CandidateLayout layout = sc.decode();
    const auto features = layout_features(layout);
    const auto again = layout_features(sc.decode());
    REQUIRE(features.size() == again.size());

    std::set<std::string> ids;
    size_t lots = 0;
    size_t roads = 0;
    for (size_t i = 0; i < features.size(); ++i) {
        CHECK(features[i].id == again[i].id);
        CHECK(features[i].type == again[i].type);
        ids.insert(features[i].id);
        if (features[i].type == "lot") {
            ++lots;
        }
        if (features[i].type.rfind("road-", 0) == 0) {
            ++roads;
            CHECK(features[i].polyline.size() >= 2);
        }
    }
    CHECK(ids.size() == features.size());
    CHECK(lots == layout.lots.size());
    CHECK(roads == layout.roads.segments.size());
}

TEST_CASE("decoding is bit-identical for the same genome") {
    parkgen_test::Scenario sc;
    Genome g;
    g[kGeneOrientation] = 0.8;
    g[kGeneCutSeed] = 0.31;
    const CandidateLayout a = sc.decode(g);
    const CandidateLayout b = sc.decode(g);
    REQUIRE(a.lots.size() == b.lots.size());
    for (size_t i = 0; i < a.lots.size(); ++i) {
        CHECK(parkgen_test::same_polygon(a.lots[i].polygon, b.lots[i].polygon));
    }
    REQUIRE(a.roads.segments.size() == b.roads.segments.size());
    for (size_t i = 0; i < a.roads.segments.size(); ++i) {
        CHECK(parkgen_test::same_polygon(a.roads.segments[i].row, b.roads.segments[i].row));
    }
}

TEST_CASE("site too small for its buffer fails before searching") {
    ParameterSet params;
    params.perimeter_buffer = 15.0;
    const Polygon tiny = rect(0, 0, 20, 20);
    CHECK_THROWS_AS(plan_site(tiny, nullptr, params, default_rule_set()), InfeasibleGeometry);
}

TEST_CASE("site without a usable edge fails with NoValidFrontage") {
    ParameterSet params;
    CHECK_THROWS_AS(plan_site(rect(0, 0, 60, 60), nullptr, params, default_rule_set()), NoValidFrontage);
}

TEST_CASE("invalid inputs are rejected") {
    ParameterSet params;
    params.lot_area_min = 5000.0;  // above the target
    CHECK_THROWS_AS(plan_site(rect(0, 0, 500, 400), nullptr, params, default_rule_set()), std::invalid_argument);

    const Polygon line{{0, 0}, {10, 0}, {20, 0}};
    CHECK_THROWS_AS(plan_site(line, nullptr, ParameterSet{}, default_rule_set()), std::invalid_argument);
}

TEST_CASE("L-shaped site") {
    const Polygon ell{{0, 0}, {600, 0}, {600, 230}, {250, 230}, {250, 500}, {0, 500}};
    check_layout_invariants(decode_site(ell), parkgen_test::Scenario{}.params);
}

TEST_CASE("U-shaped site") {
    const Polygon u{{0, 0}, {600, 0}, {600, 450}, {420, 450}, {420, 200}, {180, 200}, {180, 450}, {0, 450}};
    check_layout_invariants(decode_site(u), parkgen_test::Scenario{}.params);
}

TEST_CASE("triangular site") {
    const Polygon tri{{0, 0}, {700, 0}, {0, 600}};
    check_layout_invariants(decode_site(tri), parkgen_test::Scenario{}.params);
}

TEST_CASE("site with a narrow notch in its frontage") {
    const Polygon notched{{0, 0}, {290, 0}, {300, 100}, {310, 0}, {600, 0}, {600, 400}, {0, 400}};
    ParameterSet params = parkgen_test::Scenario{}.params;
    const Polyline highway{{-100.0, -30.0}, {800.0, -30.0}};
    CHECK_NOTHROW(prepare_decode(notched, &highway, params));
    check_layout_invariants(decode_site(notched), params);
}

TEST_CASE("shaped sites hold up across genomes") {
    const Polygon ell{{0, 0}, {600, 0}, {600, 230}, {250, 230}, {250, 500}, {0, 500}};
    const ParameterSet params = parkgen_test::Scenario{}.params;
    for (double v : {0.1, 0.6, 0.9}) {
        parkgen_test::Scenario sc;
        sc.boundary = ell;
        sc.highway = Polyline{{-100.0, -30.0}, {800.0, -30.0}};
        Genome g;
        g[kGeneOrientation] = v;
        g[kGeneSpineOffset] = 1.0 - v;
        g[kGeneSecondaryPhase] = v;
        g[kGeneCutSeed] = v;
        check_layout_invariants(sc.decode(g), params);
    }
}

TEST_CASE("rotated site keeps the same lot count") {
    parkgen_test::Scenario sc;
    const CandidateLayout flat = sc.decode();

    parkgen_test::Scenario turned;
    turned.boundary = rotate_polygon(sc.boundary, 25.0);
    turned.highway = rotate_polygon(sc.highway, 25.0);
    const CandidateLayout tilted = turned.decode();
    const double n_flat = static_cast<double>(flat.lots.size());
    const double n_tilted = static_cast<double>(tilted.lots.size());
    CHECK(std::abs(n_tilted - n_flat) <= 2.0);
    CHECK(tilted.lot_area() == doctest::Approx(flat.lot_area()).epsilon(0.02));
}
