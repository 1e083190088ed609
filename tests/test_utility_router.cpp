#include <doctest/doctest.h>

#include "parkgen/scoring.hpp"
#include "parkgen/timeline.hpp"
#include "parkgen/utility_router.hpp"
#include "test_helpers.hpp"

using namespace parkgen;
using parkgen_test::rect;

namespace {

RoadSegment road(int id, RoadClass rc, Point a, Point b, double width) {
    RoadSegment s;
    s.id = id;
    s.road_class = rc;
    s.centerline = {a, b};
    s.width = width;
    return s;
}

Lot lot_on(int id, const Polygon& poly, int road_id) {
    Lot l;
    l.id = id;
    l.polygon = poly;
    l.area = polygon_area(poly);
    l.access_road = road_id;
    return l;
}

// Spine along y = 0, a branch up at x = 100, a dead end at x = 180.
// Lot 0 is centred at (20, 20), lot 1 at (110, 90). The primary entrance sits at the east end.
CandidateLayout tee_layout() {
    CandidateLayout l;
    l.boundary = rect(-50, -50, 250, 150);
    l.roads.segments.push_back(road(0, RoadClass::kPrimary, {0, 0}, {200, 0}, 10.0));
    l.roads.segments.push_back(road(1, RoadClass::kSecondary, {100, 0}, {100, 100}, 8.0));
    l.roads.segments.push_back(road(2, RoadClass::kSecondary, {180, 0}, {180, 50}, 8.0));
    l.lots.push_back(lot_on(0, rect(10, 10, 30, 30), 0));
    l.lots.push_back(lot_on(1, rect(105, 80, 115, 100), 1));

    InfrastructureElement plant;
    plant.id = 0;
    plant.kind = InfrastructureKind::kWaterTreatment;
    plant.polygon = rect(-5, -25, 5, -15);
    plant.anchor = Point{0.0, -20.0};
    l.infrastructure.push_back(plant);

    Entrance gate;
    gate.id = 0;
    gate.point = Point{200.0, 0.0};
    gate.primary = true;
    l.entrances.push_back(gate);
    return l;
}

}  // namespace

TEST_CASE("water follows only the roads that lead to lots") {
    const CandidateLayout l = tee_layout();
    const ParameterSet params;
    const UtilityNetwork water = route_utility(UtilityKind::kWater, l, params);
    CHECK(water.has_plant);
    CHECK(water.source.y == doctest::Approx(-20.0));
    // (0,0) -> (100,0) -> (100,90); the dead end and the spine east of x = 100 stay dry.
    CHECK(water.main_length == doctest::Approx(190.0));
    // Plant lateral 20, lot laterals 20 and 10.
    CHECK(water.service_length == doctest::Approx(50.0));
    CHECK(water.connections == 2);
    CHECK(water.unserved == 0);
    CHECK(water.cost == doctest::Approx(60.0 * 240.0 + 2 * 300.0));
    for (const auto& r : water.runs) {
        if (!r.service) {
            CHECK(r.a.x <= 100.0 + 1e-9);
            CHECK(r.b.x <= 100.0 + 1e-9);
        }
    }
}

TEST_CASE("sewer drains every lot to the entrance when there is no treatment plant") {
    const CandidateLayout l = tee_layout();
    const UtilityNetwork sewer = route_utility(UtilityKind::kSewer, l, ParameterSet{});
    CHECK_FALSE(sewer.has_plant);
    CHECK(sewer.source.x == doctest::Approx(200.0));
    // (20,0) -> (200,0) plus the branch from (100,90) down to the spine.
    CHECK(sewer.main_length == doctest::Approx(270.0));
    CHECK(sewer.service_length == doctest::Approx(30.0));
    CHECK(sewer.connections == 2);
}

TEST_CASE("power spans every road reachable from the source") {
    const CandidateLayout l = tee_layout();
    const UtilityNetwork power = route_utility(UtilityKind::kPower, l, ParameterSet{});
    CHECK(power.main_length == doctest::Approx(350.0));
    CHECK(power.total_length() == doctest::Approx(380.0));
}

TEST_CASE("lots on a detached road are unserved") {
    CandidateLayout l = tee_layout();
    l.roads.segments.push_back(road(7, RoadClass::kSecondary, {300, 300}, {400, 300}, 8.0));
    l.lots.push_back(lot_on(2, rect(340, 310, 360, 330), 7));
    const std::vector<UtilityNetwork> nets = route_utilities(l, ParameterSet{});
    REQUIRE(nets.size() == 3);
    CHECK(nets[0].kind == UtilityKind::kWater);
    CHECK(nets[1].kind == UtilityKind::kSewer);
    CHECK(nets[2].kind == UtilityKind::kPower);
    for (const auto& n : nets) {
        CHECK(n.connections == 2);
        CHECK(n.unserved == 1);
    }
    CHECK(nets[0].main_length == doctest::Approx(190.0));
    CHECK(nets[2].main_length == doctest::Approx(350.0));
}

TEST_CASE("no roads means nothing is served") {
    CandidateLayout l = tee_layout();
    l.roads.segments.clear();
    const UtilityNetwork water = route_utility(UtilityKind::kWater, l, ParameterSet{});
    CHECK(water.runs.empty());
    CHECK(water.unserved == 2);
    CHECK(water.cost == doctest::Approx(0.0));
}

TEST_CASE("decoded layouts carry routed utilities that feed the schedule and the finances") {
    const parkgen_test::Scenario sc;
    const CandidateLayout layout = sc.decode();
    REQUIRE(layout.utilities.size() == 3);
    const double roads = layout.roads.total_length();
    for (const auto& u : layout.utilities) {
        CHECK(u.connections + u.unserved == static_cast<int>(layout.lots.size()));
        CHECK(u.unserved == 0);
        CHECK(u.main_length > 0.0);
        CHECK(u.main_length <= 1.05 * roads);
        CHECK(u.cost > 0.0);
    }
    const UtilityNetwork* water = layout.utility(UtilityKind::kWater);
    const UtilityNetwork* power = layout.utility(UtilityKind::kPower);
    REQUIRE(water != nullptr);
    REQUIRE(power != nullptr);
    bool plant_placed = false;
    for (const auto& e : layout.infrastructure) {
        plant_placed = plant_placed || e.kind == InfrastructureKind::kWaterTreatment;
    }
    CHECK(water->has_plant == plant_placed);
    CHECK(layout.utility_cost() > 0.0);

    for (const auto& p : build_work_packages(layout, sc.params)) {
        if (p.id == "water-network") {
            CHECK(p.quantity == doctest::Approx(water->total_length() / 1000.0));
        }
        if (p.id == "power-conduits") {
            CHECK(p.quantity == doctest::Approx(power->total_length() / 1000.0));
        }
    }

    const LayoutMetrics m = measure_layout(layout, sc.params);
    const ViolationReport rep = evaluate_rules(m, default_rule_set());
    const TimelineResult tl = estimate_timeline(layout, sc.params);
    const ScoreVector base = score_layout(layout, m, rep, tl, sc.params);
    ParameterSet pricey = sc.params;
    pricey.financial.water_pipe_cost_per_m *= 20.0;
    pricey.financial.sewer_pipe_cost_per_m *= 20.0;
    pricey.financial.power_cable_cost_per_m *= 20.0;
    const CandidateLayout costly = decode_layout(sc.context(), Genome{}, pricey);
    const ScoreVector dear = score_layout(costly, m, rep, tl, pricey);
    CHECK(costly.utility_cost() > layout.utility_cost());
    CHECK(dear[ScoreDimension::kFinancial] < base[ScoreDimension::kFinancial]);
}
