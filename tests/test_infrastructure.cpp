#include <doctest/doctest.h>

#include "parkgen/infrastructure_placer.hpp"
#include "parkgen/road_network.hpp"
#include "test_helpers.hpp"

using namespace parkgen;
using parkgen_test::rect;

namespace {

struct Fixture {
    ParameterSet params;
    RoadLayout roads;
    Polygon buildable = rect(0, 0, 490, 390);

    Fixture() {
        params.terrain.grad_y = 0.01;  // rises to the north
        RoadLayoutInput in;
        in.buildable = buildable;
        in.lot_depth = 42.0;
        roads = generate_road_network(in, params);
    }

    InfrastructurePlacement place() const {
        return place_infrastructure(roads.blocks, buildable, roads.network, LocalFrame{}, 500.0 * 400.0, params);
    }
};

}  // namespace

TEST_CASE("default utilities are placed at their required size") {
    Fixture f;
    const InfrastructurePlacement out = f.place();
    CHECK(out.elements.size() + out.issues.size() == f.params.infrastructure.size());
    CHECK(out.issues.empty());
    for (const auto& e : out.elements) {
        double need = 0.0;
        for (const auto& req : f.params.infrastructure) {
            if (req.kind == e.kind) {
                need = required_area(req, 500.0 * 400.0);
            }
        }
        CHECK(polygon_area(e.polygon) == doctest::Approx(need).epsilon(0.01));
        CHECK(e.adjacency_met);
    }
}

TEST_CASE("detention pond sits low and on the boundary") {
    Fixture f;
    const InfrastructurePlacement out = f.place();
    bool seen = false;
    for (const auto& e : out.elements) {
        if (e.kind != InfrastructureKind::kDetentionPond) {
            continue;
        }
        seen = true;
        CHECK(e.anchor.y < f.roads.spine_y);
        CHECK(polygon_bbox(e.polygon).min_y == doctest::Approx(0.0));
    }
    CHECK(seen);
}

TEST_CASE("elements leave the remaining blocks untouched") {
    Fixture f;
    const InfrastructurePlacement out = f.place();
    double total = 0.0;
    for (const auto& b : f.roads.blocks) {
        total += polygon_area(b.polygon);
    }
    double used = 0.0;
    for (const auto& e : out.elements) {
        used += polygon_area(e.polygon);
        for (const auto& b : out.remaining) {
            CHECK_FALSE(polygons_overlap_strict(e.polygon, b.polygon, 1e-6));
        }
    }
    for (const auto& s : out.open_spaces) {
        used += polygon_area(s.polygon);
    }
    for (const auto& b : out.remaining) {
        used += polygon_area(b.polygon);
    }
    CHECK(used == doctest::Approx(total).epsilon(1e-9));
}

TEST_CASE("oversized requirement is reported, not fatal") {
    Fixture f;
    InfrastructureRequirement huge;
    huge.kind = InfrastructureKind::kSubstation;
    huge.area = 150000.0;
    huge.priority = 9;
    f.params.infrastructure.push_back(huge);
    const InfrastructurePlacement out = f.place();
    REQUIRE(!out.issues.empty());
    CHECK(out.issues.back().kind == ErrorKind::kPlacementInfeasible);
    CHECK(out.elements.size() == f.params.infrastructure.size() - 1);
}
