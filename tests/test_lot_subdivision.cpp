#include <doctest/doctest.h>

#include "parkgen/lot_subdivision.hpp"
#include "parkgen/road_network.hpp"
#include "test_helpers.hpp"

using namespace parkgen;
using parkgen_test::rect;

namespace {

RoadLayout sample_roads(const ParameterSet& params) {
    RoadLayoutInput in;
    in.buildable = rect(0, 0, 490, 390);
    in.lot_depth = 42.0;
    return generate_road_network(in, params);
}

}  // namespace

TEST_CASE("lots and residuals cover every block") {
    ParameterSet params;
    const RoadLayout roads = sample_roads(params);
    const SubdivisionResult res = subdivide_blocks(roads.blocks, roads.network.frontage, params, 1200.0, 42);

    double block_area = 0.0;
    for (const auto& b : roads.blocks) {
        block_area += polygon_area(b.polygon);
    }
    double used = 0.0;
    for (const auto& lot : res.lots) {
        used += polygon_area(lot.polygon);
    }
    for (const auto& r : res.residuals) {
        used += polygon_area(r.polygon);
    }
    CHECK(used == doctest::Approx(block_area).epsilon(1e-9));
    CHECK(res.lots.size() > 60);
}

TEST_CASE("every lot fronts a road and respects the size and shape bounds") {
    ParameterSet params;
    const RoadLayout roads = sample_roads(params);
    const SubdivisionResult res = subdivide_blocks(roads.blocks, roads.network.frontage, params, 1200.0, 7);
    REQUIRE(!res.lots.empty());
    for (size_t i = 0; i < res.lots.size(); ++i) {
        const Lot& lot = res.lots[i];
        CHECK(lot.id == static_cast<int>(i));
        CHECK(lot.area == doctest::Approx(polygon_area(lot.polygon)));
        CHECK(lot.area >= params.lot_area_min - 1e-6);
        if (lot.relaxed) {
            CHECK(lot.area <= params.subdivision.relax_factor * params.lot_area_max + 1e-6);
        } else {
            CHECK(lot.area <= params.lot_area_max + 1e-6);
            CHECK(lot_aspect_ratio(lot.polygon) <= params.subdivision.max_aspect + 1e-9);
        }
        CHECK(lot.frontage >= params.subdivision.min_frontage - 1e-6);
        CHECK(lot.access_road >= 0);
        CHECK(lot.use == params.industry);
    }
    for (size_t i = 0; i < res.lots.size(); ++i) {
        for (size_t j = i + 1; j < res.lots.size(); ++j) {
            CHECK_FALSE(polygons_overlap_strict(res.lots[i].polygon, res.lots[j].polygon, 1e-6));
        }
    }
}

TEST_CASE("residual land could never hold a lot") {
    ParameterSet params;
    const RoadLayout roads = sample_roads(params);
    const SubdivisionResult res = subdivide_blocks(roads.blocks, roads.network.frontage, params, 1200.0, 11);
    for (const auto& r : res.residuals) {
        const double a = polygon_area(r.polygon);
        const double fr = measure_frontage(r.polygon, roads.network.frontage).length;
        CHECK((a < params.lot_area_min || fr < params.subdivision.min_frontage));
        CHECK(r.kind == OpenSpaceKind::kResidual);
    }
}

TEST_CASE("land behind a short road stub becomes open space, never a lot without access") {
    ParameterSet params;
    // 200 x 100 block touching a road only along its first 30 m.
    const std::vector<Block> blocks{Block{rect(0, 0, 200, 100), 0}};
    const std::vector<FrontageLine> stub{FrontageLine{Point{0, 0}, Point{30, 0}, 3}};
    const SubdivisionResult res = subdivide_blocks(blocks, stub, params, 1200.0, 5);

    REQUIRE(!res.lots.empty());
    double used = 0.0;
    for (const auto& lot : res.lots) {
        CHECK(lot.access_road == 3);
        CHECK(lot.frontage >= params.subdivision.min_frontage - 1e-6);
        CHECK(lot.area >= params.lot_area_min - 1e-6);
        used += lot.area;
    }
    for (const auto& r : res.residuals) {
        const double a = polygon_area(r.polygon);
        CHECK((a < params.lot_area_min || measure_frontage(r.polygon, stub).length < params.subdivision.min_frontage));
        used += a;
    }
    CHECK(used == doctest::Approx(200.0 * 100.0));
}

TEST_CASE("same seed gives the same lots") {
    ParameterSet params;
    const RoadLayout roads = sample_roads(params);
    const auto a = subdivide_blocks(roads.blocks, roads.network.frontage, params, 1200.0, 99);
    const auto b = subdivide_blocks(roads.blocks, roads.network.frontage, params, 1200.0, 99);
    REQUIRE(a.lots.size() == b.lots.size());
    for (size_t i = 0; i < a.lots.size(); ++i) {
        CHECK(parkgen_test::same_polygon(a.lots[i].polygon, b.lots[i].polygon));
    }
}

TEST_CASE("aspect ratio of rectangles") {
    CHECK(lot_aspect_ratio(rect(0, 0, 30, 40)) == doctest::Approx(40.0 / 30.0));
    CHECK(lot_aspect_ratio(rotate_polygon(rect(0, 0, 10, 50), 45.0)) == doctest::Approx(5.0));
}
