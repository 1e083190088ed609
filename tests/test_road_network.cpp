#include <doctest/doctest.h>

#include <algorithm>
#include <cmath>

#include "parkgen/errors.hpp"
#include "parkgen/road_network.hpp"
#include "test_helpers.hpp"

using namespace parkgen;
using parkgen_test::rect;

namespace {

RoadLayout rectangle_roads(const ParameterSet& params, double depth = 42.0) {
    RoadLayoutInput in;
    in.buildable = rect(0, 0, 490, 390);
    in.lot_depth = depth;
    return generate_road_network(in, params);
}

// 490 x 390 with a 170 m wide slot cut down from the top to y = 150.
Polygon u_shape() {
    return Polygon{{0, 0}, {490, 0}, {490, 390}, {330, 390}, {330, 150}, {160, 150}, {160, 390}, {0, 390}};
}

bool has_x(const std::vector<double>& xs, double x) {
    return std::any_of(xs.begin(), xs.end(), [x](double v) { return std::abs(v - x) < 1e-9; });
}

double partition_area(const RoadLayout& out) {
    double area = out.network.row_area();
    for (const auto& b : out.blocks) {
        area += polygon_area(b.polygon);
    }
    return area;
}

// Frontage lines lie on their own road's right-of-way outline and never run past the road.
void check_frontage_on_row(const RoadNetwork& net) {
    for (const auto& f : net.frontage_lines()) {
        REQUIRE(f.road_id >= 0);
        REQUIRE(static_cast<size_t>(f.road_id) < net.segments.size());
        const RoadSegment& s = net.segments[static_cast<size_t>(f.road_id)];
        CHECK(point_ring_distance(f.a, s.row) < 1e-6);
        CHECK(point_ring_distance(f.b, s.row) < 1e-6);
        const Point mid{0.5 * (f.a.x + f.b.x), 0.5 * (f.a.y + f.b.y)};
        CHECK(point_ring_distance(mid, s.row) < 1e-6);
        const Point& c0 = s.centerline.front();
        const Point& c1 = s.centerline.back();
        CHECK(point_segment_distance(f.a, c0, c1) <= 0.5 * s.width + 1e-6);
        CHECK(point_segment_distance(f.b, c0, c1) <= 0.5 * s.width + 1e-6);
    }
}

}  // namespace

TEST_CASE("spine and secondaries form one network") {
    ParameterSet params;
    const RoadLayout out = rectangle_roads(params);
    const RoadNetwork& net = out.network;

    REQUIRE(!net.segments.empty());
    CHECK(net.segments.front().road_class == RoadClass::kPrimary);
    CHECK(net.segments.front().width == doctest::Approx(params.primary_row_width));
    CHECK(net.length_of(RoadClass::kPrimary) == doctest::Approx(490.0));
    CHECK(net.connected());
    CHECK(net.component_count() == 1);
    CHECK(road_component_count(net.segments) == 1);
    CHECK(net.junctions >= static_cast<int>(net.segments.size()) - 1);
    CHECK(out.spine_y > 0.3 * 390 - 1e-9);
    CHECK(out.spine_y < 0.7 * 390 + 1e-9);

    for (const auto& s : net.segments) {
        if (s.road_class == RoadClass::kSecondary) {
            CHECK(s.width == doctest::Approx(params.secondary_row_width));
            // every secondary branch touches the spine
            CHECK(std::find(s.connections.begin(), s.connections.end(), 0) != s.connections.end());
        }
    }
}

TEST_CASE("blocks and rights-of-way partition the buildable area") {
    ParameterSet params;
    const RoadLayout out = rectangle_roads(params);
    CHECK(partition_area(out) == doctest::Approx(490.0 * 390.0).epsilon(1e-9));
    CHECK(out.blocks.size() == 2 * (out.secondary_x.size() + 1));
    for (size_t i = 1; i < out.blocks.size(); ++i) {
        CHECK(out.blocks[i].order > out.blocks[i - 1].order);
    }
}

TEST_CASE("forced secondary passes through the entrance position") {
    ParameterSet params;
    RoadLayoutInput in;
    in.buildable = rect(0, 0, 490, 390);
    in.lot_depth = 42.0;
    in.forced_secondaries = {Point{201.5, 0.0}};
    const RoadLayout out = generate_road_network(in, params);
    const double spacing = 2.0 * 42.0 + params.secondary_row_width;
    CHECK(has_x(out.secondary_x, 201.5));
    CHECK(has_x(out.secondary_x, 201.5 - spacing));
    CHECK(has_x(out.secondary_x, 201.5 + spacing));
    CHECK(out.network.connected());
    CHECK(out.network.coverage >= params.roads.coverage_target);
}

TEST_CASE("pruning keeps coverage at or above the target") {
    ParameterSet params;
    params.roads.max_road_distance = 200.0;
    const RoadLayout pruned = rectangle_roads(params);
    params.roads.prune = false;
    const RoadLayout full = rectangle_roads(params);

    CHECK(pruned.network.segments.size() <= full.network.segments.size());
    CHECK(pruned.network.total_length() <= full.network.total_length() + 1e-9);
    CHECK(full.network.coverage >= params.roads.coverage_target);
    CHECK(pruned.network.coverage >= params.roads.coverage_target);
    const double measured = road_coverage(rect(0, 0, 490, 390), pruned.network.segments, 200.0);
    CHECK(measured == doctest::Approx(pruned.network.coverage));
}

TEST_CASE("default reach keeps every part of the site near a road") {
    ParameterSet params;
    const RoadLayout out = rectangle_roads(params);
    CHECK(out.max_road_distance == doctest::Approx(1.05 * 42.0));
    CHECK(out.network.coverage >= params.roads.coverage_target);
    // The regular pattern leaves 47 m strips at both site edges, wider than the reach.
    const double measured = road_coverage(rect(0, 0, 490, 390), out.network.segments, out.max_road_distance);
    CHECK(measured >= params.roads.coverage_target);
}

TEST_CASE("frontage lines run along right-of-way edges") {
    ParameterSet params;
    const RoadLayout out = rectangle_roads(params);
    const auto& lines = out.network.frontage_lines();
    REQUIRE(lines.size() >= 2);
    double spine_frontage = 0.0;
    for (const auto& f : lines) {
        if (f.road_id != 0) {
            continue;
        }
        const bool below = std::abs(f.a.y - (out.spine_y - 0.5 * params.primary_row_width)) < 1e-6;
        const bool above = std::abs(f.a.y - (out.spine_y + 0.5 * params.primary_row_width)) < 1e-6;
        CHECK((below || above));
        CHECK(f.b.y == doctest::Approx(f.a.y));
        CHECK(std::min(f.a.x, f.b.x) >= -1e-9);
        CHECK(std::max(f.a.x, f.b.x) <= 490.0 + 1e-9);
        spine_frontage += distance(f.a, f.b);
    }
    CHECK(spine_frontage == doctest::Approx(2.0 * 490.0));
    check_frontage_on_row(out.network);

    for (const auto& b : out.blocks) {
        const FrontageMeasure fm = measure_frontage(b.polygon, lines);
        CHECK(fm.length > 0.0);
    }
}

TEST_CASE("U-shaped site gets clipped frontage and one network") {
    ParameterSet params;
    RoadLayoutInput in;
    in.buildable = u_shape();
    in.lot_depth = 42.0;
    const RoadLayout out = generate_road_network(in, params);
    const RoadNetwork& net = out.network;

    CHECK(net.connected());
    CHECK(road_component_count(net.segments) == 1);
    CHECK(partition_area(out) == doctest::Approx(polygon_area(u_shape())).epsilon(1e-9));
    CHECK(net.coverage >= params.roads.coverage_target);
    check_frontage_on_row(net);

    for (const auto& s : net.segments) {
        // Rights-of-way stay inside the site, so none of them crosses the slot.
        for (const auto& p : s.row) {
            CHECK((point_in_polygon(p, u_shape()) || point_ring_distance(p, u_shape()) < 1e-6));
        }
        CHECK_FALSE(polygons_overlap_strict(s.row, rect(160, 150, 330, 390), 1e-6));
    }
    for (const auto& b : out.blocks) {
        const FrontageMeasure fm = measure_frontage(b.polygon, net.frontage_lines());
        if (fm.length > 0.0) {
            REQUIRE(fm.road_id >= 0);
            CHECK(static_cast<size_t>(fm.road_id) < net.segments.size());
        }
    }
}

TEST_CASE("empty buildable region is infeasible") {
    ParameterSet params;
    RoadLayoutInput in;
    in.lot_depth = 40.0;
    CHECK_THROWS_AS(generate_road_network(in, params), InfeasibleGeometry);
}
