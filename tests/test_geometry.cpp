#include <doctest/doctest.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

#include "parkgen/geometry.hpp"
#include "parkgen/spatial_hash_grid.hpp"
#include "test_helpers.hpp"

using namespace parkgen;
using parkgen_test::rect;

TEST_CASE("area and orientation") {
    const Polygon sq = rect(0, 0, 10, 10);
    CHECK(polygon_signed_area(sq) == doctest::Approx(100.0));

    Polygon cw(sq.rbegin(), sq.rend());
    CHECK(polygon_signed_area(cw) == doctest::Approx(-100.0));
    CHECK(polygon_signed_area(ensure_ccw(cw)) == doctest::Approx(100.0));

    const Point c = polygon_centroid(translate_polygon(sq, 1000.0, -50.0));
    CHECK(c.x == doctest::Approx(1005.0));
    CHECK(c.y == doctest::Approx(-45.0));
}

TEST_CASE("strict overlap ignores shared edges") {
    const Polygon a = rect(0, 0, 10, 10);
    CHECK_FALSE(polygons_overlap_strict(a, rect(10, 0, 20, 10)));
    CHECK_FALSE(polygons_overlap_strict(a, rect(10, 10, 20, 20)));
    CHECK(polygons_overlap_strict(a, rect(9, 0, 20, 10)));
    CHECK(polygons_overlap_strict(a, rect(2, 2, 4, 4)));
    CHECK(polygons_overlap_strict(rect(2, 2, 4, 4), a));
    // Cross shape: no vertex of either lies inside the other.
    CHECK(polygons_overlap_strict(rect(0, 4, 10, 6), rect(4, 0, 6, 10)));
}

TEST_CASE("simple polygon test") {
    CHECK(polygon_is_simple(rect(0, 0, 3, 2)));
    const Polygon bowtie{{0, 0}, {2, 2}, {2, 0}, {0, 2}};
    CHECK_FALSE(polygon_is_simple(bowtie));
}

TEST_CASE("clip and split partition area") {
    const Polygon sq = rect(0, 0, 10, 10);
    CHECK(polygon_area(clip_to_box(sq, BoundingBox{2, 2, 5, 5})) == doctest::Approx(9.0));
    CHECK(clip_to_box(sq, BoundingBox{20, 20, 30, 30}).empty());

    const auto halves = split_axis(sq, 0, 4.0);
    CHECK(polygon_area(halves.first) == doctest::Approx(40.0));
    CHECK(polygon_area(halves.second) == doctest::Approx(60.0));
    CHECK(polygon_bbox(halves.first).max_x == doctest::Approx(4.0));

    const Polygon kept = clip_halfplane(sq, 0.0, 1.0, 3.0);
    CHECK(polygon_area(kept) == doctest::Approx(30.0));
}

TEST_CASE("scanline intervals of an L shape") {
    const Polygon ell{{0, 0}, {10, 0}, {10, 4}, {4, 4}, {4, 10}, {0, 10}};
    auto low = scanline_intervals(ell, 1, 2.0);
    REQUIRE(low.size() == 1);
    CHECK(low[0].first == doctest::Approx(0.0));
    CHECK(low[0].second == doctest::Approx(10.0));

    auto high = scanline_intervals(ell, 1, 7.0);
    REQUIRE(high.size() == 1);
    CHECK(high[0].second == doctest::Approx(4.0));

    const Polygon u{{0, 0}, {10, 0}, {10, 10}, {7, 10}, {7, 3}, {3, 3}, {3, 10}, {0, 10}};
    CHECK(scanline_intervals(u, 1, 6.0).size() == 2);
}

TEST_CASE("inward offset") {
    const Polygon in = offset_inward(rect(0, 0, 10, 10), 1.0);
    REQUIRE(in.size() == 4);
    CHECK(polygon_area(in) == doctest::Approx(64.0));
    CHECK(offset_inward(rect(0, 0, 10, 10), 6.0).empty());

    const Polygon ell{{0, 0}, {10, 0}, {10, 4}, {4, 4}, {4, 10}, {0, 10}};
    const Polygon core = offset_inward(ell, 1.0);
    REQUIRE(core.size() == 6);
    CHECK(polygon_area(core) == doctest::Approx(28.0));
    const BoundingBox bb = polygon_bbox(core);
    CHECK(bb.min_x == doctest::Approx(1.0));
    CHECK(bb.max_y == doctest::Approx(9.0));
}

TEST_CASE("inward offset of a site with a narrow notch") {
    // 600 x 400 with a 20 m wide V-notch reaching 100 m in from the south edge.
    const Polygon notched{{0, 0}, {290, 0}, {300, 100}, {310, 0}, {600, 0}, {600, 400}, {0, 400}};
    const Polygon core = offset_inward(notched, 5.0);
    REQUIRE(core.size() >= 3);
    CHECK(polygon_is_simple(core));
    CHECK(polygon_area(core) > 0.9 * polygon_area(notched));
    CHECK(polygon_area(core) < polygon_area(notched));
    for (const auto& p : core) {
        CHECK(point_in_polygon(p, notched));
        CHECK(point_ring_distance(p, notched) >= 5.0 - 1e-6);
    }
    // The cap keeps the band above the notch tip.
    CHECK(point_in_polygon(Point{300.0, 140.0}, core));
}

TEST_CASE("chord cuts only split where the chord overlaps the range") {
    const Polygon u{{0, 0}, {10, 0}, {10, 10}, {7, 10}, {7, 3}, {3, 3}, {3, 10}, {0, 10}};
    const double inf = std::numeric_limits<double>::infinity();

    const auto all = cut_chords(u, 1, 6.0, -inf, inf);
    REQUIRE(all.size() == 3);
    double area = 0.0;
    for (const auto& p : all) {
        CHECK(polygon_is_simple(p));
        area += polygon_area(p);
    }
    CHECK(area == doctest::Approx(polygon_area(u)));

    const auto left = cut_chords(u, 1, 6.0, 0.0, 2.0);
    REQUIRE(left.size() == 2);
    CHECK(std::min(polygon_area(left[0]), polygon_area(left[1])) == doctest::Approx(12.0));
    CHECK(polygon_area(left[0]) + polygon_area(left[1]) == doctest::Approx(polygon_area(u)));

    CHECK(cut_chords(u, 1, 6.0, 4.0, 6.0).size() == 1);
}

TEST_CASE("axis split keeps the components of a non-convex polygon apart") {
    const Polygon u{{0, 0}, {10, 0}, {10, 10}, {7, 10}, {7, 3}, {3, 3}, {3, 10}, {0, 10}};
    const auto parts = split_axis_parts(u, 1, 6.0);
    REQUIRE(parts.first.size() == 1);
    REQUIRE(parts.second.size() == 2);
    CHECK(polygon_area(parts.first[0]) == doctest::Approx(48.0));
    for (const auto& p : parts.second) {
        CHECK(polygon_area(p) == doctest::Approx(12.0));
        CHECK(polygon_bbox(p).min_y == doctest::Approx(6.0));
    }

    const Polygon ell{{0, 0}, {10, 0}, {10, 4}, {4, 4}, {4, 10}, {0, 10}};
    const auto halves = split_axis_parts(ell, 0, 2.0);
    REQUIRE(halves.first.size() == 1);
    REQUIRE(halves.second.size() == 1);
    CHECK(polygon_area(halves.first[0]) + polygon_area(halves.second[0]) == doctest::Approx(polygon_area(ell)));
}

TEST_CASE("distances") {
    CHECK(polygon_distance(rect(0, 0, 1, 1), rect(4, 0, 5, 1)) == doctest::Approx(3.0));
    CHECK(polygon_distance(rect(0, 0, 2, 2), rect(1, 1, 3, 3)) == doctest::Approx(0.0));
    CHECK(point_segment_distance(Point{5, 3}, Point{0, 0}, Point{10, 0}) == doctest::Approx(3.0));
    CHECK(point_ring_distance(Point{5, 4}, rect(0, 0, 10, 10)) == doctest::Approx(4.0));
}

TEST_CASE("minimum area box of a rotated rectangle") {
    const Polygon r = rotate_polygon(rect(0, 0, 20, 10), 30.0);
    const OrientedBox box = min_area_obb(r);
    CHECK(box.length == doctest::Approx(20.0));
    CHECK(box.breadth == doctest::Approx(10.0));
    CHECK(box.angle_deg == doctest::Approx(30.0));
}

TEST_CASE("local frame round trip") {
    const LocalFrame f{Point{120.0, -40.0}, 37.5};
    const Point p{333.25, 17.0};
    const Point back = f.to_world(f.to_local(p));
    CHECK(back.x == doctest::Approx(p.x));
    CHECK(back.y == doctest::Approx(p.y));
    CHECK(polygon_area(f.to_local(rect(0, 0, 30, 20))) == doctest::Approx(600.0));
}

TEST_CASE("convex hull drops interior points") {
    const std::vector<Point> pts{{0, 0}, {4, 0}, {4, 4}, {0, 4}, {2, 2}, {1, 3}};
    const Polygon h = convex_hull(pts);
    CHECK(h.size() == 4);
    CHECK(polygon_area(h) == doctest::Approx(16.0));
}

TEST_CASE("spatial hash grid finds neighbours only") {
    SpatialHashGrid grid(10.0);
    grid.insert(0, BoundingBox{0, 0, 5, 5});
    grid.insert(1, BoundingBox{100, 100, 105, 105});
    grid.insert(2, BoundingBox{4, 4, 12, 12});
    std::vector<int> out;
    grid.query_into(out, BoundingBox{1, 1, 2, 2});
    CHECK(out == std::vector<int>{0, 2});
    CHECK_THROWS_AS(grid.insert(2, BoundingBox{0, 0, 1, 1}), std::runtime_error);

    grid.query_into(out, BoundingBox{90, 90, 95, 95}, 6.0);
    CHECK(out == std::vector<int>{1});
}
