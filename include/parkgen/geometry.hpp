#pragma once

#include <cstdint>
#include <utility>
#include <vector>

namespace parkgen {

struct Point {
    double x = 0.0;
    double y = 0.0;
};

// Closed ring; the closing edge back to front() is implicit.
using Polygon = std::vector<Point>;
// Open chain of points.
using Polyline = std::vector<Point>;

struct BoundingBox {
    double min_x = 0.0;
    double min_y = 0.0;
    double max_x = 0.0;
    double max_y = 0.0;

    double width() const { return max_x - min_x; }
    double height() const { return max_y - min_y; }
    double area() const { return width() * height(); }
    Point center() const { return Point{0.5 * (min_x + max_x), 0.5 * (min_y + max_y)}; }
};

// Interval [lo, hi] on a scan line.
using Interval = std::pair<double, double>;

double polygon_signed_area(const Polygon& poly);
double polygon_area(const Polygon& poly);
Polygon ensure_ccw(Polygon poly);
BoundingBox polygon_bbox(const Polygon& poly);
Point polygon_centroid(const Polygon& poly);
double polyline_length(const Polyline& line);

Point rotate_point(const Point& p, double deg);
Polygon rotate_polygon(const Polygon& poly, double deg);
Polygon translate_polygon(const Polygon& poly, double dx, double dy);

double orient(const Point& a, const Point& b, const Point& c);
double distance(const Point& a, const Point& b);

Polygon convex_hull(std::vector<Point> pts, double eps = 1e-12);

bool segments_intersect(const Point& a, const Point& b, const Point& c, const Point& d, double eps = 1e-12);
bool point_in_polygon(const Point& p, const Polygon& poly, double eps = 1e-12);
bool polygons_intersect(const Polygon& poly_a, const Polygon& poly_b, double eps = 1e-12);

// Returns true only when polygons overlap with positive area (touching at boundary is NOT considered overlap).
bool polygons_overlap_strict(const Polygon& poly_a, const Polygon& poly_b, double eps = 1e-9);

// No two non-adjacent edges touch and no adjacent edges fold back on each other.
bool polygon_is_simple(const Polygon& poly, double eps = 1e-9);

double point_segment_distance(const Point& p, const Point& a, const Point& b);
// Minimum distance between two polygons (0 when they touch or overlap).
double polygon_distance(const Polygon& a, const Polygon& b);
// Minimum distance from p to the polygon outline.
double point_ring_distance(const Point& p, const Polygon& poly);

// Drops repeated vertices and vertices lying on the segment between their neighbours.
Polygon remove_degenerate(Polygon poly, double eps = 1e-9);

// Sutherland-Hodgman against the half-plane nx*x + ny*y <= c.
Polygon clip_halfplane(const Polygon& subject, double nx, double ny, double c);
// Clips against the axis-aligned box; the subject may be non-convex.
Polygon clip_to_box(const Polygon& subject, const BoundingBox& box);
// Splits at x = c (axis 0) or y = c (axis 1); first = lower side, second = upper side.
std::pair<Polygon, Polygon> split_axis(const Polygon& poly, int axis, double c);

// Intervals of the horizontal line y = const (axis 1) or vertical line x = const (axis 0)
// lying inside the polygon, sorted ascending.
std::vector<Interval> scanline_intervals(const Polygon& poly, int axis, double c);

// Cuts a simple polygon along every chord of the line x = c (axis 0) or y = c (axis 1) that
// overlaps [lo, hi] on the line. Each piece is simple; pieces keep the input's total area.
std::vector<Polygon> cut_chords(const Polygon& poly, int axis, double c, double lo, double hi);
// Like split_axis, but a non-convex polygon comes back as its separate simple components.
std::pair<std::vector<Polygon>, std::vector<Polygon>> split_axis_parts(const Polygon& poly, int axis, double c);

// Inward offset of a CCW polygon. Convex corners are mitred; reflex corners whose mitre
// would exceed twice the offset get a square cap at distance d. Edges that vanish under the
// offset are collapsed and a ring that still crosses itself is reduced to its largest simple
// loop. Returns an empty polygon only when no area remains.
Polygon offset_inward(const Polygon& poly, double d, double eps = 1e-9);

struct OrientedBox {
    double angle_deg = 0.0;  // direction of the long side
    double length = 0.0;
    double breadth = 0.0;
    Point center;
};

// Minimum-area enclosing rectangle (edge directions of the convex hull).
OrientedBox min_area_obb(const Polygon& poly);

// Rotation + translation that maps world coordinates into a site-aligned frame.
struct LocalFrame {
    Point origin;
    double angle_deg = 0.0;

    Point to_local(const Point& p) const;
    Point to_world(const Point& p) const;
    Polygon to_local(const Polygon& poly) const;
    Polygon to_world(const Polygon& poly) const;
};

}  // namespace parkgen
