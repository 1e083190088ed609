#include "parkgen/geometry.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace parkgen {

double polygon_signed_area(const Polygon& poly) {
    if (poly.size() < 3) {
        return 0.0;
    }
    double acc = 0.0;
    for (size_t i = 0; i < poly.size(); ++i) {
        const auto& a = poly[i];
        const auto& b = poly[(i + 1) % poly.size()];
        acc += a.x * b.y - a.y * b.x;
    }
    return acc * 0.5;
}

double polygon_area(const Polygon& poly) {
    return std::abs(polygon_signed_area(poly));
}

Polygon ensure_ccw(Polygon poly) {
    if (polygon_signed_area(poly) < 0.0) {
        std::reverse(poly.begin(), poly.end());
    }
    return poly;
}

BoundingBox polygon_bbox(const Polygon& poly) {
    if (poly.empty()) {
        return BoundingBox{};
    }

    double min_x = std::numeric_limits<double>::infinity();
    double min_y = std::numeric_limits<double>::infinity();
    double max_x = -std::numeric_limits<double>::infinity();
    double max_y = -std::numeric_limits<double>::infinity();

    for (const auto& p : poly) {
        min_x = std::min(min_x, p.x);
        min_y = std::min(min_y, p.y);
        max_x = std::max(max_x, p.x);
        max_y = std::max(max_y, p.y);
    }
    return BoundingBox{min_x, min_y, max_x, max_y};
}

Point polygon_centroid(const Polygon& poly) {
    if (poly.empty()) {
        return Point{};
    }
    const double a = polygon_signed_area(poly);
    if (std::abs(a) < 1e-12) {
        Point acc;
        for (const auto& p : poly) {
            acc.x += p.x;
            acc.y += p.y;
        }
        const double n = static_cast<double>(poly.size());
        return Point{acc.x / n, acc.y / n};
    }
    // Shift to the first vertex to keep the products small for projected coordinates.
    const Point o = poly.front();
    double cx = 0.0;
    double cy = 0.0;
    for (size_t i = 0; i < poly.size(); ++i) {
        const Point p{poly[i].x - o.x, poly[i].y - o.y};
        const Point q{poly[(i + 1) % poly.size()].x - o.x, poly[(i + 1) % poly.size()].y - o.y};
        const double cr = p.x * q.y - q.x * p.y;
        cx += (p.x + q.x) * cr;
        cy += (p.y + q.y) * cr;
    }
    return Point{o.x + cx / (6.0 * a), o.y + cy / (6.0 * a)};
}

double polyline_length(const Polyline& line) {
    double acc = 0.0;
    for (size_t i = 1; i < line.size(); ++i) {
        acc += distance(line[i - 1], line[i]);
    }
    return acc;
}

Point rotate_point(const Point& p, double deg) {
    const double rad = deg * (3.14159265358979323846 / 180.0);
    const double c = std::cos(rad);
    const double s = std::sin(rad);
    return Point{c * p.x - s * p.y, s * p.x + c * p.y};
}

Polygon rotate_polygon(const Polygon& poly, double deg) {
    Polygon out;
    out.reserve(poly.size());
    for (const auto& p : poly) {
        out.push_back(rotate_point(p, deg));
    }
    return out;
}

Polygon translate_polygon(const Polygon& poly, double dx, double dy) {
    Polygon out;
    out.reserve(poly.size());
    for (const auto& p : poly) {
        out.push_back(Point{p.x + dx, p.y + dy});
    }
    return out;
}

static long double orient_ld(const Point& a, const Point& b, const Point& c) {
    const long double bax = static_cast<long double>(b.x) - static_cast<long double>(a.x);
    const long double bay = static_cast<long double>(b.y) - static_cast<long double>(a.y);
    const long double cax = static_cast<long double>(c.x) - static_cast<long double>(a.x);
    const long double cay = static_cast<long double>(c.y) - static_cast<long double>(a.y);
    return bax * cay - bay * cax;
}

double orient(const Point& a, const Point& b, const Point& c) {
    return static_cast<double>(orient_ld(a, b, c));
}

double distance(const Point& a, const Point& b) {
    return std::hypot(b.x - a.x, b.y - a.y);
}

Polygon convex_hull(std::vector<Point> pts, double eps) {
    if (pts.size() <= 1) {
        return pts;
    }

    std::sort(pts.begin(), pts.end(), [](const Point& a, const Point& b) {
        if (a.x != b.x) {
            return a.x < b.x;
        }
        return a.y < b.y;
    });

    auto nearly_eq = [&](const Point& a, const Point& b) {
        return std::abs(a.x - b.x) <= eps && std::abs(a.y - b.y) <= eps;
    };
    pts.erase(std::unique(pts.begin(), pts.end(), nearly_eq), pts.end());

    if (pts.size() <= 1) {
        return pts;
    }

    std::vector<Point> lower;
    for (const auto& p : pts) {
        while (lower.size() >= 2 &&
               orient_ld(lower[lower.size() - 2], lower.back(), p) <= static_cast<long double>(eps)) {
            lower.pop_back();
        }
        lower.push_back(p);
    }

    std::vector<Point> upper;
    for (size_t i = pts.size(); i-- > 0;) {
        const auto& p = pts[i];
        while (upper.size() >= 2 &&
               orient_ld(upper[upper.size() - 2], upper.back(), p) <= static_cast<long double>(eps)) {
            upper.pop_back();
        }
        upper.push_back(p);
    }

    lower.pop_back();
    upper.pop_back();
    lower.insert(lower.end(), upper.begin(), upper.end());
    return lower;  // CCW
}

static bool on_segment(const Point& a, const Point& b, const Point& p, double eps) {
    return (std::min(a.x, b.x) - eps <= p.x && p.x <= std::max(a.x, b.x) + eps &&
            std::min(a.y, b.y) - eps <= p.y && p.y <= std::max(a.y, b.y) + eps &&
            std::abs(orient_ld(a, b, p)) <= static_cast<long double>(eps));
}

bool segments_intersect(const Point& a, const Point& b, const Point& c, const Point& d, double eps) {
    const long double o1 = orient_ld(a, b, c);
    const long double o2 = orient_ld(a, b, d);
    const long double o3 = orient_ld(c, d, a);
    const long double o4 = orient_ld(c, d, b);
    const long double e = static_cast<long double>(eps);

    const bool ab_straddles = (o1 > e && o2 < -e) || (o1 < -e && o2 > e);
    const bool cd_straddles = (o3 > e && o4 < -e) || (o3 < -e && o4 > e);
    if (ab_straddles && cd_straddles) {
        return true;
    }

    if (std::abs(o1) <= e && on_segment(a, b, c, eps)) {
        return true;
    }
    if (std::abs(o2) <= e && on_segment(a, b, d, eps)) {
        return true;
    }
    if (std::abs(o3) <= e && on_segment(c, d, a, eps)) {
        return true;
    }
    if (std::abs(o4) <= e && on_segment(c, d, b, eps)) {
        return true;
    }

    return false;
}

static bool segments_intersect_proper(const Point& a, const Point& b, const Point& c, const Point& d, double eps) {
    const long double o1 = orient_ld(a, b, c);
    const long double o2 = orient_ld(a, b, d);
    const long double o3 = orient_ld(c, d, a);
    const long double o4 = orient_ld(c, d, b);
    const long double e = static_cast<long double>(eps);

    const bool ab_straddles = (o1 > e && o2 < -e) || (o1 < -e && o2 > e);
    const bool cd_straddles = (o3 > e && o4 < -e) || (o3 < -e && o4 > e);
    return ab_straddles && cd_straddles;
}

static bool point_strictly_inside_polygon(const Point& p, const Polygon& poly, double eps) {
    if (poly.size() < 3) {
        return false;
    }

    for (size_t i = 0; i < poly.size(); ++i) {
        const auto& a = poly[i];
        const auto& b = poly[(i + 1) % poly.size()];
        if (on_segment(a, b, p, eps)) {
            return false;  // boundary is not "inside" for strict overlap checks
        }
    }

    bool inside = false;
    for (size_t i = 0; i < poly.size(); ++i) {
        const auto& a = poly[i];
        const auto& b = poly[(i + 1) % poly.size()];

        const bool ay = (a.y > p.y);
        const bool by = (b.y > p.y);
        if (ay != by) {
            const double x_int = (b.x - a.x) * (p.y - a.y) / (b.y - a.y) + a.x;
            if (x_int > p.x + eps) {
                inside = !inside;
            }
        }
    }
    return inside;
}

bool point_in_polygon(const Point& p, const Polygon& poly, double eps) {
    if (poly.size() < 3) {
        return false;
    }

    bool inside = false;
    for (size_t i = 0; i < poly.size(); ++i) {
        const auto& a = poly[i];
        const auto& b = poly[(i + 1) % poly.size()];

        if (on_segment(a, b, p, eps)) {
            return true;
        }

        const bool ay = (a.y > p.y);
        const bool by = (b.y > p.y);
        if (ay != by) {
            const double x_int = (b.x - a.x) * (p.y - a.y) / (b.y - a.y) + a.x;
            if (x_int > p.x + eps) {
                inside = !inside;
            }
        }
    }
    return inside;
}

static bool bboxes_disjoint(const Polygon& poly_a, const Polygon& poly_b, double eps) {
    const BoundingBox bb_a = polygon_bbox(poly_a);
    const BoundingBox bb_b = polygon_bbox(poly_b);
    return bb_a.max_x < bb_b.min_x - eps || bb_b.max_x < bb_a.min_x - eps ||
           bb_a.max_y < bb_b.min_y - eps || bb_b.max_y < bb_a.min_y - eps;
}

bool polygons_intersect(const Polygon& poly_a, const Polygon& poly_b, double eps) {
    if (poly_a.empty() || poly_b.empty()) {
        return false;
    }
    if (bboxes_disjoint(poly_a, poly_b, eps)) {
        return false;
    }

    for (size_t i = 0; i < poly_a.size(); ++i) {
        const auto& a1 = poly_a[i];
        const auto& a2 = poly_a[(i + 1) % poly_a.size()];
        for (size_t j = 0; j < poly_b.size(); ++j) {
            const auto& b1 = poly_b[j];
            const auto& b2 = poly_b[(j + 1) % poly_b.size()];
            if (segments_intersect(a1, a2, b1, b2, eps)) {
                return true;
            }
        }
    }

    if (point_in_polygon(poly_a[0], poly_b, eps)) {
        return true;
    }
    if (point_in_polygon(poly_b[0], poly_a, eps)) {
        return true;
    }
    return false;
}

bool polygons_overlap_strict(const Polygon& poly_a, const Polygon& poly_b, double eps) {
    if (poly_a.size() < 3 || poly_b.size() < 3) {
        return false;
    }
    if (bboxes_disjoint(poly_a, poly_b, eps)) {
        return false;
    }

    for (size_t i = 0; i < poly_a.size(); ++i) {
        const auto& a1 = poly_a[i];
        const auto& a2 = poly_a[(i + 1) % poly_a.size()];
        for (size_t j = 0; j < poly_b.size(); ++j) {
            const auto& b1 = poly_b[j];
            const auto& b2 = poly_b[(j + 1) % poly_b.size()];
            if (segments_intersect_proper(a1, a2, b1, b2, eps)) {
                return true;
            }
        }
    }

    // Strict containment (not counting boundary as overlap). Vertices alone miss
    // congruent or edge-sharing nested rings, so edge midpoints and centroids are tested too.
    auto any_inside = [&](const Polygon& src, const Polygon& dst) {
        for (size_t i = 0; i < src.size(); ++i) {
            const auto& a = src[i];
            const auto& b = src[(i + 1) % src.size()];
            if (point_strictly_inside_polygon(a, dst, eps)) {
                return true;
            }
            if (point_strictly_inside_polygon(Point{0.5 * (a.x + b.x), 0.5 * (a.y + b.y)}, dst, eps)) {
                return true;
            }
        }
        const Point c = polygon_centroid(src);
        return point_in_polygon(c, src, eps) && point_strictly_inside_polygon(c, dst, eps);
    };
    return any_inside(poly_a, poly_b) || any_inside(poly_b, poly_a);
}

bool polygon_is_simple(const Polygon& poly, double eps) {
    const size_t n = poly.size();
    if (n < 3) {
        return false;
    }
    for (size_t i = 0; i < n; ++i) {
        const auto& a1 = poly[i];
        const auto& a2 = poly[(i + 1) % n];
        if (distance(a1, a2) <= eps) {
            return false;
        }
        // Adjacent edge folding back onto this one.
        const auto& a3 = poly[(i + 2) % n];
        if (std::abs(orient_ld(a1, a2, a3)) <= static_cast<long double>(eps)) {
            const double dot = (a2.x - a1.x) * (a3.x - a2.x) + (a2.y - a1.y) * (a3.y - a2.y);
            if (dot < 0.0) {
                return false;
            }
        }
        for (size_t j = i + 2; j < n; ++j) {
            if (i == 0 && j == n - 1) {
                continue;
            }
            if (segments_intersect(a1, a2, poly[j], poly[(j + 1) % n], eps)) {
                return false;
            }
        }
    }
    return true;
}

double point_segment_distance(const Point& p, const Point& a, const Point& b) {
    const double vx = b.x - a.x;
    const double vy = b.y - a.y;
    const double wx = p.x - a.x;
    const double wy = p.y - a.y;
    const double vv = vx * vx + vy * vy;
    if (!(vv > 0.0)) {
        return std::hypot(wx, wy);
    }
    const double t = std::clamp((wx * vx + wy * vy) / vv, 0.0, 1.0);
    return std::hypot(p.x - (a.x + t * vx), p.y - (a.y + t * vy));
}

double point_ring_distance(const Point& p, const Polygon& poly) {
    double best = std::numeric_limits<double>::infinity();
    for (size_t i = 0; i < poly.size(); ++i) {
        best = std::min(best, point_segment_distance(p, poly[i], poly[(i + 1) % poly.size()]));
    }
    return best;
}

double polygon_distance(const Polygon& a, const Polygon& b) {
    if (a.empty() || b.empty()) {
        return std::numeric_limits<double>::infinity();
    }
    if (polygons_intersect(a, b, 1e-9)) {
        return 0.0;
    }
    double best = std::numeric_limits<double>::infinity();
    for (const auto& p : a) {
        best = std::min(best, point_ring_distance(p, b));
    }
    for (const auto& p : b) {
        best = std::min(best, point_ring_distance(p, a));
    }
    return best;
}

Polygon remove_degenerate(Polygon poly, double eps) {
    bool changed = true;
    while (changed && poly.size() >= 3) {
        changed = false;
        for (size_t i = 0; i < poly.size() && poly.size() >= 3; ++i) {
            const size_t n = poly.size();
            const Point& prev = poly[(i + n - 1) % n];
            const Point& cur = poly[i];
            const Point& next = poly[(i + 1) % n];
            const double la = distance(prev, cur);
            const double lb = distance(cur, next);
            const bool duplicate = la <= eps;
            const bool collinear = std::abs(orient(prev, cur, next)) <= eps * std::max(1.0, la * lb);
            if (duplicate || collinear) {
                poly.erase(poly.begin() + static_cast<std::ptrdiff_t>(i));
                changed = true;
                break;
            }
        }
    }
    if (poly.size() < 3) {
        return {};
    }
    return poly;
}

namespace {

template <typename Side, typename Cross>
Polygon clip_generic(const Polygon& subject, Side side, Cross cross) {
    Polygon out;
    if (subject.size() < 3) {
        return out;
    }
    out.reserve(subject.size() + 4);
    for (size_t i = 0; i < subject.size(); ++i) {
        const Point& cur = subject[i];
        const Point& prev = subject[(i + subject.size() - 1) % subject.size()];
        const double fc = side(cur);
        const double fp = side(prev);
        if (fc <= 0.0) {
            if (fp > 0.0) {
                out.push_back(cross(prev, cur, fp, fc));
            }
            out.push_back(cur);
        } else if (fp <= 0.0) {
            out.push_back(cross(prev, cur, fp, fc));
        }
    }
    return out;
}

Point lerp_cross(const Point& a, const Point& b, double fa, double fb) {
    const double t = fa / (fa - fb);
    return Point{a.x + t * (b.x - a.x), a.y + t * (b.y - a.y)};
}

// keep_upper == false keeps coord <= c, otherwise coord >= c. Crossing points snap onto the cut.
Polygon clip_axis(const Polygon& subject, int axis, double c, bool keep_upper) {
    const double sign = keep_upper ? -1.0 : 1.0;
    auto side = [&](const Point& p) { return sign * ((axis == 0 ? p.x : p.y) - c); };
    auto cross = [&](const Point& a, const Point& b, double fa, double fb) {
        Point p = lerp_cross(a, b, fa, fb);
        if (axis == 0) {
            p.x = c;
        } else {
            p.y = c;
        }
        return p;
    };
    return clip_generic(subject, side, cross);
}

}  // namespace

Polygon clip_halfplane(const Polygon& subject, double nx, double ny, double c) {
    auto side = [&](const Point& p) { return nx * p.x + ny * p.y - c; };
    return clip_generic(subject, side, lerp_cross);
}

Polygon clip_to_box(const Polygon& subject, const BoundingBox& box) {
    Polygon out = clip_axis(subject, 0, box.min_x, true);
    out = clip_axis(out, 0, box.max_x, false);
    out = clip_axis(out, 1, box.min_y, true);
    out = clip_axis(out, 1, box.max_y, false);
    return remove_degenerate(std::move(out));
}

std::pair<Polygon, Polygon> split_axis(const Polygon& poly, int axis, double c) {
    if (axis != 0 && axis != 1) {
        throw std::invalid_argument("split_axis: axis must be 0 or 1");
    }
    Polygon lower = remove_degenerate(clip_axis(poly, axis, c, false));
    Polygon upper = remove_degenerate(clip_axis(poly, axis, c, true));
    return {std::move(lower), std::move(upper)};
}

namespace {

struct Crossing {
    double value = 0.0;
    size_t edge = 0;
};

// Crossings of the line with the ring, half-open in the scan coordinate so that a vertex on the
// line is counted once. Sorted by position along the line.
std::vector<Crossing> line_crossings(const Polygon& poly, int axis, double c) {
    std::vector<Crossing> out;
    for (size_t i = 0; i < poly.size(); ++i) {
        const Point& a = poly[i];
        const Point& b = poly[(i + 1) % poly.size()];
        const double ua = (axis == 1) ? a.y : a.x;
        const double ub = (axis == 1) ? b.y : b.x;
        const double va = (axis == 1) ? a.x : a.y;
        const double vb = (axis == 1) ? b.x : b.y;
        if ((ua > c) != (ub > c)) {
            out.push_back(Crossing{va + (c - ua) * (vb - va) / (ub - ua), i});
        }
    }
    std::sort(out.begin(), out.end(), [](const Crossing& l, const Crossing& r) {
        if (l.value != r.value) {
            return l.value < r.value;
        }
        return l.edge < r.edge;
    });
    return out;
}

Point on_line(int axis, double c, double value) {
    return (axis == 1) ? Point{value, c} : Point{c, value};
}

// Splits a simple CCW ring along the chord between two crossings. Fails when either side
// has no positive area (the chord runs along the outline).
bool split_at_chord(const Polygon& poly, int axis, double c, const Crossing& s, const Crossing& e,
                    Polygon& first, Polygon& second) {
    const size_t n = poly.size();
    const Point pa = on_line(axis, c, s.value);
    const Point pb = on_line(axis, c, e.value);
    first.clear();
    second.clear();
    first.push_back(pa);
    for (size_t k = (s.edge + 1) % n;; k = (k + 1) % n) {
        first.push_back(poly[k]);
        if (k == e.edge) {
            break;
        }
    }
    first.push_back(pb);
    second.push_back(pb);
    for (size_t k = (e.edge + 1) % n;; k = (k + 1) % n) {
        second.push_back(poly[k]);
        if (k == s.edge) {
            break;
        }
    }
    second.push_back(pa);
    first = remove_degenerate(std::move(first));
    second = remove_degenerate(std::move(second));
    const double whole = polygon_signed_area(poly);
    const double eps = 1e-9 * std::max(1.0, std::abs(whole));
    return polygon_signed_area(first) > eps && polygon_signed_area(second) > eps;
}

Point segment_cross_point(const Point& a, const Point& b, const Point& c, const Point& d) {
    const double rx = b.x - a.x;
    const double ry = b.y - a.y;
    const double sx = d.x - c.x;
    const double sy = d.y - c.y;
    const double den = rx * sy - ry * sx;
    if (std::abs(den) < 1e-18) {
        return b;
    }
    const double t = ((c.x - a.x) * sy - (c.y - a.y) * sx) / den;
    return Point{a.x + t * rx, a.y + t * ry};
}

// Splits a self-crossing ring at its crossings and keeps the simple loop with the largest
// positive area.
Polygon largest_simple_loop(const Polygon& ring, double eps) {
    std::vector<Polygon> stack{ring};
    Polygon best;
    double best_area = 0.0;
    int budget = 256;
    while (!stack.empty() && budget-- > 0) {
        Polygon cur = remove_degenerate(std::move(stack.back()), eps);
        stack.pop_back();
        const size_t n = cur.size();
        if (n < 3) {
            continue;
        }
        bool split = false;
        for (size_t i = 0; i < n && !split; ++i) {
            for (size_t j = i + 2; j < n; ++j) {
                if (i == 0 && j == n - 1) {
                    continue;
                }
                const Point& a = cur[i];
                const Point& b = cur[i + 1];
                const Point& c = cur[j];
                const Point& d = cur[(j + 1) % n];
                if (!segments_intersect_proper(a, b, c, d, eps)) {
                    continue;
                }
                const Point x = segment_cross_point(a, b, c, d);
                Polygon inner{x};
                inner.insert(inner.end(), cur.begin() + static_cast<std::ptrdiff_t>(i + 1),
                             cur.begin() + static_cast<std::ptrdiff_t>(j + 1));
                Polygon outer{x};
                outer.insert(outer.end(), cur.begin() + static_cast<std::ptrdiff_t>(j + 1), cur.end());
                outer.insert(outer.end(), cur.begin(), cur.begin() + static_cast<std::ptrdiff_t>(i + 1));
                stack.push_back(std::move(inner));
                stack.push_back(std::move(outer));
                split = true;
                break;
            }
        }
        if (split) {
            continue;
        }
        const double a = polygon_signed_area(cur);
        if (a > best_area && polygon_is_simple(cur, eps)) {
            best_area = a;
            best = std::move(cur);
        }
    }
    return best;
}

}  // namespace

std::vector<Interval> scanline_intervals(const Polygon& poly, int axis, double c) {
    const auto hits = line_crossings(poly, axis, c);
    std::vector<Interval> out;
    for (size_t i = 0; i + 1 < hits.size(); i += 2) {
        if (hits[i + 1].value > hits[i].value) {
            out.emplace_back(hits[i].value, hits[i + 1].value);
        }
    }
    return out;
}

std::vector<Polygon> cut_chords(const Polygon& poly, int axis, double c, double lo, double hi) {
    if (axis != 0 && axis != 1) {
        throw std::invalid_argument("cut_chords: axis must be 0 or 1");
    }
    std::vector<Polygon> done;
    std::vector<Polygon> todo{ensure_ccw(poly)};
    int budget = 4 * static_cast<int>(poly.size()) + 16;
    Polygon first;
    Polygon second;
    while (!todo.empty()) {
        Polygon cur = std::move(todo.back());
        todo.pop_back();
        if (cur.size() < 3) {
            continue;
        }
        bool cut = false;
        if (budget-- > 0) {
            const auto hits = line_crossings(cur, axis, c);
            for (size_t k = 0; k + 1 < hits.size(); k += 2) {
                const double u = hits[k].value;
                const double v = hits[k + 1].value;
                if (!(v - u > 1e-9) || v < lo - 1e-9 || u > hi + 1e-9) {
                    continue;
                }
                if (split_at_chord(cur, axis, c, hits[k], hits[k + 1], first, second)) {
                    todo.push_back(std::move(second));
                    todo.push_back(std::move(first));
                    cut = true;
                    break;
                }
            }
        }
        if (!cut) {
            done.push_back(std::move(cur));
        }
    }
    return done;
}

std::pair<std::vector<Polygon>, std::vector<Polygon>> split_axis_parts(const Polygon& poly, int axis, double c) {
    std::pair<std::vector<Polygon>, std::vector<Polygon>> out;
    const double inf = std::numeric_limits<double>::infinity();
    for (auto& piece : cut_chords(poly, axis, c, -inf, inf)) {
        const BoundingBox bb = polygon_bbox(piece);
        const double lo = (axis == 0) ? bb.min_x : bb.min_y;
        const double hi = (axis == 0) ? bb.max_x : bb.max_y;
        const double tol = 1e-9 * std::max(1.0, std::abs(c));
        if (hi <= c + tol) {
            out.first.push_back(std::move(piece));
        } else if (lo >= c - tol) {
            out.second.push_back(std::move(piece));
        } else {
            // Chords that could not be cut cleanly; fall back to clipping.
            auto halves = split_axis(piece, axis, c);
            if (halves.first.size() >= 3) {
                out.first.push_back(std::move(halves.first));
            }
            if (halves.second.size() >= 3) {
                out.second.push_back(std::move(halves.second));
            }
        }
    }
    return out;
}

Polygon offset_inward(const Polygon& poly, double d, double eps) {
    Polygon base = remove_degenerate(ensure_ccw(poly), eps);
    if (base.size() < 3 || !(d > 0.0)) {
        return base;
    }

    struct Line {
        Point a;
        double dx = 0.0;
        double dy = 0.0;
    };

    // Mitres longer than this multiple of d are replaced by a square cap.
    constexpr double kMiterLimit = 2.0;

    const size_t n = base.size();
    std::vector<Line> lines;
    lines.reserve(2 * n);
    for (size_t i = 0; i < n; ++i) {
        const Point& prev = base[(i + n - 1) % n];
        const Point& p = base[i];
        const Point& q = base[(i + 1) % n];
        const double lin = distance(prev, p);
        const double ix = (p.x - prev.x) / lin;
        const double iy = (p.y - prev.y) / lin;
        const double len = distance(p, q);
        const double dx = (q.x - p.x) / len;
        const double dy = (q.y - p.y) / len;
        // A reflex corner pushes its mitre outwards along the bisector; cap it at distance d.
        if (ix * dy - iy * dx < 0.0) {
            double bx = -iy - dy;
            double by = ix + dx;
            const double bl = std::hypot(bx, by);
            if (bl > 1e-12) {
                bx /= bl;
                by /= bl;
                const double cos_half = bx * -iy + by * ix;
                if (cos_half < 1.0 / kMiterLimit) {
                    lines.push_back(Line{Point{p.x + bx * d, p.y + by * d}, by, -bx});
                }
            }
        }
        // Left normal points inward for a CCW ring.
        lines.push_back(Line{Point{p.x - dy * d, p.y + dx * d}, dx, dy});
    }

    auto meet = [](const Line& l1, const Line& l2) {
        const double cr = l1.dx * l2.dy - l1.dy * l2.dx;
        if (std::abs(cr) < 1e-12) {
            return l2.a;
        }
        const double t = ((l2.a.x - l1.a.x) * l2.dy - (l2.a.y - l1.a.y) * l2.dx) / cr;
        return Point{l1.a.x + t * l1.dx, l1.a.y + t * l1.dy};
    };

    Polygon verts;
    const size_t max_rounds = lines.size() + 1;
    for (size_t round = 0; round < max_rounds; ++round) {
        const size_t m = lines.size();
        if (m < 3) {
            return {};
        }
        verts.assign(m, Point{});
        for (size_t i = 0; i < m; ++i) {
            verts[i] = meet(lines[(i + m - 1) % m], lines[i]);
        }

        // Edge i runs verts[i] -> verts[i+1] along lines[i]; a negative projection means it vanished.
        size_t worst = m;
        double worst_proj = -eps;
        for (size_t i = 0; i < m; ++i) {
            const Point& p = verts[i];
            const Point& q = verts[(i + 1) % m];
            const double proj = (q.x - p.x) * lines[i].dx + (q.y - p.y) * lines[i].dy;
            if (proj < worst_proj) {
                worst_proj = proj;
                worst = i;
            }
        }
        if (worst == m) {
            break;
        }
        lines.erase(lines.begin() + static_cast<std::ptrdiff_t>(worst));
    }

    verts = remove_degenerate(std::move(verts), eps);
    if (verts.size() < 3) {
        return {};
    }
    if (!polygon_is_simple(verts, eps)) {
        verts = largest_simple_loop(verts, eps);
    }
    if (verts.size() < 3 || !(polygon_signed_area(verts) > eps)) {
        return {};
    }
    return verts;
}

OrientedBox min_area_obb(const Polygon& poly) {
    OrientedBox best;
    const Polygon hull = convex_hull(poly);
    if (hull.size() < 3) {
        const BoundingBox bb = polygon_bbox(poly);
        best.length = std::max(bb.width(), bb.height());
        best.breadth = std::min(bb.width(), bb.height());
        best.angle_deg = (bb.height() > bb.width()) ? 90.0 : 0.0;
        best.center = bb.center();
        return best;
    }

    double best_area = std::numeric_limits<double>::infinity();
    BoundingBox best_bb;
    double best_deg = 0.0;
    for (size_t i = 0; i < hull.size(); ++i) {
        const Point& a = hull[i];
        const Point& b = hull[(i + 1) % hull.size()];
        double deg = std::atan2(b.y - a.y, b.x - a.x) * (180.0 / 3.14159265358979323846);
        // Edge directions repeat every 90 degrees for an enclosing rectangle.
        deg = std::fmod(deg, 90.0);
        if (deg < 0.0) {
            deg += 90.0;
        }
        const BoundingBox bb = polygon_bbox(rotate_polygon(hull, -deg));
        const double area = bb.area();
        if (area < best_area * (1.0 - 1e-12)) {
            best_area = area;
            best_bb = bb;
            best_deg = deg;
        }
    }

    best.center = rotate_point(best_bb.center(), best_deg);
    if (best_bb.height() > best_bb.width()) {
        best.angle_deg = best_deg + 90.0;
        best.length = best_bb.height();
        best.breadth = best_bb.width();
    } else {
        best.angle_deg = best_deg;
        best.length = best_bb.width();
        best.breadth = best_bb.height();
    }
    if (best.angle_deg > 90.0) {
        best.angle_deg -= 180.0;
    }
    return best;
}

Point LocalFrame::to_local(const Point& p) const {
    return rotate_point(Point{p.x - origin.x, p.y - origin.y}, -angle_deg);
}

Point LocalFrame::to_world(const Point& p) const {
    const Point r = rotate_point(p, angle_deg);
    return Point{r.x + origin.x, r.y + origin.y};
}

Polygon LocalFrame::to_local(const Polygon& poly) const {
    Polygon out;
    out.reserve(poly.size());
    for (const auto& p : poly) {
        out.push_back(to_local(p));
    }
    return out;
}

Polygon LocalFrame::to_world(const Polygon& poly) const {
    Polygon out;
    out.reserve(poly.size());
    for (const auto& p : poly) {
        out.push_back(to_world(p));
    }
    return out;
}

}  // namespace parkgen
