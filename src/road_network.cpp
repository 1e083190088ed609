#include "parkgen/road_network.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

#include "parkgen/errors.hpp"

namespace parkgen {

namespace {

constexpr double kAreaEps = 1e-6;
constexpr double kLineTol = 1e-7;

std::vector<Point> coverage_samples(const Polygon& region, double step) {
    std::vector<Point> out;
    if (region.size() < 3) {
        return out;
    }
    if (!(step > 0.0)) {
        step = std::max(2.0, std::sqrt(polygon_area(region) / 1500.0));
    }
    const BoundingBox bb = polygon_bbox(region);
    for (double y = bb.min_y + 0.5 * step; y < bb.max_y; y += step) {
        for (double x = bb.min_x + 0.5 * step; x < bb.max_x; x += step) {
            const Point p{x, y};
            if (point_in_polygon(p, region)) {
                out.push_back(p);
            }
        }
    }
    return out;
}

double centerline_distance(const Point& p, const RoadSegment& s) {
    const auto& cl = s.centerline;
    if (cl.empty()) {
        return std::numeric_limits<double>::infinity();
    }
    if (cl.size() == 1) {
        return distance(p, cl.front());
    }
    double best = std::numeric_limits<double>::infinity();
    for (size_t i = 1; i < cl.size(); ++i) {
        best = std::min(best, point_segment_distance(p, cl[i - 1], cl[i]));
    }
    return best;
}

double covered_fraction(const std::vector<Point>& samples,
                        const std::vector<const RoadSegment*>& segs,
                        double max_distance) {
    if (samples.empty()) {
        return 1.0;
    }
    size_t covered = 0;
    for (const auto& p : samples) {
        for (const RoadSegment* s : segs) {
            if (centerline_distance(p, *s) - 0.5 * s->width <= max_distance) {
                ++covered;
                break;
            }
        }
    }
    return static_cast<double>(covered) / static_cast<double>(samples.size());
}

bool segments_touch(const RoadSegment& s, const RoadSegment& t, double tol) {
    if (s.centerline.empty() || t.centerline.empty()) {
        return false;
    }
    const double reach = 0.5 * (s.width + t.width) + tol;
    for (const Point* p : {&s.centerline.front(), &s.centerline.back()}) {
        if (centerline_distance(*p, t) <= reach) {
            return true;
        }
    }
    for (const Point* p : {&t.centerline.front(), &t.centerline.back()}) {
        if (centerline_distance(*p, s) <= reach) {
            return true;
        }
    }
    return false;
}

enum class CandidateKind {
    kRoot = 0,       // the spine
    kSpineLine = 1,  // further intervals on the spine line
    kCollector = 2,  // parallel to the spine
    kEdgeFill = 3,   // secondary closing a gap the regular pattern leaves
    kPattern = 4,    // regular secondary
    kForced = 5,     // secondary through an entrance
};

// Simplification removes lower ranks first.
int prune_rank(CandidateKind k) {
    switch (k) {
    case CandidateKind::kSpineLine:
    case CandidateKind::kCollector:
        return 0;
    case CandidateKind::kEdgeFill:
        return 1;
    case CandidateKind::kPattern:
        return 2;
    default:
        return 3;
    }
}

// A straight road spanning one whole interior interval of the buildable area.
struct Candidate {
    int axis = 1;  // 1: runs along x at y = pos, 0: runs along y at x = pos
    double pos = 0.0;
    Interval span;
    double width = 0.0;
    CandidateKind kind = CandidateKind::kPattern;
    bool active = true;
    std::vector<size_t> crossings;
    std::vector<size_t> covers;  // coverage samples within reach

    double length() const { return span.second - span.first; }
    bool pinned() const { return kind == CandidateKind::kRoot || kind == CandidateKind::kForced; }
    Point at(double t) const { return axis == 1 ? Point{t, pos} : Point{pos, t}; }
};

// h runs along x, v along y; v must fit inside h's span with its whole width.
bool crosses(const Candidate& h, const Candidate& v) {
    return v.pos >= h.span.first + 0.5 * v.width - kLineTol && v.pos <= h.span.second - 0.5 * v.width + kLineTol &&
           h.pos >= v.span.first - kLineTol && h.pos <= v.span.second + kLineTol;
}

size_t nearest_interval(const std::vector<Interval>& ivs, double t) {
    size_t best = 0;
    double best_d = std::numeric_limits<double>::infinity();
    for (size_t i = 0; i < ivs.size(); ++i) {
        const double dd = std::max({0.0, ivs[i].first - t, t - ivs[i].second});
        if (dd < best_d) {
            best_d = dd;
            best = i;
        }
    }
    return best;
}

size_t longest(const std::vector<Interval>& ivs) {
    size_t best = 0;
    for (size_t i = 1; i < ivs.size(); ++i) {
        if (ivs[i].second - ivs[i].first > ivs[best].second - ivs[best].first) {
            best = i;
        }
    }
    return best;
}

// Marks candidates that cannot reach `root` through active crossings; returns true if none.
bool reach_from(std::vector<Candidate>& cands, size_t root, bool deactivate) {
    std::vector<char> seen(cands.size(), 0);
    std::vector<size_t> stack{root};
    seen[root] = 1;
    while (!stack.empty()) {
        const size_t i = stack.back();
        stack.pop_back();
        for (size_t j : cands[i].crossings) {
            if (cands[j].active && !seen[j]) {
                seen[j] = 1;
                stack.push_back(j);
            }
        }
    }
    bool all = true;
    for (size_t i = 0; i < cands.size(); ++i) {
        if (cands[i].active && !seen[i]) {
            all = false;
            if (deactivate) {
                cands[i].active = false;
            }
        }
    }
    return all;
}

struct SecondaryPosition {
    double x = 0.0;
    CandidateKind kind = CandidateKind::kPattern;
    Point hit;
};

std::vector<SecondaryPosition> secondary_positions(const RoadLayoutInput& in, const BoundingBox& bb, double ws) {
    const double d = in.lot_depth;
    const double spacing = 2.0 * d + ws;
    std::vector<SecondaryPosition> out;
    if (!in.forced_secondaries.empty()) {
        const double lo_lim = bb.min_x + 0.5 * ws + 0.5 * d;
        const double hi_lim = bb.max_x - 0.5 * ws - 0.5 * d;
        const Point base = in.forced_secondaries.front();
        for (double x = base.x - spacing; x >= lo_lim; x -= spacing) {
            out.push_back(SecondaryPosition{x, CandidateKind::kPattern, Point{}});
        }
        for (double x = base.x + spacing; x <= hi_lim; x += spacing) {
            out.push_back(SecondaryPosition{x, CandidateKind::kPattern, Point{}});
        }
        out.push_back(SecondaryPosition{base.x, CandidateKind::kForced, base});
        for (size_t i = 1; i < in.forced_secondaries.size(); ++i) {
            const Point fp = in.forced_secondaries[i];
            bool duplicate = false;
            for (const auto& s : out) {
                if (s.kind == CandidateKind::kForced && std::abs(s.x - fp.x) < 0.5 * spacing) {
                    duplicate = true;
                }
            }
            if (duplicate) {
                continue;
            }
            out.erase(std::remove_if(out.begin(), out.end(),
                                     [&](const SecondaryPosition& s) {
                                         return s.kind != CandidateKind::kForced && std::abs(s.x - fp.x) < 0.5 * spacing;
                                     }),
                      out.end());
            out.push_back(SecondaryPosition{fp.x, CandidateKind::kForced, fp});
        }
    } else {
        const double width = bb.width();
        const int n = static_cast<int>(std::floor((width + d) / spacing));
        if (n >= 1) {
            const double edge_total = width - n * ws - 2.0 * d * (n - 1);
            const double left = 0.5 * d + std::clamp(in.phase, 0.0, 1.0) * std::max(0.0, edge_total - d);
            for (int k = 0; k < n; ++k) {
                out.push_back(SecondaryPosition{bb.min_x + left + 0.5 * ws + k * spacing, CandidateKind::kPattern,
                                                Point{}});
            }
        }
    }
    std::sort(out.begin(), out.end(),
              [](const SecondaryPosition& a, const SecondaryPosition& b) { return a.x < b.x; });
    return out;
}

// Adds secondaries in the middle of every gap wider than the road reach: one reach at the
// site edges, two between neighbouring roads.
void fill_gaps(std::vector<SecondaryPosition>& pos, const BoundingBox& bb, double ws, double reach) {
    if (pos.empty()) {
        pos.push_back(SecondaryPosition{bb.center().x, CandidateKind::kEdgeFill, Point{}});
    }
    for (int round = 0; round < 64; ++round) {
        std::vector<double> add;
        const double left_gap = pos.front().x - 0.5 * ws - bb.min_x;
        if (left_gap > reach) {
            add.push_back(bb.min_x + 0.5 * left_gap);
        }
        for (size_t i = 1; i < pos.size(); ++i) {
            if (pos[i].x - pos[i - 1].x - ws > 2.0 * reach) {
                add.push_back(0.5 * (pos[i].x + pos[i - 1].x));
            }
        }
        const double right_gap = bb.max_x - pos.back().x - 0.5 * ws;
        if (right_gap > reach) {
            add.push_back(bb.max_x - 0.5 * right_gap);
        }
        if (add.empty()) {
            break;
        }
        for (double x : add) {
            pos.push_back(SecondaryPosition{x, CandidateKind::kEdgeFill, Point{}});
        }
        std::sort(pos.begin(), pos.end(),
                  [](const SecondaryPosition& a, const SecondaryPosition& b) { return a.x < b.x; });
    }
}

// Cuts the blocks along both right-of-way edges of a straight road (only chords overlapping
// [ext_lo, ext_hi]) and takes the strip containing `inside` as the road's right-of-way.
// `edges` receives the strip edges lying on the cut lines.
bool carve_row(std::vector<Polygon>& blocks,
               int axis,
               double pos,
               double hw,
               double ext_lo,
               double ext_hi,
               const Point& inside,
               Polygon& row,
               std::vector<std::pair<Point, Point>>& edges) {
    const double inf = std::numeric_limits<double>::infinity();
    const double cuts[2] = {pos - hw, pos + hw};
    auto across = [axis](const Point& p) { return axis == 1 ? p.y : p.x; };
    auto span_of = [axis](const Polygon& poly, double& lo, double& hi, double& along_lo, double& along_hi) {
        const BoundingBox bb = polygon_bbox(poly);
        lo = axis == 1 ? bb.min_y : bb.min_x;
        hi = axis == 1 ? bb.max_y : bb.max_x;
        along_lo = axis == 1 ? bb.min_x : bb.min_y;
        along_hi = axis == 1 ? bb.max_x : bb.max_y;
    };

    for (double c : cuts) {
        std::vector<Polygon> next;
        next.reserve(blocks.size() + 2);
        for (auto& piece : blocks) {
            double lo = 0.0;
            double hi = 0.0;
            double along_lo = 0.0;
            double along_hi = 0.0;
            span_of(piece, lo, hi, along_lo, along_hi);
            if (lo < c - kLineTol && hi > c + kLineTol && along_hi > ext_lo && along_lo < ext_hi) {
                for (auto& part : cut_chords(piece, axis, c, ext_lo, ext_hi)) {
                    next.push_back(std::move(part));
                }
            } else {
                next.push_back(std::move(piece));
            }
        }
        blocks = std::move(next);
    }

    auto find = [&]() {
        for (size_t i = 0; i < blocks.size(); ++i) {
            if (point_in_polygon(inside, blocks[i])) {
                return i;
            }
        }
        return blocks.size();
    };
    size_t k = find();
    if (k == blocks.size()) {
        return false;
    }
    double lo = 0.0;
    double hi = 0.0;
    double along_lo = 0.0;
    double along_hi = 0.0;
    span_of(blocks[k], lo, hi, along_lo, along_hi);
    if (lo < cuts[0] - kLineTol || hi > cuts[1] + kLineTol) {
        // The outline re-enters the band beyond the road's extent; cut the strip free everywhere.
        std::vector<Polygon> parts{std::move(blocks[k])};
        blocks.erase(blocks.begin() + static_cast<std::ptrdiff_t>(k));
        for (double c : cuts) {
            std::vector<Polygon> next;
            for (const auto& part : parts) {
                for (auto& q : cut_chords(part, axis, c, -inf, inf)) {
                    next.push_back(std::move(q));
                }
            }
            parts = std::move(next);
        }
        for (auto& part : parts) {
            blocks.push_back(std::move(part));
        }
        k = find();
        if (k == blocks.size()) {
            return false;
        }
    }

    row = std::move(blocks[k]);
    blocks.erase(blocks.begin() + static_cast<std::ptrdiff_t>(k));
    for (size_t i = 0; i < row.size(); ++i) {
        const Point& a = row[i];
        const Point& b = row[(i + 1) % row.size()];
        if (!(distance(a, b) > kLineTol)) {
            continue;
        }
        for (double c : cuts) {
            if (std::abs(across(a) - c) <= kLineTol && std::abs(across(b) - c) <= kLineTol) {
                edges.emplace_back(a, b);
            }
        }
    }
    return true;
}

struct PlannedRoad {
    RoadSegment seg;
    int axis = 1;
    double pos = 0.0;
    double ext_lo = 0.0;  // extent outside crossing bands, along the road
    double ext_hi = 0.0;
};

}  // namespace

RoadLayout generate_road_network(const RoadLayoutInput& in, const ParameterSet& params) {
    const Polygon poly = ensure_ccw(in.buildable);
    if (poly.size() < 3 || !(polygon_area(poly) > kAreaEps)) {
        throw InfeasibleGeometry("buildable area after perimeter buffer is empty");
    }
    if (!(in.lot_depth > 0.0)) {
        throw std::invalid_argument("generate_road_network: lot_depth must be > 0");
    }

    const double wp = params.primary_row_width;
    const double ws = params.secondary_row_width;
    const double d = in.lot_depth;
    const BoundingBox bb = polygon_bbox(poly);
    const auto& ro = params.roads;

    RoadLayout out;
    out.max_road_distance = (ro.max_road_distance > 0.0) ? ro.max_road_distance : 1.05 * d;
    const double reach = out.max_road_distance;

    // Primary spine.
    double yc = 0.0;
    if (in.has_forced_spine) {
        yc = std::clamp(in.forced_spine_at.y, bb.min_y, bb.max_y);
    } else {
        const double f = ro.spine_min_fraction +
                         std::clamp(in.spine_fraction, 0.0, 1.0) * (ro.spine_max_fraction - ro.spine_min_fraction);
        yc = bb.min_y + f * bb.height();
    }
    std::vector<Interval> spine_ivs = scanline_intervals(poly, 1, yc);
    if (spine_ivs.empty()) {
        for (double f : {0.5, 0.4, 0.6, 0.3, 0.7, 0.2, 0.8}) {
            yc = bb.min_y + f * bb.height();
            spine_ivs = scanline_intervals(poly, 1, yc);
            if (!spine_ivs.empty()) {
                break;
            }
        }
        if (spine_ivs.empty()) {
            throw InfeasibleGeometry("no interior line for the primary spine");
        }
    }
    out.spine_y = yc;
    const size_t root_iv = in.has_forced_spine ? nearest_interval(spine_ivs, in.forced_spine_at.x)
                                               : longest(spine_ivs);

    // Candidates: every interior interval of the spine line, of the collector lines and of the
    // secondary lines. The spine is candidate 0.
    std::vector<Candidate> cands;
    {
        Candidate root;
        root.axis = 1;
        root.pos = yc;
        root.span = spine_ivs[root_iv];
        root.width = wp;
        root.kind = CandidateKind::kRoot;
        cands.push_back(root);
    }
    for (size_t i = 0; i < spine_ivs.size(); ++i) {
        if (i != root_iv && spine_ivs[i].second - spine_ivs[i].first >= wp) {
            Candidate c;
            c.axis = 1;
            c.pos = yc;
            c.span = spine_ivs[i];
            c.width = wp;
            c.kind = CandidateKind::kSpineLine;
            cands.push_back(c);
        }
    }
    for (int side : {-1, 1}) {
        for (int j = 1;; ++j) {
            const double y = yc + side * (0.5 * wp + 0.5 * ws + j * d);
            if (!(y > bb.min_y && y < bb.max_y)) {
                break;
            }
            for (const auto& iv : scanline_intervals(poly, 1, y)) {
                if (iv.second - iv.first >= ws) {
                    Candidate c;
                    c.axis = 1;
                    c.pos = y;
                    c.span = iv;
                    c.width = ws;
                    c.kind = CandidateKind::kCollector;
                    cands.push_back(c);
                }
            }
        }
    }
    std::vector<SecondaryPosition> positions = secondary_positions(in, bb, ws);
    fill_gaps(positions, bb, ws, reach);
    for (const auto& sp : positions) {
        const auto ivs = scanline_intervals(poly, 0, sp.x);
        if (ivs.empty()) {
            continue;
        }
        for (size_t i = 0; i < ivs.size(); ++i) {
            const bool take = (sp.kind == CandidateKind::kForced) ? i == nearest_interval(ivs, sp.hit.y)
                                                                  : ivs[i].second - ivs[i].first >= ws;
            if (!take) {
                continue;
            }
            Candidate c;
            c.axis = 0;
            c.pos = sp.x;
            c.span = ivs[i];
            c.width = ws;
            c.kind = sp.kind;
            cands.push_back(c);
        }
    }

    for (size_t i = 0; i < cands.size(); ++i) {
        for (size_t j = 0; j < cands.size(); ++j) {
            if (cands[i].axis == 1 && cands[j].axis == 0 && crosses(cands[i], cands[j])) {
                cands[i].crossings.push_back(j);
                cands[j].crossings.push_back(i);
            }
        }
    }
    reach_from(cands, 0, true);

    // Coverage bookkeeping: how many active candidates reach each sample.
    const std::vector<Point> samples = coverage_samples(poly, ro.sample_step);
    std::vector<int> counts(samples.size(), 0);
    for (auto& c : cands) {
        const Point a = c.at(c.span.first);
        const Point b = c.at(c.span.second);
        for (size_t k = 0; k < samples.size(); ++k) {
            if (point_segment_distance(samples[k], a, b) - 0.5 * c.width <= reach) {
                c.covers.push_back(k);
            }
        }
        if (c.active) {
            for (size_t k : c.covers) {
                ++counts[k];
            }
        }
    }
    size_t covered = static_cast<size_t>(std::count_if(counts.begin(), counts.end(), [](int n) { return n > 0; }));
    auto fraction = [&](size_t n) {
        return samples.empty() ? 1.0 : static_cast<double>(n) / static_cast<double>(samples.size());
    };
    double coverage = fraction(covered);

    // Simplify: drop candidates (collectors, then gap fills, then regular secondaries; shortest
    // first, then fewest junctions) while the network stays connected and coverage holds.
    if (ro.prune) {
        std::vector<size_t> order;
        for (size_t i = 0; i < cands.size(); ++i) {
            if (cands[i].active && !cands[i].pinned()) {
                order.push_back(i);
            }
        }
        std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
            const int ra = prune_rank(cands[a].kind);
            const int rb = prune_rank(cands[b].kind);
            if (ra != rb) {
                return ra < rb;
            }
            const double la = cands[a].length();
            const double lb = cands[b].length();
            if (std::abs(la - lb) > 1e-9) {
                return la < lb;
            }
            return cands[a].crossings.size() < cands[b].crossings.size();
        });
        const double coverage_floor = std::min(ro.coverage_target, coverage) - 1e-12;
        for (size_t idx : order) {
            Candidate& c = cands[idx];
            c.active = false;
            if (!reach_from(cands, 0, false)) {
                c.active = true;
                continue;
            }
            size_t lost = 0;
            for (size_t k : c.covers) {
                if (counts[k] == 1) {
                    ++lost;
                }
            }
            if (fraction(covered - lost) >= coverage_floor) {
                for (size_t k : c.covers) {
                    --counts[k];
                }
                covered -= lost;
            } else {
                c.active = true;
            }
        }
    }

    // Segments: roads along x whole, roads along y split at every crossing.
    std::vector<PlannedRoad> planned;
    for (size_t i = 0; i < cands.size(); ++i) {
        const Candidate& c = cands[i];
        if (!c.active || c.axis != 1) {
            continue;
        }
        PlannedRoad pr;
        pr.seg.road_class = (c.kind == CandidateKind::kCollector) ? RoadClass::kSecondary : RoadClass::kPrimary;
        pr.seg.width = c.width;
        pr.seg.centerline = Polyline{c.at(c.span.first), c.at(c.span.second)};
        pr.axis = 1;
        pr.pos = c.pos;
        pr.ext_lo = c.span.first;
        pr.ext_hi = c.span.second;
        planned.push_back(std::move(pr));
    }
    std::vector<size_t> verticals;
    for (size_t i = 0; i < cands.size(); ++i) {
        if (cands[i].active && cands[i].axis == 0) {
            verticals.push_back(i);
        }
    }
    std::stable_sort(verticals.begin(), verticals.end(), [&](size_t a, size_t b) {
        if (cands[a].pos != cands[b].pos) {
            return cands[a].pos < cands[b].pos;
        }
        return cands[a].span.first < cands[b].span.first;
    });
    for (size_t vi : verticals) {
        const Candidate& v = cands[vi];
        std::vector<std::pair<double, double>> stops{{v.span.first, 0.0}};
        for (size_t h : v.crossings) {
            if (cands[h].active) {
                stops.emplace_back(cands[h].pos, 0.5 * cands[h].width);
            }
        }
        std::sort(stops.begin() + 1, stops.end());
        stops.emplace_back(v.span.second, 0.0);
        for (size_t k = 1; k < stops.size(); ++k) {
            const double lo = stops[k - 1].first + stops[k - 1].second;
            const double hi = stops[k].first - stops[k].second;
            if (hi - lo < 1e-3) {
                continue;
            }
            PlannedRoad pr;
            pr.seg.road_class = RoadClass::kSecondary;
            pr.seg.width = v.width;
            pr.seg.centerline = Polyline{v.at(stops[k - 1].first), v.at(stops[k].first)};
            pr.axis = 0;
            pr.pos = v.pos;
            pr.ext_lo = lo;
            pr.ext_hi = hi;
            planned.push_back(std::move(pr));
        }
        out.secondary_x.push_back(v.pos);
    }
    out.secondary_x.erase(std::unique(out.secondary_x.begin(), out.secondary_x.end()), out.secondary_x.end());

    // Rights-of-way: roads along x first, then the branches between them.
    RoadNetwork& net = out.network;
    std::vector<Polygon> pieces{poly};
    for (auto& pr : planned) {
        const Point mid = (pr.axis == 1) ? Point{0.5 * (pr.ext_lo + pr.ext_hi), pr.pos}
                                         : Point{pr.pos, 0.5 * (pr.ext_lo + pr.ext_hi)};
        std::vector<std::pair<Point, Point>> edges;
        if (!carve_row(pieces, pr.axis, pr.pos, 0.5 * pr.seg.width, pr.ext_lo, pr.ext_hi, mid, pr.seg.row,
                       edges)) {
            if (net.segments.empty()) {
                throw InfeasibleGeometry("no room for the primary spine right-of-way");
            }
            continue;
        }
        pr.seg.id = static_cast<int>(net.segments.size());
        for (const auto& e : edges) {
            net.frontage.push_back(FrontageLine{e.first, e.second, pr.seg.id});
        }
        net.segments.push_back(std::move(pr.seg));
    }
    link_road_segments(net);

    std::vector<const RoadSegment*> segs;
    for (const auto& s : net.segments) {
        segs.push_back(&s);
    }
    net.coverage = covered_fraction(samples, segs, reach);

    int order = 0;
    for (auto& piece : pieces) {
        if (polygon_area(piece) > kAreaEps) {
            out.blocks.push_back(Block{std::move(piece), order++});
        }
    }
    return out;
}

void link_road_segments(RoadNetwork& net, double tol) {
    for (auto& s : net.segments) {
        s.connections.clear();
    }
    int pairs = 0;
    for (size_t i = 0; i < net.segments.size(); ++i) {
        for (size_t j = i + 1; j < net.segments.size(); ++j) {
            if (segments_touch(net.segments[i], net.segments[j], tol)) {
                net.segments[i].connections.push_back(net.segments[j].id);
                net.segments[j].connections.push_back(net.segments[i].id);
                ++pairs;
            }
        }
    }
    for (auto& s : net.segments) {
        std::sort(s.connections.begin(), s.connections.end());
    }
    net.junctions = pairs;
}

int road_component_count(const std::vector<RoadSegment>& segments, double tol) {
    RoadNetwork net;
    net.segments = segments;
    link_road_segments(net, tol);
    return net.component_count();
}

double road_coverage(const Polygon& region,
                     const std::vector<RoadSegment>& segments,
                     double max_distance,
                     double step) {
    std::vector<const RoadSegment*> segs;
    segs.reserve(segments.size());
    for (const auto& s : segments) {
        segs.push_back(&s);
    }
    return covered_fraction(coverage_samples(region, step), segs, max_distance);
}

}  // namespace parkgen
