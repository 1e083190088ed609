#include "parkgen/entrance_placer.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace parkgen {

namespace {

double polyline_distance(const Point& p, const Polyline& line) {
    double best = std::numeric_limits<double>::infinity();
    for (size_t i = 1; i < line.size(); ++i) {
        best = std::min(best, point_segment_distance(p, line[i - 1], line[i]));
    }
    return best;
}

int alignment_band(double alignment, double tol) {
    if (!(tol > 0.0)) {
        return 0;
    }
    return static_cast<int>(std::floor(alignment / tol + 1e-9));
}

Point point_on_edge(const EntranceCandidate& c, double t) {
    const double ux = (c.b.x - c.a.x) / c.length;
    const double uy = (c.b.y - c.a.y) / c.length;
    return Point{c.a.x + t * ux, c.a.y + t * uy};
}

bool faces_frame_y(const Point& inward_normal, double frame_angle_deg) {
    const Point local = rotate_point(inward_normal, -frame_angle_deg);
    return std::abs(local.y) >= std::abs(local.x);
}

}  // namespace

std::vector<EntranceCandidate> rank_entrance_edges(const Polygon& boundary,
                                                   const Polyline* reference,
                                                   const ParameterSet& params) {
    const Polygon ring = ensure_ccw(boundary);
    const double setback = params.entrances.corner_setback;
    const double half_width = 0.5 * params.access_row_width;
    const double clearance = 2.0 * setback + params.access_row_width;
    const bool has_ref = reference != nullptr && reference->size() >= 2;

    Point ref_dir;
    if (has_ref) {
        const Point& r0 = reference->front();
        const Point& r1 = reference->back();
        const double len = distance(r0, r1);
        if (len > 0.0) {
            ref_dir = Point{(r1.x - r0.x) / len, (r1.y - r0.y) / len};
        }
    }

    std::vector<EntranceCandidate> out;
    for (size_t i = 0; i < ring.size(); ++i) {
        const Point& a = ring[i];
        const Point& b = ring[(i + 1) % ring.size()];
        const double len = distance(a, b);
        if (len < clearance) {
            continue;
        }
        EntranceCandidate c;
        c.edge_index = static_cast<int>(i);
        c.a = a;
        c.b = b;
        c.length = len;
        const double ux = (b.x - a.x) / len;
        const double uy = (b.y - a.y) / len;
        c.inward_normal = Point{-uy, ux};  // left of a CCW edge
        c.span_lo = setback + half_width;
        c.span_hi = len - setback - half_width;
        if (has_ref) {
            // Outward normal is the negated inward one; only |.| matters.
            c.alignment = std::abs(c.inward_normal.x * ref_dir.x + c.inward_normal.y * ref_dir.y);
            c.ref_distance = polyline_distance(Point{0.5 * (a.x + b.x), 0.5 * (a.y + b.y)}, *reference);
        } else {
            c.alignment = 0.0;
            c.ref_distance = -len;
        }
        out.push_back(c);
    }

    if (out.empty()) {
        throw NoValidFrontage("no boundary edge is at least " + std::to_string(clearance) +
                              " m long (corner setbacks plus access road)");
    }

    const double tol = params.entrances.alignment_tolerance;
    std::stable_sort(out.begin(), out.end(), [&](const EntranceCandidate& x, const EntranceCandidate& y) {
        const int bx = alignment_band(x.alignment, tol);
        const int by = alignment_band(y.alignment, tol);
        if (bx != by) {
            return bx < by;
        }
        if (x.ref_distance != y.ref_distance) {
            return x.ref_distance < y.ref_distance;
        }
        return x.edge_index < y.edge_index;
    });
    return out;
}

int primary_candidate_index(const std::vector<EntranceCandidate>& ranked,
                            const ParameterSet& params,
                            double choice_gene) {
    if (ranked.empty()) {
        throw NoValidFrontage("no entrance candidates");
    }
    const double tol = params.entrances.alignment_tolerance;
    const int best_band = alignment_band(ranked.front().alignment, tol);
    int k = 0;
    for (const auto& c : ranked) {
        if (k >= params.entrances.top_candidates || alignment_band(c.alignment, tol) != best_band) {
            break;
        }
        ++k;
    }
    k = std::max(k, 1);
    return std::min(static_cast<int>(std::clamp(choice_gene, 0.0, 1.0) * k), k - 1);
}

EntrancePlan place_entrances(const std::vector<EntranceCandidate>& ranked,
                             const ParameterSet& params,
                             double frame_angle_deg,
                             double choice_gene,
                             double offset_gene) {
    EntrancePlan plan;
    if (ranked.empty()) {
        throw NoValidFrontage("no entrance candidates");
    }

    const double tol = params.entrances.alignment_tolerance;
    const int pick = primary_candidate_index(ranked, params, choice_gene);
    const EntranceCandidate& primary = ranked[static_cast<size_t>(pick)];

    const double t = primary.span_lo + std::clamp(offset_gene, 0.0, 1.0) * (primary.span_hi - primary.span_lo);
    Entrance first;
    first.id = 0;
    first.point = point_on_edge(primary, t);
    first.edge_index = primary.edge_index;
    first.primary = true;
    plan.entrances.push_back(first);
    plan.inward_normals.push_back(primary.inward_normal);

    constexpr int kSamplesPerEdge = 9;
    for (int n = 1; n < params.entrance_count; ++n) {
        bool found = false;
        int found_band = 0;
        double found_sep = -1.0;
        Point found_pt;
        const EntranceCandidate* found_edge = nullptr;

        for (const auto& c : ranked) {
            if (!faces_frame_y(c.inward_normal, frame_angle_deg)) {
                continue;
            }
            const int band = alignment_band(c.alignment, tol);
            if (found && band > found_band) {
                break;  // ranked by band; a worse band cannot win
            }
            for (int s = 0; s < kSamplesPerEdge; ++s) {
                const double f = static_cast<double>(s) / static_cast<double>(kSamplesPerEdge - 1);
                const Point p = point_on_edge(c, c.span_lo + f * (c.span_hi - c.span_lo));
                double sep = std::numeric_limits<double>::infinity();
                for (const auto& e : plan.entrances) {
                    sep = std::min(sep, distance(p, e.point));
                }
                if (sep < params.entrances.min_spacing) {
                    continue;
                }
                if (!found || band < found_band || sep > found_sep + 1e-9) {
                    found = true;
                    found_band = band;
                    found_sep = sep;
                    found_pt = p;
                    found_edge = &c;
                }
            }
        }

        if (!found) {
            plan.dropped += params.entrance_count - n;
            break;
        }
        Entrance e;
        e.id = n;
        e.point = found_pt;
        e.edge_index = found_edge->edge_index;
        plan.entrances.push_back(e);
        plan.inward_normals.push_back(found_edge->inward_normal);
    }
    return plan;
}

RoadSegment make_entrance_connector(const Entrance& entrance,
                                    const Point& inward_normal,
                                    double depth,
                                    double width,
                                    int id) {
    RoadSegment seg;
    seg.id = id;
    seg.road_class = RoadClass::kAccess;
    seg.width = width;
    const Point& p = entrance.point;
    const Point q{p.x + depth * inward_normal.x, p.y + depth * inward_normal.y};
    seg.centerline = Polyline{p, q};

    // Tangent along the boundary edge (CCW direction).
    const double hx = 0.5 * width * inward_normal.y;
    const double hy = -0.5 * width * inward_normal.x;
    seg.row = ensure_ccw(Polygon{
        Point{p.x - hx, p.y - hy},
        Point{p.x + hx, p.y + hy},
        Point{q.x + hx, q.y + hy},
        Point{q.x - hx, q.y - hy},
    });
    return seg;
}

}  // namespace parkgen
