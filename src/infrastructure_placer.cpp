#include "parkgen/infrastructure_placer.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

namespace parkgen {

namespace {

constexpr double kAreaEps = 1e-6;

struct Carve {
    Polygon slice;
    std::vector<Polygon> margin;
    std::vector<Polygon> rest;
    int axis = 1;
    double cut = 0.0;
};

// Slice of `poly` with area `target` taken across the whole block from its low or high end
// along `axis`. The slice must come out as one piece.
bool carve_slice(const Polygon& poly, int axis, bool slice_low, double target, double margin, Carve& out) {
    if (polygon_area(poly) < target) {
        return false;
    }
    auto slice_area = [&](double c) {
        const auto parts = split_axis(poly, axis, c);
        return polygon_area(slice_low ? parts.first : parts.second);
    };

    const BoundingBox bb = polygon_bbox(poly);
    double lo = (axis == 0) ? bb.min_x : bb.min_y;
    double hi = (axis == 0) ? bb.max_x : bb.max_y;
    for (int it = 0; it < 64; ++it) {
        const double mid = 0.5 * (lo + hi);
        const bool small = slice_area(mid) < target;
        if (slice_low == small) {
            lo = mid;
        } else {
            hi = mid;
        }
    }
    const double c = slice_low ? hi : lo;
    auto parts = split_axis_parts(poly, axis, c);
    std::vector<Polygon>& near = slice_low ? parts.first : parts.second;
    std::vector<Polygon>& far = slice_low ? parts.second : parts.first;

    out = Carve{};
    out.axis = axis;
    out.cut = c;
    for (auto& q : near) {
        if (polygon_area(q) > kAreaEps) {
            if (!out.slice.empty()) {
                return false;
            }
            out.slice = std::move(q);
        }
    }
    if (out.slice.empty()) {
        return false;
    }

    for (auto& q : far) {
        if (!(margin > 0.0)) {
            out.rest.push_back(std::move(q));
            continue;
        }
        auto mparts = split_axis_parts(q, axis, slice_low ? c + margin : c - margin);
        for (auto& m : slice_low ? mparts.first : mparts.second) {
            out.margin.push_back(std::move(m));
        }
        for (auto& r : slice_low ? mparts.second : mparts.first) {
            out.rest.push_back(std::move(r));
        }
    }
    return true;
}

// True when an edge of `poly` (other than those on the cut line) lies on the buildable outline.
bool touches_outline(const Polygon& poly, const Polygon& buildable, int axis, double cut) {
    for (size_t i = 0; i < poly.size(); ++i) {
        const Point& a = poly[i];
        const Point& b = poly[(i + 1) % poly.size()];
        const double ua = (axis == 0) ? a.x : a.y;
        const double ub = (axis == 0) ? b.x : b.y;
        if (std::abs(ua - cut) < 1e-7 && std::abs(ub - cut) < 1e-7) {
            continue;
        }
        if (distance(a, b) < 1e-6) {
            continue;
        }
        const Point mid{0.5 * (a.x + b.x), 0.5 * (a.y + b.y)};
        if (point_ring_distance(mid, buildable) < 1e-6) {
            return true;
        }
    }
    return false;
}

}  // namespace

InfrastructurePlacement place_infrastructure(const std::vector<Block>& blocks,
                                             const Polygon& buildable,
                                             const RoadNetwork& roads,
                                             const LocalFrame& frame,
                                             double site_area,
                                             const ParameterSet& params) {
    InfrastructurePlacement out;
    out.remaining = blocks;

    std::vector<InfrastructureRequirement> reqs = params.infrastructure;
    std::stable_sort(reqs.begin(), reqs.end(),
                     [](const InfrastructureRequirement& a, const InfrastructureRequirement& b) {
                         return a.priority < b.priority;
                     });

    // Frontage lines in the local frame are the road network's own (roads are still local here).
    const auto& lines = roads.frontage_lines();

    int next_id = 0;
    for (const auto& req : reqs) {
        const double need = required_area(req, site_area);
        const char* name = infrastructure_kind_name(req.kind);
        if (!(need > 0.0)) {
            continue;
        }

        int best = -1;
        Carve best_carve;
        double best_elev = std::numeric_limits<double>::infinity();
        double best_area = -1.0;
        for (size_t i = 0; i < out.remaining.size(); ++i) {
            const Block& blk = out.remaining[i];
            const double area = polygon_area(blk.polygon);
            for (int axis : {1, 0}) {
                for (bool low : {true, false}) {
                    Carve cv;
                    if (!carve_slice(blk.polygon, axis, low, need, req.exclusion_radius, cv)) {
                        continue;
                    }
                    if (req.adjacency == Adjacency::kBoundary && !touches_outline(cv.slice, buildable, axis, cv.cut)) {
                        continue;
                    }
                    if (req.adjacency == Adjacency::kRoad && !(measure_frontage(cv.slice, lines, 1e-6).length > 0.0)) {
                        continue;
                    }
                    const double elev =
                        req.lowest_elevation ? params.terrain.at(frame.to_world(polygon_centroid(cv.slice))) : 0.0;
                    bool better = false;
                    if (best < 0) {
                        better = true;
                    } else if (req.lowest_elevation && std::abs(elev - best_elev) > 1e-9) {
                        better = elev < best_elev;
                    } else {
                        better = area > best_area + 1e-9;
                    }
                    if (better) {
                        best = static_cast<int>(i);
                        best_carve = std::move(cv);
                        best_elev = elev;
                        best_area = area;
                    }
                }
            }
        }

        if (best < 0) {
            PlacementIssue issue;
            issue.kind = ErrorKind::kPlacementInfeasible;
            issue.element = name;
            std::ostringstream msg;
            msg << "no block can host " << need << " m2 with "
                << (req.adjacency == Adjacency::kBoundary ? "boundary" : "road") << " adjacency";
            issue.message = msg.str();
            out.issues.push_back(std::move(issue));
            continue;
        }

        const Block host = out.remaining[static_cast<size_t>(best)];
        InfrastructureElement e;
        e.id = next_id++;
        e.kind = req.kind;
        e.polygon = std::move(best_carve.slice);
        e.anchor = polygon_centroid(e.polygon);
        e.exclusion_radius = req.exclusion_radius;
        e.adjacency = req.adjacency;
        e.adjacency_met = true;
        e.elevation = params.terrain.at(frame.to_world(e.anchor));
        e.service_radius = req.service_radius;
        out.elements.push_back(std::move(e));

        for (auto& m : best_carve.margin) {
            if (polygon_area(m) > kAreaEps) {
                out.open_spaces.push_back(OpenSpace{std::move(m), OpenSpaceKind::kExclusionMargin});
            }
        }
        out.remaining.erase(out.remaining.begin() + best);
        for (auto& r : best_carve.rest) {
            const double rest_area = polygon_area(r);
            if (rest_area >= params.lot_area_min) {
                out.remaining.push_back(Block{std::move(r), host.order});
            } else if (rest_area > kAreaEps) {
                out.open_spaces.push_back(OpenSpace{std::move(r), OpenSpaceKind::kResidual});
            }
        }
    }

    // Keep subdivision order independent of placement order.
    std::stable_sort(out.remaining.begin(), out.remaining.end(),
                     [](const Block& a, const Block& b) { return a.order < b.order; });
    return out;
}

}  // namespace parkgen
