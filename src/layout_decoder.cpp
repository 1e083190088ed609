#include "parkgen/layout_decoder.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include "parkgen/errors.hpp"
#include "parkgen/infrastructure_placer.hpp"
#include "parkgen/lot_subdivision.hpp"
#include "parkgen/road_network.hpp"
#include "parkgen/utility_router.hpp"

namespace parkgen {

namespace {

constexpr double kRadToDeg = 180.0 / 3.14159265358979323846;

Polyline to_world(const LocalFrame& frame, const Polyline& line) {
    Polyline out;
    out.reserve(line.size());
    for (const auto& p : line) {
        out.push_back(frame.to_world(p));
    }
    return out;
}

Polygon buildable_region(const Polygon& ring, double buffer) {
    if (!(buffer > 0.0)) {
        return ring;
    }
    return offset_inward(ring, buffer);
}

}  // namespace

DecodeContext prepare_decode(const Polygon& boundary, const Polyline* reference, const ParameterSet& params) {
    DecodeContext ctx;
    ctx.boundary = make_boundary(boundary);
    ctx.site_area = polygon_area(ctx.boundary);
    ctx.origin = polygon_centroid(ctx.boundary);
    if (reference != nullptr && reference->size() >= 2) {
        ctx.has_reference = true;
        ctx.reference = *reference;
    }

    const Polygon inner = buildable_region(ctx.boundary, params.perimeter_buffer);
    if (inner.size() < 3 || !(polygon_area(inner) > 0.0)) {
        throw InfeasibleGeometry("no buildable area remains inside a " + std::to_string(params.perimeter_buffer) +
                                 " m perimeter buffer");
    }

    ctx.ranked_edges = rank_entrance_edges(ctx.boundary, ctx.has_reference ? &ctx.reference : nullptr, params);
    ctx.obb = min_area_obb(ctx.boundary);
    return ctx;
}

double genome_lot_area(const Genome& genome, const ParameterSet& params) {
    const double scale = 0.85 + 0.3 * std::clamp(genome[kGeneLotTargetArea], 0.0, 1.0);
    return std::clamp(params.lot_area_target * scale, params.lot_area_min, params.lot_area_max);
}

double genome_lot_depth(const Genome& genome, const ParameterSet& params) {
    // Depth:width ratio in [1, 2].
    const double ratio = 1.0 + std::clamp(genome[kGeneLotDepth], 0.0, 1.0);
    return std::sqrt(genome_lot_area(genome, params) * ratio);
}

CandidateLayout decode_layout(const DecodeContext& ctx, const Genome& genome, const ParameterSet& params) {
    CandidateLayout layout;
    layout.boundary = ctx.boundary;
    layout.genome = genome;

    // Frame: along the primary frontage edge, or along the long side of the minimum-area box.
    const int primary = primary_candidate_index(ctx.ranked_edges, params, genome[kGeneEntranceChoice]);
    const EntranceCandidate& front = ctx.ranked_edges[static_cast<size_t>(primary)];
    double angle = ctx.obb.angle_deg;
    if (genome[kGeneOrientation] < 0.5) {
        angle = std::atan2(front.b.y - front.a.y, front.b.x - front.a.x) * kRadToDeg;
    }
    const LocalFrame frame{ctx.origin, angle};
    layout.frame_angle_deg = angle;

    EntrancePlan plan = place_entrances(ctx.ranked_edges, params, angle, genome[kGeneEntranceChoice],
                                        genome[kGeneEntranceOffset]);
    layout.dropped_entrances = plan.dropped;

    const Polygon local_boundary = frame.to_local(ctx.boundary);
    const double buffer = params.perimeter_buffer;
    const Polygon buildable = buildable_region(local_boundary, buffer);
    if (buildable.size() < 3 || !(polygon_area(buildable) > 0.0)) {
        throw InfeasibleGeometry("buildable area after perimeter buffer is empty");
    }

    const double lot_area = genome_lot_area(genome, params);
    const double depth = genome_lot_depth(genome, params);
    layout.lot_depth = depth;

    // Entrances pin the road pattern: a secondary road through each north/south facing entrance,
    // the spine through a side-facing primary entrance.
    RoadLayoutInput rin;
    rin.buildable = buildable;
    rin.spine_fraction = genome[kGeneSpineOffset];
    rin.lot_depth = depth;
    rin.phase = genome[kGeneSecondaryPhase];
    std::vector<Entrance> local_entrances;
    std::vector<Point> local_normals;
    for (size_t i = 0; i < plan.entrances.size(); ++i) {
        Entrance e = plan.entrances[i];
        e.point = frame.to_local(e.point);
        const Point n = rotate_point(plan.inward_normals[i], -angle);
        const Point hit{e.point.x + buffer * n.x, e.point.y + buffer * n.y};
        if (std::abs(n.y) >= std::abs(n.x)) {
            rin.forced_secondaries.push_back(hit);
        } else if (e.primary) {
            rin.has_forced_spine = true;
            rin.forced_spine_at = hit;
        } else {
            ++layout.dropped_entrances;
            continue;
        }
        local_entrances.push_back(e);
        local_normals.push_back(n);
    }

    RoadLayout roads = generate_road_network(rin, params);

    // Access connectors through the perimeter buffer.
    double connector_area = 0.0;
    if (buffer > 0.0) {
        int next_id = static_cast<int>(roads.network.segments.size());
        for (size_t i = 0; i < local_entrances.size(); ++i) {
            RoadSegment conn = make_entrance_connector(local_entrances[i], local_normals[i], buffer,
                                                       params.access_row_width, next_id++);
            local_entrances[i].connector_road = conn.id;
            connector_area += polygon_area(conn.row);
            roads.network.segments.push_back(std::move(conn));
        }
        link_road_segments(roads.network);
    } else {
        // Entrance sits directly on the buildable edge; attach it to the closest road.
        for (auto& e : local_entrances) {
            double best = std::numeric_limits<double>::infinity();
            for (const auto& s : roads.network.segments) {
                for (size_t k = 1; k < s.centerline.size(); ++k) {
                    const double dd = point_segment_distance(e.point, s.centerline[k - 1], s.centerline[k]);
                    if (dd < best) {
                        best = dd;
                        e.connector_road = s.id;
                    }
                }
            }
        }
    }

    InfrastructurePlacement infra =
        place_infrastructure(roads.blocks, buildable, roads.network, frame, ctx.site_area, params);
    SubdivisionResult sub =
        subdivide_blocks(infra.remaining, roads.network.frontage_lines(), params, lot_area, genome.cut_seed());

    // Back to world coordinates.
    layout.buildable = frame.to_world(buildable);
    layout.buffer_area = std::max(0.0, polygon_area(local_boundary) - polygon_area(buildable) - connector_area);

    layout.roads = std::move(roads.network);
    for (auto& s : layout.roads.segments) {
        s.centerline = to_world(frame, s.centerline);
        s.row = frame.to_world(s.row);
    }
    for (auto& f : layout.roads.frontage) {
        f.a = frame.to_world(f.a);
        f.b = frame.to_world(f.b);
    }

    for (auto& e : infra.elements) {
        e.polygon = frame.to_world(e.polygon);
        e.anchor = frame.to_world(e.anchor);
    }
    layout.infrastructure = std::move(infra.elements);
    layout.placement_issues = std::move(infra.issues);

    for (auto& lot : sub.lots) {
        lot.polygon = frame.to_world(lot.polygon);
    }
    layout.lots = std::move(sub.lots);

    for (auto& o : infra.open_spaces) {
        o.polygon = frame.to_world(o.polygon);
        layout.open_spaces.push_back(std::move(o));
    }
    for (auto& o : sub.residuals) {
        o.polygon = frame.to_world(o.polygon);
        layout.open_spaces.push_back(std::move(o));
    }

    for (auto& e : local_entrances) {
        e.point = frame.to_world(e.point);
        layout.entrances.push_back(e);
    }
    layout.utilities = route_utilities(layout, params);
    return layout;
}

}  // namespace parkgen
