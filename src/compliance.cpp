#include "parkgen/compliance.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

#include "parkgen/lot_subdivision.hpp"
#include "parkgen/road_network.hpp"
#include "parkgen/spatial_hash_grid.hpp"

namespace parkgen {

namespace {

constexpr double kGeomTol = 1e-5;

double min_width_of(const RoadNetwork& net, RoadClass rc) {
    double w = std::numeric_limits<double>::infinity();
    for (const auto& s : net.segments) {
        if (s.road_class == rc) {
            w = std::min(w, s.width);
        }
    }
    return w;
}

double buffer_width(const Polygon& boundary, const Polygon& buildable) {
    if (buildable.size() < 3) {
        return 0.0;
    }
    double best = std::numeric_limits<double>::infinity();
    for (const auto& p : buildable) {
        best = std::min(best, point_ring_distance(p, boundary));
    }
    for (const auto& p : boundary) {
        best = std::min(best, point_ring_distance(p, buildable));
    }
    return best;
}

// Pairs (a in first set, b in second set) whose polygons overlap with positive area.
// With `same_set`, each unordered pair of the first set is counted once.
int count_overlaps(const std::vector<const Polygon*>& first,
                   const std::vector<const Polygon*>& second,
                   bool same_set) {
    if (first.empty() || second.empty()) {
        return 0;
    }
    std::vector<Polygon> all;
    for (const Polygon* p : second) {
        all.push_back(*p);
    }
    SpatialHashGrid grid(suggested_cell_size(all));
    for (size_t i = 0; i < second.size(); ++i) {
        if (second[i]->size() >= 3) {
            grid.insert(static_cast<int>(i), polygon_bbox(*second[i]));
        }
    }

    int count = 0;
    std::vector<int> cand;
    for (size_t i = 0; i < first.size(); ++i) {
        if (first[i]->size() < 3) {
            continue;
        }
        grid.query_into(cand, polygon_bbox(*first[i]));
        for (int j : cand) {
            if (same_set && static_cast<size_t>(j) <= i) {
                continue;
            }
            if (polygons_overlap_strict(*first[i], *second[static_cast<size_t>(j)], kGeomTol)) {
                ++count;
            }
        }
    }
    return count;
}

}  // namespace

double metric_value(const LayoutMetrics& m, Quantity q) {
    switch (q) {
    case Quantity::kSalableFraction:
        return m.salable_fraction;
    case Quantity::kGreenFraction:
        return m.green_fraction;
    case Quantity::kRoadFraction:
        return m.road_fraction;
    case Quantity::kMinPrimaryRow:
        return m.min_primary_row;
    case Quantity::kMinSecondaryRow:
        return m.min_secondary_row;
    case Quantity::kPerimeterBuffer:
        return m.perimeter_buffer;
    case Quantity::kLotCount:
        return m.lot_count;
    case Quantity::kLotsWithoutFrontage:
        return m.lots_without_frontage;
    case Quantity::kUndersizedLots:
        return m.undersized_lots;
    case Quantity::kOversizedLots:
        return m.oversized_lots;
    case Quantity::kAspectViolations:
        return m.aspect_violations;
    case Quantity::kLotOverlaps:
        return m.lot_overlaps;
    case Quantity::kInfrastructureOverlaps:
        return m.infrastructure_overlaps;
    case Quantity::kExclusionBreaches:
        return m.exclusion_breaches;
    case Quantity::kRoadComponents:
        return m.road_components;
    case Quantity::kEntranceCount:
        return m.entrance_count;
    case Quantity::kPlacementFailures:
        return m.placement_failures;
    case Quantity::kLotDeficit:
        return m.lot_deficit;
    case Quantity::kCoverageFraction:
        return m.coverage_fraction;
    case Quantity::kUncoveredArea:
        return m.uncovered_area;
    }
    return 0.0;
}

LayoutMetrics measure_layout(const CandidateLayout& layout, const ParameterSet& params) {
    LayoutMetrics m;
    m.site_area = layout.site_area();
    if (!(m.site_area > 0.0)) {
        throw std::invalid_argument("measure_layout: layout has no boundary");
    }

    const double lots_area = layout.lot_area();
    const double roads_area = layout.roads.row_area();
    const double infra_area = layout.infrastructure_area();
    const double open_area = layout.open_space_area();
    double pond_area = 0.0;
    for (const auto& e : layout.infrastructure) {
        if (e.kind == InfrastructureKind::kDetentionPond) {
            pond_area += polygon_area(e.polygon);
        }
    }

    m.salable_fraction = lots_area / m.site_area;
    m.green_fraction = (layout.buffer_area + open_area + pond_area) / m.site_area;
    m.road_fraction = roads_area / m.site_area;
    m.min_primary_row = min_width_of(layout.roads, RoadClass::kPrimary);
    m.min_secondary_row = min_width_of(layout.roads, RoadClass::kSecondary);
    m.perimeter_buffer = buffer_width(layout.boundary, layout.buildable);

    const auto& so = params.subdivision;
    m.lot_count = static_cast<int>(layout.lots.size());
    for (const auto& lot : layout.lots) {
        const double fr = measure_frontage(lot.polygon, layout.roads.frontage_lines(), kGeomTol).length;
        if (fr < so.min_frontage - 1e-6) {
            ++m.lots_without_frontage;
        }
        const double a = polygon_area(lot.polygon);
        if (a < params.lot_area_min * (1.0 - 1e-9)) {
            ++m.undersized_lots;
        }
        if (a > params.lot_area_max * (1.0 + 1e-9)) {
            ++m.oversized_lots;
        }
        if (lot_aspect_ratio(lot.polygon) > so.max_aspect + 1e-9) {
            ++m.aspect_violations;
        }
    }

    std::vector<const Polygon*> lot_polys;
    std::vector<const Polygon*> road_polys;
    std::vector<const Polygon*> infra_polys;
    for (const auto& lot : layout.lots) {
        lot_polys.push_back(&lot.polygon);
    }
    for (const auto& s : layout.roads.segments) {
        road_polys.push_back(&s.row);
    }
    for (const auto& e : layout.infrastructure) {
        infra_polys.push_back(&e.polygon);
    }
    m.lot_overlaps = count_overlaps(lot_polys, lot_polys, true) + count_overlaps(lot_polys, road_polys, false);
    m.infrastructure_overlaps = count_overlaps(infra_polys, lot_polys, false) +
                                count_overlaps(infra_polys, road_polys, false) +
                                count_overlaps(infra_polys, infra_polys, true);

    for (const auto& e : layout.infrastructure) {
        if (!(e.exclusion_radius > 0.0)) {
            continue;
        }
        const BoundingBox eb = polygon_bbox(e.polygon);
        for (const auto& lot : layout.lots) {
            const BoundingBox lb = polygon_bbox(lot.polygon);
            if (lb.min_x > eb.max_x + e.exclusion_radius || lb.max_x < eb.min_x - e.exclusion_radius ||
                lb.min_y > eb.max_y + e.exclusion_radius || lb.max_y < eb.min_y - e.exclusion_radius) {
                continue;
            }
            if (polygon_distance(lot.polygon, e.polygon) < e.exclusion_radius - 1e-6) {
                ++m.exclusion_breaches;
            }
        }
    }

    m.road_components = road_component_count(layout.roads.segments, kGeomTol);
    m.entrance_count = static_cast<int>(layout.entrances.size());
    m.placement_failures = static_cast<int>(layout.placement_issues.size());
    m.lot_deficit = std::max(0, params.min_lot_count - m.lot_count);

    const double depth = (layout.lot_depth > 0.0) ? layout.lot_depth : std::sqrt(2.0 * params.lot_area_target);
    const double max_dist = (params.roads.max_road_distance > 0.0) ? params.roads.max_road_distance : 1.05 * depth;
    m.coverage_fraction = road_coverage(layout.buildable, layout.roads.segments, max_dist, params.roads.sample_step);

    m.uncovered_area = m.site_area - (lots_area + roads_area + infra_area + open_area + layout.buffer_area);
    m.road_length = layout.roads.total_length();
    m.road_length_per_ha = m.road_length / (m.site_area / 10000.0);
    return m;
}

int ViolationReport::hard_count() const {
    int n = 0;
    for (const auto& kv : violations) {
        if (kv.second.severity == Severity::kHard) {
            ++n;
        }
    }
    return n;
}

int ViolationReport::soft_count() const {
    return static_cast<int>(violations.size()) - hard_count();
}

double ViolationReport::hard_magnitude() const {
    double acc = 0.0;
    for (const auto& kv : violations) {
        if (kv.second.severity == Severity::kHard) {
            acc += kv.second.magnitude;
        }
    }
    return acc;
}

double ViolationReport::soft_penalty() const {
    double acc = 0.0;
    for (const auto& kv : violations) {
        if (kv.second.severity == Severity::kSoft) {
            acc += kv.second.magnitude;
        }
    }
    return acc;
}

ViolationReport evaluate_rules(const LayoutMetrics& metrics, const RuleSet& rules) {
    ViolationReport report;
    for (const auto& r : rules.rules) {
        const double measured = metric_value(metrics, r.quantity);
        if (rule_holds(r.comparison, measured, r.threshold)) {
            continue;
        }
        Violation v;
        v.rule_id = r.id;
        v.severity = r.severity;
        v.measured = measured;
        v.threshold = r.threshold;
        v.magnitude = violation_magnitude(measured, r.threshold);
        if (!std::isfinite(v.magnitude)) {
            v.magnitude = 1e6;
        }
        std::ostringstream msg;
        msg << (r.message.empty() ? r.id : r.message) << " (" << quantity_name(r.quantity) << " = " << measured
            << ", required " << comparison_symbol(r.comparison) << " " << r.threshold << ")";
        v.message = msg.str();
        report.violations[r.id] = std::move(v);
    }
    return report;
}

ViolationReport validate_layout(const CandidateLayout& layout, const RuleSet& rules, const ParameterSet& params) {
    return evaluate_rules(measure_layout(layout, params), rules);
}

}  // namespace parkgen
