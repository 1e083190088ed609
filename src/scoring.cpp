#include "parkgen/scoring.hpp"

#include <algorithm>
#include <cmath>
#include <map>

#include "parkgen/lot_subdivision.hpp"
#include "parkgen/utility_router.hpp"

namespace parkgen {

namespace {

constexpr double kPreferredAspect = 1.5;

double clamp01(double v) {
    if (!std::isfinite(v)) {
        return 0.0;
    }
    return std::min(1.0, std::max(0.0, v));
}

double compliance_score(const ViolationReport& report) {
    const double hard = 0.25 * report.hard_count() + 0.25 * std::min(1.0, report.hard_magnitude());
    const double soft = 0.5 * std::min(1.0, report.soft_penalty());
    return clamp01(1.0 - hard - soft);
}

double financial_score(const CandidateLayout& layout, const ParameterSet& params) {
    const FinancialParams& f = params.financial;
    const double site = layout.site_area();
    const double potential = site * f.land_price_per_m2;
    if (!(potential > 0.0)) {
        return 0.0;
    }
    const double revenue = layout.lot_area() * f.land_price_per_m2;
    double utility_cost = 0.0;
    for (const auto& u : utilities_of(layout, params)) {
        utility_cost += u.cost;
    }
    const double cost = layout.roads.row_area() * f.road_cost_per_m2 +
                        layout.infrastructure_area() * f.infrastructure_cost_per_m2 +
                        site * f.site_prep_cost_per_m2 + utility_cost;
    return clamp01((revenue - cost) / potential);
}

// 1 at or under 10 months, falling linearly to 0 at 24 months.
double duration_score(double days) {
    const double months = days / 30.0;
    return clamp01((24.0 - months) / 14.0);
}

double utility_score(const CandidateLayout& layout, const ParameterSet& params) {
    std::map<InfrastructureKind, double> wanted;
    for (const auto& req : params.infrastructure) {
        if (req.service_radius > 0.0) {
            wanted[req.kind] = req.service_radius;
        }
    }
    if (wanted.empty()) {
        return 1.0;
    }
    if (layout.lots.empty()) {
        return 0.0;
    }
    double acc = 0.0;
    for (const auto& kv : wanted) {
        int served = 0;
        for (const auto& lot : layout.lots) {
            const Point c = polygon_centroid(lot.polygon);
            for (const auto& e : layout.infrastructure) {
                if (e.kind != kv.first) {
                    continue;
                }
                const double r = e.service_radius > 0.0 ? e.service_radius : kv.second;
                if (point_in_polygon(c, e.polygon) || point_ring_distance(c, e.polygon) <= r) {
                    ++served;
                    break;
                }
            }
        }
        acc += static_cast<double>(served) / static_cast<double>(layout.lots.size());
    }
    return acc / static_cast<double>(wanted.size());
}

}  // namespace

const char* score_dimension_name(ScoreDimension d) {
    switch (d) {
    case ScoreDimension::kCompliance:
        return "compliance";
    case ScoreDimension::kEfficiency:
        return "efficiency";
    case ScoreDimension::kLotQuality:
        return "lot-quality";
    case ScoreDimension::kFinancial:
        return "financial";
    case ScoreDimension::kConstructability:
        return "constructability";
    case ScoreDimension::kEnvironmental:
        return "environmental";
    case ScoreDimension::kUtilityCoverage:
        return "utility-coverage";
    }
    return "unknown";
}

std::string grade_for(double s) {
    if (s >= 95.0) {
        return "A+";
    }
    if (s >= 90.0) {
        return "A";
    }
    if (s >= 85.0) {
        return "B+";
    }
    if (s >= 80.0) {
        return "B";
    }
    if (s >= 75.0) {
        return "C+";
    }
    if (s >= 70.0) {
        return "C";
    }
    if (s >= 65.0) {
        return "D+";
    }
    if (s >= 60.0) {
        return "D";
    }
    return "F";
}

double lot_quality(const std::vector<Lot>& lots, const ParameterSet& params) {
    if (lots.empty()) {
        return 0.0;
    }
    const double max_aspect = params.subdivision.max_aspect;
    double acc = 0.0;
    for (const auto& lot : lots) {
        const double r = lot_aspect_ratio(lot.polygon);
        if (r > max_aspect + 1e-9) {
            continue;
        }
        const double span = std::max(max_aspect - kPreferredAspect, kPreferredAspect - 1.0);
        acc += clamp01(1.0 - 0.5 * std::abs(r - kPreferredAspect) / span);
    }
    return acc / static_cast<double>(lots.size());
}

double lot_regularity(const std::vector<Lot>& lots) {
    if (lots.empty()) {
        return 0.0;
    }
    double acc = 0.0;
    for (const auto& lot : lots) {
        const OrientedBox box = min_area_obb(lot.polygon);
        const double boxed = box.length * box.breadth;
        if (boxed > 0.0) {
            acc += clamp01(polygon_area(lot.polygon) / boxed);
        }
    }
    return acc / static_cast<double>(lots.size());
}

ScoreVector score_layout(const CandidateLayout& layout,
                         const LayoutMetrics& metrics,
                         const ViolationReport& report,
                         const TimelineResult& timeline,
                         const ParameterSet& params) {
    ScoreVector sv;
    auto set = [&sv](ScoreDimension d, double v) { sv.values[static_cast<size_t>(d)] = clamp01(v); };

    set(ScoreDimension::kCompliance, compliance_score(report));
    set(ScoreDimension::kEfficiency,
        params.salable_ceiling > 0.0 ? metrics.salable_fraction / params.salable_ceiling : 0.0);
    set(ScoreDimension::kLotQuality, lot_quality(layout.lots, params));
    set(ScoreDimension::kFinancial, financial_score(layout, params));
    set(ScoreDimension::kConstructability,
        0.6 * duration_score(timeline.total_duration_days) + 0.4 * lot_regularity(layout.lots));
    set(ScoreDimension::kEnvironmental,
        params.green_target > 0.0 ? metrics.green_fraction / params.green_target : 1.0);
    set(ScoreDimension::kUtilityCoverage, utility_score(layout, params));

    double wsum = 0.0;
    double acc = 0.0;
    for (size_t i = 0; i < sv.values.size(); ++i) {
        wsum += params.score_weights[i];
        acc += params.score_weights[i] * sv.values[i];
    }
    sv.aggregate = wsum > 0.0 ? acc / wsum : 0.0;
    sv.grade = grade_for(100.0 * sv.aggregate);
    return sv;
}

LayoutComparison compare_layouts(const std::vector<ScoreVector>& scores) {
    LayoutComparison cmp;
    cmp.best_by_dimension.fill(-1);
    for (size_t i = 0; i < scores.size(); ++i) {
        const int idx = static_cast<int>(i);
        if (cmp.best_overall < 0 || scores[i].aggregate > scores[static_cast<size_t>(cmp.best_overall)].aggregate) {
            cmp.best_overall = idx;
        }
        for (size_t d = 0; d < cmp.best_by_dimension.size(); ++d) {
            const int cur = cmp.best_by_dimension[d];
            if (cur < 0 || scores[i].values[d] > scores[static_cast<size_t>(cur)].values[d]) {
                cmp.best_by_dimension[d] = idx;
            }
        }
    }
    return cmp;
}

}  // namespace parkgen
