#include "parkgen/params.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace parkgen {

LotSizeRange lot_size_defaults(IndustryType industry) {
    switch (industry) {
    case IndustryType::kLightManufacturing:
        return LotSizeRange{2000.0, 4000.0, 10000.0};
    case IndustryType::kMediumManufacturing:
        return LotSizeRange{5000.0, 12000.0, 30000.0};
    case IndustryType::kHeavyManufacturing:
        return LotSizeRange{10000.0, 25000.0, 50000.0};
    case IndustryType::kWarehouse:
        return LotSizeRange{2000.0, 8000.0, 20000.0};
    case IndustryType::kMixed:
        return LotSizeRange{800.0, 1200.0, 2400.0};
    }
    throw std::invalid_argument("lot_size_defaults: unknown industry");
}

const char* industry_name(IndustryType industry) {
    switch (industry) {
    case IndustryType::kLightManufacturing:
        return "light";
    case IndustryType::kMediumManufacturing:
        return "medium";
    case IndustryType::kHeavyManufacturing:
        return "heavy";
    case IndustryType::kWarehouse:
        return "warehouse";
    case IndustryType::kMixed:
        return "mixed";
    }
    return "unknown";
}

IndustryType parse_industry(const std::string& s) {
    if (s == "light") {
        return IndustryType::kLightManufacturing;
    }
    if (s == "medium") {
        return IndustryType::kMediumManufacturing;
    }
    if (s == "heavy") {
        return IndustryType::kHeavyManufacturing;
    }
    if (s == "warehouse") {
        return IndustryType::kWarehouse;
    }
    if (s == "mixed") {
        return IndustryType::kMixed;
    }
    throw std::invalid_argument("Unknown industry: " + s + " (expected light|medium|heavy|warehouse|mixed)");
}

const char* infrastructure_kind_name(InfrastructureKind kind) {
    switch (kind) {
    case InfrastructureKind::kDetentionPond:
        return "detention-pond";
    case InfrastructureKind::kWaterTreatment:
        return "water-treatment";
    case InfrastructureKind::kWastewaterTreatment:
        return "wastewater-treatment";
    case InfrastructureKind::kSubstation:
        return "substation";
    }
    return "unknown";
}

double required_area(const InfrastructureRequirement& req, double site_area) {
    if (req.area > 0.0) {
        return req.area;
    }
    double a = req.area_fraction * site_area;
    if (req.min_area > 0.0) {
        a = std::max(a, req.min_area);
    }
    if (req.max_area > 0.0) {
        a = std::min(a, req.max_area);
    }
    return a;
}

std::vector<InfrastructureRequirement> default_infrastructure() {
    std::vector<InfrastructureRequirement> out;

    InfrastructureRequirement pond;
    pond.kind = InfrastructureKind::kDetentionPond;
    pond.area_fraction = 0.03;
    pond.adjacency = Adjacency::kBoundary;
    pond.lowest_elevation = true;
    pond.priority = 0;
    out.push_back(pond);

    InfrastructureRequirement substation;
    substation.kind = InfrastructureKind::kSubstation;
    substation.area_fraction = 0.01;
    substation.min_area = 1600.0;   // 1 rai
    substation.max_area = 16000.0;  // 10 rai
    substation.exclusion_radius = 10.0;
    substation.adjacency = Adjacency::kRoad;
    substation.priority = 1;
    substation.service_radius = 800.0;
    out.push_back(substation);

    InfrastructureRequirement wtp;
    wtp.kind = InfrastructureKind::kWaterTreatment;
    wtp.area_fraction = 0.005;
    wtp.exclusion_radius = 10.0;
    wtp.adjacency = Adjacency::kRoad;
    wtp.priority = 2;
    wtp.service_radius = 600.0;
    out.push_back(wtp);

    InfrastructureRequirement wwtp = wtp;
    wwtp.kind = InfrastructureKind::kWastewaterTreatment;
    wwtp.priority = 3;
    out.push_back(wwtp);

    return out;
}

ParameterSet parameters_for_industry(IndustryType industry) {
    ParameterSet p;
    const LotSizeRange r = lot_size_defaults(industry);
    p.industry = industry;
    p.lot_area_min = r.min_area;
    p.lot_area_target = r.target_area;
    p.lot_area_max = r.max_area;
    return p;
}

void validate_parameters(const ParameterSet& p) {
    if (!(p.lot_area_min > 0.0)) {
        throw std::invalid_argument("lot_area_min must be > 0");
    }
    if (!(p.lot_area_min <= p.lot_area_target && p.lot_area_target <= p.lot_area_max)) {
        throw std::invalid_argument("lot areas must satisfy min <= target <= max");
    }
    if (p.min_lot_count < 0) {
        throw std::invalid_argument("min_lot_count must be >= 0");
    }
    if (!(p.primary_row_width > 0.0) || !(p.secondary_row_width > 0.0) || !(p.access_row_width > 0.0)) {
        throw std::invalid_argument("road widths must be > 0");
    }
    if (!(p.perimeter_buffer >= 0.0)) {
        throw std::invalid_argument("perimeter_buffer must be >= 0");
    }
    if (!(p.salable_target > 0.0 && p.salable_target <= 1.0) || !(p.salable_ceiling > 0.0 && p.salable_ceiling <= 1.0)) {
        throw std::invalid_argument("salable_target and salable_ceiling must be in (0, 1]");
    }
    if (!(p.green_target >= 0.0 && p.green_target < 1.0)) {
        throw std::invalid_argument("green_target must be in [0, 1)");
    }
    if (p.entrance_count < 1) {
        throw std::invalid_argument("entrance_count must be >= 1");
    }
    for (const auto& req : p.infrastructure) {
        if (!(req.area >= 0.0) || !(req.area_fraction >= 0.0) || !(req.exclusion_radius >= 0.0)) {
            throw std::invalid_argument(std::string("invalid infrastructure requirement: ") +
                                        infrastructure_kind_name(req.kind));
        }
        if (req.area == 0.0 && req.area_fraction == 0.0 && req.min_area == 0.0) {
            throw std::invalid_argument(std::string("infrastructure requirement has no footprint: ") +
                                        infrastructure_kind_name(req.kind));
        }
    }
    double wsum = 0.0;
    for (double w : p.score_weights) {
        if (!(w >= 0.0)) {
            throw std::invalid_argument("score weights must be >= 0");
        }
        wsum += w;
    }
    if (!(wsum > 0.0)) {
        throw std::invalid_argument("score weights must not all be zero");
    }

    const auto& f = p.financial;
    if (!(f.water_pipe_cost_per_m >= 0.0) || !(f.sewer_pipe_cost_per_m >= 0.0) ||
        !(f.power_cable_cost_per_m >= 0.0) || !(f.service_connection_cost >= 0.0)) {
        throw std::invalid_argument("utility costs must be >= 0");
    }

    const auto& r = p.roads;
    if (!(r.max_road_distance >= 0.0) || !(r.coverage_target >= 0.0 && r.coverage_target <= 1.0) ||
        !(r.sample_step >= 0.0)) {
        throw std::invalid_argument("invalid road network options");
    }
    if (!(r.spine_min_fraction > 0.0 && r.spine_min_fraction <= r.spine_max_fraction && r.spine_max_fraction < 1.0)) {
        throw std::invalid_argument("spine fractions must satisfy 0 < min <= max < 1");
    }

    const auto& e = p.entrances;
    if (!(e.corner_setback >= 0.0) || !(e.min_spacing >= 0.0) || !(e.alignment_tolerance >= 0.0) ||
        e.top_candidates < 1) {
        throw std::invalid_argument("invalid entrance options");
    }

    const auto& s = p.subdivision;
    if (!(s.max_aspect >= 1.0) || !(s.min_frontage > 0.0) || !(s.relax_factor >= 1.0) ||
        !(s.cut_jitter >= 0.0 && s.cut_jitter < 0.5) || s.max_depth < 1) {
        throw std::invalid_argument("invalid subdivision options");
    }

    const auto& t = p.timeline;
    if (t.lots_per_phase < 1 || !(t.road_days_per_km > 0.0) || !(t.road_min_days >= 0.0) ||
        !(t.grading_days_per_ha > 0.0) || !(t.landscaping_days_per_ha > 0.0)) {
        throw std::invalid_argument("invalid timeline options");
    }

    const auto& o = p.optimizer;
    if (o.population < 4) {
        throw std::invalid_argument("optimizer population must be >= 4");
    }
    if (o.generations < 1) {
        throw std::invalid_argument("optimizer generations must be >= 1");
    }
    if (!(o.crossover_rate >= 0.0 && o.crossover_rate <= 1.0) || !(o.mutation_rate >= 0.0 && o.mutation_rate <= 1.0)) {
        throw std::invalid_argument("optimizer rates must be in [0, 1]");
    }
    if (!(o.mutation_sigma > 0.0) || o.tournament_size < 2 || o.stagnation_window < 0 ||
        !(o.stagnation_tolerance >= 0.0) || !(o.time_limit_s >= 0.0) || o.threads < 0 || o.log_every < 0) {
        throw std::invalid_argument("invalid optimizer options");
    }
}

}  // namespace parkgen
