#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

#include "parkgen/geometry.hpp"

namespace parkgen {

enum class IndustryType {
    kLightManufacturing = 0,
    kMediumManufacturing = 1,
    kHeavyManufacturing = 2,
    kWarehouse = 3,
    kMixed = 4,
};

struct LotSizeRange {
    double min_area = 0.0;
    double target_area = 0.0;
    double max_area = 0.0;
};

// Typical plot sizes per industry (m^2).
LotSizeRange lot_size_defaults(IndustryType industry);
const char* industry_name(IndustryType industry);
IndustryType parse_industry(const std::string& s);

enum class InfrastructureKind {
    kDetentionPond = 0,
    kWaterTreatment = 1,
    kWastewaterTreatment = 2,
    kSubstation = 3,
};

const char* infrastructure_kind_name(InfrastructureKind kind);

enum class Adjacency {
    kNone = 0,
    kRoad = 1,      // one side on a road right-of-way
    kBoundary = 2,  // one side on the perimeter buffer
};

struct InfrastructureRequirement {
    InfrastructureKind kind = InfrastructureKind::kSubstation;

    // Footprint: fixed area if > 0, otherwise area_fraction * site area clamped to [min_area, max_area]
    // (a bound of 0 is ignored).
    double area = 0.0;
    double area_fraction = 0.0;
    double min_area = 0.0;
    double max_area = 0.0;

    double exclusion_radius = 0.0;  // minimum clearance to any lot
    Adjacency adjacency = Adjacency::kRoad;
    bool lowest_elevation = false;
    int priority = 0;               // lower places first
    double service_radius = 0.0;    // 0 = not a utility for coverage scoring
};

double required_area(const InfrastructureRequirement& req, double site_area);

// Detention pond, substation, water and wastewater treatment with IEAT-style sizing.
std::vector<InfrastructureRequirement> default_infrastructure();

// Planar terrain: z = base + grad_x * x + grad_y * y (world coordinates).
struct ElevationModel {
    double base = 0.0;
    double grad_x = 0.0;
    double grad_y = 0.0;

    double at(const Point& p) const { return base + grad_x * p.x + grad_y * p.y; }
};

struct FinancialParams {
    double land_price_per_m2 = 120.0;
    double road_cost_per_m2 = 45.0;
    double infrastructure_cost_per_m2 = 250.0;
    double site_prep_cost_per_m2 = 8.0;
    // Utility mains and service laterals, per metre of pipe or cable.
    double water_pipe_cost_per_m = 60.0;
    double sewer_pipe_cost_per_m = 95.0;
    double power_cable_cost_per_m = 50.0;
    double service_connection_cost = 300.0;  // per lot and utility
};

constexpr int kScoreDimensionCount = 7;
using ScoreWeights = std::array<double, kScoreDimensionCount>;

struct RoadNetworkOptions {
    // Maximum distance from any buildable point to a road edge; 0 = 1.05 * lot depth.
    double max_road_distance = 0.0;
    double coverage_target = 0.95;
    // Coverage sample spacing in metres; 0 = derived from the buildable area.
    double sample_step = 0.0;

    // Spine position range as a fraction of the buildable depth.
    double spine_min_fraction = 0.3;
    double spine_max_fraction = 0.7;

    bool prune = true;
};

struct EntranceOptions {
    double corner_setback = 50.0;
    double min_spacing = 100.0;         // between entrances of one site
    double alignment_tolerance = 0.1;   // |n . d| band treated as equally aligned
    int top_candidates = 3;             // primary entrance picked among the best k edges
};

struct SubdivisionOptions {
    double max_aspect = 4.0;      // depth:width upper bound (1:1 .. 1:4)
    double min_frontage = 15.0;
    double relax_factor = 1.5;    // uncuttable pieces up to relax_factor * lot_area_max stay whole
    double cut_jitter = 0.04;     // seeded perturbation of the cut fraction
    int max_depth = 48;
};

struct TimelineOptions {
    int lots_per_phase = 20;
    double road_days_per_km = 5.0;
    double road_min_days = 10.0;
    double grading_days_per_ha = 6.0;
    double landscaping_days_per_ha = 4.0;
};

struct OptimizerOptions {
    int population = 24;
    int generations = 40;
    double crossover_rate = 0.9;
    double mutation_rate = 0.35;
    double mutation_sigma = 0.15;
    int tournament_size = 2;

    // Stop when the best aggregate improves less than `stagnation_tolerance` over this many generations.
    int stagnation_window = 8;
    double stagnation_tolerance = 1e-4;

    double time_limit_s = 0.0;                 // 0 = no deadline
    const std::atomic<bool>* cancel = nullptr; // polled between generations

    int threads = 0;  // 0 = OpenMP default
    std::uint64_t seed = 1;
    int log_every = 0;
    std::string log_prefix = "[nsga]";
};

struct ParameterSet {
    double lot_area_min = 800.0;
    double lot_area_target = 1200.0;
    double lot_area_max = 2400.0;
    int min_lot_count = 0;
    IndustryType industry = IndustryType::kMixed;

    double primary_row_width = 25.0;
    double secondary_row_width = 12.0;
    double access_row_width = 12.0;
    double perimeter_buffer = 5.0;

    double salable_target = 0.75;
    double salable_ceiling = 0.85;
    double green_target = 0.10;
    int entrance_count = 1;

    std::vector<InfrastructureRequirement> infrastructure = default_infrastructure();
    ElevationModel terrain;
    ScoreWeights score_weights{1.0 / 7.0, 1.0 / 7.0, 1.0 / 7.0, 1.0 / 7.0, 1.0 / 7.0, 1.0 / 7.0, 1.0 / 7.0};
    FinancialParams financial;

    RoadNetworkOptions roads;
    EntranceOptions entrances;
    SubdivisionOptions subdivision;
    TimelineOptions timeline;
    OptimizerOptions optimizer;
};

// Parameter set with the lot size range of the given industry.
ParameterSet parameters_for_industry(IndustryType industry);

// Throws std::invalid_argument on out-of-range values.
void validate_parameters(const ParameterSet& params);

}  // namespace parkgen
