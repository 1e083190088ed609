#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "parkgen/errors.hpp"
#include "parkgen/geometry.hpp"
#include "parkgen/params.hpp"

namespace parkgen {

enum class RoadClass {
    kPrimary = 0,
    kSecondary = 1,
    kAccess = 2,
};

const char* road_class_name(RoadClass rc);

struct RoadSegment {
    int id = -1;
    RoadClass road_class = RoadClass::kSecondary;
    Polyline centerline;
    double width = 0.0;
    Polygon row;                   // right-of-way footprint
    std::vector<int> connections;  // ids of touching segments, ascending

    double length() const { return polyline_length(centerline); }
};

// A straight right-of-way edge that lots can front onto.
struct FrontageLine {
    Point a;
    Point b;
    int road_id = -1;
};

struct RoadNetwork {
    std::vector<RoadSegment> segments;
    std::vector<FrontageLine> frontage;
    int junctions = 0;
    double coverage = 0.0;

    double total_length() const;
    double length_of(RoadClass rc) const;
    double row_area() const;
    // Connected components of the `connections` graph.
    int component_count() const;
    bool connected() const { return !segments.empty() && component_count() == 1; }
    const std::vector<FrontageLine>& frontage_lines() const { return frontage; }
};

// Length of polygon edges lying on a frontage line (within tol), and the road with the longest share.
struct FrontageMeasure {
    double length = 0.0;
    int road_id = -1;
};
FrontageMeasure measure_frontage(const Polygon& poly, const std::vector<FrontageLine>& lines, double tol = 1e-6);

struct Lot {
    int id = -1;
    Polygon polygon;
    double area = 0.0;
    IndustryType use = IndustryType::kMixed;
    int access_road = -1;
    double frontage = 0.0;
    bool relaxed = false;  // accepted above lot_area_max because no admissible cut existed
};

struct InfrastructureElement {
    int id = -1;
    InfrastructureKind kind = InfrastructureKind::kSubstation;
    Polygon polygon;
    Point anchor;
    double exclusion_radius = 0.0;
    Adjacency adjacency = Adjacency::kNone;
    bool adjacency_met = false;
    double elevation = 0.0;
    double service_radius = 0.0;
};

struct Entrance {
    int id = -1;
    Point point;
    int edge_index = -1;
    int connector_road = -1;
    bool primary = false;
};

struct PlacementIssue {
    ErrorKind kind = ErrorKind::kPlacementInfeasible;
    std::string element;
    std::string message;
};

enum class OpenSpaceKind {
    kResidual = 0,          // leftover too small or without frontage
    kExclusionMargin = 1,   // clearance strip around infrastructure
};

struct OpenSpace {
    Polygon polygon;
    OpenSpaceKind kind = OpenSpaceKind::kResidual;
};

enum class UtilityKind {
    kWater = 0,
    kSewer = 1,
    kPower = 2,
};

const char* utility_kind_name(UtilityKind kind);

// A straight pipe or cable run. Mains follow road centerlines; service runs connect a lot or a
// plant to the nearest main.
struct UtilityRun {
    Point a;
    Point b;
    bool service = false;
};

struct UtilityNetwork {
    UtilityKind kind = UtilityKind::kWater;
    Point source;            // plant anchor, or the primary entrance when the plant is missing
    bool has_plant = false;
    std::vector<UtilityRun> runs;
    double main_length = 0.0;
    double service_length = 0.0;
    int connections = 0;     // lots reached
    int unserved = 0;        // lots with no road path to the source
    double cost = 0.0;

    double total_length() const { return main_length + service_length; }
};

enum GeneIndex {
    kGeneOrientation = 0,
    kGeneSpineOffset = 1,
    kGeneLotDepth = 2,
    kGeneSecondaryPhase = 3,
    kGeneLotTargetArea = 4,
    kGeneEntranceChoice = 5,
    kGeneEntranceOffset = 6,
    kGeneCutSeed = 7,
    kGeneCount = 8,
};

// Layout parameterization; every gene lives in [0, 1).
struct Genome {
    std::array<double, kGeneCount> genes{0.25, 0.5, 0.5, 0.5, 0.5, 0.0, 0.5, 0.5};

    double operator[](int i) const { return genes[static_cast<size_t>(i)]; }
    double& operator[](int i) { return genes[static_cast<size_t>(i)]; }
    std::uint64_t cut_seed() const;
};

const char* gene_name(int index);

struct CandidateLayout {
    Polygon boundary;    // world, CCW
    Polygon buildable;   // boundary minus the perimeter buffer
    RoadNetwork roads;
    std::vector<Lot> lots;
    std::vector<InfrastructureElement> infrastructure;
    std::vector<Entrance> entrances;
    std::vector<OpenSpace> open_spaces;
    double buffer_area = 0.0;  // perimeter strip minus entrance connectors
    std::vector<PlacementIssue> placement_issues;
    int dropped_entrances = 0;
    std::vector<UtilityNetwork> utilities;  // water, sewer, power; see route_utilities()

    Genome genome;
    double frame_angle_deg = 0.0;
    double lot_depth = 0.0;

    double site_area() const { return polygon_area(boundary); }
    double lot_area() const;
    double infrastructure_area() const;
    double open_space_area() const;
    double utility_cost() const;
    const UtilityNetwork* utility(UtilityKind kind) const;
};

// Validates and normalises a site ring: >= 3 finite vertices, simple, positive area. Returns it CCW.
// Throws std::invalid_argument otherwise.
Polygon make_boundary(Polygon ring);

struct LayoutFeature {
    std::string id;
    std::string type;  // road-primary | road-secondary | road-access | lot | infrastructure-<kind> | open-space
    Polygon polygon;
    Polyline polyline;  // road centerline, empty for other types
};

// Flattens a layout into typed features with stable ids (same layout -> same ids).
std::vector<LayoutFeature> layout_features(const CandidateLayout& layout);

}  // namespace parkgen
