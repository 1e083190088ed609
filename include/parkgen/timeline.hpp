#pragma once

#include <string>
#include <vector>

#include "parkgen/layout.hpp"
#include "parkgen/params.hpp"

namespace parkgen {

enum class WorkType {
    kSurvey = 0,
    kClearing,
    kEarthworks,
    kWaterNetwork,
    kSewerNetwork,
    kPowerConduits,
    kDetentionPond,
    kWaterTreatment,
    kWastewaterTreatment,
    kSubstation,
    kRoad,
    kLotGrading,
    kLandscaping,
    kInspection,
};

const char* work_type_name(WorkType t);

struct WorkPackage {
    std::string id;
    std::string name;
    WorkType type = WorkType::kSurvey;
    double quantity = 0.0;  // unit depends on type: ha, km, element count
    double duration = 0.0;  // days
    std::vector<std::string> predecessors;

    // Filled by schedule_packages().
    double early_start = 0.0;
    double early_finish = 0.0;
    double slack = 0.0;
    bool critical = false;
};

struct TimelineResult {
    std::vector<WorkPackage> packages;  // topological order
    double total_duration_days = 0.0;
    std::vector<std::string> critical_path;
    int max_parallel = 0;
};

// Duration lookup keyed by work type and quantity.
double package_duration(WorkType type, double quantity, const TimelineOptions& opt);

// Deterministic package graph for a finished layout.
std::vector<WorkPackage> build_work_packages(const CandidateLayout& layout, const ParameterSet& params);

// CPM over an arbitrary package graph. Throws CyclicDependency if the graph has a cycle and
// std::invalid_argument for duplicate ids or unknown predecessors.
TimelineResult schedule_packages(std::vector<WorkPackage> packages);

TimelineResult estimate_timeline(const CandidateLayout& layout, const ParameterSet& params);

}  // namespace parkgen
