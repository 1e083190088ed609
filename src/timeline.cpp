#include "parkgen/timeline.hpp"

#include <algorithm>
#include <cmath>
#include <set>
#include <stdexcept>
#include <unordered_map>

#include "parkgen/errors.hpp"
#include "parkgen/utility_router.hpp"

namespace parkgen {

namespace {

constexpr double kEps = 1e-9;

WorkPackage make_package(std::string id, std::string name, WorkType type, double quantity,
                         std::vector<std::string> preds, const TimelineOptions& opt) {
    WorkPackage p;
    p.id = std::move(id);
    p.name = std::move(name);
    p.type = type;
    p.quantity = quantity;
    p.duration = package_duration(type, quantity, opt);
    p.predecessors = std::move(preds);
    return p;
}

WorkType work_type_for(InfrastructureKind kind) {
    switch (kind) {
    case InfrastructureKind::kDetentionPond:
        return WorkType::kDetentionPond;
    case InfrastructureKind::kWaterTreatment:
        return WorkType::kWaterTreatment;
    case InfrastructureKind::kWastewaterTreatment:
        return WorkType::kWastewaterTreatment;
    case InfrastructureKind::kSubstation:
        return WorkType::kSubstation;
    }
    return WorkType::kSubstation;
}

}  // namespace

const char* work_type_name(WorkType t) {
    switch (t) {
    case WorkType::kSurvey:
        return "survey";
    case WorkType::kClearing:
        return "clearing";
    case WorkType::kEarthworks:
        return "earthworks";
    case WorkType::kWaterNetwork:
        return "water-network";
    case WorkType::kSewerNetwork:
        return "sewer-network";
    case WorkType::kPowerConduits:
        return "power-conduits";
    case WorkType::kDetentionPond:
        return "detention-pond";
    case WorkType::kWaterTreatment:
        return "water-treatment";
    case WorkType::kWastewaterTreatment:
        return "wastewater-treatment";
    case WorkType::kSubstation:
        return "substation";
    case WorkType::kRoad:
        return "road";
    case WorkType::kLotGrading:
        return "lot-grading";
    case WorkType::kLandscaping:
        return "landscaping";
    case WorkType::kInspection:
        return "inspection";
    }
    return "unknown";
}

double package_duration(WorkType type, double quantity, const TimelineOptions& opt) {
    const double q = std::max(0.0, quantity);
    switch (type) {
    case WorkType::kSurvey:
        return 5.0;
    case WorkType::kClearing:
        return std::max(10.0, std::ceil(0.5 * q));
    case WorkType::kEarthworks:
        return std::max(15.0, std::ceil(1.5 * q));
    case WorkType::kWaterNetwork:
    case WorkType::kSewerNetwork:
        return std::max(10.0, std::ceil(4.0 * q));
    case WorkType::kPowerConduits:
        return std::max(10.0, std::ceil(3.0 * q));
    case WorkType::kDetentionPond:
        // q = number of ponds on site; excavation crews are shared.
        return std::max(15.0, 10.0 * q);
    case WorkType::kWaterTreatment:
        return 30.0;
    case WorkType::kWastewaterTreatment:
        return 35.0;
    case WorkType::kSubstation:
        return 40.0;
    case WorkType::kRoad:
        return std::max(opt.road_min_days, std::ceil(opt.road_days_per_km * q));
    case WorkType::kLotGrading:
        return std::max(5.0, std::ceil(opt.grading_days_per_ha * q));
    case WorkType::kLandscaping:
        return std::max(10.0, std::ceil(opt.landscaping_days_per_ha * q));
    case WorkType::kInspection:
        return 5.0;
    }
    return 0.0;
}

std::vector<WorkPackage> build_work_packages(const CandidateLayout& layout, const ParameterSet& params) {
    const TimelineOptions& opt = params.timeline;
    if (opt.lots_per_phase <= 0) {
        throw std::invalid_argument("timeline: lots_per_phase must be positive");
    }
    const double site_ha = layout.site_area() / 10000.0;
    const std::vector<UtilityNetwork> utilities = utilities_of(layout, params);
    auto utility_km = [&utilities](UtilityKind kind) {
        for (const auto& u : utilities) {
            if (u.kind == kind) {
                return u.total_length() / 1000.0;
            }
        }
        return 0.0;
    };

    std::vector<WorkPackage> out;
    out.push_back(make_package("survey", "Site survey and staking", WorkType::kSurvey, site_ha, {}, opt));
    out.push_back(make_package("clearing", "Site clearing", WorkType::kClearing, site_ha, {"survey"}, opt));
    out.push_back(make_package("earthworks", "Mass earthworks", WorkType::kEarthworks, site_ha, {"clearing"}, opt));

    // Roads: primary first, secondaries branch off it, connectors tie into the spine.
    std::vector<std::string> road_ids;
    const RoadClass classes[] = {RoadClass::kPrimary, RoadClass::kSecondary, RoadClass::kAccess};
    for (RoadClass rc : classes) {
        const double km = layout.roads.length_of(rc) / 1000.0;
        if (!(km > 0.0)) {
            continue;
        }
        std::vector<std::string> preds{"earthworks"};
        if (rc != RoadClass::kPrimary && !road_ids.empty()) {
            preds = {road_ids.front()};
        }
        const std::string id = std::string("road-") + road_class_name(rc);
        out.push_back(make_package(id, std::string("Construct ") + road_class_name(rc) + " roads", WorkType::kRoad,
                                   km, preds, opt));
        road_ids.push_back(id);
    }
    const std::string trunk = road_ids.empty() ? std::string("earthworks") : road_ids.front();

    out.push_back(make_package("water-network", "Water distribution network", WorkType::kWaterNetwork,
                               utility_km(UtilityKind::kWater),
                               {trunk}, opt));
    out.push_back(make_package("sewer-network", "Sewer and drainage network", WorkType::kSewerNetwork,
                               utility_km(UtilityKind::kSewer),
                               {trunk}, opt));
    out.push_back(make_package("power-conduits", "Power conduits", WorkType::kPowerConduits,
                               utility_km(UtilityKind::kPower), {trunk}, opt));

    int ponds = 0;
    for (const auto& e : layout.infrastructure) {
        if (e.kind == InfrastructureKind::kDetentionPond) {
            ++ponds;
        }
    }
    std::vector<std::string> infra_ids;
    std::vector<std::string> pond_ids;
    for (const auto& e : layout.infrastructure) {
        const WorkType t = work_type_for(e.kind);
        std::string pred;
        switch (e.kind) {
        case InfrastructureKind::kDetentionPond:
            pred = "earthworks";
            break;
        case InfrastructureKind::kWaterTreatment:
            pred = "water-network";
            break;
        case InfrastructureKind::kWastewaterTreatment:
            pred = "sewer-network";
            break;
        case InfrastructureKind::kSubstation:
            pred = "power-conduits";
            break;
        }
        const std::string id = "infra-" + std::to_string(e.id) + "-" + infrastructure_kind_name(e.kind);
        const double qty = (t == WorkType::kDetentionPond) ? ponds : 1.0;
        out.push_back(make_package(id, std::string("Build ") + infrastructure_kind_name(e.kind), t, qty, {pred}, opt));
        infra_ids.push_back(id);
        if (t == WorkType::kDetentionPond) {
            pond_ids.push_back(id);
        }
    }

    // Lot grading in phases of lots_per_phase; one crew, so phases run back to back.
    std::vector<std::string> phase_ids;
    const std::string lot_road = road_ids.size() > 1 ? road_ids[1] : trunk;
    const size_t per_phase = static_cast<size_t>(opt.lots_per_phase);
    for (size_t start = 0; start < layout.lots.size(); start += per_phase) {
        const size_t end = std::min(layout.lots.size(), start + per_phase);
        double ha = 0.0;
        for (size_t i = start; i < end; ++i) {
            ha += layout.lots[i].area / 10000.0;
        }
        std::vector<std::string> preds{lot_road};
        if (!phase_ids.empty()) {
            preds.push_back(phase_ids.back());
        }
        const std::string id = "lot-phase-" + std::to_string(phase_ids.size() + 1);
        out.push_back(make_package(id, "Grade lots " + std::to_string(start + 1) + "-" + std::to_string(end),
                                   WorkType::kLotGrading, ha, preds, opt));
        phase_ids.push_back(id);
    }

    double green_ha = layout.buffer_area / 10000.0;
    for (const auto& os : layout.open_spaces) {
        green_ha += polygon_area(os.polygon) / 10000.0;
    }
    std::vector<std::string> land_preds = phase_ids;
    land_preds.insert(land_preds.end(), pond_ids.begin(), pond_ids.end());
    if (land_preds.empty()) {
        land_preds.push_back(trunk);
    }
    out.push_back(make_package("landscaping", "Landscaping and buffers", WorkType::kLandscaping, green_ha, land_preds,
                               opt));

    std::vector<std::string> final_preds{"landscaping", "water-network", "sewer-network", "power-conduits"};
    final_preds.insert(final_preds.end(), road_ids.begin(), road_ids.end());
    final_preds.insert(final_preds.end(), infra_ids.begin(), infra_ids.end());
    out.push_back(make_package("final-inspection", "Final inspection and handover", WorkType::kInspection, 1.0,
                               final_preds, opt));
    return out;
}

TimelineResult schedule_packages(std::vector<WorkPackage> packages) {
    const size_t n = packages.size();
    std::unordered_map<std::string, size_t> index;
    for (size_t i = 0; i < n; ++i) {
        if (!(packages[i].duration >= 0.0)) {
            throw std::invalid_argument("timeline: package " + packages[i].id + " has negative duration");
        }
        if (!index.emplace(packages[i].id, i).second) {
            throw std::invalid_argument("timeline: duplicate package id " + packages[i].id);
        }
    }

    std::vector<std::vector<size_t>> succ(n);
    std::vector<std::vector<size_t>> pred(n);
    std::vector<int> indeg(n, 0);
    for (size_t i = 0; i < n; ++i) {
        for (const auto& p : packages[i].predecessors) {
            auto it = index.find(p);
            if (it == index.end()) {
                throw std::invalid_argument("timeline: package " + packages[i].id + " depends on unknown " + p);
            }
            succ[it->second].push_back(i);
            pred[i].push_back(it->second);
            ++indeg[i];
        }
    }

    // Kahn's algorithm; ready set ordered by input position.
    std::set<size_t> ready;
    for (size_t i = 0; i < n; ++i) {
        if (indeg[i] == 0) {
            ready.insert(i);
        }
    }
    std::vector<size_t> order;
    order.reserve(n);
    while (!ready.empty()) {
        const size_t u = *ready.begin();
        ready.erase(ready.begin());
        order.push_back(u);
        for (size_t v : succ[u]) {
            if (--indeg[v] == 0) {
                ready.insert(v);
            }
        }
    }
    if (order.size() != n) {
        std::string stuck;
        for (size_t i = 0; i < n; ++i) {
            if (indeg[i] > 0) {
                stuck += (stuck.empty() ? "" : ", ") + packages[i].id;
            }
        }
        throw CyclicDependency("work packages form a cycle through " + stuck);
    }

    // Forward pass.
    std::vector<double> es(n, 0.0), ef(n, 0.0);
    double total = 0.0;
    for (size_t u : order) {
        for (size_t p : pred[u]) {
            es[u] = std::max(es[u], ef[p]);
        }
        ef[u] = es[u] + packages[u].duration;
        total = std::max(total, ef[u]);
    }

    // Backward pass.
    std::vector<double> lf(n, total);
    for (auto it = order.rbegin(); it != order.rend(); ++it) {
        const size_t u = *it;
        for (size_t s : succ[u]) {
            lf[u] = std::min(lf[u], es[s]);
        }
    }

    TimelineResult res;
    res.total_duration_days = total;
    for (size_t i = 0; i < n; ++i) {
        packages[i].early_start = es[i];
        packages[i].early_finish = ef[i];
        packages[i].slack = std::max(0.0, lf[i] - ef[i]);
        packages[i].critical = packages[i].slack <= kEps;
    }

    // Walk back from the latest finishing package along tight predecessors.
    if (n > 0) {
        size_t cur = order.front();
        for (size_t u : order) {
            if (ef[u] > ef[cur] + kEps) {
                cur = u;
            }
        }
        std::vector<std::string> path{packages[cur].id};
        for (;;) {
            bool found = false;
            size_t next = 0;
            for (size_t p : pred[cur]) {
                if (std::abs(ef[p] - es[cur]) <= kEps && (!found || p < next)) {
                    next = p;
                    found = true;
                }
            }
            if (!found) {
                break;
            }
            cur = next;
            path.push_back(packages[cur].id);
        }
        res.critical_path.assign(path.rbegin(), path.rend());
    }

    // Peak concurrency over half-open [es, ef) intervals; finishes sort before starts.
    std::vector<std::pair<double, int>> events;
    for (size_t i = 0; i < n; ++i) {
        if (packages[i].duration > 0.0) {
            events.emplace_back(es[i], +1);
            events.emplace_back(ef[i], -1);
        }
    }
    std::sort(events.begin(), events.end());
    int running = 0;
    for (const auto& ev : events) {
        running += ev.second;
        res.max_parallel = std::max(res.max_parallel, running);
    }

    res.packages.reserve(n);
    for (size_t u : order) {
        res.packages.push_back(std::move(packages[u]));
    }
    return res;
}

TimelineResult estimate_timeline(const CandidateLayout& layout, const ParameterSet& params) {
    return schedule_packages(build_work_packages(layout, params));
}

}  // namespace parkgen
