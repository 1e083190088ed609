#include "parkgen/layout.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <numeric>
#include <stdexcept>

namespace parkgen {

const char* road_class_name(RoadClass rc) {
    switch (rc) {
    case RoadClass::kPrimary:
        return "primary";
    case RoadClass::kSecondary:
        return "secondary";
    case RoadClass::kAccess:
        return "access";
    }
    return "unknown";
}

const char* utility_kind_name(UtilityKind kind) {
    switch (kind) {
    case UtilityKind::kWater:
        return "water";
    case UtilityKind::kSewer:
        return "sewer";
    case UtilityKind::kPower:
        return "power";
    }
    return "unknown";
}

double RoadNetwork::total_length() const {
    double acc = 0.0;
    for (const auto& s : segments) {
        acc += s.length();
    }
    return acc;
}

double RoadNetwork::length_of(RoadClass rc) const {
    double acc = 0.0;
    for (const auto& s : segments) {
        if (s.road_class == rc) {
            acc += s.length();
        }
    }
    return acc;
}

double RoadNetwork::row_area() const {
    double acc = 0.0;
    for (const auto& s : segments) {
        acc += polygon_area(s.row);
    }
    return acc;
}

int RoadNetwork::component_count() const {
    const size_t n = segments.size();
    std::map<int, size_t> index;
    for (size_t i = 0; i < n; ++i) {
        index[segments[i].id] = i;
    }
    std::vector<size_t> parent(n);
    std::iota(parent.begin(), parent.end(), size_t{0});
    auto find = [&](size_t x) {
        while (parent[x] != x) {
            parent[x] = parent[parent[x]];
            x = parent[x];
        }
        return x;
    };
    for (size_t i = 0; i < n; ++i) {
        for (int other : segments[i].connections) {
            auto it = index.find(other);
            if (it == index.end()) {
                continue;
            }
            parent[find(i)] = find(it->second);
        }
    }
    int comps = 0;
    for (size_t i = 0; i < n; ++i) {
        if (find(i) == i) {
            ++comps;
        }
    }
    return comps;
}

FrontageMeasure measure_frontage(const Polygon& poly, const std::vector<FrontageLine>& lines, double tol) {
    FrontageMeasure out;
    std::map<int, double> per_road;
    for (size_t i = 0; i < poly.size(); ++i) {
        const Point& p = poly[i];
        const Point& q = poly[(i + 1) % poly.size()];
        if (distance(p, q) <= tol) {
            continue;
        }
        for (const auto& line : lines) {
            const double len = distance(line.a, line.b);
            if (!(len > tol)) {
                continue;
            }
            const double ux = (line.b.x - line.a.x) / len;
            const double uy = (line.b.y - line.a.y) / len;
            // Perpendicular offsets of both edge endpoints from the line.
            const double dp = std::abs((p.x - line.a.x) * uy - (p.y - line.a.y) * ux);
            const double dq = std::abs((q.x - line.a.x) * uy - (q.y - line.a.y) * ux);
            if (dp > tol || dq > tol) {
                continue;
            }
            const double tp = (p.x - line.a.x) * ux + (p.y - line.a.y) * uy;
            const double tq = (q.x - line.a.x) * ux + (q.y - line.a.y) * uy;
            const double lo = std::max(std::min(tp, tq), 0.0);
            const double hi = std::min(std::max(tp, tq), len);
            if (hi > lo) {
                per_road[line.road_id] += hi - lo;
            }
        }
    }
    double best = 0.0;
    for (const auto& kv : per_road) {
        out.length += kv.second;
        if (kv.second > best) {
            best = kv.second;
            out.road_id = kv.first;
        }
    }
    return out;
}

std::uint64_t Genome::cut_seed() const {
    const double g = std::clamp(genes[kGeneCutSeed], 0.0, 1.0);
    return static_cast<std::uint64_t>(g * 4294967296.0) * 0x9E3779B97F4A7C15ULL + 0x632BE59BD9B4E019ULL;
}

const char* gene_name(int index) {
    switch (index) {
    case kGeneOrientation:
        return "orientation";
    case kGeneSpineOffset:
        return "spine_offset";
    case kGeneLotDepth:
        return "lot_depth";
    case kGeneSecondaryPhase:
        return "secondary_phase";
    case kGeneLotTargetArea:
        return "lot_target_area";
    case kGeneEntranceChoice:
        return "entrance_choice";
    case kGeneEntranceOffset:
        return "entrance_offset";
    case kGeneCutSeed:
        return "cut_seed";
    default:
        return "unknown";
    }
}

double CandidateLayout::lot_area() const {
    double acc = 0.0;
    for (const auto& lot : lots) {
        acc += lot.area;
    }
    return acc;
}

double CandidateLayout::infrastructure_area() const {
    double acc = 0.0;
    for (const auto& e : infrastructure) {
        acc += polygon_area(e.polygon);
    }
    return acc;
}

double CandidateLayout::open_space_area() const {
    double acc = 0.0;
    for (const auto& o : open_spaces) {
        acc += polygon_area(o.polygon);
    }
    return acc;
}

double CandidateLayout::utility_cost() const {
    double acc = 0.0;
    for (const auto& u : utilities) {
        acc += u.cost;
    }
    return acc;
}

const UtilityNetwork* CandidateLayout::utility(UtilityKind kind) const {
    for (const auto& u : utilities) {
        if (u.kind == kind) {
            return &u;
        }
    }
    return nullptr;
}

Polygon make_boundary(Polygon ring) {
    // Drop an explicit closing vertex.
    if (ring.size() >= 2 && ring.front().x == ring.back().x && ring.front().y == ring.back().y) {
        ring.pop_back();
    }
    if (ring.size() < 3) {
        throw std::invalid_argument("boundary needs at least 3 vertices");
    }
    for (const auto& p : ring) {
        if (!std::isfinite(p.x) || !std::isfinite(p.y)) {
            throw std::invalid_argument("boundary has non-finite coordinates");
        }
    }
    ring = remove_degenerate(ensure_ccw(std::move(ring)));
    if (ring.size() < 3 || !(polygon_area(ring) > 0.0)) {
        throw std::invalid_argument("boundary has zero area");
    }
    if (!polygon_is_simple(ring)) {
        throw std::invalid_argument("boundary is self-intersecting");
    }
    return ring;
}

std::vector<LayoutFeature> layout_features(const CandidateLayout& layout) {
    std::vector<LayoutFeature> out;
    out.reserve(layout.roads.segments.size() + layout.lots.size() + layout.infrastructure.size() +
                layout.open_spaces.size());

    for (const auto& s : layout.roads.segments) {
        LayoutFeature f;
        f.id = "road-" + std::to_string(s.id);
        f.type = std::string("road-") + road_class_name(s.road_class);
        f.polygon = s.row;
        f.polyline = s.centerline;
        out.push_back(std::move(f));
    }
    for (const auto& lot : layout.lots) {
        LayoutFeature f;
        f.id = "lot-" + std::to_string(lot.id);
        f.type = "lot";
        f.polygon = lot.polygon;
        out.push_back(std::move(f));
    }
    for (const auto& e : layout.infrastructure) {
        LayoutFeature f;
        f.id = "infra-" + std::to_string(e.id);
        f.type = std::string("infrastructure-") + infrastructure_kind_name(e.kind);
        f.polygon = e.polygon;
        out.push_back(std::move(f));
    }
    for (size_t i = 0; i < layout.open_spaces.size(); ++i) {
        LayoutFeature f;
        f.id = "open-" + std::to_string(i);
        f.type = "open-space";
        f.polygon = layout.open_spaces[i].polygon;
        out.push_back(std::move(f));
    }
    return out;
}

}  // namespace parkgen
