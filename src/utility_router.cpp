#include "parkgen/utility_router.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>
#include <map>
#include <queue>
#include <tuple>
#include <utility>

namespace parkgen {

namespace {

constexpr double kInf = std::numeric_limits<double>::infinity();
constexpr double kNodeGrid = 1e-4;  // points closer than this share a node
constexpr double kContactTol = 1e-6;

struct Arc {
    int to;
    double length;
};

struct RoadGraph {
    std::vector<Point> nodes;
    std::vector<std::vector<Arc>> adj;
    std::map<std::pair<long long, long long>, int> index;

    int node_at(const Point& p) {
        const std::pair<long long, long long> key{std::llround(p.x / kNodeGrid), std::llround(p.y / kNodeGrid)};
        auto it = index.find(key);
        if (it != index.end()) {
            return it->second;
        }
        const int id = static_cast<int>(nodes.size());
        index.emplace(key, id);
        nodes.push_back(p);
        adj.emplace_back();
        return id;
    }

    void connect(int a, int b) {
        if (a == b) {
            return;
        }
        const double len = distance(nodes[static_cast<size_t>(a)], nodes[static_cast<size_t>(b)]);
        adj[static_cast<size_t>(a)].push_back(Arc{b, len});
        adj[static_cast<size_t>(b)].push_back(Arc{a, len});
    }
};

// Nearest point on one centerline edge of a road.
struct RoadPoint {
    size_t segment = 0;
    size_t piece = 0;
    double t = 0.0;
    Point at;
    double dist = kInf;
};

RoadPoint closest_on(const RoadSegment& s, size_t index, const Point& p) {
    RoadPoint best;
    best.segment = index;
    for (size_t i = 0; i + 1 < s.centerline.size(); ++i) {
        const Point& a = s.centerline[i];
        const Point& b = s.centerline[i + 1];
        const double vx = b.x - a.x;
        const double vy = b.y - a.y;
        const double vv = vx * vx + vy * vy;
        double t = 0.0;
        if (vv > 0.0) {
            t = std::clamp(((p.x - a.x) * vx + (p.y - a.y) * vy) / vv, 0.0, 1.0);
        }
        const Point q{a.x + t * vx, a.y + t * vy};
        const double d = distance(p, q);
        if (d < best.dist) {
            best.piece = i;
            best.t = t;
            best.at = q;
            best.dist = d;
        }
    }
    return best;
}

RoadPoint closest_on_roads(const std::vector<RoadSegment>& segs, const Point& p) {
    RoadPoint best;
    for (size_t i = 0; i < segs.size(); ++i) {
        const RoadPoint rp = closest_on(segs[i], i, p);
        if (rp.dist < best.dist) {
            best = rp;
        }
    }
    return best;
}

// Centerline pieces split at every junction and attachment point. A road end that lies within
// the combined half widths of another road is linked to its nearest point on that road.
RoadGraph build_road_graph(const std::vector<RoadSegment>& segs,
                           const std::vector<RoadPoint>& attachments,
                           std::vector<int>& attachment_nodes) {
    std::vector<std::vector<std::vector<std::pair<double, Point>>>> splits(segs.size());
    for (size_t s = 0; s < segs.size(); ++s) {
        const Polyline& c = segs[s].centerline;
        splits[s].resize(c.size() > 1 ? c.size() - 1 : 0);
        for (size_t i = 0; i + 1 < c.size(); ++i) {
            splits[s][i].emplace_back(0.0, c[i]);
            splits[s][i].emplace_back(1.0, c[i + 1]);
        }
    }

    std::vector<std::pair<Point, Point>> links;
    for (size_t s = 0; s < segs.size(); ++s) {
        const Polyline& c = segs[s].centerline;
        if (c.size() < 2) {
            continue;
        }
        for (const Point& end : {c.front(), c.back()}) {
            for (size_t o = 0; o < segs.size(); ++o) {
                if (o == s) {
                    continue;
                }
                const RoadPoint q = closest_on(segs[o], o, end);
                if (!(q.dist <= 0.5 * (segs[s].width + segs[o].width) + kContactTol)) {
                    continue;
                }
                splits[o][q.piece].emplace_back(q.t, q.at);
                links.emplace_back(end, q.at);
            }
        }
    }
    for (const auto& a : attachments) {
        splits[a.segment][a.piece].emplace_back(a.t, a.at);
    }

    RoadGraph g;
    for (auto& per_road : splits) {
        for (auto& pts : per_road) {
            std::stable_sort(pts.begin(), pts.end(), [](const std::pair<double, Point>& l,
                                                        const std::pair<double, Point>& r) {
                return l.first < r.first;
            });
            for (size_t k = 1; k < pts.size(); ++k) {
                g.connect(g.node_at(pts[k - 1].second), g.node_at(pts[k].second));
            }
        }
    }
    for (const auto& l : links) {
        g.connect(g.node_at(l.first), g.node_at(l.second));
    }
    attachment_nodes.clear();
    for (const auto& a : attachments) {
        attachment_nodes.push_back(g.node_at(a.at));
    }
    return g;
}

void shortest_paths(const RoadGraph& g, int src, std::vector<double>& dist, std::vector<int>& prev) {
    dist.assign(g.nodes.size(), kInf);
    prev.assign(g.nodes.size(), -1);
    using Item = std::pair<double, int>;
    std::priority_queue<Item, std::vector<Item>, std::greater<Item>> pq;
    dist[static_cast<size_t>(src)] = 0.0;
    pq.emplace(0.0, src);
    while (!pq.empty()) {
        const Item top = pq.top();
        pq.pop();
        const size_t u = static_cast<size_t>(top.second);
        if (top.first > dist[u]) {
            continue;
        }
        for (const Arc& a : g.adj[u]) {
            const double nd = top.first + a.length;
            const size_t v = static_cast<size_t>(a.to);
            if (nd < dist[v]) {
                dist[v] = nd;
                prev[v] = top.second;
                pq.emplace(nd, a.to);
            }
        }
    }
}

class TreeEdges {
public:
    void add(int a, int b, double length) {
        if (a > b) {
            std::swap(a, b);
        }
        edges_.emplace(std::make_pair(a, b), length);
    }

    // Walks a shortest-path tree from `target` back to its root.
    void add_path(int target, const std::vector<double>& dist, const std::vector<int>& prev) {
        for (int v = target; prev[static_cast<size_t>(v)] >= 0; v = prev[static_cast<size_t>(v)]) {
            const int u = prev[static_cast<size_t>(v)];
            add(u, v, dist[static_cast<size_t>(v)] - dist[static_cast<size_t>(u)]);
        }
    }

    const std::map<std::pair<int, int>, double>& edges() const { return edges_; }

private:
    std::map<std::pair<int, int>, double> edges_;
};

// Prim over every node reachable from `src`.
void spanning_tree(const RoadGraph& g, int src, TreeEdges& tree) {
    std::vector<bool> done(g.nodes.size(), false);
    using Item = std::tuple<double, int, int>;  // length, node, parent
    std::priority_queue<Item, std::vector<Item>, std::greater<Item>> pq;
    pq.emplace(0.0, src, -1);
    while (!pq.empty()) {
        const Item top = pq.top();
        pq.pop();
        const int u = std::get<1>(top);
        if (done[static_cast<size_t>(u)]) {
            continue;
        }
        done[static_cast<size_t>(u)] = true;
        if (std::get<2>(top) >= 0) {
            tree.add(std::get<2>(top), u, std::get<0>(top));
        }
        for (const Arc& a : g.adj[static_cast<size_t>(u)]) {
            if (!done[static_cast<size_t>(a.to)]) {
                pq.emplace(a.length, a.to, u);
            }
        }
    }
}

// Minimum spanning tree of the terminals' shortest-path distances, each tree edge expanded into
// its road path. terminals[0] is the source; all terminals are reachable from it.
void steiner_tree(const RoadGraph& g, std::vector<int> terminals, TreeEdges& tree) {
    std::sort(terminals.begin() + 1, terminals.end());
    terminals.erase(std::unique(terminals.begin() + 1, terminals.end()), terminals.end());
    terminals.erase(std::remove(terminals.begin() + 1, terminals.end(), terminals.front()), terminals.end());
    const size_t n = terminals.size();
    if (n < 2) {
        return;
    }
    std::vector<std::vector<double>> dist(n);
    std::vector<std::vector<int>> prev(n);
    for (size_t i = 0; i < n; ++i) {
        shortest_paths(g, terminals[i], dist[i], prev[i]);
    }

    std::vector<bool> in_tree(n, false);
    std::vector<double> best(n, kInf);
    std::vector<size_t> parent(n, 0);
    best[0] = 0.0;
    for (size_t round = 0; round < n; ++round) {
        size_t u = n;
        for (size_t i = 0; i < n; ++i) {
            if (!in_tree[i] && (u == n || best[i] < best[u])) {
                u = i;
            }
        }
        if (u == n || best[u] == kInf) {
            break;
        }
        in_tree[u] = true;
        if (round > 0) {
            tree.add_path(terminals[u], dist[parent[u]], prev[parent[u]]);
        }
        for (size_t v = 0; v < n; ++v) {
            if (in_tree[v]) {
                continue;
            }
            const double d = dist[u][static_cast<size_t>(terminals[v])];
            if (d < best[v]) {
                best[v] = d;
                parent[v] = u;
            }
        }
    }
}

InfrastructureKind plant_for(UtilityKind kind) {
    switch (kind) {
    case UtilityKind::kWater:
        return InfrastructureKind::kWaterTreatment;
    case UtilityKind::kSewer:
        return InfrastructureKind::kWastewaterTreatment;
    case UtilityKind::kPower:
        return InfrastructureKind::kSubstation;
    }
    return InfrastructureKind::kSubstation;
}

double cost_per_m(UtilityKind kind, const FinancialParams& f) {
    switch (kind) {
    case UtilityKind::kWater:
        return f.water_pipe_cost_per_m;
    case UtilityKind::kSewer:
        return f.sewer_pipe_cost_per_m;
    case UtilityKind::kPower:
        return f.power_cable_cost_per_m;
    }
    return 0.0;
}

}  // namespace

UtilityNetwork route_utility(UtilityKind kind, const CandidateLayout& layout, const ParameterSet& params) {
    UtilityNetwork net;
    net.kind = kind;
    const std::vector<RoadSegment>& segs = layout.roads.segments;

    const InfrastructureElement* plant = nullptr;
    for (const auto& e : layout.infrastructure) {
        if (e.kind == plant_for(kind) && (plant == nullptr || e.id < plant->id)) {
            plant = &e;
        }
    }
    const Entrance* gate = nullptr;
    for (const auto& e : layout.entrances) {
        if (gate == nullptr || (e.primary && !gate->primary)) {
            gate = &e;
        }
    }
    if (plant != nullptr) {
        net.source = plant->anchor;
        net.has_plant = true;
    } else if (gate != nullptr) {
        net.source = gate->point;
    } else if (!segs.empty() && !segs.front().centerline.empty()) {
        net.source = segs.front().centerline.front();
    }

    std::vector<RoadPoint> attach;
    attach.push_back(closest_on_roads(segs, net.source));
    if (attach.front().dist == kInf) {
        net.unserved = static_cast<int>(layout.lots.size());
        return net;
    }
    std::map<int, size_t> by_id;
    for (size_t i = 0; i < segs.size(); ++i) {
        by_id[segs[i].id] = i;
    }
    for (const auto& lot : layout.lots) {
        const Point c = polygon_centroid(lot.polygon);
        RoadPoint rp;
        auto it = by_id.find(lot.access_road);
        if (it != by_id.end()) {
            rp = closest_on(segs[it->second], it->second, c);
        }
        if (rp.dist == kInf) {
            rp = closest_on_roads(segs, c);
        }
        attach.push_back(rp);
    }

    std::vector<int> nodes;
    const RoadGraph g = build_road_graph(segs, attach, nodes);
    const int src = nodes.front();
    std::vector<double> dist;
    std::vector<int> prev;
    shortest_paths(g, src, dist, prev);

    std::vector<size_t> served;
    for (size_t i = 0; i < layout.lots.size(); ++i) {
        if (dist[static_cast<size_t>(nodes[i + 1])] < kInf) {
            served.push_back(i);
        } else {
            ++net.unserved;
        }
    }

    TreeEdges tree;
    switch (kind) {
    case UtilityKind::kWater: {
        std::vector<int> terminals{src};
        for (size_t i : served) {
            terminals.push_back(nodes[i + 1]);
        }
        steiner_tree(g, terminals, tree);
        break;
    }
    case UtilityKind::kSewer:
        for (size_t i : served) {
            tree.add_path(nodes[i + 1], dist, prev);
        }
        break;
    case UtilityKind::kPower:
        spanning_tree(g, src, tree);
        break;
    }

    for (const auto& kv : tree.edges()) {
        net.runs.push_back(UtilityRun{g.nodes[static_cast<size_t>(kv.first.first)],
                                      g.nodes[static_cast<size_t>(kv.first.second)], false});
        net.main_length += kv.second;
    }
    if (attach.front().dist > kContactTol) {
        net.runs.push_back(UtilityRun{net.source, attach.front().at, true});
        net.service_length += attach.front().dist;
    }
    for (size_t i : served) {
        const RoadPoint& rp = attach[i + 1];
        net.runs.push_back(UtilityRun{polygon_centroid(layout.lots[i].polygon), rp.at, true});
        net.service_length += rp.dist;
    }
    net.connections = static_cast<int>(served.size());

    const FinancialParams& f = params.financial;
    net.cost = cost_per_m(kind, f) * net.total_length() + f.service_connection_cost * net.connections;
    return net;
}

std::vector<UtilityNetwork> route_utilities(const CandidateLayout& layout, const ParameterSet& params) {
    return {route_utility(UtilityKind::kWater, layout, params), route_utility(UtilityKind::kSewer, layout, params),
            route_utility(UtilityKind::kPower, layout, params)};
}

std::vector<UtilityNetwork> utilities_of(const CandidateLayout& layout, const ParameterSet& params) {
    if (!layout.utilities.empty()) {
        return layout.utilities;
    }
    return route_utilities(layout, params);
}

}  // namespace parkgen
