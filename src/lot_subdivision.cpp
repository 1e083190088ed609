#include "parkgen/lot_subdivision.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <random>
#include <stdexcept>

namespace parkgen {

namespace {

constexpr double kAreaEps = 1e-6;
constexpr int kBisectIters = 48;

struct Context {
    const std::vector<FrontageLine>& frontage;
    const ParameterSet& params;
    double target_area;
    std::mt19937_64 rng;
    SubdivisionResult out;
};

// Cut coordinate on `axis` leaving `want` area on the lower side.
double bisect_cut(const Polygon& piece, int axis, double want) {
    const BoundingBox bb = polygon_bbox(piece);
    double lo = (axis == 0) ? bb.min_x : bb.min_y;
    double hi = (axis == 0) ? bb.max_x : bb.max_y;
    for (int it = 0; it < kBisectIters; ++it) {
        const double mid = 0.5 * (lo + hi);
        if (polygon_area(split_axis(piece, axis, mid).first) < want) {
            lo = mid;
        } else {
            hi = mid;
        }
    }
    return 0.5 * (lo + hi);
}

int lots_for_area(double area, double target) {
    return std::max(1, static_cast<int>(std::lround(area / target)));
}

struct CutChoice {
    std::vector<Polygon> parts;
    double score = std::numeric_limits<double>::infinity();
};

// Lower is better: aspect excess and size misfit of pieces that would become single lots,
// plus a small bias for cutting across the longer side.
double piece_penalty(const Polygon& piece, const Context& ctx) {
    const double a = polygon_area(piece);
    if (lots_for_area(a, ctx.target_area) > 1) {
        return 0.0;
    }
    const auto& p = ctx.params;
    double pen = std::max(0.0, lot_aspect_ratio(piece) - p.subdivision.max_aspect);
    if (a < p.lot_area_min) {
        pen += 1.0 + (p.lot_area_min - a) / p.lot_area_min;
    } else if (a > p.lot_area_max) {
        pen += (a - p.lot_area_max) / p.lot_area_max;
    }
    return pen;
}

double frontage_of(const Polygon& piece, const Context& ctx) {
    return measure_frontage(piece, ctx.frontage, 1e-6).length;
}

void emit_lot(const Polygon& piece, double area, const FrontageMeasure& fr, bool relaxed, Context& ctx) {
    Lot lot;
    lot.id = static_cast<int>(ctx.out.lots.size());
    lot.polygon = piece;
    lot.area = area;
    lot.use = ctx.params.industry;
    lot.access_road = fr.road_id;
    lot.frontage = fr.length;
    lot.relaxed = relaxed;
    ctx.out.lots.push_back(std::move(lot));
}

void add_parts(std::vector<Polygon>& to, std::vector<Polygon>& from) {
    for (auto& p : from) {
        if (polygon_area(p) > kAreaEps) {
            to.push_back(std::move(p));
        }
    }
}

// Guillotine cut into `parts` shares. Each side must keep a piece with full frontage and every
// piece large enough to be a lot must have it; smaller pieces are allowed but penalised.
CutChoice best_cut(const Polygon& piece, double a, int n, Context& ctx) {
    const auto& so = ctx.params.subdivision;
    std::uniform_real_distribution<double> jitter(-so.cut_jitter, so.cut_jitter);
    std::uniform_real_distribution<double> tie(0.0, 1e-6);

    CutChoice best;
    const int parts = std::max(n, 2);
    std::vector<int> ks{1, parts / 2, parts - 1};
    std::sort(ks.begin(), ks.end());
    ks.erase(std::unique(ks.begin(), ks.end()), ks.end());

    const BoundingBox bb = polygon_bbox(piece);
    // Axis 0 cuts along x = c (splitting the width); prefer cutting across the longer side.
    const int long_axis = (bb.width() >= bb.height()) ? 0 : 1;

    for (int axis = 0; axis < 2; ++axis) {
        for (int k : ks) {
            if (k < 1 || k >= parts) {
                continue;
            }
            double frac = static_cast<double>(k) / static_cast<double>(parts);
            frac = std::clamp(frac + jitter(ctx.rng) / static_cast<double>(parts), 0.02, 0.98);
            const double c = bisect_cut(piece, axis, frac * a);
            auto sides = split_axis_parts(piece, axis, c);
            double score = 0.0;
            bool ok = true;
            for (const auto* side : {&sides.first, &sides.second}) {
                bool fronted = false;
                for (const auto& q : *side) {
                    const double qa = polygon_area(q);
                    if (!(qa > kAreaEps)) {
                        continue;
                    }
                    if (frontage_of(q, ctx) >= so.min_frontage) {
                        fronted = true;
                        score += piece_penalty(q, ctx);
                    } else if (qa >= ctx.params.lot_area_min) {
                        ok = false;
                    } else {
                        score += qa / ctx.params.lot_area_min;
                    }
                }
                ok = ok && fronted;
            }
            if (!ok) {
                continue;
            }
            if (axis != long_axis) {
                score += 0.01;
            }
            score += tie(ctx.rng);
            if (score < best.score) {
                best.score = score;
                best.parts.clear();
                add_parts(best.parts, sides.first);
                add_parts(best.parts, sides.second);
            }
        }
    }
    return best;
}

// Re-cut with relaxed shape: slice a lot-sized piece off whichever end keeps full frontage,
// leaving the rest to further cuts or to open space.
CutChoice relaxed_cut(const Polygon& piece, double a, Context& ctx) {
    const auto& p = ctx.params;
    const auto& so = p.subdivision;
    const double want = std::clamp(ctx.target_area, p.lot_area_min, p.lot_area_max);
    CutChoice best;
    if (!(want < a)) {
        return best;
    }
    for (int axis = 0; axis < 2; ++axis) {
        for (bool low : {true, false}) {
            const double c = bisect_cut(piece, axis, low ? want : a - want);
            auto sides = split_axis_parts(piece, axis, c);
            std::vector<Polygon>& near = low ? sides.first : sides.second;
            std::vector<Polygon>& far = low ? sides.second : sides.first;
            double score = 0.0;
            bool lot_found = false;
            for (const auto& q : near) {
                const double qa = polygon_area(q);
                if (qa >= p.lot_area_min && frontage_of(q, ctx) >= so.min_frontage) {
                    lot_found = true;
                    score += piece_penalty(q, ctx);
                }
            }
            if (!lot_found) {
                continue;
            }
            for (const auto& q : far) {
                if (frontage_of(q, ctx) < so.min_frontage) {
                    score += polygon_area(q) / a;
                }
            }
            if (score < best.score) {
                best.score = score;
                best.parts.clear();
                add_parts(best.parts, near);
                add_parts(best.parts, far);
            }
        }
    }
    return best;
}

void split_piece(const Polygon& piece, int depth, Context& ctx) {
    const auto& p = ctx.params;
    const auto& so = p.subdivision;
    const double a = polygon_area(piece);
    if (!(a > kAreaEps)) {
        return;
    }
    const FrontageMeasure fr = measure_frontage(piece, ctx.frontage, 1e-6);
    // Cuts never add frontage, so such a piece cannot yield a lot.
    if (a < p.lot_area_min || fr.length < so.min_frontage) {
        ctx.out.residuals.push_back(OpenSpace{piece, OpenSpaceKind::kResidual});
        return;
    }

    const int n = lots_for_area(a, ctx.target_area);
    if (n == 1 && a <= p.lot_area_max && lot_aspect_ratio(piece) <= so.max_aspect) {
        emit_lot(piece, a, fr, false, ctx);
        return;
    }

    CutChoice best;
    if (depth < so.max_depth) {
        best = best_cut(piece, a, n, ctx);
    }
    if (!std::isfinite(best.score)) {
        if (a <= so.relax_factor * p.lot_area_max) {
            emit_lot(piece, a, fr, true, ctx);
            return;
        }
        if (depth < so.max_depth) {
            best = relaxed_cut(piece, a, ctx);
        }
    }
    if (!std::isfinite(best.score) || best.parts.size() < 2) {
        // Nothing splits it further; a fronted piece is still a usable lot.
        emit_lot(piece, a, fr, true, ctx);
        return;
    }
    for (const auto& part : best.parts) {
        split_piece(part, depth + 1, ctx);
    }
}

}  // namespace

double lot_aspect_ratio(const Polygon& poly) {
    const OrientedBox box = min_area_obb(poly);
    if (!(box.breadth > 0.0)) {
        return std::numeric_limits<double>::infinity();
    }
    return box.length / box.breadth;
}

SubdivisionResult subdivide_blocks(const std::vector<Block>& blocks,
                                   const std::vector<FrontageLine>& frontage,
                                   const ParameterSet& params,
                                   double target_area,
                                   std::uint64_t seed) {
    if (!(target_area > 0.0)) {
        throw std::invalid_argument("subdivide_blocks: target_area must be > 0");
    }
    Context ctx{frontage, params, target_area, std::mt19937_64(seed), SubdivisionResult{}};
    for (const auto& b : blocks) {
        split_piece(b.polygon, 0, ctx);
    }
    return std::move(ctx.out);
}

}  // namespace parkgen
