#include "parkgen/optimizer.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <iomanip>
#include <iostream>
#include <limits>
#include <mutex>
#include <numeric>
#include <random>
#include <utility>

#include "parkgen/errors.hpp"
#include "parkgen/logging.hpp"
#include "parkgen/timeline.hpp"

#if defined(_OPENMP)
#include <omp.h>
#endif

namespace parkgen {

namespace {

constexpr int kFailedHardCount = 1000000;
constexpr double kFailedObjective = 1e9;
constexpr double kDomEps = 1e-12;

int omp_max_threads() {
#if defined(_OPENMP)
    return omp_get_max_threads();
#else
    return 1;
#endif
}

void omp_set_threads(int threads) {
#if defined(_OPENMP)
    if (threads > 0) {
        omp_set_num_threads(threads);
    }
#else
    (void)threads;
#endif
}

// Genes whose value is periodic wrap around; the others saturate.
bool gene_wraps(int g) {
    return g == kGeneSecondaryPhase || g == kGeneEntranceChoice || g == kGeneEntranceOffset || g == kGeneCutSeed;
}

double fold_gene(int g, double v) {
    const double top = std::nextafter(1.0, 0.0);
    if (gene_wraps(g)) {
        v -= std::floor(v);
        return std::min(v, top);
    }
    return std::min(top, std::max(0.0, v));
}

Genome random_genome(std::mt19937_64& rng) {
    std::uniform_real_distribution<double> u01(0.0, 1.0);
    Genome g;
    for (int i = 0; i < kGeneCount; ++i) {
        g[i] = u01(rng);
    }
    return g;
}

struct Ranked {
    std::vector<int> rank;
    std::vector<double> crowd;
};

Ranked rank_population(const std::vector<Evaluation>& pop) {
    Ranked r;
    r.rank.assign(pop.size(), 0);
    r.crowd.assign(pop.size(), 0.0);
    const auto fronts = non_dominated_sort(pop);
    for (size_t f = 0; f < fronts.size(); ++f) {
        const auto cd = crowding_distance(pop, fronts[f]);
        for (size_t k = 0; k < fronts[f].size(); ++k) {
            const size_t i = static_cast<size_t>(fronts[f][k]);
            r.rank[i] = static_cast<int>(f);
            r.crowd[i] = cd[k];
        }
    }
    return r;
}

int tournament(const Ranked& r, int size, std::mt19937_64& rng) {
    std::uniform_int_distribution<int> pick(0, static_cast<int>(r.rank.size()) - 1);
    int best = pick(rng);
    for (int k = 1; k < size; ++k) {
        const int c = pick(rng);
        const size_t bi = static_cast<size_t>(best);
        const size_t ci = static_cast<size_t>(c);
        if (r.rank[ci] < r.rank[bi] || (r.rank[ci] == r.rank[bi] && r.crowd[ci] > r.crowd[bi])) {
            best = c;
        }
    }
    return best;
}

// Scalar progress used for stagnation: aggregate once feasible, negative hard load before.
double progress_of(const Evaluation& e) {
    if (!e.decoded) {
        return -1e12;
    }
    if (e.hard_count == 0) {
        return e.scores.aggregate;
    }
    return -static_cast<double>(e.hard_count) - std::min(1e6, e.hard_magnitude);
}

// Evaluates genomes into `out` in parallel; each slot is written by one iteration only.
void evaluate_all(const DecodeContext& ctx,
                  const std::vector<Genome>& genomes,
                  const ParameterSet& params,
                  const RuleSet& rules,
                  std::vector<Evaluation>& out) {
    out.assign(genomes.size(), Evaluation{});
    std::vector<std::exception_ptr> errors(genomes.size());
    const int n = static_cast<int>(genomes.size());
#pragma omp parallel for schedule(dynamic)
    for (int i = 0; i < n; ++i) {
        const size_t k = static_cast<size_t>(i);
        try {
            out[k] = evaluate_genome(ctx, genomes[k], params, rules);
        } catch (...) {
            errors[k] = std::current_exception();
        }
    }
    for (const auto& e : errors) {
        if (e) {
            std::rethrow_exception(e);
        }
    }
}

}  // namespace

Evaluation evaluate_genome(const DecodeContext& ctx,
                           const Genome& genome,
                           const ParameterSet& params,
                           const RuleSet& rules) {
    Evaluation ev;
    ev.genome = genome;
    try {
        ev.layout = decode_layout(ctx, genome, params);
    } catch (const PlanningError& e) {
        ev.decoded = false;
        ev.error = e.what();
        ev.hard_count = kFailedHardCount;
        ev.hard_magnitude = std::numeric_limits<double>::infinity();
        ev.objectives.fill(kFailedObjective);
        return ev;
    }
    ev.decoded = true;
    ev.metrics = measure_layout(ev.layout, params);
    ev.report = evaluate_rules(ev.metrics, rules);
    const TimelineResult timeline = estimate_timeline(ev.layout, params);
    ev.scores = score_layout(ev.layout, ev.metrics, ev.report, timeline, params);

    ev.hard_count = ev.report.hard_count();
    ev.hard_magnitude = ev.report.hard_magnitude();
    ev.objectives = {ev.report.soft_penalty(), -ev.scores.aggregate, ev.metrics.road_length_per_ha,
                     -ev.scores[ScoreDimension::kLotQuality]};
    for (auto& o : ev.objectives) {
        if (!std::isfinite(o)) {
            o = kFailedObjective;
        }
    }
    return ev;
}

bool constrained_dominates(const Evaluation& a, const Evaluation& b) {
    const bool fa = a.hard_count == 0;
    const bool fb = b.hard_count == 0;
    if (fa != fb) {
        return fa;
    }
    if (!fa) {
        if (a.hard_count != b.hard_count) {
            return a.hard_count < b.hard_count;
        }
        return a.hard_magnitude < b.hard_magnitude - kDomEps;
    }
    bool strictly = false;
    for (int k = 0; k < kObjectiveCount; ++k) {
        const size_t i = static_cast<size_t>(k);
        if (a.objectives[i] > b.objectives[i] + kDomEps) {
            return false;
        }
        if (a.objectives[i] < b.objectives[i] - kDomEps) {
            strictly = true;
        }
    }
    return strictly;
}

bool better_final(const Evaluation& a, const Evaluation& b) {
    if (a.decoded != b.decoded) {
        return a.decoded;
    }
    if (a.hard_count != b.hard_count) {
        return a.hard_count < b.hard_count;
    }
    if (a.scores.aggregate != b.scores.aggregate) {
        return a.scores.aggregate > b.scores.aggregate;
    }
    return a.report.soft_penalty() < b.report.soft_penalty();
}

std::vector<std::vector<int>> non_dominated_sort(const std::vector<Evaluation>& pop) {
    const size_t n = pop.size();
    std::vector<std::vector<int>> dominated(n);
    std::vector<int> count(n, 0);
    std::vector<std::vector<int>> fronts;
    std::vector<int> current;
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = 0; j < n; ++j) {
            if (i == j) {
                continue;
            }
            if (constrained_dominates(pop[i], pop[j])) {
                dominated[i].push_back(static_cast<int>(j));
            } else if (constrained_dominates(pop[j], pop[i])) {
                ++count[i];
            }
        }
        if (count[i] == 0) {
            current.push_back(static_cast<int>(i));
        }
    }
    while (!current.empty()) {
        std::vector<int> next;
        for (int i : current) {
            for (int j : dominated[static_cast<size_t>(i)]) {
                if (--count[static_cast<size_t>(j)] == 0) {
                    next.push_back(j);
                }
            }
        }
        std::sort(next.begin(), next.end());
        fronts.push_back(std::move(current));
        current = std::move(next);
    }
    return fronts;
}

std::vector<double> crowding_distance(const std::vector<Evaluation>& pop, const std::vector<int>& front) {
    const size_t m = front.size();
    std::vector<double> d(m, 0.0);
    if (m <= 2) {
        std::fill(d.begin(), d.end(), std::numeric_limits<double>::infinity());
        return d;
    }
    std::vector<size_t> order(m);
    for (int k = 0; k < kObjectiveCount; ++k) {
        const size_t ok = static_cast<size_t>(k);
        std::iota(order.begin(), order.end(), size_t{0});
        auto obj = [&](size_t pos) { return pop[static_cast<size_t>(front[pos])].objectives[ok]; };
        std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) { return obj(a) < obj(b); });
        const double lo = obj(order.front());
        const double hi = obj(order.back());
        d[order.front()] = std::numeric_limits<double>::infinity();
        d[order.back()] = std::numeric_limits<double>::infinity();
        if (!(hi - lo > 0.0)) {
            continue;
        }
        for (size_t i = 1; i + 1 < m; ++i) {
            d[order[i]] += (obj(order[i + 1]) - obj(order[i - 1])) / (hi - lo);
        }
    }
    return d;
}

const char* stop_reason_name(StopReason r) {
    switch (r) {
    case StopReason::kGenerationLimit:
        return "generation-limit";
    case StopReason::kStagnation:
        return "stagnation";
    case StopReason::kDeadline:
        return "deadline";
    case StopReason::kCancelled:
        return "cancelled";
    }
    return "unknown";
}

OptimizerResult optimize_layout(const DecodeContext& ctx, const ParameterSet& params, const RuleSet& rules) {
    const OptimizerOptions& opt = params.optimizer;
    const auto t0 = std::chrono::steady_clock::now();
    auto elapsed = [&t0]() {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
    };

    omp_set_threads(opt.threads);
    std::mt19937_64 rng(opt.seed);
    std::uniform_real_distribution<double> u01(0.0, 1.0);
    std::normal_distribution<double> gauss(0.0, opt.mutation_sigma);
    std::uniform_int_distribution<int> pick_gene(0, kGeneCount - 1);

    const size_t mu = static_cast<size_t>(opt.population);
    std::vector<Genome> genomes;
    genomes.reserve(mu);
    genomes.push_back(Genome{});  // the default parameterization always competes
    while (genomes.size() < mu) {
        genomes.push_back(random_genome(rng));
    }

    OptimizerResult res;
    std::vector<Evaluation> pop;
    evaluate_all(ctx, genomes, params, rules, pop);
    res.evaluations += static_cast<long long>(pop.size());

    auto track_best = [&res](const std::vector<Evaluation>& evs) {
        for (const auto& e : evs) {
            if (better_final(e, res.best)) {
                res.best = e;
            }
        }
    };
    res.best = pop.front();
    track_best(pop);

    std::vector<double> history{progress_of(res.best)};
    res.stop_reason = StopReason::kGenerationLimit;

    if (opt.log_every > 0) {
        std::lock_guard<std::mutex> lk(log_mutex());
        std::cerr << opt.log_prefix << " start pop=" << mu << " gens=" << opt.generations
                  << " threads=" << omp_max_threads() << "\n";
    }

    for (int gen = 1; gen <= opt.generations; ++gen) {
        if (opt.cancel && opt.cancel->load()) {
            res.stop_reason = StopReason::kCancelled;
            break;
        }
        if (opt.time_limit_s > 0.0 && elapsed() >= opt.time_limit_s) {
            res.stop_reason = StopReason::kDeadline;
            break;
        }

        const Ranked ranked = rank_population(pop);
        std::vector<Genome> children;
        children.reserve(mu);
        while (children.size() < mu) {
            Genome a = pop[static_cast<size_t>(tournament(ranked, opt.tournament_size, rng))].genome;
            Genome b = pop[static_cast<size_t>(tournament(ranked, opt.tournament_size, rng))].genome;
            if (u01(rng) < opt.crossover_rate) {
                for (int g = 0; g < kGeneCount; ++g) {
                    if (u01(rng) < 0.5) {
                        std::swap(a[g], b[g]);
                    }
                }
            }
            for (Genome* c : {&a, &b}) {
                if (u01(rng) < opt.mutation_rate) {
                    const int g = pick_gene(rng);
                    (*c)[g] = fold_gene(g, (*c)[g] + gauss(rng));
                }
            }
            children.push_back(a);
            if (children.size() < mu) {
                children.push_back(b);
            }
        }

        std::vector<Evaluation> offspring;
        evaluate_all(ctx, children, params, rules, offspring);
        res.evaluations += static_cast<long long>(offspring.size());
        track_best(offspring);

        // (mu + lambda) survivor selection by front, then crowding.
        std::vector<Evaluation> merged;
        merged.reserve(pop.size() + offspring.size());
        for (auto& e : pop) {
            merged.push_back(std::move(e));
        }
        for (auto& e : offspring) {
            merged.push_back(std::move(e));
        }
        const auto fronts = non_dominated_sort(merged);
        std::vector<Evaluation> next;
        next.reserve(mu);
        for (const auto& front : fronts) {
            if (next.size() + front.size() <= mu) {
                for (int i : front) {
                    next.push_back(std::move(merged[static_cast<size_t>(i)]));
                }
                continue;
            }
            const auto cd = crowding_distance(merged, front);
            std::vector<size_t> order(front.size());
            std::iota(order.begin(), order.end(), size_t{0});
            std::stable_sort(order.begin(), order.end(), [&cd](size_t a, size_t b) { return cd[a] > cd[b]; });
            for (size_t k = 0; k < order.size() && next.size() < mu; ++k) {
                next.push_back(std::move(merged[static_cast<size_t>(front[order[k]])]));
            }
            break;
        }
        pop = std::move(next);
        res.generations = gen;
        history.push_back(progress_of(res.best));

        if (opt.log_every > 0 && gen % opt.log_every == 0) {
            std::lock_guard<std::mutex> lk(log_mutex());
            std::cerr << opt.log_prefix << " gen=" << gen << " hard=" << res.best.hard_count
                      << " aggregate=" << std::fixed << std::setprecision(4) << res.best.scores.aggregate
                      << " lots=" << res.best.layout.lots.size() << " evals=" << res.evaluations
                      << " t=" << std::setprecision(2) << elapsed() << "s" << std::defaultfloat << "\n";
        }

        const size_t w = static_cast<size_t>(opt.stagnation_window);
        if (opt.stagnation_window > 0 && history.size() > w) {
            const double gain = history.back() - history[history.size() - 1 - w];
            if (gain < opt.stagnation_tolerance) {
                res.stop_reason = StopReason::kStagnation;
                break;
            }
        }
    }

    if (!res.best.decoded) {
        throw InfeasibleGeometry("no parameterization produced a usable layout (" + res.best.error + ")");
    }
    res.compliant = res.best.hard_count == 0;

    const auto fronts = non_dominated_sort(pop);
    if (!fronts.empty()) {
        for (int i : fronts.front()) {
            const Evaluation& e = pop[static_cast<size_t>(i)];
            if (!e.decoded) {
                continue;
            }
            FrontMember fm;
            fm.genome = e.genome;
            fm.objectives = e.objectives;
            fm.hard_count = e.hard_count;
            fm.aggregate = e.scores.aggregate;
            res.front.push_back(fm);
        }
    }
    res.elapsed_s = elapsed();

    if (opt.log_every > 0) {
        std::lock_guard<std::mutex> lk(log_mutex());
        std::cerr << opt.log_prefix << " done gens=" << res.generations << " evals=" << res.evaluations
                  << " stop=" << stop_reason_name(res.stop_reason) << " compliant=" << (res.compliant ? 1 : 0)
                  << "\n";
    }
    return res;
}

}  // namespace parkgen
