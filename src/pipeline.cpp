#include "parkgen/pipeline.hpp"

#include <iomanip>
#include <iostream>
#include <mutex>

#include "parkgen/layout_decoder.hpp"
#include "parkgen/logging.hpp"

namespace parkgen {

SitePlanReport plan_site(const Polygon& boundary,
                         const Polyline* reference,
                         const ParameterSet& params,
                         const RuleSet& rules) {
    validate_parameters(params);
    validate_rule_set(rules);

    const DecodeContext ctx = prepare_decode(boundary, reference, params);
    const bool verbose = params.optimizer.log_every > 0;
    if (verbose) {
        std::lock_guard<std::mutex> lk(log_mutex());
        std::cerr << params.optimizer.log_prefix << " site area=" << std::fixed << std::setprecision(1)
                  << ctx.site_area << " m2 edges=" << ctx.boundary.size()
                  << " frontage candidates=" << ctx.ranked_edges.size() << std::defaultfloat << "\n";
    }

    OptimizerResult opt = optimize_layout(ctx, params, rules);

    SitePlanReport rep;
    rep.layout = std::move(opt.best.layout);
    rep.metrics = opt.best.metrics;
    rep.violations = std::move(opt.best.report);
    rep.timeline = estimate_timeline(rep.layout, params);
    rep.scores = score_layout(rep.layout, rep.metrics, rep.violations, rep.timeline, params);
    rep.features = layout_features(rep.layout);
    rep.compliant = opt.compliant;
    rep.stats.generations = opt.generations;
    rep.stats.evaluations = opt.evaluations;
    rep.stats.elapsed_s = opt.elapsed_s;
    rep.stats.stop_reason = opt.stop_reason;
    rep.stats.front_size = opt.front.size();

    if (verbose) {
        std::lock_guard<std::mutex> lk(log_mutex());
        std::cerr << params.optimizer.log_prefix << " plan lots=" << rep.layout.lots.size() << " salable="
                  << std::fixed << std::setprecision(3) << rep.metrics.salable_fraction
                  << " hard=" << rep.violations.hard_count() << " score=" << rep.scores.aggregate
                  << " grade=" << rep.scores.grade << " days=" << std::setprecision(0)
                  << rep.timeline.total_duration_days << std::defaultfloat << "\n";
        for (const auto& u : rep.layout.utilities) {
            std::cerr << params.optimizer.log_prefix << "   " << utility_kind_name(u.kind) << " main=" << std::fixed
                      << std::setprecision(0) << u.main_length << "m service=" << u.service_length
                      << "m unserved=" << u.unserved << std::defaultfloat << "\n";
        }
        for (const auto& kv : rep.violations.violations) {
            std::cerr << params.optimizer.log_prefix << "   " << severity_name(kv.second.severity) << " "
                      << kv.first << ": " << kv.second.message << "\n";
        }
    }
    return rep;
}

}  // namespace parkgen
