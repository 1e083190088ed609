#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "parkgen/cli_parse.hpp"
#include "parkgen/errors.hpp"
#include "parkgen/params.hpp"
#include "parkgen/pipeline.hpp"
#include "parkgen/rules.hpp"

namespace {

struct Args {
    double width = 500.0;
    double height = 400.0;
    parkgen::Polygon boundary;       // overrides width/height when given
    parkgen::Polyline reference;     // optional highway line
    bool default_reference = true;   // line along the south edge of the rectangle
    std::string industry;
    double lot_target = 1200.0;
    int min_lots = 0;
    int entrances = 1;
    std::string rules_path;
    std::string write_rules_path;
    std::string features_path;
    parkgen::OptimizerOptions opt;
};

void usage() {
    std::cout << "Usage: park_plan_demo [--width 500] [--height 400] [--boundary \"x,y;x,y;...\"]\n"
              << "                      [--reference \"x,y;x,y\"] [--no-reference] [--industry mixed]\n"
              << "                      [--lot-target 1200] [--min-lots 0] [--entrances 1]\n"
              << "                      [--population 24] [--generations 40] [--seed 1] [--threads 0]\n"
              << "                      [--time-limit 0] [--rules rules.csv] [--write-rules out.csv]\n"
              << "                      [--features out.csv] [--log-every 0]\n";
}

Args parse_args(int argc, char** argv) {
    using namespace parkgen;
    Args args;
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--width") {
            args.width = parse_double(require_arg(i, argc, argv, a));
        } else if (a == "--height") {
            args.height = parse_double(require_arg(i, argc, argv, a));
        } else if (a == "--boundary") {
            args.boundary = parse_point_list(require_arg(i, argc, argv, a));
        } else if (a == "--reference") {
            args.reference = parse_point_list(require_arg(i, argc, argv, a));
        } else if (a == "--no-reference") {
            args.default_reference = false;
        } else if (a == "--industry") {
            args.industry = require_arg(i, argc, argv, a);
        } else if (a == "--lot-target") {
            args.lot_target = parse_double(require_arg(i, argc, argv, a));
        } else if (a == "--min-lots") {
            args.min_lots = parse_int(require_arg(i, argc, argv, a));
        } else if (a == "--entrances") {
            args.entrances = parse_int(require_arg(i, argc, argv, a));
        } else if (a == "--population") {
            args.opt.population = parse_int(require_arg(i, argc, argv, a));
        } else if (a == "--generations") {
            args.opt.generations = parse_int(require_arg(i, argc, argv, a));
        } else if (a == "--seed") {
            args.opt.seed = parse_u64(require_arg(i, argc, argv, a));
        } else if (a == "--threads") {
            args.opt.threads = parse_int(require_arg(i, argc, argv, a));
        } else if (a == "--time-limit") {
            args.opt.time_limit_s = parse_double(require_arg(i, argc, argv, a));
        } else if (a == "--log-every") {
            args.opt.log_every = parse_int(require_arg(i, argc, argv, a));
        } else if (a == "--rules") {
            args.rules_path = require_arg(i, argc, argv, a);
        } else if (a == "--write-rules") {
            args.write_rules_path = require_arg(i, argc, argv, a);
        } else if (a == "--features") {
            args.features_path = require_arg(i, argc, argv, a);
        } else if (a == "-h" || a == "--help") {
            usage();
            std::exit(0);
        } else {
            throw std::runtime_error("unknown arg: " + a);
        }
    }
    if (args.boundary.empty() && !(args.width > 0.0 && args.height > 0.0)) {
        throw std::runtime_error("--width and --height must be > 0");
    }
    if (args.reference.size() == 1) {
        throw std::runtime_error("--reference needs at least two points");
    }
    return args;
}

void write_features(const std::vector<parkgen::LayoutFeature>& features, std::ostream& out) {
    out << "id,type,wkt\n";
    out << std::setprecision(10);
    for (const auto& f : features) {
        out << f.id << "," << f.type << ",\"";
        if (!f.polyline.empty()) {
            out << "LINESTRING (";
            for (size_t i = 0; i < f.polyline.size(); ++i) {
                out << (i ? ", " : "") << f.polyline[i].x << " " << f.polyline[i].y;
            }
            out << ")";
        } else {
            out << "POLYGON ((";
            for (size_t i = 0; i <= f.polygon.size(); ++i) {
                const auto& p = f.polygon[i % f.polygon.size()];
                out << (i ? ", " : "") << p.x << " " << p.y;
            }
            out << "))";
        }
        out << "\"\n";
    }
}

}  // namespace

int main(int argc, char** argv) {
    try {
        const Args args = parse_args(argc, argv);

        parkgen::ParameterSet params;
        if (!args.industry.empty()) {
            params = parkgen::parameters_for_industry(parkgen::parse_industry(args.industry));
        } else {
            params.lot_area_target = args.lot_target;
        }
        params.min_lot_count = args.min_lots;
        params.entrance_count = args.entrances;
        params.optimizer = args.opt;

        parkgen::RuleSet rules = parkgen::default_rule_set();
        if (!args.rules_path.empty()) {
            std::ifstream f(args.rules_path);
            if (!f) {
                throw std::runtime_error("failed to open: " + args.rules_path);
            }
            rules = parkgen::read_rule_set_csv(f);
        }
        if (!args.write_rules_path.empty()) {
            std::ofstream f(args.write_rules_path);
            if (!f) {
                throw std::runtime_error("failed to open for write: " + args.write_rules_path);
            }
            parkgen::write_rule_set_csv(rules, f);
        }

        parkgen::Polygon boundary = args.boundary;
        parkgen::Polyline reference = args.reference;
        if (boundary.empty()) {
            boundary = {{0.0, 0.0}, {args.width, 0.0}, {args.width, args.height}, {0.0, args.height}};
            if (reference.empty() && args.default_reference) {
                reference = {{-100.0, -30.0}, {args.width + 100.0, -30.0}};
            }
        }

        const auto rep = parkgen::plan_site(boundary, reference.empty() ? nullptr : &reference, params, rules);

        std::cout << std::fixed << std::setprecision(3);
        std::cout << "compliant: " << (rep.compliant ? "yes" : "no") << "\n";
        std::cout << "site_area_m2: " << rep.metrics.site_area << "\n";
        std::cout << "lots: " << rep.layout.lots.size() << "\n";
        std::cout << "salable_fraction: " << rep.metrics.salable_fraction << "\n";
        std::cout << "green_fraction: " << rep.metrics.green_fraction << "\n";
        std::cout << "road_length_m: " << rep.metrics.road_length << "\n";
        std::cout << "road_coverage: " << rep.metrics.coverage_fraction << "\n";
        for (const auto& u : rep.layout.utilities) {
            std::cout << "utility." << parkgen::utility_kind_name(u.kind) << ": main_m=" << u.main_length
                      << " service_m=" << u.service_length << " connections=" << u.connections
                      << " unserved=" << u.unserved << " cost=" << u.cost << "\n";
        }
        std::cout << "infrastructure: " << rep.layout.infrastructure.size() << "\n";
        std::cout << "entrances: " << rep.layout.entrances.size() << "\n";
        std::cout << "hard_violations: " << rep.violations.hard_count() << "\n";
        std::cout << "soft_penalty: " << rep.violations.soft_penalty() << "\n";
        for (const auto& kv : rep.violations.violations) {
            std::cout << "  [" << parkgen::severity_name(kv.second.severity) << "] " << kv.second.message << "\n";
        }
        for (int d = 0; d < parkgen::kScoreDimensionCount; ++d) {
            const auto dim = static_cast<parkgen::ScoreDimension>(d);
            std::cout << "score." << parkgen::score_dimension_name(dim) << ": " << rep.scores[dim] << "\n";
        }
        std::cout << "score.aggregate: " << rep.scores.aggregate << " (" << rep.scores.grade << ")\n";
        std::cout << std::setprecision(0);
        std::cout << "timeline_days: " << rep.timeline.total_duration_days << "\n";
        std::cout << "critical_path:";
        for (const auto& id : rep.timeline.critical_path) {
            std::cout << " " << id;
        }
        std::cout << "\n";
        std::cout << "max_parallel: " << rep.timeline.max_parallel << "\n";
        std::cout << std::setprecision(2);
        std::cout << "optimizer: generations=" << rep.stats.generations << " evaluations=" << rep.stats.evaluations
                  << " elapsed_s=" << rep.stats.elapsed_s
                  << " stop=" << parkgen::stop_reason_name(rep.stats.stop_reason) << "\n";

        if (!args.features_path.empty()) {
            std::ofstream f(args.features_path);
            if (!f) {
                throw std::runtime_error("failed to open for write: " + args.features_path);
            }
            write_features(rep.features, f);
        }
        return rep.compliant ? 0 : 2;
    } catch (const parkgen::PlanningError& e) {
        std::cerr << "planning failed: " << e.what() << "\n";
        return 3;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
