#include "parkgen/rules.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <limits>
#include <set>
#include <sstream>
#include <stdexcept>

namespace parkgen {
namespace {

struct QuantityEntry {
    Quantity q;
    const char* name;
};

constexpr QuantityEntry kQuantities[] = {
    {Quantity::kSalableFraction, "salable_fraction"},
    {Quantity::kGreenFraction, "green_fraction"},
    {Quantity::kRoadFraction, "road_fraction"},
    {Quantity::kMinPrimaryRow, "min_primary_row"},
    {Quantity::kMinSecondaryRow, "min_secondary_row"},
    {Quantity::kPerimeterBuffer, "perimeter_buffer"},
    {Quantity::kLotCount, "lot_count"},
    {Quantity::kLotsWithoutFrontage, "lots_without_frontage"},
    {Quantity::kUndersizedLots, "undersized_lots"},
    {Quantity::kOversizedLots, "oversized_lots"},
    {Quantity::kAspectViolations, "aspect_violations"},
    {Quantity::kLotOverlaps, "lot_overlaps"},
    {Quantity::kInfrastructureOverlaps, "infrastructure_overlaps"},
    {Quantity::kExclusionBreaches, "exclusion_breaches"},
    {Quantity::kRoadComponents, "road_components"},
    {Quantity::kEntranceCount, "entrance_count"},
    {Quantity::kPlacementFailures, "placement_failures"},
    {Quantity::kLotDeficit, "lot_deficit"},
    {Quantity::kCoverageFraction, "coverage_fraction"},
    {Quantity::kUncoveredArea, "uncovered_area"},
};

std::string trim_copy(std::string_view s) {
    size_t b = 0;
    while (b < s.size() && std::isspace(static_cast<unsigned char>(s[b]))) {
        ++b;
    }
    size_t e = s.size();
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) {
        --e;
    }
    return std::string(s.substr(b, e - b));
}

std::string lower_copy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// First five fields split on ','; the message keeps any further commas.
std::vector<std::string> split_rule_fields(const std::string& line) {
    std::vector<std::string> out;
    size_t start = 0;
    for (int k = 0; k < 5; ++k) {
        const size_t pos = line.find(',', start);
        if (pos == std::string::npos) {
            out.push_back(line.substr(start));
            return out;
        }
        out.push_back(line.substr(start, pos - start));
        start = pos + 1;
    }
    out.push_back(line.substr(start));
    return out;
}

Rule make_rule(const char* id, Quantity q, Comparison c, double threshold, Severity s, const char* message) {
    Rule r;
    r.id = id;
    r.quantity = q;
    r.comparison = c;
    r.threshold = threshold;
    r.severity = s;
    r.message = message;
    return r;
}

}  // namespace

const Rule* RuleSet::find(std::string_view id) const {
    for (const auto& r : rules) {
        if (r.id == id) {
            return &r;
        }
    }
    return nullptr;
}

const char* quantity_name(Quantity q) {
    for (const auto& e : kQuantities) {
        if (e.q == q) {
            return e.name;
        }
    }
    return "unknown";
}

Quantity parse_quantity(std::string_view s) {
    const std::string key = lower_copy(trim_copy(s));
    for (const auto& e : kQuantities) {
        if (key == e.name) {
            return e.q;
        }
    }
    throw std::runtime_error("unknown rule quantity: " + key);
}

const char* comparison_symbol(Comparison c) {
    switch (c) {
    case Comparison::kLess:
        return "<";
    case Comparison::kLessEqual:
        return "<=";
    case Comparison::kEqual:
        return "==";
    case Comparison::kGreaterEqual:
        return ">=";
    case Comparison::kGreater:
        return ">";
    }
    return "?";
}

Comparison parse_comparison(std::string_view s) {
    const std::string t = trim_copy(s);
    if (t == "<" || t == "lt") {
        return Comparison::kLess;
    }
    if (t == "<=" || t == "le") {
        return Comparison::kLessEqual;
    }
    if (t == "==" || t == "=" || t == "eq") {
        return Comparison::kEqual;
    }
    if (t == ">=" || t == "ge") {
        return Comparison::kGreaterEqual;
    }
    if (t == ">" || t == "gt") {
        return Comparison::kGreater;
    }
    throw std::runtime_error("unknown comparison operator: " + t);
}

const char* severity_name(Severity s) {
    return s == Severity::kHard ? "hard" : "soft";
}

Severity parse_severity(std::string_view s) {
    const std::string t = lower_copy(trim_copy(s));
    if (t == "hard") {
        return Severity::kHard;
    }
    if (t == "soft") {
        return Severity::kSoft;
    }
    throw std::runtime_error("unknown severity (expected hard|soft): " + t);
}

bool rule_holds(Comparison c, double measured, double threshold, double tol) {
    switch (c) {
    case Comparison::kLess:
        return measured < threshold;
    case Comparison::kLessEqual:
        return measured <= threshold + tol;
    case Comparison::kEqual:
        return std::abs(measured - threshold) <= tol;
    case Comparison::kGreaterEqual:
        return measured >= threshold - tol;
    case Comparison::kGreater:
        return measured > threshold;
    }
    return false;
}

double violation_magnitude(double measured, double threshold) {
    return std::abs(measured - threshold) / std::max(std::abs(threshold), 1.0);
}

RuleSet default_rule_set() {
    using C = Comparison;
    using Q = Quantity;
    const Severity hard = Severity::kHard;
    const Severity soft = Severity::kSoft;

    RuleSet rs;
    rs.rules = {
        make_rule("salable-max", Q::kSalableFraction, C::kLessEqual, 0.85, hard, "salable area exceeds the regulatory ceiling"),
        make_rule("salable-min", Q::kSalableFraction, C::kGreaterEqual, 0.70, soft, "salable area below target"),
        make_rule("green-min", Q::kGreenFraction, C::kGreaterEqual, 0.10, soft, "green area below 10% of the site"),
        make_rule("primary-row", Q::kMinPrimaryRow, C::kGreaterEqual, 25.0, hard, "primary road right-of-way narrower than 25 m"),
        make_rule("secondary-row", Q::kMinSecondaryRow, C::kGreaterEqual, 12.0, hard, "secondary road right-of-way narrower than 12 m"),
        make_rule("buffer", Q::kPerimeterBuffer, C::kGreaterEqual, 5.0, hard, "perimeter buffer narrower than 5 m"),
        make_rule("frontage", Q::kLotsWithoutFrontage, C::kEqual, 0.0, hard, "lots without road frontage"),
        make_rule("lot-overlap", Q::kLotOverlaps, C::kEqual, 0.0, hard, "lots overlap each other or a road"),
        make_rule("infra-overlap", Q::kInfrastructureOverlaps, C::kEqual, 0.0, hard, "infrastructure overlaps lots, roads or other infrastructure"),
        make_rule("exclusion", Q::kExclusionBreaches, C::kEqual, 0.0, hard, "lots inside an infrastructure exclusion radius"),
        make_rule("road-connected", Q::kRoadComponents, C::kEqual, 1.0, hard, "road network is not connected"),
        make_rule("entrances", Q::kEntranceCount, C::kGreaterEqual, 1.0, hard, "site has no entrance"),
        make_rule("lot-deficit", Q::kLotDeficit, C::kEqual, 0.0, soft, "fewer lots than requested"),
        make_rule("undersized", Q::kUndersizedLots, C::kEqual, 0.0, soft, "lots below the minimum lot area"),
        make_rule("aspect", Q::kAspectViolations, C::kEqual, 0.0, soft, "lots outside the 1:1 to 1:4 aspect range"),
        make_rule("placement", Q::kPlacementFailures, C::kEqual, 0.0, soft, "infrastructure that could not be placed"),
        make_rule("coverage", Q::kCoverageFraction, C::kGreaterEqual, 0.95, soft, "buildable area too far from roads"),
        make_rule("coverage-floor", Q::kCoverageFraction, C::kGreaterEqual, 0.90, hard, "large parts of the site have no road access"),
    };
    return rs;
}

void validate_rule_set(const RuleSet& rules) {
    std::set<std::string> ids;
    for (const auto& r : rules.rules) {
        if (r.id.empty()) {
            throw std::invalid_argument("rule with empty id");
        }
        if (!ids.insert(r.id).second) {
            throw std::invalid_argument("duplicate rule id: " + r.id);
        }
        if (!std::isfinite(r.threshold)) {
            throw std::invalid_argument("rule " + r.id + ": threshold must be finite");
        }
    }
}

RuleSet read_rule_set_csv(std::istream& in) {
    RuleSet rs;
    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        line_no++;
        const std::string t = trim_copy(line);
        if (t.empty() || t[0] == '#') {
            continue;
        }
        if (line_no == 1 && lower_copy(t).rfind("id,", 0) == 0) {
            continue;
        }

        const auto fields = split_rule_fields(t);
        if (fields.size() < 5) {
            throw std::runtime_error("line " + std::to_string(line_no) + ": expected at least 5 columns");
        }
        Rule r;
        try {
            r.id = trim_copy(fields[0]);
            r.quantity = parse_quantity(fields[1]);
            r.comparison = parse_comparison(fields[2]);
            const std::string thr = trim_copy(fields[3]);
            size_t pos = 0;
            r.threshold = std::stod(thr, &pos);
            if (pos != thr.size()) {
                throw std::runtime_error("invalid threshold: " + thr);
            }
            r.severity = parse_severity(fields[4]);
            if (fields.size() > 5) {
                r.message = trim_copy(fields[5]);
            }
        } catch (const std::logic_error& e) {
            // std::stod reports bad input via invalid_argument / out_of_range.
            throw std::runtime_error("line " + std::to_string(line_no) + ": " + e.what());
        } catch (const std::runtime_error& e) {
            throw std::runtime_error("line " + std::to_string(line_no) + ": " + e.what());
        }
        rs.rules.push_back(std::move(r));
    }
    validate_rule_set(rs);
    return rs;
}

void write_rule_set_csv(const RuleSet& rules, std::ostream& out) {
    out << "id,quantity,op,threshold,severity,message\n";
    for (const auto& r : rules.rules) {
        std::ostringstream thr;
        thr << std::setprecision(std::numeric_limits<double>::max_digits10) << r.threshold;
        out << r.id << "," << quantity_name(r.quantity) << "," << comparison_symbol(r.comparison) << ","
            << thr.str() << "," << severity_name(r.severity) << "," << r.message << "\n";
    }
}

}  // namespace parkgen
