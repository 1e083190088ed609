#pragma once

#include <istream>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace parkgen {

// Measurable layout quantities a rule can constrain.
enum class Quantity {
    kSalableFraction = 0,
    kGreenFraction,
    kRoadFraction,
    kMinPrimaryRow,
    kMinSecondaryRow,
    kPerimeterBuffer,
    kLotCount,
    kLotsWithoutFrontage,
    kUndersizedLots,
    kOversizedLots,
    kAspectViolations,
    kLotOverlaps,
    kInfrastructureOverlaps,
    kExclusionBreaches,
    kRoadComponents,
    kEntranceCount,
    kPlacementFailures,
    kLotDeficit,
    kCoverageFraction,
    kUncoveredArea,
};

enum class Comparison {
    kLess = 0,
    kLessEqual,
    kEqual,
    kGreaterEqual,
    kGreater,
};

enum class Severity {
    kHard = 0,  // must hold; a violation makes the layout non-viable
    kSoft = 1,  // penalised
};

struct Rule {
    std::string id;
    Quantity quantity = Quantity::kSalableFraction;
    Comparison comparison = Comparison::kLessEqual;
    double threshold = 0.0;
    Severity severity = Severity::kHard;
    std::string message;
};

struct RuleSet {
    std::vector<Rule> rules;

    const Rule* find(std::string_view id) const;
};

const char* quantity_name(Quantity q);
Quantity parse_quantity(std::string_view s);
const char* comparison_symbol(Comparison c);
Comparison parse_comparison(std::string_view s);
const char* severity_name(Severity s);
Severity parse_severity(std::string_view s);

// True when `measured <op> threshold` holds (equality within tol).
bool rule_holds(Comparison c, double measured, double threshold, double tol = 1e-9);

// Normalised violation size: |measured - threshold| / max(|threshold|, 1).
double violation_magnitude(double measured, double threshold);

// IEAT-style defaults (salable ceiling, ROW minimums, buffer, frontage, overlap and connectivity).
RuleSet default_rule_set();

// Throws std::invalid_argument on empty or duplicate ids and non-finite thresholds.
void validate_rule_set(const RuleSet& rules);

// CSV: id,quantity,op,threshold,severity[,message]. Optional header line, '#' comments, blank lines.
RuleSet read_rule_set_csv(std::istream& in);
void write_rule_set_csv(const RuleSet& rules, std::ostream& out);

}  // namespace parkgen
