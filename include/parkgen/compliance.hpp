#pragma once

#include <map>
#include <string>

#include "parkgen/layout.hpp"
#include "parkgen/params.hpp"
#include "parkgen/rules.hpp"

namespace parkgen {

struct LayoutMetrics {
    double site_area = 0.0;
    double salable_fraction = 0.0;
    double green_fraction = 0.0;
    double road_fraction = 0.0;
    double min_primary_row = 0.0;    // +inf when the layout has no road of that class
    double min_secondary_row = 0.0;
    double perimeter_buffer = 0.0;

    int lot_count = 0;
    int lots_without_frontage = 0;
    int undersized_lots = 0;
    int oversized_lots = 0;
    int aspect_violations = 0;
    int lot_overlaps = 0;
    int infrastructure_overlaps = 0;
    int exclusion_breaches = 0;
    int road_components = 0;
    int entrance_count = 0;
    int placement_failures = 0;
    int lot_deficit = 0;

    double coverage_fraction = 0.0;
    double uncovered_area = 0.0;
    double road_length = 0.0;
    double road_length_per_ha = 0.0;
};

double metric_value(const LayoutMetrics& m, Quantity q);

// Measures every rule quantity from the layout geometry. Pure: no caching between calls.
LayoutMetrics measure_layout(const CandidateLayout& layout, const ParameterSet& params);

struct Violation {
    std::string rule_id;
    Severity severity = Severity::kHard;
    double magnitude = 0.0;
    double measured = 0.0;
    double threshold = 0.0;
    std::string message;

    bool operator==(const Violation& o) const {
        return rule_id == o.rule_id && severity == o.severity && magnitude == o.magnitude &&
               measured == o.measured && threshold == o.threshold && message == o.message;
    }
};

struct ViolationReport {
    std::map<std::string, Violation> violations;  // keyed by rule id

    int hard_count() const;
    int soft_count() const;
    double hard_magnitude() const;
    // Sum of soft magnitudes.
    double soft_penalty() const;
    bool compliant() const { return hard_count() == 0; }

    bool operator==(const ViolationReport& o) const { return violations == o.violations; }
};

// Small interpreter over the rule table: one entry per failing rule.
ViolationReport evaluate_rules(const LayoutMetrics& metrics, const RuleSet& rules);

ViolationReport validate_layout(const CandidateLayout& layout, const RuleSet& rules, const ParameterSet& params);

}  // namespace parkgen
