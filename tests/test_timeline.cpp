#include <doctest/doctest.h>

#include <algorithm>
#include <set>
#include <string>

#include "parkgen/errors.hpp"
#include "parkgen/timeline.hpp"
#include "test_helpers.hpp"

using namespace parkgen;

namespace {

WorkPackage pkg(const std::string& id, double days, std::vector<std::string> preds) {
    WorkPackage p;
    p.id = id;
    p.name = id;
    p.duration = days;
    p.predecessors = std::move(preds);
    return p;
}

}  // namespace

TEST_CASE("critical path of a small diamond") {
    const TimelineResult r = schedule_packages({
        pkg("a", 5, {}),
        pkg("b", 10, {"a"}),
        pkg("c", 3, {"a"}),
        pkg("d", 2, {"b", "c"}),
    });
    CHECK(r.total_duration_days == doctest::Approx(17.0));
    CHECK(r.critical_path == std::vector<std::string>{"a", "b", "d"});
    CHECK(r.max_parallel == 2);
    for (const auto& p : r.packages) {
        if (p.id == "c") {
            CHECK(p.slack == doctest::Approx(7.0));
            CHECK_FALSE(p.critical);
        }
        if (p.id == "b") {
            CHECK(p.early_start == doctest::Approx(5.0));
            CHECK(p.critical);
        }
    }
}

TEST_CASE("cycles are reported as an internal fault") {
    CHECK_THROWS_AS(schedule_packages({pkg("a", 1, {"c"}), pkg("b", 1, {"a"}), pkg("c", 1, {"b"})}),
                    CyclicDependency);
    try {
        schedule_packages({pkg("x", 1, {"x"})});
        FAIL("expected CyclicDependency");
    } catch (const PlanningError& e) {
        CHECK(e.kind() == ErrorKind::kCyclicDependency);
    }
}

TEST_CASE("graph errors other than cycles") {
    CHECK_THROWS_AS(schedule_packages({pkg("a", 1, {"missing"})}), std::invalid_argument);
    CHECK_THROWS_AS(schedule_packages({pkg("a", 1, {}), pkg("a", 2, {})}), std::invalid_argument);
}

TEST_CASE("duration table") {
    TimelineOptions opt;
    CHECK(package_duration(WorkType::kRoad, 0.5, opt) == doctest::Approx(10.0));
    CHECK(package_duration(WorkType::kRoad, 4.0, opt) == doctest::Approx(20.0));
    CHECK(package_duration(WorkType::kDetentionPond, 1.0, opt) == doctest::Approx(15.0));
    CHECK(package_duration(WorkType::kDetentionPond, 3.0, opt) == doctest::Approx(30.0));
    CHECK(package_duration(WorkType::kSubstation, 1.0, opt) == doctest::Approx(40.0));
}

TEST_CASE("layout timeline is bounded by its packages") {
    const parkgen_test::Scenario sc;
    const CandidateLayout layout = sc.decode();
    const TimelineResult r = estimate_timeline(layout, sc.params);
    REQUIRE(!r.packages.empty());

    double longest = 0.0;
    double sum = 0.0;
    std::set<std::string> ids;
    for (const auto& p : r.packages) {
        longest = std::max(longest, p.duration);
        sum += p.duration;
        ids.insert(p.id);
    }
    CHECK(r.total_duration_days >= longest);
    CHECK(r.total_duration_days <= sum);
    CHECK(ids.size() == r.packages.size());
    CHECK(ids.count("survey") == 1);
    CHECK(ids.count("road-primary") == 1);
    CHECK(ids.count("final-inspection") == 1);
    CHECK(r.critical_path.front() == "survey");
    CHECK(r.critical_path.back() == "final-inspection");
    CHECK(r.max_parallel >= 2);

    const size_t phases = (layout.lots.size() + 19) / 20;
    size_t seen = 0;
    for (const auto& id : ids) {
        if (id.rfind("lot-phase-", 0) == 0) {
            ++seen;
        }
    }
    CHECK(seen == phases);

    // Same layout, same schedule.
    const TimelineResult again = estimate_timeline(layout, sc.params);
    CHECK(again.critical_path == r.critical_path);
    CHECK(again.total_duration_days == r.total_duration_days);
}
