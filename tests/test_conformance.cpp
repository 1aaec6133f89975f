#include "support/frames.hpp"
#include "support/restricted_adapter.hpp"

#include <tessera/conformance/conformance.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <memory>

using namespace tessera;
using namespace tessera::testing;

namespace {

auto find_result(const std::vector<conformance::CheckResult>& results, std::string_view check)
    -> const conformance::CheckResult& {
    auto it = std::ranges::find_if(results, [check](const auto& r) { return r.check == check; });
    REQUIRE(it != results.end());
    return *it;
}

}  // namespace

TEST_CASE("Dtype promotion is commutative", "[conformance]") {
    const auto result = conformance::check_promotion();
    INFO(result.detail);
    REQUIRE(result.outcome == conformance::Outcome::Passed);
    REQUIRE(result.backend == "core");
}

TEST_CASE("Built-in engines conform", "[conformance]") {
    const auto registry = make_registry();

    for (const std::string backend : {"eager", "eager-masked"}) {
        const auto results = conformance::run_backend(registry, backend);
        REQUIRE(results.size() == 6);
        for (const auto& r : results) {
            INFO(backend << " " << r.check << ": " << r.detail);
            REQUIRE(r.backend == backend);
            REQUIRE(r.outcome != conformance::Outcome::Failed);
        }
        // Full support leaves nothing to reject.
        REQUIRE(find_result(results, "unsupported").outcome == conformance::Outcome::Skipped);
    }
}

TEST_CASE("Support sets are checked", "[conformance]") {
    const auto registry = make_registry({std::make_shared<RestrictedAdapter>()});
    const auto results = conformance::run_backend(registry, "restricted");

    const auto& unsupported = find_result(results, "unsupported");
    INFO(unsupported.detail);
    REQUIRE(unsupported.outcome == conformance::Outcome::Passed);
    REQUIRE(find_result(results, "null_preservation").outcome != conformance::Outcome::Failed);
}

TEST_CASE("Unknown backends fail the run", "[conformance]") {
    const auto results = conformance::run_backend(make_registry(), "nope");
    REQUIRE(results.size() == 1);
    REQUIRE(results.front().outcome == conformance::Outcome::Failed);
}

TEST_CASE("Reports", "[conformance]") {
    const auto registry = make_registry();

    SECTION("every registered backend by default") {
        const auto report = conformance::run(registry);
        REQUIRE(report.results.size() == 1 + 2 * 6);
        REQUIRE(report.passed());
    }

    SECTION("selected backends only") {
        const auto report = conformance::run(registry, {"eager"});
        REQUIRE(report.results.size() == 7);
        REQUIRE(std::ranges::none_of(report.results,
                                     [](const auto& r) { return r.backend == "eager-masked"; }));
    }

    SECTION("text format") {
        conformance::Report report;
        report.results.push_back({.check = "kleene", .backend = "eager", .outcome = conformance::Outcome::Passed, .detail = ""});
        report.results.push_back({.check = "round_trip", .backend = "eager", .outcome = conformance::Outcome::Failed, .detail = "schema differs"});
        const auto text = conformance::format_report(report);
        REQUIRE(text.find("FAILED") != std::string::npos);
        REQUIRE(text.find("schema differs") != std::string::npos);
        REQUIRE(text.find("2 checks, 1 failed") != std::string::npos);
        REQUIRE_FALSE(report.passed());
    }
}
