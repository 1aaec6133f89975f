#pragma once

#include <tessera/dispatch/registry.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace tessera::conformance {

enum class Outcome : std::uint8_t {
    Passed,
    Failed,
    Skipped,
};

[[nodiscard]] auto to_string(Outcome outcome) -> std::string_view;

/// One check against one backend. Backend-independent checks use "core".
struct CheckResult {
    std::string check;
    std::string backend;
    Outcome outcome = Outcome::Passed;
    std::string detail;
};

struct Report {
    std::vector<CheckResult> results;

    [[nodiscard]] auto failures() const -> std::size_t;
    [[nodiscard]] auto passed() const -> bool { return failures() == 0; }
};

/// Null preservation, Kleene table, ignore_nulls, round-trip, the
/// [1.4, null, 4.2] scenario and up-front UnsupportedOperation, against one
/// registered backend. Lazy backends receive their data through lazy().
[[nodiscard]] auto run_backend(const dispatch::RegistryPtr& registry, std::string_view backend)
    -> std::vector<CheckResult>;

/// Dtype promotion totality and commutativity over the variant grid.
[[nodiscard]] auto check_promotion() -> CheckResult;

/// check_promotion() plus run_backend() for each backend in `backends`
/// (every registered backend when empty).
[[nodiscard]] auto run(const dispatch::RegistryPtr& registry,
                       const std::vector<std::string>& backends = {}) -> Report;

/// Aligned text table, one line per check, with a summary line.
[[nodiscard]] auto format_report(const Report& report) -> std::string;

}  // namespace tessera::conformance
