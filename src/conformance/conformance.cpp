#include <tessera/conformance/conformance.hpp>

#include <tessera/frame/frame.hpp>
#include <tessera/ir/analysis.hpp>
#include <tessera/normalize/kleene.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <functional>
#include <iterator>
#include <optional>
#include <utility>

namespace tessera::conformance {

namespace {

using normalize::Tri;

constexpr std::string_view kCore = "core";

auto to_scalar(Tri value) -> Scalar {
    if (!value.has_value()) {
        return std::monostate{};
    }
    return *value;
}

auto render(const std::vector<Scalar>& values) -> std::string {
    std::vector<std::string> parts;
    parts.reserve(values.size());
    for (const auto& v : values) {
        parts.push_back(format_scalar(v));
    }
    return fmt::format("[{}]", fmt::join(parts, ", "));
}

auto same_values(const std::vector<Scalar>& lhs, const std::vector<Scalar>& rhs) -> bool {
    return std::ranges::equal(lhs, rhs,
                              [](const Scalar& l, const Scalar& r) { return scalars_equal(l, r); });
}

/// Test data reaches lazy backends through the masked eager engine.
class Fixture {
   public:
    Fixture(dispatch::RegistryPtr registry, dispatch::AdapterPtr adapter)
        : registry_(std::move(registry)), adapter_(std::move(adapter)) {}

    [[nodiscard]] auto backend() const -> std::string { return std::string(adapter_->name()); }
    [[nodiscard]] auto registry() const -> const dispatch::RegistryPtr& { return registry_; }
    [[nodiscard]] auto capabilities() const -> const Capabilities& {
        return adapter_->capabilities();
    }

    [[nodiscard]] auto frame(const FrameData& data) const -> DataFrame {
        if (adapter_->capabilities().lazy) {
            return DataFrame::from_dict(data, "eager-masked", registry_).lazy(backend());
        }
        return DataFrame::from_dict(data, backend(), registry_);
    }

   private:
    dispatch::RegistryPtr registry_;
    dispatch::AdapterPtr adapter_;
};

auto pass(std::string_view check, std::string_view backend, std::string detail = {})
    -> CheckResult {
    return CheckResult{.check = std::string(check),
                       .backend = std::string(backend),
                       .outcome = Outcome::Passed,
                       .detail = std::move(detail)};
}

auto fail(std::string_view check, std::string_view backend, std::string detail) -> CheckResult {
    return CheckResult{.check = std::string(check),
                       .backend = std::string(backend),
                       .outcome = Outcome::Failed,
                       .detail = std::move(detail)};
}

auto skip(std::string_view check, std::string_view backend, std::string detail) -> CheckResult {
    return CheckResult{.check = std::string(check),
                       .backend = std::string(backend),
                       .outcome = Outcome::Skipped,
                       .detail = std::move(detail)};
}

/// Run `body`, turning a tessera::Exception into a failed check.
auto guarded(std::string_view check, std::string_view backend,
             const std::function<CheckResult()>& body) -> CheckResult {
    try {
        return body();
    } catch (const Exception& e) {
        return fail(check, backend, e.what());
    }
}

auto first_column(const DataFrame& frame) -> std::vector<Scalar> {
    auto data = frame.to_dict();
    if (data.empty()) {
        return {};
    }
    return std::move(data.front().values);
}

// ─── Null preservation ─────────────────────────────────────────────────────────

auto check_null_preservation(const Fixture& fixture) -> CheckResult {
    constexpr std::string_view name = "null_preservation";
    return guarded(name, fixture.backend(), [&]() -> CheckResult {
        // Row 0 valid, row 1 null on the left, row 2 null on the right.
        const FrameData data{
            ColumnData{.name = "x", .dtype = DType::float64(), .values = {1.0, std::monostate{}, 3.0}},
            ColumnData{.name = "y", .dtype = DType::float64(), .values = {2.0, 2.0, std::monostate{}}},
            ColumnData{.name = "i",
                       .dtype = DType::int64(),
                       .values = {std::int64_t{4}, std::monostate{}, std::int64_t{6}}},
            ColumnData{.name = "j",
                       .dtype = DType::int64(),
                       .values = {std::int64_t{3}, std::int64_t{3}, std::monostate{}}},
        };
        const auto frame = fixture.frame(data);
        const auto& caps = fixture.capabilities();

        std::vector<std::string> problems;
        std::size_t evaluated = 0;
        auto expect_nulls = [&](const std::string& label, const Expr& expr, std::size_t null_rows) {
            if (!std::ranges::all_of(ir::collect_operations(*expr.node()),
                                     [&](const ir::OpKey& key) { return caps.supports(key); })) {
                return;
            }
            ++evaluated;
            const auto values = first_column(frame.select({expr.alias("out")}));
            if (values.size() != 3) {
                problems.push_back(fmt::format("{}: {} rows", label, values.size()));
                return;
            }
            for (std::size_t row = 1; row <= null_rows; ++row) {
                if (!tessera::is_null(values[row])) {
                    problems.push_back(
                        fmt::format("{}: row {} is {}", label, row, format_scalar(values[row])));
                }
            }
            if (tessera::is_null(values[0])) {
                problems.push_back(fmt::format("{}: row 0 is null", label));
            }
        };

        const std::vector<std::pair<std::string, ir::BinaryKind>> arithmetic{
            {"add", ir::BinaryKind::Add},      {"sub", ir::BinaryKind::Sub},
            {"mul", ir::BinaryKind::Mul},      {"truediv", ir::BinaryKind::TrueDiv},
            {"floordiv", ir::BinaryKind::FloorDiv}, {"mod", ir::BinaryKind::Mod},
            {"pow", ir::BinaryKind::Pow},
        };
        for (const auto& [label, kind] : arithmetic) {
            expect_nulls(label + "(float)", Expr(ir::binary(kind, ir::column("x"), ir::column("y"))), 2);
            expect_nulls(label + "(int)", Expr(ir::binary(kind, ir::column("i"), ir::column("j"))), 2);
        }
        expect_nulls("neg", -col("x"), 1);
        expect_nulls("abs", col("x").abs(), 1);
        expect_nulls("sqrt", col("x").sqrt(), 1);
        expect_nulls("exp", col("x").exp(), 1);
        expect_nulls("cast", col("i").cast(DType::float64()), 1);

        if (!problems.empty()) {
            return fail(name, fixture.backend(), fmt::format("{}", fmt::join(problems, "; ")));
        }
        return pass(name, fixture.backend(), fmt::format("{} expressions", evaluated));
    });
}

// ─── Three-valued logic ────────────────────────────────────────────────────────

/// Comparisons `col > 0` over these produce True, False and null.
auto truth_source(Tri value) -> Scalar {
    if (!value.has_value()) {
        return std::monostate{};
    }
    return std::int64_t{*value ? 1 : -1};
}

auto check_kleene(const Fixture& fixture) -> CheckResult {
    constexpr std::string_view name = "kleene";
    return guarded(name, fixture.backend(), [&]() -> CheckResult {
        const auto table = normalize::kleene_table();
        ColumnData lhs{.name = "l", .dtype = DType::int64(), .values = {}};
        ColumnData rhs{.name = "r", .dtype = DType::int64(), .values = {}};
        for (const auto& row : table) {
            lhs.values.push_back(truth_source(row.lhs));
            rhs.values.push_back(truth_source(row.rhs));
        }
        const auto frame = fixture.frame({lhs, rhs});
        const auto l = col("l") > 0;
        const auto r = col("r") > 0;
        const auto result = frame.select({(l & r).alias("and"), (l | r).alias("or")});
        const auto data = result.to_dict();
        const bool approximate = result.is_approximate();

        std::vector<Scalar> expected_and;
        std::vector<Scalar> expected_or;
        for (const auto& row : table) {
            if (approximate) {
                expected_and.emplace_back(normalize::fallback_and(row.lhs, row.rhs));
                expected_or.emplace_back(normalize::fallback_or(row.lhs, row.rhs));
            } else {
                expected_and.push_back(to_scalar(row.and_));
                expected_or.push_back(to_scalar(row.or_));
            }
        }
        if (data.size() != 2) {
            return fail(name, fixture.backend(), fmt::format("{} output columns", data.size()));
        }
        if (!same_values(data[0].values, expected_and)) {
            return fail(name, fixture.backend(),
                        fmt::format("and: expected {}, got {}", render(expected_and),
                                    render(data[0].values)));
        }
        if (!same_values(data[1].values, expected_or)) {
            return fail(name, fixture.backend(),
                        fmt::format("or: expected {}, got {}", render(expected_or),
                                    render(data[1].values)));
        }
        return pass(name, fixture.backend(), approximate ? "null-as-False fallback" : "");
    });
}

auto check_ignore_nulls(const Fixture& fixture) -> CheckResult {
    constexpr std::string_view name = "ignore_nulls";
    const auto any_key = ir::OpKey{.kind = ir::NodeKind::Horizontal,
                                   .op = static_cast<std::uint8_t>(ir::HorizontalKind::Any)};
    const auto all_key = ir::OpKey{.kind = ir::NodeKind::Horizontal,
                                   .op = static_cast<std::uint8_t>(ir::HorizontalKind::All)};
    if (!fixture.capabilities().supports(any_key) || !fixture.capabilities().supports(all_key)) {
        return skip(name, fixture.backend(), "any/all_horizontal not supported");
    }
    return guarded(name, fixture.backend(), [&]() -> CheckResult {
        const FrameData data{
            ColumnData{.name = "a", .dtype = DType::int64(), .values = {std::monostate{}}},
            ColumnData{.name = "b", .dtype = DType::int64(), .values = {std::monostate{}}},
        };
        const auto frame = fixture.frame(data);
        const std::vector<Expr> inputs{col("a") > 0, col("b") > 0};
        const auto result = frame.select({
            any_horizontal(inputs, true).alias("any_ignore"),
            all_horizontal(inputs, true).alias("all_ignore"),
            any_horizontal(inputs, false).alias("any_kleene"),
            all_horizontal(inputs, false).alias("all_kleene"),
        });
        const auto columns = result.to_dict();

        // Under the fallback the comparisons themselves are already False.
        const std::vector<Tri> row(2, result.is_approximate() ? Tri{false} : Tri{});
        const std::vector<Scalar> expected{
            to_scalar(normalize::horizontal_any(row, true)),
            to_scalar(normalize::horizontal_all(row, true)),
            to_scalar(normalize::horizontal_any(row, false)),
            to_scalar(normalize::horizontal_all(row, false)),
        };
        if (columns.size() != expected.size()) {
            return fail(name, fixture.backend(), fmt::format("{} output columns", columns.size()));
        }
        for (std::size_t i = 0; i < expected.size(); ++i) {
            if (columns[i].values.size() != 1 || !scalars_equal(columns[i].values[0], expected[i])) {
                return fail(name, fixture.backend(),
                            fmt::format("{}: expected {}, got {}", columns[i].name,
                                        format_scalar(expected[i]), render(columns[i].values)));
            }
        }
        return pass(name, fixture.backend());
    });
}

// ─── Round trip ────────────────────────────────────────────────────────────────

auto check_round_trip(const Fixture& fixture) -> CheckResult {
    constexpr std::string_view name = "round_trip";
    return guarded(name, fixture.backend(), [&]() -> CheckResult {
        const FrameData data{
            ColumnData{.name = "i",
                       .dtype = DType::int64(),
                       .values = {std::int64_t{1}, std::monostate{}, std::int64_t{3}}},
            ColumnData{.name = "f", .dtype = DType::float64(), .values = {0.5, 1.5, std::monostate{}}},
            ColumnData{.name = "s",
                       .dtype = DType::string(),
                       .values = {std::string("a"), std::monostate{}, std::string("c")}},
            ColumnData{.name = "d",
                       .dtype = DType::date(),
                       .values = {Date{.days = 0}, Date{.days = 19000}, std::monostate{}}},
            ColumnData{.name = "b", .dtype = DType::boolean(), .values = {true, false, true}},
        };
        const auto original = fixture.frame(data);
        const auto wrapped = DataFrame::from_native(original.to_native(), fixture.registry());
        if (wrapped.backend() != original.backend()) {
            return fail(name, fixture.backend(),
                        fmt::format("native object resolved to '{}'", wrapped.backend()));
        }
        if (!(wrapped.schema() == schema_of(data))) {
            return fail(name, fixture.backend(), "schema changed across the round trip");
        }
        const auto out = wrapped.to_dict();
        for (std::size_t c = 0; c < data.size(); ++c) {
            if (c >= out.size() || out[c].name != data[c].name ||
                !same_values(out[c].values, data[c].values)) {
                return fail(name, fixture.backend(),
                            fmt::format("column '{}' differs after the round trip", data[c].name));
            }
        }
        return pass(name, fixture.backend());
    });
}

// ─── Worked scenario ───────────────────────────────────────────────────────────

auto check_scenario(const Fixture& fixture) -> CheckResult {
    constexpr std::string_view name = "scenario";
    return guarded(name, fixture.backend(), [&]() -> CheckResult {
        const FrameData data{
            ColumnData{.name = "a", .dtype = DType::float64(), .values = {1.4, std::monostate{}, 4.2}},
        };
        const auto frame = fixture.frame(data);

        const auto doubled = first_column(frame.select({(col("a") * 2).alias("a")}));
        const std::vector<Scalar> expected_doubled{2.8, std::monostate{}, 8.4};
        if (!same_values(doubled, expected_doubled)) {
            return fail(name, fixture.backend(),
                        fmt::format("a * 2: expected {}, got {}", render(expected_doubled),
                                    render(doubled)));
        }

        const auto compared = frame.select({(col("a") > 2).alias("a")});
        const std::vector<Scalar> expected_compared =
            compared.is_approximate() ? std::vector<Scalar>{false, false, true}
                                      : std::vector<Scalar>{false, std::monostate{}, true};
        const auto values = first_column(compared);
        if (!same_values(values, expected_compared)) {
            return fail(name, fixture.backend(),
                        fmt::format("a > 2: expected {}, got {}", render(expected_compared),
                                    render(values)));
        }
        return pass(name, fixture.backend());
    });
}

// ─── Up-front rejection ────────────────────────────────────────────────────────

/// A minimal expression exercising `key` over columns x (Float64), g and o (Int64).
auto sample_expression(const ir::OpKey& key) -> std::optional<ir::ExprPtr> {
    auto x = ir::column("x");
    auto flag = ir::binary(ir::BinaryKind::Gt, ir::column("x"), ir::literal(0.0));
    switch (key.kind) {
        case ir::NodeKind::Unary: {
            const auto kind = static_cast<ir::UnaryKind>(key.op);
            return ir::unary(kind, kind == ir::UnaryKind::Not ? flag : x);
        }
        case ir::NodeKind::Binary: {
            const auto kind = static_cast<ir::BinaryKind>(key.op);
            if (ir::is_logical(kind)) {
                return ir::binary(kind, flag, flag);
            }
            return ir::binary(kind, x, ir::column("x"));
        }
        case ir::NodeKind::Aggregation: {
            const auto kind = static_cast<ir::AggKind>(key.op);
            const bool logical = kind == ir::AggKind::Any || kind == ir::AggKind::All;
            return ir::aggregation(kind, logical ? flag : x);
        }
        case ir::NodeKind::Window: {
            const auto kind = static_cast<ir::WindowKind>(key.op);
            if (kind == ir::WindowKind::Over) {
                return ir::window(kind, ir::aggregation(ir::AggKind::Sum, x), {"g"});
            }
            return ir::window(kind, x, {}, {"o"});
        }
        case ir::NodeKind::Horizontal: {
            const auto kind = static_cast<ir::HorizontalKind>(key.op);
            const bool logical = kind == ir::HorizontalKind::Any || kind == ir::HorizontalKind::All;
            if (logical) {
                return ir::horizontal(kind, {flag, flag});
            }
            return ir::horizontal(kind, {x, ir::column("x")});
        }
        case ir::NodeKind::Cast:
            return ir::cast(x, DType::int64());
        case ir::NodeKind::Alias:
            return ir::alias(x, "y");
        case ir::NodeKind::NameMap:
            return ir::name_map(x, ir::NameMapping::ToUppercase);
        case ir::NodeKind::ColumnRef:
        case ir::NodeKind::Selection:
        case ir::NodeKind::Literal:
            return std::nullopt;
    }
    return std::nullopt;
}

auto check_unsupported(const Fixture& fixture) -> CheckResult {
    constexpr std::string_view name = "unsupported";
    std::vector<ir::OpKey> missing;
    for (const auto& key : ir::all_operations()) {
        if (!fixture.capabilities().supports(key) && sample_expression(key).has_value()) {
            missing.push_back(key);
        }
    }
    if (missing.empty()) {
        return skip(name, fixture.backend(), "every operation is supported");
    }
    return guarded(name, fixture.backend(), [&]() -> CheckResult {
        const FrameData data{
            ColumnData{.name = "x", .dtype = DType::float64(), .values = {1.0, 2.0}},
            ColumnData{.name = "g", .dtype = DType::int64(), .values = {std::int64_t{1}, std::int64_t{1}}},
            ColumnData{.name = "o", .dtype = DType::int64(), .values = {std::int64_t{0}, std::int64_t{1}}},
        };
        const auto frame = fixture.frame(data);
        for (const auto& key : missing) {
            const auto expr = Expr(*sample_expression(key)).alias("out");
            const auto what = ir::to_string(key);
            try {
                (void)frame.select({expr}).to_dict();
            } catch (const Exception& e) {
                if (e.kind() != ErrorKind::UnsupportedOperation) {
                    return fail(name, fixture.backend(),
                                fmt::format("{}: raised {} instead of UnsupportedOperation", what,
                                            to_string(e.kind())));
                }
                if (e.backend() != fixture.backend() ||
                    std::string_view(e.what()).find(what) == std::string_view::npos) {
                    return fail(name, fixture.backend(),
                                fmt::format("{}: error does not name the operation and backend: {}",
                                            what, e.what()));
                }
                continue;
            }
            return fail(name, fixture.backend(), fmt::format("{} was accepted", what));
        }
        return pass(name, fixture.backend(), fmt::format("{} operations rejected", missing.size()));
    });
}

auto promotion_grid() -> std::vector<DType> {
    return {
        DType::int8(),
        DType::int16(),
        DType::int32(),
        DType::int64(),
        DType::uint8(),
        DType::uint16(),
        DType::uint32(),
        DType::uint64(),
        DType::float32(),
        DType::float64(),
        DType::boolean(),
        DType::string(),
        DType::date(),
        DType::datetime(TimeUnit::Microseconds),
        DType::datetime(TimeUnit::Nanoseconds, "UTC"),
        DType::duration(TimeUnit::Milliseconds),
        DType::list(DType::int64()),
        DType::list(DType::float64()),
        DType::structure({{"a", DType::int64()}}),
        DType::structure({{"a", DType::float64()}}),
        DType::unknown(),
    };
}

}  // namespace

auto to_string(Outcome outcome) -> std::string_view {
    switch (outcome) {
        case Outcome::Passed:
            return "ok";
        case Outcome::Failed:
            return "FAILED";
        case Outcome::Skipped:
            return "skipped";
    }
    return "?";
}

auto Report::failures() const -> std::size_t {
    return static_cast<std::size_t>(std::ranges::count_if(
        results, [](const CheckResult& r) { return r.outcome == Outcome::Failed; }));
}

auto check_promotion() -> CheckResult {
    constexpr std::string_view name = "promotion";
    const auto grid = promotion_grid();
    std::size_t pairs = 0;
    for (const auto& lhs : grid) {
        for (const auto& rhs : grid) {
            ++pairs;
            const auto forward = promote(lhs, rhs);
            const auto backward = promote(rhs, lhs);
            if (forward.has_value() != backward.has_value() ||
                (forward.has_value() && !(*forward == *backward))) {
                return fail(name, kCore,
                            fmt::format("promote({}, {}) is not commutative", lhs.to_string(),
                                        rhs.to_string()));
            }
            if (lhs == rhs && (!forward.has_value() || !(*forward == lhs))) {
                return fail(name, kCore,
                            fmt::format("promote({0}, {0}) is not {0}", lhs.to_string()));
            }
        }
    }
    return pass(name, kCore, fmt::format("{} pairs", pairs));
}

auto run_backend(const dispatch::RegistryPtr& registry, std::string_view backend)
    -> std::vector<CheckResult> {
    auto adapter = registry->adapter_by_name(backend);
    if (!adapter) {
        return {fail("registry", backend, adapter.error().describe())};
    }
    const Fixture fixture(registry, *adapter);
    spdlog::debug("conformance: running checks against '{}'", backend);

    std::vector<CheckResult> results;
    results.push_back(check_null_preservation(fixture));
    results.push_back(check_kleene(fixture));
    results.push_back(check_ignore_nulls(fixture));
    results.push_back(check_round_trip(fixture));
    results.push_back(check_scenario(fixture));
    results.push_back(check_unsupported(fixture));
    for (const auto& r : results) {
        if (r.outcome == Outcome::Failed) {
            spdlog::warn("conformance: {} on '{}': {}", r.check, r.backend, r.detail);
        }
    }
    return results;
}

auto run(const dispatch::RegistryPtr& registry, const std::vector<std::string>& backends)
    -> Report {
    Report report;
    report.results.push_back(check_promotion());
    const auto names = backends.empty() ? registry->names() : backends;
    for (const auto& name : names) {
        auto results = run_backend(registry, name);
        std::ranges::move(results, std::back_inserter(report.results));
    }
    return report;
}

auto format_report(const Report& report) -> std::string {
    std::size_t check_width = 5;
    std::size_t backend_width = 7;
    for (const auto& r : report.results) {
        check_width = std::max(check_width, r.check.size());
        backend_width = std::max(backend_width, r.backend.size());
    }
    std::string out = fmt::format("{:<{}}  {:<{}}  {:<7}  {}\n", "check", check_width, "backend",
                                  backend_width, "result", "detail");
    for (const auto& r : report.results) {
        out += fmt::format("{:<{}}  {:<{}}  {:<7}  {}\n", r.check, check_width, r.backend,
                           backend_width, to_string(r.outcome), r.detail);
    }
    out += fmt::format("{} checks, {} failed\n", report.results.size(), report.failures());
    return out;
}

}  // namespace tessera::conformance
