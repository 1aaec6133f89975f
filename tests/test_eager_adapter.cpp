#include "support/shared_checks.hpp"

#include <tessera/eager/eager_adapter.hpp>
#include <tessera/eager/kernels.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <cstdint>
#include <limits>
#include <variant>
#include <vector>

using namespace tessera;
using namespace tessera::testing;

namespace {

auto masked() -> BackendUnderTest {
    return BackendUnderTest{.registry = make_registry(), .backend = "eager-masked"};
}

auto sentinel(Config config = {}) -> BackendUnderTest {
    return BackendUnderTest{.registry = make_registry({}, std::move(config)), .backend = "eager"};
}

auto ranks_of(ir::RankMethod method, bool descending = false) -> std::vector<Scalar> {
    const FrameData data{
        ColumnData{.name = "v", .dtype = DType::int64(), .values = {i64(3), i64(1), i64(3), null, i64(2)}},
    };
    const auto out = masked().frame(data).select({col("v").rank(method, descending)});
    return column_values(out, "v");
}

}  // namespace

TEST_CASE("eager-masked shared behaviour", "[eager][masked]") {
    check_shared_behaviour(masked());
}

TEST_CASE("eager shared behaviour", "[eager][sentinel]") {
    check_shared_behaviour(sentinel());
}

TEST_CASE("Eager capabilities", "[eager][adapter]") {
    const eager::EagerAdapter sentinel_adapter(eager::NullMode::Sentinel);
    const eager::EagerAdapter masked_adapter(eager::NullMode::Masked);

    REQUIRE(sentinel_adapter.name() == "eager");
    REQUIRE(masked_adapter.name() == "eager-masked");
    REQUIRE_FALSE(sentinel_adapter.capabilities().nullable_boolean);
    REQUIRE(sentinel_adapter.capabilities().boolean_upcast);
    REQUIRE(masked_adapter.capabilities().nullable_boolean);
    REQUIRE(masked_adapter.capabilities().supported.size() == ir::all_operations().size());
    REQUIRE_FALSE(masked_adapter.capabilities().lazy);
}

TEST_CASE("Boolean strategies on sentinel storage", "[eager][sentinel][boolean]") {
    const auto predicate = ((col("x") > 1) & (col("y") > 2)).alias("both");

    SECTION("default runs under the null-as-False fallback") {
        const auto out = sentinel().frame(sample_data()).select({col("id"), predicate}).sort({"id"});
        REQUIRE(out.is_approximate());
        require_values(column_values(out, "both"), {false, false, false, true});
    }

    SECTION("approximation sticks to derived frames") {
        const auto out = sentinel().frame(sample_data()).with_columns({predicate}).select({col("id")});
        REQUIRE(out.is_approximate());
    }

    SECTION("upcast keeps Kleene results") {
        Config config;
        config.upcast_booleans = true;
        const auto out =
            sentinel(config).frame(sample_data()).select({col("id"), predicate}).sort({"id"});
        REQUIRE_FALSE(out.is_approximate());
        require_values(column_values(out, "both"), {false, null, null, true});
    }

    SECTION("disallowed approximation is an error") {
        Config config;
        config.allow_approximate = false;
        try {
            (void)sentinel(config).frame(sample_data()).select({predicate});
            FAIL("approximate evaluation was allowed");
        } catch (const Exception& e) {
            REQUIRE(e.kind() == ErrorKind::UnsupportedOperation);
            REQUIRE(e.backend() == "eager");
        }
    }

    SECTION("non-boolean results stay exact") {
        const auto out = sentinel().frame(sample_data()).select({col("x") * 2});
        REQUIRE_FALSE(out.is_approximate());
    }
}

TEST_CASE("Nullable booleans without boolean operators", "[eager][sentinel][boolean]") {
    const FrameData data{
        ColumnData{.name = "b", .dtype = DType::boolean(), .values = {true, false}},
        ColumnData{.name = "v", .dtype = DType::int64(), .values = {i64(1), null}},
    };

    SECTION("shift is flagged under the fallback") {
        const auto out = sentinel().frame(data).with_columns({col("b").shift(1)});
        REQUIRE(out.is_approximate());
        require_values(column_values(out, "b"), {false, true});
    }

    SECTION("cast to boolean is flagged under the fallback") {
        const auto out = sentinel().frame(data).select({col("v").cast(DType::boolean())});
        REQUIRE(out.is_approximate());
        require_values(column_values(out, "v"), {true, false});
    }

    SECTION("upcast keeps the nulls") {
        Config config;
        config.upcast_booleans = true;
        const auto out = sentinel(config).frame(data).with_columns({col("b").shift(1)});
        REQUIRE_FALSE(out.is_approximate());
        require_values(column_values(out, "b"), {null, true});
    }

    SECTION("plain boolean columns and null tests stay exact") {
        const auto out = sentinel().frame(data).select({col("b"), col("v").is_null().alias("n")});
        REQUIRE_FALSE(out.is_approximate());
        require_values(column_values(out, "n"), {false, true});
    }
}

TEST_CASE("Rank methods", "[eager][window]") {
    require_values(ranks_of(ir::RankMethod::Average), {3.5, 1.0, 3.5, null, 2.0});
    require_values(ranks_of(ir::RankMethod::Min), {i64(3), i64(1), i64(3), null, i64(2)});
    require_values(ranks_of(ir::RankMethod::Max), {i64(4), i64(1), i64(4), null, i64(2)});
    require_values(ranks_of(ir::RankMethod::Dense), {i64(3), i64(1), i64(3), null, i64(2)});
    require_values(ranks_of(ir::RankMethod::Ordinal), {i64(3), i64(1), i64(4), null, i64(2)});
    require_values(ranks_of(ir::RankMethod::Dense, true), {i64(1), i64(3), i64(1), null, i64(2)});
}

TEST_CASE("Ordered windows", "[eager][window]") {
    const auto frame = masked().frame(sample_data());

    SECTION("shift and diff follow row order") {
        const auto out = frame.select({col("x").shift(-1).alias("next"), col("x").diff().alias("d")});
        require_values(column_values(out, "next"), {i64(2), null, i64(4), null});
        require_values(column_values(out, "d"), {null, i64(1), null, null});
    }

    SECTION("reverse cumulative") {
        const auto out = frame.select({col("x").cum_sum(true).alias("rs"),
                                       col("x").cum_count(true).alias("rc")});
        require_values(column_values(out, "rs"), {i64(7), i64(6), null, i64(4)});
        require_values(column_values(out, "rc"), {i64(3), i64(2), i64(1), i64(1)});
    }

    SECTION("cumulative min and max") {
        const auto out = frame.select({col("y").cum_min().alias("lo"), col("y").cum_max().alias("hi")});
        require_values(column_values(out, "lo"), {1.5, null, 1.5, 1.5});
        require_values(column_values(out, "hi"), {1.5, null, 3.5, 4.5});
    }

    SECTION("over a partition broadcasts the aggregate") {
        const auto out = frame.select({col("x").sum().over({"g"}).alias("gx")});
        require_values(column_values(out, "gx"), {i64(1), i64(2), i64(1), i64(4)});
    }

    SECTION("partitioned cumulative with order") {
        const auto out = frame.select({col("id").cum_sum().over({"g"}, {"id"}).alias("c")});
        require_values(column_values(out, "c"), {i64(0), i64(1), i64(2), i64(3)});
    }
}

TEST_CASE("Rolling windows", "[eager][window][rolling]") {
    const FrameData data{
        ColumnData{.name = "v", .dtype = DType::int64(), .values = {i64(1), i64(2), null, i64(4), i64(5)}},
    };
    const auto frame = masked().frame(data);

    SECTION("min_samples defaults to the window size") {
        const auto out = frame.select({col("v").rolling_sum(2).alias("strict"),
                                       col("v").rolling_sum(2, 1).alias("loose")});
        REQUIRE(*out.schema().find("strict") == DType::int64());
        require_values(column_values(out, "strict"), {null, i64(3), null, null, i64(9)});
        require_values(column_values(out, "loose"), {i64(1), i64(3), i64(2), i64(4), i64(9)});
    }

    SECTION("centred mean") {
        const auto out = frame.select({col("v").rolling_mean(3, 1, true)});
        require_values(column_values(out, "v"), {1.5, 1.5, 3.0, 4.5, 4.5});
    }

    SECTION("variance and deviation") {
        const auto out = frame.select({col("v").rolling_var(3, 2).alias("var"),
                                       col("v").rolling_std(3, 2).alias("std"),
                                       col("v").rolling_var(3, 2, false, 0).alias("pop")});
        require_values(column_values(out, "var"), {null, 0.5, 0.5, 2.0, 0.5});
        require_values(column_values(out, "std"),
                       {null, std::sqrt(0.5), std::sqrt(0.5), std::sqrt(2.0), std::sqrt(0.5)});
        require_values(column_values(out, "pop"), {null, 0.25, 0.25, 1.0, 0.25});
    }

    SECTION("bad window parameters are rejected") {
        try {
            (void)frame.select({col("v").rolling_sum(2, 3)});
            FAIL("min_samples above window_size accepted");
        } catch (const Exception& e) {
            REQUIRE(e.kind() == ErrorKind::InvalidOperation);
        }
    }
}

TEST_CASE("Distinct flags", "[eager][window]") {
    const FrameData data{
        ColumnData{.name = "k", .dtype = DType::string(), .values = {str("a"), str("b"), str("a"), null, null}},
        ColumnData{.name = "o", .dtype = DType::int64(), .values = {i64(4), i64(3), i64(2), i64(1), i64(0)}},
    };

    SECTION("null counts as a value") {
        const auto out = masked().frame(data).select({col("k").is_first_distinct().alias("first"),
                                                      col("k").is_last_distinct().alias("last"),
                                                      col("k").is_unique().alias("once")});
        require_values(column_values(out, "first"), {true, true, false, true, false});
        require_values(column_values(out, "last"), {false, true, true, false, true});
        require_values(column_values(out, "once"), {false, true, false, false, false});
    }

    SECTION("order_by decides which row comes first") {
        const auto out = masked().frame(data).select({col("k").is_first_distinct().over({}, {"o"})});
        require_values(column_values(out, "k"), {false, true, true, false, true});
    }

    SECTION("flags never need the null-as-False fallback") {
        const auto out = sentinel().frame(data).select({col("k").is_unique()});
        REQUIRE_FALSE(out.is_approximate());
        require_values(column_values(out, "k"), {false, true, false, false, false});
    }
}

TEST_CASE("Eager aggregations", "[eager][aggregate]") {
    const auto frame = masked().frame(sample_data());

    SECTION("n_unique counts null as a value") {
        const auto out = frame.select({col("g").n_unique(), col("x").n_unique()});
        require_values(column_values(out, "g"), {i64(3)});
        require_values(column_values(out, "x"), {i64(4)});
    }

    SECTION("dispersion honours ddof") {
        const auto out = frame.select({col("y").var().alias("v1"), col("y").var(0).alias("v0"),
                                       col("y").std().alias("s1")});
        require_values(column_values(out, "v1"), {7.0 / 3.0});
        require_values(column_values(out, "v0"), {14.0 / 9.0});
        REQUIRE(std::get<double>(column_values(out, "s1").front()) ==
                Catch::Approx(1.5275).epsilon(1e-4));
    }

    SECTION("median") {
        require_values(column_values(frame.select({col("x").median()}), "x"), {2.0});
    }

    SECTION("any and all skip nulls") {
        const auto out = frame.select({(col("x") > 3).any().alias("any"),
                                       (col("x") > 3).all().alias("all")});
        require_values(column_values(out, "any"), {true});
        require_values(column_values(out, "all"), {false});
    }

    SECTION("all-null input") {
        const auto empty = frame.filter(col("x").is_null());
        const auto out = empty.select({col("x").sum().alias("s"), col("x").count().alias("n"),
                                       col("y").std().alias("sd")});
        require_values(column_values(out, "s"), {null});
        require_values(column_values(out, "n"), {i64(0)});
        require_values(column_values(out, "sd"), {null});
    }
}

TEST_CASE("Eager arithmetic", "[eager][arithmetic]") {
    const FrameData data{
        ColumnData{.name = "a", .dtype = DType::int64(), .values = {i64(7), i64(-7), i64(1)}},
        ColumnData{.name = "b", .dtype = DType::int64(), .values = {i64(2), i64(2), i64(0)}},
        ColumnData{.name = "s", .dtype = DType::string(), .values = {str("x"), str("y"), null}},
        ColumnData{.name = "p", .dtype = DType::boolean(), .values = {true, false, null}},
    };
    const auto frame = masked().frame(data);

    SECTION("integer floordiv and mod; division by zero is null") {
        const auto out = frame.select({col("a").floordiv(col("b")).alias("q"),
                                       (col("a") % col("b")).alias("r")});
        require_values(column_values(out, "q"), {i64(3), i64(-4), null});
        require_values(column_values(out, "r"), {i64(1), i64(1), null});
    }

    SECTION("true division is floating point") {
        const auto out = frame.select({(col("a") / col("b")).alias("t")});
        REQUIRE(*out.schema().find("t") == DType::float64());
        const auto values = column_values(out, "t");
        REQUIRE(std::get<double>(values[0]) == 3.5);
        REQUIRE(std::get<double>(values[2]) == std::numeric_limits<double>::infinity());
    }

    SECTION("string concatenation") {
        const auto out = frame.select({col("s") + "!"});
        require_values(column_values(out, "s"), {str("x!"), str("y!"), null});
    }

    SECTION("xor and not are null-strict") {
        const auto out = frame.select({col("p").xor_(lit(true)).alias("x"), (!col("p")).alias("n")});
        require_values(column_values(out, "x"), {false, true, null});
        require_values(column_values(out, "n"), {false, true, null});
    }

    SECTION("casts") {
        const auto out = frame.select({col("a").cast(DType::float32())});
        REQUIRE(*out.schema().find("a") == DType::float32());
    }
}

TEST_CASE("Horizontal sum of an all-null row", "[eager][horizontal]") {
    const auto node = sum_horizontal({col("a"), col("b")}).node();
    const auto& reduction = std::get<ir::HorizontalReduction>(node->node);
    const std::vector<eager::Values> operands{{null}, {null}};

    const auto floats = value_or_throw(eager::horizontal(
        reduction, operands, 1, normalize::BooleanStrategy::Native, DType::float64()));
    REQUIRE(std::holds_alternative<double>(floats.front()));
    REQUIRE(std::get<double>(floats.front()) == 0.0);

    const auto ints = value_or_throw(eager::horizontal(
        reduction, operands, 1, normalize::BooleanStrategy::Native, DType::int32()));
    REQUIRE(std::get<std::int64_t>(ints.front()) == 0);

    const FrameData data{
        ColumnData{.name = "y", .dtype = DType::float64(), .values = {1.5, null}},
    };
    const auto out = masked().frame(data).select({sum_horizontal({col("y"), col("y")})});
    REQUIRE(*out.schema().find("y") == DType::float64());
    require_values(column_values(out, "y"), {3.0, 0.0});
}

TEST_CASE("Eager from_native", "[eager][adapter]") {
    const auto registry = make_registry();
    auto table = value_or_throw(eager::make_table(sample_data(), eager::NullMode::Masked));
    const auto frame = DataFrame::from_native(eager::native(std::move(table)), registry);

    REQUIRE(frame.backend() == "eager-masked");
    REQUIRE(frame.columns() == std::vector<std::string>{"id", "g", "x", "y"});
    REQUIRE(frame.native_as<eager::TablePtr>()->rows() == 4);
}
