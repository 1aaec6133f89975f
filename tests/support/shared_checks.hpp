#pragma once
// Behaviour every backend must share. Each function runs inside a TEST_CASE
// of the backend's own test file. Results are sorted by an id or key column
// before comparison since lazy engines do not promise row order.

#include "frames.hpp"

#include <tessera/conformance/conformance.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <limits>

namespace tessera::testing {

inline void check_elementwise(const BackendUnderTest& b) {
    const auto frame = b.frame(sample_data());

    auto out = frame
                   .with_columns({(col("x") * 2).alias("x2"), (col("x") + col("y")).alias("xy")})
                   .sort({"id"});
    REQUIRE(out.columns() == std::vector<std::string>{"id", "g", "x", "y", "x2", "xy"});
    REQUIRE(*out.schema().find("x2") == DType::int64());
    REQUIRE(*out.schema().find("xy") == DType::float64());

    const auto data = out.to_dict();
    require_values(column_values(data, "x2"), {i64(2), i64(4), null, i64(8)});
    require_values(column_values(data, "xy"), {2.5, null, null, 8.5});
}

inline void check_replace_in_place(const BackendUnderTest& b) {
    const auto out = b.frame(sample_data()).with_columns({col("x") + 1}).sort({"id"});
    REQUIRE(out.columns() == std::vector<std::string>{"id", "g", "x", "y"});
    require_values(column_values(out, "x"), {i64(2), i64(3), null, i64(5)});
}

inline void check_reducing_select(const BackendUnderTest& b) {
    const auto out = b.frame(sample_data())
                         .select({col("x").sum(), col("y").mean().alias("ym"),
                                  col("x").count().alias("n"), len()});
    REQUIRE(out.columns() == std::vector<std::string>{"x", "ym", "n", "len"});
    REQUIRE(*out.schema().find("x") == DType::int64());

    const auto data = out.to_dict();
    require_values(column_values(data, "x"), {i64(7)});
    require_values(column_values(data, "ym"), {9.5 / 3.0});
    require_values(column_values(data, "n"), {i64(3)});
    require_values(column_values(data, "len"), {i64(4)});
}

inline void check_broadcast(const BackendUnderTest& b) {
    const auto out = b.frame(sample_data())
                         .select({col("id"), (col("x") - col("x").mean()).alias("dev")})
                         .sort({"id"});
    require_values(column_values(out, "dev"), {1.0 - 7.0 / 3.0, 2.0 - 7.0 / 3.0, null, 4.0 - 7.0 / 3.0});
}

inline void check_filter(const BackendUnderTest& b) {
    const auto out = b.frame(sample_data()).filter(col("x") > 1).sort({"id"});
    require_values(column_values(out, "id"), {i64(1), i64(3)});
}

inline void check_group_by(const BackendUnderTest& b) {
    const auto frame = b.frame(sample_data());

    SECTION("null keys form their own group") {
        const auto out =
            frame.group_by({"g"})
                .agg({col("x").sum().alias("sx"), col("y").max().alias("my"), len()})
                .sort({SortKey{.name = "g", .descending = false, .nulls_last = true}});
        REQUIRE(out.columns() == std::vector<std::string>{"g", "sx", "my", "len"});
        const auto data = out.to_dict();
        require_values(column_values(data, "g"), {str("a"), str("b"), null});
        require_values(column_values(data, "sx"), {i64(1), i64(2), i64(4)});
        require_values(column_values(data, "my"), {3.5, null, 4.5});
        require_values(column_values(data, "len"), {i64(2), i64(1), i64(1)});
    }

    SECTION("drop_null_keys removes them") {
        const auto out = frame.group_by({"g"}, true).agg({col("x").count()}).sort({"g"});
        require_values(column_values(out, "g"), {str("a"), str("b")});
        require_values(column_values(out, "x"), {i64(1), i64(1)});
    }

    SECTION("agg rejects non-aggregating expressions") {
        try {
            (void)frame.group_by({"g"}).agg({col("x") + 1});
            FAIL("agg accepted an elementwise expression");
        } catch (const Exception& e) {
            REQUIRE(e.kind() == ErrorKind::InvalidOperation);
        }
    }
}

inline void check_sort(const BackendUnderTest& b) {
    const auto frame = b.frame(sample_data());

    const auto desc = frame.sort({SortKey{.name = "x", .descending = true, .nulls_last = true}});
    require_values(column_values(desc, "id"), {i64(3), i64(1), i64(0), i64(2)});

    const auto asc = frame.sort({SortKey{.name = "y", .descending = false, .nulls_last = false}});
    require_values(column_values(asc, "id"), {i64(1), i64(0), i64(2), i64(3)});
}

inline void check_names(const BackendUnderTest& b) {
    const auto frame = b.frame(sample_data());

    REQUIRE(frame.select({all().name().suffix("_v")}).columns() ==
            std::vector<std::string>{"id_v", "g_v", "x_v", "y_v"});
    REQUIRE(frame.select({col("x").alias("q").name().to_uppercase()}).columns() ==
            std::vector<std::string>{"Q"});
    REQUIRE(frame.select({col("x").alias("q").name().keep()}).columns() ==
            std::vector<std::string>{"x"});
    REQUIRE(frame.drop({"g", "y"}).columns() == std::vector<std::string>{"id", "x"});
    REQUIRE(frame.rename({{"x", "z"}}).columns() == std::vector<std::string>{"id", "g", "z", "y"});

    try {
        (void)frame.select({col("missing")});
        FAIL("unknown column accepted");
    } catch (const Exception& e) {
        REQUIRE(e.kind() == ErrorKind::ColumnNotFound);
    }
}

inline void check_horizontal(const BackendUnderTest& b) {
    const auto out = b.frame(sample_data())
                         .select({col("id"), sum_horizontal({col("x"), col("y")}).alias("s"),
                                  max_horizontal({col("x"), col("y")}).alias("m")})
                         .sort({"id"});
    const auto data = out.to_dict();
    require_values(column_values(data, "s"), {2.5, 2.0, 3.5, 8.5});
    require_values(column_values(data, "m"), {1.5, 2.0, 3.5, 4.5});
}

inline void check_numeric_functions(const BackendUnderTest& b) {
    const auto out = b.frame(sample_data())
                         .select({col("id"), col("x").clip(i64(2), i64(3)).alias("c"),
                                  col("y").clip(null, 4.0).alias("cy"),
                                  col("x").clip(1.5, null).alias("cf"),
                                  col("y").round().alias("r"), col("x").log(2.0).alias("l"),
                                  (col("x") - 2).log().alias("edge")})
                         .sort({"id"});
    REQUIRE(*out.schema().find("c") == DType::int64());
    REQUIRE(*out.schema().find("cf") == DType::float64());
    REQUIRE(*out.schema().find("l") == DType::float64());

    const auto data = out.to_dict();
    require_values(column_values(data, "c"), {i64(2), i64(2), null, i64(3)});
    require_values(column_values(data, "cy"), {1.5, null, 3.5, 4.0});
    require_values(column_values(data, "cf"), {1.5, 2.0, null, 4.0});
    require_values(column_values(data, "r"), {2.0, null, 4.0, 5.0});
    require_values(column_values(data, "l"), {0.0, 1.0, null, 2.0});
    require_values(column_values(data, "edge"),
                   {std::numeric_limits<double>::quiet_NaN(),
                    -std::numeric_limits<double>::infinity(), null, std::log(2.0)});
}

inline void check_ordered_window(const BackendUnderTest& b) {
    const auto out = b.frame(sample_data())
                         .select({col("id"), col("x").cum_sum().over({}, {"id"}).alias("cs"),
                                  col("x").shift(1).over({}, {"id"}).alias("prev")})
                         .sort({"id"});
    const auto data = out.to_dict();
    require_values(column_values(data, "cs"), {i64(1), i64(3), null, i64(7)});
    require_values(column_values(data, "prev"), {null, i64(1), i64(2), null});
}

/// Kleene results on backends with nullable booleans; flagged fallback results otherwise.
inline void check_boolean_logic(const BackendUnderTest& b) {
    const auto out = b.frame(sample_data())
                         .select({col("id"), ((col("x") > 1) | (col("y") > 2)).alias("or"),
                                  ((col("x") > 1) & (col("y") > 2)).alias("and")})
                         .sort({"id"});
    const auto data = out.to_dict();
    if (out.is_approximate()) {
        require_values(column_values(data, "or"), {false, true, true, true});
        require_values(column_values(data, "and"), {false, false, false, true});
    } else {
        require_values(column_values(data, "or"), {false, true, true, true});
        require_values(column_values(data, "and"), {false, null, null, true});
    }
}

inline void check_collect(const BackendUnderTest& b) {
    const auto frame = b.frame(sample_data());
    const auto collected = frame.collect();
    REQUIRE_FALSE(collected.is_lazy());
    if (!frame.is_lazy()) {
        REQUIRE(collected.backend() == frame.backend());
    } else {
        REQUIRE(collected.backend() == "eager-masked");
    }
    REQUIRE(collected.schema() == frame.schema());
}

/// lower() then dtype_of() agrees with the dtype the materialized result carries.
inline void check_lowering(const BackendUnderTest& b) {
    const auto adapter = b.adapter();
    const auto frame = b.frame(sample_data());
    const LoweringContext context{.frame = frame.to_native(), .schema = frame.schema()};

    for (const auto& expr : {col("x") * 2, col("x") / 2, col("x") > 1, col("g"), col("x").sum()}) {
        const auto lowered = value_or_throw(adapter->lower(*expr.node(), context));
        const auto dtype = value_or_throw(adapter->dtype_of(lowered));
        const auto out = frame.select({expr.alias("v")});
        INFO(dtype.to_string());
        REQUIRE(dtype == *out.schema().find("v"));
    }

    const auto wrong = adapter->dtype_of(NativeColumn(std::string("column")));
    REQUIRE_FALSE(wrong.has_value());
    REQUIRE(wrong.error().kind == ErrorKind::UnknownDtype);
}

inline void check_conformance(const BackendUnderTest& b) {
    for (const auto& result : conformance::run_backend(b.registry, b.backend)) {
        INFO(result.check << ": " << result.detail);
        REQUIRE(result.outcome != conformance::Outcome::Failed);
    }
}

/// Everything above.
inline void check_shared_behaviour(const BackendUnderTest& b) {
    SECTION("elementwise") { check_elementwise(b); }
    SECTION("replace in place") { check_replace_in_place(b); }
    SECTION("reducing select") { check_reducing_select(b); }
    SECTION("broadcast") { check_broadcast(b); }
    SECTION("filter") { check_filter(b); }
    SECTION("group_by") { check_group_by(b); }
    SECTION("sort") { check_sort(b); }
    SECTION("names") { check_names(b); }
    SECTION("horizontal") { check_horizontal(b); }
    SECTION("numeric functions") { check_numeric_functions(b); }
    SECTION("ordered window") { check_ordered_window(b); }
    SECTION("boolean logic") { check_boolean_logic(b); }
    SECTION("collect") { check_collect(b); }
    SECTION("lowering") { check_lowering(b); }
    SECTION("conformance") { check_conformance(b); }
}

}  // namespace tessera::testing
