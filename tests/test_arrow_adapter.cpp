#include "support/shared_checks.hpp"

#include "arrow_adapter.hpp"

#include <arrow/api.h>

#include <catch2/catch_test_macros.hpp>

using namespace tessera;
using namespace tessera::testing;

namespace {

auto arrow_backend() -> BackendUnderTest {
    return BackendUnderTest{
        .registry = make_registry({std::make_shared<const arrow_backend::ArrowAdapter>()}),
        .backend = "arrow"};
}

void expect_unsupported(const DataFrame& frame, const Expr& expr) {
    try {
        (void)frame.select({expr});
        FAIL("expression accepted");
    } catch (const Exception& e) {
        REQUIRE(e.kind() == ErrorKind::UnsupportedOperation);
        REQUIRE(e.backend() == "arrow");
    }
}

}  // namespace

TEST_CASE("arrow shared behaviour", "[arrow]") {
    check_shared_behaviour(arrow_backend());
}

TEST_CASE("Arrow type mapping", "[arrow][dtype]") {
    for (const auto& dtype : {DType::int8(), DType::uint32(), DType::float32(), DType::boolean(),
                              DType::string(), DType::date(),
                              DType::datetime(TimeUnit::Microseconds, "UTC"),
                              DType::duration(TimeUnit::Nanoseconds), DType::list(DType::int64())}) {
        INFO(dtype.to_string());
        auto type = arrow_backend::to_arrow_type(dtype);
        REQUIRE(type.has_value());
        auto back = arrow_backend::from_arrow_type(**type);
        REQUIRE(back.has_value());
        REQUIRE(*back == dtype);
    }

    auto unmapped = arrow_backend::from_arrow_type(*arrow::decimal128(10, 2));
    REQUIRE_FALSE(unmapped.has_value());
    REQUIRE(unmapped.error().kind == ErrorKind::UnknownDtype);
}

TEST_CASE("Arrow tables resolve to the arrow backend", "[arrow]") {
    arrow::Int64Builder builder;
    REQUIRE(builder.AppendValues({1, 2, 3}).ok());
    REQUIRE(builder.AppendNull().ok());
    std::shared_ptr<arrow::Array> values;
    REQUIRE(builder.Finish(&values).ok());
    auto table = arrow::Table::Make(arrow::schema({arrow::field("n", arrow::int64())}), {values});

    const auto frame = DataFrame::from_native(table, arrow_backend().registry);
    REQUIRE(frame.backend() == "arrow");
    REQUIRE(*frame.schema().find("n") == DType::int64());

    const auto out = frame.select({col("n").sum(), col("n").count().alias("c")});
    require_values(column_values(out, "n"), {i64(6)});
    require_values(column_values(out, "c"), {i64(3)});
    REQUIRE(out.native_as<arrow_backend::TablePtr>()->num_rows() == 1);
}

TEST_CASE("Arrow rejects windows it cannot compute exactly", "[arrow][window]") {
    const auto frame = arrow_backend().frame(sample_data());

    expect_unsupported(frame, col("x").rank());
    expect_unsupported(frame, col("x").sum().over({"g"}));
    expect_unsupported(frame, col("x").cum_sum().over({"g"}, {"id"}));
    expect_unsupported(frame, col("x").rolling_mean(2));
    expect_unsupported(frame, col("g").is_first_distinct());
    expect_unsupported(frame, col("g").is_unique());
}

TEST_CASE("Arrow integer floor division", "[arrow][arithmetic]") {
    const FrameData data{
        ColumnData{.name = "a", .dtype = DType::int64(), .values = {i64(7), i64(-7), i64(1)}},
        ColumnData{.name = "b", .dtype = DType::int64(), .values = {i64(2), i64(2), i64(0)}},
    };
    const auto out = arrow_backend().frame(data).select({col("a").floordiv(col("b"))});
    REQUIRE(*out.schema().find("a") == DType::int64());
    require_values(column_values(out, "a"), {i64(3), i64(-4), null});
}

TEST_CASE("Arrow integer floor division stays exact past 2^53", "[arrow][arithmetic]") {
    const FrameData data{
        ColumnData{.name = "a",
                   .dtype = DType::int64(),
                   .values = {i64(9007199254740993), i64(-9007199254740993), i64(9007199254740993)}},
        ColumnData{.name = "b", .dtype = DType::int64(), .values = {i64(1), i64(2), i64(-1)}},
    };
    const auto out = arrow_backend().frame(data).select(
        {col("a").floordiv(col("b")).alias("q"), (col("a") % col("b")).alias("r")});
    require_values(column_values(out, "q"),
                   {i64(9007199254740993), i64(-4503599627370497), i64(-9007199254740993)});
    require_values(column_values(out, "r"), {i64(0), i64(1), i64(0)});
}

TEST_CASE("Arrow groups come out in first-occurrence order", "[arrow][group]") {
    const FrameData data{
        ColumnData{.name = "k", .dtype = DType::string(),
                   .values = {str("c"), str("a"), str("c"), null, str("b"), str("a")}},
        ColumnData{.name = "v", .dtype = DType::int64(),
                   .values = {i64(1), i64(2), i64(3), i64(4), i64(5), i64(6)}},
    };
    const auto out = arrow_backend().frame(data).group_by({"k"}).agg({col("v").sum()});
    require_values(column_values(out, "k"), {str("c"), str("a"), null, str("b")});
    require_values(column_values(out, "v"), {i64(4), i64(8), i64(4), i64(5)});
}
