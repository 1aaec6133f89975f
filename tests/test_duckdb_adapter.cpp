#include "support/shared_checks.hpp"

#include "duckdb_adapter.hpp"

#include <catch2/catch_test_macros.hpp>

#include <memory>

using namespace tessera;
using namespace tessera::testing;

namespace {

const auto kAdapter = std::make_shared<const duckdb_backend::DuckDbAdapter>();

auto duckdb_backend_under_test() -> BackendUnderTest {
    return BackendUnderTest{.registry = make_registry({kAdapter}), .backend = "duckdb"};
}

template <typename Fn>
auto error_of(Fn&& fn) -> Error {
    try {
        fn();
    } catch (const Exception& e) {
        return e.error();
    }
    FAIL("no tessera::Exception thrown");
    return Error{};
}

}  // namespace

TEST_CASE("duckdb shared behaviour", "[duckdb]") {
    check_shared_behaviour(duckdb_backend_under_test());
}

TEST_CASE("DuckDB is lazy-only", "[duckdb]") {
    const auto b = duckdb_backend_under_test();

    SECTION("from_dict is rejected") {
        const auto error = error_of([&] { (void)DataFrame::from_dict(sample_data(), "duckdb", b.registry); });
        REQUIRE(error.kind == ErrorKind::InvalidOperation);
        REQUIRE(error.message == "duckdb support is lazy-only");
    }

    SECTION("so is new_series") {
        const auto error = error_of(
            [&] { (void)Series::new_series("a", {i64(1)}, std::nullopt, "duckdb", b.registry); });
        REQUIRE(error.kind == ErrorKind::InvalidOperation);
    }

    SECTION("frames report lazy and collect to the masked engine") {
        const auto frame = b.frame(sample_data());
        REQUIRE(frame.is_lazy());
        REQUIRE(frame.backend() == "duckdb");
        const auto collected = frame.filter(col("x") > 1).collect();
        REQUIRE(collected.backend() == "eager-masked");
        REQUIRE(error_of([&] { (void)frame.collect("duckdb"); }).kind == ErrorKind::InvalidOperation);
    }
}

TEST_CASE("DuckDB order-dependent windows need order_by", "[duckdb][window]") {
    const auto frame = duckdb_backend_under_test().frame(sample_data());

    const auto error = error_of([&] { (void)frame.select({col("x").cum_sum()}); });
    REQUIRE(error.kind == ErrorKind::UnsupportedOperation);
    REQUIRE(error.backend == "duckdb");
    REQUIRE(error.message.find("without order_by") != std::string::npos);

    const auto ranked = frame.select({col("id"), col("y").rank().alias("r")}).sort({"id"});
    require_values(column_values(ranked, "r"), {1.0, null, 2.0, 3.0});
}

TEST_CASE("DuckDB result dtypes", "[duckdb][dtype]") {
    const auto frame = duckdb_backend_under_test().frame(sample_data());

    const auto out = frame.select({col("x").sum().alias("s"), col("x").mean().alias("m")});
    REQUIRE(*out.schema().find("s") == DType::int64());
    REQUIRE(*out.schema().find("m") == DType::float64());
    require_values(column_values(out, "s"), {i64(7)});
}

TEST_CASE("DuckDB integer floor division", "[duckdb][arithmetic]") {
    const FrameData data{
        ColumnData{.name = "id", .dtype = DType::int64(), .values = {i64(0), i64(1), i64(2), i64(3), i64(4)}},
        ColumnData{.name = "a",
                   .dtype = DType::int64(),
                   .values = {i64(7), i64(-7), i64(1), i64(9007199254740993), i64(-9007199254740993)}},
        ColumnData{.name = "b", .dtype = DType::int64(), .values = {i64(2), i64(2), i64(0), i64(-1), i64(2)}},
    };
    const auto out = duckdb_backend_under_test()
                         .frame(data)
                         .select({col("id"), col("a").floordiv(col("b")).alias("q"),
                                  (col("a") % col("b")).alias("r")})
                         .sort({"id"});
    require_values(column_values(out, "q"),
                   {i64(3), i64(-4), null, i64(-9007199254740993), i64(-4503599627370497)});
    require_values(column_values(out, "r"), {i64(1), i64(1), null, i64(0), i64(1)});
}

TEST_CASE("DuckDB rolling windows and distinct flags", "[duckdb][window]") {
    const FrameData data{
        ColumnData{.name = "id", .dtype = DType::int64(), .values = {i64(0), i64(1), i64(2), i64(3), i64(4)}},
        ColumnData{.name = "v", .dtype = DType::int64(), .values = {i64(1), i64(2), null, i64(4), i64(5)}},
        ColumnData{.name = "k", .dtype = DType::string(), .values = {str("a"), str("b"), str("a"), null, null}},
    };
    const auto frame = duckdb_backend_under_test().frame(data);

    SECTION("rolling frames follow order_by") {
        const auto out = frame
                             .select({col("id"), col("v").rolling_sum(2).over({}, {"id"}).alias("s"),
                                      col("v").rolling_mean(3, 1, true).over({}, {"id"}).alias("m"),
                                      col("v").rolling_var(3, 2).over({}, {"id"}).alias("var")})
                             .sort({"id"});
        REQUIRE(*out.schema().find("s") == DType::int64());
        require_values(column_values(out, "s"), {null, i64(3), null, null, i64(9)});
        require_values(column_values(out, "m"), {1.5, 1.5, 3.0, 4.5, 4.5});
        require_values(column_values(out, "var"), {null, 0.5, 0.5, 2.0, 0.5});
    }

    SECTION("distinct flags") {
        const auto out = frame
                             .select({col("id"),
                                      col("k").is_first_distinct().over({}, {"id"}).alias("first"),
                                      col("k").is_last_distinct().over({}, {"id"}).alias("last"),
                                      col("k").is_unique().alias("once")})
                             .sort({"id"});
        require_values(column_values(out, "first"), {true, true, false, true, false});
        require_values(column_values(out, "last"), {false, true, true, false, true});
        require_values(column_values(out, "once"), {false, true, false, false, false});
    }

    SECTION("rolling without order_by is rejected") {
        const auto error = error_of([&] { (void)frame.select({col("v").rolling_sum(2)}); });
        REQUIRE(error.kind == ErrorKind::UnsupportedOperation);
    }
}

TEST_CASE("DuckDB SQL helpers", "[duckdb][sql]") {
    REQUIRE(duckdb_backend::quote_identifier("a\"b") == "\"a\"\"b\"");
    REQUIRE(duckdb_backend::sql_type(DType::int64()) == "BIGINT");
    REQUIRE_FALSE(duckdb_backend::sql_type(DType::duration()).has_value());

    auto literal = duckdb_backend::sql_literal(str("it's"), DType::string());
    REQUIRE(literal.has_value());
    REQUIRE(literal->find("'it''s'") != std::string::npos);
}

TEST_CASE("DuckDB relations resolve to the duckdb backend", "[duckdb]") {
    const auto b = duckdb_backend_under_test();
    duckdb_backend::RelationPtr relation(
        kAdapter->connection().RelationFromQuery("SELECT range AS n FROM range(4)"));

    const auto frame = DataFrame::from_native(relation, b.registry);
    REQUIRE(frame.backend() == "duckdb");
    REQUIRE(*frame.schema().find("n") == DType::int64());

    const auto out = frame.select({col("n").sum()});
    require_values(column_values(out, "n"), {i64(6)});
}
