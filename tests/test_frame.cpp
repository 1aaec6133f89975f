#include "support/frames.hpp"
#include "support/restricted_adapter.hpp"

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <string>

using namespace tessera;
using namespace tessera::testing;

namespace {

template <typename Fn>
auto error_kind_of(Fn&& fn) -> ErrorKind {
    try {
        fn();
    } catch (const Exception& e) {
        return e.kind();
    }
    FAIL("no tessera::Exception thrown");
    return ErrorKind::Native;
}

}  // namespace

TEST_CASE("Frames are immutable", "[frame]") {
    const auto frame = DataFrame::from_dict(sample_data(), "eager-masked", make_registry());
    const auto derived = frame.with_columns({(col("x") * 10).alias("x10")}).filter(col("id") > 0);

    REQUIRE(frame.columns() == std::vector<std::string>{"id", "g", "x", "y"});
    require_values(column_values(frame, "id"), {i64(0), i64(1), i64(2), i64(3)});
    REQUIRE(derived.columns() == std::vector<std::string>{"id", "g", "x", "y", "x10"});
    require_values(column_values(derived, "x10"), {i64(20), null, i64(40)});
}

TEST_CASE("Frame construction", "[frame]") {
    const auto registry = make_registry();

    SECTION("from_native rejects unknown objects") {
        REQUIRE(error_kind_of([&] { (void)DataFrame::from_native(std::string("table"), registry); }) ==
                ErrorKind::UnrecognizedNativeType);
    }

    SECTION("from_dict needs a registered backend") {
        REQUIRE(error_kind_of([&] { (void)DataFrame::from_dict(sample_data(), "pandas", registry); }) ==
                ErrorKind::InvalidOperation);
    }

    SECTION("the process-wide registry is the default") {
        const auto frame = DataFrame::from_dict(sample_data(), "eager");
        REQUIRE(frame.backend() == "eager");
    }

    SECTION("to_native round-trips through from_native") {
        const auto frame = DataFrame::from_dict(sample_data(), "eager", registry);
        const auto again = DataFrame::from_native(frame.to_native(), registry);
        REQUIRE(again.backend() == "eager");
        REQUIRE(again.schema() == frame.schema());
    }
}

TEST_CASE("Upcast results stay on the sentinel backend", "[frame][boolean]") {
    Config config;
    config.upcast_booleans = true;
    const auto registry = make_registry({}, config);
    const auto out = DataFrame::from_dict(sample_data(), "eager", registry)
                         .select({col("id"), (col("x") > 1).alias("p")});
    REQUIRE(out.backend() == "eager");

    const auto again = DataFrame::from_native(out.to_native(), registry);
    REQUIRE(again.backend() == "eager");
    require_values(column_values(again, "p"), {false, true, null, true});
}

TEST_CASE("Frame operation errors", "[frame][errors]") {
    const auto frame = DataFrame::from_dict(sample_data(), "eager-masked", make_registry());

    REQUIRE(error_kind_of([&] { (void)frame.filter(col("x") + 1); }) == ErrorKind::DtypeMismatch);
    REQUIRE(error_kind_of([&] { (void)frame.filter(cols({"x", "y"}) > 0); }) ==
            ErrorKind::InvalidOperation);
    REQUIRE(error_kind_of([&] { (void)frame.select({col("x"), col("y").alias("x")}); }) ==
            ErrorKind::InvalidOperation);
    REQUIRE(error_kind_of([&] { (void)frame.group_by({}); }) == ErrorKind::InvalidOperation);
    REQUIRE(error_kind_of([&] { (void)frame.group_by({"nope"}); }) == ErrorKind::ColumnNotFound);
    REQUIRE(error_kind_of([&] { (void)frame.sort({"nope"}); }) == ErrorKind::ColumnNotFound);
    REQUIRE(error_kind_of([&] { (void)frame.drop({"nope"}); }) == ErrorKind::ColumnNotFound);
    REQUIRE(error_kind_of([&] { (void)frame.with_columns({col("g") + col("x")}); }) ==
            ErrorKind::DtypeMismatch);
    REQUIRE(error_kind_of([&] { (void)frame.group_by({"g"}).agg({col("g").count()}); }) ==
            ErrorKind::InvalidOperation);
    REQUIRE(error_kind_of([&] { (void)frame.collect("restricted"); }) ==
            ErrorKind::InvalidOperation);
}

TEST_CASE("Unsupported operations fail before any native call", "[frame][capabilities]") {
    auto restricted = std::make_shared<RestrictedAdapter>();
    const auto registry = make_registry({restricted});
    const auto frame = DataFrame::from_dict(sample_data(), "restricted", registry);

    try {
        (void)frame.select({col("x").floordiv(2)});
        FAIL("floordiv accepted");
    } catch (const Exception& e) {
        REQUIRE(e.kind() == ErrorKind::UnsupportedOperation);
        REQUIRE(e.backend() == "restricted");
        REQUIRE(std::string(e.what()).find("floordiv") != std::string::npos);
    }
    try {
        (void)frame.filter(col("x").rank() > 1);
        FAIL("rank accepted");
    } catch (const Exception& e) {
        REQUIRE(e.kind() == ErrorKind::UnsupportedOperation);
    }
    REQUIRE(restricted->native_calls == 0);

    const auto out = frame.select({col("x") * 3});
    REQUIRE(restricted->native_calls == 1);
    require_values(column_values(out, "x"), {i64(3), i64(6), null, i64(12)});
}

TEST_CASE("Group by several keys", "[frame][group]") {
    const FrameData data{
        ColumnData{.name = "k1", .dtype = DType::string(), .values = {str("a"), str("a"), str("b"), str("a")}},
        ColumnData{.name = "k2", .dtype = DType::int64(), .values = {i64(1), i64(2), i64(1), i64(1)}},
        ColumnData{.name = "v", .dtype = DType::float64(), .values = {1.0, 2.0, 3.0, 4.0}},
    };
    const auto out = DataFrame::from_dict(data, "eager-masked", make_registry())
                         .group_by({"k1", "k2"})
                         .agg({col("v").sum(), col("v").mean().alias("m")});

    REQUIRE(out.columns() == std::vector<std::string>{"k1", "k2", "v", "m"});
    require_values(column_values(out, "k1"), {str("a"), str("a"), str("b")});
    require_values(column_values(out, "k2"), {i64(1), i64(2), i64(1)});
    require_values(column_values(out, "v"), {5.0, 2.0, 3.0});
    require_values(column_values(out, "m"), {2.5, 2.0, 3.0});
}

TEST_CASE("Moving between backends", "[frame][backends]") {
    const auto registry = make_registry();
    const auto frame = DataFrame::from_dict(sample_data(), "eager-masked", registry);

    REQUIRE(frame.lazy().backend() == "eager-masked");
    REQUIRE(frame.collect().backend() == "eager-masked");

    const auto sentinel = frame.collect("eager");
    REQUIRE(sentinel.backend() == "eager");
    REQUIRE(sentinel.schema() == frame.schema());
    require_values(column_values(sentinel, "y"), {1.5, null, 3.5, 4.5});
}

TEST_CASE("Column access", "[frame][series]") {
    const auto frame = DataFrame::from_dict(sample_data(), "eager-masked", make_registry());
    const auto x = frame.column("x");

    REQUIRE(x.name() == "x");
    REQUIRE(x.dtype() == DType::int64());
    REQUIRE(x.size() == 4);
    REQUIRE(error_kind_of([&] { (void)frame.column("nope"); }) == ErrorKind::ColumnNotFound);
}
