#include "support/frames.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace tessera;
using namespace tessera::testing;

TEST_CASE("Series construction", "[series]") {
    const auto registry = make_registry();

    SECTION("dtype is inferred from the values") {
        const auto s = Series::new_series("a", {i64(1), null, i64(3)}, std::nullopt, "eager-masked",
                                          registry);
        REQUIRE(s.name() == "a");
        REQUIRE(s.dtype() == DType::int64());
        REQUIRE(s.size() == 3);
        REQUIRE(s.backend() == "eager-masked");
    }

    SECTION("mixed ints and floats widen") {
        const auto s =
            Series::new_series("a", {i64(1), 2.5}, std::nullopt, "eager-masked", registry);
        REQUIRE(s.dtype() == DType::float64());
    }

    SECTION("an explicit dtype wins") {
        const auto s = Series::new_series("a", {i64(1), i64(2)}, DType::int32(), "eager", registry);
        REQUIRE(s.dtype() == DType::int32());
    }

    SECTION("all-null values have no natural dtype") {
        const auto s = Series::new_series("a", {null, null}, std::nullopt, "eager-masked", registry);
        REQUIRE(s.dtype() == DType::unknown());
    }

    SECTION("wrapping a one-column table") {
        const auto frame = DataFrame::from_dict(sample_data(), "eager-masked", registry);
        const auto s = Series::from_native(frame.select({col("y")}).to_native(), registry);
        REQUIRE(s.name() == "y");
        require_values(s.values(), {1.5, null, 3.5, 4.5});
    }

    SECTION("wider tables are not series") {
        const auto frame = DataFrame::from_dict(sample_data(), "eager-masked", registry);
        try {
            (void)Series::from_native(frame.to_native(), registry);
            FAIL("a four-column table became a series");
        } catch (const Exception& e) {
            REQUIRE(e.kind() == ErrorKind::InvalidOperation);
        }
    }
}

TEST_CASE("Series reductions", "[series]") {
    const auto s = Series::new_series("v", {i64(4), null, i64(1), i64(7)}, std::nullopt,
                                      "eager-masked", make_registry());

    REQUIRE(std::get<std::int64_t>(s.sum()) == 12);
    REQUIRE(std::get<double>(s.mean()) == Catch::Approx(4.0));
    REQUIRE(std::get<std::int64_t>(s.min()) == 1);
    REQUIRE(std::get<std::int64_t>(s.max()) == 7);
    REQUIRE(s.count() == 3);
    REQUIRE(s.null_count() == 1);
}

TEST_CASE("Series transforms", "[series]") {
    const auto s = Series::new_series("v", {1.0, null, 4.0}, std::nullopt, "eager-masked",
                                      make_registry());

    SECTION("apply keeps the name") {
        const auto out = s.apply([](const Expr& e) { return e.sqrt() * 2; });
        REQUIRE(out.name() == "v");
        require_values(out.values(), {2.0, null, 4.0});
    }

    SECTION("apply may alias") {
        const auto out = s.apply([](const Expr& e) { return e.is_null().alias("missing"); });
        REQUIRE(out.name() == "missing");
        require_values(out.values(), {false, true, false});
    }

    SECTION("rename") {
        const auto out = s.rename("w");
        REQUIRE(out.name() == "w");
        REQUIRE(s.name() == "v");
        REQUIRE(out.to_frame().columns() == std::vector<std::string>{"w"});
    }
}
