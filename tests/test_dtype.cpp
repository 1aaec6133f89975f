#include <tessera/dtype/dtype.hpp>

#include <catch2/catch_test_macros.hpp>

#include <type_traits>
#include <vector>

using namespace tessera;

TEST_CASE("DType rendering", "[dtype]") {
    REQUIRE(DType::int64().to_string() == "Int64");
    REQUIRE(DType::uint8().to_string() == "UInt8");
    REQUIRE(DType::float32().to_string() == "Float32");
    REQUIRE(DType::boolean().to_string() == "Boolean");
    REQUIRE(DType::datetime(TimeUnit::Microseconds, "UTC").to_string() ==
            "Datetime(time_unit='us', time_zone='UTC')");
    REQUIRE(DType::datetime(TimeUnit::Nanoseconds).to_string() ==
            "Datetime(time_unit='ns', time_zone=None)");
    REQUIRE(DType::duration(TimeUnit::Milliseconds).to_string() == "Duration(time_unit='ms')");
    REQUIRE(DType::list(DType::int64()).to_string() == "List(Int64)");
    REQUIRE(DType::structure({{"a", DType::int64()}, {"b", DType::string()}}).to_string() ==
            "Struct({'a': Int64, 'b': String})");
}

TEST_CASE("DTypes convert from lattice variants", "[dtype]") {
    const DType flag = dt::Boolean{};
    REQUIRE(flag == DType::boolean());
    REQUIRE(DType(dt::Int{.bits = 32, .is_signed = false}) == DType::uint32());
    REQUIRE(DType(DType::Variant{dt::Float{.bits = 32}}) == DType::float32());
    REQUIRE(DType() == DType::unknown());
    STATIC_REQUIRE_FALSE(std::is_convertible_v<int, DType>);
}

TEST_CASE("DType predicates", "[dtype]") {
    REQUIRE(DType::int16().is_numeric());
    REQUIRE(DType::int16().is_signed_integer());
    REQUIRE(DType::uint16().is_unsigned_integer());
    REQUIRE_FALSE(DType::uint16().is_signed_integer());
    REQUIRE(DType::float64().is_float());
    REQUIRE_FALSE(DType::boolean().is_numeric());
    REQUIRE(DType::date().is_temporal());
    REQUIRE(DType::duration().is_temporal());
    REQUIRE(DType::list(DType::string()).is_nested());
    REQUIRE(DType::unknown().is_unknown());
}

TEST_CASE("Nested dtypes compare structurally", "[dtype]") {
    REQUIRE(DType::list(DType::int64()) == DType::list(DType::int64()));
    REQUIRE_FALSE(DType::list(DType::int64()) == DType::list(DType::int32()));
    REQUIRE(DType::structure({{"a", DType::int64()}}) == DType::structure({{"a", DType::int64()}}));
    REQUIRE_FALSE(DType::structure({{"a", DType::int64()}}) ==
                  DType::structure({{"b", DType::int64()}}));
}

TEST_CASE("promote: integers", "[dtype][promote]") {
    SECTION("same signedness takes the wider width") {
        REQUIRE(promote(DType::int8(), DType::int32()) == DType::int32());
        REQUIRE(promote(DType::uint16(), DType::uint64()) == DType::uint64());
    }

    SECTION("signed wins when strictly wider") {
        REQUIRE(promote(DType::int32(), DType::uint16()) == DType::int32());
    }

    SECTION("otherwise the next signed width above the unsigned one") {
        REQUIRE(promote(DType::int8(), DType::uint8()) == DType::int16());
        REQUIRE(promote(DType::int16(), DType::uint32()) == DType::int64());
    }

    SECTION("Int64 with UInt64 has no integer representation") {
        REQUIRE(promote(DType::int64(), DType::uint64()) == DType::float64());
    }

    SECTION("Boolean joins any numeric type") {
        REQUIRE(promote(DType::boolean(), DType::int8()) == DType::int8());
        REQUIRE(promote(DType::float32(), DType::boolean()) == DType::float32());
    }
}

TEST_CASE("promote: floats", "[dtype][promote]") {
    REQUIRE(promote(DType::int16(), DType::float32()) == DType::float32());
    REQUIRE(promote(DType::int32(), DType::float32()) == DType::float64());
    REQUIRE(promote(DType::float32(), DType::float64()) == DType::float64());
}

TEST_CASE("promote: temporal", "[dtype][promote]") {
    const auto us = DType::datetime(TimeUnit::Microseconds);
    const auto ns = DType::datetime(TimeUnit::Nanoseconds);
    const auto utc = DType::datetime(TimeUnit::Microseconds, "UTC");

    REQUIRE(promote(DType::date(), utc) == utc);
    REQUIRE(promote(us, ns) == ns);
    REQUIRE_FALSE(promote(us, utc).has_value());
    REQUIRE(promote(DType::duration(TimeUnit::Seconds), DType::duration(TimeUnit::Milliseconds)) ==
            DType::duration(TimeUnit::Milliseconds));
    REQUIRE_FALSE(promote(DType::date(), DType::int32()).has_value());
}

TEST_CASE("promote: nested", "[dtype][promote]") {
    REQUIRE(promote(DType::list(DType::int8()), DType::list(DType::float64())) ==
            DType::list(DType::float64()));
    REQUIRE_FALSE(promote(DType::list(DType::int8()), DType::list(DType::string())).has_value());

    REQUIRE(promote(DType::structure({{"a", DType::int32()}}),
                    DType::structure({{"a", DType::int64()}})) ==
            DType::structure({{"a", DType::int64()}}));
    REQUIRE_FALSE(promote(DType::structure({{"a", DType::int32()}}),
                          DType::structure({{"b", DType::int32()}}))
                      .has_value());
}

TEST_CASE("promote: Unknown absorbs and strings stay apart", "[dtype][promote]") {
    REQUIRE(promote(DType::unknown(), DType::string()) == DType::unknown());
    REQUIRE_FALSE(promote(DType::string(), DType::int64()).has_value());

    auto mismatch = supertype(DType::string(), DType::int64());
    REQUIRE_FALSE(mismatch.has_value());
    REQUIRE(mismatch.error().kind == ErrorKind::DtypeMismatch);
}

TEST_CASE("promote is commutative", "[dtype][promote]") {
    const std::vector<DType> grid{
        DType::int8(),    DType::int64(),   DType::uint8(),          DType::uint64(),
        DType::float32(), DType::float64(), DType::boolean(),        DType::string(),
        DType::date(),    DType::datetime(), DType::duration(),       DType::list(DType::int8()),
        DType::unknown(), DType::structure({{"a", DType::uint32()}}),
    };
    for (const auto& a : grid) {
        for (const auto& b : grid) {
            INFO(a.to_string() << " with " << b.to_string());
            REQUIRE(promote(a, b) == promote(b, a));
        }
    }
}

TEST_CASE("Schema keeps insertion order and unique names", "[dtype][schema]") {
    Schema schema{{"a", DType::int64()}, {"b", DType::string()}};
    schema.set("c", DType::float64());
    schema.set("a", DType::int32());

    REQUIRE(schema.size() == 3);
    REQUIRE(schema.names() == std::vector<std::string>{"a", "b", "c"});
    REQUIRE(*schema.find("a") == DType::int32());
    REQUIRE(schema.find("z") == nullptr);
    REQUIRE(schema.contains("b"));
}
