#include <tessera/eager/column.hpp>
#include <tessera/eager/table.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <vector>

using namespace tessera;
using namespace tessera::eager;

TEST_CASE("Column<int64_t> basic operations", "[eager][column]") {
    Column<std::int64_t> col{1, 2, 3, 4, 5};

    SECTION("size and element access") {
        REQUIRE(col.size() == 5);
        REQUIRE_FALSE(col.empty());
        REQUIRE(col.at(0) == 1);
        REQUIRE(col[4] == 5);
    }

    SECTION("push_back grows the column") {
        col.push_back(6);
        REQUIRE(col.size() == 6);
        REQUIRE(col.at(5) == 6);
    }

    SECTION("at() throws on out-of-bounds") {
        REQUIRE_THROWS_AS(col.at(100), std::out_of_range);
    }
}

TEST_CASE("Column take and repeat", "[eager][column]") {
    Column<std::int64_t> col{10, 20, 30, 40};

    const std::vector<std::size_t> rows{3, 0, 0};
    auto taken = col.take(rows);
    REQUIRE(taken.size() == 3);
    REQUIRE(taken[0] == 40);
    REQUIRE(taken[1] == 10);
    REQUIRE(taken[2] == 10);

    auto repeated = col.repeat(1, 3);
    REQUIRE(repeated.size() == 3);
    REQUIRE(repeated[2] == 20);
}

TEST_CASE("Column<Bool> is fixed-width", "[eager][column]") {
    Column<Bool> flags{Bool::True, Bool::False};
    REQUIRE(to_bool(flags[0]));
    REQUIRE_FALSE(to_bool(flags[1]));
    REQUIRE(from_bool(true) == Bool::True);
}

TEST_CASE("make_entry records nulls in the validity bitmap", "[eager][table]") {
    auto entry = make_entry("x", DType::int32(), {std::int64_t{1}, std::monostate{}, std::int64_t{3}});
    REQUIRE(entry.has_value());
    REQUIRE(entry->size() == 3);
    REQUIRE(entry->null_count() == 1);
    REQUIRE(eager::is_null(*entry, 1));
    REQUIRE_FALSE(eager::is_null(*entry, 0));
    REQUIRE(entry->dtype == DType::int32());
    REQUIRE(std::get<std::int64_t>(value_at(*entry, 2)) == 3);

    SECTION("all-valid columns carry no bitmap") {
        auto dense = make_entry("y", DType::float64(), {1.0, 2.0});
        REQUIRE(dense.has_value());
        REQUIRE_FALSE(dense->validity.has_value());
    }

    SECTION("nested dtypes have no eager storage") {
        auto nested = make_entry("l", DType::list(DType::int64()), {});
        REQUIRE_FALSE(nested.has_value());
        REQUIRE(nested.error().kind == ErrorKind::UnsupportedOperation);
    }
}

TEST_CASE("Sentinel tables reject null booleans", "[eager][table]") {
    const FrameData data{
        ColumnData{.name = "b", .dtype = DType::boolean(), .values = {true, std::monostate{}}},
    };
    REQUIRE_FALSE(make_table(data, NullMode::Sentinel).has_value());

    auto masked = make_table(data, NullMode::Masked);
    REQUIRE(masked.has_value());
    REQUIRE(masked->rows() == 2);
    REQUIRE_FALSE(to_tri(masked->columns[0], 1).has_value());
    REQUIRE(to_tri(masked->columns[0], 0) == normalize::Tri{true});
}

TEST_CASE("Table add_column reseats in place", "[eager][table]") {
    auto table = make_table(
        {
            ColumnData{.name = "a", .dtype = DType::int64(), .values = {std::int64_t{1}}},
            ColumnData{.name = "b", .dtype = DType::int64(), .values = {std::int64_t{2}}},
        },
        NullMode::Masked);
    REQUIRE(table.has_value());

    auto replacement = make_entry("a", DType::string(), {std::string("x")});
    REQUIRE(replacement.has_value());
    table->add_column(*replacement);

    REQUIRE(table->columns.size() == 2);
    REQUIRE(table->columns[0].name == "a");
    REQUIRE(table->columns[0].dtype == DType::string());
    REQUIRE(table->find_entry("missing") == nullptr);
    REQUIRE(table->schema().names() == std::vector<std::string>{"a", "b"});
}

TEST_CASE("take gathers rows and validity together", "[eager][table]") {
    auto entry = make_entry("s", DType::string(),
                            {std::string("a"), std::monostate{}, std::string("c")});
    REQUIRE(entry.has_value());

    const std::vector<std::size_t> rows{2, 1};
    auto taken = take(*entry, rows);
    REQUIRE(taken.size() == 2);
    REQUIRE(std::get<std::string>(value_at(taken, 0)) == "c");
    REQUIRE(eager::is_null(taken, 1));
}

TEST_CASE("cast moves between physical storages", "[eager][table]") {
    auto ints = make_entry("i", DType::int64(), {std::int64_t{1}, std::monostate{}});
    REQUIRE(ints.has_value());

    auto floats = cast(*ints, DType::float64());
    REQUIRE(floats.has_value());
    REQUIRE(floats->dtype == DType::float64());
    REQUIRE(std::get<double>(value_at(*floats, 0)) == 1.0);
    REQUIRE(eager::is_null(*floats, 1));

    auto text = cast(*ints, DType::string());
    REQUIRE(text.has_value());
    REQUIRE(std::get<std::string>(value_at(*text, 0)) == "1");

    auto dates = make_entry("d", DType::date(), {Date{.days = 1}});
    REQUIRE(dates.has_value());
    auto stamps = cast(*dates, DType::datetime(TimeUnit::Nanoseconds));
    REQUIRE(stamps.has_value());
    REQUIRE(std::get<Timestamp>(value_at(*stamps, 0)).nanos == 86'400'000'000'000);

    REQUIRE_FALSE(cast(*dates, DType::int64()).has_value());
}

TEST_CASE("Duration casts fail instead of overflowing", "[eager][table]") {
    STATIC_REQUIRE(to_nanos(2, TimeUnit::Seconds) == 2'000'000'000);
    STATIC_REQUIRE_FALSE(to_nanos(std::numeric_limits<std::int64_t>::max(), TimeUnit::Milliseconds)
                             .has_value());

    auto seconds = make_entry("d", DType::duration(TimeUnit::Seconds), {std::int64_t{10}});
    REQUIRE(seconds.has_value());
    auto millis = cast(*seconds, DType::duration(TimeUnit::Milliseconds));
    REQUIRE(millis.has_value());
    REQUIRE(std::get<std::int64_t>(value_at(*millis, 0)) == 10'000);

    constexpr std::int64_t kLargest = std::numeric_limits<std::int64_t>::max() / 1000;
    auto largest = make_entry("d", DType::duration(TimeUnit::Seconds), {kLargest});
    REQUIRE(largest.has_value());
    auto fits = cast(*largest, DType::duration(TimeUnit::Milliseconds));
    REQUIRE(fits.has_value());
    REQUIRE(std::get<std::int64_t>(value_at(*fits, 0)) == kLargest * 1000);

    auto huge = make_entry("d", DType::duration(TimeUnit::Seconds), {kLargest + 1});
    REQUIRE(huge.has_value());
    auto overflow = cast(*huge, DType::duration(TimeUnit::Milliseconds));
    REQUIRE_FALSE(overflow.has_value());
    REQUIRE(overflow.error().kind == ErrorKind::InvalidOperation);

    auto nanos = make_entry("d", DType::duration(TimeUnit::Nanoseconds),
                            {std::numeric_limits<std::int64_t>::max()});
    REQUIRE(nanos.has_value());
    auto coarse = cast(*nanos, DType::duration(TimeUnit::Seconds));
    REQUIRE(coarse.has_value());
    REQUIRE(std::get<std::int64_t>(value_at(*coarse, 0)) == 9'223'372'036);
}
