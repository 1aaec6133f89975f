#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>

namespace tessera {

/// Resolution of a Datetime or Duration value.
enum class TimeUnit : std::uint8_t {
    Seconds,
    Milliseconds,
    Microseconds,
    Nanoseconds,
};

/// Calendar date in days since 1970-01-01 (Unix epoch).
struct Date {
    std::int32_t days = 0;
    auto operator<=>(const Date&) const = default;
};

/// Instant in nanoseconds since 1970-01-01T00:00:00Z (Unix epoch).
struct Timestamp {
    std::int64_t nanos = 0;
    auto operator<=>(const Timestamp&) const = default;
};

/// Number of ticks of `unit` per second.
[[nodiscard]] constexpr auto ticks_per_second(TimeUnit unit) noexcept -> std::int64_t {
    switch (unit) {
        case TimeUnit::Seconds:
            return 1;
        case TimeUnit::Milliseconds:
            return 1'000;
        case TimeUnit::Microseconds:
            return 1'000'000;
        case TimeUnit::Nanoseconds:
            return 1'000'000'000;
    }
    return 1;
}

/// Re-express ticks of `from` in `to`, flooring when the unit coarsens; nullopt on overflow.
[[nodiscard]] constexpr auto convert_ticks(std::int64_t ticks, TimeUnit from, TimeUnit to) noexcept
    -> std::optional<std::int64_t> {
    const std::int64_t f = ticks_per_second(from);
    const std::int64_t t = ticks_per_second(to);
    if (t < f) {
        const std::int64_t div = f / t;
        std::int64_t q = ticks / div;
        if ((ticks % div != 0) && (ticks < 0)) {
            --q;
        }
        return q;
    }
    std::int64_t out = 0;
    if (__builtin_mul_overflow(ticks, t / f, &out)) {
        return std::nullopt;
    }
    return out;
}

/// Convert a tick count in `unit` to nanoseconds; nullopt when the result overflows int64.
[[nodiscard]] constexpr auto to_nanos(std::int64_t ticks, TimeUnit unit) noexcept
    -> std::optional<std::int64_t> {
    return convert_ticks(ticks, unit, TimeUnit::Nanoseconds);
}

/// "s", "ms", "us", "ns"
[[nodiscard]] auto unit_suffix(TimeUnit unit) -> const char*;

/// YYYY-MM-DD
[[nodiscard]] auto format_date(Date date) -> std::string;

/// YYYY-MM-DD HH:MM:SS.fffffffff
[[nodiscard]] auto format_timestamp(Timestamp ts) -> std::string;

}  // namespace tessera

namespace std {

template <>
struct hash<tessera::Date> {
    auto operator()(const tessera::Date& d) const noexcept -> std::size_t {
        return std::hash<std::int32_t>{}(d.days);
    }
};

template <>
struct hash<tessera::Timestamp> {
    auto operator()(const tessera::Timestamp& ts) const noexcept -> std::size_t {
        return std::hash<std::int64_t>{}(ts.nanos);
    }
};

}  // namespace std
