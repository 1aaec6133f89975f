#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <span>

namespace tessera::normalize {

/// Three-valued boolean: std::nullopt is null (unknown).
using Tri = std::optional<bool>;

/// Kleene conjunction: False dominates, otherwise null propagates.
[[nodiscard]] constexpr auto kleene_and(Tri lhs, Tri rhs) noexcept -> Tri {
    if ((lhs.has_value() && !*lhs) || (rhs.has_value() && !*rhs)) {
        return false;
    }
    if (!lhs.has_value() || !rhs.has_value()) {
        return std::nullopt;
    }
    return true;
}

/// Kleene disjunction: True dominates, otherwise null propagates.
[[nodiscard]] constexpr auto kleene_or(Tri lhs, Tri rhs) noexcept -> Tri {
    if ((lhs.has_value() && *lhs) || (rhs.has_value() && *rhs)) {
        return true;
    }
    if (!lhs.has_value() || !rhs.has_value()) {
        return std::nullopt;
    }
    return false;
}

[[nodiscard]] constexpr auto strict_xor(Tri lhs, Tri rhs) noexcept -> Tri {
    if (!lhs.has_value() || !rhs.has_value()) {
        return std::nullopt;
    }
    return *lhs != *rhs;
}

[[nodiscard]] constexpr auto strict_not(Tri value) noexcept -> Tri {
    if (!value.has_value()) {
        return std::nullopt;
    }
    return !*value;
}

// ─── Fallback for storage without a null bit ──────────────────────────────────
// Boolean-producing comparisons map null to False; logic then runs two-valued.

[[nodiscard]] constexpr auto null_as_false(Tri value) noexcept -> bool {
    return value.value_or(false);
}

[[nodiscard]] constexpr auto fallback_and(Tri lhs, Tri rhs) noexcept -> bool {
    return null_as_false(lhs) && null_as_false(rhs);
}

[[nodiscard]] constexpr auto fallback_or(Tri lhs, Tri rhs) noexcept -> bool {
    return null_as_false(lhs) || null_as_false(rhs);
}

/// Row-wise any over a set of values.
/// With ignore_nulls an all-null (or empty) row is False; without, Kleene or.
[[nodiscard]] constexpr auto horizontal_any(std::span<const Tri> values, bool ignore_nulls) noexcept
    -> Tri {
    Tri acc = false;
    for (const auto& v : values) {
        if (ignore_nulls && !v.has_value()) {
            continue;
        }
        acc = kleene_or(acc, v);
    }
    return acc;
}

/// Row-wise all; an all-null row is True under ignore_nulls.
[[nodiscard]] constexpr auto horizontal_all(std::span<const Tri> values, bool ignore_nulls) noexcept
    -> Tri {
    Tri acc = true;
    for (const auto& v : values) {
        if (ignore_nulls && !v.has_value()) {
            continue;
        }
        acc = kleene_and(acc, v);
    }
    return acc;
}

/// One row of the reference truth table.
struct TruthRow {
    Tri lhs;
    Tri rhs;
    Tri and_;
    Tri or_;
};

/// The nine {True, False, null} combinations with their Kleene results.
[[nodiscard]] constexpr auto kleene_table() noexcept -> std::array<TruthRow, 9> {
    constexpr std::array<Tri, 3> values{Tri{true}, Tri{false}, Tri{}};
    std::array<TruthRow, 9> out{};
    std::size_t i = 0;
    for (const auto& l : values) {
        for (const auto& r : values) {
            out[i++] = TruthRow{.lhs = l, .rhs = r, .and_ = kleene_and(l, r), .or_ = kleene_or(l, r)};
        }
    }
    return out;
}

}  // namespace tessera::normalize
