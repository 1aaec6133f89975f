#pragma once

#include <tessera/core/error.hpp>
#include <tessera/core/scalar.hpp>
#include <tessera/ir/node.hpp>
#include <tessera/normalize/semantics.hpp>

#include <compare>
#include <cstddef>
#include <functional>
#include <vector>

namespace tessera::eager {

/// Row values of one evaluated column. Length 1 broadcasts.
using Values = std::vector<Scalar>;

/// Group key: one value per key column; null is an ordinary key value.
struct Key {
    std::vector<Scalar> values;
    auto operator==(const Key&) const -> bool = default;
};

struct KeyHash {
    auto operator()(const Key& key) const -> std::size_t {
        std::size_t seed = 0;
        auto hash_combine = [&](std::size_t value) {
            seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        };
        for (const auto& value : key.values) {
            std::size_t h = std::visit(
                [](const auto& v) { return std::hash<std::decay_t<decltype(v)>>{}(v); }, value);
            hash_combine(h);
        }
        return seed;
    }
};

struct ScalarHash {
    auto operator()(const Scalar& value) const -> std::size_t {
        return std::visit(
            [](const auto& v) { return std::hash<std::decay_t<decltype(v)>>{}(v); }, value);
    }
};

/// Order two non-null values. Numbers compare across int/float/bool;
/// values of different kinds are unordered, as is NaN.
[[nodiscard]] auto compare_values(const Scalar& lhs, const Scalar& rhs) -> std::partial_ordering;

// ─── Elementwise ──────────────────────────────────────────────────────────────
// Operands are already cast to a common dtype. Either side may have length 1.

[[nodiscard]] auto unary(ir::UnaryKind kind, const Values& operand,
                         normalize::BooleanStrategy boolean, const ir::UnaryOptions& options = {})
    -> Result<Values>;

[[nodiscard]] auto binary(ir::BinaryKind kind, const Values& lhs, const Values& rhs,
                          normalize::BooleanStrategy boolean) -> Result<Values>;

/// Row-wise reduction over operands of length `rows` (or 1), already cast to `dtype`.
[[nodiscard]] auto horizontal(const ir::HorizontalReduction& reduction,
                              const std::vector<Values>& operands, std::size_t rows,
                              normalize::BooleanStrategy boolean, const DType& dtype)
    -> Result<Values>;

// ─── Reductions and windows ───────────────────────────────────────────────────

/// Reduce to one value; nulls are skipped.
[[nodiscard]] auto reduce(const ir::Aggregation& aggregation, const Values& values)
    -> Result<Scalar>;

/// Run a window kernel over one partition already in window order.
/// Over is evaluated by the caller.
[[nodiscard]] auto window(const ir::WindowFunction& function, const Values& ordered)
    -> Result<Values>;

}  // namespace tessera::eager
