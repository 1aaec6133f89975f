#pragma once

#include <tessera/core/config.hpp>
#include <tessera/core/error.hpp>
#include <tessera/core/scalar.hpp>
#include <tessera/dtype/dtype.hpp>
#include <tessera/ir/node.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace tessera::normalize {

// ─── Boolean storage ──────────────────────────────────────────────────────────

/// How an adapter evaluates boolean-producing expressions.
enum class BooleanStrategy : std::uint8_t {
    /// Native storage holds null booleans; Kleene logic is exact.
    Native,
    /// Convert to the backend's nullable boolean representation first.
    Upcast,
    /// Null-as-False fallback; results are flagged approximate.
    NullAsFalse,
};

[[nodiscard]] auto to_string(BooleanStrategy strategy) -> std::string_view;

/// Pick the strategy from the adapter's capability flags and the config.
/// Fails with UnsupportedOperation when no exact path exists and approximation
/// is disabled.
[[nodiscard]] auto choose_boolean_strategy(bool nullable_boolean, bool boolean_upcast,
                                           const Config& config, std::string_view backend)
    -> Result<BooleanStrategy>;

/// True when the expression produces or combines booleans that may be null
/// (comparisons, logic, not, any/all reductions).
[[nodiscard]] auto needs_nullable_boolean(const ir::Expr& expr) -> bool;

// ─── Group keys ───────────────────────────────────────────────────────────────

/// What a native engine does with null group keys.
enum class NullKeyPolicy : std::uint8_t {
    OwnGroup,
    Dropped,
};

/// True when the native policy differs from what was asked for: null keys
/// form their own group unless drop_null_keys is set.
[[nodiscard]] constexpr auto null_keys_diverge(NullKeyPolicy native, bool drop_null_keys) noexcept
    -> bool {
    return (native == NullKeyPolicy::Dropped) != drop_null_keys;
}

// ─── Aggregations ─────────────────────────────────────────────────────────────

/// Result of an aggregation over zero non-null values, given the row count.
///
/// sum, mean, min, max, median, std and var give null; count gives 0; len gives
/// the row count; n_unique gives 1 when every row is null (null counts as a
/// value) and 0 for no rows; any gives False; all gives True.
[[nodiscard]] auto degenerate_aggregate(ir::AggKind kind, std::size_t rows) -> Scalar;

/// std/var are defined only when count - ddof > 0.
[[nodiscard]] constexpr auto dispersion_defined(std::size_t count, int ddof) noexcept -> bool {
    return static_cast<std::int64_t>(count) - ddof > 0;
}

// ─── Arithmetic ───────────────────────────────────────────────────────────────
// Floor semantics: the quotient rounds toward -inf and the remainder takes
// the sign of the divisor.

/// Integer floor division; null (nullopt) on division by zero.
[[nodiscard]] auto floordiv(std::int64_t lhs, std::int64_t rhs) noexcept
    -> std::optional<std::int64_t>;
[[nodiscard]] auto mod(std::int64_t lhs, std::int64_t rhs) noexcept -> std::optional<std::int64_t>;

/// IEEE floor division: x // 0 is +-inf or NaN.
[[nodiscard]] auto floordiv(double lhs, double rhs) noexcept -> double;
/// IEEE floor modulus: x % 0 is NaN.
[[nodiscard]] auto mod(double lhs, double rhs) noexcept -> double;

// ─── Dtype inference ──────────────────────────────────────────────────────────

/// Static result dtype of an expanded expression against `schema`.
///
/// Every adapter casts native results to this dtype, so the same expression
/// reports the same schema everywhere. Fails with DtypeMismatch for operand
/// types the operation does not accept and ColumnNotFound for unknown columns.
[[nodiscard]] auto infer_dtype(const ir::Expr& expr, const Schema& schema) -> Result<DType>;

/// Dtype the operands of a binary op are brought to before evaluation
/// (weak literals adopt the other side). Comparisons use it as the compare type.
[[nodiscard]] auto operand_dtype(const ir::BinaryOp& op, const Schema& schema) -> Result<DType>;

}  // namespace tessera::normalize
