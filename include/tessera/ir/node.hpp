#pragma once

#include <tessera/core/scalar.hpp>
#include <tessera/dtype/dtype.hpp>

#include <compare>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tessera::ir {

/// Expression node. Immutable once built and shared between trees.
struct Expr;
using ExprPtr = std::shared_ptr<const Expr>;

/// Reference to a single input column.
struct ColumnRef {
    std::string name;
};

/// Multi-output column leaf: `col({"a", "b"})` or `all()`.
/// Replaced by one ColumnRef per column during expansion.
struct Selection {
    std::vector<std::string> names;
    bool all = false;
};

/// Literal value. Weak literals adopt the dtype of the other operand.
struct Literal {
    Scalar value;
    DType dtype;
    bool weak = true;
};

enum class UnaryKind : std::uint8_t {
    Negate,
    Not,
    IsNull,
    IsNotNull,
    Abs,
    Sqrt,
    Exp,
    /// Logarithm in `options.base`; 0 maps to -inf and negatives to NaN.
    Log,
    /// Round half away from zero to `options.decimals` places.
    Round,
    /// Bound to [lower, upper]; a null bound is open.
    Clip,
};

struct UnaryOptions {
    double base = 2.718281828459045;
    int decimals = 0;
    Scalar lower;
    Scalar upper;
    auto operator==(const UnaryOptions&) const -> bool = default;
};

struct UnaryOp {
    UnaryKind kind = UnaryKind::Negate;
    ExprPtr operand;
    UnaryOptions options;
};

enum class BinaryKind : std::uint8_t {
    Add,
    Sub,
    Mul,
    TrueDiv,
    FloorDiv,
    Mod,
    Pow,
    Eq,
    Ne,
    Lt,
    Le,
    Gt,
    Ge,
    And,
    Or,
    Xor,
};

struct BinaryOp {
    BinaryKind kind = BinaryKind::Add;
    ExprPtr left;
    ExprPtr right;
};

enum class AggKind : std::uint8_t {
    Sum,
    Mean,
    Min,
    Max,
    /// Non-null values.
    Count,
    /// Rows, nulls included.
    Len,
    NUnique,
    Std,
    Var,
    Median,
    Any,
    All,
};

struct AggOptions {
    /// Delta degrees of freedom for std/var.
    int ddof = 1;
    auto operator==(const AggOptions&) const -> bool = default;
};

/// Reduction of a column to one value (per group when grouped).
/// `operand` is null only for a frame-level Len.
struct Aggregation {
    AggKind kind = AggKind::Sum;
    ExprPtr operand;
    AggOptions options;
};

enum class WindowKind : std::uint8_t {
    CumSum,
    CumMin,
    CumMax,
    CumProd,
    CumCount,
    Shift,
    Diff,
    Rank,
    /// Broadcast an aggregating operand over partitions.
    Over,
    RollingSum,
    RollingMean,
    RollingVar,
    RollingStd,
    /// True on the first row of each distinct value, in window order.
    IsFirstDistinct,
    IsLastDistinct,
    /// True where the value occurs exactly once in the partition.
    IsUnique,
};

enum class RankMethod : std::uint8_t {
    Average,
    Min,
    Max,
    Dense,
    Ordinal,
};

struct WindowOptions {
    bool reverse = false;
    /// Shift / diff distance; negative shifts lead.
    std::int64_t periods = 1;
    RankMethod method = RankMethod::Average;
    bool descending = false;
    /// Rolling window length in rows.
    std::int64_t window_size = 1;
    /// Non-null rows a rolling window needs before it yields a value.
    std::int64_t min_samples = 1;
    /// Centre the rolling window on the row instead of ending it there.
    bool center = false;
    int ddof = 1;
    auto operator==(const WindowOptions&) const -> bool = default;
};

struct WindowFunction {
    WindowKind kind = WindowKind::CumSum;
    ExprPtr operand;
    std::vector<std::string> partition_by;
    std::vector<std::string> order_by;
    WindowOptions options;
};

enum class HorizontalKind : std::uint8_t {
    Any,
    All,
    Sum,
    Min,
    Max,
};

/// Row-wise reduction across sibling columns.
struct HorizontalReduction {
    HorizontalKind kind = HorizontalKind::Any;
    std::vector<ExprPtr> operands;
    bool ignore_nulls = true;
};

struct Cast {
    ExprPtr operand;
    DType dtype;
};

struct Alias {
    ExprPtr operand;
    std::string name;
};

enum class NameMapping : std::uint8_t {
    /// Root column name, discarding aliases.
    Keep,
    ToUppercase,
    ToLowercase,
    Prefix,
    Suffix,
};

/// Output name derived from the root column name (the `.name` namespace).
struct NameMap {
    ExprPtr operand;
    NameMapping mapping = NameMapping::Keep;
    std::string affix;
};

struct Expr {
    std::variant<ColumnRef, Selection, Literal, UnaryOp, BinaryOp, Aggregation, WindowFunction,
                 HorizontalReduction, Cast, Alias, NameMap>
        node;
};

/// Node categories, in variant order.
enum class NodeKind : std::uint8_t {
    ColumnRef,
    Selection,
    Literal,
    Unary,
    Binary,
    Aggregation,
    Window,
    Horizontal,
    Cast,
    Alias,
    NameMap,
};

/// (node kind, operator) pair; the unit of an adapter's support set.
/// `op` holds the Unary/Binary/Agg/Window/HorizontalKind value, 0 otherwise.
struct OpKey {
    NodeKind kind = NodeKind::ColumnRef;
    std::uint8_t op = 0;
    auto operator<=>(const OpKey&) const = default;
};

[[nodiscard]] auto kind_of(const Expr& expr) noexcept -> NodeKind;
[[nodiscard]] auto op_key(const Expr& expr) noexcept -> OpKey;

[[nodiscard]] auto to_string(UnaryKind kind) -> std::string_view;
[[nodiscard]] auto to_string(BinaryKind kind) -> std::string_view;
[[nodiscard]] auto to_string(AggKind kind) -> std::string_view;
[[nodiscard]] auto to_string(WindowKind kind) -> std::string_view;
[[nodiscard]] auto to_string(HorizontalKind kind) -> std::string_view;
[[nodiscard]] auto to_string(RankMethod method) -> std::string_view;

/// "binary op 'floordiv'", "window function 'rank'", ...
[[nodiscard]] auto to_string(const OpKey& key) -> std::string;

/// Every OpKey the IR can express.
[[nodiscard]] auto all_operations() -> std::vector<OpKey>;

/// Rolling aggregations over a fixed row frame.
[[nodiscard]] constexpr auto is_rolling(WindowKind kind) noexcept -> bool {
    return kind >= WindowKind::RollingSum && kind <= WindowKind::RollingStd;
}

/// Window kinds whose result depends on row order.
[[nodiscard]] constexpr auto is_ordered(WindowKind kind) noexcept -> bool {
    return kind != WindowKind::Over && kind != WindowKind::Rank && kind != WindowKind::IsUnique;
}

[[nodiscard]] constexpr auto is_comparison(BinaryKind kind) noexcept -> bool {
    return kind >= BinaryKind::Eq && kind <= BinaryKind::Ge;
}

[[nodiscard]] constexpr auto is_logical(BinaryKind kind) noexcept -> bool {
    return kind == BinaryKind::And || kind == BinaryKind::Or || kind == BinaryKind::Xor;
}

[[nodiscard]] constexpr auto is_arithmetic(BinaryKind kind) noexcept -> bool {
    return kind <= BinaryKind::Pow;
}

}  // namespace tessera::ir
