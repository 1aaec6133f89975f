#pragma once

#include <tessera/core/error.hpp>
#include <tessera/dtype/dtype.hpp>
#include <tessera/ir/node.hpp>

#include <set>
#include <string>
#include <vector>

namespace tessera::ir {

/// Call `fn` on every direct child expression.
template <typename Fn>
void for_each_child(const Expr& expr, Fn&& fn) {
    std::visit(
        [&fn](const auto& node) {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, UnaryOp> || std::is_same_v<T, Aggregation> ||
                          std::is_same_v<T, WindowFunction> || std::is_same_v<T, Cast> ||
                          std::is_same_v<T, Alias> || std::is_same_v<T, NameMap>) {
                if (node.operand) {
                    fn(*node.operand);
                }
            } else if constexpr (std::is_same_v<T, BinaryOp>) {
                fn(*node.left);
                fn(*node.right);
            } else if constexpr (std::is_same_v<T, HorizontalReduction>) {
                for (const auto& operand : node.operands) {
                    fn(*operand);
                }
            }
        },
        expr.node);
}

// ─── Structural queries ───────────────────────────────────────────────────────
// None of these evaluate anything.

/// A plain column, optionally aliased or renamed. Such projections skip lowering.
[[nodiscard]] auto is_column_ref_only(const Expr& expr) -> bool;

/// True when an Aggregation appears outside every window function.
/// Picks the reducing path over the elementwise one.
[[nodiscard]] auto contains_aggregation(const Expr& expr) -> bool;

/// True when the result depends on row order (cumulative, shift, diff, rolling).
[[nodiscard]] auto is_order_dependent(const Expr& expr) -> bool;

/// True when any Selection leaf remains.
[[nodiscard]] auto has_multi_output(const Expr& expr) -> bool;

/// Left-most root column name ignoring aliases; "literal" for a literal root
/// and "len" for a frame-level length.
[[nodiscard]] auto root_name(const Expr& expr) -> std::string;

/// Name the expression's output column receives.
[[nodiscard]] auto output_name(const Expr& expr) -> std::string;

/// Input columns read by the expression, in first-use order. Includes
/// window partition and order keys.
[[nodiscard]] auto referenced_columns(const Expr& expr) -> std::vector<std::string>;

/// Every operation used by the expression.
[[nodiscard]] auto collect_operations(const Expr& expr) -> std::set<OpKey>;

// ─── Expansion ────────────────────────────────────────────────────────────────

/// Replace Selection leaves by one expression per selected column.
///
/// A selection feeding an elementwise chain multiplies the chain; at most one
/// multi-output leaf may do so. Horizontal reductions absorb their expanded
/// operands into a single expression. Unknown columns fail with ColumnNotFound.
[[nodiscard]] auto expand(const ExprPtr& expr, const Schema& schema) -> Result<std::vector<ExprPtr>>;

/// expand() over a list, concatenating the results.
[[nodiscard]] auto expand_all(const std::vector<ExprPtr>& exprs, const Schema& schema)
    -> Result<std::vector<ExprPtr>>;

}  // namespace tessera::ir
