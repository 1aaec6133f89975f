#pragma once

#include <tessera/ir/node.hpp>

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace tessera::ir {

/// Node constructors. Building never touches an engine.

[[nodiscard]] inline auto make(Expr expr) -> ExprPtr {
    return std::make_shared<const Expr>(std::move(expr));
}

[[nodiscard]] inline auto column(std::string name) -> ExprPtr {
    return make(Expr{ColumnRef{.name = std::move(name)}});
}

[[nodiscard]] inline auto columns(std::vector<std::string> names) -> ExprPtr {
    return make(Expr{Selection{.names = std::move(names), .all = false}});
}

[[nodiscard]] inline auto all_columns() -> ExprPtr {
    return make(Expr{Selection{.names = {}, .all = true}});
}

/// Weakly typed literal carrying its natural dtype.
[[nodiscard]] inline auto literal(Scalar value) -> ExprPtr {
    auto dtype = natural_dtype(value);
    return make(Expr{Literal{.value = std::move(value), .dtype = std::move(dtype), .weak = true}});
}

/// Strongly typed literal.
[[nodiscard]] inline auto literal(Scalar value, DType dtype) -> ExprPtr {
    return make(Expr{Literal{.value = std::move(value), .dtype = std::move(dtype), .weak = false}});
}

[[nodiscard]] inline auto unary(UnaryKind kind, ExprPtr operand, UnaryOptions options = {})
    -> ExprPtr {
    return make(Expr{
        UnaryOp{.kind = kind, .operand = std::move(operand), .options = std::move(options)}});
}

[[nodiscard]] inline auto binary(BinaryKind kind, ExprPtr left, ExprPtr right) -> ExprPtr {
    return make(Expr{BinaryOp{.kind = kind, .left = std::move(left), .right = std::move(right)}});
}

[[nodiscard]] inline auto aggregation(AggKind kind, ExprPtr operand, AggOptions options = {})
    -> ExprPtr {
    return make(Expr{Aggregation{.kind = kind, .operand = std::move(operand), .options = options}});
}

[[nodiscard]] inline auto window(WindowKind kind, ExprPtr operand,
                                 std::vector<std::string> partition_by = {},
                                 std::vector<std::string> order_by = {},
                                 WindowOptions options = {}) -> ExprPtr {
    return make(Expr{WindowFunction{.kind = kind,
                                    .operand = std::move(operand),
                                    .partition_by = std::move(partition_by),
                                    .order_by = std::move(order_by),
                                    .options = options}});
}

[[nodiscard]] inline auto horizontal(HorizontalKind kind, std::vector<ExprPtr> operands,
                                     bool ignore_nulls = true) -> ExprPtr {
    return make(Expr{HorizontalReduction{
        .kind = kind, .operands = std::move(operands), .ignore_nulls = ignore_nulls}});
}

[[nodiscard]] inline auto cast(ExprPtr operand, DType dtype) -> ExprPtr {
    return make(Expr{Cast{.operand = std::move(operand), .dtype = std::move(dtype)}});
}

[[nodiscard]] inline auto alias(ExprPtr operand, std::string name) -> ExprPtr {
    return make(Expr{Alias{.operand = std::move(operand), .name = std::move(name)}});
}

[[nodiscard]] inline auto name_map(ExprPtr operand, NameMapping mapping, std::string affix = {})
    -> ExprPtr {
    return make(
        Expr{NameMap{.operand = std::move(operand), .mapping = mapping, .affix = std::move(affix)}});
}

}  // namespace tessera::ir
