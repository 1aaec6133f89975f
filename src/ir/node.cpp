#include <tessera/ir/node.hpp>

#include <fmt/format.h>

namespace tessera::ir {

auto kind_of(const Expr& expr) noexcept -> NodeKind {
    return static_cast<NodeKind>(expr.node.index());
}

auto op_key(const Expr& expr) noexcept -> OpKey {
    return std::visit(
        [&expr](const auto& node) -> OpKey {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, UnaryOp>) {
                return {.kind = NodeKind::Unary, .op = static_cast<std::uint8_t>(node.kind)};
            } else if constexpr (std::is_same_v<T, BinaryOp>) {
                return {.kind = NodeKind::Binary, .op = static_cast<std::uint8_t>(node.kind)};
            } else if constexpr (std::is_same_v<T, Aggregation>) {
                return {.kind = NodeKind::Aggregation, .op = static_cast<std::uint8_t>(node.kind)};
            } else if constexpr (std::is_same_v<T, WindowFunction>) {
                return {.kind = NodeKind::Window, .op = static_cast<std::uint8_t>(node.kind)};
            } else if constexpr (std::is_same_v<T, HorizontalReduction>) {
                return {.kind = NodeKind::Horizontal, .op = static_cast<std::uint8_t>(node.kind)};
            } else {
                return {.kind = kind_of(expr), .op = 0};
            }
        },
        expr.node);
}

auto to_string(UnaryKind kind) -> std::string_view {
    switch (kind) {
        case UnaryKind::Negate:
            return "negate";
        case UnaryKind::Not:
            return "not";
        case UnaryKind::IsNull:
            return "is_null";
        case UnaryKind::IsNotNull:
            return "is_not_null";
        case UnaryKind::Abs:
            return "abs";
        case UnaryKind::Sqrt:
            return "sqrt";
        case UnaryKind::Exp:
            return "exp";
        case UnaryKind::Log:
            return "log";
        case UnaryKind::Round:
            return "round";
        case UnaryKind::Clip:
            return "clip";
    }
    return "?";
}

auto to_string(BinaryKind kind) -> std::string_view {
    switch (kind) {
        case BinaryKind::Add:
            return "add";
        case BinaryKind::Sub:
            return "sub";
        case BinaryKind::Mul:
            return "mul";
        case BinaryKind::TrueDiv:
            return "truediv";
        case BinaryKind::FloorDiv:
            return "floordiv";
        case BinaryKind::Mod:
            return "mod";
        case BinaryKind::Pow:
            return "pow";
        case BinaryKind::Eq:
            return "eq";
        case BinaryKind::Ne:
            return "ne";
        case BinaryKind::Lt:
            return "lt";
        case BinaryKind::Le:
            return "le";
        case BinaryKind::Gt:
            return "gt";
        case BinaryKind::Ge:
            return "ge";
        case BinaryKind::And:
            return "and";
        case BinaryKind::Or:
            return "or";
        case BinaryKind::Xor:
            return "xor";
    }
    return "?";
}

auto to_string(AggKind kind) -> std::string_view {
    switch (kind) {
        case AggKind::Sum:
            return "sum";
        case AggKind::Mean:
            return "mean";
        case AggKind::Min:
            return "min";
        case AggKind::Max:
            return "max";
        case AggKind::Count:
            return "count";
        case AggKind::Len:
            return "len";
        case AggKind::NUnique:
            return "n_unique";
        case AggKind::Std:
            return "std";
        case AggKind::Var:
            return "var";
        case AggKind::Median:
            return "median";
        case AggKind::Any:
            return "any";
        case AggKind::All:
            return "all";
    }
    return "?";
}

auto to_string(WindowKind kind) -> std::string_view {
    switch (kind) {
        case WindowKind::CumSum:
            return "cum_sum";
        case WindowKind::CumMin:
            return "cum_min";
        case WindowKind::CumMax:
            return "cum_max";
        case WindowKind::CumProd:
            return "cum_prod";
        case WindowKind::CumCount:
            return "cum_count";
        case WindowKind::Shift:
            return "shift";
        case WindowKind::Diff:
            return "diff";
        case WindowKind::Rank:
            return "rank";
        case WindowKind::Over:
            return "over";
        case WindowKind::RollingSum:
            return "rolling_sum";
        case WindowKind::RollingMean:
            return "rolling_mean";
        case WindowKind::RollingVar:
            return "rolling_var";
        case WindowKind::RollingStd:
            return "rolling_std";
        case WindowKind::IsFirstDistinct:
            return "is_first_distinct";
        case WindowKind::IsLastDistinct:
            return "is_last_distinct";
        case WindowKind::IsUnique:
            return "is_unique";
    }
    return "?";
}

auto to_string(HorizontalKind kind) -> std::string_view {
    switch (kind) {
        case HorizontalKind::Any:
            return "any_horizontal";
        case HorizontalKind::All:
            return "all_horizontal";
        case HorizontalKind::Sum:
            return "sum_horizontal";
        case HorizontalKind::Min:
            return "min_horizontal";
        case HorizontalKind::Max:
            return "max_horizontal";
    }
    return "?";
}

auto to_string(RankMethod method) -> std::string_view {
    switch (method) {
        case RankMethod::Average:
            return "average";
        case RankMethod::Min:
            return "min";
        case RankMethod::Max:
            return "max";
        case RankMethod::Dense:
            return "dense";
        case RankMethod::Ordinal:
            return "ordinal";
    }
    return "?";
}

auto to_string(const OpKey& key) -> std::string {
    switch (key.kind) {
        case NodeKind::ColumnRef:
            return "column reference";
        case NodeKind::Selection:
            return "column selection";
        case NodeKind::Literal:
            return "literal";
        case NodeKind::Unary:
            return fmt::format("unary op '{}'", to_string(static_cast<UnaryKind>(key.op)));
        case NodeKind::Binary:
            return fmt::format("binary op '{}'", to_string(static_cast<BinaryKind>(key.op)));
        case NodeKind::Aggregation:
            return fmt::format("aggregation '{}'", to_string(static_cast<AggKind>(key.op)));
        case NodeKind::Window:
            return fmt::format("window function '{}'", to_string(static_cast<WindowKind>(key.op)));
        case NodeKind::Horizontal:
            return fmt::format("horizontal reduction '{}'",
                               to_string(static_cast<HorizontalKind>(key.op)));
        case NodeKind::Cast:
            return "cast";
        case NodeKind::Alias:
            return "alias";
        case NodeKind::NameMap:
            return "name mapping";
    }
    return "?";
}

auto all_operations() -> std::vector<OpKey> {
    std::vector<OpKey> out;
    auto add_range = [&out](NodeKind kind, std::uint8_t last) {
        for (std::uint8_t op = 0; op <= last; ++op) {
            out.push_back(OpKey{.kind = kind, .op = op});
        }
    };
    out.push_back(OpKey{.kind = NodeKind::ColumnRef});
    out.push_back(OpKey{.kind = NodeKind::Selection});
    out.push_back(OpKey{.kind = NodeKind::Literal});
    add_range(NodeKind::Unary, static_cast<std::uint8_t>(UnaryKind::Clip));
    add_range(NodeKind::Binary, static_cast<std::uint8_t>(BinaryKind::Xor));
    add_range(NodeKind::Aggregation, static_cast<std::uint8_t>(AggKind::All));
    add_range(NodeKind::Window, static_cast<std::uint8_t>(WindowKind::IsUnique));
    add_range(NodeKind::Horizontal, static_cast<std::uint8_t>(HorizontalKind::Max));
    out.push_back(OpKey{.kind = NodeKind::Cast});
    out.push_back(OpKey{.kind = NodeKind::Alias});
    out.push_back(OpKey{.kind = NodeKind::NameMap});
    return out;
}

}  // namespace tessera::ir
