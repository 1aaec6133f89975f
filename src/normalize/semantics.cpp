#include <tessera/normalize/semantics.hpp>

#include <fmt/format.h>

#include <cmath>
#include <cstdint>
#include <functional>

namespace tessera::normalize {

using ir::AggKind;
using ir::BinaryKind;
using ir::UnaryKind;
using ir::WindowKind;

auto to_string(BooleanStrategy strategy) -> std::string_view {
    switch (strategy) {
        case BooleanStrategy::Native:
            return "native";
        case BooleanStrategy::Upcast:
            return "upcast";
        case BooleanStrategy::NullAsFalse:
            return "null-as-false";
    }
    return "?";
}

auto choose_boolean_strategy(bool nullable_boolean, bool boolean_upcast, const Config& config,
                             std::string_view backend) -> Result<BooleanStrategy> {
    if (nullable_boolean) {
        return BooleanStrategy::Native;
    }
    if (boolean_upcast && config.upcast_booleans) {
        return BooleanStrategy::Upcast;
    }
    if (config.allow_approximate) {
        return BooleanStrategy::NullAsFalse;
    }
    return make_error(ErrorKind::UnsupportedOperation,
                      fmt::format("nullable boolean logic is not supported by the '{}' backend "
                                  "and approximation is disabled",
                                  backend),
                      std::string(backend));
}

namespace {

auto any_child(const ir::Expr& expr, const std::function<bool(const ir::Expr&)>& pred) -> bool {
    return std::visit(
        [&pred](const auto& node) -> bool {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, ir::BinaryOp>) {
                return pred(*node.left) || pred(*node.right);
            } else if constexpr (std::is_same_v<T, ir::HorizontalReduction>) {
                for (const auto& operand : node.operands) {
                    if (pred(*operand)) {
                        return true;
                    }
                }
                return false;
            } else if constexpr (std::is_same_v<T, ir::ColumnRef> ||
                                 std::is_same_v<T, ir::Selection> ||
                                 std::is_same_v<T, ir::Literal>) {
                return false;
            } else {
                return node.operand != nullptr && pred(*node.operand);
            }
        },
        expr.node);
}

}  // namespace

auto needs_nullable_boolean(const ir::Expr& expr) -> bool {
    if (const auto* bin = std::get_if<ir::BinaryOp>(&expr.node)) {
        if (ir::is_comparison(bin->kind) || ir::is_logical(bin->kind)) {
            return true;
        }
    } else if (const auto* un = std::get_if<ir::UnaryOp>(&expr.node)) {
        if (un->kind == UnaryKind::Not) {
            return true;
        }
    } else if (const auto* agg = std::get_if<ir::Aggregation>(&expr.node)) {
        if (agg->kind == AggKind::Any || agg->kind == AggKind::All) {
            return true;
        }
    } else if (const auto* hor = std::get_if<ir::HorizontalReduction>(&expr.node)) {
        if (hor->kind == ir::HorizontalKind::Any || hor->kind == ir::HorizontalKind::All) {
            return true;
        }
    }
    return any_child(expr, needs_nullable_boolean);
}

auto degenerate_aggregate(AggKind kind, std::size_t rows) -> Scalar {
    switch (kind) {
        case AggKind::Count:
            return std::int64_t{0};
        case AggKind::Len:
            return static_cast<std::int64_t>(rows);
        case AggKind::NUnique:
            return static_cast<std::int64_t>(rows > 0 ? 1 : 0);
        case AggKind::Any:
            return false;
        case AggKind::All:
            return true;
        default:
            return std::monostate{};
    }
}

// ─── Arithmetic ───────────────────────────────────────────────────────────────

auto floordiv(std::int64_t lhs, std::int64_t rhs) noexcept -> std::optional<std::int64_t> {
    if (rhs == 0) {
        return std::nullopt;
    }
    if (rhs == -1) {
        // INT64_MIN / -1 overflows; wrap like the other integer ops.
        return static_cast<std::int64_t>(std::uint64_t{0} - static_cast<std::uint64_t>(lhs));
    }
    std::int64_t q = lhs / rhs;
    if ((lhs % rhs != 0) && ((lhs < 0) != (rhs < 0))) {
        --q;
    }
    return q;
}

auto mod(std::int64_t lhs, std::int64_t rhs) noexcept -> std::optional<std::int64_t> {
    if (rhs == 0) {
        return std::nullopt;
    }
    if (rhs == -1) {
        return std::int64_t{0};
    }
    std::int64_t r = lhs % rhs;
    if (r != 0 && ((r < 0) != (rhs < 0))) {
        r += rhs;
    }
    return r;
}

auto floordiv(double lhs, double rhs) noexcept -> double {
    return std::floor(lhs / rhs);
}

auto mod(double lhs, double rhs) noexcept -> double {
    if (rhs == 0.0) {
        return std::nan("");
    }
    double r = std::fmod(lhs, rhs);
    if (r != 0.0 && ((r < 0.0) != (rhs < 0.0))) {
        r += rhs;
    }
    return r;
}

// ─── Dtype inference ──────────────────────────────────────────────────────────

namespace {

auto mismatch(std::string_view what, const DType& dtype) -> std::unexpected<Error> {
    return make_error(ErrorKind::DtypeMismatch,
                      fmt::format("{} is not defined for {}", what, dtype.to_string()));
}

auto mismatch(std::string_view what, const DType& lhs, const DType& rhs)
    -> std::unexpected<Error> {
    return make_error(ErrorKind::DtypeMismatch,
                      fmt::format("{} is not defined for {} and {}", what, lhs.to_string(),
                                  rhs.to_string()));
}

auto is_orderable(const DType& dtype) -> bool {
    return dtype.is_numeric() || dtype.is<dt::Boolean>() || dtype.is<dt::String>() ||
           dtype.is_temporal() || dtype.is_unknown();
}

auto sum_dtype(std::string_view what, const DType& dtype) -> Result<DType> {
    if (dtype.is<dt::Boolean>() || dtype.is_signed_integer()) {
        return DType::int64();
    }
    if (dtype.is_unsigned_integer()) {
        return DType::uint64();
    }
    if (dtype.is_float() || dtype.is<dt::Duration>() || dtype.is_unknown()) {
        return dtype;
    }
    return mismatch(what, dtype);
}

auto float_dtype(std::string_view what, const DType& dtype) -> Result<DType> {
    if (dtype == DType::float32() || dtype.is_unknown()) {
        return dtype;
    }
    if (dtype.is_numeric() || dtype.is<dt::Boolean>()) {
        return DType::float64();
    }
    return mismatch(what, dtype);
}

auto weak_literal(const ir::Expr& expr) -> const ir::Literal* {
    const auto* lit = std::get_if<ir::Literal>(&expr.node);
    return (lit != nullptr && lit->weak) ? lit : nullptr;
}

/// Dtype a weak literal takes next to a column of `other`.
auto adopt(const DType& other, const ir::Literal& lit) -> std::optional<DType> {
    if (is_null(lit.value)) {
        return other;
    }
    const DType& own = lit.dtype;
    if (own.is_integer() && other.is_numeric()) {
        return other;
    }
    if (own.is_float() && other.is_float()) {
        return other;
    }
    if (own.is<dt::Boolean>() && (other.is<dt::Boolean>() || other.is_numeric())) {
        return other;
    }
    if (own.is_temporal() && other.is<dt::Datetime>()) {
        return other;
    }
    return promote(own, other);
}

}  // namespace

auto operand_dtype(const ir::BinaryOp& op, const Schema& schema) -> Result<DType> {
    auto lhs = infer_dtype(*op.left, schema);
    if (!lhs) {
        return lhs;
    }
    auto rhs = infer_dtype(*op.right, schema);
    if (!rhs) {
        return rhs;
    }
    const auto* weak_l = weak_literal(*op.left);
    const auto* weak_r = weak_literal(*op.right);
    std::optional<DType> out;
    if (weak_l != nullptr && weak_r == nullptr) {
        out = adopt(*rhs, *weak_l);
    } else if (weak_r != nullptr && weak_l == nullptr) {
        out = adopt(*lhs, *weak_r);
    } else {
        out = promote(*lhs, *rhs);
    }
    if (!out) {
        return mismatch(fmt::format("binary op '{}'", ir::to_string(op.kind)), *lhs, *rhs);
    }
    return std::move(*out);
}

namespace {

auto infer_binary(const ir::BinaryOp& op, const Schema& schema) -> Result<DType> {
    auto operands = operand_dtype(op, schema);
    if (!operands) {
        return operands;
    }
    const DType& t = *operands;
    const auto what = fmt::format("binary op '{}'", ir::to_string(op.kind));
    if (ir::is_comparison(op.kind)) {
        if (t.is_nested()) {
            return mismatch(what, t);
        }
        return DType::boolean();
    }
    if (ir::is_logical(op.kind)) {
        if (t.is<dt::Boolean>() || t.is_unknown()) {
            return DType::boolean();
        }
        return mismatch(what, t);
    }
    switch (op.kind) {
        case BinaryKind::TrueDiv:
            return float_dtype(what, t);
        case BinaryKind::Pow:
            if (t.is_numeric() || t.is<dt::Boolean>() || t.is_unknown()) {
                return DType::float64();
            }
            return mismatch(what, t);
        case BinaryKind::Add:
            if (t.is<dt::String>()) {
                return t;
            }
            [[fallthrough]];
        default:
            if (t.is<dt::Boolean>()) {
                return DType::int64();
            }
            if (t.is_numeric() || t.is_unknown()) {
                return t;
            }
            return mismatch(what, t);
    }
}

/// Operand dtype widened by any float bound.
auto clip_dtype(std::string_view what, const DType& t, const ir::UnaryOptions& options)
    -> Result<DType> {
    if (!t.is_numeric() && !t.is_unknown()) {
        return mismatch(what, t);
    }
    DType out = t;
    for (const auto* bound : {&options.lower, &options.upper}) {
        if (is_null(*bound)) {
            continue;
        }
        const ir::Literal literal{.value = *bound, .dtype = natural_dtype(*bound), .weak = true};
        if (!literal.dtype.is_numeric()) {
            return mismatch(what, t, literal.dtype);
        }
        if (out.is_unknown()) {
            continue;
        }
        auto joined = adopt(out, literal);
        if (!joined) {
            return mismatch(what, t, literal.dtype);
        }
        out = std::move(*joined);
    }
    return out;
}

auto infer_unary(const ir::UnaryOp& op, const Schema& schema) -> Result<DType> {
    auto operand = infer_dtype(*op.operand, schema);
    if (!operand) {
        return operand;
    }
    const DType& t = *operand;
    const auto what = fmt::format("unary op '{}'", ir::to_string(op.kind));
    switch (op.kind) {
        case UnaryKind::IsNull:
        case UnaryKind::IsNotNull:
            return DType::boolean();
        case UnaryKind::Not:
            if (t.is<dt::Boolean>() || t.is_unknown()) {
                return DType::boolean();
            }
            return mismatch(what, t);
        case UnaryKind::Negate:
        case UnaryKind::Abs:
            if (t.is_numeric() || t.is<dt::Duration>() || t.is_unknown()) {
                return t;
            }
            return mismatch(what, t);
        case UnaryKind::Sqrt:
        case UnaryKind::Exp:
        case UnaryKind::Log:
            return float_dtype(what, t);
        case UnaryKind::Round:
            if (op.options.decimals < 0) {
                return make_error(ErrorKind::InvalidOperation,
                                  fmt::format("round() takes decimals >= 0, got {}",
                                              op.options.decimals));
            }
            if (t.is_numeric() || t.is_unknown()) {
                return t;
            }
            return mismatch(what, t);
        case UnaryKind::Clip:
            return clip_dtype(what, t, op.options);
    }
    return mismatch(what, t);
}

auto infer_aggregation(const ir::Aggregation& agg, const Schema& schema) -> Result<DType> {
    if (!agg.operand) {
        return DType::int64();
    }
    auto operand = infer_dtype(*agg.operand, schema);
    if (!operand) {
        return operand;
    }
    const DType& t = *operand;
    const auto what = fmt::format("aggregation '{}'", ir::to_string(agg.kind));
    switch (agg.kind) {
        case AggKind::Sum:
            return sum_dtype(what, t);
        case AggKind::Mean:
        case AggKind::Median:
        case AggKind::Std:
        case AggKind::Var:
            return float_dtype(what, t);
        case AggKind::Min:
        case AggKind::Max:
            if (is_orderable(t)) {
                return t;
            }
            return mismatch(what, t);
        case AggKind::Count:
        case AggKind::Len:
        case AggKind::NUnique:
            return DType::int64();
        case AggKind::Any:
        case AggKind::All:
            if (t.is<dt::Boolean>() || t.is_unknown()) {
                return DType::boolean();
            }
            return mismatch(what, t);
    }
    return mismatch(what, t);
}

auto infer_window(const ir::WindowFunction& win, const Schema& schema) -> Result<DType> {
    auto operand = infer_dtype(*win.operand, schema);
    if (!operand) {
        return operand;
    }
    const DType& t = *operand;
    const auto what = fmt::format("window function '{}'", ir::to_string(win.kind));
    if (ir::is_rolling(win.kind)) {
        const auto& opts = win.options;
        if (opts.window_size < 1 || opts.min_samples < 1 || opts.min_samples > opts.window_size) {
            return make_error(ErrorKind::InvalidOperation,
                              fmt::format("{} needs 1 <= min_samples <= window_size, got {} and {}",
                                          what, opts.min_samples, opts.window_size));
        }
    }
    switch (win.kind) {
        case WindowKind::CumSum:
        case WindowKind::CumProd:
            return sum_dtype(what, t);
        case WindowKind::CumMin:
        case WindowKind::CumMax:
            if (is_orderable(t)) {
                return t;
            }
            return mismatch(what, t);
        case WindowKind::CumCount:
            return DType::int64();
        case WindowKind::Shift:
        case WindowKind::Over:
            return t;
        case WindowKind::Diff:
            if (t.is_unsigned_integer()) {
                return DType::int64();
            }
            if (t.is_numeric() || t.is_unknown()) {
                return t;
            }
            return mismatch(what, t);
        case WindowKind::Rank:
            if (!is_orderable(t)) {
                return mismatch(what, t);
            }
            return win.options.method == ir::RankMethod::Average ? DType::float64()
                                                                  : DType::int64();
        case WindowKind::RollingSum:
            return sum_dtype(what, t);
        case WindowKind::RollingMean:
        case WindowKind::RollingVar:
        case WindowKind::RollingStd:
            return float_dtype(what, t);
        case WindowKind::IsFirstDistinct:
        case WindowKind::IsLastDistinct:
        case WindowKind::IsUnique:
            if (t.is_nested()) {
                return mismatch(what, t);
            }
            return DType::boolean();
    }
    return mismatch(what, t);
}

auto infer_horizontal(const ir::HorizontalReduction& hor, const Schema& schema)
    -> Result<DType> {
    const auto what = fmt::format("horizontal reduction '{}'", ir::to_string(hor.kind));
    std::optional<DType> acc;
    for (const auto& operand : hor.operands) {
        auto t = infer_dtype(*operand, schema);
        if (!t) {
            return t;
        }
        if (!acc) {
            acc = std::move(*t);
            continue;
        }
        auto joined = promote(*acc, *t);
        if (!joined) {
            return mismatch(what, *acc, *t);
        }
        acc = std::move(*joined);
    }
    if (!acc) {
        return make_error(ErrorKind::InvalidOperation, fmt::format("{} has no operands", what));
    }
    switch (hor.kind) {
        case ir::HorizontalKind::Any:
        case ir::HorizontalKind::All:
            if (acc->is<dt::Boolean>() || acc->is_unknown()) {
                return DType::boolean();
            }
            return mismatch(what, *acc);
        case ir::HorizontalKind::Sum:
            if (acc->is<dt::Boolean>()) {
                return DType::int64();
            }
            if (acc->is_numeric() || acc->is_unknown()) {
                return *acc;
            }
            return mismatch(what, *acc);
        case ir::HorizontalKind::Min:
        case ir::HorizontalKind::Max:
            if (is_orderable(*acc)) {
                return *acc;
            }
            return mismatch(what, *acc);
    }
    return mismatch(what, *acc);
}

}  // namespace

auto infer_dtype(const ir::Expr& expr, const Schema& schema) -> Result<DType> {
    return std::visit(
        [&schema](const auto& node) -> Result<DType> {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, ir::ColumnRef>) {
                if (const auto* dtype = schema.find(node.name)) {
                    return *dtype;
                }
                return make_error(ErrorKind::ColumnNotFound,
                                  fmt::format("column '{}' not found", node.name));
            } else if constexpr (std::is_same_v<T, ir::Selection>) {
                return make_error(ErrorKind::InvalidOperation,
                                  "multi-output selection must be expanded before typing");
            } else if constexpr (std::is_same_v<T, ir::Literal>) {
                return is_null(node.value) && node.weak ? DType::unknown() : node.dtype;
            } else if constexpr (std::is_same_v<T, ir::UnaryOp>) {
                return infer_unary(node, schema);
            } else if constexpr (std::is_same_v<T, ir::BinaryOp>) {
                return infer_binary(node, schema);
            } else if constexpr (std::is_same_v<T, ir::Aggregation>) {
                return infer_aggregation(node, schema);
            } else if constexpr (std::is_same_v<T, ir::WindowFunction>) {
                return infer_window(node, schema);
            } else if constexpr (std::is_same_v<T, ir::HorizontalReduction>) {
                return infer_horizontal(node, schema);
            } else if constexpr (std::is_same_v<T, ir::Cast>) {
                auto operand = infer_dtype(*node.operand, schema);
                if (!operand) {
                    return operand;
                }
                return node.dtype;
            } else {
                return infer_dtype(*node.operand, schema);
            }
        },
        expr.node);
}

}  // namespace tessera::normalize
