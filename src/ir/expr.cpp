#include <tessera/ir/expr.hpp>

namespace tessera {

using ir::AggKind;
using ir::BinaryKind;
using ir::UnaryKind;
using ir::WindowKind;

// ─── NameOps ──────────────────────────────────────────────────────────────────

auto NameOps::keep() const -> Expr {
    return Expr(ir::name_map(node_, ir::NameMapping::Keep));
}

auto NameOps::to_uppercase() const -> Expr {
    return Expr(ir::name_map(node_, ir::NameMapping::ToUppercase));
}

auto NameOps::to_lowercase() const -> Expr {
    return Expr(ir::name_map(node_, ir::NameMapping::ToLowercase));
}

auto NameOps::prefix(std::string prefix) const -> Expr {
    return Expr(ir::name_map(node_, ir::NameMapping::Prefix, std::move(prefix)));
}

auto NameOps::suffix(std::string suffix) const -> Expr {
    return Expr(ir::name_map(node_, ir::NameMapping::Suffix, std::move(suffix)));
}

// ─── Expr ─────────────────────────────────────────────────────────────────────

Expr::Expr(int value) : node_(ir::literal(static_cast<std::int64_t>(value))) {}
Expr::Expr(std::int64_t value) : node_(ir::literal(value)) {}
Expr::Expr(double value) : node_(ir::literal(value)) {}
Expr::Expr(bool value) : node_(ir::literal(value)) {}
Expr::Expr(const char* value) : node_(ir::literal(std::string(value))) {}

auto Expr::alias(std::string name) const -> Expr {
    return Expr(ir::alias(node_, std::move(name)));
}

auto Expr::cast(DType dtype) const -> Expr {
    return Expr(ir::cast(node_, std::move(dtype)));
}

auto Expr::is_null() const -> Expr {
    return Expr(ir::unary(UnaryKind::IsNull, node_));
}

auto Expr::is_not_null() const -> Expr {
    return Expr(ir::unary(UnaryKind::IsNotNull, node_));
}

auto Expr::abs() const -> Expr {
    return Expr(ir::unary(UnaryKind::Abs, node_));
}

auto Expr::sqrt() const -> Expr {
    return Expr(ir::unary(UnaryKind::Sqrt, node_));
}

auto Expr::exp() const -> Expr {
    return Expr(ir::unary(UnaryKind::Exp, node_));
}

auto Expr::log(double base) const -> Expr {
    return Expr(ir::unary(UnaryKind::Log, node_, {.base = base}));
}

auto Expr::round(int decimals) const -> Expr {
    return Expr(ir::unary(UnaryKind::Round, node_, {.decimals = decimals}));
}

auto Expr::clip(Scalar lower, Scalar upper) const -> Expr {
    return Expr(ir::unary(UnaryKind::Clip, node_,
                          {.lower = std::move(lower), .upper = std::move(upper)}));
}

auto Expr::floordiv(const Expr& rhs) const -> Expr {
    return Expr(ir::binary(BinaryKind::FloorDiv, node_, rhs.node_));
}

auto Expr::pow(const Expr& rhs) const -> Expr {
    return Expr(ir::binary(BinaryKind::Pow, node_, rhs.node_));
}

auto Expr::xor_(const Expr& rhs) const -> Expr {
    return Expr(ir::binary(BinaryKind::Xor, node_, rhs.node_));
}

auto Expr::agg(AggKind kind, ir::AggOptions options) const -> Expr {
    return Expr(ir::aggregation(kind, node_, options));
}

auto Expr::sum() const -> Expr { return agg(AggKind::Sum); }
auto Expr::mean() const -> Expr { return agg(AggKind::Mean); }
auto Expr::min() const -> Expr { return agg(AggKind::Min); }
auto Expr::max() const -> Expr { return agg(AggKind::Max); }
auto Expr::count() const -> Expr { return agg(AggKind::Count); }
auto Expr::len() const -> Expr { return agg(AggKind::Len); }
auto Expr::n_unique() const -> Expr { return agg(AggKind::NUnique); }
auto Expr::std(int ddof) const -> Expr { return agg(AggKind::Std, {.ddof = ddof}); }
auto Expr::var(int ddof) const -> Expr { return agg(AggKind::Var, {.ddof = ddof}); }
auto Expr::median() const -> Expr { return agg(AggKind::Median); }
auto Expr::any() const -> Expr { return agg(AggKind::Any); }
auto Expr::all() const -> Expr { return agg(AggKind::All); }

auto Expr::win(WindowKind kind, ir::WindowOptions options) const -> Expr {
    return Expr(ir::window(kind, node_, {}, {}, options));
}

auto Expr::cum_sum(bool reverse) const -> Expr {
    return win(WindowKind::CumSum, {.reverse = reverse});
}

auto Expr::cum_min(bool reverse) const -> Expr {
    return win(WindowKind::CumMin, {.reverse = reverse});
}

auto Expr::cum_max(bool reverse) const -> Expr {
    return win(WindowKind::CumMax, {.reverse = reverse});
}

auto Expr::cum_prod(bool reverse) const -> Expr {
    return win(WindowKind::CumProd, {.reverse = reverse});
}

auto Expr::cum_count(bool reverse) const -> Expr {
    return win(WindowKind::CumCount, {.reverse = reverse});
}

auto Expr::shift(std::int64_t periods) const -> Expr {
    return win(WindowKind::Shift, {.periods = periods});
}

auto Expr::diff(std::int64_t periods) const -> Expr {
    return win(WindowKind::Diff, {.periods = periods});
}

auto Expr::rank(ir::RankMethod method, bool descending) const -> Expr {
    return win(WindowKind::Rank, {.method = method, .descending = descending});
}

auto Expr::rolling(WindowKind kind, std::int64_t window_size,
                   std::optional<std::int64_t> min_samples, bool center, int ddof) const -> Expr {
    return win(kind, {.window_size = window_size,
                      .min_samples = min_samples.value_or(window_size),
                      .center = center,
                      .ddof = ddof});
}

auto Expr::rolling_sum(std::int64_t window_size, std::optional<std::int64_t> min_samples,
                       bool center) const -> Expr {
    return rolling(WindowKind::RollingSum, window_size, min_samples, center, 1);
}

auto Expr::rolling_mean(std::int64_t window_size, std::optional<std::int64_t> min_samples,
                        bool center) const -> Expr {
    return rolling(WindowKind::RollingMean, window_size, min_samples, center, 1);
}

auto Expr::rolling_var(std::int64_t window_size, std::optional<std::int64_t> min_samples,
                       bool center, int ddof) const -> Expr {
    return rolling(WindowKind::RollingVar, window_size, min_samples, center, ddof);
}

auto Expr::rolling_std(std::int64_t window_size, std::optional<std::int64_t> min_samples,
                       bool center, int ddof) const -> Expr {
    return rolling(WindowKind::RollingStd, window_size, min_samples, center, ddof);
}

auto Expr::is_first_distinct() const -> Expr {
    return win(WindowKind::IsFirstDistinct, {});
}

auto Expr::is_last_distinct() const -> Expr {
    return win(WindowKind::IsLastDistinct, {});
}

auto Expr::is_unique() const -> Expr {
    return win(WindowKind::IsUnique, {});
}

auto Expr::over(std::vector<std::string> partition_by, std::vector<std::string> order_by) const
    -> Expr {
    if (const auto* w = std::get_if<ir::WindowFunction>(&node_->node);
        w != nullptr && w->kind != WindowKind::Over && w->partition_by.empty() &&
        w->order_by.empty()) {
        return Expr(ir::window(w->kind, w->operand, std::move(partition_by), std::move(order_by),
                               w->options));
    }
    return Expr(ir::window(WindowKind::Over, node_, std::move(partition_by), std::move(order_by)));
}

// ─── Operators ────────────────────────────────────────────────────────────────

namespace {

auto bin(BinaryKind kind, const Expr& lhs, const Expr& rhs) -> Expr {
    return Expr(ir::binary(kind, lhs.node(), rhs.node()));
}

}  // namespace

auto operator+(const Expr& lhs, const Expr& rhs) -> Expr { return bin(BinaryKind::Add, lhs, rhs); }
auto operator-(const Expr& lhs, const Expr& rhs) -> Expr { return bin(BinaryKind::Sub, lhs, rhs); }
auto operator*(const Expr& lhs, const Expr& rhs) -> Expr { return bin(BinaryKind::Mul, lhs, rhs); }
auto operator/(const Expr& lhs, const Expr& rhs) -> Expr {
    return bin(BinaryKind::TrueDiv, lhs, rhs);
}
auto operator%(const Expr& lhs, const Expr& rhs) -> Expr { return bin(BinaryKind::Mod, lhs, rhs); }
auto operator==(const Expr& lhs, const Expr& rhs) -> Expr { return bin(BinaryKind::Eq, lhs, rhs); }
auto operator!=(const Expr& lhs, const Expr& rhs) -> Expr { return bin(BinaryKind::Ne, lhs, rhs); }
auto operator<(const Expr& lhs, const Expr& rhs) -> Expr { return bin(BinaryKind::Lt, lhs, rhs); }
auto operator<=(const Expr& lhs, const Expr& rhs) -> Expr { return bin(BinaryKind::Le, lhs, rhs); }
auto operator>(const Expr& lhs, const Expr& rhs) -> Expr { return bin(BinaryKind::Gt, lhs, rhs); }
auto operator>=(const Expr& lhs, const Expr& rhs) -> Expr { return bin(BinaryKind::Ge, lhs, rhs); }
auto operator&(const Expr& lhs, const Expr& rhs) -> Expr { return bin(BinaryKind::And, lhs, rhs); }
auto operator|(const Expr& lhs, const Expr& rhs) -> Expr { return bin(BinaryKind::Or, lhs, rhs); }
auto operator^(const Expr& lhs, const Expr& rhs) -> Expr { return bin(BinaryKind::Xor, lhs, rhs); }

auto operator!(const Expr& operand) -> Expr {
    return Expr(ir::unary(UnaryKind::Not, operand.node()));
}

auto operator-(const Expr& operand) -> Expr {
    return Expr(ir::unary(UnaryKind::Negate, operand.node()));
}

// ─── Free constructors ────────────────────────────────────────────────────────

auto col(std::string name) -> Expr {
    return Expr(ir::column(std::move(name)));
}

auto cols(std::vector<std::string> names) -> Expr {
    return Expr(ir::columns(std::move(names)));
}

auto all() -> Expr {
    return Expr(ir::all_columns());
}

auto len() -> Expr {
    return Expr(ir::aggregation(AggKind::Len, nullptr));
}

auto lit(Scalar value) -> Expr {
    return Expr(ir::literal(std::move(value)));
}

auto lit(Scalar value, DType dtype) -> Expr {
    return Expr(ir::literal(std::move(value), std::move(dtype)));
}

auto lit(const char* value) -> Expr {
    return Expr(ir::literal(std::string(value)));
}

namespace {

auto hor(ir::HorizontalKind kind, const std::vector<Expr>& exprs, bool ignore_nulls) -> Expr {
    return Expr(ir::horizontal(kind, nodes(exprs), ignore_nulls));
}

}  // namespace

auto any_horizontal(std::vector<Expr> exprs, bool ignore_nulls) -> Expr {
    return hor(ir::HorizontalKind::Any, exprs, ignore_nulls);
}

auto all_horizontal(std::vector<Expr> exprs, bool ignore_nulls) -> Expr {
    return hor(ir::HorizontalKind::All, exprs, ignore_nulls);
}

auto sum_horizontal(std::vector<Expr> exprs, bool ignore_nulls) -> Expr {
    return hor(ir::HorizontalKind::Sum, exprs, ignore_nulls);
}

auto min_horizontal(std::vector<Expr> exprs, bool ignore_nulls) -> Expr {
    return hor(ir::HorizontalKind::Min, exprs, ignore_nulls);
}

auto max_horizontal(std::vector<Expr> exprs, bool ignore_nulls) -> Expr {
    return hor(ir::HorizontalKind::Max, exprs, ignore_nulls);
}

auto nodes(const std::vector<Expr>& exprs) -> std::vector<ir::ExprPtr> {
    std::vector<ir::ExprPtr> out;
    out.reserve(exprs.size());
    for (const auto& e : exprs) {
        out.push_back(e.node());
    }
    return out;
}

}  // namespace tessera
