#include "duckdb_adapter.hpp"

#include <tessera/ir/analysis.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <type_traits>

namespace tessera::duckdb_backend {

namespace {

constexpr std::string_view kBackend = "duckdb";

auto native_failure(const std::exception& e) -> std::unexpected<Error> {
    return make_error(ErrorKind::Native, e.what(), std::string(kBackend));
}

auto unit_of(const duckdb::LogicalType& type) -> TimeUnit {
    switch (type.id()) {
        case duckdb::LogicalTypeId::TIMESTAMP_SEC:
            return TimeUnit::Seconds;
        case duckdb::LogicalTypeId::TIMESTAMP_MS:
            return TimeUnit::Milliseconds;
        case duckdb::LogicalTypeId::TIMESTAMP_NS:
            return TimeUnit::Nanoseconds;
        default:
            return TimeUnit::Microseconds;
    }
}

auto double_literal(double value) -> std::string {
    if (std::isnan(value)) {
        return "CAST('NaN' AS DOUBLE)";
    }
    if (std::isinf(value)) {
        return value > 0 ? "CAST('Infinity' AS DOUBLE)" : "CAST('-Infinity' AS DOUBLE)";
    }
    return fmt::format("CAST({} AS DOUBLE)", value);
}

auto string_literal(std::string_view text) -> std::string {
    std::string out = "'";
    for (char c : text) {
        if (c == '\'') {
            out += '\'';
        }
        out += c;
    }
    out += '\'';
    return out;
}

auto cast_sql(const std::string& sql, const DType& dtype) -> Result<std::string> {
    if (dtype.is_unknown()) {
        return sql;
    }
    auto type = sql_type(dtype);
    if (!type) {
        return std::unexpected(type.error());
    }
    return fmt::format("CAST({} AS {})", sql, *type);
}

auto from_value(const duckdb::Value& value) -> Result<Scalar> {
    if (value.IsNull()) {
        return Scalar{};
    }
    const auto& type = value.type();
    switch (type.id()) {
        case duckdb::LogicalTypeId::BOOLEAN:
            return Scalar{duckdb::BooleanValue::Get(value)};
        case duckdb::LogicalTypeId::TINYINT:
        case duckdb::LogicalTypeId::SMALLINT:
        case duckdb::LogicalTypeId::INTEGER:
        case duckdb::LogicalTypeId::BIGINT:
        case duckdb::LogicalTypeId::UTINYINT:
        case duckdb::LogicalTypeId::USMALLINT:
        case duckdb::LogicalTypeId::UINTEGER:
            return Scalar{value.GetValue<std::int64_t>()};
        case duckdb::LogicalTypeId::UBIGINT:
            return Scalar{static_cast<std::int64_t>(value.GetValue<std::uint64_t>())};
        case duckdb::LogicalTypeId::FLOAT:
        case duckdb::LogicalTypeId::DOUBLE:
            return Scalar{value.GetValue<double>()};
        case duckdb::LogicalTypeId::VARCHAR:
            return Scalar{duckdb::StringValue::Get(value)};
        case duckdb::LogicalTypeId::DATE:
            return Scalar{Date{value.GetValueUnsafe<std::int32_t>()}};
        case duckdb::LogicalTypeId::TIMESTAMP:
        case duckdb::LogicalTypeId::TIMESTAMP_SEC:
        case duckdb::LogicalTypeId::TIMESTAMP_MS:
        case duckdb::LogicalTypeId::TIMESTAMP_NS:
        case duckdb::LogicalTypeId::TIMESTAMP_TZ: {
            const auto ticks = value.GetValueUnsafe<std::int64_t>();
            const auto nanos = to_nanos(ticks, unit_of(type));
            if (!nanos) {
                return make_error(ErrorKind::InvalidOperation,
                                  fmt::format("timestamp {}{} overflows nanoseconds", ticks,
                                              unit_suffix(unit_of(type))),
                                  std::string(kBackend));
            }
            return Scalar{Timestamp{*nanos}};
        }
        case duckdb::LogicalTypeId::SQLNULL:
            return Scalar{};
        default:
            break;
    }
    return unsupported(fmt::format("values of DuckDB type {}", type.ToString()), kBackend);
}

// ─── SQL rendering ────────────────────────────────────────────────────────────

auto window_spec(const std::vector<std::string>& partition_by,
                 const std::vector<std::string>& order_by, std::string_view frame = {})
    -> std::string {
    std::vector<std::string> parts;
    if (!partition_by.empty()) {
        std::vector<std::string> cols;
        for (const auto& p : partition_by) {
            cols.push_back(quote_identifier(p));
        }
        parts.push_back(fmt::format("PARTITION BY {}", fmt::join(cols, ", ")));
    }
    if (!order_by.empty()) {
        std::vector<std::string> cols;
        for (const auto& o : order_by) {
            cols.push_back(quote_identifier(o) + " ASC NULLS LAST");
        }
        parts.push_back(fmt::format("ORDER BY {}", fmt::join(cols, ", ")));
    }
    if (!frame.empty()) {
        parts.emplace_back(frame);
    }
    return fmt::format("{}", fmt::join(parts, " "));
}

/// Renders one expanded expression to SQL.
///
/// With `reducing` set aggregates render as plain SQL aggregates (group_by or
/// a reducing select); otherwise they become window aggregates over `window`.
class SqlRenderer {
   public:
    SqlRenderer(const Schema& schema, bool reducing) : schema_(schema), reducing_(reducing) {}

    auto render(const ir::Expr& expr) -> Result<std::string> {
        return std::visit([&](const auto& node) { return render_node(node, expr); }, expr.node);
    }

   private:
    auto dtype(const ir::Expr& expr) const -> Result<DType> {
        return normalize::infer_dtype(expr, schema_);
    }

    auto render_as(const ir::Expr& expr, const DType& target) -> Result<std::string> {
        auto sql = render(expr);
        if (!sql) {
            return sql;
        }
        return cast_sql(*sql, target);
    }

    auto render_node(const ir::ColumnRef& node, const ir::Expr& /*expr*/) -> Result<std::string> {
        if (!schema_.contains(node.name)) {
            return make_error(ErrorKind::ColumnNotFound,
                              fmt::format("column '{}' not found", node.name),
                              std::string(kBackend));
        }
        return quote_identifier(node.name);
    }

    auto render_node(const ir::Selection& /*node*/, const ir::Expr& /*expr*/)
        -> Result<std::string> {
        return make_error(ErrorKind::InvalidOperation,
                          "multi-column selection reached lowering unexpanded",
                          std::string(kBackend));
    }

    auto render_node(const ir::Literal& node, const ir::Expr& /*expr*/) -> Result<std::string> {
        return sql_literal(node.value, node.dtype);
    }

    auto render_node(const ir::UnaryOp& node, const ir::Expr& expr) -> Result<std::string> {
        auto operand = render(*node.operand);
        if (!operand) {
            return operand;
        }
        const auto& x = *operand;
        switch (node.kind) {
            case ir::UnaryKind::Negate:
                return fmt::format("(-{})", x);
            case ir::UnaryKind::Not:
                return fmt::format("(NOT {})", x);
            case ir::UnaryKind::IsNull:
                return fmt::format("({} IS NULL)", x);
            case ir::UnaryKind::IsNotNull:
                return fmt::format("({} IS NOT NULL)", x);
            case ir::UnaryKind::Abs:
                return fmt::format("abs({})", x);
            case ir::UnaryKind::Sqrt:
            case ir::UnaryKind::Exp: {
                auto out = dtype(expr);
                if (!out) {
                    return std::unexpected(out.error());
                }
                auto value = cast_sql(x, *out);
                if (!value) {
                    return value;
                }
                if (node.kind == ir::UnaryKind::Exp) {
                    return fmt::format("exp({})", *value);
                }
                // sqrt of a negative number is NaN, not an error.
                return fmt::format("CASE WHEN {0} < 0 THEN CAST('NaN' AS DOUBLE) ELSE sqrt({0}) END",
                                   *value);
            }
            case ir::UnaryKind::Log: {
                auto value = cast_sql(x, DType::float64());
                if (!value) {
                    return value;
                }
                auto base = sql_literal(std::log(node.options.base), DType::float64());
                if (!base) {
                    return base;
                }
                return fmt::format(
                    "CASE WHEN {0} < 0 THEN CAST('NaN' AS DOUBLE) WHEN {0} = 0 THEN "
                    "CAST('-inf' AS DOUBLE) ELSE ln({0}) / {1} END",
                    *value, *base);
            }
            case ir::UnaryKind::Round: {
                auto out = dtype(expr);
                if (!out) {
                    return std::unexpected(out.error());
                }
                if (!out->is_float()) {
                    return x;
                }
                return fmt::format("round({}, {})", x, node.options.decimals);
            }
            case ir::UnaryKind::Clip:
                return render_clip(node, expr, x);
        }
        return unsupported(fmt::format("unary op '{}'", ir::to_string(node.kind)), kBackend);
    }

    auto render_node(const ir::BinaryOp& node, const ir::Expr& expr) -> Result<std::string> {
        auto operand = normalize::operand_dtype(node, schema_);
        if (!operand) {
            return std::unexpected(operand.error());
        }
        auto out = dtype(expr);
        if (!out) {
            return std::unexpected(out.error());
        }
        const bool arithmetic = ir::is_arithmetic(node.kind);
        const DType work = arithmetic && !operand->is<dt::String>() ? *out : *operand;
        auto l = render_as(*node.left, work);
        if (!l) {
            return l;
        }
        auto r = render_as(*node.right, work);
        if (!r) {
            return r;
        }
        // IEEE division: x / 0 is +-inf or NaN.
        auto ieee_div = [](const std::string& a, const std::string& b) {
            return fmt::format("CASE WHEN {1} = 0 THEN {0} * CAST('Infinity' AS DOUBLE) "
                               "ELSE {0} / {1} END",
                               a, b);
        };
        switch (node.kind) {
            case ir::BinaryKind::Add:
                if (work.is<dt::String>()) {
                    return fmt::format("({} || {})", *l, *r);
                }
                return fmt::format("({} + {})", *l, *r);
            case ir::BinaryKind::Sub:
                return fmt::format("({} - {})", *l, *r);
            case ir::BinaryKind::Mul:
                return fmt::format("({} * {})", *l, *r);
            case ir::BinaryKind::TrueDiv:
                return fmt::format("({})", ieee_div(*l, *r));
            case ir::BinaryKind::Pow:
                return fmt::format("pow({}, {})", *l, *r);
            case ir::BinaryKind::FloorDiv:
            case ir::BinaryKind::Mod: {
                auto type = sql_type(work);
                if (!type) {
                    return std::unexpected(type.error());
                }
                if (work.is_integer()) {
                    // Integer division by zero is null. // and % truncate toward
                    // zero; step down when remainder and divisor differ in sign.
                    const auto divisor = fmt::format("NULLIF({}, 0)", *r);
                    const auto remainder = fmt::format("({} % {})", *l, divisor);
                    const auto adjust = fmt::format(
                        "({0} <> 0 AND (({0} < 0) <> ({1} < 0)))", remainder, divisor);
                    if (node.kind == ir::BinaryKind::FloorDiv) {
                        return fmt::format(
                            "(CASE WHEN {1} = -1 THEN (-({0})) ELSE ({0} // {1}) - CAST({2} AS {3}) END)",
                            *l, divisor, adjust, *type);
                    }
                    return fmt::format(
                        "(CASE WHEN {1} = -1 THEN CAST(0 AS {3}) "
                        "WHEN {2} THEN {0} + {1} ELSE {0} END)",
                        remainder, divisor, adjust, *type);
                }
                const auto floored = fmt::format("floor({})", ieee_div(*l, *r));
                if (node.kind == ir::BinaryKind::FloorDiv) {
                    return floored;
                }
                return fmt::format("({} - {} * {})", *l, floored, *r);
            }
            case ir::BinaryKind::Eq:
                return fmt::format("({} = {})", *l, *r);
            case ir::BinaryKind::Ne:
                return fmt::format("({} <> {})", *l, *r);
            case ir::BinaryKind::Lt:
                return fmt::format("({} < {})", *l, *r);
            case ir::BinaryKind::Le:
                return fmt::format("({} <= {})", *l, *r);
            case ir::BinaryKind::Gt:
                return fmt::format("({} > {})", *l, *r);
            case ir::BinaryKind::Ge:
                return fmt::format("({} >= {})", *l, *r);
            case ir::BinaryKind::And:
                return fmt::format("({} AND {})", *l, *r);
            case ir::BinaryKind::Or:
                return fmt::format("({} OR {})", *l, *r);
            case ir::BinaryKind::Xor:
                return fmt::format("({} <> {})", *l, *r);
        }
        return unsupported(fmt::format("binary op '{}'", ir::to_string(node.kind)), kBackend);
    }

    auto render_node(const ir::Aggregation& node, const ir::Expr& /*expr*/)
        -> Result<std::string> {
        std::string x = "*";
        bool boolean_input = false;
        if (node.operand) {
            if (ir::contains_aggregation(*node.operand)) {
                return unsupported("aggregation of an aggregation", kBackend);
            }
            auto operand = render(*node.operand);
            if (!operand) {
                return operand;
            }
            x = std::move(*operand);
            auto in = dtype(*node.operand);
            boolean_input = in.has_value() && in->is<dt::Boolean>();
        }
        // Outside a group_by each aggregate call becomes a window aggregate.
        auto call = [this](const std::string& text) {
            return reducing_ ? text : fmt::format("{} OVER ({})", text, window_);
        };
        const auto as_double = fmt::format("CAST({} AS DOUBLE)", x);
        const auto count = call(fmt::format("count({})", x));
        switch (node.kind) {
            case ir::AggKind::Sum:
                return call(boolean_input ? fmt::format("sum(CAST({} AS BIGINT))", x)
                                          : fmt::format("sum({})", x));
            case ir::AggKind::Mean:
                return call(fmt::format("avg({})", as_double));
            case ir::AggKind::Min:
                return call(fmt::format("min({})", x));
            case ir::AggKind::Max:
                return call(fmt::format("max({})", x));
            case ir::AggKind::Count:
                return fmt::format("COALESCE({}, 0)", count);
            case ir::AggKind::Len:
                return call("count(*)");
            case ir::AggKind::NUnique:
                // Null counts as one distinct value.
                return fmt::format("({} + CASE WHEN {} > {} THEN 1 ELSE 0 END)",
                                   call(fmt::format("count(DISTINCT {})", x)), call("count(*)"),
                                   count);
            case ir::AggKind::Var:
            case ir::AggKind::Std: {
                const int ddof = node.options.ddof;
                auto var = fmt::format("CASE WHEN {0} > {1} THEN {2} * {0} / ({0} - {1}) END",
                                       count, ddof, call(fmt::format("var_pop({})", as_double)));
                if (node.kind == ir::AggKind::Var) {
                    return var;
                }
                return fmt::format("sqrt({})", var);
            }
            case ir::AggKind::Median:
                return call(fmt::format("quantile_cont({}, 0.5)", as_double));
            case ir::AggKind::Any:
                return fmt::format("COALESCE({}, FALSE)", call(fmt::format("bool_or({})", x)));
            case ir::AggKind::All:
                return fmt::format("COALESCE({}, TRUE)", call(fmt::format("bool_and({})", x)));
        }
        return unsupported(fmt::format("aggregation '{}'", ir::to_string(node.kind)), kBackend);
    }

    auto render_node(const ir::WindowFunction& node, const ir::Expr& expr) -> Result<std::string> {
        if (node.kind == ir::WindowKind::Over) {
            SqlRenderer inner(schema_, false);
            inner.window_ = window_spec(node.partition_by, {});
            return inner.render(*node.operand);
        }
        auto out = dtype(expr);
        if (!out) {
            return std::unexpected(out.error());
        }
        auto operand = render(*node.operand);
        if (!operand) {
            return operand;
        }
        const auto& x = *operand;
        const auto& opts = node.options;
        const std::string_view frame = opts.reverse
                                           ? "ROWS BETWEEN CURRENT ROW AND UNBOUNDED FOLLOWING"
                                           : "ROWS BETWEEN UNBOUNDED PRECEDING AND CURRENT ROW";
        const auto spec = window_spec(node.partition_by, node.order_by, frame);
        const auto plain = window_spec(node.partition_by, node.order_by);
        auto keep_nulls = [&x](const std::string& sql) {
            return fmt::format("CASE WHEN {} IS NULL THEN NULL ELSE {} END", x, sql);
        };
        switch (node.kind) {
            case ir::WindowKind::CumSum:
            case ir::WindowKind::CumProd:
            case ir::WindowKind::CumMin:
            case ir::WindowKind::CumMax: {
                auto value = cast_sql(x, *out);
                if (!value) {
                    return value;
                }
                const char* fn = node.kind == ir::WindowKind::CumSum    ? "sum"
                                 : node.kind == ir::WindowKind::CumProd ? "product"
                                 : node.kind == ir::WindowKind::CumMin  ? "min"
                                                                        : "max";
                return keep_nulls(fmt::format("{}({}) OVER ({})", fn, *value, spec));
            }
            case ir::WindowKind::CumCount:
                return fmt::format("count({}) OVER ({})", x, spec);
            case ir::WindowKind::Shift:
            case ir::WindowKind::Diff: {
                const auto periods = opts.periods;
                const auto base = node.kind == ir::WindowKind::Diff ? cast_sql(x, *out)
                                                                     : Result<std::string>(x);
                if (!base) {
                    return base;
                }
                const auto shifted =
                    periods >= 0 ? fmt::format("lag({}, {}) OVER ({})", *base, periods, plain)
                                 : fmt::format("lead({}, {}) OVER ({})", *base, -periods, plain);
                if (node.kind == ir::WindowKind::Shift) {
                    return shifted;
                }
                return fmt::format("({} - {})", *base, shifted);
            }
            case ir::WindowKind::Rank:
                return render_rank(node, x);
            case ir::WindowKind::RollingSum:
            case ir::WindowKind::RollingMean:
            case ir::WindowKind::RollingVar:
            case ir::WindowKind::RollingStd:
                return render_rolling(node, *out, x);
            case ir::WindowKind::IsFirstDistinct:
            case ir::WindowKind::IsLastDistinct:
            case ir::WindowKind::IsUnique:
                return render_distinct(node, x);
            case ir::WindowKind::Over:
                break;
        }
        return unsupported(ir::to_string(ir::op_key(expr)), kBackend);
    }

    /// greatest() and least() skip nulls, so a null input is kept explicitly.
    auto render_clip(const ir::UnaryOp& node, const ir::Expr& expr, const std::string& x)
        -> Result<std::string> {
        auto out = dtype(expr);
        if (!out) {
            return std::unexpected(out.error());
        }
        auto value = cast_sql(x, *out);
        if (!value) {
            return value;
        }
        std::string sql = *value;
        if (!tessera::is_null(node.options.lower)) {
            auto lower = sql_literal(node.options.lower, *out);
            if (!lower) {
                return lower;
            }
            sql = fmt::format("greatest({}, {})", sql, *lower);
        }
        if (!tessera::is_null(node.options.upper)) {
            auto upper = sql_literal(node.options.upper, *out);
            if (!upper) {
                return upper;
            }
            sql = fmt::format("least({}, {})", sql, *upper);
        }
        return fmt::format("CASE WHEN {} IS NULL THEN NULL ELSE {} END", *value, sql);
    }

    /// Null unless the frame holds min_samples non-null values.
    auto render_rolling(const ir::WindowFunction& node, const DType& out, const std::string& x)
        -> Result<std::string> {
        const auto& opts = node.options;
        std::int64_t before = opts.window_size - 1;
        std::int64_t after = 0;
        if (opts.center) {
            after = (opts.window_size - 1) / 2;
            before = opts.window_size - 1 - after;
        }
        const auto frame =
            after == 0
                ? fmt::format("ROWS BETWEEN {} PRECEDING AND CURRENT ROW", before)
                : fmt::format("ROWS BETWEEN {} PRECEDING AND {} FOLLOWING", before, after);
        const auto spec = window_spec(node.partition_by, node.order_by, frame);
        const auto count = fmt::format("count({}) OVER ({})", x, spec);
        const auto as_double = fmt::format("CAST({} AS DOUBLE)", x);
        std::string value;
        switch (node.kind) {
            case ir::WindowKind::RollingSum: {
                auto typed = cast_sql(x, out);
                if (!typed) {
                    return typed;
                }
                value = fmt::format("sum({}) OVER ({})", *typed, spec);
                break;
            }
            case ir::WindowKind::RollingMean:
                value = fmt::format("avg({}) OVER ({})", as_double, spec);
                break;
            default: {
                const int ddof = opts.ddof;
                value = fmt::format(
                    "CASE WHEN {0} > {1} THEN var_pop({2}) OVER ({3}) * {0} / ({0} - {1}) END",
                    count, ddof, as_double, spec);
                if (node.kind == ir::WindowKind::RollingStd) {
                    value = fmt::format("sqrt({})", value);
                }
                break;
            }
        }
        return fmt::format("CASE WHEN {} >= {} THEN {} END", count, opts.min_samples, value);
    }

    /// The value joins the partition keys; null is one more value.
    auto render_distinct(const ir::WindowFunction& node, const std::string& x)
        -> Result<std::string> {
        std::vector<std::string> keys;
        for (const auto& p : node.partition_by) {
            keys.push_back(quote_identifier(p));
        }
        keys.push_back(x);
        const auto part = fmt::format("PARTITION BY {}", fmt::join(keys, ", "));
        if (node.kind == ir::WindowKind::IsUnique) {
            return fmt::format("(count(*) OVER ({}) = 1)", part);
        }
        const bool last = node.kind == ir::WindowKind::IsLastDistinct;
        std::vector<std::string> order;
        for (const auto& o : node.order_by) {
            order.push_back(quote_identifier(o) + (last ? " DESC NULLS FIRST" : " ASC NULLS LAST"));
        }
        return fmt::format("(row_number() OVER ({} ORDER BY {}) = 1)", part,
                           fmt::join(order, ", "));
    }

    auto render_rank(const ir::WindowFunction& node, const std::string& x) -> Result<std::string> {
        // Nulls sit in their own partition and keep a null rank.
        auto partition = node.partition_by;
        std::vector<std::string> cols;
        for (const auto& p : partition) {
            cols.push_back(quote_identifier(p));
        }
        cols.push_back(fmt::format("({} IS NULL)", x));
        const auto part = fmt::format("PARTITION BY {}", fmt::join(cols, ", "));
        const auto order = fmt::format("ORDER BY {} {}", x, node.options.descending ? "DESC" : "ASC");
        const auto min_rank = fmt::format("rank() OVER ({} {})", part, order);
        const auto ties = fmt::format("count(*) OVER ({}, {})", part, x);
        std::string sql;
        switch (node.options.method) {
            case ir::RankMethod::Min:
                sql = min_rank;
                break;
            case ir::RankMethod::Max:
                sql = fmt::format("({} + {} - 1)", min_rank, ties);
                break;
            case ir::RankMethod::Average:
                sql = fmt::format("(({0}) + ({0} + {1} - 1)) / 2.0", min_rank, ties);
                break;
            case ir::RankMethod::Dense:
                sql = fmt::format("dense_rank() OVER ({} {})", part, order);
                break;
            case ir::RankMethod::Ordinal: {
                std::string tie_break;
                for (const auto& o : node.order_by) {
                    tie_break += ", " + quote_identifier(o);
                }
                sql = fmt::format("row_number() OVER ({} {}{})", part, order, tie_break);
                break;
            }
        }
        return fmt::format("CASE WHEN {} IS NULL THEN NULL ELSE {} END", x, sql);
    }

    auto render_node(const ir::HorizontalReduction& node, const ir::Expr& expr)
        -> Result<std::string> {
        auto out = dtype(expr);
        if (!out) {
            return std::unexpected(out.error());
        }
        std::vector<std::string> operands;
        for (const auto& operand : node.operands) {
            auto sql = render_as(*operand, *out);
            if (!sql) {
                return sql;
            }
            operands.push_back(std::move(*sql));
        }
        auto fold = [&](std::string_view op, std::string_view identity) -> std::string {
            if (operands.empty()) {
                return std::string(identity);
            }
            std::vector<std::string> terms;
            for (const auto& o : operands) {
                terms.push_back(node.ignore_nulls ? fmt::format("COALESCE({}, {})", o, identity)
                                                  : o);
            }
            return fmt::format("({})", fmt::join(terms, fmt::format(" {} ", op)));
        };
        switch (node.kind) {
            case ir::HorizontalKind::Any:
                return fold("OR", "FALSE");
            case ir::HorizontalKind::All:
                return fold("AND", "TRUE");
            case ir::HorizontalKind::Sum: {
                auto zero = sql_literal(std::int64_t{0}, *out);
                if (!zero) {
                    return zero;
                }
                return fold("+", *zero);
            }
            case ir::HorizontalKind::Min:
            case ir::HorizontalKind::Max: {
                const char* fn = node.kind == ir::HorizontalKind::Min ? "least" : "greatest";
                auto call = fmt::format("{}({})", fn, fmt::join(operands, ", "));
                if (node.ignore_nulls) {
                    return call;
                }
                std::vector<std::string> checks;
                for (const auto& o : operands) {
                    checks.push_back(fmt::format("{} IS NULL", o));
                }
                return fmt::format("CASE WHEN {} THEN NULL ELSE {} END",
                                   fmt::join(checks, " OR "), call);
            }
        }
        return unsupported("horizontal reduction", kBackend);
    }

    auto render_node(const ir::Cast& node, const ir::Expr& /*expr*/) -> Result<std::string> {
        auto operand = render(*node.operand);
        if (!operand) {
            return operand;
        }
        auto from = dtype(*node.operand);
        if (from && from->is_float() && node.dtype.is_integer()) {
            // DuckDB rounds float-to-int casts; truncate instead.
            return cast_sql(fmt::format("trunc({})", *operand), node.dtype);
        }
        return cast_sql(*operand, node.dtype);
    }

    auto render_node(const ir::Alias& node, const ir::Expr& /*expr*/) -> Result<std::string> {
        return render(*node.operand);
    }

    auto render_node(const ir::NameMap& node, const ir::Expr& /*expr*/) -> Result<std::string> {
        return render(*node.operand);
    }

    const Schema& schema_;
    bool reducing_ = false;
    std::string window_;
};

auto make_capabilities() -> Capabilities {
    Capabilities caps;
    for (const auto& key : ir::all_operations()) {
        caps.supported.insert(key);
    }
    caps.nullable_boolean = true;
    caps.boolean_upcast = false;
    caps.lazy = true;
    caps.partitioned_windows = true;
    caps.ordered_rows = false;
    caps.null_keys = normalize::NullKeyPolicy::OwnGroup;
    return caps;
}

template <typename Fn>
auto guarded(Fn&& fn) -> Result<NativeObject> {
    try {
        return NativeObject(RelationPtr(fn()));
    } catch (const std::exception& e) {
        return native_failure(e);
    }
}

}  // namespace

// ─── Type mapping ─────────────────────────────────────────────────────────────

auto quote_identifier(std::string_view name) -> std::string {
    std::string out = "\"";
    for (char c : name) {
        if (c == '"') {
            out += '"';
        }
        out += c;
    }
    out += '"';
    return out;
}

auto sql_type(const DType& dtype) -> Result<std::string> {
    return std::visit(
        [&dtype](const auto& t) -> Result<std::string> {
            using T = std::decay_t<decltype(t)>;
            if constexpr (std::is_same_v<T, dt::Int>) {
                switch (t.bits) {
                    case 8:
                        return std::string(t.is_signed ? "TINYINT" : "UTINYINT");
                    case 16:
                        return std::string(t.is_signed ? "SMALLINT" : "USMALLINT");
                    case 32:
                        return std::string(t.is_signed ? "INTEGER" : "UINTEGER");
                    default:
                        return std::string(t.is_signed ? "BIGINT" : "UBIGINT");
                }
            } else if constexpr (std::is_same_v<T, dt::Float>) {
                return std::string(t.bits == 32 ? "FLOAT" : "DOUBLE");
            } else if constexpr (std::is_same_v<T, dt::Boolean>) {
                return std::string("BOOLEAN");
            } else if constexpr (std::is_same_v<T, dt::String>) {
                return std::string("VARCHAR");
            } else if constexpr (std::is_same_v<T, dt::Date>) {
                return std::string("DATE");
            } else if constexpr (std::is_same_v<T, dt::Datetime>) {
                if (t.time_zone.has_value()) {
                    return std::string("TIMESTAMPTZ");
                }
                switch (t.unit) {
                    case TimeUnit::Seconds:
                        return std::string("TIMESTAMP_S");
                    case TimeUnit::Milliseconds:
                        return std::string("TIMESTAMP_MS");
                    case TimeUnit::Microseconds:
                        return std::string("TIMESTAMP");
                    case TimeUnit::Nanoseconds:
                        return std::string("TIMESTAMP_NS");
                }
                return std::string("TIMESTAMP");
            } else if constexpr (std::is_same_v<T, dt::List>) {
                auto inner = sql_type(*t.inner);
                if (!inner) {
                    return inner;
                }
                return *inner + "[]";
            } else if constexpr (std::is_same_v<T, dt::Struct>) {
                std::vector<std::string> fields;
                for (const auto& field : t.fields) {
                    auto inner = sql_type(*field.dtype);
                    if (!inner) {
                        return inner;
                    }
                    fields.push_back(fmt::format("{} {}", quote_identifier(field.name), *inner));
                }
                return fmt::format("STRUCT({})", fmt::join(fields, ", "));
            } else {
                // Duration, Unknown
                return unsupported(fmt::format("{} columns", dtype.to_string()), kBackend);
            }
        },
        dtype.variant());
}

auto from_duckdb_type(const duckdb::LogicalType& type) -> Result<DType> {
    using Id = duckdb::LogicalTypeId;
    switch (type.id()) {
        case Id::SQLNULL:
            return DType::unknown();
        case Id::BOOLEAN:
            return DType::boolean();
        case Id::TINYINT:
            return DType::int8();
        case Id::SMALLINT:
            return DType::int16();
        case Id::INTEGER:
            return DType::int32();
        case Id::BIGINT:
            return DType::int64();
        case Id::UTINYINT:
            return DType::uint8();
        case Id::USMALLINT:
            return DType::uint16();
        case Id::UINTEGER:
            return DType::uint32();
        case Id::UBIGINT:
            return DType::uint64();
        case Id::FLOAT:
            return DType::float32();
        case Id::DOUBLE:
            return DType::float64();
        case Id::VARCHAR:
            return DType::string();
        case Id::DATE:
            return DType::date();
        case Id::TIMESTAMP:
        case Id::TIMESTAMP_SEC:
        case Id::TIMESTAMP_MS:
        case Id::TIMESTAMP_NS:
            return DType::datetime(unit_of(type));
        case Id::TIMESTAMP_TZ:
            return DType::datetime(TimeUnit::Microseconds, "UTC");
        case Id::LIST: {
            auto inner = from_duckdb_type(duckdb::ListType::GetChildType(type));
            if (!inner) {
                return inner;
            }
            return DType::list(std::move(*inner));
        }
        case Id::STRUCT: {
            std::vector<std::pair<std::string, DType>> fields;
            for (const auto& [name, child] : duckdb::StructType::GetChildTypes(type)) {
                auto inner = from_duckdb_type(child);
                if (!inner) {
                    return inner;
                }
                fields.emplace_back(name, std::move(*inner));
            }
            return DType::structure(std::move(fields));
        }
        default:
            break;
    }
    return make_error(ErrorKind::UnknownDtype,
                      fmt::format("DuckDB type {} has no dtype mapping", type.ToString()),
                      std::string(kBackend));
}

auto sql_literal(const Scalar& value, const DType& dtype) -> Result<std::string> {
    if (is_null(value)) {
        return cast_sql("NULL", dtype);
    }
    auto natural = std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, bool>) {
                return v ? "TRUE" : "FALSE";
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                return fmt::format("CAST({} AS BIGINT)", v);
            } else if constexpr (std::is_same_v<T, double>) {
                return double_literal(v);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return string_literal(v);
            } else if constexpr (std::is_same_v<T, Date>) {
                return fmt::format("CAST({} AS DATE)", string_literal(format_date(v)));
            } else if constexpr (std::is_same_v<T, Timestamp>) {
                return fmt::format("CAST({} AS TIMESTAMP_NS)", string_literal(format_timestamp(v)));
            } else {
                return "NULL";
            }
        },
        value);
    return cast_sql(natural, dtype);
}

// ─── DuckDbAdapter ────────────────────────────────────────────────────────────

DuckDbAdapter::DuckDbAdapter()
    : database_(std::make_unique<duckdb::DuckDB>(nullptr)),
      connection_(std::make_unique<duckdb::Connection>(*database_)),
      capabilities_(make_capabilities()) {}

DuckDbAdapter::~DuckDbAdapter() = default;

auto DuckDbAdapter::recognizes(const NativeObject& object) const -> bool {
    const auto* relation = std::any_cast<RelationPtr>(&object);
    return relation != nullptr && *relation != nullptr;
}

auto DuckDbAdapter::relation_of(const NativeObject& object) const -> Result<RelationPtr> {
    const auto* relation = std::any_cast<RelationPtr>(&object);
    if (relation == nullptr || !*relation) {
        return make_error(ErrorKind::UnrecognizedNativeType,
                          fmt::format("expected a duckdb::Relation, got {}", object.type().name()),
                          std::string(name()));
    }
    return *relation;
}

auto DuckDbAdapter::schema(const NativeObject& frame) const -> Result<Schema> {
    auto relation = relation_of(frame);
    if (!relation) {
        return std::unexpected(relation.error());
    }
    Schema out;
    try {
        for (const auto& column : (*relation)->Columns()) {
            auto dtype = from_duckdb_type(column.Type());
            if (!dtype) {
                spdlog::debug("[duckdb] column '{}': {}", column.Name(), dtype.error().message);
            }
            out.set(column.Name(), dtype.value_or(DType::unknown()));
        }
    } catch (const std::exception& e) {
        return native_failure(e);
    }
    return out;
}

auto DuckDbAdapter::lower(const ir::Expr& expr, const LoweringContext& context) const
    -> Result<NativeColumn> {
    auto dtype = normalize::infer_dtype(expr, context.schema);
    if (!dtype) {
        return std::unexpected(dtype.error());
    }
    SqlRenderer renderer(context.schema, context.reducing);
    auto sql = renderer.render(expr);
    if (!sql) {
        return std::unexpected(sql.error());
    }
    return NativeColumn(SqlColumn{.sql = std::move(*sql), .dtype = std::move(*dtype)});
}

auto DuckDbAdapter::dtype_of(const NativeColumn& column) const -> Result<DType> {
    if (const auto* sql = std::any_cast<SqlColumn>(&column)) {
        return sql->dtype;
    }
    return make_error(ErrorKind::UnknownDtype,
                      fmt::format("not a DuckDB column: {}", column.type().name()),
                      std::string(name()));
}

auto DuckDbAdapter::select_list(const NativeObject& frame, const Plan& plan, const Schema& schema,
                                bool reducing) const -> Result<std::vector<std::string>> {
    const LoweringContext context{
        .frame = frame, .schema = schema, .boolean = plan.boolean, .reducing = reducing};
    std::vector<std::string> items;
    items.reserve(plan.columns.size());
    for (const auto& planned : plan.columns) {
        auto lowered = lower(*planned.expr, context);
        if (!lowered) {
            return std::unexpected(lowered.error());
        }
        auto dtype = dtype_of(*lowered);
        if (!dtype) {
            return std::unexpected(dtype.error());
        }
        if (!(*dtype == planned.dtype)) {
            spdlog::debug("[duckdb] '{}' lowered as {}, cast to {}", planned.name,
                          dtype->to_string(), planned.dtype.to_string());
        }
        // DuckDB widens some results (SUM of BIGINT is HUGEINT): pin the dtype.
        auto typed = cast_sql(std::any_cast<const SqlColumn&>(*lowered).sql, planned.dtype);
        if (!typed) {
            return std::unexpected(typed.error());
        }
        items.push_back(fmt::format("{} AS {}", *typed, quote_identifier(planned.name)));
    }
    return items;
}

auto DuckDbAdapter::apply_columns(const NativeObject& frame, const Plan& plan, Purpose mode) const
    -> Result<NativeObject> {
    auto relation = relation_of(frame);
    if (!relation) {
        return std::unexpected(relation.error());
    }
    auto input_schema = schema(frame);
    if (!input_schema) {
        return std::unexpected(input_schema.error());
    }
    auto items = select_list(frame, plan, *input_schema, plan.reduces);
    if (!items) {
        return std::unexpected(items.error());
    }

    if (mode == Purpose::WithColumns) {
        // Replaced columns keep their position; new ones go last.
        std::vector<std::string> projection;
        std::vector<bool> used(plan.columns.size(), false);
        for (const auto& [name, dtype] : *input_schema) {
            auto it = std::ranges::find_if(plan.columns,
                                           [&](const PlannedColumn& c) { return c.name == name; });
            if (it == plan.columns.end()) {
                projection.push_back(quote_identifier(name));
                continue;
            }
            const auto index = static_cast<std::size_t>(it - plan.columns.begin());
            used[index] = true;
            projection.push_back((*items)[index]);
        }
        for (std::size_t i = 0; i < items->size(); ++i) {
            if (!used[i]) {
                projection.push_back((*items)[i]);
            }
        }
        *items = std::move(projection);
    }

    const auto list = fmt::format("{}", fmt::join(*items, ", "));
    spdlog::debug("[duckdb] {} {}", plan.reduces ? "aggregate" : "project", list);
    const auto& input = *relation;
    if (plan.reduces) {
        return guarded([&] { return input->Aggregate(list); });
    }
    return guarded([&] { return input->Project(list); });
}

auto DuckDbAdapter::filter(const NativeObject& frame, const Plan& predicate) const
    -> Result<NativeObject> {
    auto relation = relation_of(frame);
    if (!relation) {
        return std::unexpected(relation.error());
    }
    if (predicate.columns.size() != 1) {
        return make_error(ErrorKind::InvalidOperation, "filter takes exactly one predicate");
    }
    auto input_schema = schema(frame);
    if (!input_schema) {
        return std::unexpected(input_schema.error());
    }
    SqlRenderer renderer(*input_schema, false);
    auto sql = renderer.render(*predicate.columns.front().expr);
    if (!sql) {
        return std::unexpected(sql.error());
    }
    spdlog::debug("[duckdb] filter {}", *sql);
    const auto& input = *relation;
    // SQL WHERE already drops rows whose predicate is null.
    return guarded([&] { return input->Filter(*sql); });
}

auto DuckDbAdapter::aggregate(const NativeObject& frame, const std::vector<std::string>& keys,
                              const Plan& plan) const -> Result<NativeObject> {
    auto relation = relation_of(frame);
    if (!relation) {
        return std::unexpected(relation.error());
    }
    auto input_schema = schema(frame);
    if (!input_schema) {
        return std::unexpected(input_schema.error());
    }
    for (const auto& planned : plan.columns) {
        if (std::ranges::find(keys, planned.name) != keys.end()) {
            return make_error(ErrorKind::InvalidOperation,
                              fmt::format("aggregate '{}' collides with a group key", planned.name),
                              std::string(name()));
        }
    }
    auto items = select_list(frame, plan, *input_schema, true);
    if (!items) {
        return std::unexpected(items.error());
    }
    std::vector<std::string> groups;
    std::vector<std::string> list;
    for (const auto& key : keys) {
        groups.push_back(quote_identifier(key));
        list.push_back(quote_identifier(key));
    }
    list.insert(list.end(), items->begin(), items->end());
    const auto select = fmt::format("{}", fmt::join(list, ", "));
    const auto group = fmt::format("{}", fmt::join(groups, ", "));
    spdlog::debug("[duckdb] aggregate {} group by {}", select, group);
    const auto& input = *relation;
    if (keys.empty()) {
        return guarded([&] { return input->Aggregate(select); });
    }
    return guarded([&] { return input->Aggregate(select, group); });
}

auto DuckDbAdapter::sort(const NativeObject& frame, const std::vector<SortKey>& keys) const
    -> Result<NativeObject> {
    auto relation = relation_of(frame);
    if (!relation) {
        return std::unexpected(relation.error());
    }
    if (keys.empty()) {
        return NativeObject(*relation);
    }
    std::vector<std::string> order;
    for (const auto& key : keys) {
        order.push_back(fmt::format("{} {} {}", quote_identifier(key.name),
                                    key.descending ? "DESC" : "ASC",
                                    key.nulls_last ? "NULLS LAST" : "NULLS FIRST"));
    }
    const auto clause = fmt::format("{}", fmt::join(order, ", "));
    const auto& input = *relation;
    return guarded([&] { return input->Order(clause); });
}

auto DuckDbAdapter::from_columns(const FrameData& data) const -> Result<NativeObject> {
    if (data.empty()) {
        return make_error(ErrorKind::InvalidOperation, "a DuckDB relation needs at least one column",
                          std::string(name()));
    }
    const std::size_t rows = data.front().values.size();
    std::vector<std::string> projection;
    std::vector<std::string> seen;
    for (std::size_t c = 0; c < data.size(); ++c) {
        const auto& column = data[c];
        if (std::ranges::find(seen, column.name) != seen.end()) {
            return make_error(ErrorKind::InvalidOperation,
                              fmt::format("duplicate column name '{}'", column.name),
                              std::string(name()));
        }
        seen.push_back(column.name);
        if (column.values.size() != rows) {
            return make_error(ErrorKind::InvalidOperation,
                              fmt::format("column '{}' has {} rows, expected {}", column.name,
                                          column.values.size(), rows),
                              std::string(name()));
        }
        const auto source = rows == 0 ? std::string("NULL") : fmt::format("c{}", c);
        auto typed = cast_sql(source, column.dtype);
        if (!typed) {
            return std::unexpected(typed.error());
        }
        projection.push_back(fmt::format("{} AS {}", *typed, quote_identifier(column.name)));
    }

    std::string sql;
    if (rows == 0) {
        sql = fmt::format("SELECT {} LIMIT 0", fmt::join(projection, ", "));
    } else {
        std::vector<std::string> tuples;
        tuples.reserve(rows);
        for (std::size_t r = 0; r < rows; ++r) {
            std::vector<std::string> cells;
            for (const auto& column : data) {
                auto literal = sql_literal(column.values[r], column.dtype);
                if (!literal) {
                    return std::unexpected(literal.error());
                }
                cells.push_back(std::move(*literal));
            }
            tuples.push_back(fmt::format("({})", fmt::join(cells, ", ")));
        }
        std::vector<std::string> names;
        for (std::size_t c = 0; c < data.size(); ++c) {
            names.push_back(fmt::format("c{}", c));
        }
        sql = fmt::format("SELECT {} FROM (VALUES {}) AS t({})", fmt::join(projection, ", "),
                          fmt::join(tuples, ", "), fmt::join(names, ", "));
    }
    std::scoped_lock lock(mutex_);
    return guarded([&] { return connection_->RelationFromQuery(sql); });
}

auto DuckDbAdapter::to_columns(const NativeObject& frame) const -> Result<FrameData> {
    auto relation = relation_of(frame);
    if (!relation) {
        return std::unexpected(relation.error());
    }
    auto dtypes = schema(frame);
    if (!dtypes) {
        return std::unexpected(dtypes.error());
    }
    FrameData data;
    for (const auto& [column_name, dtype] : *dtypes) {
        data.push_back(ColumnData{.name = column_name, .dtype = dtype, .values = {}});
    }
    try {
        auto result = (*relation)->Execute();
        if (result->HasError()) {
            return native_error(result->GetError());
        }
        for (auto chunk = result->Fetch(); chunk && chunk->size() > 0; chunk = result->Fetch()) {
            for (std::size_t c = 0; c < data.size(); ++c) {
                for (duckdb::idx_t row = 0; row < chunk->size(); ++row) {
                    auto value = from_value(chunk->GetValue(c, row));
                    if (!value) {
                        return std::unexpected(value.error());
                    }
                    data[c].values.push_back(std::move(*value));
                }
            }
        }
    } catch (const std::exception& e) {
        return native_failure(e);
    }
    spdlog::debug("[duckdb] fetched {} row(s)", data.empty() ? 0 : data.front().values.size());
    return data;
}

}  // namespace tessera::duckdb_backend
