#include <tessera/eager/kernels.hpp>

#include <tessera/normalize/kleene.hpp>

#include <fmt/format.h>
#include <robin_hood.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <optional>

namespace tessera::eager {

using ir::AggKind;
using ir::BinaryKind;
using ir::UnaryKind;
using ir::WindowKind;
using normalize::BooleanStrategy;
using normalize::Tri;

namespace {

auto as_int(const Scalar& value) -> std::optional<std::int64_t> {
    if (const auto* v = std::get_if<std::int64_t>(&value)) {
        return *v;
    }
    if (const auto* v = std::get_if<bool>(&value)) {
        return *v ? 1 : 0;
    }
    return std::nullopt;
}

auto as_double(const Scalar& value) -> std::optional<double> {
    if (const auto* v = std::get_if<double>(&value)) {
        return *v;
    }
    if (auto i = as_int(value)) {
        return static_cast<double>(*i);
    }
    return std::nullopt;
}

auto as_tri(const Scalar& value) -> Tri {
    if (const auto* v = std::get_if<bool>(&value)) {
        return *v;
    }
    return std::nullopt;
}

auto from_tri(Tri value) -> Scalar {
    if (!value.has_value()) {
        return std::monostate{};
    }
    return *value;
}

auto at(const Values& values, std::size_t row) -> const Scalar& {
    return values.size() == 1 ? values.front() : values[row];
}

auto broadcast_rows(std::size_t lhs, std::size_t rhs) -> Result<std::size_t> {
    if (lhs == rhs || rhs == 1) {
        return lhs;
    }
    if (lhs == 1) {
        return rhs;
    }
    return make_error(ErrorKind::InvalidOperation,
                      fmt::format("operands have {} and {} rows", lhs, rhs));
}

// Wrapping integer arithmetic: overflow is defined behaviour on the unsigned type.
auto wrap_add(std::int64_t a, std::int64_t b) -> std::int64_t {
    return static_cast<std::int64_t>(static_cast<std::uint64_t>(a) + static_cast<std::uint64_t>(b));
}
auto wrap_sub(std::int64_t a, std::int64_t b) -> std::int64_t {
    return static_cast<std::int64_t>(static_cast<std::uint64_t>(a) - static_cast<std::uint64_t>(b));
}
auto wrap_mul(std::int64_t a, std::int64_t b) -> std::int64_t {
    return static_cast<std::int64_t>(static_cast<std::uint64_t>(a) * static_cast<std::uint64_t>(b));
}

auto arithmetic(BinaryKind kind, const Scalar& lhs, const Scalar& rhs) -> Result<Scalar> {
    if (is_null(lhs) || is_null(rhs)) {
        return std::monostate{};
    }
    const auto* ls = std::get_if<std::string>(&lhs);
    const auto* rs = std::get_if<std::string>(&rhs);
    if (ls != nullptr && rs != nullptr && kind == BinaryKind::Add) {
        return *ls + *rs;
    }
    auto ld = as_double(lhs);
    auto rd = as_double(rhs);
    if (!ld || !rd) {
        return make_error(ErrorKind::DtypeMismatch,
                          fmt::format("binary op '{}' on {} and {}", ir::to_string(kind),
                                      format_scalar(lhs), format_scalar(rhs)));
    }
    if (kind == BinaryKind::TrueDiv) {
        return *ld / *rd;
    }
    if (kind == BinaryKind::Pow) {
        return std::pow(*ld, *rd);
    }
    auto li = as_int(lhs);
    auto ri = as_int(rhs);
    if (li && ri) {
        switch (kind) {
            case BinaryKind::Add:
                return wrap_add(*li, *ri);
            case BinaryKind::Sub:
                return wrap_sub(*li, *ri);
            case BinaryKind::Mul:
                return wrap_mul(*li, *ri);
            case BinaryKind::FloorDiv:
                if (auto q = normalize::floordiv(*li, *ri)) {
                    return *q;
                }
                return std::monostate{};
            case BinaryKind::Mod:
                if (auto r = normalize::mod(*li, *ri)) {
                    return *r;
                }
                return std::monostate{};
            default:
                break;
        }
    } else {
        switch (kind) {
            case BinaryKind::Add:
                return *ld + *rd;
            case BinaryKind::Sub:
                return *ld - *rd;
            case BinaryKind::Mul:
                return *ld * *rd;
            case BinaryKind::FloorDiv:
                return normalize::floordiv(*ld, *rd);
            case BinaryKind::Mod:
                return normalize::mod(*ld, *rd);
            default:
                break;
        }
    }
    return make_error(ErrorKind::InvalidOperation,
                      fmt::format("'{}' is not arithmetic", ir::to_string(kind)));
}

auto comparison(BinaryKind kind, const Scalar& lhs, const Scalar& rhs) -> Tri {
    if (is_null(lhs) || is_null(rhs)) {
        return std::nullopt;
    }
    auto order = compare_values(lhs, rhs);
    switch (kind) {
        case BinaryKind::Eq:
            return order == std::partial_ordering::equivalent;
        case BinaryKind::Ne:
            return order != std::partial_ordering::equivalent;
        case BinaryKind::Lt:
            return order == std::partial_ordering::less;
        case BinaryKind::Le:
            return order == std::partial_ordering::less ||
                   order == std::partial_ordering::equivalent;
        case BinaryKind::Gt:
            return order == std::partial_ordering::greater;
        case BinaryKind::Ge:
            return order == std::partial_ordering::greater ||
                   order == std::partial_ordering::equivalent;
        default:
            return std::nullopt;
    }
}

auto logical(BinaryKind kind, Tri lhs, Tri rhs, BooleanStrategy boolean) -> Tri {
    if (boolean == BooleanStrategy::NullAsFalse) {
        switch (kind) {
            case BinaryKind::And:
                return normalize::fallback_and(lhs, rhs);
            case BinaryKind::Or:
                return normalize::fallback_or(lhs, rhs);
            default:
                return normalize::null_as_false(lhs) != normalize::null_as_false(rhs);
        }
    }
    switch (kind) {
        case BinaryKind::And:
            return normalize::kleene_and(lhs, rhs);
        case BinaryKind::Or:
            return normalize::kleene_or(lhs, rhs);
        default:
            return normalize::strict_xor(lhs, rhs);
    }
}

auto non_null(const Values& values) -> Values {
    Values out;
    out.reserve(values.size());
    std::ranges::copy_if(values, std::back_inserter(out),
                         [](const Scalar& v) { return !is_null(v); });
    return out;
}

auto all_integral(const Values& values) -> bool {
    return std::ranges::all_of(values, [](const Scalar& v) { return as_int(v).has_value(); });
}

auto sum_of(const Values& values) -> Scalar {
    if (all_integral(values)) {
        std::int64_t acc = 0;
        for (const auto& v : values) {
            acc = wrap_add(acc, *as_int(v));
        }
        return acc;
    }
    double acc = 0.0;
    for (const auto& v : values) {
        acc += as_double(v).value_or(0.0);
    }
    return acc;
}

auto doubles_of(const Values& values) -> Result<std::vector<double>> {
    std::vector<double> out;
    out.reserve(values.size());
    for (const auto& v : values) {
        auto d = as_double(v);
        if (!d) {
            return make_error(ErrorKind::DtypeMismatch,
                              fmt::format("expected a number, got {}", format_scalar(v)));
        }
        out.push_back(*d);
    }
    return out;
}

auto extreme(const Values& values, bool want_max) -> Scalar {
    Scalar best = values.front();
    for (std::size_t i = 1; i < values.size(); ++i) {
        auto order = compare_values(values[i], best);
        if (want_max ? order == std::partial_ordering::greater
                     : order == std::partial_ordering::less) {
            best = values[i];
        }
    }
    return best;
}

auto variance(const std::vector<double>& xs, int ddof) -> double {
    const double n = static_cast<double>(xs.size());
    const double mean = std::accumulate(xs.begin(), xs.end(), 0.0) / n;
    double ss = 0.0;
    for (double x : xs) {
        ss += (x - mean) * (x - mean);
    }
    return ss / (n - static_cast<double>(ddof));
}

auto cumulative(const ir::WindowFunction& function, const Values& ordered) -> Result<Values> {
    const std::size_t n = ordered.size();
    Values out(n);
    std::vector<std::size_t> order(n);
    std::iota(order.begin(), order.end(), std::size_t{0});
    if (function.options.reverse) {
        std::ranges::reverse(order);
    }
    std::optional<Scalar> acc;
    std::int64_t count = 0;
    for (auto row : order) {
        const auto& v = ordered[row];
        if (function.kind == WindowKind::CumCount) {
            count += is_null(v) ? 0 : 1;
            out[row] = count;
            continue;
        }
        if (is_null(v)) {
            continue;
        }
        if (!acc) {
            acc = v;
        } else {
            switch (function.kind) {
                case WindowKind::CumSum: {
                    auto next = arithmetic(BinaryKind::Add, *acc, v);
                    if (!next) {
                        return std::unexpected(next.error());
                    }
                    acc = std::move(*next);
                    break;
                }
                case WindowKind::CumProd: {
                    auto next = arithmetic(BinaryKind::Mul, *acc, v);
                    if (!next) {
                        return std::unexpected(next.error());
                    }
                    acc = std::move(*next);
                    break;
                }
                case WindowKind::CumMin:
                    if (compare_values(v, *acc) == std::partial_ordering::less) {
                        acc = v;
                    }
                    break;
                case WindowKind::CumMax:
                    if (compare_values(v, *acc) == std::partial_ordering::greater) {
                        acc = v;
                    }
                    break;
                default:
                    break;
            }
        }
        out[row] = *acc;
    }
    return out;
}

auto logarithm(double x, double base) -> double {
    if (x < 0.0) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    if (x == 0.0) {
        return -std::numeric_limits<double>::infinity();
    }
    return std::log(x) / std::log(base);
}

auto round_half_away(double x, int decimals) -> double {
    if (!std::isfinite(x)) {
        return x;
    }
    const double scale = std::pow(10.0, decimals);
    return std::round(x * scale) / scale;
}

/// `bound` in the representation of `like`.
auto coerce_like(const Scalar& bound, const Scalar& like) -> std::optional<Scalar> {
    if (std::holds_alternative<double>(like)) {
        if (auto d = as_double(bound)) {
            return Scalar{*d};
        }
        return std::nullopt;
    }
    if (auto i = as_int(bound)) {
        return Scalar{*i};
    }
    return std::nullopt;
}

auto clip(const Scalar& v, const ir::UnaryOptions& options) -> Result<Scalar> {
    Scalar out = v;
    if (!is_null(options.lower) && compare_values(out, options.lower) == std::partial_ordering::less) {
        auto bound = coerce_like(options.lower, v);
        if (!bound) {
            return make_error(ErrorKind::DtypeMismatch,
                              fmt::format("clip bound {} does not fit {}",
                                          format_scalar(options.lower), format_scalar(v)));
        }
        out = std::move(*bound);
    }
    if (!is_null(options.upper) &&
        compare_values(out, options.upper) == std::partial_ordering::greater) {
        auto bound = coerce_like(options.upper, v);
        if (!bound) {
            return make_error(ErrorKind::DtypeMismatch,
                              fmt::format("clip bound {} does not fit {}",
                                          format_scalar(options.upper), format_scalar(v)));
        }
        out = std::move(*bound);
    }
    return out;
}

/// Rows [i - before, i + after] of every position, nulls skipped.
auto rolling(const ir::WindowFunction& function, const Values& ordered) -> Result<Values> {
    const auto& opts = function.options;
    const auto n = static_cast<std::int64_t>(ordered.size());
    std::int64_t before = opts.window_size - 1;
    std::int64_t after = 0;
    if (opts.center) {
        after = (opts.window_size - 1) / 2;
        before = opts.window_size - 1 - after;
    }
    Values out(ordered.size());
    Values present;
    for (std::int64_t i = 0; i < n; ++i) {
        present.clear();
        const std::int64_t first = std::max<std::int64_t>(0, i - before);
        const std::int64_t last = std::min<std::int64_t>(n - 1, i + after);
        for (std::int64_t k = first; k <= last; ++k) {
            if (!is_null(ordered[static_cast<std::size_t>(k)])) {
                present.push_back(ordered[static_cast<std::size_t>(k)]);
            }
        }
        if (static_cast<std::int64_t>(present.size()) < opts.min_samples) {
            continue;
        }
        auto& slot = out[static_cast<std::size_t>(i)];
        if (function.kind == WindowKind::RollingSum) {
            slot = sum_of(present);
            continue;
        }
        auto xs = doubles_of(present);
        if (!xs) {
            return std::unexpected(xs.error());
        }
        if (function.kind == WindowKind::RollingMean) {
            slot = std::accumulate(xs->begin(), xs->end(), 0.0) / static_cast<double>(xs->size());
            continue;
        }
        if (!normalize::dispersion_defined(xs->size(), opts.ddof)) {
            continue;
        }
        const double var = variance(*xs, opts.ddof);
        slot = function.kind == WindowKind::RollingStd ? std::sqrt(var) : var;
    }
    return out;
}

/// First (or last) occurrence flags, or occurs-once flags. Null is a value.
auto distinct_flags(WindowKind kind, const Values& ordered) -> Values {
    const std::size_t n = ordered.size();
    Values out(n);
    if (kind == WindowKind::IsUnique) {
        robin_hood::unordered_flat_map<Scalar, std::size_t, ScalarHash> counts;
        counts.reserve(n);
        for (const auto& v : ordered) {
            ++counts[v];
        }
        for (std::size_t i = 0; i < n; ++i) {
            out[i] = counts[ordered[i]] == 1;
        }
        return out;
    }
    robin_hood::unordered_flat_set<Scalar, ScalarHash> seen;
    seen.reserve(n);
    for (std::size_t k = 0; k < n; ++k) {
        const std::size_t i = kind == WindowKind::IsFirstDistinct ? k : n - 1 - k;
        out[i] = seen.insert(ordered[i]).second;
    }
    return out;
}

auto rank(const ir::WindowFunction& function, const Values& ordered) -> Values {
    const auto& opts = function.options;
    Values out(ordered.size());
    std::vector<std::size_t> rows;
    for (std::size_t i = 0; i < ordered.size(); ++i) {
        if (!is_null(ordered[i])) {
            rows.push_back(i);
        }
    }
    auto before = [&](std::size_t a, std::size_t b) {
        auto order = compare_values(ordered[a], ordered[b]);
        return opts.descending ? order == std::partial_ordering::greater
                               : order == std::partial_ordering::less;
    };
    std::ranges::stable_sort(rows, before);

    std::size_t start = 0;
    std::int64_t dense = 0;
    while (start < rows.size()) {
        std::size_t end = start + 1;
        while (end < rows.size() && !before(rows[start], rows[end]) &&
               !before(rows[end], rows[start])) {
            ++end;
        }
        ++dense;
        for (std::size_t k = start; k < end; ++k) {
            Scalar value;
            switch (opts.method) {
                case ir::RankMethod::Average:
                    value = static_cast<double>(start + end + 1) / 2.0;
                    break;
                case ir::RankMethod::Min:
                    value = static_cast<std::int64_t>(start + 1);
                    break;
                case ir::RankMethod::Max:
                    value = static_cast<std::int64_t>(end);
                    break;
                case ir::RankMethod::Dense:
                    value = dense;
                    break;
                case ir::RankMethod::Ordinal:
                    value = static_cast<std::int64_t>(k + 1);
                    break;
            }
            out[rows[k]] = std::move(value);
        }
        start = end;
    }
    return out;
}

}  // namespace

auto compare_values(const Scalar& lhs, const Scalar& rhs) -> std::partial_ordering {
    auto li = as_int(lhs);
    auto ri = as_int(rhs);
    if (li && ri) {
        return *li <=> *ri;
    }
    auto ld = as_double(lhs);
    auto rd = as_double(rhs);
    if (ld && rd) {
        return *ld <=> *rd;
    }
    if (lhs.index() != rhs.index()) {
        return std::partial_ordering::unordered;
    }
    return std::visit(
        [&rhs](const auto& l) -> std::partial_ordering {
            using T = std::decay_t<decltype(l)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return std::partial_ordering::equivalent;
            } else {
                return l <=> std::get<T>(rhs);
            }
        },
        lhs);
}

auto unary(UnaryKind kind, const Values& operand, BooleanStrategy boolean,
           const ir::UnaryOptions& options) -> Result<Values> {
    Values out;
    out.reserve(operand.size());
    for (const auto& v : operand) {
        switch (kind) {
            case UnaryKind::IsNull:
                out.emplace_back(is_null(v));
                continue;
            case UnaryKind::IsNotNull:
                out.emplace_back(!is_null(v));
                continue;
            case UnaryKind::Not:
                if (boolean == BooleanStrategy::NullAsFalse) {
                    out.emplace_back(!normalize::null_as_false(as_tri(v)));
                } else {
                    out.push_back(from_tri(normalize::strict_not(as_tri(v))));
                }
                continue;
            default:
                break;
        }
        if (is_null(v)) {
            out.emplace_back(std::monostate{});
            continue;
        }
        if (kind == UnaryKind::Clip) {
            auto clipped = clip(v, options);
            if (!clipped) {
                return std::unexpected(clipped.error());
            }
            out.push_back(std::move(*clipped));
            continue;
        }
        if (kind == UnaryKind::Round && std::holds_alternative<std::int64_t>(v)) {
            out.push_back(v);
            continue;
        }
        if (kind == UnaryKind::Sqrt || kind == UnaryKind::Exp || kind == UnaryKind::Log ||
            kind == UnaryKind::Round) {
            auto d = as_double(v);
            if (!d) {
                return make_error(ErrorKind::DtypeMismatch,
                                  fmt::format("unary op '{}' on {}", ir::to_string(kind),
                                              format_scalar(v)));
            }
            switch (kind) {
                case UnaryKind::Sqrt:
                    out.emplace_back(std::sqrt(*d));
                    break;
                case UnaryKind::Exp:
                    out.emplace_back(std::exp(*d));
                    break;
                case UnaryKind::Log:
                    out.emplace_back(logarithm(*d, options.base));
                    break;
                default:
                    out.emplace_back(round_half_away(*d, options.decimals));
                    break;
            }
            continue;
        }
        if (const auto* i = std::get_if<std::int64_t>(&v)) {
            std::int64_t negated = wrap_sub(0, *i);
            out.emplace_back(kind == UnaryKind::Abs && *i >= 0 ? *i : negated);
        } else if (const auto* d = std::get_if<double>(&v)) {
            out.emplace_back(kind == UnaryKind::Abs ? std::fabs(*d) : -*d);
        } else {
            return make_error(ErrorKind::DtypeMismatch,
                              fmt::format("unary op '{}' on {}", ir::to_string(kind),
                                          format_scalar(v)));
        }
    }
    return out;
}

auto binary(BinaryKind kind, const Values& lhs, const Values& rhs, BooleanStrategy boolean)
    -> Result<Values> {
    auto rows = broadcast_rows(lhs.size(), rhs.size());
    if (!rows) {
        return std::unexpected(rows.error());
    }
    Values out;
    out.reserve(*rows);
    for (std::size_t i = 0; i < *rows; ++i) {
        const auto& l = at(lhs, i);
        const auto& r = at(rhs, i);
        if (ir::is_comparison(kind)) {
            auto result = comparison(kind, l, r);
            if (boolean == BooleanStrategy::NullAsFalse) {
                out.emplace_back(normalize::null_as_false(result));
            } else {
                out.push_back(from_tri(result));
            }
        } else if (ir::is_logical(kind)) {
            out.push_back(from_tri(logical(kind, as_tri(l), as_tri(r), boolean)));
        } else {
            auto result = arithmetic(kind, l, r);
            if (!result) {
                return std::unexpected(result.error());
            }
            out.push_back(std::move(*result));
        }
    }
    return out;
}

auto horizontal(const ir::HorizontalReduction& reduction, const std::vector<Values>& operands,
                std::size_t rows, BooleanStrategy boolean, const DType& dtype) -> Result<Values> {
    const Scalar zero = dtype.is_float() ? Scalar{0.0} : Scalar{std::int64_t{0}};
    Values out;
    out.reserve(rows);
    std::vector<Tri> tris;
    Values row_values;
    for (std::size_t i = 0; i < rows; ++i) {
        switch (reduction.kind) {
            case ir::HorizontalKind::Any:
            case ir::HorizontalKind::All: {
                tris.clear();
                for (const auto& operand : operands) {
                    Tri t = as_tri(at(operand, i));
                    if (boolean == BooleanStrategy::NullAsFalse) {
                        t = normalize::null_as_false(t);
                    }
                    tris.push_back(t);
                }
                out.push_back(from_tri(reduction.kind == ir::HorizontalKind::Any
                                           ? normalize::horizontal_any(tris, reduction.ignore_nulls)
                                           : normalize::horizontal_all(tris, reduction.ignore_nulls)));
                break;
            }
            case ir::HorizontalKind::Sum:
            case ir::HorizontalKind::Min:
            case ir::HorizontalKind::Max: {
                row_values.clear();
                bool saw_null = false;
                for (const auto& operand : operands) {
                    const auto& v = at(operand, i);
                    if (is_null(v)) {
                        saw_null = true;
                    } else {
                        row_values.push_back(v);
                    }
                }
                if (saw_null && !reduction.ignore_nulls) {
                    out.emplace_back(std::monostate{});
                } else if (reduction.kind == ir::HorizontalKind::Sum) {
                    out.push_back(row_values.empty() ? zero : sum_of(row_values));
                } else if (row_values.empty()) {
                    out.emplace_back(std::monostate{});
                } else {
                    out.push_back(extreme(row_values, reduction.kind == ir::HorizontalKind::Max));
                }
                break;
            }
        }
    }
    return out;
}

auto reduce(const ir::Aggregation& aggregation, const Values& values) -> Result<Scalar> {
    switch (aggregation.kind) {
        case AggKind::Len:
            return static_cast<std::int64_t>(values.size());
        case AggKind::NUnique: {
            robin_hood::unordered_flat_set<Scalar, ScalarHash> seen;
            seen.reserve(values.size());
            for (const auto& v : values) {
                seen.insert(v);
            }
            return static_cast<std::int64_t>(seen.size());
        }
        default:
            break;
    }
    auto present = non_null(values);
    if (aggregation.kind == AggKind::Count) {
        return static_cast<std::int64_t>(present.size());
    }
    if (present.empty()) {
        return normalize::degenerate_aggregate(aggregation.kind, values.size());
    }
    switch (aggregation.kind) {
        case AggKind::Sum:
            return sum_of(present);
        case AggKind::Min:
            return extreme(present, false);
        case AggKind::Max:
            return extreme(present, true);
        case AggKind::Any:
            return std::ranges::any_of(present, [](const Scalar& v) { return as_tri(v) == true; });
        case AggKind::All:
            return std::ranges::all_of(present, [](const Scalar& v) { return as_tri(v) == true; });
        default:
            break;
    }
    auto xs = doubles_of(present);
    if (!xs) {
        return std::unexpected(xs.error());
    }
    switch (aggregation.kind) {
        case AggKind::Mean:
            return std::accumulate(xs->begin(), xs->end(), 0.0) / static_cast<double>(xs->size());
        case AggKind::Median: {
            std::ranges::sort(*xs);
            const std::size_t mid = xs->size() / 2;
            if (xs->size() % 2 == 1) {
                return (*xs)[mid];
            }
            return ((*xs)[mid - 1] + (*xs)[mid]) / 2.0;
        }
        case AggKind::Std:
        case AggKind::Var: {
            if (!normalize::dispersion_defined(xs->size(), aggregation.options.ddof)) {
                return std::monostate{};
            }
            double var = variance(*xs, aggregation.options.ddof);
            return aggregation.kind == AggKind::Std ? std::sqrt(var) : var;
        }
        default:
            break;
    }
    return make_error(ErrorKind::InvalidOperation,
                      fmt::format("aggregation '{}' has no eager kernel",
                                  ir::to_string(aggregation.kind)));
}

auto window(const ir::WindowFunction& function, const Values& ordered) -> Result<Values> {
    const std::size_t n = ordered.size();
    switch (function.kind) {
        case WindowKind::CumSum:
        case WindowKind::CumMin:
        case WindowKind::CumMax:
        case WindowKind::CumProd:
        case WindowKind::CumCount:
            return cumulative(function, ordered);
        case WindowKind::Shift:
        case WindowKind::Diff: {
            const std::int64_t periods = function.options.periods;
            Values out(n);
            for (std::size_t i = 0; i < n; ++i) {
                const std::int64_t src = static_cast<std::int64_t>(i) - periods;
                if (src < 0 || src >= static_cast<std::int64_t>(n)) {
                    continue;
                }
                const auto& prev = ordered[static_cast<std::size_t>(src)];
                if (function.kind == WindowKind::Shift) {
                    out[i] = prev;
                    continue;
                }
                auto delta = arithmetic(BinaryKind::Sub, ordered[i], prev);
                if (!delta) {
                    return std::unexpected(delta.error());
                }
                out[i] = std::move(*delta);
            }
            return out;
        }
        case WindowKind::Rank:
            return rank(function, ordered);
        case WindowKind::RollingSum:
        case WindowKind::RollingMean:
        case WindowKind::RollingVar:
        case WindowKind::RollingStd:
            return rolling(function, ordered);
        case WindowKind::IsFirstDistinct:
        case WindowKind::IsLastDistinct:
        case WindowKind::IsUnique:
            return distinct_flags(function.kind, ordered);
        case WindowKind::Over:
            break;
    }
    return make_error(ErrorKind::InvalidOperation, "over() has no per-partition kernel");
}

}  // namespace tessera::eager
