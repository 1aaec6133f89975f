#include "arrow_adapter.hpp"

#include <tessera/ir/analysis.hpp>

#include <arrow/acero/exec_plan.h>
#include <arrow/acero/options.h>
#include <arrow/array/concatenate.h>
#include <arrow/array/util.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <map>
#include <optional>
#include <type_traits>
#include <utility>

namespace tessera::arrow_backend {

namespace cp = arrow::compute;
namespace ac = arrow::acero;

namespace {

constexpr std::string_view kBackend = "arrow";
constexpr std::int64_t kMillisPerDay = 86'400'000;

template <typename T>
auto unwrap(arrow::Result<T> result) -> Result<T> {
    if (!result.ok()) {
        return make_error(ErrorKind::Native, result.status().ToString(), std::string(kBackend));
    }
    return std::move(result).ValueUnsafe();
}

auto unwrap(const arrow::Status& status) -> Result<void> {
    if (!status.ok()) {
        return make_error(ErrorKind::Native, status.ToString(), std::string(kBackend));
    }
    return {};
}

auto arrow_unit(TimeUnit unit) -> arrow::TimeUnit::type {
    switch (unit) {
        case TimeUnit::Seconds:
            return arrow::TimeUnit::SECOND;
        case TimeUnit::Milliseconds:
            return arrow::TimeUnit::MILLI;
        case TimeUnit::Microseconds:
            return arrow::TimeUnit::MICRO;
        case TimeUnit::Nanoseconds:
            return arrow::TimeUnit::NANO;
    }
    return arrow::TimeUnit::MICRO;
}

auto tessera_unit(arrow::TimeUnit::type unit) -> TimeUnit {
    switch (unit) {
        case arrow::TimeUnit::SECOND:
            return TimeUnit::Seconds;
        case arrow::TimeUnit::MILLI:
            return TimeUnit::Milliseconds;
        case arrow::TimeUnit::MICRO:
            return TimeUnit::Microseconds;
        case arrow::TimeUnit::NANO:
            return TimeUnit::Nanoseconds;
    }
    return TimeUnit::Microseconds;
}

// ─── Datum helpers ────────────────────────────────────────────────────────────

auto call(const std::string& function, const std::vector<arrow::Datum>& args,
          const cp::FunctionOptions* options = nullptr) -> Result<arrow::Datum> {
    return unwrap(cp::CallFunction(function, args, options));
}

auto cast_to(const arrow::Datum& value, const std::shared_ptr<arrow::DataType>& type)
    -> Result<arrow::Datum> {
    if (value.type() != nullptr && value.type()->Equals(*type)) {
        return value;
    }
    auto options = cp::CastOptions::Safe(type);
    options.allow_float_truncate = true;
    options.allow_time_truncate = true;
    return unwrap(cp::Cast(value, options));
}

auto cast_to(const arrow::Datum& value, const DType& dtype) -> Result<arrow::Datum> {
    auto type = to_arrow_type(dtype);
    if (!type) {
        return std::unexpected(type.error());
    }
    return cast_to(value, *type);
}

auto typed_scalar(std::int64_t value, const std::shared_ptr<arrow::DataType>& type)
    -> Result<arrow::Datum> {
    return cast_to(arrow::Datum(std::make_shared<arrow::Int64Scalar>(value)), type);
}

/// Floor division or modulus on integers without leaving the integer type.
/// Division by zero is null; x / -1 is a wrapping negation.
auto integer_floor_div_mod(const arrow::Datum& l, const arrow::Datum& r,
                           const std::shared_ptr<arrow::DataType>& type, bool is_signed,
                           bool floordiv) -> Result<arrow::Datum> {
    auto zero = typed_scalar(0, type);
    if (!zero) {
        return zero;
    }
    auto one = typed_scalar(1, type);
    if (!one) {
        return one;
    }
    auto is_zero = call("equal", {r, *zero});
    if (!is_zero) {
        return is_zero;
    }
    arrow::Datum divisor = r;
    std::optional<arrow::Datum> is_minus_one;
    if (is_signed) {
        auto minus_one = typed_scalar(-1, type);
        if (!minus_one) {
            return minus_one;
        }
        auto flag = call("equal", {r, *minus_one});
        if (!flag) {
            return flag;
        }
        auto safe = call("if_else", {*flag, *one, divisor});
        if (!safe) {
            return safe;
        }
        divisor = std::move(*safe);
        is_minus_one = std::move(*flag);
    }
    auto masked = call("if_else", {*is_zero, arrow::Datum(arrow::MakeNullScalar(type)), divisor});
    if (!masked) {
        return masked;
    }
    // Arrow integer division truncates toward zero.
    auto truncated = call("divide", {l, *masked});
    if (!truncated) {
        return truncated;
    }
    if (is_minus_one) {
        auto negated = call("negate", {l});
        if (!negated) {
            return negated;
        }
        truncated = call("if_else", {*is_minus_one, *negated, *truncated});
        if (!truncated) {
            return truncated;
        }
    }
    auto product = call("multiply", {*truncated, r});
    if (!product) {
        return product;
    }
    auto remainder = call("subtract", {l, *product});
    if (!remainder) {
        return remainder;
    }
    if (!is_signed) {
        return floordiv ? *truncated : *remainder;
    }
    // Round toward negative infinity when the remainder and divisor differ in sign.
    auto nonzero = call("not_equal", {*remainder, *zero});
    if (!nonzero) {
        return nonzero;
    }
    auto rem_negative = call("less", {*remainder, *zero});
    if (!rem_negative) {
        return rem_negative;
    }
    auto div_negative = call("less", {r, *zero});
    if (!div_negative) {
        return div_negative;
    }
    auto signs_differ = call("not_equal", {*rem_negative, *div_negative});
    if (!signs_differ) {
        return signs_differ;
    }
    auto adjust = call("and", {*nonzero, *signs_differ});
    if (!adjust) {
        return adjust;
    }
    auto step = cast_to(*adjust, type);
    if (!step) {
        return step;
    }
    if (floordiv) {
        return call("subtract", {*truncated, *step});
    }
    auto shift = call("multiply", {*step, r});
    if (!shift) {
        return shift;
    }
    return call("add", {*remainder, *shift});
}

/// A datum as one contiguous array of `rows` values; scalars broadcast.
auto to_array(const arrow::Datum& value, std::int64_t rows) -> Result<std::shared_ptr<arrow::Array>> {
    if (value.is_scalar()) {
        return unwrap(arrow::MakeArrayFromScalar(*value.scalar(), rows));
    }
    if (value.is_array()) {
        return value.make_array();
    }
    if (value.is_chunked_array()) {
        const auto& chunked = value.chunked_array();
        if (chunked->num_chunks() == 0) {
            return unwrap(arrow::MakeEmptyArray(chunked->type()));
        }
        if (chunked->num_chunks() == 1) {
            return chunked->chunk(0);
        }
        return unwrap(arrow::Concatenate(chunked->chunks()));
    }
    return make_error(ErrorKind::InvalidOperation, "expected a column value",
                      std::string(kBackend));
}

auto to_chunked(const arrow::Datum& value, std::int64_t rows)
    -> Result<std::shared_ptr<arrow::ChunkedArray>> {
    if (value.is_chunked_array()) {
        return value.chunked_array();
    }
    auto array = to_array(value, rows);
    if (!array) {
        return std::unexpected(array.error());
    }
    return std::make_shared<arrow::ChunkedArray>(std::move(*array));
}

auto index_array(const std::vector<std::int64_t>& indices) -> Result<std::shared_ptr<arrow::Array>> {
    arrow::Int64Builder builder;
    if (auto appended = unwrap(builder.AppendValues(indices)); !appended) {
        return std::unexpected(appended.error());
    }
    return unwrap(builder.Finish());
}

auto take(const arrow::Datum& values, const std::shared_ptr<arrow::Array>& indices)
    -> Result<arrow::Datum> {
    return unwrap(cp::Take(values, arrow::Datum(indices)));
}

auto reversed(const std::shared_ptr<arrow::Array>& values) -> Result<std::shared_ptr<arrow::Array>> {
    std::vector<std::int64_t> indices(static_cast<std::size_t>(values->length()));
    for (std::size_t i = 0; i < indices.size(); ++i) {
        indices[i] = static_cast<std::int64_t>(indices.size() - 1 - i);
    }
    auto idx = index_array(indices);
    if (!idx) {
        return std::unexpected(idx.error());
    }
    auto out = take(arrow::Datum(values), *idx);
    if (!out) {
        return std::unexpected(out.error());
    }
    return out->make_array();
}

/// Shift by `periods`, filling vacated slots with null.
auto shifted(const std::shared_ptr<arrow::Array>& values, std::int64_t periods)
    -> Result<std::shared_ptr<arrow::Array>> {
    const std::int64_t n = values->length();
    const std::int64_t gap = std::min(n, periods < 0 ? -periods : periods);
    auto nulls = unwrap(arrow::MakeArrayOfNull(values->type(), gap));
    if (!nulls) {
        return std::unexpected(nulls.error());
    }
    if (periods >= 0) {
        return unwrap(arrow::Concatenate({*nulls, values->Slice(0, n - gap)}));
    }
    return unwrap(arrow::Concatenate({values->Slice(gap), *nulls}));
}

// ─── Scalars ──────────────────────────────────────────────────────────────────

auto natural_arrow_scalar(const Scalar& value) -> std::shared_ptr<arrow::Scalar> {
    return std::visit(
        [](const auto& v) -> std::shared_ptr<arrow::Scalar> {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return arrow::MakeNullScalar(arrow::null());
            } else if constexpr (std::is_same_v<T, bool>) {
                return std::make_shared<arrow::BooleanScalar>(v);
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                return std::make_shared<arrow::Int64Scalar>(v);
            } else if constexpr (std::is_same_v<T, double>) {
                return std::make_shared<arrow::DoubleScalar>(v);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return std::make_shared<arrow::StringScalar>(v);
            } else if constexpr (std::is_same_v<T, Date>) {
                return std::make_shared<arrow::Date32Scalar>(v.days);
            } else {
                return std::make_shared<arrow::TimestampScalar>(
                    v.nanos, arrow::timestamp(arrow::TimeUnit::NANO));
            }
        },
        value);
}

template <typename S>
auto int_value(const arrow::Scalar& s) -> Scalar {
    return static_cast<std::int64_t>(static_cast<const S&>(s).value);
}

auto floor_div(std::int64_t lhs, std::int64_t rhs) -> std::int64_t {
    std::int64_t q = lhs / rhs;
    if ((lhs % rhs != 0) && ((lhs < 0) != (rhs < 0))) {
        --q;
    }
    return q;
}

auto from_arrow_scalar(const arrow::Scalar& s) -> Result<Scalar> {
    if (!s.is_valid) {
        return Scalar{};
    }
    switch (s.type->id()) {
        case arrow::Type::NA:
            return Scalar{};
        case arrow::Type::BOOL:
            return Scalar{static_cast<const arrow::BooleanScalar&>(s).value};
        case arrow::Type::INT8:
            return int_value<arrow::Int8Scalar>(s);
        case arrow::Type::INT16:
            return int_value<arrow::Int16Scalar>(s);
        case arrow::Type::INT32:
            return int_value<arrow::Int32Scalar>(s);
        case arrow::Type::INT64:
            return int_value<arrow::Int64Scalar>(s);
        case arrow::Type::UINT8:
            return int_value<arrow::UInt8Scalar>(s);
        case arrow::Type::UINT16:
            return int_value<arrow::UInt16Scalar>(s);
        case arrow::Type::UINT32:
            return int_value<arrow::UInt32Scalar>(s);
        case arrow::Type::UINT64:
            return int_value<arrow::UInt64Scalar>(s);
        case arrow::Type::FLOAT:
            return Scalar{static_cast<double>(static_cast<const arrow::FloatScalar&>(s).value)};
        case arrow::Type::DOUBLE:
            return Scalar{static_cast<const arrow::DoubleScalar&>(s).value};
        case arrow::Type::STRING:
        case arrow::Type::LARGE_STRING:
            return Scalar{static_cast<const arrow::BaseBinaryScalar&>(s).value->ToString()};
        case arrow::Type::DATE32:
            return Scalar{Date{static_cast<const arrow::Date32Scalar&>(s).value}};
        case arrow::Type::DATE64: {
            const auto ms = static_cast<const arrow::Date64Scalar&>(s).value;
            return Scalar{Date{static_cast<std::int32_t>(floor_div(ms, kMillisPerDay))}};
        }
        case arrow::Type::TIMESTAMP: {
            const auto& type = static_cast<const arrow::TimestampType&>(*s.type);
            const auto ticks = static_cast<const arrow::TimestampScalar&>(s).value;
            const auto unit = tessera_unit(type.unit());
            const auto nanos = to_nanos(ticks, unit);
            if (!nanos) {
                return make_error(ErrorKind::InvalidOperation,
                                  fmt::format("timestamp {}{} overflows nanoseconds", ticks,
                                              unit_suffix(unit)),
                                  std::string(kBackend));
            }
            return Scalar{Timestamp{*nanos}};
        }
        case arrow::Type::DURATION:
            return int_value<arrow::DurationScalar>(s);
        default:
            break;
    }
    return unsupported(fmt::format("values of arrow type {}", s.type->ToString()), kBackend);
}

// ─── Column building ──────────────────────────────────────────────────────────

template <typename Builder, typename Convert>
auto build_values(Builder& builder, const ColumnData& column, Convert convert)
    -> Result<std::shared_ptr<arrow::Array>> {
    for (const auto& value : column.values) {
        if (is_null(value)) {
            if (auto st = unwrap(builder.AppendNull()); !st) {
                return std::unexpected(st.error());
            }
            continue;
        }
        auto converted = convert(value);
        if (!converted) {
            return make_error(ErrorKind::DtypeMismatch,
                              fmt::format("column '{}': value {} does not fit {}", column.name,
                                          format_scalar(value), column.dtype.to_string()),
                              std::string(kBackend));
        }
        if (auto st = unwrap(builder.Append(*converted)); !st) {
            return std::unexpected(st.error());
        }
    }
    return unwrap(builder.Finish());
}

auto as_int(const Scalar& v) -> std::optional<std::int64_t> {
    if (const auto* i = std::get_if<std::int64_t>(&v)) {
        return *i;
    }
    if (const auto* b = std::get_if<bool>(&v)) {
        return *b ? 1 : 0;
    }
    return std::nullopt;
}

auto as_double(const Scalar& v) -> std::optional<double> {
    if (const auto* d = std::get_if<double>(&v)) {
        return *d;
    }
    if (auto i = as_int(v)) {
        return static_cast<double>(*i);
    }
    return std::nullopt;
}

auto build_column(const ColumnData& column) -> Result<std::shared_ptr<arrow::Array>> {
    auto target = to_arrow_type(column.dtype);
    if (!target) {
        return std::unexpected(target.error());
    }
    const auto& dtype = column.dtype;
    Result<std::shared_ptr<arrow::Array>> storage;
    if (dtype.is<dt::Int>() || dtype.is<dt::Duration>()) {
        arrow::Int64Builder builder;
        storage = build_values(builder, column, as_int);
    } else if (dtype.is<dt::Float>()) {
        arrow::DoubleBuilder builder;
        storage = build_values(builder, column, as_double);
    } else if (dtype.is<dt::Boolean>()) {
        arrow::BooleanBuilder builder;
        storage = build_values(builder, column, [](const Scalar& v) -> std::optional<bool> {
            if (const auto* b = std::get_if<bool>(&v)) {
                return *b;
            }
            return std::nullopt;
        });
    } else if (dtype.is<dt::String>()) {
        arrow::StringBuilder builder;
        storage = build_values(builder, column, [](const Scalar& v) -> std::optional<std::string> {
            if (const auto* s = std::get_if<std::string>(&v)) {
                return *s;
            }
            return std::nullopt;
        });
    } else if (dtype.is<dt::Date>()) {
        arrow::Date32Builder builder;
        storage = build_values(builder, column, [](const Scalar& v) -> std::optional<std::int32_t> {
            if (const auto* d = std::get_if<Date>(&v)) {
                return d->days;
            }
            return std::nullopt;
        });
    } else if (dtype.is<dt::Datetime>()) {
        arrow::TimestampBuilder builder(arrow::timestamp(arrow::TimeUnit::NANO),
                                        arrow::default_memory_pool());
        storage = build_values(builder, column, [](const Scalar& v) -> std::optional<std::int64_t> {
            if (const auto* ts = std::get_if<Timestamp>(&v)) {
                return ts->nanos;
            }
            return std::nullopt;
        });
    } else if (dtype.is_unknown()) {
        if (std::ranges::any_of(column.values, [](const Scalar& v) { return !is_null(v); })) {
            return make_error(ErrorKind::DtypeMismatch,
                              fmt::format("column '{}' has Unknown dtype but non-null values",
                                          column.name),
                              std::string(kBackend));
        }
        return unwrap(
            arrow::MakeArrayOfNull(arrow::null(), static_cast<std::int64_t>(column.values.size())));
    } else {
        return unsupported(fmt::format("building {} columns", dtype.to_string()), kBackend);
    }
    if (!storage) {
        return storage;
    }
    auto cast = cast_to(arrow::Datum(*storage), *target);
    if (!cast) {
        return std::unexpected(cast.error());
    }
    return cast->make_array();
}

// ─── Aggregation kernels ──────────────────────────────────────────────────────

struct AggregateKernel {
    std::string function;
    std::shared_ptr<cp::FunctionOptions> options;
};

auto aggregate_kernel(const ir::Aggregation& agg, bool grouped) -> Result<AggregateKernel> {
    const std::string prefix = grouped ? "hash_" : "";
    auto valid_only = std::make_shared<cp::ScalarAggregateOptions>(/*skip_nulls=*/true,
                                                                   /*min_count=*/1);
    auto any_count = std::make_shared<cp::ScalarAggregateOptions>(true, 0);
    switch (agg.kind) {
        case ir::AggKind::Sum:
            return AggregateKernel{prefix + "sum", valid_only};
        case ir::AggKind::Mean:
            return AggregateKernel{prefix + "mean", valid_only};
        case ir::AggKind::Min:
            return AggregateKernel{prefix + "min", valid_only};
        case ir::AggKind::Max:
            return AggregateKernel{prefix + "max", valid_only};
        case ir::AggKind::Count:
            return AggregateKernel{prefix + "count",
                                   std::make_shared<cp::CountOptions>(cp::CountOptions::ONLY_VALID)};
        case ir::AggKind::Len:
            return AggregateKernel{prefix + "count",
                                   std::make_shared<cp::CountOptions>(cp::CountOptions::ALL)};
        case ir::AggKind::NUnique:
            return AggregateKernel{prefix + "count_distinct",
                                   std::make_shared<cp::CountOptions>(cp::CountOptions::ALL)};
        case ir::AggKind::Std:
            return AggregateKernel{prefix + "stddev",
                                   std::make_shared<cp::VarianceOptions>(agg.options.ddof, true, 0)};
        case ir::AggKind::Var:
            return AggregateKernel{prefix + "variance",
                                   std::make_shared<cp::VarianceOptions>(agg.options.ddof, true, 0)};
        case ir::AggKind::Median:
            if (grouped) {
                return unsupported("grouped aggregation 'median'", kBackend);
            }
            return AggregateKernel{"quantile", std::make_shared<cp::QuantileOptions>(
                                                   0.5, cp::QuantileOptions::LINEAR)};
        case ir::AggKind::Any:
            return AggregateKernel{prefix + "any", any_count};
        case ir::AggKind::All:
            return AggregateKernel{prefix + "all", any_count};
    }
    return unsupported(fmt::format("aggregation '{}'", ir::to_string(agg.kind)), kBackend);
}

/// Numeric kernels take booleans as integers (float for mean-like ones).
auto aggregate_input(const arrow::Datum& values, ir::AggKind kind) -> Result<arrow::Datum> {
    if (values.type() == nullptr || values.type()->id() != arrow::Type::BOOL) {
        return values;
    }
    switch (kind) {
        case ir::AggKind::Sum:
            return cast_to(values, arrow::int64());
        case ir::AggKind::Mean:
        case ir::AggKind::Std:
        case ir::AggKind::Var:
        case ir::AggKind::Median:
            return cast_to(values, arrow::float64());
        default:
            return values;
    }
}

/// Peel aliases, renames and casts off a planned aggregate; the planned
/// dtype already records the outer cast.
auto core_aggregation(const ir::Expr& expr) -> const ir::Aggregation* {
    const ir::Expr* e = &expr;
    while (true) {
        if (const auto* agg = std::get_if<ir::Aggregation>(&e->node)) {
            return agg;
        }
        if (const auto* alias = std::get_if<ir::Alias>(&e->node)) {
            e = alias->operand.get();
        } else if (const auto* map = std::get_if<ir::NameMap>(&e->node)) {
            e = map->operand.get();
        } else if (const auto* cast = std::get_if<ir::Cast>(&e->node)) {
            e = cast->operand.get();
        } else {
            return nullptr;
        }
    }
}

auto make_capabilities() -> Capabilities {
    Capabilities caps;
    for (const auto& key : ir::all_operations()) {
        const bool window = key.kind == ir::NodeKind::Window;
        if (window && (key.op == static_cast<std::uint8_t>(ir::WindowKind::Rank) ||
                       key.op >= static_cast<std::uint8_t>(ir::WindowKind::Over))) {
            continue;
        }
        caps.supported.insert(key);
    }
    caps.nullable_boolean = true;
    caps.boolean_upcast = false;
    caps.lazy = false;
    caps.partitioned_windows = false;
    caps.ordered_rows = true;
    caps.null_keys = normalize::NullKeyPolicy::OwnGroup;
    return caps;
}

}  // namespace

// ─── Type mapping ─────────────────────────────────────────────────────────────

auto to_arrow_type(const DType& dtype) -> Result<std::shared_ptr<arrow::DataType>> {
    return std::visit(
        [](const auto& t) -> Result<std::shared_ptr<arrow::DataType>> {
            using T = std::decay_t<decltype(t)>;
            if constexpr (std::is_same_v<T, dt::Int>) {
                switch (t.bits) {
                    case 8:
                        return t.is_signed ? arrow::int8() : arrow::uint8();
                    case 16:
                        return t.is_signed ? arrow::int16() : arrow::uint16();
                    case 32:
                        return t.is_signed ? arrow::int32() : arrow::uint32();
                    default:
                        return t.is_signed ? arrow::int64() : arrow::uint64();
                }
            } else if constexpr (std::is_same_v<T, dt::Float>) {
                return t.bits == 32 ? arrow::float32() : arrow::float64();
            } else if constexpr (std::is_same_v<T, dt::Boolean>) {
                return arrow::boolean();
            } else if constexpr (std::is_same_v<T, dt::String>) {
                return arrow::utf8();
            } else if constexpr (std::is_same_v<T, dt::Date>) {
                return arrow::date32();
            } else if constexpr (std::is_same_v<T, dt::Datetime>) {
                return arrow::timestamp(arrow_unit(t.unit), t.time_zone.value_or(""));
            } else if constexpr (std::is_same_v<T, dt::Duration>) {
                return arrow::duration(arrow_unit(t.unit));
            } else if constexpr (std::is_same_v<T, dt::List>) {
                auto inner = to_arrow_type(*t.inner);
                if (!inner) {
                    return inner;
                }
                return arrow::list(*inner);
            } else if constexpr (std::is_same_v<T, dt::Struct>) {
                arrow::FieldVector fields;
                for (const auto& field : t.fields) {
                    auto type = to_arrow_type(*field.dtype);
                    if (!type) {
                        return type;
                    }
                    fields.push_back(arrow::field(field.name, *type));
                }
                return arrow::struct_(fields);
            } else {
                return arrow::null();
            }
        },
        dtype.variant());
}

auto from_arrow_type(const arrow::DataType& type) -> Result<DType> {
    switch (type.id()) {
        case arrow::Type::NA:
            return DType::unknown();
        case arrow::Type::BOOL:
            return DType::boolean();
        case arrow::Type::INT8:
            return DType::int8();
        case arrow::Type::INT16:
            return DType::int16();
        case arrow::Type::INT32:
            return DType::int32();
        case arrow::Type::INT64:
            return DType::int64();
        case arrow::Type::UINT8:
            return DType::uint8();
        case arrow::Type::UINT16:
            return DType::uint16();
        case arrow::Type::UINT32:
            return DType::uint32();
        case arrow::Type::UINT64:
            return DType::uint64();
        case arrow::Type::FLOAT:
            return DType::float32();
        case arrow::Type::DOUBLE:
            return DType::float64();
        case arrow::Type::STRING:
        case arrow::Type::LARGE_STRING:
            return DType::string();
        case arrow::Type::DATE32:
        case arrow::Type::DATE64:
            return DType::date();
        case arrow::Type::TIMESTAMP: {
            const auto& ts = static_cast<const arrow::TimestampType&>(type);
            std::optional<std::string> tz;
            if (!ts.timezone().empty()) {
                tz = ts.timezone();
            }
            return DType::datetime(tessera_unit(ts.unit()), std::move(tz));
        }
        case arrow::Type::DURATION:
            return DType::duration(
                tessera_unit(static_cast<const arrow::DurationType&>(type).unit()));
        case arrow::Type::LIST:
        case arrow::Type::LARGE_LIST: {
            const auto& list = static_cast<const arrow::BaseListType&>(type);
            auto inner = from_arrow_type(*list.value_type());
            if (!inner) {
                return inner;
            }
            return DType::list(std::move(*inner));
        }
        case arrow::Type::STRUCT: {
            std::vector<std::pair<std::string, DType>> fields;
            for (const auto& field : type.fields()) {
                auto inner = from_arrow_type(*field->type());
                if (!inner) {
                    return inner;
                }
                fields.emplace_back(field->name(), std::move(*inner));
            }
            return DType::structure(std::move(fields));
        }
        default:
            break;
    }
    return make_error(ErrorKind::UnknownDtype,
                      fmt::format("arrow type {} has no dtype mapping", type.ToString()),
                      std::string(kBackend));
}

// ─── ArrowAdapter ─────────────────────────────────────────────────────────────

ArrowAdapter::ArrowAdapter() : capabilities_(make_capabilities()) {}

auto ArrowAdapter::recognizes(const NativeObject& object) const -> bool {
    const auto* table = std::any_cast<TablePtr>(&object);
    return table != nullptr && *table != nullptr;
}

auto ArrowAdapter::table_of(const NativeObject& object) const -> Result<TablePtr> {
    const auto* table = std::any_cast<TablePtr>(&object);
    if (table == nullptr || !*table) {
        return make_error(ErrorKind::UnrecognizedNativeType,
                          fmt::format("expected an arrow::Table, got {}", object.type().name()),
                          std::string(name()));
    }
    return *table;
}

auto ArrowAdapter::schema(const NativeObject& frame) const -> Result<Schema> {
    auto table = table_of(frame);
    if (!table) {
        return std::unexpected(table.error());
    }
    Schema out;
    for (const auto& field : (*table)->schema()->fields()) {
        auto dtype = from_arrow_type(*field->type());
        if (!dtype) {
            spdlog::debug("[arrow] column '{}': {}", field->name(), dtype.error().message);
        }
        out.set(field->name(), dtype.value_or(DType::unknown()));
    }
    return out;
}

auto ArrowAdapter::lower(const ir::Expr& expr, const LoweringContext& context) const
    -> Result<NativeColumn> {
    auto table = table_of(context.frame);
    if (!table) {
        return std::unexpected(table.error());
    }
    auto datum = lower_datum(expr, *table, context.schema);
    if (!datum) {
        return std::unexpected(datum.error());
    }
    return NativeColumn(std::move(*datum));
}

auto ArrowAdapter::dtype_of(const NativeColumn& column) const -> Result<DType> {
    const auto* datum = std::any_cast<arrow::Datum>(&column);
    if (datum == nullptr || datum->type() == nullptr) {
        return make_error(ErrorKind::UnknownDtype,
                          fmt::format("not an arrow column: {}", column.type().name()),
                          std::string(name()));
    }
    return from_arrow_type(*datum->type());
}

auto ArrowAdapter::lower_datum(const ir::Expr& expr, const TablePtr& table,
                               const Schema& schema) const -> Result<arrow::Datum> {
    const auto rows = table->num_rows();
    auto child = [&](const ir::ExprPtr& e) { return lower_datum(*e, table, schema); };

    return std::visit(
        [&](const auto& node) -> Result<arrow::Datum> {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, ir::ColumnRef>) {
                auto column = table->GetColumnByName(node.name);
                if (column == nullptr) {
                    return make_error(ErrorKind::ColumnNotFound,
                                      fmt::format("column '{}' not found", node.name),
                                      std::string(name()));
                }
                return arrow::Datum(column);
            } else if constexpr (std::is_same_v<T, ir::Selection>) {
                return make_error(ErrorKind::InvalidOperation,
                                  "multi-column selection reached lowering unexpanded",
                                  std::string(name()));
            } else if constexpr (std::is_same_v<T, ir::Literal>) {
                auto type = to_arrow_type(node.dtype);
                if (!type) {
                    return std::unexpected(type.error());
                }
                if (tessera::is_null(node.value)) {
                    return arrow::Datum(arrow::MakeNullScalar(*type));
                }
                return cast_to(arrow::Datum(natural_arrow_scalar(node.value)), *type);
            } else if constexpr (std::is_same_v<T, ir::UnaryOp>) {
                auto operand = child(node.operand);
                if (!operand) {
                    return operand;
                }
                switch (node.kind) {
                    case ir::UnaryKind::Negate:
                        return call("negate", {*operand});
                    case ir::UnaryKind::Abs:
                        return call("abs", {*operand});
                    case ir::UnaryKind::Not:
                        return call("invert", {*operand});
                    case ir::UnaryKind::IsNull:
                        return call("is_null", {*operand});
                    case ir::UnaryKind::IsNotNull:
                        return call("is_valid", {*operand});
                    case ir::UnaryKind::Sqrt:
                    case ir::UnaryKind::Exp:
                    case ir::UnaryKind::Log:
                    case ir::UnaryKind::Round:
                    case ir::UnaryKind::Clip:
                        return lower_numeric_unary(node, expr, *operand, schema);
                }
                return unsupported(fmt::format("unary op '{}'", ir::to_string(node.kind)));
            } else if constexpr (std::is_same_v<T, ir::BinaryOp>) {
                return lower_binary(node, expr, child, schema);
            } else if constexpr (std::is_same_v<T, ir::Aggregation>) {
                if (!node.operand) {
                    return arrow::Datum(std::make_shared<arrow::Int64Scalar>(rows));
                }
                auto operand = child(node.operand);
                if (!operand) {
                    return operand;
                }
                const std::int64_t length =
                    ir::contains_aggregation(*node.operand) && operand->is_scalar() ? 1 : rows;
                auto values = to_array(*operand, length);
                if (!values) {
                    return std::unexpected(values.error());
                }
                auto input = aggregate_input(arrow::Datum(*values), node.kind);
                if (!input) {
                    return input;
                }
                auto kernel = aggregate_kernel(node, false);
                if (!kernel) {
                    return std::unexpected(kernel.error());
                }
                auto result = call(kernel->function, {*input}, kernel->options.get());
                if (!result || node.kind != ir::AggKind::Median) {
                    return result;
                }
                // quantile yields an array; empty input yields no values.
                auto quantiles = result->make_array();
                if (quantiles->length() == 0) {
                    return arrow::Datum(arrow::MakeNullScalar(arrow::float64()));
                }
                auto first = unwrap(quantiles->GetScalar(0));
                if (!first) {
                    return std::unexpected(first.error());
                }
                return arrow::Datum(*first);
            } else if constexpr (std::is_same_v<T, ir::WindowFunction>) {
                return lower_window(expr, node, table, schema);
            } else if constexpr (std::is_same_v<T, ir::HorizontalReduction>) {
                auto out = normalize::infer_dtype(expr, schema);
                if (!out) {
                    return std::unexpected(out.error());
                }
                auto type = to_arrow_type(*out);
                if (!type) {
                    return std::unexpected(type.error());
                }
                std::vector<arrow::Datum> operands;
                for (const auto& operand : node.operands) {
                    auto value = child(operand);
                    if (!value) {
                        return value;
                    }
                    auto cast = cast_to(*value, *type);
                    if (!cast) {
                        return cast;
                    }
                    operands.push_back(std::move(*cast));
                }
                return lower_horizontal(node, std::move(operands), *type);
            } else if constexpr (std::is_same_v<T, ir::Cast>) {
                auto operand = child(node.operand);
                if (!operand) {
                    return operand;
                }
                return cast_to(*operand, node.dtype);
            } else {
                // Alias and NameMap only rename.
                return child(node.operand);
            }
        },
        expr.node);
}

auto ArrowAdapter::lower_binary(const ir::BinaryOp& op, const ir::Expr& expr,
                                const std::function<Result<arrow::Datum>(const ir::ExprPtr&)>& child,
                                const Schema& schema) const -> Result<arrow::Datum> {
    auto lhs = child(op.left);
    if (!lhs) {
        return lhs;
    }
    auto rhs = child(op.right);
    if (!rhs) {
        return rhs;
    }
    auto operand = normalize::operand_dtype(op, schema);
    if (!operand) {
        return std::unexpected(operand.error());
    }
    auto out = normalize::infer_dtype(expr, schema);
    if (!out) {
        return std::unexpected(out.error());
    }
    // Arithmetic runs on the result dtype (booleans count as integers);
    // comparisons and logic on the common operand dtype.
    const bool arithmetic = ir::is_arithmetic(op.kind);
    const DType& work = arithmetic && !operand->is<dt::String>() ? *out : *operand;
    auto type = to_arrow_type(work);
    if (!type) {
        return std::unexpected(type.error());
    }
    auto l = cast_to(*lhs, *type);
    if (!l) {
        return l;
    }
    auto r = cast_to(*rhs, *type);
    if (!r) {
        return r;
    }

    switch (op.kind) {
        case ir::BinaryKind::Add:
            if (work.is<dt::String>()) {
                return call("binary_join_element_wise",
                            {*l, *r, arrow::Datum(std::make_shared<arrow::StringScalar>(""))});
            }
            return call("add", {*l, *r});
        case ir::BinaryKind::Sub:
            return call("subtract", {*l, *r});
        case ir::BinaryKind::Mul:
            return call("multiply", {*l, *r});
        case ir::BinaryKind::TrueDiv:
        case ir::BinaryKind::Pow:
            return call(op.kind == ir::BinaryKind::Pow ? "power" : "divide", {*l, *r});
        case ir::BinaryKind::FloorDiv:
        case ir::BinaryKind::Mod: {
            if (work.is_integer()) {
                return integer_floor_div_mod(*l, *r, *type, work.is_signed_integer(),
                                             op.kind == ir::BinaryKind::FloorDiv);
            }
            auto fl = cast_to(*l, arrow::float64());
            if (!fl) {
                return fl;
            }
            auto fr = cast_to(*r, arrow::float64());
            if (!fr) {
                return fr;
            }
            auto quotient = call("divide", {*fl, *fr});
            if (!quotient) {
                return quotient;
            }
            auto floored = call("floor", {*quotient});
            if (!floored) {
                return floored;
            }
            if (op.kind == ir::BinaryKind::FloorDiv) {
                return cast_to(*floored, *type);
            }
            auto product = call("multiply", {*floored, *fr});
            if (!product) {
                return product;
            }
            auto remainder = call("subtract", {*fl, *product});
            if (!remainder) {
                return remainder;
            }
            return cast_to(*remainder, *type);
        }
        case ir::BinaryKind::Eq:
            return call("equal", {*l, *r});
        case ir::BinaryKind::Ne:
            return call("not_equal", {*l, *r});
        case ir::BinaryKind::Lt:
            return call("less", {*l, *r});
        case ir::BinaryKind::Le:
            return call("less_equal", {*l, *r});
        case ir::BinaryKind::Gt:
            return call("greater", {*l, *r});
        case ir::BinaryKind::Ge:
            return call("greater_equal", {*l, *r});
        case ir::BinaryKind::And:
            return call("and_kleene", {*l, *r});
        case ir::BinaryKind::Or:
            return call("or_kleene", {*l, *r});
        case ir::BinaryKind::Xor:
            return call("xor", {*l, *r});
    }
    return unsupported(fmt::format("binary op '{}'", ir::to_string(op.kind)));
}

auto ArrowAdapter::lower_horizontal(const ir::HorizontalReduction& node,
                                    std::vector<arrow::Datum> operands,
                                    const std::shared_ptr<arrow::DataType>& type) const
    -> Result<arrow::Datum> {
    if (node.kind == ir::HorizontalKind::Min || node.kind == ir::HorizontalKind::Max) {
        cp::ElementWiseAggregateOptions options(node.ignore_nulls);
        return call(node.kind == ir::HorizontalKind::Min ? "min_element_wise" : "max_element_wise",
                    operands, &options);
    }

    // Folds with an identity that also stands in for ignored nulls.
    std::string combine;
    arrow::Datum identity;
    switch (node.kind) {
        case ir::HorizontalKind::Any:
            combine = "or_kleene";
            identity = arrow::Datum(std::make_shared<arrow::BooleanScalar>(false));
            break;
        case ir::HorizontalKind::All:
            combine = "and_kleene";
            identity = arrow::Datum(std::make_shared<arrow::BooleanScalar>(true));
            break;
        default: {
            auto zero = typed_scalar(0, type);
            if (!zero) {
                return zero;
            }
            combine = "add";
            identity = std::move(*zero);
            break;
        }
    }
    if (operands.empty()) {
        return identity;
    }
    std::optional<arrow::Datum> acc;
    for (auto& operand : operands) {
        arrow::Datum value = std::move(operand);
        if (node.ignore_nulls) {
            auto filled = call("coalesce", {value, identity});
            if (!filled) {
                return filled;
            }
            value = std::move(*filled);
        }
        if (!acc) {
            acc = std::move(value);
            continue;
        }
        auto next = call(combine, {*acc, value});
        if (!next) {
            return next;
        }
        acc = std::move(*next);
    }
    return *acc;
}

auto ArrowAdapter::lower_numeric_unary(const ir::UnaryOp& node, const ir::Expr& expr,
                                       const arrow::Datum& operand, const Schema& schema) const
    -> Result<arrow::Datum> {
    auto out = normalize::infer_dtype(expr, schema);
    if (!out) {
        return std::unexpected(out.error());
    }
    auto out_type = to_arrow_type(*out);
    if (!out_type) {
        return std::unexpected(out_type.error());
    }
    auto value = cast_to(operand, *out_type);
    if (!value) {
        return value;
    }
    switch (node.kind) {
        case ir::UnaryKind::Sqrt:
            return call("sqrt", {*value});
        case ir::UnaryKind::Exp:
            return call("exp", {*value});
        case ir::UnaryKind::Log: {
            // Unchecked ln gives -inf at 0 and NaN below it.
            auto ln = call("ln", {*value});
            if (!ln) {
                return ln;
            }
            auto divisor = cast_to(
                arrow::Datum(std::make_shared<arrow::DoubleScalar>(std::log(node.options.base))),
                *out_type);
            if (!divisor) {
                return divisor;
            }
            return call("divide", {*ln, *divisor});
        }
        case ir::UnaryKind::Round: {
            if (!out->is_float()) {
                return value;
            }
            cp::RoundOptions options(node.options.decimals, cp::RoundMode::HALF_TOWARDS_INFINITY);
            return call("round", {*value}, &options);
        }
        case ir::UnaryKind::Clip: {
            cp::ElementWiseAggregateOptions options(/*skip_nulls=*/false);
            arrow::Datum clipped = *value;
            const std::pair<const Scalar*, const char*> bounds[] = {
                {&node.options.lower, "max_element_wise"},
                {&node.options.upper, "min_element_wise"},
            };
            for (const auto& [bound, function] : bounds) {
                if (tessera::is_null(*bound)) {
                    continue;
                }
                auto typed = cast_to(arrow::Datum(natural_arrow_scalar(*bound)), *out_type);
                if (!typed) {
                    return typed;
                }
                auto next = call(function, {clipped, *typed}, &options);
                if (!next) {
                    return next;
                }
                clipped = std::move(*next);
            }
            return clipped;
        }
        default:
            break;
    }
    return unsupported(fmt::format("unary op '{}'", ir::to_string(node.kind)));
}

auto ArrowAdapter::lower_window(const ir::Expr& expr, const ir::WindowFunction& window,
                                const TablePtr& table, const Schema& schema) const
    -> Result<arrow::Datum> {
    if (!window.partition_by.empty()) {
        return unsupported(fmt::format("partitioned {}", ir::to_string(ir::op_key(expr))));
    }
    if (window.kind == ir::WindowKind::Rank || window.kind >= ir::WindowKind::Over) {
        return unsupported(ir::to_string(ir::op_key(expr)));
    }
    auto out = normalize::infer_dtype(expr, schema);
    if (!out) {
        return std::unexpected(out.error());
    }
    auto out_type = to_arrow_type(*out);
    if (!out_type) {
        return std::unexpected(out_type.error());
    }
    auto operand = lower_datum(*window.operand, table, schema);
    if (!operand) {
        return operand;
    }
    auto values = to_array(*operand, table->num_rows());
    if (!values) {
        return std::unexpected(values.error());
    }

    std::shared_ptr<arrow::Array> order;
    if (!window.order_by.empty()) {
        std::vector<cp::SortKey> keys;
        for (const auto& key : window.order_by) {
            keys.emplace_back(arrow::FieldRef(key), cp::SortOrder::Ascending);
        }
        auto indices = unwrap(cp::SortIndices(arrow::Datum(table), cp::SortOptions(keys)));
        if (!indices) {
            return std::unexpected(indices.error());
        }
        order = std::move(*indices);
        auto sorted = take(arrow::Datum(*values), order);
        if (!sorted) {
            return sorted;
        }
        *values = sorted->make_array();
    }

    auto run = [&](std::shared_ptr<arrow::Array> input) -> Result<std::shared_ptr<arrow::Array>> {
        arrow::Datum result;
        switch (window.kind) {
            case ir::WindowKind::CumSum:
            case ir::WindowKind::CumProd:
            case ir::WindowKind::CumMin:
            case ir::WindowKind::CumMax: {
                auto cast = cast_to(arrow::Datum(input), *out_type);
                if (!cast) {
                    return std::unexpected(cast.error());
                }
                static const std::map<ir::WindowKind, std::string> functions{
                    {ir::WindowKind::CumSum, "cumulative_sum"},
                    {ir::WindowKind::CumProd, "cumulative_prod"},
                    {ir::WindowKind::CumMin, "cumulative_min"},
                    {ir::WindowKind::CumMax, "cumulative_max"},
                };
                cp::CumulativeOptions options(/*skip_nulls=*/true);
                auto cumulative = call(functions.at(window.kind), {*cast}, &options);
                if (!cumulative) {
                    return std::unexpected(cumulative.error());
                }
                result = std::move(*cumulative);
                break;
            }
            case ir::WindowKind::CumCount: {
                auto valid = call("is_valid", {arrow::Datum(input)});
                if (!valid) {
                    return std::unexpected(valid.error());
                }
                auto ones = cast_to(*valid, arrow::int64());
                if (!ones) {
                    return std::unexpected(ones.error());
                }
                auto counted = call("cumulative_sum", {*ones});
                if (!counted) {
                    return std::unexpected(counted.error());
                }
                result = std::move(*counted);
                break;
            }
            case ir::WindowKind::Shift:
                return shifted(input, window.options.periods);
            case ir::WindowKind::Diff: {
                auto cast = cast_to(arrow::Datum(input), *out_type);
                if (!cast) {
                    return std::unexpected(cast.error());
                }
                auto base = cast->make_array();
                auto previous = shifted(base, window.options.periods);
                if (!previous) {
                    return previous;
                }
                auto delta = call("subtract", {arrow::Datum(base), arrow::Datum(*previous)});
                if (!delta) {
                    return std::unexpected(delta.error());
                }
                result = std::move(*delta);
                break;
            }
            default:
                return unsupported(ir::to_string(ir::op_key(expr)));
        }
        return result.make_array();
    };

    const bool reverse = window.options.reverse && window.kind != ir::WindowKind::Shift &&
                         window.kind != ir::WindowKind::Diff;
    std::shared_ptr<arrow::Array> input = *values;
    if (reverse) {
        auto flipped = reversed(input);
        if (!flipped) {
            return std::unexpected(flipped.error());
        }
        input = std::move(*flipped);
    }
    auto computed = run(std::move(input));
    if (!computed) {
        return std::unexpected(computed.error());
    }
    if (reverse) {
        computed = reversed(*computed);
        if (!computed) {
            return std::unexpected(computed.error());
        }
    }
    if (!order) {
        return arrow::Datum(*computed);
    }

    // Scatter back to input order.
    const auto& sorted_rows = static_cast<const arrow::Int64Array&>(*order);
    std::vector<std::int64_t> inverse(static_cast<std::size_t>(sorted_rows.length()));
    for (std::int64_t i = 0; i < sorted_rows.length(); ++i) {
        inverse[static_cast<std::size_t>(sorted_rows.Value(i))] = i;
    }
    auto idx = index_array(inverse);
    if (!idx) {
        return std::unexpected(idx.error());
    }
    return take(arrow::Datum(*computed), *idx);
}

auto ArrowAdapter::planned_column(const PlannedColumn& planned, const LoweringContext& context) const
    -> Result<arrow::Datum> {
    auto lowered = lower(*planned.expr, context);
    if (!lowered) {
        return std::unexpected(lowered.error());
    }
    auto datum = std::any_cast<arrow::Datum>(std::move(*lowered));
    auto dtype = dtype_of(NativeColumn(datum));
    if (dtype && *dtype == planned.dtype) {
        return datum;
    }
    return cast_to(datum, planned.dtype);
}

auto ArrowAdapter::apply_columns(const NativeObject& frame, const Plan& plan, Purpose mode) const
    -> Result<NativeObject> {
    auto table = table_of(frame);
    if (!table) {
        return std::unexpected(table.error());
    }
    auto input_schema = schema(frame);
    if (!input_schema) {
        return std::unexpected(input_schema.error());
    }

    const LoweringContext context{.frame = frame, .schema = *input_schema, .boolean = plan.boolean};
    std::vector<arrow::Datum> results;
    results.reserve(plan.columns.size());
    for (const auto& planned : plan.columns) {
        auto datum = planned_column(planned, context);
        if (!datum) {
            return std::unexpected(datum.error());
        }
        results.push_back(std::move(*datum));
    }

    std::int64_t rows = (*table)->num_rows();
    if (mode == Purpose::Select && !results.empty() &&
        std::ranges::all_of(results, [](const arrow::Datum& d) { return d.is_scalar(); })) {
        rows = 1;
    }

    arrow::FieldVector fields;
    arrow::ChunkedArrayVector columns;
    for (std::size_t i = 0; i < results.size(); ++i) {
        const auto& planned = plan.columns[i];
        auto column = to_chunked(results[i], rows);
        if (!column) {
            return std::unexpected(column.error());
        }
        if ((*column)->length() != rows) {
            return make_error(ErrorKind::InvalidOperation,
                              fmt::format("column '{}' has {} rows, expected {}", planned.name,
                                          (*column)->length(), rows),
                              std::string(name()));
        }
        fields.push_back(arrow::field(planned.name, (*column)->type()));
        columns.push_back(std::move(*column));
    }

    if (mode != Purpose::WithColumns) {
        return NativeObject(arrow::Table::Make(arrow::schema(fields), columns, rows));
    }
    TablePtr out = *table;
    for (std::size_t i = 0; i < fields.size(); ++i) {
        const int index = out->schema()->GetFieldIndex(fields[i]->name());
        auto next = index >= 0 ? out->SetColumn(index, fields[i], columns[i])
                               : out->AddColumn(out->num_columns(), fields[i], columns[i]);
        auto replaced = unwrap(std::move(next));
        if (!replaced) {
            return std::unexpected(replaced.error());
        }
        out = std::move(*replaced);
    }
    return NativeObject(std::move(out));
}

auto ArrowAdapter::filter(const NativeObject& frame, const Plan& predicate) const
    -> Result<NativeObject> {
    auto table = table_of(frame);
    if (!table) {
        return std::unexpected(table.error());
    }
    if (predicate.columns.size() != 1) {
        return make_error(ErrorKind::InvalidOperation, "filter takes exactly one predicate");
    }
    auto input_schema = schema(frame);
    if (!input_schema) {
        return std::unexpected(input_schema.error());
    }
    auto mask = lower_datum(*predicate.columns.front().expr, *table, *input_schema);
    if (!mask) {
        return std::unexpected(mask.error());
    }
    auto column = to_chunked(*mask, (*table)->num_rows());
    if (!column) {
        return std::unexpected(column.error());
    }
    // Null mask slots drop the row.
    auto kept = unwrap(cp::Filter(arrow::Datum(*table), arrow::Datum(*column)));
    if (!kept) {
        return std::unexpected(kept.error());
    }
    return NativeObject(kept->table());
}

auto ArrowAdapter::aggregate(const NativeObject& frame, const std::vector<std::string>& keys,
                             const Plan& plan) const -> Result<NativeObject> {
    auto table = table_of(frame);
    if (!table) {
        return std::unexpected(table.error());
    }
    if (keys.empty()) {
        return apply_columns(frame, plan, Purpose::Select);
    }
    auto input_schema = schema(frame);
    if (!input_schema) {
        return std::unexpected(input_schema.error());
    }
    const auto& input = *table;

    arrow::FieldVector fields;
    arrow::ChunkedArrayVector columns;
    std::vector<arrow::FieldRef> key_refs;
    for (const auto& key : keys) {
        auto column = input->GetColumnByName(key);
        if (column == nullptr) {
            return make_error(ErrorKind::ColumnNotFound,
                              fmt::format("group key '{}' not found", key), std::string(name()));
        }
        fields.push_back(input->schema()->GetFieldByName(key));
        columns.push_back(column);
        key_refs.emplace_back(key);
    }

    std::vector<cp::Aggregate> aggregates;
    for (std::size_t i = 0; i < plan.columns.size(); ++i) {
        const auto& planned = plan.columns[i];
        if (std::ranges::find(keys, planned.name) != keys.end()) {
            return make_error(ErrorKind::InvalidOperation,
                              fmt::format("aggregate '{}' collides with a group key", planned.name),
                              std::string(name()));
        }
        const auto* agg = core_aggregation(*planned.expr);
        if (agg == nullptr) {
            return unsupported(fmt::format("expression '{}' over a grouped aggregation", planned.name));
        }
        auto kernel = aggregate_kernel(*agg, true);
        if (!kernel) {
            return std::unexpected(kernel.error());
        }
        arrow::Datum values = arrow::Datum(columns.front());
        if (agg->operand) {
            auto lowered = lower_datum(*agg->operand, input, *input_schema);
            if (!lowered) {
                return std::unexpected(lowered.error());
            }
            auto prepared = aggregate_input(*lowered, agg->kind);
            if (!prepared) {
                return std::unexpected(prepared.error());
            }
            values = std::move(*prepared);
        }
        auto column = to_chunked(values, input->num_rows());
        if (!column) {
            return std::unexpected(column.error());
        }
        const auto in_name = fmt::format("__agg_in{}", i);
        fields.push_back(arrow::field(in_name, (*column)->type()));
        columns.push_back(std::move(*column));
        aggregates.emplace_back(kernel->function, kernel->options, arrow::FieldRef(in_name),
                                fmt::format("__agg_out{}", i));
    }

    auto work = arrow::Table::Make(arrow::schema(fields), columns, input->num_rows());
    ac::Declaration plan_decl = ac::Declaration::Sequence({
        {"table_source", ac::TableSourceNodeOptions(work)},
        {"aggregate", ac::AggregateNodeOptions(std::move(aggregates), std::move(key_refs))},
    });
    // A single-threaded plan emits groups in first-occurrence order.
    auto grouped = unwrap(ac::DeclarationToTable(std::move(plan_decl), /*use_threads=*/false));
    if (!grouped) {
        return std::unexpected(grouped.error());
    }
    spdlog::debug("[{}] grouped {} row(s) into {} group(s)", name(), input->num_rows(),
                  (*grouped)->num_rows());

    // Output: keys first, then aggregates.
    arrow::FieldVector out_fields;
    arrow::ChunkedArrayVector out_columns;
    for (const auto& key : keys) {
        out_fields.push_back(input->schema()->GetFieldByName(key));
        out_columns.push_back((*grouped)->GetColumnByName(key));
    }
    for (std::size_t i = 0; i < plan.columns.size(); ++i) {
        const auto& planned = plan.columns[i];
        auto column = (*grouped)->GetColumnByName(fmt::format("__agg_out{}", i));
        auto cast = cast_to(arrow::Datum(column), planned.dtype);
        if (!cast) {
            return std::unexpected(cast.error());
        }
        auto chunked = cast->chunked_array();
        out_fields.push_back(arrow::field(planned.name, chunked->type()));
        out_columns.push_back(std::move(chunked));
    }
    return NativeObject(
        arrow::Table::Make(arrow::schema(out_fields), out_columns, (*grouped)->num_rows()));
}

auto ArrowAdapter::sort(const NativeObject& frame, const std::vector<SortKey>& keys) const
    -> Result<NativeObject> {
    auto table = table_of(frame);
    if (!table) {
        return std::unexpected(table.error());
    }
    if (keys.empty()) {
        return NativeObject(*table);
    }
    const bool nulls_last = keys.front().nulls_last;
    std::vector<cp::SortKey> sort_keys;
    for (const auto& key : keys) {
        if (key.nulls_last != nulls_last) {
            return unsupported("sort keys with mixed null placement");
        }
        sort_keys.emplace_back(arrow::FieldRef(key.name),
                               key.descending ? cp::SortOrder::Descending : cp::SortOrder::Ascending);
    }
    cp::SortOptions options(sort_keys,
                            nulls_last ? cp::NullPlacement::AtEnd : cp::NullPlacement::AtStart);
    auto indices = unwrap(cp::SortIndices(arrow::Datum(*table), options));
    if (!indices) {
        return std::unexpected(indices.error());
    }
    auto sorted = take(arrow::Datum(*table), *indices);
    if (!sorted) {
        return std::unexpected(sorted.error());
    }
    return NativeObject(sorted->table());
}

auto ArrowAdapter::from_columns(const FrameData& data) const -> Result<NativeObject> {
    arrow::FieldVector fields;
    arrow::ArrayVector arrays;
    std::optional<std::size_t> rows;
    for (const auto& column : data) {
        if (std::ranges::any_of(fields, [&](const auto& f) { return f->name() == column.name; })) {
            return make_error(ErrorKind::InvalidOperation,
                              fmt::format("duplicate column name '{}'", column.name),
                              std::string(name()));
        }
        if (rows && *rows != column.values.size()) {
            return make_error(ErrorKind::InvalidOperation,
                              fmt::format("column '{}' has {} rows, expected {}", column.name,
                                          column.values.size(), *rows),
                              std::string(name()));
        }
        rows = column.values.size();
        auto array = build_column(column);
        if (!array) {
            return std::unexpected(array.error());
        }
        fields.push_back(arrow::field(column.name, (*array)->type()));
        arrays.push_back(std::move(*array));
    }
    return NativeObject(arrow::Table::Make(arrow::schema(fields), arrays,
                                           static_cast<std::int64_t>(rows.value_or(0))));
}

auto ArrowAdapter::to_columns(const NativeObject& frame) const -> Result<FrameData> {
    auto table = table_of(frame);
    if (!table) {
        return std::unexpected(table.error());
    }
    FrameData data;
    const auto& fields = (*table)->schema()->fields();
    for (int c = 0; c < (*table)->num_columns(); ++c) {
        const auto& field = fields[static_cast<std::size_t>(c)];
        auto dtype = from_arrow_type(*field->type());
        if (!dtype) {
            return std::unexpected(dtype.error());
        }
        ColumnData column{.name = field->name(), .dtype = std::move(*dtype), .values = {}};
        column.values.reserve(static_cast<std::size_t>((*table)->num_rows()));
        for (const auto& chunk : (*table)->column(c)->chunks()) {
            for (std::int64_t i = 0; i < chunk->length(); ++i) {
                auto scalar = unwrap(chunk->GetScalar(i));
                if (!scalar) {
                    return std::unexpected(scalar.error());
                }
                auto value = from_arrow_scalar(**scalar);
                if (!value) {
                    return std::unexpected(value.error());
                }
                column.values.push_back(std::move(*value));
            }
        }
        data.push_back(std::move(column));
    }
    return data;
}

}  // namespace tessera::arrow_backend
