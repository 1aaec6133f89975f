#include <tessera/core/scalar.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cmath>

namespace tessera {

auto natural_dtype(const Scalar& value) -> DType {
    return std::visit(
        [](const auto& v) -> DType {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, bool>) {
                return DType::boolean();
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                return DType::int64();
            } else if constexpr (std::is_same_v<T, double>) {
                return DType::float64();
            } else if constexpr (std::is_same_v<T, std::string>) {
                return DType::string();
            } else if constexpr (std::is_same_v<T, Date>) {
                return DType::date();
            } else if constexpr (std::is_same_v<T, Timestamp>) {
                return DType::datetime(TimeUnit::Nanoseconds);
            } else {
                return DType::unknown();
            }
        },
        value);
}

auto format_scalar(const Scalar& value) -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return "null";
            } else if constexpr (std::is_same_v<T, bool>) {
                return v ? "true" : "false";
            } else if constexpr (std::is_same_v<T, double>) {
                if (std::isnan(v)) {
                    return "nan";
                }
                if (std::isinf(v)) {
                    return v > 0 ? "inf" : "-inf";
                }
                return fmt::format("{:g}", v);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else if constexpr (std::is_same_v<T, Date>) {
                return format_date(v);
            } else if constexpr (std::is_same_v<T, Timestamp>) {
                return format_timestamp(v);
            } else {
                return std::to_string(v);
            }
        },
        value);
}

auto scalars_equal(const Scalar& lhs, const Scalar& rhs, double rel_tol) -> bool {
    const auto* ld = std::get_if<double>(&lhs);
    const auto* rd = std::get_if<double>(&rhs);
    if (ld != nullptr && rd != nullptr) {
        if (std::isnan(*ld) || std::isnan(*rd)) {
            return std::isnan(*ld) && std::isnan(*rd);
        }
        if (std::isinf(*ld) || std::isinf(*rd)) {
            return *ld == *rd;
        }
        const double scale = std::max({1.0, std::abs(*ld), std::abs(*rd)});
        return std::abs(*ld - *rd) <= rel_tol * scale;
    }
    return lhs == rhs;
}

auto schema_of(const FrameData& data) -> Schema {
    Schema schema;
    for (const auto& column : data) {
        schema.set(column.name, column.dtype);
    }
    return schema;
}

}  // namespace tessera
