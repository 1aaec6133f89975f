#pragma once

#include <tessera/core/time.hpp>
#include <tessera/dtype/dtype.hpp>

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace tessera {

/// A single backend-neutral value. std::monostate is null.
///
/// Integers of every width travel as int64 and floats as double; the owning
/// column's DType records the storage width.
using Scalar = std::variant<std::monostate, bool, std::int64_t, double, std::string, Date, Timestamp>;

[[nodiscard]] inline auto is_null(const Scalar& value) noexcept -> bool {
    return std::holds_alternative<std::monostate>(value);
}

/// Natural dtype of a scalar (Int64 / Float64 / Boolean / String / Date / Datetime(ns)).
[[nodiscard]] auto natural_dtype(const Scalar& value) -> DType;

/// Human-readable rendering; null prints as "null".
[[nodiscard]] auto format_scalar(const Scalar& value) -> std::string;

/// Equality with a relative tolerance for doubles; NaN equals NaN.
[[nodiscard]] auto scalars_equal(const Scalar& lhs, const Scalar& rhs, double rel_tol = 1e-9)
    -> bool;

/// Backend-neutral column contents used by from_dict, to_dict and collect().
struct ColumnData {
    std::string name;
    DType dtype;
    std::vector<Scalar> values;
};

using FrameData = std::vector<ColumnData>;

/// Schema of a FrameData, in column order.
[[nodiscard]] auto schema_of(const FrameData& data) -> Schema;

}  // namespace tessera
