#pragma once

#include <tessera/core/error.hpp>
#include <tessera/core/scalar.hpp>
#include <tessera/core/time.hpp>
#include <tessera/dtype/dtype.hpp>
#include <tessera/eager/column.hpp>
#include <tessera/normalize/kleene.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace tessera::eager {

/// Physical storage. Integers of every width live in int64, floats in
/// double, durations as int64 ticks of their unit and datetimes as
/// nanosecond Timestamps; the entry's DType records the logical type.
using ColumnValue = std::variant<Column<std::int64_t>, Column<double>, Column<Bool>,
                                 Column<std::string>, Column<Date>, Column<Timestamp>>;

struct ColumnEntry {
    std::string name;
    DType dtype;
    std::shared_ptr<const ColumnValue> column;
    // Validity bitmap: true = valid (not null), false = null.
    // nullopt means every row is valid, the common case, with zero overhead.
    std::optional<std::vector<bool>> validity;

    [[nodiscard]] auto size() const noexcept -> std::size_t;
    [[nodiscard]] auto null_count() const noexcept -> std::size_t;
};

/// Returns true if row `row` of `entry` is null.
[[nodiscard]] inline auto is_null(const ColumnEntry& entry, std::size_t row) -> bool {
    return entry.validity.has_value() && !(*entry.validity)[row];
}

/// How a table stores missing values.
enum class NullMode : std::uint8_t {
    /// Boolean columns built from data cannot hold null; other columns
    /// carry validity bitmaps. Results of upcast boolean logic keep theirs.
    Sentinel,
    /// Every column, booleans included, may carry a validity bitmap.
    Masked,
};

struct Table {
    NullMode mode = NullMode::Sentinel;
    std::vector<ColumnEntry> columns;
    std::unordered_map<std::string, std::size_t> index;

    /// Append a column, or reseat an existing one of the same name in place.
    void add_column(ColumnEntry entry);
    [[nodiscard]] auto find_entry(const std::string& name) const -> const ColumnEntry*;
    [[nodiscard]] auto rows() const noexcept -> std::size_t;
    [[nodiscard]] auto schema() const -> Schema;
};

/// The native object the eager adapters accept.
using TablePtr = std::shared_ptr<const Table>;

// ─── Conversions ──────────────────────────────────────────────────────────────

/// Build an entry of `dtype` from scalars; null scalars become invalid rows.
/// Fails with UnsupportedOperation for dtypes without eager storage (List, Struct).
[[nodiscard]] auto make_entry(std::string name, const DType& dtype,
                              const std::vector<Scalar>& values) -> Result<ColumnEntry>;

/// Build a table from backend-neutral data. Sentinel tables reject boolean
/// columns that contain nulls.
[[nodiscard]] auto make_table(const FrameData& data, NullMode mode) -> Result<Table>;

[[nodiscard]] auto value_at(const ColumnEntry& entry, std::size_t row) -> Scalar;
[[nodiscard]] auto values_of(const ColumnEntry& entry) -> std::vector<Scalar>;
[[nodiscard]] auto to_tri(const ColumnEntry& entry, std::size_t row) -> normalize::Tri;

/// Gather rows by index.
[[nodiscard]] auto take(const ColumnEntry& entry, std::span<const std::size_t> rows) -> ColumnEntry;
[[nodiscard]] auto take(const Table& table, std::span<const std::size_t> rows) -> Table;

/// Repeat a one-row entry `rows` times.
[[nodiscard]] auto broadcast(const ColumnEntry& entry, std::size_t rows) -> ColumnEntry;

/// Convert to `target`, moving to its physical storage when needed.
/// Numeric and boolean types convert freely; anything formats to String;
/// Date widens to Datetime. Other pairs fail with DtypeMismatch.
[[nodiscard]] auto cast(const ColumnEntry& entry, const DType& target) -> Result<ColumnEntry>;

/// Read numeric, boolean or duration storage as doubles (nulls read as 0).
[[nodiscard]] auto as_doubles(const ColumnEntry& entry) -> std::vector<double>;

}  // namespace tessera::eager
