#include <tessera/eager/table.hpp>

#include <fmt/format.h>

#include <algorithm>

namespace tessera::eager {

namespace {

constexpr std::int64_t kNanosPerDay = 86'400LL * 1'000'000'000LL;

auto column_size(const ColumnValue& column) -> std::size_t {
    return std::visit([](const auto& col) { return col.size(); }, column);
}

auto make_empty(const DType& dtype) -> Result<ColumnValue> {
    if (dtype.is_integer() || dtype.is<dt::Duration>()) {
        return Column<std::int64_t>{};
    }
    if (dtype.is_float() || dtype.is_unknown()) {
        return Column<double>{};
    }
    if (dtype.is<dt::Boolean>()) {
        return Column<Bool>{};
    }
    if (dtype.is<dt::String>()) {
        return Column<std::string>{};
    }
    if (dtype.is<dt::Date>()) {
        return Column<Date>{};
    }
    if (dtype.is<dt::Datetime>()) {
        return Column<Timestamp>{};
    }
    return unsupported(fmt::format("{} storage", dtype.to_string()), "eager");
}

/// Convert a non-null scalar to storage element T.
template <typename T>
auto scalar_to(const Scalar& value) -> std::optional<T> {
    if constexpr (std::is_same_v<T, std::int64_t>) {
        if (const auto* v = std::get_if<std::int64_t>(&value)) {
            return *v;
        }
        if (const auto* v = std::get_if<bool>(&value)) {
            return *v ? 1 : 0;
        }
        if (const auto* v = std::get_if<double>(&value)) {
            return static_cast<std::int64_t>(*v);
        }
    } else if constexpr (std::is_same_v<T, double>) {
        if (const auto* v = std::get_if<double>(&value)) {
            return *v;
        }
        if (const auto* v = std::get_if<std::int64_t>(&value)) {
            return static_cast<double>(*v);
        }
        if (const auto* v = std::get_if<bool>(&value)) {
            return *v ? 1.0 : 0.0;
        }
    } else if constexpr (std::is_same_v<T, Bool>) {
        if (const auto* v = std::get_if<bool>(&value)) {
            return from_bool(*v);
        }
        if (const auto* v = std::get_if<std::int64_t>(&value)) {
            return from_bool(*v != 0);
        }
        if (const auto* v = std::get_if<double>(&value)) {
            return from_bool(*v != 0.0);
        }
    } else if constexpr (std::is_same_v<T, std::string>) {
        if (const auto* v = std::get_if<std::string>(&value)) {
            return *v;
        }
    } else if constexpr (std::is_same_v<T, Date>) {
        if (const auto* v = std::get_if<Date>(&value)) {
            return *v;
        }
        if (const auto* v = std::get_if<Timestamp>(&value)) {
            std::int64_t days = v->nanos / kNanosPerDay;
            if (v->nanos % kNanosPerDay < 0) {
                --days;
            }
            return Date{static_cast<std::int32_t>(days)};
        }
    } else if constexpr (std::is_same_v<T, Timestamp>) {
        if (const auto* v = std::get_if<Timestamp>(&value)) {
            return *v;
        }
        if (const auto* v = std::get_if<Date>(&value)) {
            return Timestamp{static_cast<std::int64_t>(v->days) * kNanosPerDay};
        }
    }
    return std::nullopt;
}

auto castable(const DType& from, const DType& to) -> bool {
    auto numeric_like = [](const DType& t) {
        return t.is_numeric() || t.is<dt::Boolean>() || t.is<dt::Duration>();
    };
    if (from == to || from.is_unknown() || to.is<dt::String>()) {
        return true;
    }
    if (numeric_like(from) && numeric_like(to)) {
        return true;
    }
    return (from.is<dt::Date>() || from.is<dt::Datetime>()) &&
           (to.is<dt::Date>() || to.is<dt::Datetime>());
}

}  // namespace

// ─── ColumnEntry / Table ──────────────────────────────────────────────────────

auto ColumnEntry::size() const noexcept -> std::size_t {
    return column ? column_size(*column) : 0;
}

auto ColumnEntry::null_count() const noexcept -> std::size_t {
    if (!validity.has_value()) {
        return 0;
    }
    return static_cast<std::size_t>(std::ranges::count(*validity, false));
}

void Table::add_column(ColumnEntry entry) {
    if (auto it = index.find(entry.name); it != index.end()) {
        // Reseat the entry rather than mutating shared column data.
        columns[it->second] = std::move(entry);
        return;
    }
    std::size_t pos = columns.size();
    columns.push_back(std::move(entry));
    index[columns.back().name] = pos;
}

auto Table::find_entry(const std::string& name) const -> const ColumnEntry* {
    if (auto it = index.find(name); it != index.end()) {
        return &columns[it->second];
    }
    return nullptr;
}

auto Table::rows() const noexcept -> std::size_t {
    if (columns.empty()) {
        return 0;
    }
    return columns.front().size();
}

auto Table::schema() const -> Schema {
    Schema out;
    for (const auto& entry : columns) {
        out.set(entry.name, entry.dtype);
    }
    return out;
}

// ─── Conversions ──────────────────────────────────────────────────────────────

auto make_entry(std::string name, const DType& dtype, const std::vector<Scalar>& values)
    -> Result<ColumnEntry> {
    auto storage = make_empty(dtype);
    if (!storage) {
        return std::unexpected(storage.error());
    }
    std::vector<bool> validity(values.size(), true);
    bool any_null = false;
    std::optional<Error> failure;
    std::visit(
        [&](auto& col) {
            using T = typename std::decay_t<decltype(col)>::value_type;
            col.reserve(values.size());
            for (std::size_t i = 0; i < values.size(); ++i) {
                if (tessera::is_null(values[i])) {
                    validity[i] = false;
                    any_null = true;
                    col.push_back(T{});
                    continue;
                }
                auto converted = scalar_to<T>(values[i]);
                if (!converted) {
                    if (!failure) {
                        failure = make_error(ErrorKind::DtypeMismatch,
                                             fmt::format("value {} does not fit column '{}' of "
                                                         "dtype {}",
                                                         format_scalar(values[i]), name,
                                                         dtype.to_string()))
                                      .error();
                    }
                    col.push_back(T{});
                    continue;
                }
                col.push_back(std::move(*converted));
            }
        },
        *storage);
    if (failure) {
        return std::unexpected(std::move(*failure));
    }
    ColumnEntry entry{.name = std::move(name),
                      .dtype = dtype,
                      .column = std::make_shared<const ColumnValue>(std::move(*storage)),
                      .validity = std::nullopt};
    if (any_null) {
        entry.validity = std::move(validity);
    }
    return entry;
}

auto make_table(const FrameData& data, NullMode mode) -> Result<Table> {
    Table table;
    table.mode = mode;
    std::optional<std::size_t> rows;
    for (const auto& column : data) {
        if (table.index.contains(column.name)) {
            return make_error(ErrorKind::InvalidOperation,
                              fmt::format("duplicate column name '{}'", column.name));
        }
        if (rows && *rows != column.values.size()) {
            return make_error(ErrorKind::InvalidOperation,
                              fmt::format("column '{}' has {} rows, expected {}", column.name,
                                          column.values.size(), *rows));
        }
        rows = column.values.size();
        auto entry = make_entry(column.name, column.dtype, column.values);
        if (!entry) {
            return std::unexpected(entry.error());
        }
        if (mode == NullMode::Sentinel && entry->dtype.is<dt::Boolean>() &&
            entry->validity.has_value()) {
            return make_error(ErrorKind::InvalidOperation,
                              fmt::format("boolean column '{}' contains nulls; sentinel storage "
                                          "has no null bit for booleans",
                                          column.name),
                              "eager");
        }
        table.add_column(std::move(*entry));
    }
    return table;
}

auto value_at(const ColumnEntry& entry, std::size_t row) -> Scalar {
    if (is_null(entry, row)) {
        return std::monostate{};
    }
    return std::visit(
        [row](const auto& col) -> Scalar {
            using T = typename std::decay_t<decltype(col)>::value_type;
            if constexpr (std::is_same_v<T, Bool>) {
                return to_bool(col[row]);
            } else {
                return col[row];
            }
        },
        *entry.column);
}

auto values_of(const ColumnEntry& entry) -> std::vector<Scalar> {
    std::vector<Scalar> out;
    const std::size_t n = entry.size();
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        out.push_back(value_at(entry, i));
    }
    return out;
}

auto to_tri(const ColumnEntry& entry, std::size_t row) -> normalize::Tri {
    if (is_null(entry, row)) {
        return std::nullopt;
    }
    if (const auto* col = std::get_if<Column<Bool>>(entry.column.get())) {
        return to_bool((*col)[row]);
    }
    return std::nullopt;
}

auto take(const ColumnEntry& entry, std::span<const std::size_t> rows) -> ColumnEntry {
    ColumnEntry out{.name = entry.name, .dtype = entry.dtype, .column = nullptr, .validity = {}};
    out.column = std::make_shared<const ColumnValue>(
        std::visit([rows](const auto& col) -> ColumnValue { return col.take(rows); }, *entry.column));
    if (entry.validity.has_value()) {
        std::vector<bool> validity;
        validity.reserve(rows.size());
        bool any_null = false;
        for (auto row : rows) {
            bool valid = (*entry.validity)[row];
            any_null = any_null || !valid;
            validity.push_back(valid);
        }
        if (any_null) {
            out.validity = std::move(validity);
        }
    }
    return out;
}

auto take(const Table& table, std::span<const std::size_t> rows) -> Table {
    Table out;
    out.mode = table.mode;
    for (const auto& entry : table.columns) {
        out.add_column(take(entry, rows));
    }
    return out;
}

auto broadcast(const ColumnEntry& entry, std::size_t rows) -> ColumnEntry {
    ColumnEntry out{.name = entry.name, .dtype = entry.dtype, .column = nullptr, .validity = {}};
    out.column = std::make_shared<const ColumnValue>(std::visit(
        [rows](const auto& col) -> ColumnValue { return col.repeat(0, rows); }, *entry.column));
    if (is_null(entry, 0)) {
        out.validity = std::vector<bool>(rows, false);
    }
    return out;
}

auto cast(const ColumnEntry& entry, const DType& target) -> Result<ColumnEntry> {
    if (entry.dtype == target) {
        return entry;
    }
    if (!castable(entry.dtype, target)) {
        return make_error(ErrorKind::DtypeMismatch,
                          fmt::format("cannot cast column '{}' from {} to {}", entry.name,
                                      entry.dtype.to_string(), target.to_string()));
    }
    auto values = values_of(entry);
    const auto* from_dur = entry.dtype.get_if<dt::Duration>();
    const auto* to_dur = target.get_if<dt::Duration>();
    for (auto& v : values) {
        if (tessera::is_null(v)) {
            continue;
        }
        if (target.is<dt::String>()) {
            v = format_scalar(v);
        } else if (target == DType::float32()) {
            if (auto d = scalar_to<double>(v)) {
                v = static_cast<double>(static_cast<float>(*d));
            }
        } else if (from_dur != nullptr && to_dur != nullptr) {
            const auto ticks = std::get<std::int64_t>(v);
            const auto converted = convert_ticks(ticks, from_dur->unit, to_dur->unit);
            if (!converted) {
                return make_error(ErrorKind::InvalidOperation,
                                  fmt::format("duration {}{} in column '{}' overflows {}", ticks,
                                              unit_suffix(from_dur->unit), entry.name,
                                              unit_suffix(to_dur->unit)));
            }
            v = *converted;
        }
    }
    auto out = make_entry(entry.name, target, values);
    if (!out) {
        return std::unexpected(out.error());
    }
    return out;
}

auto as_doubles(const ColumnEntry& entry) -> std::vector<double> {
    return std::visit(
        [](const auto& col) -> std::vector<double> {
            using T = typename std::decay_t<decltype(col)>::value_type;
            std::vector<double> out;
            if constexpr (std::is_same_v<T, std::int64_t> || std::is_same_v<T, double>) {
                out.reserve(col.size());
                for (const auto& v : col) {
                    out.push_back(static_cast<double>(v));
                }
            } else if constexpr (std::is_same_v<T, Bool>) {
                out.reserve(col.size());
                for (const auto& v : col) {
                    out.push_back(to_bool(v) ? 1.0 : 0.0);
                }
            }
            return out;
        },
        *entry.column);
}

}  // namespace tessera::eager
