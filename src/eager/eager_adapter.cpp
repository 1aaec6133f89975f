#include <tessera/eager/eager_adapter.hpp>

#include <tessera/eager/evaluator.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <numeric>

namespace tessera::eager {

namespace {

auto make_capabilities(NullMode mode) -> Capabilities {
    Capabilities caps;
    for (const auto& key : ir::all_operations()) {
        caps.supported.insert(key);
    }
    caps.nullable_boolean = mode == NullMode::Masked;
    caps.boolean_upcast = mode == NullMode::Sentinel;
    caps.lazy = false;
    caps.partitioned_windows = true;
    caps.ordered_rows = true;
    caps.null_keys = normalize::NullKeyPolicy::OwnGroup;
    return caps;
}

/// Under the fallback a sentinel table keeps no null booleans: freshly
/// computed null rows already hold False, so the bitmap goes. Upcast and
/// native results keep their validity.
void settle_booleans(ColumnEntry& entry, NullMode mode, normalize::BooleanStrategy boolean) {
    if (mode != NullMode::Sentinel || boolean != normalize::BooleanStrategy::NullAsFalse) {
        return;
    }
    if (entry.dtype.is<dt::Boolean>() && entry.validity.has_value()) {
        spdlog::debug("[eager] column '{}': {} null boolean(s) stored as False", entry.name,
                      entry.null_count());
        entry.validity.reset();
    }
}

auto evaluate_planned(const Table& table, const PlannedColumn& planned,
                      normalize::BooleanStrategy boolean) -> Result<ColumnEntry> {
    auto entry = evaluate(table, *planned.expr, boolean);
    if (!entry) {
        return entry;
    }
    auto out = cast(*entry, planned.dtype);
    if (!out) {
        return out;
    }
    out->name = planned.name;
    return out;
}

}  // namespace

EagerAdapter::EagerAdapter(NullMode mode) : mode_(mode), capabilities_(make_capabilities(mode)) {}

auto EagerAdapter::name() const -> std::string_view {
    return mode_ == NullMode::Sentinel ? "eager" : "eager-masked";
}

auto EagerAdapter::recognizes(const NativeObject& object) const -> bool {
    const auto* table = std::any_cast<TablePtr>(&object);
    if (table == nullptr || !*table) {
        return false;
    }
    return mode_ == NullMode::Sentinel || (*table)->mode == NullMode::Masked;
}

auto EagerAdapter::table_of(const NativeObject& object) const -> Result<TablePtr> {
    const auto* table = std::any_cast<TablePtr>(&object);
    if (table == nullptr || !*table) {
        return make_error(ErrorKind::UnrecognizedNativeType,
                          fmt::format("expected an eager table, got {}", object.type().name()),
                          std::string(name()));
    }
    return *table;
}

auto EagerAdapter::schema(const NativeObject& frame) const -> Result<Schema> {
    auto table = table_of(frame);
    if (!table) {
        return std::unexpected(table.error());
    }
    return (*table)->schema();
}

auto EagerAdapter::lower(const ir::Expr& expr, const LoweringContext& context) const
    -> Result<NativeColumn> {
    auto table = table_of(context.frame);
    if (!table) {
        return std::unexpected(table.error());
    }
    auto entry = evaluate(**table, expr, context.boolean);
    if (!entry) {
        return std::unexpected(entry.error());
    }
    return NativeColumn(std::move(*entry));
}

auto EagerAdapter::dtype_of(const NativeColumn& column) const -> Result<DType> {
    if (const auto* entry = std::any_cast<ColumnEntry>(&column)) {
        return entry->dtype;
    }
    return make_error(ErrorKind::UnknownDtype,
                      fmt::format("not an eager column: {}", column.type().name()),
                      std::string(name()));
}

auto EagerAdapter::apply_columns(const NativeObject& frame, const Plan& plan, Purpose mode) const
    -> Result<NativeObject> {
    auto table = table_of(frame);
    if (!table) {
        return std::unexpected(table.error());
    }
    const Table& input = **table;
    const auto input_schema = input.schema();
    const LoweringContext context{.frame = frame, .schema = input_schema, .boolean = plan.boolean};

    std::vector<ColumnEntry> results;
    results.reserve(plan.columns.size());
    for (const auto& planned : plan.columns) {
        auto lowered = lower(*planned.expr, context);
        if (!lowered) {
            return std::unexpected(lowered.error());
        }
        auto dtype = dtype_of(*lowered);
        if (!dtype) {
            return std::unexpected(dtype.error());
        }
        auto entry = std::any_cast<ColumnEntry>(std::move(*lowered));
        if (!(*dtype == planned.dtype)) {
            auto widened = cast(entry, planned.dtype);
            if (!widened) {
                return std::unexpected(widened.error());
            }
            entry = std::move(*widened);
        }
        entry.name = planned.name;
        results.push_back(std::move(entry));
    }

    std::size_t rows = input.rows();
    if (mode == Purpose::Select && !results.empty() &&
        std::ranges::all_of(results, [](const ColumnEntry& e) { return e.size() == 1; })) {
        rows = 1;
    }

    Table out;
    if (mode == Purpose::WithColumns) {
        out = input;
    } else {
        out.mode = input.mode;
    }
    for (auto& entry : results) {
        if (entry.size() != rows) {
            if (entry.size() != 1) {
                return make_error(ErrorKind::InvalidOperation,
                                  fmt::format("column '{}' has {} rows, expected {}", entry.name,
                                              entry.size(), rows));
            }
            entry = broadcast(entry, rows);
        }
        settle_booleans(entry, input.mode, plan.boolean);
        out.add_column(std::move(entry));
    }
    return native(std::move(out));
}

auto EagerAdapter::filter(const NativeObject& frame, const Plan& predicate) const
    -> Result<NativeObject> {
    auto table = table_of(frame);
    if (!table) {
        return std::unexpected(table.error());
    }
    if (predicate.columns.size() != 1) {
        return make_error(ErrorKind::InvalidOperation, "filter takes exactly one predicate");
    }
    const Table& input = **table;
    auto mask = evaluate(input, *predicate.columns.front().expr, predicate.boolean);
    if (!mask) {
        return std::unexpected(mask.error());
    }
    std::vector<std::size_t> keep;
    for (std::size_t row = 0; row < input.rows(); ++row) {
        if (to_tri(*mask, mask->size() == 1 ? 0 : row) == true) {
            keep.push_back(row);
        }
    }
    return native(take(input, keep));
}

auto EagerAdapter::aggregate(const NativeObject& frame, const std::vector<std::string>& keys,
                             const Plan& plan) const -> Result<NativeObject> {
    auto table = table_of(frame);
    if (!table) {
        return std::unexpected(table.error());
    }
    const Table& input = **table;
    for (const auto& planned : plan.columns) {
        if (std::ranges::find(keys, planned.name) != keys.end()) {
            return make_error(ErrorKind::InvalidOperation,
                              fmt::format("aggregate '{}' collides with a group key", planned.name));
        }
    }
    auto groups = group_rows(input, keys);
    if (!groups) {
        return std::unexpected(groups.error());
    }
    spdlog::debug("[{}] grouped {} row(s) into {} group(s)", name(), input.rows(), groups->size());

    std::vector<std::size_t> firsts;
    firsts.reserve(groups->size());
    for (const auto& group : *groups) {
        firsts.push_back(group.empty() ? 0 : group.front());
    }

    Table out;
    out.mode = input.mode;
    if (!keys.empty()) {
        for (const auto& key : keys) {
            out.add_column(take(*input.find_entry(key), firsts));
        }
    }

    std::vector<std::vector<Scalar>> values(plan.columns.size());
    for (const auto& group : *groups) {
        auto part = take(input, group);
        for (std::size_t c = 0; c < plan.columns.size(); ++c) {
            const auto& planned = plan.columns[c];
            auto entry = evaluate_planned(part, planned, plan.boolean);
            if (!entry) {
                return std::unexpected(entry.error());
            }
            if (entry->size() != 1) {
                return make_error(ErrorKind::InvalidOperation,
                                  fmt::format("'{}' does not reduce to one value per group",
                                              planned.name));
            }
            values[c].push_back(value_at(*entry, 0));
        }
    }
    for (std::size_t c = 0; c < plan.columns.size(); ++c) {
        auto entry = make_entry(plan.columns[c].name, plan.columns[c].dtype, values[c]);
        if (!entry) {
            return std::unexpected(entry.error());
        }
        settle_booleans(*entry, input.mode, plan.boolean);
        out.add_column(std::move(*entry));
    }
    return native(std::move(out));
}

auto EagerAdapter::sort(const NativeObject& frame, const std::vector<SortKey>& keys) const
    -> Result<NativeObject> {
    auto table = table_of(frame);
    if (!table) {
        return std::unexpected(table.error());
    }
    const Table& input = **table;
    std::vector<std::size_t> rows(input.rows());
    std::iota(rows.begin(), rows.end(), std::size_t{0});
    auto ordered = sort_rows(input, std::move(rows), keys);
    if (!ordered) {
        return std::unexpected(ordered.error());
    }
    return native(take(input, *ordered));
}

auto EagerAdapter::from_columns(const FrameData& data) const -> Result<NativeObject> {
    auto table = make_table(data, mode_);
    if (!table) {
        return std::unexpected(Error{.kind = table.error().kind,
                                     .message = table.error().message,
                                     .backend = std::string(name())});
    }
    return native(std::move(*table));
}

auto EagerAdapter::to_columns(const NativeObject& frame) const -> Result<FrameData> {
    auto table = table_of(frame);
    if (!table) {
        return std::unexpected(table.error());
    }
    FrameData data;
    data.reserve((*table)->columns.size());
    for (const auto& entry : (*table)->columns) {
        data.push_back(ColumnData{.name = entry.name, .dtype = entry.dtype, .values = values_of(entry)});
    }
    return data;
}

}  // namespace tessera::eager
