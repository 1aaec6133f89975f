#include <tessera/frame/frame.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace tessera {

namespace {

auto resolve_registry(dispatch::RegistryPtr registry) -> dispatch::RegistryPtr {
    if (registry) {
        return registry;
    }
    return value_or_throw(dispatch::global());
}

}  // namespace

DataFrame::DataFrame(NativeObject native, dispatch::AdapterPtr adapter,
                     dispatch::RegistryPtr registry, Schema schema, bool approximate)
    : native_(std::move(native)),
      adapter_(std::move(adapter)),
      registry_(std::move(registry)),
      schema_(std::move(schema)),
      approximate_(approximate) {}

auto DataFrame::from_native(NativeObject object, dispatch::RegistryPtr registry) -> DataFrame {
    registry = resolve_registry(std::move(registry));
    auto adapter = value_or_throw(registry->resolve(object));
    auto schema = value_or_throw(adapter->schema(object));
    return DataFrame(std::move(object), std::move(adapter), std::move(registry), std::move(schema),
                     false);
}

auto DataFrame::from_dict(const FrameData& data, std::string_view backend,
                          dispatch::RegistryPtr registry) -> DataFrame {
    registry = resolve_registry(std::move(registry));
    auto adapter = value_or_throw(registry->adapter_by_name(backend));
    if (adapter->capabilities().lazy) {
        throw Exception(Error{.kind = ErrorKind::InvalidOperation,
                              .message = fmt::format("{} support is lazy-only", backend),
                              .backend = std::string(backend)});
    }
    auto native = value_or_throw(adapter->from_columns(data));
    auto schema = value_or_throw(adapter->schema(native));
    return DataFrame(std::move(native), std::move(adapter), std::move(registry), std::move(schema),
                     false);
}

auto DataFrame::derive(NativeObject native, bool approximate) const -> DataFrame {
    auto schema = value_or_throw(adapter_->schema(native));
    return DataFrame(std::move(native), adapter_, registry_, std::move(schema),
                     approximate_ || approximate);
}

auto DataFrame::apply(Purpose purpose, const std::vector<Expr>& exprs) const -> DataFrame {
    auto plan = value_or_throw(adapter_->prepare(nodes(exprs), schema_, config(), purpose));
    auto native = purpose == Purpose::Filter
                      ? value_or_throw(adapter_->filter(native_, plan))
                      : value_or_throw(adapter_->apply_columns(native_, plan, purpose));
    return derive(std::move(native), plan.approximate);
}

void DataFrame::require_columns(const std::vector<std::string>& names) const {
    for (const auto& name : names) {
        if (!schema_.contains(name)) {
            throw Exception(Error{.kind = ErrorKind::ColumnNotFound,
                                  .message = fmt::format("column '{}' not found", name),
                                  .backend = std::string(backend())});
        }
    }
}

auto DataFrame::with_columns(const std::vector<Expr>& exprs) const -> DataFrame {
    return apply(Purpose::WithColumns, exprs);
}

auto DataFrame::select(const std::vector<Expr>& exprs) const -> DataFrame {
    return apply(Purpose::Select, exprs);
}

auto DataFrame::filter(const Expr& predicate) const -> DataFrame {
    return apply(Purpose::Filter, {predicate});
}

auto DataFrame::group_by(std::vector<std::string> keys, bool drop_null_keys) const -> GroupBy {
    if (keys.empty()) {
        throw Exception(Error{.kind = ErrorKind::InvalidOperation,
                              .message = "group_by needs at least one key",
                              .backend = std::string(backend())});
    }
    require_columns(keys);
    return GroupBy(*this, std::move(keys), drop_null_keys);
}

auto DataFrame::sort(const std::vector<SortKey>& keys) const -> DataFrame {
    std::vector<std::string> names;
    names.reserve(keys.size());
    for (const auto& key : keys) {
        names.push_back(key.name);
    }
    require_columns(names);
    return derive(value_or_throw(adapter_->sort(native_, keys)), false);
}

auto DataFrame::sort(const std::vector<std::string>& by, bool descending) const -> DataFrame {
    std::vector<SortKey> keys;
    keys.reserve(by.size());
    for (const auto& name : by) {
        keys.push_back(SortKey{.name = name, .descending = descending});
    }
    return sort(keys);
}

auto DataFrame::drop(const std::vector<std::string>& names) const -> DataFrame {
    require_columns(names);
    std::vector<Expr> keep;
    for (const auto& [name, dtype] : schema_) {
        if (std::ranges::find(names, name) == names.end()) {
            keep.push_back(col(name));
        }
    }
    return select(keep);
}

auto DataFrame::rename(const std::vector<std::pair<std::string, std::string>>& mapping) const
    -> DataFrame {
    std::vector<std::string> sources;
    for (const auto& [from, to] : mapping) {
        sources.push_back(from);
    }
    require_columns(sources);
    std::vector<Expr> exprs;
    for (const auto& [name, dtype] : schema_) {
        auto it = std::ranges::find_if(mapping, [&name](const auto& m) { return m.first == name; });
        exprs.push_back(it == mapping.end() ? col(name) : col(name).alias(it->second));
    }
    return select(exprs);
}

auto DataFrame::column(const std::string& name) const -> Series {
    require_columns({name});
    return Series(select({col(name)}));
}

auto DataFrame::convert_to(std::string_view target) const -> DataFrame {
    auto adapter = value_or_throw(registry_->adapter_by_name(target));
    auto data = to_dict();
    auto native = value_or_throw(adapter->from_columns(data));
    auto schema = value_or_throw(adapter->schema(native));
    spdlog::debug("converted {} column(s) from {} to {}", data.size(), backend(), target);
    return DataFrame(std::move(native), std::move(adapter), registry_, std::move(schema),
                     approximate_);
}

auto DataFrame::collect(std::string_view target) const -> DataFrame {
    if (target.empty()) {
        if (!is_lazy()) {
            return *this;
        }
        target = "eager-masked";
    }
    auto adapter = value_or_throw(registry_->adapter_by_name(target));
    if (adapter->capabilities().lazy) {
        throw Exception(Error{.kind = ErrorKind::InvalidOperation,
                              .message = fmt::format("cannot collect into lazy backend '{}'", target),
                              .backend = std::string(target)});
    }
    return convert_to(target);
}

auto DataFrame::lazy(std::string_view target) const -> DataFrame {
    if (target.empty() || target == backend()) {
        return *this;
    }
    return convert_to(target);
}

auto DataFrame::to_dict() const -> FrameData {
    auto materialized = value_or_throw(adapter_->materialize(native_));
    return value_or_throw(adapter_->to_columns(materialized));
}

// ─── GroupBy ──────────────────────────────────────────────────────────────────

auto GroupBy::agg(const std::vector<Expr>& exprs) const -> DataFrame {
    DataFrame source = frame_;
    const auto& adapter = *frame_.adapter_;
    if (drop_null_keys_) {
        // One filter per key keeps each predicate free of boolean logic.
        for (const auto& key : keys_) {
            source = source.filter(col(key).is_not_null());
        }
    } else if (normalize::null_keys_diverge(adapter.capabilities().null_keys, drop_null_keys_)) {
        spdlog::warn("[{}] group_by: backend drops null keys; rows with null keys are missing",
                     adapter.name());
    }
    auto plan = value_or_throw(
        adapter.prepare(nodes(exprs), source.schema_, source.config(), Purpose::Aggregate));
    auto native = value_or_throw(adapter.aggregate(source.native_, keys_, plan));
    return source.derive(std::move(native), plan.approximate);
}

}  // namespace tessera
