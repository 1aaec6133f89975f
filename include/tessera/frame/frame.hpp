#pragma once

#include <tessera/adapter/adapter.hpp>
#include <tessera/dispatch/registry.hpp>
#include <tessera/ir/expr.hpp>

#include <any>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tessera {

class GroupBy;
class Series;

/// Backend-neutral dataframe over one native object.
///
/// Holds the native handle, the adapter that recognized it and the resolved
/// schema. Every operation returns a new frame; the wrapped object is never
/// mutated. Failures throw tessera::Exception.
class DataFrame {
   public:
    /// Wrap a native object. Resolution uses `registry`, or the process-wide
    /// registry when null.
    [[nodiscard]] static auto from_native(NativeObject object, dispatch::RegistryPtr registry = nullptr)
        -> DataFrame;

    /// Build a native object of `backend` from column data.
    /// Lazy-only backends are rejected.
    [[nodiscard]] static auto from_dict(const FrameData& data, std::string_view backend,
                                        dispatch::RegistryPtr registry = nullptr) -> DataFrame;

    [[nodiscard]] auto to_native() const noexcept -> const NativeObject& { return native_; }

    /// The native object as its concrete type, e.g. `native_as<eager::TablePtr>()`.
    template <typename T>
    [[nodiscard]] auto native_as() const -> T {
        return std::any_cast<T>(native_);
    }

    [[nodiscard]] auto with_columns(const std::vector<Expr>& exprs) const -> DataFrame;
    [[nodiscard]] auto select(const std::vector<Expr>& exprs) const -> DataFrame;
    [[nodiscard]] auto filter(const Expr& predicate) const -> DataFrame;
    [[nodiscard]] auto group_by(std::vector<std::string> keys, bool drop_null_keys = false) const
        -> GroupBy;
    [[nodiscard]] auto sort(const std::vector<SortKey>& keys) const -> DataFrame;
    [[nodiscard]] auto sort(const std::vector<std::string>& by, bool descending = false) const
        -> DataFrame;
    [[nodiscard]] auto drop(const std::vector<std::string>& names) const -> DataFrame;
    [[nodiscard]] auto rename(const std::vector<std::pair<std::string, std::string>>& mapping) const
        -> DataFrame;
    [[nodiscard]] auto column(const std::string& name) const -> Series;

    /// Materialize into an eager backend (eager-masked by default). An eager
    /// frame with no target named is returned as is.
    [[nodiscard]] auto collect(std::string_view backend = {}) const -> DataFrame;
    /// Move the data to `backend`; with no backend named the frame is returned
    /// as is (eager frames already expose the lazy API).
    [[nodiscard]] auto lazy(std::string_view backend = {}) const -> DataFrame;

    [[nodiscard]] auto schema() const noexcept -> const Schema& { return schema_; }
    [[nodiscard]] auto columns() const -> std::vector<std::string> { return schema_.names(); }
    [[nodiscard]] auto is_lazy() const -> bool { return adapter_->capabilities().lazy; }
    /// Some result in this frame's history was computed under the
    /// null-as-False boolean fallback.
    [[nodiscard]] auto is_approximate() const noexcept -> bool { return approximate_; }
    [[nodiscard]] auto backend() const -> std::string_view { return adapter_->name(); }
    [[nodiscard]] auto adapter() const noexcept -> const dispatch::AdapterPtr& { return adapter_; }

    /// Materialized contents, one entry per column.
    [[nodiscard]] auto to_dict() const -> FrameData;

   private:
    friend class GroupBy;
    friend class Series;

    DataFrame(NativeObject native, dispatch::AdapterPtr adapter, dispatch::RegistryPtr registry,
              Schema schema, bool approximate);

    [[nodiscard]] auto config() const -> const Config& { return registry_->config(); }
    [[nodiscard]] auto derive(NativeObject native, bool approximate) const -> DataFrame;
    [[nodiscard]] auto apply(Purpose purpose, const std::vector<Expr>& exprs) const -> DataFrame;
    [[nodiscard]] auto convert_to(std::string_view backend) const -> DataFrame;
    void require_columns(const std::vector<std::string>& names) const;

    NativeObject native_;
    dispatch::AdapterPtr adapter_;
    dispatch::RegistryPtr registry_;
    Schema schema_;
    bool approximate_ = false;
};

/// Pending `group_by(...)`; `agg` produces one row per key tuple.
class GroupBy {
   public:
    [[nodiscard]] auto agg(const std::vector<Expr>& exprs) const -> DataFrame;

   private:
    friend class DataFrame;

    GroupBy(DataFrame frame, std::vector<std::string> keys, bool drop_null_keys)
        : frame_(std::move(frame)), keys_(std::move(keys)), drop_null_keys_(drop_null_keys) {}

    DataFrame frame_;
    std::vector<std::string> keys_;
    bool drop_null_keys_ = false;
};

/// A single named column, stored as a one-column frame.
class Series {
   public:
    /// Build a series on `backend`. Without `dtype` the values' common
    /// natural dtype is used (Unknown when every value is null).
    [[nodiscard]] static auto new_series(std::string name, std::vector<Scalar> values,
                                         std::optional<DType> dtype, std::string_view backend,
                                         dispatch::RegistryPtr registry = nullptr) -> Series;

    /// Wrap a native one-column object.
    [[nodiscard]] static auto from_native(NativeObject object,
                                          dispatch::RegistryPtr registry = nullptr) -> Series;

    [[nodiscard]] auto name() const -> const std::string&;
    [[nodiscard]] auto dtype() const -> const DType&;
    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto values() const -> std::vector<Scalar>;
    [[nodiscard]] auto backend() const -> std::string_view { return frame_.backend(); }
    [[nodiscard]] auto is_approximate() const noexcept -> bool { return frame_.is_approximate(); }

    /// Evaluate `fn(col(name))` elementwise; the result keeps this name unless
    /// `fn` aliases it.
    [[nodiscard]] auto apply(const std::function<Expr(const Expr&)>& fn) const -> Series;
    [[nodiscard]] auto rename(std::string name) const -> Series;
    [[nodiscard]] auto to_frame() const -> DataFrame { return frame_; }
    [[nodiscard]] auto to_native() const noexcept -> const NativeObject& {
        return frame_.to_native();
    }

    [[nodiscard]] auto sum() const -> Scalar;
    [[nodiscard]] auto mean() const -> Scalar;
    [[nodiscard]] auto min() const -> Scalar;
    [[nodiscard]] auto max() const -> Scalar;
    [[nodiscard]] auto count() const -> std::int64_t;
    [[nodiscard]] auto null_count() const -> std::int64_t;

   private:
    friend class DataFrame;

    explicit Series(DataFrame frame);

    [[nodiscard]] auto reduce(const Expr& expr) const -> Scalar;

    DataFrame frame_;
};

}  // namespace tessera
