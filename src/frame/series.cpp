#include <tessera/frame/frame.hpp>

#include <fmt/format.h>

namespace tessera {

namespace {

auto infer_values_dtype(const std::vector<Scalar>& values) -> DType {
    std::optional<DType> acc;
    for (const auto& v : values) {
        if (is_null(v)) {
            continue;
        }
        auto t = natural_dtype(v);
        if (!acc) {
            acc = std::move(t);
            continue;
        }
        auto joined = supertype(*acc, t);
        acc = value_or_throw(std::move(joined));
    }
    return acc.value_or(DType::unknown());
}

}  // namespace

Series::Series(DataFrame frame) : frame_(std::move(frame)) {
    if (frame_.schema().size() != 1) {
        throw Exception(Error{.kind = ErrorKind::InvalidOperation,
                              .message = fmt::format("a series has one column, got {}",
                                                     frame_.schema().size()),
                              .backend = std::string(frame_.backend())});
    }
}

auto Series::new_series(std::string name, std::vector<Scalar> values, std::optional<DType> dtype,
                        std::string_view backend, dispatch::RegistryPtr registry) -> Series {
    ColumnData column{.name = std::move(name),
                      .dtype = dtype.has_value() ? std::move(*dtype) : infer_values_dtype(values),
                      .values = std::move(values)};
    return Series(DataFrame::from_dict({std::move(column)}, backend, std::move(registry)));
}

auto Series::from_native(NativeObject object, dispatch::RegistryPtr registry) -> Series {
    return Series(DataFrame::from_native(std::move(object), std::move(registry)));
}

auto Series::name() const -> const std::string& {
    return frame_.schema().entries().front().first;
}

auto Series::dtype() const -> const DType& {
    return frame_.schema().entries().front().second;
}

auto Series::size() const -> std::size_t {
    auto n = reduce(col(name()).len());
    return static_cast<std::size_t>(std::get<std::int64_t>(n));
}

auto Series::values() const -> std::vector<Scalar> {
    auto data = frame_.to_dict();
    return std::move(data.front().values);
}

auto Series::apply(const std::function<Expr(const Expr&)>& fn) const -> Series {
    return Series(frame_.select({fn(col(name()))}));
}

auto Series::rename(std::string name) const -> Series {
    return Series(frame_.select({col(this->name()).alias(std::move(name))}));
}

auto Series::reduce(const Expr& expr) const -> Scalar {
    auto data = frame_.select({expr}).to_dict();
    return data.front().values.front();
}

auto Series::sum() const -> Scalar {
    return reduce(col(name()).sum());
}

auto Series::mean() const -> Scalar {
    return reduce(col(name()).mean());
}

auto Series::min() const -> Scalar {
    return reduce(col(name()).min());
}

auto Series::max() const -> Scalar {
    return reduce(col(name()).max());
}

auto Series::count() const -> std::int64_t {
    return std::get<std::int64_t>(reduce(col(name()).count()));
}

auto Series::null_count() const -> std::int64_t {
    return std::get<std::int64_t>(reduce(col(name()).is_null().sum()));
}

}  // namespace tessera
