#pragma once

#include <tessera/dispatch/registry.hpp>
#include <tessera/frame/frame.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

namespace tessera::testing {

inline const Scalar null{};

[[nodiscard]] inline auto i64(std::int64_t value) -> Scalar {
    return value;
}

[[nodiscard]] inline auto str(const char* value) -> Scalar {
    return std::string(value);
}

/// Built-in engines plus `extra`, in that order.
[[nodiscard]] inline auto make_registry(const std::vector<dispatch::AdapterPtr>& extra = {},
                                        Config config = {}) -> dispatch::RegistryPtr {
    dispatch::RegistryBuilder builder(std::move(config));
    builder.add_builtin();
    for (const auto& adapter : extra) {
        builder.add(adapter);
    }
    return value_or_throw(builder.build());
}

/// A backend to run shared checks against. Lazy backends get their data
/// through the masked eager engine.
struct BackendUnderTest {
    dispatch::RegistryPtr registry;
    std::string backend;

    [[nodiscard]] auto adapter() const -> dispatch::AdapterPtr {
        return value_or_throw(registry->adapter_by_name(backend));
    }

    [[nodiscard]] auto frame(const FrameData& data) const -> DataFrame {
        if (adapter()->capabilities().lazy) {
            return DataFrame::from_dict(data, "eager-masked", registry).lazy(backend);
        }
        return DataFrame::from_dict(data, backend, registry);
    }
};

/// id, g (String), x (Int64), y (Float64); nulls in every non-id column.
[[nodiscard]] inline auto sample_data() -> FrameData {
    return {
        ColumnData{.name = "id", .dtype = DType::int64(), .values = {i64(0), i64(1), i64(2), i64(3)}},
        ColumnData{.name = "g", .dtype = DType::string(), .values = {str("a"), str("b"), str("a"), null}},
        ColumnData{.name = "x", .dtype = DType::int64(), .values = {i64(1), i64(2), null, i64(4)}},
        ColumnData{.name = "y", .dtype = DType::float64(), .values = {1.5, null, 3.5, 4.5}},
    };
}

[[nodiscard]] inline auto column_values(const FrameData& data, const std::string& name)
    -> std::vector<Scalar> {
    auto it = std::ranges::find_if(data, [&name](const ColumnData& c) { return c.name == name; });
    REQUIRE(it != data.end());
    return it->values;
}

[[nodiscard]] inline auto column_values(const DataFrame& frame, const std::string& name)
    -> std::vector<Scalar> {
    return column_values(frame.to_dict(), name);
}

/// Element-wise comparison with a relative tolerance for doubles.
inline void require_values(const std::vector<Scalar>& actual, const std::vector<Scalar>& expected) {
    REQUIRE(actual.size() == expected.size());
    for (std::size_t i = 0; i < expected.size(); ++i) {
        INFO("row " << i << ": got " << format_scalar(actual[i]) << ", expected "
                    << format_scalar(expected[i]));
        REQUIRE(scalars_equal(actual[i], expected[i]));
    }
}

}  // namespace tessera::testing
