#pragma once

#include <concepts>
#include <cstdint>
#include <initializer_list>
#include <span>
#include <vector>

namespace tessera::eager {

/// Concept constraining valid column element types.
template <typename T>
concept ColumnElement = std::regular<T> && std::totally_ordered<T>;

/// Fixed-width boolean element. Column<bool> would select vector<bool>,
/// which has no contiguous storage.
enum class Bool : std::uint8_t {
    False,
    True,
};

[[nodiscard]] constexpr auto to_bool(Bool value) noexcept -> bool {
    return value == Bool::True;
}

[[nodiscard]] constexpr auto from_bool(bool value) noexcept -> Bool {
    return value ? Bool::True : Bool::False;
}

/// A typed, owning columnar storage container.
///
/// Column<T> owns a contiguous vector of homogeneously typed values.
/// Nulls live beside the column in a validity bitmap (see ColumnEntry).
template <typename T>
class Column {
   public:
    using value_type = T;
    using size_type = std::size_t;

    static_assert(ColumnElement<T>,
                  "Column<T> requires T to satisfy ColumnElement (regular + totally ordered).");

    Column() = default;

    explicit Column(std::vector<T> data) : data_(std::move(data)) {}

    Column(std::initializer_list<T> init) : data_(init) {}

    /// Number of elements.
    [[nodiscard]] auto size() const noexcept -> size_type { return data_.size(); }

    /// Whether the column is empty.
    [[nodiscard]] auto empty() const noexcept -> bool { return data_.empty(); }

    /// Immutable element access (bounds-checked).
    [[nodiscard]] auto at(size_type idx) const -> const T& { return data_.at(idx); }

    /// Unchecked element access.
    [[nodiscard]] auto operator[](size_type idx) const noexcept -> const T& { return data_[idx]; }

    /// Unchecked mutable element access.
    [[nodiscard]] auto operator[](size_type idx) noexcept -> T& { return data_[idx]; }

    /// Append a value.
    void push_back(const T& value) { data_.push_back(value); }
    void push_back(T&& value) { data_.push_back(std::move(value)); }

    /// Reserve capacity.
    void reserve(size_type capacity) { data_.reserve(capacity); }

    /// Gather rows by index; indices must be in range.
    [[nodiscard]] auto take(std::span<const std::size_t> rows) const -> Column<T> {
        std::vector<T> result;
        result.reserve(rows.size());
        for (auto row : rows) {
            result.push_back(data_[row]);
        }
        return Column<T>{std::move(result)};
    }

    /// Repeat element `idx` `count` times.
    [[nodiscard]] auto repeat(size_type idx, size_type count) const -> Column<T> {
        return Column<T>{std::vector<T>(count, data_[idx])};
    }

    // Iterator support
    [[nodiscard]] auto begin() const noexcept { return data_.cbegin(); }
    [[nodiscard]] auto end() const noexcept { return data_.cend(); }

   private:
    std::vector<T> data_;
};

}  // namespace tessera::eager
