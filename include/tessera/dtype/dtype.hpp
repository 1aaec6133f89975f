#pragma once

#include <tessera/core/error.hpp>
#include <tessera/core/time.hpp>

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace tessera {

class DType;
using DTypePtr = std::shared_ptr<const DType>;

/// A named struct field.
struct Field {
    std::string name;
    DTypePtr dtype;
};

/// Variants of the backend-neutral type lattice.
namespace dt {

struct Int {
    std::uint8_t bits = 64;
    bool is_signed = true;
    auto operator==(const Int&) const -> bool = default;
};

struct Float {
    std::uint8_t bits = 64;
    auto operator==(const Float&) const -> bool = default;
};

struct Boolean {
    auto operator==(const Boolean&) const -> bool = default;
};

struct String {
    auto operator==(const String&) const -> bool = default;
};

struct Date {
    auto operator==(const Date&) const -> bool = default;
};

struct Datetime {
    TimeUnit unit = TimeUnit::Microseconds;
    std::optional<std::string> time_zone;
    auto operator==(const Datetime&) const -> bool = default;
};

struct Duration {
    TimeUnit unit = TimeUnit::Microseconds;
    auto operator==(const Duration&) const -> bool = default;
};

struct List {
    DTypePtr inner;
    auto operator==(const List& other) const -> bool;
};

struct Struct {
    std::vector<Field> fields;
    auto operator==(const Struct& other) const -> bool;
};

struct Unknown {
    auto operator==(const Unknown&) const -> bool = default;
};

}  // namespace dt

template <typename T, typename V>
struct is_alternative : std::false_type {};

template <typename T, typename... Ts>
struct is_alternative<T, std::variant<Ts...>> : std::bool_constant<(std::is_same_v<T, Ts> || ...)> {};

/// A backend-neutral column type.
///
/// DType is a small value type; nested variants share their children through
/// shared_ptr<const DType>, so copies are cheap and never alias mutable state.
class DType {
   public:
    using Variant = std::variant<dt::Int, dt::Float, dt::Boolean, dt::String, dt::Date,
                                 dt::Datetime, dt::Duration, dt::List, dt::Struct, dt::Unknown>;

    DType() : value_(dt::Unknown{}) {}
    DType(Variant value) : value_(std::move(value)) {}  // NOLINT(google-explicit-constructor)

    /// Implicit from a single lattice variant, e.g. `DType t = dt::Boolean{};`.
    template <typename T>
        requires is_alternative<std::remove_cvref_t<T>, Variant>::value
    DType(T&& alternative)  // NOLINT(google-explicit-constructor)
        : value_(std::forward<T>(alternative)) {}

    [[nodiscard]] static auto int8() -> DType { return dt::Int{.bits = 8, .is_signed = true}; }
    [[nodiscard]] static auto int16() -> DType { return dt::Int{.bits = 16, .is_signed = true}; }
    [[nodiscard]] static auto int32() -> DType { return dt::Int{.bits = 32, .is_signed = true}; }
    [[nodiscard]] static auto int64() -> DType { return dt::Int{.bits = 64, .is_signed = true}; }
    [[nodiscard]] static auto uint8() -> DType { return dt::Int{.bits = 8, .is_signed = false}; }
    [[nodiscard]] static auto uint16() -> DType { return dt::Int{.bits = 16, .is_signed = false}; }
    [[nodiscard]] static auto uint32() -> DType { return dt::Int{.bits = 32, .is_signed = false}; }
    [[nodiscard]] static auto uint64() -> DType { return dt::Int{.bits = 64, .is_signed = false}; }
    [[nodiscard]] static auto float32() -> DType { return dt::Float{.bits = 32}; }
    [[nodiscard]] static auto float64() -> DType { return dt::Float{.bits = 64}; }
    [[nodiscard]] static auto boolean() -> DType { return dt::Boolean{}; }
    [[nodiscard]] static auto string() -> DType { return dt::String{}; }
    [[nodiscard]] static auto date() -> DType { return dt::Date{}; }
    [[nodiscard]] static auto datetime(TimeUnit unit = TimeUnit::Microseconds,
                                       std::optional<std::string> time_zone = std::nullopt)
        -> DType {
        return dt::Datetime{.unit = unit, .time_zone = std::move(time_zone)};
    }
    [[nodiscard]] static auto duration(TimeUnit unit = TimeUnit::Microseconds) -> DType {
        return dt::Duration{.unit = unit};
    }
    [[nodiscard]] static auto list(DType inner) -> DType;
    [[nodiscard]] static auto structure(std::vector<std::pair<std::string, DType>> fields)
        -> DType;
    [[nodiscard]] static auto unknown() -> DType { return dt::Unknown{}; }

    [[nodiscard]] auto variant() const noexcept -> const Variant& { return value_; }

    template <typename T>
    [[nodiscard]] auto is() const noexcept -> bool {
        return std::holds_alternative<T>(value_);
    }

    template <typename T>
    [[nodiscard]] auto get_if() const noexcept -> const T* {
        return std::get_if<T>(&value_);
    }

    [[nodiscard]] auto is_numeric() const noexcept -> bool;
    [[nodiscard]] auto is_integer() const noexcept -> bool { return is<dt::Int>(); }
    [[nodiscard]] auto is_signed_integer() const noexcept -> bool;
    [[nodiscard]] auto is_unsigned_integer() const noexcept -> bool;
    [[nodiscard]] auto is_float() const noexcept -> bool { return is<dt::Float>(); }
    [[nodiscard]] auto is_temporal() const noexcept -> bool;
    [[nodiscard]] auto is_nested() const noexcept -> bool;
    [[nodiscard]] auto is_unknown() const noexcept -> bool { return is<dt::Unknown>(); }

    /// Python-flavoured rendering, e.g. "Int64", "Datetime(time_unit='us', time_zone=None)".
    [[nodiscard]] auto to_string() const -> std::string;

    friend auto operator==(const DType& lhs, const DType& rhs) -> bool {
        return lhs.value_ == rhs.value_;
    }

   private:
    Variant value_;
};

/// Least upper bound of two dtypes.
///
/// Total and commutative; never throws. std::nullopt means "Unsupported": no
/// common representation exists (e.g. String with Int64, or structs whose
/// fields disagree).
[[nodiscard]] auto promote(const DType& lhs, const DType& rhs) -> std::optional<DType>;

/// promote() that reports Unsupported as a DtypeMismatch error.
[[nodiscard]] auto supertype(const DType& lhs, const DType& rhs) -> Result<DType>;

/// Ordered name → dtype mapping; names are unique, insertion order is column order.
class Schema {
   public:
    using Entry = std::pair<std::string, DType>;

    Schema() = default;
    Schema(std::initializer_list<Entry> entries);

    /// Append a column, or replace the dtype in place when the name exists.
    void set(std::string name, DType dtype);

    [[nodiscard]] auto find(const std::string& name) const -> const DType*;
    [[nodiscard]] auto contains(const std::string& name) const -> bool {
        return index_.contains(name);
    }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return entries_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return entries_.empty(); }
    [[nodiscard]] auto entries() const noexcept -> const std::vector<Entry>& { return entries_; }
    [[nodiscard]] auto names() const -> std::vector<std::string>;

    [[nodiscard]] auto begin() const noexcept { return entries_.begin(); }
    [[nodiscard]] auto end() const noexcept { return entries_.end(); }

    friend auto operator==(const Schema& lhs, const Schema& rhs) -> bool {
        return lhs.entries_ == rhs.entries_;
    }

   private:
    std::vector<Entry> entries_;
    std::unordered_map<std::string, std::size_t> index_;
};

}  // namespace tessera
