#include <tessera/dtype/dtype.hpp>

#include <fmt/format.h>

#include <algorithm>

namespace tessera {

namespace dt {

auto List::operator==(const List& other) const -> bool {
    if (inner == nullptr || other.inner == nullptr) {
        return inner == other.inner;
    }
    return *inner == *other.inner;
}

auto Struct::operator==(const Struct& other) const -> bool {
    if (fields.size() != other.fields.size()) {
        return false;
    }
    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (fields[i].name != other.fields[i].name) {
            return false;
        }
        if (!(*fields[i].dtype == *other.fields[i].dtype)) {
            return false;
        }
    }
    return true;
}

}  // namespace dt

namespace {

auto finer(TimeUnit lhs, TimeUnit rhs) -> TimeUnit {
    return ticks_per_second(lhs) >= ticks_per_second(rhs) ? lhs : rhs;
}

auto promote_int(const dt::Int& l, const dt::Int& r) -> DType {
    if (l.is_signed == r.is_signed) {
        return dt::Int{.bits = std::max(l.bits, r.bits), .is_signed = l.is_signed};
    }
    const dt::Int& s = l.is_signed ? l : r;
    const dt::Int& u = l.is_signed ? r : l;
    if (s.bits > u.bits) {
        return s;
    }
    if (u.bits < 64) {
        return dt::Int{.bits = static_cast<std::uint8_t>(u.bits * 2), .is_signed = true};
    }
    // Int64 ⊔ UInt64 has no integer representation.
    return DType::float64();
}

auto promote_int_float(const dt::Int& i, const dt::Float& f) -> DType {
    if (i.bits > 16) {
        return DType::float64();
    }
    return dt::Float{.bits = std::max<std::uint8_t>(f.bits, 32)};
}

// Ordered-pair promotion; the public entry point tries both argument orders.
auto promote_ordered(const DType& lhs, const DType& rhs) -> std::optional<DType> {
    if (lhs == rhs) {
        return lhs;
    }
    if (lhs.is_unknown() || rhs.is_unknown()) {
        return DType::unknown();
    }
    if (lhs.is<dt::Boolean>() && rhs.is_numeric()) {
        return rhs;
    }
    if (const auto* l = lhs.get_if<dt::Int>()) {
        if (const auto* r = rhs.get_if<dt::Int>()) {
            return promote_int(*l, *r);
        }
        if (const auto* r = rhs.get_if<dt::Float>()) {
            return promote_int_float(*l, *r);
        }
        return std::nullopt;
    }
    if (const auto* l = lhs.get_if<dt::Float>()) {
        if (const auto* r = rhs.get_if<dt::Float>()) {
            return dt::Float{.bits = std::max(l->bits, r->bits)};
        }
        return std::nullopt;
    }
    if (lhs.is<dt::Date>()) {
        if (const auto* r = rhs.get_if<dt::Datetime>()) {
            return *r;
        }
        return std::nullopt;
    }
    if (const auto* l = lhs.get_if<dt::Datetime>()) {
        if (const auto* r = rhs.get_if<dt::Datetime>()) {
            if (l->time_zone != r->time_zone) {
                return std::nullopt;
            }
            return dt::Datetime{.unit = finer(l->unit, r->unit), .time_zone = l->time_zone};
        }
        return std::nullopt;
    }
    if (const auto* l = lhs.get_if<dt::Duration>()) {
        if (const auto* r = rhs.get_if<dt::Duration>()) {
            return dt::Duration{.unit = finer(l->unit, r->unit)};
        }
        return std::nullopt;
    }
    if (const auto* l = lhs.get_if<dt::List>()) {
        if (const auto* r = rhs.get_if<dt::List>()) {
            auto inner = promote(*l->inner, *r->inner);
            if (!inner) {
                return std::nullopt;
            }
            return DType::list(std::move(*inner));
        }
        return std::nullopt;
    }
    if (const auto* l = lhs.get_if<dt::Struct>()) {
        const auto* r = rhs.get_if<dt::Struct>();
        if (r == nullptr || l->fields.size() != r->fields.size()) {
            return std::nullopt;
        }
        std::vector<std::pair<std::string, DType>> fields;
        fields.reserve(l->fields.size());
        for (std::size_t i = 0; i < l->fields.size(); ++i) {
            if (l->fields[i].name != r->fields[i].name) {
                return std::nullopt;
            }
            auto field = promote(*l->fields[i].dtype, *r->fields[i].dtype);
            if (!field) {
                return std::nullopt;
            }
            fields.emplace_back(l->fields[i].name, std::move(*field));
        }
        return DType::structure(std::move(fields));
    }
    return std::nullopt;
}

auto int_name(const dt::Int& i) -> std::string {
    return fmt::format("{}Int{}", i.is_signed ? "" : "U", i.bits);
}

}  // namespace

auto DType::list(DType inner) -> DType {
    return dt::List{.inner = std::make_shared<const DType>(std::move(inner))};
}

auto DType::structure(std::vector<std::pair<std::string, DType>> fields) -> DType {
    dt::Struct s;
    s.fields.reserve(fields.size());
    for (auto& [name, dtype] : fields) {
        s.fields.push_back(
            Field{.name = std::move(name), .dtype = std::make_shared<const DType>(std::move(dtype))});
    }
    return s;
}

auto DType::is_numeric() const noexcept -> bool {
    return is<dt::Int>() || is<dt::Float>();
}

auto DType::is_signed_integer() const noexcept -> bool {
    const auto* i = get_if<dt::Int>();
    return i != nullptr && i->is_signed;
}

auto DType::is_unsigned_integer() const noexcept -> bool {
    const auto* i = get_if<dt::Int>();
    return i != nullptr && !i->is_signed;
}

auto DType::is_temporal() const noexcept -> bool {
    return is<dt::Date>() || is<dt::Datetime>() || is<dt::Duration>();
}

auto DType::is_nested() const noexcept -> bool {
    return is<dt::List>() || is<dt::Struct>();
}

auto DType::to_string() const -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, dt::Int>) {
                return int_name(v);
            } else if constexpr (std::is_same_v<T, dt::Float>) {
                return fmt::format("Float{}", v.bits);
            } else if constexpr (std::is_same_v<T, dt::Boolean>) {
                return "Boolean";
            } else if constexpr (std::is_same_v<T, dt::String>) {
                return "String";
            } else if constexpr (std::is_same_v<T, dt::Date>) {
                return "Date";
            } else if constexpr (std::is_same_v<T, dt::Datetime>) {
                return fmt::format("Datetime(time_unit='{}', time_zone={})", unit_suffix(v.unit),
                                   v.time_zone ? fmt::format("'{}'", *v.time_zone) : "None");
            } else if constexpr (std::is_same_v<T, dt::Duration>) {
                return fmt::format("Duration(time_unit='{}')", unit_suffix(v.unit));
            } else if constexpr (std::is_same_v<T, dt::List>) {
                return fmt::format("List({})", v.inner->to_string());
            } else if constexpr (std::is_same_v<T, dt::Struct>) {
                std::string out = "Struct({";
                for (std::size_t i = 0; i < v.fields.size(); ++i) {
                    if (i > 0) {
                        out.append(", ");
                    }
                    out.append(fmt::format("'{}': {}", v.fields[i].name,
                                           v.fields[i].dtype->to_string()));
                }
                out.append("})");
                return out;
            } else {
                return "Unknown";
            }
        },
        value_);
}

auto promote(const DType& lhs, const DType& rhs) -> std::optional<DType> {
    if (auto out = promote_ordered(lhs, rhs)) {
        return out;
    }
    return promote_ordered(rhs, lhs);
}

auto supertype(const DType& lhs, const DType& rhs) -> Result<DType> {
    if (auto out = promote(lhs, rhs)) {
        return std::move(*out);
    }
    return make_error(ErrorKind::DtypeMismatch,
                      fmt::format("no common supertype for {} and {}", lhs.to_string(),
                                  rhs.to_string()));
}

// ─── Schema ───────────────────────────────────────────────────────────────────

Schema::Schema(std::initializer_list<Entry> entries) {
    for (const auto& [name, dtype] : entries) {
        set(name, dtype);
    }
}

void Schema::set(std::string name, DType dtype) {
    if (auto it = index_.find(name); it != index_.end()) {
        entries_[it->second].second = std::move(dtype);
        return;
    }
    index_.emplace(name, entries_.size());
    entries_.emplace_back(std::move(name), std::move(dtype));
}

auto Schema::find(const std::string& name) const -> const DType* {
    if (auto it = index_.find(name); it != index_.end()) {
        return &entries_[it->second].second;
    }
    return nullptr;
}

auto Schema::names() const -> std::vector<std::string> {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& entry : entries_) {
        out.push_back(entry.first);
    }
    return out;
}

}  // namespace tessera
