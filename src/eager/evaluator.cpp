#include <tessera/eager/evaluator.hpp>

#include <tessera/eager/kernels.hpp>
#include <tessera/ir/analysis.hpp>

#include <fmt/format.h>
#include <robin_hood.h>

#include <algorithm>
#include <cmath>
#include <numeric>
#include <optional>

namespace tessera::eager {

using normalize::BooleanStrategy;

namespace {

struct Evaluated {
    Values values;
    DType dtype;
};

auto convert(Evaluated input, const DType& target) -> Result<Evaluated> {
    if (input.dtype == target) {
        return input;
    }
    auto entry = make_entry("", input.dtype, input.values);
    if (!entry) {
        return std::unexpected(entry.error());
    }
    auto converted = cast(*entry, target);
    if (!converted) {
        return std::unexpected(converted.error());
    }
    return Evaluated{.values = values_of(*converted), .dtype = target};
}

auto is_nan(const Scalar& value) -> bool {
    const auto* d = std::get_if<double>(&value);
    return d != nullptr && std::isnan(*d);
}

/// compare_values with NaN sorted after every number.
auto sort_order(const Scalar& lhs, const Scalar& rhs) -> std::partial_ordering {
    auto order = compare_values(lhs, rhs);
    if (order != std::partial_ordering::unordered) {
        return order;
    }
    const bool l = is_nan(lhs);
    const bool r = is_nan(rhs);
    if (l == r) {
        return std::partial_ordering::equivalent;
    }
    return l ? std::partial_ordering::greater : std::partial_ordering::less;
}

class Evaluator {
   public:
    Evaluator(const Table& table, BooleanStrategy boolean)
        : table_(table), schema_(table.schema()), boolean_(boolean) {}

    auto eval(const ir::Expr& expr) -> Result<Evaluated> {
        return std::visit(
            [&](const auto& node) -> Result<Evaluated> {
                using T = std::decay_t<decltype(node)>;
                if constexpr (std::is_same_v<T, ir::ColumnRef>) {
                    const auto* entry = table_.find_entry(node.name);
                    if (entry == nullptr) {
                        return make_error(ErrorKind::ColumnNotFound,
                                          fmt::format("column '{}' not found", node.name));
                    }
                    return Evaluated{.values = values_of(*entry), .dtype = entry->dtype};
                } else if constexpr (std::is_same_v<T, ir::Selection>) {
                    return make_error(ErrorKind::InvalidOperation,
                                      "multi-output selection must be expanded before evaluation");
                } else if constexpr (std::is_same_v<T, ir::Literal>) {
                    return typed(expr, Values{node.value});
                } else if constexpr (std::is_same_v<T, ir::UnaryOp>) {
                    return eval_unary(expr, node);
                } else if constexpr (std::is_same_v<T, ir::BinaryOp>) {
                    return eval_binary(expr, node);
                } else if constexpr (std::is_same_v<T, ir::Aggregation>) {
                    return eval_aggregation(expr, node);
                } else if constexpr (std::is_same_v<T, ir::WindowFunction>) {
                    return eval_window(expr, node);
                } else if constexpr (std::is_same_v<T, ir::HorizontalReduction>) {
                    return eval_horizontal(expr, node);
                } else if constexpr (std::is_same_v<T, ir::Cast>) {
                    auto operand = eval(*node.operand);
                    if (!operand) {
                        return operand;
                    }
                    return convert(std::move(*operand), node.dtype);
                } else {
                    return eval(*node.operand);
                }
            },
            expr.node);
    }

   private:
    auto typed(const ir::Expr& expr, Values values) -> Result<Evaluated> {
        auto dtype = normalize::infer_dtype(expr, schema_);
        if (!dtype) {
            return std::unexpected(dtype.error());
        }
        return Evaluated{.values = std::move(values), .dtype = std::move(*dtype)};
    }

    auto broadcast_to_rows(Values values) const -> Values {
        if (values.size() == 1 && table_.rows() != 1) {
            return Values(table_.rows(), values.front());
        }
        return values;
    }

    auto eval_unary(const ir::Expr& expr, const ir::UnaryOp& node) -> Result<Evaluated> {
        auto operand = eval(*node.operand);
        if (!operand) {
            return operand;
        }
        if (node.kind == ir::UnaryKind::Clip) {
            // Float bounds widen an integer operand.
            auto target = normalize::infer_dtype(expr, schema_);
            if (!target) {
                return std::unexpected(target.error());
            }
            operand = convert(std::move(*operand), *target);
            if (!operand) {
                return operand;
            }
        }
        auto values = unary(node.kind, operand->values, boolean_, node.options);
        if (!values) {
            return std::unexpected(values.error());
        }
        return typed(expr, std::move(*values));
    }

    auto eval_binary(const ir::Expr& expr, const ir::BinaryOp& node) -> Result<Evaluated> {
        auto target = normalize::operand_dtype(node, schema_);
        if (!target) {
            return std::unexpected(target.error());
        }
        auto lhs = eval(*node.left);
        if (!lhs) {
            return lhs;
        }
        auto rhs = eval(*node.right);
        if (!rhs) {
            return rhs;
        }
        auto l = convert(std::move(*lhs), *target);
        if (!l) {
            return l;
        }
        auto r = convert(std::move(*rhs), *target);
        if (!r) {
            return r;
        }
        auto values = binary(node.kind, l->values, r->values, boolean_);
        if (!values) {
            return std::unexpected(values.error());
        }
        return typed(expr, std::move(*values));
    }

    auto eval_aggregation(const ir::Expr& expr, const ir::Aggregation& node)
        -> Result<Evaluated> {
        if (!node.operand) {
            return typed(expr, Values{static_cast<std::int64_t>(table_.rows())});
        }
        auto operand = eval(*node.operand);
        if (!operand) {
            return operand;
        }
        auto values = std::move(operand->values);
        if (!ir::contains_aggregation(*node.operand)) {
            values = broadcast_to_rows(std::move(values));
        }
        auto result = reduce(node, values);
        if (!result) {
            return std::unexpected(result.error());
        }
        return typed(expr, Values{std::move(*result)});
    }

    auto eval_window(const ir::Expr& expr, const ir::WindowFunction& node) -> Result<Evaluated> {
        auto groups = group_rows(table_, node.partition_by);
        if (!groups) {
            return std::unexpected(groups.error());
        }
        std::vector<SortKey> order;
        for (const auto& name : node.order_by) {
            order.push_back(SortKey{.name = name});
        }
        const std::size_t rows = table_.rows();
        Values out(rows);

        Values operand;
        if (node.kind != ir::WindowKind::Over) {
            auto evaluated = eval(*node.operand);
            if (!evaluated) {
                return evaluated;
            }
            operand = broadcast_to_rows(std::move(evaluated->values));
        }

        for (auto& group : *groups) {
            if (group.empty()) {
                continue;
            }
            auto ordered = sort_rows(table_, std::move(group), order);
            if (!ordered) {
                return std::unexpected(ordered.error());
            }
            Values result;
            if (node.kind == ir::WindowKind::Over) {
                // The operand sees only the partition's rows.
                auto part = take(table_, *ordered);
                Evaluator inner(part, boolean_);
                auto evaluated = inner.eval(*node.operand);
                if (!evaluated) {
                    return evaluated;
                }
                result = std::move(evaluated->values);
                if (result.size() == 1) {
                    Scalar value = std::move(result.front());
                    result.assign(ordered->size(), value);
                }
            } else {
                Values gathered;
                gathered.reserve(ordered->size());
                for (auto row : *ordered) {
                    gathered.push_back(operand[row]);
                }
                auto computed = window(node, gathered);
                if (!computed) {
                    return std::unexpected(computed.error());
                }
                result = std::move(*computed);
            }
            if (result.size() != ordered->size()) {
                return make_error(ErrorKind::InvalidOperation,
                                  fmt::format("window function '{}' produced {} rows for a "
                                              "partition of {}",
                                              ir::to_string(node.kind), result.size(),
                                              ordered->size()));
            }
            for (std::size_t k = 0; k < ordered->size(); ++k) {
                out[(*ordered)[k]] = std::move(result[k]);
            }
        }
        return typed(expr, std::move(out));
    }

    auto eval_horizontal(const ir::Expr& expr, const ir::HorizontalReduction& node)
        -> Result<Evaluated> {
        std::vector<Evaluated> operands;
        std::optional<DType> common;
        std::size_t rows = 1;
        for (const auto& child : node.operands) {
            auto evaluated = eval(*child);
            if (!evaluated) {
                return evaluated;
            }
            if (evaluated->values.size() != 1) {
                rows = evaluated->values.size();
            }
            if (!common) {
                common = evaluated->dtype;
            } else {
                auto joined = supertype(*common, evaluated->dtype);
                if (!joined) {
                    return std::unexpected(joined.error());
                }
                common = std::move(*joined);
            }
            operands.push_back(std::move(*evaluated));
        }
        if (!common) {
            // Typing reports the missing operands.
            return typed(expr, Values{});
        }
        std::vector<Values> values;
        values.reserve(operands.size());
        for (auto& operand : operands) {
            auto converted = convert(std::move(operand), *common);
            if (!converted) {
                return converted;
            }
            values.push_back(std::move(converted->values));
        }
        auto result = horizontal(node, values, rows, boolean_, *common);
        if (!result) {
            return std::unexpected(result.error());
        }
        return typed(expr, std::move(*result));
    }

    const Table& table_;
    Schema schema_;
    BooleanStrategy boolean_;
};

}  // namespace

auto evaluate(const Table& table, const ir::Expr& expr, BooleanStrategy boolean)
    -> Result<ColumnEntry> {
    Evaluator evaluator(table, boolean);
    auto result = evaluator.eval(expr);
    if (!result) {
        return std::unexpected(result.error());
    }
    return make_entry(ir::output_name(expr), result->dtype, result->values);
}

auto group_rows(const Table& table, const std::vector<std::string>& keys)
    -> Result<std::vector<std::vector<std::size_t>>> {
    const std::size_t rows = table.rows();
    std::vector<std::vector<std::size_t>> groups;
    if (keys.empty()) {
        groups.emplace_back(rows);
        std::iota(groups.front().begin(), groups.front().end(), std::size_t{0});
        return groups;
    }
    std::vector<const ColumnEntry*> entries;
    for (const auto& name : keys) {
        const auto* entry = table.find_entry(name);
        if (entry == nullptr) {
            return make_error(ErrorKind::ColumnNotFound,
                              fmt::format("group key '{}' not found", name));
        }
        entries.push_back(entry);
    }

    robin_hood::unordered_flat_map<Key, std::size_t, KeyHash> ids;
    ids.reserve(rows);
    for (std::size_t row = 0; row < rows; ++row) {
        Key key;
        key.values.reserve(entries.size());
        for (const auto* entry : entries) {
            key.values.push_back(value_at(*entry, row));
        }
        auto [it, inserted] = ids.try_emplace(std::move(key), groups.size());
        if (inserted) {
            groups.emplace_back();
        }
        groups[it->second].push_back(row);
    }
    return groups;
}

auto sort_rows(const Table& table, std::vector<std::size_t> rows, const std::vector<SortKey>& keys)
    -> Result<std::vector<std::size_t>> {
    if (keys.empty()) {
        return rows;
    }
    std::vector<Values> columns;
    columns.reserve(keys.size());
    for (const auto& key : keys) {
        const auto* entry = table.find_entry(key.name);
        if (entry == nullptr) {
            return make_error(ErrorKind::ColumnNotFound,
                              fmt::format("sort key '{}' not found", key.name));
        }
        columns.push_back(values_of(*entry));
    }
    std::ranges::stable_sort(rows, [&](std::size_t a, std::size_t b) {
        for (std::size_t k = 0; k < keys.size(); ++k) {
            const auto& va = columns[k][a];
            const auto& vb = columns[k][b];
            const bool na = tessera::is_null(va);
            const bool nb = tessera::is_null(vb);
            if (na && nb) {
                continue;
            }
            if (na != nb) {
                return keys[k].nulls_last ? nb : na;
            }
            auto order = sort_order(va, vb);
            if (order == std::partial_ordering::less) {
                return !keys[k].descending;
            }
            if (order == std::partial_ordering::greater) {
                return keys[k].descending;
            }
        }
        return false;
    });
    return rows;
}

}  // namespace tessera::eager
