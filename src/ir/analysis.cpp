#include <tessera/ir/analysis.hpp>

#include <tessera/ir/builder.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <functional>

namespace tessera::ir {

namespace {

auto any_node(const Expr& expr, const std::function<bool(const Expr&)>& pred) -> bool {
    if (pred(expr)) {
        return true;
    }
    bool found = false;
    for_each_child(expr, [&](const Expr& child) { found = found || any_node(child, pred); });
    return found;
}

/// Selection leaf reachable without crossing a horizontal reduction.
auto feeds_multi_output(const Expr& expr) -> bool {
    if (std::holds_alternative<Selection>(expr.node)) {
        return true;
    }
    if (std::holds_alternative<HorizontalReduction>(expr.node)) {
        return false;
    }
    bool found = false;
    for_each_child(expr, [&](const Expr& child) { found = found || feeds_multi_output(child); });
    return found;
}

auto map_name(const std::string& name, const NameMap& mapping) -> std::string {
    std::string out = name;
    switch (mapping.mapping) {
        case NameMapping::Keep:
            break;
        case NameMapping::ToUppercase:
            std::ranges::transform(out, out.begin(), [](unsigned char ch) {
                return static_cast<char>(std::toupper(ch));
            });
            break;
        case NameMapping::ToLowercase:
            std::ranges::transform(out, out.begin(), [](unsigned char ch) {
                return static_cast<char>(std::tolower(ch));
            });
            break;
        case NameMapping::Prefix:
            out = mapping.affix + out;
            break;
        case NameMapping::Suffix:
            out += mapping.affix;
            break;
    }
    return out;
}

auto require_column(const Schema& schema, const std::string& name) -> Result<void> {
    if (!schema.contains(name)) {
        return make_error(ErrorKind::ColumnNotFound, fmt::format("column '{}' not found", name));
    }
    return {};
}

using Expanded = std::vector<ExprPtr>;

/// Rebuild a single-operand node over each expansion of its operand.
auto map_operand(const ExprPtr& node, const ExprPtr& operand, Expanded expanded,
                 const std::function<ExprPtr(ExprPtr)>& rebuild) -> Expanded {
    if (expanded.size() == 1 && expanded.front() == operand) {
        return {node};
    }
    Expanded out;
    out.reserve(expanded.size());
    for (auto& e : expanded) {
        out.push_back(rebuild(std::move(e)));
    }
    return out;
}

auto expand_node(const ExprPtr& expr, const Schema& schema) -> Result<Expanded>;

auto expand_operand(const ExprPtr& expr, const ExprPtr& operand, const Schema& schema,
                    const std::function<ExprPtr(ExprPtr)>& rebuild) -> Result<Expanded> {
    auto expanded = expand_node(operand, schema);
    if (!expanded) {
        return std::unexpected(expanded.error());
    }
    return map_operand(expr, operand, std::move(*expanded), rebuild);
}

auto expand_node(const ExprPtr& expr, const Schema& schema) -> Result<Expanded> {
    const auto& node = expr->node;

    if (const auto* ref = std::get_if<ColumnRef>(&node)) {
        if (auto ok = require_column(schema, ref->name); !ok) {
            return std::unexpected(ok.error());
        }
        return Expanded{expr};
    }
    if (const auto* sel = std::get_if<Selection>(&node)) {
        std::vector<std::string> names = sel->all ? schema.names() : sel->names;
        Expanded out;
        out.reserve(names.size());
        for (auto& name : names) {
            if (auto ok = require_column(schema, name); !ok) {
                return std::unexpected(ok.error());
            }
            out.push_back(column(std::move(name)));
        }
        return out;
    }
    if (std::holds_alternative<Literal>(node)) {
        return Expanded{expr};
    }
    if (const auto* un = std::get_if<UnaryOp>(&node)) {
        return expand_operand(expr, un->operand, schema,
                              [kind = un->kind, options = un->options](ExprPtr e) {
                                  return unary(kind, std::move(e), options);
                              });
    }
    if (const auto* bin = std::get_if<BinaryOp>(&node)) {
        if (feeds_multi_output(*bin->left) && feeds_multi_output(*bin->right)) {
            return make_error(ErrorKind::InvalidOperation,
                              fmt::format("binary op '{}' combines two multi-output expressions",
                                          to_string(bin->kind)));
        }
        auto left = expand_node(bin->left, schema);
        if (!left) {
            return std::unexpected(left.error());
        }
        auto right = expand_node(bin->right, schema);
        if (!right) {
            return std::unexpected(right.error());
        }
        if (left->size() == 1 && right->size() == 1) {
            if (left->front() == bin->left && right->front() == bin->right) {
                return Expanded{expr};
            }
            return Expanded{binary(bin->kind, left->front(), right->front())};
        }
        Expanded out;
        const std::size_t n = std::max(left->size(), right->size());
        out.reserve(n);
        for (std::size_t i = 0; i < n; ++i) {
            const auto& l = left->size() == 1 ? left->front() : (*left)[i];
            const auto& r = right->size() == 1 ? right->front() : (*right)[i];
            out.push_back(binary(bin->kind, l, r));
        }
        return out;
    }
    if (const auto* agg = std::get_if<Aggregation>(&node)) {
        if (!agg->operand) {
            return Expanded{expr};
        }
        return expand_operand(expr, agg->operand, schema,
                              [kind = agg->kind, options = agg->options](ExprPtr e) {
                                  return aggregation(kind, std::move(e), options);
                              });
    }
    if (const auto* win = std::get_if<WindowFunction>(&node)) {
        for (const auto& key : win->partition_by) {
            if (auto ok = require_column(schema, key); !ok) {
                return std::unexpected(ok.error());
            }
        }
        for (const auto& key : win->order_by) {
            if (auto ok = require_column(schema, key); !ok) {
                return std::unexpected(ok.error());
            }
        }
        return expand_operand(expr, win->operand, schema, [win](ExprPtr e) {
            return window(win->kind, std::move(e), win->partition_by, win->order_by,
                          win->options);
        });
    }
    if (const auto* hor = std::get_if<HorizontalReduction>(&node)) {
        Expanded operands;
        for (const auto& operand : hor->operands) {
            auto expanded = expand_node(operand, schema);
            if (!expanded) {
                return std::unexpected(expanded.error());
            }
            operands.insert(operands.end(), expanded->begin(), expanded->end());
        }
        if (operands.empty()) {
            return make_error(ErrorKind::InvalidOperation,
                              fmt::format("{} needs at least one operand", to_string(hor->kind)));
        }
        return Expanded{horizontal(hor->kind, std::move(operands), hor->ignore_nulls)};
    }
    if (const auto* c = std::get_if<Cast>(&node)) {
        return expand_operand(expr, c->operand, schema,
                              [dtype = c->dtype](ExprPtr e) { return cast(std::move(e), dtype); });
    }
    if (const auto* a = std::get_if<Alias>(&node)) {
        auto expanded = expand_node(a->operand, schema);
        if (!expanded) {
            return std::unexpected(expanded.error());
        }
        if (expanded->size() != 1) {
            return make_error(ErrorKind::InvalidOperation,
                              fmt::format("alias '{}' applied to {} columns would duplicate "
                                          "output names",
                                          a->name, expanded->size()));
        }
        return map_operand(expr, a->operand, std::move(*expanded),
                           [name = a->name](ExprPtr e) { return alias(std::move(e), name); });
    }
    const auto& nm = std::get<NameMap>(node);
    return expand_operand(expr, nm.operand, schema, [nm](ExprPtr e) {
        return name_map(std::move(e), nm.mapping, nm.affix);
    });
}

}  // namespace

auto is_column_ref_only(const Expr& expr) -> bool {
    if (std::holds_alternative<ColumnRef>(expr.node)) {
        return true;
    }
    if (const auto* a = std::get_if<Alias>(&expr.node)) {
        return is_column_ref_only(*a->operand);
    }
    if (const auto* nm = std::get_if<NameMap>(&expr.node)) {
        return is_column_ref_only(*nm->operand);
    }
    return false;
}

auto contains_aggregation(const Expr& expr) -> bool {
    if (std::holds_alternative<Aggregation>(expr.node)) {
        return true;
    }
    if (std::holds_alternative<WindowFunction>(expr.node)) {
        return false;
    }
    bool found = false;
    for_each_child(expr, [&](const Expr& child) { found = found || contains_aggregation(child); });
    return found;
}

auto is_order_dependent(const Expr& expr) -> bool {
    return any_node(expr, [](const Expr& e) {
        const auto* win = std::get_if<WindowFunction>(&e.node);
        return win != nullptr && is_ordered(win->kind);
    });
}

auto has_multi_output(const Expr& expr) -> bool {
    return any_node(expr, [](const Expr& e) { return std::holds_alternative<Selection>(e.node); });
}

auto root_name(const Expr& expr) -> std::string {
    return std::visit(
        [](const auto& node) -> std::string {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, ColumnRef>) {
                return node.name;
            } else if constexpr (std::is_same_v<T, Selection>) {
                return node.names.empty() ? std::string("*") : node.names.front();
            } else if constexpr (std::is_same_v<T, Literal>) {
                return "literal";
            } else if constexpr (std::is_same_v<T, BinaryOp>) {
                return root_name(*node.left);
            } else if constexpr (std::is_same_v<T, HorizontalReduction>) {
                return node.operands.empty() ? std::string("literal")
                                             : root_name(*node.operands.front());
            } else if constexpr (std::is_same_v<T, Aggregation>) {
                return node.operand ? root_name(*node.operand) : std::string("len");
            } else {
                return root_name(*node.operand);
            }
        },
        expr.node);
}

auto output_name(const Expr& expr) -> std::string {
    return std::visit(
        [&expr](const auto& node) -> std::string {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, Alias>) {
                return node.name;
            } else if constexpr (std::is_same_v<T, NameMap>) {
                // keep() undoes aliases; the other mappings rename the nearest alias.
                if (node.mapping == NameMapping::Keep) {
                    return root_name(*node.operand);
                }
                return map_name(output_name(*node.operand), node);
            } else if constexpr (std::is_same_v<T, BinaryOp>) {
                return output_name(*node.left);
            } else if constexpr (std::is_same_v<T, HorizontalReduction>) {
                return node.operands.empty() ? std::string("literal")
                                             : output_name(*node.operands.front());
            } else if constexpr (std::is_same_v<T, UnaryOp> || std::is_same_v<T, Cast> ||
                                 std::is_same_v<T, WindowFunction>) {
                return output_name(*node.operand);
            } else if constexpr (std::is_same_v<T, Aggregation>) {
                return node.operand ? output_name(*node.operand) : std::string("len");
            } else {
                return root_name(expr);
            }
        },
        expr.node);
}

auto referenced_columns(const Expr& expr) -> std::vector<std::string> {
    std::vector<std::string> out;
    auto add = [&out](const std::string& name) {
        if (std::ranges::find(out, name) == out.end()) {
            out.push_back(name);
        }
    };
    std::function<void(const Expr&)> walk = [&](const Expr& e) {
        if (const auto* ref = std::get_if<ColumnRef>(&e.node)) {
            add(ref->name);
        } else if (const auto* sel = std::get_if<Selection>(&e.node)) {
            std::ranges::for_each(sel->names, add);
        } else if (const auto* win = std::get_if<WindowFunction>(&e.node)) {
            walk(*win->operand);
            std::ranges::for_each(win->partition_by, add);
            std::ranges::for_each(win->order_by, add);
            return;
        }
        for_each_child(e, walk);
    };
    walk(expr);
    return out;
}

auto collect_operations(const Expr& expr) -> std::set<OpKey> {
    std::set<OpKey> out;
    std::function<void(const Expr&)> walk = [&](const Expr& e) {
        out.insert(op_key(e));
        for_each_child(e, walk);
    };
    walk(expr);
    return out;
}

auto expand(const ExprPtr& expr, const Schema& schema) -> Result<std::vector<ExprPtr>> {
    return expand_node(expr, schema);
}

auto expand_all(const std::vector<ExprPtr>& exprs, const Schema& schema)
    -> Result<std::vector<ExprPtr>> {
    std::vector<ExprPtr> out;
    for (const auto& expr : exprs) {
        auto expanded = expand_node(expr, schema);
        if (!expanded) {
            return std::unexpected(expanded.error());
        }
        out.insert(out.end(), expanded->begin(), expanded->end());
    }
    return out;
}

}  // namespace tessera::ir
