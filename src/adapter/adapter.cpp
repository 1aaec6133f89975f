#include <tessera/adapter/adapter.hpp>

#include <tessera/ir/analysis.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <functional>
#include <optional>

namespace tessera {

namespace {

auto purpose_name(Purpose purpose) -> std::string_view {
    switch (purpose) {
        case Purpose::WithColumns:
            return "with_columns";
        case Purpose::Select:
            return "select";
        case Purpose::Filter:
            return "filter";
        case Purpose::Aggregate:
            return "agg";
    }
    return "?";
}

/// A Boolean output that can hold null: anything but a plain column, a
/// null test, a distinct flag or a non-null literal.
auto nullable_boolean_output(const ir::Expr& expr, const DType& dtype) -> bool {
    if (!dtype.is<dt::Boolean>() || ir::is_column_ref_only(expr)) {
        return false;
    }
    if (const auto* literal = std::get_if<ir::Literal>(&expr.node)) {
        return is_null(literal->value);
    }
    if (const auto* un = std::get_if<ir::UnaryOp>(&expr.node)) {
        return un->kind != ir::UnaryKind::IsNull && un->kind != ir::UnaryKind::IsNotNull;
    }
    if (const auto* win = std::get_if<ir::WindowFunction>(&expr.node)) {
        return win->kind != ir::WindowKind::IsFirstDistinct &&
               win->kind != ir::WindowKind::IsLastDistinct && win->kind != ir::WindowKind::IsUnique;
    }
    if (const auto* a = std::get_if<ir::Alias>(&expr.node)) {
        return nullable_boolean_output(*a->operand, dtype);
    }
    return true;
}

}  // namespace

auto Adapter::unsupported(std::string_view what) const -> std::unexpected<Error> {
    return ::tessera::unsupported(what, name());
}

auto Adapter::native_error(std::string message) const -> std::unexpected<Error> {
    return make_error(ErrorKind::Native, std::move(message), std::string(name()));
}

auto Adapter::prepare(const std::vector<ir::ExprPtr>& exprs, const Schema& schema,
                      const Config& config, Purpose purpose) const -> Result<Plan> {
    auto expanded = ir::expand_all(exprs, schema);
    if (!expanded) {
        return std::unexpected(expanded.error());
    }
    if (purpose == Purpose::Filter && expanded->size() != 1) {
        return make_error(ErrorKind::InvalidOperation,
                          fmt::format("filter takes exactly one predicate, got {}",
                                      expanded->size()));
    }

    const auto& caps = capabilities();
    Plan plan;
    bool needs_boolean = false;
    std::vector<std::string> seen;

    for (auto& expr : *expanded) {
        // Support set first: unsupported kinds fail before any typing or native call.
        for (const auto& key : ir::collect_operations(*expr)) {
            if (!caps.supports(key)) {
                return unsupported(ir::to_string(key));
            }
        }
        std::optional<Error> window_error;
        std::function<void(const ir::Expr&)> check_windows = [&](const ir::Expr& e) {
            if (const auto* win = std::get_if<ir::WindowFunction>(&e.node)) {
                const auto label = ir::to_string(ir::op_key(e));
                if (!caps.partitioned_windows && !win->partition_by.empty() && !window_error) {
                    window_error = unsupported(fmt::format("partitioned {}", label)).error();
                }
                if (!caps.ordered_rows && win->order_by.empty() &&
                    ir::is_ordered(win->kind) && !window_error) {
                    window_error = unsupported(fmt::format("{} without order_by", label)).error();
                }
            }
            ir::for_each_child(e, check_windows);
        };
        check_windows(*expr);
        if (window_error) {
            return std::unexpected(std::move(*window_error));
        }

        auto dtype = normalize::infer_dtype(*expr, schema);
        if (!dtype) {
            return std::unexpected(dtype.error());
        }
        auto out_name = ir::output_name(*expr);

        if (purpose == Purpose::Filter) {
            if (!dtype->is<dt::Boolean>()) {
                return make_error(ErrorKind::DtypeMismatch,
                                  fmt::format("filter predicate must be Boolean, got {}",
                                              dtype->to_string()));
            }
        } else {
            if (std::ranges::find(seen, out_name) != seen.end()) {
                return make_error(ErrorKind::InvalidOperation,
                                  fmt::format("duplicate output name '{}' in {}", out_name,
                                              purpose_name(purpose)));
            }
            seen.push_back(out_name);
        }
        if (purpose == Purpose::Aggregate && !ir::contains_aggregation(*expr)) {
            return make_error(ErrorKind::InvalidOperation,
                              fmt::format("expression '{}' in agg() does not aggregate", out_name));
        }

        needs_boolean = needs_boolean || normalize::needs_nullable_boolean(*expr) ||
                        nullable_boolean_output(*expr, *dtype);
        plan.columns.push_back(
            PlannedColumn{.name = std::move(out_name), .expr = expr, .dtype = std::move(*dtype)});
    }

    if (needs_boolean) {
        auto strategy = normalize::choose_boolean_strategy(
            caps.nullable_boolean, caps.boolean_upcast, config, name());
        if (!strategy) {
            return std::unexpected(strategy.error());
        }
        plan.boolean = *strategy;
        plan.approximate = *strategy == normalize::BooleanStrategy::NullAsFalse;
        if (plan.approximate) {
            spdlog::warn("[{}] {}: boolean nulls evaluated as False; result is approximate",
                         name(), purpose_name(purpose));
        }
    }

    plan.reduces = purpose == Purpose::Select && !plan.columns.empty() &&
                   std::ranges::all_of(plan.columns, [](const PlannedColumn& c) {
                       return ir::contains_aggregation(*c.expr);
                   });

    spdlog::debug("[{}] prepared {} column(s) for {}, boolean strategy {}{}", name(),
                  plan.columns.size(), purpose_name(purpose), normalize::to_string(plan.boolean),
                  plan.reduces ? ", reducing" : "");
    return plan;
}

}  // namespace tessera
