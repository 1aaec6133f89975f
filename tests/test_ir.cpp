#include <tessera/ir/analysis.hpp>
#include <tessera/ir/expr.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

using namespace tessera;

namespace {

auto names_of(const std::vector<ir::ExprPtr>& exprs) -> std::vector<std::string> {
    std::vector<std::string> out;
    for (const auto& e : exprs) {
        out.push_back(ir::output_name(*e));
    }
    return out;
}

auto i64_bound(std::int64_t value) -> Scalar {
    return value;
}

const Schema kSchema{
    {"a", DType::int64()},
    {"b", DType::float64()},
    {"c", DType::string()},
};

}  // namespace

TEST_CASE("Expressions are immutable", "[ir][expr]") {
    const auto base = col("a");
    const auto derived = base + 1;

    REQUIRE(std::holds_alternative<ir::ColumnRef>(base.node()->node));
    REQUIRE(std::holds_alternative<ir::BinaryOp>(derived.node()->node));
    REQUIRE(std::get<ir::BinaryOp>(derived.node()->node).left == base.node());
}

TEST_CASE("Plain values become weak literals", "[ir][expr]") {
    const auto expr = col("a") * 2;
    const auto& bin = std::get<ir::BinaryOp>(expr.node()->node);
    const auto& literal = std::get<ir::Literal>(bin.right->node);
    REQUIRE(literal.weak);
    REQUIRE(std::get<std::int64_t>(literal.value) == 2);

    const auto typed = lit(Scalar{std::int64_t{2}}, DType::int32());
    REQUIRE_FALSE(std::get<ir::Literal>(typed.node()->node).weak);
}

TEST_CASE("output_name follows the left-most root", "[ir][names]") {
    REQUIRE(ir::output_name(*(col("a") + col("b")).node()) == "a");
    REQUIRE(ir::output_name(*(lit(Scalar{1.0}) + col("b")).node()) == "literal");
    REQUIRE(ir::output_name(*col("a").sum().node()) == "a");
    REQUIRE(ir::output_name(*len().node()) == "len");
    REQUIRE(ir::output_name(*(col("a") * 2).alias("doubled").node()) == "doubled");
    REQUIRE(ir::output_name(*max_horizontal({col("b"), col("a")}).node()) == "b");
}

TEST_CASE("Name mappings", "[ir][names]") {
    REQUIRE(ir::output_name(*col("abc").name().to_uppercase().node()) == "ABC");
    REQUIRE(ir::output_name(*col("ABC").name().to_lowercase().node()) == "abc");
    REQUIRE(ir::output_name(*col("a").name().prefix("x_").node()) == "x_a");
    REQUIRE(ir::output_name(*col("a").name().suffix("_y").node()) == "a_y");
    REQUIRE(ir::output_name(*(col("a") + 1).alias("z").name().keep().node()) == "a");
}

TEST_CASE("Name mappings after an alias rename the alias", "[ir][names]") {
    const auto aliased = col("foo").alias("alias_for_foo");
    REQUIRE(ir::output_name(*aliased.name().to_uppercase().node()) == "ALIAS_FOR_FOO");
    REQUIRE(ir::output_name(*aliased.name().prefix("p_").node()) == "p_alias_for_foo");
    REQUIRE(ir::output_name(*aliased.name().suffix("_s").node()) == "alias_for_foo_s");
    REQUIRE(ir::output_name(*col("FOO").alias("Bar").name().to_lowercase().node()) == "bar");
    REQUIRE(ir::output_name(*aliased.name().keep().node()) == "foo");
    REQUIRE(ir::output_name(*(col("a") * 2).name().suffix("_x").node()) == "a_x");
}

TEST_CASE("Structural queries", "[ir][analysis]") {
    SECTION("column-ref-only fast path") {
        REQUIRE(ir::is_column_ref_only(*col("a").node()));
        REQUIRE(ir::is_column_ref_only(*col("a").alias("b").node()));
        REQUIRE_FALSE(ir::is_column_ref_only(*(col("a") + 1).node()));
    }

    SECTION("aggregations under a window do not count") {
        REQUIRE(ir::contains_aggregation(*(col("a").sum() / 2).node()));
        REQUIRE_FALSE(ir::contains_aggregation(*col("a").sum().over({"c"}).node()));
        REQUIRE_FALSE(ir::contains_aggregation(*col("a").abs().node()));
    }

    SECTION("order dependence") {
        REQUIRE(ir::is_order_dependent(*col("a").cum_sum().node()));
        REQUIRE(ir::is_order_dependent(*col("a").shift(1).node()));
        REQUIRE_FALSE(ir::is_order_dependent(*col("a").rank().node()));
        REQUIRE_FALSE(ir::is_order_dependent(*col("a").mean().over({"c"}).node()));
        REQUIRE(ir::is_order_dependent(*col("a").rolling_sum(3).node()));
        REQUIRE(ir::is_order_dependent(*col("c").is_first_distinct().node()));
        REQUIRE_FALSE(ir::is_order_dependent(*col("c").is_unique().node()));
    }

    SECTION("referenced columns include window keys") {
        const auto expr = (col("a") + col("b")).cum_sum().over({"c"}, {"a"});
        REQUIRE(ir::referenced_columns(*expr.node()) == std::vector<std::string>{"a", "b", "c"});
    }

    SECTION("collected operations") {
        const auto ops = ir::collect_operations(*(col("a") > 0 & col("b").is_null()).node());
        REQUIRE(ops.contains(ir::OpKey{.kind = ir::NodeKind::Binary,
                                       .op = static_cast<std::uint8_t>(ir::BinaryKind::And)}));
        REQUIRE(ops.contains(ir::OpKey{.kind = ir::NodeKind::Binary,
                                       .op = static_cast<std::uint8_t>(ir::BinaryKind::Gt)}));
        REQUIRE(ops.contains(ir::OpKey{.kind = ir::NodeKind::Unary,
                                       .op = static_cast<std::uint8_t>(ir::UnaryKind::IsNull)}));
        REQUIRE(ops.contains(ir::OpKey{.kind = ir::NodeKind::ColumnRef}));
    }
}

TEST_CASE("OpKey rendering names the operation", "[ir][node]") {
    REQUIRE(ir::to_string(ir::op_key(*col("a").floordiv(2).node())) == "binary op 'floordiv'");
    REQUIRE(ir::to_string(ir::op_key(*col("a").rank().node())) == "window function 'rank'");
    REQUIRE(ir::to_string(ir::op_key(*col("a").clip(i64_bound(0), i64_bound(1)).node())) ==
            "unary op 'clip'");
    REQUIRE(ir::to_string(ir::op_key(*col("a").rolling_std(2).node())) ==
            "window function 'rolling_std'");
    REQUIRE(ir::to_string(ir::op_key(*col("c").is_last_distinct().node())) ==
            "window function 'is_last_distinct'");
    REQUIRE_FALSE(ir::all_operations().empty());
}

TEST_CASE("Operation options survive expansion", "[ir][expand]") {
    const auto out = ir::expand(cols({"a", "b"}).clip(i64_bound(0), 2.5).node(), kSchema);
    REQUIRE(out.has_value());
    REQUIRE(out->size() == 2);
    for (const auto& e : *out) {
        const auto& op = std::get<ir::UnaryOp>(e->node);
        REQUIRE(op.options.lower == Scalar{std::int64_t{0}});
        REQUIRE(op.options.upper == Scalar{2.5});
    }

    const auto rolling = col("a").rolling_var(4, std::nullopt, true, 0);
    const auto& win = std::get<ir::WindowFunction>(rolling.node()->node);
    REQUIRE(win.options.window_size == 4);
    REQUIRE(win.options.min_samples == 4);
    REQUIRE(win.options.center);
    REQUIRE(win.options.ddof == 0);
}

TEST_CASE("expand: multi-output selections", "[ir][expand]") {
    SECTION("all() expands in schema order") {
        auto out = ir::expand(all().node(), kSchema);
        REQUIRE(out.has_value());
        REQUIRE(names_of(*out) == std::vector<std::string>{"a", "b", "c"});
    }

    SECTION("an elementwise chain maps over each column") {
        auto out = ir::expand((cols({"a", "b"}) * 2).name().suffix("_x2").node(), kSchema);
        REQUIRE(out.has_value());
        REQUIRE(names_of(*out) == std::vector<std::string>{"a_x2", "b_x2"});
    }

    SECTION("horizontal reductions flatten their operands") {
        auto out = ir::expand(sum_horizontal({cols({"a", "b"})}).node(), kSchema);
        REQUIRE(out.has_value());
        REQUIRE(out->size() == 1);
        const auto& hor = std::get<ir::HorizontalReduction>(out->front()->node);
        REQUIRE(hor.operands.size() == 2);
    }

    SECTION("two multi-output sides are rejected") {
        auto out = ir::expand((cols({"a", "b"}) + all()).node(), kSchema);
        REQUIRE_FALSE(out.has_value());
        REQUIRE(out.error().kind == ErrorKind::InvalidOperation);
    }

    SECTION("an alias over several columns is rejected") {
        auto out = ir::expand(cols({"a", "b"}).alias("x").node(), kSchema);
        REQUIRE_FALSE(out.has_value());
        REQUIRE(out.error().kind == ErrorKind::InvalidOperation);
    }

    SECTION("unknown columns") {
        auto out = ir::expand(col("missing").node(), kSchema);
        REQUIRE_FALSE(out.has_value());
        REQUIRE(out.error().kind == ErrorKind::ColumnNotFound);
    }

    SECTION("single-output expressions are returned as is") {
        const auto expr = (col("a") + 1).node();
        auto out = ir::expand(expr, kSchema);
        REQUIRE(out.has_value());
        REQUIRE(out->front() == expr);
    }
}
