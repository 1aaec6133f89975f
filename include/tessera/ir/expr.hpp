#pragma once

#include <tessera/ir/builder.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tessera {

class Expr;

/// `.name()` namespace: output names derived from the root column.
class NameOps {
   public:
    explicit NameOps(ir::ExprPtr node) : node_(std::move(node)) {}

    [[nodiscard]] auto keep() const -> Expr;
    [[nodiscard]] auto to_uppercase() const -> Expr;
    [[nodiscard]] auto to_lowercase() const -> Expr;
    [[nodiscard]] auto prefix(std::string prefix) const -> Expr;
    [[nodiscard]] auto suffix(std::string suffix) const -> Expr;

   private:
    ir::ExprPtr node_;
};

/// Fluent wrapper over an immutable IR node.
///
/// Every method returns a new Expr; the wrapped tree is never modified.
/// Plain numbers, booleans and C strings convert implicitly to weak literals so that
/// `col("a") * 2` reads naturally.
class Expr {
   public:
    explicit Expr(ir::ExprPtr node) : node_(std::move(node)) {}
    Expr(int value);           // NOLINT(google-explicit-constructor)
    Expr(std::int64_t value);  // NOLINT(google-explicit-constructor)
    Expr(double value);        // NOLINT(google-explicit-constructor)
    Expr(bool value);          // NOLINT(google-explicit-constructor)
    /// String literal, not a column name.
    Expr(const char* value);  // NOLINT(google-explicit-constructor)

    [[nodiscard]] auto node() const noexcept -> const ir::ExprPtr& { return node_; }

    [[nodiscard]] auto alias(std::string name) const -> Expr;
    [[nodiscard]] auto name() const -> NameOps { return NameOps(node_); }
    [[nodiscard]] auto cast(DType dtype) const -> Expr;

    [[nodiscard]] auto is_null() const -> Expr;
    [[nodiscard]] auto is_not_null() const -> Expr;
    [[nodiscard]] auto abs() const -> Expr;
    [[nodiscard]] auto sqrt() const -> Expr;
    [[nodiscard]] auto exp() const -> Expr;
    [[nodiscard]] auto log(double base = 2.718281828459045) const -> Expr;
    [[nodiscard]] auto round(int decimals = 0) const -> Expr;
    /// Null bounds leave that side open.
    [[nodiscard]] auto clip(Scalar lower, Scalar upper) const -> Expr;

    [[nodiscard]] auto floordiv(const Expr& rhs) const -> Expr;
    [[nodiscard]] auto pow(const Expr& rhs) const -> Expr;
    [[nodiscard]] auto xor_(const Expr& rhs) const -> Expr;

    [[nodiscard]] auto sum() const -> Expr;
    [[nodiscard]] auto mean() const -> Expr;
    [[nodiscard]] auto min() const -> Expr;
    [[nodiscard]] auto max() const -> Expr;
    [[nodiscard]] auto count() const -> Expr;
    [[nodiscard]] auto len() const -> Expr;
    [[nodiscard]] auto n_unique() const -> Expr;
    [[nodiscard]] auto std(int ddof = 1) const -> Expr;
    [[nodiscard]] auto var(int ddof = 1) const -> Expr;
    [[nodiscard]] auto median() const -> Expr;
    [[nodiscard]] auto any() const -> Expr;
    [[nodiscard]] auto all() const -> Expr;

    [[nodiscard]] auto cum_sum(bool reverse = false) const -> Expr;
    [[nodiscard]] auto cum_min(bool reverse = false) const -> Expr;
    [[nodiscard]] auto cum_max(bool reverse = false) const -> Expr;
    [[nodiscard]] auto cum_prod(bool reverse = false) const -> Expr;
    [[nodiscard]] auto cum_count(bool reverse = false) const -> Expr;
    [[nodiscard]] auto shift(std::int64_t periods = 1) const -> Expr;
    [[nodiscard]] auto diff(std::int64_t periods = 1) const -> Expr;
    [[nodiscard]] auto rank(ir::RankMethod method = ir::RankMethod::Average,
                            bool descending = false) const -> Expr;

    /// `min_samples` defaults to `window_size`.
    [[nodiscard]] auto rolling_sum(std::int64_t window_size,
                                   std::optional<std::int64_t> min_samples = std::nullopt,
                                   bool center = false) const -> Expr;
    [[nodiscard]] auto rolling_mean(std::int64_t window_size,
                                    std::optional<std::int64_t> min_samples = std::nullopt,
                                    bool center = false) const -> Expr;
    [[nodiscard]] auto rolling_var(std::int64_t window_size,
                                   std::optional<std::int64_t> min_samples = std::nullopt,
                                   bool center = false, int ddof = 1) const -> Expr;
    [[nodiscard]] auto rolling_std(std::int64_t window_size,
                                   std::optional<std::int64_t> min_samples = std::nullopt,
                                   bool center = false, int ddof = 1) const -> Expr;

    [[nodiscard]] auto is_first_distinct() const -> Expr;
    [[nodiscard]] auto is_last_distinct() const -> Expr;
    [[nodiscard]] auto is_unique() const -> Expr;

    /// On a window function without keys: set its partition and order keys.
    /// On anything else: broadcast the (aggregating) expression per partition.
    [[nodiscard]] auto over(std::vector<std::string> partition_by,
                            std::vector<std::string> order_by = {}) const -> Expr;

    friend auto operator+(const Expr& lhs, const Expr& rhs) -> Expr;
    friend auto operator-(const Expr& lhs, const Expr& rhs) -> Expr;
    friend auto operator*(const Expr& lhs, const Expr& rhs) -> Expr;
    friend auto operator/(const Expr& lhs, const Expr& rhs) -> Expr;
    friend auto operator%(const Expr& lhs, const Expr& rhs) -> Expr;
    friend auto operator==(const Expr& lhs, const Expr& rhs) -> Expr;
    friend auto operator!=(const Expr& lhs, const Expr& rhs) -> Expr;
    friend auto operator<(const Expr& lhs, const Expr& rhs) -> Expr;
    friend auto operator<=(const Expr& lhs, const Expr& rhs) -> Expr;
    friend auto operator>(const Expr& lhs, const Expr& rhs) -> Expr;
    friend auto operator>=(const Expr& lhs, const Expr& rhs) -> Expr;
    friend auto operator&(const Expr& lhs, const Expr& rhs) -> Expr;
    friend auto operator|(const Expr& lhs, const Expr& rhs) -> Expr;
    friend auto operator^(const Expr& lhs, const Expr& rhs) -> Expr;
    friend auto operator!(const Expr& operand) -> Expr;
    friend auto operator-(const Expr& operand) -> Expr;

   private:
    [[nodiscard]] auto agg(ir::AggKind kind, ir::AggOptions options = {}) const -> Expr;
    [[nodiscard]] auto win(ir::WindowKind kind, ir::WindowOptions options) const -> Expr;
    [[nodiscard]] auto rolling(ir::WindowKind kind, std::int64_t window_size,
                               std::optional<std::int64_t> min_samples, bool center,
                               int ddof) const -> Expr;

    ir::ExprPtr node_;
};

[[nodiscard]] auto col(std::string name) -> Expr;
/// Multi-output selection of several columns.
[[nodiscard]] auto cols(std::vector<std::string> names) -> Expr;
[[nodiscard]] auto all() -> Expr;
/// Frame-level row count.
[[nodiscard]] auto len() -> Expr;

[[nodiscard]] auto lit(Scalar value) -> Expr;
[[nodiscard]] auto lit(Scalar value, DType dtype) -> Expr;
[[nodiscard]] auto lit(const char* value) -> Expr;

[[nodiscard]] auto any_horizontal(std::vector<Expr> exprs, bool ignore_nulls = true) -> Expr;
[[nodiscard]] auto all_horizontal(std::vector<Expr> exprs, bool ignore_nulls = true) -> Expr;
[[nodiscard]] auto sum_horizontal(std::vector<Expr> exprs, bool ignore_nulls = true) -> Expr;
[[nodiscard]] auto min_horizontal(std::vector<Expr> exprs, bool ignore_nulls = true) -> Expr;
[[nodiscard]] auto max_horizontal(std::vector<Expr> exprs, bool ignore_nulls = true) -> Expr;

/// Unwrap a list of fluent expressions.
[[nodiscard]] auto nodes(const std::vector<Expr>& exprs) -> std::vector<ir::ExprPtr>;

}  // namespace tessera
