#pragma once

#include <tessera/adapter/adapter.hpp>
#include <tessera/eager/table.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace tessera::eager {

/// Evaluate one expanded expression against a table snapshot.
///
/// The result has table.rows() rows, or a single row for reducing
/// expressions and bare literals. Its dtype is the inferred dtype of `expr`.
[[nodiscard]] auto evaluate(const Table& table, const ir::Expr& expr,
                            normalize::BooleanStrategy boolean) -> Result<ColumnEntry>;

/// Row ids of each distinct key tuple, groups in first-appearance order.
/// Null is an ordinary key value. No keys: one group holding every row.
[[nodiscard]] auto group_rows(const Table& table, const std::vector<std::string>& keys)
    -> Result<std::vector<std::vector<std::size_t>>>;

/// Stable ordering of `rows` by `keys`.
[[nodiscard]] auto sort_rows(const Table& table, std::vector<std::size_t> rows,
                             const std::vector<SortKey>& keys) -> Result<std::vector<std::size_t>>;

}  // namespace tessera::eager
