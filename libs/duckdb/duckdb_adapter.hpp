#pragma once
// DuckDB backend: wraps std::shared_ptr<duckdb::Relation>.
//
// Lazy. Every operation lowers the expression IR to SQL text and stacks a new
// relation on the input; nothing runs until to_columns() executes the query.
// Relations carry no row order, so cumulative, shift, diff and rank need an
// order_by. Aggregates outside a group_by become window aggregates over the
// whole relation (or over the partition inside over()).

#include <tessera/adapter/adapter.hpp>

#include <duckdb.hpp>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tessera::duckdb_backend {

using RelationPtr = std::shared_ptr<duckdb::Relation>;

/// A lowered expression: SQL text evaluating to `dtype`.
struct SqlColumn {
    std::string sql;
    DType dtype;
};

/// SQL type name for a dtype, e.g. "BIGINT", "TIMESTAMP_NS", "VARCHAR[]".
/// Duration has no lossless DuckDB type and is rejected.
[[nodiscard]] auto sql_type(const DType& dtype) -> Result<std::string>;

/// DuckDB logical type -> DType; UnknownDtype when the type has no mapping.
[[nodiscard]] auto from_duckdb_type(const duckdb::LogicalType& type) -> Result<DType>;

/// Double-quoted SQL identifier.
[[nodiscard]] auto quote_identifier(std::string_view name) -> std::string;

/// SQL literal for a value of `dtype`, cast to that dtype's SQL type.
[[nodiscard]] auto sql_literal(const Scalar& value, const DType& dtype) -> Result<std::string>;

class DuckDbAdapter final : public Adapter {
   public:
    /// Owns an in-memory database used to build relations from column data.
    DuckDbAdapter();
    ~DuckDbAdapter() override;

    [[nodiscard]] auto name() const -> std::string_view override { return "duckdb"; }
    [[nodiscard]] auto capabilities() const -> const Capabilities& override {
        return capabilities_;
    }
    [[nodiscard]] auto recognizes(const NativeObject& object) const -> bool override;
    [[nodiscard]] auto schema(const NativeObject& frame) const -> Result<Schema> override;
    [[nodiscard]] auto lower(const ir::Expr& expr, const LoweringContext& context) const
        -> Result<NativeColumn> override;
    [[nodiscard]] auto dtype_of(const NativeColumn& column) const -> Result<DType> override;
    [[nodiscard]] auto apply_columns(const NativeObject& frame, const Plan& plan,
                                     Purpose mode) const -> Result<NativeObject> override;
    [[nodiscard]] auto filter(const NativeObject& frame, const Plan& predicate) const
        -> Result<NativeObject> override;
    [[nodiscard]] auto aggregate(const NativeObject& frame, const std::vector<std::string>& keys,
                                 const Plan& plan) const -> Result<NativeObject> override;
    [[nodiscard]] auto sort(const NativeObject& frame, const std::vector<SortKey>& keys) const
        -> Result<NativeObject> override;
    [[nodiscard]] auto from_columns(const FrameData& data) const -> Result<NativeObject> override;
    [[nodiscard]] auto to_columns(const NativeObject& frame) const -> Result<FrameData> override;

    /// The adapter's own connection, for building relations in tests and tools.
    [[nodiscard]] auto connection() const -> duckdb::Connection& { return *connection_; }

   private:
    [[nodiscard]] auto relation_of(const NativeObject& object) const -> Result<RelationPtr>;
    [[nodiscard]] auto select_list(const NativeObject& frame, const Plan& plan,
                                   const Schema& schema, bool reducing) const
        -> Result<std::vector<std::string>>;

    std::unique_ptr<duckdb::DuckDB> database_;
    std::unique_ptr<duckdb::Connection> connection_;
    mutable std::mutex mutex_;
    Capabilities capabilities_;
};

}  // namespace tessera::duckdb_backend
