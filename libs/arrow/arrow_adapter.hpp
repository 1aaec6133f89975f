#pragma once
// Arrow backend: wraps std::shared_ptr<arrow::Table>.
//
// Expressions lower to arrow::compute kernels; group_by runs an Acero
// aggregate plan. Arrow booleans are nullable, so Kleene logic maps to
// and_kleene / or_kleene directly. Window functions are limited to
// unpartitioned cumulative, shift and diff; rank, over() and grouped
// median have no exact Arrow kernel and are rejected up front.

#include <tessera/adapter/adapter.hpp>

#include <arrow/api.h>
#include <arrow/compute/api.h>

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace tessera::arrow_backend {

using TablePtr = std::shared_ptr<arrow::Table>;

/// DType -> Arrow type. Unknown maps to arrow::null().
[[nodiscard]] auto to_arrow_type(const DType& dtype) -> Result<std::shared_ptr<arrow::DataType>>;

/// Arrow type -> DType; UnknownDtype when the type has no mapping.
[[nodiscard]] auto from_arrow_type(const arrow::DataType& type) -> Result<DType>;

class ArrowAdapter final : public Adapter {
   public:
    ArrowAdapter();

    [[nodiscard]] auto name() const -> std::string_view override { return "arrow"; }
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

   private:
    [[nodiscard]] auto table_of(const NativeObject& object) const -> Result<TablePtr>;
    [[nodiscard]] auto lower_datum(const ir::Expr& expr, const TablePtr& table,
                                   const Schema& schema) const -> Result<arrow::Datum>;
    [[nodiscard]] auto lower_binary(
        const ir::BinaryOp& op, const ir::Expr& expr,
        const std::function<Result<arrow::Datum>(const ir::ExprPtr&)>& child,
        const Schema& schema) const -> Result<arrow::Datum>;
    [[nodiscard]] auto lower_numeric_unary(const ir::UnaryOp& node, const ir::Expr& expr,
                                           const arrow::Datum& operand,
                                           const Schema& schema) const -> Result<arrow::Datum>;
    [[nodiscard]] auto lower_horizontal(const ir::HorizontalReduction& node,
                                        std::vector<arrow::Datum> operands,
                                        const std::shared_ptr<arrow::DataType>& type) const
        -> Result<arrow::Datum>;
    [[nodiscard]] auto lower_window(const ir::Expr& expr, const ir::WindowFunction& window,
                                    const TablePtr& table, const Schema& schema) const
        -> Result<arrow::Datum>;
    [[nodiscard]] auto planned_column(const PlannedColumn& planned,
                                      const LoweringContext& context) const -> Result<arrow::Datum>;

    Capabilities capabilities_;
};

}  // namespace tessera::arrow_backend
