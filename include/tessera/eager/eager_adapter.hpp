#pragma once

#include <tessera/adapter/adapter.hpp>
#include <tessera/eager/table.hpp>

#include <memory>
#include <string>
#include <vector>

namespace tessera::eager {

/// Adapter over the in-house columnar engine.
///
/// In Sentinel mode ("eager") boolean input columns have no null bit: a
/// Boolean result that may be null either upcasts to a masked column or runs
/// under the null-as-False fallback. In Masked mode ("eager-masked") every column may
/// be null and Kleene logic is exact.
class EagerAdapter final : public Adapter {
   public:
    explicit EagerAdapter(NullMode mode);

    [[nodiscard]] auto name() const -> std::string_view override;
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

    [[nodiscard]] auto mode() const noexcept -> NullMode { return mode_; }

   private:
    [[nodiscard]] auto table_of(const NativeObject& object) const -> Result<TablePtr>;

    NullMode mode_;
    Capabilities capabilities_;
};

/// Wrap a table as a native object.
[[nodiscard]] inline auto native(Table table) -> NativeObject {
    return TablePtr(std::make_shared<const Table>(std::move(table)));
}

}  // namespace tessera::eager
