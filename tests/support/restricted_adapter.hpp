#pragma once

#include <tessera/eager/eager_adapter.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace tessera::testing {

/// Masked eager engine with floordiv and rank removed from its support set.
class RestrictedAdapter final : public Adapter {
   public:
    RestrictedAdapter() : inner_(eager::NullMode::Masked), capabilities_(inner_.capabilities()) {
        capabilities_.supported.erase(
            ir::OpKey{.kind = ir::NodeKind::Binary,
                      .op = static_cast<std::uint8_t>(ir::BinaryKind::FloorDiv)});
        capabilities_.supported.erase(
            ir::OpKey{.kind = ir::NodeKind::Window,
                      .op = static_cast<std::uint8_t>(ir::WindowKind::Rank)});
    }

    [[nodiscard]] auto name() const -> std::string_view override { return "restricted"; }
    [[nodiscard]] auto capabilities() const -> const Capabilities& override {
        return capabilities_;
    }
    [[nodiscard]] auto recognizes(const NativeObject&) const -> bool override { return false; }
    [[nodiscard]] auto schema(const NativeObject& frame) const -> Result<Schema> override {
        return inner_.schema(frame);
    }
    [[nodiscard]] auto lower(const ir::Expr& expr, const LoweringContext& context) const
        -> Result<NativeColumn> override {
        return inner_.lower(expr, context);
    }
    [[nodiscard]] auto dtype_of(const NativeColumn& column) const -> Result<DType> override {
        return inner_.dtype_of(column);
    }
    [[nodiscard]] auto apply_columns(const NativeObject& frame, const Plan& plan,
                                     Purpose mode) const -> Result<NativeObject> override {
        ++native_calls;
        return inner_.apply_columns(frame, plan, mode);
    }
    [[nodiscard]] auto filter(const NativeObject& frame, const Plan& predicate) const
        -> Result<NativeObject> override {
        ++native_calls;
        return inner_.filter(frame, predicate);
    }
    [[nodiscard]] auto aggregate(const NativeObject& frame, const std::vector<std::string>& keys,
                                 const Plan& plan) const -> Result<NativeObject> override {
        ++native_calls;
        return inner_.aggregate(frame, keys, plan);
    }
    [[nodiscard]] auto sort(const NativeObject& frame, const std::vector<SortKey>& keys) const
        -> Result<NativeObject> override {
        return inner_.sort(frame, keys);
    }
    [[nodiscard]] auto from_columns(const FrameData& data) const -> Result<NativeObject> override {
        return inner_.from_columns(data);
    }
    [[nodiscard]] auto to_columns(const NativeObject& frame) const -> Result<FrameData> override {
        return inner_.to_columns(frame);
    }

    mutable int native_calls = 0;

   private:
    eager::EagerAdapter inner_;
    Capabilities capabilities_;
};

}  // namespace tessera::testing
