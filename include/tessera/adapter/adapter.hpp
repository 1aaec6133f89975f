#pragma once

#include <tessera/core/config.hpp>
#include <tessera/core/error.hpp>
#include <tessera/core/scalar.hpp>
#include <tessera/dtype/dtype.hpp>
#include <tessera/ir/node.hpp>
#include <tessera/normalize/semantics.hpp>

#include <any>
#include <cstdint>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace tessera {

/// Type-erased handle to an engine's table (shared_ptr to the engine object).
using NativeObject = std::any;
/// Type-erased handle to a lowered column (engine specific).
using NativeColumn = std::any;

/// What an adapter can do, declared up front so unsupported expressions fail
/// before any native call.
struct Capabilities {
    std::set<ir::OpKey> supported;
    /// Boolean storage can hold null.
    bool nullable_boolean = true;
    /// A nullable boolean representation exists to upcast into.
    bool boolean_upcast = false;
    /// Operations build a deferred plan; materialize() runs it.
    bool lazy = false;
    /// Window functions accept partition keys.
    bool partitioned_windows = true;
    /// Rows have a defined order; otherwise order-dependent windows need order_by.
    bool ordered_rows = true;
    normalize::NullKeyPolicy null_keys = normalize::NullKeyPolicy::OwnGroup;

    [[nodiscard]] auto supports(const ir::OpKey& key) const -> bool {
        return supported.contains(key);
    }
};

/// Why a list of expressions is being prepared.
enum class Purpose : std::uint8_t {
    WithColumns,
    Select,
    Filter,
    Aggregate,
};

/// One output column of a prepared plan.
struct PlannedColumn {
    std::string name;
    ir::ExprPtr expr;
    DType dtype;
};

/// Expressions after the shared preparation pipeline: expanded, checked
/// against the support set, typed, with the boolean strategy decided.
struct Plan {
    std::vector<PlannedColumn> columns;
    normalize::BooleanStrategy boolean = normalize::BooleanStrategy::Native;
    /// Evaluated under the null-as-False fallback.
    bool approximate = false;
    /// Every column aggregates and the purpose is Select: one output row.
    bool reduces = false;
};

struct SortKey {
    std::string name;
    bool descending = false;
    bool nulls_last = true;
};

/// Per-call lowering state; valid only during the call.
struct LoweringContext {
    const NativeObject& frame;
    const Schema& schema;
    normalize::BooleanStrategy boolean = normalize::BooleanStrategy::Native;
    /// Aggregations fold to one value per group instead of broadcasting.
    bool reducing = false;
};

/// Translation of the expression IR into one native engine.
///
/// Implementations are stateless and immutable after construction; one
/// instance is shared by every frame bound to it.
class Adapter {
   public:
    Adapter() = default;
    virtual ~Adapter() = default;

    Adapter(const Adapter&) = delete;
    auto operator=(const Adapter&) -> Adapter& = delete;

    [[nodiscard]] virtual auto name() const -> std::string_view = 0;
    [[nodiscard]] virtual auto capabilities() const -> const Capabilities& = 0;
    [[nodiscard]] virtual auto recognizes(const NativeObject& object) const -> bool = 0;

    /// Resolved schema. Columns whose native type has no mapping are Unknown.
    [[nodiscard]] virtual auto schema(const NativeObject& frame) const -> Result<Schema> = 0;

    /// Lower one expanded expression, children first.
    [[nodiscard]] virtual auto lower(const ir::Expr& expr, const LoweringContext& context) const
        -> Result<NativeColumn> = 0;

    /// Dtype of a lowered column; UnknownDtype when it has no mapping.
    [[nodiscard]] virtual auto dtype_of(const NativeColumn& column) const -> Result<DType> = 0;

    /// Evaluate a prepared plan against one snapshot of `frame`.
    [[nodiscard]] virtual auto apply_columns(const NativeObject& frame, const Plan& plan,
                                             Purpose mode) const -> Result<NativeObject> = 0;

    /// Keep rows whose predicate is True; null drops the row.
    [[nodiscard]] virtual auto filter(const NativeObject& frame, const Plan& predicate) const
        -> Result<NativeObject> = 0;

    /// One row per distinct key tuple; null keys form their own group.
    [[nodiscard]] virtual auto aggregate(const NativeObject& frame,
                                         const std::vector<std::string>& keys,
                                         const Plan& plan) const -> Result<NativeObject> = 0;

    /// Stable multi-key sort.
    [[nodiscard]] virtual auto sort(const NativeObject& frame, const std::vector<SortKey>& keys)
        const -> Result<NativeObject> = 0;

    [[nodiscard]] virtual auto from_columns(const FrameData& data) const
        -> Result<NativeObject> = 0;
    [[nodiscard]] virtual auto to_columns(const NativeObject& frame) const -> Result<FrameData> = 0;

    /// Run a deferred plan. Eager adapters return the frame unchanged.
    [[nodiscard]] virtual auto materialize(const NativeObject& frame) const
        -> Result<NativeObject> {
        return frame;
    }

    /// Shared preparation pipeline run before any native call.
    [[nodiscard]] auto prepare(const std::vector<ir::ExprPtr>& exprs, const Schema& schema,
                               const Config& config, Purpose purpose) const -> Result<Plan>;

    /// UnsupportedOperation naming `what` and this backend.
    [[nodiscard]] auto unsupported(std::string_view what) const -> std::unexpected<Error>;

    /// Native error carried with this backend's name.
    [[nodiscard]] auto native_error(std::string message) const -> std::unexpected<Error>;
};

}  // namespace tessera
