#pragma once

#include <tessera/adapter/adapter.hpp>
#include <tessera/core/config.hpp>
#include <tessera/core/error.hpp>

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace tessera::dispatch {

using AdapterPtr = std::shared_ptr<const Adapter>;
using Recognizer = std::function<bool(const NativeObject&)>;
using Factory = std::function<AdapterPtr()>;

/// One registered backend. Entries are tried in registration order.
struct Entry {
    std::string name;
    Recognizer recognizes;
    Factory factory;
};

/// Read-only, ordered backend table.
///
/// Adapters are created once when the registry is built and shared by every
/// frame resolved through it.
class Registry {
   public:
    /// First adapter whose recognizer accepts `object`.
    /// UnrecognizedNativeType names the object's runtime type otherwise.
    [[nodiscard]] auto resolve(const NativeObject& object) const -> Result<AdapterPtr>;

    [[nodiscard]] auto adapter_by_name(std::string_view name) const -> Result<AdapterPtr>;

    /// Backend names in priority order.
    [[nodiscard]] auto names() const -> std::vector<std::string>;
    [[nodiscard]] auto adapters() const -> std::vector<AdapterPtr>;
    [[nodiscard]] auto config() const noexcept -> const Config& { return config_; }

   private:
    friend class RegistryBuilder;

    struct Slot {
        std::string name;
        Recognizer recognizes;
        AdapterPtr adapter;
    };

    Config config_;
    std::vector<Slot> slots_;
};

using RegistryPtr = std::shared_ptr<const Registry>;

/// Collects entries, then freezes them into a Registry.
class RegistryBuilder {
   public:
    explicit RegistryBuilder(Config config = {});

    /// Append an entry; a name already present is an InvalidOperation at build().
    auto add(Entry entry) -> RegistryBuilder&;
    /// Append an adapter instance, recognized through Adapter::recognizes.
    auto add(AdapterPtr adapter) -> RegistryBuilder&;
    /// The in-house engines: eager-masked, then eager.
    auto add_builtin() -> RegistryBuilder&;

    /// dlopen `path` and call its `tessera_register` entry point.
    auto load_plugin(const std::string& path) -> Result<void>;
    /// Load every tessera_*.so found in `search_paths`. Returns how many loaded.
    auto load_plugins(const std::vector<std::string>& search_paths) -> Result<std::size_t>;

    [[nodiscard]] auto config() const noexcept -> const Config& { return config_; }

    [[nodiscard]] auto build() -> Result<RegistryPtr>;

   private:
    Config config_;
    std::vector<Entry> entries_;
};

/// Install the process-wide registry: built-in engines, plugins from
/// config.plugin_search_paths, then whatever `extra` adds. A second call
/// fails with Configuration; the registry is read-only afterwards.
auto initialize(Config config, const std::function<void(RegistryBuilder&)>& extra = {})
    -> Result<void>;

/// The process-wide registry. Built from Config::from_env() and the built-in
/// engines on first use when initialize() was never called.
[[nodiscard]] auto global() -> Result<RegistryPtr>;

/// Signature of the `tessera_register` symbol every backend plugin exports
/// with C linkage.
using RegisterFn = void (*)(RegistryBuilder*);

}  // namespace tessera::dispatch
