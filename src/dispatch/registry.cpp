#include <tessera/dispatch/registry.hpp>

#include <tessera/eager/eager_adapter.hpp>

#include <cxxabi.h>
#include <dlfcn.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <mutex>
#include <set>

namespace tessera::dispatch {

namespace {

auto demangle(const char* mangled) -> std::string {
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> out(
        abi::__cxa_demangle(mangled, nullptr, nullptr, &status), std::free);
    if (status == 0 && out) {
        return out.get();
    }
    return mangled;
}

struct GlobalState {
    std::mutex mutex;
    RegistryPtr registry;
    bool initialized = false;
};

auto global_state() -> GlobalState& {
    static GlobalState state;
    return state;
}

auto build_default(Config config, const std::function<void(RegistryBuilder&)>& extra)
    -> Result<RegistryPtr> {
    config.apply_logging();
    RegistryBuilder builder(config);
    builder.add_builtin();
    if (!config.plugin_search_paths.empty()) {
        auto loaded = builder.load_plugins(config.plugin_search_paths);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
    }
    if (extra) {
        extra(builder);
    }
    return builder.build();
}

}  // namespace

// ─── Registry ─────────────────────────────────────────────────────────────────

auto Registry::resolve(const NativeObject& object) const -> Result<AdapterPtr> {
    for (const auto& slot : slots_) {
        if (slot.recognizes(object)) {
            spdlog::debug("dispatch: {} -> {}", demangle(object.type().name()), slot.name);
            return slot.adapter;
        }
    }
    return make_error(ErrorKind::UnrecognizedNativeType,
                      fmt::format("no registered backend recognizes native type '{}'",
                                  object.has_value() ? demangle(object.type().name())
                                                     : std::string("<empty>")));
}

auto Registry::adapter_by_name(std::string_view name) const -> Result<AdapterPtr> {
    auto it = std::ranges::find_if(slots_, [name](const Slot& s) { return s.name == name; });
    if (it == slots_.end()) {
        return make_error(ErrorKind::InvalidOperation,
                          fmt::format("unknown backend '{}' (registered: {})", name,
                                      fmt::join(names(), ", ")));
    }
    return it->adapter;
}

auto Registry::names() const -> std::vector<std::string> {
    std::vector<std::string> out;
    out.reserve(slots_.size());
    for (const auto& slot : slots_) {
        out.push_back(slot.name);
    }
    return out;
}

auto Registry::adapters() const -> std::vector<AdapterPtr> {
    std::vector<AdapterPtr> out;
    out.reserve(slots_.size());
    for (const auto& slot : slots_) {
        out.push_back(slot.adapter);
    }
    return out;
}

// ─── RegistryBuilder ──────────────────────────────────────────────────────────

RegistryBuilder::RegistryBuilder(Config config) : config_(std::move(config)) {}

auto RegistryBuilder::add(Entry entry) -> RegistryBuilder& {
    entries_.push_back(std::move(entry));
    return *this;
}

auto RegistryBuilder::add(AdapterPtr adapter) -> RegistryBuilder& {
    std::string name(adapter->name());
    auto recognizer = [adapter](const NativeObject& object) { return adapter->recognizes(object); };
    return add(Entry{.name = std::move(name),
                     .recognizes = std::move(recognizer),
                     .factory = [adapter] { return adapter; }});
}

auto RegistryBuilder::add_builtin() -> RegistryBuilder& {
    // Masked first: the sentinel adapter accepts every eager table.
    add(std::make_shared<const eager::EagerAdapter>(eager::NullMode::Masked));
    add(std::make_shared<const eager::EagerAdapter>(eager::NullMode::Sentinel));
    return *this;
}

auto RegistryBuilder::load_plugin(const std::string& path) -> Result<void> {
    void* handle = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (handle == nullptr) {
        const char* err = dlerror();
        return make_error(ErrorKind::Configuration,
                          fmt::format("failed to load plugin '{}': {}", path,
                                      err != nullptr ? err : "unknown error"));
    }
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    auto* fn = reinterpret_cast<RegisterFn>(dlsym(handle, "tessera_register"));
    if (fn == nullptr) {
        dlclose(handle);
        return make_error(ErrorKind::Configuration,
                          fmt::format("plugin '{}' has no tessera_register symbol", path));
    }
    // The handle stays open: registered adapters live in the plugin's code.
    fn(this);
    spdlog::debug("loaded plugin: {}", path);
    return {};
}

auto RegistryBuilder::load_plugins(const std::vector<std::string>& search_paths)
    -> Result<std::size_t> {
    std::size_t loaded = 0;
    std::set<std::string> seen;
    for (const auto& dir : search_paths) {
        std::error_code ec;
        if (!std::filesystem::is_directory(dir, ec)) {
            spdlog::debug("plugin path '{}' is not a directory", dir);
            continue;
        }
        std::vector<std::filesystem::path> candidates;
        for (const auto& file : std::filesystem::directory_iterator(dir, ec)) {
            const auto stem = file.path().stem().string();
            if (file.path().extension() == ".so" && stem.starts_with("tessera_")) {
                candidates.push_back(file.path());
            }
        }
        std::ranges::sort(candidates);
        for (const auto& candidate : candidates) {
            // Earlier directories shadow later ones.
            if (!seen.insert(candidate.filename().string()).second) {
                continue;
            }
            auto result = load_plugin(candidate.string());
            if (!result) {
                return std::unexpected(result.error());
            }
            ++loaded;
        }
    }
    return loaded;
}

auto RegistryBuilder::build() -> Result<RegistryPtr> {
    auto registry = std::make_shared<Registry>();
    registry->config_ = config_;
    std::set<std::string> names;
    for (auto& entry : entries_) {
        if (!names.insert(entry.name).second) {
            return make_error(ErrorKind::InvalidOperation,
                              fmt::format("backend '{}' registered twice", entry.name));
        }
        if (!entry.recognizes || !entry.factory) {
            return make_error(ErrorKind::InvalidOperation,
                              fmt::format("backend '{}' lacks a recognizer or factory",
                                          entry.name));
        }
        auto adapter = entry.factory();
        if (!adapter) {
            return make_error(ErrorKind::InvalidOperation,
                              fmt::format("factory for backend '{}' returned no adapter",
                                          entry.name));
        }
        registry->slots_.push_back(Registry::Slot{
            .name = entry.name, .recognizes = entry.recognizes, .adapter = std::move(adapter)});
    }
    spdlog::debug("registry built: [{}]", fmt::join(names, ", "));
    return RegistryPtr(std::move(registry));
}

// ─── Process-wide registry ────────────────────────────────────────────────────

auto initialize(Config config, const std::function<void(RegistryBuilder&)>& extra)
    -> Result<void> {
    auto& state = global_state();
    std::scoped_lock lock(state.mutex);
    if (state.initialized) {
        return make_error(ErrorKind::Configuration, "dispatch registry is already initialized");
    }
    auto registry = build_default(std::move(config), extra);
    if (!registry) {
        return std::unexpected(registry.error());
    }
    state.registry = std::move(*registry);
    state.initialized = true;
    return {};
}

auto global() -> Result<RegistryPtr> {
    auto& state = global_state();
    std::scoped_lock lock(state.mutex);
    if (!state.initialized) {
        auto config = Config::from_env();
        if (!config) {
            return std::unexpected(config.error());
        }
        auto registry = build_default(std::move(*config), {});
        if (!registry) {
            return std::unexpected(registry.error());
        }
        state.registry = std::move(*registry);
        state.initialized = true;
    }
    return state.registry;
}

}  // namespace tessera::dispatch
