#include <tessera/core/config.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

namespace tessera {

namespace {

auto lower(std::string_view text) -> std::string {
    std::string out(text);
    std::ranges::transform(out, out.begin(),
                           [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return out;
}

auto env_flag(const char* name, bool& target) -> Result<void> {
    const char* raw = std::getenv(name);
    if (raw == nullptr) {
        return {};
    }
    auto parsed = parse_flag(raw);
    if (!parsed) {
        return make_error(ErrorKind::Configuration,
                          fmt::format("{}: expected a boolean, got '{}'", name, raw));
    }
    target = *parsed;
    return {};
}

}  // namespace

auto parse_flag(std::string_view text) -> std::optional<bool> {
    auto value = lower(text);
    if (value == "1" || value == "true" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "0" || value == "false" || value == "no" || value == "off") {
        return false;
    }
    return std::nullopt;
}

auto Config::from_env() -> Result<Config> {
    Config config;
    if (auto ok = env_flag("TESSERA_ALLOW_APPROXIMATE", config.allow_approximate); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = env_flag("TESSERA_UPCAST_BOOLEANS", config.upcast_booleans); !ok) {
        return std::unexpected(ok.error());
    }
    if (const char* level = std::getenv("TESSERA_LOG_LEVEL")) {
        auto parsed = spdlog::level::from_str(lower(level));
        // from_str maps unknown names to "off"; only accept it when asked for.
        if (parsed == spdlog::level::off && lower(level) != "off") {
            return make_error(ErrorKind::Configuration,
                              fmt::format("TESSERA_LOG_LEVEL: unknown level '{}'", level));
        }
        config.log_level = parsed;
    }
    if (const char* paths = std::getenv("TESSERA_PLUGIN_PATH")) {
        std::stringstream ss{std::string(paths)};
        std::string dir;
        while (std::getline(ss, dir, ':')) {
            if (!dir.empty()) {
                config.plugin_search_paths.push_back(dir);
            }
        }
    }
    return config;
}

void Config::apply_logging() const {
    spdlog::set_level(log_level);
}

}  // namespace tessera
