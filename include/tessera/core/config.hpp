#pragma once

#include <tessera/core/error.hpp>

#include <spdlog/common.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tessera {

/// Process-wide behaviour switches.
///
/// Filled from environment variables by Config::from_env() and overridden by
/// command-line flags in the tools. Frozen once the dispatch registry is
/// initialized.
struct Config {
    /// Permit the null-as-False boolean fallback on backends whose boolean
    /// storage cannot hold nulls. When false such expressions fail with
    /// UnsupportedOperation instead.
    bool allow_approximate = true;
    /// Prefer upcasting to a nullable boolean representation when the backend
    /// offers one (TESSERA_UPCAST_BOOLEANS).
    bool upcast_booleans = false;
    spdlog::level::level_enum log_level = spdlog::level::warn;
    /// Directories searched (in order) for backend plugins (*.so).
    std::vector<std::string> plugin_search_paths;

    /// Read TESSERA_ALLOW_APPROXIMATE, TESSERA_UPCAST_BOOLEANS,
    /// TESSERA_LOG_LEVEL and TESSERA_PLUGIN_PATH (colon separated).
    [[nodiscard]] static auto from_env() -> Result<Config>;

    /// Push log_level into spdlog's default logger.
    void apply_logging() const;
};

/// Parse "1/true/yes/on" and "0/false/no/off" (case-insensitive).
[[nodiscard]] auto parse_flag(std::string_view text) -> std::optional<bool>;

}  // namespace tessera
