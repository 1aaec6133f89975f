#include <tessera/conformance/conformance.hpp>
#include <tessera/core/config.hpp>
#include <tessera/dispatch/registry.hpp>

#include <CLI/CLI.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <string>
#include <vector>

auto main(int argc, char** argv) -> int {
    CLI::App app{"Tessera conformance checks for registered backends"};

    bool verbose = false;
    bool upcast_booleans = false;
    std::string plugin_path;
    std::vector<std::string> backends;
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");
    app.add_option("--plugin-path", plugin_path,
                   "Directory to search for backend plugins (tessera_*.so). "
                   "Searched before TESSERA_PLUGIN_PATH.");
    app.add_option("-b,--backend", backends,
                   "Backend to check; repeat for several. Defaults to every registered backend.");
    app.add_flag("--upcast-booleans", upcast_booleans,
                 "Upcast sentinel boolean results to nullable storage instead of the "
                 "null-as-False fallback");

    CLI11_PARSE(app, argc, argv);

    auto config = tessera::Config::from_env();
    if (!config) {
        fmt::print(stderr, "error: {}\n", config.error().describe());
        return EXIT_FAILURE;
    }
    config->log_level = verbose ? spdlog::level::debug : spdlog::level::info;
    if (upcast_booleans) {
        config->upcast_booleans = true;
    }
    if (!plugin_path.empty()) {
        config->plugin_search_paths.insert(config->plugin_search_paths.begin(), plugin_path);
    }

    if (auto ok = tessera::dispatch::initialize(*config); !ok) {
        fmt::print(stderr, "error: {}\n", ok.error().describe());
        return EXIT_FAILURE;
    }
    auto registry = tessera::dispatch::global();
    if (!registry) {
        fmt::print(stderr, "error: {}\n", registry.error().describe());
        return EXIT_FAILURE;
    }
    spdlog::info("backends: {}", fmt::join((*registry)->names(), ", "));

    const auto report = tessera::conformance::run(*registry, backends);
    fmt::print("{}", tessera::conformance::format_report(report));

    return report.passed() ? EXIT_SUCCESS : EXIT_FAILURE;
}
