#include <tessera/core/config.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <string>
#include <vector>

using namespace tessera;

namespace {

/// Sets an environment variable for the lifetime of the guard.
class EnvGuard {
   public:
    EnvGuard(const char* name, const char* value) : name_(name) {
        ::setenv(name, value, 1);
    }
    ~EnvGuard() { ::unsetenv(name_); }

    EnvGuard(const EnvGuard&) = delete;
    auto operator=(const EnvGuard&) -> EnvGuard& = delete;

   private:
    const char* name_;
};

}  // namespace

TEST_CASE("parse_flag", "[config]") {
    REQUIRE(parse_flag("1") == true);
    REQUIRE(parse_flag("TRUE") == true);
    REQUIRE(parse_flag("on") == true);
    REQUIRE(parse_flag("No") == false);
    REQUIRE(parse_flag("off") == false);
    REQUIRE_FALSE(parse_flag("maybe").has_value());
}

TEST_CASE("Config defaults", "[config]") {
    const Config config;
    REQUIRE(config.allow_approximate);
    REQUIRE_FALSE(config.upcast_booleans);
    REQUIRE(config.log_level == spdlog::level::warn);
    REQUIRE(config.plugin_search_paths.empty());
}

TEST_CASE("Config::from_env", "[config]") {
    SECTION("boolean switches") {
        EnvGuard approx("TESSERA_ALLOW_APPROXIMATE", "false");
        EnvGuard upcast("TESSERA_UPCAST_BOOLEANS", "yes");
        auto config = Config::from_env();
        REQUIRE(config.has_value());
        REQUIRE_FALSE(config->allow_approximate);
        REQUIRE(config->upcast_booleans);
    }

    SECTION("plugin path is colon separated") {
        EnvGuard path("TESSERA_PLUGIN_PATH", "/opt/a::/opt/b");
        auto config = Config::from_env();
        REQUIRE(config.has_value());
        REQUIRE(config->plugin_search_paths == std::vector<std::string>{"/opt/a", "/opt/b"});
    }

    SECTION("log level") {
        EnvGuard level("TESSERA_LOG_LEVEL", "DEBUG");
        auto config = Config::from_env();
        REQUIRE(config.has_value());
        REQUIRE(config->log_level == spdlog::level::debug);
    }

    SECTION("malformed values are configuration errors") {
        EnvGuard approx("TESSERA_ALLOW_APPROXIMATE", "sometimes");
        auto config = Config::from_env();
        REQUIRE_FALSE(config.has_value());
        REQUIRE(config.error().kind == ErrorKind::Configuration);
    }

    SECTION("unknown log levels are rejected") {
        EnvGuard level("TESSERA_LOG_LEVEL", "chatty");
        auto config = Config::from_env();
        REQUIRE_FALSE(config.has_value());
        REQUIRE(config.error().kind == ErrorKind::Configuration);
    }
}
