#include <tessera/dispatch/registry.hpp>
#include <tessera/eager/eager_adapter.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace tessera;

namespace {

auto builtin_registry() -> dispatch::RegistryPtr {
    dispatch::RegistryBuilder builder;
    builder.add_builtin();
    return value_or_throw(builder.build());
}

auto table_of(eager::NullMode mode) -> NativeObject {
    auto table = eager::make_table(
        {ColumnData{.name = "a", .dtype = DType::int64(), .values = {std::int64_t{1}}}}, mode);
    return eager::native(value_or_throw(std::move(table)));
}

}  // namespace

TEST_CASE("Built-in engines register in priority order", "[dispatch][registry]") {
    auto registry = builtin_registry();
    REQUIRE(registry->names() == std::vector<std::string>{"eager-masked", "eager"});
    REQUIRE(registry->adapters().size() == 2);
}

TEST_CASE("resolve picks the first recognizing backend", "[dispatch][registry]") {
    auto registry = builtin_registry();

    SECTION("masked tables resolve to eager-masked") {
        auto adapter = registry->resolve(table_of(eager::NullMode::Masked));
        REQUIRE(adapter.has_value());
        REQUIRE((*adapter)->name() == "eager-masked");
    }

    SECTION("sentinel tables fall through to eager") {
        auto adapter = registry->resolve(table_of(eager::NullMode::Sentinel));
        REQUIRE(adapter.has_value());
        REQUIRE((*adapter)->name() == "eager");
    }

    SECTION("unknown objects name their runtime type") {
        auto adapter = registry->resolve(NativeObject{42});
        REQUIRE_FALSE(adapter.has_value());
        REQUIRE(adapter.error().kind == ErrorKind::UnrecognizedNativeType);
        REQUIRE(adapter.error().message.find("int") != std::string::npos);
    }

    SECTION("empty objects are rejected") {
        auto adapter = registry->resolve(NativeObject{});
        REQUIRE_FALSE(adapter.has_value());
        REQUIRE(adapter.error().kind == ErrorKind::UnrecognizedNativeType);
    }
}

TEST_CASE("adapter_by_name", "[dispatch][registry]") {
    auto registry = builtin_registry();
    REQUIRE(registry->adapter_by_name("eager").has_value());

    auto missing = registry->adapter_by_name("velox");
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().kind == ErrorKind::InvalidOperation);
    REQUIRE(missing.error().message.find("eager-masked") != std::string::npos);
}

TEST_CASE("Custom entries", "[dispatch][registry]") {
    dispatch::RegistryBuilder builder;
    builder.add(dispatch::Entry{
        .name = "ints",
        .recognizes = [](const NativeObject& object) { return std::any_cast<int>(&object) != nullptr; },
        .factory = [] { return std::make_shared<const eager::EagerAdapter>(eager::NullMode::Masked); },
    });
    builder.add_builtin();
    auto registry = value_or_throw(builder.build());

    REQUIRE(registry->names().front() == "ints");
    auto adapter = registry->resolve(NativeObject{7});
    REQUIRE(adapter.has_value());
}

TEST_CASE("Registry build errors", "[dispatch][registry]") {
    SECTION("duplicate names") {
        dispatch::RegistryBuilder builder;
        builder.add_builtin().add_builtin();
        auto registry = builder.build();
        REQUIRE_FALSE(registry.has_value());
        REQUIRE(registry.error().kind == ErrorKind::InvalidOperation);
    }

    SECTION("entries without a factory") {
        dispatch::RegistryBuilder builder;
        builder.add(dispatch::Entry{.name = "broken", .recognizes = {}, .factory = {}});
        REQUIRE_FALSE(builder.build().has_value());
    }
}

TEST_CASE("Plugin loading", "[dispatch][plugin]") {
    dispatch::RegistryBuilder builder;

    SECTION("a missing library is a configuration error") {
        auto loaded = builder.load_plugin("/nonexistent/tessera_missing.so");
        REQUIRE_FALSE(loaded.has_value());
        REQUIRE(loaded.error().kind == ErrorKind::Configuration);
    }

    SECTION("search paths that are not directories are skipped") {
        auto loaded = builder.load_plugins({"/nonexistent/plugins"});
        REQUIRE(loaded.has_value());
        REQUIRE(*loaded == 0);
    }
}

TEST_CASE("The process-wide registry is initialized once", "[dispatch][global]") {
    auto registry = dispatch::global();
    REQUIRE(registry.has_value());
    REQUIRE((*registry)->adapter_by_name("eager").has_value());

    auto again = dispatch::initialize(Config{});
    REQUIRE_FALSE(again.has_value());
    REQUIRE(again.error().kind == ErrorKind::Configuration);
}
