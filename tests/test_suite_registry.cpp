#include "catch2_custom.hpp"

#include "registry/shared_library.hpp"
#include "registry/suite_registry.hpp"
#include "temp_dir.hpp"

#include <suitegrader/api/suite_config.hpp>
#include <suitegrader/api/suite_macros.hpp>
#include <suitegrader/logging.hpp>
#include <suitegrader/registrars/global_registrar.hpp>

#include <filesystem>
#include <string>
#include <vector>

using suitegrader::GlobalRegistrar;
using suitegrader::SharedLibrary;
using suitegrader::SuiteConfig;
using suitegrader::SuiteRegistry;

namespace {

const std::filesystem::path PLUGIN_PATH{TEST_PLUGIN_PATH};

SuiteConfig make_suite(std::string name, std::string path, std::string cls) {
    SuiteConfig config;
    config.name = std::move(name);
    config.implementation_path = std::move(path);
    config.implementation_class = std::move(cls);
    config.max_score = 5;
    return config;
}

SuiteRegistry make_registry(const std::filesystem::path& base_dir = ".") {
    return SuiteRegistry{base_dir, spdlog::default_logger()};
}

} // namespace

TEST_CASE("Load suite classes from a plugin") {
    auto registry = make_registry();

    registry.load({make_suite("readme", PLUGIN_PATH.string(), "ReadmeSuite"),
                   make_suite("marker", PLUGIN_PATH.string(), "MarkerSuite")});

    REQUIRE(registry.size() == 2);
    REQUIRE(registry.get_failures().empty());

    const auto origin = std::filesystem::canonical(PLUGIN_PATH).string();
    const auto names = GlobalRegistrar::get().get_class_names(origin);
    REQUIRE_THAT(names, Catch::Matchers::VectorContains(std::string_view{"ReadmeSuite"}));
    REQUIRE_THAT(names, Catch::Matchers::VectorContains(std::string_view{"MarkerSuite"}));

    SECTION("A resolved factory constructs a working suite") {
        TempDir tmp;
        tmp.write_file("README", "hi");

        auto factory = registry.find("readme");
        REQUIRE(factory.has_value());

        const auto config = make_suite("readme", PLUGIN_PATH.string(), "ReadmeSuite");
        auto suite = factory->get()(tmp.path(), 42, config, spdlog::default_logger());
        auto result = suite->run();

        REQUIRE(result.success);
        REQUIRE(result.score == 5);
        REQUIRE(result.feedback_messages == std::vector<std::string>{"README found for submission 42"});
    }
}

TEST_CASE("Relative plugin paths resolve against the base directory") {
    auto registry = make_registry(PLUGIN_PATH.parent_path());

    registry.load({make_suite("readme", PLUGIN_PATH.filename().string(), "ReadmeSuite")});

    REQUIRE(registry.find("readme").has_value());
}

TEST_CASE("Loading the same plugin twice reuses its registrations") {
    const auto before = GlobalRegistrar::get().get_num_registered();

    auto first = make_registry();
    first.load({make_suite("readme", PLUGIN_PATH.string(), "ReadmeSuite")});

    const auto after_first = GlobalRegistrar::get().get_num_registered();

    auto second = make_registry();
    second.load({make_suite("readme", PLUGIN_PATH.string(), "ReadmeSuite")});

    REQUIRE(after_first >= before);
    REQUIRE(GlobalRegistrar::get().get_num_registered() == after_first);
    REQUIRE(second.find("readme").has_value());
}

TEST_CASE("Unresolvable suites are recorded and do not stop the others") {
    TempDir tmp;
    const auto not_a_library = tmp.write_file("garbage.so", "definitely not ELF");

    auto registry = make_registry();

    registry.load({
        make_suite("missing-lib", (tmp / "nope.so").string(), "ReadmeSuite"),
        make_suite("bad-lib", not_a_library.string(), "ReadmeSuite"),
        make_suite("missing-class", PLUGIN_PATH.string(), "NoSuchSuite"),
        make_suite("missing-builtin", "", "NoSuchSuite"),
        make_suite("outdated", PLUGIN_PATH.string(), "OutdatedSuite"),
        make_suite("ok", PLUGIN_PATH.string(), "MarkerSuite"),
    });

    REQUIRE(registry.size() == 1);
    REQUIRE(registry.find("ok").has_value());
    REQUIRE(registry.get_failures().size() == 5);

    using Catch::Matchers::ContainsSubstring;

    REQUIRE_THAT(*registry.get_failure("missing-lib"), ContainsSubstring("is not an existing regular file"));
    REQUIRE_THAT(*registry.get_failure("bad-lib"), ContainsSubstring("dlopen failed"));
    REQUIRE_THAT(*registry.get_failure("missing-class"),
                 ContainsSubstring("does not register a suite class named 'NoSuchSuite'") &&
                     ContainsSubstring("MarkerSuite"));
    REQUIRE_THAT(*registry.get_failure("missing-builtin"),
                 ContainsSubstring("no built-in suite class named 'NoSuchSuite'") &&
                     ContainsSubstring("CommandSuite"));
    REQUIRE_THAT(*registry.get_failure("outdated"), ContainsSubstring("plugin API version"));

    REQUIRE(!registry.find("outdated"));
    REQUIRE(!registry.get_failure("ok"));
}

TEST_CASE("Skipped suites are never resolved") {
    auto skipped = make_suite("skipped", "/does/not/exist.so", "Whatever");
    skipped.skip = true;

    auto registry = make_registry();
    registry.load({skipped});

    REQUIRE(registry.size() == 0);
    REQUIRE(!registry.find("skipped"));
    REQUIRE(!registry.get_failure("skipped"));
}

TEST_CASE("Built-in suite classes need no library") {
    auto registry = make_registry();

    auto factory = registry.resolve(make_suite("cmd", "", "CommandSuite"));

    REQUIRE(factory);
}

TEST_CASE("A plugin's class name does not shadow a built-in one") {
    auto registry = make_registry();

    // The plugin has no CommandSuite; the built-in must not be found through it
    auto factory = registry.resolve(make_suite("cmd", PLUGIN_PATH.string(), "CommandSuite"));

    REQUIRE(!factory);
}

TEST_CASE("Registrations during a library load carry the library's origin") {
    {
        GlobalRegistrar::OriginScope scope{"/virtual/origin.so"};
        GlobalRegistrar::get().add_suite("ScopedSuite", SUITEGRADER_PLUGIN_API_VERSION, {});
    }

    REQUIRE(GlobalRegistrar::get().find("/virtual/origin.so", "ScopedSuite").has_value());
    REQUIRE(!GlobalRegistrar::get().find("", "ScopedSuite").has_value());
}

TEST_CASE("Opening a directory as a shared library fails") {
    TempDir tmp;

    auto lib = SharedLibrary::open(tmp.path());

    REQUIRE(!lib);
    REQUIRE_THAT(lib.error(), Catch::Matchers::ContainsSubstring("not an existing regular file"));
}
