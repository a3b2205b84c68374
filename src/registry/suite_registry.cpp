#include "registry/suite_registry.hpp"

#include "registry/shared_library.hpp"

#include <suitegrader/api/suite_config.hpp>
#include <suitegrader/api/suite_macros.hpp>
#include <suitegrader/common/expected.hpp>
#include <suitegrader/logging.hpp>
#include <suitegrader/registrars/global_registrar.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace suitegrader {

void SuiteRegistry::load(const std::vector<SuiteConfig>& suites) {
    for (const SuiteConfig& config : suites) {
        if (config.skip) {
            LOGGER_DEBUG(logger_, "Suite '{}' is skipped; not resolving it", config.name);
            continue;
        }

        auto factory = resolve(config);

        if (!factory) {
            LOGGER_WARN(logger_, "Suite '{}' could not be loaded: {}", config.name, factory.error());
            failures_.insert_or_assign(config.name, factory.error());
            continue;
        }

        LOGGER_DEBUG(logger_, "Resolved suite '{}' to class '{}'", config.name, config.implementation_class);
        suites_.insert_or_assign(config.name, std::move(factory.value()));
    }

    if (suites_.empty()) {
        LOGGER_WARN(logger_, "No grading suites could be loaded");
    }
}

Expected<std::string, std::string> SuiteRegistry::load_library(const std::string& implementation_path) {
    std::filesystem::path path{implementation_path};

    if (path.is_relative()) {
        path = base_dir_ / path;
    }

    auto library = SharedLibrary::open(path);

    if (!library) {
        return {unexpected, library.error()};
    }

    std::string origin = library->get_canonical_path();
    libraries_.push_back(std::move(library.value()));

    return origin;
}

Expected<SuiteFactory, std::string> SuiteRegistry::resolve(const SuiteConfig& config) {
    std::string origin;

    if (!config.implementation_path.empty()) {
        origin = TRY(load_library(config.implementation_path));
    }

    const auto registration = GlobalRegistrar::get().find(origin, config.implementation_class);

    if (!registration) {
        const auto available = GlobalRegistrar::get().get_class_names(origin);

        if (origin.empty()) {
            return {unexpected, fmt::format("no built-in suite class named '{}' (available: {})",
                                            config.implementation_class, fmt::join(available, ", "))};
        }

        return {unexpected, fmt::format("'{}' does not register a suite class named '{}' (available: {})", origin,
                                        config.implementation_class, fmt::join(available, ", "))};
    }

    const SuiteRegistration& reg = registration->get();

    if (reg.api_version != SUITEGRADER_PLUGIN_API_VERSION) {
        return {unexpected,
                fmt::format("suite class '{}' was built for plugin API version {}, but this grader provides {}",
                            reg.class_name, reg.api_version, SUITEGRADER_PLUGIN_API_VERSION)};
    }

    return reg.factory;
}

std::optional<std::reference_wrapper<const SuiteFactory>> SuiteRegistry::find(std::string_view suite_name) const {
    if (auto iter = suites_.find(suite_name); iter != suites_.end()) {
        return std::cref(iter->second);
    }

    return std::nullopt;
}

std::optional<std::string> SuiteRegistry::get_failure(std::string_view suite_name) const {
    if (auto iter = failures_.find(suite_name); iter != failures_.end()) {
        return iter->second;
    }

    return std::nullopt;
}

} // namespace suitegrader
