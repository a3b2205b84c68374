#pragma once

#include <suitegrader/api/suite.hpp>
#include <suitegrader/api/suite_config.hpp>
#include <suitegrader/logging.hpp>
#include <suitegrader/registrars/global_registrar.hpp>

#include <concepts>
#include <filesystem>
#include <memory>
#include <string_view>

namespace suitegrader {

/// Helper class that, when constructed, automatically registers a suite class to the global registrar
template <typename SuiteClass>
    requires(std::derived_from<SuiteClass, Suite> &&
             std::constructible_from<SuiteClass, std::filesystem::path, int, SuiteConfig, LoggerPtr>)
class SuiteAutoRegistrar
{
public:
    explicit SuiteAutoRegistrar(std::string_view class_name, int api_version) {
        GlobalRegistrar::get().add_suite(
            std::string{class_name}, api_version,
            [](const std::filesystem::path& work_path, int submission_id, const SuiteConfig& config,
               LoggerPtr logger) -> std::unique_ptr<Suite> {
                return std::make_unique<SuiteClass>(work_path, submission_id, config, std::move(logger));
            });
    }
};

} // namespace suitegrader
