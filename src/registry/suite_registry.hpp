#pragma once

#include "registry/shared_library.hpp"

#include <suitegrader/api/suite_config.hpp>
#include <suitegrader/common/expected.hpp>
#include <suitegrader/logging.hpp>
#include <suitegrader/registrars/global_registrar.hpp>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace suitegrader {

/// Resolves configured suites to registered implementations.
///
/// An entry that cannot be resolved is recorded with its reason and skipped; it never
/// prevents the remaining entries from loading. Skipped suites are never resolved.
class SuiteRegistry
{
public:
    SuiteRegistry(std::filesystem::path base_dir, LoggerPtr logger)
        : base_dir_{std::move(base_dir)}
        , logger_{std::move(logger)} {}

    /// Resolve every entry of ``suites``. May be called more than once; later calls add to the mapping.
    void load(const std::vector<SuiteConfig>& suites);

    /// Resolve a single entry
    Expected<SuiteFactory, std::string> resolve(const SuiteConfig& config);

    std::optional<std::reference_wrapper<const SuiteFactory>> find(std::string_view suite_name) const;

    /// Why ``suite_name`` failed to resolve, if it did
    std::optional<std::string> get_failure(std::string_view suite_name) const;

    const std::map<std::string, SuiteFactory, std::less<>>& get_suites() const { return suites_; }

    const std::map<std::string, std::string, std::less<>>& get_failures() const { return failures_; }

    std::size_t size() const { return suites_.size(); }

private:
    Expected<std::string, std::string> load_library(const std::string& implementation_path);

    std::filesystem::path base_dir_;
    LoggerPtr logger_;

    std::map<std::string, SuiteFactory, std::less<>> suites_;
    std::map<std::string, std::string, std::less<>> failures_;

    // Kept open for the registry's lifetime
    std::vector<SharedLibrary> libraries_;
};

} // namespace suitegrader
