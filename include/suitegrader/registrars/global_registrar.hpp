#pragma once

#include <suitegrader/api/suite.hpp>
#include <suitegrader/api/suite_config.hpp>
#include <suitegrader/common/class_traits.hpp>
#include <suitegrader/logging.hpp>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace suitegrader {

using SuiteFactory = std::function<std::unique_ptr<Suite>(const std::filesystem::path& work_path, int submission_id,
                                                           const SuiteConfig& config, LoggerPtr logger)>;

/// A suite class made available by the program itself or by a loaded shared library
struct SuiteRegistration
{
    std::string class_name;

    /// Canonical path of the shared library that registered the class.
    /// Empty for classes compiled into the running program.
    std::string origin;

    int api_version;

    SuiteFactory factory;
};

/// A global singleton registrar of suite classes.
///
/// Registrations happen from static initializers, either at program start or while a
/// plugin library is being loaded. In the latter case the loader brackets the load
/// with an ``OriginScope`` so that every registration is tagged with the library it
/// came from, and the same class name may be registered by several libraries.
class GlobalRegistrar : NonMovable
{
public:
    /// Safe global singleton pattern (first intro. by Scott Meyers for C++, I think)
    static GlobalRegistrar& get() noexcept;

    /// Registers the suite class under the current origin.
    /// A repeated (origin, class) pair is ignored with a warning.
    void add_suite(std::string class_name, int api_version, SuiteFactory factory);

    /// Find a registration by the library it came from and its class name
    std::optional<std::reference_wrapper<const SuiteRegistration>> find(std::string_view origin,
                                                                       std::string_view class_name) const;

    /// Obtain a list of all class names registered by ``origin``
    std::vector<std::string_view> get_class_names(std::string_view origin) const;

    std::size_t get_num_registered() const;

    /// Tags registrations made during its lifetime with a library path
    class OriginScope : NonMovable
    {
    public:
        explicit OriginScope(std::string origin);
        ~OriginScope();

    private:
        std::string previous_;
    };

private:
    GlobalRegistrar() = default;

    std::string current_origin_;

    // unique_ptr so that references handed out by `find` stay valid
    std::vector<std::unique_ptr<SuiteRegistration>> registrations_;
};

} // namespace suitegrader
