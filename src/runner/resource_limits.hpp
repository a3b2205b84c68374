#pragma once

#include <suitegrader/api/suite_config.hpp>
#include <suitegrader/common/expected.hpp>

#include <fmt/format.h>

#include <string>

#include <sys/resource.h>

namespace suitegrader {

/// OS resource ceilings for one suite process. Applied with soft limit == hard limit.
struct ResourceLimits
{
    rlim_t cpu_seconds;
    rlim_t address_space_bytes;
    rlim_t file_size_bytes;
    rlim_t num_procs;
    rlim_t num_open_files;

    static ResourceLimits from_config(const SuiteConfig& config);

    /// Apply all limits to the calling process. Stops at the first limit that cannot be set.
    Expected<void, std::string> apply() const;

    std::string to_string() const {
        return fmt::format("{{cpu={}s, as={}B, fsize={}B, nproc={}, nofile={}}}", cpu_seconds, address_space_bytes,
                           file_size_bytes, num_procs, num_open_files);
    }
};

} // namespace suitegrader
