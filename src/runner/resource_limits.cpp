#include "runner/resource_limits.hpp"

#include <suitegrader/api/suite_config.hpp>
#include <suitegrader/common/expected.hpp>
#include <suitegrader/common/linux.hpp>

#include <fmt/format.h>

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include <sys/resource.h>

namespace suitegrader {

namespace {

constexpr rlim_t BYTES_PER_MB = 1024 * 1024;

rlim_t megabytes(std::int64_t count) {
    return static_cast<rlim_t>(count) * BYTES_PER_MB;
}

} // namespace

ResourceLimits ResourceLimits::from_config(const SuiteConfig& config) {
    return ResourceLimits{
        .cpu_seconds = static_cast<rlim_t>(config.timeout_sec),
        .address_space_bytes = megabytes(config.ram_limit_mb),
        .file_size_bytes = megabytes(config.file_size_limit_mb),
        .num_procs = static_cast<rlim_t>(config.num_proc_limit),
        .num_open_files = static_cast<rlim_t>(config.num_open_files_limit),
    };
}

Expected<void, std::string> ResourceLimits::apply() const {
    const std::array<std::pair<int, rlim_t>, 5> limits{{
        {RLIMIT_CPU, cpu_seconds},
        {RLIMIT_AS, address_space_bytes},
        {RLIMIT_FSIZE, file_size_bytes},
        {RLIMIT_NPROC, num_procs},
        {RLIMIT_NOFILE, num_open_files},
    }};

    constexpr std::array<std::string_view, 5> names{"RLIMIT_CPU", "RLIMIT_AS", "RLIMIT_FSIZE", "RLIMIT_NPROC",
                                                    "RLIMIT_NOFILE"};

    for (std::size_t i = 0; i < limits.size(); ++i) {
        const auto& [resource, value] = limits[i];

        if (auto res = linux::setrlimit(resource, value); !res) {
            return fmt::format("setting {} to {} failed: {}", names[i], value, res.error().message());
        }
    }

    return {};
}

} // namespace suitegrader
