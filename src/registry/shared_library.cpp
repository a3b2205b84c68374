#include "registry/shared_library.hpp"

#include <suitegrader/common/expected.hpp>
#include <suitegrader/logging.hpp>
#include <suitegrader/registrars/global_registrar.hpp>

#include <fmt/format.h>

#include <filesystem>
#include <string>
#include <system_error>
#include <utility>

#include <dlfcn.h>

namespace suitegrader {

Expected<SharedLibrary, std::string> SharedLibrary::open(const std::filesystem::path& path) {
    std::error_code err;

    if (!std::filesystem::is_regular_file(path, err)) {
        return fmt::format("'{}' is not an existing regular file", path.string());
    }

    auto canonical = std::filesystem::canonical(path, err);

    if (err) {
        return fmt::format("cannot resolve '{}': {}", path.string(), err.message());
    }

    void* handle = nullptr;

    {
        GlobalRegistrar::OriginScope origin{canonical.string()};

        // clear any stale error state
        dlerror();
        handle = dlopen(canonical.c_str(), RTLD_NOW | RTLD_LOCAL | RTLD_NODELETE);
    }

    if (handle == nullptr) {
        const char* dl_err = dlerror();
        return fmt::format("dlopen failed: {}", dl_err != nullptr ? dl_err : "unknown error");
    }

    LOG_DEBUG("Loaded shared library '{}'", canonical.string());

    return SharedLibrary{handle, canonical.string()};
}

SharedLibrary::~SharedLibrary() {
    if (handle_ == nullptr) {
        return;
    }

    if (dlclose(handle_) != 0) {
        const char* dl_err = dlerror();
        LOG_WARN("dlclose of '{}' failed: {}", canonical_path_, dl_err != nullptr ? dl_err : "unknown error");
    }
}

SharedLibrary& SharedLibrary::operator=(SharedLibrary&& rhs) noexcept {
    if (this != &rhs) {
        std::swap(handle_, rhs.handle_);
        std::swap(canonical_path_, rhs.canonical_path_);
    }

    return *this;
}

} // namespace suitegrader
