#pragma once

#include <suitegrader/common/class_traits.hpp>
#include <suitegrader/common/expected.hpp>

#include <filesystem>
#include <string>
#include <utility>

namespace suitegrader {

/// Owning handle to a ``dlopen``ed library.
///
/// Libraries are opened with ``RTLD_NODELETE``, so code they registered stays mapped
/// after the handle is closed.
class SharedLibrary : NonCopyable
{
public:
    /// ``path`` must name an existing regular file. Static initializers of the library run
    /// with registrations tagged by the library's canonical path.
    static Expected<SharedLibrary, std::string> open(const std::filesystem::path& path);

    ~SharedLibrary();

    SharedLibrary(SharedLibrary&& other) noexcept
        : handle_{std::exchange(other.handle_, nullptr)}
        , canonical_path_{std::move(other.canonical_path_)} {}

    SharedLibrary& operator=(SharedLibrary&& rhs) noexcept;

    /// The origin tag used for this library's registrations
    const std::string& get_canonical_path() const { return canonical_path_; }

private:
    SharedLibrary(void* handle, std::string canonical_path)
        : handle_{handle}
        , canonical_path_{std::move(canonical_path)} {}

    void* handle_;
    std::string canonical_path_;
};

} // namespace suitegrader
