#pragma once

#include <suitegrader/common/expected.hpp>

#include <boost/preprocessor/cat.hpp>
#include <fmt/format.h>

#include <string_view>

namespace suitegrader {

enum class ErrorKind {
    TimedOut,       ///< Operation surpassed its (generally configured) timeout
    SyscallFailure, ///< A Linux syscall failed
    BadArgument,    ///< Caller supplied an argument that cannot be acted upon
    NotFound,       ///< A named file, executable or symbol does not exist
    UnknownError,   ///< As named; use this as little as possible
};

template <typename T>
using Result = Expected<T, ErrorKind>;

constexpr std::string_view to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::TimedOut:
        return "TimedOut";
    case ErrorKind::SyscallFailure:
        return "SyscallFailure";
    case ErrorKind::BadArgument:
        return "BadArgument";
    case ErrorKind::NotFound:
        return "NotFound";
    case ErrorKind::UnknownError:
        return "UnknownError";
    }
    return "<unknown>";
}

} // namespace suitegrader

template <>
struct fmt::formatter<::suitegrader::ErrorKind> : fmt::formatter<std::string_view>
{
    auto format(::suitegrader::ErrorKind from, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(::suitegrader::to_string(from), ctx);
    }
};

/// If the supplied argument is an error (unexpected) type, then propegate the error `e` up
/// the call stack. Otherwise, continue execution as normal with the contained value
// NOLINTBEGIN(bugprone-macro-parentheses)
#define TRYE_IMPL(val, e, ident)                                                                                       \
    __extension__({                                                                                                    \
        auto&& ident = val;                                                                                            \
        if (!ident.has_value()) {                                                                                      \
            using enum ::suitegrader::ErrorKind;                                                                       \
            return e;                                                                                                  \
        }                                                                                                              \
        std::move(ident).value();                                                                                      \
    })

#define TRY_IMPL(val, ident)                                                                                           \
    __extension__({                                                                                                    \
        auto&& ident = val;                                                                                            \
        if (!ident.has_value()) {                                                                                      \
            return {::suitegrader::unexpected, ident.error()};                                                         \
        }                                                                                                              \
        std::move(ident).value();                                                                                      \
    })
// NOLINTEND(bugprone-macro-parentheses)

#define TRYE(val, e) TRYE_IMPL(val, e, BOOST_PP_CAT(errref_uniq__, __COUNTER__))

/// If the supplied argument is an error (unexpected) type, then propegate it up the call stack.
/// Otherwise, continue execution as normal
#define TRY(val) TRY_IMPL(val, BOOST_PP_CAT(errrefe_uniq__, __COUNTER__))
