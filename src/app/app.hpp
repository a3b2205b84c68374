#pragma once

#include "app/trace_exception.hpp"
#include "user/program_options.hpp"

#include <suitegrader/common/class_traits.hpp>

#include <optional>
#include <utility>

namespace suitegrader {

class App : NonCopyable
{
public:
    /// Returned when ``run_impl`` throws
    static constexpr int EXIT_UNHANDLED_EXCEPTION = 2;

    explicit App(ProgramOptions opts)
        : OPTS{std::move(opts)} {}

    virtual ~App() = default;

    const ProgramOptions& get_opts() const noexcept { return OPTS; }

    int run() noexcept {
        std::optional res = wrap_throwable_fn(&App::run_impl, this);

        return res.value_or(EXIT_UNHANDLED_EXCEPTION);
    }

    const ProgramOptions OPTS;

protected:
    virtual int run_impl() = 0;
};

} // namespace suitegrader
