#pragma once

#include "app/app.hpp" // IWYU pragma: export

namespace suitegrader {

/// Grades one submission as described by the program options
class GraderApp final : public App
{
public:
    using App::App;

    /// The report was written and the run completed
    static constexpr int EXIT_GRADED = 0;
    /// The run was aborted on a configuration or archive error; a report was still written
    static constexpr int EXIT_ABORTED = 1;
    /// No report could be written, or a requested JSON report could not be
    static constexpr int EXIT_NO_REPORT = 2;

private:
    int run_impl() override;
};

} // namespace suitegrader
