#include "app/grader_app.hpp"
#include "user/cl_args.hpp"
#include "user/program_options.hpp"

#include <suitegrader/logging.hpp>

#include <cstddef>
#include <span>

int main(int argc, const char* argv[]) {
    using namespace suitegrader;

    init_loggers();

    std::span<const char*> args{argv, static_cast<std::size_t>(argc)};

    const ProgramOptions options = parse_args_or_exit(args, GraderApp::EXIT_NO_REPORT);

    if (options.debug) {
        init_loggers(/*debug=*/true);
    }

    GraderApp app{options};

    return app.run();
}
