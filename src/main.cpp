#include "core/ArgumentParser.h"
#include "core/Config.h"
#include "core/Logging.h"
#include "core/Runner.h"
#include <iostream>
#include <string>

using namespace testsum;

int main(int argc, char** argv) {
    const std::string name = argc > 0 ? argv[0] : "testsum";

    RunOptions opts = default_options(process_env());
    ArgumentParser parser(name);
    if(!parser.parse(argc, argv, opts)) return parser.exit_code();

    Logger log(std::cerr, logger_config(opts.debug, opts.no_color));
    RunOutcome outcome = execute(opts, log, RunStreams{std::cout, std::cerr});
    return exit_status(outcome, name, std::cerr);
}
