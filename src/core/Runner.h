#pragma once
#include "Config.h"
#include "Context.h"
#include "Logging.h"
#include <ostream>
#include <string>

namespace testsum {

// Terminal status of one run.
struct RunOutcome {
    enum class Kind { Success, ChildExit, Failure };

    Kind kind = Kind::Success;
    int exit_code = 0; // ChildExit only
    bool code_known = true; // false when the child was killed by a signal
    std::string message;

    static RunOutcome success() { return RunOutcome{}; }
    static RunOutcome child_exit(int code, bool known, std::string msg){
        return RunOutcome{Kind::ChildExit, code, known, std::move(msg)};
    }
    static RunOutcome failure(std::string msg){
        return RunOutcome{Kind::Failure, 0, true, std::move(msg)};
    }
};

struct RunStreams {
    std::ostream& out;
    std::ostream& err;
};

// Runs the test command and reports on it. Throws ProcessExitError when the
// child fails, any other RunError when orchestration fails. The child is
// killed and reaped before this returns, whatever the outcome.
void run(const RunOptions& opts, Logger& log, RunStreams io,
         const ContextPtr& parent = nullptr, const EnvLookup& env = process_env());

// run() with its errors folded into a RunOutcome.
RunOutcome execute(const RunOptions& opts, Logger& log, RunStreams io,
                   const ContextPtr& parent = nullptr, const EnvLookup& env = process_env());

// Maps an outcome to the process exit status. Orchestration failures print a
// single "<program>: Error: <message>" line to err; child failures print nothing.
int exit_status(const RunOutcome& outcome, const std::string& program, std::ostream& err);

}
