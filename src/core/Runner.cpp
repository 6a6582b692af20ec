#include "Runner.h"
#include "CommandBuilder.h"
#include "Errors.h"
#include "EventHandler.h"
#include "JUnitWriter.h"
#include "Process.h"
#include "ScanOutput.h"
#include "Summary.h"
#include <cstring>

namespace testsum {

void run(const RunOptions& opts, Logger& log, RunStreams io, const ContextPtr& parent, const EnvLookup& env){
    EventHandlerPtr handler = new_event_handler(opts, io.out, io.err, log);
    SummarySections sections = summary_sections(opts.no_summary, log);

    ChildProcess proc(parent ? parent : Context::background(), compose_test_command(opts, env), log);
    CancelGuard guard(proc.cancel_func());
    try {
        proc.start();
    } catch(const SetupError& e) {
        throw SetupError("failed to run " + proc.path() + " " + join_args(proc.args()) + ": " + e.what());
    }

    auto exec = scan_test_output(ScanConfig{
        proc.stdout_source(),
        proc.stderr_source(),
        *handler,
        [&proc](){ proc.interrupt(); },
    });
    handler->close();

    print_summary(io.out, *exec, sections);
    write_junit_file(opts.junit_file, *exec);

    ProcessStatus status = proc.wait();
    if(status.success()) return;
    if(status.reason == ProcessStatus::Reason::Exit){
        throw ProcessExitError("exit status " + std::to_string(status.code), status.code, true);
    }
    throw ProcessExitError(std::string("signal: ") + strsignal(status.code), status.code, false);
}

RunOutcome execute(const RunOptions& opts, Logger& log, RunStreams io, const ContextPtr& parent, const EnvLookup& env){
    try {
        run(opts, log, io, parent, env);
    } catch(const ProcessExitError& e) {
        log.debug(std::string("test command failed: ") + e.what());
        return RunOutcome::child_exit(e.code(), e.code_known(), e.what());
    } catch(const std::exception& e) {
        return RunOutcome::failure(e.what());
    }
    return RunOutcome::success();
}

int exit_status(const RunOutcome& outcome, const std::string& program, std::ostream& err){
    switch(outcome.kind){
        case RunOutcome::Kind::Success:
            return 0;
        case RunOutcome::Kind::ChildExit:
            // the test command already reported its failure on stderr
            return outcome.code_known ? outcome.exit_code : kExitCodeIndeterminate;
        case RunOutcome::Kind::Failure:
            break;
    }
    err << program << ": Error: " << outcome.message << "\n";
    err.flush();
    return kExitCodeRunError;
}

}
