#pragma once
#include <stdexcept>
#include <string>

namespace testsum {

constexpr int kExitCodeRunError = 3;
constexpr int kExitCodeIndeterminate = 127;

// Base for every orchestration-level failure.
class RunError : public std::runtime_error {
public:
    explicit RunError(const std::string& msg) : std::runtime_error(msg) {}
};

// Pipe, fork or exec failure; nothing has been streamed yet.
class SetupError : public RunError {
public:
    explicit SetupError(const std::string& msg) : RunError(msg) {}
};

// A stdout line that is not a valid test event.
class DecodeError : public RunError {
public:
    explicit DecodeError(const std::string& msg) : RunError(msg) {}
};

// Summary, JUnit or event capture output could not be written.
class ReportError : public RunError {
public:
    explicit ReportError(const std::string& msg) : RunError(msg) {}
};

// The child exited non-zero (or was killed). Not fatal to the orchestrator;
// the code is forwarded as our own exit status.
class ProcessExitError : public RunError {
public:
    ProcessExitError(const std::string& msg, int code, bool code_known)
        : RunError(msg), code_(code), code_known_(code_known) {}
    int code() const { return code_; }
    bool code_known() const { return code_known_; }
private:
    int code_;
    bool code_known_;
};

}
