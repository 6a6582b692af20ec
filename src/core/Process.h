#pragma once
#include "ByteSource.h"
#include "Context.h"
#include "Logging.h"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

namespace testsum {

// Owning file descriptor.
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }
    UniqueFd(UniqueFd&& o) noexcept : fd_(o.release()) {}
    UniqueFd& operator=(UniqueFd&& o) noexcept { if(this != &o) reset(o.release()); return *this; }
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }
    int release() { int fd = fd_; fd_ = -1; return fd; }
    void reset(int fd = -1);
private:
    int fd_ = -1;
};

struct ProcessStatus {
    enum class Reason { Exit, Signal };
    Reason reason = Reason::Exit;
    int code = 0; // exit status, or signal number

    bool success() const { return reason == Reason::Exit && code == 0; }
};

// Reads one pipe of a child process. Returns end-of-stream early when the
// process is interrupted, even if a grandchild still holds the write end.
class PipeSource : public ByteSource {
public:
    PipeSource(const UniqueFd& fd, const UniqueFd& wake) : fd_(fd), wake_(wake) {}
    std::size_t read(char* buf, std::size_t len) override;
private:
    const UniqueFd& fd_;
    const UniqueFd& wake_;
};

// One spawned test command. Constructed first, then start()ed, so that the
// attempted command is still inspectable when start() fails.
//
// The process is bound to a context derived from the parent: cancelling the
// parent kills the child and wakes readers of its pipes. cancel() must run on
// every exit path; the destructor runs it too.
class ChildProcess {
public:
    ChildProcess(const ContextPtr& parent, std::vector<std::string> argv, Logger& log);
    ~ChildProcess();
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    // Creates the stdout/stderr pipes and spawns the command. Throws SetupError.
    void start();
    // Reaps the process. Repeated calls return the same status.
    ProcessStatus wait();
    // Kills a running child and wakes pipe readers. Safe from any thread.
    void interrupt();
    // interrupt(), reap, close every descriptor. Idempotent. An interrupt
    // already running on another thread finishes before the descriptors close.
    void cancel();
    CancelFunc cancel_func() { return [this](){ cancel(); }; }

    const std::vector<std::string>& args() const { return argv_; }
    // Resolved executable path when found on PATH, else argv[0].
    std::string path() const;
    pid_t pid() const { return pid_; }
    bool started() const { return pid_ > 0; }
    const Context& context() const { return *ctx_; }

    ByteSource& stdout_source() { return stdout_source_; }
    ByteSource& stderr_source() { return stderr_source_; }
    int stdout_fd() const { return stdout_.get(); }
    int stderr_fd() const { return stderr_.get(); }

private:
    // Kill and wake state shared with the context callback, which can still be
    // running on another thread after this object is gone. Once closed, an
    // interrupt does nothing.
    struct Control {
        std::mutex mutex;
        pid_t pid = 0;
        bool reaped = false;
        bool closed = false;
        UniqueFd wake;

        void interrupt(Logger& log);
    };

    void reap_locked(int raw_status);

    std::vector<std::string> argv_;
    Logger& log_;
    ContextPtr ctx_;
    CancelFunc ctx_cancel_;
    Context::CallbackId cancel_registration_ = 0;

    std::shared_ptr<Control> control_;
    pid_t pid_ = 0;
    UniqueFd stdout_;
    UniqueFd stderr_;
    PipeSource stdout_source_;
    PipeSource stderr_source_;

    std::optional<ProcessStatus> status_; // guarded by control_->mutex
    std::atomic<bool> cancelled_{false};
};

std::string resolve_executable(const std::string& name);
std::string join_args(const std::vector<std::string>& args);

}
