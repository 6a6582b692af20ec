#include "Process.h"
#include "Errors.h"
#include <array>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/eventfd.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace testsum {

namespace {
    struct Pipe {
        UniqueFd read_end;
        UniqueFd write_end;
    };

    Pipe make_pipe(const char* what){
        int fds[2];
        if(pipe2(fds, O_CLOEXEC) != 0){
            throw SetupError(std::string(what) + " pipe: " + std::strerror(errno));
        }
        return Pipe{UniqueFd(fds[0]), UniqueFd(fds[1])};
    }

    // Reads exactly len bytes unless EOF comes first; returns bytes read.
    ssize_t read_full(int fd, void* buf, size_t len){
        size_t got = 0;
        while(got < len){
            ssize_t n = ::read(fd, static_cast<char*>(buf) + got, len - got);
            if(n < 0 && errno == EINTR) continue;
            if(n <= 0) return n < 0 ? n : static_cast<ssize_t>(got);
            got += static_cast<size_t>(n);
        }
        return static_cast<ssize_t>(got);
    }
}

void UniqueFd::reset(int fd){
    if(fd_ >= 0) ::close(fd_);
    fd_ = fd;
}

std::size_t PipeSource::read(char* buf, std::size_t len){
    if(!fd_.valid()) return 0;
    std::array<pollfd, 2> fds{};
    fds[0].fd = fd_.get();
    fds[0].events = POLLIN;
    fds[1].fd = wake_.valid() ? wake_.get() : -1;
    fds[1].events = POLLIN;
    while(true){
        int rc = ::poll(fds.data(), fds.size(), -1);
        if(rc < 0){
            if(errno == EINTR) continue;
            throw RunError(std::string("poll: ") + std::strerror(errno));
        }
        if(fds[1].revents & POLLIN) return 0; // interrupted
        if(fds[0].revents & (POLLIN | POLLHUP | POLLERR)){
            ssize_t n = ::read(fd_.get(), buf, len);
            if(n < 0){
                if(errno == EINTR || errno == EAGAIN) continue;
                throw RunError(std::string("read: ") + std::strerror(errno));
            }
            return static_cast<std::size_t>(n);
        }
        if(fds[0].revents & POLLNVAL) return 0;
    }
}

std::string resolve_executable(const std::string& name){
    if(name.empty() || name.find('/') != std::string::npos) return name;
    const char* path = std::getenv("PATH");
    if(!path) return name;
    std::stringstream ss(path);
    std::string dir;
    while(std::getline(ss, dir, ':')){
        if(dir.empty()) dir = ".";
        std::string candidate = dir + "/" + name;
        struct stat st{};
        if(::stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) && ::access(candidate.c_str(), X_OK) == 0){
            return candidate;
        }
    }
    return name;
}

std::string join_args(const std::vector<std::string>& args){
    std::string out;
    for(const auto& a : args){
        if(!out.empty()) out.push_back(' ');
        out += a;
    }
    return out;
}

ChildProcess::ChildProcess(const ContextPtr& parent, std::vector<std::string> argv, Logger& log)
    : argv_(std::move(argv)), log_(log), control_(std::make_shared<Control>()),
      stdout_source_(stdout_, control_->wake), stderr_source_(stderr_, control_->wake) {
    auto derived = Context::with_cancel(parent ? parent : Context::background());
    ctx_ = derived.first;
    ctx_cancel_ = derived.second;
}

ChildProcess::~ChildProcess(){
    cancel();
}

std::string ChildProcess::path() const {
    if(argv_.empty()) return "";
    return resolve_executable(argv_.front());
}

void ChildProcess::start(){
    if(pid_ > 0) throw SetupError("process already started");
    if(argv_.empty()) throw SetupError("no test command to run");
    if(ctx_->cancelled()) throw SetupError(ctx_->reason());
    log_.debug("exec: [" + join_args(argv_) + "]");

    Pipe out = make_pipe("stdout");
    Pipe err = make_pipe("stderr");
    Pipe exec_status = make_pipe("exec status");

    int wake = ::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
    if(wake < 0) throw SetupError(std::string("eventfd: ") + std::strerror(errno));
    {
        std::lock_guard<std::mutex> lock(control_->mutex);
        control_->wake.reset(wake);
    }

    // Everything the child touches is prepared before fork.
    std::vector<char*> cargv;
    cargv.reserve(argv_.size() + 1);
    for(auto& a : argv_) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    pid_t pid = ::fork();
    if(pid < 0) throw SetupError(std::string("fork: ") + std::strerror(errno));
    if(pid == 0){
        int devnull = ::open("/dev/null", O_RDONLY);
        if(devnull >= 0){
            ::dup2(devnull, 0);
            if(devnull != 0) ::close(devnull);
        }
        ::dup2(out.write_end.get(), 1);
        ::dup2(err.write_end.get(), 2);
        ::execvp(cargv[0], cargv.data());
        int e = errno;
        ssize_t ignored = ::write(exec_status.write_end.get(), &e, sizeof(e));
        (void)ignored;
        ::_exit(127);
    }

    out.write_end.reset();
    err.write_end.reset();
    exec_status.write_end.reset();

    int child_errno = 0;
    ssize_t n = read_full(exec_status.read_end.get(), &child_errno, sizeof(child_errno));
    if(n == static_cast<ssize_t>(sizeof(child_errno))){
        int raw = 0;
        while(::waitpid(pid, &raw, 0) < 0 && errno == EINTR) {}
        throw SetupError("exec: \"" + argv_.front() + "\": " + std::strerror(child_errno));
    }

    {
        std::lock_guard<std::mutex> lock(control_->mutex);
        pid_ = pid;
        control_->pid = pid;
    }
    stdout_ = std::move(out.read_end);
    stderr_ = std::move(err.read_end);
    cancel_registration_ = ctx_->on_cancel([control = control_, &log = log_](){ control->interrupt(log); });
    if(pid_ > 0) log_.debug("test command pid: " + std::to_string(pid_));
}

void ChildProcess::reap_locked(int raw){
    control_->reaped = true;
    ProcessStatus st;
    if(WIFEXITED(raw)){
        st.reason = ProcessStatus::Reason::Exit;
        st.code = WEXITSTATUS(raw);
    } else {
        st.reason = ProcessStatus::Reason::Signal;
        st.code = WIFSIGNALED(raw) ? WTERMSIG(raw) : 0;
    }
    status_ = st;
}

ProcessStatus ChildProcess::wait(){
    if(pid_ <= 0) throw RunError("wait: process not started");
    {
        std::lock_guard<std::mutex> lock(control_->mutex);
        if(status_) return *status_;
    }
    // Block without reaping so interrupt() never signals a recycled pid.
    siginfo_t info{};
    while(::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT) < 0){
        if(errno != EINTR) throw RunError(std::string("wait: ") + std::strerror(errno));
    }
    std::lock_guard<std::mutex> lock(control_->mutex);
    if(status_) return *status_;
    int raw = 0;
    while(::waitpid(pid_, &raw, 0) < 0){
        if(errno != EINTR) throw RunError(std::string("wait: ") + std::strerror(errno));
    }
    reap_locked(raw);
    return *status_;
}

void ChildProcess::Control::interrupt(Logger& log){
    std::lock_guard<std::mutex> lock(mutex);
    if(closed) return;
    if(pid > 0 && !reaped){
        if(::kill(pid, SIGKILL) != 0 && errno != ESRCH){
            log.debug("kill " + std::to_string(pid) + ": " + std::strerror(errno));
        }
    }
    if(wake.valid()){
        std::uint64_t one = 1;
        ssize_t n = ::write(wake.get(), &one, sizeof(one));
        (void)n; // counter saturation still leaves it readable
    }
}

void ChildProcess::interrupt(){
    control_->interrupt(log_);
}

void ChildProcess::cancel(){
    if(cancelled_.exchange(true)) return;
    if(cancel_registration_) ctx_->remove_callback(cancel_registration_);
    ctx_cancel_();
    interrupt();
    // Callbacks already copied out by the context still hold control_; they
    // either finished under the lock or will find it closed.
    std::lock_guard<std::mutex> lock(control_->mutex);
    if(pid_ > 0 && !control_->reaped){
        int raw = 0;
        pid_t rc;
        while((rc = ::waitpid(pid_, &raw, 0)) < 0 && errno == EINTR) {}
        if(rc == pid_) reap_locked(raw);
        else log_.debug("waitpid " + std::to_string(pid_) + ": " + std::strerror(errno));
    }
    control_->closed = true;
    control_->wake.reset();
    stdout_.reset();
    stderr_.reset();
}

}
