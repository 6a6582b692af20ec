#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

namespace testsum {

class Context;
using ContextPtr = std::shared_ptr<Context>;
using CancelFunc = std::function<void()>;

// Cancellation token shared between the runner and the processes it starts.
// Cancelling a context cancels every context derived from it. Cancellation is
// idempotent and each registered callback runs exactly once.
class Context : public std::enable_shared_from_this<Context> {
    struct Key { explicit Key() = default; };
public:
    using CallbackId = std::uint64_t;
    using Clock = std::chrono::steady_clock;

    static ContextPtr background();
    static std::pair<ContextPtr, CancelFunc> with_cancel(const ContextPtr& parent);
    static std::pair<ContextPtr, CancelFunc> with_deadline(const ContextPtr& parent, Clock::time_point deadline);
    static std::pair<ContextPtr, CancelFunc> with_timeout(const ContextPtr& parent, Clock::duration timeout);

    explicit Context(Key) {}
    ~Context();
    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    void cancel() { cancel_with("context canceled"); }
    bool cancelled() const { return cancelled_.load(); }
    // Empty until cancelled.
    std::string reason() const;

    // Runs cb on cancellation; runs it immediately if already cancelled.
    CallbackId on_cancel(std::function<void()> cb);
    void remove_callback(CallbackId id);

private:
    void attach_to(const ContextPtr& parent);
    void start_deadline(Clock::time_point deadline);
    void cancel_with(const std::string& reason);

    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::string reason_;
    bool closing_ = false;
    std::map<CallbackId, std::function<void()>> callbacks_;
    CallbackId next_id_ = 1;

    ContextPtr parent_;
    CallbackId parent_registration_ = 0;
    std::thread deadline_thread_;
};

// Scope guard invoking a cancel function on every exit path.
class CancelGuard {
public:
    explicit CancelGuard(CancelFunc fn) : fn_(std::move(fn)) {}
    ~CancelGuard() { if(fn_) fn_(); }
    CancelGuard(const CancelGuard&) = delete;
    CancelGuard& operator=(const CancelGuard&) = delete;
private:
    CancelFunc fn_;
};

}
