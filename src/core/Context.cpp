#include "Context.h"
#include <vector>

namespace testsum {

ContextPtr Context::background(){
    return std::make_shared<Context>(Key{});
}

std::pair<ContextPtr, CancelFunc> Context::with_cancel(const ContextPtr& parent){
    ContextPtr ctx = std::make_shared<Context>(Key{});
    if(parent) ctx->attach_to(parent);
    std::weak_ptr<Context> weak = ctx;
    CancelFunc cancel = [weak](){ if(auto c = weak.lock()) c->cancel(); };
    return {ctx, cancel};
}

std::pair<ContextPtr, CancelFunc> Context::with_deadline(const ContextPtr& parent, Clock::time_point deadline){
    auto res = with_cancel(parent);
    res.first->start_deadline(deadline);
    return res;
}

std::pair<ContextPtr, CancelFunc> Context::with_timeout(const ContextPtr& parent, Clock::duration timeout){
    return with_deadline(parent, Clock::now() + timeout);
}

Context::~Context(){
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closing_ = true;
        callbacks_.clear();
    }
    cv_.notify_all();
    if(deadline_thread_.joinable()){
        if(deadline_thread_.get_id() == std::this_thread::get_id()) deadline_thread_.detach();
        else deadline_thread_.join();
    }
    if(parent_ && parent_registration_) parent_->remove_callback(parent_registration_);
}

void Context::attach_to(const ContextPtr& parent){
    parent_ = parent;
    std::weak_ptr<Context> weak = shared_from_this();
    parent_registration_ = parent->on_cancel([weak, parent_raw = parent.get()](){
        auto child = weak.lock();
        if(!child) return;
        child->cancel_with(parent_raw->reason());
    });
}

void Context::start_deadline(Clock::time_point deadline){
    deadline_thread_ = std::thread([this, deadline](){
        std::unique_lock<std::mutex> lock(mutex_);
        bool stop = cv_.wait_until(lock, deadline, [this]{ return cancelled_.load() || closing_; });
        lock.unlock();
        if(!stop) cancel_with("context deadline exceeded");
    });
}

std::string Context::reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reason_;
}

Context::CallbackId Context::on_cancel(std::function<void()> cb){
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if(!cancelled_.load()){
            CallbackId id = next_id_++;
            callbacks_.emplace(id, std::move(cb));
            return id;
        }
    }
    cb();
    return 0;
}

void Context::remove_callback(CallbackId id){
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_.erase(id);
}

void Context::cancel_with(const std::string& reason){
    std::vector<std::function<void()>> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if(cancelled_.exchange(true)) return;
        reason_ = reason;
        for(auto& kv : callbacks_) pending.push_back(std::move(kv.second));
        callbacks_.clear();
    }
    cv_.notify_all();
    for(auto& cb : pending) cb();
}

}
