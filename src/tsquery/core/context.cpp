#include "tsquery/core/context.h"

namespace tsquery {
namespace core {

Context::Context(std::shared_ptr<Context> parent, std::optional<Clock::time_point> deadline)
    : parent_(std::move(parent)), deadline_(deadline) {}

std::shared_ptr<Context> Context::Background() {
    return std::shared_ptr<Context>(new Context(nullptr, std::nullopt));
}

std::shared_ptr<Context> Context::WithCancel(const std::shared_ptr<Context>& parent) {
    std::optional<Clock::time_point> deadline;
    if (parent) {
        deadline = parent->Deadline();
    }
    return Derive(parent, deadline);
}

std::shared_ptr<Context> Context::WithTimeout(const std::shared_ptr<Context>& parent,
                                              std::chrono::milliseconds timeout) {
    Clock::time_point deadline = Clock::now() + timeout;
    if (parent && parent->Deadline() && *parent->Deadline() < deadline) {
        deadline = *parent->Deadline();
    }
    return Derive(parent, deadline);
}

std::shared_ptr<Context> Context::Derive(const std::shared_ptr<Context>& parent,
                                         std::optional<Clock::time_point> deadline) {
    std::shared_ptr<Context> child(new Context(parent, deadline));
    if (parent) {
        std::weak_ptr<Context> weak = child;
        uint64_t id = parent->Subscribe([weak]() {
            if (auto locked = weak.lock()) {
                locked->Cancel();
            }
        });
        std::lock_guard<std::mutex> lock(child->mutex_);
        child->parent_subscription_ = id;
    }
    return child;
}

void Context::Cancel() {
    std::map<uint64_t, Callback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_) {
            return;
        }
        cancelled_ = true;
        callbacks.swap(callbacks_);
    }
    for (auto& entry : callbacks) {
        entry.second();
    }
}

bool Context::Cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

bool Context::DeadlineExceeded() const {
    return deadline_ && Clock::now() >= *deadline_;
}

bool Context::Done() const {
    if (Cancelled() || DeadlineExceeded()) {
        return true;
    }
    return parent_ && parent_->Done();
}

uint64_t Context::Subscribe(Callback callback) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!cancelled_) {
            uint64_t id = next_id_++;
            callbacks_.emplace(id, std::move(callback));
            return id;
        }
    }
    callback();
    return 0;
}

void Context::Unsubscribe(uint64_t id) {
    if (id == 0) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_.erase(id);
}

void Context::Detach() {
    uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = parent_subscription_;
        parent_subscription_ = 0;
    }
    if (parent_) {
        parent_->Unsubscribe(id);
    }
}

ContextGuard::~ContextGuard() {
    if (context_) {
        context_->Cancel();
        context_->Detach();
    }
}

} // namespace core
} // namespace tsquery
