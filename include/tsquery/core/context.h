#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>

namespace tsquery {
namespace core {

/**
 * @brief Request-scoped cancellation and deadline scope
 *
 * Contexts form a tree: a derived context is done once it is cancelled,
 * its deadline passes, or its parent is done. Cancelling a context cancels
 * every context derived from it. Deadlines are observed lazily through
 * Done() and Deadline(); only explicit cancellation wakes subscribers, so
 * waiters combine Subscribe() with a timed wait on Deadline().
 */
class Context {
public:
    using Clock = std::chrono::steady_clock;
    using Callback = std::function<void()>;

    static std::shared_ptr<Context> Background();
    static std::shared_ptr<Context> WithCancel(const std::shared_ptr<Context>& parent);
    static std::shared_ptr<Context> WithTimeout(const std::shared_ptr<Context>& parent,
                                                std::chrono::milliseconds timeout);

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    /**
     * @brief Marks the context done and runs subscribed callbacks once
     */
    void Cancel();

    bool Done() const;
    bool Cancelled() const;
    bool DeadlineExceeded() const;

    /**
     * @brief Earliest deadline on the chain from this context to the root
     */
    std::optional<Clock::time_point> Deadline() const { return deadline_; }

    /**
     * @brief Registers a callback run on cancellation
     *
     * Runs the callback immediately when the context is already cancelled.
     * @return Subscription id, 0 if the callback already ran
     */
    uint64_t Subscribe(Callback callback);
    void Unsubscribe(uint64_t id);

    /**
     * @brief Stops following the parent's cancellation
     */
    void Detach();

private:
    Context(std::shared_ptr<Context> parent, std::optional<Clock::time_point> deadline);

    static std::shared_ptr<Context> Derive(const std::shared_ptr<Context>& parent,
                                           std::optional<Clock::time_point> deadline);

    std::shared_ptr<Context> parent_;
    std::optional<Clock::time_point> deadline_;

    mutable std::mutex mutex_;
    bool cancelled_ = false;
    uint64_t next_id_ = 1;
    uint64_t parent_subscription_ = 0;
    std::map<uint64_t, Callback> callbacks_;
};

/**
 * @brief Releases a derived context on scope exit
 */
class ContextGuard {
public:
    explicit ContextGuard(std::shared_ptr<Context> context) : context_(std::move(context)) {}
    ~ContextGuard();

    ContextGuard(const ContextGuard&) = delete;
    ContextGuard& operator=(const ContextGuard&) = delete;

private:
    std::shared_ptr<Context> context_;
};

} // namespace core
} // namespace tsquery
