#include "tsquery/command/concurrent_evaluator.h"
#include "tsquery/common/logger.h"
#include "tsquery/core/error.h"
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace tsquery {
namespace command {

namespace {

// Single-use completion slot shared between the waiting request and the
// evaluation thread. Either side may outlive the other.
class Completion {
public:
    void Deliver(std::vector<function::Value> values) {
        std::lock_guard<std::mutex> lock(mutex_);
        values_ = std::move(values);
        ready_ = true;
        cv_.notify_all();
    }

    void Fail(std::exception_ptr error) {
        std::lock_guard<std::mutex> lock(mutex_);
        error_ = std::move(error);
        ready_ = true;
        cv_.notify_all();
    }

    void Interrupt() {
        std::lock_guard<std::mutex> lock(mutex_);
        interrupted_ = true;
        cv_.notify_all();
    }

    /**
     * @return true if the evaluation finished, false on interrupt or deadline
     */
    bool Wait(std::optional<core::Context::Clock::time_point> deadline) {
        std::unique_lock<std::mutex> lock(mutex_);
        auto finished = [this] { return ready_ || interrupted_; };
        if (deadline) {
            cv_.wait_until(lock, *deadline, finished);
        } else {
            cv_.wait(lock, finished);
        }
        return ready_;
    }

    std::vector<function::Value> Take() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (error_) {
            std::rethrow_exception(error_);
        }
        return std::move(*values_);
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool ready_ = false;
    bool interrupted_ = false;
    std::optional<std::vector<function::Value>> values_;
    std::exception_ptr error_;
};

} // namespace

std::vector<function::Value> ConcurrentEvaluator::Evaluate(
    function::EvaluationContext context,
    const std::vector<function::ExpressionPtr>& expressions) const {
    std::shared_ptr<core::Context> scope = context.context ? context.context : core::Context::Background();
    std::unique_ptr<core::ContextGuard> release;
    if (timeout_.count() != 0) {
        scope = core::Context::WithTimeout(scope, timeout_);
        release = std::make_unique<core::ContextGuard>(scope);
    }
    context.context = scope;

    auto completion = std::make_shared<Completion>();
    auto shared_context = std::make_shared<const function::EvaluationContext>(std::move(context));
    std::thread([completion, shared_context, expressions]() {
        try {
            completion->Deliver(function::EvaluateMany(*shared_context, expressions));
        } catch (...) {
            completion->Fail(std::current_exception());
        }
    }).detach();

    uint64_t subscription = scope->Subscribe([completion]() { completion->Interrupt(); });
    bool finished = completion->Wait(scope->Deadline());
    scope->Unsubscribe(subscription);

    if (finished) {
        return completion->Take();
    }
    TSQUERY_WARN("query evaluation abandoned after {}ms timeout", timeout_.count());
    throw core::LimitError("Timeout while executing the query.", timeout_.count(), timeout_.count());
}

} // namespace command
} // namespace tsquery
