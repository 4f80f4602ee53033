#pragma once

#include <atomic>

namespace tsquery {
namespace function {

/**
 * @brief Request-scoped ceiling on the number of series fetches
 *
 * Shared by every expression of one evaluation; safe for concurrent use.
 */
class FetchCounter {
public:
    explicit FetchCounter(int limit) : limit_(limit) {}

    FetchCounter(const FetchCounter&) = delete;
    FetchCounter& operator=(const FetchCounter&) = delete;

    /**
     * @brief Reserves n fetches
     * @throws core::LimitError when the total would exceed the limit
     */
    void Consume(int n);

    int Current() const { return used_.load(std::memory_order_relaxed); }
    int Limit() const { return limit_; }

private:
    const int limit_;
    std::atomic<int> used_{0};
};

} // namespace function
} // namespace tsquery
