#include "tsquery/function/fetch_counter.h"
#include "tsquery/core/error.h"

namespace tsquery {
namespace function {

void FetchCounter::Consume(int n) {
    int total = used_.fetch_add(n, std::memory_order_relaxed) + n;
    if (total > limit_) {
        throw core::LimitError("fetch limit exceeded: too many series fetched", total, limit_);
    }
}

} // namespace function
} // namespace tsquery
