#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "tsquery/core/context.h"
#include "tsquery/core/timerange.h"
#include "tsquery/core/types.h"
#include "tsquery/function/fetch_counter.h"
#include "tsquery/metadata/metric_metadata.h"
#include "tsquery/query/predicate.h"
#include "tsquery/query/profiler.h"
#include "tsquery/storage/timeseries_storage.h"

namespace tsquery {
namespace function {

class Registry;

/**
 * @brief Notes accumulated while evaluating, shipped as response metadata
 */
class EvaluationNotes {
public:
    void Add(const std::string& note);
    std::vector<std::string> All() const;

private:
    mutable std::mutex mutex_;
    std::vector<std::string> notes_;
};

/**
 * @brief Everything an expression needs to evaluate
 *
 * Built once per Select. Copies share the fetch counter and the notes, so a
 * function may re-evaluate its arguments over a shifted timerange without
 * escaping the request's limits.
 */
struct EvaluationContext {
    explicit EvaluationContext(const core::Timerange& range) : timerange(range) {}

    core::Timerange timerange;
    std::shared_ptr<storage::TimeseriesStorageAPI> storage;
    std::shared_ptr<metadata::MetricMetadataAPI> metadata;
    query::PredicatePtr predicate;  // may be null: matches everything
    core::SampleMethod sample_method = core::SampleMethod::MEAN;
    std::shared_ptr<FetchCounter> fetch_limit;
    std::shared_ptr<EvaluationNotes> notes;
    std::shared_ptr<const Registry> registry;
    std::shared_ptr<query::Profiler> profiler;  // optional
    std::shared_ptr<core::Context> context;

    EvaluationContext WithTimerange(const core::Timerange& range) const;

    void AddNote(const std::string& note) const;
    std::vector<std::string> Notes() const;

    /**
     * @brief Throws core::InternalError once the request scope is done
     */
    void CheckCancelled() const;
};

} // namespace function
} // namespace tsquery
