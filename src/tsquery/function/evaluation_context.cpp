#include "tsquery/function/evaluation_context.h"
#include "tsquery/core/error.h"

namespace tsquery {
namespace function {

void EvaluationNotes::Add(const std::string& note) {
    std::lock_guard<std::mutex> lock(mutex_);
    notes_.push_back(note);
}

std::vector<std::string> EvaluationNotes::All() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return notes_;
}

EvaluationContext EvaluationContext::WithTimerange(const core::Timerange& range) const {
    EvaluationContext copy(*this);
    copy.timerange = range;
    return copy;
}

void EvaluationContext::AddNote(const std::string& note) const {
    if (notes) {
        notes->Add(note);
    }
}

std::vector<std::string> EvaluationContext::Notes() const {
    if (!notes) {
        return {};
    }
    return notes->All();
}

void EvaluationContext::CheckCancelled() const {
    if (context && context->Done()) {
        throw core::InternalError("query evaluation cancelled");
    }
}

} // namespace function
} // namespace tsquery
