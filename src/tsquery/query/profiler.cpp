#include "tsquery/query/profiler.h"

namespace tsquery {
namespace query {

Profiler::Span::Span(Profiler* profiler, std::string name)
    : profiler_(profiler), name_(std::move(name)), start_(std::chrono::system_clock::now()) {}

Profiler::Span::Span(Span&& other) noexcept
    : profiler_(other.profiler_), name_(std::move(other.name_)), start_(other.start_) {
    other.profiler_ = nullptr;
}

Profiler::Span::~Span() {
    Finish();
}

void Profiler::Span::Finish() {
    if (profiler_ == nullptr) {
        return;
    }
    profiler_->Add(Profile{name_, start_, std::chrono::system_clock::now()});
    profiler_ = nullptr;
}

Profiler::Span Profiler::Record(const std::string& name) {
    return Span(this, name);
}

void Profiler::Add(Profile profile) {
    std::lock_guard<std::mutex> lock(mutex_);
    profiles_.push_back(std::move(profile));
}

std::vector<Profile> Profiler::All() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return profiles_;
}

} // namespace query
} // namespace tsquery
