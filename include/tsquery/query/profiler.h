#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace tsquery {
namespace query {

/**
 * @brief One recorded timing span
 */
struct Profile {
    std::string name;
    std::chrono::system_clock::time_point start;
    std::chrono::system_clock::time_point finish;

    int64_t DurationMicros() const {
        return std::chrono::duration_cast<std::chrono::microseconds>(finish - start).count();
    }
};

/**
 * @brief Collects named timing spans for one request
 *
 * Thread-safe: spans may be recorded from the evaluation thread while the
 * request thread reads them.
 */
class Profiler {
public:
    /**
     * @brief Scoped span; recorded when finished or destroyed, whichever is first
     */
    class Span {
    public:
        Span(Profiler* profiler, std::string name);
        ~Span();

        Span(Span&& other) noexcept;
        Span(const Span&) = delete;
        Span& operator=(const Span&) = delete;
        Span& operator=(Span&&) = delete;

        void Finish();

    private:
        Profiler* profiler_;
        std::string name_;
        std::chrono::system_clock::time_point start_;
    };

    Profiler() = default;
    Profiler(const Profiler&) = delete;
    Profiler& operator=(const Profiler&) = delete;

    Span Record(const std::string& name);
    void Add(Profile profile);

    std::vector<Profile> All() const;

private:
    mutable std::mutex mutex_;
    std::vector<Profile> profiles_;
};

} // namespace query
} // namespace tsquery
