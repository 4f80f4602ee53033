#pragma once

#include <cstdint>
#include <string>

namespace tsquery {
namespace core {

/**
 * @brief A validated, grid-aligned range of slots
 *
 * All values are in milliseconds. The end always lies on the grid
 * start + k * resolution, so Slots() is exact.
 */
class Timerange {
public:
    /**
     * @brief Builds a range whose end is aligned down onto the slot grid from start
     * @throws InvalidRangeError if resolution <= 0, start > end or end - start
     *         does not fit in int64
     */
    static Timerange Snapped(int64_t start, int64_t end, int64_t resolution);

    int64_t Start() const { return start_; }
    int64_t End() const { return end_; }
    int64_t Resolution() const { return resolution_; }

    int64_t Duration() const { return end_ - start_; }
    int Slots() const { return static_cast<int>((end_ - start_) / resolution_) + 1; }

    /**
     * @brief Whether the timestamp falls on a slot of this range
     */
    bool Contains(int64_t timestamp) const;

    std::string ToString() const;

    bool operator==(const Timerange& other) const {
        return start_ == other.start_ && end_ == other.end_ && resolution_ == other.resolution_;
    }
    bool operator!=(const Timerange& other) const { return !(*this == other); }

private:
    Timerange(int64_t start, int64_t end, int64_t resolution)
        : start_(start), end_(end), resolution_(resolution) {}

    int64_t start_;
    int64_t end_;
    int64_t resolution_;
};

} // namespace core
} // namespace tsquery
