#pragma once

#include <cstdint>
#include <initializer_list>
#include <map>
#include <string>
#include <vector>

namespace tsquery {
namespace core {

/**
 * @brief Name of a metric as known to the metadata backend
 */
using MetricKey = std::string;

/**
 * @brief Set of tags identifying one series of a metric
 */
class TagSet {
public:
    using TagMap = std::map<std::string, std::string>;
    using const_iterator = TagMap::const_iterator;

    TagSet() = default;
    TagSet(std::initializer_list<TagMap::value_type> tags) : tags_(tags) {}
    explicit TagSet(TagMap tags) : tags_(std::move(tags)) {}

    void Set(const std::string& key, const std::string& value) { tags_[key] = value; }
    bool Has(const std::string& key) const { return tags_.count(key) != 0; }

    /**
     * @brief Value for the key, or an empty string when absent
     */
    std::string Get(const std::string& key) const;

    const TagMap& tags() const { return tags_; }
    size_t size() const { return tags_.size(); }
    bool empty() const { return tags_.empty(); }
    const_iterator begin() const { return tags_.begin(); }
    const_iterator end() const { return tags_.end(); }

    /**
     * @brief Canonical "key=value,key=value" rendering, keys in order
     */
    std::string Serialize() const;

    bool operator==(const TagSet& other) const { return tags_ == other.tags_; }
    bool operator!=(const TagSet& other) const { return !(*this == other); }
    bool operator<(const TagSet& other) const { return tags_ < other.tags_; }

private:
    TagMap tags_;
};

/**
 * @brief One series: a value per slot of the evaluation timerange
 */
struct Timeseries {
    std::vector<double> values;
    TagSet tagset;

    bool operator==(const Timeseries& other) const {
        return values == other.values && tagset == other.tagset;
    }
};

/**
 * @brief Ordered collection of series produced by one expression
 */
struct SeriesList {
    std::vector<Timeseries> series;

    bool operator==(const SeriesList& other) const { return series == other.series; }
};

struct TaggedScalar {
    TagSet tagset;
    double value;

    bool operator==(const TaggedScalar& other) const {
        return tagset == other.tagset && value == other.value;
    }
};

using ScalarSet = std::vector<TaggedScalar>;

/**
 * @brief How storage reduces raw samples into a coarser slot
 */
enum class SampleMethod {
    MEAN,
    MIN,
    MAX,
    SUM
};

const char* SampleMethodName(SampleMethod method);

} // namespace core
} // namespace tsquery
