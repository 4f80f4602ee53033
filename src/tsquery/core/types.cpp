#include "tsquery/core/types.h"
#include <sstream>

namespace tsquery {
namespace core {

std::string TagSet::Get(const std::string& key) const {
    auto it = tags_.find(key);
    if (it != tags_.end()) {
        return it->second;
    }
    return "";
}

std::string TagSet::Serialize() const {
    std::ostringstream oss;
    bool first = true;
    for (const auto& [key, value] : tags_) {
        if (!first) {
            oss << ",";
        }
        oss << key << "=" << value;
        first = false;
    }
    return oss.str();
}

const char* SampleMethodName(SampleMethod method) {
    switch (method) {
        case SampleMethod::MEAN: return "mean";
        case SampleMethod::MIN: return "min";
        case SampleMethod::MAX: return "max";
        case SampleMethod::SUM: return "sum";
    }
    return "unknown";
}

} // namespace core
} // namespace tsquery
