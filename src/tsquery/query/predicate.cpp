#include "tsquery/query/predicate.h"
#include "tsquery/core/error.h"
#include <algorithm>
#include <sstream>

namespace tsquery {
namespace query {

namespace {

class AndPredicate : public Predicate {
public:
    explicit AndPredicate(std::vector<PredicatePtr> predicates) : predicates_(std::move(predicates)) {}

    bool Apply(const core::TagSet& tagset) const override {
        for (const auto& predicate : predicates_) {
            if (!predicate->Apply(tagset)) {
                return false;
            }
        }
        return true;
    }

    std::string Query() const override {
        if (predicates_.empty()) {
            return "true";
        }
        return Join(" and ");
    }

protected:
    std::string Join(const std::string& separator) const {
        std::ostringstream oss;
        oss << "(";
        for (size_t i = 0; i < predicates_.size(); ++i) {
            if (i != 0) {
                oss << separator;
            }
            oss << predicates_[i]->Query();
        }
        oss << ")";
        return oss.str();
    }

    std::vector<PredicatePtr> predicates_;
};

class OrPredicate : public AndPredicate {
public:
    explicit OrPredicate(std::vector<PredicatePtr> predicates) : AndPredicate(std::move(predicates)) {}

    bool Apply(const core::TagSet& tagset) const override {
        for (const auto& predicate : predicates_) {
            if (predicate->Apply(tagset)) {
                return true;
            }
        }
        return false;
    }

    std::string Query() const override {
        if (predicates_.empty()) {
            return "false";
        }
        return Join(" or ");
    }
};

class NotPredicate : public Predicate {
public:
    explicit NotPredicate(PredicatePtr predicate) : predicate_(std::move(predicate)) {}

    bool Apply(const core::TagSet& tagset) const override {
        return !predicate_->Apply(tagset);
    }

    std::string Query() const override {
        return "not " + predicate_->Query();
    }

private:
    PredicatePtr predicate_;
};

std::vector<PredicatePtr> DropNull(std::vector<PredicatePtr> predicates) {
    predicates.erase(std::remove(predicates.begin(), predicates.end(), nullptr), predicates.end());
    return predicates;
}

} // namespace

PredicatePtr All(std::vector<PredicatePtr> predicates) {
    predicates = DropNull(std::move(predicates));
    if (predicates.size() == 1) {
        return predicates.front();
    }
    return std::make_shared<AndPredicate>(std::move(predicates));
}

PredicatePtr All(PredicatePtr lhs, PredicatePtr rhs) {
    return All(std::vector<PredicatePtr>{std::move(lhs), std::move(rhs)});
}

PredicatePtr Any(std::vector<PredicatePtr> predicates) {
    predicates = DropNull(std::move(predicates));
    if (predicates.size() == 1) {
        return predicates.front();
    }
    return std::make_shared<OrPredicate>(std::move(predicates));
}

PredicatePtr Not(PredicatePtr predicate) {
    if (!predicate) {
        throw core::InvalidArgumentError("cannot negate a null predicate");
    }
    return std::make_shared<NotPredicate>(std::move(predicate));
}

ListMatcher::ListMatcher(std::string tag, std::vector<std::string> values)
    : tag_(std::move(tag)), values_(std::move(values)) {}

bool ListMatcher::Apply(const core::TagSet& tagset) const {
    if (!tagset.Has(tag_)) {
        return false;
    }
    std::string value = tagset.Get(tag_);
    return std::find(values_.begin(), values_.end(), value) != values_.end();
}

std::string ListMatcher::Query() const {
    std::ostringstream oss;
    if (values_.size() == 1) {
        oss << tag_ << " = '" << values_.front() << "'";
        return oss.str();
    }
    oss << tag_ << " in (";
    for (size_t i = 0; i < values_.size(); ++i) {
        if (i != 0) {
            oss << ", ";
        }
        oss << "'" << values_[i] << "'";
    }
    oss << ")";
    return oss.str();
}

RegexMatcher::RegexMatcher(std::string tag, std::string pattern)
    : tag_(std::move(tag)), pattern_(std::move(pattern)) {
    try {
        regex_ = std::regex(pattern_);
    } catch (const std::regex_error& e) {
        throw core::InvalidArgumentError("invalid regex '" + pattern_ + "': " + e.what());
    }
}

bool RegexMatcher::Apply(const core::TagSet& tagset) const {
    if (!tagset.Has(tag_)) {
        return false;
    }
    return std::regex_search(tagset.Get(tag_), regex_);
}

std::string RegexMatcher::Query() const {
    return tag_ + " match '" + pattern_ + "'";
}

} // namespace query
} // namespace tsquery
