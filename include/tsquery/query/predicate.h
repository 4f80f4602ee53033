#pragma once

#include <memory>
#include <regex>
#include <string>
#include <vector>

#include "tsquery/core/types.h"

namespace tsquery {
namespace query {

/**
 * @brief Boolean test over the tags of a series
 */
class Predicate {
public:
    virtual ~Predicate() = default;

    virtual bool Apply(const core::TagSet& tagset) const = 0;

    /**
     * @brief Human-readable rendering, as it would appear in a query
     */
    virtual std::string Query() const = 0;
};

using PredicatePtr = std::shared_ptr<const Predicate>;

/**
 * @brief Conjunction; null operands are ignored, an empty conjunction is true
 */
PredicatePtr All(std::vector<PredicatePtr> predicates);
PredicatePtr All(PredicatePtr lhs, PredicatePtr rhs);

/**
 * @brief Disjunction; null operands are ignored, an empty disjunction is false
 */
PredicatePtr Any(std::vector<PredicatePtr> predicates);

PredicatePtr Not(PredicatePtr predicate);

/**
 * @brief Matches when the tag is present and its value is one of the listed values
 */
class ListMatcher : public Predicate {
public:
    ListMatcher(std::string tag, std::vector<std::string> values);

    bool Apply(const core::TagSet& tagset) const override;
    std::string Query() const override;

private:
    std::string tag_;
    std::vector<std::string> values_;
};

/**
 * @brief Matches when the tag is present and the regex finds a match in its value
 */
class RegexMatcher : public Predicate {
public:
    /**
     * @throws core::InvalidArgumentError on a malformed pattern
     */
    RegexMatcher(std::string tag, std::string pattern);

    bool Apply(const core::TagSet& tagset) const override;
    std::string Query() const override;

private:
    std::string tag_;
    std::string pattern_;
    std::regex regex_;
};

} // namespace query
} // namespace tsquery
