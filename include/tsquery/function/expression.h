#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "tsquery/function/evaluation_context.h"
#include "tsquery/function/value.h"
#include "tsquery/query/predicate.h"

namespace tsquery {
namespace function {

class Registry;

/**
 * @brief Lookback negotiation state shared by every expression of a query
 *
 * Expressions that need samples before the start of the range lower the
 * shared earliest start; it can never be raised. Copies made with
 * WithCurrent() share the same earliest cell, so nested functions that
 * shift their arguments in time still contribute to one minimum. All
 * access to the cell is serialized by one mutex, so the outcome does not
 * depend on the order or the thread expressions are consulted from.
 */
class WidestMode {
public:
    WidestMode(std::shared_ptr<const Registry> registry, int64_t current, int64_t resolution);

    int64_t Current() const { return current_; }
    int64_t Resolution() const { return resolution_; }
    const std::shared_ptr<const Registry>& registry() const { return registry_; }

    /**
     * @brief Lowers the earliest start to candidate if it is earlier
     */
    void Lower(int64_t candidate);
    int64_t Earliest() const;

    /**
     * @brief Same shared earliest cell, evaluated as if the range began at current
     */
    WidestMode WithCurrent(int64_t current) const;

private:
    struct Cell {
        std::mutex mutex;
        int64_t earliest;
    };

    WidestMode(std::shared_ptr<const Registry> registry, int64_t current, int64_t resolution,
               std::shared_ptr<Cell> cell);

    std::shared_ptr<const Registry> registry_;
    int64_t current_;
    int64_t resolution_;
    std::shared_ptr<Cell> cell_;
};

/**
 * @brief Node of a parsed query expression
 *
 * Besides evaluation, an expression describes itself in three modes: the
 * query text it was parsed from, a display name, and the lookback it needs
 * (Widen), which must not evaluate anything.
 */
class Expression {
public:
    virtual ~Expression() = default;

    virtual Value Evaluate(const EvaluationContext& context) const = 0;

    virtual std::string QueryString() const = 0;
    virtual std::string Name() const { return QueryString(); }

    /**
     * @brief Declares lookback needs by lowering mode's earliest start
     */
    virtual void Widen(WidestMode& mode) const { (void)mode; }
};

using ExpressionPtr = std::shared_ptr<const Expression>;

/**
 * @brief Evaluates expressions in order over one context
 * @throws core::InternalError if the request is cancelled between expressions
 */
std::vector<Value> EvaluateMany(const EvaluationContext& context,
                                const std::vector<ExpressionPtr>& expressions);

/**
 * @brief Fetches every series of a metric whose tags satisfy the predicate
 */
class MetricFetchExpression : public Expression {
public:
    MetricFetchExpression(core::MetricKey metric, query::PredicatePtr predicate);

    Value Evaluate(const EvaluationContext& context) const override;
    std::string QueryString() const override;
    std::string Name() const override { return metric_; }

private:
    core::MetricKey metric_;
    query::PredicatePtr predicate_;
};

class ScalarExpression : public Expression {
public:
    explicit ScalarExpression(double value) : value_(value) {}

    Value Evaluate(const EvaluationContext& context) const override;
    std::string QueryString() const override;

private:
    double value_;
};

class StringExpression : public Expression {
public:
    explicit StringExpression(std::string text) : text_(std::move(text)) {}

    Value Evaluate(const EvaluationContext& context) const override;
    std::string QueryString() const override;

private:
    std::string text_;
};

class DurationExpression : public Expression {
public:
    DurationExpression(std::string literal, int64_t millis)
        : literal_(std::move(literal)), millis_(millis) {}

    Value Evaluate(const EvaluationContext& context) const override;
    std::string QueryString() const override { return literal_; }

    int64_t millis() const { return millis_; }

private:
    std::string literal_;
    int64_t millis_;
};

/**
 * @brief Call of a registry function; evaluation and widening are delegated to it
 */
class FunctionExpression : public Expression {
public:
    FunctionExpression(std::string function_name, std::vector<ExpressionPtr> arguments);

    Value Evaluate(const EvaluationContext& context) const override;
    std::string QueryString() const override;
    void Widen(WidestMode& mode) const override;

    const std::string& function_name() const { return function_name_; }
    const std::vector<ExpressionPtr>& arguments() const { return arguments_; }

private:
    std::string function_name_;
    std::vector<ExpressionPtr> arguments_;
};

} // namespace function
} // namespace tsquery
