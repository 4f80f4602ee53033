#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "tsquery/function/expression.h"

namespace tsquery {
namespace function {

/**
 * @brief A named function callable from a query
 */
class Function {
public:
    virtual ~Function() = default;

    virtual std::string Name() const = 0;

    virtual Value Evaluate(const EvaluationContext& context,
                           const std::vector<ExpressionPtr>& arguments) const = 0;

    /**
     * @brief Declares the function's lookback, then widens every argument
     *
     * The default only widens the arguments.
     */
    virtual void Widen(WidestMode& mode, const std::vector<ExpressionPtr>& arguments) const;
};

using FunctionPtr = std::shared_ptr<const Function>;

/**
 * @brief Lookup table of functions by name
 */
class Registry {
public:
    /**
     * @throws core::InvalidArgumentError if the name is already registered
     */
    void Register(FunctionPtr function);

    /**
     * @return The function, or nullptr when unknown
     */
    FunctionPtr Get(const std::string& name) const;

    std::vector<std::string> Names() const;

    /**
     * @brief Process-wide registry holding the built-in functions
     */
    static std::shared_ptr<const Registry> Default();

private:
    std::map<std::string, FunctionPtr> functions_;
};

/**
 * @brief transform.moving_average(series, window)
 *
 * Trailing mean over the window for every slot; needs one window of lookback.
 */
class MovingAverageFunction : public Function {
public:
    std::string Name() const override { return "transform.moving_average"; }
    Value Evaluate(const EvaluationContext& context,
                   const std::vector<ExpressionPtr>& arguments) const override;
    void Widen(WidestMode& mode, const std::vector<ExpressionPtr>& arguments) const override;
};

/**
 * @brief aggregate.sum(series)
 *
 * Slot-wise sum of all series, tagged with the tags every input shares.
 */
class SumFunction : public Function {
public:
    std::string Name() const override { return "aggregate.sum"; }
    Value Evaluate(const EvaluationContext& context,
                   const std::vector<ExpressionPtr>& arguments) const override;
};

} // namespace function
} // namespace tsquery
