#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "schedexpr/builder.hpp"
#include "schedexpr/eval_context.hpp"

namespace schedexpr {

/// Named schedules, kept in definition order. A definition may refer to
/// any schedule defined before it.
class Catalog {
public:
    /// Compile and run one "name = expr" statement.
    /// Throws ParseError, EvalError or ScheduleError.
    const Schedule& define(std::string_view statement);

    /// Same as define("name = expression") for names that need quoting.
    const Schedule& define(std::string_view name, std::string_view expression);

    const Schedule* find(std::string_view name) const { return builder_.find(name); }

    /// Throws EvalError if `name` is not defined.
    const Schedule& at(std::string_view name) const;

    const std::vector<std::string>& names() const { return order_; }
    std::size_t size() const { return order_.size(); }
    bool empty() const { return order_.empty(); }

    /// Names of the schedules that fire at `t`, in definition order. All
    /// entries are evaluated together as one evaluation of `ctx`.
    std::vector<std::string> firing(const TimePoint& t, EvalContext& ctx) const;

private:
    ScheduleBuilder builder_;
    std::vector<std::string> order_;
};

} // namespace schedexpr
