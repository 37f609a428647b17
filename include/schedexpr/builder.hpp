#pragma once

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "schedexpr/program.hpp"
#include "schedexpr/schedule.hpp"

namespace schedexpr {

/// Backend for Program::execute that builds Schedule values.
///
/// Names resolve to previously stored schedules, to the keywords
/// `always` / `never`, or (as numbers) to day names such as `wed`.
/// Functions: weeks, days, hours, minutes, months (integer arguments)
/// and times(schedule, n).
class ScheduleBuilder {
public:
    using Value = std::variant<Schedule, long>;

    Value load(std::string_view name) const;
    Value literal(long x) const { return x; }
    Value negate(const Value& a) const;
    Value intersect(const Value& a, const Value& b) const;
    Value unite(const Value& a, const Value& b) const;
    Value apply(std::string_view fn, const std::vector<Value>& args) const;

    /// Throws EvalError for reserved names, redefinitions and non-schedule values.
    void define(std::string_view name, const Value& v);

    /// nullptr if `name` is not defined.
    const Schedule* find(std::string_view name) const;

    const std::map<std::string, Schedule, std::less<>>& vars() const { return vars_; }

    static bool is_reserved(std::string_view name);

private:
    std::map<std::string, Schedule, std::less<>> vars_;
};

} // namespace schedexpr
