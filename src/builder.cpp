#include "schedexpr/builder.hpp"
#include "schedexpr/logging.hpp"

#include <limits>

namespace schedexpr {

using Value = ScheduleBuilder::Value;

static const Schedule& as_schedule(const Value& v, const std::string& where) {
    if (!std::holds_alternative<Schedule>(v)) throw EvalError(where + " expects a schedule, got a number");
    return std::get<Schedule>(v);
}

static std::vector<int> int_args(std::string_view fn, const std::vector<Value>& args) {
    std::vector<int> out;
    out.reserve(args.size());
    for (const auto& a : args) {
        if (!std::holds_alternative<long>(a)) {
            throw EvalError(std::string(fn) + "() expects numbers, got a schedule");
        }
        long v = std::get<long>(a);
        if (v > std::numeric_limits<int>::max()) {
            throw EvalError(std::string(fn) + "() argument too large: " + std::to_string(v));
        }
        out.push_back(static_cast<int>(v));
    }
    return out;
}

bool ScheduleBuilder::is_reserved(std::string_view name) {
    return name == "always" || name == "never" || day_from_name(name).has_value();
}

Value ScheduleBuilder::load(std::string_view name) const {
    if (name == "always") return always();
    if (name == "never") return never();
    if (auto day = day_from_name(name)) return static_cast<long>(*day);

    auto it = vars_.find(name);
    if (it == vars_.end()) throw EvalError("Unknown schedule: " + std::string(name));
    return it->second;
}

Value ScheduleBuilder::negate(const Value& a) const {
    return schedexpr::negate(as_schedule(a, "'!'"));
}

Value ScheduleBuilder::intersect(const Value& a, const Value& b) const {
    return intersection(as_schedule(a, "'&'"), as_schedule(b, "'&'"));
}

Value ScheduleBuilder::unite(const Value& a, const Value& b) const {
    return union_of(as_schedule(a, "'|'"), as_schedule(b, "'|'"));
}

Value ScheduleBuilder::apply(std::string_view fn, const std::vector<Value>& args) const {
    if (fn == "weeks")   return weeks(int_args(fn, args));
    if (fn == "days")    return days_of_the_week(int_args(fn, args));
    if (fn == "hours")   return hours_of_the_day(int_args(fn, args));
    if (fn == "minutes") return minutes_of_the_hour(int_args(fn, args));
    if (fn == "months")  return months_of_the_year(int_args(fn, args));

    if (fn == "times") {
        if (args.size() != 2) throw EvalError("times() expects 2 arguments");
        const Schedule& inner = as_schedule(args[0], "times()");
        if (!std::holds_alternative<long>(args[1])) throw EvalError("times() expects a count as its second argument");
        long n = std::get<long>(args[1]);
        if (n > std::numeric_limits<int>::max()) throw EvalError("times() count too large: " + std::to_string(n));
        return times(inner, static_cast<int>(n));
    }

    throw EvalError("Unknown function: " + std::string(fn));
}

void ScheduleBuilder::define(std::string_view name, const Value& v) {
    if (is_reserved(name)) throw EvalError("Reserved name cannot be redefined: " + std::string(name));
    if (vars_.find(name) != vars_.end()) throw EvalError("Schedule already defined: " + std::string(name));
    if (!std::holds_alternative<Schedule>(v)) throw EvalError("Statement must produce a schedule: " + std::string(name));

    const auto& s = std::get<Schedule>(v);
    logging::get()->debug("defined schedule {} = {}", name, s.to_string());
    vars_.emplace(std::string(name), s);
}

const Schedule* ScheduleBuilder::find(std::string_view name) const {
    auto it = vars_.find(name);
    return it == vars_.end() ? nullptr : &it->second;
}

} // namespace schedexpr
