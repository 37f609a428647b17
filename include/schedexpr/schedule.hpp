#pragma once

#include <initializer_list>
#include <iosfwd>
#include <memory>
#include <set>
#include <string>
#include <variant>
#include <vector>

#include "schedexpr/time_point.hpp"

namespace schedexpr {

struct Node;

namespace detail { struct NodeFactory; }

enum class Kind {
    Weeks,
    DaysOfWeek,
    Hours,
    Minutes,
    Months,
    Always,
    Never,
    Times,
    Union,
    Intersection,
    Negation,
};

const char* to_string(Kind k);

/// An immutable schedule expression. Copies share the underlying node,
/// and combining schedules never copies the operands.
class Schedule {
public:
    /// The never-matching schedule.
    Schedule();

    Kind kind() const;
    const Node& node() const noexcept { return *node_; }

    /// Identity of the underlying node; equal for copies of one schedule.
    const Node* id() const noexcept { return node_.get(); }

    /// True if the tree contains a times() node and needs an EvalContext.
    bool is_stateful() const;

    /// Rendering in the schedule language, e.g. "days(wed) & hours(6, 12)".
    std::string to_string() const;

    Schedule union_with(const Schedule& other) const;
    Schedule intersect(const Schedule& other) const;
    Schedule negate() const;

private:
    friend struct detail::NodeFactory;
    explicit Schedule(std::shared_ptr<const Node> node) : node_(std::move(node)) {}

    std::shared_ptr<const Node> node_;
};

namespace node {

struct Weeks      { std::set<int> values; };
struct DaysOfWeek { std::set<int> values; };
struct Hours      { std::set<int> values; };
struct Minutes    { std::set<int> values; };
struct Months     { std::set<int> values; };

struct Always {};
struct Never {};

// Inner schedule, but only on its first n matches.
struct Times {
    Schedule inner;
    int n{0};
};

struct Union        { Schedule left, right; };
struct Intersection { Schedule left, right; };
struct Negation     { Schedule inner; };

} // namespace node

struct Node {
    std::variant<node::Weeks, node::DaysOfWeek, node::Hours, node::Minutes, node::Months, node::Always,
                 node::Never, node::Times, node::Union, node::Intersection, node::Negation>
        value;
};

// Leaf constructors. Duplicates collapse; an empty list never matches.
// Values outside the field's range throw ScheduleError:
// weeks 1..5, days 0..6 (Sunday = 0), hours 0..23, minutes 0..59, months 1..12.
Schedule weeks(const std::vector<int>& values);
Schedule days_of_the_week(const std::vector<int>& values);
Schedule days_of_the_week(std::initializer_list<DayOfWeek> days);
Schedule hours_of_the_day(const std::vector<int>& values);
Schedule minutes_of_the_hour(const std::vector<int>& values);
Schedule months_of_the_year(const std::vector<int>& values);

Schedule always();
Schedule never();

/// Throws ScheduleError if n is negative.
Schedule times(const Schedule& inner, int n);

Schedule union_of(const Schedule& a, const Schedule& b);
Schedule intersection(const Schedule& a, const Schedule& b);
Schedule negate(const Schedule& a);

Schedule operator|(const Schedule& a, const Schedule& b);
Schedule operator&(const Schedule& a, const Schedule& b);
Schedule operator!(const Schedule& a);

/// Receives the occurrences of times() nodes during evaluation.
class OccurrenceCounter {
public:
    virtual ~OccurrenceCounter() = default;

    /// Called when the inner schedule of `times_node` matches, possibly
    /// more than once per evaluation if several paths reach the node.
    /// Returns whether the node fires.
    virtual bool record(const Schedule& times_node, int budget) = 0;
};

/// Pure evaluation. Throws ScheduleError if the tree contains times();
/// evaluate those through an EvalContext.
bool matches(const Schedule& s, const TimePoint& t);

/// Evaluation with occurrence history. Union and intersection short-circuit
/// left to right, so unreached times() nodes are not counted.
bool matches(const Schedule& s, const TimePoint& t, OccurrenceCounter& counter);

std::ostream& operator<<(std::ostream& os, const Schedule& s);

} // namespace schedexpr
