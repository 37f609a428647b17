#include "schedexpr/schedule.hpp"

#include <ostream>
#include <utility>

namespace schedexpr {

namespace detail {

struct NodeFactory {
    template <class T>
    static Schedule make(T payload) {
        return Schedule(std::make_shared<const Node>(Node{std::move(payload)}));
    }

    static const Schedule& never() {
        static const Schedule s = make(node::Never{});
        return s;
    }

    static const Schedule& always() {
        static const Schedule s = make(node::Always{});
        return s;
    }
};

template <class... Fs>
struct Overloaded : Fs... { using Fs::operator()...; };
template <class... Fs>
Overloaded(Fs...) -> Overloaded<Fs...>;

class NoHistory : public OccurrenceCounter {
public:
    bool record(const Schedule&, int) override {
        throw ScheduleError("times() needs an EvalContext to count occurrences");
    }
};

struct Evaluator {
    const TimePoint& t;
    OccurrenceCounter& counter;

    bool eval(const Schedule& s) const {
        if (const auto* times = std::get_if<node::Times>(&s.node().value)) {
            if (!eval(times->inner)) return false;
            return counter.record(s, times->n);
        }
        return std::visit(*this, s.node().value);
    }

    bool operator()(const node::Weeks& n) const { return n.values.count(t.week_of_month) > 0; }
    bool operator()(const node::DaysOfWeek& n) const {
        return n.values.count(static_cast<int>(t.day_of_week)) > 0;
    }
    bool operator()(const node::Hours& n) const { return n.values.count(t.hour_of_day) > 0; }
    bool operator()(const node::Minutes& n) const { return n.values.count(t.minute_of_hour) > 0; }
    bool operator()(const node::Months& n) const { return n.values.count(t.month_of_year) > 0; }
    bool operator()(const node::Always&) const { return true; }
    bool operator()(const node::Never&) const { return false; }
    bool operator()(const node::Times&) const {
        throw ScheduleError("Internal error: times() node reached the visitor");
    }
    bool operator()(const node::Union& n) const { return eval(n.left) || eval(n.right); }
    bool operator()(const node::Intersection& n) const { return eval(n.left) && eval(n.right); }
    bool operator()(const node::Negation& n) const { return !eval(n.inner); }
};

} // namespace detail

using detail::NodeFactory;
using detail::Overloaded;

static std::set<int> checked_set(const char* field, const std::vector<int>& values, int lo, int hi) {
    std::set<int> out;
    for (int v : values) {
        if (v < lo || v > hi) {
            throw ScheduleError(std::string(field) + " value " + std::to_string(v) + " out of range [" +
                                std::to_string(lo) + ", " + std::to_string(hi) + "]");
        }
        out.insert(v);
    }
    return out;
}

// Binding strength in the schedule language.
static int precedence(Kind k) {
    switch (k) {
        case Kind::Union:        return 1;
        case Kind::Intersection: return 2;
        default:                 return 3;
    }
}

static void render_list(std::string& out, const char* fn, const std::set<int>& values) {
    out += fn;
    out += '(';
    bool first = true;
    for (int v : values) {
        if (!first) out += ", ";
        out += std::to_string(v);
        first = false;
    }
    out += ')';
}

static void render(const Schedule& s, int parent_prec, std::string& out) {
    const bool wrap = precedence(s.kind()) < parent_prec;
    if (wrap) out += '(';

    std::visit(
        Overloaded{
            [&](const node::Weeks& n) { render_list(out, "weeks", n.values); },
            [&](const node::DaysOfWeek& n) {
                out += "days(";
                bool first = true;
                for (int d : n.values) {
                    if (!first) out += ", ";
                    out += to_string(static_cast<DayOfWeek>(d));
                    first = false;
                }
                out += ')';
            },
            [&](const node::Hours& n) { render_list(out, "hours", n.values); },
            [&](const node::Minutes& n) { render_list(out, "minutes", n.values); },
            [&](const node::Months& n) { render_list(out, "months", n.values); },
            [&](const node::Always&) { out += "always"; },
            [&](const node::Never&) { out += "never"; },
            [&](const node::Times& n) {
                out += "times(";
                render(n.inner, 0, out);
                out += ", " + std::to_string(n.n) + ")";
            },
            [&](const node::Union& n) {
                render(n.left, 1, out);
                out += " | ";
                render(n.right, 1, out);
            },
            [&](const node::Intersection& n) {
                render(n.left, 2, out);
                out += " & ";
                render(n.right, 2, out);
            },
            [&](const node::Negation& n) {
                out += '!';
                render(n.inner, 3, out);
            },
        },
        s.node().value);

    if (wrap) out += ')';
}

const char* to_string(Kind k) {
    switch (k) {
        case Kind::Weeks:        return "weeks";
        case Kind::DaysOfWeek:   return "days";
        case Kind::Hours:        return "hours";
        case Kind::Minutes:      return "minutes";
        case Kind::Months:       return "months";
        case Kind::Always:       return "always";
        case Kind::Never:        return "never";
        case Kind::Times:        return "times";
        case Kind::Union:        return "union";
        case Kind::Intersection: return "intersection";
        case Kind::Negation:     return "negation";
    }
    return "???";
}

Schedule::Schedule() : node_(NodeFactory::never().node_) {}

Kind Schedule::kind() const {
    // Alternatives are declared in Kind order.
    return static_cast<Kind>(node_->value.index());
}

bool Schedule::is_stateful() const {
    return std::visit(Overloaded{
                          [](const node::Times&) { return true; },
                          [](const node::Union& n) { return n.left.is_stateful() || n.right.is_stateful(); },
                          [](const node::Intersection& n) {
                              return n.left.is_stateful() || n.right.is_stateful();
                          },
                          [](const node::Negation& n) { return n.inner.is_stateful(); },
                          [](const auto&) { return false; },
                      },
                      node_->value);
}

std::string Schedule::to_string() const {
    std::string out;
    render(*this, 0, out);
    return out;
}

Schedule Schedule::union_with(const Schedule& other) const { return union_of(*this, other); }
Schedule Schedule::intersect(const Schedule& other) const { return intersection(*this, other); }
Schedule Schedule::negate() const { return schedexpr::negate(*this); }

Schedule weeks(const std::vector<int>& values) {
    return NodeFactory::make(node::Weeks{checked_set("week", values, 1, 5)});
}

Schedule days_of_the_week(const std::vector<int>& values) {
    return NodeFactory::make(node::DaysOfWeek{checked_set("day", values, 0, 6)});
}

Schedule days_of_the_week(std::initializer_list<DayOfWeek> days) {
    std::vector<int> values;
    values.reserve(days.size());
    for (DayOfWeek d : days) values.push_back(static_cast<int>(d));
    return days_of_the_week(values);
}

Schedule hours_of_the_day(const std::vector<int>& values) {
    return NodeFactory::make(node::Hours{checked_set("hour", values, 0, 23)});
}

Schedule minutes_of_the_hour(const std::vector<int>& values) {
    return NodeFactory::make(node::Minutes{checked_set("minute", values, 0, 59)});
}

Schedule months_of_the_year(const std::vector<int>& values) {
    return NodeFactory::make(node::Months{checked_set("month", values, 1, 12)});
}

Schedule always() { return NodeFactory::always(); }
Schedule never() { return NodeFactory::never(); }

Schedule times(const Schedule& inner, int n) {
    if (n < 0) throw ScheduleError("times() count must not be negative: " + std::to_string(n));
    return NodeFactory::make(node::Times{inner, n});
}

Schedule union_of(const Schedule& a, const Schedule& b) { return NodeFactory::make(node::Union{a, b}); }

Schedule intersection(const Schedule& a, const Schedule& b) {
    return NodeFactory::make(node::Intersection{a, b});
}

Schedule negate(const Schedule& a) { return NodeFactory::make(node::Negation{a}); }

Schedule operator|(const Schedule& a, const Schedule& b) { return union_of(a, b); }
Schedule operator&(const Schedule& a, const Schedule& b) { return intersection(a, b); }
Schedule operator!(const Schedule& a) { return negate(a); }

bool matches(const Schedule& s, const TimePoint& t) {
    detail::NoHistory none;
    return matches(s, t, none);
}

bool matches(const Schedule& s, const TimePoint& t, OccurrenceCounter& counter) {
    return detail::Evaluator{t, counter}.eval(s);
}

std::ostream& operator<<(std::ostream& os, const Schedule& s) { return os << s.to_string(); }

} // namespace schedexpr
