#pragma once

#include <mutex>
#include <unordered_map>
#include <vector>

#include "schedexpr/schedule.hpp"

namespace schedexpr {

/// Occurrence history for times() nodes. Each times() node counts the
/// matches of its inner schedule seen through this context and stops
/// matching once its budget is spent.
///
/// Counters are keyed by node identity: a times() node shared between
/// several parents has one counter. Within one evaluation (a call to
/// matches() or matches_each()) a node counts at most once, however many
/// paths reach it; later paths see the same answer. All members may be
/// called concurrently; evaluations through one context are serialized.
class EvalContext : private OccurrenceCounter {
public:
    EvalContext() = default;
    EvalContext(const EvalContext&) = delete;
    EvalContext& operator=(const EvalContext&) = delete;

    bool matches(const Schedule& schedule, const TimePoint& t);

    /// Evaluates all schedules at `t` as one evaluation, under one lock.
    std::vector<bool> matches_each(const std::vector<Schedule>& schedules, const TimePoint& t);

    /// Occurrences a times() schedule has fired on so far, at most its budget.
    int occurrences(const Schedule& times_node) const;

    /// True once a times() schedule has matched past its budget.
    bool exhausted(const Schedule& times_node) const;

    /// Forget all history.
    void reset();

private:
    bool record(const Schedule& times_node, int budget) override;

    struct Counter {
        Schedule pinned; // keeps the node, and so its address, alive
        int fired{0};
        bool exhausted{false};
    };

    mutable std::mutex mutex_;
    std::unordered_map<const Node*, Counter> counters_;
    std::unordered_map<const Node*, bool> evaluation_; // answers given during the current evaluation
};

} // namespace schedexpr
