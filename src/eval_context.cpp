#include "schedexpr/eval_context.hpp"
#include "schedexpr/logging.hpp"

namespace schedexpr {

bool EvalContext::matches(const Schedule& schedule, const TimePoint& t) {
    std::lock_guard<std::mutex> lock(mutex_);
    evaluation_.clear();
    return schedexpr::matches(schedule, t, *this);
}

std::vector<bool> EvalContext::matches_each(const std::vector<Schedule>& schedules, const TimePoint& t) {
    std::lock_guard<std::mutex> lock(mutex_);
    evaluation_.clear();

    std::vector<bool> out;
    out.reserve(schedules.size());
    for (const auto& s : schedules) out.push_back(schedexpr::matches(s, t, *this));
    return out;
}

int EvalContext::occurrences(const Schedule& times_node) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counters_.find(times_node.id());
    return it == counters_.end() ? 0 : it->second.fired;
}

bool EvalContext::exhausted(const Schedule& times_node) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counters_.find(times_node.id());
    return it != counters_.end() && it->second.exhausted;
}

void EvalContext::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_.clear();
    evaluation_.clear();
}

// Called with mutex_ held, from matches() / matches_each().
bool EvalContext::record(const Schedule& times_node, int budget) {
    auto seen = evaluation_.find(times_node.id());
    if (seen != evaluation_.end()) return seen->second;

    auto it = counters_.find(times_node.id());
    if (it == counters_.end()) it = counters_.emplace(times_node.id(), Counter{times_node}).first;

    Counter& c = it->second;
    bool fires = c.fired < budget;
    if (fires) {
        ++c.fired;
    } else if (!c.exhausted) {
        c.exhausted = true;
        logging::get()->trace("times budget of {} spent for {}", budget, times_node.to_string());
    }
    evaluation_.emplace(times_node.id(), fires);
    return fires;
}

} // namespace schedexpr
