#include <gtest/gtest.h>
#include <schedexpr/eval_context.hpp>

#include <atomic>
#include <thread>
#include <vector>

namespace {

using namespace schedexpr;

const TimePoint kWednesday{0, 6, DayOfWeek::Wednesday, 1, 5};
const TimePoint kThursday{0, 6, DayOfWeek::Thursday, 1, 5};

TEST(EvalContext, TimesFiresOnFirstNMatches) {
    EvalContext ctx;
    Schedule twice = times(days_of_the_week({DayOfWeek::Wednesday}), 2);

    EXPECT_FALSE(ctx.matches(twice, kThursday)); // not an occurrence
    EXPECT_TRUE(ctx.matches(twice, kWednesday));
    EXPECT_FALSE(ctx.matches(twice, kThursday));
    EXPECT_TRUE(ctx.matches(twice, kWednesday));
    EXPECT_FALSE(ctx.exhausted(twice));
    EXPECT_FALSE(ctx.matches(twice, kWednesday));
    EXPECT_FALSE(ctx.matches(twice, kWednesday));
    EXPECT_EQ(ctx.occurrences(twice), 2);
    EXPECT_TRUE(ctx.exhausted(twice));
}

TEST(EvalContext, ResetRearmsCounters) {
    EvalContext ctx;
    Schedule once = times(always(), 1);

    EXPECT_TRUE(ctx.matches(once, kWednesday));
    EXPECT_FALSE(ctx.matches(once, kWednesday));
    ctx.reset();
    EXPECT_EQ(ctx.occurrences(once), 0);
    EXPECT_FALSE(ctx.exhausted(once));
    EXPECT_TRUE(ctx.matches(once, kWednesday));
}

TEST(EvalContext, ZeroBudgetNeverFires) {
    EvalContext ctx;
    Schedule none = times(always(), 0);
    for (int i = 0; i < 3; ++i) EXPECT_FALSE(ctx.matches(none, kWednesday));
}

TEST(EvalContext, ContextsAreIndependent) {
    EvalContext a;
    EvalContext b;
    Schedule once = times(always(), 1);

    EXPECT_TRUE(a.matches(once, kWednesday));
    EXPECT_FALSE(a.matches(once, kWednesday));
    EXPECT_TRUE(b.matches(once, kWednesday));
}

TEST(EvalContext, SharedNodeCountsOnce) {
    EvalContext ctx;
    Schedule once = times(always(), 1);
    Schedule s1 = once & days_of_the_week({DayOfWeek::Wednesday});
    Schedule s2 = once | never();

    EXPECT_TRUE(ctx.matches(s1, kWednesday));
    // same times() node, already spent through s1
    EXPECT_FALSE(ctx.matches(s2, kWednesday));
    EXPECT_EQ(ctx.occurrences(once), 1);

    // a structurally equal but distinct node has its own counter
    EXPECT_TRUE(ctx.matches(times(always(), 1), kWednesday));
}

TEST(EvalContext, PathsWithinOneEvaluationShareTheAnswer) {
    EvalContext ctx;
    Schedule once = times(always(), 1);

    // both operands reach the same node; it counts once
    EXPECT_TRUE(ctx.matches(once & once, kWednesday));
    EXPECT_EQ(ctx.occurrences(once), 1);
    EXPECT_FALSE(ctx.matches(once & once, kWednesday));
    EXPECT_FALSE(ctx.matches(once | once, kWednesday));

    Schedule twice = times(days_of_the_week({DayOfWeek::Wednesday}), 2);
    Schedule s = (twice & hours_of_the_day({6})) | (!twice & always());
    EXPECT_TRUE(ctx.matches(s, kWednesday));
    EXPECT_TRUE(ctx.matches(s, kWednesday));
    // spent: the left branch fails, and the right one sees the same answer
    EXPECT_TRUE(ctx.matches(s, kWednesday));
    EXPECT_EQ(ctx.occurrences(twice), 2);
}

TEST(EvalContext, MatchesEachIsOneEvaluation) {
    EvalContext ctx;
    Schedule first_two = times(days_of_the_week({DayOfWeek::Wednesday}), 2);
    Schedule early = first_two & hours_of_the_day({6});
    const std::vector<Schedule> both{first_two, early};

    EXPECT_EQ(ctx.matches_each(both, kWednesday), (std::vector<bool>{true, true}));
    EXPECT_EQ(ctx.matches_each(both, kWednesday), (std::vector<bool>{true, true}));
    EXPECT_EQ(ctx.matches_each(both, kWednesday), (std::vector<bool>{false, false}));
    EXPECT_EQ(ctx.occurrences(first_two), 2);
}

TEST(EvalContext, ShortCircuitSkipsUnreachedTimes) {
    EvalContext ctx;
    Schedule once = times(always(), 1);
    Schedule guarded = days_of_the_week({DayOfWeek::Wednesday}) & once;

    EXPECT_FALSE(ctx.matches(guarded, kThursday));
    EXPECT_EQ(ctx.occurrences(once), 0);
    EXPECT_TRUE(ctx.matches(guarded, kWednesday));
    EXPECT_FALSE(ctx.matches(guarded, kWednesday));
}

TEST(EvalContext, OperandOrderDecidesBudgetUse) {
    Schedule wed = days_of_the_week({DayOfWeek::Wednesday});
    Schedule once = times(always(), 1);

    EvalContext first;
    EXPECT_TRUE(first.matches(once | wed, kWednesday));
    EXPECT_EQ(first.occurrences(once), 1);

    EvalContext second;
    EXPECT_TRUE(second.matches(wed | once, kWednesday));
    EXPECT_EQ(second.occurrences(once), 0);
}

TEST(EvalContext, NegatedTimesFiresAfterBudget) {
    EvalContext ctx;
    Schedule after_first_two = !times(always(), 2);

    EXPECT_FALSE(ctx.matches(after_first_two, kWednesday));
    EXPECT_FALSE(ctx.matches(after_first_two, kWednesday));
    EXPECT_TRUE(ctx.matches(after_first_two, kWednesday));
}

TEST(EvalContext, StatelessSchedulesMatchAsPure) {
    EvalContext ctx;
    Schedule s = days_of_the_week({DayOfWeek::Wednesday}) | hours_of_the_day({7});
    EXPECT_EQ(ctx.matches(s, kWednesday), matches(s, kWednesday));
    EXPECT_EQ(ctx.matches(s, kThursday), matches(s, kThursday));
}

TEST(EvalContext, ConcurrentEvaluationHonorsBudget) {
    constexpr int kThreads = 8;
    constexpr int kCallsPerThread = 500;
    constexpr int kBudget = 100;

    EvalContext ctx;
    Schedule limited = times(days_of_the_week({DayOfWeek::Wednesday}), kBudget);
    std::atomic<int> fired{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&] {
            for (int k = 0; k < kCallsPerThread; ++k) {
                if (ctx.matches(limited, kWednesday)) ++fired;
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(fired.load(), kBudget);
    EXPECT_EQ(ctx.occurrences(limited), kBudget);
    EXPECT_TRUE(ctx.exhausted(limited));
}

} // namespace
