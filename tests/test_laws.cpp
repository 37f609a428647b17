#include <gtest/gtest.h>
#include <schedexpr/schedule.hpp>

#include <random>
#include <vector>

// Randomized checks of the boolean-algebra laws over generated trees.

namespace {

using namespace schedexpr;

class Gen {
public:
    explicit Gen(unsigned seed) : rng_(seed) {}

    int uniform(int lo, int hi) { return std::uniform_int_distribution<int>(lo, hi)(rng_); }

    std::vector<int> values(int lo, int hi) {
        std::vector<int> out;
        int n = uniform(0, 4);
        for (int i = 0; i < n; ++i) out.push_back(uniform(lo, hi));
        return out;
    }

    Schedule leaf() {
        switch (uniform(0, 6)) {
            case 0: return weeks(values(1, 5));
            case 1: return days_of_the_week(values(0, 6));
            case 2: return hours_of_the_day(values(0, 23));
            case 3: return minutes_of_the_hour(values(0, 59));
            case 4: return months_of_the_year(values(1, 12));
            case 5: return uniform(0, 9) == 0 ? always() : hours_of_the_day(values(0, 23));
            default: return uniform(0, 9) == 0 ? never() : days_of_the_week(values(0, 6));
        }
    }

    Schedule tree(int depth) {
        if (depth == 0 || uniform(0, 3) == 0) return leaf();
        switch (uniform(0, 2)) {
            case 0: return union_of(tree(depth - 1), tree(depth - 1));
            case 1: return intersection(tree(depth - 1), tree(depth - 1));
            default: return negate(tree(depth - 1));
        }
    }

    TimePoint time_point() {
        return TimePoint{uniform(0, 59), uniform(0, 23), static_cast<DayOfWeek>(uniform(0, 6)), uniform(1, 5),
                         uniform(1, 12)};
    }

private:
    std::mt19937 rng_;
};

constexpr int kTrials = 400;
constexpr int kPointsPerTrial = 25;
constexpr int kDepth = 4;

class ScheduleLaws : public ::testing::TestWithParam<unsigned> {
protected:
    template <class Check>
    void for_all(Check check) {
        Gen gen(GetParam());
        for (int trial = 0; trial < kTrials; ++trial) {
            Schedule a = gen.tree(kDepth);
            Schedule b = gen.tree(kDepth);
            Schedule c = gen.tree(kDepth);
            for (int i = 0; i < kPointsPerTrial; ++i) {
                TimePoint t = gen.time_point();
                check(a, b, c, t);
                if (HasFatalFailure() || HasNonfatalFailure()) {
                    ADD_FAILURE() << "a = " << a << "\nb = " << b << "\nc = " << c << "\nt = " << t;
                    return;
                }
            }
        }
    }
};

TEST_P(ScheduleLaws, UnionIsOr) {
    for_all([](const Schedule& a, const Schedule& b, const Schedule&, const TimePoint& t) {
        EXPECT_EQ(matches(union_of(a, b), t), matches(a, t) || matches(b, t));
    });
}

TEST_P(ScheduleLaws, IntersectionIsAnd) {
    for_all([](const Schedule& a, const Schedule& b, const Schedule&, const TimePoint& t) {
        EXPECT_EQ(matches(intersection(a, b), t), matches(a, t) && matches(b, t));
    });
}

TEST_P(ScheduleLaws, NegationIsNot) {
    for_all([](const Schedule& a, const Schedule&, const Schedule&, const TimePoint& t) {
        EXPECT_EQ(matches(negate(a), t), !matches(a, t));
        EXPECT_EQ(matches(negate(negate(a)), t), matches(a, t));
    });
}

TEST_P(ScheduleLaws, Commutativity) {
    for_all([](const Schedule& a, const Schedule& b, const Schedule&, const TimePoint& t) {
        EXPECT_EQ(matches(a | b, t), matches(b | a, t));
        EXPECT_EQ(matches(a & b, t), matches(b & a, t));
    });
}

TEST_P(ScheduleLaws, Associativity) {
    for_all([](const Schedule& a, const Schedule& b, const Schedule& c, const TimePoint& t) {
        EXPECT_EQ(matches((a | b) | c, t), matches(a | (b | c), t));
        EXPECT_EQ(matches((a & b) & c, t), matches(a & (b & c), t));
    });
}

TEST_P(ScheduleLaws, Distributivity) {
    for_all([](const Schedule& a, const Schedule& b, const Schedule& c, const TimePoint& t) {
        EXPECT_EQ(matches(a & (b | c), t), matches((a & b) | (a & c), t));
        EXPECT_EQ(matches(a | (b & c), t), matches((a | b) & (a | c), t));
    });
}

TEST_P(ScheduleLaws, DeMorgan) {
    for_all([](const Schedule& a, const Schedule& b, const Schedule&, const TimePoint& t) {
        EXPECT_EQ(matches(!(a | b), t), matches(!a & !b, t));
        EXPECT_EQ(matches(!(a & b), t), matches(!a | !b, t));
    });
}

TEST_P(ScheduleLaws, Identities) {
    for_all([](const Schedule& a, const Schedule&, const Schedule&, const TimePoint& t) {
        EXPECT_EQ(matches(a | never(), t), matches(a, t));
        EXPECT_EQ(matches(a & always(), t), matches(a, t));
        EXPECT_TRUE(matches(a | !a, t));
        EXPECT_FALSE(matches(a & !a, t));
    });
}

INSTANTIATE_TEST_SUITE_P(Seeds, ScheduleLaws, ::testing::Values(1u, 7u, 42u, 20240501u));

} // namespace
