#include <gtest/gtest.h>

#include <workflow/backoff.hpp>
#include <workflow/condition.hpp>

TEST(Condition, WithoutMarkersAlwaysPasses) {
    EXPECT_TRUE(evaluate_condition("false", {}));
    EXPECT_TRUE(evaluate_condition("", {}));
    EXPECT_TRUE(evaluate_condition("anything at all", { { "flag", "false" } }));
}

TEST(Condition, SubstitutedTrueIsCaseInsensitive) {
    EXPECT_TRUE(evaluate_condition("$flag", { { "flag", "true" } }));
    EXPECT_TRUE(evaluate_condition("$flag", { { "flag", "TRUE" } }));
    EXPECT_TRUE(evaluate_condition("$flag", { { "flag", "True" } }));
}

TEST(Condition, AnythingElseSkips) {
    EXPECT_FALSE(evaluate_condition("$flag", { { "flag", "false" } }));
    EXPECT_FALSE(evaluate_condition("$flag", { { "flag", "yes" } }));
    EXPECT_FALSE(evaluate_condition("$flag", { { "flag", " true" } }));
    EXPECT_FALSE(evaluate_condition("$flag && $other", { { "flag", "true" }, { "other", "true" } }));
}

TEST(Condition, UnknownVariableStaysLiteral) {
    EXPECT_EQ(substitute_variables("$missing", {}), "$missing");
    EXPECT_FALSE(evaluate_condition("$missing", {}));
}

TEST(Condition, LongerNamesWin) {
    variables_t const vars{ { "env", "dev" }, { "env_name", "prod" } };
    EXPECT_EQ(substitute_variables("$env_name/$env", vars), "prod/dev");
}

TEST(Condition, CompositeText) {
    EXPECT_TRUE(evaluate_condition("t$rest", { { "rest", "rue" } }));
}

TEST(Backoff, DoublesPerAttempt) {
    EXPECT_EQ(backoff_delay(1).count(), 2);
    EXPECT_EQ(backoff_delay(2).count(), 4);
    EXPECT_EQ(backoff_delay(3).count(), 8);
    EXPECT_EQ(backoff_delay(10).count(), 1024);
}

TEST(Backoff, CapBoundsTheDelay) {
    EXPECT_EQ(backoff_delay(10, 60).count(), 60);
    EXPECT_EQ(backoff_delay(2, 60).count(), 4);
}

TEST(Backoff, Saturates) {
    EXPECT_GT(backoff_delay(200).count(), 0);
    EXPECT_EQ(backoff_delay(200), backoff_delay(100));
}
