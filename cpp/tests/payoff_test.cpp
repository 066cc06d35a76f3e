#include <gtest/gtest.h>
#include "../include/payoff_evaluator.hpp"
#include <cmath>
#include <string>
#include <vector>

using namespace fxhedge;
using namespace fxhedge::payoff;

// ============================================================================
// PAYOFF AT SPOT
// ============================================================================

class PayoffTest : public ::testing::Test {
protected:
    static constexpr double S0 = 1.10;

    MarketParams market{
        .spot = S0,
        .r_domestic = 0.02,
        .r_foreign = 0.01,
        .volatility = 0.10,
        .maturity = 1.0
    };

    static OptionLeg call(double strike, double quantity = 100.0) {
        OptionLeg leg{};
        leg.type = OptionType::CALL;
        leg.strike = Level::absolute(strike);
        leg.quantity = quantity;
        return leg;
    }

    static OptionLeg put(double strike, double quantity = 100.0) {
        OptionLeg leg = call(strike, quantity);
        leg.type = OptionType::PUT;
        return leg;
    }
};

TEST_F(PayoffTest, LongCallAtBoundaries) {
    const Strategy strategy{call(1.10)};
    EXPECT_DOUBLE_EQ(PayoffEvaluator::payoff_at_spot(strategy, 1.00, S0), 0.0);
    EXPECT_DOUBLE_EQ(PayoffEvaluator::payoff_at_spot(strategy, 1.10, S0), 0.0);
    EXPECT_NEAR(PayoffEvaluator::payoff_at_spot(strategy, 1.25, S0), 0.15, 1e-12);
}

TEST_F(PayoffTest, QuantityScalesAndSignsPayoff) {
    const Strategy half{put(1.10, 50.0)};
    const Strategy sold{put(1.10, -100.0)};
    EXPECT_NEAR(PayoffEvaluator::payoff_at_spot(half, 1.00, S0), 0.05, 1e-12);
    EXPECT_NEAR(PayoffEvaluator::payoff_at_spot(sold, 1.00, S0), -0.10, 1e-12);
}

TEST_F(PayoffTest, PercentLevelsResolveAgainstInitialSpot) {
    OptionLeg leg{};
    leg.type = OptionType::CALL;
    leg.strike = Level::percent(110.0);   // 1.21

    const Strategy strategy{leg};
    EXPECT_DOUBLE_EQ(PayoffEvaluator::payoff_at_spot(strategy, 1.20, S0), 0.0);
    EXPECT_NEAR(PayoffEvaluator::payoff_at_spot(strategy, 1.31, S0), 0.10, 1e-12);
}

TEST_F(PayoffTest, KnockOutCallGatedAtBarrier) {
    OptionLeg leg = call(1.10);
    leg.barrier = BarrierKind::KNOCK_OUT;
    leg.barrier_level = Level::absolute(1.25);

    const Strategy strategy{leg};
    EXPECT_NEAR(PayoffEvaluator::payoff_at_spot(strategy, 1.20, S0), 0.10, 1e-12);
    EXPECT_DOUBLE_EQ(PayoffEvaluator::payoff_at_spot(strategy, 1.25, S0), 0.0);
    EXPECT_DOUBLE_EQ(PayoffEvaluator::payoff_at_spot(strategy, 1.30, S0), 0.0);
}

TEST_F(PayoffTest, KnockInPutActiveOnlyPastBarrier) {
    OptionLeg leg = put(1.05);
    leg.barrier = BarrierKind::KNOCK_IN;
    leg.barrier_level = Level::absolute(1.00);

    const Strategy strategy{leg};
    EXPECT_DOUBLE_EQ(PayoffEvaluator::payoff_at_spot(strategy, 1.02, S0), 0.0);
    EXPECT_NEAR(PayoffEvaluator::payoff_at_spot(strategy, 1.00, S0), 0.05, 1e-12);
    EXPECT_NEAR(PayoffEvaluator::payoff_at_spot(strategy, 0.95, S0), 0.10, 1e-12);
}

TEST_F(PayoffTest, ReverseKnockOutCallUsesDownBarrier) {
    OptionLeg leg = call(1.10);
    leg.barrier = BarrierKind::KNOCK_OUT;
    leg.reverse = true;
    leg.barrier_level = Level::absolute(1.20);

    const Strategy strategy{leg};
    EXPECT_DOUBLE_EQ(PayoffEvaluator::payoff_at_spot(strategy, 1.15, S0), 0.0);
    EXPECT_NEAR(PayoffEvaluator::payoff_at_spot(strategy, 1.25, S0), 0.15, 1e-12);
}

TEST_F(PayoffTest, DoubleKnockOutPaysInsideCorridor) {
    OptionLeg leg = call(1.10);
    leg.barrier = BarrierKind::DOUBLE_KNOCK_OUT;
    leg.lower_barrier = Level::absolute(1.00);
    leg.upper_barrier = Level::absolute(1.20);

    const Strategy strategy{leg};
    EXPECT_NEAR(PayoffEvaluator::payoff_at_spot(strategy, 1.15, S0), 0.05, 1e-12);
    EXPECT_DOUBLE_EQ(PayoffEvaluator::payoff_at_spot(strategy, 1.20, S0), 0.0);
    EXPECT_DOUBLE_EQ(PayoffEvaluator::payoff_at_spot(strategy, 0.99, S0), 0.0);
}

TEST_F(PayoffTest, DoubleKnockInPaysOutsideCorridor) {
    OptionLeg leg = put(1.10);
    leg.barrier = BarrierKind::DOUBLE_KNOCK_IN;
    leg.lower_barrier = Level::absolute(1.00);
    leg.upper_barrier = Level::absolute(1.20);

    const Strategy strategy{leg};
    EXPECT_DOUBLE_EQ(PayoffEvaluator::payoff_at_spot(strategy, 1.05, S0), 0.0);
    EXPECT_NEAR(PayoffEvaluator::payoff_at_spot(strategy, 0.95, S0), 0.15, 1e-12);
}

TEST_F(PayoffTest, CollarSumsLegs) {
    const Strategy collar{call(1.20), put(1.00, -100.0)};
    EXPECT_DOUBLE_EQ(PayoffEvaluator::payoff_at_spot(collar, 1.10, S0), 0.0);
    EXPECT_NEAR(PayoffEvaluator::payoff_at_spot(collar, 1.30, S0), 0.10, 1e-12);
    EXPECT_NEAR(PayoffEvaluator::payoff_at_spot(collar, 0.90, S0), -0.10, 1e-12);
}

// ============================================================================
// PAYOFF CURVE
// ============================================================================

TEST_F(PayoffTest, CurveCoversSweepInclusive) {
    const auto curve = PayoffEvaluator::payoff_curve({call(1.10)}, market, SweepConfig{30.0, 61}, 0.0);

    ASSERT_EQ(curve.points.size(), 61u);
    EXPECT_NEAR(curve.points.front().spot, 0.77, 1e-12);
    EXPECT_NEAR(curve.points.back().spot, 1.43, 1e-12);
    EXPECT_NEAR(curve.points[30].spot, S0, 1e-12);

    for (size_t i = 1; i < curve.points.size(); ++i) {
        EXPECT_GT(curve.points[i].spot, curve.points[i - 1].spot);
    }
}

TEST_F(PayoffTest, LongCallCapsHedgedRate) {
    const double premium = 0.0488;
    const auto curve = PayoffEvaluator::payoff_curve({call(1.10)}, market, SweepConfig{}, premium);

    ASSERT_EQ(curve.points.size(), 100u);
    for (const auto& p : curve.points) {
        EXPECT_DOUBLE_EQ(p.unhedged_rate, p.spot);
        EXPECT_LE(p.hedged_rate, 1.10 + 1e-12);
        EXPECT_LE(p.hedged_rate, p.spot + 1e-12);
        EXPECT_NEAR(p.hedged_rate_with_premium, p.hedged_rate - premium, 1e-12);
    }
    EXPECT_NEAR(curve.points.back().hedged_rate, 1.10, 1e-12);
    EXPECT_DOUBLE_EQ(curve.total_premium, premium);
}

TEST_F(PayoffTest, CollarBoundsHedgedRate) {
    const auto curve = PayoffEvaluator::payoff_curve(
        {call(1.20), put(1.00, -100.0)}, market, SweepConfig{}, 0.0);

    for (const auto& p : curve.points) {
        EXPECT_GE(p.hedged_rate, 1.00 - 1e-12);
        EXPECT_LE(p.hedged_rate, 1.20 + 1e-12);
    }
}

TEST_F(PayoffTest, ReferenceLevelsLabelled) {
    OptionLeg ko = call(1.10);
    ko.barrier = BarrierKind::KNOCK_OUT;
    ko.barrier_level = Level::percent(110.0);

    OptionLeg dko = put(1.05);
    dko.barrier = BarrierKind::DOUBLE_KNOCK_OUT;
    dko.lower_barrier = Level::absolute(0.95);
    dko.upper_barrier = Level::absolute(1.25);

    const auto curve = PayoffEvaluator::payoff_curve({ko, dko}, market, SweepConfig{20.0, 5}, 0.0);

    const std::vector<std::string> expected_labels = {
        "leg1 strike", "leg1 barrier",
        "leg2 strike", "leg2 upper barrier", "leg2 lower barrier"
    };
    EXPECT_EQ(curve.reference_labels, expected_labels);

    ASSERT_EQ(curve.points.size(), 5u);
    const auto& levels = curve.points.front().reference_levels;
    ASSERT_EQ(levels.size(), 5u);
    EXPECT_DOUBLE_EQ(levels[0], 1.10);
    EXPECT_NEAR(levels[1], 1.21, 1e-12);
    EXPECT_DOUBLE_EQ(levels[3], 1.25);
    EXPECT_DOUBLE_EQ(levels[4], 0.95);
}

TEST_F(PayoffTest, InvalidSweepReportsDiagnostic) {
    DiagnosticLog log;
    auto curve = PayoffEvaluator::payoff_curve({call(1.10)}, market, SweepConfig{30.0, 1}, 0.0, log.sink());
    EXPECT_TRUE(curve.points.empty());

    curve = PayoffEvaluator::payoff_curve({call(1.10)}, market, SweepConfig{120.0, 50}, 0.0, log.sink());
    EXPECT_TRUE(curve.points.empty());
    EXPECT_EQ(log.count(DIAG_INVALID_INPUT), 2u);
}

TEST_F(PayoffTest, EmptyStrategyIsUnhedged) {
    const auto curve = PayoffEvaluator::payoff_curve({}, market, SweepConfig{10.0, 11}, 0.0);
    ASSERT_EQ(curve.points.size(), 11u);
    for (const auto& p : curve.points) {
        EXPECT_DOUBLE_EQ(p.hedged_rate, p.spot);
    }
    EXPECT_TRUE(curve.reference_labels.empty());
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
