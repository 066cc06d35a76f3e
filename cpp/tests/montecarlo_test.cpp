#include <gtest/gtest.h>
#include "../include/monte_carlo.hpp"
#include "../include/options_pricing.hpp"
#include <cmath>
#include <vector>

using namespace fxhedge;
using namespace fxhedge::montecarlo;

namespace {

const MarketParams kMarket{
    .spot = 1.10,
    .r_domestic = 0.02,
    .r_foreign = 0.01,
    .volatility = 0.10,
    .maturity = 1.0
};

ResolvedLeg make_leg(OptionType type, double strike, BarrierKind barrier = BarrierKind::NONE) {
    ResolvedLeg leg{};
    leg.type = type;
    leg.barrier = barrier;
    leg.strike = strike;
    leg.volatility = kMarket.volatility;
    leg.quantity = 100.0;
    return leg;
}

double closed_form_up_and_out_call(double K, double H) {
    return options::BarrierOptionPricer::price_single(
        OptionType::CALL, options::BarrierType::UP_AND_OUT,
        kMarket.spot, K, H, kMarket.maturity,
        kMarket.r_domestic, kMarket.r_foreign, kMarket.volatility);
}

// Constant uniform draws: Box-Muller then yields the same normal pair forever
struct FixedUniform {
    double value;
    double uniform() noexcept { return value; }
};

} // namespace

// ============================================================================
// RNG TESTS
// ============================================================================

TEST(XoshiroTest, SameSeedSameSequence) {
    Xoshiro256PP a(7);
    Xoshiro256PP b(7);
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(a(), b());
    }
}

TEST(XoshiroTest, UniformInUnitInterval) {
    Xoshiro256PP rng(123);
    double sum = 0.0;
    constexpr int N = 100000;
    for (int i = 0; i < N; ++i) {
        const double u = rng.uniform();
        ASSERT_GE(u, 0.0);
        ASSERT_LT(u, 1.0);
        sum += u;
    }
    EXPECT_NEAR(sum / N, 0.5, 0.01);
}

TEST(XoshiroTest, StreamSeedsDiffer) {
    EXPECT_NE(MonteCarloEngine::stream_seed(42, 0), MonteCarloEngine::stream_seed(42, 1));
    EXPECT_NE(MonteCarloEngine::stream_seed(42, 0), MonteCarloEngine::stream_seed(43, 0));
    EXPECT_EQ(MonteCarloEngine::stream_seed(42, 5), MonteCarloEngine::stream_seed(42, 5));
}

TEST(BoxMullerTest, StandardNormalMoments) {
    Xoshiro256PP rng(99);
    BoxMullerNormal<Xoshiro256PP> normal(rng);

    constexpr int N = 200000;
    double sum = 0.0;
    double sum_sq = 0.0;
    for (int i = 0; i < N; ++i) {
        const double z = normal();
        sum += z;
        sum_sq += z * z;
    }
    EXPECT_NEAR(sum / N, 0.0, 0.01);
    EXPECT_NEAR(sum_sq / N, 1.0, 0.02);
}

TEST(BrownianBridgeTest, CrossingProbability) {
    // Endpoints on opposite sides always cross
    EXPECT_DOUBLE_EQ(bridge_crossing_probability(1.0, 1.3, 1.2, 0.01), 1.0);

    const double near = bridge_crossing_probability(1.19, 1.19, 1.2, 0.0004);
    const double far = bridge_crossing_probability(1.10, 1.10, 1.2, 0.0004);
    EXPECT_GT(near, far);
    EXPECT_GT(near, 0.0);
    EXPECT_LT(near, 1.0);
}

// ============================================================================
// CONVERGENCE TESTS
// ============================================================================

TEST(MonteCarloPricingTest, UpAndOutCallConverges) {
    const double H = 1.25;
    const double reference = closed_form_up_and_out_call(1.10, H);

    ResolvedLeg leg = make_leg(OptionType::CALL, 1.10, BarrierKind::KNOCK_OUT);
    leg.barrier_level = H;

    double prev_se = 1e9;
    for (size_t paths : {1000u, 10000u, 100000u}) {
        MonteCarloConfig config;
        config.num_paths = paths;
        config.seed = 2024;
        MonteCarloEngine engine(config);

        auto result = engine.price(leg, kMarket);

        EXPECT_EQ(result.num_paths, paths);
        EXPECT_GT(result.std_error, 0.0);
        EXPECT_LT(result.std_error, prev_se) << "paths=" << paths;
        EXPECT_NEAR(result.price, reference, 4.0 * result.std_error) << "paths=" << paths;
        if (paths == 100000u) {
            EXPECT_NEAR(result.price, reference, 3.0 * result.std_error);
        }
        EXPECT_GT(result.hit_ratio, 0.0);
        EXPECT_LT(result.hit_ratio, 1.0);
        prev_se = result.std_error;
    }
}

TEST(MonteCarloPricingTest, VanillaMatchesGarmanKohlhagen) {
    MonteCarloConfig config;
    config.num_paths = 100000;
    config.time_steps = 12;
    MonteCarloEngine engine(config);

    for (auto type : {OptionType::CALL, OptionType::PUT}) {
        auto result = engine.price(make_leg(type, 1.10), kMarket);
        const double reference = options::GarmanKohlhagenPricer::price(
            type, kMarket.spot, 1.10, kMarket.maturity,
            kMarket.r_domestic, kMarket.r_foreign, kMarket.volatility);
        EXPECT_NEAR(result.price, reference, 4.0 * result.std_error);
        EXPECT_EQ(result.hit_ratio, 0.0);
    }
}

TEST(MonteCarloPricingTest, DoubleKnockOutMatchesClosedForm) {
    ResolvedLeg leg = make_leg(OptionType::CALL, 1.10, BarrierKind::DOUBLE_KNOCK_OUT);
    leg.lower_barrier = 1.00;
    leg.upper_barrier = 1.20;

    MonteCarloConfig config;
    config.num_paths = 100000;
    MonteCarloEngine engine(config);

    auto result = engine.price(leg, kMarket);
    const double reference = options::BarrierOptionPricer::price_double(
        OptionType::CALL, options::DoubleBarrierType::KNOCK_OUT,
        kMarket.spot, 1.10, 1.00, 1.20, kMarket.maturity,
        kMarket.r_domestic, kMarket.r_foreign, kMarket.volatility);

    EXPECT_NEAR(result.price, reference, 4.0 * result.std_error);
}

TEST(MonteCarloPricingTest, BarrierTableMatchesClosedForm) {
    struct Case {
        const char* name;
        OptionType type;
        BarrierKind kind;
        bool reverse;
        double barrier;
    };
    const Case cases[] = {
        {"down-and-out put", OptionType::PUT, BarrierKind::KNOCK_OUT, false, 1.00},
        {"down-and-in put", OptionType::PUT, BarrierKind::KNOCK_IN, false, 1.00},
        {"up-and-in call", OptionType::CALL, BarrierKind::KNOCK_IN, false, 1.25},
        {"reverse KO call (down-and-out)", OptionType::CALL, BarrierKind::KNOCK_OUT, true, 1.00},
        {"reverse KI call (down-and-in)", OptionType::CALL, BarrierKind::KNOCK_IN, true, 1.00},
        {"reverse KO put (up-and-out)", OptionType::PUT, BarrierKind::KNOCK_OUT, true, 1.20},
        {"DKO put", OptionType::PUT, BarrierKind::DOUBLE_KNOCK_OUT, false, 0.0},
        {"DKI put", OptionType::PUT, BarrierKind::DOUBLE_KNOCK_IN, false, 0.0},
    };

    MonteCarloConfig config;
    config.num_paths = 100000;
    config.seed = 7;
    MonteCarloEngine engine(config);

    for (const auto& c : cases) {
        ResolvedLeg leg = make_leg(c.type, 1.10, c.kind);
        leg.reverse = c.reverse;

        double reference;
        if (is_double(c.kind)) {
            leg.lower_barrier = 1.00;
            leg.upper_barrier = 1.20;
            const auto type = c.kind == BarrierKind::DOUBLE_KNOCK_IN
                ? options::DoubleBarrierType::KNOCK_IN : options::DoubleBarrierType::KNOCK_OUT;
            reference = options::BarrierOptionPricer::price_double(
                c.type, type, kMarket.spot, 1.10, 1.00, 1.20, kMarket.maturity,
                kMarket.r_domestic, kMarket.r_foreign, kMarket.volatility);
        } else {
            leg.barrier_level = c.barrier;
            const auto type = options::BarrierOptionPricer::single_barrier_type(
                c.type, c.kind == BarrierKind::KNOCK_IN, c.reverse);
            reference = options::BarrierOptionPricer::price_single(
                c.type, type, kMarket.spot, 1.10, c.barrier, kMarket.maturity,
                kMarket.r_domestic, kMarket.r_foreign, kMarket.volatility);
        }

        auto result = engine.price(leg, kMarket);
        EXPECT_GT(reference, 0.0) << c.name;
        EXPECT_GT(result.std_error, 0.0) << c.name;
        EXPECT_NEAR(result.price, reference, 4.0 * result.std_error) << c.name;
    }
}

TEST(MonteCarloPricingTest, ReverseDoubleKnockInStartingInsideIsVanilla) {
    ResolvedLeg leg = make_leg(OptionType::PUT, 1.10, BarrierKind::DOUBLE_KNOCK_IN);
    leg.reverse = true;
    leg.lower_barrier = 1.00;
    leg.upper_barrier = 1.20;

    MonteCarloConfig config;
    config.num_paths = 50000;
    MonteCarloEngine engine(config);

    auto result = engine.price(leg, kMarket);
    EXPECT_DOUBLE_EQ(result.hit_ratio, 1.0);

    const double vanilla = options::GarmanKohlhagenPricer::price(
        OptionType::PUT, kMarket.spot, 1.10, kMarket.maturity,
        kMarket.r_domestic, kMarket.r_foreign, kMarket.volatility);
    EXPECT_NEAR(result.price, vanilla, 4.0 * result.std_error);
}

// ============================================================================
// DETERMINISM AND CONFIGURATION
// ============================================================================

TEST(MonteCarloPricingTest, ResultIndependentOfThreadCount) {
    ResolvedLeg leg = make_leg(OptionType::CALL, 1.10, BarrierKind::KNOCK_OUT);
    leg.barrier_level = 1.25;

    MonteCarloConfig single;
    single.num_paths = 20000;
    single.batch_size = 1000;
    single.num_threads = 1;

    MonteCarloConfig multi = single;
    multi.num_threads = 4;

    auto a = MonteCarloEngine(single).price(leg, kMarket);
    auto b = MonteCarloEngine(multi).price(leg, kMarket);

    EXPECT_DOUBLE_EQ(a.price, b.price);
    EXPECT_DOUBLE_EQ(a.std_error, b.std_error);
    EXPECT_DOUBLE_EQ(a.hit_ratio, b.hit_ratio);
}

TEST(MonteCarloPricingTest, SeedChangesEstimate) {
    ResolvedLeg leg = make_leg(OptionType::CALL, 1.10);

    MonteCarloConfig config;
    config.num_paths = 5000;
    config.time_steps = 4;
    auto a = MonteCarloEngine(config).price(leg, kMarket);
    config.seed = 43;
    auto b = MonteCarloEngine(config).price(leg, kMarket);

    EXPECT_NE(a.price, b.price);
}

TEST(MonteCarloPricingTest, InjectedGeneratorDrivesPaths) {
    // Near-zero volatility: every path follows the forward
    ResolvedLeg leg = make_leg(OptionType::CALL, 1.00);
    leg.volatility = 1e-8;

    FixedUniform rng{0.5};
    auto sums = MonteCarloEngine::simulate_batch(leg, kMarket, 52, 10, true, rng);

    const double forward = kMarket.spot * std::exp(kMarket.r_domestic - kMarket.r_foreign);
    EXPECT_EQ(sums.paths, 10u);
    EXPECT_EQ(sums.hits, 0u);
    EXPECT_NEAR(sums.sum / 10.0, forward - 1.00, 1e-6);
}

TEST(MonteCarloPricingTest, InjectedGeneratorKnockOutOnDrift) {
    // Forward drifts through the barrier, so every path knocks out
    ResolvedLeg leg = make_leg(OptionType::CALL, 1.00, BarrierKind::KNOCK_OUT);
    leg.volatility = 1e-8;
    leg.barrier_level = 1.105;

    FixedUniform rng{0.5};
    auto sums = MonteCarloEngine::simulate_batch(leg, kMarket, 52, 10, true, rng);

    EXPECT_EQ(sums.hits, 10u);
    EXPECT_DOUBLE_EQ(sums.sum, 0.0);
}

TEST(MonteCarloPricingTest, QuantityScalesPriceAndError) {
    ResolvedLeg leg = make_leg(OptionType::CALL, 1.10);
    leg.quantity = -50.0;

    MonteCarloConfig config;
    config.num_paths = 5000;
    config.time_steps = 4;
    auto result = MonteCarloEngine(config).price(leg, kMarket);

    EXPECT_LT(result.price, 0.0);
    EXPECT_NEAR(result.price, -0.5 * result.unit_price, 1e-15);
    EXPECT_NEAR(result.std_error, 0.5 * result.unit_std_error, 1e-15);
}

TEST(MonteCarloPricingTest, ConvergenceRiskDiagnostic) {
    MonteCarloConfig config;
    config.num_paths = 1000;
    config.time_steps = 4;
    config.max_std_error = 1e-9;

    DiagnosticLog log;
    auto result = MonteCarloEngine(config).price(make_leg(OptionType::CALL, 1.10), kMarket, log.sink());

    EXPECT_GT(result.price, 0.0);
    EXPECT_EQ(log.count(DIAG_CONVERGENCE_RISK), 1u);
}

TEST(MonteCarloPricingTest, InvalidInputReportsDiagnostic) {
    MarketParams bad = kMarket;
    bad.spot = 0.0;

    DiagnosticLog log;
    auto result = MonteCarloEngine().price(make_leg(OptionType::CALL, 1.10), bad, log.sink());

    EXPECT_EQ(result.price, 0.0);
    EXPECT_EQ(result.num_paths, 0u);
    EXPECT_EQ(log.count(DIAG_INVALID_INPUT), 1u);
}

TEST(MonteCarloPricingTest, ZeroThreadsUsesHardware) {
    MonteCarloEngine engine;
    EXPECT_GE(engine.num_threads(), 1u);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
