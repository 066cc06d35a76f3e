#include <gtest/gtest.h>
#include "../include/binding_args.hpp"
#include <limits>

using namespace fxhedge;
using namespace fxhedge::bindings;

namespace {

constexpr double kInf = std::numeric_limits<double>::infinity();
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

} // namespace

// ============================================================================
// ENUM NAME TESTS
// ============================================================================

TEST(BindingArgsTest, OptionTypeNames) {
    OptionType type = OptionType::PUT;
    EXPECT_TRUE(parse_option_type("call", type));
    EXPECT_EQ(type, OptionType::CALL);
    EXPECT_TRUE(parse_option_type("put", type));
    EXPECT_EQ(type, OptionType::PUT);
}

TEST(BindingArgsTest, NonStringValuesReadAsEmptyAreRejected) {
    // A JS number or boolean reaches the parsers as an empty string
    OptionType type = OptionType::CALL;
    EXPECT_FALSE(parse_option_type("", type));
    EXPECT_FALSE(parse_option_type("Call", type));
    EXPECT_FALSE(parse_option_type("5", type));
    EXPECT_EQ(type, OptionType::CALL);

    BarrierKind kind = BarrierKind::KNOCK_OUT;
    EXPECT_FALSE(parse_barrier_kind("", kind));
    EXPECT_FALSE(parse_barrier_kind("true", kind));
    EXPECT_FALSE(parse_barrier_kind("ko", kind));
    EXPECT_EQ(kind, BarrierKind::KNOCK_OUT);
}

TEST(BindingArgsTest, BarrierKindNamesRoundTrip) {
    for (auto kind : {BarrierKind::NONE, BarrierKind::KNOCK_OUT, BarrierKind::KNOCK_IN,
                      BarrierKind::DOUBLE_KNOCK_OUT, BarrierKind::DOUBLE_KNOCK_IN}) {
        BarrierKind parsed = BarrierKind::NONE;
        ASSERT_TRUE(parse_barrier_kind(barrier_kind_name(kind), parsed)) << barrier_kind_name(kind);
        EXPECT_EQ(parsed, kind);
    }
}

// ============================================================================
// NUMERIC NARROWING TESTS
// ============================================================================

TEST(BindingArgsTest, CountAcceptsRange) {
    size_t out = 0;
    EXPECT_TRUE(to_count(20000.0, 1.0, MAX_PATHS, out));
    EXPECT_EQ(out, 20000u);
    EXPECT_TRUE(to_count(MAX_PATHS, 1.0, MAX_PATHS, out));
    EXPECT_EQ(out, 100000000u);
    EXPECT_TRUE(to_count(2.9, 2.0, MAX_SWEEP_STEPS, out));
    EXPECT_EQ(out, 2u);
}

TEST(BindingArgsTest, CountRejectsNonFiniteAndOutOfRange) {
    size_t out = 77;
    EXPECT_FALSE(to_count(kInf, 2.0, MAX_SWEEP_STEPS, out));
    EXPECT_FALSE(to_count(-kInf, 1.0, MAX_PATHS, out));
    EXPECT_FALSE(to_count(kNaN, 1.0, MAX_PATHS, out));
    EXPECT_FALSE(to_count(1e300, 1.0, MAX_PATHS, out));
    EXPECT_FALSE(to_count(MAX_PATHS + 1.0, 1.0, MAX_PATHS, out));
    EXPECT_FALSE(to_count(1.0, 2.0, MAX_SWEEP_STEPS, out));
    EXPECT_FALSE(to_count(-5.0, 1.0, MAX_TIME_STEPS, out));
    EXPECT_EQ(out, 77u);
}

TEST(BindingArgsTest, SeedAcceptsNonNegativeIntegers) {
    uint64_t seed = 0;
    EXPECT_TRUE(to_seed(0.0, seed));
    EXPECT_EQ(seed, 0u);
    EXPECT_TRUE(to_seed(2024.0, seed));
    EXPECT_EQ(seed, 2024u);
    EXPECT_TRUE(to_seed(MAX_SEED, seed));
    EXPECT_EQ(seed, 9007199254740992ull);
}

TEST(BindingArgsTest, SeedRejectsNegativeFractionalAndNonFinite) {
    uint64_t seed = 42;
    EXPECT_FALSE(to_seed(-1.0, seed));
    EXPECT_FALSE(to_seed(0.5, seed));
    EXPECT_FALSE(to_seed(kInf, seed));
    EXPECT_FALSE(to_seed(kNaN, seed));
    EXPECT_FALSE(to_seed(1e300, seed));
    EXPECT_EQ(seed, 42u);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
