#include <gtest/gtest.h>
#include "adaptive_model.hpp"
#include "codec_errors.hpp"
#include "range_coder.hpp"

// Test: AdaptiveModel_InitialState
TEST(AdaptiveModelTest, InitialState) {
    AdaptiveModel model(2);

    EXPECT_EQ(model.get_frequency(0), 1u);
    EXPECT_EQ(model.get_frequency(1), 1u);

    const FrequencyModel& freq = model.frequencies();
    EXPECT_EQ(freq.total_count(), 2u);
    EXPECT_EQ(freq.cumulative_before(0), 0u);
    EXPECT_EQ(freq.cumulative_before(1), 1u);

    EXPECT_EQ(model.alphabet_size(), 2u);
}

// Test: AdaptiveModel_SingleSymbolAlphabet
TEST(AdaptiveModelTest, SingleSymbolAlphabet) {
    AdaptiveModel model(1);
    EXPECT_EQ(model.get_frequency(0), 1u);
    model.update_model(0);
    EXPECT_EQ(model.get_frequency(0), 2u);
}

// Test: AdaptiveModel_UpdateFrequency
TEST(AdaptiveModelTest, UpdateFrequency) {
    AdaptiveModel model(2);

    model.update_model(0);
    EXPECT_EQ(model.get_frequency(0), 2u);
    EXPECT_EQ(model.get_frequency(1), 1u);

    model.update_model(0);
    EXPECT_EQ(model.get_frequency(0), 3u);
    EXPECT_EQ(model.get_frequency(1), 1u);

    EXPECT_EQ(model.frequencies().total_count(), 4u);
    EXPECT_EQ(model.frequencies().cumulative_before(1), 3u);
}

// Test: AdaptiveModel_Rescaling
TEST(AdaptiveModelTest, Rescaling) {
    AdaptiveModel model(2, 100);

    for (int i = 0; i < 1000; i++) {
        model.update_model(0);
        EXPECT_LE(model.frequencies().total_count(), 100u);
    }

    // Halving rounds up, so the unused symbol is never lost
    EXPECT_GE(model.get_frequency(1), 1u);
    EXPECT_GT(model.get_frequency(0), model.get_frequency(1));
}

// Test: AdaptiveModel_DefaultThreshold
TEST(AdaptiveModelTest, DefaultThreshold) {
    AdaptiveModel model(4);
    EXPECT_EQ(model.max_total(), AdaptiveModel::ADAPTIVE_MAX_TOTAL);

    for (int i = 0; i < 100000; i++) {
        model.update_model(static_cast<uint32_t>(i % 3));
    }
    EXPECT_LE(model.frequencies().total_count(), AdaptiveModel::ADAPTIVE_MAX_TOTAL);
}

// Test: AdaptiveModel_IdenticalUpdatesGiveIdenticalModels
TEST(AdaptiveModelTest, IdenticalUpdatesGiveIdenticalModels) {
    AdaptiveModel a(5, 50);
    AdaptiveModel b(5, 50);
    std::vector<uint32_t> sequence = {4, 4, 0, 1, 4, 2, 2, 4, 3, 4, 4, 4};
    for (int round = 0; round < 20; round++) {
        for (uint32_t s : sequence) {
            a.update_model(s);
            b.update_model(s);
        }
    }
    EXPECT_EQ(a.frequencies().counts(), b.frequencies().counts());
}

// Test: AdaptiveModel_Reset
TEST(AdaptiveModelTest, Reset) {
    AdaptiveModel model(2);

    model.update_model(0);
    model.update_model(0);
    EXPECT_EQ(model.get_frequency(0), 3u);

    model.reset();

    EXPECT_EQ(model.get_frequency(0), 1u);
    EXPECT_EQ(model.get_frequency(1), 1u);
}

// Test: AdaptiveModel_InvalidSymbol
TEST(AdaptiveModelTest, InvalidSymbol) {
    AdaptiveModel model(2);

    EXPECT_NO_THROW(model.update_model(0));
    EXPECT_NO_THROW(model.update_model(1));
    EXPECT_THROW(model.update_model(2), UnknownSymbolError);

    // The failed update left the model untouched
    EXPECT_EQ(model.frequencies().total_count(), 4u);
}

// Test: AdaptiveModel_InvalidConstruction
TEST(AdaptiveModelTest, InvalidConstruction) {
    EXPECT_THROW(AdaptiveModel(0), std::invalid_argument);
    EXPECT_THROW(AdaptiveModel(10, 10), std::invalid_argument);
}

// Test: AdaptiveModel_ThresholdWithinCoderPrecision
TEST(AdaptiveModelTest, ThresholdWithinCoderPrecision) {
    EXPECT_THROW(AdaptiveModel(4, RangeCoder::MAX_TOTAL + 1), std::invalid_argument);

    AdaptiveModel model(4, RangeCoder::MAX_TOTAL);
    EXPECT_EQ(model.max_total(), RangeCoder::MAX_TOTAL);
    EXPECT_TRUE(model.frequencies().fits_precision(RangeCoder::MAX_TOTAL));
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
