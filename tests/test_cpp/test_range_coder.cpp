#include <gtest/gtest.h>
#include <cmath>
#include <random>
#include <vector>
#include "adaptive_model.hpp"
#include "bit_stream.hpp"
#include "codec_errors.hpp"
#include "frequency_model.hpp"
#include "range_coder.hpp"

namespace {

double shannon_bits(const FrequencyModel& model) {
    double bits = 0.0;
    double total = static_cast<double>(model.total_count());
    for (uint64_t f : model.counts()) {
        if (f > 0) bits -= static_cast<double>(f) * std::log2(static_cast<double>(f) / total);
    }
    return bits;
}

} // namespace

// Test: RangeCoder_InitialState
TEST(RangeCoderTest, InitialState) {
    std::vector<uint8_t> buffer;
    BitOutputStream bit_stream(buffer);
    RangeCoder coder;

    EXPECT_FALSE(coder.is_encoding());
    coder.start_encoding(bit_stream);

    EXPECT_TRUE(coder.is_encoding());
    EXPECT_FALSE(coder.is_decoding());
}

// Test: RangeCoder_Constants
TEST(RangeCoderTest, Constants) {
    EXPECT_EQ(RangeCoder::CODE_VALUE_BITS, 32);
    EXPECT_EQ(RangeCoder::TOP_VALUE, 4294967295ULL);
    EXPECT_EQ(RangeCoder::FIRST_QTR, 1ULL << 30);
    EXPECT_EQ(RangeCoder::HALF, 1ULL << 31);
    EXPECT_EQ(RangeCoder::THIRD_QTR, 3ULL << 30);
    EXPECT_EQ(RangeCoder::MAX_TOTAL, (1ULL << 30) - 1);
}

// Test: RangeCoder_SessionMisuse
TEST(RangeCoderTest, SessionMisuse) {
    RangeCoder coder;
    FrequencyModel model = FrequencyModel::from_table({1, 1});
    EXPECT_THROW(coder.encode_symbol(0, model), std::runtime_error);
    EXPECT_THROW(coder.done_encoding(), std::runtime_error);
    EXPECT_THROW(coder.decode_symbol(model), std::runtime_error);
}

// Test: RangeCoder_RoundTrip_Simple
TEST(RangeCoderTest, RoundTrip_Simple) {
    FrequencyModel model = FrequencyModel::from_table({5, 2, 1, 1});
    std::vector<uint32_t> original = {0, 0, 1, 0, 2, 3};

    RangeCoder encoder;
    std::vector<uint8_t> buffer = encoder.encode(original, model);
    EXPECT_FALSE(encoder.is_encoding());
    ASSERT_FALSE(buffer.empty());

    RangeCoder decoder;
    EXPECT_EQ(decoder.decode(buffer, model, original.size()), original);
}

// Test: RangeCoder_RoundTrip_SessionApi
TEST(RangeCoderTest, RoundTrip_SessionApi) {
    std::vector<uint8_t> buffer;
    BitOutputStream out_stream(buffer);
    FrequencyModel model = FrequencyModel::from_table({3, 1});
    RangeCoder encoder;
    RangeCoder decoder;

    std::vector<uint32_t> original = {0, 1, 0, 1, 1, 0, 1, 0, 1, 1};
    encoder.start_encoding(out_stream);
    for (uint32_t symbol : original) {
        encoder.encode_symbol(symbol, model);
    }
    encoder.done_encoding();

    // We create a fresh input stream from the populated buffer
    BitInputStream in_stream(buffer);
    decoder.start_decoding(in_stream);
    EXPECT_TRUE(decoder.is_decoding());
    EXPECT_FALSE(decoder.is_encoding());

    std::vector<uint32_t> decoded;
    for (size_t i = 0; i < original.size(); i++) {
        decoded.push_back(decoder.decode_symbol(model));
    }
    EXPECT_EQ(decoded, original);

    // The decoder consumed every written bit and nothing more
    EXPECT_LT(in_stream.bits_remaining(), 8u);
}

// Test: RangeCoder_RoundTrip_Random
TEST(RangeCoderTest, RoundTrip_Random) {
    std::mt19937 rng(42);
    for (int trial = 0; trial < 50; trial++) {
        uint32_t alphabet = 1 + rng() % 40;
        std::vector<int64_t> counts(alphabet);
        for (int64_t& c : counts) c = 1 + rng() % 500;
        FrequencyModel model = FrequencyModel::from_table(counts);

        std::discrete_distribution<uint32_t> dist(counts.begin(), counts.end());
        std::vector<uint32_t> original(1 + rng() % 2000);
        for (uint32_t& s : original) s = dist(rng);

        RangeCoder coder;
        std::vector<uint8_t> buffer = coder.encode(original, model);
        EXPECT_EQ(coder.decode(buffer, model, original.size()), original) << "trial " << trial;
    }
}

// Test: RangeCoder_SingleSymbolAlphabet
TEST(RangeCoderTest, SingleSymbolAlphabet) {
    FrequencyModel model = FrequencyModel::from_table({7});
    std::vector<uint32_t> original(1000, 0);

    RangeCoder coder;
    std::vector<uint8_t> buffer = coder.encode(original, model);
    // A certain symbol costs nothing beyond the termination bits
    EXPECT_EQ(buffer.size(), 4u);
    EXPECT_EQ(coder.decode(buffer, model, original.size()), original);
}

// Test: RangeCoder_ExtremeFrequencyRatio
TEST(RangeCoderTest, ExtremeFrequencyRatio) {
    // One symbol at count 1 next to one at the largest allowed count forces
    // long runs of renormalization and pending (E3) bits.
    FrequencyModel model = FrequencyModel::from_table({1, static_cast<int64_t>(RangeCoder::MAX_TOTAL - 1)});

    std::vector<uint32_t> original;
    for (int i = 0; i < 200; i++) {
        original.push_back(1);
        if (i % 17 == 0) original.push_back(0);
    }
    original.push_back(0);
    original.push_back(0);

    RangeCoder coder;
    std::vector<uint8_t> buffer = coder.encode(original, model);
    EXPECT_EQ(coder.decode(buffer, model, original.size()), original);
}

// Test: RangeCoder_UnderflowCondition
TEST(RangeCoderTest, UnderflowCondition) {
    // Near-even splits keep the interval straddling the midpoint
    FrequencyModel model = FrequencyModel::from_table({1000001, 1000000});
    std::vector<uint32_t> original;
    for (int i = 0; i < 500; i++) {
        original.push_back(i % 2);
    }

    RangeCoder coder;
    std::vector<uint8_t> buffer = coder.encode(original, model);
    EXPECT_EQ(coder.decode(buffer, model, original.size()), original);
}

// Test: RangeCoder_ZeroFrequencySymbolsInModel
TEST(RangeCoderTest, ZeroFrequencySymbolsInModel) {
    FrequencyModel model = FrequencyModel::from_table({0, 3, 0, 0, 2, 0});
    std::vector<uint32_t> original = {1, 4, 4, 1, 1};

    RangeCoder coder;
    std::vector<uint8_t> buffer = coder.encode(original, model);
    EXPECT_EQ(coder.decode(buffer, model, original.size()), original);

    EXPECT_THROW(coder.encode({1, 2}, model), UnknownSymbolError);
    EXPECT_THROW(coder.encode({6}, model), UnknownSymbolError);
}

// Test: RangeCoder_ApproachesEntropy
TEST(RangeCoderTest, ApproachesEntropy) {
    std::mt19937 rng(7);
    std::bernoulli_distribution rare(0.01);
    std::vector<uint32_t> original(200000);
    for (uint32_t& s : original) s = rare(rng) ? 1 : 0;

    FrequencyModel model = FrequencyModel::from_symbols(original, 2);
    std::vector<uint8_t> buffer;
    BitOutputStream stream(buffer);
    RangeCoder coder;
    coder.encode(original, model, stream);

    double entropy = shannon_bits(model);
    // Termination adds CODE_VALUE_BITS; integer rounding a fraction of a bit
    // per thousand symbols.
    EXPECT_LE(static_cast<double>(stream.bits_written()), entropy + 64 + original.size() / 1000.0);
    EXPECT_EQ(coder.decode(buffer, model, original.size()), original);
}

// Test: RangeCoder_EmptyModel
TEST(RangeCoderTest, EmptyModel) {
    RangeCoder coder;
    EXPECT_THROW(coder.encode({0}, FrequencyModel(3)), EmptyAlphabetError);
}

// Test: RangeCoder_PrecisionOverflow
TEST(RangeCoderTest, PrecisionOverflow) {
    FrequencyModel model = FrequencyModel::from_table({1, static_cast<int64_t>(RangeCoder::MAX_TOTAL)});
    RangeCoder coder;
    EXPECT_THROW(coder.encode({0, 1}, model), PrecisionOverflowError);

    // Rescaling brings it back into range
    model.rescale(RangeCoder::MAX_TOTAL);
    std::vector<uint8_t> buffer = coder.encode({0, 1}, model);
    std::vector<uint32_t> expected = {0, 1};
    EXPECT_EQ(coder.decode(buffer, model, 2), expected);
}

// Test: RangeCoder_TruncatedStream
TEST(RangeCoderTest, TruncatedStream) {
    FrequencyModel model = FrequencyModel::from_table({9, 3, 1});
    std::vector<uint32_t> original = {0, 1, 0, 0, 2, 0, 1, 0, 0, 0, 2, 2, 1};

    RangeCoder coder;
    std::vector<uint8_t> buffer = coder.encode(original, model);
    buffer.pop_back();
    EXPECT_THROW(coder.decode(buffer, model, original.size()), CorruptStreamError);

    std::vector<uint8_t> tiny = {0x12};
    EXPECT_THROW(coder.decode(tiny, model, 1), CorruptStreamError);
}

// Test: RangeCoder_ZeroSymbolsReadNothing
TEST(RangeCoderTest, ZeroSymbolsReadNothing) {
    FrequencyModel model = FrequencyModel::from_table({1, 1});
    std::vector<uint8_t> empty;
    RangeCoder coder;
    EXPECT_TRUE(coder.decode(empty, model, 0).empty());
}

// ============================================================================
//  Adaptive mode
// ============================================================================

// Test: RangeCoder_RoundTrip_AdaptiveModel
TEST(RangeCoderTest, RoundTrip_AdaptiveModel) {
    std::vector<uint8_t> buffer;
    BitOutputStream out_stream(buffer);

    AdaptiveModel encode_model(2);
    AdaptiveModel decode_model(2);
    RangeCoder encoder;
    RangeCoder decoder;

    // Lock-step protocol: each side codes a symbol, then updates its model
    std::vector<uint32_t> original = {0, 0, 0, 1, 1, 0, 0, 1, 1, 1};
    encoder.start_encoding(out_stream);
    for (uint32_t symbol : original) {
        encoder.encode_symbol(symbol, encode_model.frequencies());
        encode_model.update_model(symbol);
    }
    encoder.done_encoding();

    BitInputStream in_stream(buffer);
    decoder.start_decoding(in_stream);

    std::vector<uint32_t> decoded;
    for (size_t i = 0; i < original.size(); i++) {
        uint32_t symbol = decoder.decode_symbol(decode_model.frequencies());
        decode_model.update_model(symbol);
        decoded.push_back(symbol);
    }

    EXPECT_EQ(decoded, original);

    // Verify models have same frequencies (adaptation was synchronized)
    for (uint32_t i = 0; i < 2; i++) {
        EXPECT_EQ(encode_model.get_frequency(i), decode_model.get_frequency(i));
    }
}

// Test: RangeCoder_RoundTrip_AdaptiveWithRescaling
TEST(RangeCoderTest, RoundTrip_AdaptiveWithRescaling) {
    std::mt19937 rng(99);
    std::vector<uint32_t> original(20000);
    for (size_t i = 0; i < original.size(); i++) {
        // Drifting statistics: the favoured symbol changes every 5000 symbols
        uint32_t favoured = static_cast<uint32_t>(i / 5000);
        original[i] = (rng() % 10 < 8) ? favoured : static_cast<uint32_t>(rng() % 6);
    }

    AdaptiveModel encode_model(6, 1000);
    RangeCoder encoder;
    std::vector<uint8_t> buffer = encoder.encode_adaptive(original, encode_model);

    AdaptiveModel decode_model(6, 1000);
    RangeCoder decoder;
    EXPECT_EQ(decoder.decode_adaptive(buffer, decode_model, original.size()), original);
    EXPECT_EQ(encode_model.frequencies().counts(), decode_model.frequencies().counts());
}

// Test: RangeCoder_AdaptiveModelMismatchDiverges
TEST(RangeCoderTest, AdaptiveModelMismatchDiverges) {
    std::vector<uint32_t> original = {0, 0, 0, 0, 0, 0, 0, 0, 1, 2, 1, 0, 0, 0, 0, 0};

    AdaptiveModel encode_model(3);
    RangeCoder coder;
    std::vector<uint8_t> buffer = coder.encode_adaptive(original, encode_model);

    // Decoding with a model that is not in the encoder's start state
    AdaptiveModel stale_model(3);
    stale_model.update_model(2);
    stale_model.update_model(2);
    stale_model.update_model(2);

    std::vector<uint32_t> decoded;
    try {
        decoded = coder.decode_adaptive(buffer, stale_model, original.size());
    } catch (const CorruptStreamError&) {
        SUCCEED();
        return;
    }
    EXPECT_NE(decoded, original);
}

// Test: RangeCoder_ModelSeparation
TEST(RangeCoderTest, ModelSeparation) {
    AdaptiveModel model1(2);
    AdaptiveModel model2(2);
    RangeCoder coder1, coder2;

    coder1.encode_adaptive({0}, model1);
    coder2.encode_adaptive({1}, model2);

    EXPECT_NE(model1.get_frequency(0), model2.get_frequency(0));
    EXPECT_NE(model1.get_frequency(1), model2.get_frequency(1));
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
