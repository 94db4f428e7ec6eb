#ifndef RANGE_CODER_HPP
#define RANGE_CODER_HPP

/**
 * @file range_coder.hpp
 * @brief Range (arithmetic) coder over 32-bit integer intervals
 *
 * This implementation is based on the arithmetic coding algorithm from
 * Witten, I.H., Neal, R.M., & Cleary, J.G. (1987). "Arithmetic coding
 * for data compression." Communications of the ACM, 30(6), 520-540,
 * widened to 32-bit code values with 64-bit intermediate products.
 *
 * Bitstream convention (any change is a format break):
 * - The interval [low, high] is inclusive; both ends start at the full
 *   domain [0, 2^32 - 1].
 * - A symbol s narrows it to
 *     high = low + range * (cum(s) + freq(s)) / total - 1
 *     low  = low + range * cum(s) / total
 *   where range = high - low + 1 and cum(s) = cumulative_before(s).
 * - Renormalization: high < HALF emits 0, low >= HALF emits 1, and an
 *   interval inside [FIRST_QTR, THIRD_QTR) defers one bit (E3 scaling); each
 *   deferred bit is written, inverted, right after the next settled bit.
 * - On completion two bits select a quarter inside the final interval,
 *   followed by CODE_VALUE_BITS - 2 zero bits. The payload then holds
 *   exactly as many bits as the decoder's lookahead consumes, so a valid
 *   stream is never read past its end and a truncated one always fails.
 * - Bits are packed MSB first by BitOutputStream.
 *
 * @see Witten, Neal, & Cleary (1987) for the original algorithm
 */

#include "adaptive_model.hpp"
#include "bit_stream.hpp"
#include "frequency_model.hpp"
#include <cstdint>
#include <vector>

/**
 * @brief Range coder with static or adaptive models
 *
 * A session is opened with start_encoding()/start_decoding(), driven one
 * symbol at a time and closed with done_encoding(). The model is passed with
 * every symbol, so the caller decides whether it is static or updated between
 * symbols. The whole-sequence helpers wrap both patterns.
 */
class RangeCoder {
public:
    // Constants for range coding
    static constexpr int CODE_VALUE_BITS = 32;
    static constexpr uint64_t TOP_VALUE = ((1ULL << CODE_VALUE_BITS) - 1);
    static constexpr uint64_t FIRST_QTR = (TOP_VALUE / 4 + 1);
    static constexpr uint64_t HALF = (2 * FIRST_QTR);
    static constexpr uint64_t THIRD_QTR = (3 * FIRST_QTR);

    /// Largest model total that keeps every present symbol's sub-interval
    /// non-empty after renormalization.
    static constexpr uint64_t MAX_TOTAL = FIRST_QTR - 1;

    RangeCoder();

    /**
     * Start encoding a stream of symbols.
     *
     * @param stream Bit output stream to write encoded bits to
     */
    void start_encoding(BitOutputStream& stream);

    /**
     * Encode a symbol.
     *
     * @param symbol Symbol to encode (0 to alphabet_size-1)
     * @param model Frequencies to code the symbol with
     * @throw UnknownSymbolError If the symbol is outside the alphabet or has
     *        zero frequency
     * @throw EmptyAlphabetError If the model total is zero
     * @throw PrecisionOverflowError If the model total exceeds MAX_TOTAL
     */
    void encode_symbol(uint32_t symbol, const FrequencyModel& model);

    /**
     * Finish encoding the stream.
     * Writes the bits that identify the final interval and flushes the stream.
     */
    void done_encoding();

    /**
     * Start decoding a stream of symbols.
     *
     * @param stream Bit input stream to read encoded bits from
     * @throw CorruptStreamError If the stream is shorter than the lookahead
     */
    void start_decoding(BitInputStream& stream);

    /**
     * Decode the next symbol.
     *
     * @param model Frequencies the encoder used for this symbol
     * @return Decoded symbol (0 to alphabet_size-1)
     * @throw CorruptStreamError If the stream is inconsistent with the model
     *        or ends early
     */
    uint32_t decode_symbol(const FrequencyModel& model);

    bool is_encoding() const { return encoding_; }
    bool is_decoding() const { return decoding_; }

    // --- Whole-sequence helpers ---

    /**
     * Encode symbols with a static model and close the session.
     */
    void encode(const std::vector<uint32_t>& symbols, const FrequencyModel& model,
                BitOutputStream& stream);

    std::vector<uint8_t> encode(const std::vector<uint32_t>& symbols,
                                const FrequencyModel& model);

    /**
     * Decode exactly symbol_count symbols with a static model.
     * A count of 0 reads nothing.
     */
    std::vector<uint32_t> decode(BitInputStream& stream, const FrequencyModel& model,
                                 uint64_t symbol_count);

    std::vector<uint32_t> decode(const std::vector<uint8_t>& bits,
                                 const FrequencyModel& model,
                                 uint64_t symbol_count);

    /**
     * Encode symbols, updating the model after each one.
     * The model is left in its final state.
     */
    void encode_adaptive(const std::vector<uint32_t>& symbols, AdaptiveModel& model,
                         BitOutputStream& stream);

    std::vector<uint8_t> encode_adaptive(const std::vector<uint32_t>& symbols,
                                         AdaptiveModel& model);

    /**
     * Decode symbols, updating the model after each one exactly as
     * encode_adaptive did. The model must start in the encoder's start state.
     */
    std::vector<uint32_t> decode_adaptive(BitInputStream& stream, AdaptiveModel& model,
                                          uint64_t symbol_count);

    std::vector<uint32_t> decode_adaptive(const std::vector<uint8_t>& bits,
                                          AdaptiveModel& model,
                                          uint64_t symbol_count);

private:
    // Interval state (shared by both directions)
    uint64_t low_;              // Lower bound of the interval
    uint64_t high_;             // Upper bound of the interval (inclusive)

    // Encoding state
    uint64_t bits_to_follow_;   // Number of opposite bits to output (underflow handling)
    BitOutputStream* output_stream_;
    bool encoding_;

    // Decoding state
    uint64_t value_;            // Current code value being decoded
    BitInputStream* input_stream_;
    bool decoding_;

    /**
     * Output a bit plus any following opposite bits (underflow handling).
     *
     * @param bit Bit to output (true = 1, false = 0)
     */
    void bit_plus_follow(bool bit);

    /// Read one bit while decoding, reporting exhaustion as stream corruption.
    bool next_bit();

    /// Narrow [low_, high_] to the sub-interval of a symbol.
    void narrow(uint64_t cum_low, uint64_t cum_high, uint64_t total);

    static void check_model(const FrequencyModel& model);
};

#endif // RANGE_CODER_HPP
