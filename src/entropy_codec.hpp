#ifndef ENTROPY_CODEC_HPP
#define ENTROPY_CODEC_HPP

/**
 * @file entropy_codec.hpp
 * @brief One-call entropy coding of symbol sequences
 *
 * EntropyCodec ties a model, a coder and the bit streams together and writes
 * the self-describing stream defined in codec_format.hpp:
 *
 * - HUFFMAN:        counts the input, builds a canonical code and transmits
 *                   the code lengths.
 * - RANGE_STATIC:   counts the input, rescales the counts into the range
 *                   coder's precision and transmits them.
 * - RANGE_ADAPTIVE: transmits no table; encoder and decoder both start from a
 *                   flat AdaptiveModel and update it after every symbol.
 *
 * Instances hold configuration only; encode() and decode() keep all session
 * state local, so one codec can be used from several threads.
 */

#include "codec_format.hpp"
#include <cstdint>
#include <vector>

/**
 * @brief Codec configuration.
 */
struct CodecConfig {
    CoderMethod method = CoderMethod::HUFFMAN;

    // Symbols must be below alphabet_size. 0 derives the alphabet from the
    // input as max(symbol) + 1.
    uint32_t alphabet_size = 0;

    // Largest symbol count decode() accepts from a header; 0 means no limit.
    // A range-coded stream whose model gives one symbol all the probability
    // spends no bits on it, so its declared count cannot be checked against
    // the payload size. Set this when decoding untrusted input.
    uint64_t max_symbols = 0;
};

class EntropyCodec {
public:
    /**
     * @throw std::invalid_argument If alphabet_size exceeds
     *        CodecFormat::MAX_ALPHABET_SIZE
     */
    explicit EntropyCodec(CodecConfig config = CodecConfig());

    /**
     * Encode a symbol sequence into a header plus payload.
     *
     * An empty sequence produces a header with an empty payload.
     *
     * @throw UnknownSymbolError If a symbol is outside the alphabet
     */
    std::vector<uint8_t> encode(const std::vector<uint32_t>& symbols) const;

    /**
     * Decode a stream produced by encode().
     *
     * The coding method is read from the stream, so any EntropyCodec can
     * decode any stream.
     *
     * @throw CorruptStreamError If the stream is malformed, truncated,
     *        followed by extra bytes or declares more than
     *        CodecConfig::max_symbols symbols
     */
    std::vector<uint32_t> decode(const std::vector<uint8_t>& data) const;

    const CodecConfig& config() const { return config_; }

    /**
     * Rescale threshold of the adaptive model for a given alphabet. Both
     * sides derive it from the alphabet size in the header.
     */
    static uint64_t adaptive_max_total(uint32_t alphabet_size);

private:
    CodecConfig config_;
};

#endif // ENTROPY_CODEC_HPP
