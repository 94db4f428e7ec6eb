
#include "range_coder.hpp"
#include "codec_debug.hpp"
#include "codec_errors.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

RangeCoder::RangeCoder()
    : low_(0), high_(TOP_VALUE), bits_to_follow_(0), output_stream_(nullptr),
      encoding_(false), value_(0), input_stream_(nullptr), decoding_(false) {
}

void RangeCoder::start_encoding(BitOutputStream& stream) {
    output_stream_ = &stream;
    encoding_ = true;
    decoding_ = false;

    low_ = 0;
    high_ = TOP_VALUE;
    bits_to_follow_ = 0;
}

void RangeCoder::encode_symbol(uint32_t symbol, const FrequencyModel& model) {
    if (!encoding_) {
        throw std::runtime_error("RangeCoder: not in encoding mode");
    }
    check_model(model);

    if (symbol >= model.alphabet_size() || model.frequency(symbol) == 0) {
        throw UnknownSymbolError("range encode: symbol " + std::to_string(symbol) +
                                 " has no probability in the model");
    }

    uint64_t cum_low = model.cumulative_before(symbol);
    narrow(cum_low, cum_low + model.frequency(symbol), model.total_count());

    // Output bits and scale the interval
    for (;;) {
        if (high_ < HALF) {
            // Entire range is in lower half, output 0
            bit_plus_follow(false);
        } else if (low_ >= HALF) {
            // Entire range is in upper half, output 1
            bit_plus_follow(true);
            low_ -= HALF;
            high_ -= HALF;
        } else if (low_ >= FIRST_QTR && high_ < THIRD_QTR) {
            // Range straddles the midpoint inside the middle half
            bits_to_follow_++;
            low_ -= FIRST_QTR;
            high_ -= FIRST_QTR;
        } else {
            break;
        }

        low_ = 2 * low_;
        high_ = 2 * high_ + 1;
    }
}

void RangeCoder::done_encoding() {
    if (!encoding_) {
        throw std::runtime_error("RangeCoder: not in encoding mode");
    }

    // Two bits select a quarter that lies entirely inside [low_, high_]
    bits_to_follow_++;
    bit_plus_follow(low_ >= FIRST_QTR);

    // Fill the rest of the decoder's lookahead window
    output_stream_->write_bits(0, CODE_VALUE_BITS - 2);

    ENTROPY_DEBUG_LOG("range encode: " << output_stream_->bits_written()
                      << " bits written");
    output_stream_->flush();

    encoding_ = false;
}

void RangeCoder::start_decoding(BitInputStream& stream) {
    input_stream_ = &stream;
    decoding_ = true;
    encoding_ = false;

    try {
        value_ = stream.read_bits(CODE_VALUE_BITS);
    } catch (const OutOfDataError&) {
        decoding_ = false;
        throw CorruptStreamError("range decode: stream shorter than the " +
                                 std::to_string(CODE_VALUE_BITS) + "-bit lookahead");
    }

    low_ = 0;
    high_ = TOP_VALUE;
}

uint32_t RangeCoder::decode_symbol(const FrequencyModel& model) {
    if (!decoding_) {
        throw std::runtime_error("RangeCoder: not in decoding mode");
    }
    check_model(model);

    if (value_ < low_ || value_ > high_) {
        throw CorruptStreamError("range decode: code value left the interval");
    }

    uint64_t range = high_ - low_ + 1;
    uint64_t total = model.total_count();

    // Find the cumulative frequency corresponding to the current value
    uint64_t cum = ((value_ - low_ + 1) * total - 1) / range;
    uint32_t symbol = model.symbol_at_cumulative(cum);

    uint64_t cum_low = model.cumulative_before(symbol);
    narrow(cum_low, cum_low + model.frequency(symbol), total);

    // Scale the interval and read new bits, mirroring encode_symbol
    for (;;) {
        if (high_ < HALF) {
            // Expand lower half (no change to value)
        } else if (low_ >= HALF) {
            value_ -= HALF;
            low_ -= HALF;
            high_ -= HALF;
        } else if (low_ >= FIRST_QTR && high_ < THIRD_QTR) {
            value_ -= FIRST_QTR;
            low_ -= FIRST_QTR;
            high_ -= FIRST_QTR;
        } else {
            break;
        }

        low_ = 2 * low_;
        high_ = 2 * high_ + 1;
        value_ = 2 * value_ + (next_bit() ? 1 : 0);
    }

    return symbol;
}

// ============================================================================
//  Whole-sequence helpers
// ============================================================================

void RangeCoder::encode(const std::vector<uint32_t>& symbols, const FrequencyModel& model,
                        BitOutputStream& stream) {
    start_encoding(stream);
    for (uint32_t symbol : symbols) {
        encode_symbol(symbol, model);
    }
    done_encoding();
}

std::vector<uint8_t> RangeCoder::encode(const std::vector<uint32_t>& symbols,
                                        const FrequencyModel& model) {
    std::vector<uint8_t> bytes;
    BitOutputStream stream(bytes);
    encode(symbols, model, stream);
    return bytes;
}

std::vector<uint32_t> RangeCoder::decode(BitInputStream& stream, const FrequencyModel& model,
                                         uint64_t symbol_count) {
    std::vector<uint32_t> decoded;
    if (symbol_count == 0) {
        return decoded;
    }
    start_decoding(stream);
    for (uint64_t i = 0; i < symbol_count; i++) {
        decoded.push_back(decode_symbol(model));
    }
    decoding_ = false;
    return decoded;
}

std::vector<uint32_t> RangeCoder::decode(const std::vector<uint8_t>& bits,
                                         const FrequencyModel& model,
                                         uint64_t symbol_count) {
    BitInputStream stream(bits);
    return decode(stream, model, symbol_count);
}

void RangeCoder::encode_adaptive(const std::vector<uint32_t>& symbols, AdaptiveModel& model,
                                 BitOutputStream& stream) {
    start_encoding(stream);
    for (uint32_t symbol : symbols) {
        encode_symbol(symbol, model.frequencies());
        model.update_model(symbol);
    }
    done_encoding();
}

std::vector<uint8_t> RangeCoder::encode_adaptive(const std::vector<uint32_t>& symbols,
                                                 AdaptiveModel& model) {
    std::vector<uint8_t> bytes;
    BitOutputStream stream(bytes);
    encode_adaptive(symbols, model, stream);
    return bytes;
}

std::vector<uint32_t> RangeCoder::decode_adaptive(BitInputStream& stream, AdaptiveModel& model,
                                                  uint64_t symbol_count) {
    std::vector<uint32_t> decoded;
    if (symbol_count == 0) {
        return decoded;
    }
    start_decoding(stream);
    for (uint64_t i = 0; i < symbol_count; i++) {
        uint32_t symbol = decode_symbol(model.frequencies());
        model.update_model(symbol);
        decoded.push_back(symbol);
    }
    decoding_ = false;
    return decoded;
}

std::vector<uint32_t> RangeCoder::decode_adaptive(const std::vector<uint8_t>& bits,
                                                  AdaptiveModel& model,
                                                  uint64_t symbol_count) {
    BitInputStream stream(bits);
    return decode_adaptive(stream, model, symbol_count);
}

// ============================================================================
//  Internals
// ============================================================================

void RangeCoder::bit_plus_follow(bool bit) {
    output_stream_->write_bit(bit);

    // Output opposite bits for underflow handling
    while (bits_to_follow_ > 0) {
        output_stream_->write_bit(!bit);
        bits_to_follow_--;
    }
}

bool RangeCoder::next_bit() {
    try {
        return input_stream_->read_bit();
    } catch (const OutOfDataError&) {
        decoding_ = false;
        throw CorruptStreamError("range decode: stream ended at bit " +
                                 std::to_string(input_stream_->bits_consumed()));
    }
}

void RangeCoder::narrow(uint64_t cum_low, uint64_t cum_high, uint64_t total) {
    uint64_t range = high_ - low_ + 1;
    high_ = low_ + (range * cum_high) / total - 1;
    low_ = low_ + (range * cum_low) / total;
}

void RangeCoder::check_model(const FrequencyModel& model) {
    if (model.total_count() == 0) {
        throw EmptyAlphabetError("range coder: model has no positive frequency");
    }
    if (!model.fits_precision(MAX_TOTAL)) {
        throw PrecisionOverflowError("range coder: model total " +
                                     std::to_string(model.total_count()) +
                                     " exceeds " + std::to_string(MAX_TOTAL));
    }
}
