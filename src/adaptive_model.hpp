#ifndef ADAPTIVE_MODEL_HPP
#define ADAPTIVE_MODEL_HPP

/**
 * @file adaptive_model.hpp
 * @brief Adaptive probability model for range coding
 *
 * This implementation follows the adaptive source model from
 * Witten, I.H., Neal, R.M., & Cleary, J.G. (1987). "Arithmetic coding
 * for data compression." Communications of the ACM, 30(6), 520-540.
 *
 * The model starts with a flat distribution and counts symbols as they are
 * coded, so no frequency table has to be transmitted. Encoder and decoder each
 * own one model and must call update_model() after every symbol, in the same
 * order; the coded stream is only decodable under that lock-step protocol.
 *
 * @see Witten, Neal, & Cleary (1987) for the original adaptive model algorithm
 */

#include "frequency_model.hpp"
#include <cstdint>

/**
 * @brief Adaptive probability model for range coding
 *
 * Key features:
 * - All symbols start with frequency 1, so every symbol of the alphabet is
 *   always codable.
 * - Frequencies are halved when the total reaches max_total, which keeps the
 *   total inside the range coder's precision and weights recent symbols
 *   more heavily.
 */
class AdaptiveModel {
public:
    /// Default rescale threshold (2^16 - 1).
    static constexpr uint64_t ADAPTIVE_MAX_TOTAL = 65535;

    /**
     * Constructor.
     *
     * @param alphabet_size Number of symbols in the alphabet (at least 1)
     * @param max_total Total frequency that triggers halving, in
     *        (alphabet_size, RangeCoder::MAX_TOTAL]
     * @throw std::invalid_argument If alphabet_size is 0 or max_total is
     *        outside that range
     */
    explicit AdaptiveModel(uint32_t alphabet_size,
                           uint64_t max_total = ADAPTIVE_MAX_TOTAL);

    /**
     * Initialize the model with flat probabilities.
     * All symbols start with frequency 1.
     */
    void start_model();

    /**
     * Update the model after encoding/decoding a symbol.
     *
     * Halves all frequencies first if the total has reached max_total, then
     * increments the symbol's frequency.
     *
     * @param symbol Symbol to update (0 to alphabet_size-1)
     * @throw UnknownSymbolError If the symbol is outside the alphabet
     */
    void update_model(uint32_t symbol);

    /**
     * Current frequencies, as consumed by RangeCoder::encode_symbol and
     * RangeCoder::decode_symbol.
     */
    const FrequencyModel& frequencies() const { return model_; }

    uint32_t alphabet_size() const { return model_.alphabet_size(); }
    uint64_t max_total() const { return max_total_; }
    uint64_t get_frequency(uint32_t symbol) const { return model_.frequency(symbol); }

    /**
     * Reset the model to initial state.
     */
    void reset();

private:
    FrequencyModel model_;
    uint64_t max_total_;
};

#endif // ADAPTIVE_MODEL_HPP
