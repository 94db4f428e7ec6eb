#ifndef FREQUENCY_MODEL_HPP
#define FREQUENCY_MODEL_HPP

/**
 * @file frequency_model.hpp
 * @brief Symbol frequency table with cumulative-frequency lookups
 *
 * A FrequencyModel holds one non-negative count per symbol of a fixed
 * alphabet [0, alphabet_size). It is the input of the Huffman table builder
 * and the probability source of the range coder, which needs the forward
 * cumulative frequency of every symbol and the inverse mapping from a
 * cumulative value back to a symbol.
 *
 * Cumulative counts live in a Fenwick (binary indexed) tree, so
 * cumulative_before, symbol_at_cumulative and increment are all O(log n).
 * An adaptive coder can then update the model once per symbol at a cost
 * independent of the alphabet size. halve() rebuilds the tree in O(n).
 */

#include <vector>
#include <cstddef>
#include <cstdint>

class FrequencyModel {
public:
    /**
     * Count symbols in one pass.
     *
     * @param symbols Input sequence
     * @param alphabet_size Alphabet size; 0 derives it as max(symbol) + 1
     * @throw UnknownSymbolError If a symbol is outside the given alphabet
     */
    static FrequencyModel from_symbols(const std::vector<uint32_t>& symbols,
                                       uint32_t alphabet_size = 0);

    /**
     * Accept externally supplied counts, indexed by symbol.
     *
     * @throw std::invalid_argument If a count is negative
     * @throw EmptyAlphabetError If no count is positive
     */
    static FrequencyModel from_table(const std::vector<int64_t>& counts);

    /**
     * Constructor for an all-zero model.
     *
     * @param alphabet_size Number of symbols in the alphabet
     */
    explicit FrequencyModel(uint32_t alphabet_size = 0);

    uint32_t alphabet_size() const { return static_cast<uint32_t>(freq_.size()); }
    uint64_t total_count() const { return total_; }

    /// Number of symbols with a positive count.
    uint32_t num_present() const;

    uint64_t frequency(uint32_t symbol) const;

    /// frequency(symbol) / total_count(), 0.0 for an empty model.
    double probability_of(uint32_t symbol) const;

    /// Sum of the counts of all symbols below `symbol`.
    uint64_t cumulative_before(uint32_t symbol) const;

    /**
     * Inverse of cumulative_before.
     *
     * @param value Cumulative value in [0, total_count())
     * @return The symbol s with cumulative_before(s) <= value <
     *         cumulative_before(s) + frequency(s)
     * @throw CorruptStreamError If value is outside [0, total_count())
     */
    uint32_t symbol_at_cumulative(uint64_t value) const;

    const std::vector<uint64_t>& counts() const { return freq_; }

    /// Add one occurrence of a symbol.
    void increment(uint32_t symbol);

    /**
     * Halve every count, rounding up so that present symbols stay present.
     */
    void halve();

    /**
     * Halve until total_count() <= max_total.
     *
     * @throw PrecisionOverflowError If max_total is below num_present()
     */
    void rescale(uint64_t max_total);

    bool fits_precision(uint64_t max_total) const { return total_count() <= max_total; }

private:
    std::vector<uint64_t> freq_;  // Symbol frequencies
    std::vector<uint64_t> tree_;  // Fenwick tree over freq_, 1-based, size n + 1
    uint64_t total_;
    uint32_t top_bit_;            // Largest power of two <= alphabet_size, 0 if empty

    void check_symbol(uint32_t symbol) const;
    void rebuild_cumulative();
};

#endif // FREQUENCY_MODEL_HPP
