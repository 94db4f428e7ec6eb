#ifndef HUFFMAN_CODER_HPP
#define HUFFMAN_CODER_HPP

/**
 * @file huffman_coder.hpp
 * @brief Canonical Huffman coding
 *
 * Code lengths come from the classic greedy construction (Huffman, 1952):
 * the two lowest-weight nodes are merged until a single root remains, and the
 * depth of each leaf is its code length. Codes are then assigned canonically,
 * so that the list of code lengths alone is enough to rebuild the table on the
 * decoding side.
 *
 * Tie-breaking rule: nodes live in an index-addressed arena. Leaves are added
 * in ascending symbol order and merged nodes are appended after them; among
 * nodes of equal weight the one with the lower arena index is taken first.
 *
 * Canonical rule: symbols are sorted by (length, symbol). The first gets code
 * 0, and each following symbol gets
 *     code = (previous_code + 1) << (length - previous_length).
 * Codes are written MSB first.
 */

#include "bit_stream.hpp"
#include "frequency_model.hpp"
#include <cstdint>
#include <vector>

/**
 * @brief Per-symbol canonical codes plus the decode tree derived from them.
 */
struct CodeTable {
    struct Entry {
        uint32_t code{0};
        uint8_t length{0};  // 0 = symbol absent from the table
    };
    struct DecodeNode {
        int left{-1};
        int right{-1};
        int symbol{-1};
    };

    std::vector<Entry> entries;          // indexed by symbol
    std::vector<DecodeNode> decode_nodes; // node 0 is the root

    uint32_t alphabet_size() const { return static_cast<uint32_t>(entries.size()); }
    bool contains(uint32_t symbol) const;

    /// Code lengths indexed by symbol, the only data a decoder needs.
    std::vector<uint8_t> code_lengths() const;

    /// Sum of 2^-length over present symbols; 1.0 for a complete code.
    double kraft_sum() const;

    /// True if no code is a bit-prefix of another.
    bool is_prefix_free() const;

    /// Bits needed to code every occurrence counted in the model.
    uint64_t encoded_bit_length(const FrequencyModel& model) const;
};

class HuffmanCoder {
public:
    /// Longest code the bit stream can write in one call.
    static constexpr int MAX_CODE_LENGTH = 32;

    /**
     * Build a canonical code table from symbol frequencies.
     *
     * A single present symbol gets a 1-bit code. Zero-count symbols get no
     * code.
     *
     * @throw EmptyAlphabetError If no symbol has a positive frequency
     */
    static CodeTable build(const FrequencyModel& model);

    /**
     * Rebuild a table from code lengths only (0 = absent).
     *
     * @throw CorruptStreamError If a length exceeds MAX_CODE_LENGTH or the
     *        lengths are over-subscribed (Kraft sum above 1)
     * @throw EmptyAlphabetError If every length is 0
     */
    static CodeTable from_code_lengths(const std::vector<uint8_t>& lengths);

    /**
     * Huffman code lengths for the given weights, before canonical assignment.
     */
    static std::vector<uint8_t> compute_code_lengths(const std::vector<uint64_t>& weights);

    /**
     * Write the code of every symbol, in sequence order.
     *
     * @throw UnknownSymbolError If a symbol has no code in the table
     */
    static void encode(const std::vector<uint32_t>& symbols, const CodeTable& table,
                       BitOutputStream& stream);

    /**
     * Encode into a fresh, zero-padded byte vector.
     */
    static std::vector<uint8_t> encode(const std::vector<uint32_t>& symbols,
                                       const CodeTable& table);

    /**
     * Read exactly symbol_count symbols.
     *
     * @throw CorruptStreamError If the bits run out first or a bit sequence
     *        matches no code
     */
    static std::vector<uint32_t> decode(BitInputStream& stream, const CodeTable& table,
                                        uint64_t symbol_count);

    static std::vector<uint32_t> decode(const std::vector<uint8_t>& bits,
                                        const CodeTable& table,
                                        uint64_t symbol_count);
};

#endif // HUFFMAN_CODER_HPP
