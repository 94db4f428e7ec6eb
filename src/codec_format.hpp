#ifndef CODEC_FORMAT_HPP
#define CODEC_FORMAT_HPP

/**
 * @file codec_format.hpp
 * @brief Serialized stream format of EntropyCodec
 *
 * A stream is a fixed-size header, per-symbol metadata and the coded payload.
 * All integers are little-endian.
 *
 * Stream structure:
 * - magic          u32   CodecFormat::MAGIC
 * - version        u8    CodecFormat::VERSION
 * - method         u8    CoderMethod
 * - alphabet_size  u32   0 only for an empty stream
 * - symbol_count   u64   number of symbols to decode
 * - metadata             HUFFMAN:        alphabet_size x u8 code length (0 = absent)
 *                        RANGE_STATIC:   alphabet_size x u32 frequency
 *                        RANGE_ADAPTIVE: nothing (the model starts flat)
 * - payload              MSB-first bitstream, last byte zero-padded
 *
 * Callers that need their own framing use HuffmanCoder and RangeCoder
 * directly.
 */

#include <cstdint>
#include <cstddef>
#include <vector>

enum class CoderMethod : uint8_t {
    HUFFMAN = 0,
    RANGE_STATIC = 1,
    RANGE_ADAPTIVE = 2
};

namespace CodecFormat {
    // Magic number: "ENT\0"
    static constexpr uint32_t MAGIC = 0x454E5400;

    // Stream format version
    static constexpr uint8_t VERSION = 1;

    // Size of the fixed part of the header in bytes
    static constexpr size_t FIXED_HEADER_SIZE = 4 + 1 + 1 + 4 + 8;

    // Largest alphabet a stream may declare
    static constexpr uint32_t MAX_ALPHABET_SIZE = 1u << 20;

    /**
     * @brief Decoded header and metadata of a stream.
     *
     * Only the metadata vector matching `method` is used.
     */
    struct StreamHeader {
        CoderMethod method = CoderMethod::HUFFMAN;
        uint32_t alphabet_size = 0;
        uint64_t symbol_count = 0;
        std::vector<uint8_t> code_lengths;   // HUFFMAN
        std::vector<uint32_t> frequencies;   // RANGE_STATIC
    };

    /// Bytes taken by the header plus metadata.
    size_t header_size(const StreamHeader& header);

    /**
     * Append the header and metadata to `out`.
     *
     * @throw std::invalid_argument If the metadata size does not match
     *        alphabet_size
     */
    void write_header(std::vector<uint8_t>& out, const StreamHeader& header);

    /**
     * Parse the header and metadata at the start of `data`.
     *
     * @param payload_offset Set to the index of the first payload byte
     * @throw CorruptStreamError On a short buffer, bad magic or version,
     *        unknown method or out-of-range alphabet size
     */
    StreamHeader read_header(const std::vector<uint8_t>& data, size_t& payload_offset);
}

#endif // CODEC_FORMAT_HPP
