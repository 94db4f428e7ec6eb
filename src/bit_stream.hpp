#ifndef BIT_STREAM_HPP
#define BIT_STREAM_HPP

/**
 * @file bit_stream.hpp
 * @brief Memory-based Bit Stream utilities for the entropy coders.
 * * This file defines the BitOutputStream and BitInputStream classes, which
 * facilitate writing and reading individual bits to and from underlying
 * byte vectors (std::vector<uint8_t>). Both the Huffman and the range coder
 * produce and consume their payloads through these classes.
 * * Key Features:
 * - Zero-Copy Architecture: operates on references to existing vectors.
 * - MSB First: Bits are packed from Most Significant Bit to Least Significant Bit.
 * - The final partial byte is padded with zero bits at its LSB end.
 * - Exceptions: Throws OutOfDataError on buffer underflow and
 *   std::invalid_argument on bad bit widths.
 */

#include <vector>
#include <cstddef>
#include <cstdint>
#include <stdexcept>

/**
 * @brief Writes bits to a dynamically growing memory buffer.
 * * The BitOutputStream allows writing single bits or multi-bit integers
 * into a std::vector<uint8_t>. It handles the buffering of partial bytes
 * internally.
 */
class BitOutputStream {
public:
    /**
     * @brief Construct a new Bit Output Stream object.
     * * @param target_buffer Reference to the output vector. The vector is NOT cleared
     * on construction; bits are appended to existing content.
     * The caller retains ownership of this vector.
     */
    explicit BitOutputStream(std::vector<uint8_t>& target_buffer);

    /**
     * @brief Destroy the Bit Output Stream object.
     * * Automatically calls flush() to ensure any remaining partial bits
     * are written to the buffer.
     */
    ~BitOutputStream();

    BitOutputStream(const BitOutputStream&) = delete;
    BitOutputStream& operator=(const BitOutputStream&) = delete;

    /**
     * @brief Write a single bit to the stream.
     * * @param bit The bit to write (true = 1, false = 0).
     */
    void write_bit(bool bit);

    /**
     * @brief Write the low bits of an integer, MSB first.
     * * @param value The integer value containing the bits to write.
     * @param num_bits The number of bits to write (1 to 32).
     * @throw std::invalid_argument If num_bits is not between 1 and 32.
     */
    void write_bits(uint32_t value, int num_bits);

    /**
     * @brief Flushes any pending bits to the output vector.
     * * A partial byte is padded with zeros at the LSB end. Further writes
     * start a new byte.
     */
    void flush();

    /**
     * @brief Number of bits written through this stream, padding excluded.
     */
    uint64_t bits_written() const { return bits_written_; }

private:
    std::vector<uint8_t>& buffer_; ///< Reference to the user-owned output vector.
    uint8_t pending_byte_;         ///< Accumulator for bits currently being built.
    int bits_in_pending_;          ///< Count of bits currently in the accumulator (0-7).
    uint64_t bits_written_;        ///< Total payload bits written.
};

/**
 * @brief Reads bits from a read-only memory buffer.
 * * The BitInputStream allows reading single bits or multi-bit integers
 * from a byte buffer, in the same order BitOutputStream writes them. Reading
 * past the end throws OutOfDataError; decoders translate that into
 * CorruptStreamError when they know how many symbols were expected.
 */
class BitInputStream {
public:
    /**
     * @brief Construct a new Bit Input Stream over a whole vector.
     * * @param source_buffer Reference to the input vector containing compressed data.
     */
    explicit BitInputStream(const std::vector<uint8_t>& source_buffer);

    /**
     * @brief Construct a Bit Input Stream over a raw byte range.
     * * The range must outlive the stream. Used by the codec facade to read a
     * payload in place after its header.
     */
    BitInputStream(const uint8_t* data, size_t size);

    /**
     * @brief Read a single bit from the stream.
     * * @return true if the bit is 1.
     * @return false if the bit is 0.
     * @throw OutOfDataError If attempting to read past the end of the buffer.
     */
    bool read_bit();

    /**
     * @brief Read multiple bits to form an integer.
     * * Bits are read and reconstructed MSB first.
     * * @param num_bits The number of bits to read (1 to 32).
     * @return uint32_t The constructed integer value.
     * @throw std::invalid_argument If num_bits is not between 1 and 32.
     * @throw OutOfDataError If fewer than num_bits bits remain.
     */
    uint32_t read_bits(int num_bits);

    /**
     * @brief Check if the end of the stream has been reached.
     * * @return true If no more bytes are available in the buffer.
     */
    bool eof() const;

    /// Bits read so far.
    uint64_t bits_consumed() const;

    /// Bits still available, including any zero padding in the last byte.
    uint64_t bits_remaining() const;

private:
    const uint8_t* data_;                ///< Start of the input data.
    size_t size_;                        ///< Number of bytes available.
    size_t byte_pos_;                    ///< Current index in the byte range.
    int bits_consumed_in_byte_;          ///< Current bit index (0-7) within the current byte.
};

#endif // BIT_STREAM_HPP
