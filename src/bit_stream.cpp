/**
 * @file bit_stream.cpp
 * @brief Implementation of memory-based Bit Stream utilities.
 */

 #include "bit_stream.hpp"
 #include "codec_errors.hpp"
 #include <string>

 // ============================================================================
 //  BitOutputStream Implementation
 // ============================================================================

 BitOutputStream::BitOutputStream(std::vector<uint8_t>& target_buffer)
     : buffer_(target_buffer), pending_byte_(0), bits_in_pending_(0),
       bits_written_(0) {
 }

 BitOutputStream::~BitOutputStream() {
     flush();
 }

 void BitOutputStream::write_bit(bool bit) {
     // MSB first: the first bit of a byte lands in position 7
     if (bit) {
         pending_byte_ |= static_cast<uint8_t>(1 << (7 - bits_in_pending_));
     }

     bits_in_pending_++;
     bits_written_++;

     if (bits_in_pending_ == 8) {
         buffer_.push_back(pending_byte_);
         pending_byte_ = 0;
         bits_in_pending_ = 0;
     }
 }

 void BitOutputStream::write_bits(uint32_t value, int num_bits) {
     if (num_bits < 1 || num_bits > 32) {
         throw std::invalid_argument("num_bits must be between 1 and 32");
     }

     for (int i = num_bits - 1; i >= 0; i--) {
         write_bit(((value >> i) & 1U) != 0);
     }
 }

 void BitOutputStream::flush() {
     // The unused low bits of pending_byte_ are already zero
     if (bits_in_pending_ > 0) {
         buffer_.push_back(pending_byte_);
         pending_byte_ = 0;
         bits_in_pending_ = 0;
     }
 }

 // ============================================================================
 //  BitInputStream Implementation
 // ============================================================================

 BitInputStream::BitInputStream(const std::vector<uint8_t>& source_buffer)
     : data_(source_buffer.data()), size_(source_buffer.size()),
       byte_pos_(0), bits_consumed_in_byte_(0) {
 }

 BitInputStream::BitInputStream(const uint8_t* data, size_t size)
     : data_(data), size_(size), byte_pos_(0), bits_consumed_in_byte_(0) {
 }

 bool BitInputStream::read_bit() {
     if (byte_pos_ >= size_) {
         throw OutOfDataError("BitInputStream: read past end of " +
                              std::to_string(size_) + "-byte buffer");
     }

     uint8_t current_byte = data_[byte_pos_];
     bool bit = ((current_byte >> (7 - bits_consumed_in_byte_)) & 1) != 0;

     bits_consumed_in_byte_++;

     if (bits_consumed_in_byte_ == 8) {
         byte_pos_++;
         bits_consumed_in_byte_ = 0;
     }

     return bit;
 }

 uint32_t BitInputStream::read_bits(int num_bits) {
     if (num_bits < 1 || num_bits > 32) {
         throw std::invalid_argument("num_bits must be between 1 and 32");
     }
     if (bits_remaining() < static_cast<uint64_t>(num_bits)) {
         throw OutOfDataError("BitInputStream: " + std::to_string(num_bits) +
                              " bits requested, " +
                              std::to_string(bits_remaining()) + " available");
     }

     uint32_t value = 0;
     for (int i = num_bits - 1; i >= 0; i--) {
         value |= (read_bit() ? 1U : 0U) << i;
     }
     return value;
 }

 bool BitInputStream::eof() const {
     return byte_pos_ >= size_;
 }

 uint64_t BitInputStream::bits_consumed() const {
     return static_cast<uint64_t>(byte_pos_) * 8 + bits_consumed_in_byte_;
 }

 uint64_t BitInputStream::bits_remaining() const {
     return static_cast<uint64_t>(size_) * 8 - bits_consumed();
 }
