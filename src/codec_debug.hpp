#ifndef CODEC_DEBUG_HPP
#define CODEC_DEBUG_HPP

/**
 * @file codec_debug.hpp
 * @brief Trace output for the entropy coders
 *
 * Compiled in only when ENTROPY_DEBUG is defined; the ENTROPY_CODERS_DEBUG
 * CMake option sets it for the whole library. Trace points:
 * - HuffmanCoder::build: weight halving while the tree is too deep, and the
 *   final table size and longest code.
 * - RangeCoder::done_encoding: bits written by the finished session.
 * - EntropyCodec::encode / decode: symbol count, alphabet, method and the
 *   resulting stream size.
 */

#ifdef ENTROPY_DEBUG
#include <iostream>
#include <sstream>

/// Usage: ENTROPY_DEBUG_LOG("huffman: built table for " << n << " symbols");
#define ENTROPY_DEBUG_LOG(msg) do { \
    std::ostringstream _oss; \
    _oss << "[ENTROPY_DEBUG] " << msg; \
    std::cerr << _oss.str() << std::endl; \
} while(0)

#else
#define ENTROPY_DEBUG_LOG(msg) ((void)0)
#endif

#endif // CODEC_DEBUG_HPP
