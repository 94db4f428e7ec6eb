#include "entropy_codec.hpp"
#include "adaptive_model.hpp"
#include "bit_stream.hpp"
#include "codec_debug.hpp"
#include "codec_errors.hpp"
#include "frequency_model.hpp"
#include "huffman_coder.hpp"
#include "range_coder.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

// ============================================================================
//  Constructor
// ============================================================================

EntropyCodec::EntropyCodec(CodecConfig config) : config_(config) {
  if (config_.alphabet_size > CodecFormat::MAX_ALPHABET_SIZE) {
    throw std::invalid_argument("alphabet_size must be <= " +
                                std::to_string(CodecFormat::MAX_ALPHABET_SIZE));
  }
}

uint64_t EntropyCodec::adaptive_max_total(uint32_t alphabet_size) {
  // Leave headroom above the flat start so halving keeps some history
  return std::max<uint64_t>(AdaptiveModel::ADAPTIVE_MAX_TOTAL,
                            4 * static_cast<uint64_t>(alphabet_size));
}

// ============================================================================
//  ENCODE
// ============================================================================

std::vector<uint8_t> EntropyCodec::encode(const std::vector<uint32_t> &symbols) const {
  uint32_t alphabet_size = config_.alphabet_size;
  if (alphabet_size == 0 && !symbols.empty()) {
    uint32_t max_symbol = *std::max_element(symbols.begin(), symbols.end());
    if (max_symbol >= CodecFormat::MAX_ALPHABET_SIZE) {
      throw UnknownSymbolError("symbol " + std::to_string(max_symbol) +
                               " exceeds the largest supported alphabet");
    }
    alphabet_size = max_symbol + 1;
  }

  // 1. Count (also rejects symbols outside a configured alphabet)
  FrequencyModel model = FrequencyModel::from_symbols(symbols, alphabet_size);

  CodecFormat::StreamHeader header;
  header.method = config_.method;
  header.alphabet_size = alphabet_size;
  header.symbol_count = symbols.size();

  std::vector<uint8_t> output;

  // 2. Empty input: header only, with absent-symbol metadata
  if (symbols.empty()) {
    header.code_lengths.assign(alphabet_size, 0);
    header.frequencies.assign(alphabet_size, 0);
    CodecFormat::write_header(output, header);
    return output;
  }

  // 3. Build the table, write the header, then append the payload to the
  // same buffer through a BitOutputStream.
  switch (config_.method) {
  case CoderMethod::HUFFMAN: {
    CodeTable table = HuffmanCoder::build(model);
    header.code_lengths = table.code_lengths();
    CodecFormat::write_header(output, header);

    BitOutputStream bit_stream(output);
    HuffmanCoder::encode(symbols, table, bit_stream);
    bit_stream.flush();
    break;
  }
  case CoderMethod::RANGE_STATIC: {
    model.rescale(RangeCoder::MAX_TOTAL);
    header.frequencies.reserve(alphabet_size);
    for (uint64_t f : model.counts()) {
      header.frequencies.push_back(static_cast<uint32_t>(f));
    }
    CodecFormat::write_header(output, header);

    BitOutputStream bit_stream(output);
    RangeCoder coder;
    coder.encode(symbols, model, bit_stream);
    break;
  }
  case CoderMethod::RANGE_ADAPTIVE: {
    CodecFormat::write_header(output, header);

    AdaptiveModel adaptive(alphabet_size, adaptive_max_total(alphabet_size));
    BitOutputStream bit_stream(output);
    RangeCoder coder;
    coder.encode_adaptive(symbols, adaptive, bit_stream);
    break;
  }
  }

  ENTROPY_DEBUG_LOG("encode: " << symbols.size() << " symbols, alphabet "
                    << alphabet_size << ", method "
                    << static_cast<int>(config_.method) << " -> "
                    << output.size() << " bytes");
  return output;
}

// ============================================================================
//  DECODE
// ============================================================================

std::vector<uint32_t> EntropyCodec::decode(const std::vector<uint8_t> &data) const {
  size_t payload_offset = 0;
  CodecFormat::StreamHeader header = CodecFormat::read_header(data, payload_offset);
  if (config_.max_symbols != 0 && header.symbol_count > config_.max_symbols) {
    throw CorruptStreamError("stream declares " + std::to_string(header.symbol_count) +
                             " symbols, limit is " +
                             std::to_string(config_.max_symbols));
  }

  BitInputStream bit_stream(data.data() + payload_offset, data.size() - payload_offset);

  std::vector<uint32_t> symbols;
  if (header.symbol_count > 0) {
    switch (header.method) {
    case CoderMethod::HUFFMAN: {
      bool any_code = std::any_of(header.code_lengths.begin(), header.code_lengths.end(),
                                  [](uint8_t len) { return len > 0; });
      if (!any_code) {
        throw CorruptStreamError("huffman stream has symbols but no codes");
      }
      // Every code takes at least one bit
      if (header.symbol_count > bit_stream.bits_remaining()) {
        throw CorruptStreamError("stream declares " + std::to_string(header.symbol_count) +
                                 " symbols but carries only " +
                                 std::to_string(bit_stream.bits_remaining()) + " bits");
      }
      CodeTable table = HuffmanCoder::from_code_lengths(header.code_lengths);
      symbols = HuffmanCoder::decode(bit_stream, table, header.symbol_count);
      break;
    }
    case CoderMethod::RANGE_STATIC: {
      std::vector<int64_t> counts(header.frequencies.begin(), header.frequencies.end());
      bool any_count = std::any_of(counts.begin(), counts.end(),
                                   [](int64_t c) { return c > 0; });
      if (!any_count) {
        throw CorruptStreamError("range stream has symbols but no frequencies");
      }
      FrequencyModel model = FrequencyModel::from_table(counts);
      if (!model.fits_precision(RangeCoder::MAX_TOTAL)) {
        throw CorruptStreamError("stream frequency total " +
                                 std::to_string(model.total_count()) +
                                 " exceeds the coder precision");
      }
      RangeCoder coder;
      symbols = coder.decode(bit_stream, model, header.symbol_count);
      break;
    }
    case CoderMethod::RANGE_ADAPTIVE: {
      AdaptiveModel adaptive(header.alphabet_size,
                             adaptive_max_total(header.alphabet_size));
      RangeCoder coder;
      symbols = coder.decode_adaptive(bit_stream, adaptive, header.symbol_count);
      break;
    }
    }
  }

  // Only the zero padding of the last byte may remain
  if (bit_stream.bits_remaining() >= 8) {
    throw CorruptStreamError(std::to_string(bit_stream.bits_remaining() / 8) +
                             " unexpected trailing bytes after payload");
  }

  ENTROPY_DEBUG_LOG("decode: " << data.size() << " bytes -> " << symbols.size()
                    << " symbols");
  return symbols;
}
