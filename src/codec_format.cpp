#include "codec_format.hpp"
#include "codec_errors.hpp"
#include <stdexcept>
#include <string>

namespace {

class ByteWriter {
public:
    explicit ByteWriter(std::vector<uint8_t>& out) : buf_(out) {}

    void write_u8(uint8_t v) { buf_.push_back(v); }
    void write_u32_le(uint32_t v) {
        for (int i = 0; i < 4; i++) {
            buf_.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
        }
    }
    void write_u64_le(uint64_t v) {
        write_u32_le(static_cast<uint32_t>(v & 0xFFFFFFFFu));
        write_u32_le(static_cast<uint32_t>(v >> 32));
    }

private:
    std::vector<uint8_t>& buf_;
};

class ByteReader {
public:
    explicit ByteReader(const std::vector<uint8_t>& data) : buf_(data) {}

    uint8_t read_u8() {
        need(1);
        return buf_[pos_++];
    }
    uint32_t read_u32_le() {
        need(4);
        uint32_t v = 0;
        for (int i = 0; i < 4; i++) {
            v |= static_cast<uint32_t>(buf_[pos_++]) << (8 * i);
        }
        return v;
    }
    uint64_t read_u64_le() {
        uint64_t lo = read_u32_le();
        uint64_t hi = read_u32_le();
        return lo | (hi << 32);
    }
    size_t position() const { return pos_; }

private:
    void need(size_t n) {
        if (buf_.size() - pos_ < n) {
            throw CorruptStreamError("stream header truncated at byte " + std::to_string(pos_));
        }
    }
    const std::vector<uint8_t>& buf_;
    size_t pos_ = 0;
};

} // namespace

namespace CodecFormat {

size_t header_size(const StreamHeader& header) {
    switch (header.method) {
    case CoderMethod::HUFFMAN:
        return FIXED_HEADER_SIZE + header.alphabet_size;
    case CoderMethod::RANGE_STATIC:
        return FIXED_HEADER_SIZE + static_cast<size_t>(header.alphabet_size) * 4;
    case CoderMethod::RANGE_ADAPTIVE:
        break;
    }
    return FIXED_HEADER_SIZE;
}

void write_header(std::vector<uint8_t>& out, const StreamHeader& header) {
    if (header.method == CoderMethod::HUFFMAN &&
        header.code_lengths.size() != header.alphabet_size) {
        throw std::invalid_argument("code_lengths size does not match alphabet_size");
    }
    if (header.method == CoderMethod::RANGE_STATIC &&
        header.frequencies.size() != header.alphabet_size) {
        throw std::invalid_argument("frequencies size does not match alphabet_size");
    }

    out.reserve(out.size() + header_size(header));
    ByteWriter w(out);
    w.write_u32_le(MAGIC);
    w.write_u8(VERSION);
    w.write_u8(static_cast<uint8_t>(header.method));
    w.write_u32_le(header.alphabet_size);
    w.write_u64_le(header.symbol_count);

    if (header.method == CoderMethod::HUFFMAN) {
        for (uint8_t len : header.code_lengths) w.write_u8(len);
    } else if (header.method == CoderMethod::RANGE_STATIC) {
        for (uint32_t f : header.frequencies) w.write_u32_le(f);
    }
}

StreamHeader read_header(const std::vector<uint8_t>& data, size_t& payload_offset) {
    ByteReader r(data);

    uint32_t magic = r.read_u32_le();
    if (magic != MAGIC) {
        throw CorruptStreamError("bad stream magic");
    }
    uint8_t version = r.read_u8();
    if (version != VERSION) {
        throw CorruptStreamError("unsupported stream version " + std::to_string(version));
    }
    uint8_t method = r.read_u8();
    if (method > static_cast<uint8_t>(CoderMethod::RANGE_ADAPTIVE)) {
        throw CorruptStreamError("unknown coder method " + std::to_string(method));
    }

    StreamHeader header;
    header.method = static_cast<CoderMethod>(method);
    header.alphabet_size = r.read_u32_le();
    header.symbol_count = r.read_u64_le();

    if (header.alphabet_size > MAX_ALPHABET_SIZE) {
        throw CorruptStreamError("alphabet size " + std::to_string(header.alphabet_size) +
                                 " exceeds " + std::to_string(MAX_ALPHABET_SIZE));
    }
    if (header.alphabet_size == 0 && header.symbol_count > 0) {
        throw CorruptStreamError("non-empty stream declares an empty alphabet");
    }

    if (data.size() - r.position() < header_size(header) - FIXED_HEADER_SIZE) {
        throw CorruptStreamError("stream metadata truncated: " +
                                 std::to_string(header.alphabet_size) + " symbols declared");
    }

    if (header.method == CoderMethod::HUFFMAN) {
        header.code_lengths.resize(header.alphabet_size);
        for (uint32_t s = 0; s < header.alphabet_size; s++) {
            header.code_lengths[s] = r.read_u8();
        }
    } else if (header.method == CoderMethod::RANGE_STATIC) {
        header.frequencies.resize(header.alphabet_size);
        for (uint32_t s = 0; s < header.alphabet_size; s++) {
            header.frequencies[s] = r.read_u32_le();
        }
    }

    payload_offset = r.position();
    return header;
}

} // namespace CodecFormat
