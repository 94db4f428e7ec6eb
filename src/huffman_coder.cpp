#include "huffman_coder.hpp"
#include "codec_debug.hpp"
#include "codec_errors.hpp"
#include <algorithm>
#include <queue>
#include <string>
#include <utility>

namespace {

// Construction-only tree node. Children are arena indices, -1 for a leaf.
struct HuffmanNode {
    uint64_t weight;
    int left;
    int right;
    uint32_t symbol;
};

// Orders arena indices for a min-heap on (weight, index).
struct NodeOrder {
    const std::vector<HuffmanNode>* nodes;

    bool operator()(int a, int b) const {
        const HuffmanNode& na = (*nodes)[a];
        const HuffmanNode& nb = (*nodes)[b];
        if (na.weight != nb.weight) return na.weight > nb.weight;
        return a > b;
    }
};

struct CanonEntry {
    uint32_t symbol;
    uint8_t length;
};

uint8_t max_length(const std::vector<uint8_t>& lengths) {
    uint8_t m = 0;
    for (uint8_t len : lengths) m = std::max(m, len);
    return m;
}

// Insert one code into the decode tree, creating nodes along its path.
void insert_code(CodeTable& table, uint32_t symbol, uint32_t code, uint8_t length) {
    int node_idx = 0;
    for (int i = length - 1; i >= 0; --i) {
        if (table.decode_nodes[node_idx].symbol != -1) {
            throw CorruptStreamError("huffman: code for symbol " + std::to_string(symbol) +
                                     " extends another code");
        }
        bool bit = ((code >> i) & 1U) != 0;
        int next = bit ? table.decode_nodes[node_idx].right : table.decode_nodes[node_idx].left;
        if (next == -1) {
            next = static_cast<int>(table.decode_nodes.size());
            table.decode_nodes.push_back({});
            if (bit) table.decode_nodes[node_idx].right = next;
            else table.decode_nodes[node_idx].left = next;
        }
        node_idx = next;
    }
    const CodeTable::DecodeNode& leaf = table.decode_nodes[node_idx];
    if (leaf.symbol != -1 || leaf.left != -1 || leaf.right != -1) {
        throw CorruptStreamError("huffman: duplicate code assignment for symbol " +
                                 std::to_string(symbol));
    }
    table.decode_nodes[node_idx].symbol = static_cast<int>(symbol);
}

} // namespace

// ============================================================================
//  CodeTable
// ============================================================================

bool CodeTable::contains(uint32_t symbol) const {
    return symbol < entries.size() && entries[symbol].length > 0;
}

std::vector<uint8_t> CodeTable::code_lengths() const {
    std::vector<uint8_t> lengths(entries.size(), 0);
    for (size_t i = 0; i < entries.size(); i++) {
        lengths[i] = entries[i].length;
    }
    return lengths;
}

double CodeTable::kraft_sum() const {
    double sum = 0.0;
    for (const Entry& e : entries) {
        if (e.length > 0) {
            sum += 1.0 / static_cast<double>(uint64_t{1} << e.length);
        }
    }
    return sum;
}

bool CodeTable::is_prefix_free() const {
    // In lexicographic order a code is followed directly by any code it
    // prefixes, so checking neighbours is enough.
    std::vector<Entry> present;
    for (const Entry& e : entries) {
        if (e.length > 0) present.push_back(e);
    }
    auto padded = [](const Entry& e) {
        return static_cast<uint64_t>(e.code) << (HuffmanCoder::MAX_CODE_LENGTH - e.length);
    };
    std::sort(present.begin(), present.end(), [&](const Entry& a, const Entry& b) {
        if (padded(a) != padded(b)) return padded(a) < padded(b);
        return a.length < b.length;
    });
    for (size_t i = 1; i < present.size(); i++) {
        const Entry& a = present[i - 1];
        const Entry& b = present[i];
        if (a.length <= b.length && (b.code >> (b.length - a.length)) == a.code) {
            return false;
        }
    }
    return true;
}

uint64_t CodeTable::encoded_bit_length(const FrequencyModel& model) const {
    uint64_t bits = 0;
    for (uint32_t s = 0; s < model.alphabet_size(); s++) {
        uint64_t f = model.frequency(s);
        if (f == 0) continue;
        if (!contains(s)) {
            throw UnknownSymbolError("huffman: symbol " + std::to_string(s) +
                                     " has no code");
        }
        bits += f * entries[s].length;
    }
    return bits;
}

// ============================================================================
//  Table construction
// ============================================================================

std::vector<uint8_t> HuffmanCoder::compute_code_lengths(const std::vector<uint64_t>& weights) {
    std::vector<uint8_t> lengths(weights.size(), 0);

    std::vector<HuffmanNode> nodes;
    nodes.reserve(weights.size() * 2);
    for (uint32_t s = 0; s < weights.size(); s++) {
        if (weights[s] > 0) {
            nodes.push_back({weights[s], -1, -1, s});
        }
    }
    if (nodes.empty()) {
        throw EmptyAlphabetError("huffman: no symbol has a positive frequency");
    }
    if (nodes.size() == 1) {
        // A zero-length code could not be read back
        lengths[nodes[0].symbol] = 1;
        return lengths;
    }

    std::priority_queue<int, std::vector<int>, NodeOrder> pq(NodeOrder{&nodes});
    for (int i = 0; i < static_cast<int>(nodes.size()); i++) {
        pq.push(i);
    }

    while (pq.size() > 1) {
        int a = pq.top(); pq.pop();
        int b = pq.top(); pq.pop();
        // NodeOrder holds a pointer to the arena, so growing it is safe
        nodes.push_back({nodes[a].weight + nodes[b].weight, a, b, 0});
        pq.push(static_cast<int>(nodes.size()) - 1);
    }

    // Children always precede their parent, so one backward sweep from the
    // root assigns every depth.
    std::vector<int> depth(nodes.size(), 0);
    for (int i = static_cast<int>(nodes.size()) - 1; i >= 0; --i) {
        const HuffmanNode& n = nodes[i];
        if (n.left == -1) {
            lengths[n.symbol] = static_cast<uint8_t>(std::min(depth[i], 255));
        } else {
            depth[n.left] = depth[i] + 1;
            depth[n.right] = depth[i] + 1;
        }
    }
    return lengths;
}

CodeTable HuffmanCoder::build(const FrequencyModel& model) {
    std::vector<uint64_t> weights = model.counts();
    std::vector<uint8_t> lengths = compute_code_lengths(weights);

    // Flatten the weights until the deepest leaf fits a 32-bit code.
    while (max_length(lengths) > MAX_CODE_LENGTH) {
        ENTROPY_DEBUG_LOG("huffman: max code length " << int(max_length(lengths))
                          << " too long, halving weights");
        for (uint64_t& w : weights) {
            w = (w + 1) / 2;
        }
        lengths = compute_code_lengths(weights);
    }

    CodeTable table = from_code_lengths(lengths);
    ENTROPY_DEBUG_LOG("huffman: built table for " << model.num_present()
                      << " symbols, max length " << int(max_length(lengths)));
    return table;
}

CodeTable HuffmanCoder::from_code_lengths(const std::vector<uint8_t>& lengths) {
    std::vector<CanonEntry> sorted;
    uint64_t kraft = 0;  // in units of 2^-MAX_CODE_LENGTH
    for (uint32_t s = 0; s < lengths.size(); s++) {
        uint8_t len = lengths[s];
        if (len == 0) continue;
        if (len > MAX_CODE_LENGTH) {
            throw CorruptStreamError("huffman: code length " + std::to_string(len) +
                                     " for symbol " + std::to_string(s) +
                                     " exceeds " + std::to_string(MAX_CODE_LENGTH));
        }
        kraft += uint64_t{1} << (MAX_CODE_LENGTH - len);
        if (kraft > (uint64_t{1} << MAX_CODE_LENGTH)) {
            throw CorruptStreamError("huffman: code lengths are over-subscribed");
        }
        sorted.push_back({s, len});
    }
    if (sorted.empty()) {
        throw EmptyAlphabetError("huffman: every code length is zero");
    }

    // Sort for canonical assignment
    std::sort(sorted.begin(), sorted.end(), [](const CanonEntry& a, const CanonEntry& b) {
        if (a.length != b.length) return a.length < b.length;
        return a.symbol < b.symbol;
    });

    CodeTable table;
    table.entries.assign(lengths.size(), {});
    table.decode_nodes.push_back({}); // root

    uint64_t code = 0;
    uint8_t prev_len = sorted.front().length;
    for (size_t i = 0; i < sorted.size(); ++i) {
        const CanonEntry& ce = sorted[i];
        if (i > 0) {
            code = (code + 1) << (ce.length - prev_len);
            prev_len = ce.length;
        }
        table.entries[ce.symbol] = {static_cast<uint32_t>(code), ce.length};
        insert_code(table, ce.symbol, static_cast<uint32_t>(code), ce.length);
    }
    return table;
}

// ============================================================================
//  Encode / Decode
// ============================================================================

void HuffmanCoder::encode(const std::vector<uint32_t>& symbols, const CodeTable& table,
                          BitOutputStream& stream) {
    for (uint32_t s : symbols) {
        if (!table.contains(s)) {
            throw UnknownSymbolError("huffman encode: symbol " + std::to_string(s) +
                                     " not in table");
        }
        const CodeTable::Entry& e = table.entries[s];
        stream.write_bits(e.code, e.length);
    }
}

std::vector<uint8_t> HuffmanCoder::encode(const std::vector<uint32_t>& symbols,
                                          const CodeTable& table) {
    std::vector<uint8_t> bytes;
    BitOutputStream stream(bytes);
    encode(symbols, table, stream);
    stream.flush();
    return bytes;
}

std::vector<uint32_t> HuffmanCoder::decode(BitInputStream& stream, const CodeTable& table,
                                           uint64_t symbol_count) {
    std::vector<uint32_t> out;
    if (symbol_count == 0) {
        return out;
    }
    if (table.decode_nodes.empty()) {
        throw CorruptStreamError("huffman decode: empty code table");
    }
    // Every code is at least one bit long
    out.reserve(static_cast<size_t>(std::min<uint64_t>(symbol_count, stream.bits_remaining())));

    for (uint64_t n = 0; n < symbol_count; ++n) {
        int node = 0;
        while (table.decode_nodes[node].symbol == -1) {
            bool bit;
            try {
                bit = stream.read_bit();
            } catch (const OutOfDataError&) {
                throw CorruptStreamError("huffman decode: stream ended after " +
                                         std::to_string(n) + " of " +
                                         std::to_string(symbol_count) + " symbols");
            }
            const CodeTable::DecodeNode& nd = table.decode_nodes[node];
            node = bit ? nd.right : nd.left;
            if (node == -1) {
                throw CorruptStreamError("huffman decode: no code matches at bit " +
                                         std::to_string(stream.bits_consumed() - 1));
            }
        }
        out.push_back(static_cast<uint32_t>(table.decode_nodes[node].symbol));
    }
    return out;
}

std::vector<uint32_t> HuffmanCoder::decode(const std::vector<uint8_t>& bits,
                                           const CodeTable& table,
                                           uint64_t symbol_count) {
    BitInputStream stream(bits);
    return decode(stream, table, symbol_count);
}
