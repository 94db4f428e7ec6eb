#include "frequency_model.hpp"
#include "codec_errors.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

FrequencyModel FrequencyModel::from_symbols(const std::vector<uint32_t>& symbols,
                                            uint32_t alphabet_size) {
    if (alphabet_size == 0 && !symbols.empty()) {
        alphabet_size = *std::max_element(symbols.begin(), symbols.end()) + 1;
    }

    FrequencyModel model(alphabet_size);
    for (uint32_t symbol : symbols) {
        if (symbol >= alphabet_size) {
            throw UnknownSymbolError("symbol " + std::to_string(symbol) +
                                     " outside alphabet of size " +
                                     std::to_string(alphabet_size));
        }
        model.freq_[symbol]++;
    }
    model.rebuild_cumulative();
    return model;
}

FrequencyModel FrequencyModel::from_table(const std::vector<int64_t>& counts) {
    FrequencyModel model(static_cast<uint32_t>(counts.size()));
    bool has_positive = false;
    for (size_t i = 0; i < counts.size(); i++) {
        if (counts[i] < 0) {
            throw std::invalid_argument("negative frequency for symbol " +
                                        std::to_string(i));
        }
        if (counts[i] > 0) {
            has_positive = true;
        }
        model.freq_[i] = static_cast<uint64_t>(counts[i]);
    }
    if (!has_positive) {
        throw EmptyAlphabetError("frequency table has no positive count");
    }
    model.rebuild_cumulative();
    return model;
}

FrequencyModel::FrequencyModel(uint32_t alphabet_size)
    : freq_(alphabet_size, 0), tree_(static_cast<size_t>(alphabet_size) + 1, 0),
      total_(0), top_bit_(0) {
    if (alphabet_size > 0) {
        top_bit_ = 1;
        while (top_bit_ <= alphabet_size / 2) {
            top_bit_ <<= 1;
        }
    }
}

uint32_t FrequencyModel::num_present() const {
    return static_cast<uint32_t>(
        std::count_if(freq_.begin(), freq_.end(), [](uint64_t f) { return f > 0; }));
}

uint64_t FrequencyModel::frequency(uint32_t symbol) const {
    check_symbol(symbol);
    return freq_[symbol];
}

double FrequencyModel::probability_of(uint32_t symbol) const {
    check_symbol(symbol);
    if (total_count() == 0) {
        return 0.0;
    }
    return static_cast<double>(freq_[symbol]) / static_cast<double>(total_count());
}

uint64_t FrequencyModel::cumulative_before(uint32_t symbol) const {
    check_symbol(symbol);
    uint64_t sum = 0;
    for (size_t i = symbol; i > 0; i &= i - 1) {
        sum += tree_[i];
    }
    return sum;
}

uint32_t FrequencyModel::symbol_at_cumulative(uint64_t value) const {
    if (value >= total_count()) {
        throw CorruptStreamError("cumulative value " + std::to_string(value) +
                                 " outside [0, " + std::to_string(total_count()) + ")");
    }
    // Descend to the longest prefix whose sum is still <= value. Zero-width
    // symbols do not change the sum, so the descent steps over them.
    size_t pos = 0;
    for (size_t step = top_bit_; step > 0; step >>= 1) {
        size_t next = pos + step;
        if (next < tree_.size() && tree_[next] <= value) {
            pos = next;
            value -= tree_[next];
        }
    }
    return static_cast<uint32_t>(pos);
}

void FrequencyModel::increment(uint32_t symbol) {
    check_symbol(symbol);
    freq_[symbol]++;
    total_++;
    for (size_t i = static_cast<size_t>(symbol) + 1; i < tree_.size(); i += i & (~i + 1)) {
        tree_[i]++;
    }
}

void FrequencyModel::halve() {
    for (uint64_t& f : freq_) {
        f = (f + 1) / 2;  // Round up so that present symbols stay non-zero
    }
    rebuild_cumulative();
}

void FrequencyModel::rescale(uint64_t max_total) {
    if (num_present() > max_total) {
        throw PrecisionOverflowError(std::to_string(num_present()) +
                                     " present symbols cannot fit a total of " +
                                     std::to_string(max_total));
    }
    while (total_count() > max_total) {
        halve();
    }
}

void FrequencyModel::check_symbol(uint32_t symbol) const {
    if (symbol >= freq_.size()) {
        throw UnknownSymbolError("symbol " + std::to_string(symbol) +
                                 " outside alphabet of size " +
                                 std::to_string(freq_.size()));
    }
}

void FrequencyModel::rebuild_cumulative() {
    // Linear-time Fenwick construction: each node pushes its sum to its parent
    total_ = 0;
    for (size_t i = 1; i < tree_.size(); i++) {
        tree_[i] = freq_[i - 1];
        total_ += freq_[i - 1];
    }
    for (size_t i = 1; i < tree_.size(); i++) {
        size_t parent = i + (i & (~i + 1));
        if (parent < tree_.size()) {
            tree_[parent] += tree_[i];
        }
    }
}
