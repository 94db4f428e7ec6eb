
#include "adaptive_model.hpp"
#include "codec_errors.hpp"
#include "range_coder.hpp"
#include <stdexcept>
#include <string>
#include <vector>

AdaptiveModel::AdaptiveModel(uint32_t alphabet_size, uint64_t max_total)
    : model_(alphabet_size), max_total_(max_total) {
    if (alphabet_size < 1) {
        throw std::invalid_argument("alphabet_size must be at least 1");
    }
    // Halving never takes the total below alphabet_size, so the threshold
    // must leave room for at least one increment above the flat state.
    if (max_total <= alphabet_size) {
        throw std::invalid_argument("max_total " + std::to_string(max_total) +
                                    " must exceed alphabet_size " +
                                    std::to_string(alphabet_size));
    }
    // The total peaks at max_total, and the range coder must accept it.
    if (max_total > RangeCoder::MAX_TOTAL) {
        throw std::invalid_argument("max_total " + std::to_string(max_total) +
                                    " exceeds the range coder limit " +
                                    std::to_string(RangeCoder::MAX_TOTAL));
    }

    start_model();
}

void AdaptiveModel::start_model() {
    std::vector<int64_t> flat(model_.alphabet_size(), 1);
    model_ = FrequencyModel::from_table(flat);
}

void AdaptiveModel::update_model(uint32_t symbol) {
    // Validate before touching the model so a bad symbol leaves it unchanged
    if (symbol >= model_.alphabet_size()) {
        throw UnknownSymbolError("symbol " + std::to_string(symbol) +
                                 " outside alphabet of size " +
                                 std::to_string(model_.alphabet_size()));
    }

    if (model_.total_count() >= max_total_) {
        model_.halve();
    }

    model_.increment(symbol);
}

void AdaptiveModel::reset() {
    start_model();
}
