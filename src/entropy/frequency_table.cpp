#include "entropy/frequency_table.hpp"

#include "entropy/bit_io.hpp"

#include <cmath>
#include <istream>
#include <limits>
#include <stdexcept>

namespace hufz {

uint64_t FrequencyTable::total_bytes() const {
    uint64_t sum = 0;
    for (uint32_t i = 0; i < kEndOfStream; ++i) sum += counts[i];
    return sum;
}

uint32_t FrequencyTable::used_symbols() const {
    uint32_t n = 0;
    for (uint64_t c : counts) {
        if (c != 0) ++n;
    }
    return n;
}

FrequencyTable build_frequency_table(std::istream& in) {
    FrequencyTable ft;
    BitReader br(in);
    while (true) {
        const int byte = br.read_byte();
        if (byte == BitReader::kEndOfInput) break;
        if (ft.counts[byte] == std::numeric_limits<uint64_t>::max()) {
            throw std::runtime_error("frequency: count overflow");
        }
        ++ft.counts[byte];
    }
    ft.counts[kEndOfStream] = 1;
    return ft;
}

FrequencyTable build_frequency_table(const std::vector<uint8_t>& bytes) {
    FrequencyTable ft;
    for (uint8_t b : bytes) ++ft.counts[b];
    ft.counts[kEndOfStream] = 1;
    return ft;
}

double entropy_bits_per_byte(const FrequencyTable& ft) {
    const uint64_t total = ft.total_bytes();
    if (total == 0) return 0.0;
    double h = 0.0;
    for (uint32_t i = 0; i < kEndOfStream; ++i) {
        if (ft.counts[i] == 0) continue;
        const double p = static_cast<double>(ft.counts[i]) / static_cast<double>(total);
        h -= p * std::log2(p);
    }
    return h;
}

} // namespace hufz
