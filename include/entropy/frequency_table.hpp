#pragma once

#include <array>
#include <cstdint>
#include <iosfwd>
#include <vector>

namespace hufz {

// Symbols 0..255 are literal bytes; 256 is the end-of-stream sentinel.
inline constexpr uint32_t kSymbolCount = 257;
inline constexpr uint32_t kEndOfStream = 256;

struct FrequencyTable {
    std::array<uint64_t, kSymbolCount> counts{};

    uint64_t& operator[](uint32_t sym) { return counts[sym]; }
    uint64_t operator[](uint32_t sym) const { return counts[sym]; }

    // Sum of the byte counts (sentinel excluded) == input length.
    uint64_t total_bytes() const;
    // Number of symbols (sentinel included) with a non-zero count.
    uint32_t used_symbols() const;
};

// Count every whole byte of the stream, then pin the sentinel to 1.
FrequencyTable build_frequency_table(std::istream& in);
FrequencyTable build_frequency_table(const std::vector<uint8_t>& bytes);

// Order-0 Shannon entropy in bits per input byte (sentinel excluded).
double entropy_bits_per_byte(const FrequencyTable& ft);

} // namespace hufz
