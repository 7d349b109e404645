#pragma once

#include <cstdint>

#include "entropy/frequency_table.hpp"

namespace hufz {

// IMPORTANT:
// Do NOT write/read this struct by dumping raw memory or using sizeof(HufzHeader).
// Struct padding/alignment is compiler-dependent. Always serialize field-by-field.
inline constexpr uint16_t kHufzVersion = 1;
inline constexpr uint16_t kHufzHeaderBytes = 16 + 8 * kSymbolCount; // fixed on-disk header size for v1

// .hufz file layout:
// [Header][payload bitstream...]
//
// Header fields are little-endian. The payload follows immediately, MSB-first,
// ended logically by the end-of-stream code and zero-padded to a byte.
struct HufzHeader {
    char     magic[4];        // "HUFZ"
    uint16_t version;         // codec version
    uint16_t header_bytes;    // fixed header size
    uint16_t symbol_count;    // 257
    uint16_t reserved0;       // 0
    uint32_t reserved1;       // 0

    FrequencyTable freq;      // counts[0..256] as u64
};

} // namespace hufz
