#pragma once

#include <cstdint>

namespace hufz {

// Diagnostics only; nothing in the format depends on these.
struct CodecStats {
    uint64_t input_bytes{0};
    uint64_t payload_bits{0};  // code bits, padding excluded
    uint64_t output_bytes{0};
};

} // namespace hufz
