#pragma once

#include <iosfwd>
#include <string>
#include <vector>
#include <cstdint>

#include "codec/codec_stats.hpp"
#include "entropy/bit_io.hpp"
#include "entropy/huffman.hpp"

namespace hufz {

// Write the code of every whole input byte, then the end-of-stream code,
// then close the writer. Returns the number of code bits written.
uint64_t encode_payload(std::istream& in, const CodeTable& table, BitWriter& bw);

// Two passes over `in` (counting, then coding), so it must be seekable.
CodecStats encode_stream(std::istream& in, std::ostream& out);

CodecStats encode_file(const std::string& in_path, const std::string& out_path);

// Encode bytes to .hufz bytes.
std::vector<uint8_t> encode_to_hufz(const std::vector<uint8_t>& data, CodecStats* stats = nullptr);

} // namespace hufz
