#pragma once

#include <iosfwd>
#include <string>
#include <vector>
#include <cstdint>

#include "codec/codec_stats.hpp"
#include "entropy/bit_io.hpp"
#include "entropy/huffman.hpp"

namespace hufz {

// Walk the tree one bit at a time, writing each decoded byte, until the
// end-of-stream symbol. Padding after it is never read. Throws FormatError
// if the bits run out first. Returns the number of bytes written.
uint64_t decode_payload(BitReader& br, const HuffNode& root, std::ostream& out);

CodecStats decode_stream(std::istream& in, std::ostream& out);

CodecStats decode_file(const std::string& in_path, const std::string& out_path);

// Decode .hufz bytes to the original bytes.
std::vector<uint8_t> decode_from_hufz(const std::vector<uint8_t>& bytes, CodecStats* stats = nullptr);

} // namespace hufz
