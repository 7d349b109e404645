#include "codec/decoder.hpp"

#include "codec/encoder.hpp"
#include "entropy/bitstream.hpp"
#include "format/hufz_format.hpp"
#include "io/errors.hpp"

#include <cstdio>
#include <fstream>
#include <istream>
#include <ostream>
#include <sstream>
#include <stdexcept>

namespace hufz {

uint64_t decode_payload(BitReader& br, const HuffNode& root, std::ostream& out) {
    if (root.is_leaf() && root.leaf().symbol != kEndOfStream) {
        // would emit its symbol forever without consuming a bit
        throw std::logic_error("decode: single-leaf tree without end-of-stream symbol");
    }
    uint64_t written = 0;
    const HuffNode* node = &root;
    while (true) {
        if (node->is_leaf()) {
            const uint32_t sym = node->leaf().symbol;
            if (sym == kEndOfStream) break;
            out.put(static_cast<char>(sym));
            if (!out.good()) throw IoError("decode: write failed");
            ++written;
            node = &root;
            continue;
        }
        const int bit = br.read_bit();
        if (bit == BitReader::kEndOfInput) {
            throw FormatError("decode: payload ended before end-of-stream symbol");
        }
        const HuffInternal& in = node->internal();
        node = bit ? in.right.get() : in.left.get();
    }
    return written;
}

CodecStats decode_stream(std::istream& in, std::ostream& out) {
    HufzHeader hdr = read_hufz_header(in);

#ifndef NDEBUG
    std::fprintf(stderr, "decode: v%u header, %llu original bytes, %u used symbols\n",
                 static_cast<unsigned>(hdr.version), static_cast<unsigned long long>(hdr.freq.total_bytes()),
                 hdr.freq.used_symbols());
#endif

    // Rebuild the identical tree from the stored table
    HuffNodePtr root = build_huffman_tree(hdr.freq);
    BitReader br(in);
    const uint64_t written = decode_payload(br, *root, out);
    out.flush();
    if (!out.good()) throw IoError("decode: flush failed");
    if (written != hdr.freq.total_bytes()) {
        throw FormatError("decode: decoded length does not match header");
    }

    CodecStats stats;
    stats.payload_bits = br.bits_read();
    stats.input_bytes = kHufzHeaderBytes + (stats.payload_bits + 7) / 8;
    stats.output_bytes = written;
    return stats;
}

CodecStats decode_file(const std::string& in_path, const std::string& out_path) {
    std::ifstream in(in_path, std::ios::binary);
    if (!in.good()) throw IoError("Cannot open file: " + in_path);
    std::ofstream out(out_path, std::ios::binary | std::ios::trunc);
    if (!out.good()) throw IoError("Cannot write file: " + out_path);
    return decode_stream(in, out);
}

std::vector<uint8_t> decode_from_hufz(const std::vector<uint8_t>& bytes, CodecStats* stats) {
    std::istringstream in(std::string(bytes.begin(), bytes.end()), std::ios::binary);
    std::ostringstream out(std::ios::binary);
    CodecStats s = decode_stream(in, out);
    if (stats) *stats = s;
    const std::string decoded = out.str();
    return std::vector<uint8_t>(decoded.begin(), decoded.end());
}

// Debug self-test: small in-memory round-trip.
#ifndef NDEBUG
namespace {
struct CodecSelfTest {
    CodecSelfTest() {
        const std::string text = "abracadabra";
        std::vector<uint8_t> src(text.begin(), text.end());
        std::vector<uint8_t> enc = encode_to_hufz(src);
        std::vector<uint8_t> dec = decode_from_hufz(enc);
        if (dec != src) {
            throw std::runtime_error("codec self-test: round-trip mismatch");
        }
    }
};
static CodecSelfTest _codec_self_test{};
} // namespace
#endif

} // namespace hufz
