#include "codec/encoder.hpp"

#include "entropy/bitstream.hpp"
#include "entropy/frequency_table.hpp"
#include "io/errors.hpp"

#include <cstdio>
#include <fstream>
#include <istream>
#include <ostream>
#include <sstream>
#include <stdexcept>

namespace hufz {

uint64_t encode_payload(std::istream& in, const CodeTable& table, BitWriter& bw) {
    BitReader br(in);
    while (true) {
        const int byte = br.read_byte();
        if (byte == BitReader::kEndOfInput) break;
        bw.write_code(table.code(static_cast<uint32_t>(byte)));
    }
    bw.write_code(table.code(kEndOfStream));
    const uint64_t bits = bw.bits_written();
    bw.close();
    return bits;
}

CodecStats encode_stream(std::istream& in, std::ostream& out) {
    const std::istream::pos_type start = in.tellg();
    if (start == std::istream::pos_type(-1)) {
        throw IoError("encode: input stream is not seekable");
    }

    //===Frequency pass===//
    FrequencyTable ft = build_frequency_table(in);
    in.clear();
    in.seekg(start);
    if (!in.good()) throw IoError("encode: cannot rewind input");

    //===Tree + codes===//
    HuffNodePtr root = build_huffman_tree(ft);
    CodeTable table = build_code_table(*root);

    // Debug: print the code of the first few used symbols
#ifndef NDEBUG
    std::fprintf(stderr, "encode: %llu input bytes, %u used symbols\n",
                 static_cast<unsigned long long>(ft.total_bytes()), ft.used_symbols());
    int shown = 0;
    for (uint32_t s = 0; s < kSymbolCount && shown < 10; ++s) {
        if (!table.has(s)) continue;
        std::fprintf(stderr, "sym=%u count=%llu code=%s\n", s,
                     static_cast<unsigned long long>(ft.counts[s]),
                     code_to_string(table.enc[s].bits).c_str());
        ++shown;
    }
#endif

    //===Header + payload===//
    write_hufz_header(out, ft);
    BitWriter bw(out);
    CodecStats stats;
    stats.input_bytes = ft.total_bytes();
    stats.payload_bits = encode_payload(in, table, bw);
    stats.output_bytes = kHufzHeaderBytes + (stats.payload_bits + 7) / 8;
    return stats;
}

CodecStats encode_file(const std::string& in_path, const std::string& out_path) {
    std::ifstream in(in_path, std::ios::binary);
    if (!in.good()) throw IoError("Cannot open file: " + in_path);
    std::ofstream out(out_path, std::ios::binary | std::ios::trunc);
    if (!out.good()) throw IoError("Cannot write file: " + out_path);
    return encode_stream(in, out);
}

std::vector<uint8_t> encode_to_hufz(const std::vector<uint8_t>& data, CodecStats* stats) {
    std::istringstream in(std::string(data.begin(), data.end()), std::ios::binary);
    std::ostringstream out(std::ios::binary);
    CodecStats s = encode_stream(in, out);
    if (stats) *stats = s;
    const std::string bytes = out.str();
    return std::vector<uint8_t>(bytes.begin(), bytes.end());
}

} // namespace hufz
