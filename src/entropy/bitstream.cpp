#include "entropy/bitstream.hpp"

#include <istream>
#include <limits>
#include <ostream>

namespace hufz {

namespace {
static bool has_magic(const std::vector<uint8_t>& b) {
    return b.size() >= 4 && b[0] == 'H' && b[1] == 'U' && b[2] == 'F' && b[3] == 'Z';
}
} // namespace

void write_hufz_header(ByteWriter& w, const FrequencyTable& ft) {
    HufzHeader hdr{};
    // "HUFZ"
    hdr.magic[0] = 'H';
    hdr.magic[1] = 'U';
    hdr.magic[2] = 'F';
    hdr.magic[3] = 'Z';
    hdr.version = kHufzVersion;
    hdr.header_bytes = kHufzHeaderBytes;
    hdr.symbol_count = static_cast<uint16_t>(kSymbolCount);
    hdr.freq = ft;

    w.write_bytes(hdr.magic, 4);
    w.write_u16_le(hdr.version);
    w.write_u16_le(hdr.header_bytes);
    w.write_u16_le(hdr.symbol_count);
    w.write_u16_le(hdr.reserved0);
    w.write_u32_le(hdr.reserved1);
    for (uint64_t c : hdr.freq.counts) {
        w.write_u64_le(c);
    }
}

void write_hufz_header(std::ostream& os, const FrequencyTable& ft) {
    ByteWriter w;
    write_hufz_header(w, ft);
    const auto& b = w.bytes();
    os.write(reinterpret_cast<const char*>(b.data()), static_cast<std::streamsize>(b.size()));
    if (!os.good()) throw IoError("encode: header write failed");
}

HufzHeader read_hufz_header(const std::vector<uint8_t>& bytes) {
    if (!has_magic(bytes)) throw FormatError("decode: bad magic");
    if (bytes.size() < kHufzHeaderBytes) throw FormatError("decode: truncated header");

    ByteReader r(std::vector<uint8_t>(bytes.begin(), bytes.begin() + kHufzHeaderBytes));
    HufzHeader hdr{};
    r.read_bytes(hdr.magic, 4);
    hdr.version = r.read_u16_le();
    hdr.header_bytes = r.read_u16_le();
    hdr.symbol_count = r.read_u16_le();
    hdr.reserved0 = r.read_u16_le();
    hdr.reserved1 = r.read_u32_le();

    if (hdr.version != kHufzVersion) throw FormatError("decode: unsupported version");
    if (hdr.header_bytes != kHufzHeaderBytes) throw FormatError("decode: invalid header_bytes");
    if (hdr.symbol_count != kSymbolCount) throw FormatError("decode: invalid symbol_count");

    uint64_t sum = 0;
    for (uint32_t i = 0; i < kSymbolCount; ++i) {
        const uint64_t c = r.read_u64_le();
        if (c > std::numeric_limits<uint64_t>::max() - sum) {
            throw FormatError("decode: frequency sum overflow");
        }
        sum += c;
        hdr.freq.counts[i] = c;
    }
    if (hdr.freq.counts[kEndOfStream] != 1) {
        throw FormatError("decode: end-of-stream count must be 1");
    }
    return hdr;
}

HufzHeader read_hufz_header(std::istream& is) {
    std::vector<uint8_t> buf(kHufzHeaderBytes);
    is.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(buf.size()));
    if (is.bad()) throw IoError("decode: header read failed");
    buf.resize(static_cast<size_t>(is.gcount()));
    return read_hufz_header(buf);
}

} // namespace hufz
