#pragma once

#include <iosfwd>
#include <cstdint>
#include <vector>
#include <cstring>
#include <utility>

#include "format/hufz_format.hpp"
#include "io/errors.hpp"

namespace hufz {

class ByteWriter {
public:
    void write_u8(uint8_t v) { buf_.push_back(v); }
    void write_u16_le(uint16_t v) {
        buf_.push_back(static_cast<uint8_t>(v & 0xFF));
        buf_.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    }
    void write_u32_le(uint32_t v) {
        write_u16_le(static_cast<uint16_t>(v & 0xFFFF));
        write_u16_le(static_cast<uint16_t>((v >> 16) & 0xFFFF));
    }
    void write_u64_le(uint64_t v) {
        write_u32_le(static_cast<uint32_t>(v & 0xFFFFFFFFu));
        write_u32_le(static_cast<uint32_t>((v >> 32) & 0xFFFFFFFFu));
    }
    void write_bytes(const void* p, size_t n) {
        const uint8_t* b = static_cast<const uint8_t*>(p);
        buf_.insert(buf_.end(), b, b + n);
    }
    const std::vector<uint8_t>& bytes() const { return buf_; }
private:
    std::vector<uint8_t> buf_;
};

class ByteReader {
public:
    explicit ByteReader(std::vector<uint8_t> data) : buf_(std::move(data)) {}

    uint8_t read_u8() {
        need(1);
        return buf_[pos_++];
    }
    uint16_t read_u16_le() {
        uint16_t lo = read_u8();
        uint16_t hi = read_u8();
        return static_cast<uint16_t>(lo | (hi << 8));
    }
    uint32_t read_u32_le() {
        uint32_t a = read_u16_le();
        uint32_t b = read_u16_le();
        return a | (b << 16);
    }
    uint64_t read_u64_le() {
        uint64_t a = read_u32_le();
        uint64_t b = read_u32_le();
        return a | (b << 32);
    }
    void read_bytes(void* out, size_t n) {
        need(n);
        std::memcpy(out, buf_.data() + pos_, n);
        pos_ += n;
    }
    bool eof() const { return pos_ >= buf_.size(); }
    size_t remaining() const { return buf_.size() - pos_; }
private:
    void need(size_t n) {
        if (pos_ + n > buf_.size()) throw FormatError("bitstream: premature EOF");
    }
    std::vector<uint8_t> buf_;
    size_t pos_ = 0;
};

// Serialize the v1 header for a frequency table.
void write_hufz_header(ByteWriter& w, const FrequencyTable& ft);
void write_hufz_header(std::ostream& os, const FrequencyTable& ft);

// Parse and validate a v1 header; throws FormatError on anything malformed.
HufzHeader read_hufz_header(const std::vector<uint8_t>& bytes);
// Consumes exactly kHufzHeaderBytes from the stream.
HufzHeader read_hufz_header(std::istream& is);

} // namespace hufz
