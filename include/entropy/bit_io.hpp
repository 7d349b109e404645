#pragma once

#include <cstdint>
#include <iosfwd>
#include <vector>

namespace hufz {

// Explicit code bits, root-to-leaf order (false = left/0, true = right/1).
using Code = std::vector<bool>;

// MSB-first bit sink over a byte stream.
// The first bit written lands in the most significant position of its byte.
// close() pads the final partial byte with 0s on the low end and flushes;
// the stream itself stays owned (and is closed) by the caller.
class BitWriter {
public:
    explicit BitWriter(std::ostream& os) : os_(os) {}
    BitWriter(const BitWriter&) = delete;
    BitWriter& operator=(const BitWriter&) = delete;

    void write_bit(bool bit);
    void write_code(const Code& code);
    void close();

    bool closed() const { return closed_; }
    uint64_t bits_written() const { return bits_written_; }

private:
    void emit(uint8_t byte);

    std::ostream& os_;
    uint8_t cur_{0};
    uint8_t bit_pos_{0}; // bits filled in cur_ (0..7 between writes)
    uint64_t bits_written_{0};
    bool closed_{false};
};

// MSB-first bit source over a byte stream.
// A byte is pulled from the stream only once the previous 8 bits are used up.
class BitReader {
public:
    static constexpr int kEndOfInput = -1;

    explicit BitReader(std::istream& is) : is_(is) {}
    BitReader(const BitReader&) = delete;
    BitReader& operator=(const BitReader&) = delete;

    // 0, 1 or kEndOfInput.
    int read_bit();
    // Next whole 8-bit group as 0..255, or kEndOfInput if the source ends
    // anywhere inside the group.
    int read_byte();

    uint64_t bits_read() const { return bits_read_; }

private:
    std::istream& is_;
    uint8_t cur_{0};
    uint8_t bit_pos_{8}; // next bit to hand out from cur_; 8 = need a new byte
    uint64_t bits_read_{0};
};

} // namespace hufz
