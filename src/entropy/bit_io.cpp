#include "entropy/bit_io.hpp"

#include "io/errors.hpp"

#include <istream>
#include <ostream>
#include <stdexcept>

namespace hufz {

// ---------------- BitWriter ---------------- //
void BitWriter::write_bit(bool bit) {
    if (closed_) {
        throw std::logic_error("BitWriter: write after close");
    }
    cur_ = static_cast<uint8_t>((cur_ << 1) | (bit ? 1u : 0u));
    ++bit_pos_;
    ++bits_written_;
    if (bit_pos_ == 8) {
        emit(cur_);
        cur_ = 0;
        bit_pos_ = 0;
    }
}

void BitWriter::write_code(const Code& code) {
    for (bool b : code) write_bit(b);
}

void BitWriter::close() {
    if (closed_) {
        throw std::logic_error("BitWriter: close called twice");
    }
    closed_ = true;
    if (bit_pos_ > 0) {
        cur_ = static_cast<uint8_t>(cur_ << (8 - bit_pos_));
        emit(cur_);
        cur_ = 0;
        bit_pos_ = 0;
    }
    os_.flush();
    if (!os_.good()) throw IoError("BitWriter: flush failed");
}

void BitWriter::emit(uint8_t byte) {
    os_.put(static_cast<char>(byte));
    if (!os_.good()) throw IoError("BitWriter: write failed");
}

// ---------------- BitReader ---------------- //
int BitReader::read_bit() {
    if (bit_pos_ == 8) {
        const auto c = is_.get();
        if (c == std::char_traits<char>::eof()) {
            if (is_.bad()) throw IoError("BitReader: read failed");
            return kEndOfInput;
        }
        cur_ = static_cast<uint8_t>(c);
        bit_pos_ = 0;
    }
    const int bit = (cur_ >> (7 - bit_pos_)) & 1;
    ++bit_pos_;
    ++bits_read_;
    return bit;
}

int BitReader::read_byte() {
    int value = 0;
    for (int i = 0; i < 8; ++i) {
        const int bit = read_bit();
        if (bit == kEndOfInput) return kEndOfInput;
        value = (value << 1) | bit;
    }
    return value;
}

} // namespace hufz
