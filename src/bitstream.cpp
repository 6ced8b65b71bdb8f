#include "bitstream.hpp"
#include <stdexcept>

// ====================
// BitWriter
// ====================

void BitWriter::writeBit(bool bit) {
    // Pack bits MSB-first into currentByte_
    currentByte_ |= (bit ? 1u : 0u) << (7 - bitPos_);
    ++bitPos_;

    // If we filled the byte, push it to the buffer and reset.
    if (bitPos_ == 8) {
        buffer_.push_back(currentByte_);
        currentByte_ = 0;
        bitPos_ = 0;
    }
}

void BitWriter::writeBits(uint32_t value, int nBits) {
    if (nBits < 0 || nBits > 32) {
        throw std::invalid_argument("BitWriter: nBits out of range (0..32)");
    }
    for (int i = nBits - 1; i >= 0; --i) {
        bool bit = (value >> i) & 1u; // MSB-first
        writeBit(bit);
    }
}

void BitWriter::writeTrailingBits() {
    writeBit(true);
    while (!byteAligned()) {
        writeBit(false);
    }
}

std::vector<uint8_t> BitWriter::flush() {
    // If there are partially filled bits, push the last byte.
    if (bitPos_ != 0) {
        buffer_.push_back(currentByte_);
        currentByte_ = 0;
        bitPos_ = 0;
    }
    return buffer_;
}

// ====================
// BitReader
// ====================

BitReader::BitReader(const std::vector<uint8_t>& data)
    : data_(data) {}

bool BitReader::readBit() {
    if (pos_ >= data_.size() * 8) {
        throw std::runtime_error("BitReader: out of data");
    }

    bool bit = (data_[pos_ / 8] >> (7 - pos_ % 8)) & 1u;
    ++pos_;
    return bit;
}

uint32_t BitReader::readBits(int nBits) {
    if (nBits < 0 || nBits > 32) {
        throw std::invalid_argument("BitReader: nBits out of range (0..32)");
    }
    if (static_cast<size_t>(nBits) > bitsLeft()) {
        throw std::runtime_error("BitReader: out of data");
    }
    uint32_t v = 0;
    for (int i = 0; i < nBits; ++i) {
        v = (v << 1) | (readBit() ? 1u : 0u); // MSB-first
    }
    return v;
}

void BitReader::seek(size_t bitPos) {
    if (bitPos > data_.size() * 8) {
        throw std::out_of_range("BitReader: seek past end of data");
    }
    pos_ = bitPos;
}

size_t BitReader::bitsLeft() const {
    return data_.size() * 8 - pos_;
}

bool BitReader::moreRbspData() const {
    if (pos_ >= data_.size() * 8) {
        return false;
    }

    // Find the last 1 bit, scanning back from the end.
    size_t byteIndex = data_.size();
    while (byteIndex > 0 && data_[byteIndex - 1] == 0) {
        --byteIndex;
    }
    if (byteIndex == 0) {
        return false;
    }
    uint8_t last = data_[byteIndex - 1];
    int lowest = 0;
    while (((last >> lowest) & 1u) == 0) {
        ++lowest;
    }
    size_t lastOnePos = (byteIndex - 1) * 8 + static_cast<size_t>(7 - lowest);

    return pos_ < lastOnePos;
}
