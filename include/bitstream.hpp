#pragma once
#include <vector>
#include <cstdint>
#include <cstddef>

// MSB-first bit I/O over an RBSP, the bit order of H.264 / H.265 syntax.

class BitWriter {
public:
    void writeBit(bool bit);
    void writeBits(uint32_t value, int nBits);   // nBits in 0..32
    // rbsp_trailing_bits(): stop bit, then zeros up to a byte boundary.
    void writeTrailingBits();
    bool byteAligned() const { return bitPos_ == 0; }
    std::vector<uint8_t> flush();
private:
    std::vector<uint8_t> buffer_;
    uint8_t currentByte_ = 0;
    int bitPos_ = 0; // bits already written into currentByte_, 0..7
};

class BitReader {
public:
    explicit BitReader(const std::vector<uint8_t>& data);
    bool readBit();
    uint32_t readBits(int nBits);                // nBits in 0..32

    size_t position() const { return pos_; }     // in bits
    void seek(size_t bitPos);
    size_t bitsLeft() const;

    // more_rbsp_data(): true while there are bits before the last 1 bit
    // of the buffer (the rbsp_stop_one_bit). Does not move the cursor.
    bool moreRbspData() const;
private:
    const std::vector<uint8_t>& data_;
    size_t pos_ = 0;
};
