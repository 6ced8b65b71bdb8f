#include "epb.hpp"

#include <cstdint>
#include <vector>

// ============================
// Escape insertion
// ============================
//
// After an escape the cursor moves by 2, not 3: the byte that triggered
// the escape becomes the first byte of the next window, so
//   00 00 00 00 00 01 -> 00 00 03 00 00 03 00 01
// escapes every qualifying pair of a long zero run.

static bool needsEscape(const std::vector<uint8_t>& data, size_t i) {
    return i + 2 < data.size()
        && data[i] == 0x00
        && data[i + 1] == 0x00
        && data[i + 2] <= 0x03;
}

size_t epbCount(const std::vector<uint8_t>& data) {
    size_t count = 0;
    size_t i = 0;
    while (i < data.size()) {
        if (needsEscape(data, i)) {
            ++count;
            i += 2;
        } else {
            ++i;
        }
    }
    return count;
}

std::vector<uint8_t> epbEncode(const std::vector<uint8_t>& data) {
    std::vector<uint8_t> out;
    out.reserve(data.size() + epbCount(data));

    size_t i = 0;
    while (i < data.size()) {
        if (needsEscape(data, i)) {
            out.push_back(0x00);
            out.push_back(0x00);
            out.push_back(0x03);
            i += 2;
        } else {
            out.push_back(data[i]);
            ++i;
        }
    }
    return out;
}

// ============================
// Escape removal
// ============================

std::vector<uint8_t> epbDecode(const std::vector<uint8_t>& data) {
    std::vector<uint8_t> out;
    out.reserve(data.size());

    size_t i = 0;
    while (i < data.size()) {
        if (i + 2 < data.size()
            && data[i] == 0x00
            && data[i + 1] == 0x00
            && data[i + 2] == 0x03) {
            // drop the emulation_prevention_three_byte
            out.push_back(0x00);
            out.push_back(0x00);
            i += 3;
        } else {
            out.push_back(data[i]);
            ++i;
        }
    }
    return out;
}
