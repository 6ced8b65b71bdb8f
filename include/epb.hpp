#pragma once
#include <vector>
#include <cstdint>
#include <cstddef>

// Emulation prevention for H.264 / H.265 NAL unit payloads.
//
// Inside a NAL unit any 00 00 0x (x <= 3) in the RBSP is broken up by an
// emulation_prevention_three_byte (0x03) so the payload can never contain
// something that looks like a start code.

// RBSP -> escaped payload. A trailing 00 00 is left as is.
std::vector<uint8_t> epbEncode(const std::vector<uint8_t>& data);

// Escaped payload -> RBSP. Every 00 00 03 loses its 03.
std::vector<uint8_t> epbDecode(const std::vector<uint8_t>& data);

// Number of escape bytes epbEncode would insert.
size_t epbCount(const std::vector<uint8_t>& data);
