/// @file Frame.h
/// @brief CRC-8 and word framing for SEN5x I2C payloads
#pragma once

#include <cstddef>
#include <cstdint>
#include "SEN5x/Status.h"

namespace SEN5x {
namespace frame {

/// CRC-8 (poly 0x31, init 0xFF, no reflection, no final XOR)
uint8_t crc8(const uint8_t* data, size_t len);

/// Validate and decode CRC-framed words
/// @param buf       Received bytes, [hi, lo, crc] per word
/// @param len       Length of buf, must equal 3 * wordCount
/// @param words     Output words (untouched unless every CRC matches)
/// @param wordCount Number of words expected
/// @return CRC_MISMATCH with detail = index of the first bad word,
///         INVALID_PARAM on a length or pointer error
Status decodeWords(const uint8_t* buf, size_t len, uint16_t* words, size_t wordCount);

/// Encode one word as [hi, lo, crc] into out[0..2]
void encodeWord(uint16_t word, uint8_t* out);

} // namespace frame
} // namespace SEN5x
