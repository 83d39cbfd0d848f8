/**
 * @file Frame.cpp
 * @brief CRC-8 and word framing implementation.
 */

#include "SEN5x/Frame.h"
#include "SEN5x/CommandTable.h"

namespace SEN5x {
namespace frame {

uint8_t crc8(const uint8_t* data, size_t len) {
  uint8_t crc = cmd::CRC_INIT;
  for (size_t i = 0; i < len; ++i) {
    crc ^= data[i];
    for (uint8_t bit = 0; bit < 8; ++bit) {
      if (crc & 0x80) {
        crc = static_cast<uint8_t>((crc << 1) ^ cmd::CRC_POLY);
      } else {
        crc <<= 1;
      }
    }
  }
  return crc;
}

Status decodeWords(const uint8_t* buf, size_t len, uint16_t* words, size_t wordCount) {
  if (buf == nullptr || words == nullptr || wordCount == 0) {
    return Status::Error(Err::INVALID_PARAM, "Invalid frame buffer");
  }
  if (len != wordCount * cmd::DATA_WORD_WITH_CRC) {
    return Status::Error(Err::INVALID_PARAM, "Frame length mismatch",
                         static_cast<int32_t>(len));
  }

  // Validate the whole frame before publishing any word.
  for (size_t i = 0; i < wordCount; ++i) {
    const uint8_t* triple = &buf[i * cmd::DATA_WORD_WITH_CRC];
    if (crc8(triple, cmd::DATA_WORD_BYTES) != triple[2]) {
      return Status::Error(Err::CRC_MISMATCH, "CRC mismatch", static_cast<int32_t>(i));
    }
  }

  for (size_t i = 0; i < wordCount; ++i) {
    const uint8_t* triple = &buf[i * cmd::DATA_WORD_WITH_CRC];
    words[i] = static_cast<uint16_t>((triple[0] << 8) | triple[1]);
  }
  return Status::Ok();
}

void encodeWord(uint16_t word, uint8_t* out) {
  out[0] = static_cast<uint8_t>(word >> 8);
  out[1] = static_cast<uint8_t>(word & 0xFF);
  out[2] = crc8(out, cmd::DATA_WORD_BYTES);
}

} // namespace frame
} // namespace SEN5x
