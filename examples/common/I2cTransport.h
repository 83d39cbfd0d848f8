/// @file I2cTransport.h
/// @brief Wire-based I2C transport and timing adapters for SEN5x examples
/// @note NOT part of the library - examples only
#pragma once

#include <Arduino.h>
#include <Wire.h>
#include "SEN5x/Status.h"
#include "SEN5x/CommandTable.h"

namespace transport {

using SEN5x::Status;
using SEN5x::Err;

/// Largest SEN5x response (product name: 16 words * 3 bytes)
static constexpr size_t MAX_RESPONSE_LEN = SEN5x::cmd::PRODUCT_NAME_DATA_LEN;

/// Initialize Wire for examples
/// @param sda SDA pin
/// @param scl SCL pin
/// @param freqHz I2C clock frequency (SEN5x supports up to 100 kHz)
/// @param timeoutMs Wire timeout in milliseconds
/// @return true if initialized
inline bool initWire(int sda, int scl, uint32_t freqHz, uint32_t timeoutMs) {
  Wire.begin(sda, scl);
  Wire.setClock(freqHz);
  Wire.setTimeOut(timeoutMs);
  return true;
}

/// Map an Arduino endTransmission() result to a driver status
/// Codes are core-dependent: 1=data too long, 2=NACK addr, 3=NACK data,
/// 4=other, 5=timeout (ESP32 core).
inline Status mapWireResult(uint8_t result) {
  switch (result) {
    case 0: return Status::Ok();
    case 1: return Status::Error(Err::INVALID_PARAM, "I2C write too long", result);
    case 2: return Status::Error(Err::I2C_NACK_ADDR, "I2C NACK addr", result);
    case 3: return Status::Error(Err::I2C_NACK_DATA, "I2C NACK data", result);
    case 4: return Status::Error(Err::I2C_BUS, "I2C bus error", result);
    case 5: return Status::Error(Err::I2C_TIMEOUT, "I2C timeout", result);
    default: return Status::Error(Err::I2C_ERROR, "I2C write failed", result);
  }
}

/// Command/payload write with STOP (the read is a separate transfer)
/// @param addr I2C device address (7-bit)
/// @param data Opcode followed by optional CRC-framed words
/// @param len Number of bytes to write
/// @param timeoutMs Unused; Wire timeout is set in initWire()
/// @param user User context (unused)
inline Status wireWrite(uint8_t addr, const uint8_t* data, size_t len,
                        uint32_t timeoutMs, void* user) {
  (void)user;
  (void)timeoutMs;

  Wire.beginTransmission(addr);
  const size_t written = Wire.write(data, len);
  const Status st = mapWireResult(Wire.endTransmission(true));
  if (!st.ok()) {
    return st;
  }
  if (written != len) {
    return Status::Error(Err::I2C_ERROR, "I2C write incomplete", static_cast<int32_t>(written));
  }
  return Status::Ok();
}

/// Response read. A short read is reported as I2C_ERROR so the driver never
/// validates CRCs over a truncated frame.
/// @param addr I2C device address (7-bit)
/// @param txData Unused (txLen must be 0)
/// @param txLen Must be 0
/// @param rxData Buffer for the [hi, lo, crc] triples
/// @param rxLen Exact frame length for the issued command
/// @param timeoutMs Unused; Wire timeout is set in initWire()
/// @param user User context (unused)
inline Status wireWriteRead(uint8_t addr, const uint8_t* txData, size_t txLen,
                            uint8_t* rxData, size_t rxLen,
                            uint32_t timeoutMs, void* user) {
  (void)user;
  (void)timeoutMs;
  (void)txData;

  if (txLen > 0) {
    return Status::Error(Err::INVALID_PARAM, "Combined write+read not supported");
  }
  if (rxLen == 0 || rxLen > MAX_RESPONSE_LEN) {
    return Status::Error(Err::INVALID_PARAM, "Invalid response length",
                         static_cast<int32_t>(rxLen));
  }

  const size_t received = Wire.requestFrom(addr, rxLen);
  if (received != rxLen) {
    // Drain so the next transfer starts clean.
    while (Wire.available() > 0) {
      (void)Wire.read();
    }
    return Status::Error(Err::I2C_ERROR,
                         received == 0 ? "I2C read returned 0 bytes" : "I2C read incomplete",
                         static_cast<int32_t>(received));
  }

  for (size_t i = 0; i < rxLen; i++) {
    rxData[i] = static_cast<uint8_t>(Wire.read());
  }
  return Status::Ok();
}

/// Delay callback using Arduino delay()
inline void arduinoDelay(uint32_t ms, void* user) {
  (void)user;
  delay(ms);
}

/// Timestamp callback using Arduino millis()
inline uint32_t arduinoMillis(void* user) {
  (void)user;
  return millis();
}

} // namespace transport
