/// @file I2cScanner.h
/// @brief I2C bus scanner for bring-up debugging
/// @note NOT part of the library - examples only
#pragma once

#include <Arduino.h>
#include <Wire.h>
#include "Log.h"
#include "SEN5x/CommandTable.h"

namespace i2c {

/// Check if a specific address acknowledges
/// @param addr I2C address to check
/// @return true if device responds
inline bool checkAddress(uint8_t addr) {
  Wire.beginTransmission(addr);
  return Wire.endTransmission() == 0;
}

/// Scan I2C bus and print found devices, marking the SEN5x default address
/// @return Number of devices found
inline int scan() {
  LOGI("Scanning I2C bus...");

  int count = 0;
  for (uint8_t addr = 1; addr < 127; addr++) {
    if (!checkAddress(addr)) {
      continue;
    }
    const bool isSen5x = (addr == SEN5x::cmd::I2C_ADDR_DEFAULT);
    Serial.printf("  Found device at 0x%02X%s\n", addr, isSen5x ? " (SEN5x)" : "");
    count++;
  }

  if (count == 0) {
    LOGW("No I2C devices found");
  } else {
    LOGI("Found %d device(s)", count);
  }
  return count;
}

} // namespace i2c
