/**
 * @file BoardConfig.h
 * @brief Example board configuration for ESP32-S2 / ESP32-S3 reference hardware.
 *
 * NOT part of the library API. Override for your hardware.
 *
 * @warning The library itself is board-agnostic. Transport and timing are
 *          passed via Config callbacks.
 */

#pragma once

#include <stdint.h>

#include "common/I2cTransport.h"

namespace board {

/// @brief I2C SDA pin (data line). Example default for ESP32-S2/S3.
static constexpr int I2C_SDA = 8;

/// @brief I2C SCL pin (clock line). Example default for ESP32-S2/S3.
static constexpr int I2C_SCL = 9;

/// @brief I2C clock frequency in Hz (SEN5x maximum is 100 kHz).
static constexpr uint32_t I2C_FREQ_HZ = 100000;

/// @brief I2C timeout in milliseconds for example transactions.
static constexpr uint16_t I2C_TIMEOUT_MS = 50;

/// @brief Serial console baud rate.
static constexpr uint32_t SERIAL_BAUD = 115200;

/// @brief Initialize I2C for examples using the default config.
inline bool initI2c() {
  return transport::initWire(I2C_SDA, I2C_SCL, I2C_FREQ_HZ, I2C_TIMEOUT_MS);
}

}  // namespace board
