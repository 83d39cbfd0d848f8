/// @file Config.h
/// @brief Configuration structure for SEN5x driver
#pragma once

#include <cstddef>
#include <cstdint>
#include "SEN5x/Status.h"
#include "SEN5x/CommandTable.h"

namespace SEN5x {

/// I2C write callback signature
/// @param addr     I2C device address (7-bit)
/// @param data     Pointer to data to write
/// @param len      Number of bytes to write
/// @param timeoutMs Maximum time to wait for completion
/// @param user     User context pointer passed through from Config
/// @return Status indicating success or failure. Transport SHOULD distinguish:
///         - Err::I2C_NACK_ADDR (address NACK)
///         - Err::I2C_NACK_DATA (data NACK)
///         - Err::I2C_TIMEOUT (timeout)
///         - Err::I2C_BUS (bus/arbitration error)
///         - Err::I2C_ERROR (unspecified I2C error)
using I2cWriteFn = Status (*)(uint8_t addr, const uint8_t* data, size_t len,
                              uint32_t timeoutMs, void* user);

/// I2C read callback signature
/// @param addr     I2C device address (7-bit)
/// @param txData   Unused by the driver (txLen is always 0)
/// @param txLen    Number of bytes to write before the read (always 0)
/// @param rxData   Pointer to buffer for read data
/// @param rxLen    Number of bytes to read
/// @param timeoutMs Maximum time to wait for completion
/// @param user     User context pointer passed through from Config
/// @return Status indicating success or failure. A read that returns fewer
///         than rxLen bytes MUST be reported as an error.
/// @note The driver writes the command via i2cWrite(), waits the command's
///       settle time, then calls i2cWriteRead() with txLen==0.
using I2cWriteReadFn = Status (*)(uint8_t addr, const uint8_t* txData, size_t txLen,
                                  uint8_t* rxData, size_t rxLen, uint32_t timeoutMs,
                                  void* user);

/// Blocking delay callback
/// @param ms   Milliseconds to wait
/// @param user User context pointer (Config::timeUser)
using DelayMsFn = void (*)(uint32_t ms, void* user);

/// Optional monotonic millisecond clock, used for health timestamps
/// @param user User context pointer (Config::timeUser)
using NowMsFn = uint32_t (*)(void* user);

/// Configuration for SEN5x driver
struct Config {
  // === I2C Transport (required) ===
  I2cWriteFn i2cWrite = nullptr;        ///< I2C write function pointer
  I2cWriteReadFn i2cWriteRead = nullptr; ///< I2C read function pointer
  void* i2cUser = nullptr;               ///< User context for I2C callbacks

  // === Timing ===
  DelayMsFn delayMs = nullptr;           ///< Settle delay (required)
  NowMsFn nowMs = nullptr;               ///< Timestamp source (optional)
  void* timeUser = nullptr;              ///< User context for timing callbacks

  // === Device Settings ===
  uint8_t i2cAddress = cmd::I2C_ADDR_DEFAULT; ///< 7-bit device address
  uint32_t i2cTimeoutMs = 50;            ///< I2C transaction timeout in ms

  // === Health Tracking ===
  uint8_t offlineThreshold = 5;          ///< Consecutive failures before OFFLINE

  // === Command Guard ===
  /// Reject commands not permitted during measurement with Err::BUSY
  bool enforceRunningState = false;
};

} // namespace SEN5x
