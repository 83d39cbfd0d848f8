/// @file Status.h
/// @brief Error codes and status handling for SEN5x driver
#pragma once

#include <cstdint>

namespace SEN5x {

/// Error codes for all SEN5x operations
enum class Err : uint8_t {
  OK = 0,                 ///< Operation successful
  NOT_INITIALIZED,        ///< begin() not called
  INVALID_CONFIG,         ///< Invalid configuration parameter
  INVALID_PARAM,          ///< Invalid parameter value
  DEVICE_NOT_FOUND,       ///< Device not responding on I2C bus
  CRC_MISMATCH,           ///< CRC check failed (detail = word index)
  BUSY,                   ///< Command not permitted while measuring
  I2C_ERROR,              ///< Unspecified I2C failure
  I2C_NACK_ADDR,          ///< Address not acknowledged
  I2C_NACK_DATA,          ///< Data byte not acknowledged
  I2C_NACK_READ,          ///< Read header not acknowledged
  I2C_TIMEOUT,            ///< Transport timeout
  I2C_BUS                 ///< Bus or arbitration error
};

/// @return true if the code was produced by the bus transport
inline constexpr bool isI2cError(Err code) {
  return code == Err::I2C_ERROR || code == Err::I2C_NACK_ADDR ||
         code == Err::I2C_NACK_DATA || code == Err::I2C_NACK_READ ||
         code == Err::I2C_TIMEOUT || code == Err::I2C_BUS;
}

/// Status structure returned by all fallible operations
struct Status {
  Err code = Err::OK;
  int32_t detail = 0;        ///< Implementation-specific detail (e.g., I2C error code)
  const char* msg = "";      ///< Static string describing the error

  constexpr Status() = default;
  constexpr Status(Err c, int32_t d, const char* m) : code(c), detail(d), msg(m) {}

  /// @return true if operation succeeded
  constexpr bool ok() const { return code == Err::OK; }

  /// Create a success status
  static constexpr Status Ok() { return Status{Err::OK, 0, "OK"}; }

  /// Create an error status
  static constexpr Status Error(Err err, const char* message, int32_t detailCode = 0) {
    return Status{err, detailCode, message};
  }
};

} // namespace SEN5x
