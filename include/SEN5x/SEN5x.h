/// @file SEN5x.h
/// @brief Main driver class for SEN5x
#pragma once

#include <cstddef>
#include <cstdint>
#include "SEN5x/Status.h"
#include "SEN5x/Config.h"
#include "SEN5x/CommandTable.h"
#include "SEN5x/Frame.h"
#include "SEN5x/Version.h"

namespace SEN5x {

/// Driver state for health monitoring
enum class DriverState : uint8_t {
  UNINIT,    ///< begin() not called or end() called
  READY,     ///< Operational, consecutiveFailures == 0
  DEGRADED,  ///< 1 <= consecutiveFailures < offlineThreshold
  OFFLINE    ///< consecutiveFailures >= offlineThreshold
};

/// Measurement result (float)
struct Measurement {
  float pm1_0 = 0.0f;        ///< Mass concentration PM1.0 [ug/m3]
  float pm2_5 = 0.0f;        ///< Mass concentration PM2.5 [ug/m3]
  float pm4_0 = 0.0f;        ///< Mass concentration PM4.0 [ug/m3]
  float pm10_0 = 0.0f;       ///< Mass concentration PM10 [ug/m3]
  float humidityPct = 0.0f;  ///< Compensated ambient humidity [%RH]
  float temperatureC = 0.0f; ///< Compensated ambient temperature [degC]
  float vocIndex = 0.0f;     ///< VOC index
  float noxIndex = 0.0f;     ///< NOx index
};

/// Raw measurement words, in device order
struct RawMeasurement {
  uint16_t pm1_0 = 0;        ///< PM1.0 x10
  uint16_t pm2_5 = 0;        ///< PM2.5 x10
  uint16_t pm4_0 = 0;        ///< PM4.0 x10
  uint16_t pm10_0 = 0;       ///< PM10 x10
  uint16_t humidity = 0;     ///< Humidity x100
  uint16_t temperature = 0;  ///< Temperature x200
  uint16_t vocIndex = 0;     ///< VOC index x10
  uint16_t noxIndex = 0;     ///< NOx index x10
};

/// Parsed device status register
struct DeviceStatusRegister {
  uint32_t raw = 0;
  bool fanSpeedWarning = false;
  bool fanCleaning = false;
  bool gasSensorError = false;
  bool rhtError = false;
  bool laserFailure = false;
  bool fanFailure = false;
};

/// SEN5x driver class
class SEN5x {
public:
  // =========================================================================
  // Lifecycle
  // =========================================================================

  /// Initialize the driver with configuration (no bus traffic)
  /// @param config Configuration including transport and timing callbacks
  /// @return Status::Ok() on success, INVALID_CONFIG otherwise
  Status begin(const Config& config);

  /// Shutdown the driver
  void end();

  /// Check if device is present on the bus (no health tracking)
  /// @return Status::Ok() if device responds, error otherwise
  Status probe();

  // =========================================================================
  // Driver State
  // =========================================================================

  /// Get current driver state
  DriverState state() const { return _driverState; }

  /// Check if driver is ready for operations
  bool isOnline() const {
    return _driverState == DriverState::READY ||
           _driverState == DriverState::DEGRADED;
  }

  /// True after startMeasurement() until stopMeasurement()
  bool isMeasuring() const { return _running; }

  /// Active 7-bit device address
  uint8_t address() const { return _config.i2cAddress; }

  // =========================================================================
  // Health Tracking
  // =========================================================================

  /// Timestamp of last successful I2C operation
  uint32_t lastOkMs() const { return _lastOkMs; }

  /// Timestamp of last failed I2C operation
  uint32_t lastErrorMs() const { return _lastErrorMs; }

  /// Most recent error status
  Status lastError() const { return _lastError; }

  /// Consecutive failures since last success
  uint8_t consecutiveFailures() const { return _consecutiveFailures; }

  /// Total failure count (lifetime)
  uint32_t totalFailures() const { return _totalFailures; }

  /// Total success count (lifetime)
  uint32_t totalSuccess() const { return _totalSuccess; }

  // =========================================================================
  // Measurement Control
  // =========================================================================

  /// Start periodic measurement (all channels, 1 s update interval)
  Status startMeasurement();

  /// Start periodic measurement with PM channels off (RH/T, VOC, NOx only)
  Status startMeasurementRhtGasOnly();

  /// Stop periodic measurement and return to idle
  Status stopMeasurement();

  /// Reinitialize the sensor (reloads user settings from EEPROM)
  Status reinit();

  // =========================================================================
  // Measurement API
  // =========================================================================

  /// Check whether a new measurement can be read out
  Status readDataReady(bool& ready);

  /// Read raw measurement words
  Status readMeasurementRaw(RawMeasurement& out);

  /// Read measurement converted to physical units
  Status readMeasurement(Measurement& out);

  // =========================================================================
  // Identification
  // =========================================================================

  /// Read 48-bit serial number
  Status readSerialNumber(uint64_t& serial);

  /// Read product name as 32 raw bytes (NUL-padded ASCII on real devices)
  Status readProductName(uint8_t (&name)[cmd::PRODUCT_NAME_LEN]);

  /// Read firmware major version
  Status readFirmwareVersion(uint8_t& version);

  // =========================================================================
  // Fan Cleaning
  // =========================================================================

  /// Start fan cleaning (only effective while measuring)
  Status startFanCleaning();

  /// Read auto-cleaning interval in seconds
  Status readAutoCleaningInterval(uint32_t& seconds);

  /// Write auto-cleaning interval in seconds (0 disables)
  Status writeAutoCleaningInterval(uint32_t seconds);

  // =========================================================================
  // Device Status
  // =========================================================================

  /// Read raw device status register
  Status readDeviceStatus(uint32_t& raw);

  /// Read and parse device status register
  Status readDeviceStatus(DeviceStatusRegister& out);

  /// Clear device status flags
  Status clearDeviceStatus();

  // =========================================================================
  // Helpers
  // =========================================================================

  /// Convert raw PM word to ug/m3
  static float convertPm(uint16_t raw);

  /// Convert raw humidity word to %RH
  static float convertHumidityPct(uint16_t raw);

  /// Convert raw temperature word to degC
  static float convertTemperatureC(uint16_t raw);

  /// Convert raw VOC/NOx index word
  static float convertIndex(uint16_t raw);

  /// Convert a full raw sample
  static Measurement convert(const RawMeasurement& raw);

private:
  // =========================================================================
  // Transport Wrappers
  // =========================================================================

  /// Raw I2C read (no health tracking)
  Status _i2cReadRaw(uint8_t* rxBuf, size_t rxLen);

  /// Raw I2C write (no health tracking)
  Status _i2cWriteRaw(const uint8_t* buf, size_t len);

  /// Tracked I2C read (updates health)
  Status _i2cReadTracked(uint8_t* rxBuf, size_t rxLen);

  /// Tracked I2C write (updates health)
  Status _i2cWriteTracked(const uint8_t* buf, size_t len);

  // =========================================================================
  // Command Access
  // =========================================================================

  Status _checkCommand(Command command) const;
  Status _writeCommand(Command command, bool tracked);
  Status _writeCommandWithWords(Command command, const uint16_t* words,
                                size_t wordCount, bool tracked);
  Status _readAfterCommand(Command command, uint8_t* buf, size_t len,
                           bool tracked);

  // =========================================================================
  // Health Management
  // =========================================================================

  /// Update health counters and state based on operation result
  /// Called ONLY from tracked transport wrappers
  Status _updateHealth(const Status& st);

  uint32_t _now() const;
  void _waitMs(uint32_t delayMs);

  // =========================================================================
  // State
  // =========================================================================

  Config _config;
  bool _initialized = false;
  bool _running = false;
  DriverState _driverState = DriverState::UNINIT;

  // Health counters
  uint32_t _lastOkMs = 0;
  uint32_t _lastErrorMs = 0;
  Status _lastError = Status::Ok();
  uint8_t _consecutiveFailures = 0;
  uint32_t _totalFailures = 0;
  uint32_t _totalSuccess = 0;
};

} // namespace SEN5x
