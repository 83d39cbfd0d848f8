/// @file CommandTable.h
/// @brief Command definitions, timings and bit masks for SEN5x
#pragma once

#include <cstdint>
#include <cstddef>

namespace SEN5x {

/// Commands understood by the driver
enum class Command : uint8_t {
  StartMeasurement = 0,
  StartMeasurementRhtGasOnly,
  StopMeasurement,
  GetReadDataReadyStatus,
  ReadMeasurement,
  StartFanCleaning,
  AutoCleaningInterval,
  ReadProductName,
  GetSerialNumber,
  ReadFirmwareVersion,
  ReadDeviceStatus,
  ClearDeviceStatus,
  Reinit
};

/// Opcode and timing associated with a command
struct CommandInfo {
  uint16_t code;              ///< 16-bit opcode, sent big-endian
  uint16_t delayMs;           ///< Settle time after the command write
  bool allowedWhileRunning;   ///< Valid while periodic measurement is active
};

namespace cmd {

// ============================================================================
// I2C Address (7-bit)
// ============================================================================

static constexpr uint8_t I2C_ADDR_DEFAULT = 0x69;
static constexpr uint8_t I2C_ADDR_MAX = 0x7F;

// ============================================================================
// CRC-8 parameters
// ============================================================================

static constexpr uint8_t CRC_INIT = 0xFF;
static constexpr uint8_t CRC_POLY = 0x31;

// ============================================================================
// Command table (indexed by Command)
// ============================================================================

static constexpr CommandInfo COMMAND_TABLE[] = {
    {0x0021, 50, false},   // StartMeasurement
    {0x0037, 50, false},   // StartMeasurementRhtGasOnly
    {0x0104, 200, true},   // StopMeasurement
    {0x0202, 20, true},    // GetReadDataReadyStatus
    {0x03C4, 20, true},    // ReadMeasurement
    {0x5607, 20, true},    // StartFanCleaning
    {0x8004, 20, true},    // AutoCleaningInterval (read/write)
    {0xD014, 20, true},    // ReadProductName
    {0xD033, 20, true},    // GetSerialNumber
    {0xD100, 20, true},    // ReadFirmwareVersion
    {0xD206, 20, true},    // ReadDeviceStatus
    {0xD210, 20, true},    // ClearDeviceStatus
    {0xD304, 100, true},   // Reinit (device reset)
};

static constexpr size_t COMMAND_COUNT = sizeof(COMMAND_TABLE) / sizeof(COMMAND_TABLE[0]);
static_assert(COMMAND_COUNT == static_cast<size_t>(Command::Reinit) + 1,
              "COMMAND_TABLE must cover every Command");

/// Resolve a command to its opcode, delay and running-state flag
static constexpr const CommandInfo& resolve(Command c) {
  return COMMAND_TABLE[static_cast<uint8_t>(c)];
}

// ============================================================================
// Data-ready status
// ============================================================================

static constexpr uint16_t DATA_READY_MASK = 0x07FF;

// ============================================================================
// Device status register bit masks (32-bit)
// ============================================================================

static constexpr uint32_t STATUS_FAN_SPEED_WARNING = 1UL << 21;
static constexpr uint32_t STATUS_FAN_CLEANING = 1UL << 19;
static constexpr uint32_t STATUS_GAS_SENSOR_ERROR = 1UL << 7;
static constexpr uint32_t STATUS_RHT_ERROR = 1UL << 6;
static constexpr uint32_t STATUS_LASER_FAILURE = 1UL << 5;
static constexpr uint32_t STATUS_FAN_FAILURE = 1UL << 4;

// ============================================================================
// Scale factors (raw word = physical value * scale)
// ============================================================================

static constexpr float SCALE_PM = 10.0f;
static constexpr float SCALE_HUMIDITY = 100.0f;
static constexpr float SCALE_TEMPERATURE = 200.0f;
static constexpr float SCALE_INDEX = 10.0f;

// ============================================================================
// Data lengths
// ============================================================================

static constexpr size_t COMMAND_BYTES = 2;
static constexpr size_t DATA_WORD_BYTES = 2;
static constexpr size_t DATA_CRC_BYTES = 1;
static constexpr size_t DATA_WORD_WITH_CRC = 3;

static constexpr size_t SERIAL_WORDS = 3;
static constexpr size_t PRODUCT_NAME_WORDS = 16;
static constexpr size_t FIRMWARE_WORDS = 1;
static constexpr size_t DATA_READY_WORDS = 1;
static constexpr size_t MEASUREMENT_WORDS = 8;
static constexpr size_t DEVICE_STATUS_WORDS = 2;
static constexpr size_t CLEANING_INTERVAL_WORDS = 2;

static constexpr size_t SERIAL_DATA_LEN = SERIAL_WORDS * DATA_WORD_WITH_CRC;             // 9
static constexpr size_t PRODUCT_NAME_DATA_LEN = PRODUCT_NAME_WORDS * DATA_WORD_WITH_CRC; // 48
static constexpr size_t FIRMWARE_DATA_LEN = FIRMWARE_WORDS * DATA_WORD_WITH_CRC;         // 3
static constexpr size_t DATA_READY_DATA_LEN = DATA_READY_WORDS * DATA_WORD_WITH_CRC;     // 3
static constexpr size_t MEASUREMENT_DATA_LEN = MEASUREMENT_WORDS * DATA_WORD_WITH_CRC;   // 24
static constexpr size_t DEVICE_STATUS_DATA_LEN = DEVICE_STATUS_WORDS * DATA_WORD_WITH_CRC;
static constexpr size_t CLEANING_INTERVAL_DATA_LEN =
    CLEANING_INTERVAL_WORDS * DATA_WORD_WITH_CRC;

static constexpr size_t PRODUCT_NAME_LEN = PRODUCT_NAME_WORDS * DATA_WORD_BYTES;         // 32

/// Largest host-to-device write: opcode + two CRC-framed words
static constexpr size_t MAX_WRITE_LEN = COMMAND_BYTES + 2 * DATA_WORD_WITH_CRC;

} // namespace cmd
} // namespace SEN5x
