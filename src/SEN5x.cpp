/**
 * @file SEN5x.cpp
 * @brief SEN5x driver implementation.
 */

#include "SEN5x/SEN5x.h"

#include <limits>

namespace SEN5x {

Status SEN5x::begin(const Config& config) {
  _initialized = false;
  _running = false;
  _driverState = DriverState::UNINIT;

  _lastOkMs = 0;
  _lastErrorMs = 0;
  _lastError = Status::Ok();
  _consecutiveFailures = 0;
  _totalFailures = 0;
  _totalSuccess = 0;

  if (config.i2cWrite == nullptr || config.i2cWriteRead == nullptr) {
    return Status::Error(Err::INVALID_CONFIG, "I2C callbacks not set");
  }
  if (config.delayMs == nullptr) {
    return Status::Error(Err::INVALID_CONFIG, "Delay callback not set");
  }
  if (config.i2cTimeoutMs == 0) {
    return Status::Error(Err::INVALID_CONFIG, "I2C timeout must be > 0");
  }
  if (config.i2cAddress > cmd::I2C_ADDR_MAX) {
    return Status::Error(Err::INVALID_CONFIG, "Invalid I2C address");
  }

  _config = config;
  if (_config.offlineThreshold == 0) {
    _config.offlineThreshold = 1;
  }

  _initialized = true;
  _driverState = DriverState::READY;
  return Status::Ok();
}

void SEN5x::end() {
  _initialized = false;
  _running = false;
  _driverState = DriverState::UNINIT;
}

Status SEN5x::probe() {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "begin() not called");
  }

  uint8_t buf[cmd::FIRMWARE_DATA_LEN] = {};
  Status st = _readAfterCommand(Command::ReadFirmwareVersion, buf, sizeof(buf), false);
  if (!st.ok()) {
    if (isI2cError(st.code)) {
      return Status::Error(Err::DEVICE_NOT_FOUND, "Device not responding", st.detail);
    }
    return st;
  }

  uint16_t word = 0;
  return frame::decodeWords(buf, sizeof(buf), &word, cmd::FIRMWARE_WORDS);
}

Status SEN5x::startMeasurement() {
  Status st = _writeCommand(Command::StartMeasurement, true);
  if (!st.ok()) {
    return st;
  }

  _running = true;
  return Status::Ok();
}

Status SEN5x::startMeasurementRhtGasOnly() {
  Status st = _writeCommand(Command::StartMeasurementRhtGasOnly, true);
  if (!st.ok()) {
    return st;
  }

  _running = true;
  return Status::Ok();
}

Status SEN5x::stopMeasurement() {
  Status st = _writeCommand(Command::StopMeasurement, true);
  if (!st.ok()) {
    return st;
  }

  _running = false;
  return Status::Ok();
}

Status SEN5x::reinit() {
  return _writeCommand(Command::Reinit, true);
}

Status SEN5x::readDataReady(bool& ready) {
  uint8_t buf[cmd::DATA_READY_DATA_LEN] = {};
  Status st = _readAfterCommand(Command::GetReadDataReadyStatus, buf, sizeof(buf), true);
  if (!st.ok()) {
    return st;
  }

  uint16_t word = 0;
  st = frame::decodeWords(buf, sizeof(buf), &word, cmd::DATA_READY_WORDS);
  if (!st.ok()) {
    return st;
  }

  // Ready unless all eleven low bits are clear.
  ready = (word & cmd::DATA_READY_MASK) != 0;
  return Status::Ok();
}

Status SEN5x::readMeasurementRaw(RawMeasurement& out) {
  uint8_t buf[cmd::MEASUREMENT_DATA_LEN] = {};
  Status st = _readAfterCommand(Command::ReadMeasurement, buf, sizeof(buf), true);
  if (!st.ok()) {
    return st;
  }

  uint16_t words[cmd::MEASUREMENT_WORDS] = {};
  st = frame::decodeWords(buf, sizeof(buf), words, cmd::MEASUREMENT_WORDS);
  if (!st.ok()) {
    return st;
  }

  out.pm1_0 = words[0];
  out.pm2_5 = words[1];
  out.pm4_0 = words[2];
  out.pm10_0 = words[3];
  out.humidity = words[4];
  out.temperature = words[5];
  out.vocIndex = words[6];
  out.noxIndex = words[7];
  return Status::Ok();
}

Status SEN5x::readMeasurement(Measurement& out) {
  RawMeasurement raw;
  Status st = readMeasurementRaw(raw);
  if (!st.ok()) {
    return st;
  }

  out = convert(raw);
  return Status::Ok();
}

Status SEN5x::readSerialNumber(uint64_t& serial) {
  uint8_t buf[cmd::SERIAL_DATA_LEN] = {};
  Status st = _readAfterCommand(Command::GetSerialNumber, buf, sizeof(buf), true);
  if (!st.ok()) {
    return st;
  }

  uint16_t words[cmd::SERIAL_WORDS] = {};
  st = frame::decodeWords(buf, sizeof(buf), words, cmd::SERIAL_WORDS);
  if (!st.ok()) {
    return st;
  }

  serial = (static_cast<uint64_t>(words[0]) << 32) |
           (static_cast<uint64_t>(words[1]) << 16) |
           static_cast<uint64_t>(words[2]);
  return Status::Ok();
}

Status SEN5x::readProductName(uint8_t (&name)[cmd::PRODUCT_NAME_LEN]) {
  uint8_t buf[cmd::PRODUCT_NAME_DATA_LEN] = {};
  Status st = _readAfterCommand(Command::ReadProductName, buf, sizeof(buf), true);
  if (!st.ok()) {
    return st;
  }

  uint16_t words[cmd::PRODUCT_NAME_WORDS] = {};
  st = frame::decodeWords(buf, sizeof(buf), words, cmd::PRODUCT_NAME_WORDS);
  if (!st.ok()) {
    return st;
  }

  for (size_t i = 0; i < cmd::PRODUCT_NAME_WORDS; ++i) {
    name[i * 2] = static_cast<uint8_t>(words[i] >> 8);
    name[i * 2 + 1] = static_cast<uint8_t>(words[i] & 0xFF);
  }
  return Status::Ok();
}

Status SEN5x::readFirmwareVersion(uint8_t& version) {
  uint8_t buf[cmd::FIRMWARE_DATA_LEN] = {};
  Status st = _readAfterCommand(Command::ReadFirmwareVersion, buf, sizeof(buf), true);
  if (!st.ok()) {
    return st;
  }

  uint16_t word = 0;
  st = frame::decodeWords(buf, sizeof(buf), &word, cmd::FIRMWARE_WORDS);
  if (!st.ok()) {
    return st;
  }

  // Low byte is reserved.
  version = static_cast<uint8_t>(word >> 8);
  return Status::Ok();
}

Status SEN5x::startFanCleaning() {
  return _writeCommand(Command::StartFanCleaning, true);
}

Status SEN5x::readAutoCleaningInterval(uint32_t& seconds) {
  uint8_t buf[cmd::CLEANING_INTERVAL_DATA_LEN] = {};
  Status st = _readAfterCommand(Command::AutoCleaningInterval, buf, sizeof(buf), true);
  if (!st.ok()) {
    return st;
  }

  uint16_t words[cmd::CLEANING_INTERVAL_WORDS] = {};
  st = frame::decodeWords(buf, sizeof(buf), words, cmd::CLEANING_INTERVAL_WORDS);
  if (!st.ok()) {
    return st;
  }

  seconds = (static_cast<uint32_t>(words[0]) << 16) | words[1];
  return Status::Ok();
}

Status SEN5x::writeAutoCleaningInterval(uint32_t seconds) {
  const uint16_t words[cmd::CLEANING_INTERVAL_WORDS] = {
      static_cast<uint16_t>(seconds >> 16),
      static_cast<uint16_t>(seconds & 0xFFFF)};
  return _writeCommandWithWords(Command::AutoCleaningInterval, words,
                                cmd::CLEANING_INTERVAL_WORDS, true);
}

Status SEN5x::readDeviceStatus(uint32_t& raw) {
  uint8_t buf[cmd::DEVICE_STATUS_DATA_LEN] = {};
  Status st = _readAfterCommand(Command::ReadDeviceStatus, buf, sizeof(buf), true);
  if (!st.ok()) {
    return st;
  }

  uint16_t words[cmd::DEVICE_STATUS_WORDS] = {};
  st = frame::decodeWords(buf, sizeof(buf), words, cmd::DEVICE_STATUS_WORDS);
  if (!st.ok()) {
    return st;
  }

  raw = (static_cast<uint32_t>(words[0]) << 16) | words[1];
  return Status::Ok();
}

Status SEN5x::readDeviceStatus(DeviceStatusRegister& out) {
  uint32_t raw = 0;
  Status st = readDeviceStatus(raw);
  if (!st.ok()) {
    return st;
  }

  out.raw = raw;
  out.fanSpeedWarning = (raw & cmd::STATUS_FAN_SPEED_WARNING) != 0;
  out.fanCleaning = (raw & cmd::STATUS_FAN_CLEANING) != 0;
  out.gasSensorError = (raw & cmd::STATUS_GAS_SENSOR_ERROR) != 0;
  out.rhtError = (raw & cmd::STATUS_RHT_ERROR) != 0;
  out.laserFailure = (raw & cmd::STATUS_LASER_FAILURE) != 0;
  out.fanFailure = (raw & cmd::STATUS_FAN_FAILURE) != 0;
  return Status::Ok();
}

Status SEN5x::clearDeviceStatus() {
  return _writeCommand(Command::ClearDeviceStatus, true);
}

float SEN5x::convertPm(uint16_t raw) {
  return static_cast<float>(raw) / cmd::SCALE_PM;
}

float SEN5x::convertHumidityPct(uint16_t raw) {
  return static_cast<float>(raw) / cmd::SCALE_HUMIDITY;
}

float SEN5x::convertTemperatureC(uint16_t raw) {
  return static_cast<float>(raw) / cmd::SCALE_TEMPERATURE;
}

float SEN5x::convertIndex(uint16_t raw) {
  return static_cast<float>(raw) / cmd::SCALE_INDEX;
}

Measurement SEN5x::convert(const RawMeasurement& raw) {
  Measurement m;
  m.pm1_0 = convertPm(raw.pm1_0);
  m.pm2_5 = convertPm(raw.pm2_5);
  m.pm4_0 = convertPm(raw.pm4_0);
  m.pm10_0 = convertPm(raw.pm10_0);
  m.humidityPct = convertHumidityPct(raw.humidity);
  m.temperatureC = convertTemperatureC(raw.temperature);
  m.vocIndex = convertIndex(raw.vocIndex);
  m.noxIndex = convertIndex(raw.noxIndex);
  return m;
}

Status SEN5x::_i2cReadRaw(uint8_t* rxBuf, size_t rxLen) {
  if (_config.i2cWriteRead == nullptr) {
    return Status::Error(Err::INVALID_CONFIG, "I2C write-read not set");
  }
  return _config.i2cWriteRead(_config.i2cAddress, nullptr, 0, rxBuf, rxLen,
                              _config.i2cTimeoutMs, _config.i2cUser);
}

Status SEN5x::_i2cWriteRaw(const uint8_t* buf, size_t len) {
  if (_config.i2cWrite == nullptr) {
    return Status::Error(Err::INVALID_CONFIG, "I2C write not set");
  }
  return _config.i2cWrite(_config.i2cAddress, buf, len, _config.i2cTimeoutMs,
                          _config.i2cUser);
}

Status SEN5x::_i2cReadTracked(uint8_t* rxBuf, size_t rxLen) {
  if (rxBuf == nullptr || rxLen == 0) {
    return Status::Error(Err::INVALID_PARAM, "Invalid I2C buffer");
  }

  Status st = _i2cReadRaw(rxBuf, rxLen);
  if (st.code == Err::INVALID_CONFIG || st.code == Err::INVALID_PARAM) {
    return st;
  }
  return _updateHealth(st);
}

Status SEN5x::_i2cWriteTracked(const uint8_t* buf, size_t len) {
  if (buf == nullptr || len == 0) {
    return Status::Error(Err::INVALID_PARAM, "Invalid I2C buffer");
  }

  Status st = _i2cWriteRaw(buf, len);
  if (st.code == Err::INVALID_CONFIG || st.code == Err::INVALID_PARAM) {
    return st;
  }
  return _updateHealth(st);
}

Status SEN5x::_checkCommand(Command command) const {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "begin() not called");
  }
  if (_config.enforceRunningState && _running &&
      !cmd::resolve(command).allowedWhileRunning) {
    return Status::Error(Err::BUSY, "Stop measurement before this command",
                         cmd::resolve(command).code);
  }
  return Status::Ok();
}

Status SEN5x::_writeCommand(Command command, bool tracked) {
  return _writeCommandWithWords(command, nullptr, 0, tracked);
}

Status SEN5x::_writeCommandWithWords(Command command, const uint16_t* words,
                                     size_t wordCount, bool tracked) {
  Status st = _checkCommand(command);
  if (!st.ok()) {
    return st;
  }

  const size_t len = cmd::COMMAND_BYTES + wordCount * cmd::DATA_WORD_WITH_CRC;
  if (len > cmd::MAX_WRITE_LEN || (wordCount > 0 && words == nullptr)) {
    return Status::Error(Err::INVALID_PARAM, "Invalid command payload");
  }

  const CommandInfo& info = cmd::resolve(command);
  uint8_t payload[cmd::MAX_WRITE_LEN] = {};
  payload[0] = static_cast<uint8_t>(info.code >> 8);
  payload[1] = static_cast<uint8_t>(info.code & 0xFF);
  for (size_t i = 0; i < wordCount; ++i) {
    frame::encodeWord(words[i], &payload[cmd::COMMAND_BYTES + i * cmd::DATA_WORD_WITH_CRC]);
  }

  st = tracked ? _i2cWriteTracked(payload, len) : _i2cWriteRaw(payload, len);
  if (!st.ok()) {
    return st;
  }

  _waitMs(info.delayMs);
  return Status::Ok();
}

Status SEN5x::_readAfterCommand(Command command, uint8_t* buf, size_t len,
                                bool tracked) {
  if (buf == nullptr || len == 0) {
    return Status::Error(Err::INVALID_PARAM, "Invalid read buffer");
  }

  Status st = _writeCommand(command, tracked);
  if (!st.ok()) {
    return st;
  }

  if (tracked) {
    return _i2cReadTracked(buf, len);
  }
  return _i2cReadRaw(buf, len);
}

Status SEN5x::_updateHealth(const Status& st) {
  const uint32_t now = _now();
  const uint32_t maxU32 = std::numeric_limits<uint32_t>::max();
  const uint8_t maxU8 = std::numeric_limits<uint8_t>::max();

  if (st.ok()) {
    _lastOkMs = now;
    if (_totalSuccess < maxU32) {
      _totalSuccess++;
    }
    _consecutiveFailures = 0;
    _driverState = DriverState::READY;
    return st;
  }

  _lastError = st;
  _lastErrorMs = now;
  if (_totalFailures < maxU32) {
    _totalFailures++;
  }
  if (_consecutiveFailures < maxU8) {
    _consecutiveFailures++;
  }

  if (_consecutiveFailures >= _config.offlineThreshold) {
    _driverState = DriverState::OFFLINE;
  } else {
    _driverState = DriverState::DEGRADED;
  }

  return st;
}

uint32_t SEN5x::_now() const {
  return _config.nowMs != nullptr ? _config.nowMs(_config.timeUser) : 0;
}

void SEN5x::_waitMs(uint32_t delayMs) {
  if (delayMs == 0 || _config.delayMs == nullptr) {
    return;
  }
  _config.delayMs(delayMs, _config.timeUser);
}

}  // namespace SEN5x
