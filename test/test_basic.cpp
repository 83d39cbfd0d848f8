/// @file test_basic.cpp
/// @brief Basic unit tests for SEN5x status, command table and framing

#include <unity.h>

#include <cstring>

#include "SEN5x/SEN5x.h"

using namespace SEN5x;
using SEN5xDevice = SEN5x::SEN5x;

// ============================================================================
// Test Helpers
// ============================================================================

void setUp() {}
void tearDown() {}

// ============================================================================
// Tests
// ============================================================================

void test_status_ok() {
  Status st = Status::Ok();
  TEST_ASSERT_TRUE(st.ok());
  TEST_ASSERT_EQUAL(Err::OK, st.code);
}

void test_status_error() {
  Status st = Status::Error(Err::I2C_ERROR, "Test error", 42);
  TEST_ASSERT_FALSE(st.ok());
  TEST_ASSERT_EQUAL(Err::I2C_ERROR, st.code);
  TEST_ASSERT_EQUAL(42, st.detail);
}

void test_i2c_error_classification() {
  TEST_ASSERT_TRUE(isI2cError(Err::I2C_ERROR));
  TEST_ASSERT_TRUE(isI2cError(Err::I2C_NACK_ADDR));
  TEST_ASSERT_TRUE(isI2cError(Err::I2C_NACK_DATA));
  TEST_ASSERT_TRUE(isI2cError(Err::I2C_NACK_READ));
  TEST_ASSERT_TRUE(isI2cError(Err::I2C_TIMEOUT));
  TEST_ASSERT_TRUE(isI2cError(Err::I2C_BUS));
  TEST_ASSERT_FALSE(isI2cError(Err::CRC_MISMATCH));
  TEST_ASSERT_FALSE(isI2cError(Err::BUSY));
  TEST_ASSERT_FALSE(isI2cError(Err::OK));
}

void test_config_defaults() {
  Config cfg;
  TEST_ASSERT_NULL(cfg.i2cWrite);
  TEST_ASSERT_NULL(cfg.i2cWriteRead);
  TEST_ASSERT_NULL(cfg.i2cUser);
  TEST_ASSERT_NULL(cfg.delayMs);
  TEST_ASSERT_NULL(cfg.nowMs);
  TEST_ASSERT_NULL(cfg.timeUser);
  TEST_ASSERT_EQUAL_HEX8(0x69, cfg.i2cAddress);
  TEST_ASSERT_EQUAL(50u, cfg.i2cTimeoutMs);
  TEST_ASSERT_EQUAL(5, cfg.offlineThreshold);
  TEST_ASSERT_FALSE(cfg.enforceRunningState);
}

void test_version_string() {
  TEST_ASSERT_NOT_NULL(VERSION);
  TEST_ASSERT_TRUE(std::strlen(VERSION) > 0);
}

void test_crc8_example() {
  const uint8_t data[2] = {0xBE, 0xEF};
  TEST_ASSERT_EQUAL_HEX8(0x92, frame::crc8(data, 2));
}

void test_crc8_single_bit_flip_detected() {
  for (uint8_t bit = 0; bit < 16; ++bit) {
    const uint16_t word = static_cast<uint16_t>(0xBEEF ^ (1U << bit));
    const uint8_t data[2] = {static_cast<uint8_t>(word >> 8),
                             static_cast<uint8_t>(word & 0xFF)};
    TEST_ASSERT_NOT_EQUAL(0x92, frame::crc8(data, 2));
  }
}

void test_encode_word() {
  uint8_t out[3] = {};
  frame::encodeWord(0xBEEF, out);
  TEST_ASSERT_EQUAL_HEX8(0xBE, out[0]);
  TEST_ASSERT_EQUAL_HEX8(0xEF, out[1]);
  TEST_ASSERT_EQUAL_HEX8(0x92, out[2]);
}

void test_decode_words_ok() {
  const uint8_t buf[6] = {0xBE, 0xEF, 0x92, 0x00, 0x12, 0xA0};
  uint16_t words[2] = {};
  Status st = frame::decodeWords(buf, sizeof(buf), words, 2);
  TEST_ASSERT_TRUE(st.ok());
  TEST_ASSERT_EQUAL_HEX16(0xBEEF, words[0]);
  TEST_ASSERT_EQUAL_HEX16(0x0012, words[1]);
}

void test_decode_words_first_mismatch_wins() {
  // Words 1 and 2 are both corrupt; the scan must stop at word 1.
  const uint8_t buf[9] = {0xBE, 0xEF, 0x92,
                          0xBE, 0xEF, 0x93,
                          0xBE, 0xEF, 0x00};
  uint16_t words[3] = {0x1111, 0x2222, 0x3333};
  Status st = frame::decodeWords(buf, sizeof(buf), words, 3);
  TEST_ASSERT_EQUAL(Err::CRC_MISMATCH, st.code);
  TEST_ASSERT_EQUAL(1, st.detail);

  // No partial output.
  TEST_ASSERT_EQUAL_HEX16(0x1111, words[0]);
  TEST_ASSERT_EQUAL_HEX16(0x2222, words[1]);
  TEST_ASSERT_EQUAL_HEX16(0x3333, words[2]);
}

void test_decode_words_rejects_length_mismatch() {
  const uint8_t buf[5] = {0xBE, 0xEF, 0x92, 0xBE, 0xEF};
  uint16_t words[2] = {};
  Status st = frame::decodeWords(buf, sizeof(buf), words, 2);
  TEST_ASSERT_EQUAL(Err::INVALID_PARAM, st.code);

  st = frame::decodeWords(buf, 3, words, 0);
  TEST_ASSERT_EQUAL(Err::INVALID_PARAM, st.code);

  st = frame::decodeWords(nullptr, 3, words, 1);
  TEST_ASSERT_EQUAL(Err::INVALID_PARAM, st.code);
}

void test_command_table_opcodes() {
  TEST_ASSERT_EQUAL_HEX16(0x0021, cmd::resolve(Command::StartMeasurement).code);
  TEST_ASSERT_EQUAL_HEX16(0x0037, cmd::resolve(Command::StartMeasurementRhtGasOnly).code);
  TEST_ASSERT_EQUAL_HEX16(0x0104, cmd::resolve(Command::StopMeasurement).code);
  TEST_ASSERT_EQUAL_HEX16(0x0202, cmd::resolve(Command::GetReadDataReadyStatus).code);
  TEST_ASSERT_EQUAL_HEX16(0x03C4, cmd::resolve(Command::ReadMeasurement).code);
  TEST_ASSERT_EQUAL_HEX16(0x5607, cmd::resolve(Command::StartFanCleaning).code);
  TEST_ASSERT_EQUAL_HEX16(0x8004, cmd::resolve(Command::AutoCleaningInterval).code);
  TEST_ASSERT_EQUAL_HEX16(0xD014, cmd::resolve(Command::ReadProductName).code);
  TEST_ASSERT_EQUAL_HEX16(0xD033, cmd::resolve(Command::GetSerialNumber).code);
  TEST_ASSERT_EQUAL_HEX16(0xD100, cmd::resolve(Command::ReadFirmwareVersion).code);
  TEST_ASSERT_EQUAL_HEX16(0xD206, cmd::resolve(Command::ReadDeviceStatus).code);
  TEST_ASSERT_EQUAL_HEX16(0xD210, cmd::resolve(Command::ClearDeviceStatus).code);
  TEST_ASSERT_EQUAL_HEX16(0xD304, cmd::resolve(Command::Reinit).code);
}

void test_command_table_timing_and_flags() {
  TEST_ASSERT_EQUAL(50, cmd::resolve(Command::StartMeasurement).delayMs);
  TEST_ASSERT_EQUAL(200, cmd::resolve(Command::StopMeasurement).delayMs);
  TEST_ASSERT_EQUAL(100, cmd::resolve(Command::Reinit).delayMs);
  TEST_ASSERT_EQUAL(20, cmd::resolve(Command::ReadMeasurement).delayMs);

  TEST_ASSERT_FALSE(cmd::resolve(Command::StartMeasurement).allowedWhileRunning);
  TEST_ASSERT_FALSE(cmd::resolve(Command::StartMeasurementRhtGasOnly).allowedWhileRunning);
  TEST_ASSERT_TRUE(cmd::resolve(Command::StopMeasurement).allowedWhileRunning);
  TEST_ASSERT_TRUE(cmd::resolve(Command::ReadMeasurement).allowedWhileRunning);
}

void test_frame_lengths() {
  TEST_ASSERT_EQUAL(9u, cmd::SERIAL_DATA_LEN);
  TEST_ASSERT_EQUAL(48u, cmd::PRODUCT_NAME_DATA_LEN);
  TEST_ASSERT_EQUAL(3u, cmd::FIRMWARE_DATA_LEN);
  TEST_ASSERT_EQUAL(3u, cmd::DATA_READY_DATA_LEN);
  TEST_ASSERT_EQUAL(24u, cmd::MEASUREMENT_DATA_LEN);
  TEST_ASSERT_EQUAL(32u, cmd::PRODUCT_NAME_LEN);
}

void test_conversions_basic() {
  TEST_ASSERT_FLOAT_WITHIN(0.0001f, 2.2f, SEN5xDevice::convertPm(22));
  TEST_ASSERT_FLOAT_WITHIN(0.0001f, 22.405f, SEN5xDevice::convertTemperatureC(4481));
  TEST_ASSERT_FLOAT_WITHIN(0.0001f, 87.73f, SEN5xDevice::convertTemperatureC(0x448A));
  TEST_ASSERT_FLOAT_WITHIN(0.0001f, 55.14f, SEN5xDevice::convertHumidityPct(5514));
  TEST_ASSERT_FLOAT_WITHIN(0.0001f, 36.0f, SEN5xDevice::convertIndex(360));
  TEST_ASSERT_FLOAT_WITHIN(0.0001f, 0.0f, SEN5xDevice::convertPm(0));
}

void test_convert_full_sample() {
  RawMeasurement raw;
  raw.pm1_0 = 18;
  raw.pm2_5 = 22;
  raw.pm4_0 = 24;
  raw.pm10_0 = 26;
  raw.humidity = 5514;
  raw.temperature = 4481;
  raw.vocIndex = 360;
  raw.noxIndex = 10;

  const Measurement m = SEN5xDevice::convert(raw);
  TEST_ASSERT_FLOAT_WITHIN(0.0001f, 1.8f, m.pm1_0);
  TEST_ASSERT_FLOAT_WITHIN(0.0001f, 2.2f, m.pm2_5);
  TEST_ASSERT_FLOAT_WITHIN(0.0001f, 2.4f, m.pm4_0);
  TEST_ASSERT_FLOAT_WITHIN(0.0001f, 2.6f, m.pm10_0);
  TEST_ASSERT_FLOAT_WITHIN(0.0001f, 55.14f, m.humidityPct);
  TEST_ASSERT_FLOAT_WITHIN(0.0001f, 22.405f, m.temperatureC);
  TEST_ASSERT_FLOAT_WITHIN(0.0001f, 36.0f, m.vocIndex);
  TEST_ASSERT_FLOAT_WITHIN(0.0001f, 1.0f, m.noxIndex);
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char** argv) {
  (void)argc;
  (void)argv;
  UNITY_BEGIN();
  RUN_TEST(test_status_ok);
  RUN_TEST(test_status_error);
  RUN_TEST(test_i2c_error_classification);
  RUN_TEST(test_config_defaults);
  RUN_TEST(test_version_string);
  RUN_TEST(test_crc8_example);
  RUN_TEST(test_crc8_single_bit_flip_detected);
  RUN_TEST(test_encode_word);
  RUN_TEST(test_decode_words_ok);
  RUN_TEST(test_decode_words_first_mismatch_wins);
  RUN_TEST(test_decode_words_rejects_length_mismatch);
  RUN_TEST(test_command_table_opcodes);
  RUN_TEST(test_command_table_timing_and_flags);
  RUN_TEST(test_frame_lengths);
  RUN_TEST(test_conversions_basic);
  RUN_TEST(test_convert_full_sample);
  return UNITY_END();
}
