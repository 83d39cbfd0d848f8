/// @file main.cpp
/// @brief Basic bringup example for SEN5x
/// @note This is an EXAMPLE, not part of the library

#include <Arduino.h>
#include <cstdlib>
#include "common/Log.h"
#include "common/BoardConfig.h"
#include "common/I2cTransport.h"
#include "common/I2cScanner.h"

#include "SEN5x/SEN5x.h"

// ============================================================================
// Globals
// ============================================================================

/// Data-ready poll period while a stress run is active
static constexpr uint32_t POLL_INTERVAL_MS = 100;

struct StressStats {
  bool active = false;
  uint32_t startMs = 0;
  int target = 0;
  int attempts = 0;
  int success = 0;
  uint32_t errors = 0;
  uint32_t notReady = 0;
  bool hasSample = false;
  float minPm25 = 0.0f;
  float maxPm25 = 0.0f;
  double sumPm25 = 0.0;
  double sumTemp = 0.0;
  SEN5x::Status lastError = SEN5x::Status::Ok();
};

SEN5x::SEN5x device;
SEN5x::Config gConfig;
bool gConfigReady = false;
bool verboseMode = false;
uint32_t lastPollMs = 0;
int stressRemaining = 0;
StressStats stressStats;

// ============================================================================
// Helper Functions
// ============================================================================

const char* errToStr(SEN5x::Err err) {
  using namespace SEN5x;
  switch (err) {
    case Err::OK: return "OK";
    case Err::NOT_INITIALIZED: return "NOT_INITIALIZED";
    case Err::INVALID_CONFIG: return "INVALID_CONFIG";
    case Err::INVALID_PARAM: return "INVALID_PARAM";
    case Err::DEVICE_NOT_FOUND: return "DEVICE_NOT_FOUND";
    case Err::CRC_MISMATCH: return "CRC_MISMATCH";
    case Err::BUSY: return "BUSY";
    case Err::I2C_ERROR: return "I2C_ERROR";
    case Err::I2C_NACK_ADDR: return "I2C_NACK_ADDR";
    case Err::I2C_NACK_DATA: return "I2C_NACK_DATA";
    case Err::I2C_NACK_READ: return "I2C_NACK_READ";
    case Err::I2C_TIMEOUT: return "I2C_TIMEOUT";
    case Err::I2C_BUS: return "I2C_BUS";
    default: return "UNKNOWN";
  }
}

const char* stateToStr(SEN5x::DriverState st) {
  using namespace SEN5x;
  switch (st) {
    case DriverState::UNINIT: return "UNINIT";
    case DriverState::READY: return "READY";
    case DriverState::DEGRADED: return "DEGRADED";
    case DriverState::OFFLINE: return "OFFLINE";
    default: return "UNKNOWN";
  }
}

void printStatus(const SEN5x::Status& st) {
  Serial.printf("  Status: %s (code=%u, detail=%ld)\n",
                errToStr(st.code),
                static_cast<unsigned>(st.code),
                static_cast<long>(st.detail));
  if (st.msg && st.msg[0]) {
    Serial.printf("  Message: %s\n", st.msg);
  }
}

void printDriverHealth() {
  Serial.println("=== Driver State ===");
  Serial.printf("  State: %s\n", stateToStr(device.state()));
  Serial.printf("  Online: %s\n", device.isOnline() ? "YES" : "NO");
  Serial.printf("  Measuring: %s\n", device.isMeasuring() ? "YES" : "NO");
  Serial.printf("  Address: 0x%02X\n", device.address());
  Serial.printf("  Consecutive failures: %u\n", device.consecutiveFailures());
  Serial.printf("  Total failures: %lu\n", static_cast<unsigned long>(device.totalFailures()));
  Serial.printf("  Total success: %lu\n", static_cast<unsigned long>(device.totalSuccess()));
  Serial.printf("  Last OK at: %lu ms\n", static_cast<unsigned long>(device.lastOkMs()));
  Serial.printf("  Last error at: %lu ms\n", static_cast<unsigned long>(device.lastErrorMs()));
  if (device.lastError().code != SEN5x::Err::OK) {
    Serial.printf("  Last error: %s\n", errToStr(device.lastError().code));
  }
  Serial.printf("  Verbose: %s\n", verboseMode ? "ON" : "OFF");
}

void printMeasurement(const SEN5x::Measurement& m) {
  Serial.printf("PM1.0=%.1f PM2.5=%.1f PM4.0=%.1f PM10=%.1f ug/m3\n",
                m.pm1_0, m.pm2_5, m.pm4_0, m.pm10_0);
  Serial.printf("T=%.2f C RH=%.2f %% VOC=%.1f NOx=%.1f\n",
                m.temperatureC, m.humidityPct, m.vocIndex, m.noxIndex);
}

void printRaw(const SEN5x::RawMeasurement& r) {
  Serial.printf("Raw: PM1=0x%04X PM2.5=0x%04X PM4=0x%04X PM10=0x%04X\n",
                r.pm1_0, r.pm2_5, r.pm4_0, r.pm10_0);
  Serial.printf("     RH=0x%04X T=0x%04X VOC=0x%04X NOx=0x%04X\n",
                r.humidity, r.temperature, r.vocIndex, r.noxIndex);
}

void printDeviceStatus(const SEN5x::DeviceStatusRegister& s) {
  Serial.printf("Device status: 0x%08lX\n", static_cast<unsigned long>(s.raw));
  Serial.printf("  Fan speed warning: %s\n", s.fanSpeedWarning ? "YES" : "no");
  Serial.printf("  Fan cleaning:      %s\n", s.fanCleaning ? "ACTIVE" : "no");
  Serial.printf("  Gas sensor error:  %s\n", s.gasSensorError ? "YES" : "no");
  Serial.printf("  RHT error:         %s\n", s.rhtError ? "YES" : "no");
  Serial.printf("  Laser failure:     %s\n", s.laserFailure ? "YES" : "no");
  Serial.printf("  Fan failure:       %s\n", s.fanFailure ? "YES" : "no");
}

void resetStressStats(int target) {
  stressStats = StressStats();
  stressStats.active = true;
  stressStats.startMs = millis();
  stressStats.target = target;
}

void finishStressStats() {
  stressStats.active = false;
  const uint32_t durationMs = millis() - stressStats.startMs;

  Serial.println("=== Stress Summary ===");
  Serial.printf("  Target: %d\n", stressStats.target);
  Serial.printf("  Attempts: %d\n", stressStats.attempts);
  Serial.printf("  Success: %d\n", stressStats.success);
  Serial.printf("  Errors: %lu\n", static_cast<unsigned long>(stressStats.errors));
  Serial.printf("  Not-ready polls: %lu\n", static_cast<unsigned long>(stressStats.notReady));
  Serial.printf("  Duration: %lu ms\n", static_cast<unsigned long>(durationMs));

  if (stressStats.success > 0) {
    Serial.printf("  PM2.5: min=%.1f avg=%.1f max=%.1f\n",
                  stressStats.minPm25,
                  static_cast<float>(stressStats.sumPm25 / stressStats.success),
                  stressStats.maxPm25);
    Serial.printf("  Temp C avg: %.2f\n",
                  static_cast<float>(stressStats.sumTemp / stressStats.success));
  } else {
    Serial.println("  No valid samples");
  }

  if (!stressStats.lastError.ok()) {
    Serial.printf("  Last error: %s\n", errToStr(stressStats.lastError.code));
  }
}

void noteStressResult(const SEN5x::Status& st, const SEN5x::Measurement& m) {
  stressStats.attempts++;
  if (!st.ok()) {
    stressStats.errors++;
    stressStats.lastError = st;
  } else {
    if (!stressStats.hasSample || m.pm2_5 < stressStats.minPm25) {
      stressStats.minPm25 = m.pm2_5;
    }
    if (!stressStats.hasSample || m.pm2_5 > stressStats.maxPm25) {
      stressStats.maxPm25 = m.pm2_5;
    }
    stressStats.hasSample = true;
    stressStats.sumPm25 += m.pm2_5;
    stressStats.sumTemp += m.temperatureC;
    stressStats.success++;
    if (verboseMode) {
      printMeasurement(m);
    }
  }

  if (stressRemaining > 0) {
    stressRemaining--;
  }
  if (stressRemaining == 0) {
    finishStressStats();
  }
}

void pollStress() {
  if (!stressStats.active || stressRemaining <= 0) {
    return;
  }
  const uint32_t now = millis();
  if (now - lastPollMs < POLL_INTERVAL_MS) {
    return;
  }
  lastPollMs = now;

  bool ready = false;
  SEN5x::Status st = device.readDataReady(ready);
  SEN5x::Measurement m;
  if (!st.ok()) {
    noteStressResult(st, m);
    return;
  }
  if (!ready) {
    stressStats.notReady++;
    return;
  }
  st = device.readMeasurement(m);
  noteStressResult(st, m);
}

bool parseU32(const String& token, uint32_t& out) {
  const char* str = token.c_str();
  char* end = nullptr;
  const unsigned long value = std::strtoul(str, &end, 0);
  if (end == str || *end != '\0') {
    return false;
  }
  out = static_cast<uint32_t>(value);
  return true;
}

void printHelp() {
  Serial.println("=== Commands ===");
  Serial.println("  help                     - Show this help");
  Serial.println("  scan                     - Scan I2C bus");
  Serial.println("  start                    - Start measurement (all channels)");
  Serial.println("  start_rht                - Start measurement (RH/T and gas only)");
  Serial.println("  stop                     - Stop measurement");
  Serial.println("  reinit                   - Reinitialize device (keeps mode)");
  Serial.println("  ready                    - Read data-ready flag");
  Serial.println("  read                     - Read measurement");
  Serial.println("  raw                      - Read raw measurement words");
  Serial.println("  serial                   - Read serial number");
  Serial.println("  name                     - Read product name");
  Serial.println("  fw                       - Read firmware version");
  Serial.println("  clean                    - Start fan cleaning");
  Serial.println("  interval [seconds]       - Read or write auto-cleaning interval");
  Serial.println("  status                   - Read device status register");
  Serial.println("  clearstatus              - Clear device status register");
  Serial.println("  drv                      - Show driver state and health");
  Serial.println("  probe                    - Probe device (no health tracking)");
  Serial.println("  begin                    - Re-initialize driver");
  Serial.println("  end                      - End driver session");
  Serial.println("  verbose [0|1]            - Enable/disable verbose output");
  Serial.println("  stress [N]               - Read N measurements (device must be started)");
}

// ============================================================================
// Command Processing
// ============================================================================

void processCommand(const String& cmdLine) {
  String cmd = cmdLine;
  cmd.trim();
  if (cmd.length() == 0) {
    return;
  }

  if (cmd == "help" || cmd == "?") {
    printHelp();
    return;
  }

  if (cmd == "scan") {
    i2c::scan();
    return;
  }

  if (cmd == "start") {
    printStatus(device.startMeasurement());
    return;
  }

  if (cmd == "start_rht") {
    printStatus(device.startMeasurementRhtGasOnly());
    return;
  }

  if (cmd == "stop") {
    stressRemaining = 0;
    stressStats.active = false;
    printStatus(device.stopMeasurement());
    return;
  }

  if (cmd == "reinit") {
    printStatus(device.reinit());
    return;
  }

  if (cmd == "ready") {
    bool ready = false;
    const SEN5x::Status st = device.readDataReady(ready);
    if (!st.ok()) {
      printStatus(st);
      return;
    }
    Serial.printf("Data ready: %s\n", ready ? "YES" : "NO");
    return;
  }

  if (cmd == "read") {
    SEN5x::Measurement m;
    const SEN5x::Status st = device.readMeasurement(m);
    if (!st.ok()) {
      printStatus(st);
      return;
    }
    printMeasurement(m);
    return;
  }

  if (cmd == "raw") {
    SEN5x::RawMeasurement r;
    const SEN5x::Status st = device.readMeasurementRaw(r);
    if (!st.ok()) {
      printStatus(st);
      return;
    }
    printRaw(r);
    if (verboseMode) {
      printMeasurement(SEN5x::SEN5x::convert(r));
    }
    return;
  }

  if (cmd == "serial") {
    uint64_t serial = 0;
    const SEN5x::Status st = device.readSerialNumber(serial);
    if (!st.ok()) {
      printStatus(st);
      return;
    }
    Serial.printf("Serial: 0x%04lX%08lX\n",
                  static_cast<unsigned long>((serial >> 32) & 0xFFFFUL),
                  static_cast<unsigned long>(serial & 0xFFFFFFFFUL));
    return;
  }

  if (cmd == "name") {
    uint8_t name[SEN5x::cmd::PRODUCT_NAME_LEN] = {};
    const SEN5x::Status st = device.readProductName(name);
    if (!st.ok()) {
      printStatus(st);
      return;
    }
    Serial.print("Product name: ");
    for (size_t i = 0; i < sizeof(name) && name[i] != 0; ++i) {
      Serial.print(static_cast<char>(name[i]));
    }
    Serial.println();
    return;
  }

  if (cmd == "fw") {
    uint8_t version = 0;
    const SEN5x::Status st = device.readFirmwareVersion(version);
    if (!st.ok()) {
      printStatus(st);
      return;
    }
    Serial.printf("Firmware version: %u\n", version);
    return;
  }

  if (cmd == "clean") {
    printStatus(device.startFanCleaning());
    return;
  }

  if (cmd == "interval") {
    uint32_t seconds = 0;
    const SEN5x::Status st = device.readAutoCleaningInterval(seconds);
    if (!st.ok()) {
      printStatus(st);
      return;
    }
    Serial.printf("Auto-cleaning interval: %lu s\n", static_cast<unsigned long>(seconds));
    return;
  }

  if (cmd.startsWith("interval ")) {
    uint32_t seconds = 0;
    String arg = cmd.substring(9);
    arg.trim();
    if (!parseU32(arg, seconds)) {
      LOGW("Invalid interval: %s", arg.c_str());
      return;
    }
    printStatus(device.writeAutoCleaningInterval(seconds));
    return;
  }

  if (cmd == "status") {
    SEN5x::DeviceStatusRegister reg;
    const SEN5x::Status st = device.readDeviceStatus(reg);
    if (!st.ok()) {
      printStatus(st);
      return;
    }
    printDeviceStatus(reg);
    return;
  }

  if (cmd == "clearstatus") {
    printStatus(device.clearDeviceStatus());
    return;
  }

  if (cmd == "drv") {
    printDriverHealth();
    return;
  }

  if (cmd == "probe") {
    LOGI("Probing device (no health tracking)...");
    printStatus(device.probe());
    return;
  }

  if (cmd == "begin") {
    if (!gConfigReady) {
      LOGW("Config not ready");
      return;
    }
    stressRemaining = 0;
    stressStats.active = false;
    printStatus(device.begin(gConfig));
    return;
  }

  if (cmd == "end") {
    stressRemaining = 0;
    stressStats.active = false;
    device.end();
    LOGI("Driver ended");
    return;
  }

  if (cmd == "verbose") {
    Serial.printf("  Verbose: %s\n", verboseMode ? "ON" : "OFF");
    return;
  }

  if (cmd.startsWith("verbose ")) {
    verboseMode = (cmd.substring(8).toInt() != 0);
    LOGI("Verbose mode: %s", verboseMode ? "ON" : "OFF");
    return;
  }

  if (cmd.startsWith("stress")) {
    int count = 10;
    if (cmd.length() > 6) {
      count = cmd.substring(6).toInt();
    }
    if (count <= 0) {
      LOGW("Invalid stress count");
      return;
    }
    if (!device.isMeasuring()) {
      LOGW("Device not measuring; run 'start' first");
      return;
    }
    stressRemaining = count;
    resetStressStats(count);
    LOGI("Starting stress test: %d samples", count);
    return;
  }

  LOGW("Unknown command: %s", cmd.c_str());
}

// ============================================================================
// Setup and Loop
// ============================================================================

void setup() {
  log_begin(board::SERIAL_BAUD);

  LOGI("=== SEN5x Bringup Example (driver v%s) ===", SEN5x::VERSION);

  if (!board::initI2c()) {
    LOGE("Failed to initialize I2C");
    return;
  }
  LOGI("I2C initialized (SDA=%d, SCL=%d)", board::I2C_SDA, board::I2C_SCL);

  i2c::scan();

  gConfig.i2cWrite = transport::wireWrite;
  gConfig.i2cWriteRead = transport::wireWriteRead;
  gConfig.delayMs = transport::arduinoDelay;
  gConfig.nowMs = transport::arduinoMillis;
  gConfig.i2cAddress = SEN5x::cmd::I2C_ADDR_DEFAULT;
  gConfig.i2cTimeoutMs = board::I2C_TIMEOUT_MS;
  gConfig.offlineThreshold = 5;
  gConfigReady = true;

  SEN5x::Status st = device.begin(gConfig);
  if (!st.ok()) {
    LOGE("Failed to initialize driver");
    printStatus(st);
    return;
  }

  st = device.probe();
  if (!st.ok()) {
    LOGW("Device did not respond");
    printStatus(st);
  } else {
    LOGI("Device responded");
  }

  printDriverHealth();
  printHelp();
  Serial.print("> ");
}

void loop() {
  pollStress();

  static String inputBuffer;
  while (Serial.available()) {
    const char c = static_cast<char>(Serial.read());
    if (c == '\n' || c == '\r') {
      if (inputBuffer.length() > 0) {
        processCommand(inputBuffer);
        inputBuffer = "";
        Serial.print("> ");
      }
    } else {
      inputBuffer += c;
    }
  }
}
