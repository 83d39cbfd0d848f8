/// @file Log.h
/// @brief Serial logging macros for examples
/// @note NOT part of the library - examples only
#pragma once

#include <Arduino.h>

/// Start the serial console and wait briefly for USB CDC hosts
inline void log_begin(uint32_t baud) {
  Serial.begin(baud);
  const uint32_t start = millis();
  while (!Serial && (millis() - start) < 2000) {
    delay(10);
  }
}

#define LOG_PRINT(level, fmt, ...) \
  Serial.printf("[%lu] " level " " fmt "\n", static_cast<unsigned long>(millis()), ##__VA_ARGS__)

#define LOGI(fmt, ...) LOG_PRINT("I", fmt, ##__VA_ARGS__)
#define LOGW(fmt, ...) LOG_PRINT("W", fmt, ##__VA_ARGS__)
#define LOGE(fmt, ...) LOG_PRINT("E", fmt, ##__VA_ARGS__)
