#pragma once

#include <stdint.h>
#include <Arduino.h>
// General configuration values for the pulse oximeter node.

constexpr uint32_t kSerialBaud = 115200;

// ===== I2C (ESP32 DevKit V1) =====
#define I2C_CLOCK_HZ            400000
#define I2C_SDA_PIN             21
#define I2C_SCL_PIN             22

// 7-bit address of the PPG front end
#define I2C_ADDR_MAX30102       0x57

// ===== Cadences (ms) =====
// The MAX30102 FIFO holds 32 samples: 320 ms at 100 Hz, 80 ms at 400 Hz.
// Poll well inside that so the FIFO never rolls over in normal operation.
#define PPG_POLL_INTERVAL_MS    20
constexpr uint32_t kReportIntervalMs = 1000;   // one summary line per second

// Per-beat log lines
#ifndef PPG_DEBUG
#define PPG_DEBUG               0
#endif

// Run the pipeline on synthetic data instead of the MAX30102 (bench demo)
#ifndef PULSEOX_MOCK_SENSOR
#define PULSEOX_MOCK_SENSOR     0
#endif

// ===== Default acquisition settings =====
constexpr uint16_t kDefaultSampleRateHz = 100;
constexpr uint16_t kDefaultPulseWidthUs = 411;
constexpr float kDefaultIrCurrentMa = 13.8f;   // 0x45, as on the bring-up board
constexpr float kDefaultRedCurrentMa = 13.8f;
