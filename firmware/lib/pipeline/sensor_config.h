#pragma once

#include <cstddef>
#include <cstdint>

#include "ppg_status.h"

namespace sensor_config {

// Which estimators run. Resolved once per poll into a Stages set.
enum class Mode : uint8_t {
  kHeartRate,
  kSpo2,
  kHeartRateAndSpo2,
};

// Beat detection always runs: it delimits the SpO2 windows too.
struct Stages {
  bool report_bpm;
  bool estimate_spo2;
};

Stages stages_for(Mode mode);
const char* mode_name(Mode mode);

constexpr uint8_t kMaxAverageBeats = 8;

// MAX30102 limits
constexpr float kMaxLedCurrentMa = 51.0f;     // 0xFF * 0.2 mA
constexpr float kLedCurrentStepMa = 0.2f;
constexpr float kMaxBpmCeiling = 300.0f;

struct SensorConfig {
  Mode mode = Mode::kHeartRateAndSpo2;
  uint16_t sample_rate_hz = 100;
  float ir_led_current_ma = 7.0f;
  float red_led_current_ma = 7.0f;
  uint16_t pulse_width_us = 411;

  // Processing tunables
  float baseline_cutoff_hz = 0.3f;      // DC tracker corner
  float threshold_fraction = 0.25f;     // of previous cycle peak-to-peak
  float min_bpm = 30.0f;
  float max_bpm = 220.0f;
  float refractory_fraction = 0.6f;     // of the shortest plausible interval
  uint8_t bpm_average_beats = 4;
  uint8_t spo2_average_beats = 4;
  uint16_t finger_dc_threshold = 7000;  // IR DC counts (16-bit) for finger present
  uint16_t min_beat_amplitude = 20;     // IR AC peak-to-peak counts
};

// Highest sample rate the MAX30102 supports in two-LED mode at this pulse width.
// Returns 0 for an unsupported pulse width.
uint16_t max_rate_for_pulse_width(uint16_t pulse_width_us);

bool is_supported_sample_rate(uint16_t sample_rate_hz);

// Checks every field; the first offending field name is written to `reason`.
bool validate(const SensorConfig& cfg, const char** reason = nullptr);

// Samples ignored after a beat: floor(refractory_fraction * fs * 60 / max_bpm).
// Kept below the shortest plausible interval so beats near max_bpm are still
// seen and judged by the interval filter.
uint32_t refractory_samples(const SensorConfig& cfg);

// LED amplitude register code for a drive current (0.2 mA per LSB).
uint8_t led_code_for_current(float current_ma);

}  // namespace sensor_config
