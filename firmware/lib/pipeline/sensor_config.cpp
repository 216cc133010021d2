#include "sensor_config.h"

#include <cmath>

namespace sensor_config {

namespace {
    constexpr uint16_t kSampleRates[] = {50, 100, 200, 400, 800, 1000, 1600, 3200};

    struct PulseWidthLimit {
        uint16_t pulse_width_us;
        uint16_t max_rate_hz;
    };

    // Two-LED (SpO2) mode ceilings from the MAX30102 datasheet.
    constexpr PulseWidthLimit kPulseWidths[] = {
        {69, 1600},
        {118, 1000},
        {215, 800},
        {411, 400},
    };

    bool fail(const char** reason, const char* field) {
        if (reason) *reason = field;
        return false;
    }
}

Stages stages_for(Mode mode) {
  switch (mode) {
    case Mode::kHeartRate:        return Stages{true, false};
    case Mode::kSpo2:             return Stages{false, true};
    case Mode::kHeartRateAndSpo2: return Stages{true, true};
  }
  return Stages{false, false};
}

const char* mode_name(Mode mode) {
  switch (mode) {
    case Mode::kHeartRate: return "heart_rate";
    case Mode::kSpo2: return "spo2";
    case Mode::kHeartRateAndSpo2: return "hr_and_spo2";
  }
  return "unknown";
}

uint16_t max_rate_for_pulse_width(uint16_t pulse_width_us) {
  for (const auto& limit : kPulseWidths) {
    if (limit.pulse_width_us == pulse_width_us) return limit.max_rate_hz;
  }
  return 0;
}

bool is_supported_sample_rate(uint16_t sample_rate_hz) {
  for (uint16_t rate : kSampleRates) {
    if (rate == sample_rate_hz) return true;
  }
  return false;
}

bool validate(const SensorConfig& cfg, const char** reason) {
  switch (cfg.mode) {
    case Mode::kHeartRate:
    case Mode::kSpo2:
    case Mode::kHeartRateAndSpo2:
      break;
    default:
      return fail(reason, "mode");
  }

  if (!is_supported_sample_rate(cfg.sample_rate_hz)) return fail(reason, "sample_rate_hz");

  const uint16_t max_rate = max_rate_for_pulse_width(cfg.pulse_width_us);
  if (max_rate == 0) return fail(reason, "pulse_width_us");
  if (cfg.sample_rate_hz > max_rate) return fail(reason, "sample_rate_hz/pulse_width_us");

  // NaN fails every comparison below, so !(x >= lo) style checks reject it.
  if (!(cfg.ir_led_current_ma >= 0.0f && cfg.ir_led_current_ma <= kMaxLedCurrentMa)) {
    return fail(reason, "ir_led_current_ma");
  }
  if (!(cfg.red_led_current_ma >= 0.0f && cfg.red_led_current_ma <= kMaxLedCurrentMa)) {
    return fail(reason, "red_led_current_ma");
  }

  const float nyquist_tenth = cfg.sample_rate_hz / 10.0f;
  if (!(cfg.baseline_cutoff_hz > 0.0f && cfg.baseline_cutoff_hz <= nyquist_tenth)) {
    return fail(reason, "baseline_cutoff_hz");
  }
  if (!(cfg.threshold_fraction > 0.0f && cfg.threshold_fraction < 1.0f)) {
    return fail(reason, "threshold_fraction");
  }
  if (!(cfg.min_bpm > 0.0f && cfg.min_bpm < cfg.max_bpm && cfg.max_bpm <= kMaxBpmCeiling)) {
    return fail(reason, "min_bpm/max_bpm");
  }
  if (!(cfg.refractory_fraction > 0.0f && cfg.refractory_fraction <= 1.0f)) {
    return fail(reason, "refractory_fraction");
  }
  if (refractory_samples(cfg) < 1) return fail(reason, "max_bpm");

  if (cfg.bpm_average_beats < 1 || cfg.bpm_average_beats > kMaxAverageBeats) {
    return fail(reason, "bpm_average_beats");
  }
  if (cfg.spo2_average_beats < 1 || cfg.spo2_average_beats > kMaxAverageBeats) {
    return fail(reason, "spo2_average_beats");
  }
  if (cfg.finger_dc_threshold == 0) return fail(reason, "finger_dc_threshold");

  return true;
}

uint32_t refractory_samples(const SensorConfig& cfg) {
  return static_cast<uint32_t>(std::floor(cfg.refractory_fraction * cfg.sample_rate_hz * 60.0f / cfg.max_bpm));
}

uint8_t led_code_for_current(float current_ma) {
  if (!(current_ma > 0.0f)) return 0;
  if (current_ma >= kMaxLedCurrentMa) return 0xFF;
  return static_cast<uint8_t>(std::lround(current_ma / kLedCurrentStepMa));
}

}  // namespace sensor_config
