#include <Arduino.h>
#include <Wire.h>

#include "app_config.h"
#include "ppg_status.h"
#include "pipeline/pulse_pipeline.h"
#include "pipeline/sensor_config.h"

#if PULSEOX_MOCK_SENSOR
#include "compute/mockdata.h"
#else
#include "sensors/max30102_source.h"
#endif

namespace {

#if PULSEOX_MOCK_SENSOR
// 72 BPM, R = 0.8 -> SpO2 near 90 %
mockdata::SyntheticPpgSource gSource(kDefaultSampleRateHz, 1.2f,
                                     mockdata::Waveform{50000.0f, 2000.0f},
                                     mockdata::Waveform{37500.0f, 1200.0f});
uint32_t gLastAdvanceMs = 0;
#else
max30102::Max30102Source gSource(Wire);
#endif

pulse::PulsePipeline gPipeline(gSource);
bool gRunning = false;
uint32_t gLastReportMs = 0;

void handle_beat(const beat_detect::BeatEvent& ev) {
#if PPG_DEBUG
  Serial.printf("[PPG] beat @%lu ms ibi=%.0f ms bpm=%.1f\n",
                (unsigned long)ev.timestamp_ms, ev.ibi_ms,
                gPipeline.read_processed_data().heart_rate_bpm);
#else
  (void)ev;
#endif
}

void handle_ibi_rejected(const beat_detect::BeatEvent& ev) {
#if PPG_DEBUG
  Serial.printf("[PPG] ibi %.0f ms rejected\n", ev.ibi_ms);
#else
  (void)ev;
#endif
}

void handle_overflow(uint8_t dropped) {
  Serial.printf("[PPG] FIFO overflow, %u samples lost\n", dropped);
}

void handle_finger(bool present) {
  Serial.println(present ? "[PPG] Finger detected" : "[PPG] Finger removed");
}

void handle_window_rejected(spo2_calc::WindowResult result) {
#if PPG_DEBUG
  Serial.printf("[PPG] SpO2 window rejected: %s\n", spo2_calc::to_string(result));
#else
  (void)result;
#endif
}

void report() {
  const pulse::ProcessedData d = gPipeline.read_processed_data();
  if (d.status == PpgError::kNoFingerDetected) {
    Serial.println("[PPG] No finger");
    return;
  }

  char hr[12] = "--";
  char spo2[12] = "--";
  char temp[12] = "--";
  if (d.heart_rate_valid) snprintf(hr, sizeof(hr), "%.1f", d.heart_rate_bpm);
  if (d.spo2_valid) snprintf(spo2, sizeof(spo2), "%.1f", d.spo2_percent);
  if (d.temperature_valid) snprintf(temp, sizeof(temp), "%.2f", d.temperature_c);
  const char* note = "";
  if (d.status == PpgError::kBufferOverflow) note = " (resettling after overflow)";
  else if (!d.valid) note = " (acquiring)";
  Serial.printf("[PPG] HR=%s bpm SpO2=%s %% T=%s C%s\n", hr, spo2, temp, note);
}

}  // namespace

void setup() {
  Serial.begin(kSerialBaud);
  delay(200);
  Serial.println();
  Serial.println("============================");
  Serial.println("ESP32 Pulse Oximeter Boot");
  Serial.println("============================");

#if PULSEOX_MOCK_SENSOR
  Serial.println("[MAIN] Using synthetic PPG source");
#else
  if (!gSource.begin()) {
    Serial.println("[MAIN] MAX30102 init failed.");
    return;  // Don't continue without a sensor
  }
#endif

  gPipeline.onBeat = handle_beat;
  gPipeline.onIbiRejected = handle_ibi_rejected;
  gPipeline.onOverflow = handle_overflow;
  gPipeline.onFingerChange = handle_finger;
  gPipeline.onWindowRejected = handle_window_rejected;

  sensor_config::SensorConfig cfg;
  cfg.mode = sensor_config::Mode::kHeartRateAndSpo2;
  cfg.sample_rate_hz = kDefaultSampleRateHz;
  cfg.pulse_width_us = kDefaultPulseWidthUs;
  cfg.ir_led_current_ma = kDefaultIrCurrentMa;
  cfg.red_led_current_ma = kDefaultRedCurrentMa;

  const PpgError err = gPipeline.configure(cfg);
  if (err != PpgError::kOk) {
    const char* why = gPipeline.last_config_error();
    Serial.printf("[MAIN] Configure failed: %s (%s)\n", to_string(err), why ? why : "-");
    return;
  }
  gRunning = gPipeline.activate();
  Serial.printf("[MAIN] Pipeline %s, mode %s, %u Hz\n",
                pulse::to_string(gPipeline.state()),
                sensor_config::mode_name(cfg.mode), cfg.sample_rate_hz);
}

void loop() {
  if (!gRunning) {
    delay(1000);
    return;
  }

  const uint32_t now = millis();

#if PULSEOX_MOCK_SENSOR
  // Let the fake device produce as many samples as wall time allows.
  const uint32_t elapsed = now - gLastAdvanceMs;
  const size_t due = (size_t)elapsed * kDefaultSampleRateHz / 1000;
  if (due > 0) {
    gSource.advance(due);
    gLastAdvanceMs += (uint32_t)(due * 1000 / kDefaultSampleRateHz);
  }
#endif

  if (gPipeline.is_ready()) {
    const PpgError err = gPipeline.poll();
    if (err != PpgError::kOk) {
      Serial.printf("[PPG] poll error: %s\n", to_string(err));
    }
  }

  if ((now - gLastReportMs) >= kReportIntervalMs) {
    report();
    gLastReportMs = now;
  }

  delay(PPG_POLL_INTERVAL_MS);
}
