#pragma once

#include <stdint.h>

#include <cmath>
#include <cstdlib>

#include "ingest/sample_source.h"
#include "pipeline/sensor_config.h"
#include "ringbuf/reg_buffer.h"

namespace mockdata {

// Baseline plus sinusoidal pulse for one LED channel, in 16-bit ADC counts.
struct Waveform {
  float baseline;
  float amplitude;
};

// Stands in for the MAX30102: samples are a pure function of their index, so
// dropped samples leave the waveform phase intact. Emulates the 32-slot
// rollover FIFO with its saturating overflow counter.
class SyntheticPpgSource : public fifo_ingest::SampleSource {
 public:
  static constexpr size_t kFifoDepth = 32;
  static constexpr uint8_t kOverflowCounterMax = 31;

  SyntheticPpgSource(float sample_rate_hz, float pulse_hz, Waveform ir, Waveform red);

  // Let `samples` sample periods elapse on the device.
  void advance(size_t samples);

  void set_pulse_hz(float pulse_hz) { pulse_hz_ = pulse_hz; }
  void set_ir(Waveform w) { ir_ = w; }
  void set_red(Waveform w) { red_ = w; }
  void set_bus_failure(bool failing) { bus_failure_ = failing; }
  void set_temperature(int8_t integer, uint8_t fraction) { temp_int_ = integer; temp_frac_ = fraction; }

  size_t pending() const { return static_cast<size_t>(write_index_ - read_index_); }
  uint32_t apply_count() const { return apply_count_; }
  const sensor_config::SensorConfig& applied() const { return applied_; }

  // fifo_ingest::SampleSource
  bool apply_config(const sensor_config::SensorConfig& cfg) override;
  bool samples_pending() override;
  bool read_available(reg_buffer::SampleRingBuffer& out, uint8_t& dropped) override;
  bool read_temperature(fifo_ingest::RawTemperature& out) override;

 private:
  reg_buffer::RawSample sample_at(uint32_t index) const;

  float sample_rate_hz_;
  float pulse_hz_;
  Waveform ir_;
  Waveform red_;

  uint32_t write_index_ = 0;   // next sample the device will produce
  uint32_t read_index_ = 0;    // oldest unread sample
  uint8_t overflow_counter_ = 0;

  bool bus_failure_ = false;
  bool temp_converting_ = false;
  int8_t temp_int_ = 31;
  uint8_t temp_frac_ = 8;      // 31.5 C

  uint32_t apply_count_ = 0;
  sensor_config::SensorConfig applied_;
};

}  // namespace mockdata
