#include "mockdata.h"

#include <algorithm>

namespace mockdata {

namespace {
    constexpr float kTwoPi = 6.28318530718f;

    uint16_t to_counts(float v) {
      if (v <= 0.0f) return 0;
      if (v >= 65535.0f) return 65535;
      return static_cast<uint16_t>(std::lround(v));
    }
}

SyntheticPpgSource::SyntheticPpgSource(float sample_rate_hz, float pulse_hz, Waveform ir, Waveform red)
    : sample_rate_hz_(sample_rate_hz), pulse_hz_(pulse_hz), ir_(ir), red_(red) {}

reg_buffer::RawSample SyntheticPpgSource::sample_at(uint32_t index) const {
  const float t = index / sample_rate_hz_;
  const float s = std::sin(kTwoPi * pulse_hz_ * t);
  reg_buffer::RawSample out;
  out.ir = to_counts(ir_.baseline + ir_.amplitude * s);
  out.red = to_counts(red_.baseline + red_.amplitude * s);
  return out;
}

void SyntheticPpgSource::advance(size_t samples) {
  for (size_t i = 0; i < samples; ++i) {
    ++write_index_;
    // Rollover: the newest sample overwrites the oldest unread one.
    if (pending() > kFifoDepth) {
      ++read_index_;
      if (overflow_counter_ < kOverflowCounterMax) ++overflow_counter_;
    }
  }
}

bool SyntheticPpgSource::apply_config(const sensor_config::SensorConfig& cfg) {
  if (bus_failure_) return false;
  applied_ = cfg;
  sample_rate_hz_ = cfg.sample_rate_hz;
  ++apply_count_;
  // The device clears its FIFO on reconfiguration.
  read_index_ = write_index_;
  overflow_counter_ = 0;
  return true;
}

bool SyntheticPpgSource::samples_pending() {
  return !bus_failure_ && pending() > 0;
}

bool SyntheticPpgSource::read_available(reg_buffer::SampleRingBuffer& out, uint8_t& dropped) {
  dropped = 0;
  if (bus_failure_) return false;

  dropped = overflow_counter_;
  overflow_counter_ = 0;
  while (read_index_ != write_index_ && !out.full()) {
    out.push(sample_at(read_index_));
    ++read_index_;
  }
  return true;
}

bool SyntheticPpgSource::read_temperature(fifo_ingest::RawTemperature& out) {
  out = fifo_ingest::RawTemperature{};
  if (bus_failure_) return false;
  if (!temp_converting_) {
    temp_converting_ = true;   // result is collected on the next call
    return true;
  }
  temp_converting_ = false;
  out.integer = temp_int_;
  out.fraction = temp_frac_;
  out.valid = true;
  return true;
}

}  // namespace mockdata
