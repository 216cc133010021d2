#include "signal_cond.h"

#include <cmath>

namespace signal_cond {

namespace {
    constexpr float kTwoPi = 6.28318530718f;
}

float BaselineFilter::update(float raw) {
  if (!primed_) {
    dc_ = raw;
    primed_ = true;
    return 0.0f;
  }
  dc_ += alpha_ * (raw - dc_);
  return raw - dc_;
}

void BaselineFilter::reset() {
  dc_ = 0.0f;
  primed_ = false;
}

float alpha_for(float cutoff_hz, float sample_rate_hz) {
  if (cutoff_hz <= 0.0f || sample_rate_hz <= 0.0f) return 0.0f;
  return 1.0f - std::exp(-kTwoPi * cutoff_hz / sample_rate_hz);
}

void SignalConditioner::configure(float cutoff_hz, uint16_t sample_rate_hz) {
  const float alpha = alpha_for(cutoff_hz, sample_rate_hz);
  ir_.set_alpha(alpha);
  red_.set_alpha(alpha);
  // tau = 1 / (2*pi*fc) seconds
  settle_samples_ = cutoff_hz > 0.0f
      ? static_cast<uint32_t>(std::ceil(sample_rate_hz / (kTwoPi * cutoff_hz)))
      : 0;
  reset();
}

void SignalConditioner::reset() {
  ir_.reset();
  red_.reset();
  last_ = ConditionedSample{};
  samples_since_prime_ = 0;
}

const ConditionedSample& SignalConditioner::process(const reg_buffer::RawSample& raw) {
  if (primed() && samples_since_prime_ < settle_samples_) ++samples_since_prime_;
  last_.ir_ac = ir_.update(raw.ir);
  last_.red_ac = red_.update(raw.red);
  last_.ir_dc = ir_.dc();
  last_.red_dc = red_.dc();
  return last_;
}

}  // namespace signal_cond
