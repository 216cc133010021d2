#pragma once

#include <cstdint>

#include "ringbuf/reg_buffer.h"

namespace signal_cond {

struct ConditionedSample {
    float ir_ac = 0.0f;
    float red_ac = 0.0f;
    float ir_dc = 0.0f;
    float red_dc = 0.0f;
};

// First-order exponential baseline tracker for one channel.
class BaselineFilter {
public:
    void set_alpha(float alpha) { alpha_ = alpha; }
    float alpha() const { return alpha_; }

    // Returns the AC part (raw minus updated baseline). The first sample primes
    // the baseline so the output starts at zero.
    float update(float raw);

    float dc() const { return dc_; }
    bool primed() const { return primed_; }
    void reset();

private:
    float alpha_ = 0.0f;
    float dc_ = 0.0f;
    bool primed_ = false;
};

// alpha = 1 - exp(-2*pi*fc/fs)
float alpha_for(float cutoff_hz, float sample_rate_hz);

// Splits each raw IR/Red pair into baseline and pulsatile parts.
class SignalConditioner {
public:
    void configure(float cutoff_hz, uint16_t sample_rate_hz);
    void reset();

    const ConditionedSample& process(const reg_buffer::RawSample& raw);
    const ConditionedSample& last() const { return last_; }

    // One filter time constant has elapsed since priming.
    bool settled() const { return primed() && samples_since_prime_ >= settle_samples_; }
    bool primed() const { return ir_.primed(); }
    uint32_t settle_samples() const { return settle_samples_; }

private:
    BaselineFilter ir_;
    BaselineFilter red_;
    ConditionedSample last_;
    uint32_t samples_since_prime_ = 0;
    uint32_t settle_samples_ = 0;
};

}  // namespace signal_cond
