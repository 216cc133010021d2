#include "beat_detect.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace beat_detect {

// ---------------- BpmEstimate ----------------

void BpmEstimate::configure(uint8_t window, float min_bpm, float max_bpm) {
  window_ = std::max<uint8_t>(1, std::min(window, sensor_config::kMaxAverageBeats));
  min_ibi_ms_ = 60000.0f / max_bpm;
  max_ibi_ms_ = 60000.0f / min_bpm;
  reset();
}

void BpmEstimate::reset() {
  ibis_.fill(0.0f);
  next_ = 0;
  count_ = 0;
}

bool BpmEstimate::is_plausible(float ibi_ms) const {
  return ibi_ms >= min_ibi_ms_ && ibi_ms <= max_ibi_ms_;
}

bool BpmEstimate::add_ibi(float ibi_ms) {
  if (!is_plausible(ibi_ms)) return false;
  ibis_[next_] = ibi_ms;
  next_ = (next_ + 1) % window_;
  if (count_ < window_) ++count_;
  return true;
}

float BpmEstimate::mean_ibi_ms() const {
  if (count_ == 0) return NAN;
  float sum = 0.0f;
  for (uint8_t i = 0; i < count_; ++i) sum += ibis_[i];
  return sum / count_;
}

float BpmEstimate::bpm() const {
  if (count_ == 0) return NAN;
  return 60000.0f / mean_ibi_ms();
}

// ---------------- BeatDetector ----------------

void BeatDetector::configure(const sensor_config::SensorConfig& cfg) {
  sample_rate_hz_ = cfg.sample_rate_hz;
  threshold_fraction_ = cfg.threshold_fraction;
  min_amplitude_ = cfg.min_beat_amplitude;
  refractory_samples_ = sensor_config::refractory_samples(cfg);
  lost_beat_samples_ = static_cast<uint32_t>(std::ceil(cfg.sample_rate_hz * 60.0f / cfg.min_bpm));
  bpm_.configure(cfg.bpm_average_beats, cfg.min_bpm, cfg.max_bpm);
  reset();
}

void BeatDetector::reset() {
  clock_ = 0;
  restart();
}

void BeatDetector::restart() {
  bpm_.reset();
  state_ = State::kBelow;
  prev_ = 0.0f;
  prev2_ = 0.0f;
  have_prev_ = false;
  have_prev2_ = false;
  cycle_open_ = false;
  amplitude_ = 0.0f;
  last_peak_index_ = 0;
  reference_index_ = 0;
  reference_offset_ = 0.0f;
  has_reference_ = false;
  last_accepted_index_ = 0;
  has_accepted_ = false;
  last_event_ = BeatEvent{};
}

float BeatDetector::reference_amplitude() const {
  if (amplitude_ > 0.0f) return amplitude_;
  return cycle_open_ ? cycle_max_ - cycle_min_ : 0.0f;
}

float BeatDetector::threshold() const {
  return threshold_fraction_ * reference_amplitude();
}

uint32_t BeatDetector::to_ms(uint32_t index) const {
  return static_cast<uint32_t>(static_cast<uint64_t>(index) * 1000u / sample_rate_hz_);
}

uint32_t BeatDetector::samples_since_accepted() const {
  if (!has_accepted_) return std::numeric_limits<uint32_t>::max();
  return clock_ - last_accepted_index_;
}

void BeatDetector::restart_cycle(uint32_t index, float value) {
  cycle_max_ = value;
  cycle_min_ = value;
  cycle_start_ = index;
  cycle_open_ = true;
}

void BeatDetector::skip(uint32_t samples) {
  clock_ += samples;
  state_ = State::kBelow;
  have_prev_ = false;
  have_prev2_ = false;
  cycle_open_ = false;
  // A peak may be hidden in the gap; the next beat starts a new interval.
  has_reference_ = false;
}

BeatOutcome BeatDetector::process(float ir_ac) {
  const uint32_t index = clock_++;

  if (!cycle_open_) {
    restart_cycle(index, ir_ac);
  } else {
    cycle_max_ = std::max(cycle_max_, ir_ac);
    cycle_min_ = std::min(cycle_min_, ir_ac);
  }

  BeatOutcome outcome = BeatOutcome::kNone;
  const float thr = threshold();

  const bool armed = reference_amplitude() >= min_amplitude_;

  switch (state_) {
    case State::kBelow:
      if (have_prev_ && prev_ <= thr && ir_ac > thr && armed) {
        state_ = State::kAbove;
      }
      break;
    case State::kAbove:
      // First decrease marks the previous sample as the peak.
      if (ir_ac < prev_) {
        outcome = on_peak(index - 1, prev_, ir_ac);
        state_ = State::kRefractory;
      }
      break;
    case State::kRefractory:
      if (index - last_peak_index_ >= refractory_samples_) {
        // At fast rates the next upstroke can cross the threshold before the
        // refractory interval ends; keep tracking it if it is still rising.
        const bool rising_above = have_prev_ && ir_ac > thr && ir_ac > prev_ && armed;
        state_ = rising_above ? State::kAbove : State::kBelow;
      }
      break;
  }

  // No beat for a whole max-IBI: pulse amplitude probably fell, re-learn it.
  if (outcome == BeatOutcome::kNone && index - cycle_start_ >= lost_beat_samples_) {
    amplitude_ = cycle_max_ - cycle_min_;
    restart_cycle(index, ir_ac);
    if (state_ == State::kAbove) state_ = State::kBelow;
  }

  prev2_ = prev_;
  have_prev2_ = have_prev_;
  prev_ = ir_ac;
  have_prev_ = true;
  return outcome;
}

// Vertex of the parabola through the samples around the peak, in samples
// relative to the peak sample (|offset| <= 0.5).
float BeatDetector::peak_offset(float current) const {
  if (!have_prev2_) return 0.0f;
  const float denom = prev2_ - 2.0f * prev_ + current;
  if (!(denom < 0.0f)) return 0.0f;
  const float offset = 0.5f * (prev2_ - current) / denom;
  return std::max(-0.5f, std::min(0.5f, offset));
}

BeatOutcome BeatDetector::on_peak(uint32_t peak_index, float peak_value, float current) {
  last_peak_index_ = peak_index;
  const float offset = peak_offset(current);

  BeatEvent ev;
  ev.sample_index = peak_index;
  ev.timestamp_ms = to_ms(peak_index);

  BeatOutcome outcome;
  if (!has_reference_) {
    outcome = BeatOutcome::kFirst;
    ev.accepted = true;
  } else {
    const float samples = static_cast<float>(peak_index - reference_index_) + (offset - reference_offset_);
    ev.ibi_ms = samples * 1000.0f / sample_rate_hz_;
    if (bpm_.add_ibi(ev.ibi_ms)) {
      outcome = BeatOutcome::kAccepted;
      ev.accepted = true;
    } else if (ev.ibi_ms > bpm_.max_ibi_ms()) {
      outcome = BeatOutcome::kRejectedLong;
    } else {
      outcome = BeatOutcome::kRejectedShort;
    }
  }
  last_event_ = ev;

  if (outcome == BeatOutcome::kRejectedShort) return outcome;

  has_reference_ = true;
  reference_index_ = peak_index;
  reference_offset_ = offset;
  if (ev.accepted) {
    has_accepted_ = true;
    last_accepted_index_ = peak_index;
  }

  // Next cycle runs peak to peak.
  amplitude_ = cycle_max_ - cycle_min_;
  restart_cycle(peak_index, peak_value);
  cycle_min_ = std::min(cycle_min_, current);
  return outcome;
}

}  // namespace beat_detect
