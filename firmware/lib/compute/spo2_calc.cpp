#include "spo2_calc.h"

#include <algorithm>
#include <cmath>

namespace spo2_calc {

namespace {
    constexpr CalibrationPoint kStandardPoints[] = {
        {0.4f, 100.0f},
        {0.6f, 95.0f},
        {0.8f, 90.0f},
        {1.0f, 85.0f},
        {1.2f, 80.0f},
        {1.6f, 70.0f},
    };
}

// ---------------- CalibrationTable ----------------

CalibrationTable::CalibrationTable(const CalibrationPoint* points, size_t count) {
  if (!points || count < 2 || count > kMaxCalibrationPoints) return;
  for (size_t i = 1; i < count; ++i) {
    if (!(points[i].ratio > points[i - 1].ratio)) return;
  }
  std::copy(points, points + count, points_.begin());
  count_ = count;
}

const CalibrationTable& CalibrationTable::standard() {
  static const CalibrationTable table(kStandardPoints);
  return table;
}

float CalibrationTable::lookup(float ratio) const {
  if (!valid() || std::isnan(ratio)) return NAN;
  if (ratio <= points_[0].ratio) return points_[0].spo2;
  if (ratio >= points_[count_ - 1].ratio) return points_[count_ - 1].spo2;

  size_t hi = 1;
  while (points_[hi].ratio < ratio) ++hi;
  const CalibrationPoint& a = points_[hi - 1];
  const CalibrationPoint& b = points_[hi];
  if (ratio == b.ratio) return b.spo2;
  const float t = (ratio - a.ratio) / (b.ratio - a.ratio);
  return a.spo2 + t * (b.spo2 - a.spo2);
}

const char* to_string(WindowResult r) {
  switch (r) {
    case WindowResult::kNoWindow: return "no window";
    case WindowResult::kAccepted: return "accepted";
    case WindowResult::kNoPulse: return "no pulse";
    case WindowResult::kLowDc: return "low dc";
    case WindowResult::kOutOfTable: return "out of table";
  }
  return "unknown";
}

// ---------------- Spo2Estimator ----------------

Spo2Estimator::Spo2Estimator(const CalibrationTable& table) : table_(table) {}

void Spo2Estimator::configure(uint8_t average_beats) {
  window_beats_ = std::max<uint8_t>(1, std::min(average_beats, sensor_config::kMaxAverageBeats));
  reset();
}

void Spo2Estimator::reset() {
  window_open_ = false;
  clear_window();
  history_.fill(0.0f);
  next_ = 0;
  count_ = 0;
  last_ratio_ = NAN;
}

void Spo2Estimator::clear_window() {
  samples_ = 0;
  ir_ac_max_ = ir_ac_min_ = 0.0f;
  red_ac_max_ = red_ac_min_ = 0.0f;
  ir_dc_sum_ = red_dc_sum_ = 0.0;
}

void Spo2Estimator::add(const signal_cond::ConditionedSample& s) {
  if (!window_open_) return;
  if (samples_ == 0) {
    ir_ac_max_ = ir_ac_min_ = s.ir_ac;
    red_ac_max_ = red_ac_min_ = s.red_ac;
  } else {
    ir_ac_max_ = std::max(ir_ac_max_, s.ir_ac);
    ir_ac_min_ = std::min(ir_ac_min_, s.ir_ac);
    red_ac_max_ = std::max(red_ac_max_, s.red_ac);
    red_ac_min_ = std::min(red_ac_min_, s.red_ac);
  }
  ir_dc_sum_ += s.ir_dc;
  red_dc_sum_ += s.red_dc;
  ++samples_;
}

void Spo2Estimator::restart_window() {
  clear_window();
  window_open_ = true;
}

WindowResult Spo2Estimator::close_window() {
  if (!window_open_ || samples_ == 0) {
    restart_window();
    return WindowResult::kNoWindow;
  }

  const float ir_pp = ir_ac_max_ - ir_ac_min_;
  const float red_pp = red_ac_max_ - red_ac_min_;
  const float ir_dc = static_cast<float>(ir_dc_sum_ / samples_);
  const float red_dc = static_cast<float>(red_dc_sum_ / samples_);
  restart_window();

  if (ir_dc < kMinWindowDc || red_dc < kMinWindowDc) return WindowResult::kLowDc;
  if (!(ir_pp > 0.0f)) return WindowResult::kNoPulse;

  const float ratio = (red_pp / red_dc) / (ir_pp / ir_dc);
  const float value = table_.lookup(ratio);
  if (std::isnan(value)) return WindowResult::kOutOfTable;

  last_ratio_ = ratio;
  history_[next_] = value;
  next_ = (next_ + 1) % window_beats_;
  if (count_ < window_beats_) ++count_;
  return WindowResult::kAccepted;
}

float Spo2Estimator::spo2() const {
  if (count_ == 0) return NAN;
  float sum = 0.0f;
  for (uint8_t i = 0; i < count_; ++i) sum += history_[i];
  return sum / count_;
}

}  // namespace spo2_calc
