#pragma once

#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>

#include "compute/signal_cond.h"
#include "pipeline/sensor_config.h"

namespace spo2_calc {

struct CalibrationPoint {
    float ratio;
    float spo2;
};

constexpr size_t kMaxCalibrationPoints = 16;

// Ordered (ratio, SpO2) knots for piecewise-linear mapping. Copied at
// construction and never modified afterwards. Ratios must strictly increase;
// a table that breaks this (or has fewer than two points) is empty and every
// lookup returns NAN.
class CalibrationTable {
public:
    CalibrationTable(const CalibrationPoint* points, size_t count);

    template <size_t N>
    explicit CalibrationTable(const CalibrationPoint (&points)[N]) : CalibrationTable(points, N) {}

    // Linear between knots, clamped to the end knots outside the domain.
    float lookup(float ratio) const;

    bool valid() const { return count_ >= 2; }
    size_t size() const { return count_; }
    const CalibrationPoint& point(size_t i) const { return points_[i]; }
    float min_ratio() const { return valid() ? points_[0].ratio : NAN; }
    float max_ratio() const { return valid() ? points_[count_ - 1].ratio : NAN; }

    // Knots of SpO2 = 110 - 25 * R over 0.4 <= R <= 1.6.
    static const CalibrationTable& standard();

private:
    std::array<CalibrationPoint, kMaxCalibrationPoints> points_{};
    size_t count_ = 0;
};

enum class WindowResult : uint8_t {
    kNoWindow,      // no beat has opened a window yet
    kAccepted,
    kNoPulse,       // flat IR AC in the window
    kLowDc,         // a channel's baseline is near zero
    kOutOfTable,    // lookup failed (empty table)
};

const char* to_string(WindowResult r);

// Accumulates one beat-to-beat window and turns it into a smoothed SpO2.
class Spo2Estimator {
public:
    explicit Spo2Estimator(const CalibrationTable& table = CalibrationTable::standard());

    void configure(uint8_t average_beats);
    void reset();

    void add(const signal_cond::ConditionedSample& s);

    // Beat boundary: evaluate the open window (if any), then open a new one.
    WindowResult close_window();
    // Drop the open window's contents and start over from here.
    void restart_window();

    bool valid() const { return count_ > 0; }
    float spo2() const;                   // smoothed, NAN until valid
    float last_ratio() const { return last_ratio_; }
    bool window_open() const { return window_open_; }
    uint32_t window_samples() const { return samples_; }

    static constexpr float kMinWindowDc = 100.0f;

private:
    void clear_window();

    CalibrationTable table_;
    uint8_t window_beats_ = 4;

    bool window_open_ = false;
    uint32_t samples_ = 0;
    float ir_ac_max_ = 0.0f;
    float ir_ac_min_ = 0.0f;
    float red_ac_max_ = 0.0f;
    float red_ac_min_ = 0.0f;
    double ir_dc_sum_ = 0.0;
    double red_dc_sum_ = 0.0;

    std::array<float, sensor_config::kMaxAverageBeats> history_{};
    uint8_t next_ = 0;
    uint8_t count_ = 0;
    float last_ratio_ = NAN;
};

}  // namespace spo2_calc
