#pragma once

#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>

#include "pipeline/sensor_config.h"

namespace beat_detect {

// Moving average over the last N accepted inter-beat intervals.
class BpmEstimate {
public:
    void configure(uint8_t window, float min_bpm, float max_bpm);
    void reset();

    bool is_plausible(float ibi_ms) const;
    bool add_ibi(float ibi_ms);   // false (and no change) if implausible

    bool valid() const { return count_ > 0; }
    float bpm() const;            // NAN until valid
    float mean_ibi_ms() const;
    uint8_t count() const { return count_; }
    float min_ibi_ms() const { return min_ibi_ms_; }
    float max_ibi_ms() const { return max_ibi_ms_; }

private:
    std::array<float, sensor_config::kMaxAverageBeats> ibis_{};
    uint8_t window_ = 4;
    uint8_t next_ = 0;
    uint8_t count_ = 0;
    float min_ibi_ms_ = 60000.0f / 220.0f;
    float max_ibi_ms_ = 60000.0f / 30.0f;
};

enum class State : uint8_t {
    kBelow,       // under the dynamic threshold
    kAbove,       // crossed upward, waiting for the peak
    kRefractory,  // ignoring crossings after a beat
};

enum class BeatOutcome : uint8_t {
    kNone,
    kFirst,          // first beat since reset, no interval yet
    kAccepted,
    kRejectedLong,   // interval below min BPM; beat becomes the new reference
    kRejectedShort,  // interval above max BPM; old reference kept
};

struct BeatEvent {
    uint32_t sample_index = 0;
    uint32_t timestamp_ms = 0;   // from the sample clock
    float ibi_ms = 0.0f;         // 0 for the first beat; sub-sample resolution
    bool accepted = false;
};

// Threshold / peak state machine over the IR AC stream.
class BeatDetector {
public:
    void configure(const sensor_config::SensorConfig& cfg);
    void reset();     // detection state, estimate and sample clock
    void restart();   // detection state and estimate; the clock keeps running

    // Consume one IR AC sample; advances the sample clock by one.
    BeatOutcome process(float ir_ac);

    // Account for samples that were never seen (FIFO overflow, no finger).
    // The interval history is kept; no interval is measured across the gap.
    void skip(uint32_t samples);

    const BeatEvent& last_event() const { return last_event_; }
    const BpmEstimate& estimate() const { return bpm_; }

    State state() const { return state_; }
    float threshold() const;
    float amplitude() const { return amplitude_; }
    uint32_t sample_clock() const { return clock_; }
    uint32_t refractory_samples() const { return refractory_samples_; }

    // Samples since the last accepted beat, UINT32_MAX if none yet.
    uint32_t samples_since_accepted() const;

private:
    BeatOutcome on_peak(uint32_t peak_index, float peak_value, float current);
    float peak_offset(float current) const;
    void restart_cycle(uint32_t index, float value);
    float reference_amplitude() const;
    uint32_t to_ms(uint32_t index) const;

    BpmEstimate bpm_;
    State state_ = State::kBelow;

    uint16_t sample_rate_hz_ = 100;
    float threshold_fraction_ = 0.25f;
    float min_amplitude_ = 20.0f;
    uint32_t refractory_samples_ = 16;
    uint32_t lost_beat_samples_ = 200;

    uint32_t clock_ = 0;              // index of the next sample
    float prev_ = 0.0f;
    float prev2_ = 0.0f;
    bool have_prev_ = false;
    bool have_prev2_ = false;

    // Extremes since the last beat (or since the stretch began)
    float cycle_max_ = 0.0f;
    float cycle_min_ = 0.0f;
    uint32_t cycle_start_ = 0;
    bool cycle_open_ = false;

    float amplitude_ = 0.0f;          // previous cycle peak-to-peak
    uint32_t last_peak_index_ = 0;
    uint32_t reference_index_ = 0;    // interval origin
    float reference_offset_ = 0.0f;   // sub-sample peak position of the origin
    bool has_reference_ = false;
    uint32_t last_accepted_index_ = 0;
    bool has_accepted_ = false;

    BeatEvent last_event_;
};

}  // namespace beat_detect
