#pragma once

#include <cmath>
#include <cstdint>
#include <functional>

#include "compute/beat_detect.h"
#include "compute/signal_cond.h"
#include "compute/spo2_calc.h"
#include "ingest/fifo_ingest.h"
#include "ingest/sample_source.h"
#include "pipeline/sensor_config.h"
#include "ppg_status.h"
#include "ringbuf/reg_buffer.h"

namespace pulse {

enum class LifecycleState : uint8_t {
  kUnconfigured,
  kConfigured,
  kActive,
};

const char* to_string(LifecycleState state);

// Snapshot returned to the caller. Absent values are NAN with the matching
// flag cleared. After a FIFO overflow `status` is kBufferOverflow until the next
// accepted inter-beat interval; estimates from before the gap stay reported
// while they are fresh.
struct ProcessedData {
  float heart_rate_bpm = NAN;
  bool heart_rate_valid = false;
  float spo2_percent = NAN;
  bool spo2_valid = false;
  float temperature_c = NAN;
  bool temperature_valid = false;
  bool finger_present = false;
  bool valid = false;             // every estimator the mode enables is valid
  PpgError status = PpgError::kOk;
};

struct PipelineStats {
  uint32_t samples_processed = 0;
  uint32_t beats_accepted = 0;
  uint32_t beats_rejected = 0;
  uint32_t overflow_events = 0;
  uint32_t samples_dropped = 0;
  uint32_t windows_accepted = 0;
  uint32_t windows_rejected = 0;
  float last_ratio = NAN;
};

// One sensor's processing chain: ingestion, conditioning, beat detection and
// SpO2 estimation. Owns all of its state; run one instance per sensor.
class PulsePipeline {
public:
  explicit PulsePipeline(fifo_ingest::SampleSource& source,
                         const spo2_calc::CalibrationTable& table = spo2_calc::CalibrationTable::standard());

  // Validates, pushes to the device, then resets all processing state.
  // Nothing changes on failure.
  PpgError configure(const sensor_config::SensorConfig& cfg);
  bool activate();
  void deactivate();
  void reset();

  bool is_ready();

  // One ingestion + processing cycle. Returns only hard errors.
  PpgError poll();

  ProcessedData read_processed_data() const;

  LifecycleState state() const { return state_; }
  const sensor_config::SensorConfig& config() const { return config_; }
  const char* last_config_error() const { return config_error_; }
  PipelineStats stats() const;

  // Event hooks, all optional
  std::function<void(const beat_detect::BeatEvent&)> onBeat;
  std::function<void(const beat_detect::BeatEvent&)> onIbiRejected;
  std::function<void(uint8_t dropped)> onOverflow;
  std::function<void(bool present)> onFingerChange;
  std::function<void(spo2_calc::WindowResult)> onWindowRejected;

  static constexpr uint32_t kStaleBeatMs = 3000;

private:
  static constexpr size_t kBatchSize = 16;

  void reset_processing();
  void handle_overflow(uint8_t dropped, const sensor_config::Stages& stages);
  void process_sample(const reg_buffer::RawSample& raw, const sensor_config::Stages& stages);
  void handle_beat(beat_detect::BeatOutcome outcome, const sensor_config::Stages& stages);
  PpgError poll_temperature();
  bool beats_fresh() const;

  fifo_ingest::SampleSource& source_;
  fifo_ingest::FifoIngest ingest_;
  reg_buffer::SampleRingBuffer ring_;
  signal_cond::SignalConditioner conditioner_;
  beat_detect::BeatDetector detector_;
  spo2_calc::Spo2Estimator spo2_;

  sensor_config::SensorConfig config_;
  LifecycleState state_ = LifecycleState::kUnconfigured;
  const char* config_error_ = nullptr;

  bool finger_present_ = false;
  uint32_t samples_processed_ = 0;
  uint32_t sample_clock_ = 0;       // processed + dropped
  uint32_t beats_accepted_ = 0;
  uint32_t beats_rejected_ = 0;
  uint32_t windows_accepted_ = 0;
  uint32_t windows_rejected_ = 0;
  bool recovering_ = false;         // overflow seen, no interval measured since

  uint32_t next_temperature_clock_ = 0;
  bool temperature_pending_ = false;
  bool temperature_valid_ = false;
  float temperature_c_ = NAN;
};

}  // namespace pulse
