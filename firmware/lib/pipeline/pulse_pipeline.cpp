#include "pulse_pipeline.h"

#include <array>

namespace pulse {

using beat_detect::BeatOutcome;
using sensor_config::Stages;

const char* to_string(LifecycleState state) {
  switch (state) {
    case LifecycleState::kUnconfigured: return "unconfigured";
    case LifecycleState::kConfigured: return "configured";
    case LifecycleState::kActive: return "active";
  }
  return "unknown";
}

PulsePipeline::PulsePipeline(fifo_ingest::SampleSource& source,
                             const spo2_calc::CalibrationTable& table)
    : source_(source), ingest_(source), spo2_(table) {
  reset_processing();
}

PpgError PulsePipeline::configure(const sensor_config::SensorConfig& cfg) {
  const char* reason = nullptr;
  if (!sensor_config::validate(cfg, &reason)) {
    config_error_ = reason;
    return PpgError::kInvalidConfiguration;
  }
  if (!source_.apply_config(cfg)) {
    config_error_ = "device rejected settings";
    return PpgError::kSensorCommunicationFailure;
  }

  config_error_ = nullptr;
  config_ = cfg;
  reset_processing();
  state_ = LifecycleState::kConfigured;
  return PpgError::kOk;
}

bool PulsePipeline::activate() {
  if (state_ == LifecycleState::kUnconfigured) return false;
  state_ = LifecycleState::kActive;
  return true;
}

void PulsePipeline::deactivate() {
  if (state_ == LifecycleState::kActive) state_ = LifecycleState::kConfigured;
}

void PulsePipeline::reset() {
  config_ = sensor_config::SensorConfig{};
  config_error_ = nullptr;
  reset_processing();
  state_ = LifecycleState::kUnconfigured;
}

bool PulsePipeline::is_ready() {
  return state_ == LifecycleState::kActive && ingest_.pending();
}

void PulsePipeline::reset_processing() {
  ring_.clear();
  ingest_.reset_counters();
  conditioner_.configure(config_.baseline_cutoff_hz, config_.sample_rate_hz);
  detector_.configure(config_);
  spo2_.configure(config_.spo2_average_beats);

  finger_present_ = false;
  samples_processed_ = 0;
  sample_clock_ = 0;
  beats_accepted_ = 0;
  beats_rejected_ = 0;
  windows_accepted_ = 0;
  windows_rejected_ = 0;
  recovering_ = false;

  next_temperature_clock_ = 0;
  temperature_pending_ = false;
  temperature_valid_ = false;
  temperature_c_ = NAN;
}

PpgError PulsePipeline::poll() {
  if (state_ != LifecycleState::kActive) return PpgError::kOk;

  // Mode is resolved once per tick.
  const Stages stages = sensor_config::stages_for(config_.mode);

  const fifo_ingest::DrainResult drained = ingest_.drain(ring_);
  if (drained.overflow) handle_overflow(drained.dropped, stages);

  // Samples delivered before a bus failure are still processed, in order.
  std::array<reg_buffer::RawSample, kBatchSize> batch;
  size_t n;
  while ((n = ring_.pop_batch(batch.data(), batch.size())) > 0) {
    for (size_t i = 0; i < n; ++i) process_sample(batch[i], stages);
  }

  if (drained.error != PpgError::kOk) return drained.error;
  return poll_temperature();
}

void PulsePipeline::handle_overflow(uint8_t dropped, const Stages& stages) {
  sample_clock_ += dropped;
  recovering_ = true;
  if (onOverflow) onOverflow(dropped);

  // A baseline that never settled is worthless after a gap; re-prime it.
  if (!conditioner_.settled()) conditioner_.reset();

  detector_.skip(dropped);
  if (stages.estimate_spo2 && spo2_.window_open()) spo2_.restart_window();
}

void PulsePipeline::process_sample(const reg_buffer::RawSample& raw, const Stages& stages) {
  const signal_cond::ConditionedSample& s = conditioner_.process(raw);
  ++samples_processed_;
  ++sample_clock_;

  const bool present = s.ir_dc >= config_.finger_dc_threshold;
  if (present != finger_present_) {
    finger_present_ = present;
    detector_.restart();
    if (stages.estimate_spo2) spo2_.reset();
    if (onFingerChange) onFingerChange(present);
  }
  if (!present) {
    detector_.skip(1);
    return;
  }

  handle_beat(detector_.process(s.ir_ac), stages);
  // After the beat so a new window starts just past the peak.
  if (stages.estimate_spo2) spo2_.add(s);
}

void PulsePipeline::handle_beat(BeatOutcome outcome, const Stages& stages) {
  const beat_detect::BeatEvent& ev = detector_.last_event();
  switch (outcome) {
    case BeatOutcome::kNone:
      return;
    case BeatOutcome::kFirst:
      // No beat-to-beat span behind it (start, finger placed, or a gap).
      ++beats_accepted_;
      if (stages.estimate_spo2) spo2_.restart_window();
      if (onBeat) onBeat(ev);
      return;
    case BeatOutcome::kAccepted: {
      ++beats_accepted_;
      recovering_ = false;
      if (stages.estimate_spo2) {
        const spo2_calc::WindowResult r = spo2_.close_window();
        if (r == spo2_calc::WindowResult::kAccepted) {
          ++windows_accepted_;
        } else if (r != spo2_calc::WindowResult::kNoWindow) {
          ++windows_rejected_;
          if (onWindowRejected) onWindowRejected(r);
        }
      }
      if (onBeat) onBeat(ev);
      return;
    }
    case BeatOutcome::kRejectedLong:
      ++beats_rejected_;
      if (stages.estimate_spo2) spo2_.restart_window();
      if (onIbiRejected) onIbiRejected(ev);
      return;
    case BeatOutcome::kRejectedShort:
      ++beats_rejected_;
      if (onIbiRejected) onIbiRejected(ev);
      return;
  }
}

PpgError PulsePipeline::poll_temperature() {
  if (!temperature_pending_ && sample_clock_ < next_temperature_clock_) return PpgError::kOk;

  fifo_ingest::RawTemperature raw;
  if (!source_.read_temperature(raw)) return PpgError::kSensorCommunicationFailure;

  if (!raw.valid) {
    temperature_pending_ = true;
    return PpgError::kOk;
  }
  temperature_pending_ = false;
  temperature_valid_ = true;
  temperature_c_ = raw.celsius();
  next_temperature_clock_ = sample_clock_ + config_.sample_rate_hz;  // ~1 s
  return PpgError::kOk;
}

bool PulsePipeline::beats_fresh() const {
  const uint32_t stale_samples = kStaleBeatMs * config_.sample_rate_hz / 1000u;
  return detector_.samples_since_accepted() <= stale_samples;
}

ProcessedData PulsePipeline::read_processed_data() const {
  ProcessedData out;
  out.temperature_valid = temperature_valid_;
  out.temperature_c = temperature_c_;
  if (state_ == LifecycleState::kUnconfigured) return out;

  out.finger_present = finger_present_;
  if (!finger_present_) {
    if (samples_processed_ > 0) out.status = PpgError::kNoFingerDetected;
    return out;
  }

  if (recovering_) out.status = PpgError::kBufferOverflow;

  const Stages stages = sensor_config::stages_for(config_.mode);
  const bool fresh = beats_fresh();
  if (stages.report_bpm && fresh && detector_.estimate().valid()) {
    out.heart_rate_bpm = detector_.estimate().bpm();
    out.heart_rate_valid = true;
  }
  if (stages.estimate_spo2 && fresh && spo2_.valid()) {
    out.spo2_percent = spo2_.spo2();
    out.spo2_valid = true;
  }
  out.valid = (!stages.report_bpm || out.heart_rate_valid) &&
              (!stages.estimate_spo2 || out.spo2_valid);
  return out;
}

PipelineStats PulsePipeline::stats() const {
  PipelineStats s;
  const fifo_ingest::IngestCounters& c = ingest_.counters();
  s.samples_processed = samples_processed_;
  s.beats_accepted = beats_accepted_;
  s.beats_rejected = beats_rejected_;
  s.overflow_events = c.overflow_events;
  s.samples_dropped = c.samples_dropped;
  s.windows_accepted = windows_accepted_;
  s.windows_rejected = windows_rejected_;
  s.last_ratio = spo2_.last_ratio();
  return s;
}

}  // namespace pulse
