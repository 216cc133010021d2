#pragma once

#include <cstdint>

#include "pipeline/sensor_config.h"
#include "ringbuf/reg_buffer.h"

namespace fifo_ingest {

// Die temperature as the MAX3010x reports it: signed integer part plus a
// fraction in 1/16 degC steps. `valid` is false while a conversion is pending.
struct RawTemperature {
    int8_t integer = 0;
    uint8_t fraction = 0;
    bool valid = false;

    float celsius() const { return integer + fraction * 0.0625f; }
};

// Device-side collaborator delivering PPG samples. Every call is non-blocking;
// a false return means the bus transaction failed and is not retried here.
class SampleSource {
 public:
    virtual ~SampleSource() = default;

    // Push LED drive, sample rate and pulse width to the device.
    virtual bool apply_config(const sensor_config::SensorConfig& cfg) = 0;

    // Cheap check for at least one unread sample. False on bus failure too.
    virtual bool samples_pending() = 0;

    // Move unread samples into `out`, oldest first, stopping when `out` is full.
    // `dropped` receives the number of samples lost to FIFO overflow since the
    // previous call (0 if none).
    virtual bool read_available(reg_buffer::SampleRingBuffer& out, uint8_t& dropped) = 0;

    // Start or collect a die temperature conversion.
    virtual bool read_temperature(RawTemperature& out) = 0;
};

}  // namespace fifo_ingest
