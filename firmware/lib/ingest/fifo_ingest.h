#pragma once

#include <cstddef>
#include <cstdint>

#include "ingest/sample_source.h"
#include "ppg_status.h"
#include "ringbuf/reg_buffer.h"

namespace fifo_ingest {

struct DrainResult {
    size_t count = 0;       // samples moved into the ring this tick
    uint8_t dropped = 0;    // samples the device lost before this tick
    bool overflow = false;
    PpgError error = PpgError::kOk;
};

struct IngestCounters {
    uint32_t samples_read = 0;
    uint32_t overflow_events = 0;
    uint32_t samples_dropped = 0;
};

// Drains whatever the source currently holds into the staging ring.
class FifoIngest {
public:
    explicit FifoIngest(SampleSource& source);

    DrainResult drain(reg_buffer::SampleRingBuffer& ring);

    bool pending() { return source_.samples_pending(); }

    const IngestCounters& counters() const { return counters_; }
    void reset_counters() { counters_ = IngestCounters{}; }

private:
    SampleSource& source_;
    IngestCounters counters_;
};

}  // namespace fifo_ingest
