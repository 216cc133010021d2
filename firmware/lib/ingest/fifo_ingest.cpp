#include "fifo_ingest.h"

namespace fifo_ingest {

FifoIngest::FifoIngest(SampleSource& source) : source_(source) {}

DrainResult FifoIngest::drain(reg_buffer::SampleRingBuffer& ring) {
  DrainResult result;
  const size_t before = ring.size();

  uint8_t dropped = 0;
  const bool bus_ok = source_.read_available(ring, dropped);

  // A transfer that fails part way keeps the samples it already delivered.
  result.count = ring.size() - before;
  counters_.samples_read += result.count;
  if (!bus_ok) {
    result.error = PpgError::kSensorCommunicationFailure;
    return result;
  }

  result.dropped = dropped;
  result.overflow = dropped > 0;
  if (result.overflow) {
    ++counters_.overflow_events;
    counters_.samples_dropped += dropped;
  }
  return result;
}

}  // namespace fifo_ingest
