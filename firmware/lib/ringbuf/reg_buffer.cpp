#include "reg_buffer.h"

#include <algorithm>

namespace reg_buffer {

SampleRingBuffer::SampleRingBuffer() = default;

bool SampleRingBuffer::push(const RawSample& sample) {
  if (full()) return false;
  slots_[wrap(head_ + count_)] = sample;
  ++count_;
  return true;
}

bool SampleRingBuffer::pop(RawSample& sample_out) {
  return pop_batch(&sample_out, 1) == 1;
}

size_t SampleRingBuffer::pop_batch(RawSample* out, size_t max_count) {
  if (!out) return 0;
  const size_t n = std::min(max_count, count_);
  for (size_t i = 0; i < n; ++i) {
    out[i] = slots_[wrap(head_ + i)];
  }
  head_ = wrap(head_ + n);
  count_ -= n;
  return n;
}

bool SampleRingBuffer::peek(size_t index, RawSample& sample_out) const {
  if (index >= count_) return false;
  sample_out = slots_[wrap(head_ + index)];
  return true;
}

void SampleRingBuffer::clear() {
  head_ = 0;
  count_ = 0;
}

}  // namespace reg_buffer
