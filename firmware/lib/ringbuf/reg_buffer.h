#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace reg_buffer {

// One MAX3010x FIFO slot, narrowed to 16 bits per channel.
#pragma pack(push, 1)
struct RawSample {
    uint16_t ir;
    uint16_t red;
};
#pragma pack(pop)

static_assert(sizeof(RawSample) == 4, "RawSample must remain 4 bytes (2*uint16)");

// Fixed-size circular buffer staging FIFO reads between ingestion and processing.
// Holds two full device FIFOs (32 slots each). Never overwrites: a full ring
// refuses the push and the caller leaves the sample in the device FIFO.
class SampleRingBuffer {
 public:
    static constexpr size_t kCapacity = 64;
    static_assert((kCapacity & (kCapacity - 1)) == 0, "capacity must be a power of two");

    SampleRingBuffer();

    bool push(const RawSample& sample);        // returns false if buffer is full
    bool pop(RawSample& sample_out);           // returns false if buffer is empty
    size_t pop_batch(RawSample* out, size_t max_count);  // oldest first, returns count
    bool peek(size_t index, RawSample& sample_out) const;  // index relative to oldest
    size_t size() const { return count_; }
    size_t free_slots() const { return kCapacity - count_; }
    bool empty() const { return count_ == 0; }
    bool full() const { return count_ == kCapacity; }
    void clear();

 private:
    static size_t wrap(size_t index) { return index & (kCapacity - 1); }

    std::array<RawSample, kCapacity> slots_{};
    size_t head_ = 0;   // oldest element
    size_t count_ = 0;
};

}  // namespace reg_buffer
