#pragma once

#include <stdint.h>
#include <Arduino.h>
#include <Wire.h>
#include "MAX30105.h"   // SparkFun MAX3010x library (drives the MAX30102 too)

#include "app_config.h"
#include "ingest/sample_source.h"

namespace max30102 {

// Register map subset used for FIFO draining and die temperature.
constexpr uint8_t kRegFifoWrPtr   = 0x04;
constexpr uint8_t kRegOvfCounter  = 0x05;
constexpr uint8_t kRegFifoRdPtr   = 0x06;
constexpr uint8_t kRegFifoData    = 0x07;
constexpr uint8_t kRegTempInt     = 0x1F;
constexpr uint8_t kRegTempFrac    = 0x20;
constexpr uint8_t kRegTempConfig  = 0x21;
constexpr uint8_t kPartId         = 0x15;

constexpr size_t kFifoDepth = 32;

// Sample Source backed by a MAX30102 on the I2C bus. Configuration goes
// through the SparkFun library; FIFO and temperature reads use plain Wire
// transactions so every bus error is visible to the caller.
class Max30102Source : public fifo_ingest::SampleSource {
 public:
  explicit Max30102Source(TwoWire& wire, uint8_t address = I2C_ADDR_MAX30102);

  // Bring up the bus and probe the part. False if nothing answers.
  bool begin();
  bool present() const { return present_; }

  bool apply_config(const sensor_config::SensorConfig& cfg) override;
  bool samples_pending() override;
  bool read_available(reg_buffer::SampleRingBuffer& out, uint8_t& dropped) override;
  bool read_temperature(fifo_ingest::RawTemperature& out) override;

 private:
  bool write8(uint8_t reg, uint8_t val);
  int read8(uint8_t reg);
  size_t readN(uint8_t reg, uint8_t* buf, size_t n);

  TwoWire& wire_;
  uint8_t address_;
  MAX30105 sensor_;
  bool present_ = false;
  bool temp_converting_ = false;
};

}  // namespace max30102
