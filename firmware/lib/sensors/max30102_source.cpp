#include "max30102_source.h"

namespace max30102 {

namespace {
    constexpr uint8_t kLedModeRedIr = 2;     // SparkFun setup(): slot1 = Red, slot2 = IR
    constexpr uint8_t kSampleAverage = 1;    // raw rate; averaging happens downstream
    constexpr int kAdcRange = 16384;         // nA full scale

    // 18-bit left-justified FIFO word narrowed to 16 bits.
    uint16_t unpack(const uint8_t* b) {
      uint32_t v = ((uint32_t)b[0] << 16) | ((uint32_t)b[1] << 8) | b[2];
      v &= 0x3FFFF;
      return (uint16_t)(v >> 2);
    }
}

Max30102Source::Max30102Source(TwoWire& wire, uint8_t address)
    : wire_(wire), address_(address) {}

// ---- Minimal I2C helpers ----
bool Max30102Source::write8(uint8_t reg, uint8_t val) {
  wire_.beginTransmission(address_);
  wire_.write(reg);
  wire_.write(val);
  return wire_.endTransmission() == 0;
}

int Max30102Source::read8(uint8_t reg) {
  wire_.beginTransmission(address_);
  wire_.write(reg);
  if (wire_.endTransmission(false) != 0) return -1;  // repeated start
  if (wire_.requestFrom((int)address_, 1) != 1) return -1;
  return wire_.read();
}

size_t Max30102Source::readN(uint8_t reg, uint8_t* buf, size_t n) {
  wire_.beginTransmission(address_);
  wire_.write(reg);
  if (wire_.endTransmission(false) != 0) return 0;
  size_t got = wire_.requestFrom((int)address_, (int)n);
  for (size_t i = 0; i < got; ++i) buf[i] = wire_.read();
  return got;
}

bool Max30102Source::begin() {
  wire_.begin(I2C_SDA_PIN, I2C_SCL_PIN);
  wire_.setClock(I2C_CLOCK_HZ);
  delay(10);

  present_ = sensor_.begin(wire_, I2C_SPEED_FAST, address_);
  if (!present_) {
    Serial.println("[MAX30102] not found at 0x57. Check wiring/power.");
    return false;
  }
  Serial.printf("[MAX30102] found, part id 0x%02X rev 0x%02X\n",
                sensor_.readPartID(), sensor_.getRevisionID());
  return true;
}

bool Max30102Source::apply_config(const sensor_config::SensorConfig& cfg) {
  if (!present_) return false;

  // setup() soft-resets, enables FIFO rollover and clears the FIFO.
  sensor_.setup(sensor_config::led_code_for_current(cfg.ir_led_current_ma),
                kSampleAverage, kLedModeRedIr,
                cfg.sample_rate_hz, cfg.pulse_width_us, kAdcRange);
  sensor_.setPulseAmplitudeRed(sensor_config::led_code_for_current(cfg.red_led_current_ma));
  sensor_.setPulseAmplitudeIR(sensor_config::led_code_for_current(cfg.ir_led_current_ma));
  temp_converting_ = false;

  // The library writes blind; read back the part ID to confirm the bus.
  const int part = read8(0xFF);
  if (part != kPartId) {
    Serial.printf("[MAX30102] config readback failed (%d)\n", part);
    return false;
  }
  Serial.printf("[MAX30102] %u Hz, %u us, IR %.1f mA, Red %.1f mA\n",
                cfg.sample_rate_hz, cfg.pulse_width_us,
                cfg.ir_led_current_ma, cfg.red_led_current_ma);
  return true;
}

bool Max30102Source::samples_pending() {
  const int wr = read8(kRegFifoWrPtr);
  const int rd = read8(kRegFifoRdPtr);
  if (wr < 0 || rd < 0) return false;
  if (wr != rd) return true;
  // Equal pointers with a non-zero overflow count means a full FIFO.
  const int ovf = read8(kRegOvfCounter);
  return ovf > 0;
}

bool Max30102Source::read_available(reg_buffer::SampleRingBuffer& out, uint8_t& dropped) {
  dropped = 0;
  const int wr = read8(kRegFifoWrPtr);
  const int ovf = read8(kRegOvfCounter);   // cleared once the read pointer moves
  const int rd = read8(kRegFifoRdPtr);
  if (wr < 0 || ovf < 0 || rd < 0) return false;

  dropped = (uint8_t)(ovf & 0x1F);
  size_t available = (size_t)((wr - rd) & 0x1F);
  if (available == 0 && dropped > 0) available = kFifoDepth;
  if (available > out.free_slots()) available = out.free_slots();

  for (size_t i = 0; i < available; ++i) {
    uint8_t b[6];
    if (readN(kRegFifoData, b, sizeof(b)) != sizeof(b)) return false;
    reg_buffer::RawSample s;
    s.red = unpack(b);
    s.ir = unpack(b + 3);
    out.push(s);
  }
  return true;
}

bool Max30102Source::read_temperature(fifo_ingest::RawTemperature& out) {
  out = fifo_ingest::RawTemperature{};
  if (!temp_converting_) {
    if (!write8(kRegTempConfig, 0x01)) return false;   // TEMP_EN, self-clearing
    temp_converting_ = true;
    return true;
  }

  const int cfg = read8(kRegTempConfig);
  if (cfg < 0) return false;
  if (cfg & 0x01) return true;   // still converting

  const int tint = read8(kRegTempInt);
  const int tfrac = read8(kRegTempFrac);
  if (tint < 0 || tfrac < 0) return false;
  temp_converting_ = false;
  out.integer = (int8_t)tint;
  out.fraction = (uint8_t)(tfrac & 0x0F);
  out.valid = true;
  return true;
}

}  // namespace max30102
