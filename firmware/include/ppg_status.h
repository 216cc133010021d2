#pragma once

#include <stdint.h>

// Status values returned by the PPG core. Only configuration misuse and bus
// failures are hard errors; the rest are reported but absorbed.
enum class PpgError : uint8_t {
  kOk = 0,
  kInvalidConfiguration,
  kBufferOverflow,
  kNoFingerDetected,
  kSensorCommunicationFailure,
};

inline const char* to_string(PpgError err) {
  switch (err) {
    case PpgError::kOk: return "ok";
    case PpgError::kInvalidConfiguration: return "invalid configuration";
    case PpgError::kBufferOverflow: return "buffer overflow";
    case PpgError::kNoFingerDetected: return "no finger detected";
    case PpgError::kSensorCommunicationFailure: return "sensor communication failure";
  }
  return "unknown";
}
