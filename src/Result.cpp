/// @file Result.cpp
/// @brief Conversion status and result decoding

#include "LTC2983/Result.h"

namespace LTC2983 {

float ConversionResult::temperature() const {
  return static_cast<float>(raw) / static_cast<float>(1UL << cmd::RESULT_FRAC_BITS);
}

ConversionStatus decodeStatus(uint8_t raw) {
  ConversionStatus status;
  status.started = (raw & cmd::MASK_STATUS_START) != 0;
  status.done = (raw & cmd::MASK_STATUS_DONE) != 0;
  status.channel = static_cast<uint8_t>((raw & cmd::MASK_STATUS_CHANNEL) >> cmd::BIT_STATUS_CHANNEL);
  return status;
}

ConversionResult decodeResult(uint8_t channel, uint32_t word) {
  uint8_t faultByte = static_cast<uint8_t>((word & cmd::MASK_RESULT_FAULTS) >> cmd::BIT_RESULT_FAULTS);
  uint32_t data = (word & cmd::MASK_RESULT_DATA) >> cmd::BIT_RESULT_DATA;

  // Sign-extend 24-bit two's complement
  int32_t value = static_cast<int32_t>(data);
  if ((data & cmd::RESULT_SIGN_BIT) != 0) {
    value -= static_cast<int32_t>(cmd::MASK_RESULT_DATA) + 1;
  }

  ConversionResult result;
  result.channel = channel;
  result.raw = value;
  result.faults = static_cast<uint8_t>(faultByte & cmd::MASK_FAULT_BITS);
  result.valid = (faultByte & cmd::RESULT_VALID) != 0;
  return result;
}

} // namespace LTC2983
