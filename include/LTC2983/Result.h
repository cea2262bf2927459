/// @file Result.h
/// @brief Conversion status and result decoding for LTC2983
#pragma once

#include <cstdint>

#include "LTC2983/CommandTable.h"

namespace LTC2983 {

/// Hardware fault bits reported in the result word's fault byte
enum class Fault : uint8_t {
  SENSOR_HARD_FAULT     = cmd::FAULT_SENSOR_HARD,
  OPEN_CIRCUIT          = cmd::FAULT_SENSOR_HARD,  ///< Alias: open or shorted sensor
  HARD_ADC_OUT_OF_RANGE = cmd::FAULT_ADC_HARD,
  CJ_HARD_FAULT         = cmd::FAULT_CJ_HARD,
  CJ_SOFT_FAULT         = cmd::FAULT_CJ_SOFT,
  SENSOR_OVER_RANGE     = cmd::FAULT_SENSOR_OVER,
  SENSOR_UNDER_RANGE    = cmd::FAULT_SENSOR_UNDER,
  ADC_OUT_OF_RANGE      = cmd::FAULT_ADC_OUT_OF_RANGE
};

/// Snapshot of the command/status register
struct ConversionStatus {
  bool started = false;   ///< Start bit still set (conversion pending/running)
  bool done = false;      ///< Conversion complete
  uint8_t channel = 0;    ///< Channel the status applies to, 0 = multi-channel

  bool isMultiChannel() const { return channel == cmd::CHANNEL_MULTI; }
};

/// Decoded conversion result.
/// The numeric value is kept even when faults are present.
struct ConversionResult {
  uint8_t channel = 0;
  int32_t raw = 0;         ///< Signed temperature, LSB = 1/1024 degree
  uint8_t faults = 0;      ///< Bitmask of Fault
  bool valid = false;      ///< Device VALID bit

  /// Temperature in the configured unit (Celsius or Fahrenheit)
  float temperature() const;

  bool hasFault(Fault fault) const {
    return (faults & static_cast<uint8_t>(fault)) != 0;
  }
  bool hasAnyFault() const { return faults != 0; }
};

/// Decode the command/status register byte
ConversionStatus decodeStatus(uint8_t raw);

/// Decode a 32-bit result word: fault byte (31:24) + 24-bit two's complement (23:0)
ConversionResult decodeResult(uint8_t channel, uint32_t word);

} // namespace LTC2983
