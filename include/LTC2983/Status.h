/// @file Status.h
/// @brief Error codes and status handling for LTC2983 driver
#pragma once

#include <cstdint>

namespace LTC2983 {

/// Error codes for all LTC2983 operations
enum class Err : uint8_t {
  OK = 0,                         ///< Operation successful
  NOT_INITIALIZED,                ///< begin() not called
  INVALID_CONFIG,                 ///< Invalid configuration parameter
  BUS_ERROR,                      ///< Transport (SPI) failure
  INVALID_PARAM,                  ///< Invalid parameter value
  DEVICE_NOT_FOUND,               ///< LTC2983 not responding
  IN_PROGRESS,                    ///< Conversion started; poll readStatus()
  INVALID_CHANNEL,                ///< Channel outside 1..20
  INVALID_COLD_JUNCTION_CHANNEL,  ///< Cold junction invalid or self-referencing
  PARAMETER_OUT_OF_RANGE,         ///< Probe parameter fails validation
  UNSUPPORTED_PROBE_TYPE,         ///< Sensor type has no implemented encoding
  STALE_RESULT                    ///< Result read without matching done status
};

/// Status structure returned by all fallible operations
struct Status {
  Err code = Err::OK;
  int32_t detail = 0;        ///< Implementation-specific detail (e.g., bus error code)
  const char* msg = "";      ///< Static string describing the error

  constexpr Status() = default;
  constexpr Status(Err codeIn, int32_t detailIn, const char* msgIn)
      : code(codeIn), detail(detailIn), msg(msgIn) {}

  /// @return true if operation succeeded
  constexpr bool ok() const { return code == Err::OK; }

  /// @return true if operation in progress (not a failure)
  constexpr bool inProgress() const { return code == Err::IN_PROGRESS; }

  /// Create a success status
  static constexpr Status Ok() { return Status{Err::OK, 0, "OK"}; }

  /// Create an error status
  static constexpr Status Error(Err err, const char* message, int32_t detailCode = 0) {
    return Status{err, detailCode, message};
  }
};

} // namespace LTC2983
