/// @file LTC2983.h
/// @brief Main driver class for LTC2983
#pragma once

#include <cstddef>
#include <cstdint>

#include "LTC2983/ChannelMap.h"
#include "LTC2983/CommandTable.h"
#include "LTC2983/Config.h"
#include "LTC2983/ProbeConfig.h"
#include "LTC2983/Result.h"
#include "LTC2983/Status.h"
#include "LTC2983/Version.h"

namespace LTC2983 {

/// Driver state for health monitoring
enum class DriverState : uint8_t {
  UNINIT,    ///< begin() not called or end() called
  READY,     ///< Operational, consecutiveFailures == 0
  DEGRADED,  ///< 1 <= consecutiveFailures < offlineThreshold
  OFFLINE    ///< consecutiveFailures >= offlineThreshold
};

/// LTC2983 driver class.
///
/// Conversions are polled by the caller: startConversion() returns
/// IN_PROGRESS, then readStatus() until done, then readTemperature().
/// The driver never waits and has no timeouts.
class LTC2983 {
public:
  // === Lifecycle ===
  Status begin(const Config& config);
  void end();

  // === Diagnostics (no health tracking) ===
  Status probe();
  Status recover();

  // === Driver State ===
  DriverState state() const { return _driverState; }
  bool isOnline() const {
    return _driverState == DriverState::READY ||
           _driverState == DriverState::DEGRADED;
  }

  // === Health Tracking ===
  Status lastError() const { return _lastError; }
  uint8_t consecutiveFailures() const { return _consecutiveFailures; }
  uint32_t totalFailures() const { return _totalFailures; }
  uint32_t totalSuccess() const { return _totalSuccess; }

  // === Channel Configuration ===
  Status configureChannel(uint8_t channel, const ProbeConfig& probe);
  Status clearChannel(uint8_t channel);
  Status readAssignmentWord(uint8_t channel, uint32_t& word);
  Status readChannelConfig(uint8_t channel, ProbeConfig& probe);

  // === Conversion API ===
  Status startConversion(uint8_t channel);
  Status startMultiConversion(uint32_t channelMask);
  Status readStatus(ConversionStatus& status);
  Status readTemperature(uint8_t channel, ConversionResult& result);

  // === Global Configuration ===
  Status setUnit(TemperatureUnit unit);
  TemperatureUnit getUnit() const { return _config.unit; }

  Status setRejection(Rejection rejection);
  Rejection getRejection() const { return _config.rejection; }

  Status setMuxDelay(uint8_t delay);
  uint8_t getMuxDelay() const { return _config.muxDelay; }

  Status readGlobalConfig(uint8_t& value);

private:
  // === Transport Wrappers ===
  Status _spiReadRaw(uint16_t address, uint8_t* buf, size_t len);
  Status _spiWriteRaw(uint16_t address, const uint8_t* buf, size_t len);
  Status _spiReadTracked(uint16_t address, uint8_t* buf, size_t len);
  Status _spiWriteTracked(uint16_t address, const uint8_t* buf, size_t len);

  // === Register Access ===
  Status readRegister8(uint16_t address, uint8_t& value);
  Status writeRegister8(uint16_t address, uint8_t value);
  Status readRegister32(uint16_t address, uint32_t& value);
  Status writeRegister32(uint16_t address, uint32_t value);
  Status _readRegister8Raw(uint16_t address, uint8_t& value);

  // === Health Tracking ===
  Status _updateHealth(const Status& st);

  // === Internal ===
  Status _applyConfig();
  uint8_t _buildGlobalConfigRegister() const;

  // === State ===
  Config _config;
  bool _initialized = false;
  DriverState _driverState = DriverState::UNINIT;

  // === Health Counters ===
  Status _lastError = Status::Ok();
  uint8_t _consecutiveFailures = 0;
  uint32_t _totalFailures = 0;
  uint32_t _totalSuccess = 0;

  // === Conversion State ===
  uint32_t _multiChannelMask = 0;  ///< Channels of the last multi-channel start
};

} // namespace LTC2983
