/// @file LTC2983.cpp
/// @brief Implementation of LTC2983 driver

#include "LTC2983/LTC2983.h"

#include <climits>

namespace LTC2983 {

namespace {

bool isValidUnit(TemperatureUnit unit) {
  return static_cast<uint8_t>(unit) <= static_cast<uint8_t>(TemperatureUnit::FAHRENHEIT);
}

bool isValidRejection(Rejection rejection) {
  return static_cast<uint8_t>(rejection) <= static_cast<uint8_t>(Rejection::REJECT_50HZ);
}

bool isValidChannelMask(uint32_t mask) {
  return mask != 0 && (mask & ~cmd::MASK_MULTI_CHANNELS) == 0;
}

Status checkColdJunction(uint8_t channel, const ProbeConfig& probe) {
  if (probe.isThermocouple() && probe.thermocoupleParams().coldJunction == channel) {
    return Status::Error(Err::INVALID_COLD_JUNCTION_CHANNEL,
                         "Cold junction cannot be the thermocouple channel", channel);
  }
  return Status::Ok();
}

} // namespace

// ============================================================================
// Lifecycle
// ============================================================================

Status LTC2983::begin(const Config& config) {
  _config = config;
  _initialized = false;
  _driverState = DriverState::UNINIT;
  _multiChannelMask = 0;

  _lastError = Status::Ok();
  _consecutiveFailures = 0;
  _totalFailures = 0;
  _totalSuccess = 0;

  if (_config.spiWrite == nullptr || _config.spiRead == nullptr) {
    return Status::Error(Err::INVALID_CONFIG, "SPI callbacks required");
  }
  if (!isValidUnit(_config.unit) || !isValidRejection(_config.rejection)) {
    return Status::Error(Err::INVALID_CONFIG, "Invalid config enum value");
  }

  if (_config.offlineThreshold == 0) {
    _config.offlineThreshold = 1;
  }

  Status st = probe();
  if (!st.ok()) {
    return st;
  }

  st = _applyConfig();
  if (!st.ok()) {
    return st;
  }

  _initialized = true;
  _driverState = DriverState::READY;
  return Status::Ok();
}

void LTC2983::end() {
  _initialized = false;
  _driverState = DriverState::UNINIT;
  _multiChannelMask = 0;
}

// ============================================================================
// Diagnostics
// ============================================================================

Status LTC2983::probe() {
  uint8_t statusReg = 0;
  Status st = _readRegister8Raw(cmd::REG_COMMAND_STATUS, statusReg);
  if (!st.ok()) {
    if (st.code == Err::INVALID_CONFIG || st.code == Err::INVALID_PARAM) {
      return st;
    }
    return Status::Error(Err::DEVICE_NOT_FOUND, "LTC2983 not responding", st.detail);
  }
  return Status::Ok();
}

Status LTC2983::recover() {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "Driver not initialized");
  }

  uint8_t statusReg = 0;
  return readRegister8(cmd::REG_COMMAND_STATUS, statusReg);
}

// ============================================================================
// Channel Configuration
// ============================================================================

Status LTC2983::configureChannel(uint8_t channel, const ProbeConfig& probe) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "Driver not initialized");
  }

  uint16_t address = 0;
  Status st = assignmentAddress(channel, address);
  if (!st.ok()) {
    return st;
  }
  st = checkColdJunction(channel, probe);
  if (!st.ok()) {
    return st;
  }

  uint32_t word = 0;
  st = probe.encode(word);
  if (!st.ok()) {
    return st;
  }
  return writeRegister32(address, word);
}

Status LTC2983::clearChannel(uint8_t channel) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "Driver not initialized");
  }

  uint16_t address = 0;
  Status st = assignmentAddress(channel, address);
  if (!st.ok()) {
    return st;
  }
  return writeRegister32(address, 0);
}

Status LTC2983::readAssignmentWord(uint8_t channel, uint32_t& word) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "Driver not initialized");
  }

  uint16_t address = 0;
  Status st = assignmentAddress(channel, address);
  if (!st.ok()) {
    return st;
  }
  return readRegister32(address, word);
}

Status LTC2983::readChannelConfig(uint8_t channel, ProbeConfig& probe) {
  uint32_t word = 0;
  Status st = readAssignmentWord(channel, word);
  if (!st.ok()) {
    return st;
  }

  ProbeConfig decoded;
  st = ProbeConfig::decode(word, decoded);
  if (!st.ok()) {
    return st;
  }
  st = checkColdJunction(channel, decoded);
  if (!st.ok()) {
    return st;
  }

  probe = decoded;
  return Status::Ok();
}

// ============================================================================
// Conversion API
// ============================================================================

Status LTC2983::startConversion(uint8_t channel) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "Driver not initialized");
  }
  if (!isValidChannel(channel)) {
    return Status::Error(Err::INVALID_CHANNEL, "Channel must be 1..20", channel);
  }

  Status st = writeRegister8(cmd::REG_COMMAND_STATUS,
                             static_cast<uint8_t>(cmd::CMD_START_CONVERSION | channel));
  if (!st.ok()) {
    return st;
  }

  _multiChannelMask = 0;
  return Status{Err::IN_PROGRESS, channel, "Conversion started"};
}

Status LTC2983::startMultiConversion(uint32_t channelMask) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "Driver not initialized");
  }
  if (!isValidChannelMask(channelMask)) {
    return Status::Error(Err::INVALID_PARAM, "Channel mask must select channels 1..20");
  }

  Status st = writeRegister32(cmd::REG_MULTI_CHANNEL_MASK, channelMask);
  if (!st.ok()) {
    return st;
  }
  st = writeRegister8(cmd::REG_COMMAND_STATUS,
                      static_cast<uint8_t>(cmd::CMD_START_CONVERSION | cmd::CHANNEL_MULTI));
  if (!st.ok()) {
    return st;
  }

  _multiChannelMask = channelMask;
  return Status{Err::IN_PROGRESS, 0, "Multi-channel conversion started"};
}

Status LTC2983::readStatus(ConversionStatus& status) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "Driver not initialized");
  }

  uint8_t statusReg = 0;
  Status st = readRegister8(cmd::REG_COMMAND_STATUS, statusReg);
  if (!st.ok()) {
    return st;
  }
  status = decodeStatus(statusReg);
  return Status::Ok();
}

Status LTC2983::readTemperature(uint8_t channel, ConversionResult& result) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "Driver not initialized");
  }

  uint16_t address = 0;
  Status st = resultAddress(channel, address);
  if (!st.ok()) {
    return st;
  }
  uint32_t maskBit = 0;
  st = channelMaskBit(channel, maskBit);
  if (!st.ok()) {
    return st;
  }

  ConversionStatus status;
  st = readStatus(status);
  if (!st.ok()) {
    return st;
  }
  if (!status.done) {
    return Status::Error(Err::STALE_RESULT, "Conversion not done", status.channel);
  }
  bool matches = status.channel == channel ||
                 (status.isMultiChannel() && (_multiChannelMask & maskBit) != 0);
  if (!matches) {
    return Status::Error(Err::STALE_RESULT, "Status reports another channel", status.channel);
  }

  uint32_t word = 0;
  st = readRegister32(address, word);
  if (!st.ok()) {
    return st;
  }
  result = decodeResult(channel, word);
  return Status::Ok();
}

// ============================================================================
// Global Configuration
// ============================================================================

Status LTC2983::setUnit(TemperatureUnit unit) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "Driver not initialized");
  }
  if (!isValidUnit(unit)) {
    return Status::Error(Err::INVALID_PARAM, "Invalid temperature unit");
  }
  _config.unit = unit;
  return _applyConfig();
}

Status LTC2983::setRejection(Rejection rejection) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "Driver not initialized");
  }
  if (!isValidRejection(rejection)) {
    return Status::Error(Err::INVALID_PARAM, "Invalid rejection");
  }
  _config.rejection = rejection;
  return _applyConfig();
}

Status LTC2983::setMuxDelay(uint8_t delay) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "Driver not initialized");
  }
  _config.muxDelay = delay;
  return _applyConfig();
}

Status LTC2983::readGlobalConfig(uint8_t& value) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "Driver not initialized");
  }
  return readRegister8(cmd::REG_GLOBAL_CONFIG, value);
}

// ============================================================================
// Transport Wrappers
// ============================================================================

Status LTC2983::_spiReadRaw(uint16_t address, uint8_t* buf, size_t len) {
  if (_config.spiRead == nullptr) {
    return Status::Error(Err::INVALID_CONFIG, "SPI read callback missing");
  }
  Status st = _config.spiRead(address, buf, len, _config.spiUser);
  if (!st.ok()) {
    return Status::Error(Err::BUS_ERROR, st.msg, st.detail);
  }
  return st;
}

Status LTC2983::_spiWriteRaw(uint16_t address, const uint8_t* buf, size_t len) {
  if (_config.spiWrite == nullptr) {
    return Status::Error(Err::INVALID_CONFIG, "SPI write callback missing");
  }
  Status st = _config.spiWrite(address, buf, len, _config.spiUser);
  if (!st.ok()) {
    return Status::Error(Err::BUS_ERROR, st.msg, st.detail);
  }
  return st;
}

Status LTC2983::_spiReadTracked(uint16_t address, uint8_t* buf, size_t len) {
  Status st = _spiReadRaw(address, buf, len);
  if (st.code == Err::INVALID_CONFIG || st.code == Err::INVALID_PARAM) {
    return st;
  }
  return _updateHealth(st);
}

Status LTC2983::_spiWriteTracked(uint16_t address, const uint8_t* buf, size_t len) {
  Status st = _spiWriteRaw(address, buf, len);
  if (st.code == Err::INVALID_CONFIG || st.code == Err::INVALID_PARAM) {
    return st;
  }
  return _updateHealth(st);
}

// ============================================================================
// Register Access
// ============================================================================

Status LTC2983::readRegister8(uint16_t address, uint8_t& value) {
  uint8_t rx = 0;
  Status st = _spiReadTracked(address, &rx, 1);
  if (!st.ok()) {
    return st;
  }
  value = rx;
  return Status::Ok();
}

Status LTC2983::writeRegister8(uint16_t address, uint8_t value) {
  return _spiWriteTracked(address, &value, 1);
}

Status LTC2983::readRegister32(uint16_t address, uint32_t& value) {
  uint8_t rx[4] = {0, 0, 0, 0};
  Status st = _spiReadTracked(address, rx, sizeof(rx));
  if (!st.ok()) {
    return st;
  }
  value = (static_cast<uint32_t>(rx[0]) << 24) |
          (static_cast<uint32_t>(rx[1]) << 16) |
          (static_cast<uint32_t>(rx[2]) << 8) |
          rx[3];
  return Status::Ok();
}

Status LTC2983::writeRegister32(uint16_t address, uint32_t value) {
  uint8_t tx[4] = {
    static_cast<uint8_t>((value >> 24) & 0xFF),
    static_cast<uint8_t>((value >> 16) & 0xFF),
    static_cast<uint8_t>((value >> 8) & 0xFF),
    static_cast<uint8_t>(value & 0xFF)
  };
  return _spiWriteTracked(address, tx, sizeof(tx));
}

Status LTC2983::_readRegister8Raw(uint16_t address, uint8_t& value) {
  uint8_t rx = 0;
  Status st = _spiReadRaw(address, &rx, 1);
  if (!st.ok()) {
    return st;
  }
  value = rx;
  return Status::Ok();
}

// ============================================================================
// Health Tracking
// ============================================================================

Status LTC2983::_updateHealth(const Status& st) {
  if (st.ok() || st.inProgress()) {
    _consecutiveFailures = 0;
    if (_totalSuccess < UINT32_MAX) {
      _totalSuccess++;
    }

    if (_initialized) {
      _driverState = DriverState::READY;
    }
  } else {
    _lastError = st;

    if (_consecutiveFailures < UINT8_MAX) {
      _consecutiveFailures++;
    }
    if (_totalFailures < UINT32_MAX) {
      _totalFailures++;
    }

    if (_initialized) {
      if (_consecutiveFailures >= _config.offlineThreshold) {
        _driverState = DriverState::OFFLINE;
      } else {
        _driverState = DriverState::DEGRADED;
      }
    }
  }

  return st;
}

// ============================================================================
// Internal
// ============================================================================

Status LTC2983::_applyConfig() {
  Status st = writeRegister8(cmd::REG_GLOBAL_CONFIG, _buildGlobalConfigRegister());
  if (!st.ok()) {
    return st;
  }
  return writeRegister8(cmd::REG_MUX_DELAY, _config.muxDelay);
}

uint8_t LTC2983::_buildGlobalConfigRegister() const {
  uint8_t config = cmd::GLOBAL_CONFIG_DEFAULT;
  config |= (static_cast<uint8_t>(_config.unit) << cmd::BIT_GLOBAL_UNIT) & cmd::MASK_GLOBAL_UNIT;
  config |= (static_cast<uint8_t>(_config.rejection) << cmd::BIT_GLOBAL_REJECTION) &
            cmd::MASK_GLOBAL_REJECTION;
  return config;
}

} // namespace LTC2983
