/// @file Config.h
/// @brief Configuration structure for LTC2983 driver
#pragma once

#include <cstddef>
#include <cstdint>
#include "LTC2983/Status.h"

namespace LTC2983 {

/// Register write callback signature
/// @param address  16-bit device register address
/// @param data     Pointer to data to write (big-endian register bytes)
/// @param len      Number of bytes to write
/// @param user     User context pointer passed through from Config
/// @return Status indicating success or failure
using SpiWriteFn = Status (*)(uint16_t address, const uint8_t* data, size_t len,
                              void* user);

/// Register read callback signature
/// @param address  16-bit device register address
/// @param data     Pointer to buffer for read data
/// @param len      Number of bytes to read
/// @param user     User context pointer passed through from Config
/// @return Status indicating success or failure
using SpiReadFn = Status (*)(uint16_t address, uint8_t* data, size_t len,
                             void* user);

/// Temperature unit reported in conversion results
enum class TemperatureUnit : uint8_t {
  CELSIUS    = 0,  ///< Degrees Celsius (default)
  FAHRENHEIT = 1   ///< Degrees Fahrenheit
};

/// Digital filter notch selection
enum class Rejection : uint8_t {
  REJECT_50_60HZ = 0,  ///< Simultaneous 50/60Hz rejection (default)
  REJECT_60HZ    = 1,  ///< 60Hz rejection
  REJECT_50HZ    = 2   ///< 50Hz rejection
};

/// Configuration for LTC2983 driver
struct Config {
  // === SPI Transport (required) ===
  SpiWriteFn spiWrite = nullptr;
  SpiReadFn spiRead = nullptr;
  void* spiUser = nullptr;

  // === Global Settings ===
  TemperatureUnit unit = TemperatureUnit::CELSIUS;
  Rejection rejection = Rejection::REJECT_50_60HZ;
  uint8_t muxDelay = 0;            ///< Extra delay between conversions, 100us units

  // === Health Tracking ===
  uint8_t offlineThreshold = 5;    ///< Consecutive failures before OFFLINE
};

} // namespace LTC2983
