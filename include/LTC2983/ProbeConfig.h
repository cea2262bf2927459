/// @file ProbeConfig.h
/// @brief Validated channel probe configurations and assignment word codec
#pragma once

#include <cstdint>

#include "LTC2983/CommandTable.h"
#include "LTC2983/Status.h"

namespace LTC2983 {

/// Sensor type selector (assignment word bits 31:27)
enum class SensorType : uint8_t {
  UNASSIGNED              = cmd::TYPE_UNASSIGNED,
  THERMOCOUPLE_J          = cmd::TYPE_THERMOCOUPLE_J,
  THERMOCOUPLE_K          = cmd::TYPE_THERMOCOUPLE_K,
  THERMOCOUPLE_E          = cmd::TYPE_THERMOCOUPLE_E,
  THERMOCOUPLE_N          = cmd::TYPE_THERMOCOUPLE_N,
  THERMOCOUPLE_R          = cmd::TYPE_THERMOCOUPLE_R,
  THERMOCOUPLE_S          = cmd::TYPE_THERMOCOUPLE_S,
  THERMOCOUPLE_T          = cmd::TYPE_THERMOCOUPLE_T,
  THERMOCOUPLE_B          = cmd::TYPE_THERMOCOUPLE_B,
  CUSTOM_THERMOCOUPLE     = cmd::TYPE_CUSTOM_THERMOCOUPLE,
  RTD_PT10                = cmd::TYPE_RTD_PT10,
  RTD_PT50                = cmd::TYPE_RTD_PT50,
  RTD_PT100               = cmd::TYPE_RTD_PT100,
  RTD_PT200               = cmd::TYPE_RTD_PT200,
  RTD_PT500               = cmd::TYPE_RTD_PT500,
  RTD_PT1000              = cmd::TYPE_RTD_PT1000,
  RTD_1000                = cmd::TYPE_RTD_1000,
  RTD_NI120               = cmd::TYPE_RTD_NI120,
  CUSTOM_RTD              = cmd::TYPE_CUSTOM_RTD,
  THERMISTOR_44004_44033  = cmd::TYPE_THERMISTOR_44004,
  THERMISTOR_44005_44030  = cmd::TYPE_THERMISTOR_44005,
  THERMISTOR_44007_44034  = cmd::TYPE_THERMISTOR_44007,
  THERMISTOR_44006_44031  = cmd::TYPE_THERMISTOR_44006,
  THERMISTOR_44008_44032  = cmd::TYPE_THERMISTOR_44008,
  THERMISTOR_YSI400       = cmd::TYPE_THERMISTOR_YSI400,
  THERMISTOR_SPECTRUM     = cmd::TYPE_THERMISTOR_SPECTRUM,
  THERMISTOR_STEINHART_HART = cmd::TYPE_THERMISTOR_STEINHART_HART,
  CUSTOM_THERMISTOR       = cmd::TYPE_CUSTOM_THERMISTOR,
  DIODE                   = cmd::TYPE_DIODE,
  SENSE_RESISTOR          = cmd::TYPE_SENSE_RESISTOR,
  DIRECT_ADC              = cmd::TYPE_DIRECT_ADC
};

/// Thermocouple open-circuit detection current
enum class OcCurrent : uint8_t {
  EXTERNAL = cmd::OC_EXTERNAL,  ///< No internal check current (default)
  I10UA    = cmd::OC_10UA,      ///< 10uA pulse
  I100UA   = cmd::OC_100UA,     ///< 100uA pulse
  I500UA   = cmd::OC_500UA,     ///< 500uA pulse
  I1MA     = cmd::OC_1MA        ///< 1mA pulse
};

/// Diode excitation current
enum class DiodeCurrent : uint8_t {
  I10UA  = cmd::DIODE_10UA,   ///< 10uA (default)
  I20UA  = cmd::DIODE_20UA,
  I40UA  = cmd::DIODE_40UA,
  I80UA  = cmd::DIODE_80UA,
  I160UA = cmd::DIODE_160UA,
  I320UA = cmd::DIODE_320UA,
  I640UA = cmd::DIODE_640UA
};

/// Diode readings per conversion
enum class DiodeReadings : uint8_t {
  READ1 = cmd::DIODE_READ1,
  READ2 = cmd::DIODE_READ2,   ///< (default)
  READ3 = cmd::DIODE_READ3
};

/// Thermocouple parameters (types J, K, E, N, R, S, T, B)
struct ThermocoupleParams {
  uint8_t coldJunction = 0;                 ///< Cold junction channel, 1..20
  bool singleEnded = false;                 ///< false = differential input
  OcCurrent ocCurrent = OcCurrent::EXTERNAL;
};

/// Diode parameters
struct DiodeParams {
  float idealityFactor = 1.0f;              ///< (0, 10], LSB 2^-18
  DiodeCurrent excitation = DiodeCurrent::I10UA;
  DiodeReadings readings = DiodeReadings::READ2;
};

/// Sense resistor parameters
struct SenseResistorParams {
  double resistanceOhms = 0.0;              ///< > 0, LSB 1/1024 ohm, max 131071.999
};

/// Immutable, validated probe configuration for one channel.
///
/// Instances are produced only by the builders below or by decode(), so a
/// ProbeConfig of a supported type always encodes. Configurations of the
/// RTD, thermistor, custom thermocouple and direct ADC families can be
/// created with unsupported() to name the type, but have no implemented
/// register layout: encode() fails with UNSUPPORTED_PROBE_TYPE.
///
/// Fixed-point fields round to nearest:
///  - diode ideality factor: 4.18, max error 2^-19 (~1.9e-6)
///  - sense resistance: 17.10 ohms, max error 1/2048 ohm
class ProbeConfig {
public:
  /// Unassigned channel; encode() fails with UNSUPPORTED_PROBE_TYPE
  ProbeConfig() = default;

  // === Builders ===
  static Status thermocouple(SensorType kind, uint8_t channel,
                             const ThermocoupleParams& params, ProbeConfig& out);
  static Status diode(const DiodeParams& params, ProbeConfig& out);
  static Status senseResistor(const SenseResistorParams& params, ProbeConfig& out);
  static Status unsupported(SensorType type, ProbeConfig& out);

  // === Assignment Word Codec ===
  Status encode(uint32_t& word) const;
  static Status decode(uint32_t word, ProbeConfig& out);

  // === Accessors ===
  SensorType type() const { return _type; }
  bool isThermocouple() const;
  bool isDiode() const { return _type == SensorType::DIODE; }
  bool isSenseResistor() const { return _type == SensorType::SENSE_RESISTOR; }
  bool isSupported() const { return isThermocouple() || isDiode() || isSenseResistor(); }

  /// Only meaningful when the matching is*() returns true
  const ThermocoupleParams& thermocoupleParams() const { return _thermocouple; }
  const DiodeParams& diodeParams() const { return _diode; }
  const SenseResistorParams& senseResistorParams() const { return _senseResistor; }

private:
  explicit ProbeConfig(SensorType type) : _type(type) {}

  SensorType _type = SensorType::UNASSIGNED;
  ThermocoupleParams _thermocouple;
  DiodeParams _diode;
  SenseResistorParams _senseResistor;
};

} // namespace LTC2983
