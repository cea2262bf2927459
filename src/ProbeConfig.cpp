/// @file ProbeConfig.cpp
/// @brief Probe configuration builders and assignment word codec

#include "LTC2983/ProbeConfig.h"

#include <cmath>

#include "LTC2983/ChannelMap.h"

namespace LTC2983 {

namespace {

constexpr float kMaxIdealityFactor = 10.0f;
constexpr uint32_t kMaxIdealityCode =
    static_cast<uint32_t>(10) << cmd::DIODE_IDEALITY_FRAC_BITS;

bool isThermocoupleType(uint8_t code) {
  return code >= cmd::TYPE_THERMOCOUPLE_J && code <= cmd::TYPE_THERMOCOUPLE_B;
}

bool isUnsupportedType(uint8_t code) {
  return (code >= cmd::TYPE_CUSTOM_THERMOCOUPLE && code <= cmd::TYPE_CUSTOM_THERMISTOR) ||
         code == cmd::TYPE_DIRECT_ADC;
}

bool isValidOcCurrent(OcCurrent current) {
  switch (current) {
    case OcCurrent::EXTERNAL:
    case OcCurrent::I10UA:
    case OcCurrent::I100UA:
    case OcCurrent::I500UA:
    case OcCurrent::I1MA:
      return true;
  }
  return false;
}

bool isValidDiodeCurrent(DiodeCurrent current) {
  return static_cast<uint8_t>(current) <= static_cast<uint8_t>(DiodeCurrent::I640UA);
}

bool isValidDiodeReadings(DiodeReadings readings) {
  return static_cast<uint8_t>(readings) <= static_cast<uint8_t>(DiodeReadings::READ3);
}

/// Round-to-nearest unsigned fixed point. Fails for non-finite, non-positive,
/// zero-after-rounding or overflowing values.
bool toUnsignedFixed(double value, uint8_t fracBits, uint32_t maxCode, uint32_t& code) {
  if (!std::isfinite(value) || value <= 0.0) {
    return false;
  }
  double scaled = std::floor(value * static_cast<double>(1UL << fracBits) + 0.5);
  if (scaled < 1.0 || scaled > static_cast<double>(maxCode)) {
    return false;
  }
  code = static_cast<uint32_t>(scaled);
  return true;
}

double fromUnsignedFixed(uint32_t code, uint8_t fracBits) {
  return static_cast<double>(code) / static_cast<double>(1UL << fracBits);
}

Status validateThermocouple(uint8_t channel, const ThermocoupleParams& params) {
  if (!isValidChannel(params.coldJunction)) {
    return Status::Error(Err::INVALID_COLD_JUNCTION_CHANNEL,
                         "Cold junction channel must be 1..20", params.coldJunction);
  }
  if (params.coldJunction == channel) {
    return Status::Error(Err::INVALID_COLD_JUNCTION_CHANNEL,
                         "Cold junction cannot be the thermocouple channel", channel);
  }
  if (!isValidOcCurrent(params.ocCurrent)) {
    return Status::Error(Err::PARAMETER_OUT_OF_RANGE, "Invalid open-circuit current",
                         static_cast<int32_t>(params.ocCurrent));
  }
  return Status::Ok();
}

Status validateDiode(const DiodeParams& params, uint32_t& idealityCode) {
  // NaN fails both comparisons
  if (!(params.idealityFactor > 0.0f && params.idealityFactor <= kMaxIdealityFactor)) {
    return Status::Error(Err::PARAMETER_OUT_OF_RANGE, "Ideality factor must be in (0, 10]");
  }
  if (!toUnsignedFixed(params.idealityFactor, cmd::DIODE_IDEALITY_FRAC_BITS,
                       kMaxIdealityCode, idealityCode)) {
    return Status::Error(Err::PARAMETER_OUT_OF_RANGE, "Ideality factor not representable");
  }
  if (!isValidDiodeCurrent(params.excitation)) {
    return Status::Error(Err::PARAMETER_OUT_OF_RANGE, "Invalid diode excitation current",
                         static_cast<int32_t>(params.excitation));
  }
  if (!isValidDiodeReadings(params.readings)) {
    return Status::Error(Err::PARAMETER_OUT_OF_RANGE, "Invalid diode reading count",
                         static_cast<int32_t>(params.readings));
  }
  return Status::Ok();
}

Status validateSenseResistor(const SenseResistorParams& params, uint32_t& resistanceCode) {
  if (!toUnsignedFixed(params.resistanceOhms, cmd::RSENSE_FRAC_BITS,
                       cmd::MASK_RSENSE_VALUE, resistanceCode)) {
    return Status::Error(Err::PARAMETER_OUT_OF_RANGE,
                         "Sense resistance must be in (0, 131072) ohms");
  }
  return Status::Ok();
}

Status decodeThermocouple(uint32_t word, ThermocoupleParams& params) {
  if ((word & (cmd::MASK_TC_RESERVED | cmd::MASK_TC_CUSTOM_DATA)) != 0) {
    return Status::Error(Err::UNSUPPORTED_PROBE_TYPE,
                         "Thermocouple custom data not supported",
                         static_cast<int32_t>(word & cmd::MASK_TC_CUSTOM_DATA));
  }

  params.coldJunction = static_cast<uint8_t>(
      (word & cmd::MASK_TC_COLD_JUNCTION) >> cmd::BIT_TC_COLD_JUNCTION);
  params.singleEnded = (word & cmd::MASK_TC_SINGLE_ENDED) != 0;
  params.ocCurrent = static_cast<OcCurrent>(
      (word & cmd::MASK_TC_OC_CURRENT) >> cmd::BIT_TC_OC_CURRENT);

  // The configured channel is unknown here; LTC2983::readChannelConfig()
  // applies the self-reference check.
  return validateThermocouple(0, params);
}

Status decodeDiode(uint32_t word, ProbeConfig& out) {
  uint32_t idealityCode = (word & cmd::MASK_DIODE_IDEALITY) >> cmd::BIT_DIODE_IDEALITY;
  if (idealityCode == 0 || idealityCode > kMaxIdealityCode) {
    return Status::Error(Err::PARAMETER_OUT_OF_RANGE, "Ideality factor must be in (0, 10]",
                         static_cast<int32_t>(idealityCode));
  }

  DiodeParams params;
  params.idealityFactor = static_cast<float>(
      fromUnsignedFixed(idealityCode, cmd::DIODE_IDEALITY_FRAC_BITS));
  params.excitation = static_cast<DiodeCurrent>(
      (word & cmd::MASK_DIODE_EXCITATION) >> cmd::BIT_DIODE_EXCITATION);
  params.readings = static_cast<DiodeReadings>(
      (word & cmd::MASK_DIODE_READINGS) >> cmd::BIT_DIODE_READINGS);
  return ProbeConfig::diode(params, out);
}

Status decodeSenseResistor(uint32_t word, ProbeConfig& out) {
  uint32_t code = (word & cmd::MASK_RSENSE_VALUE) >> cmd::BIT_RSENSE_VALUE;
  if (code == 0) {
    return Status::Error(Err::PARAMETER_OUT_OF_RANGE, "Sense resistance is zero");
  }

  SenseResistorParams params;
  params.resistanceOhms = fromUnsignedFixed(code, cmd::RSENSE_FRAC_BITS);
  return ProbeConfig::senseResistor(params, out);
}

} // namespace

// ============================================================================
// Builders
// ============================================================================

Status ProbeConfig::thermocouple(SensorType kind, uint8_t channel,
                                 const ThermocoupleParams& params, ProbeConfig& out) {
  if (!isThermocoupleType(static_cast<uint8_t>(kind))) {
    return Status::Error(Err::INVALID_PARAM, "Not a standard thermocouple type",
                         static_cast<int32_t>(kind));
  }
  if (!isValidChannel(channel)) {
    return Status::Error(Err::INVALID_CHANNEL, "Channel must be 1..20", channel);
  }

  Status st = validateThermocouple(channel, params);
  if (!st.ok()) {
    return st;
  }

  ProbeConfig cfg(kind);
  cfg._thermocouple = params;
  out = cfg;
  return Status::Ok();
}

Status ProbeConfig::diode(const DiodeParams& params, ProbeConfig& out) {
  uint32_t idealityCode = 0;
  Status st = validateDiode(params, idealityCode);
  if (!st.ok()) {
    return st;
  }

  ProbeConfig cfg(SensorType::DIODE);
  cfg._diode = params;
  out = cfg;
  return Status::Ok();
}

Status ProbeConfig::senseResistor(const SenseResistorParams& params, ProbeConfig& out) {
  uint32_t resistanceCode = 0;
  Status st = validateSenseResistor(params, resistanceCode);
  if (!st.ok()) {
    return st;
  }

  ProbeConfig cfg(SensorType::SENSE_RESISTOR);
  cfg._senseResistor = params;
  out = cfg;
  return Status::Ok();
}

Status ProbeConfig::unsupported(SensorType type, ProbeConfig& out) {
  if (!isUnsupportedType(static_cast<uint8_t>(type))) {
    return Status::Error(Err::INVALID_PARAM, "Type has a dedicated builder or is undefined",
                         static_cast<int32_t>(type));
  }
  out = ProbeConfig(type);
  return Status::Ok();
}

// ============================================================================
// Accessors
// ============================================================================

bool ProbeConfig::isThermocouple() const {
  return isThermocoupleType(static_cast<uint8_t>(_type));
}

// ============================================================================
// Assignment Word Codec
// ============================================================================

Status ProbeConfig::encode(uint32_t& word) const {
  uint32_t value = (static_cast<uint32_t>(_type) << cmd::BIT_SENSOR_TYPE) & cmd::MASK_SENSOR_TYPE;

  if (isThermocouple()) {
    value |= (static_cast<uint32_t>(_thermocouple.coldJunction) << cmd::BIT_TC_COLD_JUNCTION) &
             cmd::MASK_TC_COLD_JUNCTION;
    value |= (static_cast<uint32_t>(_thermocouple.singleEnded ? 1 : 0) << cmd::BIT_TC_SINGLE_ENDED) &
             cmd::MASK_TC_SINGLE_ENDED;
    value |= (static_cast<uint32_t>(_thermocouple.ocCurrent) << cmd::BIT_TC_OC_CURRENT) &
             cmd::MASK_TC_OC_CURRENT;
    word = value;
    return Status::Ok();
  }

  if (isDiode()) {
    uint32_t idealityCode = 0;
    Status st = validateDiode(_diode, idealityCode);
    if (!st.ok()) {
      return st;
    }
    value |= (static_cast<uint32_t>(_diode.readings) << cmd::BIT_DIODE_READINGS) &
             cmd::MASK_DIODE_READINGS;
    value |= (static_cast<uint32_t>(_diode.excitation) << cmd::BIT_DIODE_EXCITATION) &
             cmd::MASK_DIODE_EXCITATION;
    value |= (idealityCode << cmd::BIT_DIODE_IDEALITY) & cmd::MASK_DIODE_IDEALITY;
    word = value;
    return Status::Ok();
  }

  if (isSenseResistor()) {
    uint32_t resistanceCode = 0;
    Status st = validateSenseResistor(_senseResistor, resistanceCode);
    if (!st.ok()) {
      return st;
    }
    value |= (resistanceCode << cmd::BIT_RSENSE_VALUE) & cmd::MASK_RSENSE_VALUE;
    word = value;
    return Status::Ok();
  }

  if (_type == SensorType::UNASSIGNED) {
    return Status::Error(Err::UNSUPPORTED_PROBE_TYPE, "Channel unassigned");
  }
  return Status::Error(Err::UNSUPPORTED_PROBE_TYPE, "Sensor type encoding not implemented",
                       static_cast<int32_t>(_type));
}

Status ProbeConfig::decode(uint32_t word, ProbeConfig& out) {
  uint8_t typeCode = static_cast<uint8_t>((word & cmd::MASK_SENSOR_TYPE) >> cmd::BIT_SENSOR_TYPE);

  if (isThermocoupleType(typeCode)) {
    ThermocoupleParams params;
    Status st = decodeThermocouple(word, params);
    if (!st.ok()) {
      return st;
    }
    ProbeConfig cfg(static_cast<SensorType>(typeCode));
    cfg._thermocouple = params;
    out = cfg;
    return Status::Ok();
  }
  if (typeCode == cmd::TYPE_DIODE) {
    return decodeDiode(word, out);
  }
  if (typeCode == cmd::TYPE_SENSE_RESISTOR) {
    return decodeSenseResistor(word, out);
  }
  if (typeCode == cmd::TYPE_UNASSIGNED) {
    return Status::Error(Err::UNSUPPORTED_PROBE_TYPE, "Channel unassigned");
  }
  return Status::Error(Err::UNSUPPORTED_PROBE_TYPE, "Sensor type decoding not implemented",
                       typeCode);
}

} // namespace LTC2983
