/// @file CommandTable.h
/// @brief Register addresses and bit definitions for LTC2983
#pragma once

#include <cstdint>

namespace LTC2983 {
namespace cmd {

// ============================================================================
// SPI Instruction Bytes (for transport implementations)
// ============================================================================

static constexpr uint8_t INSTR_WRITE = 0x02;  ///< Write: 0x02, addr[15:8], addr[7:0], data...
static constexpr uint8_t INSTR_READ  = 0x03;  ///< Read:  0x03, addr[15:8], addr[7:0], dummy...

// ============================================================================
// Register Addresses
// ============================================================================

static constexpr uint16_t REG_COMMAND_STATUS    = 0x000;  ///< Command / status (8-bit, R/W)
static constexpr uint16_t REG_RESULT_BASE       = 0x010;  ///< CH1 conversion result (32-bit, read-only)
static constexpr uint16_t REG_GLOBAL_CONFIG     = 0x0F0;  ///< Global configuration (8-bit, R/W)
static constexpr uint16_t REG_MULTI_CHANNEL_MASK = 0x0F4; ///< Multi-channel mask (32-bit, R/W)
static constexpr uint16_t REG_MUX_DELAY         = 0x0FF;  ///< Mux configuration delay (8-bit, R/W)
static constexpr uint16_t REG_ASSIGNMENT_BASE   = 0x200;  ///< CH1 channel assignment (32-bit, R/W)
static constexpr uint16_t REG_CUSTOM_DATA_BASE  = 0x250;  ///< Custom sensor table data

static constexpr uint16_t CHANNEL_STRIDE = 4;   ///< Bytes per channel in result/assignment blocks
static constexpr uint8_t CHANNEL_MIN = 1;
static constexpr uint8_t CHANNEL_MAX = 20;
static constexpr uint8_t CHANNEL_MULTI = 0;     ///< Status channel field for multi-channel conversion

// ============================================================================
// Command / Status Register (0x000)
// ============================================================================

static constexpr uint8_t MASK_STATUS_START   = 0x80;  ///< Write: start conversion; read: busy
static constexpr uint8_t MASK_STATUS_DONE    = 0x40;  ///< Read: conversion complete
static constexpr uint8_t MASK_STATUS_CHANNEL = 0x1F;  ///< Channel selection (5 bits: 4:0)

static constexpr uint8_t BIT_STATUS_START   = 7;
static constexpr uint8_t BIT_STATUS_DONE    = 6;
static constexpr uint8_t BIT_STATUS_CHANNEL = 0;

static constexpr uint8_t CMD_START_CONVERSION = 0x80;  ///< OR with channel (0 = multi-channel)

// ============================================================================
// Global Configuration Register (0x0F0)
// ============================================================================

static constexpr uint8_t MASK_GLOBAL_UNIT      = 0x04;  ///< 0 = Celsius, 1 = Fahrenheit
static constexpr uint8_t MASK_GLOBAL_REJECTION = 0x03;  ///< Digital filter notch selection

static constexpr uint8_t BIT_GLOBAL_UNIT      = 2;
static constexpr uint8_t BIT_GLOBAL_REJECTION = 0;

static constexpr uint8_t GLOBAL_CONFIG_DEFAULT = 0x00;

// REJECTION field values
static constexpr uint8_t REJECTION_50_60HZ = 0x00;
static constexpr uint8_t REJECTION_60HZ    = 0x01;
static constexpr uint8_t REJECTION_50HZ    = 0x02;

// ============================================================================
// Multi-Channel Mask Register (0x0F4..0x0F7)
// ============================================================================

static constexpr uint32_t MASK_MULTI_CHANNELS = 0x000FFFFF;  ///< Bit (n-1) selects channel n

// ============================================================================
// Channel Assignment Word (32-bit) - common fields
// ============================================================================

static constexpr uint32_t MASK_SENSOR_TYPE = 0xF8000000;  ///< Sensor type selector (5 bits: 31:27)
static constexpr uint8_t BIT_SENSOR_TYPE = 27;

// Sensor type codes
static constexpr uint8_t TYPE_UNASSIGNED          = 0;
static constexpr uint8_t TYPE_THERMOCOUPLE_J      = 1;
static constexpr uint8_t TYPE_THERMOCOUPLE_K      = 2;
static constexpr uint8_t TYPE_THERMOCOUPLE_E      = 3;
static constexpr uint8_t TYPE_THERMOCOUPLE_N      = 4;
static constexpr uint8_t TYPE_THERMOCOUPLE_R      = 5;
static constexpr uint8_t TYPE_THERMOCOUPLE_S      = 6;
static constexpr uint8_t TYPE_THERMOCOUPLE_T      = 7;
static constexpr uint8_t TYPE_THERMOCOUPLE_B      = 8;
static constexpr uint8_t TYPE_CUSTOM_THERMOCOUPLE = 9;
static constexpr uint8_t TYPE_RTD_PT10            = 10;
static constexpr uint8_t TYPE_RTD_PT50            = 11;
static constexpr uint8_t TYPE_RTD_PT100           = 12;
static constexpr uint8_t TYPE_RTD_PT200           = 13;
static constexpr uint8_t TYPE_RTD_PT500           = 14;
static constexpr uint8_t TYPE_RTD_PT1000          = 15;
static constexpr uint8_t TYPE_RTD_1000            = 16;
static constexpr uint8_t TYPE_RTD_NI120           = 17;
static constexpr uint8_t TYPE_CUSTOM_RTD          = 18;
static constexpr uint8_t TYPE_THERMISTOR_44004    = 19;
static constexpr uint8_t TYPE_THERMISTOR_44005    = 20;
static constexpr uint8_t TYPE_THERMISTOR_44007    = 21;
static constexpr uint8_t TYPE_THERMISTOR_44006    = 22;
static constexpr uint8_t TYPE_THERMISTOR_44008    = 23;
static constexpr uint8_t TYPE_THERMISTOR_YSI400   = 24;
static constexpr uint8_t TYPE_THERMISTOR_SPECTRUM = 25;
static constexpr uint8_t TYPE_THERMISTOR_STEINHART_HART = 26;
static constexpr uint8_t TYPE_CUSTOM_THERMISTOR   = 27;
static constexpr uint8_t TYPE_DIODE               = 28;
static constexpr uint8_t TYPE_SENSE_RESISTOR      = 29;
static constexpr uint8_t TYPE_DIRECT_ADC          = 30;

// ============================================================================
// Thermocouple Assignment Fields
// ============================================================================

static constexpr uint32_t MASK_TC_COLD_JUNCTION = 0x07C00000;  ///< CJ channel (5 bits: 26:22), 0 = none
static constexpr uint32_t MASK_TC_SINGLE_ENDED  = 0x00200000;  ///< Single-ended input (1 bit: 21)
static constexpr uint32_t MASK_TC_OC_CURRENT    = 0x001C0000;  ///< Open-circuit current (3 bits: 20:18)
static constexpr uint32_t MASK_TC_RESERVED      = 0x0003F000;  ///< Unused, must be 0 (6 bits: 17:12)
static constexpr uint32_t MASK_TC_CUSTOM_DATA   = 0x00000FFF;  ///< Custom data pointer (12 bits: 11:0)

static constexpr uint8_t BIT_TC_COLD_JUNCTION = 22;
static constexpr uint8_t BIT_TC_SINGLE_ENDED  = 21;
static constexpr uint8_t BIT_TC_OC_CURRENT    = 18;
static constexpr uint8_t BIT_TC_CUSTOM_DATA   = 0;

// OC_CURRENT field values (bit 2 enables open-circuit check)
static constexpr uint8_t OC_EXTERNAL = 0x0;
static constexpr uint8_t OC_10UA     = 0x4;
static constexpr uint8_t OC_100UA    = 0x5;
static constexpr uint8_t OC_500UA    = 0x6;
static constexpr uint8_t OC_1MA      = 0x7;

// ============================================================================
// Diode Assignment Fields
// ============================================================================

static constexpr uint32_t MASK_DIODE_READINGS   = 0x06000000;  ///< Reading count (2 bits: 26:25)
static constexpr uint32_t MASK_DIODE_EXCITATION = 0x01C00000;  ///< Excitation current (3 bits: 24:22)
static constexpr uint32_t MASK_DIODE_IDEALITY   = 0x003FFFFF;  ///< Ideality factor 4.18 (22 bits: 21:0)

static constexpr uint8_t BIT_DIODE_READINGS   = 25;
static constexpr uint8_t BIT_DIODE_EXCITATION = 22;
static constexpr uint8_t BIT_DIODE_IDEALITY   = 0;

static constexpr uint8_t DIODE_IDEALITY_FRAC_BITS = 18;

// READINGS field values
static constexpr uint8_t DIODE_READ1 = 0x0;
static constexpr uint8_t DIODE_READ2 = 0x1;
static constexpr uint8_t DIODE_READ3 = 0x2;

// EXCITATION field values
static constexpr uint8_t DIODE_10UA  = 0x0;
static constexpr uint8_t DIODE_20UA  = 0x1;
static constexpr uint8_t DIODE_40UA  = 0x2;
static constexpr uint8_t DIODE_80UA  = 0x3;
static constexpr uint8_t DIODE_160UA = 0x4;
static constexpr uint8_t DIODE_320UA = 0x5;
static constexpr uint8_t DIODE_640UA = 0x6;

// ============================================================================
// Sense Resistor Assignment Fields
// ============================================================================

static constexpr uint32_t MASK_RSENSE_VALUE = 0x07FFFFFF;  ///< Resistance 17.10 ohms (27 bits: 26:0)
static constexpr uint8_t BIT_RSENSE_VALUE = 0;
static constexpr uint8_t RSENSE_FRAC_BITS = 10;

// ============================================================================
// Conversion Result Word (32-bit)
// ============================================================================

static constexpr uint32_t MASK_RESULT_FAULTS = 0xFF000000;  ///< Fault byte (8 bits: 31:24)
static constexpr uint32_t MASK_RESULT_DATA   = 0x00FFFFFF;  ///< Temperature (24 bits: 23:0, signed)
static constexpr uint32_t RESULT_SIGN_BIT    = 0x00800000;

static constexpr uint8_t BIT_RESULT_FAULTS = 24;
static constexpr uint8_t BIT_RESULT_DATA   = 0;

static constexpr uint8_t RESULT_FRAC_BITS = 10;  ///< LSB = 1/1024 degree

// Fault byte bits
static constexpr uint8_t FAULT_SENSOR_HARD     = 0x80;  ///< Sensor hard fault (open circuit)
static constexpr uint8_t FAULT_ADC_HARD        = 0x40;  ///< Hard ADC out of range
static constexpr uint8_t FAULT_CJ_HARD         = 0x20;  ///< Cold junction hard fault
static constexpr uint8_t FAULT_CJ_SOFT         = 0x10;  ///< Cold junction soft fault
static constexpr uint8_t FAULT_SENSOR_OVER     = 0x08;  ///< Sensor over range
static constexpr uint8_t FAULT_SENSOR_UNDER    = 0x04;  ///< Sensor under range
static constexpr uint8_t FAULT_ADC_OUT_OF_RANGE = 0x02; ///< ADC out of range
static constexpr uint8_t RESULT_VALID          = 0x01;  ///< Valid result (not a fault)

static constexpr uint8_t MASK_FAULT_BITS = 0xFE;

} // namespace cmd
} // namespace LTC2983
