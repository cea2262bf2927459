/// @file ChannelMap.h
/// @brief Channel number to register address mapping for LTC2983
#pragma once

#include <cstdint>

#include "LTC2983/Status.h"

namespace LTC2983 {

/// @return true if channel is in 1..20
bool isValidChannel(uint8_t channel);

/// Base address of a channel's 32-bit assignment word (0x200 + 4 * (channel - 1))
Status assignmentAddress(uint8_t channel, uint16_t& address);

/// Base address of a channel's 32-bit conversion result (0x010 + 4 * (channel - 1))
Status resultAddress(uint8_t channel, uint16_t& address);

/// Multi-channel mask register bit for a channel (bit channel - 1)
Status channelMaskBit(uint8_t channel, uint32_t& bit);

} // namespace LTC2983
