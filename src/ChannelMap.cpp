/// @file ChannelMap.cpp
/// @brief Channel number to register address mapping

#include "LTC2983/ChannelMap.h"

#include "LTC2983/CommandTable.h"

namespace LTC2983 {

bool isValidChannel(uint8_t channel) {
  return channel >= cmd::CHANNEL_MIN && channel <= cmd::CHANNEL_MAX;
}

Status assignmentAddress(uint8_t channel, uint16_t& address) {
  if (!isValidChannel(channel)) {
    return Status::Error(Err::INVALID_CHANNEL, "Channel must be 1..20", channel);
  }
  address = static_cast<uint16_t>(cmd::REG_ASSIGNMENT_BASE +
                                  (channel - 1) * cmd::CHANNEL_STRIDE);
  return Status::Ok();
}

Status resultAddress(uint8_t channel, uint16_t& address) {
  if (!isValidChannel(channel)) {
    return Status::Error(Err::INVALID_CHANNEL, "Channel must be 1..20", channel);
  }
  address = static_cast<uint16_t>(cmd::REG_RESULT_BASE +
                                  (channel - 1) * cmd::CHANNEL_STRIDE);
  return Status::Ok();
}

Status channelMaskBit(uint8_t channel, uint32_t& bit) {
  if (!isValidChannel(channel)) {
    return Status::Error(Err::INVALID_CHANNEL, "Channel must be 1..20", channel);
  }
  bit = static_cast<uint32_t>(1UL << (channel - 1));
  return Status::Ok();
}

} // namespace LTC2983
