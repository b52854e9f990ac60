#pragma once

#include "firmata_types.hpp"

#include <cstdint>
#include <vector>

// Outbound message framing. Every function returns the exact bytes to write;
// none of them touch the board state or the transport.
namespace firmata::encoder {

using Frame = std::vector<uint8_t>;

Frame setPinMode(int pin, PinMode mode);
Frame digitalPort(int port, uint8_t port_value);
// 14-bit value, pin 0..15
Frame analog(int pin, int32_t level);
// Any pin, any non-negative level, as 7-bit groups
Frame extendedAnalog(int pin, int32_t level);
Frame reportDigital(int port, bool enabled);
Frame reportAnalog(int channel, bool enabled);

Frame queryProtocolVersion();
Frame queryFirmware();
Frame queryCapabilities();
Frame queryAnalogMapping();
Frame queryPinState(int pin);
Frame samplingInterval(int interval_ms);

Frame i2cConfig(int delay_us);
Frame i2cRead(int address, int size);
Frame i2cWrite(int address, const std::vector<uint8_t> &data);

// Appends value as low/high 7-bit bytes
void appendTwoBytes(Frame &frame, int32_t value);

} // namespace firmata::encoder
