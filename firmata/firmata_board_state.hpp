#pragma once

#include "firmata_types.hpp"

#include <cstddef>
#include <deque>
#include <optional>
#include <vector>

namespace firmata {

// Everything known about the remote device. Written by the decoder,
// read by the encoder; not synchronized.
struct BoardState
{
    std::vector<Pin> pins;
    std::deque<I2CReply> i2c_replies;
    DeviceIdentity identity;

    bool hasPin(int pin) const { return pin >= 0 && static_cast<std::size_t>(pin) < pins.size(); }

    // Throws PinOutOfBoundsError unless `pin` indexes the pin list
    Pin &pinAt(int pin);
    const Pin &pinAt(int pin) const;

    // Bit i is set when pin 8 * port + i holds a non-zero value.
    // Pins past the end of the list count as zero.
    uint8_t portValue(int port) const;

    std::optional<I2CReply> popI2CReply();
};

} // namespace firmata
