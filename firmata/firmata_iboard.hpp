#pragma once

#include "firmata_types.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <optional>
#include <vector>

namespace firmata {

// Operations on one connected Firmata device. Not thread safe: callers sharing
// a board across threads must hold a lock for the duration of every call.
class IBoard
{
public:
    virtual ~IBoard() = default;

    // Runs the start-up handshake against the device
    virtual void initialize() = 0;

    virtual const std::vector<Pin> &pins() const = 0;
    virtual const DeviceIdentity &identity() const = 0;
    virtual const std::deque<I2CReply> &i2cReplies() const = 0;
    // Removes and returns the oldest I2C reply
    virtual std::optional<I2CReply> popI2CReply() = 0;

    virtual void setPinMode(int pin, PinMode mode) = 0;
    virtual void digitalWrite(int pin, int32_t level) = 0;
    virtual void analogWrite(int pin, int32_t level) = 0;
    virtual void reportDigital(int port, bool enabled) = 0;
    virtual void reportAnalog(int channel, bool enabled) = 0;
    virtual void setSamplingInterval(int interval_ms) = 0;

    virtual void queryProtocolVersion() = 0;
    virtual void queryFirmware() = 0;
    virtual void queryCapabilities() = 0;
    virtual void queryAnalogMapping() = 0;
    virtual void queryPinState(int pin) = 0;

    virtual void i2cConfig(int delay_us) = 0;
    virtual void i2cRead(int address, int size) = 0;
    virtual void i2cWrite(int address, const std::vector<uint8_t> &data) = 0;

    // Reads one message from the device and applies it to the board state
    virtual Message readAndDecode() = 0;
    // True when readAndDecode() has data to work on
    virtual bool waitForData(std::chrono::milliseconds timeout) = 0;
};

} // namespace firmata
