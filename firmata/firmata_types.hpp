#pragma once

#include "firmata_constants.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace firmata {

// Pin mode identifiers as they appear on the wire
enum class PinMode : uint8_t {
    Input = 0x00,
    Output = 0x01,
    Analog = 0x02,
    Pwm = 0x03,
    Servo = 0x04,
    I2C = 0x06,
    OneWire = 0x07,
    Stepper = 0x08,
    Encoder = 0x09
};

std::string toString(PinMode mode);
std::optional<PinMode> pinModeFromString(const std::string &name);

// One way a pin can be configured
struct Capability
{
    PinMode mode;
    uint8_t resolution;

    bool operator==(const Capability &other) const
    {
        return mode == other.mode && resolution == other.resolution;
    }
};

struct Pin
{
    PinMode mode = PinMode::Analog;
    uint8_t resolution = DEFAULT_ANALOG_RESOLUTION;
    std::vector<Capability> capabilities;
    // Analog input channel, set by an analog mapping response
    std::optional<uint8_t> analog_channel;
    int32_t value = 0;
};

struct I2CReply
{
    int address = 0;
    int reg = 0;
    std::vector<uint8_t> data;
};

struct DeviceIdentity
{
    std::string protocol_version;
    std::string firmware_name;
    std::string firmware_version;
};

// What a single read_and_decode call consumed
enum class Message {
    ProtocolVersion,
    Analog,
    Digital,
    EmptyResponse,
    AnalogMappingResponse,
    CapabilityResponse,
    PinStateResponse,
    ReportFirmware,
    I2CReply
};

std::string toString(Message message);

} // namespace firmata
