#include "firmata_types.hpp"

#include <array>
#include <utility>

namespace firmata {

namespace {

const std::array<std::pair<PinMode, const char *>, 9> pin_mode_names{{
    {PinMode::Input, "input"},
    {PinMode::Output, "output"},
    {PinMode::Analog, "analog"},
    {PinMode::Pwm, "pwm"},
    {PinMode::Servo, "servo"},
    {PinMode::I2C, "i2c"},
    {PinMode::OneWire, "onewire"},
    {PinMode::Stepper, "stepper"},
    {PinMode::Encoder, "encoder"},
}};

} // namespace

std::string toString(PinMode mode)
{
    for (const auto &[value, name] : pin_mode_names) {
        if (value == mode) {
            return name;
        }
    }
    // Modes the device reports but we have no name for
    return "mode_" + std::to_string(static_cast<int>(mode));
}

std::optional<PinMode> pinModeFromString(const std::string &name)
{
    for (const auto &[value, mode_name] : pin_mode_names) {
        if (name == mode_name) {
            return value;
        }
    }
    return std::nullopt;
}

std::string toString(Message message)
{
    switch (message) {
    case Message::ProtocolVersion:
        return "protocol_version";
    case Message::Analog:
        return "analog";
    case Message::Digital:
        return "digital";
    case Message::EmptyResponse:
        return "empty_response";
    case Message::AnalogMappingResponse:
        return "analog_mapping_response";
    case Message::CapabilityResponse:
        return "capability_response";
    case Message::PinStateResponse:
        return "pin_state_response";
    case Message::ReportFirmware:
        return "report_firmware";
    case Message::I2CReply:
        return "i2c_reply";
    }
    return "unknown";
}

} // namespace firmata
