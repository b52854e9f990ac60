#include "firmata_encoder.hpp"

namespace firmata::encoder {

namespace {

uint8_t low7(int32_t value)
{
    return static_cast<uint8_t>(value & DATA_MASK);
}

uint8_t nibble(int index)
{
    return static_cast<uint8_t>(index & 0x0F);
}

Frame sysex(uint8_t command)
{
    return {START_SYSEX, command, END_SYSEX};
}

Frame i2cRequest(int address, uint8_t mode)
{
    return {START_SYSEX,
            I2C_REQUEST,
            low7(address),
            static_cast<uint8_t>(mode << I2C_MODE_SHIFT)};
}

} // namespace

void appendTwoBytes(Frame &frame, int32_t value)
{
    frame.push_back(low7(value));
    frame.push_back(low7(value >> 7));
}

Frame setPinMode(int pin, PinMode mode)
{
    return {SET_PIN_MODE, low7(pin), static_cast<uint8_t>(mode)};
}

Frame digitalPort(int port, uint8_t port_value)
{
    Frame frame{static_cast<uint8_t>(DIGITAL_MESSAGE | nibble(port))};
    appendTwoBytes(frame, port_value);
    return frame;
}

Frame analog(int pin, int32_t level)
{
    Frame frame{static_cast<uint8_t>(ANALOG_MESSAGE | nibble(pin))};
    appendTwoBytes(frame, level);
    return frame;
}

Frame extendedAnalog(int pin, int32_t level)
{
    Frame frame{START_SYSEX, EXTENDED_ANALOG, low7(pin)};
    appendTwoBytes(frame, level);
    for (int32_t rest = level >> 14; rest > 0; rest >>= 7) {
        frame.push_back(low7(rest));
    }
    frame.push_back(END_SYSEX);
    return frame;
}

Frame reportDigital(int port, bool enabled)
{
    return {static_cast<uint8_t>(REPORT_DIGITAL | nibble(port)), static_cast<uint8_t>(enabled)};
}

Frame reportAnalog(int channel, bool enabled)
{
    return {static_cast<uint8_t>(REPORT_ANALOG | nibble(channel)), static_cast<uint8_t>(enabled)};
}

Frame queryProtocolVersion()
{
    return {PROTOCOL_VERSION};
}

Frame queryFirmware()
{
    return sysex(REPORT_FIRMWARE);
}

Frame queryCapabilities()
{
    return sysex(CAPABILITY_QUERY);
}

Frame queryAnalogMapping()
{
    return sysex(ANALOG_MAPPING_QUERY);
}

Frame queryPinState(int pin)
{
    return {START_SYSEX, PIN_STATE_QUERY, low7(pin), END_SYSEX};
}

Frame samplingInterval(int interval_ms)
{
    Frame frame{START_SYSEX, SAMPLING_INTERVAL};
    appendTwoBytes(frame, interval_ms);
    frame.push_back(END_SYSEX);
    return frame;
}

Frame i2cConfig(int delay_us)
{
    Frame frame{START_SYSEX, I2C_CONFIG};
    appendTwoBytes(frame, delay_us);
    frame.push_back(END_SYSEX);
    return frame;
}

Frame i2cRead(int address, int size)
{
    Frame frame = i2cRequest(address, I2C_READ);
    appendTwoBytes(frame, size);
    frame.push_back(END_SYSEX);
    return frame;
}

Frame i2cWrite(int address, const std::vector<uint8_t> &data)
{
    Frame frame = i2cRequest(address, I2C_WRITE);
    for (uint8_t byte : data) {
        appendTwoBytes(frame, byte);
    }
    frame.push_back(END_SYSEX);
    return frame;
}

} // namespace firmata::encoder
