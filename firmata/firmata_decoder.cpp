#include "firmata_decoder.hpp"
#include "firmata_error.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace firmata {

namespace {

constexpr std::size_t message_size = 3;

std::string formatVersion(uint8_t major, uint8_t minor)
{
    return std::to_string(major) + "." + std::to_string(minor);
}

int32_t combine(uint8_t low, uint8_t high)
{
    return static_cast<int32_t>(low) | (static_cast<int32_t>(high) << 7);
}

// Returns the offset of the first malformed sequence, or text.size()
std::size_t findInvalidUtf8(const std::string &text)
{
    std::size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        std::size_t length = 0;
        uint32_t code_point = 0;

        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            length = 2;
            code_point = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            code_point = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            code_point = lead & 0x07;
        } else {
            return i;
        }

        if (i + length > text.size()) {
            return i;
        }
        for (std::size_t k = 1; k < length; ++k) {
            const auto next = static_cast<unsigned char>(text[i + k]);
            if ((next & 0xC0) != 0x80) {
                return i;
            }
            code_point = (code_point << 6) | (next & 0x3F);
        }

        static constexpr uint32_t min_for_length[] = {0, 0, 0x80, 0x800, 0x10000};
        if (code_point < min_for_length[length] || code_point > 0x10FFFF
            || (code_point >= 0xD800 && code_point <= 0xDFFF)) {
            return i;
        }
        i += length;
    }
    return text.size();
}

} // namespace

std::vector<uint8_t> Decoder::read(transport::ITransport &transport, std::size_t count)
{
    std::vector<uint8_t> buf;
    buf.reserve(count);

    while (!pending_.empty() && buf.size() < count) {
        buf.push_back(pending_.front());
        pending_.pop_front();
    }
    if (buf.size() < count) {
        std::vector<uint8_t> rest = transport.read(count - buf.size());
        if (rest.size() != count - buf.size()) {
            throw IoError("short read from " + transport.describe());
        }
        buf.insert(buf.end(), rest.begin(), rest.end());
    }
    return buf;
}

Message Decoder::readAndDecode(transport::ITransport &transport, BoardState &state)
{
    std::vector<uint8_t> buf = read(transport, message_size);
    const uint8_t command = buf[0];

    if (command == PROTOCOL_VERSION) {
        state.identity.protocol_version = formatVersion(buf[1], buf[2]);
        return Message::ProtocolVersion;
    }
    if (command >= ANALOG_MESSAGE && command <= ANALOG_MESSAGE_BOUND) {
        decodeAnalog(buf, state);
        return Message::Analog;
    }
    if (command >= DIGITAL_MESSAGE && command <= DIGITAL_MESSAGE_BOUND) {
        decodeDigital(buf, state);
        return Message::Digital;
    }
    if (command != START_SYSEX) {
        throw BadByteError(command);
    }

    if (buf[1] == END_SYSEX) {
        // Two byte frame, the third byte already belongs to the next message
        pending_.push_front(buf[2]);
        return Message::EmptyResponse;
    }
    while (buf.back() != END_SYSEX) {
        buf.push_back(read(transport, 1).front());
    }
    return decodeSysEx(buf, state);
}

Message Decoder::decodeSysEx(const std::vector<uint8_t> &frame, BoardState &state)
{
    switch (frame[1]) {
    case ANALOG_MAPPING_RESPONSE:
        decodeAnalogMapping(frame, state);
        return Message::AnalogMappingResponse;
    case CAPABILITY_RESPONSE:
        decodeCapabilities(frame, state);
        return Message::CapabilityResponse;
    case REPORT_FIRMWARE:
        decodeFirmware(frame, state);
        return Message::ReportFirmware;
    case I2C_REPLY:
        decodeI2CReply(frame, state);
        return Message::I2CReply;
    case PIN_STATE_RESPONSE:
        decodePinState(frame, state);
        return Message::PinStateResponse;
    default:
        throw UnknownSysExError(frame[1]);
    }
}

void Decoder::decodeAnalog(const std::vector<uint8_t> &buf, BoardState &state)
{
    const int pin = (buf[0] & 0x0F) + ANALOG_PIN_OFFSET;
    // The device may report pins we have not enumerated yet
    if (state.hasPin(pin)) {
        state.pins[static_cast<std::size_t>(pin)].value = combine(buf[1], buf[2]);
    }
}

void Decoder::decodeDigital(const std::vector<uint8_t> &buf, BoardState &state)
{
    const int port = buf[0] & 0x0F;
    const int32_t value = combine(buf[1], buf[2]);

    for (int i = 0; i < PINS_PER_PORT; ++i) {
        const int pin = PINS_PER_PORT * port + i;
        if (!state.hasPin(pin)) {
            break;
        }
        Pin &target = state.pins[static_cast<std::size_t>(pin)];
        // Bits of non-input pins are dropped
        if (target.mode == PinMode::Input) {
            target.value = (value >> i) & 0x01;
        }
    }
}

void Decoder::decodeAnalogMapping(const std::vector<uint8_t> &frame, BoardState &state)
{
    const std::size_t payload = frame.size() - 3;
    const std::size_t upper = std::min(payload, state.pins.size());

    for (std::size_t pin = 0; pin < upper; ++pin) {
        const uint8_t channel = frame[2 + pin];
        if (channel == NO_VALUE) {
            state.pins[pin].analog_channel.reset();
        } else {
            state.pins[pin].analog_channel = channel;
        }
    }
}

void Decoder::decodeCapabilities(const std::vector<uint8_t> &frame, BoardState &state)
{
    std::vector<Pin> pins;
    pins.emplace_back(); // pin 0 is a reserved placeholder

    std::vector<Capability> capabilities;
    const std::size_t end = frame.size() - 1;
    std::size_t i = 2;

    while (i < end) {
        if (frame[i] == NO_VALUE) {
            Pin pin;
            if (!capabilities.empty()) {
                pin.mode = capabilities.front().mode;
                pin.resolution = capabilities.front().resolution;
            }
            pin.capabilities = std::move(capabilities);
            capabilities.clear();
            pins.push_back(std::move(pin));
            ++i;
            continue;
        }
        if (i + 1 >= end) {
            throw MessageTooShortError();
        }
        capabilities.push_back({static_cast<PinMode>(frame[i]), frame[i + 1]});
        i += 2;
    }

    state.pins = std::move(pins);
}

void Decoder::decodeFirmware(const std::vector<uint8_t> &frame, BoardState &state)
{
    // F0 79 major minor [name...] F7
    if (frame.size() < 5) {
        throw MessageTooShortError();
    }

    std::string name;
    if (frame.size() > 5) {
        name.assign(frame.begin() + 4, frame.end() - 1);
        const std::size_t bad = findInvalidUtf8(name);
        if (bad != name.size()) {
            throw TextDecodeError("invalid firmware name at byte " + std::to_string(bad));
        }
    }

    state.identity.firmware_version = formatVersion(frame[2], frame[3]);
    if (!name.empty()) {
        state.identity.firmware_name = std::move(name);
    }
}

void Decoder::decodeI2CReply(const std::vector<uint8_t> &frame, BoardState &state)
{
    // F0 77 addr(2) reg(2) data(2)... F7
    if (frame.size() < 9) {
        throw MessageTooShortError();
    }

    I2CReply reply;
    reply.address = combine(frame[2], frame[3]);
    reply.reg = combine(frame[4], frame[5]);

    const std::size_t end = frame.size() - 1;
    for (std::size_t i = 6; i + 1 < end; i += 2) {
        reply.data.push_back(static_cast<uint8_t>(combine(frame[i], frame[i + 1])));
    }

    state.i2c_replies.push_back(std::move(reply));
}

void Decoder::decodePinState(const std::vector<uint8_t> &frame, BoardState &state)
{
    // F0 6E pin [mode [value...]] F7
    if (frame.size() < 4) {
        throw MessageTooShortError();
    }
    const int index = frame[2];
    const std::size_t end = frame.size() - 1;
    if (end == 3 || !state.hasPin(index)) {
        return;
    }

    Pin &pin = state.pins[static_cast<std::size_t>(index)];
    pin.mode = static_cast<PinMode>(frame[3]);
    for (const Capability &capability : pin.capabilities) {
        if (capability.mode == pin.mode) {
            pin.resolution = capability.resolution;
            break;
        }
    }

    if (end > 4) {
        int32_t value = 0;
        for (std::size_t i = 4; i < end && i < 8; ++i) {
            value |= static_cast<int32_t>(frame[i] & DATA_MASK) << (7 * (i - 4));
        }
        pin.value = value;
    }
}

} // namespace firmata
