#include "firmata_board.hpp"
#include "firmata_error.hpp"

#include <initializer_list>
#include <stdexcept>
#include <utility>

namespace firmata {

namespace {

constexpr int32_t max_two_byte_value = 0x3FFF;

std::string params(std::initializer_list<std::pair<const char *, int>> values)
{
    std::string text;
    for (const auto &[name, value] : values) {
        if (!text.empty()) {
            text += ", ";
        }
        text += std::string(name) + "=" + std::to_string(value);
    }
    return text;
}

void checkNibbleIndex(int index)
{
    if (index < 0 || index >= MAX_NIBBLE_INDEX) {
        throw PinOutOfBoundsError(index, MAX_NIBBLE_INDEX);
    }
}

} // namespace

Board::Board(std::unique_ptr<transport::ITransport> transport, OperationHook hook)
    : transport_(std::move(transport))
    , hook_(std::move(hook))
{
    if (!transport_) {
        throw std::invalid_argument("Board requires a transport");
    }
    initialize();
}

Board::~Board() = default;

void Board::initialize()
{
    instrument("initialize", transport_->describe(), [this] {
        queryFirmware();
        queryCapabilities();
        queryAnalogMapping();

        bool received_firmware = false;
        bool received_capabilities = false;
        bool received_analog_mapping = false;

        while (!received_firmware || !received_capabilities || !received_analog_mapping) {
            switch (readAndDecode()) {
            case Message::ReportFirmware:
                received_firmware = true;
                break;
            case Message::CapabilityResponse:
                received_capabilities = true;
                break;
            case Message::AnalogMappingResponse:
                received_analog_mapping = true;
                break;
            default:
                break;
            }
        }

        reportDigital(0, true);
        reportDigital(1, true);
    });
}

void Board::setOperationHook(OperationHook hook)
{
    hook_ = std::move(hook);
}

void Board::notify(const char *operation, const std::string &params, const std::string &result) const
{
    if (hook_) {
        hook_(operation, params, result);
    }
}

void Board::write(const encoder::Frame &frame)
{
    std::size_t written = transport_->write(frame);
    if (written != frame.size()) {
        throw IoError("short write to " + transport_->describe() + ": " + std::to_string(written)
                      + " of " + std::to_string(frame.size()) + " bytes");
    }
}

const std::vector<Pin> &Board::pins() const
{
    return state_.pins;
}

const DeviceIdentity &Board::identity() const
{
    return state_.identity;
}

const std::deque<I2CReply> &Board::i2cReplies() const
{
    return state_.i2c_replies;
}

std::optional<I2CReply> Board::popI2CReply()
{
    return state_.popI2CReply();
}

void Board::setPinMode(int pin, PinMode mode)
{
    instrument("set_pin_mode", params({{"pin", pin}, {"mode", static_cast<int>(mode)}}), [&] {
        Pin &target = state_.pinAt(pin);
        // Recorded before the device confirms anything
        target.mode = mode;
        for (const Capability &capability : target.capabilities) {
            if (capability.mode == mode) {
                target.resolution = capability.resolution;
                break;
            }
        }
        write(encoder::setPinMode(pin, mode));
    });
}

void Board::digitalWrite(int pin, int32_t level)
{
    instrument("digital_write", params({{"pin", pin}, {"level", level}}), [&] {
        state_.pinAt(pin).value = level != 0 ? 1 : 0;
        const int port = pin / PINS_PER_PORT;
        write(encoder::digitalPort(port, state_.portValue(port)));
    });
}

void Board::analogWrite(int pin, int32_t level)
{
    instrument("analog_write", params({{"pin", pin}, {"level", level}}), [&] {
        if (level < 0) {
            throw std::invalid_argument("analog level must not be negative: "
                                        + std::to_string(level));
        }
        state_.pinAt(pin).value = level;
        if (pin < MAX_NIBBLE_INDEX && level <= max_two_byte_value) {
            write(encoder::analog(pin, level));
        } else {
            write(encoder::extendedAnalog(pin, level));
        }
    });
}

void Board::reportDigital(int port, bool enabled)
{
    instrument("report_digital", params({{"port", port}, {"enabled", enabled}}), [&] {
        checkNibbleIndex(port);
        write(encoder::reportDigital(port, enabled));
    });
}

void Board::reportAnalog(int channel, bool enabled)
{
    instrument("report_analog", params({{"channel", channel}, {"enabled", enabled}}), [&] {
        checkNibbleIndex(channel);
        write(encoder::reportAnalog(channel, enabled));
    });
}

void Board::setSamplingInterval(int interval_ms)
{
    instrument("set_sampling_interval", params({{"interval_ms", interval_ms}}), [&] {
        write(encoder::samplingInterval(interval_ms));
    });
}

void Board::queryProtocolVersion()
{
    instrument("query_protocol_version", "", [this] { write(encoder::queryProtocolVersion()); });
}

void Board::queryFirmware()
{
    instrument("query_firmware", "", [this] { write(encoder::queryFirmware()); });
}

void Board::queryCapabilities()
{
    instrument("query_capabilities", "", [this] { write(encoder::queryCapabilities()); });
}

void Board::queryAnalogMapping()
{
    instrument("query_analog_mapping", "", [this] { write(encoder::queryAnalogMapping()); });
}

void Board::queryPinState(int pin)
{
    instrument("query_pin_state", params({{"pin", pin}}), [&] {
        state_.pinAt(pin);
        write(encoder::queryPinState(pin));
    });
}

void Board::i2cConfig(int delay_us)
{
    instrument("i2c_config", params({{"delay", delay_us}}), [&] {
        write(encoder::i2cConfig(delay_us));
    });
}

void Board::i2cRead(int address, int size)
{
    instrument("i2c_read", params({{"address", address}, {"size", size}}), [&] {
        write(encoder::i2cRead(address, size));
    });
}

void Board::i2cWrite(int address, const std::vector<uint8_t> &data)
{
    instrument("i2c_write",
               params({{"address", address}, {"bytes", static_cast<int>(data.size())}}),
               [&] { write(encoder::i2cWrite(address, data)); });
}

Message Board::readAndDecode()
{
    return instrument("read_and_decode", "", [this] {
        return decoder_.readAndDecode(*transport_, state_);
    });
}

bool Board::waitForData(std::chrono::milliseconds timeout)
{
    if (decoder_.pendingBytes() > 0) {
        return true;
    }
    return transport_->poll(timeout);
}

} // namespace firmata
