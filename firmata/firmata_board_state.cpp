#include "firmata_board_state.hpp"
#include "firmata_error.hpp"

#include <utility>

namespace firmata {

Pin &BoardState::pinAt(int pin)
{
    if (!hasPin(pin)) {
        throw PinOutOfBoundsError(pin, pins.size());
    }
    return pins[static_cast<std::size_t>(pin)];
}

const Pin &BoardState::pinAt(int pin) const
{
    if (!hasPin(pin)) {
        throw PinOutOfBoundsError(pin, pins.size());
    }
    return pins[static_cast<std::size_t>(pin)];
}

uint8_t BoardState::portValue(int port) const
{
    uint8_t value = 0;
    for (int i = 0; i < PINS_PER_PORT; ++i) {
        const int pin = PINS_PER_PORT * port + i;
        if (hasPin(pin) && pins[static_cast<std::size_t>(pin)].value != 0) {
            value |= static_cast<uint8_t>(1 << i);
        }
    }
    return value;
}

std::optional<I2CReply> BoardState::popI2CReply()
{
    if (i2c_replies.empty()) {
        return std::nullopt;
    }
    I2CReply reply = std::move(i2c_replies.front());
    i2c_replies.pop_front();
    return reply;
}

} // namespace firmata
