#include "firmata_retry_board.hpp"

#include <thread>
#include <utility>

namespace firmata {

RetryBoard::RetryBoard(IBoard &board,
                       BackoffPolicy policy,
                       Sleeper sleeper,
                       ExponentialBackoff::Clock clock)
    : board_(board)
    , policy_(policy)
    , sleeper_(std::move(sleeper))
    , clock_(std::move(clock))
{
    // Rejects an unusable policy up front rather than on the first failure
    ExponentialBackoff validate(policy_, clock_);

    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds interval) { std::this_thread::sleep_for(interval); };
    }
}

void RetryBoard::setRetryHook(RetryHook hook)
{
    retry_hook_ = std::move(hook);
}

void RetryBoard::initialize()
{
    retry([&] { board_.initialize(); });
}

const std::vector<Pin> &RetryBoard::pins() const
{
    return board_.pins();
}

const DeviceIdentity &RetryBoard::identity() const
{
    return board_.identity();
}

const std::deque<I2CReply> &RetryBoard::i2cReplies() const
{
    return board_.i2cReplies();
}

std::optional<I2CReply> RetryBoard::popI2CReply()
{
    return board_.popI2CReply();
}

void RetryBoard::setPinMode(int pin, PinMode mode)
{
    retry([&] { board_.setPinMode(pin, mode); });
}

void RetryBoard::digitalWrite(int pin, int32_t level)
{
    retry([&] { board_.digitalWrite(pin, level); });
}

void RetryBoard::analogWrite(int pin, int32_t level)
{
    retry([&] { board_.analogWrite(pin, level); });
}

void RetryBoard::reportDigital(int port, bool enabled)
{
    retry([&] { board_.reportDigital(port, enabled); });
}

void RetryBoard::reportAnalog(int channel, bool enabled)
{
    retry([&] { board_.reportAnalog(channel, enabled); });
}

void RetryBoard::setSamplingInterval(int interval_ms)
{
    retry([&] { board_.setSamplingInterval(interval_ms); });
}

void RetryBoard::queryProtocolVersion()
{
    retry([&] { board_.queryProtocolVersion(); });
}

void RetryBoard::queryFirmware()
{
    retry([&] { board_.queryFirmware(); });
}

void RetryBoard::queryCapabilities()
{
    retry([&] { board_.queryCapabilities(); });
}

void RetryBoard::queryAnalogMapping()
{
    retry([&] { board_.queryAnalogMapping(); });
}

void RetryBoard::queryPinState(int pin)
{
    retry([&] { board_.queryPinState(pin); });
}

void RetryBoard::i2cConfig(int delay_us)
{
    retry([&] { board_.i2cConfig(delay_us); });
}

void RetryBoard::i2cRead(int address, int size)
{
    retry([&] { board_.i2cRead(address, size); });
}

void RetryBoard::i2cWrite(int address, const std::vector<uint8_t> &data)
{
    retry([&] { board_.i2cWrite(address, data); });
}

Message RetryBoard::readAndDecode()
{
    return retry([&] { return board_.readAndDecode(); });
}

bool RetryBoard::waitForData(std::chrono::milliseconds timeout)
{
    return retry([&] { return board_.waitForData(timeout); });
}

} // namespace firmata
