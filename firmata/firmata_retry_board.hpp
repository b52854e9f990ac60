#pragma once

#include "firmata_backoff.hpp"
#include "firmata_error.hpp"
#include "firmata_iboard.hpp"

#include <chrono>
#include <exception>
#include <functional>
#include <string>

namespace firmata {

/*
 * Decorates another board: every fallible operation is retried with
 * exponential backoff until it succeeds or the policy runs out. All failures
 * count as transient, a malformed frame is retried like an I/O hiccup.
 *
 * Exhaustion throws AttemptsExceededError (max_attempts reached) or
 * TimeoutExceededError (the next sleep would pass max_elapsed_time), both
 * carrying the error of the final attempt. The wrapped board must outlive
 * the decorator.
 */
class RetryBoard : public IBoard
{
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;
    // attempt number that failed, the wait before the next one, the error
    using RetryHook = std::function<
        void(int attempt, std::chrono::milliseconds interval, const std::string &error)>;

    explicit RetryBoard(IBoard &board,
                        BackoffPolicy policy = BackoffPolicy{},
                        Sleeper sleeper = nullptr,
                        ExponentialBackoff::Clock clock = nullptr);

    void setRetryHook(RetryHook hook);

    void initialize() override final;

    const std::vector<Pin> &pins() const override final;
    const DeviceIdentity &identity() const override final;
    const std::deque<I2CReply> &i2cReplies() const override final;
    std::optional<I2CReply> popI2CReply() override final;

    void setPinMode(int pin, PinMode mode) override final;
    void digitalWrite(int pin, int32_t level) override final;
    void analogWrite(int pin, int32_t level) override final;
    void reportDigital(int port, bool enabled) override final;
    void reportAnalog(int channel, bool enabled) override final;
    void setSamplingInterval(int interval_ms) override final;

    void queryProtocolVersion() override final;
    void queryFirmware() override final;
    void queryCapabilities() override final;
    void queryAnalogMapping() override final;
    void queryPinState(int pin) override final;

    void i2cConfig(int delay_us) override final;
    void i2cRead(int address, int size) override final;
    void i2cWrite(int address, const std::vector<uint8_t> &data) override final;

    Message readAndDecode() override final;
    bool waitForData(std::chrono::milliseconds timeout) override final;

private:
    template<typename Fn>
    auto retry(Fn &&fn)
    {
        ExponentialBackoff backoff(policy_, clock_);
        int attempts = 0;

        while (true) {
            ++attempts;
            try {
                return fn();
            } catch (const std::exception &e) {
                std::exception_ptr last_error = std::current_exception();
                if (policy_.max_attempts > 0 && attempts >= policy_.max_attempts) {
                    throw AttemptsExceededError(attempts, last_error);
                }
                const std::chrono::milliseconds interval = backoff.nextInterval();
                if (backoff.wouldExceed(interval)) {
                    throw TimeoutExceededError(attempts, last_error);
                }
                if (retry_hook_) {
                    retry_hook_(attempts, interval, e.what());
                }
                sleeper_(interval);
            }
        }
    }

    IBoard &board_;
    BackoffPolicy policy_;
    Sleeper sleeper_;
    ExponentialBackoff::Clock clock_;
    RetryHook retry_hook_;
};

} // namespace firmata
