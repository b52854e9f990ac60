#pragma once

#include "firmata_board_state.hpp"
#include "firmata_decoder.hpp"
#include "firmata_encoder.hpp"
#include "firmata_iboard.hpp"
#include "transport/transport_itransport.hpp"

#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>

namespace firmata {

class Board : public IBoard
{
public:
    // Called after every board operation with its name, its parameters and
    // "ok", the decoded message tag or the error text
    using OperationHook = std::function<
        void(const std::string &operation, const std::string &params, const std::string &result)>;

    // Takes exclusive ownership of the transport and runs the handshake.
    // Throws if the device cannot be initialized.
    explicit Board(std::unique_ptr<transport::ITransport> transport, OperationHook hook = nullptr);
    ~Board();

    Board(const Board &) = delete;
    Board &operator=(const Board &) = delete;
    Board(Board &&) noexcept = delete;
    Board &operator=(Board &&) noexcept = delete;

    /*
     * Handshake: query firmware, capabilities and analog mapping, then decode
     * until each of the three responses has been seen at least once, in any
     * order, then enable digital reporting for ports 0 and 1. Other messages
     * arriving meanwhile are applied and skipped.
     */
    void initialize() override final;

    void setOperationHook(OperationHook hook);

    const BoardState &state() const { return state_; }

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
    void write(const encoder::Frame &frame);

    void notify(const char *operation, const std::string &params, const std::string &result) const;

    template<typename Fn>
    auto instrument(const char *operation, const std::string &params, Fn &&fn)
    {
        try {
            if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
                fn();
                notify(operation, params, "ok");
            } else {
                auto result = fn();
                notify(operation, params, toString(result));
                return result;
            }
        } catch (const std::exception &e) {
            notify(operation, params, std::string("error: ") + e.what());
            throw;
        }
    }

    std::unique_ptr<transport::ITransport> transport_;
    BoardState state_;
    Decoder decoder_;
    OperationHook hook_;
};

} // namespace firmata
