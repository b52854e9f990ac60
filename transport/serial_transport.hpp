#pragma once

#include "transport_itransport.hpp"

#include <string>

namespace transport {

// Raw 8N1 tty without flow control
class SerialTransport : public ITransport
{
public:
    SerialTransport(const std::string &device, int baud_rate);
    ~SerialTransport();

    SerialTransport(const SerialTransport &) = delete;
    SerialTransport &operator=(const SerialTransport &) = delete;
    SerialTransport(SerialTransport &&) noexcept = delete;
    SerialTransport &operator=(SerialTransport &&) noexcept = delete;

    std::vector<uint8_t> read(std::size_t count) override final;
    std::size_t write(const std::vector<uint8_t> &data) override final;
    bool poll(std::chrono::milliseconds timeout) override final;
    std::string describe() const override final;

private:
    void configure();

    std::string device_;
    int baud_rate_;
    int fd_ = -1;
};

} // namespace transport
