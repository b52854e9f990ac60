#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace transport {

// Ordered, reliable byte stream. Failures are reported as firmata::IoError.
class ITransport
{
public:
    virtual ~ITransport() = default;

    // Blocks until exactly `count` bytes have been read
    virtual std::vector<uint8_t> read(std::size_t count) = 0;
    // Writes the whole buffer, returns the number of bytes written
    virtual std::size_t write(const std::vector<uint8_t> &data) = 0;

    // True when a read would not block. Streams without readiness
    // notification are always considered readable.
    virtual bool poll(std::chrono::milliseconds) { return true; }

    virtual std::string describe() const = 0;
};

} // namespace transport
