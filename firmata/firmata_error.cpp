#include "firmata_error.hpp"

#include <cstdio>
#include <utility>

namespace firmata {

namespace {

std::string hexByte(uint8_t byte)
{
    char buf[8];
    std::snprintf(buf, sizeof(buf), "0x%02X", byte);
    return buf;
}

} // namespace

UnknownSysExError::UnknownSysExError(uint8_t code)
    : Error(ErrorKind::UnknownSysEx, "Unknown SysEx code: " + hexByte(code))
    , code_(code)
{}

BadByteError::BadByteError(uint8_t byte)
    : Error(ErrorKind::BadByte, "Received a bad byte: " + hexByte(byte))
    , byte_(byte)
{}

PinOutOfBoundsError::PinOutOfBoundsError(int pin, std::size_t pin_count)
    : Error(ErrorKind::PinOutOfBounds,
            "Pin out of bounds: " + std::to_string(pin) + " (" + std::to_string(pin_count) + ")")
    , pin_(pin)
    , pin_count_(pin_count)
{}

RetryExhaustedError::RetryExhaustedError(ErrorKind kind,
                                         const std::string &what,
                                         int attempts,
                                         std::exception_ptr last_error)
    : Error(kind, what)
    , attempts_(attempts)
    , last_error_(std::move(last_error))
{}

void RetryExhaustedError::rethrowLastError() const
{
    if (last_error_) {
        std::rethrow_exception(last_error_);
    }
}

AttemptsExceededError::AttemptsExceededError(int attempts, std::exception_ptr last_error)
    : RetryExhaustedError(ErrorKind::AttemptsExceeded,
                          "Attempts exceeded after " + std::to_string(attempts)
                              + " tries, last error: " + describe(last_error),
                          attempts,
                          last_error)
{}

TimeoutExceededError::TimeoutExceededError(int attempts, std::exception_ptr last_error)
    : RetryExhaustedError(ErrorKind::TimeoutExceeded,
                          "Timeout exceeded after " + std::to_string(attempts)
                              + " tries, last error: " + describe(last_error),
                          attempts,
                          last_error)
{}

std::string describe(std::exception_ptr ptr)
{
    if (!ptr) {
        return "none";
    }
    try {
        std::rethrow_exception(ptr);
    } catch (const std::exception &e) {
        return e.what();
    } catch (...) {
        return "non-standard exception";
    }
}

} // namespace firmata
