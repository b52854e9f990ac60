#pragma once

#include <cstddef>
#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>

namespace firmata {

enum class ErrorKind {
    UnknownSysEx,
    BadByte,
    Io,
    TextDecode,
    MessageTooShort,
    PinOutOfBounds,
    AttemptsExceeded,
    TimeoutExceeded
};

class Error : public std::runtime_error
{
public:
    Error(ErrorKind kind, const std::string &what)
        : std::runtime_error(what)
        , kind_(kind)
    {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class UnknownSysExError : public Error
{
public:
    explicit UnknownSysExError(uint8_t code);

    uint8_t code() const noexcept { return code_; }

private:
    uint8_t code_;
};

class BadByteError : public Error
{
public:
    explicit BadByteError(uint8_t byte);

    uint8_t byte() const noexcept { return byte_; }

private:
    uint8_t byte_;
};

// Any transport failure: OS error, closed stream, short write
class IoError : public Error
{
public:
    explicit IoError(const std::string &what)
        : Error(ErrorKind::Io, "I/O error: " + what)
    {}
};

class TextDecodeError : public Error
{
public:
    explicit TextDecodeError(const std::string &what)
        : Error(ErrorKind::TextDecode, "UTF-8 error: " + what)
    {}
};

class MessageTooShortError : public Error
{
public:
    MessageTooShortError()
        : Error(ErrorKind::MessageTooShort, "Message was too short")
    {}
};

class PinOutOfBoundsError : public Error
{
public:
    PinOutOfBoundsError(int pin, std::size_t pin_count);

    int pin() const noexcept { return pin_; }
    std::size_t pinCount() const noexcept { return pin_count_; }

private:
    int pin_;
    std::size_t pin_count_;
};

// Base for retry exhaustion, keeps the error of the final attempt
class RetryExhaustedError : public Error
{
public:
    RetryExhaustedError(ErrorKind kind,
                        const std::string &what,
                        int attempts,
                        std::exception_ptr last_error);

    int attempts() const noexcept { return attempts_; }
    std::exception_ptr lastError() const noexcept { return last_error_; }
    void rethrowLastError() const;

private:
    int attempts_;
    std::exception_ptr last_error_;
};

class AttemptsExceededError : public RetryExhaustedError
{
public:
    AttemptsExceededError(int attempts, std::exception_ptr last_error);
};

class TimeoutExceededError : public RetryExhaustedError
{
public:
    TimeoutExceededError(int attempts, std::exception_ptr last_error);
};

// what() of the exception held by ptr, or a placeholder
std::string describe(std::exception_ptr ptr);

} // namespace firmata
