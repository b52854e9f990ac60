#include "serial_transport.hpp"
#include "firmata/firmata_error.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

namespace transport {

namespace {

speed_t toSpeed(int baud_rate)
{
    switch (baud_rate) {
    case 9600:
        return B9600;
    case 19200:
        return B19200;
    case 38400:
        return B38400;
    case 57600:
        return B57600;
    case 115200:
        return B115200;
    default:
        throw firmata::IoError("Unsupported baud rate: " + std::to_string(baud_rate));
    }
}

std::string lastError(const std::string &what)
{
    return what + ": " + std::strerror(errno);
}

} // namespace

SerialTransport::SerialTransport(const std::string &device, int baud_rate)
    : device_(device)
    , baud_rate_(baud_rate)
{
    fd_ = ::open(device_.c_str(), O_RDWR | O_NOCTTY);
    if (fd_ < 0) {
        throw firmata::IoError(lastError("Failed to open " + device_));
    }

    try {
        configure();
    } catch (...) {
        ::close(fd_);
        throw;
    }
}

SerialTransport::~SerialTransport()
{
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

void SerialTransport::configure()
{
    const speed_t speed = toSpeed(baud_rate_);

    termios tty{};
    if (tcgetattr(fd_, &tty) != 0) {
        throw firmata::IoError(lastError("tcgetattr failed on " + device_));
    }

    cfmakeraw(&tty);
    cfsetispeed(&tty, speed);
    cfsetospeed(&tty, speed);

    tty.c_cflag &= ~(PARENB | CSTOPB | CSIZE | CRTSCTS);
    tty.c_cflag |= CS8 | CLOCAL | CREAD;
    // Block until at least one byte arrives
    tty.c_cc[VMIN] = 1;
    tty.c_cc[VTIME] = 0;

    if (tcsetattr(fd_, TCSANOW, &tty) != 0) {
        throw firmata::IoError(lastError("tcsetattr failed on " + device_));
    }
    tcflush(fd_, TCIOFLUSH);
}

std::vector<uint8_t> SerialTransport::read(std::size_t count)
{
    std::vector<uint8_t> buf(count);
    std::size_t offset = 0;

    while (offset < count) {
        ssize_t n = ::read(fd_, buf.data() + offset, count - offset);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw firmata::IoError(lastError("read failed on " + device_));
        }
        if (n == 0) {
            throw firmata::IoError("unexpected end of stream on " + device_);
        }
        offset += static_cast<std::size_t>(n);
    }
    return buf;
}

std::size_t SerialTransport::write(const std::vector<uint8_t> &data)
{
    std::size_t offset = 0;

    while (offset < data.size()) {
        ssize_t n = ::write(fd_, data.data() + offset, data.size() - offset);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw firmata::IoError(lastError("write failed on " + device_));
        }
        offset += static_cast<std::size_t>(n);
    }
    return offset;
}

bool SerialTransport::poll(std::chrono::milliseconds timeout)
{
    pollfd pfd{fd_, POLLIN, 0};

    int rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (rc < 0) {
        if (errno == EINTR) {
            return false;
        }
        throw firmata::IoError(lastError("poll failed on " + device_));
    }
    if (rc > 0 && (pfd.revents & (POLLERR | POLLHUP | POLLNVAL))) {
        throw firmata::IoError("device " + device_ + " hung up");
    }
    return rc > 0;
}

std::string SerialTransport::describe() const
{
    return device_ + "@" + std::to_string(baud_rate_);
}

} // namespace transport
