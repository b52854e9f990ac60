#include <doctest/doctest.h>

#include "firmata/firmata_error.hpp"
#include "test_support.hpp"
#include "transport/serial_transport.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <fcntl.h>
#include <poll.h>
#include <string>
#include <thread>
#include <unistd.h>

using firmata::IoError;
using std::chrono::milliseconds;

namespace {

// Pseudo-terminal pair: the transport opens the slave, the test drives the master
class PseudoTerminal
{
public:
    PseudoTerminal()
    {
        master_ = ::posix_openpt(O_RDWR | O_NOCTTY);
        REQUIRE(master_ >= 0);
        REQUIRE(::grantpt(master_) == 0);
        REQUIRE(::unlockpt(master_) == 0);
        const char *name = ::ptsname(master_);
        REQUIRE(name != nullptr);
        slave_name_ = name;
    }

    ~PseudoTerminal() { closeMaster(); }

    PseudoTerminal(const PseudoTerminal &) = delete;
    PseudoTerminal &operator=(const PseudoTerminal &) = delete;

    const std::string &slaveName() const { return slave_name_; }

    void closeMaster()
    {
        if (master_ >= 0) {
            ::close(master_);
            master_ = -1;
        }
    }

    bool send(const Bytes &bytes)
    {
        return ::write(master_, bytes.data(), bytes.size()) == static_cast<ssize_t>(bytes.size());
    }

    Bytes receive(std::size_t count)
    {
        Bytes bytes;
        while (bytes.size() < count) {
            pollfd pfd{master_, POLLIN, 0};
            REQUIRE(::poll(&pfd, 1, 1000) == 1);
            uint8_t buf[64];
            const ssize_t n = ::read(master_, buf, std::min(sizeof(buf), count - bytes.size()));
            REQUIRE(n > 0);
            bytes.insert(bytes.end(), buf, buf + n);
        }
        return bytes;
    }

private:
    int master_ = -1;
    std::string slave_name_;
};

} // namespace

TEST_CASE("serial read waits for the full count") {
    PseudoTerminal pty;
    transport::SerialTransport serial(pty.slaveName(), 57600);

    bool first_sent = false;
    bool second_sent = false;
    std::thread device([&] {
        first_sent = pty.send({0xF9, 0x02});
        std::this_thread::sleep_for(milliseconds(50));
        second_sent = pty.send({0x05});
    });

    const Bytes bytes = serial.read(3);
    device.join();

    CHECK(first_sent);
    CHECK(second_sent);
    CHECK(bytes == Bytes{0xF9, 0x02, 0x05});
}

TEST_CASE("serial poll reports pending input") {
    PseudoTerminal pty;
    transport::SerialTransport serial(pty.slaveName(), 57600);

    CHECK_FALSE(serial.poll(milliseconds(0)));

    REQUIRE(pty.send({0xE0, 0x10, 0x00}));
    CHECK(serial.poll(milliseconds(1000)));
    CHECK(serial.read(3) == Bytes{0xE0, 0x10, 0x00});
    CHECK_FALSE(serial.poll(milliseconds(0)));
}

TEST_CASE("serial write sends the whole frame") {
    PseudoTerminal pty;
    transport::SerialTransport serial(pty.slaveName(), 115200);

    const Bytes frame{0xF0, 0x79, 0xF7};
    CHECK(serial.write(frame) == frame.size());
    CHECK(pty.receive(frame.size()) == frame);
    CHECK(serial.describe() == pty.slaveName() + "@115200");
}

TEST_CASE("serial hang-up is an I/O error") {
    PseudoTerminal pty;
    transport::SerialTransport serial(pty.slaveName(), 57600);

    pty.closeMaster();

    SUBCASE("read") {
        CHECK_THROWS_AS(serial.read(1), IoError);
    }
    SUBCASE("poll") {
        CHECK_THROWS_AS(serial.poll(milliseconds(100)), IoError);
    }
}

TEST_CASE("serial open failures") {
    SUBCASE("unsupported baud rate") {
        PseudoTerminal pty;
        CHECK_THROWS_AS(transport::SerialTransport(pty.slaveName(), 1234), IoError);
    }
    SUBCASE("missing device") {
        CHECK_THROWS_AS(transport::SerialTransport("/dev/firmata-does-not-exist", 57600), IoError);
    }
}
