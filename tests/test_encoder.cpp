#include <doctest/doctest.h>

#include "firmata/firmata_encoder.hpp"

using namespace firmata;
using Bytes = std::vector<uint8_t>;

TEST_CASE("fixed size commands") {
    SUBCASE("set pin mode") {
        CHECK(encoder::setPinMode(13, PinMode::Output) == Bytes{0xF4, 13, 0x01});
        CHECK(encoder::setPinMode(3, PinMode::Servo) == Bytes{0xF4, 3, 0x04});
    }

    SUBCASE("digital port carries the port in the low nibble") {
        CHECK(encoder::digitalPort(1, 0x20) == Bytes{0x91, 0x20, 0x00});
        CHECK(encoder::digitalPort(0, 0xFF) == Bytes{0x90, 0x7F, 0x01});
    }

    SUBCASE("analog splits 14 bits low byte first") {
        CHECK(encoder::analog(3, 255) == Bytes{0xE3, 0x7F, 0x01});
        CHECK(encoder::analog(9, 16383) == Bytes{0xE9, 0x7F, 0x7F});
        CHECK(encoder::analog(0, 0) == Bytes{0xE0, 0x00, 0x00});
    }

    SUBCASE("reporting toggles") {
        CHECK(encoder::reportDigital(1, true) == Bytes{0xD1, 1});
        CHECK(encoder::reportDigital(0, false) == Bytes{0xD0, 0});
        CHECK(encoder::reportAnalog(2, true) == Bytes{0xC2, 1});
    }

    SUBCASE("protocol version query is a single byte") {
        CHECK(encoder::queryProtocolVersion() == Bytes{0xF9});
    }
}

TEST_CASE("sysex queries are framed") {
    CHECK(encoder::queryFirmware() == Bytes{0xF0, 0x79, 0xF7});
    CHECK(encoder::queryCapabilities() == Bytes{0xF0, 0x6B, 0xF7});
    CHECK(encoder::queryAnalogMapping() == Bytes{0xF0, 0x69, 0xF7});
    CHECK(encoder::queryPinState(13) == Bytes{0xF0, 0x6D, 13, 0xF7});
    CHECK(encoder::samplingInterval(1000) == Bytes{0xF0, 0x7A, 0x68, 0x07, 0xF7});
}

TEST_CASE("extended analog uses as many 7-bit groups as needed") {
    CHECK(encoder::extendedAnalog(20, 100) == Bytes{0xF0, 0x6F, 20, 100, 0, 0xF7});
    CHECK(encoder::extendedAnalog(3, 0x4000) == Bytes{0xF0, 0x6F, 3, 0, 0, 1, 0xF7});
}

TEST_CASE("i2c requests") {
    SUBCASE("config delay is split into 7-bit halves") {
        CHECK(encoder::i2cConfig(0) == Bytes{0xF0, 0x78, 0, 0, 0xF7});
        CHECK(encoder::i2cConfig(200) == Bytes{0xF0, 0x78, 0x48, 0x01, 0xF7});
    }

    SUBCASE("read carries the read mode and the size") {
        CHECK(encoder::i2cRead(0x09, 3) == Bytes{0xF0, 0x76, 0x09, 0x08, 3, 0, 0xF7});
        CHECK(encoder::i2cRead(0x50, 300) == Bytes{0xF0, 0x76, 0x50, 0x08, 0x2C, 0x02, 0xF7});
    }

    SUBCASE("write splits every data byte") {
        CHECK(encoder::i2cWrite(0x09, {'n', 255, 0})
              == Bytes{0xF0, 0x76, 0x09, 0x00, 'n', 0, 0x7F, 0x01, 0, 0, 0xF7});
        CHECK(encoder::i2cWrite(0x09, {}) == Bytes{0xF0, 0x76, 0x09, 0x00, 0xF7});
    }
}

TEST_CASE("no byte inside a sysex frame has the top bit set") {
    const std::vector<Bytes> frames{encoder::i2cWrite(0x7F, {0xFF, 0x80, 0x7F}),
                                    encoder::i2cConfig(0x3FFF),
                                    encoder::i2cRead(0x7F, 0x3FFF),
                                    encoder::extendedAnalog(127, 0x1FFFFF)};
    for (const auto &frame : frames) {
        REQUIRE(frame.size() >= 3);
        CHECK(frame.front() == START_SYSEX);
        CHECK(frame.back() == END_SYSEX);
        for (std::size_t i = 1; i + 1 < frame.size(); ++i) {
            CHECK((frame[i] & 0x80) == 0);
        }
    }
}
