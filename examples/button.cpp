#include "firmata/firmata_board.hpp"
#include "transport/serial_transport.hpp"

#include <iostream>
#include <memory>

int main(int argc, char **argv)
{
    const std::string device = argc > 1 ? argv[1] : "/dev/ttyACM0";
    constexpr int led = 13;
    constexpr int button = 2;

    try {
        firmata::Board board(std::make_unique<transport::SerialTransport>(device, 57600));

        board.setPinMode(led, firmata::PinMode::Output);
        board.setPinMode(button, firmata::PinMode::Input);
        // Pins 0-7 are port 0
        board.reportDigital(button / 8, true);

        int32_t last = -1;
        while (true) {
            if (board.readAndDecode() != firmata::Message::Digital) {
                continue;
            }
            const int32_t pressed = board.pins()[button].value;
            if (pressed != last) {
                std::cout << (pressed ? "on" : "off") << std::endl;
                board.digitalWrite(led, pressed);
                last = pressed;
            }
        }
    } catch (const std::exception &ex) {
        std::cerr << "[BUTTON] " << ex.what() << std::endl;
        return 1;
    }
}
