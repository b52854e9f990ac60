#include "firmata/firmata_board.hpp"
#include "transport/serial_transport.hpp"

#include <iostream>
#include <memory>

int main(int argc, char **argv)
{
    const std::string device = argc > 1 ? argv[1] : "/dev/ttyACM0";
    constexpr int channel = 0;
    constexpr int pin = channel + firmata::ANALOG_PIN_OFFSET; // A0

    try {
        firmata::Board board(std::make_unique<transport::SerialTransport>(device, 57600));

        board.setPinMode(pin, firmata::PinMode::Analog);
        board.reportAnalog(channel, true);

        while (true) {
            if (board.readAndDecode() == firmata::Message::Analog) {
                std::cout << "analog value: " << board.pins()[pin].value << std::endl;
            }
        }
    } catch (const std::exception &ex) {
        std::cerr << "[ANALOG] " << ex.what() << std::endl;
        return 1;
    }
}
