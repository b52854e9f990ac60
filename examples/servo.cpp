#include "firmata/firmata_board.hpp"
#include "transport/serial_transport.hpp"

#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

int main(int argc, char **argv)
{
    const std::string device = argc > 1 ? argv[1] : "/dev/ttyACM0";
    constexpr int pin = 3;

    try {
        firmata::Board board(std::make_unique<transport::SerialTransport>(device, 57600));

        board.setPinMode(pin, firmata::PinMode::Servo);

        while (true) {
            for (int angle = 0; angle < 180; ++angle) {
                board.analogWrite(pin, angle);
                std::cout << angle << std::endl;
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
        }
    } catch (const std::exception &ex) {
        std::cerr << "[SERVO] " << ex.what() << std::endl;
        return 1;
    }
}
