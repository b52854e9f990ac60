#include "firmata/firmata_board.hpp"
#include "transport/serial_transport.hpp"

#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

int main(int argc, char **argv)
{
    const std::string device = argc > 1 ? argv[1] : "/dev/ttyACM0";
    constexpr int led = 13;

    try {
        firmata::Board board(std::make_unique<transport::SerialTransport>(device, 57600));

        std::cout << "firmware version " << board.identity().firmware_version << std::endl;
        std::cout << "firmware name " << board.identity().firmware_name << std::endl;

        board.setPinMode(led, firmata::PinMode::Output);

        int level = 0;
        while (true) {
            board.digitalWrite(led, level);
            std::cout << "led " << (level ? "on" : "off") << std::endl;
            level ^= 1;
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
        }
    } catch (const std::exception &ex) {
        std::cerr << "[BLINK] " << ex.what() << std::endl;
        return 1;
    }
}
