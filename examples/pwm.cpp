#include "firmata/firmata_board.hpp"
#include "firmata/firmata_retry_board.hpp"
#include "transport/serial_transport.hpp"

#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

// Fades an LED, going through the retrying board so a busy device only slows us down
int main(int argc, char **argv)
{
    const std::string device = argc > 1 ? argv[1] : "/dev/ttyACM0";
    constexpr int pin = 3;

    try {
        firmata::Board board(std::make_unique<transport::SerialTransport>(device, 57600));
        firmata::RetryBoard retrying(board);

        retrying.setPinMode(pin, firmata::PinMode::Pwm);

        while (true) {
            for (int level = 0; level <= 255; level += 5) {
                retrying.analogWrite(pin, level);
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
            for (int level = 255; level >= 0; level -= 5) {
                retrying.analogWrite(pin, level);
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
        }
    } catch (const std::exception &ex) {
        std::cerr << "[PWM] " << ex.what() << std::endl;
        return 1;
    }
}
