#include "firmata/firmata_board.hpp"
#include "transport/serial_transport.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>

// Drives a BlinkM RGB LED at I2C address 0x09. One thread decodes incoming
// messages while the main thread sends commands; every board call holds the lock.
namespace {

constexpr int blinkm_address = 0x09;

void setRgb(firmata::Board &board, std::mutex &mutex, const std::array<uint8_t, 3> &rgb)
{
    std::lock_guard<std::mutex> lock(mutex);
    board.i2cWrite(blinkm_address, {'n'});
    board.i2cWrite(blinkm_address, {rgb[0], rgb[1], rgb[2]});
}

std::vector<uint8_t> readRgb(firmata::Board &board, std::mutex &mutex, const std::atomic<bool> &running)
{
    {
        std::lock_guard<std::mutex> lock(mutex);
        board.i2cWrite(blinkm_address, {'g'});
        board.i2cRead(blinkm_address, 3);
    }
    while (running) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (auto reply = board.popI2CReply()) {
                return reply->data;
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    throw std::runtime_error("decoder stopped before the I2C reply arrived");
}

} // namespace

int main(int argc, char **argv)
{
    const std::string device = argc > 1 ? argv[1] : "/dev/ttyACM0";

    try {
        firmata::Board board(std::make_unique<transport::SerialTransport>(device, 57600));
        std::mutex mutex;
        std::atomic<bool> running{true};

        {
            std::lock_guard<std::mutex> lock(mutex);
            board.i2cConfig(0);
            // Stop the BlinkM light script
            board.i2cWrite(blinkm_address, {'o'});
        }

        std::thread decoder([&] {
            while (running) {
                {
                    std::lock_guard<std::mutex> lock(mutex);
                    try {
                        if (board.waitForData(std::chrono::milliseconds(0))) {
                            board.readAndDecode();
                        }
                    } catch (const std::exception &ex) {
                        std::cerr << "[BLINKM] decode failed: " << ex.what() << std::endl;
                        running = false;
                    }
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
        });

        const std::array<std::array<uint8_t, 3>, 3> colors{{{255, 0, 0}, {0, 255, 0}, {0, 0, 255}}};
        try {
            for (const auto &color : colors) {
                setRgb(board, mutex, color);
                std::cout << "rgb:";
                for (uint8_t c : readRgb(board, mutex, running)) {
                    std::cout << " " << static_cast<int>(c);
                }
                std::cout << std::endl;
                std::this_thread::sleep_for(std::chrono::seconds(1));
            }
        } catch (...) {
            running = false;
            decoder.join();
            throw;
        }

        running = false;
        decoder.join();
    } catch (const std::exception &ex) {
        std::cerr << "[BLINKM] " << ex.what() << std::endl;
        return 1;
    }
}
