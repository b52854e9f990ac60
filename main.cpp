#include "application.hpp"
#include "config.hpp"
#include "firmata/firmata_board.hpp"
#include "mqtt/mqtt_client.hpp"
#include "transport/serial_transport.hpp"

#include <cstdlib> // std::getenv
#include <iostream>
#include <memory>
#include <string>

std::string getEnvVar(const std::string &key, const std::string &default_value = "")
{
    if (const char *val = std::getenv(key.c_str())) {
        return std::string(val);
    }
    return default_value;
}

int getEnvVarInt(const std::string &key, int default_value)
{
    if (const char *val = std::getenv(key.c_str())) {
        return std::stoi(val);
    }
    return default_value;
}

int main()
{
    try {
        AppConfig app_config{
            .max_reconnect_attempts = getEnvVarInt("MAX_RECONNECT_ATTEMPTS", 5),
            .trace_board = !getEnvVar("FIRMATA_TRACE").empty(),
            .serial = SerialConfig{.device = getEnvVar("SERIAL_DEVICE", "/dev/ttyACM0"),
                                   .baud_rate = getEnvVarInt("SERIAL_BAUD", 57600)},
            .mqtt = MqttConfig{.host = getEnvVar("MQTT_HOST", "localhost"),
                               .port = getEnvVarInt("MQTT_PORT", 1883),
                               .client_id = getEnvVar("MQTT_CLIENT_ID", "firmata_bridge"),
                               .username = getEnvVar("MQTT_USERNAME", ""),
                               .password = getEnvVar("MQTT_PASSWORD", "")},
            .topics = TopicConfig{.prefix = getEnvVar("MQTT_TOPIC_PREFIX", "firmata")},
            .backoff = BackoffConfig{.initial_interval_ms = getEnvVarInt("BACKOFF_INITIAL_MS", 500),
                                     .max_interval_ms = getEnvVarInt("BACKOFF_MAX_INTERVAL_MS", 5000),
                                     .max_elapsed_ms = getEnvVarInt("BACKOFF_MAX_ELAPSED_MS", 30000)}};

        firmata::Board::OperationHook trace = nullptr;
        if (app_config.trace_board) {
            trace = [](const std::string &operation, const std::string &params, const std::string &result) {
                std::clog << "[BOARD] " << operation << "(" << params << ") -> " << result << std::endl;
            };
        }

        std::cout << "[MAIN] Opening board on " << app_config.serial.device << std::endl;
        auto serial = std::make_unique<transport::SerialTransport>(app_config.serial.device,
                                                                   app_config.serial.baud_rate);
        auto board = std::make_unique<firmata::Board>(std::move(serial), trace);

        std::cout << "[MAIN] Board ready: " << board->identity().firmware_name << " "
                  << board->identity().firmware_version << ", " << board->pins().size() << " pins"
                  << std::endl;

        std::unique_ptr<mqtt::IClient> mqtt_client = std::make_unique<mqtt::Client>(app_config.mqtt);

        Application app(app_config, std::move(mqtt_client), std::move(board));

        app.run();
    } catch (const std::exception &ex) {
        std::cerr << "[MAIN] Unhandled exception: " << ex.what() << std::endl;
        return 1;
    }
}
