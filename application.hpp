#pragma once

#include "config.hpp"
#include "firmata/firmata_iboard.hpp"
#include "firmata/firmata_retry_board.hpp"
#include "mqtt/mqtt_iclient.hpp"
#include "safe_queue.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <utility>
#include <vector>

// Bridges one Firmata board to an MQTT broker: JSON commands in, pin
// telemetry and I2C replies out. The board is only touched from the thread
// running run()/poll(); MQTT callbacks only enqueue.
class Application
{
public:
    Application(const AppConfig &config,
                std::unique_ptr<mqtt::IClient> mqtt_client,
                std::unique_ptr<firmata::IBoard> board);
    ~Application();

    void run();
    void restart();
    void stop();

    // One pass of the connected state: drain board telemetry, then handle at
    // most one queued command
    void poll(std::chrono::milliseconds board_timeout);

private:
    enum class State {
        WaitingToConnect,
        Connected,
        Disconnected,
        Reconnecting,
        Restarting,
        Exiting
    };

    void connectToMqtt();
    void setupMqttHandlers();
    void processIncomingMessage(const std::string &topic, const std::string &payload);
    void executeCommand(const std::string &command, const nlohmann::json &data);
    void processBoard(std::chrono::milliseconds timeout);
    void handleBoardMessage(firmata::Message message);

    void publishPinChanges();
    void publishI2CReplies();
    void publishDevice();
    void publishError(const std::string &msg);

    void printMessage(const std::string &msg) const;
    void printError(const std::string &msg) const;

private:
    AppConfig config_;
    std::unique_ptr<mqtt::IClient> mqtt_client_;
    std::unique_ptr<firmata::IBoard> board_;
    firmata::RetryBoard retry_board_;
    SafeQueue<std::pair<std::string, std::string>> incoming_messages_;

    // Pin values as last published
    std::vector<int32_t> published_values_;

    std::atomic<bool> announce_pending_{false};

    State state_;
    int reconnect_attempts_;
    std::chrono::steady_clock::time_point last_reconnect_time_;

    mutable std::mutex state_mutex_;
    mutable std::mutex log_mutex_;
};
