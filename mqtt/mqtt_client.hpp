#pragma once

#include "config.hpp"
#include "mqtt_iclient.hpp"
#include "safe_queue.hpp"

#include <atomic>
#include <mosquitto.h>
#include <mutex>
#include <string>
#include <thread>

namespace mqtt {

// libmosquitto client. Network I/O and publishing run on a private loop
// thread; callbacks are invoked from that thread.
class Client : public IClient
{
public:
    explicit Client(const MqttConfig &config);
    ~Client();

    Client(const Client &) = delete;
    Client &operator=(const Client &) = delete;
    Client(Client &&) noexcept = delete;
    Client &operator=(Client &&) noexcept = delete;

    void connect() override final;
    void disconnect() override final;
    bool isConnected() override final;
    void subscribe(const std::string &topic) override final;
    void publish(const std::string &topic, const std::string &payload, bool retain) override final;
    void setWill(const std::string &topic, const std::string &payload) override final;
    void setMessageCallback(MessageCallback callback) override final;
    void setConnectCallback(ConnectCallback callback) override final;
    void setDisconnectCallback(DisconnectCallback callback) override final;

private:
    struct Outgoing
    {
        std::string topic;
        std::string payload;
        bool retain;
    };

    static void onConnectWrapper(struct mosquitto *, void *, int rc);
    static void onDisconnectWrapper(struct mosquitto *, void *, int rc);
    static void onMessageWrapper(struct mosquitto *, void *, const struct mosquitto_message *);

    void onConnect(int rc);
    void onDisconnect(int rc);
    void onMessage(const struct mosquitto_message *msg);
    void loop(int timeout_ms);
    void flushPublishQueue();

    void printMessage(const std::string &msg);
    void printError(const std::string &msg);

private:
    MqttConfig config_;

    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};
    std::thread loop_thread_;
    SafeQueue<Outgoing> publish_queue_;

    MessageCallback message_callback_ = nullptr;
    ConnectCallback connect_callback_ = nullptr;
    DisconnectCallback disconnect_callback_ = nullptr;

    mutable std::mutex mutex_;
    mutable std::mutex log_mutex_;

    struct mosquitto *mosq_ = nullptr;
};

} // namespace mqtt
