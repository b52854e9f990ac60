#include "mqtt_client.hpp"
#include <iostream>
#include <stdexcept>

namespace mqtt {

namespace {

constexpr int keepalive_s = 60;
constexpr int loop_timeout_ms = 100;
constexpr int qos = 0;

} // namespace

Client::Client(const MqttConfig &config)
    : config_(config)
{
    mosquitto_lib_init();

    mosq_ = mosquitto_new(config_.client_id.c_str(), true, this);
    if (!mosq_) {
        mosquitto_lib_cleanup();
        throw std::runtime_error("Failed to create Mosquitto instance");
    }

    if (!config_.username.empty()) {
        const char *password = config_.password.empty() ? nullptr : config_.password.c_str();
        int rc = mosquitto_username_pw_set(mosq_, config_.username.c_str(), password);
        if (rc != MOSQ_ERR_SUCCESS) {
            mosquitto_destroy(mosq_);
            mosquitto_lib_cleanup();
            throw std::runtime_error("Failed to set username/password: "
                                     + std::string(mosquitto_strerror(rc)));
        }
    }

    mosquitto_connect_callback_set(mosq_, &Client::onConnectWrapper);
    mosquitto_disconnect_callback_set(mosq_, &Client::onDisconnectWrapper);
    mosquitto_message_callback_set(mosq_, &Client::onMessageWrapper);
}

Client::~Client()
{
    disconnect();
    if (mosq_) {
        mosquitto_destroy(mosq_);
    }
    mosquitto_lib_cleanup();
}

void Client::connect()
{
    // Loop thread of a previous session exits on its own after a broker disconnect
    if (loop_thread_.joinable()) {
        running_ = false;
        loop_thread_.join();
    }

    int rc = mosquitto_connect(mosq_, config_.host.c_str(), config_.port, keepalive_s);
    if (rc != MOSQ_ERR_SUCCESS) {
        throw std::runtime_error("Failed to connect to MQTT broker " + config_.host + ":"
                                 + std::to_string(config_.port) + ": "
                                 + std::string(mosquitto_strerror(rc)));
    }

    running_ = true;
    loop_thread_ = std::thread([this] { loop(loop_timeout_ms); });
}

void Client::disconnect()
{
    if (running_) {
        // Give queued messages a chance before the link goes away
        flushPublishQueue();
    }
    mosquitto_disconnect(mosq_);

    running_ = false;
    if (loop_thread_.joinable()) {
        loop_thread_.join();
    }
    connected_ = false;
}

bool Client::isConnected()
{
    return connected_;
}

void Client::subscribe(const std::string &topic)
{
    std::lock_guard<std::mutex> lock(mutex_);

    int rc = mosquitto_subscribe(mosq_, nullptr, topic.c_str(), qos);
    if (rc != MOSQ_ERR_SUCCESS) {
        throw std::runtime_error("Failed to subscribe to " + topic + ": "
                                 + std::string(mosquitto_strerror(rc)));
    }
}

void Client::publish(const std::string &topic, const std::string &payload, bool retain)
{
    publish_queue_.emplace(topic, payload, retain);
}

void Client::setWill(const std::string &topic, const std::string &payload)
{
    std::lock_guard<std::mutex> lock(mutex_);

    int rc = mosquitto_will_set(mosq_,
                                topic.c_str(),
                                static_cast<int>(payload.size()),
                                payload.c_str(),
                                qos,
                                true);
    if (rc != MOSQ_ERR_SUCCESS) {
        throw std::runtime_error("Failed to set will on " + topic + ": "
                                 + std::string(mosquitto_strerror(rc)));
    }
}

void Client::setMessageCallback(MessageCallback callback)
{
    std::lock_guard<std::mutex> lock(mutex_);
    message_callback_ = std::move(callback);
}

void Client::setConnectCallback(ConnectCallback callback)
{
    std::lock_guard<std::mutex> lock(mutex_);
    connect_callback_ = std::move(callback);
}

void Client::setDisconnectCallback(DisconnectCallback callback)
{
    std::lock_guard<std::mutex> lock(mutex_);
    disconnect_callback_ = std::move(callback);
}

void Client::loop(int timeout_ms)
{
    while (running_) {
        int rc = mosquitto_loop(mosq_, timeout_ms, 1);
        if (rc != MOSQ_ERR_SUCCESS && running_) {
            printError("[MQTT_CLIENT] loop error: " + std::string(mosquitto_strerror(rc)));
            break;
        }
        flushPublishQueue();
    }
}

void Client::flushPublishQueue()
{
    while (auto item = publish_queue_.tryPop()) {
        int rc = mosquitto_publish(mosq_,
                                   nullptr,
                                   item->topic.c_str(),
                                   static_cast<int>(item->payload.size()),
                                   item->payload.c_str(),
                                   qos,
                                   item->retain);
        if (rc != MOSQ_ERR_SUCCESS) {
            printError("[MQTT_CLIENT] Publish to " + item->topic
                       + " failed: " + std::string(mosquitto_strerror(rc)));
        }
    }
}

void Client::onConnectWrapper(struct mosquitto *, void *obj, int rc)
{
    if (auto *self = static_cast<Client *>(obj)) {
        self->onConnect(rc);
    }
}

void Client::onDisconnectWrapper(struct mosquitto *, void *obj, int rc)
{
    if (auto *self = static_cast<Client *>(obj)) {
        self->onDisconnect(rc);
    }
}

void Client::onMessageWrapper(struct mosquitto *, void *obj, const struct mosquitto_message *msg)
{
    if (auto *self = static_cast<Client *>(obj)) {
        self->onMessage(msg);
    }
}

void Client::onConnect(int rc)
{
    if (rc != 0) {
        printError("[MQTT_CLIENT] Connection refused: " + std::string(mosquitto_connack_string(rc)));
        return;
    }

    printMessage("[MQTT_CLIENT] Connected to " + config_.host + ":" + std::to_string(config_.port));
    connected_ = true;

    ConnectCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = connect_callback_;
    }
    if (callback) {
        callback();
    }
}

void Client::onDisconnect(int rc)
{
    printMessage("[MQTT_CLIENT] Disconnected: " + std::to_string(rc));
    running_ = false;
    connected_ = false;

    DisconnectCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = disconnect_callback_;
    }
    if (callback) {
        callback(rc);
    }
}

void Client::onMessage(const struct mosquitto_message *msg)
{
    if (!msg || !msg->payload) {
        return;
    }

    MessageCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = message_callback_;
    }
    if (callback) {
        std::string topic = msg->topic ? msg->topic : "";
        std::string payload(static_cast<const char *>(msg->payload), msg->payloadlen);
        callback(topic, payload);
    }
}

void Client::printMessage(const std::string &msg)
{
    std::lock_guard<std::mutex> lock(log_mutex_);
    std::cout << msg << std::endl;
}

void Client::printError(const std::string &msg)
{
    std::lock_guard<std::mutex> lock(log_mutex_);
    std::cerr << msg << std::endl;
}

} // namespace mqtt
