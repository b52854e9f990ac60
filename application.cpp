#include "application.hpp"
#include "firmata/firmata_error.hpp"

#include <cstdint>
#include <iostream>
#include <limits>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace {

// Raised for malformed command payloads, reported on the error topic
class CommandError : public std::invalid_argument
{
public:
    using std::invalid_argument::invalid_argument;
};

firmata::BackoffPolicy toPolicy(const BackoffConfig &config)
{
    firmata::BackoffPolicy policy;
    policy.initial_interval = std::chrono::milliseconds(config.initial_interval_ms);
    policy.max_interval = std::chrono::milliseconds(config.max_interval_ms);
    policy.max_elapsed_time = std::chrono::milliseconds(config.max_elapsed_ms);
    return policy;
}

// Any JSON integer as int64_t; false for non-integers and unsigned values past INT64_MAX
bool toInt64(const nlohmann::json &value, int64_t &out)
{
    if (value.is_number_unsigned()) {
        const uint64_t raw = value.get<uint64_t>();
        if (raw > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return false;
        }
        out = static_cast<int64_t>(raw);
        return true;
    }
    if (value.is_number_integer()) {
        out = value.get<int64_t>();
        return true;
    }
    return false;
}

int requireInt(const nlohmann::json &data, const char *field, int min, int max)
{
    int64_t value = 0;
    if (!data.contains(field) || !data[field].is_number_integer()) {
        throw CommandError(std::string("Missing or invalid '") + field + "' field");
    }
    if (!toInt64(data[field], value) || value < min || value > max) {
        throw CommandError(std::string("'") + field + "' must be in range [" + std::to_string(min)
                           + ", " + std::to_string(max) + "]");
    }
    return static_cast<int>(value);
}

int requirePin(const nlohmann::json &data, const firmata::IBoard &board)
{
    const int pin_count = static_cast<int>(board.pins().size());
    if (pin_count == 0) {
        throw CommandError("Board has no pins");
    }
    return requireInt(data, "pin", 0, pin_count - 1);
}

bool requireFlag(const nlohmann::json &data, const char *field)
{
    if (!data.contains(field)) {
        throw CommandError(std::string("Missing '") + field + "' field");
    }
    const auto &value = data[field];
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    if (value.is_number_integer()) {
        return value.get<int>() != 0;
    }
    throw CommandError(std::string("'") + field + "' must be a boolean");
}

firmata::PinMode requireMode(const nlohmann::json &data)
{
    if (data.contains("mode") && data["mode"].is_string()) {
        if (auto mode = firmata::pinModeFromString(data["mode"].get<std::string>())) {
            return *mode;
        }
        throw CommandError("Unknown pin mode: " + data["mode"].get<std::string>());
    }
    return static_cast<firmata::PinMode>(requireInt(data, "mode", 0, 0x7F));
}

std::vector<uint8_t> requireBytes(const nlohmann::json &data, const char *field)
{
    if (!data.contains(field) || !data[field].is_array()) {
        throw CommandError(std::string("Missing or invalid '") + field + "' array");
    }
    std::vector<uint8_t> bytes;
    for (const auto &item : data[field]) {
        int64_t value = 0;
        if (!toInt64(item, value) || value < 0 || value > 0xFF) {
            throw CommandError(std::string("'") + field + "' must hold bytes in range [0, 255]");
        }
        bytes.push_back(static_cast<uint8_t>(value));
    }
    return bytes;
}

} // namespace

Application::Application(const AppConfig &config,
                         std::unique_ptr<mqtt::IClient> mqtt_client,
                         std::unique_ptr<firmata::IBoard> board)
    : config_(config)
    , mqtt_client_(std::move(mqtt_client))
    , board_(std::move(board))
    , retry_board_(*board_, toPolicy(config.backoff))
    , state_(State::WaitingToConnect)
    , reconnect_attempts_(0)
    , last_reconnect_time_(std::chrono::steady_clock::now())
{
    retry_board_.setRetryHook(
        [this](int attempt, std::chrono::milliseconds interval, const std::string &error) {
            printError("[APP] Board operation failed (attempt " + std::to_string(attempt)
                       + "), retrying in " + std::to_string(interval.count()) + " ms: " + error);
        });
    setupMqttHandlers();
}

Application::~Application() = default;

void Application::setupMqttHandlers()
{
    mqtt_client_->setWill(config_.topics.status(), "offline");

    mqtt_client_->setMessageCallback([this](const std::string &topic, const std::string &payload) {
        incoming_messages_.emplace(topic, payload);
    });

    mqtt_client_->setConnectCallback([this]() {
        printMessage("[APP] MQTT Client Connected");
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (state_ != State::Exiting) {
                state_ = State::Connected;
            }
            reconnect_attempts_ = 0;
        }
        // The board belongs to the main loop, announce from there
        announce_pending_ = true;
    });

    mqtt_client_->setDisconnectCallback([this](int reason) {
        printMessage("[APP] MQTT Client Disconnected, reason = " + std::to_string(reason));
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (state_ != State::Restarting && state_ != State::Exiting) {
                state_ = State::Disconnected;
                last_reconnect_time_ = std::chrono::steady_clock::now();
            }
        }
    });
}

void Application::connectToMqtt()
{
    try {
        mqtt_client_->connect();
        mqtt_client_->subscribe(config_.topics.control());
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (state_ != State::Connected && state_ != State::Exiting) {
                state_ = State::WaitingToConnect;
            }
        }
    } catch (const std::exception &e) {
        printError("[APP] MQTT initial client connect failed: " + std::string(e.what()));
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (state_ != State::Exiting) {
                state_ = State::Disconnected;
                last_reconnect_time_ = std::chrono::steady_clock::now();
            }
        }
    }
}

void Application::processIncomingMessage(const std::string &topic, const std::string &payload)
{
    printMessage("[APP] MQTT message received: [" + topic + "] " + payload);

    if (topic != config_.topics.control()) {
        publishError("Unsupported topic: " + topic);
        return;
    }

    nlohmann::json data;
    try {
        data = nlohmann::json::parse(payload);
    } catch (const std::exception &e) {
        publishError("Invalid JSON format: " + std::string(e.what()));
        return;
    }

    if (!data.is_object() || !data.contains("command") || !data["command"].is_string()) {
        publishError("Missing or invalid 'command' field");
        return;
    }

    const std::string command = data["command"];

    try {
        executeCommand(command, data);
    } catch (const CommandError &e) {
        publishError(command + ": " + e.what());
    } catch (const std::exception &e) {
        publishError("Board error on " + command + ": " + e.what());
    }
}

void Application::executeCommand(const std::string &command, const nlohmann::json &data)
{
    static constexpr int max_i2c_address = 0x7F;
    static constexpr int max_two_byte = 0x3FFF;
    static constexpr int max_analog_level = 0x1FFFFF;
    static constexpr int max_nibble = 0x0F;

    if (command == "restart") {
        printMessage("[APP] Received restart command");
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            state_ = State::Restarting;
        }
        return;
    }

    if (command == "set_pin_mode") {
        const int pin = requirePin(data, *board_);
        const firmata::PinMode mode = requireMode(data);
        retry_board_.setPinMode(pin, mode);
        printMessage("[APP] Pin " + std::to_string(pin) + " set to " + firmata::toString(mode));
    } else if (command == "digital_write") {
        const int pin = requirePin(data, *board_);
        const int value = requireInt(data, "value", 0, 1);
        retry_board_.digitalWrite(pin, value);
    } else if (command == "analog_write") {
        const int pin = requirePin(data, *board_);
        const int value = requireInt(data, "value", 0, max_analog_level);
        retry_board_.analogWrite(pin, value);
    } else if (command == "report_digital") {
        const int port = requireInt(data, "port", 0, max_nibble);
        retry_board_.reportDigital(port, requireFlag(data, "enabled"));
    } else if (command == "report_analog") {
        const int channel = requireInt(data, "channel", 0, max_nibble);
        retry_board_.reportAnalog(channel, requireFlag(data, "enabled"));
    } else if (command == "sampling_interval") {
        retry_board_.setSamplingInterval(requireInt(data, "interval_ms", 1, max_two_byte));
    } else if (command == "i2c_config") {
        retry_board_.i2cConfig(requireInt(data, "delay", 0, max_two_byte));
    } else if (command == "i2c_write") {
        const int address = requireInt(data, "address", 0, max_i2c_address);
        retry_board_.i2cWrite(address, requireBytes(data, "data"));
    } else if (command == "i2c_read") {
        const int address = requireInt(data, "address", 0, max_i2c_address);
        retry_board_.i2cRead(address, requireInt(data, "size", 1, max_two_byte));
    } else if (command == "query_firmware") {
        retry_board_.queryFirmware();
    } else if (command == "query_capabilities") {
        retry_board_.queryCapabilities();
    } else if (command == "query_analog_mapping") {
        retry_board_.queryAnalogMapping();
    } else if (command == "query_protocol_version") {
        retry_board_.queryProtocolVersion();
    } else if (command == "query_pin_state") {
        retry_board_.queryPinState(requirePin(data, *board_));
    } else {
        throw CommandError("Unsupported command");
    }

    // Commanded output values are published like incoming ones
    publishPinChanges();
}

void Application::processBoard(std::chrono::milliseconds timeout)
{
    // Bounded so a chatty board cannot starve command handling
    static constexpr int max_messages_per_pass = 32;

    try {
        if (!board_->waitForData(timeout)) {
            return;
        }
        for (int i = 0; i < max_messages_per_pass; ++i) {
            handleBoardMessage(board_->readAndDecode());
            if (!board_->waitForData(std::chrono::milliseconds(0))) {
                break;
            }
        }
    } catch (const firmata::IoError &e) {
        printError("[APP] Board connection error: " + std::string(e.what()));
        publishError(e.what());
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_ = State::Exiting;
    } catch (const std::exception &e) {
        // A malformed frame costs us that frame only
        printError("[APP] Board decode error: " + std::string(e.what()));
        publishError(e.what());
    }
}

void Application::handleBoardMessage(firmata::Message message)
{
    switch (message) {
    case firmata::Message::Analog:
    case firmata::Message::Digital:
    case firmata::Message::PinStateResponse:
        publishPinChanges();
        break;
    case firmata::Message::I2CReply:
        publishI2CReplies();
        break;
    case firmata::Message::CapabilityResponse:
        // Pin list was rebuilt, everything is new
        published_values_.clear();
        publishDevice();
        publishPinChanges();
        break;
    case firmata::Message::ReportFirmware:
    case firmata::Message::ProtocolVersion:
        publishDevice();
        break;
    case firmata::Message::AnalogMappingResponse:
    case firmata::Message::EmptyResponse:
        break;
    }
}

void Application::publishPinChanges()
{
    const auto &pins = board_->pins();
    if (published_values_.size() != pins.size()) {
        published_values_.assign(pins.size(), 0);
    }

    // Pin 0 is a placeholder
    for (std::size_t i = 1; i < pins.size(); ++i) {
        if (pins[i].value == published_values_[i]) {
            continue;
        }
        published_values_[i] = pins[i].value;

        nlohmann::json message;
        message["pin"] = i;
        message["mode"] = firmata::toString(pins[i].mode);
        message["value"] = pins[i].value;
        mqtt_client_->publish(config_.topics.pinState(), message.dump(), false);
    }
}

void Application::publishI2CReplies()
{
    while (auto reply = board_->popI2CReply()) {
        nlohmann::json message;
        message["address"] = reply->address;
        message["register"] = reply->reg;
        message["data"] = reply->data;
        std::string payload = message.dump();

        printMessage("[APP] I2C reply: " + payload);
        mqtt_client_->publish(config_.topics.i2cReply(), payload, false);
    }
}

void Application::publishDevice()
{
    const auto &identity = board_->identity();

    nlohmann::json message;
    message["firmware_name"] = identity.firmware_name;
    message["firmware_version"] = identity.firmware_version;
    message["protocol_version"] = identity.protocol_version;
    message["pin_count"] = board_->pins().size();
    mqtt_client_->publish(config_.topics.device(), message.dump(), true);
}

void Application::publishError(const std::string &msg)
{
    mqtt_client_->publish(config_.topics.errors(), msg, false);
}

void Application::restart()
{
    printMessage("[APP] Restarting board handshake...");

    try {
        retry_board_.initialize();
        published_values_.clear();
        publishDevice();
        publishPinChanges();
        printMessage("[APP] Board ready: " + board_->identity().firmware_name + " "
                     + board_->identity().firmware_version);
    } catch (const std::exception &e) {
        printError("[APP] Board restart failed: " + std::string(e.what()));
        publishError("Restart failed: " + std::string(e.what()));
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_ = State::Exiting;
        return;
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    state_ = mqtt_client_->isConnected() ? State::Connected : State::Disconnected;
}

void Application::stop()
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_ = State::Exiting;
}

void Application::poll(std::chrono::milliseconds board_timeout)
{
    if (announce_pending_.exchange(false)) {
        mqtt_client_->publish(config_.topics.status(), "online", true);
        publishDevice();
    }

    processBoard(board_timeout);

    if (auto msg = incoming_messages_.tryPop()) {
        const auto &[topic, payload] = *msg;
        processIncomingMessage(topic, payload);
    }
}

void Application::run()
{
    static constexpr auto board_poll_timeout = std::chrono::milliseconds(10);
    static constexpr int reconnect_interval_ms = 2000;

    connectToMqtt();

    bool is_running = true;

    while (is_running) {
        State current_state;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            current_state = state_;
        }

        auto now = std::chrono::steady_clock::now();

        switch (current_state) {
        case State::WaitingToConnect:
            // Keep the serial buffer drained while the broker answers
            processBoard(board_poll_timeout);
            break;

        case State::Connected:
            poll(board_poll_timeout);
            break;

        case State::Disconnected: {
            processBoard(board_poll_timeout);
            if (std::chrono::duration_cast<std::chrono::milliseconds>(now - last_reconnect_time_)
                    .count()
                >= reconnect_interval_ms) {
                std::lock_guard<std::mutex> lock(state_mutex_);
                if (reconnect_attempts_ < config_.max_reconnect_attempts) {
                    printMessage("[APP] Attempting reconnect MQTT connection, attempt "
                                 + std::to_string(reconnect_attempts_ + 1));
                    state_ = State::Reconnecting;
                } else {
                    printError("[APP] Max reconnection attempts reached, getting application to exit");
                    last_reconnect_time_ = now;
                    state_ = State::Exiting;
                }
            }
            break;
        }

        case State::Reconnecting: {
            try {
                if (mqtt_client_->isConnected()) {
                    mqtt_client_->disconnect();
                }
                mqtt_client_->connect();
                mqtt_client_->subscribe(config_.topics.control());
                {
                    std::lock_guard<std::mutex> lock(state_mutex_);
                    state_ = state_ != State::Connected ? State::WaitingToConnect
                                                        : State::Connected;
                    reconnect_attempts_ = 0;
                }
            } catch (const std::exception &e) {
                printError("[APP] Reconnect failed: " + std::string(e.what()));
                {
                    std::lock_guard<std::mutex> lock(state_mutex_);
                    state_ = State::Disconnected;
                    last_reconnect_time_ = now;
                    reconnect_attempts_++;
                }
            }
            break;
        }

        case State::Restarting:
            restart();
            break;

        case State::Exiting:
            printMessage("[APP] Exiting application");
            mqtt_client_->publish(config_.topics.status(), "offline", true);
            mqtt_client_->disconnect();
            is_running = false;
            break;
        }
    }
}

void Application::printMessage(const std::string &msg) const
{
    std::lock_guard<std::mutex> lock(log_mutex_);
    std::cout << msg << std::endl;
}

void Application::printError(const std::string &msg) const
{
    std::lock_guard<std::mutex> lock(log_mutex_);
    std::cerr << msg << std::endl;
}
