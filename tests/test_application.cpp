#include <doctest/doctest.h>

#include "application.hpp"
#include "test_support.hpp"

#include <nlohmann/json.hpp>

using std::chrono::milliseconds;

namespace {

class FakeMqttClient : public mqtt::IClient
{
public:
    struct Published
    {
        std::string topic;
        std::string payload;
        bool retain;
    };

    void connect() override
    {
        connected = true;
        if (connect_callback) {
            connect_callback();
        }
    }

    void disconnect() override { connected = false; }
    bool isConnected() override { return connected; }
    void subscribe(const std::string &topic) override { subscriptions.push_back(topic); }

    void publish(const std::string &topic, const std::string &payload, bool retain) override
    {
        published.push_back({topic, payload, retain});
    }

    void setWill(const std::string &topic, const std::string &payload) override
    {
        will = {topic, payload, true};
    }

    void setMessageCallback(MessageCallback callback) override { message_callback = std::move(callback); }
    void setConnectCallback(ConnectCallback callback) override { connect_callback = std::move(callback); }
    void setDisconnectCallback(DisconnectCallback callback) override
    {
        disconnect_callback = std::move(callback);
    }

    void deliver(const std::string &topic, const std::string &payload) { message_callback(topic, payload); }

    std::vector<Published> on(const std::string &topic) const
    {
        std::vector<Published> matching;
        for (const auto &message : published) {
            if (message.topic == topic) {
                matching.push_back(message);
            }
        }
        return matching;
    }

    bool connected = false;
    std::vector<std::string> subscriptions;
    std::vector<Published> published;
    Published will;

    MessageCallback message_callback;
    ConnectCallback connect_callback;
    DisconnectCallback disconnect_callback;
};

AppConfig testConfig()
{
    return AppConfig{.max_reconnect_attempts = 1,
                     .trace_board = false,
                     .serial = SerialConfig{.device = "scripted", .baud_rate = 57600},
                     .mqtt = MqttConfig{.host = "localhost",
                                        .port = 1883,
                                        .client_id = "test",
                                        .username = "",
                                        .password = ""},
                     .topics = TopicConfig{.prefix = "firmata"},
                     .backoff = BackoffConfig{.initial_interval_ms = 1,
                                              .max_interval_ms = 2,
                                              .max_elapsed_ms = 20}};
}

struct Bridge
{
    std::unique_ptr<Application> app;
    FakeMqttClient *mqtt;
    ScriptedTransport *wire;
};

Bridge makeBridge()
{
    auto [board, wire] = makeBoard();
    auto client = std::make_unique<FakeMqttClient>();
    FakeMqttClient *mqtt = client.get();
    auto app = std::make_unique<Application>(testConfig(), std::move(client), std::move(board));
    return {std::move(app), mqtt, wire};
}

nlohmann::json lastJson(const FakeMqttClient &mqtt, const std::string &topic)
{
    auto messages = mqtt.on(topic);
    REQUIRE_FALSE(messages.empty());
    return nlohmann::json::parse(messages.back().payload);
}

} // namespace

TEST_CASE("last will marks the bridge offline") {
    auto bridge = makeBridge();
    CHECK(bridge.mqtt->will.topic == "firmata/status");
    CHECK(bridge.mqtt->will.payload == "offline");
}

TEST_CASE("connect announces status and device") {
    auto bridge = makeBridge();
    bridge.mqtt->connect();
    bridge.app->poll(milliseconds(0));

    auto status = bridge.mqtt->on("firmata/status");
    REQUIRE(status.size() == 1);
    CHECK(status[0].payload == "online");
    CHECK(status[0].retain);

    auto device = lastJson(*bridge.mqtt, "firmata/device");
    CHECK(device["firmware_name"] == "Test");
    CHECK(device["firmware_version"] == "2.5");
    CHECK(device["pin_count"] == 21);
    CHECK(bridge.mqtt->on("firmata/device").back().retain);

    // Only once per connect
    bridge.app->poll(milliseconds(0));
    CHECK(bridge.mqtt->on("firmata/status").size() == 1);
}

TEST_CASE("commands drive the board") {
    auto bridge = makeBridge();

    SUBCASE("digital_write") {
        bridge.mqtt->deliver("firmata/control", R"({"command":"digital_write","pin":13,"value":1})");
        bridge.app->poll(milliseconds(0));

        REQUIRE(bridge.wire->writes.size() == 1);
        CHECK(bridge.wire->writes[0] == Bytes{0x91, 0x20, 0x00});

        auto state = lastJson(*bridge.mqtt, "firmata/pins/state");
        CHECK(state["pin"] == 13);
        CHECK(state["value"] == 1);
    }

    SUBCASE("set_pin_mode by name") {
        bridge.mqtt->deliver("firmata/control", R"({"command":"set_pin_mode","pin":3,"mode":"pwm"})");
        bridge.app->poll(milliseconds(0));
        CHECK(bridge.wire->writes.back() == Bytes{0xF4, 3, 0x03});
    }

    SUBCASE("set_pin_mode by number") {
        bridge.mqtt->deliver("firmata/control", R"({"command":"set_pin_mode","pin":4,"mode":1})");
        bridge.app->poll(milliseconds(0));
        CHECK(bridge.wire->writes.back() == Bytes{0xF4, 4, 0x01});
    }

    SUBCASE("analog_write") {
        bridge.mqtt->deliver("firmata/control", R"({"command":"analog_write","pin":3,"value":200})");
        bridge.app->poll(milliseconds(0));
        CHECK(bridge.wire->writes.back() == Bytes{0xE3, 0x48, 0x01});
    }

    SUBCASE("report_analog") {
        bridge.mqtt->deliver("firmata/control", R"({"command":"report_analog","channel":2,"enabled":true})");
        bridge.app->poll(milliseconds(0));
        CHECK(bridge.wire->writes.back() == Bytes{0xC2, 1});
    }

    SUBCASE("i2c_write") {
        bridge.mqtt->deliver("firmata/control", R"({"command":"i2c_write","address":9,"data":[111,200]})");
        bridge.app->poll(milliseconds(0));
        CHECK(bridge.wire->writes.back() == Bytes{0xF0, 0x76, 9, 0, 111, 0, 0x48, 1, 0xF7});
    }

    SUBCASE("i2c_read") {
        bridge.mqtt->deliver("firmata/control", R"({"command":"i2c_read","address":9,"size":3})");
        bridge.app->poll(milliseconds(0));
        CHECK(bridge.wire->writes.back() == Bytes{0xF0, 0x76, 9, 0x08, 3, 0, 0xF7});
    }

    SUBCASE("query_pin_state") {
        bridge.mqtt->deliver("firmata/control", R"({"command":"query_pin_state","pin":5})");
        bridge.app->poll(milliseconds(0));
        CHECK(bridge.wire->writes.back() == Bytes{0xF0, 0x6D, 5, 0xF7});
    }

    CHECK(bridge.mqtt->on("firmata/errors").empty());
}

TEST_CASE("bad commands are reported on the error topic") {
    auto bridge = makeBridge();
    std::string expected;

    SUBCASE("invalid json") {
        bridge.mqtt->deliver("firmata/control", "{nope");
        expected = "Invalid JSON format";
    }

    SUBCASE("missing command") {
        bridge.mqtt->deliver("firmata/control", R"({"pin":1})");
        expected = "Missing or invalid 'command' field";
    }

    SUBCASE("unknown command") {
        bridge.mqtt->deliver("firmata/control", R"({"command":"explode"})");
        expected = "explode: Unsupported command";
    }

    SUBCASE("wrong topic") {
        bridge.mqtt->deliver("firmata/other", R"({"command":"query_firmware"})");
        expected = "Unsupported topic: firmata/other";
    }

    SUBCASE("pin outside the board") {
        bridge.mqtt->deliver("firmata/control", R"({"command":"digital_write","pin":21,"value":1})");
        expected = "digital_write: 'pin' must be in range [0, 20]";
    }

    SUBCASE("pin that only fits in 64 bits") {
        // Low 32 bits are 13, a valid pin
        bridge.mqtt->deliver("firmata/control", R"({"command":"digital_write","pin":4294967309,"value":1})");
        expected = "digital_write: 'pin' must be in range [0, 20]";
    }

    SUBCASE("pin past the signed 64 bit range") {
        bridge.mqtt->deliver("firmata/control",
                             R"({"command":"digital_write","pin":18446744073709551615,"value":1})");
        expected = "digital_write: 'pin' must be in range [0, 20]";
    }

    SUBCASE("unknown mode name") {
        bridge.mqtt->deliver("firmata/control", R"({"command":"set_pin_mode","pin":3,"mode":"laser"})");
        expected = "set_pin_mode: Unknown pin mode: laser";
    }

    SUBCASE("byte out of range") {
        bridge.mqtt->deliver("firmata/control", R"({"command":"i2c_write","address":9,"data":[256]})");
        expected = "i2c_write: 'data' must hold bytes in range [0, 255]";
    }

    SUBCASE("byte that wraps to a valid one") {
        bridge.mqtt->deliver("firmata/control", R"({"command":"i2c_write","address":9,"data":[4294967297]})");
        expected = "i2c_write: 'data' must hold bytes in range [0, 255]";
    }

    bridge.app->poll(milliseconds(0));

    auto errors = bridge.mqtt->on("firmata/errors");
    REQUIRE(errors.size() == 1);
    CHECK(errors[0].payload.rfind(expected, 0) == 0);
    CHECK(bridge.wire->writes.empty());
}

TEST_CASE("board failures are retried before they are reported") {
    auto bridge = makeBridge();

    SUBCASE("transient") {
        bridge.wire->failing_writes = 1;
        bridge.mqtt->deliver("firmata/control", R"({"command":"query_firmware"})");
        bridge.app->poll(milliseconds(0));

        CHECK(bridge.wire->writes.back() == Bytes{0xF0, 0x79, 0xF7});
        CHECK(bridge.mqtt->on("firmata/errors").empty());
    }

    SUBCASE("persistent") {
        bridge.wire->failing_writes = 1000;
        bridge.mqtt->deliver("firmata/control", R"({"command":"query_firmware"})");
        bridge.app->poll(milliseconds(0));

        auto errors = bridge.mqtt->on("firmata/errors");
        REQUIRE(errors.size() == 1);
        CHECK(errors[0].payload.rfind("Board error on query_firmware: Timeout exceeded", 0) == 0);
    }
}

TEST_CASE("board telemetry is published") {
    auto bridge = makeBridge();

    SUBCASE("analog value") {
        bridge.wire->feed({0xE0, 0x10, 0x00});
        bridge.app->poll(milliseconds(0));

        auto state = lastJson(*bridge.mqtt, "firmata/pins/state");
        CHECK(state["pin"] == 14);
        CHECK(state["mode"] == "analog");
        CHECK(state["value"] == 16);

        // Unchanged values are not repeated
        bridge.wire->feed({0xE0, 0x10, 0x00});
        bridge.app->poll(milliseconds(0));
        CHECK(bridge.mqtt->on("firmata/pins/state").size() == 1);
    }

    SUBCASE("i2c reply") {
        bridge.wire->feed({0xF0, 0x77, 9, 0, 2, 0, 1, 0, 0xF7});
        bridge.app->poll(milliseconds(0));

        auto reply = lastJson(*bridge.mqtt, "firmata/i2c/reply");
        CHECK(reply["address"] == 9);
        CHECK(reply["register"] == 2);
        CHECK(reply["data"] == nlohmann::json::array({1}));
    }

    SUBCASE("decode error") {
        bridge.wire->feed({0x42, 0x00, 0x00});
        bridge.app->poll(milliseconds(0));

        auto errors = bridge.mqtt->on("firmata/errors");
        REQUIRE(errors.size() == 1);
        CHECK(errors[0].payload == "Received a bad byte: 0x42");
    }
}

TEST_CASE("lost board ends the run loop") {
    auto bridge = makeBridge();

    SUBCASE("connection error") {
        bridge.wire->feed({0xF9});
        bridge.app->poll(milliseconds(0));
        REQUIRE(bridge.mqtt->on("firmata/errors").size() == 1);
    }

    SUBCASE("stop") {
        bridge.app->stop();
    }

    bridge.app->run();

    auto status = bridge.mqtt->on("firmata/status");
    REQUIRE_FALSE(status.empty());
    CHECK(status.back().payload == "offline");
    CHECK_FALSE(bridge.mqtt->connected);
}

TEST_CASE("restart reruns the handshake") {
    auto bridge = makeBridge();
    feedHandshake(*bridge.wire);

    bridge.app->restart();

    REQUIRE(bridge.wire->writes.size() == 5);
    CHECK(bridge.wire->writes[0] == Bytes{0xF0, 0x79, 0xF7});
    CHECK(lastJson(*bridge.mqtt, "firmata/device")["firmware_name"] == "Test");
    CHECK(bridge.mqtt->on("firmata/errors").empty());
}
