#pragma once

#include <string>

struct SerialConfig
{
    std::string device;
    int baud_rate;
};

struct MqttConfig
{
    std::string host;
    int port;
    std::string client_id;
    std::string username;
    std::string password;
};

struct TopicConfig
{
    std::string prefix;

    std::string control() const { return prefix + "/control"; }
    std::string pinState() const { return prefix + "/pins/state"; }
    std::string i2cReply() const { return prefix + "/i2c/reply"; }
    std::string device() const { return prefix + "/device"; }
    std::string errors() const { return prefix + "/errors"; }
    std::string status() const { return prefix + "/status"; }
};

// Backoff for board commands, in milliseconds
struct BackoffConfig
{
    int initial_interval_ms;
    int max_interval_ms;
    int max_elapsed_ms;
};

struct AppConfig
{
    int max_reconnect_attempts;
    bool trace_board;
    SerialConfig serial;
    MqttConfig mqtt;
    TopicConfig topics;
    BackoffConfig backoff;
};
