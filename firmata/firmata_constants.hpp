#pragma once

#include <cstdint>

namespace firmata {

// Message opcodes
constexpr uint8_t PROTOCOL_VERSION = 0xF9;
constexpr uint8_t DIGITAL_MESSAGE = 0x90;
constexpr uint8_t DIGITAL_MESSAGE_BOUND = 0x9F;
constexpr uint8_t ANALOG_MESSAGE = 0xE0;
constexpr uint8_t ANALOG_MESSAGE_BOUND = 0xEF;
constexpr uint8_t REPORT_ANALOG = 0xC0;
constexpr uint8_t REPORT_DIGITAL = 0xD0;
constexpr uint8_t SET_PIN_MODE = 0xF4;

// SysEx framing
constexpr uint8_t START_SYSEX = 0xF0;
constexpr uint8_t END_SYSEX = 0xF7;

// SysEx commands
constexpr uint8_t ANALOG_MAPPING_QUERY = 0x69;
constexpr uint8_t ANALOG_MAPPING_RESPONSE = 0x6A;
constexpr uint8_t CAPABILITY_QUERY = 0x6B;
constexpr uint8_t CAPABILITY_RESPONSE = 0x6C;
constexpr uint8_t PIN_STATE_QUERY = 0x6D;
constexpr uint8_t PIN_STATE_RESPONSE = 0x6E;
constexpr uint8_t EXTENDED_ANALOG = 0x6F;
constexpr uint8_t I2C_REQUEST = 0x76;
constexpr uint8_t I2C_REPLY = 0x77;
constexpr uint8_t I2C_CONFIG = 0x78;
constexpr uint8_t REPORT_FIRMWARE = 0x79;
constexpr uint8_t SAMPLING_INTERVAL = 0x7A;

// I2C request mode, shifted into bits 3-4 of the second address byte
constexpr uint8_t I2C_WRITE = 0x00;
constexpr uint8_t I2C_READ = 0x01;
constexpr uint8_t I2C_MODE_SHIFT = 3;

// Every in-frame data byte carries only 7 bits
constexpr uint8_t DATA_MASK = 0x7F;
// Ends one pin in a capability response, "not analog" in an analog mapping
constexpr uint8_t NO_VALUE = 0x7F;

// Analog input N is reported for pin N + ANALOG_PIN_OFFSET
constexpr int ANALOG_PIN_OFFSET = 14;
constexpr int PINS_PER_PORT = 8;
// Ports and analog channels are addressed by the low nibble of the command
constexpr int MAX_NIBBLE_INDEX = 16;

constexpr uint8_t DEFAULT_ANALOG_RESOLUTION = 10;

} // namespace firmata
