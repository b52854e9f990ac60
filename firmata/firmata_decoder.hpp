#pragma once

#include "firmata_board_state.hpp"
#include "firmata_types.hpp"
#include "transport/transport_itransport.hpp"

#include <cstdint>
#include <deque>
#include <vector>

namespace firmata {

/*
 * Incremental decoder. Each readAndDecode() call consumes exactly one message
 * from the transport, applies its payload to the board state and returns the
 * message tag. Bytes read ahead of a short SysEx frame are kept for the next
 * call, so one Decoder must be used per transport.
 */
class Decoder
{
public:
    Message readAndDecode(transport::ITransport &transport, BoardState &state);

    // Bytes already read from the transport but not yet decoded
    std::size_t pendingBytes() const { return pending_.size(); }
    void reset() { pending_.clear(); }

private:
    std::vector<uint8_t> read(transport::ITransport &transport, std::size_t count);

    Message decodeSysEx(const std::vector<uint8_t> &frame, BoardState &state);

    static void decodeAnalog(const std::vector<uint8_t> &buf, BoardState &state);
    static void decodeDigital(const std::vector<uint8_t> &buf, BoardState &state);
    static void decodeAnalogMapping(const std::vector<uint8_t> &frame, BoardState &state);
    static void decodeCapabilities(const std::vector<uint8_t> &frame, BoardState &state);
    static void decodeFirmware(const std::vector<uint8_t> &frame, BoardState &state);
    static void decodeI2CReply(const std::vector<uint8_t> &frame, BoardState &state);
    static void decodePinState(const std::vector<uint8_t> &frame, BoardState &state);

    std::deque<uint8_t> pending_;
};

} // namespace firmata
