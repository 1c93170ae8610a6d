#pragma once

/**
 * @file LiveEventParser.hpp
 * @brief Framing and record decoding for live attendance packets
 *
 * Pure functions. Nothing here touches a socket or throws on bad input:
 * malformed packets decode to "nothing".
 */

#include <cstddef>
#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <vector>

namespace zkfleet {

constexpr uint16_t LIVE_EVENT_COMMAND = 500;
constexpr size_t LIVE_READ_SIZE = 1032;
constexpr size_t MIN_RECORD_SIZE = 10;

struct LivePacket {
    uint16_t command = 0;
    uint16_t session_id = 0;
    uint16_t reply_id = 0;
    uint32_t declared_length = 0;  // TCP only: length from the 8-byte top
    std::vector<uint8_t> payload;
};

struct LiveRecord {
    std::string subject_id;
    uint8_t status = 0;
    uint8_t punch = 0;
    std::time_t device_time = 0;
    size_t consumed = 0;  // bytes taken from the payload
};

/**
 * @brief Split a received buffer into header and payload
 * @param tcp stream framing (8-byte top + 8-byte header) vs datagram (8-byte header)
 * @return nullopt if the buffer is too short to hold the framing
 */
std::optional<LivePacket> frame_packet(const std::vector<uint8_t>& raw, bool tcp);

/**
 * @brief Bytes one record takes when @p remaining bytes are left in the payload
 * @return 0 when the length matches no known layout
 */
size_t record_size_for(size_t remaining);

/**
 * @brief Decode one record from the front of @p data
 *
 * The layout is chosen purely by @p size (the remaining payload length):
 * 10/12/14 carry a numeric id, 32/36/37/>=52 a 24-byte text id.
 * @return nullopt for sizes that match no layout
 */
std::optional<LiveRecord> parse_record(const uint8_t* data, size_t size);

/**
 * @brief Decode records from the front of the payload until fewer than
 *        MIN_RECORD_SIZE bytes are left
 *
 * An unrecognised remaining length ends decoding and the rest of the payload
 * is dropped. Records whose id decodes to an empty string are skipped.
 */
std::vector<LiveRecord> parse_records(const std::vector<uint8_t>& payload);

/**
 * @brief frame_packet + command filter + parse_records
 * @return empty unless the packet carries command 500 and a non-empty payload
 */
std::vector<LiveRecord> decode_live_packet(const std::vector<uint8_t>& raw, bool tcp);

} // namespace zkfleet
