#pragma once

/**
 * @file ZkProtocol.hpp
 * @brief Wire-level helpers for the ZK attendance-terminal protocol
 *
 * Every packet starts with an 8-byte little-endian header
 * (command, checksum, session id, reply id). Over TCP the header is
 * preceded by an 8-byte "top": 0x5050, 0x7d82, payload length (u32).
 */

#include <cstddef>
#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <vector>

namespace zkfleet {
namespace zk {

// Session
constexpr uint16_t CMD_CONNECT        = 1000;
constexpr uint16_t CMD_EXIT           = 1001;
constexpr uint16_t CMD_ENABLEDEVICE   = 1002;
constexpr uint16_t CMD_DISABLEDEVICE  = 1003;
constexpr uint16_t CMD_REFRESHDATA    = 1013;
constexpr uint16_t CMD_AUTH           = 1102;

// Data
constexpr uint16_t CMD_DB_RRQ         = 7;
constexpr uint16_t CMD_USER_WRQ       = 8;
constexpr uint16_t CMD_USERTEMP_RRQ   = 9;
constexpr uint16_t CMD_OPTIONS_RRQ    = 11;
constexpr uint16_t CMD_ATTLOG_RRQ     = 13;
constexpr uint16_t CMD_DELETE_USER    = 18;
constexpr uint16_t CMD_DELETE_USERTEMP = 19;
constexpr uint16_t CMD_GET_FREE_SIZES = 50;
constexpr uint16_t CMD_STARTVERIFY    = 60;
constexpr uint16_t CMD_STARTENROLL    = 61;
constexpr uint16_t CMD_CANCELCAPTURE  = 62;
constexpr uint16_t CMD_GET_USERTEMP   = 88;
constexpr uint16_t CMD_SAVE_USERTEMPS = 110;
constexpr uint16_t CMD_DELETE_USERTEMP_EX = 134;
constexpr uint16_t CMD_GET_TIME       = 201;
constexpr uint16_t CMD_REG_EVENT      = 500;
constexpr uint16_t CMD_GET_VERSION    = 1100;

// Buffered transfer
constexpr uint16_t CMD_PREPARE_DATA   = 1500;
constexpr uint16_t CMD_DATA           = 1501;
constexpr uint16_t CMD_FREE_DATA      = 1502;
constexpr uint16_t CMD_PREPARE_BUFFER = 1503;
constexpr uint16_t CMD_READ_BUFFER    = 1504;

// Replies
constexpr uint16_t CMD_ACK_OK         = 2000;
constexpr uint16_t CMD_ACK_ERROR      = 2001;
constexpr uint16_t CMD_ACK_DATA       = 2002;
constexpr uint16_t CMD_ACK_RETRY      = 2003;
constexpr uint16_t CMD_ACK_REPEAT     = 2004;
constexpr uint16_t CMD_ACK_UNAUTH     = 2005;
constexpr uint16_t CMD_ACK_UNKNOWN    = 0xffff;

// Buffered read table selectors
constexpr int FCT_ATTLOG    = 1;
constexpr int FCT_FINGERTMP = 2;
constexpr int FCT_USER      = 5;

constexpr uint16_t MACHINE_PREPARE_DATA_1 = 0x5050;
constexpr uint16_t MACHINE_PREPARE_DATA_2 = 0x7d82;
constexpr uint16_t USHRT_MAX_VALUE = 65535;

constexpr size_t HEADER_SIZE = 8;
constexpr size_t TCP_TOP_SIZE = 8;

struct PacketHeader {
    uint16_t command = 0;
    uint16_t checksum = 0;
    uint16_t session_id = 0;
    uint16_t reply_id = 0;
};

// Little-endian field access. Callers check bounds.
uint16_t read_u16(const uint8_t* data);
uint32_t read_u32(const uint8_t* data);
int32_t read_i32(const uint8_t* data);
void put_u16(std::vector<uint8_t>& out, uint16_t value);
void put_u32(std::vector<uint8_t>& out, uint32_t value);

/** Append @p text truncated or zero-padded to exactly @p width bytes */
void put_fixed_string(std::vector<uint8_t>& out, const std::string& text, size_t width);

/**
 * @brief Decode a zero-terminated text field
 *
 * Stops at the first null byte and drops byte sequences that are not valid
 * UTF-8 instead of failing.
 */
std::string decode_text(const uint8_t* data, size_t size);

uint16_t checksum(const std::vector<uint8_t>& packet);

/** Header + payload, checksum filled in */
std::vector<uint8_t> create_header(uint16_t command, const std::vector<uint8_t>& payload,
                                   uint16_t session_id, uint16_t reply_id);

/** Prefix @p packet with the TCP top */
std::vector<uint8_t> create_tcp_top(const std::vector<uint8_t>& packet);

/**
 * @brief Validate a TCP top
 * @return declared length, or 0 if the magic is wrong or the buffer is short
 */
uint32_t test_tcp_top(const std::vector<uint8_t>& data);

std::optional<PacketHeader> parse_header(const uint8_t* data, size_t size);

/** Next reply id, wrapping below 65535 */
uint16_t next_reply_id(uint16_t reply_id);

/**
 * @brief Scramble the device password for CMD_AUTH
 */
std::vector<uint8_t> make_comm_key(uint32_t password, uint32_t session_id, uint8_t ticks = 50);

/** Packed 32-bit device time (CMD_GET_TIME, attendance log) */
std::time_t decode_time(uint32_t packed);

/** Six bytes: year-2000, month, day, hour, minute, second (live events) */
std::time_t decode_timehex(const uint8_t* data);

} // namespace zk
} // namespace zkfleet
