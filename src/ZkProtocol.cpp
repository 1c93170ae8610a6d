#include "ZkProtocol.hpp"
#include "Utils.hpp"

namespace zkfleet {
namespace zk {

uint16_t read_u16(const uint8_t* data) {
    return static_cast<uint16_t>(data[0] | (data[1] << 8));
}

uint32_t read_u32(const uint8_t* data) {
    return static_cast<uint32_t>(data[0]) |
           (static_cast<uint32_t>(data[1]) << 8) |
           (static_cast<uint32_t>(data[2]) << 16) |
           (static_cast<uint32_t>(data[3]) << 24);
}

int32_t read_i32(const uint8_t* data) {
    return static_cast<int32_t>(read_u32(data));
}

void put_u16(std::vector<uint8_t>& out, uint16_t value) {
    out.push_back(value & 0xFF);
    out.push_back((value >> 8) & 0xFF);
}

void put_u32(std::vector<uint8_t>& out, uint32_t value) {
    out.push_back(value & 0xFF);
    out.push_back((value >> 8) & 0xFF);
    out.push_back((value >> 16) & 0xFF);
    out.push_back((value >> 24) & 0xFF);
}

void put_fixed_string(std::vector<uint8_t>& out, const std::string& text, size_t width) {
    for (size_t i = 0; i < width; ++i) {
        out.push_back(i < text.size() ? static_cast<uint8_t>(text[i]) : 0);
    }
}

// Length of the valid UTF-8 sequence starting at data[0], or 0 if invalid
static size_t utf8_sequence_length(const uint8_t* data, size_t available) {
    uint8_t lead = data[0];
    size_t length;
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0 && lead >= 0xC2) length = 2;
    else if ((lead & 0xF0) == 0xE0) length = 3;
    else if ((lead & 0xF8) == 0xF0 && lead <= 0xF4) length = 4;
    else return 0;

    if (length > available) return 0;
    for (size_t i = 1; i < length; ++i) {
        if ((data[i] & 0xC0) != 0x80) return 0;
    }
    // Overlong 3-byte forms and surrogates
    if (length == 3) {
        if (lead == 0xE0 && data[1] < 0xA0) return 0;
        if (lead == 0xED && data[1] >= 0xA0) return 0;
    }
    if (length == 4) {
        if (lead == 0xF0 && data[1] < 0x90) return 0;
        if (lead == 0xF4 && data[1] >= 0x90) return 0;
    }
    return length;
}

std::string decode_text(const uint8_t* data, size_t size) {
    size_t end = 0;
    while (end < size && data[end] != 0) ++end;

    std::string result;
    size_t i = 0;
    while (i < end) {
        size_t length = utf8_sequence_length(data + i, end - i);
        if (length == 0) {
            ++i;  // drop the offending byte
            continue;
        }
        result.append(reinterpret_cast<const char*>(data + i), length);
        i += length;
    }
    return result;
}

uint16_t checksum(const std::vector<uint8_t>& packet) {
    uint32_t sum = 0;
    size_t len = packet.size();

    for (size_t i = 0; i < len; i += 2) {
        if (i + 1 < len) {
            sum += static_cast<uint32_t>(packet[i + 1] << 8) | packet[i];
        } else {
            sum += packet[i];
        }

        if (sum > USHRT_MAX_VALUE) {
            sum -= USHRT_MAX_VALUE;
        }
    }

    return static_cast<uint16_t>((~sum) & 0xFFFF);
}

std::vector<uint8_t> create_header(uint16_t command, const std::vector<uint8_t>& payload,
                                   uint16_t session_id, uint16_t reply_id) {
    std::vector<uint8_t> packet;
    packet.reserve(HEADER_SIZE + payload.size());
    put_u16(packet, command);
    put_u16(packet, 0);  // checksum placeholder
    put_u16(packet, session_id);
    put_u16(packet, reply_id);
    packet.insert(packet.end(), payload.begin(), payload.end());

    uint16_t sum = checksum(packet);
    packet[2] = sum & 0xFF;
    packet[3] = (sum >> 8) & 0xFF;
    return packet;
}

std::vector<uint8_t> create_tcp_top(const std::vector<uint8_t>& packet) {
    std::vector<uint8_t> top;
    top.reserve(TCP_TOP_SIZE + packet.size());
    put_u16(top, MACHINE_PREPARE_DATA_1);
    put_u16(top, MACHINE_PREPARE_DATA_2);
    put_u32(top, static_cast<uint32_t>(packet.size()));
    top.insert(top.end(), packet.begin(), packet.end());
    return top;
}

uint32_t test_tcp_top(const std::vector<uint8_t>& data) {
    if (data.size() <= TCP_TOP_SIZE) return 0;
    if (read_u16(data.data()) != MACHINE_PREPARE_DATA_1 ||
        read_u16(data.data() + 2) != MACHINE_PREPARE_DATA_2) {
        return 0;
    }
    return read_u32(data.data() + 4);
}

std::optional<PacketHeader> parse_header(const uint8_t* data, size_t size) {
    if (size < HEADER_SIZE) return std::nullopt;

    PacketHeader header;
    header.command = read_u16(data);
    header.checksum = read_u16(data + 2);
    header.session_id = read_u16(data + 4);
    header.reply_id = read_u16(data + 6);
    return header;
}

uint16_t next_reply_id(uint16_t reply_id) {
    uint32_t next = static_cast<uint32_t>(reply_id) + 1;
    if (next >= USHRT_MAX_VALUE) {
        next -= USHRT_MAX_VALUE;
    }
    return static_cast<uint16_t>(next);
}

std::vector<uint8_t> make_comm_key(uint32_t password, uint32_t session_id, uint8_t ticks) {
    // Bit-reverse the password
    uint32_t k = 0;
    for (int i = 0; i < 32; ++i) {
        k <<= 1;
        if (password & (1u << i)) {
            k |= 1;
        }
    }
    k += session_id;

    uint8_t b[4] = {
        static_cast<uint8_t>((k & 0xFF) ^ 'Z'),
        static_cast<uint8_t>(((k >> 8) & 0xFF) ^ 'K'),
        static_cast<uint8_t>(((k >> 16) & 0xFF) ^ 'S'),
        static_cast<uint8_t>(((k >> 24) & 0xFF) ^ 'O')
    };

    // Swap the two 16-bit halves
    uint8_t swapped[4] = {b[2], b[3], b[0], b[1]};

    return {
        static_cast<uint8_t>(swapped[0] ^ ticks),
        static_cast<uint8_t>(swapped[1] ^ ticks),
        ticks,
        static_cast<uint8_t>(swapped[3] ^ ticks)
    };
}

std::time_t decode_time(uint32_t packed) {
    int second = packed % 60;
    packed /= 60;
    int minute = packed % 60;
    packed /= 60;
    int hour = packed % 24;
    packed /= 24;
    int day = packed % 31 + 1;
    packed /= 31;
    int month = packed % 12 + 1;
    packed /= 12;
    int year = static_cast<int>(packed) + 2000;

    return utils::make_device_time(year, month, day, hour, minute, second);
}

std::time_t decode_timehex(const uint8_t* data) {
    return utils::make_device_time(data[0] + 2000, data[1], data[2], data[3], data[4], data[5]);
}

} // namespace zk
} // namespace zkfleet
