#include "LiveEventParser.hpp"
#include "ZkProtocol.hpp"

namespace zkfleet {

namespace {

constexpr size_t TEXT_ID_SIZE = 24;

} // namespace

std::optional<LivePacket> frame_packet(const std::vector<uint8_t>& raw, bool tcp) {
    size_t offset = 0;
    LivePacket packet;

    if (tcp) {
        if (raw.size() < zk::TCP_TOP_SIZE + zk::HEADER_SIZE) {
            return std::nullopt;
        }
        packet.declared_length = zk::read_u32(raw.data() + 4);
        offset = zk::TCP_TOP_SIZE;
    }

    auto header = zk::parse_header(raw.data() + offset, raw.size() - offset);
    if (!header) {
        return std::nullopt;
    }
    offset += zk::HEADER_SIZE;

    packet.command = header->command;
    packet.session_id = header->session_id;
    packet.reply_id = header->reply_id;
    packet.payload.assign(raw.begin() + offset, raw.end());
    return packet;
}

size_t record_size_for(size_t remaining) {
    switch (remaining) {
        case 10: return 10;
        case 12: return 12;
        case 14: return 14;
        case 32: return 32;
        case 36: return 36;
        case 37: return 37;
        default: break;
    }
    if (remaining >= 52) return 52;
    return 0;
}

std::optional<LiveRecord> parse_record(const uint8_t* data, size_t size) {
    size_t record_size = record_size_for(size);
    if (record_size == 0) {
        return std::nullopt;
    }

    LiveRecord record;
    record.consumed = record_size;

    size_t id_width;
    switch (record_size) {
        case 10:
        case 14:
            record.subject_id = std::to_string(zk::read_u16(data));
            id_width = 2;
            break;
        case 12:
            record.subject_id = std::to_string(zk::read_u32(data));
            id_width = 4;
            break;
        default:
            record.subject_id = zk::decode_text(data, TEXT_ID_SIZE);
            id_width = TEXT_ID_SIZE;
            break;
    }

    record.status = data[id_width];
    record.punch = data[id_width + 1];
    record.device_time = zk::decode_timehex(data + id_width + 2);
    return record;
}

std::vector<LiveRecord> parse_records(const std::vector<uint8_t>& payload) {
    std::vector<LiveRecord> records;
    size_t offset = 0;

    while (payload.size() - offset >= MIN_RECORD_SIZE) {
        auto record = parse_record(payload.data() + offset, payload.size() - offset);
        if (!record) {
            // Unknown layout: nothing after this point can be trusted.
            // TODO: revisit with real captures of the lengths that land here (e.g. 20).
            break;
        }
        offset += record->consumed;
        if (!record->subject_id.empty()) {
            records.push_back(std::move(*record));
        }
    }
    return records;
}

std::vector<LiveRecord> decode_live_packet(const std::vector<uint8_t>& raw, bool tcp) {
    auto packet = frame_packet(raw, tcp);
    if (!packet || packet->command != LIVE_EVENT_COMMAND || packet->payload.empty()) {
        return {};
    }
    return parse_records(packet->payload);
}

} // namespace zkfleet
