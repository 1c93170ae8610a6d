#include "LiveEventParser.hpp"
#include "TestFakes.hpp"
#include "Utils.hpp"
#include "ZkProtocol.hpp"
#include <iostream>

using namespace zkfleet;
using namespace zkfleet::testing;

static int fails = 0;

static void assert_true(bool cond, const char* msg) {
    if (!cond) {
        std::cerr << "[FAIL] " << msg << std::endl;
        ++fails;
    } else {
        std::cout << "[PASS] " << msg << std::endl;
    }
}

static std::vector<uint8_t> pad(std::vector<uint8_t> bytes, size_t size) {
    bytes.resize(size, 0);
    return bytes;
}

int main() {
    std::cout << "=== Live Event Parser Test ===" << std::endl;

    // Test 1: every documented layout consumes its fixed size and yields the id
    {
        // 10: u16 id
        auto r10 = numeric_record(17);
        auto rec = parse_record(r10.data(), r10.size());
        assert_true(rec && rec->consumed == 10, "10-byte record consumes 10");
        assert_true(rec && rec->subject_id == "17", "u16 id 17 decodes to \"17\"");
        assert_true(rec && rec->status == 1 && rec->punch == 0, "status and punch follow the id");
        assert_true(rec && utils::format_device_time(rec->device_time) == "2024-05-17 08:30:00",
                    "timehex decodes to device wall clock");

        // 12: u32 id
        std::vector<uint8_t> r12;
        zk::put_u32(r12, 70000);
        r12.push_back(0);
        r12.push_back(1);
        auto t = timehex(2023, 12, 31, 23, 59, 59);
        r12.insert(r12.end(), t.begin(), t.end());
        rec = parse_record(r12.data(), r12.size());
        assert_true(rec && rec->consumed == 12 && rec->subject_id == "70000", "12-byte record has a u32 id");
        assert_true(rec && rec->punch == 1, "12-byte record punch byte");

        // 14: u16 id + 4 extra
        auto r14 = pad(numeric_record(4242), 14);
        rec = parse_record(r14.data(), r14.size());
        assert_true(rec && rec->consumed == 14 && rec->subject_id == "4242", "14-byte record consumes 14");

        // 32 / 36 / 37 / 52: 24-byte text id
        auto r32 = text_record("EMP-001");
        rec = parse_record(r32.data(), r32.size());
        assert_true(r32.size() == 32, "text record helper builds 32 bytes");
        assert_true(rec && rec->consumed == 32 && rec->subject_id == "EMP-001", "32-byte record text id");

        auto r36 = text_record("36", 4);
        rec = parse_record(r36.data(), r36.size());
        assert_true(rec && rec->consumed == 36 && rec->subject_id == "36", "36-byte record consumes 36");

        auto r37 = text_record("37", 5);
        rec = parse_record(r37.data(), r37.size());
        assert_true(rec && rec->consumed == 37 && rec->subject_id == "37", "37-byte record consumes 37");

        auto r52 = text_record("52", 20);
        rec = parse_record(r52.data(), r52.size());
        assert_true(rec && rec->consumed == 52 && rec->subject_id == "52", "52-byte record consumes 52");

        auto r60 = text_record("60", 28);
        rec = parse_record(r60.data(), r60.size());
        assert_true(rec && rec->consumed == 52, ">=52 remaining consumes exactly 52");
    }

    // Test 2: text id stops at the first null
    {
        std::vector<uint8_t> record(32, 0);
        record[0] = '4';
        record[1] = '2';
        record[5] = 'X';  // after the terminator, must be ignored
        auto rec = parse_record(record.data(), record.size());
        assert_true(rec && rec->subject_id == "42", "text id with embedded nulls yields the prefix");
    }

    // Test 3: invalid UTF-8 bytes are dropped, not fatal
    {
        auto record = text_record("");
        record[0] = 'A';
        record[1] = 0xFF;
        record[2] = 'B';
        auto rec = parse_record(record.data(), record.size());
        assert_true(rec && rec->subject_id == "AB", "invalid UTF-8 byte is dropped");
    }

    // Test 4: unknown sizes
    {
        assert_true(record_size_for(20) == 0, "length 20 matches no layout");
        assert_true(record_size_for(9) == 0, "length 9 matches no layout");
        assert_true(record_size_for(51) == 0, "length 51 matches no layout");
        std::vector<uint8_t> twenty(20, 1);
        assert_true(!parse_record(twenty.data(), twenty.size()), "parse_record rejects length 20");
    }

    // Test 5: multi-record payloads advance by the chosen layout
    {
        // 52 bytes left -> first record consumes 52, then 10 remain
        auto payload = text_record("A", 20);
        auto tail = numeric_record(9);
        payload.insert(payload.end(), tail.begin(), tail.end());
        auto records = parse_records(payload);
        assert_true(records.size() == 2, "62-byte payload yields two records");
        assert_true(records.size() == 2 && records[0].subject_id == "A" && records[1].subject_id == "9",
                    "records come out in wire order");
    }

    // Test 6: unknown remaining length ends decoding without throwing
    {
        std::vector<uint8_t> payload(20, 0x31);
        auto records = parse_records(payload);
        assert_true(records.empty(), "20-byte payload yields no records");

        // 72 bytes: first record takes 52, the 20 left match nothing
        auto mixed = text_record("first", 20);
        mixed.insert(mixed.end(), 20, 0x31);
        records = parse_records(mixed);
        assert_true(records.size() == 1 && records[0].subject_id == "first",
                    "unknown trailing length drops only the remainder");

        std::vector<uint8_t> short_payload(9, 0x01);
        assert_true(parse_records(short_payload).empty(), "fewer than 10 bytes yields nothing");
    }

    // Test 7: empty ids are skipped
    {
        auto payload = text_record("");
        assert_true(parse_records(payload).empty(), "record with empty text id is skipped");
    }

    // Test 8: framing by transport
    {
        auto payload = numeric_record(17);
        auto tcp = live_packet(payload, true);
        auto frame = frame_packet(tcp, true);
        assert_true(frame && frame->command == 500, "TCP frame: command from header field 0");
        assert_true(frame && frame->payload == payload, "TCP frame: payload after top and header");
        assert_true(frame && frame->declared_length == zk::HEADER_SIZE + payload.size(),
                    "TCP frame: length from the top");
        assert_true(frame && frame->session_id == 0x1234, "TCP frame: session id");

        auto udp = live_packet(payload, false);
        frame = frame_packet(udp, false);
        assert_true(frame && frame->payload == payload, "UDP frame: payload after 8-byte header");

        std::vector<uint8_t> runt(12, 0);
        assert_true(!frame_packet(runt, true), "TCP frame shorter than 16 bytes is rejected");
        std::vector<uint8_t> tiny(4, 0);
        assert_true(!frame_packet(tiny, false), "UDP frame shorter than 8 bytes is rejected");
    }

    // Test 9: command filter
    {
        auto payload = numeric_record(17);
        assert_true(decode_live_packet(live_packet(payload, true, 500), true).size() == 1,
                    "command 500 packet yields its record");
        assert_true(decode_live_packet(live_packet(payload, true, 2000), true).empty(),
                    "non-500 command is dropped entirely");
        assert_true(decode_live_packet(live_packet({}, true, 500), true).empty(),
                    "empty payload yields nothing");
        assert_true(decode_live_packet(live_packet(payload, false, 500), false).size() == 1,
                    "UDP command 500 packet yields its record");
    }

    std::cout << "\nTest Results: " << (fails == 0 ? "ALL PASSED" : "FAILURES") << std::endl;
    return fails == 0 ? 0 : 1;
}
