#include "EventForwarder.hpp"
#include <chrono>
#include <iostream>

using namespace zkfleet;

static int fails = 0;

static void assert_true(bool cond, const char* msg) {
    if (!cond) {
        std::cerr << "[FAIL] " << msg << std::endl;
        ++fails;
    } else {
        std::cout << "[PASS] " << msg << std::endl;
    }
}

static AttendanceEvent sample_event() {
    AttendanceEvent event;
    event.subject_id = "17";
    event.device_id = 2;
    event.device_name = "Side Door";
    event.observed_at_epoch = 1715934600.25;
    return event;
}

int main() {
    std::cout << "=== Event Forwarder Test ===" << std::endl;

    // Test 1: webhook body
    {
        nlohmann::json body = sample_event();
        assert_true(body["member_id"] == "17", "member_id carries the subject id");
        assert_true(body["device_id"] == 2, "device_id");
        assert_true(body["device_name"] == "Side Door", "device_name");
        assert_true(body["timestamp"].get<double>() == 1715934600.25, "timestamp is the observed epoch");
        assert_true(body.size() == 4, "body has exactly four fields");
    }

    // Test 2: endpoint construction
    {
        EventForwarder forwarder("http://backend:8000/");
        assert_true(forwarder.is_configured(), "forwarder with URL is configured");
        assert_true(forwarder.endpoint() == "http://backend:8000/check-in", "trailing slash trimmed");
    }

    // Test 3: missing backend is a logged no-op
    {
        EventForwarder forwarder("");
        assert_true(!forwarder.is_configured(), "empty URL is not configured");
        bool threw = false;
        try {
            forwarder.forward(sample_event());
        } catch (const std::exception&) {
            threw = true;
        }
        assert_true(!threw, "forward without backend does not throw");
        assert_true(forwarder.delivered() == 0 && forwarder.failed() == 0, "nothing attempted");
    }

    // Test 4: unreachable backend is absorbed and bounded by the timeout
    {
        EventForwarder forwarder("http://127.0.0.1:9", std::chrono::milliseconds(2000));
        auto start = std::chrono::steady_clock::now();
        bool threw = false;
        try {
            forwarder.forward(sample_event());
            forwarder.forward(sample_event());
        } catch (const std::exception&) {
            threw = true;
        }
        auto elapsed = std::chrono::steady_clock::now() - start;
        assert_true(!threw, "unreachable backend does not throw");
        assert_true(forwarder.failed() == 2 && forwarder.delivered() == 0, "each failure is counted and dropped");
        assert_true(elapsed < std::chrono::seconds(5), "failures return within the request timeout");
    }

    std::cout << "\nTest Results: " << (fails == 0 ? "ALL PASSED" : "FAILURES") << std::endl;
    return fails == 0 ? 0 : 1;
}
