#include "DeviceLink.hpp"
#include "TestFakes.hpp"
#include "Utils.hpp"
#include <chrono>
#include <iostream>
#include <thread>

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

struct Fixture {
    FakeDriver* driver;
    std::unique_ptr<DeviceLink> link;
};

static Fixture make_link(LinkSettings settings = fast_settings(), EventSink* sink = nullptr) {
    auto driver = std::make_unique<FakeDriver>();
    FakeDriver* raw = driver.get();
    return {raw, std::make_unique<DeviceLink>(make_device(1), std::move(driver), settings, sink)};
}

template<class E, class F>
static bool throws(F&& f) {
    try {
        f();
    } catch (const E&) {
        return true;
    } catch (const std::exception&) {
        return false;
    }
    return false;
}

static std::vector<uint8_t> blob(size_t size) {
    return std::vector<uint8_t>(size, 0xA5);
}

int main() {
    std::cout << "=== Device Link Test ===" << std::endl;

    // Test 1: retries stop at max_retries with linear back-off
    {
        LinkSettings settings = fast_settings();
        settings.max_retries = 3;
        settings.base_delay = std::chrono::milliseconds(100);
        settings.max_delay = std::chrono::seconds(1);
        auto f = make_link(settings);
        f.driver->behavior().connect_always_fails = true;

        auto start = std::chrono::steady_clock::now();
        bool ok = f.link->connect(false);
        auto elapsed = std::chrono::steady_clock::now() - start;

        assert_true(!ok, "connect gives up when the driver always fails");
        assert_true(f.driver->behavior().connect_calls == 3, "exactly max_retries attempts");
        assert_true(elapsed >= std::chrono::milliseconds(300), "waits base*1 + base*2 between attempts");
        assert_true(elapsed < std::chrono::milliseconds(900), "no wait after the last attempt");
        assert_true(f.link->state() == LinkState::Disconnected, "state disconnected after giving up");
    }

    // Test 2: back-off is capped at max_delay
    {
        LinkSettings settings = fast_settings();
        settings.max_retries = 4;
        settings.base_delay = std::chrono::milliseconds(100);
        settings.max_delay = std::chrono::milliseconds(120);
        auto f = make_link(settings);
        f.driver->behavior().connect_always_fails = true;

        auto start = std::chrono::steady_clock::now();
        f.link->connect(false);
        auto elapsed = std::chrono::steady_clock::now() - start;
        // 100 + 120 + 120
        assert_true(elapsed >= std::chrono::milliseconds(340) && elapsed < std::chrono::milliseconds(900),
                    "delays capped at max_delay");
    }

    // Test 3: success after transient failures
    {
        auto f = make_link();
        f.driver->behavior().connect_failures = 2;
        assert_true(f.link->connect(false), "connect succeeds on the third attempt");
        assert_true(f.driver->behavior().connect_calls == 3, "two failures then success");
        assert_true(f.link->state() == LinkState::Connected, "state connected");
    }

    // Test 4: stop wakes a connect sleeping in back-off
    {
        LinkSettings settings = fast_settings();
        settings.max_retries = 5;
        settings.base_delay = std::chrono::seconds(5);
        settings.max_delay = std::chrono::seconds(60);
        auto f = make_link(settings);
        f.driver->behavior().connect_always_fails = true;

        bool result = true;
        auto start = std::chrono::steady_clock::now();
        std::thread connector([&] { result = f.link->connect(false); });
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        f.link->stop();
        connector.join();
        auto elapsed = std::chrono::steady_clock::now() - start;

        assert_true(!result, "interrupted connect returns false");
        assert_true(elapsed < std::chrono::seconds(2), "back-off wakes immediately on stop");
        assert_true(f.driver->behavior().connect_calls == 1, "no attempt after stop");
    }

    // Test 5: invalid address ends the loop at once
    {
        auto f = make_link();
        f.driver->behavior().connect_invalid = true;
        assert_true(throws<ValidationError>([&] { f.link->connect(false); }), "validation error surfaces");
        assert_true(f.driver->behavior().connect_calls == 1, "validation error is not retried");
    }

    // Test 6: fast path
    {
        auto f = make_link();
        assert_true(f.link->connect(false), "first connect");
        int pings = f.driver->count("ping");
        assert_true(f.link->connect(false), "second connect");
        assert_true(f.driver->behavior().connect_calls == 1, "fast path skips the driver connect");
        assert_true(f.driver->count("ping") == pings + 1, "fast path pings");

        f.driver->behavior().ping_ok = false;
        assert_true(f.link->connect(false), "reconnects when the ping fails");
        assert_true(f.driver->count("disconnect") == 1, "stale session closed before reconnecting");
        assert_true(f.driver->behavior().connect_calls == 2, "fresh driver connect");
    }

    // Test 7: template size window
    {
        assert_true(throws<ValidationError>([] { validate_template_size(299); }), "299 bytes rejected");
        assert_true(!throws<ValidationError>([] { validate_template_size(300); }), "300 bytes accepted");
        assert_true(!throws<ValidationError>([] { validate_template_size(2000); }), "2000 bytes accepted");
        assert_true(throws<ValidationError>([] { validate_template_size(2001); }), "2001 bytes rejected");

        auto f = make_link();
        assert_true(throws<ValidationError>([&] { f.link->set_user_template(5, 0, blob(299)); }),
                    "set_user_template rejects 299 bytes");
        assert_true(throws<ValidationError>([&] { f.link->set_user_template(5, 0, blob(2001)); }),
                    "set_user_template rejects 2001 bytes");
        assert_true(f.driver->calls().empty(), "rejected sizes never reach the device");

        assert_true(f.link->set_user_template(5, 0, blob(300)), "300-byte template stored");
        assert_true(f.link->set_user_template(5, 1, blob(2000)), "2000-byte template stored");
        assert_true(f.driver->saved_templates().size() == 2, "both templates saved");
    }

    // Test 8: template restore creates a missing user
    {
        auto f = make_link();
        f.driver->add_user(3, "3", "Alice");

        f.link->set_user_template(3, 6, blob(512));
        assert_true(f.driver->count("set_user") == 0, "existing user is not recreated");

        f.link->set_user_template(17, 2, blob(512));
        auto users = f.driver->users();
        bool created = false;
        for (const auto& user : users) {
            if (user.user_id == "17" && user.name == "user_17" && user.uid == 17) created = true;
        }
        assert_true(created, "placeholder user_17 created");

        auto saved = f.driver->saved_templates();
        assert_true(saved.size() == 2 && saved[1].first.user_id == "17" && saved[1].second.finger_index == 2 &&
                    saved[1].second.data.size() == 512, "template written for the new user and finger");
    }

    // Test 9: disabled scope is released on every path
    {
        auto f = make_link();
        f.link->get_all_users();
        assert_true(f.driver->count("disable_device") == 1 && f.driver->count("enable_device") == 1,
                    "command runs inside disable/enable");

        f.driver->behavior().failing_command = "get_users";
        assert_true(throws<DriverError>([&] { f.link->get_all_users(); }), "driver failure surfaces to caller");
        assert_true(f.driver->count("disable_device") == 2 && f.driver->count("enable_device") == 2,
                    "device re-enabled after a failed command");

        auto calls = f.driver->calls();
        assert_true(!calls.empty() && calls.back() == "enable_device", "enable is the last call");
    }

    // Test 10: enable failure does not mask the command result
    {
        auto f = make_link();
        f.driver->add_user(1, "1", "Bob");
        f.driver->behavior().failing_command = "enable_device";
        std::vector<DeviceUser> users;
        bool threw = throws<std::exception>([&] { users = f.link->get_all_users(); });
        assert_true(!threw && users.size() == 1, "enable failure is logged, result returned");
    }

    // Test 11: device info does not disable the device
    {
        auto f = make_link();
        f.driver->add_user(1, "1", "Bob");
        auto info = f.link->get_device_info();
        assert_true(info["device_name"] == "FakeTerminal" && info["users_count"] == 1 &&
                    info["templates_count"] == 0, "device info fields");
        assert_true(info["device_time"] == utils::format_device_time(1700000000), "device time formatted");
        assert_true(f.driver->count("disable_device") == 0, "device info leaves scanning on");
    }

    // Test 12: invoke
    {
        auto f = make_link();
        assert_true(throws<UnknownOperationError>([&] { f.link->invoke("format_device", {}); }),
                    "unknown operation rejected");
        assert_true(throws<ValidationError>([&] { f.link->invoke("delete_user", nlohmann::json::object()); }),
                    "missing argument rejected");
        assert_true(throws<ValidationError>([&] {
                        f.link->invoke("get_user", nlohmann::json{{"user_id", "abc"}});
                    }), "non-numeric id rejected");

        f.link->invoke("create_user", {{"user_id", 42}, {"name", "Carol"}, {"privilege", USER_ADMIN}});
        auto user = f.link->invoke("get_user", {{"user_id", "42"}});
        assert_true(user.is_object() && user["name"] == "Carol" && user["privilege"] == USER_ADMIN,
                    "create_user then get_user");
        assert_true(f.link->invoke("user_exists", {{"user_id", 42}}) == true, "user_exists");
        assert_true(throws<ValidationError>([&] {
                        f.link->invoke("create_user", {{"user_id", 42}, {"name", "Again"}});
                    }), "duplicate user rejected");
        assert_true(f.link->invoke("get_user", {{"user_id", 99}}).is_null(), "missing user is null");

        std::string encoded = utils::base64_encode(blob(400));
        assert_true(f.link->invoke("set_user_template",
                                   {{"user_id", 42}, {"temp_id", 1}, {"template", encoded}}) == true,
                    "set_user_template via base64");
        assert_true(throws<ValidationError>([&] {
                        f.link->invoke("set_user_template", {{"user_id", 42}, {"temp_id", 1}, {"template", "***"}});
                    }), "invalid base64 rejected");
        auto finger = f.link->invoke("get_user_template", {{"user_id", 42}, {"temp_id", 1}});
        assert_true(finger.is_object() && finger["template"] == encoded, "template read back as base64");

        f.link->invoke("delete_user", {{"user_id", 42}});
        assert_true(f.link->invoke("user_exists", {{"user_id", 42}}) == false, "user deleted");
    }

    // Test 13: attendance date range
    {
        auto f = make_link();
        f.driver->add_attendance("1", utils::make_device_time(2024, 5, 16, 23, 59, 59));
        f.driver->add_attendance("2", utils::make_device_time(2024, 5, 17, 0, 0, 0));
        f.driver->add_attendance("3", utils::make_device_time(2024, 5, 18, 23, 59, 59));
        f.driver->add_attendance("4", utils::make_device_time(2024, 5, 19, 0, 0, 0));

        auto all = f.link->invoke("get_attendance", nlohmann::json::object());
        assert_true(all.size() == 4, "no range returns everything");

        auto range = f.link->invoke("get_attendance", {{"from", "2024-05-17"}, {"to", "2024-05-18"}});
        assert_true(range.size() == 2 && range[0]["user_id"] == "2" && range[1]["user_id"] == "3",
                    "'to' is inclusive through 23:59:59");
        assert_true(throws<ValidationError>([&] { f.link->invoke("get_attendance", {{"from", "May 17"}}); }),
                    "bad date rejected");
    }

    // Test 14: offline device
    {
        auto f = make_link();
        f.driver->behavior().connect_always_fails = true;
        assert_true(throws<DeviceOfflineError>([&] { f.link->get_all_users(); }), "offline device surfaces");
        assert_true(throws<DeviceOfflineError>([&] { f.link->get_device_status(); }), "status throws when offline");
        assert_true(f.driver->count("disable_device") == 0, "no disable when never connected");
    }

    // Test 15: health rules
    {
        RecordingSink sink;
        LinkSettings settings = fast_settings();
        auto f = make_link(settings, &sink);
        assert_true(!f.link->is_healthy(), "unhealthy before connecting");

        assert_true(f.link->connect(true), "connect with live capture");
        assert_true(f.link->live_capture_running(), "reader started");
        assert_true(f.link->is_healthy(), "healthy when connected, reading and pinging");

        f.driver->behavior().ping_ok = false;
        assert_true(!f.link->is_healthy(), "failed ping is unhealthy");
        f.driver->behavior().ping_ok = true;
        assert_true(f.link->is_healthy(), "healthy again once ping answers");

        // Worker gone while the last ping is fresh
        f.link->cancel_enroll_user();
        for (int i = 0; i < 100 && f.link->live_capture_running(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        assert_true(!f.link->live_capture_running(), "cancel_enroll_user ends live capture");
        assert_true(!f.link->is_healthy(), "dead worker is unhealthy despite a recent ping");
    }

    // Test 16: staleness
    {
        RecordingSink sink;
        LinkSettings settings = fast_settings();
        settings.ping_interval = std::chrono::milliseconds(20);
        auto f = make_link(settings, &sink);
        f.link->connect(true);
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        int pings = f.driver->count("ping");
        assert_true(!f.link->is_healthy(), "no ping or packet within 3x interval is unhealthy");
        assert_true(f.driver->count("ping") == pings, "stale link is not pinged");
    }

    // Test 17: command link without live capture is never healthy
    {
        auto f = make_link();
        f.link->connect(false);
        assert_true(!f.link->is_healthy(), "no reader means unhealthy");
    }

    // Test 18: stop
    {
        auto f = make_link();
        f.link->stop();
        assert_true(f.driver->calls().empty(), "stopping a never-started link touches nothing");
        f.link->stop();
        assert_true(f.link->is_stopped(), "second stop is a no-op");
        assert_true(!f.link->connect(false), "stopped link does not reconnect");

        RecordingSink sink;
        auto g = make_link(fast_settings(), &sink);
        g.link->connect(true);
        g.link->stop();
        assert_true(!g.link->live_capture_running(), "stop joins the reader");
        assert_true(!g.driver->is_connected(), "stop closes the session");
        assert_true(g.link->state() == LinkState::Disconnected, "state disconnected after stop");
    }

    // Test 19: a slow health ping does not hold up stop
    {
        RecordingSink sink;
        auto f = make_link(fast_settings(), &sink);
        f.link->connect(true);
        f.driver->behavior().ping_delay_ms = 1500;

        bool healthy = true;
        std::thread prober([&] { healthy = f.link->is_healthy(); });
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        auto start = std::chrono::steady_clock::now();
        f.link->request_stop();
        auto request_elapsed = std::chrono::steady_clock::now() - start;
        f.link->stop();
        auto stop_elapsed = std::chrono::steady_clock::now() - start;
        prober.join();

        assert_true(request_elapsed < std::chrono::milliseconds(300), "request_stop returns while a ping is in flight");
        assert_true(stop_elapsed < std::chrono::milliseconds(1000), "stop does not wait for the ping");
        assert_true(!healthy, "probe that outlived stop reports unhealthy");
    }

    std::cout << "\nTest Results: " << (fails == 0 ? "ALL PASSED" : "FAILURES") << std::endl;
    return fails == 0 ? 0 : 1;
}
