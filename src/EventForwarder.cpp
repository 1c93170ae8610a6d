#include "EventForwarder.hpp"
#include "Errors.hpp"
#include "Utils.hpp"
#include <curl/curl.h>
#include <iostream>
#include <mutex>

namespace zkfleet {

namespace {

std::once_flag curl_init_flag;

// Callback for CURL to receive response
size_t curl_write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t total_size = size * nmemb;
    userp->append(static_cast<char*>(contents), total_size);
    return total_size;
}

std::string build_endpoint(const std::string& backend_url) {
    if (backend_url.empty()) return "";
    std::string base = backend_url;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + "/check-in";
}

} // namespace

void to_json(nlohmann::json& j, const AttendanceEvent& event) {
    j = nlohmann::json{
        {"member_id", event.subject_id},
        {"device_id", event.device_id},
        {"device_name", event.device_name},
        {"timestamp", event.observed_at_epoch}
    };
}

EventForwarder::EventForwarder(std::string backend_url, std::chrono::milliseconds timeout)
    : endpoint_(build_endpoint(backend_url)), timeout_(timeout) {
    // curl_global_init is not thread-safe; do it before any reader thread posts
    std::call_once(curl_init_flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });

    if (endpoint_.empty()) {
        std::cerr << "⚠️ BACKEND_URL not set, attendance events will not be forwarded" << std::endl;
    }
}

void EventForwarder::forward(const AttendanceEvent& event) {
    if (endpoint_.empty()) {
        std::cerr << "⚠️ " << utils::device_tag(event.device_id) << " no backend configured, dropping event for "
                  << event.subject_id << std::endl;
        return;
    }

    try {
        nlohmann::json payload = event;
        post(payload.dump());
        ++delivered_;
        std::cout << "📡 " << utils::device_tag(event.device_id) << " forwarded check-in for member "
                  << event.subject_id << std::endl;
    } catch (const std::exception& e) {
        ++failed_;
        if (should_surface(classify_error(e), ErrorSite::Forwarding)) {
            throw;
        }
        std::cerr << "❌ " << utils::device_tag(event.device_id) << " failed to forward event for member "
                  << event.subject_id << ": " << e.what() << std::endl;
    }
}

void EventForwarder::post(const std::string& body) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw DeliveryError("Failed to initialize CURL");
    }

    std::string response;
    curl_easy_setopt(curl, CURLOPT_URL, endpoint_.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curl_write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_.count()));
    // Reader threads must never be hit by SIGALRM from the resolver
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    // Set headers
    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        throw DeliveryError(std::string("request failed: ") + curl_easy_strerror(res));
    }
    if (status < 200 || status >= 300) {
        throw DeliveryError("backend returned HTTP " + std::to_string(status));
    }
}

} // namespace zkfleet
