#include "Utils.hpp"
#include "Errors.hpp"
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace zkfleet {
namespace utils {

std::string get_timestamp_string(const std::string& format) {
    auto now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, format.c_str());
    return oss.str();
}

std::string format_device_time(std::time_t timestamp, const char* format) {
    std::tm tm{};
    gmtime_r(&timestamp, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, format);
    return oss.str();
}

std::time_t make_device_time(int year, int month, int day, int hour, int minute, int second) {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    return timegm(&tm);
}

std::optional<std::time_t> parse_date(const std::string& text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }

    std::tm tm{};
    std::istringstream iss(text);
    iss >> std::get_time(&tm, "%Y-%m-%d");
    if (iss.fail()) {
        return std::nullopt;
    }

    // Reject dates that timegm would silently normalise (e.g. 2024-02-30)
    int year = tm.tm_year + 1900;
    int month = tm.tm_mon + 1;
    int day = tm.tm_mday;
    std::time_t value = make_device_time(year, month, day, 0, 0, 0);
    std::tm check{};
    gmtime_r(&value, &check);
    if (check.tm_mday != day || check.tm_mon + 1 != month) {
        return std::nullopt;
    }
    return value;
}

double epoch_now() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::microseconds>(now).count() / 1e6;
}

bool ensure_directory_exists(const std::string& path) {
    struct stat info;

    if (stat(path.c_str(), &info) == 0) {
        return S_ISDIR(info.st_mode);
    }

    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    return !ec;
}

bool setup_logging(const std::string& log_file) {
    std::filesystem::path log_path(log_file);
    if (log_path.has_parent_path() && !ensure_directory_exists(log_path.parent_path().string())) {
        std::cerr << "Failed to create log directory: " << log_path.parent_path() << std::endl;
    }

    bool ok = true;
    if (!freopen(log_file.c_str(), "a", stdout)) {
        perror("Failed to redirect stdout");
        ok = false;
    }
    if (!freopen(log_file.c_str(), "a", stderr)) {
        perror("Failed to redirect stderr");
        ok = false;
    }
    // Unbuffered so a crash never loses the last lines
    setvbuf(stdout, NULL, _IONBF, 0);
    setvbuf(stderr, NULL, _IONBF, 0);
    return ok;
}

std::string base64_encode(const std::vector<uint8_t>& input) {
    BIO *bio, *b64;
    BUF_MEM *bufferPtr;

    b64 = BIO_new(BIO_f_base64());
    bio = BIO_new(BIO_s_mem());
    bio = BIO_push(b64, bio);

    BIO_set_flags(bio, BIO_FLAGS_BASE64_NO_NL);
    BIO_write(bio, input.data(), static_cast<int>(input.size()));
    BIO_flush(bio);
    BIO_get_mem_ptr(bio, &bufferPtr);

    std::string result(bufferPtr->data, bufferPtr->length);
    BIO_free_all(bio);

    return result;
}

static bool is_base64_char(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '+' || c == '/';
}

std::vector<uint8_t> base64_decode(const std::string& input) {
    if (input.empty()) {
        return {};
    }
    if (input.size() % 4 != 0) {
        throw ValidationError("Invalid base64 length");
    }

    size_t padding = 0;
    for (size_t i = 0; i < input.size(); ++i) {
        char c = input[i];
        if (c == '=') {
            // Padding only in the last two positions
            if (i < input.size() - 2) {
                throw ValidationError("Invalid base64 padding");
            }
            ++padding;
        } else if (padding > 0 || !is_base64_char(c)) {
            throw ValidationError("Invalid base64 character");
        }
    }

    // BIO's base64 filter skips garbage silently, so validation happens above
    BIO *bio, *b64;
    b64 = BIO_new(BIO_f_base64());
    bio = BIO_new_mem_buf(input.c_str(), static_cast<int>(input.length()));
    bio = BIO_push(b64, bio);

    BIO_set_flags(bio, BIO_FLAGS_BASE64_NO_NL);

    std::vector<uint8_t> output(input.length());
    int decoded_size = BIO_read(bio, output.data(), static_cast<int>(input.length()));

    BIO_free_all(bio);

    size_t expected = input.size() / 4 * 3 - padding;
    if (decoded_size < 0 || static_cast<size_t>(decoded_size) != expected) {
        throw ValidationError("Invalid base64 data");
    }
    output.resize(decoded_size);
    return output;
}

std::string device_tag(int device_id) {
    return "[Device-" + std::to_string(device_id) + "]";
}

std::string env_or(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    if (value && *value) {
        return value;
    }
    return fallback;
}

} // namespace utils
} // namespace zkfleet
