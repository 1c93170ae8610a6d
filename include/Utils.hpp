#pragma once

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <vector>

namespace zkfleet {
namespace utils {

/**
 * @brief Get current local timestamp string
 * @param format Format string (default: "%Y-%m-%d %H:%M:%S")
 * @return Timestamp string
 */
std::string get_timestamp_string(const std::string& format = "%Y-%m-%d %H:%M:%S");

/**
 * @brief Format a device timestamp
 *
 * Device clocks carry no zone, so their timestamps are stored as UTC-based
 * epoch values and formatted back the same way.
 */
std::string format_device_time(std::time_t timestamp, const char* format = "%Y-%m-%d %H:%M:%S");

/**
 * @brief Build a device timestamp from calendar fields (no zone conversion)
 */
std::time_t make_device_time(int year, int month, int day, int hour, int minute, int second);

/**
 * @brief Parse a YYYY-MM-DD date into the start of that day
 * @return nullopt if the text is not a valid date
 */
std::optional<std::time_t> parse_date(const std::string& text);

/** Seconds since the Unix epoch with sub-second precision */
double epoch_now();

/**
 * @brief Create directory (and parents) if it doesn't exist
 * @param path Directory path
 * @return true if directory exists or was created
 */
bool ensure_directory_exists(const std::string& path);

/**
 * @brief Redirect stdout/stderr to an append-mode log file, unbuffered
 * @return false if either stream could not be redirected
 */
bool setup_logging(const std::string& log_file);

/** Base64 encode (no line breaks) */
std::string base64_encode(const std::vector<uint8_t>& input);

/**
 * @brief Strict base64 decode
 * @throws ValidationError on characters outside the alphabet or bad padding
 */
std::vector<uint8_t> base64_decode(const std::string& input);

/** "[Device-<id>]" log prefix */
std::string device_tag(int device_id);

/** Environment variable, or @p fallback when unset or empty */
std::string env_or(const char* name, const std::string& fallback);

} // namespace utils
} // namespace zkfleet
