#pragma once

#include "DeviceDriver.hpp"
#include "ZkProtocol.hpp"
#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace zkfleet {

/**
 * @brief ZK binary protocol over a TCP (or UDP) socket
 *
 * Not thread-safe apart from is_connected(), ping() and interrupt(); the
 * owning DeviceLink serializes everything else.
 */
class ZkSocketDriver : public DeviceDriver, public RawTransport {
public:
    explicit ZkSocketDriver(const DeviceConfig& config);
    ~ZkSocketDriver() override;

    ZkSocketDriver(const ZkSocketDriver&) = delete;
    ZkSocketDriver& operator=(const ZkSocketDriver&) = delete;

    // DeviceDriver: session
    void connect() override;
    void disconnect() override;
    bool is_connected() const override { return connected_; }
    bool is_tcp() const override { return tcp_; }
    bool ping() override;
    void enable_device() override;
    void disable_device() override;

    // DeviceDriver: live capture
    bool cancel_capture() override;
    void verify_user() override;
    void reg_event(uint32_t flags) override;
    void ack_ok() override;
    RawTransport& raw_transport() override { return *this; }

    // DeviceDriver: commands
    std::vector<DeviceUser> get_users() override;
    void set_user(const DeviceUser& user) override;
    void delete_user(int uid, const std::string& user_id) override;
    void enroll_user(int uid, int finger_index, const std::string& user_id) override;
    void delete_user_template(int uid, int finger_index, const std::string& user_id) override;
    std::optional<FingerTemplate> get_user_template(int uid, int finger_index) override;
    void save_user_template(const DeviceUser& user, const FingerTemplate& finger) override;
    std::vector<FingerTemplate> get_templates() override;
    std::vector<AttendanceRecord> get_attendance() override;
    std::string get_device_name() override;
    std::string get_firmware_version() override;
    std::string get_platform() override;
    std::string get_serial_number() override;
    std::time_t get_time() override;
    DeviceCapacity read_sizes() override;

    // RawTransport
    std::optional<std::vector<uint8_t>> read(size_t max_bytes) override;
    void write(const std::vector<uint8_t>& data) override;
    void set_timeout(std::optional<std::chrono::milliseconds> timeout) override;
    void interrupt() override;

private:
    struct TcpChunk {
        std::vector<uint8_t> data;
        std::vector<uint8_t> broken_header;  // bytes of the next packet already read
    };

    void open_socket();
    void close_socket();
    void apply_timeout(std::optional<std::chrono::milliseconds> timeout);

    void send_bytes(const std::vector<uint8_t>& data);
    std::vector<uint8_t> recv_bytes(size_t max_bytes);
    std::vector<uint8_t> receive_raw_data(size_t size);

    /**
     * @brief Send one command and read its reply
     * @return true for ACK_OK / PREPARE_DATA / DATA replies
     */
    bool send_command(uint16_t command, const std::vector<uint8_t>& payload = {},
                      size_t response_size = 8);

    std::optional<std::vector<uint8_t>> receive_chunk();
    std::optional<TcpChunk> receive_tcp_data(const std::vector<uint8_t>& data_recv, size_t size);
    std::vector<uint8_t> read_chunk(uint32_t start, uint32_t size);
    std::vector<uint8_t> read_with_buffer(uint16_t command, int fct = 0, int ext = 0);
    void send_with_buffer(const std::vector<uint8_t>& buffer);

    void free_data();
    void refresh_data();
    std::string read_option(const std::string& key);
    int find_uid(const std::string& user_id);

    std::vector<uint8_t> pack_user(const DeviceUser& user, bool with_tag) const;

    DeviceConfig config_;
    bool tcp_;
    std::chrono::milliseconds command_timeout_;

    std::atomic<int> fd_{-1};
    std::atomic<bool> connected_{false};

    uint16_t session_id_ = 0;
    uint16_t reply_id_ = zk::USHRT_MAX_VALUE - 1;
    uint16_t response_ = 0;
    uint32_t tcp_length_ = 0;
    std::vector<uint8_t> data_;  // payload of the last reply
    int user_packet_size_ = 28;
};

/** DriverFactory for the daemon */
std::unique_ptr<DeviceDriver> make_socket_driver(const DeviceConfig& config);

} // namespace zkfleet
