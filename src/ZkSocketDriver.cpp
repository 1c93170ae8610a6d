#include "ZkSocketDriver.hpp"
#include "Errors.hpp"
#include "Utils.hpp"
#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstdint>
#include <cstring>
#include <iostream>

namespace zkfleet {

using namespace zk;

namespace {

constexpr std::chrono::seconds DEFAULT_COMMAND_TIMEOUT{60};

std::vector<uint8_t> slice(const std::vector<uint8_t>& data, size_t from, size_t to = SIZE_MAX) {
    to = std::min(to, data.size());
    if (from >= to) return {};
    return std::vector<uint8_t>(data.begin() + from, data.begin() + to);
}

void append(std::vector<uint8_t>& out, const std::vector<uint8_t>& more) {
    out.insert(out.end(), more.begin(), more.end());
}

std::string trim(const std::string& text) {
    const char* ws = " \t\r\n";
    size_t begin = text.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    size_t end = text.find_last_not_of(ws);
    return text.substr(begin, end - begin + 1);
}

// UDP-era firmware stores these fields as integers
uint32_t numeric_field(const char* field, const std::string& value) {
    try {
        size_t pos = 0;
        unsigned long number = std::stoul(value, &pos);
        if (pos != value.size()) throw std::invalid_argument(value);
        return static_cast<uint32_t>(number);
    } catch (const std::exception&) {
        throw ValidationError(std::string(field) + " must be numeric on this device: '" + value + "'");
    }
}

} // namespace

ZkSocketDriver::ZkSocketDriver(const DeviceConfig& config)
    : config_(config),
      tcp_(!config.force_udp),
      command_timeout_(config.timeout_seconds
                           ? std::chrono::milliseconds(std::chrono::seconds(*config.timeout_seconds))
                           : std::chrono::milliseconds(DEFAULT_COMMAND_TIMEOUT)) {}

ZkSocketDriver::~ZkSocketDriver() {
    close_socket();
}

// ---------------------------------------------------------------------------
// Socket plumbing
// ---------------------------------------------------------------------------

void ZkSocketDriver::open_socket() {
    close_socket();

    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(config_.port));
    if (inet_pton(AF_INET, config_.ip.c_str(), &addr.sin_addr) != 1) {
        throw ValidationError("invalid device address: " + config_.ip);
    }

    int fd = socket(AF_INET, tcp_ ? SOCK_STREAM : SOCK_DGRAM, 0);
    if (fd < 0) {
        throw ConnectionError(std::string("socket() failed: ") + std::strerror(errno));
    }

    // Non-blocking connect so the attempt is bounded by the command timeout
    int flags = fcntl(fd, F_GETFL, 0);
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);

    int rc = ::connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
    if (rc < 0 && errno == EINPROGRESS) {
        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLOUT;
        rc = poll(&pfd, 1, static_cast<int>(command_timeout_.count()));
        if (rc == 0) {
            close(fd);
            throw ConnectionError("timed out connecting to " + config_.ip + ":" + std::to_string(config_.port));
        }
        int so_error = 0;
        socklen_t len = sizeof(so_error);
        getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
        rc = (rc > 0 && so_error == 0) ? 0 : -1;
        if (so_error != 0) errno = so_error;
    }
    if (rc < 0) {
        std::string reason = std::strerror(errno);
        close(fd);
        throw ConnectionError("connect to " + config_.ip + ":" + std::to_string(config_.port) + " failed: " + reason);
    }

    fcntl(fd, F_SETFL, flags);
    fd_ = fd;
    apply_timeout(command_timeout_);
}

void ZkSocketDriver::close_socket() {
    int fd = fd_.exchange(-1);
    if (fd >= 0) {
        close(fd);
    }
    connected_ = false;
}

void ZkSocketDriver::apply_timeout(std::optional<std::chrono::milliseconds> timeout) {
    int fd = fd_;
    if (fd < 0) return;

    struct timeval tv;
    tv.tv_sec = 0;
    tv.tv_usec = 0;
    if (timeout) {
        tv.tv_sec = static_cast<time_t>(timeout->count() / 1000);
        tv.tv_usec = static_cast<suseconds_t>((timeout->count() % 1000) * 1000);
    }
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

void ZkSocketDriver::send_bytes(const std::vector<uint8_t>& data) {
    int fd = fd_;
    if (fd < 0) {
        throw TransportError("socket is closed");
    }

    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw TransportError(std::string("send failed: ") + std::strerror(errno));
        }
        sent += static_cast<size_t>(n);
    }
}

std::vector<uint8_t> ZkSocketDriver::recv_bytes(size_t max_bytes) {
    int fd = fd_;
    if (fd < 0) {
        throw TransportError("socket is closed");
    }

    std::vector<uint8_t> buffer(max_bytes);
    ssize_t n;
    do {
        n = recv(fd, buffer.data(), max_bytes, 0);
    } while (n < 0 && errno == EINTR);

    if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            throw TransportError("timed out waiting for device reply");
        }
        throw TransportError(std::string("recv failed: ") + std::strerror(errno));
    }
    if (n == 0 && tcp_) {
        throw TransportError("connection closed by device");
    }
    buffer.resize(static_cast<size_t>(n));
    return buffer;
}

std::vector<uint8_t> ZkSocketDriver::receive_raw_data(size_t size) {
    std::vector<uint8_t> data;
    while (data.size() < size) {
        append(data, recv_bytes(size - data.size()));
    }
    return data;
}

// ---------------------------------------------------------------------------
// Command exchange
// ---------------------------------------------------------------------------

bool ZkSocketDriver::send_command(uint16_t command, const std::vector<uint8_t>& payload,
                                  size_t response_size) {
    if (!connected_ && command != CMD_CONNECT && command != CMD_AUTH) {
        throw ConnectionError("device " + config_.ip + " is not connected");
    }

    reply_id_ = next_reply_id(reply_id_);
    std::vector<uint8_t> packet = create_header(command, payload, session_id_, reply_id_);

    std::vector<uint8_t> data_recv;
    if (tcp_) {
        send_bytes(create_tcp_top(packet));
        std::vector<uint8_t> tcp_data = recv_bytes(response_size + TCP_TOP_SIZE);
        tcp_length_ = test_tcp_top(tcp_data);
        if (tcp_length_ == 0) {
            throw TransportError("TCP packet invalid");
        }
        data_recv = slice(tcp_data, TCP_TOP_SIZE);
    } else {
        send_bytes(packet);
        data_recv = recv_bytes(response_size);
    }

    auto header = parse_header(data_recv.data(), data_recv.size());
    if (!header) {
        throw TransportError("reply shorter than a packet header");
    }

    response_ = header->command;
    session_id_ = (command == CMD_CONNECT) ? header->session_id : session_id_;
    reply_id_ = header->reply_id;
    data_ = slice(data_recv, HEADER_SIZE);

    return response_ == CMD_ACK_OK || response_ == CMD_PREPARE_DATA || response_ == CMD_DATA;
}

void ZkSocketDriver::connect() {
    open_socket();

    session_id_ = 0;
    reply_id_ = USHRT_MAX_VALUE - 1;

    bool ok = false;
    try {
        ok = send_command(CMD_CONNECT);
        if (response_ == CMD_ACK_UNAUTH) {
            ok = send_command(CMD_AUTH, make_comm_key(static_cast<uint32_t>(config_.password), session_id_));
        }
    } catch (const TransportError& e) {
        close_socket();
        throw ConnectionError(std::string("handshake failed: ") + e.what());
    }

    if (!ok) {
        uint16_t code = response_;
        close_socket();
        if (code == CMD_ACK_UNAUTH) {
            throw ConnectionError("unauthenticated: wrong device password");
        }
        throw ConnectionError("invalid response to connect: " + std::to_string(code));
    }

    user_packet_size_ = tcp_ ? 72 : 28;
    connected_ = true;
}

void ZkSocketDriver::disconnect() {
    if (fd_ < 0) {
        connected_ = false;
        return;
    }

    try {
        if (connected_) {
            send_command(CMD_EXIT);
        }
    } catch (const std::exception& e) {
        std::cerr << "⚠️ " << utils::device_tag(config_.id) << " CMD_EXIT failed: " << e.what() << std::endl;
    }
    close_socket();
}

bool ZkSocketDriver::ping() {
    struct in_addr probe;
    if (inet_pton(AF_INET, config_.ip.c_str(), &probe) != 1) {
        return false;
    }
    std::string cmd = "ping -c 1 -W 5 " + config_.ip + " > /dev/null 2>&1";
    return std::system(cmd.c_str()) == 0;
}

void ZkSocketDriver::enable_device() {
    if (!send_command(CMD_ENABLEDEVICE)) {
        throw DriverError("Can't enable device");
    }
}

void ZkSocketDriver::disable_device() {
    if (!send_command(CMD_DISABLEDEVICE)) {
        throw DriverError("Can't disable device");
    }
}

bool ZkSocketDriver::cancel_capture() {
    return send_command(CMD_CANCELCAPTURE);
}

void ZkSocketDriver::verify_user() {
    if (!send_command(CMD_STARTVERIFY)) {
        throw DriverError("Can't start verify mode");
    }
}

void ZkSocketDriver::reg_event(uint32_t flags) {
    std::vector<uint8_t> payload;
    put_u32(payload, flags);
    if (!send_command(CMD_REG_EVENT, payload)) {
        throw DriverError("Can't register events (flags " + std::to_string(flags) + ")");
    }
}

void ZkSocketDriver::ack_ok() {
    std::vector<uint8_t> packet = create_header(CMD_ACK_OK, {}, session_id_, USHRT_MAX_VALUE - 1);
    send_bytes(tcp_ ? create_tcp_top(packet) : packet);
}

void ZkSocketDriver::free_data() {
    if (!send_command(CMD_FREE_DATA)) {
        throw DriverError("Can't free data");
    }
}

void ZkSocketDriver::refresh_data() {
    if (!send_command(CMD_REFRESHDATA)) {
        throw DriverError("Can't refresh data");
    }
}

// ---------------------------------------------------------------------------
// Buffered transfers
// ---------------------------------------------------------------------------

std::optional<ZkSocketDriver::TcpChunk> ZkSocketDriver::receive_tcp_data(
    const std::vector<uint8_t>& data_recv, size_t size) {
    uint32_t tcp_length = test_tcp_top(data_recv);
    if (tcp_length <= HEADER_SIZE) {
        std::cerr << "⚠️ " << utils::device_tag(config_.id) << " incorrect tcp packet" << std::endl;
        return std::nullopt;
    }

    if (tcp_length - HEADER_SIZE < size) {
        // The device split the data over several packets
        auto first = receive_tcp_data(data_recv, tcp_length - HEADER_SIZE);
        if (!first) return std::nullopt;
        size -= first->data.size();

        std::vector<uint8_t> next = first->broken_header;
        append(next, recv_bytes(size + 16));
        auto second = receive_tcp_data(next, size);
        if (!second) return std::nullopt;

        TcpChunk chunk;
        chunk.data = std::move(first->data);
        append(chunk.data, second->data);
        chunk.broken_header = std::move(second->broken_header);
        return chunk;
    }

    size_t received = data_recv.size();
    if (received < TCP_TOP_SIZE + HEADER_SIZE) {
        return std::nullopt;
    }
    uint16_t response = read_u16(data_recv.data() + TCP_TOP_SIZE);

    if (received >= size + 32) {
        if (response != CMD_DATA) {
            std::cerr << "⚠️ " << utils::device_tag(config_.id) << " unexpected reply " << response << std::endl;
            return std::nullopt;
        }
        TcpChunk chunk;
        chunk.data = slice(data_recv, 16, size + 16);
        chunk.broken_header = slice(data_recv, size + 16);
        return chunk;
    }

    TcpChunk chunk;
    chunk.data = slice(data_recv, 16, size + 16);
    long remaining = static_cast<long>(size) - static_cast<long>(received - 16);
    if (remaining < 0) {
        chunk.broken_header = slice(data_recv, received - static_cast<size_t>(-remaining));
    } else if (remaining > 0) {
        append(chunk.data, receive_raw_data(static_cast<size_t>(remaining)));
    }
    return chunk;
}

std::optional<std::vector<uint8_t>> ZkSocketDriver::receive_chunk() {
    if (response_ == CMD_DATA) {
        if (tcp_ && tcp_length_ > HEADER_SIZE && data_.size() < tcp_length_ - HEADER_SIZE) {
            std::vector<uint8_t> data = data_;
            append(data, receive_raw_data(tcp_length_ - HEADER_SIZE - data_.size()));
            return data;
        }
        return data_;
    }

    if (response_ != CMD_PREPARE_DATA) {
        return std::nullopt;
    }
    if (data_.size() < 4) {
        throw DecodeError("PREPARE_DATA reply without a size");
    }
    size_t size = read_u32(data_.data());

    if (tcp_) {
        std::vector<uint8_t> data_recv = slice(data_, 8);
        if (data_.size() < 8 + size) {
            append(data_recv, recv_bytes(size + 32));
        }

        auto chunk = receive_tcp_data(data_recv, size);
        if (!chunk) return std::nullopt;

        // Trailing ACK_OK
        std::vector<uint8_t> ack = chunk->broken_header;
        if (ack.size() < 16) {
            append(ack, recv_bytes(16));
        }
        if (ack.size() < 16) {
            append(ack, receive_raw_data(16 - ack.size()));
        }
        if (!test_tcp_top(ack)) {
            return std::nullopt;
        }
        if (read_u16(ack.data() + TCP_TOP_SIZE) != CMD_ACK_OK) {
            return std::nullopt;
        }
        return chunk->data;
    }

    std::vector<uint8_t> data;
    while (true) {
        std::vector<uint8_t> packet = recv_bytes(1024 + HEADER_SIZE);
        auto header = parse_header(packet.data(), packet.size());
        if (header && header->command == CMD_DATA) {
            append(data, slice(packet, HEADER_SIZE));
            continue;
        }
        break;  // ACK_OK ends the transfer
    }
    return data;
}

std::vector<uint8_t> ZkSocketDriver::read_chunk(uint32_t start, uint32_t size) {
    for (int retries = 0; retries < 3; ++retries) {
        std::vector<uint8_t> payload;
        put_u32(payload, start);
        put_u32(payload, size);
        size_t response_size = tcp_ ? size + 32 : 1024 + HEADER_SIZE;

        send_command(CMD_READ_BUFFER, payload, response_size);
        auto data = receive_chunk();
        if (data) {
            return *data;
        }
    }
    throw DriverError("can't read chunk " + std::to_string(start) + ":[" + std::to_string(size) + "]");
}

std::vector<uint8_t> ZkSocketDriver::read_with_buffer(uint16_t command, int fct, int ext) {
    const uint32_t max_chunk = tcp_ ? 0xFFc0 : 16 * 1024;

    std::vector<uint8_t> payload;
    payload.push_back(1);
    put_u16(payload, command);
    put_u32(payload, static_cast<uint32_t>(fct));
    put_u32(payload, static_cast<uint32_t>(ext));

    if (!send_command(CMD_PREPARE_BUFFER, payload, 1024)) {
        throw DriverError("buffered read not supported");
    }

    if (response_ == CMD_DATA) {
        // Small tables come back inline
        if (tcp_ && tcp_length_ > HEADER_SIZE && data_.size() < tcp_length_ - HEADER_SIZE) {
            std::vector<uint8_t> data = data_;
            append(data, receive_raw_data(tcp_length_ - HEADER_SIZE - data_.size()));
            return data;
        }
        return data_;
    }

    if (data_.size() < 5) {
        throw DecodeError("buffer reply without a size");
    }
    uint32_t size = read_u32(data_.data() + 1);
    uint32_t remain = size % max_chunk;
    uint32_t packets = (size - remain) / max_chunk;

    std::vector<uint8_t> data;
    data.reserve(size);
    uint32_t start = 0;
    for (uint32_t i = 0; i < packets; ++i) {
        append(data, read_chunk(start, max_chunk));
        start += max_chunk;
    }
    if (remain) {
        append(data, read_chunk(start, remain));
    }
    free_data();
    return data;
}

void ZkSocketDriver::send_with_buffer(const std::vector<uint8_t>& buffer) {
    const size_t max_chunk = 1024;

    free_data();
    std::vector<uint8_t> payload;
    put_u32(payload, static_cast<uint32_t>(buffer.size()));
    if (!send_command(CMD_PREPARE_DATA, payload)) {
        throw DriverError("Can't prepare data");
    }

    for (size_t start = 0; start < buffer.size(); start += max_chunk) {
        std::vector<uint8_t> chunk = slice(buffer, start, start + max_chunk);
        if (!send_command(CMD_DATA, chunk)) {
            throw DriverError("Can't send chunk at " + std::to_string(start));
        }
    }
}

// ---------------------------------------------------------------------------
// Users
// ---------------------------------------------------------------------------

DeviceCapacity ZkSocketDriver::read_sizes() {
    if (!send_command(CMD_GET_FREE_SIZES, {}, 1024)) {
        throw DriverError("Can't read sizes");
    }

    DeviceCapacity sizes;
    if (data_.size() >= 80) {
        int32_t fields[20];
        for (int i = 0; i < 20; ++i) {
            fields[i] = read_i32(data_.data() + i * 4);
        }
        sizes.users = fields[4];
        sizes.fingers = fields[6];
        sizes.records = fields[8];
        sizes.fingers_capacity = fields[14];
        sizes.users_capacity = fields[15];
        sizes.records_capacity = fields[16];
    }
    return sizes;
}

std::vector<DeviceUser> ZkSocketDriver::get_users() {
    DeviceCapacity sizes = read_sizes();
    if (sizes.users <= 0) {
        return {};
    }

    std::vector<uint8_t> userdata = read_with_buffer(CMD_USERTEMP_RRQ, FCT_USER);
    if (userdata.size() <= 4) {
        return {};
    }

    uint32_t total_size = read_u32(userdata.data());
    int packet_size = static_cast<int>(total_size / static_cast<uint32_t>(sizes.users));
    if (packet_size == 28 || packet_size == 72) {
        user_packet_size_ = packet_size;
    } else {
        std::cerr << "⚠️ " << utils::device_tag(config_.id) << " odd user packet size "
                  << packet_size << ", assuming " << user_packet_size_ << std::endl;
    }

    std::vector<DeviceUser> users;
    size_t offset = 4;
    const size_t record = static_cast<size_t>(user_packet_size_);
    while (offset + record <= userdata.size()) {
        const uint8_t* p = userdata.data() + offset;
        DeviceUser user;
        user.uid = read_u16(p);
        user.privilege = p[2];
        if (record == 28) {
            user.password = decode_text(p + 3, 5);
            user.name = trim(decode_text(p + 8, 8));
            user.card = read_u32(p + 16);
            user.group_id = std::to_string(p[21]);
            user.user_id = std::to_string(read_u32(p + 24));
        } else {
            user.password = decode_text(p + 3, 8);
            user.name = trim(decode_text(p + 11, 24));
            user.card = read_u32(p + 35);
            user.group_id = trim(decode_text(p + 40, 7));
            user.user_id = decode_text(p + 48, 24);
        }
        if (user.name.empty()) {
            user.name = "NN-" + user.user_id;
        }
        users.push_back(user);
        offset += record;
    }
    return users;
}

std::vector<uint8_t> ZkSocketDriver::pack_user(const DeviceUser& user, bool with_tag) const {
    int privilege = (user.privilege == USER_DEFAULT || user.privilege == USER_ADMIN)
                        ? user.privilege : USER_DEFAULT;

    std::vector<uint8_t> out;
    if (with_tag) {
        out.push_back(2);
    }
    put_u16(out, static_cast<uint16_t>(user.uid));
    out.push_back(static_cast<uint8_t>(privilege));

    if (user_packet_size_ == 28) {
        uint32_t group = 0;
        if (!user.group_id.empty()) {
            group = numeric_field("group_id", user.group_id);
        }
        put_fixed_string(out, user.password, 5);
        put_fixed_string(out, user.name, 8);
        put_u32(out, user.card);
        out.push_back(0);
        out.push_back(static_cast<uint8_t>(group));
        put_u16(out, 0);  // timezone
        put_u32(out, numeric_field("user_id", user.user_id));
    } else {
        put_fixed_string(out, user.password, 8);
        put_fixed_string(out, user.name, 24);
        put_u32(out, user.card);
        out.push_back(with_tag ? 1 : 0);
        put_fixed_string(out, user.group_id, 7);
        out.push_back(0);
        put_fixed_string(out, user.user_id, 24);
    }
    return out;
}

void ZkSocketDriver::set_user(const DeviceUser& user) {
    if (!send_command(CMD_USER_WRQ, pack_user(user, false), 1024)) {
        throw DriverError("Can't set user " + user.user_id);
    }
    refresh_data();
}

int ZkSocketDriver::find_uid(const std::string& user_id) {
    for (const auto& user : get_users()) {
        if (user.user_id == user_id) {
            return user.uid;
        }
    }
    throw DriverError("No user with user_id " + user_id);
}

void ZkSocketDriver::delete_user(int uid, const std::string& user_id) {
    if (uid == 0 && !user_id.empty()) {
        uid = find_uid(user_id);
    }

    std::vector<uint8_t> payload;
    put_u16(payload, static_cast<uint16_t>(uid));
    if (!send_command(CMD_DELETE_USER, payload)) {
        throw DriverError("Can't delete user " + std::to_string(uid));
    }
    refresh_data();
}

// ---------------------------------------------------------------------------
// Fingerprints
// ---------------------------------------------------------------------------

void ZkSocketDriver::enroll_user(int uid, int finger_index, const std::string& user_id) {
    std::vector<uint8_t> payload;
    if (tcp_) {
        put_fixed_string(payload, user_id, 24);
        payload.push_back(static_cast<uint8_t>(finger_index));
        payload.push_back(1);
    } else {
        put_u32(payload, numeric_field("user_id", user_id));
        payload.push_back(static_cast<uint8_t>(finger_index));
    }

    cancel_capture();
    // The terminal now guides the user through the finger presses
    if (!send_command(CMD_STARTENROLL, payload)) {
        throw DriverError("Can't enroll user #" + std::to_string(uid) + " [" + std::to_string(finger_index) + "]");
    }
}

void ZkSocketDriver::delete_user_template(int uid, int finger_index, const std::string& user_id) {
    if (tcp_ && !user_id.empty()) {
        std::vector<uint8_t> payload;
        put_fixed_string(payload, user_id, 24);
        payload.push_back(static_cast<uint8_t>(finger_index));
        if (!send_command(CMD_DELETE_USERTEMP_EX, payload)) {
            throw DriverError("Can't delete template " + std::to_string(finger_index) + " of user " + user_id);
        }
        return;
    }

    if (uid == 0) {
        uid = find_uid(user_id);
    }
    std::vector<uint8_t> payload;
    put_u16(payload, static_cast<uint16_t>(uid));
    payload.push_back(static_cast<uint8_t>(finger_index));
    if (!send_command(CMD_DELETE_USERTEMP, payload)) {
        throw DriverError("Can't delete template " + std::to_string(finger_index) + " of uid " + std::to_string(uid));
    }
    refresh_data();
}

std::optional<FingerTemplate> ZkSocketDriver::get_user_template(int uid, int finger_index) {
    for (int retries = 0; retries < 3; ++retries) {
        std::vector<uint8_t> payload;
        put_u16(payload, static_cast<uint16_t>(uid));
        payload.push_back(static_cast<uint8_t>(finger_index));

        send_command(CMD_GET_USERTEMP, payload, 1024 + HEADER_SIZE);
        auto data = receive_chunk();
        if (!data) {
            continue;
        }
        if (data->empty()) {
            return std::nullopt;
        }

        // Trailing checksum byte, sometimes followed by six bytes of padding
        std::vector<uint8_t> resp = slice(*data, 0, data->size() - 1);
        if (resp.size() >= 6 && std::all_of(resp.end() - 6, resp.end(), [](uint8_t b) { return b == 0; })) {
            resp.resize(resp.size() - 6);
        }

        FingerTemplate finger;
        finger.uid = uid;
        finger.finger_index = finger_index;
        finger.valid = true;
        finger.data = std::move(resp);
        return finger;
    }
    std::cerr << "⚠️ " << utils::device_tag(config_.id) << " can't read template " << uid
              << ":" << finger_index << std::endl;
    return std::nullopt;
}

std::vector<FingerTemplate> ZkSocketDriver::get_templates() {
    std::vector<uint8_t> data = read_with_buffer(CMD_DB_RRQ, FCT_FINGERTMP);
    if (data.size() < 4) {
        return {};
    }

    std::vector<FingerTemplate> templates;
    int32_t total_size = read_i32(data.data());
    size_t offset = 4;
    while (total_size > 0 && offset + 6 <= data.size()) {
        const uint8_t* p = data.data() + offset;
        uint16_t size = read_u16(p);
        if (size < 6 || offset + size > data.size()) {
            std::cerr << "⚠️ " << utils::device_tag(config_.id) << " truncated template table" << std::endl;
            break;
        }

        FingerTemplate finger;
        finger.uid = read_u16(p + 2);
        finger.finger_index = static_cast<int8_t>(p[4]);
        finger.valid = static_cast<int8_t>(p[5]) != 0;
        finger.data.assign(p + 6, p + size);
        templates.push_back(std::move(finger));

        offset += size;
        total_size -= size;
    }
    return templates;
}

void ZkSocketDriver::save_user_template(const DeviceUser& user, const FingerTemplate& finger) {
    std::vector<uint8_t> upack = pack_user(user, true);

    std::vector<uint8_t> fpack;
    put_u16(fpack, static_cast<uint16_t>(finger.data.size()));
    append(fpack, finger.data);

    std::vector<uint8_t> table;
    table.push_back(2);
    put_u16(table, static_cast<uint16_t>(user.uid));
    table.push_back(static_cast<uint8_t>(0x10 + finger.finger_index));
    put_u32(table, 0);  // offset of this template in fpack

    std::vector<uint8_t> packet;
    put_u32(packet, static_cast<uint32_t>(upack.size()));
    put_u32(packet, static_cast<uint32_t>(table.size()));
    put_u32(packet, static_cast<uint32_t>(fpack.size()));
    append(packet, upack);
    append(packet, table);
    append(packet, fpack);

    send_with_buffer(packet);

    std::vector<uint8_t> payload;
    put_u32(payload, 12);
    put_u16(payload, 0);
    put_u16(payload, 8);
    if (!send_command(CMD_SAVE_USERTEMPS, payload)) {
        throw DriverError("Can't save template for user " + user.user_id);
    }
    refresh_data();
}

// ---------------------------------------------------------------------------
// Attendance log
// ---------------------------------------------------------------------------

std::vector<AttendanceRecord> ZkSocketDriver::get_attendance() {
    DeviceCapacity sizes = read_sizes();
    if (sizes.records <= 0) {
        return {};
    }

    std::vector<DeviceUser> users = get_users();
    std::vector<uint8_t> data = read_with_buffer(CMD_ATTLOG_RRQ);
    if (data.size() < 4) {
        return {};
    }

    uint32_t total_size = read_u32(data.data());
    uint32_t record_size = total_size / static_cast<uint32_t>(sizes.records);

    std::vector<AttendanceRecord> records;
    size_t offset = 4;
    if (record_size == 8) {
        while (offset + 8 <= data.size()) {
            const uint8_t* p = data.data() + offset;
            AttendanceRecord record;
            record.uid = read_u16(p);
            record.status = p[2];
            record.timestamp = decode_time(read_u32(p + 3));
            record.punch = p[7];
            record.user_id = std::to_string(record.uid);
            for (const auto& user : users) {
                if (user.uid == record.uid) {
                    record.user_id = user.user_id;
                    break;
                }
            }
            records.push_back(record);
            offset += 8;
        }
    } else if (record_size == 16) {
        while (offset + 16 <= data.size()) {
            const uint8_t* p = data.data() + offset;
            AttendanceRecord record;
            record.user_id = std::to_string(read_u32(p));
            record.timestamp = decode_time(read_u32(p + 4));
            record.status = p[8];
            record.punch = p[9];
            record.uid = static_cast<int>(read_u32(p));
            for (const auto& user : users) {
                if (user.user_id == record.user_id) {
                    record.uid = user.uid;
                    break;
                }
            }
            records.push_back(record);
            offset += 16;
        }
    } else {
        while (offset + 40 <= data.size()) {
            const uint8_t* p = data.data() + offset;
            AttendanceRecord record;
            record.uid = read_u16(p);
            record.user_id = decode_text(p + 2, 24);
            record.status = p[26];
            record.timestamp = decode_time(read_u32(p + 27));
            record.punch = p[31];
            records.push_back(record);
            offset += 40;
        }
    }
    return records;
}

// ---------------------------------------------------------------------------
// Metadata
// ---------------------------------------------------------------------------

std::string ZkSocketDriver::read_option(const std::string& key) {
    std::vector<uint8_t> payload(key.begin(), key.end());
    payload.push_back(0);

    if (!send_command(CMD_OPTIONS_RRQ, payload, 1024)) {
        std::cerr << "⚠️ " << utils::device_tag(config_.id) << " option " << key << " not available" << std::endl;
        return "";
    }

    std::string text = decode_text(data_.data(), data_.size());
    size_t eq = text.find('=');
    return eq == std::string::npos ? text : text.substr(eq + 1);
}

std::string ZkSocketDriver::get_device_name() {
    return read_option("~DeviceName");
}

std::string ZkSocketDriver::get_platform() {
    return read_option("~Platform");
}

std::string ZkSocketDriver::get_serial_number() {
    return read_option("~SerialNumber");
}

std::string ZkSocketDriver::get_firmware_version() {
    if (!send_command(CMD_GET_VERSION, {}, 1024)) {
        throw DriverError("Can't read firmware version");
    }
    return decode_text(data_.data(), data_.size());
}

std::time_t ZkSocketDriver::get_time() {
    if (!send_command(CMD_GET_TIME, {}, 1032) || data_.size() < 4) {
        throw DriverError("Can't read device time");
    }
    return decode_time(read_u32(data_.data()));
}

// ---------------------------------------------------------------------------
// RawTransport
// ---------------------------------------------------------------------------

std::optional<std::vector<uint8_t>> ZkSocketDriver::read(size_t max_bytes) {
    int fd = fd_;
    if (fd < 0) {
        throw TransportError("socket is closed");
    }

    std::vector<uint8_t> buffer(max_bytes);
    ssize_t n = recv(fd, buffer.data(), max_bytes, 0);
    if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            return std::nullopt;
        }
        throw TransportError(std::string("recv failed: ") + std::strerror(errno));
    }
    if (n == 0 && tcp_) {
        throw TransportError("connection closed by device");
    }
    buffer.resize(static_cast<size_t>(n));
    return buffer;
}

void ZkSocketDriver::write(const std::vector<uint8_t>& data) {
    send_bytes(data);
}

void ZkSocketDriver::set_timeout(std::optional<std::chrono::milliseconds> timeout) {
    apply_timeout(timeout);
}

void ZkSocketDriver::interrupt() {
    int fd = fd_;
    if (fd >= 0) {
        shutdown(fd, SHUT_RDWR);
    }
}

std::unique_ptr<DeviceDriver> make_socket_driver(const DeviceConfig& config) {
    return std::make_unique<ZkSocketDriver>(config);
}

} // namespace zkfleet
