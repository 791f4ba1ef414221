#include "network/tcp_swarm.hpp"
#include "polygraph/serialization.hpp"
#include "crypto/random.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <cstring>
#include <sstream>

#include <sys/socket.h>
#include <sys/types.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <errno.h>

namespace polygraph::network {

namespace {

constexpr const char* HELLO_PROTOCOL = "polygraph-swarm/1";
constexpr uint8_t TOPIC_SERVER = 0x01;
constexpr uint8_t TOPIC_CLIENT = 0x02;
constexpr int ACCEPT_POLL_MS = 200;

#ifdef MSG_NOSIGNAL
constexpr int SEND_FLAGS = MSG_NOSIGNAL;
#else
constexpr int SEND_FLAGS = 0;
#endif

bool write_all(int fd, const byte* data, size_t len) {
    size_t total_sent = 0;
    while (total_sent < len) {
        ssize_t sent = ::send(fd, data + total_sent, len - total_sent, SEND_FLAGS);
        if (sent < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        total_sent += static_cast<size_t>(sent);
    }
    return true;
}

bool read_exact(int fd, byte* data, size_t len) {
    size_t total_read = 0;
    while (total_read < len) {
        ssize_t received = ::recv(fd, data + total_read, len - total_read, 0);
        if (received == 0) {
            return false;
        }
        if (received < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        total_read += static_cast<size_t>(received);
    }
    return true;
}

bool write_frame(int fd, const bytes& payload) {
    ByteWriter header;
    header.write_u32(static_cast<uint32_t>(payload.size()));
    return write_all(fd, header.data().data(), header.size()) &&
           write_all(fd, payload.data(), payload.size());
}

std::optional<bytes> read_frame(int fd) {
    bytes header(4);
    if (!read_exact(fd, header.data(), header.size())) {
        return std::nullopt;
    }

    ByteReader reader(header);
    uint32_t length = reader.read_u32();
    if (length > constants::MAX_FRAME_SIZE) {
        POLYGRAPH_LOG_WARN("Dropping connection: frame of {} bytes exceeds limit", length);
        return std::nullopt;
    }

    bytes payload(length);
    if (length > 0 && !read_exact(fd, payload.data(), length)) {
        return std::nullopt;
    }
    return payload;
}

void set_receive_timeout(int fd, std::chrono::milliseconds timeout) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
}

bool set_nonblocking(int fd, bool nonblocking) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) return false;

    if (nonblocking) {
        flags |= O_NONBLOCK;
    } else {
        flags &= ~O_NONBLOCK;
    }

    return fcntl(fd, F_SETFL, flags) == 0;
}

std::string describe_peer(const sockaddr_storage& storage, socklen_t len) {
    char host[NI_MAXHOST];
    char service[NI_MAXSERV];
    if (getnameinfo(reinterpret_cast<const sockaddr*>(&storage), len,
                    host, sizeof(host), service, sizeof(service),
                    NI_NUMERICHOST | NI_NUMERICSERV) != 0) {
        return "unknown";
    }
    bool ipv6 = storage.ss_family == AF_INET6;
    return ipv6 ? "[" + std::string(host) + "]:" + service : std::string(host) + ":" + service;
}

uint16_t local_port(int fd) {
    sockaddr_storage storage{};
    socklen_t len = sizeof(storage);
    if (getsockname(fd, reinterpret_cast<sockaddr*>(&storage), &len) != 0) {
        return 0;
    }
    if (storage.ss_family == AF_INET6) {
        return ntohs(reinterpret_cast<const sockaddr_in6*>(&storage)->sin6_port);
    }
    return ntohs(reinterpret_cast<const sockaddr_in*>(&storage)->sin_port);
}

// Non-blocking connect bounded by `timeout`; returns a blocking socket or -1
int connect_with_timeout(const SocketAddress& address, std::chrono::milliseconds timeout) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* result = nullptr;
    std::string port_str = std::to_string(address.port);
    int ret = getaddrinfo(address.host.c_str(), port_str.c_str(), &hints, &result);
    if (ret != 0) {
        POLYGRAPH_LOG_WARN("Failed to resolve address {}: {}", address.to_string(), gai_strerror(ret));
        return -1;
    }

    int fd = -1;
    for (addrinfo* rp = result; rp != nullptr; rp = rp->ai_next) {
        fd = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (fd < 0) continue;

        bool connected = false;
        if (set_nonblocking(fd, true)) {
            ret = ::connect(fd, rp->ai_addr, rp->ai_addrlen);
            if (ret == 0) {
                connected = true;
            } else if (errno == EINPROGRESS) {
                pollfd pfd{fd, POLLOUT, 0};
                if (::poll(&pfd, 1, static_cast<int>(timeout.count())) > 0) {
                    int error = 0;
                    socklen_t len = sizeof(error);
                    connected = getsockopt(fd, SOL_SOCKET, SO_ERROR, &error, &len) == 0 && error == 0;
                }
            }
        }

        if (connected && set_nonblocking(fd, false)) {
            int nodelay = 1;
            setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay));
            break;
        }
        ::close(fd);
        fd = -1;
    }

    freeaddrinfo(result);
    return fd;
}

} // namespace

// SocketAddress implementation

std::string SocketAddress::to_string() const {
    std::ostringstream oss;
    if (is_ipv6()) {
        oss << "[" << host << "]:" << port;
    } else {
        oss << host << ":" << port;
    }
    return oss.str();
}

std::optional<SocketAddress> SocketAddress::from_string(const std::string& addr) {
    std::string host;
    std::string port_str;

    if (!addr.empty() && addr[0] == '[') {
        // [host]:port
        size_t close_bracket = addr.find(']');
        if (close_bracket == std::string::npos ||
            close_bracket + 1 >= addr.length() || addr[close_bracket + 1] != ':') {
            return std::nullopt;
        }
        host = addr.substr(1, close_bracket - 1);
        port_str = addr.substr(close_bracket + 2);
    } else {
        size_t colon = addr.rfind(':');
        if (colon == std::string::npos) {
            return std::nullopt;
        }
        host = addr.substr(0, colon);
        port_str = addr.substr(colon + 1);
    }

    if (host.empty() || port_str.empty() ||
        port_str.find_first_not_of("0123456789") != std::string::npos || port_str.size() > 5) {
        return std::nullopt;
    }
    unsigned long port = std::stoul(port_str);
    if (port > 65535) {
        return std::nullopt;
    }
    return SocketAddress(host, static_cast<uint16_t>(port));
}

// TcpDuplex

/**
 * Connection to one remote swarm. The reader thread owned by TcpSwarm feeds
 * deliver() and calls finish() once the socket is done; close() only shuts
 * the socket down so that thread can wind up.
 */
class TcpDuplex : public Duplex {
public:
    TcpDuplex(int fd, std::string remote_id, bool initiator)
        : fd_(fd), remote_id_(std::move(remote_id)), initiator_(initiator) {}

    ~TcpDuplex() override {
        if (fd_ >= 0) ::close(fd_);
    }

    bool send(const bytes& message) override {
        std::lock_guard<std::mutex> lock(send_mutex_);
        if (!open_ || fd_ < 0) {
            return false;
        }
        if (!write_frame(fd_, message)) {
            POLYGRAPH_LOG_DEBUG("Send to swarm {} failed: {}", remote_id_, strerror(errno));
            open_ = false;
            ::shutdown(fd_, SHUT_RDWR);
            return false;
        }
        return true;
    }

    void close() override {
        if (!open_.exchange(false)) {
            return;
        }
        std::lock_guard<std::mutex> lock(send_mutex_);
        if (fd_ >= 0) {
            ::shutdown(fd_, SHUT_RDWR);
        }
    }

    bool is_open() const override { return open_; }
    std::string remote_id() const override { return remote_id_; }
    bool is_initiator() const override { return initiator_; }

    int fd() const { return fd_; }

    void deliver(const bytes& message) {
        if (open_) on_message(message);
    }

    void finish() {
        open_ = false;
        {
            std::lock_guard<std::mutex> lock(send_mutex_);
            if (fd_ >= 0) {
                ::close(fd_);
                fd_ = -1;
            }
        }
        on_close();
    }

private:
    int fd_;
    std::string remote_id_;
    bool initiator_;
    std::atomic<bool> open_{true};
    std::mutex send_mutex_;
};

// TcpSwarm implementation

TcpSwarm::TcpSwarm(TcpSwarmConfig config)
    : config_(std::move(config))
    , id_(to_hex(crypto::Random::generate_fixed<16>()))
{
}

TcpSwarm::~TcpSwarm() {
    destroy();
}

void TcpSwarm::set_connection_callback(ConnectionCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    callback_ = std::move(callback);
}

void TcpSwarm::add_bootstrap(const SocketAddress& address) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& existing : config_.bootstrap) {
        if (existing == address) return;
    }
    config_.bootstrap.push_back(address);
}

Result<void> TcpSwarm::join(const DiscoveryKey& topic, const JoinOptions& options) {
    std::vector<SocketAddress> bootstrap;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (destroyed_) {
            return Result<void>::Err(ErrorCode::NetworkDisconnected, "Swarm was destroyed");
        }
        topics_[topic] = options;
        bootstrap = config_.bootstrap;
    }

    if (options.server) {
        auto result = start_listening();
        if (result.is_err()) {
            std::lock_guard<std::mutex> lock(mutex_);
            topics_.erase(topic);
            return result;
        }
    }

    if (options.client) {
        for (const auto& address : bootstrap) {
            dial(address);
        }
    }

    POLYGRAPH_LOG_DEBUG("Swarm {} joined topic {} (server={}, client={})",
                        id_, to_hex(topic), options.server, options.client);
    return Result<void>::Ok();
}

void TcpSwarm::leave(const DiscoveryKey& topic) {
    std::lock_guard<std::mutex> lock(mutex_);
    topics_.erase(topic);
}

Result<void> TcpSwarm::flush(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    bool settled = pending_cv_.wait_for(lock, timeout, [this] {
        return pending_dials_ == 0 || destroyed_;
    });
    if (!settled) {
        return Result<void>::Err(ErrorCode::NetworkTimeout,
            std::to_string(pending_dials_) + " connection attempt(s) still pending after " +
            std::to_string(timeout.count()) + " ms");
    }
    if (destroyed_) {
        return Result<void>::Err(ErrorCode::NetworkDisconnected, "Swarm was destroyed");
    }
    return Result<void>::Ok();
}

void TcpSwarm::destroy() {
    std::vector<std::shared_ptr<TcpDuplex>> connections;
    {
        std::lock_guard<std::mutex> threads_lock(threads_mutex_);
        running_ = false;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (destroyed_) {
            return;
        }
        destroyed_ = true;
        topics_.clear();
        callback_ = nullptr;
        for (auto& [remote, duplex] : connections_) {
            connections.push_back(duplex);
        }
        connections_.clear();
        for (int fd : handshaking_) {
            ::shutdown(fd, SHUT_RDWR);
        }
    }
    pending_cv_.notify_all();

    for (auto& duplex : connections) {
        duplex->close();
    }

    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> threads_lock(threads_mutex_);
        threads.swap(threads_);
    }
    for (auto& thread : threads) {
        if (thread.get_id() == std::this_thread::get_id()) {
            thread.detach();
        } else if (thread.joinable()) {
            thread.join();
        }
    }

    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
        bound_port_ = 0;
    }
    POLYGRAPH_LOG_DEBUG("Swarm {} destroyed", id_);
}

size_t TcpSwarm::connection_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& [remote, duplex] : connections_) {
        if (duplex->is_open()) ++count;
    }
    return count;
}

std::vector<DiscoveryKey> TcpSwarm::topics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DiscoveryKey> result;
    for (const auto& [topic, options] : topics_) {
        result.push_back(topic);
    }
    return result;
}

Result<void> TcpSwarm::start_listening() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (listen_fd_ >= 0) {
        return Result<void>::Ok();
    }

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE;

    addrinfo* result = nullptr;
    std::string port_str = std::to_string(config_.listen_port);
    const char* host = config_.listen_host.empty() ? nullptr : config_.listen_host.c_str();
    int ret = getaddrinfo(host, port_str.c_str(), &hints, &result);
    if (ret != 0) {
        return Result<void>::Err(ErrorCode::NetworkConnectionFailed,
            "Cannot resolve listen address " + config_.listen_host + ": " + gai_strerror(ret));
    }

    int fd = -1;
    std::string last_error = "no usable address";
    for (addrinfo* rp = result; rp != nullptr; rp = rp->ai_next) {
        fd = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (fd < 0) {
            last_error = strerror(errno);
            continue;
        }

        int reuse = 1;
        setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

        if (::bind(fd, rp->ai_addr, rp->ai_addrlen) == 0 && ::listen(fd, SOMAXCONN) == 0) {
            break;
        }
        last_error = strerror(errno);
        ::close(fd);
        fd = -1;
    }
    freeaddrinfo(result);

    if (fd < 0) {
        return Result<void>::Err(ErrorCode::NetworkConnectionFailed,
            "Cannot listen on " + config_.listen_host + ":" + port_str + ": " + last_error);
    }

    listen_fd_ = fd;
    bound_port_ = local_port(fd);
    if (!spawn([this] { accept_loop(); })) {
        ::close(listen_fd_);
        listen_fd_ = -1;
        bound_port_ = 0;
        return Result<void>::Err(ErrorCode::NetworkDisconnected, "Swarm is shutting down");
    }

    POLYGRAPH_LOG_INFO("Swarm {} listening on {}:{}", id_, config_.listen_host, bound_port_.load());
    return Result<void>::Ok();
}

void TcpSwarm::accept_loop() {
    while (running_) {
        pollfd pfd{listen_fd_, POLLIN, 0};
        if (::poll(&pfd, 1, ACCEPT_POLL_MS) <= 0) {
            continue;
        }

        sockaddr_storage peer{};
        socklen_t peer_len = sizeof(peer);
        int fd = ::accept(listen_fd_, reinterpret_cast<sockaddr*>(&peer), &peer_len);
        if (fd < 0) {
            continue;
        }
        std::string address = describe_peer(peer, peer_len);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (destroyed_) {
                ::close(fd);
                return;
            }
            handshaking_.insert(fd);
        }

        if (!spawn([this, fd, address] { run_connection(fd, false, address, false); })) {
            std::lock_guard<std::mutex> lock(mutex_);
            handshaking_.erase(fd);
            ::close(fd);
        }
    }
}

void TcpSwarm::dial(const SocketAddress& address) {
    std::string key = address.to_string();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (destroyed_ || busy_addresses_.count(key) > 0) {
            return;
        }
        busy_addresses_.insert(key);
        ++pending_dials_;
    }

    bool started = spawn([this, address, key] {
        int fd = connect_with_timeout(address, config_.connect_timeout);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (fd >= 0 && !destroyed_) {
                handshaking_.insert(fd);
            } else {
                if (fd >= 0) ::close(fd);
                busy_addresses_.erase(key);
                --pending_dials_;
                pending_cv_.notify_all();
                if (fd < 0) {
                    POLYGRAPH_LOG_DEBUG("Could not reach bootstrap peer {}", key);
                }
                return;
            }
        }
        run_connection(fd, true, key, true);
    });

    if (!started) {
        std::lock_guard<std::mutex> lock(mutex_);
        busy_addresses_.erase(key);
        --pending_dials_;
        pending_cv_.notify_all();
    }
}

void TcpSwarm::run_connection(int fd, bool initiator, const std::string& address, bool counted) {
    bool settled = !counted;
    auto settle = [&] {
        if (settled) return;
        settled = true;
        std::lock_guard<std::mutex> lock(mutex_);
        --pending_dials_;
        pending_cv_.notify_all();
    };

    set_receive_timeout(fd, config_.connect_timeout);
    std::optional<Hello> hello;
    if (write_frame(fd, encode_hello())) {
        if (auto frame = read_frame(fd)) {
            hello = decode_hello(*frame);
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        handshaking_.erase(fd);
    }

    const char* reject = nullptr;
    if (!hello) {
        reject = "handshake failed";
    } else if (hello->swarm_id == id_) {
        reject = "connected to self";
    } else if (!wants(*hello)) {
        reject = "no shared topic";
    }
    if (reject != nullptr) {
        POLYGRAPH_LOG_DEBUG("Dropping connection with {}: {}", address, reject);
        ::close(fd);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            busy_addresses_.erase(address);
        }
        settle();
        return;
    }

    set_receive_timeout(fd, std::chrono::milliseconds(0));
    auto duplex = std::make_shared<TcpDuplex>(fd, hello->swarm_id, initiator);
    if (!register_connection(duplex)) {
        POLYGRAPH_LOG_DEBUG("Dropping duplicate connection with swarm {}", hello->swarm_id);
        duplex->finish();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            busy_addresses_.erase(address);
        }
        settle();
        return;
    }

    POLYGRAPH_LOG_INFO("Connected to swarm {} at {} ({})", hello->swarm_id, address,
                       initiator ? "outbound" : "inbound");

    ConnectionCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = callback_;
    }
    if (callback) {
        callback(duplex);
    }
    settle();

    while (auto message = read_frame(duplex->fd())) {
        duplex->deliver(*message);
    }

    unregister_connection(duplex, address);
    duplex->finish();
    POLYGRAPH_LOG_DEBUG("Connection with swarm {} closed", hello->swarm_id);
}

bool TcpSwarm::register_connection(const std::shared_ptr<TcpDuplex>& duplex) {
    std::shared_ptr<TcpDuplex> replaced;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (destroyed_) {
            return false;
        }

        const std::string remote = duplex->remote_id();
        auto it = connections_.find(remote);
        if (it != connections_.end() && it->second->is_open()) {
            // Both sides keep the connection dialed by the smaller swarm id
            const std::string& preferred = std::min(id_, remote);
            auto initiator_of = [&](const std::shared_ptr<TcpDuplex>& d) {
                return d->is_initiator() ? id_ : remote;
            };
            if (initiator_of(it->second) == preferred || initiator_of(duplex) != preferred) {
                return false;
            }
            replaced = it->second;
        }
        connections_[remote] = duplex;
    }

    if (replaced) {
        replaced->close();
    }
    return true;
}

void TcpSwarm::unregister_connection(const std::shared_ptr<TcpDuplex>& duplex, const std::string& address) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(duplex->remote_id());
    if (it != connections_.end() && it->second == duplex) {
        connections_.erase(it);
    }
    busy_addresses_.erase(address);
}

bool TcpSwarm::spawn(std::function<void()> body) {
    std::lock_guard<std::mutex> lock(threads_mutex_);
    if (!running_) {
        return false;
    }
    threads_.emplace_back(std::move(body));
    return true;
}

bytes TcpSwarm::encode_hello() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ByteWriter writer;
    writer.write_string(HELLO_PROTOCOL);
    writer.write_string(id_);
    writer.write_u32(static_cast<uint32_t>(topics_.size()));
    for (const auto& [topic, options] : topics_) {
        writer.write_fixed(topic);
        uint8_t flags = (options.server ? TOPIC_SERVER : 0) | (options.client ? TOPIC_CLIENT : 0);
        writer.write_u8(flags);
    }
    return writer.take();
}

std::optional<TcpSwarm::Hello> TcpSwarm::decode_hello(const bytes& frame) {
    try {
        ByteReader reader(frame);
        if (reader.read_string() != HELLO_PROTOCOL) {
            return std::nullopt;
        }

        Hello hello;
        hello.swarm_id = reader.read_string();
        uint32_t count = reader.read_u32();
        for (uint32_t i = 0; i < count; ++i) {
            DiscoveryKey topic = reader.read_fixed<32>();
            uint8_t flags = reader.read_u8();
            hello.topics[topic] = JoinOptions{(flags & TOPIC_SERVER) != 0, (flags & TOPIC_CLIENT) != 0};
        }
        return hello;
    } catch (const PolygraphException& e) {
        POLYGRAPH_LOG_DEBUG("Malformed HELLO: {}", e.what());
        return std::nullopt;
    }
}

bool TcpSwarm::wants(const Hello& hello) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [topic, theirs] : hello.topics) {
        auto it = topics_.find(topic);
        if (it == topics_.end()) continue;
        const JoinOptions& mine = it->second;
        if ((mine.client && theirs.server) || (mine.server && theirs.client)) {
            return true;
        }
    }
    return false;
}

} // namespace polygraph::network
