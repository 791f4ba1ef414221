#pragma once

#include "network/swarm.hpp"
#include <atomic>
#include <condition_variable>
#include <map>
#include <optional>
#include <set>
#include <thread>

namespace polygraph::network {

/**
 * SocketAddress - host:port pair ("127.0.0.1:7878", "[::1]:7878")
 */
struct SocketAddress {
    std::string host;
    uint16_t port = 0;

    SocketAddress() = default;
    SocketAddress(std::string h, uint16_t p) : host(std::move(h)), port(p) {}

    std::string to_string() const;
    static std::optional<SocketAddress> from_string(const std::string& addr);

    bool is_ipv6() const { return host.find(':') != std::string::npos; }

    bool operator==(const SocketAddress& other) const {
        return host == other.host && port == other.port;
    }
};

struct TcpSwarmConfig {
    std::string listen_host = "0.0.0.0";
    uint16_t listen_port = constants::DEFAULT_PORT;  // 0 picks an ephemeral port
    std::vector<SocketAddress> bootstrap;            // Peers dialed for client topics
    std::chrono::milliseconds connect_timeout{3000};
};

class TcpDuplex;

/**
 * TcpSwarm - Swarm over plain TCP.
 *
 * Discovery is a static bootstrap list: joining a topic as client dials
 * every bootstrap peer not already connected. Each side opens with a HELLO
 * frame carrying its swarm id and topics; the connection is kept only when
 * a client topic of one side is a server topic of the other. All frames are
 * [u32 length LE][payload]. At most one connection is kept per remote swarm.
 */
class TcpSwarm : public Swarm {
public:
    explicit TcpSwarm(TcpSwarmConfig config);
    ~TcpSwarm() override;

    POLYGRAPH_DISALLOW_COPY_AND_MOVE(TcpSwarm);

    void set_connection_callback(ConnectionCallback callback) override;
    Result<void> join(const DiscoveryKey& topic, const JoinOptions& options) override;
    void leave(const DiscoveryKey& topic) override;
    Result<void> flush(std::chrono::milliseconds timeout) override;
    void destroy() override;
    size_t connection_count() const override;
    std::vector<DiscoveryKey> topics() const override;
    std::string id() const override { return id_; }

    // Port the listener is bound to, 0 while not serving
    uint16_t listen_port() const { return bound_port_; }

    void add_bootstrap(const SocketAddress& address);

private:
    struct Hello {
        std::string swarm_id;
        std::map<DiscoveryKey, JoinOptions> topics;
    };

    Result<void> start_listening();
    void accept_loop();
    void dial(const SocketAddress& address);
    void run_connection(int fd, bool initiator, const std::string& address, bool counted);
    bool register_connection(const std::shared_ptr<TcpDuplex>& duplex);
    void unregister_connection(const std::shared_ptr<TcpDuplex>& duplex, const std::string& address);
    bool spawn(std::function<void()> body);

    bytes encode_hello() const;
    static std::optional<Hello> decode_hello(const bytes& frame);
    bool wants(const Hello& hello) const;

    TcpSwarmConfig config_;
    std::string id_;

    mutable std::mutex mutex_;
    std::condition_variable pending_cv_;
    ConnectionCallback callback_;
    std::map<DiscoveryKey, JoinOptions> topics_;
    std::map<std::string, std::shared_ptr<TcpDuplex>> connections_;  // By remote swarm id
    std::set<std::string> busy_addresses_;  // Dialing or connected
    std::set<int> handshaking_;
    size_t pending_dials_ = 0;
    bool destroyed_ = false;

    int listen_fd_ = -1;
    std::atomic<uint16_t> bound_port_{0};
    std::atomic<bool> running_{true};

    std::mutex threads_mutex_;
    std::vector<std::thread> threads_;
};

} // namespace polygraph::network
