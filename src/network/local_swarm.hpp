#pragma once

#include "network/swarm.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <map>
#include <set>
#include <thread>

namespace polygraph::network {

class LocalSwarm;
class LocalDuplex;

/**
 * LocalSwarmHub - In-process rendezvous for LocalSwarm instances.
 *
 * Every delivery (new connection, message, close) runs on one dispatcher
 * thread in FIFO order, which makes swarms in one process behave like
 * remote peers without sockets.
 */
class LocalSwarmHub : public std::enable_shared_from_this<LocalSwarmHub> {
public:
    LocalSwarmHub();
    ~LocalSwarmHub();

    POLYGRAPH_DISALLOW_COPY_AND_MOVE(LocalSwarmHub);

    std::shared_ptr<LocalSwarm> create_swarm();

    size_t swarm_count() const;

    // Queue work for the dispatcher thread
    void post(std::function<void()> task);

private:
    friend class LocalSwarm;
    friend class LocalDuplex;

    struct Member {
        std::weak_ptr<LocalSwarm> swarm;
        std::map<DiscoveryKey, JoinOptions> topics;
    };

    void register_topic(const std::string& swarm_id, const DiscoveryKey& topic, const JoinOptions& options);
    void unregister_topic(const std::string& swarm_id, const DiscoveryKey& topic);
    void remove_swarm(const std::string& swarm_id);
    void unlink(const std::string& a, const std::string& b);
    void run();

    mutable std::mutex mutex_;
    std::map<std::string, Member> members_;
    std::set<std::pair<std::string, std::string>> links_;
    uint64_t next_swarm_ = 1;

    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<std::function<void()>> queue_;
    bool stopping_ = false;
    std::thread dispatcher_;
};

/**
 * LocalDuplex - One end of an in-process connection
 */
class LocalDuplex : public Duplex, public std::enable_shared_from_this<LocalDuplex> {
public:
    LocalDuplex(std::weak_ptr<LocalSwarmHub> hub, std::string local_id,
                std::string remote_id, bool initiator);

    static std::pair<std::shared_ptr<LocalDuplex>, std::shared_ptr<LocalDuplex>>
    create_pair(const std::shared_ptr<LocalSwarmHub>& hub,
                const std::string& initiator_id, const std::string& responder_id);

    bool send(const bytes& message) override;
    void close() override;
    bool is_open() const override { return open_; }
    std::string remote_id() const override { return remote_id_; }
    bool is_initiator() const override { return initiator_; }

    const std::string& local_id() const { return local_id_; }

private:
    void deliver(const bytes& message);
    void close_from_peer();

    std::weak_ptr<LocalSwarmHub> hub_;
    std::weak_ptr<LocalDuplex> peer_;
    std::string local_id_;
    std::string remote_id_;
    bool initiator_;
    std::atomic<bool> open_{true};
};

/**
 * LocalSwarm - Swarm whose peers live in the same process
 */
class LocalSwarm : public Swarm, public std::enable_shared_from_this<LocalSwarm> {
public:
    LocalSwarm(std::shared_ptr<LocalSwarmHub> hub, std::string id);
    ~LocalSwarm() override;

    void set_connection_callback(ConnectionCallback callback) override;
    Result<void> join(const DiscoveryKey& topic, const JoinOptions& options) override;
    void leave(const DiscoveryKey& topic) override;
    Result<void> flush(std::chrono::milliseconds timeout) override;
    void destroy() override;
    size_t connection_count() const override;
    std::vector<DiscoveryKey> topics() const override;
    std::string id() const override { return id_; }

private:
    friend class LocalSwarmHub;

    // Runs on the dispatcher thread
    void accept(const std::shared_ptr<LocalDuplex>& duplex);

    std::shared_ptr<LocalSwarmHub> hub_;
    std::string id_;

    mutable std::mutex mutex_;
    ConnectionCallback callback_;
    std::map<DiscoveryKey, JoinOptions> topics_;
    std::vector<std::shared_ptr<LocalDuplex>> connections_;
    bool destroyed_ = false;
};

} // namespace polygraph::network
