#pragma once

#include "polygraph/common.hpp"
#include "network/swarm.hpp"
#include "network/replication_stream.hpp"
#include "storage/append_log.hpp"
#include "storage/log_kv_store.hpp"
#include "utils/config.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace polygraph::network {

class LocalSwarmHub;

enum class ReplicationState {
    DISCONNECTED,
    JOINING,
    JOINED
};

const char* replication_state_to_string(ReplicationState state);

struct ReplicatorConfig {
    std::string transport = "tcp";  // "tcp" or "local"
    std::string listen_host = "0.0.0.0";
    uint16_t listen_port = constants::DEFAULT_PORT;
    std::vector<std::string> bootstrap;  // "host:port"
    std::chrono::milliseconds join_timeout{constants::DEFAULT_JOIN_TIMEOUT_MS};
    std::chrono::milliseconds sync_timeout{constants::DEFAULT_SYNC_TIMEOUT_MS};
    bool sparse = true;  // Replicas opened by sync_with_peer fetch on demand

    /**
     * Read the `network.*` and `sparse` keys
     * @throws PolygraphException(InvalidArgument) for out-of-range values
     */
    static ReplicatorConfig from_config(const utils::Config& config);
};

// One peer log this replicator has synced with
struct PeerSync {
    std::string remote_key;
    uint64_t synced_at_ms = 0;
};

struct SwarmStatus {
    ReplicationState state = ReplicationState::DISCONNECTED;
    size_t connections = 0;
    std::vector<std::string> topics;
    std::vector<PeerSync> synced_peers;
    std::string key;

    nlohmann::json to_json() const;
};

/**
 * Replicator - Joins the swarm and replicates raw logs with peers.
 *
 * Every connection gets a ReplicationStream carrying the local log and every
 * replica opened through sync_with_peer(). The replicator never looks at
 * log contents. State moves Disconnected -> Joining -> Joined and back to
 * Disconnected on leave_network() or a failed join; there is no retry.
 */
class Replicator : public std::enable_shared_from_this<Replicator> {
public:
    using SwarmFactory = std::function<std::shared_ptr<Swarm>()>;

    /**
     * @param local_log   log written by this process
     * @param remotes_dir directory holding one replica directory per peer key
     * @param factory     swarm constructor; defaults to the configured transport
     */
    static std::shared_ptr<Replicator> create(std::shared_ptr<storage::AppendLog> local_log,
                                              std::filesystem::path remotes_dir,
                                              ReplicatorConfig config,
                                              SwarmFactory factory = nullptr);
    ~Replicator();

    POLYGRAPH_DISALLOW_COPY_AND_MOVE(Replicator);

    /**
     * Join the local log's topic as server and client and wait for the
     * swarm to settle. A no-op while already joining or joined.
     * @throws NetworkException on timeout or transport failure; state is
     *         Disconnected again and every resource released
     */
    void join_network();

    // Close streams and destroy the swarm; a no-op when not joined
    void leave_network();

    /**
     * Open (or reuse) a read-only replica of a peer's log and start
     * replicating it. Repeated calls for one key return the same handle.
     * @throws NetworkException(NetworkDisconnected) unless joined
     * @throws PolygraphException(InvalidArgument) for a malformed key
     * @throws NetworkException if joining the peer's topic fails or times out
     */
    std::shared_ptr<storage::LogKVStore> sync_with_peer(const std::string& remote_key_hex);

    ReplicationState state() const;
    SwarmStatus status() const;

    // Hex public key of the local log
    std::string key() const;

    const ReplicatorConfig& config() const { return config_; }

    static SwarmFactory tcp_factory(const ReplicatorConfig& config);
    static SwarmFactory local_factory(std::shared_ptr<LocalSwarmHub> hub);

private:
    Replicator(std::shared_ptr<storage::AppendLog> local_log,
               std::filesystem::path remotes_dir,
               ReplicatorConfig config,
               SwarmFactory factory);

    void on_connection(const std::shared_ptr<Duplex>& duplex);
    void remove_stream(const ReplicationStream* stream);
    void abort_join(const std::shared_ptr<Swarm>& swarm, const Error& error);

    std::shared_ptr<storage::AppendLog> local_log_;
    std::filesystem::path remotes_dir_;
    ReplicatorConfig config_;
    SwarmFactory factory_;

    mutable std::mutex mutex_;
    ReplicationState state_ = ReplicationState::DISCONNECTED;
    std::shared_ptr<Swarm> swarm_;
    std::vector<std::shared_ptr<ReplicationStream>> streams_;
    std::map<std::string, std::shared_ptr<storage::LogKVStore>> replicas_;  // By hex key
    std::map<std::string, PeerSync> peers_;
};

} // namespace polygraph::network
