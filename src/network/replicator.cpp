#include "network/replicator.hpp"
#include "network/local_swarm.hpp"
#include "network/tcp_swarm.hpp"
#include "crypto/ed25519.hpp"
#include "polygraph/time_utils.hpp"
#include "utils/logger.hpp"
#include <algorithm>

namespace polygraph::network {

const char* replication_state_to_string(ReplicationState state) {
    switch (state) {
        case ReplicationState::DISCONNECTED: return "disconnected";
        case ReplicationState::JOINING: return "joining";
        case ReplicationState::JOINED: return "joined";
    }
    return "unknown";
}

// ReplicatorConfig

ReplicatorConfig ReplicatorConfig::from_config(const utils::Config& config) {
    ReplicatorConfig result;
    result.transport = config.get_or<std::string>("network.transport", result.transport);
    if (result.transport != "tcp" && result.transport != "local") {
        throw PolygraphException(ErrorCode::InvalidArgument,
            "network.transport must be \"tcp\" or \"local\", got \"" + result.transport + "\"");
    }

    result.listen_host = config.get_or<std::string>("network.listen_host", result.listen_host);

    int64_t port = config.get_or<int64_t>("network.listen_port", result.listen_port);
    if (port < 0 || port > 65535) {
        throw PolygraphException(ErrorCode::InvalidArgument,
            "network.listen_port out of range: " + std::to_string(port));
    }
    result.listen_port = static_cast<uint16_t>(port);

    result.bootstrap = config.get_or<std::vector<std::string>>("network.bootstrap", {});

    int64_t join_ms = config.get_or<int64_t>("network.join_timeout_ms", result.join_timeout.count());
    int64_t sync_ms = config.get_or<int64_t>("network.sync_timeout_ms", result.sync_timeout.count());
    if (join_ms <= 0 || sync_ms <= 0) {
        throw PolygraphException(ErrorCode::InvalidArgument, "network timeouts must be positive");
    }
    result.join_timeout = std::chrono::milliseconds(join_ms);
    result.sync_timeout = std::chrono::milliseconds(sync_ms);

    result.sparse = config.get_or<bool>("sparse", result.sparse);
    return result;
}

nlohmann::json SwarmStatus::to_json() const {
    nlohmann::json peers = nlohmann::json::array();
    for (const auto& peer : synced_peers) {
        peers.push_back({
            {"key", peer.remote_key},
            {"synced_at", time::millis_to_string(peer.synced_at_ms)}
        });
    }
    return nlohmann::json{
        {"state", replication_state_to_string(state)},
        {"connections", connections},
        {"topics", topics},
        {"synced_peers", peers},
        {"key", key}
    };
}

// Replicator

Replicator::Replicator(std::shared_ptr<storage::AppendLog> local_log,
                       std::filesystem::path remotes_dir,
                       ReplicatorConfig config,
                       SwarmFactory factory)
    : local_log_(std::move(local_log))
    , remotes_dir_(std::move(remotes_dir))
    , config_(std::move(config))
    , factory_(std::move(factory))
{
    if (!factory_) {
        factory_ = tcp_factory(config_);
    }
}

std::shared_ptr<Replicator> Replicator::create(std::shared_ptr<storage::AppendLog> local_log,
                                               std::filesystem::path remotes_dir,
                                               ReplicatorConfig config,
                                               SwarmFactory factory) {
    if (!local_log) {
        throw PolygraphException(ErrorCode::InvalidArgument, "Replicator requires a local log");
    }
    return std::shared_ptr<Replicator>(new Replicator(
        std::move(local_log), std::move(remotes_dir), std::move(config), std::move(factory)));
}

Replicator::~Replicator() {
    leave_network();
}

Replicator::SwarmFactory Replicator::tcp_factory(const ReplicatorConfig& config) {
    TcpSwarmConfig tcp;
    tcp.listen_host = config.listen_host;
    tcp.listen_port = config.listen_port;
    for (const auto& entry : config.bootstrap) {
        auto address = SocketAddress::from_string(entry);
        if (!address) {
            POLYGRAPH_LOG_WARN("Ignoring malformed bootstrap address '{}'", entry);
            continue;
        }
        tcp.bootstrap.push_back(*address);
    }
    return [tcp] { return std::make_shared<TcpSwarm>(tcp); };
}

Replicator::SwarmFactory Replicator::local_factory(std::shared_ptr<LocalSwarmHub> hub) {
    return [hub] { return hub->create_swarm(); };
}

void Replicator::join_network() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != ReplicationState::DISCONNECTED) {
            POLYGRAPH_LOG_WARN("join_network ignored: already {}", replication_state_to_string(state_));
            return;
        }
        state_ = ReplicationState::JOINING;
    }

    std::shared_ptr<Swarm> swarm;
    try {
        swarm = factory_();
    } catch (const PolygraphException& e) {
        abort_join(nullptr, Error(e.code(), e.what()));
    }
    if (!swarm) {
        abort_join(nullptr, Error(ErrorCode::NetworkConnectionFailed, "Swarm factory returned no swarm"));
    }

    std::weak_ptr<Replicator> weak = weak_from_this();
    swarm->set_connection_callback([weak](std::shared_ptr<Duplex> duplex) {
        if (auto self = weak.lock()) {
            self->on_connection(duplex);
        } else {
            duplex->close();
        }
    });
    {
        std::lock_guard<std::mutex> lock(mutex_);
        swarm_ = swarm;
    }

    POLYGRAPH_LOG_INFO("Joining network as {}", key());
    auto joined = swarm->join(local_log_->discovery_key(), JoinOptions{true, true});
    if (joined.is_err()) {
        abort_join(swarm, joined.error());
    }

    auto flushed = swarm->flush(config_.join_timeout);
    if (flushed.is_err()) {
        abort_join(swarm, flushed.error());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = ReplicationState::JOINED;
    }
    POLYGRAPH_LOG_INFO("Joined network ({} connection(s))", swarm->connection_count());
}

void Replicator::abort_join(const std::shared_ptr<Swarm>& swarm, const Error& error) {
    std::vector<std::shared_ptr<ReplicationStream>> streams;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        streams.swap(streams_);
        swarm_.reset();
        state_ = ReplicationState::DISCONNECTED;
    }
    for (auto& stream : streams) {
        stream->close();
    }
    if (swarm) {
        swarm->destroy();
    }

    POLYGRAPH_LOG_ERROR("Failed to join network: {}", error.to_string());
    throw NetworkException(error);
}

void Replicator::leave_network() {
    std::shared_ptr<Swarm> swarm;
    std::vector<std::shared_ptr<ReplicationStream>> streams;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == ReplicationState::DISCONNECTED && !swarm_) {
            return;
        }
        swarm.swap(swarm_);
        streams.swap(streams_);
        peers_.clear();
        state_ = ReplicationState::DISCONNECTED;
    }

    for (auto& stream : streams) {
        stream->close();
    }
    if (swarm) {
        for (const auto& topic : swarm->topics()) {
            swarm->leave(topic);
        }
        swarm->destroy();
    }
    POLYGRAPH_LOG_INFO("Left network");
}

std::shared_ptr<storage::LogKVStore> Replicator::sync_with_peer(const std::string& remote_key_hex) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != ReplicationState::JOINED) {
            throw NetworkException(ErrorCode::NetworkDisconnected,
                "sync_with_peer requires a joined network (state: " +
                std::string(replication_state_to_string(state_)) + ")");
        }
    }

    auto public_key = crypto::Ed25519::public_key_from_hex(remote_key_hex);
    if (!public_key) {
        throw PolygraphException(ErrorCode::InvalidArgument, "Malformed peer key: '" + remote_key_hex + "'");
    }
    if (*public_key == local_log_->public_key()) {
        throw PolygraphException(ErrorCode::InvalidArgument, "Cannot sync with the local log");
    }
    const std::string key_hex = to_hex(*public_key);

    std::shared_ptr<storage::LogKVStore> replica;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = replicas_.find(key_hex);
        if (it != replicas_.end()) replica = it->second;
    }
    if (!replica) {
        auto log = storage::AppendLog::open_replica(remotes_dir_ / key_hex, *public_key, config_.sparse);
        auto opened = std::make_shared<storage::LogKVStore>(log);
        std::lock_guard<std::mutex> lock(mutex_);
        replica = replicas_.emplace(key_hex, opened).first->second;
    }

    std::shared_ptr<Swarm> swarm;
    std::vector<std::shared_ptr<ReplicationStream>> streams;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        swarm = swarm_;
        streams = streams_;
    }
    if (!swarm) {
        throw NetworkException(ErrorCode::NetworkDisconnected, "Network was left during sync_with_peer");
    }

    for (auto& stream : streams) {
        stream->attach(replica->log());
    }

    auto joined = swarm->join(replica->log()->discovery_key(), JoinOptions{false, true});
    if (joined.is_err()) {
        throw NetworkException(joined.error());
    }
    auto flushed = swarm->flush(config_.sync_timeout);
    if (flushed.is_err()) {
        throw NetworkException(flushed.error());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        peers_[key_hex] = PeerSync{key_hex, time::timestamp_milliseconds()};
    }
    POLYGRAPH_LOG_INFO("Syncing with peer {} ({} of {} entries local)", key_hex,
                       replica->log()->contiguous_length(), replica->log()->remote_length());
    return replica;
}

void Replicator::on_connection(const std::shared_ptr<Duplex>& duplex) {
    auto stream = ReplicationStream::create(duplex);

    std::vector<std::shared_ptr<storage::AppendLog>> logs{local_log_};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == ReplicationState::DISCONNECTED) {
            duplex->close();
            return;
        }
        streams_.erase(std::remove_if(streams_.begin(), streams_.end(),
                                      [](const std::shared_ptr<ReplicationStream>& s) { return !s->is_open(); }),
                       streams_.end());
        streams_.push_back(stream);
        for (const auto& [key_hex, replica] : replicas_) {
            logs.push_back(replica->log());
        }
    }

    std::weak_ptr<Replicator> weak = weak_from_this();
    const ReplicationStream* raw = stream.get();
    stream->set_close_callback([weak, raw] {
        if (auto self = weak.lock()) self->remove_stream(raw);
    });

    for (const auto& log : logs) {
        stream->attach(log);
    }
    POLYGRAPH_LOG_INFO("Peer {} connected ({} log(s) offered)", duplex->remote_id(), logs.size());
}

void Replicator::remove_stream(const ReplicationStream* stream) {
    std::lock_guard<std::mutex> lock(mutex_);
    streams_.erase(std::remove_if(streams_.begin(), streams_.end(),
                                  [stream](const std::shared_ptr<ReplicationStream>& s) { return s.get() == stream; }),
                   streams_.end());
}

ReplicationState Replicator::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

SwarmStatus Replicator::status() const {
    SwarmStatus status;
    std::shared_ptr<Swarm> swarm;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        status.state = state_;
        swarm = swarm_;
        for (const auto& [key_hex, peer] : peers_) {
            status.synced_peers.push_back(peer);
        }
    }
    status.key = key();
    if (swarm) {
        status.connections = swarm->connection_count();
        for (const auto& topic : swarm->topics()) {
            status.topics.push_back(to_hex(topic));
        }
    }
    return status;
}

std::string Replicator::key() const {
    return to_hex(local_log_->public_key());
}

} // namespace polygraph::network
