#include "core/graph/graph.hpp"
#include "network/local_swarm.hpp"
#include "utils/logger.hpp"

namespace polygraph::graph {

GraphOptions GraphOptions::from_config(const utils::Config& config) {
    GraphOptions options;
    options.data_dir = config.get_or<std::string>("data_dir", options.data_dir.string());

    auto key = config.get<std::string>("key");
    if (key && !key->empty()) {
        options.secret_key_hex = *key;
    }

    options.network = network::ReplicatorConfig::from_config(config);
    options.peers = config.get_or<std::vector<std::string>>("peers", {});
    return options;
}

Graph::Graph(GraphOptions options)
    : options_(std::move(options))
{
}

std::unique_ptr<Graph> Graph::open(const GraphOptions& options) {
    std::optional<SecretKey> secret_key;
    if (options.secret_key_hex) {
        secret_key = from_hex<constants::ED25519_SECRET_KEY_SIZE>(*options.secret_key_hex);
        if (!secret_key) {
            throw PolygraphException(ErrorCode::InvalidArgument,
                "key must be " + std::to_string(constants::ED25519_SECRET_KEY_SIZE * 2) + " hex characters");
        }
    }

    std::unique_ptr<Graph> graph(new Graph(options));
    graph->log_ = storage::AppendLog::open_writable(options.data_dir / "local", secret_key);
    graph->kv_ = std::make_shared<storage::LogKVStore>(graph->log_);
    graph->store_ = std::make_unique<GraphStore>(graph->kv_);

    network::Replicator::SwarmFactory factory;
    if (options.hub) {
        factory = network::Replicator::local_factory(options.hub);
    } else if (options.network.transport == "local") {
        throw PolygraphException(ErrorCode::InvalidArgument,
            "network.transport \"local\" requires an in-process hub");
    }
    graph->replicator_ = network::Replicator::create(
        graph->log_, options.data_dir / "remotes", options.network, factory);

    POLYGRAPH_LOG_INFO("Opened graph {} at {} ({} entries)",
                       graph->key(), options.data_dir.string(), graph->log_->length());
    return graph;
}

Graph::~Graph() {
    close();
}

void Graph::close() {
    if (!store_) {
        return;
    }
    if (replicator_) {
        replicator_->leave_network();
        replicator_.reset();
    }
    store_.reset();
    kv_.reset();
    log_.reset();
    POLYGRAPH_LOG_DEBUG("Closed graph at {}", options_.data_dir.string());
}

GraphStore& Graph::store() {
    if (!store_) {
        throw PolygraphException(ErrorCode::InvalidArgument, "Graph is closed");
    }
    return *store_;
}

network::Replicator& Graph::replicator() {
    if (!replicator_) {
        throw PolygraphException(ErrorCode::InvalidArgument, "Graph is closed");
    }
    return *replicator_;
}

std::string Graph::key() const {
    if (!log_) {
        return "";
    }
    return to_hex(log_->public_key());
}

} // namespace polygraph::graph
