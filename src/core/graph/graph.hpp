#pragma once

#include "polygraph/common.hpp"
#include "core/graph/graph_store.hpp"
#include "network/replicator.hpp"
#include "storage/append_log.hpp"
#include "storage/log_kv_store.hpp"
#include "utils/config.hpp"
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace polygraph::graph {

struct GraphOptions {
    std::filesystem::path data_dir = "./data";
    std::optional<std::string> secret_key_hex;  // Ed25519 secret key of the local log
    network::ReplicatorConfig network;
    std::vector<std::string> peers;  // Keys to sync with after joining

    // Overrides network.transport; used to run several graphs in one process
    std::shared_ptr<network::LocalSwarmHub> hub;

    /**
     * Read `data_dir`, `key`, `peers` and the replicator keys
     * @throws PolygraphException(InvalidArgument) for malformed values
     */
    static GraphOptions from_config(const utils::Config& config);
};

/**
 * Graph - Owns the local log, its KV index, the GraphStore over it and the
 * Replicator. Layout under data_dir:
 *
 *   local/          writable log and key.json
 *   remotes/<key>/  one read-only replica per synced peer
 */
class Graph {
public:
    /**
     * @throws StorageException if the local log cannot be opened
     * @throws PolygraphException(InvalidArgument) for a malformed key
     */
    static std::unique_ptr<Graph> open(const GraphOptions& options);
    ~Graph();

    POLYGRAPH_DISALLOW_COPY_AND_MOVE(Graph);

    // Leave the network and release the store; idempotent
    void close();
    bool is_open() const { return store_ != nullptr; }

    GraphStore& store();
    network::Replicator& replicator();
    const std::shared_ptr<storage::LogKVStore>& kv() const { return kv_; }

    // Hex public key of the local log
    std::string key() const;

    const GraphOptions& options() const { return options_; }

private:
    explicit Graph(GraphOptions options);

    GraphOptions options_;
    std::shared_ptr<storage::AppendLog> log_;
    std::shared_ptr<storage::LogKVStore> kv_;
    std::unique_ptr<GraphStore> store_;
    std::shared_ptr<network::Replicator> replicator_;
};

} // namespace polygraph::graph
