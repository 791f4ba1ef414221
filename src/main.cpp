#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <thread>

#include "core/graph/graph.hpp"
#include "network/replicator.hpp"
#include "utils/logger.hpp"
#include "utils/config.hpp"
#include "polygraph/common.hpp"

// Global flag for graceful shutdown
std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdown_requested = true;
    }
}

namespace {

constexpr int STATUS_INTERVAL_SECONDS = 30;

void log_status(polygraph::graph::Graph& graph) {
    auto status = graph.replicator().status();
    POLYGRAPH_LOG_INFO("Status: {} | {} connection(s) | {} topic(s) | {} synced peer(s) | {} local entries",
        polygraph::network::replication_state_to_string(status.state),
        status.connections,
        status.topics.size(),
        status.synced_peers.size(),
        graph.kv()->version());
}

}

int main(int argc, char** argv) {
    try {
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        std::string config_path = "polygraph.json";
        if (argc > 1) {
            config_path = argv[1];
        }

        // Load configuration (or use defaults if file doesn't exist)
        polygraph::utils::Config config;
        if (std::filesystem::exists(config_path)) {
            config = polygraph::utils::Config::load_from_file(config_path);
        } else {
            config.set("log_level", "info");
            config.set("log_to_file", false);
            config.set("data_dir", "./data");
        }

        auto log_level = config.get_or<std::string>("log_level", "info");
        auto log_to_file = config.get_or<bool>("log_to_file", false);
        polygraph::utils::Logger::init(log_level, log_to_file);

        POLYGRAPH_LOG_INFO("polygraphd v{}", POLYGRAPH_VERSION_STRING);
        if (!std::filesystem::exists(config_path)) {
            POLYGRAPH_LOG_WARN("Config file '{}' not found, using defaults", config_path);
        }

        auto options = polygraph::graph::GraphOptions::from_config(config);
        if (options.network.transport != "tcp") {
            POLYGRAPH_LOG_ERROR("polygraphd only supports network.transport \"tcp\"");
            return 1;
        }

        auto graph = polygraph::graph::Graph::open(options);
        POLYGRAPH_LOG_INFO("Local key: {}", graph->key());
        POLYGRAPH_LOG_INFO("Data dir:  {}", options.data_dir.string());

        graph->replicator().join_network();

        for (const auto& peer : options.peers) {
            try {
                auto replica = graph->replicator().sync_with_peer(peer);
                POLYGRAPH_LOG_INFO("Peer {}: {} entries indexed", peer, replica->version());
            } catch (const polygraph::PolygraphException& e) {
                POLYGRAPH_LOG_ERROR("Failed to sync with peer {}: {}", peer, e.what());
            }
        }

        log_status(*graph);
        POLYGRAPH_LOG_INFO("Press Ctrl+C to shutdown");

        int elapsed = 0;
        while (!g_shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
            if (++elapsed % STATUS_INTERVAL_SECONDS == 0) {
                log_status(*graph);
            }
        }

        POLYGRAPH_LOG_INFO("Shutting down...");
        graph->close();
        POLYGRAPH_LOG_INFO("Stopped");
    } catch (const std::exception& e) {
        POLYGRAPH_LOG_ERROR("Fatal error: {}", e.what());
        return 1;
    }

    return 0;
}
