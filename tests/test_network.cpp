#include "network/tcp_swarm.hpp"
#include "network/replicator.hpp"
#include "core/graph/graph_store.hpp"
#include "storage/append_log.hpp"
#include "storage/log_kv_store.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <filesystem>
#include <functional>
#include <thread>

using namespace polygraph;
using namespace polygraph::network;

namespace fs = std::filesystem;

namespace {

bool eventually(const std::function<bool()>& condition,
                std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return condition();
}

TcpSwarmConfig loopback_config() {
    TcpSwarmConfig config;
    config.listen_host = "127.0.0.1";
    config.listen_port = 0;
    config.connect_timeout = std::chrono::milliseconds(1000);
    return config;
}

DiscoveryKey topic_of(byte tag) {
    DiscoveryKey topic{};
    topic.fill(tag);
    return topic;
}

}

TEST(SocketAddressTest, ParsesHostAndPort) {
    auto v4 = SocketAddress::from_string("127.0.0.1:7878");
    ASSERT_TRUE(v4.has_value());
    EXPECT_EQ(v4->host, "127.0.0.1");
    EXPECT_EQ(v4->port, 7878);
    EXPECT_FALSE(v4->is_ipv6());
    EXPECT_EQ(v4->to_string(), "127.0.0.1:7878");

    auto v6 = SocketAddress::from_string("[::1]:9000");
    ASSERT_TRUE(v6.has_value());
    EXPECT_EQ(v6->host, "::1");
    EXPECT_EQ(v6->port, 9000);
    EXPECT_TRUE(v6->is_ipv6());

    auto named = SocketAddress::from_string("peer.example:80");
    ASSERT_TRUE(named.has_value());
    EXPECT_EQ(*named, SocketAddress("peer.example", 80));
}

TEST(SocketAddressTest, RejectsMalformed) {
    EXPECT_FALSE(SocketAddress::from_string("").has_value());
    EXPECT_FALSE(SocketAddress::from_string("127.0.0.1").has_value());
    EXPECT_FALSE(SocketAddress::from_string(":7878").has_value());
    EXPECT_FALSE(SocketAddress::from_string("host:").has_value());
    EXPECT_FALSE(SocketAddress::from_string("host:65536").has_value());
    EXPECT_FALSE(SocketAddress::from_string("host:12a").has_value());
    EXPECT_FALSE(SocketAddress::from_string("[::1]7878").has_value());
    EXPECT_FALSE(SocketAddress::from_string("[::1").has_value());
}

TEST(TcpSwarmTest, ConnectsOnSharedTopic) {
    TcpSwarm server(loopback_config());
    auto topic = topic_of(0x11);

    std::atomic<int> server_received{0};
    std::shared_ptr<Duplex> server_side;
    std::mutex server_mutex;
    server.set_connection_callback([&](std::shared_ptr<Duplex> duplex) {
        duplex->set_message_callback([&](const bytes& message) {
            if (message == bytes{'p', 'i', 'n', 'g'}) ++server_received;
        });
        std::lock_guard<std::mutex> lock(server_mutex);
        server_side = duplex;
    });
    ASSERT_TRUE(server.join(topic, JoinOptions{true, false}).is_ok());
    ASSERT_NE(server.listen_port(), 0);

    auto client_config = loopback_config();
    client_config.bootstrap.emplace_back("127.0.0.1", server.listen_port());
    TcpSwarm client(client_config);

    std::atomic<int> client_received{0};
    std::shared_ptr<Duplex> client_side;
    std::mutex client_mutex;
    client.set_connection_callback([&](std::shared_ptr<Duplex> duplex) {
        duplex->set_message_callback([&](const bytes& message) {
            if (message == bytes{'p', 'o', 'n', 'g'}) ++client_received;
        });
        std::lock_guard<std::mutex> lock(client_mutex);
        client_side = duplex;
    });
    ASSERT_TRUE(client.join(topic, JoinOptions{false, true}).is_ok());
    EXPECT_EQ(client.listen_port(), 0);
    ASSERT_TRUE(client.flush(std::chrono::seconds(5)).is_ok());

    ASSERT_TRUE(eventually([&] {
        return server.connection_count() == 1 && client.connection_count() == 1;
    }));

    std::shared_ptr<Duplex> from_client;
    std::shared_ptr<Duplex> from_server;
    ASSERT_TRUE(eventually([&] {
        std::lock_guard<std::mutex> a(client_mutex);
        std::lock_guard<std::mutex> b(server_mutex);
        from_client = client_side;
        from_server = server_side;
        return from_client && from_server;
    }));
    EXPECT_TRUE(from_client->is_initiator());
    EXPECT_FALSE(from_server->is_initiator());
    EXPECT_EQ(from_client->remote_id(), server.id());
    EXPECT_EQ(from_server->remote_id(), client.id());

    EXPECT_TRUE(from_client->send(bytes{'p', 'i', 'n', 'g'}));
    EXPECT_TRUE(from_server->send(bytes{'p', 'o', 'n', 'g'}));
    EXPECT_TRUE(eventually([&] { return server_received.load() == 1 && client_received.load() == 1; }));

    // Destroying one side closes the other
    server.destroy();
    EXPECT_TRUE(eventually([&] { return !from_client->is_open(); }));
    EXPECT_TRUE(eventually([&] { return client.connection_count() == 0; }));
    server.destroy();
    EXPECT_FALSE(server.join(topic, JoinOptions{}).is_ok());
    EXPECT_FALSE(from_client->send(bytes{1}));
}

TEST(TcpSwarmTest, DropsConnectionWithoutSharedTopic) {
    TcpSwarm server(loopback_config());
    std::atomic<int> accepted{0};
    server.set_connection_callback([&](std::shared_ptr<Duplex>) { ++accepted; });
    ASSERT_TRUE(server.join(topic_of(0x01), JoinOptions{true, false}).is_ok());

    auto client_config = loopback_config();
    client_config.bootstrap.emplace_back("127.0.0.1", server.listen_port());
    TcpSwarm client(client_config);
    client.set_connection_callback([&](std::shared_ptr<Duplex>) { ++accepted; });
    ASSERT_TRUE(client.join(topic_of(0x02), JoinOptions{false, true}).is_ok());

    ASSERT_TRUE(client.flush(std::chrono::seconds(5)).is_ok());
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_EQ(accepted.load(), 0);
    EXPECT_EQ(client.connection_count(), 0u);
    EXPECT_EQ(server.connection_count(), 0u);
}

TEST(TcpSwarmTest, UnreachableBootstrapSettles) {
    // Grab a free port, then close it so nothing listens there
    uint16_t port;
    {
        TcpSwarm probe(loopback_config());
        ASSERT_TRUE(probe.join(topic_of(0x05), JoinOptions{true, false}).is_ok());
        port = probe.listen_port();
    }

    auto config = loopback_config();
    config.bootstrap.emplace_back("127.0.0.1", port);
    TcpSwarm client(config);
    ASSERT_TRUE(client.join(topic_of(0x05), JoinOptions{false, true}).is_ok());
    EXPECT_TRUE(client.flush(std::chrono::seconds(5)).is_ok());
    EXPECT_EQ(client.connection_count(), 0u);

    auto topics = client.topics();
    ASSERT_EQ(topics.size(), 1u);
    client.leave(topics[0]);
    EXPECT_TRUE(client.topics().empty());
}

TEST(TcpSwarmTest, ListenFailureIsReported) {
    TcpSwarm first(loopback_config());
    ASSERT_TRUE(first.join(topic_of(0x07), JoinOptions{true, false}).is_ok());

    auto config = loopback_config();
    config.listen_port = first.listen_port();
    TcpSwarm second(config);
    auto result = second.join(topic_of(0x07), JoinOptions{true, false});
    ASSERT_TRUE(result.is_err());
    EXPECT_TRUE(second.topics().empty());
}

class TcpReplicationTest : public ::testing::Test {
protected:
    std::string test_dir = "./test_network_data";

    void SetUp() override {
        if (fs::exists(test_dir)) {
            fs::remove_all(test_dir);
        }
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }
};

TEST_F(TcpReplicationTest, ReplicatesGraphOverTcp) {
    auto writer_log = storage::AppendLog::open_writable(fs::path(test_dir) / "a" / "local");
    auto writer_kv = std::make_shared<storage::LogKVStore>(writer_log);
    graph::GraphStore writer(writer_kv);
    writer.add_node("Water");
    writer.add_node("Hydrogen");
    writer.add_relation("hydrogen", "water", "part of");

    auto server_swarm = std::make_shared<TcpSwarm>(loopback_config());
    ReplicatorConfig config;
    auto a = Replicator::create(writer_log, fs::path(test_dir) / "a" / "remotes", config,
                                [server_swarm] { return server_swarm; });
    a->join_network();
    ASSERT_NE(server_swarm->listen_port(), 0);

    auto reader_log = storage::AppendLog::open_writable(fs::path(test_dir) / "b" / "local");
    auto client_config = loopback_config();
    client_config.bootstrap.emplace_back("127.0.0.1", server_swarm->listen_port());
    auto b = Replicator::create(reader_log, fs::path(test_dir) / "b" / "remotes", config,
                                [client_config] { return std::make_shared<TcpSwarm>(client_config); });
    b->join_network();
    EXPECT_EQ(b->state(), ReplicationState::JOINED);

    auto replica = b->sync_with_peer(a->key());
    graph::GraphStore remote(replica);
    ASSERT_TRUE(eventually([&] {
        replica->update(std::chrono::milliseconds(500));
        return remote.get_node("water").has_value();
    }, std::chrono::seconds(10)));
    EXPECT_EQ(*remote.get_node("hydrogen"), *writer.get_node("hydrogen"));
    EXPECT_EQ(remote.list_relations().size(), 1u);

    writer.add_attribute("water", "chemical formula", "H2O");
    EXPECT_TRUE(eventually([&] {
        replica->update(std::chrono::milliseconds(500));
        return remote.attributes_of("water").size() == 1;
    }, std::chrono::seconds(10)));

    EXPECT_GE(a->status().connections, 1u);
    b->leave_network();
    a->leave_network();
    EXPECT_EQ(server_swarm->connection_count(), 0u);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
