#pragma once

#include "polygraph/common.hpp"
#include "network/swarm.hpp"
#include "storage/append_log.hpp"
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace polygraph::network {

/**
 * ReplicationMessage - Wire message of the log replication protocol.
 *
 * Encoding: u8 type followed by the 32-byte discovery key and the body.
 *   OPEN    {}                               peer has the log; answer with HAVE
 *   HAVE    {u64 length}                     contiguous entries the sender holds
 *   REQUEST {u64 start, u64 end}             send entries in [start, end)
 *   DATA    {u32 count, (u64 seq, bytes payload, 64-byte signature)*}
 */
struct ReplicationMessage {
    enum class Type : uint8_t {
        OPEN = 1,
        HAVE = 2,
        REQUEST = 3,
        DATA = 4
    };

    Type type = Type::OPEN;
    DiscoveryKey discovery_key{};
    uint64_t length = 0;
    uint64_t start = 0;
    uint64_t end = 0;
    std::vector<storage::LogEntry> entries;

    bytes serialize() const;
    static std::optional<ReplicationMessage> deserialize(const bytes& data);

    static ReplicationMessage open(const DiscoveryKey& key);
    static ReplicationMessage have(const DiscoveryKey& key, uint64_t length);
    static ReplicationMessage request(const DiscoveryKey& key, uint64_t start, uint64_t end);
};

const char* message_type_to_string(ReplicationMessage::Type type);

/**
 * ReplicationStream - Replicates every attached log over one Duplex.
 *
 * The stream knows nothing about what the logs contain. Both sides
 * announce the logs they carry; a side holding a replica asks for the
 * entries it lacks. Full replicas ask as soon as they learn a peer's
 * length, sparse replicas only while a download is pending.
 */
class ReplicationStream : public std::enable_shared_from_this<ReplicationStream> {
public:
    using CloseCallback = std::function<void()>;

    static std::shared_ptr<ReplicationStream> create(std::shared_ptr<Duplex> duplex);
    ~ReplicationStream();

    POLYGRAPH_DISALLOW_COPY_AND_MOVE(ReplicationStream);

    /**
     * Replicate `log` with the peer; attaching the same log twice is a no-op
     */
    void attach(const std::shared_ptr<storage::AppendLog>& log);
    void detach(const DiscoveryKey& discovery_key);

    // Stop replicating and close the duplex
    void close();

    bool is_open() const;
    std::string remote_id() const { return duplex_->remote_id(); }
    size_t log_count() const;

    void set_close_callback(CloseCallback callback);

    uint64_t entries_sent() const { return entries_sent_; }
    uint64_t entries_received() const { return entries_received_; }

private:
    struct Channel {
        std::shared_ptr<storage::AppendLog> log;
        size_t entry_subscription = 0;
        size_t demand_subscription = 0;
        uint64_t advertised = 0;
        bool remote_open = false;
    };

    explicit ReplicationStream(std::shared_ptr<Duplex> duplex);

    void start();
    void handle(const bytes& data);
    void handle_have(const std::shared_ptr<storage::AppendLog>& log, uint64_t length);
    void handle_request(const std::shared_ptr<storage::AppendLog>& log, uint64_t start, uint64_t end);
    void handle_data(const std::shared_ptr<storage::AppendLog>& log, const std::vector<storage::LogEntry>& entries);
    void on_local_entry(const DiscoveryKey& key);
    void on_demand(const DiscoveryKey& key);
    void request_missing(const std::shared_ptr<storage::AppendLog>& log);
    void on_duplex_closed();
    void release_channels();

    std::shared_ptr<storage::AppendLog> find_log(const DiscoveryKey& key) const;
    bool send(const ReplicationMessage& message);

    std::shared_ptr<Duplex> duplex_;

    mutable std::mutex mutex_;
    std::map<DiscoveryKey, Channel> channels_;
    CloseCallback close_callback_;
    bool closed_ = false;

    std::atomic<uint64_t> entries_sent_{0};
    std::atomic<uint64_t> entries_received_{0};
};

} // namespace polygraph::network
