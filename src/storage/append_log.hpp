#pragma once

#include "polygraph/common.hpp"
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace polygraph::storage {

/**
 * One signed record of an append-only log
 */
struct LogEntry {
    uint64_t seq = 0;
    bytes payload;
    Signature signature{};
};

/**
 * Topic under which a log is announced and looked up:
 * keyed BLAKE3 of the public key, keyed with BLAKE3("polygraph-discovery").
 */
DiscoveryKey discovery_key_for(const PublicKey& public_key);

/**
 * AppendLog - Signed, append-only, replicable log with a single writer.
 *
 * Only the holder of the Ed25519 secret key can append. Replicas receive
 * entries through apply_remote(), which drops anything whose signature does
 * not verify against the log's public key. Sparse replicas may hold holes;
 * contiguous_length() is the prefix that has no gaps.
 *
 * On disk a log is a directory holding `key.json` and `log.dat`, the latter a
 * sequence of [u64 seq][u32 len][payload][64-byte signature] records.
 */
class AppendLog {
public:
    using EntryListener = std::function<void(const LogEntry&)>;
    using DemandListener = std::function<void()>;

    /**
     * Open (or create) the writable log in `dir`.
     * A new keypair is generated unless `secret_key` is given or the
     * directory already holds one.
     * @throws StorageException on I/O failure or key mismatch
     */
    static std::shared_ptr<AppendLog> open_writable(const std::filesystem::path& dir,
                                                    const std::optional<SecretKey>& secret_key = std::nullopt);

    /**
     * Open (or create) a read-only replica of the log identified by `public_key`
     */
    static std::shared_ptr<AppendLog> open_replica(const std::filesystem::path& dir,
                                                   const PublicKey& public_key,
                                                   bool sparse);

    ~AppendLog();

    POLYGRAPH_DISALLOW_COPY_AND_MOVE(AppendLog);

    const PublicKey& public_key() const { return public_key_; }
    const DiscoveryKey& discovery_key() const { return discovery_key_; }
    bool writable() const { return secret_key_.has_value(); }
    bool sparse() const { return sparse_; }

    /**
     * Sign and append a payload
     * @return sequence number of the new entry
     * @throws StorageException(StorageReadOnly) on replicas
     */
    uint64_t append(const bytes& payload);

    /**
     * Store an entry received from a peer
     * @return true if the entry was new and its signature verified
     */
    bool apply_remote(const LogEntry& entry);

    std::optional<LogEntry> get(uint64_t seq) const;
    bool has(uint64_t seq) const;

    // Number of entries from seq 0 without a gap
    uint64_t contiguous_length() const;

    // One past the highest stored seq
    uint64_t length() const;

    // Largest length any peer has advertised, or our own length for writers
    uint64_t remote_length() const;
    void update_remote_length(uint64_t length);

    /**
     * Sequence numbers in [start, end) not held locally
     */
    std::vector<uint64_t> missing(uint64_t start, uint64_t end) const;

    /**
     * Ask connected peers for everything missing and wait until the
     * contiguous prefix reaches the advertised length.
     * @return false if the deadline passed first
     */
    bool download(std::chrono::milliseconds timeout);

    // True while a download() is waiting for data
    bool has_demand() const;

    size_t subscribe(EntryListener listener);
    size_t on_demand(DemandListener listener);
    void unsubscribe(size_t id);

    // Payload covered by an entry's signature: seq (u64 LE) || payload
    static bytes signing_message(uint64_t seq, const bytes& payload);

private:
    AppendLog(std::filesystem::path dir, PublicKey public_key,
              std::optional<SecretKey> secret_key, bool sparse);

    void load();
    void persist(const LogEntry& entry);
    void insert_locked(LogEntry entry);
    void notify_entry(const LogEntry& entry);
    void notify_demand();

    std::filesystem::path dir_;
    PublicKey public_key_;
    DiscoveryKey discovery_key_;
    std::optional<SecretKey> secret_key_;
    bool sparse_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<uint64_t, LogEntry> entries_;
    uint64_t contiguous_ = 0;
    uint64_t remote_length_ = 0;
    bool remote_length_known_ = false;
    int pending_demand_ = 0;

    std::mutex listeners_mutex_;
    size_t next_listener_id_ = 1;
    std::map<size_t, EntryListener> entry_listeners_;
    std::map<size_t, DemandListener> demand_listeners_;
};

} // namespace polygraph::storage
