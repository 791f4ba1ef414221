#pragma once

#include "kv_store.hpp"
#include "append_log.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>

namespace polygraph::storage {

/**
 * LogKVStore - Ordered key-value view over an AppendLog.
 *
 * Every put/del/write_batch becomes one signed log entry, so a batch is
 * atomic locally and on every replica. The index is the result of applying
 * the contiguous prefix of the log in order; entries that arrive past a hole
 * wait until the hole is filled.
 */
class LogKVStore : public KeyValueStore {
public:
    explicit LogKVStore(std::shared_ptr<AppendLog> log);
    ~LogKVStore() override;

    POLYGRAPH_DISALLOW_COPY_AND_MOVE(LogKVStore);

    std::optional<std::string> get(const std::string& key) const override;
    void put(const std::string& key, const std::string& value) override;
    bool del(const std::string& key) override;
    void write_batch(const std::vector<WriteOp>& ops) override;
    std::vector<KVEntry> scan(const std::string& start, const std::string& end) const override;
    bool writable() const override;

    /**
     * Fetch whatever peers have that this replica lacks.
     * @return true once the index covers everything advertised
     */
    bool update(std::chrono::milliseconds timeout);

    // Number of log entries folded into the index
    uint64_t version() const;
    size_t size() const;

    const std::shared_ptr<AppendLog>& log() const { return log_; }

    static bytes encode_batch(const std::vector<WriteOp>& ops);
    static std::vector<WriteOp> decode_batch(const bytes& payload);

private:
    void catch_up();
    void require_writable() const;

    std::shared_ptr<AppendLog> log_;
    size_t subscription_ = 0;

    mutable std::mutex mutex_;
    std::map<std::string, std::string> index_;
    uint64_t applied_ = 0;
};

} // namespace polygraph::storage
