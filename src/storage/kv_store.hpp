#pragma once

#include "polygraph/common.hpp"
#include <optional>
#include <string>
#include <vector>

namespace polygraph::storage {

enum class WriteOpType : uint8_t {
    PUT = 1,
    DEL = 2
};

// One mutation of a write batch
struct WriteOp {
    WriteOpType type = WriteOpType::PUT;
    std::string key;
    std::string value;  // Empty for DEL

    static WriteOp put(std::string key, std::string value) {
        return WriteOp{WriteOpType::PUT, std::move(key), std::move(value)};
    }

    static WriteOp del(std::string key) {
        return WriteOp{WriteOpType::DEL, std::move(key), std::string()};
    }
};

struct KVEntry {
    std::string key;
    std::string value;
};

/**
 * Ordered key-value substrate the graph store is written against.
 *
 * Keys are compared bytewise. Mutating calls throw
 * StorageException(StorageReadOnly) on a handle that cannot write.
 */
class KeyValueStore {
public:
    virtual ~KeyValueStore() = default;

    virtual std::optional<std::string> get(const std::string& key) const = 0;
    virtual void put(const std::string& key, const std::string& value) = 0;

    /**
     * Remove a key
     * @return true if the key existed
     */
    virtual bool del(const std::string& key) = 0;

    /**
     * Apply every op or none of them
     */
    virtual void write_batch(const std::vector<WriteOp>& ops) = 0;

    /**
     * All entries with start <= key < end, ascending
     */
    virtual std::vector<KVEntry> scan(const std::string& start, const std::string& end) const = 0;

    virtual bool writable() const = 0;
};

} // namespace polygraph::storage
