#include "log_kv_store.hpp"
#include "polygraph/error.hpp"
#include "polygraph/serialization.hpp"
#include "utils/logger.hpp"
#include <algorithm>

namespace polygraph::storage {

LogKVStore::LogKVStore(std::shared_ptr<AppendLog> log)
    : log_(std::move(log))
{
    if (!log_) {
        throw StorageException(ErrorCode::InvalidArgument, "LogKVStore requires a log");
    }
    subscription_ = log_->subscribe([this](const LogEntry&) {
        catch_up();
    });
    catch_up();
}

LogKVStore::~LogKVStore() {
    log_->unsubscribe(subscription_);
}

bytes LogKVStore::encode_batch(const std::vector<WriteOp>& ops) {
    ByteWriter writer;
    writer.write_u32(static_cast<uint32_t>(ops.size()));
    for (const auto& op : ops) {
        writer.write_u8(static_cast<uint8_t>(op.type));
        writer.write_string(op.key);
        writer.write_string(op.type == WriteOpType::PUT ? op.value : std::string());
    }
    return writer.take();
}

std::vector<WriteOp> LogKVStore::decode_batch(const bytes& payload) {
    ByteReader reader(payload);
    uint32_t count = reader.read_u32();

    std::vector<WriteOp> ops;
    ops.reserve(std::min<size_t>(count, payload.size()));
    for (uint32_t i = 0; i < count; ++i) {
        WriteOp op;
        uint8_t type = reader.read_u8();
        if (type != static_cast<uint8_t>(WriteOpType::PUT) &&
            type != static_cast<uint8_t>(WriteOpType::DEL)) {
            throw PolygraphException(ErrorCode::DeserializationFailed,
                "Unknown write op type " + std::to_string(type));
        }
        op.type = static_cast<WriteOpType>(type);
        op.key = reader.read_string();
        op.value = reader.read_string();
        ops.push_back(std::move(op));
    }
    if (!reader.at_end()) {
        throw PolygraphException(ErrorCode::DeserializationFailed, "Trailing bytes after write batch");
    }
    return ops;
}

void LogKVStore::catch_up() {
    std::lock_guard<std::mutex> lock(mutex_);
    while (true) {
        auto entry = log_->get(applied_);
        if (!entry) break;

        try {
            for (auto& op : decode_batch(entry->payload)) {
                if (op.type == WriteOpType::PUT) {
                    index_[op.key] = std::move(op.value);
                } else {
                    index_.erase(op.key);
                }
            }
        } catch (const PolygraphException& e) {
            // Signed by the writer but unreadable: skip it, every replica does the same
            POLYGRAPH_LOG_ERROR("Skipping undecodable entry {} of log {}: {}",
                                applied_, to_hex(log_->public_key()), e.what());
        }
        ++applied_;
    }
}

void LogKVStore::require_writable() const {
    if (!log_->writable()) {
        throw StorageException(ErrorCode::StorageReadOnly,
            "Store over log " + to_hex(log_->public_key()) + " is read-only");
    }
}

std::optional<std::string> LogKVStore::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(key);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void LogKVStore::put(const std::string& key, const std::string& value) {
    write_batch({WriteOp::put(key, value)});
}

bool LogKVStore::del(const std::string& key) {
    require_writable();
    if (!get(key)) {
        return false;
    }
    write_batch({WriteOp::del(key)});
    return true;
}

void LogKVStore::write_batch(const std::vector<WriteOp>& ops) {
    require_writable();
    if (ops.empty()) {
        return;
    }
    log_->append(encode_batch(ops));
    catch_up();
}

std::vector<KVEntry> LogKVStore::scan(const std::string& start, const std::string& end) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<KVEntry> result;
    for (auto it = index_.lower_bound(start); it != index_.end() && it->first < end; ++it) {
        result.push_back(KVEntry{it->first, it->second});
    }
    return result;
}

bool LogKVStore::writable() const {
    return log_->writable();
}

bool LogKVStore::update(std::chrono::milliseconds timeout) {
    bool complete = log_->download(timeout);
    catch_up();
    if (!complete) {
        POLYGRAPH_LOG_DEBUG("Replica {} incomplete after {} ms ({} of {} entries)",
                            to_hex(log_->public_key()), timeout.count(),
                            log_->contiguous_length(), log_->remote_length());
    }
    return complete;
}

uint64_t LogKVStore::version() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return applied_;
}

size_t LogKVStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.size();
}

} // namespace polygraph::storage
