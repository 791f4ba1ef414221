#include "append_log.hpp"
#include "polygraph/error.hpp"
#include "polygraph/serialization.hpp"
#include "crypto/blake3.hpp"
#include "crypto/ed25519.hpp"
#include "utils/logger.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <tuple>

namespace polygraph::storage {

namespace fs = std::filesystem;

namespace {
    constexpr const char* KEY_FILE = "key.json";
    constexpr const char* LOG_FILE = "log.dat";

    // Record header: u64 seq + u32 payload length
    constexpr size_t RECORD_HEADER_SIZE = 12;

    nlohmann::json read_key_file(const fs::path& path) {
        std::ifstream file(path);
        if (!file) {
            throw StorageException(ErrorCode::StorageReadFailed,
                "Failed to open key file: " + path.string());
        }
        try {
            nlohmann::json j;
            file >> j;
            return j;
        } catch (const nlohmann::json::exception& e) {
            throw StorageException(ErrorCode::StorageCorrupted,
                "Malformed key file " + path.string() + ": " + e.what());
        }
    }

    void write_key_file(const fs::path& path, const nlohmann::json& j) {
        std::ofstream file(path, std::ios::trunc);
        if (!file) {
            throw StorageException(ErrorCode::StorageWriteFailed,
                "Failed to create key file: " + path.string());
        }
        file << j.dump(2);
        if (!file) {
            throw StorageException(ErrorCode::StorageWriteFailed,
                "Failed to write key file: " + path.string());
        }
    }

    void ensure_directory(const fs::path& dir) {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            throw StorageException(ErrorCode::StorageWriteFailed,
                "Failed to create " + dir.string() + ": " + ec.message());
        }
    }

    PublicKey parse_public_key(const nlohmann::json& j, const fs::path& path) {
        auto key = crypto::Ed25519::public_key_from_hex(j.value("public_key", ""));
        if (!key) {
            throw StorageException(ErrorCode::StorageCorrupted,
                "Key file " + path.string() + " has no valid public key");
        }
        return *key;
    }
}

DiscoveryKey discovery_key_for(const PublicKey& public_key) {
    static const Hash256 ns_key = crypto::Blake3::hash(std::string(constants::DISCOVERY_NAMESPACE));
    return crypto::Blake3::keyed_hash(ns_key, bytes(public_key.begin(), public_key.end()));
}

AppendLog::AppendLog(fs::path dir, PublicKey public_key,
                     std::optional<SecretKey> secret_key, bool sparse)
    : dir_(std::move(dir))
    , public_key_(public_key)
    , discovery_key_(discovery_key_for(public_key))
    , secret_key_(std::move(secret_key))
    , sparse_(sparse)
{
}

AppendLog::~AppendLog() = default;

std::shared_ptr<AppendLog> AppendLog::open_writable(const fs::path& dir,
                                                    const std::optional<SecretKey>& secret_key) {
    ensure_directory(dir);
    fs::path key_path = dir / KEY_FILE;

    PublicKey public_key{};
    SecretKey secret{};

    if (fs::exists(key_path)) {
        nlohmann::json j = read_key_file(key_path);
        public_key = parse_public_key(j, key_path);
        auto stored = from_hex<constants::ED25519_SECRET_KEY_SIZE>(j.value("secret_key", ""));
        if (!stored) {
            throw StorageException(ErrorCode::StorageReadOnly,
                "Log at " + dir.string() + " has no secret key; it is a replica");
        }
        secret = *stored;
        if (secret_key && *secret_key != secret) {
            throw StorageException(ErrorCode::StorageCorrupted,
                "Configured key does not match the log at " + dir.string());
        }
    } else {
        if (secret_key) {
            secret = *secret_key;
            public_key = crypto::Ed25519::secret_to_public(secret);
        } else {
            std::tie(public_key, secret) = crypto::Ed25519::generate_keypair();
        }
        write_key_file(key_path, nlohmann::json{
            {"public_key", to_hex(public_key)},
            {"secret_key", to_hex(secret)}
        });
        POLYGRAPH_LOG_INFO("Created log {} at {}", to_hex(public_key), dir.string());
    }

    std::shared_ptr<AppendLog> log(new AppendLog(dir, public_key, secret, false));
    log->load();
    return log;
}

std::shared_ptr<AppendLog> AppendLog::open_replica(const fs::path& dir,
                                                   const PublicKey& public_key,
                                                   bool sparse) {
    ensure_directory(dir);
    fs::path key_path = dir / KEY_FILE;

    if (fs::exists(key_path)) {
        PublicKey stored = parse_public_key(read_key_file(key_path), key_path);
        if (stored != public_key) {
            throw StorageException(ErrorCode::StorageCorrupted,
                "Replica directory " + dir.string() + " belongs to another log");
        }
    } else {
        write_key_file(key_path, nlohmann::json{{"public_key", to_hex(public_key)}});
    }

    std::shared_ptr<AppendLog> log(new AppendLog(dir, public_key, std::nullopt, sparse));
    log->load();
    return log;
}

bytes AppendLog::signing_message(uint64_t seq, const bytes& payload) {
    ByteWriter writer;
    writer.write_u64(seq);
    bytes message = writer.take();
    message.insert(message.end(), payload.begin(), payload.end());
    return message;
}

void AppendLog::load() {
    fs::path log_path = dir_ / LOG_FILE;
    if (!fs::exists(log_path)) {
        return;
    }

    std::ifstream file(log_path, std::ios::binary);
    if (!file) {
        throw StorageException(ErrorCode::StorageReadFailed,
            "Failed to open log file: " + log_path.string());
    }

    size_t loaded = 0;
    size_t rejected = 0;
    while (true) {
        bytes header(RECORD_HEADER_SIZE);
        file.read(reinterpret_cast<char*>(header.data()), header.size());
        if (file.gcount() == 0) break;
        if (static_cast<size_t>(file.gcount()) != header.size()) {
            POLYGRAPH_LOG_WARN("Truncated record header in {}, ignoring tail", log_path.string());
            break;
        }

        ByteReader reader(header);
        LogEntry entry;
        entry.seq = reader.read_u64();
        uint32_t length = reader.read_u32();
        if (length > constants::MAX_FRAME_SIZE) {
            throw StorageException(ErrorCode::StorageCorrupted,
                "Record length " + std::to_string(length) + " exceeds limit in " + log_path.string());
        }

        entry.payload.resize(length);
        file.read(reinterpret_cast<char*>(entry.payload.data()), length);
        file.read(reinterpret_cast<char*>(entry.signature.data()), entry.signature.size());
        if (!file) {
            POLYGRAPH_LOG_WARN("Truncated record {} in {}, ignoring tail", entry.seq, log_path.string());
            break;
        }

        if (!crypto::Ed25519::verify(signing_message(entry.seq, entry.payload), entry.signature, public_key_)) {
            ++rejected;
            continue;
        }
        insert_locked(std::move(entry));
        ++loaded;
    }

    if (rejected > 0) {
        POLYGRAPH_LOG_WARN("Dropped {} records with bad signatures from {}", rejected, log_path.string());
    }
    if (writable()) {
        remote_length_ = contiguous_;
        remote_length_known_ = true;
    }
    POLYGRAPH_LOG_DEBUG("Loaded {} entries of log {}", loaded, to_hex(public_key_));
}

void AppendLog::persist(const LogEntry& entry) {
    fs::path log_path = dir_ / LOG_FILE;
    std::ofstream file(log_path, std::ios::binary | std::ios::app);
    if (!file) {
        throw StorageException(ErrorCode::StorageWriteFailed,
            "Failed to open log file: " + log_path.string());
    }

    ByteWriter writer;
    writer.write_u64(entry.seq);
    writer.write_u32(static_cast<uint32_t>(entry.payload.size()));
    const bytes& header = writer.data();

    file.write(reinterpret_cast<const char*>(header.data()), header.size());
    file.write(reinterpret_cast<const char*>(entry.payload.data()), entry.payload.size());
    file.write(reinterpret_cast<const char*>(entry.signature.data()), entry.signature.size());
    file.flush();
    if (!file) {
        throw StorageException(ErrorCode::StorageWriteFailed,
            "Failed to write log record " + std::to_string(entry.seq));
    }
}

void AppendLog::insert_locked(LogEntry entry) {
    uint64_t seq = entry.seq;
    entries_.emplace(seq, std::move(entry));
    while (entries_.count(contiguous_) > 0) {
        ++contiguous_;
    }
}

uint64_t AppendLog::append(const bytes& payload) {
    if (!secret_key_) {
        throw StorageException(ErrorCode::StorageReadOnly,
            "Log " + to_hex(public_key_) + " is a read-only replica");
    }
    if (payload.size() > constants::MAX_FRAME_SIZE) {
        throw StorageException(ErrorCode::StorageWriteFailed, "Payload too large");
    }

    LogEntry entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entry.seq = contiguous_;
        entry.payload = payload;
        entry.signature = crypto::Ed25519::sign(signing_message(entry.seq, payload), *secret_key_);
        persist(entry);
        insert_locked(entry);
        remote_length_ = contiguous_;
        remote_length_known_ = true;
    }
    cv_.notify_all();
    notify_entry(entry);
    return entry.seq;
}

bool AppendLog::apply_remote(const LogEntry& entry) {
    if (entry.payload.size() > constants::MAX_FRAME_SIZE) {
        return false;
    }
    if (!crypto::Ed25519::verify(signing_message(entry.seq, entry.payload), entry.signature, public_key_)) {
        POLYGRAPH_LOG_WARN("Rejected entry {} of log {}: bad signature", entry.seq, to_hex(public_key_));
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (entries_.count(entry.seq) > 0) {
            return false;
        }
        persist(entry);
        insert_locked(entry);
        if (entry.seq + 1 > remote_length_) {
            remote_length_ = entry.seq + 1;
        }
    }
    cv_.notify_all();
    notify_entry(entry);
    return true;
}

std::optional<LogEntry> AppendLog::get(uint64_t seq) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(seq);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool AppendLog::has(uint64_t seq) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(seq) > 0;
}

uint64_t AppendLog::contiguous_length() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return contiguous_;
}

uint64_t AppendLog::length() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.empty() ? 0 : entries_.rbegin()->first + 1;
}

uint64_t AppendLog::remote_length() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return remote_length_;
}

void AppendLog::update_remote_length(uint64_t length) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        remote_length_known_ = true;
        if (length > remote_length_) {
            remote_length_ = length;
        }
    }
    cv_.notify_all();
}

std::vector<uint64_t> AppendLog::missing(uint64_t start, uint64_t end) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<uint64_t> result;
    for (uint64_t seq = start; seq < end; ++seq) {
        if (entries_.count(seq) == 0) {
            result.push_back(seq);
        }
    }
    return result;
}

bool AppendLog::download(std::chrono::milliseconds timeout) {
    if (writable()) {
        return true;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++pending_demand_;
    }
    notify_demand();

    std::unique_lock<std::mutex> lock(mutex_);
    bool complete = cv_.wait_for(lock, timeout, [this] {
        return remote_length_known_ && contiguous_ >= remote_length_;
    });
    --pending_demand_;
    return complete;
}

bool AppendLog::has_demand() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_demand_ > 0;
}

size_t AppendLog::subscribe(EntryListener listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    size_t id = next_listener_id_++;
    entry_listeners_[id] = std::move(listener);
    return id;
}

size_t AppendLog::on_demand(DemandListener listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    size_t id = next_listener_id_++;
    demand_listeners_[id] = std::move(listener);
    return id;
}

void AppendLog::unsubscribe(size_t id) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    entry_listeners_.erase(id);
    demand_listeners_.erase(id);
}

// Listeners run on the caller's thread and must not (un)subscribe
void AppendLog::notify_entry(const LogEntry& entry) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    for (auto& [id, listener] : entry_listeners_) {
        listener(entry);
    }
}

void AppendLog::notify_demand() {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    for (auto& [id, listener] : demand_listeners_) {
        listener();
    }
}

} // namespace polygraph::storage
