#include "network/replication_stream.hpp"
#include "polygraph/serialization.hpp"
#include "utils/logger.hpp"
#include <algorithm>

namespace polygraph::network {

// ReplicationMessage

const char* message_type_to_string(ReplicationMessage::Type type) {
    switch (type) {
        case ReplicationMessage::Type::OPEN: return "OPEN";
        case ReplicationMessage::Type::HAVE: return "HAVE";
        case ReplicationMessage::Type::REQUEST: return "REQUEST";
        case ReplicationMessage::Type::DATA: return "DATA";
    }
    return "UNKNOWN";
}

ReplicationMessage ReplicationMessage::open(const DiscoveryKey& key) {
    ReplicationMessage message;
    message.type = Type::OPEN;
    message.discovery_key = key;
    return message;
}

ReplicationMessage ReplicationMessage::have(const DiscoveryKey& key, uint64_t length) {
    ReplicationMessage message;
    message.type = Type::HAVE;
    message.discovery_key = key;
    message.length = length;
    return message;
}

ReplicationMessage ReplicationMessage::request(const DiscoveryKey& key, uint64_t start, uint64_t end) {
    ReplicationMessage message;
    message.type = Type::REQUEST;
    message.discovery_key = key;
    message.start = start;
    message.end = end;
    return message;
}

bytes ReplicationMessage::serialize() const {
    ByteWriter writer;
    writer.write_u8(static_cast<uint8_t>(type));
    writer.write_fixed(discovery_key);

    switch (type) {
        case Type::OPEN:
            break;
        case Type::HAVE:
            writer.write_u64(length);
            break;
        case Type::REQUEST:
            writer.write_u64(start);
            writer.write_u64(end);
            break;
        case Type::DATA:
            writer.write_u32(static_cast<uint32_t>(entries.size()));
            for (const auto& entry : entries) {
                writer.write_u64(entry.seq);
                writer.write_bytes(entry.payload);
                writer.write_fixed(entry.signature);
            }
            break;
    }
    return writer.take();
}

std::optional<ReplicationMessage> ReplicationMessage::deserialize(const bytes& data) {
    try {
        ByteReader reader(data);
        ReplicationMessage message;

        uint8_t type = reader.read_u8();
        if (type < static_cast<uint8_t>(Type::OPEN) || type > static_cast<uint8_t>(Type::DATA)) {
            return std::nullopt;
        }
        message.type = static_cast<Type>(type);
        message.discovery_key = reader.read_fixed<32>();

        switch (message.type) {
            case Type::OPEN:
                break;
            case Type::HAVE:
                message.length = reader.read_u64();
                break;
            case Type::REQUEST:
                message.start = reader.read_u64();
                message.end = reader.read_u64();
                break;
            case Type::DATA: {
                uint32_t count = reader.read_u32();
                for (uint32_t i = 0; i < count; ++i) {
                    storage::LogEntry entry;
                    entry.seq = reader.read_u64();
                    entry.payload = reader.read_bytes();
                    entry.signature = reader.read_fixed<constants::ED25519_SIGNATURE_SIZE>();
                    message.entries.push_back(std::move(entry));
                }
                break;
            }
        }

        if (!reader.at_end()) {
            return std::nullopt;
        }
        return message;
    } catch (const PolygraphException&) {
        return std::nullopt;
    }
}

// ReplicationStream

ReplicationStream::ReplicationStream(std::shared_ptr<Duplex> duplex)
    : duplex_(std::move(duplex))
{
}

ReplicationStream::~ReplicationStream() = default;

std::shared_ptr<ReplicationStream> ReplicationStream::create(std::shared_ptr<Duplex> duplex) {
    std::shared_ptr<ReplicationStream> stream(new ReplicationStream(std::move(duplex)));
    stream->start();
    return stream;
}

void ReplicationStream::start() {
    std::weak_ptr<ReplicationStream> weak = shared_from_this();
    duplex_->set_message_callback([weak](const bytes& data) {
        if (auto stream = weak.lock()) stream->handle(data);
    });
    duplex_->set_close_callback([weak] {
        if (auto stream = weak.lock()) stream->on_duplex_closed();
    });
}

void ReplicationStream::attach(const std::shared_ptr<storage::AppendLog>& log) {
    const DiscoveryKey key = log->discovery_key();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || channels_.count(key) > 0) {
            return;
        }
        channels_[key].log = log;
    }

    // Subscribe without holding mutex_: log listeners take it when they fire
    std::weak_ptr<ReplicationStream> weak = shared_from_this();
    size_t entry_subscription = log->subscribe([weak, key](const storage::LogEntry&) {
        if (auto stream = weak.lock()) stream->on_local_entry(key);
    });
    size_t demand_subscription = log->on_demand([weak, key] {
        if (auto stream = weak.lock()) stream->on_demand(key);
    });

    uint64_t length = log->contiguous_length();
    bool kept = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = channels_.find(key);
        if (!closed_ && it != channels_.end()) {
            it->second.entry_subscription = entry_subscription;
            it->second.demand_subscription = demand_subscription;
            it->second.advertised = length;
            kept = true;
        }
    }
    if (!kept) {
        log->unsubscribe(entry_subscription);
        log->unsubscribe(demand_subscription);
        return;
    }

    send(ReplicationMessage::open(key));
    send(ReplicationMessage::have(key, length));
    POLYGRAPH_LOG_DEBUG("Replicating log {} with {}", to_hex(key), remote_id());
}

void ReplicationStream::detach(const DiscoveryKey& discovery_key) {
    Channel channel;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = channels_.find(discovery_key);
        if (it == channels_.end()) {
            return;
        }
        channel = it->second;
        channels_.erase(it);
    }
    channel.log->unsubscribe(channel.entry_subscription);
    channel.log->unsubscribe(channel.demand_subscription);
}

void ReplicationStream::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
    }
    release_channels();
    duplex_->close();
}

bool ReplicationStream::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !closed_ && duplex_->is_open();
}

size_t ReplicationStream::log_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return channels_.size();
}

void ReplicationStream::set_close_callback(CloseCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    close_callback_ = std::move(callback);
}

void ReplicationStream::on_duplex_closed() {
    CloseCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        callback = std::move(close_callback_);
        close_callback_ = nullptr;
    }
    release_channels();
    POLYGRAPH_LOG_DEBUG("Replication stream with {} closed ({} sent, {} received)",
                        remote_id(), entries_sent_.load(), entries_received_.load());
    if (callback) {
        callback();
    }
}

void ReplicationStream::release_channels() {
    std::map<DiscoveryKey, Channel> channels;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        channels.swap(channels_);
    }
    for (auto& [key, channel] : channels) {
        channel.log->unsubscribe(channel.entry_subscription);
        channel.log->unsubscribe(channel.demand_subscription);
    }
}

std::shared_ptr<storage::AppendLog> ReplicationStream::find_log(const DiscoveryKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = channels_.find(key);
    if (it == channels_.end()) {
        return nullptr;
    }
    return it->second.log;
}

bool ReplicationStream::send(const ReplicationMessage& message) {
    return duplex_->send(message.serialize());
}

void ReplicationStream::handle(const bytes& data) {
    auto message = ReplicationMessage::deserialize(data);
    if (!message) {
        POLYGRAPH_LOG_WARN("Malformed replication message from {} ({} bytes)", remote_id(), data.size());
        return;
    }

    auto log = find_log(message->discovery_key);
    if (!log) {
        // Peer carries a log we do not replicate
        return;
    }

    POLYGRAPH_LOG_TRACE("{} {} from {}", message_type_to_string(message->type),
                        to_hex(message->discovery_key), remote_id());

    switch (message->type) {
        case ReplicationMessage::Type::OPEN: {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                auto it = channels_.find(message->discovery_key);
                if (it != channels_.end()) it->second.remote_open = true;
            }
            send(ReplicationMessage::have(message->discovery_key, log->contiguous_length()));
            break;
        }
        case ReplicationMessage::Type::HAVE:
            handle_have(log, message->length);
            break;
        case ReplicationMessage::Type::REQUEST:
            handle_request(log, message->start, message->end);
            break;
        case ReplicationMessage::Type::DATA:
            handle_data(log, message->entries);
            break;
    }
}

void ReplicationStream::handle_have(const std::shared_ptr<storage::AppendLog>& log, uint64_t length) {
    if (log->writable()) {
        return;
    }
    log->update_remote_length(length);
    if (!log->sparse() || log->has_demand()) {
        request_missing(log);
    }
}

void ReplicationStream::handle_request(const std::shared_ptr<storage::AppendLog>& log,
                                       uint64_t start, uint64_t end) {
    end = std::min(end, log->length());

    ReplicationMessage data;
    data.type = ReplicationMessage::Type::DATA;
    data.discovery_key = log->discovery_key();

    for (uint64_t seq = start; seq < end; ++seq) {
        auto entry = log->get(seq);
        if (!entry) continue;
        data.entries.push_back(std::move(*entry));

        if (data.entries.size() >= constants::MAX_ENTRIES_PER_DATA_MESSAGE) {
            entries_sent_ += data.entries.size();
            if (!send(data)) return;
            data.entries.clear();
        }
    }

    if (!data.entries.empty()) {
        entries_sent_ += data.entries.size();
        send(data);
    }
}

void ReplicationStream::handle_data(const std::shared_ptr<storage::AppendLog>& log,
                                    const std::vector<storage::LogEntry>& entries) {
    if (log->writable()) {
        return;
    }
    for (const auto& entry : entries) {
        if (log->apply_remote(entry)) {
            ++entries_received_;
        }
    }
}

void ReplicationStream::on_local_entry(const DiscoveryKey& key) {
    uint64_t length = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = channels_.find(key);
        if (it == channels_.end()) {
            return;
        }
        length = it->second.log->contiguous_length();
        if (length <= it->second.advertised) {
            return;
        }
        it->second.advertised = length;
    }
    send(ReplicationMessage::have(key, length));
}

void ReplicationStream::on_demand(const DiscoveryKey& key) {
    auto log = find_log(key);
    if (!log) {
        return;
    }
    // OPEN makes the peer answer with its current length
    send(ReplicationMessage::open(key));
    request_missing(log);
}

void ReplicationStream::request_missing(const std::shared_ptr<storage::AppendLog>& log) {
    uint64_t start = log->contiguous_length();
    uint64_t end = log->remote_length();
    if (end > start) {
        send(ReplicationMessage::request(log->discovery_key(), start, end));
    }
}

} // namespace polygraph::network
