#pragma once

#include "polygraph/common.hpp"
#include "polygraph/error.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace polygraph::network {

/**
 * How a swarm takes part in a topic: announce it (server), look it up
 * (client), or both. Two swarms connect when one's client side meets the
 * other's server side on a shared topic.
 */
struct JoinOptions {
    bool server = true;
    bool client = true;
};

/**
 * Duplex - Message channel to one peer, established by a Swarm.
 *
 * Callbacks are installed from the swarm's connection callback; messages are
 * delivered only after it returns, one at a time and in order.
 */
class Duplex {
public:
    using MessageCallback = std::function<void(const bytes&)>;
    using CloseCallback = std::function<void()>;

    virtual ~Duplex() = default;

    // @return false if the channel is closed
    virtual bool send(const bytes& message) = 0;
    virtual void close() = 0;
    virtual bool is_open() const = 0;

    // Identifier of the swarm on the other side
    virtual std::string remote_id() const = 0;
    virtual bool is_initiator() const = 0;

    void set_message_callback(MessageCallback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        message_callback_ = std::move(callback);
    }

    void set_close_callback(CloseCallback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        close_callback_ = std::move(callback);
    }

protected:
    void on_message(const bytes& message) {
        MessageCallback callback;
        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            callback = message_callback_;
        }
        if (callback) callback(message);
    }

    void on_close() {
        CloseCallback callback;
        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            callback = std::move(close_callback_);
            close_callback_ = nullptr;
            message_callback_ = nullptr;
        }
        if (callback) callback();
    }

private:
    std::mutex callback_mutex_;
    MessageCallback message_callback_;
    CloseCallback close_callback_;
};

/**
 * Swarm - Topic-based peer discovery and connection management
 */
class Swarm {
public:
    using ConnectionCallback = std::function<void(std::shared_ptr<Duplex>)>;

    virtual ~Swarm() = default;

    virtual void set_connection_callback(ConnectionCallback callback) = 0;

    /**
     * Start announcing and/or looking up a topic
     * @return error if the swarm cannot serve or reach the network
     */
    virtual Result<void> join(const DiscoveryKey& topic, const JoinOptions& options) = 0;

    // Stop discovery for a topic; established connections stay open
    virtual void leave(const DiscoveryKey& topic) = 0;

    /**
     * Wait until connection attempts triggered so far have settled
     * @return NetworkTimeout if the deadline passed first
     */
    virtual Result<void> flush(std::chrono::milliseconds timeout) = 0;

    // Close every connection and stop all discovery; idempotent
    virtual void destroy() = 0;

    virtual size_t connection_count() const = 0;
    virtual std::vector<DiscoveryKey> topics() const = 0;

    // Identifier other peers see in remote_id()
    virtual std::string id() const = 0;
};

} // namespace polygraph::network
