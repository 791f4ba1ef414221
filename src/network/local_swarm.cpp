#include "network/local_swarm.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <future>

namespace polygraph::network {

namespace {
    struct PendingLink {
        std::weak_ptr<LocalSwarm> initiator;
        std::weak_ptr<LocalSwarm> responder;
        std::string initiator_id;
        std::string responder_id;
    };

    std::pair<std::string, std::string> link_key(const std::string& a, const std::string& b) {
        return a < b ? std::make_pair(a, b) : std::make_pair(b, a);
    }
}

// LocalSwarmHub implementation

LocalSwarmHub::LocalSwarmHub()
    : dispatcher_([this] { run(); })
{
}

LocalSwarmHub::~LocalSwarmHub() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stopping_ = true;
    }
    queue_cv_.notify_all();

    if (dispatcher_.joinable()) {
        // The last owner may be released by a task on the dispatcher itself
        if (dispatcher_.get_id() == std::this_thread::get_id()) {
            dispatcher_.detach();
        } else {
            dispatcher_.join();
        }
    }
}

std::shared_ptr<LocalSwarm> LocalSwarmHub::create_swarm() {
    std::string id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = "local-" + std::to_string(next_swarm_++);
    }
    auto swarm = std::make_shared<LocalSwarm>(shared_from_this(), id);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        members_[id].swarm = swarm;
    }
    return swarm;
}

size_t LocalSwarmHub::swarm_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return members_.size();
}

void LocalSwarmHub::post(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stopping_) return;
        queue_.push_back(std::move(task));
    }
    queue_cv_.notify_one();
}

void LocalSwarmHub::run() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (stopping_) {
                return;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
        }

        try {
            task();
        } catch (const std::exception& e) {
            POLYGRAPH_LOG_ERROR("Local swarm delivery failed: {}", e.what());
        }
    }
}

void LocalSwarmHub::register_topic(const std::string& swarm_id, const DiscoveryKey& topic,
                                   const JoinOptions& options) {
    std::vector<PendingLink> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto self_it = members_.find(swarm_id);
        if (self_it == members_.end()) {
            return;
        }
        self_it->second.topics[topic] = options;

        for (auto& [other_id, member] : members_) {
            if (other_id == swarm_id) continue;
            auto topic_it = member.topics.find(topic);
            if (topic_it == member.topics.end()) continue;

            const JoinOptions& theirs = topic_it->second;
            bool we_dial = options.client && theirs.server;
            bool they_dial = options.server && theirs.client;
            if (!we_dial && !they_dial) continue;
            if (!links_.insert(link_key(swarm_id, other_id)).second) continue;

            if (we_dial) {
                pending.push_back(PendingLink{self_it->second.swarm, member.swarm, swarm_id, other_id});
            } else {
                pending.push_back(PendingLink{member.swarm, self_it->second.swarm, other_id, swarm_id});
            }
        }
    }

    for (const auto& link : pending) {
        auto ends = LocalDuplex::create_pair(shared_from_this(), link.initiator_id, link.responder_id);
        post([link, ends] {
            auto a = link.initiator.lock();
            auto b = link.responder.lock();
            if (!a || !b) {
                ends.first->close();
                return;
            }
            a->accept(ends.first);
            b->accept(ends.second);
        });
        POLYGRAPH_LOG_DEBUG("Local swarm {} -> {} connecting", link.initiator_id, link.responder_id);
    }
}

void LocalSwarmHub::unregister_topic(const std::string& swarm_id, const DiscoveryKey& topic) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = members_.find(swarm_id);
    if (it != members_.end()) {
        it->second.topics.erase(topic);
    }
}

void LocalSwarmHub::remove_swarm(const std::string& swarm_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    members_.erase(swarm_id);
    for (auto it = links_.begin(); it != links_.end();) {
        if (it->first == swarm_id || it->second == swarm_id) {
            it = links_.erase(it);
        } else {
            ++it;
        }
    }
}

void LocalSwarmHub::unlink(const std::string& a, const std::string& b) {
    std::lock_guard<std::mutex> lock(mutex_);
    links_.erase(link_key(a, b));
}

// LocalDuplex implementation

LocalDuplex::LocalDuplex(std::weak_ptr<LocalSwarmHub> hub, std::string local_id,
                         std::string remote_id, bool initiator)
    : hub_(std::move(hub))
    , local_id_(std::move(local_id))
    , remote_id_(std::move(remote_id))
    , initiator_(initiator)
{
}

std::pair<std::shared_ptr<LocalDuplex>, std::shared_ptr<LocalDuplex>>
LocalDuplex::create_pair(const std::shared_ptr<LocalSwarmHub>& hub,
                         const std::string& initiator_id, const std::string& responder_id) {
    auto a = std::make_shared<LocalDuplex>(hub, initiator_id, responder_id, true);
    auto b = std::make_shared<LocalDuplex>(hub, responder_id, initiator_id, false);
    a->peer_ = b;
    b->peer_ = a;
    return {a, b};
}

bool LocalDuplex::send(const bytes& message) {
    if (!open_) {
        return false;
    }
    auto hub = hub_.lock();
    auto peer = peer_.lock();
    if (!hub || !peer) {
        return false;
    }
    hub->post([peer, message] { peer->deliver(message); });
    return true;
}

void LocalDuplex::deliver(const bytes& message) {
    if (open_) {
        on_message(message);
    }
}

void LocalDuplex::close() {
    if (!open_.exchange(false)) {
        return;
    }
    if (auto peer = peer_.lock()) {
        peer->close_from_peer();
    }
    if (auto hub = hub_.lock()) {
        hub->unlink(local_id_, remote_id_);
        auto self = shared_from_this();
        hub->post([self] { self->on_close(); });
    }
}

void LocalDuplex::close_from_peer() {
    if (!open_.exchange(false)) {
        return;
    }
    if (auto hub = hub_.lock()) {
        auto self = shared_from_this();
        hub->post([self] { self->on_close(); });
    }
}

// LocalSwarm implementation

LocalSwarm::LocalSwarm(std::shared_ptr<LocalSwarmHub> hub, std::string id)
    : hub_(std::move(hub))
    , id_(std::move(id))
{
}

LocalSwarm::~LocalSwarm() {
    destroy();
}

void LocalSwarm::set_connection_callback(ConnectionCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    callback_ = std::move(callback);
}

Result<void> LocalSwarm::join(const DiscoveryKey& topic, const JoinOptions& options) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (destroyed_) {
            return Result<void>::Err(ErrorCode::NetworkDisconnected, "Swarm " + id_ + " was destroyed");
        }
        topics_[topic] = options;
    }
    hub_->register_topic(id_, topic, options);
    return Result<void>::Ok();
}

void LocalSwarm::leave(const DiscoveryKey& topic) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        topics_.erase(topic);
    }
    hub_->unregister_topic(id_, topic);
}

Result<void> LocalSwarm::flush(std::chrono::milliseconds timeout) {
    // Everything queued before this marker has been delivered once it runs
    auto marker = std::make_shared<std::promise<void>>();
    auto done = marker->get_future();
    hub_->post([marker] { marker->set_value(); });

    if (done.wait_for(timeout) != std::future_status::ready) {
        return Result<void>::Err(ErrorCode::NetworkTimeout,
            "Swarm " + id_ + " flush timed out after " + std::to_string(timeout.count()) + " ms");
    }
    return Result<void>::Ok();
}

void LocalSwarm::destroy() {
    std::vector<std::shared_ptr<LocalDuplex>> connections;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (destroyed_) {
            return;
        }
        destroyed_ = true;
        topics_.clear();
        callback_ = nullptr;
        connections.swap(connections_);
    }

    hub_->remove_swarm(id_);
    for (auto& connection : connections) {
        connection->close();
    }
}

size_t LocalSwarm::connection_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& connection : connections_) {
        if (connection->is_open()) ++count;
    }
    return count;
}

std::vector<DiscoveryKey> LocalSwarm::topics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DiscoveryKey> result;
    for (const auto& [topic, options] : topics_) {
        result.push_back(topic);
    }
    return result;
}

void LocalSwarm::accept(const std::shared_ptr<LocalDuplex>& duplex) {
    ConnectionCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (destroyed_) {
            duplex->close();
            return;
        }
        connections_.erase(
            std::remove_if(connections_.begin(), connections_.end(),
                           [](const std::shared_ptr<LocalDuplex>& c) { return !c->is_open(); }),
            connections_.end());
        connections_.push_back(duplex);
        callback = callback_;
    }

    if (callback) {
        callback(duplex);
    }
}

} // namespace polygraph::network
