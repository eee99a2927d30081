#pragma once

#include "encryption.hpp"
#include "rpc.hpp"
#include "types.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace oneiros {

enum class live_action {
    create,
    update,
    remove,
    close
};

const char* to_string(live_action action);

/// CREATE, UPDATE, DELETE, CLOSE (any case). Anything else is an update.
live_action parse_live_action(const std::string& text);

struct live_event {
    live_action action = live_action::update;
    std::string live_id;
    json data;
    /// Id of the changed record, when the server sends one.
    std::optional<json> record;
    /// Set when the payload could not be fully decrypted.
    std::optional<std::string> error;

    /// Parses the "result" object of a notification frame.
    static std::optional<live_event> from_json(const json& notification);
};

// ============================================================================
// notification_queue - bounded buffer behind one subscription
// ============================================================================
//
// push() never blocks: past the watermark the oldest event is discarded and
// counted. Consumers block in pop() until an event arrives or the queue is
// closed and drained.

class notification_queue {
public:
    explicit notification_queue(std::size_t watermark);

    /// False once closed.
    bool push(live_event event);

    std::optional<live_event> pop();
    std::optional<live_event> pop_for(std::chrono::milliseconds timeout);
    std::optional<live_event> try_pop();

    void close();
    bool closed() const;
    uint64_t dropped() const;
    std::size_t size() const;

private:
    std::optional<live_event> take_front();

    const std::size_t watermark_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<live_event> events_;
    uint64_t dropped_ = 0;
    bool closed_ = false;
};

// ============================================================================
// notification_stream - consumer end of a live subscription (move-only)
// ============================================================================
//
// Destroying or closing the stream unsubscribes: the router forgets the id
// and sends a kill for it.

class notification_stream {
public:
    notification_stream() = default;
    notification_stream(std::string id, std::shared_ptr<notification_queue> queue,
                        std::function<void()> on_close)
        : id_(std::move(id)), queue_(std::move(queue)), on_close_(std::move(on_close)) {}

    ~notification_stream() {
        close();
    }

    notification_stream(const notification_stream&) = delete;
    notification_stream& operator=(const notification_stream&) = delete;

    notification_stream(notification_stream&& other) noexcept
        : id_(std::move(other.id_)), queue_(std::move(other.queue_)), on_close_(std::move(other.on_close_)) {
        other.on_close_ = nullptr;
    }

    notification_stream& operator=(notification_stream&& other) noexcept {
        if (this != &other) {
            close();
            id_ = std::move(other.id_);
            queue_ = std::move(other.queue_);
            on_close_ = std::move(other.on_close_);
            other.on_close_ = nullptr;
        }
        return *this;
    }

    const std::string& id() const { return id_; }
    [[nodiscard]] bool valid() const noexcept { return queue_ != nullptr; }

    /// Blocks for the next event; nullopt once closed and drained.
    std::optional<live_event> next() { return queue_ ? queue_->pop() : std::nullopt; }
    std::optional<live_event> next_for(std::chrono::milliseconds timeout) {
        return queue_ ? queue_->pop_for(timeout) : std::nullopt;
    }
    std::optional<live_event> try_next() { return queue_ ? queue_->try_pop() : std::nullopt; }

    /// Events discarded because this consumer fell behind.
    uint64_t dropped() const { return queue_ ? queue_->dropped() : 0; }
    bool is_closed() const { return !queue_ || queue_->closed(); }

    void close() {
        if (on_close_) {
            auto fn = std::move(on_close_);
            on_close_ = nullptr;
            fn();
        }
        if (queue_) queue_->close();
    }

private:
    std::string id_;
    std::shared_ptr<notification_queue> queue_;
    std::function<void()> on_close_;
};

// ============================================================================
// live_subscription_router
// ============================================================================

class live_subscription_router : public std::enable_shared_from_this<live_subscription_router> {
public:
    static std::shared_ptr<live_subscription_router> create(
        std::shared_ptr<request_correlator> correlator,
        std::size_t watermark,
        std::chrono::milliseconds request_timeout,
        std::shared_ptr<const encryption_pipeline> pipeline = nullptr);

    /// Starts a live query on `table` and waits for the server's id.
    /// Reversible fields named by `descriptors` are decrypted before queuing.
    notification_stream subscribe(const std::string& table, bool diff,
                                  field_descriptors descriptors = {});

    /// Routes notifications for a live query started some other way
    /// (e.g. a LIVE SELECT statement).
    notification_stream attach(const std::string& live_id, const std::string& target, bool diff,
                               field_descriptors descriptors = {});

    /// Stops local delivery immediately, then sends the kill.
    rpc_call unsubscribe(const std::string& live_id);

    /// Delivers a notification frame. False when it names no registered
    /// subscription.
    bool dispatch(const json& frame);

    /// Closes every stream without sending kills (teardown and reset).
    void close_all();

    std::size_t size() const;
    bool contains(const std::string& live_id) const;

private:
    live_subscription_router(std::shared_ptr<request_correlator> correlator, std::size_t watermark,
                             std::chrono::milliseconds request_timeout,
                             std::shared_ptr<const encryption_pipeline> pipeline);

    struct live_subscription {
        std::string id;
        std::string target;
        bool diff = false;
        field_descriptors descriptors;
        std::shared_ptr<notification_queue> queue;
    };

    void register_subscription(std::shared_ptr<live_subscription> subscription);
    std::shared_ptr<live_subscription> remove(const std::string& live_id);
    notification_stream make_stream(const std::string& live_id, std::shared_ptr<notification_queue> queue);
    rpc_call send_kill(const std::string& live_id);
    /// Stream-drop path: kill only if the subscription is still registered.
    void release(const std::string& live_id);

    std::shared_ptr<request_correlator> correlator_;
    const std::size_t watermark_;
    const std::chrono::milliseconds request_timeout_;
    std::shared_ptr<const encryption_pipeline> pipeline_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<live_subscription>> subscriptions_;
};

} // namespace oneiros
