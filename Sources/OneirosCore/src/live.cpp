#include "oneiros/live.hpp"
#include "oneiros/errors.hpp"
#include "oneiros/log.hpp"

#include <algorithm>
#include <cctype>

namespace oneiros {

const char* to_string(live_action action) {
    switch (action) {
        case live_action::create: return "CREATE";
        case live_action::update: return "UPDATE";
        case live_action::remove: return "DELETE";
        case live_action::close: return "CLOSE";
    }
    return "UPDATE";
}

live_action parse_live_action(const std::string& text) {
    std::string upper(text);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "CREATE") return live_action::create;
    if (upper == "DELETE") return live_action::remove;
    if (upper == "CLOSE") return live_action::close;
    return live_action::update;
}

std::optional<live_event> live_event::from_json(const json& notification) {
    if (!notification.is_object()) return std::nullopt;
    auto id = notification.find("id");
    if (id == notification.end() || !id->is_string()) return std::nullopt;

    live_event event;
    event.live_id = id->get<std::string>();
    if (auto action = notification.find("action"); action != notification.end() && action->is_string()) {
        event.action = parse_live_action(action->get<std::string>());
    }
    if (auto result = notification.find("result"); result != notification.end()) {
        event.data = *result;
    }
    if (auto record = notification.find("record"); record != notification.end() && !record->is_null()) {
        event.record = *record;
    }
    return event;
}

// ============================================================================
// notification_queue
// ============================================================================

notification_queue::notification_queue(std::size_t watermark)
    : watermark_(std::max<std::size_t>(watermark, 1)) {}

bool notification_queue::push(live_event event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return false;
        if (events_.size() >= watermark_) {
            events_.pop_front();
            ++dropped_;
            LOG_WARN("live", "Subscription %s is behind, dropped oldest event (%llu lost)",
                     event.live_id.c_str(), static_cast<unsigned long long>(dropped_));
        }
        events_.push_back(std::move(event));
    }
    cv_.notify_one();
    return true;
}

std::optional<live_event> notification_queue::take_front() {
    if (events_.empty()) return std::nullopt;
    live_event event = std::move(events_.front());
    events_.pop_front();
    return event;
}

std::optional<live_event> notification_queue::pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !events_.empty() || closed_; });
    return take_front();
}

std::optional<live_event> notification_queue::pop_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return !events_.empty() || closed_; });
    return take_front();
}

std::optional<live_event> notification_queue::try_pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    return take_front();
}

void notification_queue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool notification_queue::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

uint64_t notification_queue::dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

std::size_t notification_queue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

// ============================================================================
// live_subscription_router
// ============================================================================

std::shared_ptr<live_subscription_router> live_subscription_router::create(
    std::shared_ptr<request_correlator> correlator, std::size_t watermark,
    std::chrono::milliseconds request_timeout, std::shared_ptr<const encryption_pipeline> pipeline) {
    return std::shared_ptr<live_subscription_router>(new live_subscription_router(
        std::move(correlator), watermark, request_timeout, std::move(pipeline)));
}

live_subscription_router::live_subscription_router(std::shared_ptr<request_correlator> correlator,
                                                   std::size_t watermark,
                                                   std::chrono::milliseconds request_timeout,
                                                   std::shared_ptr<const encryption_pipeline> pipeline)
    : correlator_(std::move(correlator))
    , watermark_(watermark)
    , request_timeout_(request_timeout)
    , pipeline_(std::move(pipeline)) {
    if (!correlator_) {
        throw configuration_error("live subscription router needs a request correlator");
    }
}

notification_stream live_subscription_router::subscribe(const std::string& table, bool diff,
                                                        field_descriptors descriptors) {
    if (table.empty()) {
        throw missing_target("live query needs a table");
    }

    auto queue = std::make_shared<notification_queue>(watermark_);
    std::weak_ptr<live_subscription_router> weak_self = weak_from_this();

    // Registration happens on the demultiplexer as the acknowledgement is
    // processed, so no notification that follows it can be missed.
    auto on_ack = [weak_self, table, diff, descriptors = std::move(descriptors), queue](json result) {
        if (!result.is_string()) {
            throw oneiros_error("live query returned no subscription id");
        }
        if (auto self = weak_self.lock()) {
            auto subscription = std::make_shared<live_subscription>();
            subscription->id = result.get<std::string>();
            subscription->target = table;
            subscription->diff = diff;
            subscription->descriptors = descriptors;
            subscription->queue = queue;
            self->register_subscription(std::move(subscription));
        }
        return result;
    };

    auto call = correlator_->send("live", json::array({table, diff}), request_timeout_, std::move(on_ack));
    std::string live_id = call.get().get<std::string>();
    return make_stream(live_id, std::move(queue));
}

notification_stream live_subscription_router::attach(const std::string& live_id, const std::string& target,
                                                     bool diff, field_descriptors descriptors) {
    if (live_id.empty()) {
        throw configuration_error("live subscription id must not be empty");
    }
    auto subscription = std::make_shared<live_subscription>();
    subscription->id = live_id;
    subscription->target = target;
    subscription->diff = diff;
    subscription->descriptors = std::move(descriptors);
    subscription->queue = std::make_shared<notification_queue>(watermark_);
    auto queue = subscription->queue;
    register_subscription(std::move(subscription));
    return make_stream(live_id, std::move(queue));
}

notification_stream live_subscription_router::make_stream(const std::string& live_id,
                                                          std::shared_ptr<notification_queue> queue) {
    std::weak_ptr<live_subscription_router> weak_self = weak_from_this();
    return notification_stream(live_id, std::move(queue), [weak_self, live_id] {
        if (auto self = weak_self.lock()) {
            self->release(live_id);
        }
    });
}

void live_subscription_router::register_subscription(std::shared_ptr<live_subscription> subscription) {
    std::lock_guard<std::mutex> lock(mutex_);
    LOG_DEBUG("live", "Subscribed %s on %s", subscription->id.c_str(), subscription->target.c_str());
    auto& slot = subscriptions_[subscription->id];
    if (slot) {
        slot->queue->close();
    }
    slot = std::move(subscription);
}

std::shared_ptr<live_subscription_router::live_subscription>
live_subscription_router::remove(const std::string& live_id) {
    std::shared_ptr<live_subscription> removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = subscriptions_.find(live_id);
        if (it == subscriptions_.end()) return nullptr;
        removed = std::move(it->second);
        subscriptions_.erase(it);
    }
    removed->queue->close();
    return removed;
}

rpc_call live_subscription_router::send_kill(const std::string& live_id) {
    // A pass-through completion keeps the entry registered if the caller
    // drops the handle, so the acknowledgement is consumed quietly.
    return correlator_->send("kill", json::array({live_id}), request_timeout_,
                             [](json result) { return result; });
}

rpc_call live_subscription_router::unsubscribe(const std::string& live_id) {
    remove(live_id);
    return send_kill(live_id);
}

void live_subscription_router::release(const std::string& live_id) {
    if (remove(live_id)) {
        send_kill(live_id);
    }
}

bool live_subscription_router::dispatch(const json& frame) {
    if (!frame.is_object()) return false;
    auto result = frame.find("result");
    if (result == frame.end()) return false;

    auto event = live_event::from_json(*result);
    if (!event) return false;

    std::shared_ptr<live_subscription> subscription;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = subscriptions_.find(event->live_id);
        if (it != subscriptions_.end()) subscription = it->second;
    }
    if (!subscription) {
        LOG_DEBUG("live", "Dropping notification for unknown subscription %s", event->live_id.c_str());
        return false;
    }

    if (pipeline_ && !subscription->descriptors.empty() && event->data.is_object()) {
        auto failures = pipeline_->decrypt_fields(event->data, subscription->descriptors);
        if (!failures.empty()) {
            std::string message;
            for (const auto& failure : failures) {
                if (!message.empty()) message += "; ";
                message += failure.what();
            }
            event->error = std::move(message);
        }
    }

    bool closing = event->action == live_action::close;
    subscription->queue->push(std::move(*event));
    if (closing) {
        remove(subscription->id);
    }
    return true;
}

void live_subscription_router::close_all() {
    std::unordered_map<std::string, std::shared_ptr<live_subscription>> closed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed.swap(subscriptions_);
    }
    if (!closed.empty()) {
        LOG_INFO("live", "Closing %zu live subscription(s)", closed.size());
    }
    for (auto& [id, subscription] : closed) {
        subscription->queue->close();
    }
}

std::size_t live_subscription_router::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_.size();
}

bool live_subscription_router::contains(const std::string& live_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_.count(live_id) != 0;
}

} // namespace oneiros
