#include "oneiros/rpc.hpp"
#include "oneiros/errors.hpp"
#include "oneiros/log.hpp"

#include <vector>

namespace oneiros {

// ============================================================================
// rpc_response
// ============================================================================

std::optional<rpc_response> rpc_response::from_json(const json& frame) {
    if (!frame.is_object()) return std::nullopt;

    auto id_it = frame.find("id");
    if (id_it == frame.end()) return std::nullopt;

    rpc_response response;
    if (id_it->is_string()) {
        response.id = id_it->get<std::string>();
    } else if (id_it->is_number_integer()) {
        response.id = std::to_string(id_it->get<int64_t>());
    } else {
        return std::nullopt;
    }

    if (auto error = frame.find("error"); error != frame.end() && !error->is_null()) {
        response.error = *error;
    }
    if (auto result = frame.find("result"); result != frame.end()) {
        response.result = *result;
    }
    return response;
}

// ============================================================================
// rpc_call
// ============================================================================

rpc_call::~rpc_call() {
    abandon();
}

rpc_call::rpc_call(rpc_call&& other) noexcept
    : id_(std::move(other.id_)), future_(std::move(other.future_)), owner_(std::move(other.owner_)) {}

rpc_call& rpc_call::operator=(rpc_call&& other) noexcept {
    if (this != &other) {
        abandon();
        id_ = std::move(other.id_);
        future_ = std::move(other.future_);
        owner_ = std::move(other.owner_);
    }
    return *this;
}

json rpc_call::get() {
    if (!future_.valid()) {
        throw oneiros_error("rpc_call has no result to wait for");
    }
    return future_.get();
}

std::future_status rpc_call::wait_for(std::chrono::milliseconds timeout) const {
    if (!future_.valid()) return std::future_status::ready;
    return future_.wait_for(timeout);
}

void rpc_call::abandon() {
    if (!future_.valid()) return;
    if (future_.wait_for(std::chrono::seconds(0)) == std::future_status::ready) return;
    if (auto owner = owner_.lock()) {
        owner->abandon(id_);
    }
    future_ = std::future<json>();
}

// ============================================================================
// request_correlator
// ============================================================================

std::shared_ptr<request_correlator> request_correlator::create(frame_writer writer) {
    return std::shared_ptr<request_correlator>(new request_correlator(std::move(writer)));
}

request_correlator::request_correlator(frame_writer writer)
    : writer_(std::move(writer)) {
    timer_ = std::thread([this] { timer_loop(); });
}

request_correlator::~request_correlator() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    timer_cv_.notify_all();
    if (timer_.joinable()) {
        timer_.join();
    }
    fail_all("client destroyed");
}

rpc_call request_correlator::send(const std::string& method, json params,
                                  std::chrono::milliseconds timeout, completion on_result) {
    if (timeout.count() <= 0) {
        throw configuration_error("request timeout must be positive");
    }

    pending_request entry;
    entry.issued_at = std::chrono::steady_clock::now();
    entry.deadline = entry.issued_at + timeout;
    entry.method = method;
    entry.on_result = std::move(on_result);
    auto future = entry.promise.get_future();

    std::string id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        do {
            id = std::to_string(++next_id_);
        } while (pending_.count(id) != 0);
        pending_.emplace(id, std::move(entry));
    }
    timer_cv_.notify_one();

    rpc_request request{id, method, std::move(params)};
    std::string frame = request.to_json().dump();
    LOG_DEBUG("rpc", "-> %s (%s)", method.c_str(), id.c_str());

    try {
        std::lock_guard<std::mutex> lock(write_mutex_);
        writer_(frame);
    } catch (const std::exception& e) {
        LOG_ERROR("rpc", "Failed to send %s: %s", method.c_str(), e.what());
        if (auto failed = take(id)) {
            failed->promise.set_exception(std::make_exception_ptr(connection_error(e.what())));
        }
    }

    return rpc_call(id, std::move(future), weak_from_this());
}

std::optional<request_correlator::pending_request> request_correlator::take(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(id);
    if (it == pending_.end()) return std::nullopt;
    std::optional<pending_request> entry(std::move(it->second));
    pending_.erase(it);
    return entry;
}

bool request_correlator::dispatch(const rpc_response& response) {
    auto entry = take(response.id);
    if (!entry) return false;

    if (response.error) {
        const json& error = *response.error;
        int64_t code = 0;
        std::string message;
        if (error.is_object()) {
            code = error.value("code", int64_t{0});
            message = error.value("message", std::string("unknown error"));
        } else if (error.is_string()) {
            message = error.get<std::string>();
        } else {
            message = error.dump();
        }
        LOG_DEBUG("rpc", "<- %s failed: %s", entry->method.c_str(), message.c_str());
        entry->promise.set_exception(std::make_exception_ptr(remote_error(code, message)));
        return true;
    }

    json result = response.result;
    if (entry->on_result) {
        try {
            result = entry->on_result(std::move(result));
        } catch (...) {
            entry->promise.set_exception(std::current_exception());
            return true;
        }
    }
    entry->promise.set_value(std::move(result));
    return true;
}

void request_correlator::fail_all(const std::string& reason) {
    std::unordered_map<std::string, pending_request> failed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        failed.swap(pending_);
    }
    if (!failed.empty()) {
        LOG_INFO("rpc", "Failing %zu pending request(s): %s", failed.size(), reason.c_str());
    }
    for (auto& [id, entry] : failed) {
        entry.promise.set_exception(std::make_exception_ptr(connection_error(reason)));
    }
}

void request_correlator::abandon(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(id);
    if (it == pending_.end()) return;
    if (it->second.on_result) {
        // Session-affecting replies still have to be applied.
        it->second.abandoned = true;
    } else {
        pending_.erase(it);
    }
}

std::size_t request_correlator::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

bool request_correlator::is_pending(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.count(id) != 0;
}

void request_correlator::timer_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        auto now = std::chrono::steady_clock::now();
        std::vector<std::pair<std::string, pending_request>> expired;
        std::optional<std::chrono::steady_clock::time_point> next;

        for (auto it = pending_.begin(); it != pending_.end();) {
            if (it->second.deadline <= now) {
                expired.emplace_back(it->first, std::move(it->second));
                it = pending_.erase(it);
            } else {
                if (!next || it->second.deadline < *next) next = it->second.deadline;
                ++it;
            }
        }

        if (!expired.empty()) {
            lock.unlock();
            for (auto& [id, entry] : expired) {
                LOG_WARN("rpc", "Request %s (%s) timed out", id.c_str(), entry.method.c_str());
                if (!entry.abandoned) {
                    entry.promise.set_exception(std::make_exception_ptr(
                        timeout_error(entry.method + " request " + id + " timed out")));
                }
            }
            lock.lock();
            continue;
        }

        if (next) {
            timer_cv_.wait_until(lock, *next);
        } else {
            timer_cv_.wait(lock);
        }
    }
}

} // namespace oneiros
