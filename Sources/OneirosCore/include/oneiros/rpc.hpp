#pragma once

#include "types.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

namespace oneiros {

// ============================================================================
// Wire envelopes
// ============================================================================

/// Outbound {"id","method","params"}.
struct rpc_request {
    std::string id;
    std::string method;
    json params = json::array();

    json to_json() const {
        return json{{"id", id}, {"method", method}, {"params", params}};
    }
};

/// Inbound {"id","result"} or {"id","error":{"code","message"}}.
struct rpc_response {
    std::string id;
    json result;
    std::optional<json> error;

    /// nullopt when the frame carries no usable top-level id.
    static std::optional<rpc_response> from_json(const json& frame);
};

class request_correlator;

// ============================================================================
// rpc_call - handle to one in-flight request
// ============================================================================
//
// Dropping an unresolved handle forgets the pending request locally. The
// server still runs the operation; its reply is discarded on arrival.

class rpc_call {
public:
    rpc_call() = default;
    ~rpc_call();

    rpc_call(const rpc_call&) = delete;
    rpc_call& operator=(const rpc_call&) = delete;
    rpc_call(rpc_call&& other) noexcept;
    rpc_call& operator=(rpc_call&& other) noexcept;

    const std::string& id() const { return id_; }
    [[nodiscard]] bool valid() const noexcept { return future_.valid(); }

    /// Blocks until resolved. Rethrows remote_error, timeout_error or
    /// connection_error. May be called once.
    json get();

    std::future_status wait_for(std::chrono::milliseconds timeout) const;

private:
    friend class request_correlator;
    rpc_call(std::string id, std::future<json> future, std::weak_ptr<request_correlator> owner)
        : id_(std::move(id)), future_(std::move(future)), owner_(std::move(owner)) {}

    void abandon();

    std::string id_;
    std::future<json> future_;
    std::weak_ptr<request_correlator> owner_;
};

// ============================================================================
// request_correlator - pending table, id assignment, deadline expiry
// ============================================================================
//
// send() registers the pending entry before the frame is written, so a reply
// delivered synchronously from inside the write still finds its waiter.
// Writes are serialized by a dedicated mutex; the pending table lock is never
// held while writing or while resolving a future.

class request_correlator : public std::enable_shared_from_this<request_correlator> {
public:
    using frame_writer = std::function<void(const std::string& frame)>;

    /// Runs on the demultiplexer before the waiter is resolved; its return
    /// value becomes the call's result and a throw becomes its failure.
    using completion = std::function<json(json result)>;

    static std::shared_ptr<request_correlator> create(frame_writer writer);
    ~request_correlator();

    request_correlator(const request_correlator&) = delete;
    request_correlator& operator=(const request_correlator&) = delete;

    rpc_call send(const std::string& method, json params,
                  std::chrono::milliseconds timeout,
                  completion on_result = nullptr);

    /// Resolves the matching pending request exactly once. False when the id
    /// is not pending (expired, abandoned, never sent, or a notification).
    bool dispatch(const rpc_response& response);

    /// Resolves every pending request with connection_error(reason).
    void fail_all(const std::string& reason);

    std::size_t pending_count() const;
    bool is_pending(const std::string& id) const;

private:
    explicit request_correlator(frame_writer writer);

    struct pending_request {
        std::chrono::steady_clock::time_point issued_at;
        std::chrono::steady_clock::time_point deadline;
        std::string method;
        std::promise<json> promise;
        completion on_result;
        bool abandoned = false;
    };

    friend class rpc_call;
    void abandon(const std::string& id);
    std::optional<pending_request> take(const std::string& id);
    void timer_loop();

    frame_writer writer_;
    std::mutex write_mutex_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, pending_request> pending_;
    uint64_t next_id_ = 0;

    std::condition_variable timer_cv_;
    bool stopping_ = false;
    std::thread timer_;
};

} // namespace oneiros
