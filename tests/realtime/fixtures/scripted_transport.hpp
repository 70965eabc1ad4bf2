#pragma once
#include "realtime/RtmClient.hpp"
#include "realtime/RtmTypes.hpp"
#include "realtime/ws/WsTransport.hpp"
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>

/// In-memory stand-in for the network. Tests feed frames through a shared TransportScript;
/// the client owns the ScriptedTransport built from it.
/// receive() blocks until a step is queued or stop is requested, like a socket read would.
namespace fixtures {

class TransportScript {
public:
    enum class ConnectMode { Succeed, Timeout, Fail };

    struct Step {
        enum class Kind { Frame, Close, Fault } kind;
        rtmlink::FrameKind frameKind{rtmlink::FrameKind::Text};
        std::string bytes;
        bool final{true};
        std::string error;
    };

    // Frames longer than the client's read buffer are delivered in several chunks
    void pushText(std::string payload, bool final = true) {
        push(Step{Step::Kind::Frame, rtmlink::FrameKind::Text, std::move(payload), final, {}});
    }
    void pushBinary(std::string payload, bool final = true) {
        push(Step{Step::Kind::Frame, rtmlink::FrameKind::Binary, std::move(payload), final, {}});
    }
    void pushClose() { push(Step{Step::Kind::Close, rtmlink::FrameKind::Close, {}, true, {}}); }
    void pushFault(std::string error) {
        push(Step{Step::Kind::Fault, rtmlink::FrameKind::Text, {}, true, std::move(error)});
    }

    void setConnectMode(ConnectMode mode, std::string error = "connection refused") {
        std::lock_guard lock(mx_);
        connectMode_ = mode;
        connectError_ = std::move(error);
    }

    // true once a receive() is blocked on an empty queue
    bool waitForPendingReceive(std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock lock(mx_);
        return cv_.wait_for(lock, timeout, [this] { return receivePending_; });
    }

    // true once every queued step has been consumed
    bool waitUntilDrained(std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock lock(mx_);
        return cv_.wait_for(lock, timeout, [this] { return steps_.empty() && receivePending_; });
    }

    int connectCalls() const { std::lock_guard lock(mx_); return connectCalls_; }
    int closeCalls() const { std::lock_guard lock(mx_); return closeCalls_; }
    int transportsDestroyed() const { std::lock_guard lock(mx_); return destroyed_; }
    std::string lastUrl() const { std::lock_guard lock(mx_); return lastUrl_; }
    std::chrono::milliseconds lastTimeout() const { std::lock_guard lock(mx_); return lastTimeout_; }

private:
    friend class ScriptedTransport;

    mutable std::mutex mx_;
    std::condition_variable_any cv_;
    std::deque<Step> steps_;
    ConnectMode connectMode_{ConnectMode::Succeed};
    std::string connectError_;
    bool receivePending_{false};
    int connectCalls_{0};
    int closeCalls_{0};
    int destroyed_{0};
    std::string lastUrl_;
    std::chrono::milliseconds lastTimeout_{0};

    void push(Step step) {
        {
            std::lock_guard lock(mx_);
            steps_.push_back(std::move(step));
        }
        cv_.notify_all();
    }
};

class ScriptedTransport : public rtmlink::WsTransport {
public:
    explicit ScriptedTransport(std::shared_ptr<TransportScript> script) : script_(std::move(script)) {}

    ~ScriptedTransport() override {
        std::lock_guard lock(script_->mx_);
        ++script_->destroyed_;
    }

    void connect(const std::string& url, std::chrono::milliseconds timeout) override {
        std::lock_guard lock(script_->mx_);
        ++script_->connectCalls_;
        script_->lastUrl_ = url;
        script_->lastTimeout_ = timeout;
        switch (script_->connectMode_) {
            case TransportScript::ConnectMode::Succeed: return;
            case TransportScript::ConnectMode::Timeout:
                throw rtmlink::HandshakeTimeoutError("websocket handshake timed out");
            case TransportScript::ConnectMode::Fail:
                throw rtmlink::TransportError(script_->connectError_);
        }
    }

    rtmlink::ReceiveResult receive(std::span<char> buffer, std::stop_token stop) override {
        std::unique_lock lock(script_->mx_);
        script_->receivePending_ = script_->steps_.empty();
        script_->cv_.notify_all();
        const bool ready = script_->cv_.wait(lock, stop, [this] { return !script_->steps_.empty(); });
        script_->receivePending_ = false;
        if (!ready) {
            return rtmlink::ReceiveResult::stopped();
        }

        auto& step = script_->steps_.front();
        if (step.kind == TransportScript::Step::Kind::Close) {
            script_->steps_.pop_front();
            return rtmlink::ReceiveResult::of(rtmlink::FrameKind::Close, 0, true);
        }
        if (step.kind == TransportScript::Step::Kind::Fault) {
            const std::string error = step.error;
            script_->steps_.pop_front();
            throw rtmlink::TransportError(error);
        }

        const std::size_t n = std::min(buffer.size(), step.bytes.size());
        std::memcpy(buffer.data(), step.bytes.data(), n);
        const rtmlink::FrameKind kind = step.frameKind;
        bool final = step.final;
        if (n < step.bytes.size()) {
            step.bytes.erase(0, n);
            final = false;
        } else {
            script_->steps_.pop_front();
        }
        return rtmlink::ReceiveResult::of(kind, n, final);
    }

    void close() noexcept override {
        std::lock_guard lock(script_->mx_);
        ++script_->closeCalls_;
    }

private:
    std::shared_ptr<TransportScript> script_;
};

inline rtmlink::RtmClient::TransportFactory scriptedFactory(std::shared_ptr<TransportScript> script) {
    return [script] { return std::make_unique<ScriptedTransport>(script); };
}

} // namespace fixtures
