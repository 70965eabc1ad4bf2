#pragma once
/*
rtmlink - ConnectionStateMachine
Role: Owns the lifecycle state of one client and serializes check-then-act transitions.
Threading: All transitions run under one mutex; state() is a lock-free atomic read.
           Transition observers are invoked after the mutex is released, in transition order
           for any single thread driving the machine.
Related: RtmClient.cpp, FrameReceiver.cpp.
*/
#include "realtime/RtmTypes.hpp"
#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace rtmlink {

class ConnectionStateMachine {
public:
    using Observer = std::function<void(RunState from, RunState to)>;

    explicit ConnectionStateMachine(Observer observer = {});

    [[nodiscard]] RunState state() const noexcept { return m_state.load(std::memory_order_acquire); }

    // Moves from -> to when the current state equals from.
    // Returns the state that was observed, so callers can report why a claim failed.
    [[nodiscard]] std::optional<RunState> tryTransition(RunState from, RunState to);

    // As above; onClaimed runs under the state lock right after the move and before any observer,
    // so whatever it reads belongs to the lifecycle phase that was just claimed.
    template <class F>
    [[nodiscard]] std::optional<RunState> tryTransition(RunState from, RunState to, F&& onClaimed) {
        if (!isLegal(from, to)) {
            throw std::logic_error(illegalTransitionMessage(from, to));
        }
        {
            std::lock_guard<std::mutex> lock(m_mx);
            const RunState current = m_state.load(std::memory_order_relaxed);
            if (current != from) {
                return current;
            }
            m_state.store(to, std::memory_order_release);
            onClaimed();
        }
        notify({{from, to}});
        return std::nullopt;
    }

    // Runs action under the state lock when the current state equals required; throws
    // InvalidRunningStateError otherwise. Used for properties that may change only while Stopped.
    template <class F>
    void guarded(RunState required, const char* what, F&& action) {
        std::lock_guard<std::mutex> lock(m_mx);
        const RunState current = m_state.load(std::memory_order_relaxed);
        if (current != required) {
            throw InvalidRunningStateError(invalidStateMessage(what, current, required), current);
        }
        action();
    }

    // Loop-exit path: Started -> Stopping -> Stopped, or Stopping -> Stopped.
    // No-op from Stopped, so a second call cannot emit a duplicate transition.
    void finishStopping();

    // Only forward edges plus the handshake-failure revert Starting -> Stopped
    [[nodiscard]] static bool isLegal(RunState from, RunState to) noexcept;

private:
    mutable std::mutex m_mx;
    std::atomic<RunState> m_state{RunState::Stopped};
    Observer m_observer;

    void notify(const std::vector<StateTransition>& transitions) const;
    static std::string illegalTransitionMessage(RunState from, RunState to);
    static std::string invalidStateMessage(const char* what, RunState current, RunState required);
};

} // namespace rtmlink
