#include "ConnectionStateMachine.hpp"
#include "Log.hpp"
#include <fmt/format.h>

namespace rtmlink {

ConnectionStateMachine::ConnectionStateMachine(Observer observer)
    : m_observer(std::move(observer))
{}

bool ConnectionStateMachine::isLegal(RunState from, RunState to) noexcept {
    switch (from) {
        case RunState::Stopped:  return to == RunState::Starting;
        case RunState::Starting: return to == RunState::Started || to == RunState::Stopped;
        case RunState::Started:  return to == RunState::Stopping;
        case RunState::Stopping: return to == RunState::Stopped;
    }
    return false;
}

std::optional<RunState> ConnectionStateMachine::tryTransition(RunState from, RunState to) {
    return tryTransition(from, to, [] {});
}

void ConnectionStateMachine::finishStopping() {
    std::vector<StateTransition> transitions;
    {
        std::lock_guard<std::mutex> lock(m_mx);
        const RunState current = m_state.load(std::memory_order_relaxed);
        if (current == RunState::Started) {
            transitions.push_back({RunState::Started, RunState::Stopping});
        }
        if (current == RunState::Started || current == RunState::Stopping) {
            transitions.push_back({RunState::Stopping, RunState::Stopped});
            m_state.store(RunState::Stopped, std::memory_order_release);
        }
    }
    notify(transitions);
}

void ConnectionStateMachine::notify(const std::vector<StateTransition>& transitions) const {
    for (const auto& t : transitions) {
        RTMLINK_LOG_T("rtm", "RunState changed: {} -> {}", toString(t.from), toString(t.to));
        if (m_observer) {
            m_observer(t.from, t.to);
        }
    }
}

std::string ConnectionStateMachine::illegalTransitionMessage(RunState from, RunState to) {
    return fmt::format("illegal transition {} -> {}", toString(from), toString(to));
}

std::string ConnectionStateMachine::invalidStateMessage(const char* what, RunState current, RunState required) {
    return fmt::format("Invalid RunState for {}: currently {} but only {} is allowed",
                       what, toString(current), toString(required));
}

} // namespace rtmlink
