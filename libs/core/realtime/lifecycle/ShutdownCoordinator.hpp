#pragma once
/*
rtmlink - ShutdownCoordinator
Role: Per-connection cancellation signal plus a one-shot completion signal.
Threading: requestStop()/stopToken() are safe from any thread. markCompleted() is called by the
           receive loop on exit; waitCompleted() blocks any other thread until then.
Related: RtmClient.cpp (disconnect), FrameReceiver.cpp (loop exit).
Assumptions: Cancellation is cooperative; the receive primitive observes it at its next boundary.
*/
#include <atomic>
#include <chrono>
#include <future>
#include <stop_token>

namespace rtmlink {

class ShutdownCoordinator {
public:
    ShutdownCoordinator();

    ShutdownCoordinator(const ShutdownCoordinator&) = delete;
    ShutdownCoordinator& operator=(const ShutdownCoordinator&) = delete;

    [[nodiscard]] std::stop_token stopToken() const noexcept { return m_stop.get_token(); }
    [[nodiscard]] bool stopRequested() const noexcept { return m_stop.stop_requested(); }

    // true for the call that actually requested the stop
    bool requestStop() noexcept { return m_stop.request_stop(); }

    // Fulfills the completion signal; only the first call has an effect
    bool markCompleted() noexcept;

    [[nodiscard]] bool completed() const noexcept { return m_completed.load(std::memory_order_acquire); }

    void waitCompleted() const { m_done.wait(); }

    template <class Rep, class Period>
    [[nodiscard]] bool waitCompletedFor(const std::chrono::duration<Rep, Period>& timeout) const {
        return m_done.wait_for(timeout) == std::future_status::ready;
    }

private:
    std::stop_source m_stop;
    std::promise<void> m_promise;
    std::shared_future<void> m_done;
    std::atomic<bool> m_completed{false};
};

} // namespace rtmlink
