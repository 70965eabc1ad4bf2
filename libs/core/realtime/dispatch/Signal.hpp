#pragma once
/*
rtmlink - Signal
Role: Ordered listener registry for one event kind, on top of boost::signals2.
Threading: subscribe/unsubscribe from any thread, including from inside a listener. A listener
           connected during an emit is first called by the next emit; one disconnected during an
           emit is not called for the rest of it.
Observability: A throwing listener is logged under "router" and skipped; delivery continues.
*/
#include "Log.hpp"
#include <boost/signals2/connection.hpp>
#include <boost/signals2/signal.hpp>
#include <cstddef>
#include <exception>
#include <functional>
#include <utility>

namespace rtmlink {

// Handle returned by subscribe(); disconnect() on it, or pass it to unsubscribe()
using Subscription = boost::signals2::connection;
using ScopedSubscription = boost::signals2::scoped_connection;

template <class... Args>
class Signal {
public:
    using Handler = std::function<void(const Args&...)>;

    Signal() = default;
    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;

    Subscription subscribe(Handler handler) {
        return m_sig.connect([h = std::move(handler)](const Args&... args) {
            try {
                h(args...);
            } catch (const std::exception& ex) {
                RTMLINK_LOG_E("router", "Subscriber threw: {}", ex.what());
            } catch (...) {
                RTMLINK_LOG_E("router", "Subscriber threw a non-standard exception");
            }
        });
    }

    // false when the subscription was already disconnected
    bool unsubscribe(Subscription& subscription) {
        if (!subscription.connected()) return false;
        subscription.disconnect();
        return true;
    }

    void clear() { m_sig.disconnect_all_slots(); }

    [[nodiscard]] std::size_t size() const { return m_sig.num_slots(); }

    [[nodiscard]] bool empty() const { return m_sig.empty(); }

    void emit(const Args&... args) const { m_sig(args...); }

private:
    mutable boost::signals2::signal<void(const Args&...)> m_sig;
};

} // namespace rtmlink
