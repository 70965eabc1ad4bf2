#include "ShutdownCoordinator.hpp"

namespace rtmlink {

ShutdownCoordinator::ShutdownCoordinator()
    : m_done(m_promise.get_future().share())
{}

bool ShutdownCoordinator::markCompleted() noexcept {
    if (m_completed.exchange(true, std::memory_order_acq_rel)) {
        return false;
    }
    m_promise.set_value();
    return true;
}

} // namespace rtmlink
