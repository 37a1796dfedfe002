#pragma once
//
// Thread-safe Cancellation Token for matrix runs
//

#include <atomic>
#include <memory>

namespace asset_matrix::runtime::events {

class CancellationToken {
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    // Safe to call from a signal handler
    void Cancel() noexcept {
        m_cancelled.store(true, std::memory_order_release);
    }

    [[nodiscard]] bool IsCancelled() const noexcept {
        return m_cancelled.load(std::memory_order_acquire);
    }

    // Call only when no run is in progress
    void Reset() noexcept {
        m_cancelled.store(false, std::memory_order_release);
    }

private:
    std::atomic<bool> m_cancelled{false};
    static_assert(std::atomic<bool>::is_always_lock_free);
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;

inline CancellationTokenPtr MakeCancellationToken() {
    return std::make_shared<CancellationToken>();
}

} // namespace asset_matrix::runtime::events
