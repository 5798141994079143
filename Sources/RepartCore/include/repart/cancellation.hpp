#pragma once

#ifdef __cplusplus

#include <atomic>

namespace repart {

/// Cooperative cancellation for long-running steps. Checked at batch
/// boundaries only; a batch in flight always completes.
class cancellation_token {
public:
    void cancel() { cancelled_.store(true, std::memory_order_relaxed); }
    bool is_cancelled() const { return cancelled_.load(std::memory_order_relaxed); }

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace repart

#endif // __cplusplus
