#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace silverbp::system {

/**
 * @brief Single-fire latch: the first set() releases every waiter, later calls
 * are no-ops. Safe to set from the BLE host task while the loop task waits.
 */
class CompletionSignal {
public:
    void set();

    /**
     * @brief Block until set() or until @p timeoutMs elapses.
     * @return true when the signal fired, false on timeout.
     */
    [[nodiscard]] bool waitFor(uint32_t timeoutMs);

    [[nodiscard]] bool isSet() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool fired_ = false;
};

}  // namespace silverbp::system
