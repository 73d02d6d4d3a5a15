#include "system/CompletionSignal.h"

#include <chrono>

namespace silverbp::system {

void CompletionSignal::set() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fired_) {
            return;
        }
        fired_ = true;
    }
    cv_.notify_all();
}

bool CompletionSignal::waitFor(uint32_t timeoutMs) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, std::chrono::milliseconds(timeoutMs), [this] { return fired_; });
}

bool CompletionSignal::isSet() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fired_;
}

}  // namespace silverbp::system
