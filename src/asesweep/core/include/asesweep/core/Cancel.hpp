#pragma once

#include <atomic>

namespace asesweep {

/* Abort request shared between the control thread and whoever wants it stopped
   (signal handler, GUI, test). Observed between steps only. */
class CancelToken {
public:
    void request() noexcept { flag_.store(true, std::memory_order_relaxed); }
    [[nodiscard]] bool requested() const noexcept { return flag_.load(std::memory_order_relaxed); }

    /// Throws CancelledError if an abort was requested.
    void throwIfRequested() const;

private:
    std::atomic<bool> flag_{false};
};

} // namespace asesweep
