#include "cancellation.hpp"
#include <algorithm>
#include <thread>

namespace core {

    namespace {
        // Granularity of the polling wait; bounds how late a cancel() is noticed
        constexpr std::chrono::milliseconds kPollSlice{50};
    }

    void CancellationToken::cancel() noexcept {
        cancelled_.store(true);
    }

    void CancellationToken::setDeadline(Clock::time_point deadline) noexcept {
        deadline_ticks_.store(std::max<Clock::rep>(1, deadline.time_since_epoch().count()));
    }

    void CancellationToken::setTimeout(std::chrono::milliseconds timeout) noexcept {
        setDeadline(Clock::now() + timeout);
    }

    bool CancellationToken::isCancelled() const noexcept {
        if (cancelled_.load()) {
            return true;
        }
        const Clock::rep ticks = deadline_ticks_.load();
        return ticks != 0 && Clock::now().time_since_epoch().count() >= ticks;
    }

    bool CancellationToken::waitFor(std::chrono::milliseconds duration) const {
        const auto until = Clock::now() + duration;
        while (!isCancelled()) {
            const auto now = Clock::now();
            if (now >= until) {
                return false;
            }
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(until - now);
            std::this_thread::sleep_for(std::min(remaining, kPollSlice));
        }
        return true;
    }

} // namespace core
