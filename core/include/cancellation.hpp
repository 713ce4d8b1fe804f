#pragma once

#include <atomic>
#include <chrono>

namespace core {

    // Cooperative stop signal for long-running fetches. cancel() only touches a
    // lock-free atomic so it may be called from a signal handler. An optional
    // absolute deadline makes the token report cancelled once it has passed.
    class CancellationToken {
    public:
        using Clock = std::chrono::steady_clock;

        CancellationToken() = default;
        CancellationToken(const CancellationToken&) = delete;
        CancellationToken& operator=(const CancellationToken&) = delete;

        void cancel() noexcept;
        void setDeadline(Clock::time_point deadline) noexcept;
        void setTimeout(std::chrono::milliseconds timeout) noexcept;

        bool isCancelled() const noexcept;

        // Blocks for up to `duration`. Returns true if the token was (or became)
        // cancelled before the full duration elapsed.
        bool waitFor(std::chrono::milliseconds duration) const;

    private:
        std::atomic<bool> cancelled_{false};
        std::atomic<Clock::rep> deadline_ticks_{0}; // 0 = no deadline
    };

} // namespace core
