#pragma once

#include <chrono>
#include "cancellation.hpp"

namespace data {

    // Blocking wait used for backoff and page pacing. Split out so tests can
    // observe the requested delays without actually sleeping.
    class ISleeper {
    public:
        virtual ~ISleeper() = default;
        // Returns false if the wait was cut short by cancellation
        virtual bool sleepFor(std::chrono::milliseconds duration, const core::CancellationToken& token) = 0;
    };

    class ThreadSleeper : public ISleeper {
    public:
        bool sleepFor(std::chrono::milliseconds duration, const core::CancellationToken& token) override {
            return !token.waitFor(duration);
        }
    };

} // namespace data
