#pragma once

#include <atomic>
#include <cstdint>

namespace floatwm {

    // Hands out ever-increasing stacking orders (z-index values).
    //
    // The baseline sits well above zero so that window stacking never competes
    // with ordinary surface content. The practical ceiling is INT32_MAX; reaching
    // it would take billions of focus changes and is not handled.
    class StackingRegistry {
        std::atomic<int32_t> current_;

    public:
        static constexpr int32_t DEFAULT_BASELINE = 10;

        explicit StackingRegistry(int32_t baseline = DEFAULT_BASELINE) : current_(baseline) {}

        // Highest stacking order handed out so far (or the baseline).
        int32_t current() const { return current_.load(); }
        // Atomic increment-and-read.
        int32_t nextStackOrder() { return current_.fetch_add(1) + 1; }
    };

}
