#pragma once
#include <chrono>
#include <cstdint>

#include "interrupt.hpp"

/**
 * @brief Anchored periodic clock for the publish cadence
 *
 * Wake times are computed as anchor + k * period from a fixed start point,
 * never from "now" after the work of a tick, so serialization and publish
 * latency do not accumulate into drift. A late tick is followed by the
 * next scheduled slot, not by a shifted schedule.
 */
struct PeriodicClock {
    using clock = std::chrono::steady_clock;

    std::chrono::nanoseconds period;
    clock::time_point anchor;
    std::uint64_t ticks{0};   ///< Number of completed waits

    /**
     * @brief Construct a new Periodic Clock
     * @param p Period between ticks
     * @param start Anchor of the schedule (tick 0 runs at this instant)
     */
    explicit PeriodicClock(std::chrono::nanoseconds p, clock::time_point start = clock::now())
        : period(p), anchor(start) {}

    /**
     * @brief Scheduled start of tick k
     */
    clock::time_point deadline(std::uint64_t k) const {
        return anchor + period * static_cast<std::chrono::nanoseconds::rep>(k);
    }

    /**
     * @brief Scheduled start of the next tick
     */
    clock::time_point next() const {
        return deadline(ticks + 1);
    }

    /**
     * @brief Sleep until the next scheduled tick, waking early on interrupt
     * @return true if the tick was reached, false if interrupted
     */
    bool wait_next(const Interrupt& interrupt) {
        if (!interrupt.wait_until(next())) {
            return false;
        }
        ++ticks;
        return true;
    }
};
