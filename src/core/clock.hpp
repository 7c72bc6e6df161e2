/**
 * @file clock.hpp
 * @brief Injectable time sources.
 * @author Dimitris Kafetzis
 *
 * Scheduling code never reads the system clock itself; the controller asks
 * an IClock for "now" and passes the value down. SystemClock is used in
 * production, ManualClock in tests and simulations.
 */

#pragma once

#include "core/types.hpp"

#include <atomic>

namespace placement_engine {

class IClock {
public:
    virtual ~IClock() = default;
    [[nodiscard]] virtual Timestamp now() const = 0;
};

class SystemClock : public IClock {
public:
    [[nodiscard]] Timestamp now() const override {
        return std::chrono::system_clock::now();
    }
};

/**
 * @brief Clock that only moves when told to. Thread-safe.
 */
class ManualClock : public IClock {
public:
    explicit ManualClock(Timestamp start = Timestamp{}) : now_(start) {}

    [[nodiscard]] Timestamp now() const override { return now_.load(); }

    void set(Timestamp ts) noexcept { now_.store(ts); }

    template <typename Rep, typename Period>
    void advance(std::chrono::duration<Rep, Period> delta) noexcept {
        auto current = now_.load();
        while (!now_.compare_exchange_weak(
            current, current + std::chrono::duration_cast<Timestamp::duration>(delta))) {
        }
    }

private:
    std::atomic<Timestamp> now_;
};

}  // namespace placement_engine
