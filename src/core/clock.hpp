#pragma once

#include "core/types.hpp"
#include <atomic>
#include <chrono>

namespace surge {

/// Wall-clock source, injected so reports can be tested deterministically
class Clock {
public:
    virtual ~Clock() = default;

    /// Current time as seconds since the Unix epoch
    [[nodiscard]] virtual EpochSeconds now() const = 0;
};

/// Clock backed by std::chrono::system_clock
class SystemClock final : public Clock {
public:
    [[nodiscard]] EpochSeconds now() const override {
        auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
        return std::chrono::duration<double>(since_epoch).count();
    }
};

/// Clock whose time only moves when told to
/// Safe to read from one thread while another advances it
class ManualClock final : public Clock {
public:
    explicit ManualClock(EpochSeconds start = 0.0) : now_(start) {}

    [[nodiscard]] EpochSeconds now() const override {
        return now_.load();
    }

    void set(EpochSeconds t) {
        now_.store(t);
    }

    void advance(double seconds) {
        now_.store(now_.load() + seconds);
    }

private:
    std::atomic<EpochSeconds> now_;
};

}  // namespace surge
