#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace ulidkit {

// Wall-clock source in milliseconds since the Unix epoch.
class Clock {
public:
    virtual ~Clock() = default;
    virtual uint64_t now_ms() = 0;
};

using PClock = std::shared_ptr<Clock>;

// std::chrono::system_clock; follows NTP steps and manual changes.
class SystemClock final : public Clock {
public:
    uint64_t now_ms() override;
};

/**
 * Reads the reference clock once, then advances with steady_clock.
 * Never goes backwards, drifts from wall time if the reference is stepped.
 * The reference defaults to SystemClock; pass an NTP-disciplined source to
 * anchor on it instead.
 */
class MonotonicClock final : public Clock {
public:
    explicit MonotonicClock(PClock reference = std::make_shared<SystemClock>());

    uint64_t now_ms() override;

private:
    PClock reference_;
    std::mutex mutex_;
    bool anchored_ = false;
    uint64_t anchor_ms_ = 0;
    std::chrono::steady_clock::time_point anchor_tp_ {};
};

// True for the names make_clock() accepts.
bool is_clock_name(const std::string& kind);

// "system" or "monotonic"; throws UlidError(Config) for anything else.
PClock make_clock(const std::string& kind);

} // namespace ulidkit
