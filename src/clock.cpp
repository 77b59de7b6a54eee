#include "clock.hpp"
#include "lib.hpp"
#include <utility>

namespace ulidkit {

uint64_t SystemClock::now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

MonotonicClock::MonotonicClock(PClock reference) : reference_(std::move(reference)) {
    if (!reference_) ULIDKIT_THROW(UlidErrc::Config, "monotonic clock needs a reference clock");
}

uint64_t MonotonicClock::now_ms() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!anchored_) {
        anchor_ms_ = reference_->now_ms();
        anchor_tp_ = std::chrono::steady_clock::now();
        anchored_ = true;
        return anchor_ms_;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - anchor_tp_
    ).count();
    return anchor_ms_ + static_cast<uint64_t>(elapsed);
}

bool is_clock_name(const std::string& kind) {
    return kind == "system" || kind == "monotonic";
}

PClock make_clock(const std::string& kind) {
    if (!is_clock_name(kind)) {
        ULIDKIT_THROW(UlidErrc::Config, "unknown clock '%s' (expected system or monotonic)", kind.c_str());
    }
    if (kind == "monotonic") return std::make_shared<MonotonicClock>();
    return std::make_shared<SystemClock>();
}

} // namespace ulidkit
