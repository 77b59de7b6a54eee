#include "generator.hpp"
#include "lib.hpp"

namespace ulidkit {

ClockPolicy clockpolicy(const std::string& name) {
    if (name == "monotonic") return ClockPolicy::Monotonic;
    if (name == "strict"   ) return ClockPolicy::Strict;
    ULIDKIT_THROW(UlidErrc::Config, "unknown clock policy '%s' (expected monotonic or strict)", name.c_str());
}

std::string clockpolicy(ClockPolicy policy) {
    return policy == ClockPolicy::Strict ? "strict" : "monotonic";
}

Generator::Generator(PClock clock, PEntropy entropy, ClockPolicy policy)
    : clock_(std::move(clock)), entropy_(std::move(entropy)), policy_(policy) {
    if (!clock_)   ULIDKIT_THROW(UlidErrc::Config, "generator needs a clock");
    if (!entropy_) ULIDKIT_THROW(UlidErrc::Config, "generator needs an entropy source");
}

ULID Generator::next() {
    std::lock_guard<std::mutex> lock(mutex_);

    State work = state_;
    ULID id = step(work);
    state_ = work;
    return id;
}

std::vector<ULID> Generator::next_batch(std::size_t count) {
    std::vector<ULID> out;
    if (count == 0) return out;
    out.reserve(count);

    std::lock_guard<std::mutex> lock(mutex_);

    State work = state_;
    for (std::size_t i = 0; i < count; ++i) {
        out.push_back(step(work));
    }
    state_ = work;
    return out;
}

ULID Generator::step(State& state) {
    const uint64_t now = clock_->now_ms();

    // Clock moved forward (or first call): fresh randomness.
    if (state.fresh || now > state.last_timestamp) {
        draw(state, now);
        return ULID(state.last_timestamp, state.last_rand_hi, state.last_rand_lo);
    }

    // Clock moved backwards.
    if (now < state.last_timestamp && policy_ == ClockPolicy::Strict) {
        ULIDKIT_THROW(UlidErrc::ClockRegression,
                      "Clock moved backwards: current=%llums, last=%llums, backward=%llums",
                      static_cast<unsigned long long>(now),
                      static_cast<unsigned long long>(state.last_timestamp),
                      static_cast<unsigned long long>(state.last_timestamp - now));
    }

    // Same millisecond, or a regression under the monotonic policy: keep the
    // last timestamp and count up.
    increment(state);
    return ULID(state.last_timestamp, state.last_rand_hi, state.last_rand_lo);
}

void Generator::draw(State& state, uint64_t timestamp) {
    ULID fresh = ULID::from_random(timestamp, *entropy_);
    state.fresh          = false;
    state.last_timestamp = timestamp;
    state.last_rand_hi   = fresh.rand_hi();
    state.last_rand_lo   = fresh.rand_lo();
}

// 80-bit increment, carrying from the low word into the high 16 bits.
void Generator::increment(State& state) {
    if (state.last_rand_lo != UINT64_MAX) {
        ++state.last_rand_lo;
        return;
    }
    if (state.last_rand_hi < MAX_RAND_HI) {
        ++state.last_rand_hi;
        state.last_rand_lo = 0;
        return;
    }
    ULIDKIT_THROW(UlidErrc::RandomnessOverflow,
                  "Random overflow: timestamp=%llums, too many ULIDs in the same millisecond",
                  static_cast<unsigned long long>(state.last_timestamp));
}

} // namespace ulidkit
